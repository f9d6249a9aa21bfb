/* Stencil a small text templating engine
   Copyright © 2023 ef3d0c3e

   This program is free software: you can redistribute it and/or modify
   it under the terms of the GNU Affero General Public License as
   published by the Free Software Foundation, either version 3 of the
   License, or any later version.

   This program is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
   GNU Affero General Public License for more details.

   You should have received a copy of the GNU Affero General Public License
   along with this program.  If not, see <http://www.gnu.org/licenses/>. */

#include "Formatter.hpp"
#include "Error.hpp"
#include <fmt/format.h>

using namespace std::literals;

namespace Stencil
{
static constexpr auto reserved_formatters = make_array<std::string_view>("default"sv, "html"sv);

[[nodiscard]] std::string Formatters::plain(const Value& value, const std::vector<Value>& args)
{
	if (!args.empty())
		throw FormatterError(fmt::format("Expected no arguments, got {}", args.size()));

	auto s = value.to_string();
	if (!s)
		throw FormatterError(fmt::format("Cannot format a value of type `{}`", getTypeName(value.type())));
	return std::move(*s);
}

[[nodiscard]] std::string Formatters::html(const Value& value, const std::vector<Value>& args)
{
	return replace_each(plain(value, args),
		make_array<std::pair<char, std::string_view>>(
			std::make_pair('&', "&amp;"sv),
			std::make_pair('<', "&lt;"sv),
			std::make_pair('>', "&gt;"sv),
			std::make_pair('"', "&quot;"sv),
			std::make_pair('\'', "&#39;"sv)
		));
}

[[nodiscard]] FormatterRegistry::FormatterRegistry()
{
	m_formatters.emplace("default"s, Formatters::plain);
	m_formatters.emplace("html"s, Formatters::html);
}

[[nodiscard]] bool FormatterRegistry::reserved(std::string_view name) noexcept
{
	return std::find(reserved_formatters.cbegin(), reserved_formatters.cend(), name) != reserved_formatters.cend();
}

void FormatterRegistry::add(const std::string& name, Formatter fn)
{
	if (reserved(name))
		throw Error(fmt::format("Cannot replace built-in formatter `{}`", name));
	if (!fn)
		throw Error(fmt::format("Empty formatter `{}`", name));

	const bool valid = !name.empty()
		&& std::all_of(name.cbegin(), name.cend(), [](char c)
		{
			return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
		})
		&& !(name.front() >= '0' && name.front() <= '9');
	if (!valid)
		throw Error(fmt::format("Invalid formatter name `{}`", name));

	m_formatters.insert_or_assign(name, std::move(fn));
}

[[nodiscard]] const Formatter* FormatterRegistry::find(std::string_view name) const noexcept
{
	const auto it = m_formatters.find(name);
	if (it == m_formatters.cend())
		return nullptr;
	return &it->second;
}
} // Stencil
