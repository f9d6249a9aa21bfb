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

#include "Definitions.hpp"
#include <cctype>
#include <charconv>
#include <fmt/format.h>

using namespace std::literals;

namespace Stencil
{
template <class T>
[[nodiscard]] static std::optional<T> parseNumber(std::string_view s) noexcept
{
	if (s.empty() || !(std::isdigit(static_cast<unsigned char>(s.front()))
			|| (s.size() > 1 && s.front() == '-' && std::isdigit(static_cast<unsigned char>(s[1])))))
		return std::nullopt;

	T n;
	const auto [ptr, ec] = std::from_chars(s.data(), s.data()+s.size(), n);
	if (ec != std::errc{} || ptr != s.data()+s.size())
		return std::nullopt;
	return n;
}

[[nodiscard]] Value parseDefinitionValue(std::string_view text)
{
	if (text == "true"sv)
		return true;
	else if (text == "false"sv)
		return false;
	else if (text == "null"sv)
		return Value{};
	else if (const auto n = parseNumber<std::int64_t>(text))
		return *n;
	else if (const auto d = parseNumber<double>(text))
		return *d;

	if (text.size() >= 2 && text.front() == '[' && text.back() == ']')
	{
		Sequence seq;
		const std::string_view inner = trim(text.substr(1, text.size()-2));
		std::size_t pos = 0;
		while (!inner.empty())
		{
			const std::size_t comma = inner.find(',', pos);
			seq.emplace_back(trim(inner.substr(pos, comma == std::string_view::npos ? std::string_view::npos : comma-pos)));
			if (comma == std::string_view::npos)
				break;
			pos = comma+1;
		}
		return seq;
	}

	return text;
}

void define(Object& root, std::string_view definition)
{
	const std::size_t eq = definition.find('=');
	if (eq == std::string_view::npos)
		throw Error(fmt::format("Invalid definition `{}`, expected `path=value`", definition));

	const std::string_view path = trim(definition.substr(0, eq));
	std::vector<std::string_view> segments;
	std::size_t pos = 0;
	while (true)
	{
		const std::size_t dot = path.find('.', pos);
		const std::string_view seg = path.substr(pos, dot == std::string_view::npos ? std::string_view::npos : dot-pos);
		if (seg.empty())
			throw Error(fmt::format("Invalid definition `{}`, empty path segment", definition));
		segments.push_back(seg);

		if (dot == std::string_view::npos)
			break;
		pos = dot+1;
	}

	Object* obj = &root;
	for (std::size_t i = 0; i+1 < segments.size(); ++i)
	{
		auto it = obj->find(segments[i]);
		if (it == obj->end())
			it = obj->emplace(std::string{segments[i]}, Object{}).first;
		else if (!it->second.is_object())
			throw Error(fmt::format("Cannot define `{}`, `{}` is a value of type `{}`",
				path, path.substr(0, segments[i].data()+segments[i].size()-path.data()), getTypeName(it->second.type())));

		obj = &it->second.as_object();
	}

	obj->insert_or_assign(std::string{segments.back()}, parseDefinitionValue(definition.substr(eq+1)));
}
} // Stencil
