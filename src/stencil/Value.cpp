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

#include "Value.hpp"
#include <cmath>
#include <fmt/format.h>

using namespace std::literals;

namespace Stencil
{
[[nodiscard]] std::string_view getTypeName(Value::Type type) noexcept
{
	static constexpr auto names = make_array<std::string_view>(
		"null",
		"bool",
		"integer",
		"float",
		"string",
		"sequence",
		"object"
	);

	return names[static_cast<std::size_t>(type)];
}

template <class T>
[[nodiscard]] static const T& get(const auto& data, Value::Type expected)
{
	const T* p = std::get_if<T>(&data);
	if (!p) [[unlikely]]
		throw Error(fmt::format("Expected a value of type `{}`, got `{}`",
			getTypeName(expected), getTypeName(static_cast<Value::Type>(data.index()))));
	return *p;
}

[[nodiscard]] bool Value::as_bool() const
{
	return get<bool>(m_data, Type::BOOL);
}

[[nodiscard]] std::int64_t Value::as_integer() const
{
	if (const double* d = std::get_if<double>(&m_data))
	{
		// [-2^63, 2^63), NaN fails both comparisons
		if (!(*d >= -0x1p63 && *d < 0x1p63) || std::trunc(*d) != *d)
			throw Error(fmt::format("Cannot convert float `{}` to an integer", *d));
		return static_cast<std::int64_t>(*d);
	}
	return get<std::int64_t>(m_data, Type::INTEGER);
}

[[nodiscard]] double Value::as_number() const
{
	if (const std::int64_t* n = std::get_if<std::int64_t>(&m_data))
		return static_cast<double>(*n);
	return get<double>(m_data, Type::FLOAT);
}

[[nodiscard]] const std::string& Value::as_string() const
{
	return get<std::string>(m_data, Type::STRING);
}

[[nodiscard]] const Sequence& Value::as_sequence() const
{
	return get<Sequence>(m_data, Type::SEQUENCE);
}

[[nodiscard]] const Object& Value::as_object() const
{
	return get<Object>(m_data, Type::OBJECT);
}

[[nodiscard]] Object& Value::as_object()
{
	return const_cast<Object&>(std::as_const(*this).as_object());
}

[[nodiscard]] const Value* Value::find(std::string_view key) const noexcept
{
	const Object* obj = std::get_if<Object>(&m_data);
	if (!obj)
		return nullptr;

	const auto it = obj->find(key);
	if (it == obj->cend())
		return nullptr;
	return &it->second;
}

[[nodiscard]] const Value* Value::at(std::size_t index) const noexcept
{
	const Sequence* seq = std::get_if<Sequence>(&m_data);
	if (!seq || index >= seq->size())
		return nullptr;
	return &(*seq)[index];
}

[[nodiscard]] bool Value::truthy() const noexcept
{
	return std::visit(overloaded{
		[](std::monostate) { return false; },
		[](bool b) { return b; },
		[](std::int64_t n) { return n != 0; },
		[](double d) { return d != 0.0; },
		[](const std::string& s) { return !s.empty(); },
		[](const Sequence& seq) { return !seq.empty(); },
		[](const Object&) { return true; },
	}, m_data);
}

[[nodiscard]] std::optional<std::string> Value::to_string() const
{
	return std::visit(overloaded{
		[](std::monostate) -> std::optional<std::string> { return ""s; },
		[](bool b) -> std::optional<std::string> { return b ? "true"s : "false"s; },
		[](std::int64_t n) -> std::optional<std::string> { return fmt::format("{}", n); },
		[](double d) -> std::optional<std::string> { return fmt::format("{}", d); },
		[](const std::string& s) -> std::optional<std::string> { return s; },
		[](const Sequence&) -> std::optional<std::string> { return std::nullopt; },
		[](const Object&) -> std::optional<std::string> { return std::nullopt; },
	}, m_data);
}

[[nodiscard]] std::string Value::repr() const
{
	return std::visit(overloaded{
		[](std::monostate) { return "null"s; },
		[](bool b) { return b ? "true"s : "false"s; },
		[](std::int64_t n) { return fmt::format("{}", n); },
		[](double d) { return fmt::format("{}", d); },
		[](const std::string& s)
		{
			return fmt::format("\"{}\"", replace_each(s,
				make_array<std::pair<char, std::string_view>>(
					std::make_pair('"', "\\\""sv),
					std::make_pair('\\', "\\\\"sv),
					std::make_pair('\n', "\\n"sv),
					std::make_pair('\t', "\\t"sv)
				)));
		},
		[](const Sequence& seq)
		{
			std::string s("[");
			for (std::size_t i = 0; i < seq.size(); ++i)
			{
				if (i != 0)
					s.append(", ");
				s.append(seq[i].repr());
			}
			s.push_back(']');
			return s;
		},
		[](const Object& obj)
		{
			std::string s("{");
			bool first = true;
			for (const auto& [k, v] : obj)
			{
				if (!first)
					s.append(", ");
				first = false;
				s.append(fmt::format("{}: {}", k, v.repr()));
			}
			s.push_back('}');
			return s;
		},
	}, m_data);
}

[[nodiscard]] bool operator==(const Value& a, const Value& b) noexcept
{
	if (a.is_number() && b.is_number())
	{
		if (a.is_integer() && b.is_integer())
			return std::get<std::int64_t>(a.m_data) == std::get<std::int64_t>(b.m_data);
		return a.as_number() == b.as_number();
	}

	return a.m_data == b.m_data;
}
} // Stencil
