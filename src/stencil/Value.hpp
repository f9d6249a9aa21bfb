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

#ifndef STENCIL_VALUE_HPP
#define STENCIL_VALUE_HPP

#include <concepts>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include "Util.hpp"

namespace Stencil
{
class Value;

using Sequence = std::vector<Value>;
using Object = std::map<std::string, Value, std::less<>>;

template <class, class...>
struct ValueConverter;

/**
 * @brief Dynamic value a template is rendered against
 */
class Value
{
public:
	/**
	 * @brief Type of a value
	 */
	enum class Type : std::uint8_t
	{
		NUL,
		BOOL,
		INTEGER,
		FLOAT,
		STRING,
		SEQUENCE,
		OBJECT,
	};

private:
	std::variant<std::monostate, bool, std::int64_t, double, std::string, Sequence, Object> m_data;

public:
	/**
	 * @brief Constructs a null value
	 */
	Value() noexcept {}
	Value(std::nullptr_t) noexcept {}
	Value(bool b) noexcept:
		m_data{b} {}

	template <class T>
	requires(std::is_integral_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char>)
	Value(T n) noexcept:
		m_data{static_cast<std::int64_t>(n)} {}

	template <class T>
	requires(std::is_floating_point_v<T>)
	Value(T d) noexcept:
		m_data{static_cast<double>(d)} {}

	Value(char c):
		m_data{std::string(1, c)} {}
	Value(const char* s):
		m_data{std::string{s}} {}
	Value(std::string s):
		m_data{std::move(s)} {}
	Value(std::string_view s):
		m_data{std::string{s}} {}
	Value(Sequence seq):
		m_data{std::move(seq)} {}
	Value(Object obj):
		m_data{std::move(obj)} {}

	/**
	 * @brief Constructs from any type that has a converter
	 *
	 * @param v Value to convert
	 */
	template <class T>
	requires requires (const T& v) { { ValueConverter<T>::from(v) } -> std::same_as<Value>; }
	Value(const T& v):
		Value(ValueConverter<T>::from(v)) {}

	/**
	 * @brief Gets the value's type
	 *
	 * @returns Value's type
	 */
	[[nodiscard]] Type type() const noexcept { return static_cast<Type>(m_data.index()); }

	[[nodiscard]] bool is_null() const noexcept { return type() == Type::NUL; }
	[[nodiscard]] bool is_bool() const noexcept { return type() == Type::BOOL; }
	[[nodiscard]] bool is_integer() const noexcept { return type() == Type::INTEGER; }
	[[nodiscard]] bool is_float() const noexcept { return type() == Type::FLOAT; }
	[[nodiscard]] bool is_number() const noexcept { return is_integer() || is_float(); }
	[[nodiscard]] bool is_string() const noexcept { return type() == Type::STRING; }
	[[nodiscard]] bool is_sequence() const noexcept { return type() == Type::SEQUENCE; }
	[[nodiscard]] bool is_object() const noexcept { return type() == Type::OBJECT; }

	/**
	 * @brief Accessors
	 *
	 * `as_integer` accepts floats with an integral value in range, `as_number`
	 * accepts integers.
	 *
	 * @throws Error if the value holds another type
	 */
	[[nodiscard]] bool as_bool() const;
	[[nodiscard]] std::int64_t as_integer() const;
	[[nodiscard]] double as_number() const;
	[[nodiscard]] const std::string& as_string() const;
	[[nodiscard]] const Sequence& as_sequence() const;
	[[nodiscard]] const Object& as_object() const;
	[[nodiscard]] Object& as_object();

	/**
	 * @brief Gets a field of an object
	 *
	 * @param key Field's name
	 * @returns nullptr if this is not an object or the field does not exist
	 */
	[[nodiscard]] const Value* find(std::string_view key) const noexcept;

	/**
	 * @brief Gets an element of a sequence
	 *
	 * @param index Element's index
	 * @returns nullptr if this is not a sequence or index is out of range
	 */
	[[nodiscard]] const Value* at(std::size_t index) const noexcept;

	/**
	 * @brief Gets whether this value is truthy
	 *
	 * Null, false, zero, empty strings and empty sequences are falsy
	 */
	[[nodiscard]] bool truthy() const noexcept;

	/**
	 * @brief Gets the default string representation
	 *
	 * @returns Nothing for sequences and objects
	 */
	[[nodiscard]] std::optional<std::string> to_string() const;

	/**
	 * @brief Gets a debug representation (strings are quoted)
	 */
	[[nodiscard]] std::string repr() const;

	/**
	 * @brief Values of different types are never equal, except for
	 * integers and floats which compare numerically
	 */
	[[nodiscard]] friend bool operator==(const Value& a, const Value& b) noexcept;
};

/**
 * @brief Gets the name of a type
 *
 * @param type Type
 * @returns Type's name
 */
[[nodiscard]] std::string_view getTypeName(Value::Type type) noexcept;

// Containers
template <template <class...> class Container, class T, class... Ts>
requires (std::is_same_v<Container<T, Ts...>, std::vector<T, Ts...>>
		&& !std::is_same_v<T, Value>)
struct ValueConverter<Container<T, Ts...>>
{
	[[nodiscard]] static Value from(const Container<T, Ts...>& vec)
	{
		Sequence seq;
		seq.reserve(vec.size());
		for (const auto& v : vec)
			seq.push_back(Value{v});

		return seq;
	}

	[[nodiscard]] static Container<T, Ts...> to(const Value& v)
	{
		Container<T, Ts...> vec;
		for (const auto& elem : v.as_sequence())
			vec.push_back(ValueConverter<T>::to(elem));

		return vec;
	}
};

// Maps
template <template <class...> class Map, class T, class... Ts>
requires ((std::is_same_v<Map<std::string, T, Ts...>, std::map<std::string, T, Ts...>>)
		&& !std::is_same_v<T, Value>)
struct ValueConverter<Map<std::string, T, Ts...>>
{
	[[nodiscard]] static Value from(const Map<std::string, T, Ts...>& map)
	{
		Object obj;
		for (const auto& [k, v] : map)
			obj.emplace(k, Value{v});

		return obj;
	}

	[[nodiscard]] static Map<std::string, T, Ts...> to(const Value& v)
	{
		Map<std::string, T, Ts...> map;
		for (const auto& [k, elem] : v.as_object())
			map.emplace(k, ValueConverter<T>::to(elem));

		return map;
	}
};

// Scalars, only used for conversions out of a value
template <class T>
requires(std::is_arithmetic_v<T> || std::is_same_v<T, std::string>)
struct ValueConverter<T>
{
	[[nodiscard]] static T to(const Value& v)
	{
		if constexpr (std::is_same_v<T, bool>)
			return v.as_bool();
		else if constexpr (std::is_integral_v<T>)
		{
			const std::int64_t n = v.as_integer();
			if (!std::in_range<T>(n))
				throw Error("Integer `" + std::to_string(n) + "` is out of range for the requested type");
			return static_cast<T>(n);
		}
		else if constexpr (std::is_floating_point_v<T>)
			return static_cast<T>(v.as_number());
		else
			return v.as_string();
	}
};

/**
 * @brief Converts a value to a C++ type
 *
 * @param v Value to convert
 * @returns Converted value
 * @throws Error if the value does not hold the expected type
 */
template <class T>
[[nodiscard]] T value_cast(const Value& v)
{
	return ValueConverter<T>::to(v);
}
} // Stencil

#endif // STENCIL_VALUE_HPP
