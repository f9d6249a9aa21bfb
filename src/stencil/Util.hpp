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

#ifndef STENCIL_UTIL_HPP
#define STENCIL_UTIL_HPP

#include <string>
#include <string_view>
#include <cstdint>
#include <source_location>
#include <array>
#include <utility>
#include <algorithm>

namespace Stencil
{
namespace Colors
{
	extern bool enabled;

	extern const std::string_view reset;
	extern const std::string_view bold;
	extern const std::string_view red;
	extern const std::string_view magenta;
} // Colors

/**
 * @brief Error exception
 *
 * Base class of every exception thrown by Stencil
 */
class Error
{
	std::string m_msg; ///< Error message
	std::source_location m_loc; ///< Where the error was thrown from

public:
	/**
	 * @brief Constructor
	 *
	 * @param msg Error message
	 * @param loc Location
	 */
	Error(const std::string& msg, const std::source_location& loc = std::source_location::current());

	/**
	 * @brief Destructor
	 */
	virtual ~Error() = default;

	/**
	 * @brief what()
	 *
	 * @returns Error message
	 */
	[[nodiscard]] virtual std::string what() const throw();

	/**
	 * @brief Gets the location the error was raised from
	 *
	 * @returns `file(line:column) function`
	 */
	[[nodiscard]] std::string where() const;
};

/**
 * @brief Represents a template's source text
 */
struct Source
{
	std::string name; ///< Source's name (for displaying)
	std::string_view content; ///< Source's content

	/**
	 * @brief Constructor
	 *
	 * @param _name Source's name (for displaying)
	 * @param _content Source's content
	 */
	[[nodiscard]] Source(const std::string& _name, const std::string_view& _content) noexcept:
		name(_name), content(_content) {}

	/**
	 * @brief Gets line starting from `start`
	 *
	 * @param start Start position of line
	 * @returns The line starting at `start`
	 */
	[[nodiscard]] std::string_view get_line(std::size_t start) const noexcept;

	/**
	 * @brief Gets the line and column of an offset
	 *
	 * Columns are counted in codepoints
	 *
	 * @param pos Byte offset in content
	 * @returns <line, column>, both starting at 1
	 */
	[[nodiscard]] std::pair<std::size_t, std::size_t> get_position(std::size_t pos) const noexcept;

	/**
	 * @brief Get an error message
	 *
	 * @param category Error category
	 * @param msg Error message
	 * @param pos Error's position
	 * @param count Number of characters to highlight after pos
	 * @returns Error message as a string
	 */
	[[nodiscard]] std::string get_error_message(std::string_view category, std::string_view msg,
			std::size_t pos, std::size_t count = 1) const;
};

/**
 * @brief Constructs an array in place
 *
 * @param args Elements of the array
 * @tparam T Array's type
 * @returns An array of type T containing args
 */
template <class T, class... Args>
static constexpr auto make_array(Args&&... args) noexcept
{
	return std::array<T, sizeof...(Args)>{std::forward<Args>(args)...};
}

/**
 * @brief Replaces every matching character in string
 *
 * @param input Input string
 * @param replace Characters to replace/with
 */
template <std::size_t N>
static std::string replace_each(
		const std::string_view& input,
		const std::array<std::pair<char, std::string_view>, N>& replace)
{
	// Result string's size
	std::size_t new_size = input.size();
	for (const auto c : input)
	{
		[&]<std::size_t... i>(std::index_sequence<i...>)
		{
			((new_size += (c == replace[i].first) ? replace[i].second.size()-1 : 0), ...);
		}(std::make_index_sequence<N>{});
	}

	std::string result(new_size, '\0');
	std::size_t j = 0;
	for (const auto c : input)
	{
		auto fn = [&]<std::size_t i>() -> bool
		{
			if (c != replace[i].first)
				return false;

			for (const auto c : replace[i].second)
				result[j++] = c;

			return true;
		};

		[&]<std::size_t... i>(std::index_sequence<i...>)
		{
			if ( !((fn.template operator()<i>()) || ...) ) // Shortcut
				result[j++] = c;
		}(std::make_index_sequence<N>{});
	}

	return result;
}

/**
 * @brief Helper to visit variants with a set of lambdas
 */
template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

/**
 * @brief Gets whether a character is blank
 */
[[nodiscard]] constexpr bool is_space(char c) noexcept
{
	return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

/**
 * @brief Removes leading and trailing blanks
 */
[[nodiscard]] std::string_view trim(std::string_view s) noexcept;
} // Stencil

#endif // STENCIL_UTIL_HPP
