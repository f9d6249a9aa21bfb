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

#ifndef STENCIL_FORMATTER_HPP
#define STENCIL_FORMATTER_HPP

#include <functional>
#include <map>
#include "Value.hpp"

namespace Stencil
{
/**
 * @brief Formats a value
 *
 * Receives the piped value and the evaluated arguments, throws FormatterError
 * to abort the render.
 */
using Formatter = std::function<std::string(const Value&, const std::vector<Value>&)>;

namespace Formatters
{
	/**
	 * @brief Stringifies a scalar: strings verbatim, numbers in decimal, `true`/`false`, null as nothing
	 *
	 * @throws FormatterError for sequences, objects and any argument
	 */
	[[nodiscard]] std::string plain(const Value& value, const std::vector<Value>& args);

	/**
	 * @brief Stringifies like plain, then escapes `&`, `<`, `>`, `"` and `'`
	 */
	[[nodiscard]] std::string html(const Value& value, const std::vector<Value>& args);
} // Formatters

/**
 * @brief Formatters by name
 *
 * Comes with `default` and `html`, whose names are reserved.
 * Rendering only reads the registry: modifying a registry while it is used by
 * a render in another thread is up to the caller to synchronize.
 */
class FormatterRegistry
{
	std::map<std::string, Formatter, std::less<>> m_formatters;
public:
	[[nodiscard]] FormatterRegistry();

	/**
	 * @brief Gets whether a name belongs to a built-in formatter
	 */
	[[nodiscard]] static bool reserved(std::string_view name) noexcept;

	/**
	 * @brief Adds or replaces a formatter
	 *
	 * @param name Formatter's name
	 * @param fn Formatter
	 * @throws Error if name is reserved or not an identifier, or fn is empty
	 */
	void add(const std::string& name, Formatter fn);

	/**
	 * @brief Gets a formatter
	 *
	 * @param name Formatter's name
	 * @returns Formatter, nullptr if none is registered with that name
	 */
	[[nodiscard]] const Formatter* find(std::string_view name) const noexcept;

	[[nodiscard]] std::size_t size() const noexcept { return m_formatters.size(); }
};
} // Stencil

#endif // STENCIL_FORMATTER_HPP
