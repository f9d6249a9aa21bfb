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

#ifndef STENCIL_TEMPLATE_HPP
#define STENCIL_TEMPLATE_HPP

#include <map>
#include "Instruction.hpp"
#include "Formatter.hpp"

namespace Stencil
{
/**
 * @brief A compiled template
 *
 * Owns its instructions and literal strings, it does not reference the text
 * it was compiled from. Immutable once compiled, can be rendered concurrently.
 */
class Template
{
	friend class TemplateCompiler;

	std::string m_name; ///< Template's name (for diagnostics)
	std::vector<std::string> m_literals; ///< Literal strings
	std::vector<Instruction> m_instructions; ///< Program

	[[nodiscard]] Template(const std::string& name):
		m_name{name} {}
public:
	/**
	 * @brief Compiles a template
	 *
	 * @param text Template source
	 * @param name Name used in diagnostics
	 * @returns Compiled template
	 * @throws LexError on unterminated tags
	 * @throws ParseError on malformed expressions or unbalanced blocks
	 */
	[[nodiscard]] static Template compile(std::string_view text, const std::string& name = "<template>");

	/**
	 * @brief Renders the template
	 *
	 * `call` tags fail with an unknown template error, use Engine to render
	 * templates that call each other.
	 *
	 * @param root Root value
	 * @param formatters Formatters available to pipes
	 * @returns Rendered text
	 * @throws RenderError
	 */
	[[nodiscard]] std::string render(const Value& root, const FormatterRegistry& formatters = FormatterRegistry{}) const;

	[[nodiscard]] const std::vector<Instruction>& instructions() const noexcept { return m_instructions; }
	[[nodiscard]] const std::string& literal(std::size_t i) const { return m_literals.at(i); }
	[[nodiscard]] std::size_t literal_count() const noexcept { return m_literals.size(); }
	[[nodiscard]] const std::string& name() const noexcept { return m_name; }

	/**
	 * @brief Gets a listing of the program, one instruction per line
	 *
	 * @returns `index: Name operands` lines
	 */
	[[nodiscard]] std::string dump() const;
};

/**
 * @brief Templates by name, used to resolve `call`
 */
using TemplateMap = std::map<std::string, Template, std::less<>>;
} // Stencil

#endif // STENCIL_TEMPLATE_HPP
