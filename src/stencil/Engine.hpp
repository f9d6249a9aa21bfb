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

#ifndef STENCIL_ENGINE_HPP
#define STENCIL_ENGINE_HPP

#include "Template.hpp"

namespace Stencil
{
/**
 * @brief Named templates sharing a set of formatters
 *
 * Templates added to an engine can render each other with `call`.
 */
class Engine
{
	TemplateMap m_templates;
	FormatterRegistry m_formatters;
public:
	/**
	 * @brief Compiles and adds a template, replacing any template with the same name
	 *
	 * @param name Template's name
	 * @param text Template's source
	 * @throws LexError
	 * @throws ParseError
	 */
	void add_template(const std::string& name, std::string_view text);

	/**
	 * @brief Adds a formatter
	 *
	 * @param name Formatter's name
	 * @param fn Formatter
	 * @throws Error if name is reserved
	 */
	void add_formatter(const std::string& name, Formatter fn);

	/**
	 * @brief Renders a template
	 *
	 * @param name Template's name
	 * @param root Root value
	 * @returns Rendered text
	 * @throws RenderError UNKNOWN_TEMPLATE if there is no template with that name
	 */
	[[nodiscard]] std::string render(std::string_view name, const Value& root) const;

	/**
	 * @brief Gets a template
	 *
	 * @param name Template's name
	 * @returns Template, nullptr if none has that name
	 */
	[[nodiscard]] const Template* find(std::string_view name) const noexcept;

	[[nodiscard]] const TemplateMap& templates() const noexcept { return m_templates; }
	[[nodiscard]] const FormatterRegistry& formatters() const noexcept { return m_formatters; }
};
} // Stencil

#endif // STENCIL_ENGINE_HPP
