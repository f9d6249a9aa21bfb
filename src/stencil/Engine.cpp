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

#include "Engine.hpp"
#include "Renderer.hpp"
#include <fmt/format.h>

namespace Stencil
{
void Engine::add_template(const std::string& name, std::string_view text)
{
	Template tmpl = Template::compile(text, name);
	m_templates.insert_or_assign(name, std::move(tmpl));
}

void Engine::add_formatter(const std::string& name, Formatter fn)
{
	m_formatters.add(name, std::move(fn));
}

[[nodiscard]] std::string Engine::render(std::string_view name, const Value& root) const
{
	const Template* tmpl = find(name);
	if (!tmpl)
		throw RenderError(RenderError::Kind::UNKNOWN_TEMPLATE, fmt::format("Unknown template `{}`", name),
			RenderError::Details{.name = std::string{name}});

	std::string out;
	Renderer renderer(*tmpl, m_formatters, &m_templates);
	renderer.render(root, out);
	return out;
}

[[nodiscard]] const Template* Engine::find(std::string_view name) const noexcept
{
	const auto it = m_templates.find(name);
	if (it == m_templates.cend())
		return nullptr;
	return &it->second;
}
} // Stencil
