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

#include "Template.hpp"
#include "Compiler.hpp"
#include "Renderer.hpp"
#include <fmt/format.h>

namespace Stencil
{
[[nodiscard]] Template Template::compile(std::string_view text, const std::string& name)
{
	const Source source(name, text);
	TemplateCompiler compiler(source);
	return compiler.compile();
}

[[nodiscard]] std::string Template::render(const Value& root, const FormatterRegistry& formatters) const
{
	std::string out;
	Renderer renderer(*this, formatters);
	renderer.render(root, out);
	return out;
}

[[nodiscard]] std::string Template::dump() const
{
	std::string r;
	const std::size_t width = fmt::formatted_size("{}", m_instructions.size());
	for (std::size_t i = 0; i < m_instructions.size(); ++i)
	{
		const std::string operands = std::visit(overloaded{
			[&](const Instr::EmitLiteral& in) { return Value{m_literals[in.literal]}.repr(); },
			[](const Instr::EmitValue& in) { return in.value.str(); },
			[](const Instr::Branch& in) { return fmt::format("{} -> {}", in.condition.str(), in.target); },
			[](const Instr::Jump& in) { return fmt::format("-> {}", in.target); },
			[](const Instr::IterStart& in)
			{
				if (in.index_name.empty())
					return fmt::format("{} in {} -> {}", in.binding, in.collection.str(), in.target);
				return fmt::format("{}, {} in {} -> {}", in.index_name, in.binding, in.collection.str(), in.target);
			},
			[](const Instr::IterNext& in) { return fmt::format("-> {}", in.target); },
			[](const Instr::IterEnd&) { return std::string{}; },
			[](const Instr::PushScope& in)
			{
				if (in.name.empty())
					return in.value.str();
				return fmt::format("{} as {}", in.value.str(), in.name);
			},
			[](const Instr::PopScope&) { return std::string{}; },
			[](const Instr::Call& in)
			{
				if (!in.value)
					return in.name;
				return fmt::format("{} with {}", in.name, in.value->str());
			},
		}, m_instructions[i]);

		r.append(fmt::format("{: >{}}: {}", i, width, getInstructionName(m_instructions[i])));
		if (!operands.empty())
			r.append(" ").append(operands);
		r.push_back('\n');
	}

	return r;
}
} // Stencil
