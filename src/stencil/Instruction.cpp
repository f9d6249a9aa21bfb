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

#include "Instruction.hpp"

using namespace std::literals;

namespace Stencil
{
[[nodiscard]] std::string_view getInstructionName(const Instruction& instr) noexcept
{
	static constexpr auto names = make_array<std::string_view>(
		"EmitLiteral"sv,
		"EmitValue"sv,
		"Branch"sv,
		"Jump"sv,
		"IterStart"sv,
		"IterNext"sv,
		"IterEnd"sv,
		"PushScope"sv,
		"PopScope"sv,
		"Call"sv
	);
	static_assert(names.size() == std::variant_size_v<Instruction>);

	return names[instr.index()];
}
} // Stencil
