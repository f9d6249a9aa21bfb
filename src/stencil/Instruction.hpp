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

#ifndef STENCIL_INSTRUCTION_HPP
#define STENCIL_INSTRUCTION_HPP

#include "Expression.hpp"

namespace Stencil
{
namespace Instr
{
	/**
	 * @brief Appends a literal string of the template
	 */
	struct EmitLiteral
	{
		std::size_t literal; ///< Index in the template's literal table
	};

	/**
	 * @brief Appends a value
	 */
	struct EmitValue
	{
		ValueExpr value;
	};

	/**
	 * @brief Jumps to target if the condition is false
	 */
	struct Branch
	{
		Condition condition;
		std::size_t target;
	};

	struct Jump
	{
		std::size_t target;
	};

	/**
	 * @brief Starts a loop, jumps to target if the collection is empty
	 */
	struct IterStart
	{
		ValueExpr collection;
		std::string binding; ///< Name of the element
		std::string index_name; ///< Name of the index (may be empty)
		std::size_t target; ///< Past the matching IterEnd
	};

	/**
	 * @brief Advances the innermost loop, jumps to target if elements remain
	 */
	struct IterNext
	{
		std::size_t target; ///< First instruction of the loop body
	};

	struct IterEnd {};

	/**
	 * @brief Pushes a `with` scope
	 */
	struct PushScope
	{
		ValueExpr value;
		std::string name; ///< Empty to expose the value's fields
	};

	struct PopScope {};

	/**
	 * @brief Renders another template in place
	 */
	struct Call
	{
		std::string name; ///< Template name
		std::optional<ValueExpr> value; ///< Root value, innermost value when empty
		std::size_t offset; ///< Offset of the tag in the source
	};
} // Instr

using Instruction = std::variant<
	Instr::EmitLiteral,
	Instr::EmitValue,
	Instr::Branch,
	Instr::Jump,
	Instr::IterStart,
	Instr::IterNext,
	Instr::IterEnd,
	Instr::PushScope,
	Instr::PopScope,
	Instr::Call
>;

/**
 * @brief Gets the name of an instruction
 *
 * @param instr Instruction
 * @returns Instruction's name, e.g `EmitLiteral`
 */
[[nodiscard]] std::string_view getInstructionName(const Instruction& instr) noexcept;
} // Stencil

#endif // STENCIL_INSTRUCTION_HPP
