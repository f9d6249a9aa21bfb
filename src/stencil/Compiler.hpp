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

#ifndef STENCIL_COMPILER_HPP
#define STENCIL_COMPILER_HPP

#include "Lexer.hpp"
#include "Template.hpp"

namespace Stencil
{
/**
 * @brief Builds a template's program from its tokens
 *
 * Blocks are compiled to flat instructions, every jump target is resolved
 * once its closing tag is reached.
 */
class TemplateCompiler
{
	/**
	 * @brief An open block
	 */
	struct Block
	{
		Token::Kind kind; ///< IF, ELSE, FOR or WITH
		std::size_t index; ///< Index of the opening instruction
		std::size_t offset; ///< Offset of the opening tag
		std::size_t count; ///< Size of the opening tag
		std::size_t jump = 0; ///< Index of the `else` jump (ELSE only)
	};

	const Source& m_source;
	Template m_tmpl;
	std::vector<Block> m_blocks; ///< Open blocks, innermost last
	std::size_t m_loops = 0; ///< Number of open `for` blocks

	std::string m_pending; ///< Literal text not yet emitted
	std::size_t m_verbatim = 0; ///< m_pending up to this position comes from a raw tag
	bool m_trimNext = false; ///< Strip leading whitespace from the next literal

	[[noreturn]] void error(std::string&& msg, std::size_t offset, std::size_t count = 1) const;

	/**
	 * @brief Emits pending literal text, if any
	 */
	void flush();

	/**
	 * @brief Makes sure loop variables are only used inside loops
	 */
	void check_loop_state(const ValueExpr& expr) const;
	void check_loop_state(const Condition& cond) const;

	/**
	 * @brief Makes sure a closing tag has no body
	 */
	void expect_empty(const Token& tok) const;

	/**
	 * @brief Pops the innermost block, which must be of a certain kind
	 *
	 * @param tok Closing token
	 * @param kinds Accepted kinds
	 * @returns Closed block
	 */
	Block close(const Token& tok, std::initializer_list<Token::Kind> kinds);

	void literal(const Token& tok);
	void raw(const Token& tok);
	void markup(const Token& tok);
public:
	/**
	 * @brief Constructor
	 *
	 * @param source Template source, must outlive the compiler
	 */
	[[nodiscard]] TemplateCompiler(const Source& source):
		m_source{source}, m_tmpl{source.name} {}

	/**
	 * @brief Compiles the source
	 *
	 * Must only be called once.
	 *
	 * @returns Compiled template
	 * @throws LexError
	 * @throws ParseError
	 */
	[[nodiscard]] Template compile();
};
} // Stencil

#endif // STENCIL_COMPILER_HPP
