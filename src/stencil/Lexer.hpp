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

#ifndef STENCIL_LEXER_HPP
#define STENCIL_LEXER_HPP

#include <optional>
#include "Util.hpp"

namespace Stencil
{
/**
 * @brief A piece of template source
 */
struct Token
{
	/**
	 * @brief Type of token
	 */
	enum class Type : std::uint8_t
	{
		LITERAL, ///< Plain text
		RAW, ///< `{= ... =}`, emitted verbatim
		MARKUP, ///< `{{ ... }}`
	};

	/**
	 * @brief Kind of markup, given by the leading keyword
	 */
	enum class Kind : std::uint8_t
	{
		VALUE,
		IF,
		ELSE,
		ENDIF,
		FOR,
		ENDFOR,
		WITH,
		ENDWITH,
		CALL,
	};

	Type type; ///< Token's type
	Kind kind = Kind::VALUE; ///< Markup kind (only for MARKUP)
	std::string_view span; ///< Full source span, delimiters included
	std::size_t offset; ///< Offset of span in the source
	std::string_view text; ///< Literal text, raw text or markup body without keyword
	std::size_t text_offset; ///< Offset of text in the source
	bool trim_left = false; ///< `{{-`: strip whitespace before the tag
	bool trim_right = false; ///< `-}}`: strip whitespace after the tag
};

/**
 * @brief Gets the keyword of a markup kind
 *
 * @param kind Markup kind
 * @returns Keyword (`value` for VALUE)
 */
[[nodiscard]] std::string_view getKindName(Token::Kind kind) noexcept;

/**
 * @brief Splits a template into tokens
 *
 * Tokens are produced one at a time and cover the source exactly once.
 */
class Lexer
{
	const Source& m_source; ///< Source being lexed
	std::size_t m_pos = 0; ///< Current position

	/**
	 * @brief Lexes a `{{ ... }}` tag starting at m_pos
	 */
	[[nodiscard]] Token markup();

	/**
	 * @brief Lexes a `{= ... =}` tag starting at m_pos
	 */
	[[nodiscard]] Token raw();
public:
	/**
	 * @brief Constructor
	 *
	 * @param source Source to lex, must outlive the lexer and its tokens
	 */
	[[nodiscard]] Lexer(const Source& source) noexcept:
		m_source{source} {}

	/**
	 * @brief Gets next token
	 *
	 * @returns Next token, nothing once the whole source has been consumed
	 * @throws LexError on unterminated tags
	 */
	[[nodiscard]] std::optional<Token> next();

	/**
	 * @brief Gets whether the whole source was consumed
	 */
	[[nodiscard]] bool done() const noexcept { return m_pos >= m_source.content.size(); }
};
} // Stencil

#endif // STENCIL_LEXER_HPP
