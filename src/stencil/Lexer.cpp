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

#include "Lexer.hpp"
#include "Error.hpp"

using namespace std::literals;

namespace Stencil
{
static constexpr auto keywords = make_array<std::pair<std::string_view, Token::Kind>>(
	std::make_pair("if"sv, Token::Kind::IF),
	std::make_pair("else"sv, Token::Kind::ELSE),
	std::make_pair("endif"sv, Token::Kind::ENDIF),
	std::make_pair("for"sv, Token::Kind::FOR),
	std::make_pair("endfor"sv, Token::Kind::ENDFOR),
	std::make_pair("with"sv, Token::Kind::WITH),
	std::make_pair("endwith"sv, Token::Kind::ENDWITH),
	std::make_pair("call"sv, Token::Kind::CALL)
);

[[nodiscard]] std::string_view getKindName(Token::Kind kind) noexcept
{
	for (const auto& [name, k] : keywords)
		if (k == kind)
			return name;

	return "value"sv;
}

[[nodiscard]] std::optional<Token> Lexer::next()
{
	const std::string_view s = m_source.content;
	if (m_pos >= s.size())
		return std::nullopt;

	// Find next opening delimiter
	std::size_t open = m_pos;
	while ((open = s.find('{', open)) != std::string_view::npos)
	{
		if (open+1 < s.size() && (s[open+1] == '{' || s[open+1] == '='))
			break;
		++open;
	}
	if (open == std::string_view::npos)
		open = s.size();

	if (open != m_pos) // Literal run up to the delimiter
	{
		const std::string_view text = s.substr(m_pos, open-m_pos);
		Token tok{
			.type = Token::Type::LITERAL,
			.span = text,
			.offset = m_pos,
			.text = text,
			.text_offset = m_pos,
		};
		m_pos = open;
		return tok;
	}

	if (s[open+1] == '=')
		return raw();
	return markup();
}

[[nodiscard]] Token Lexer::raw()
{
	const std::string_view s = m_source.content;
	const std::size_t start = m_pos;

	const std::size_t close = s.find("=}"sv, start+2);
	if (close == std::string_view::npos)
		throw LexError(m_source, "Missing closing `=}` after opening `{=`", start, 2);

	std::size_t text_offset = start+2;
	std::string_view text = s.substr(text_offset, close-text_offset);
	if (!text.empty() && text.front() == ' ')
	{
		text.remove_prefix(1);
		++text_offset;
	}
	if (!text.empty() && text.back() == ' ')
		text.remove_suffix(1);

	m_pos = close+2;
	return Token{
		.type = Token::Type::RAW,
		.span = s.substr(start, m_pos-start),
		.offset = start,
		.text = text,
		.text_offset = text_offset,
	};
}

[[nodiscard]] Token Lexer::markup()
{
	const std::string_view s = m_source.content;
	const std::size_t start = m_pos;

	std::size_t i = start+2;
	const bool trim_left = i < s.size() && s[i] == '-';
	if (trim_left)
		++i;
	const std::size_t body_start = i;

	// Find the closing delimiter, skipping string literals
	std::size_t close = std::string_view::npos;
	while (i < s.size())
	{
		const char c = s[i];
		if (c == '"' || c == '\'')
		{
			std::size_t j = i+1;
			while (j < s.size() && s[j] != c)
			{
				if (s[j] == '\\')
					++j;
				++j;
			}
			if (j >= s.size())
				throw LexError(m_source, "Unterminated string literal inside tag", i, 1);

			i = j+1;
			continue;
		}
		else if (c == '}' && i+1 < s.size() && s[i+1] == '}')
		{
			close = i;
			break;
		}
		++i;
	}
	if (close == std::string_view::npos)
		throw LexError(m_source, "Missing closing `}}` after opening `{{`", start, 2);

	std::size_t body_end = close;
	const bool trim_right = body_end > body_start && s[body_end-1] == '-';
	if (trim_right)
		--body_end;
	m_pos = close+2;

	// Classify by leading keyword
	std::size_t text_offset = body_start;
	std::string_view text = s.substr(body_start, body_end-body_start);
	while (!text.empty() && is_space(text.front()))
	{
		text.remove_prefix(1);
		++text_offset;
	}

	Token::Kind kind = Token::Kind::VALUE;
	std::size_t word = 0;
	while (word < text.size() && !is_space(text[word]))
		++word;
	for (const auto& [name, k] : keywords)
	{
		if (text.substr(0, word) != name)
			continue;

		kind = k;
		text.remove_prefix(word);
		text_offset += word;
		while (!text.empty() && is_space(text.front()))
		{
			text.remove_prefix(1);
			++text_offset;
		}
		break;
	}
	while (!text.empty() && is_space(text.back()))
		text.remove_suffix(1);

	return Token{
		.type = Token::Type::MARKUP,
		.kind = kind,
		.span = s.substr(start, m_pos-start),
		.offset = start,
		.text = text,
		.text_offset = text_offset,
		.trim_left = trim_left,
		.trim_right = trim_right,
	};
}
} // Stencil
