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

#include "Compiler.hpp"
#include "Error.hpp"
#include <fmt/format.h>

namespace Stencil
{
[[nodiscard]] static std::string_view getBlockName(Token::Kind kind) noexcept
{
	if (kind == Token::Kind::ELSE)
		return getKindName(Token::Kind::IF);
	return getKindName(kind);
}

void TemplateCompiler::error(std::string&& msg, std::size_t offset, std::size_t count) const
{
	throw ParseError(m_source, std::move(msg), offset, count);
}

void TemplateCompiler::flush()
{
	if (m_pending.empty())
		return;

	m_tmpl.m_literals.push_back(std::move(m_pending));
	m_tmpl.m_instructions.push_back(Instr::EmitLiteral{m_tmpl.m_literals.size()-1});
	m_pending.clear();
	m_verbatim = 0;
}

void TemplateCompiler::check_loop_state(const ValueExpr& expr) const
{
	if (m_loops != 0)
		return;

	forEachPath(expr, [this](const Path& p, std::size_t offset)
	{
		if (p.is_loop_keyword())
			error(fmt::format("`{}` used outside of a `for` block", p.str()), offset, p.str().size());
	});
}

void TemplateCompiler::check_loop_state(const Condition& cond) const
{
	if (m_loops != 0)
		return;

	forEachPath(cond, [this](const Path& p, std::size_t offset)
	{
		if (p.is_loop_keyword())
			error(fmt::format("`{}` used outside of a `for` block", p.str()), offset, p.str().size());
	});
}

void TemplateCompiler::expect_empty(const Token& tok) const
{
	if (tok.text.empty())
		return;

	error(fmt::format("Unexpected `{}` after `{}`", tok.text, getKindName(tok.kind)), tok.text_offset, tok.text.size());
}

TemplateCompiler::Block TemplateCompiler::close(const Token& tok, std::initializer_list<Token::Kind> kinds)
{
	const std::string_view opener = getBlockName(*kinds.begin());
	if (m_blocks.empty())
		error(fmt::format("`{}` without an open `{}` block", getKindName(tok.kind), opener),
			tok.offset, tok.span.size());

	const Block block = m_blocks.back();
	if (std::find(kinds.begin(), kinds.end(), block.kind) == kinds.end())
		error(fmt::format("`{}` does not match the open `{}` block", getKindName(tok.kind), getBlockName(block.kind)),
			tok.offset, tok.span.size());

	m_blocks.pop_back();
	return block;
}

void TemplateCompiler::literal(const Token& tok)
{
	std::string_view text = tok.text;
	if (m_trimNext)
	{
		while (!text.empty() && is_space(text.front()))
			text.remove_prefix(1);
		m_trimNext = false;
	}

	m_pending.append(text);
}

void TemplateCompiler::raw(const Token& tok)
{
	m_trimNext = false;
	m_pending.append(tok.text);
	m_verbatim = m_pending.size();
}

void TemplateCompiler::markup(const Token& tok)
{
	if (tok.trim_left)
		while (m_pending.size() > m_verbatim && is_space(m_pending.back()))
			m_pending.pop_back();
	flush();
	m_trimNext = tok.trim_right;

	auto& prog = m_tmpl.m_instructions;
	ExpressionParser parser(m_source, tok.text, tok.text_offset);
	switch (tok.kind)
	{
		case Token::Kind::VALUE:
		{
			if (tok.text.empty())
				error("Empty tag", tok.offset, tok.span.size());

			ValueExpr value = parser.parse_value();
			check_loop_state(value);
			prog.push_back(Instr::EmitValue{std::move(value)});
			break;
		}
		case Token::Kind::IF:
		{
			if (tok.text.empty())
				error("Missing condition after `if`", tok.offset, tok.span.size());

			Condition cond = parser.parse_condition();
			check_loop_state(cond);
			m_blocks.push_back(Block{Token::Kind::IF, prog.size(), tok.offset, tok.span.size()});
			prog.push_back(Instr::Branch{std::move(cond), 0});
			break;
		}
		case Token::Kind::ELSE:
		{
			expect_empty(tok);
			if (m_blocks.empty())
				error("`else` without an open `if` block", tok.offset, tok.span.size());

			Block& block = m_blocks.back();
			if (block.kind == Token::Kind::ELSE)
				error("Duplicate `else` in `if` block", tok.offset, tok.span.size());
			else if (block.kind != Token::Kind::IF)
				error(fmt::format("`else` inside a `{}` block", getKindName(block.kind)), tok.offset, tok.span.size());

			block.kind = Token::Kind::ELSE;
			block.jump = prog.size();
			prog.push_back(Instr::Jump{0});
			std::get<Instr::Branch>(prog[block.index]).target = prog.size();
			break;
		}
		case Token::Kind::ENDIF:
		{
			expect_empty(tok);
			const Block block = close(tok, {Token::Kind::IF, Token::Kind::ELSE});
			if (block.kind == Token::Kind::ELSE)
				std::get<Instr::Jump>(prog[block.jump]).target = prog.size();
			else
				std::get<Instr::Branch>(prog[block.index]).target = prog.size();
			break;
		}
		case Token::Kind::FOR:
		{
			if (tok.text.empty())
				error("Missing loop header after `for`", tok.offset, tok.span.size());

			ForHeader header = parser.parse_for();
			check_loop_state(header.collection);
			m_blocks.push_back(Block{Token::Kind::FOR, prog.size(), tok.offset, tok.span.size()});
			prog.push_back(Instr::IterStart{
				.collection = std::move(header.collection),
				.binding = std::move(header.binding),
				.index_name = std::move(header.index_name),
				.target = 0,
			});
			++m_loops;
			break;
		}
		case Token::Kind::ENDFOR:
		{
			expect_empty(tok);
			const Block block = close(tok, {Token::Kind::FOR});
			prog.push_back(Instr::IterNext{block.index+1});
			prog.push_back(Instr::IterEnd{});
			std::get<Instr::IterStart>(prog[block.index]).target = prog.size();
			--m_loops;
			break;
		}
		case Token::Kind::WITH:
		{
			if (tok.text.empty())
				error("Missing value after `with`", tok.offset, tok.span.size());

			WithHeader header = parser.parse_with();
			check_loop_state(header.value);
			m_blocks.push_back(Block{Token::Kind::WITH, prog.size(), tok.offset, tok.span.size()});
			prog.push_back(Instr::PushScope{std::move(header.value), std::move(header.name)});
			break;
		}
		case Token::Kind::ENDWITH:
		{
			expect_empty(tok);
			[[maybe_unused]] const Block block = close(tok, {Token::Kind::WITH});
			prog.push_back(Instr::PopScope{});
			break;
		}
		case Token::Kind::CALL:
		{
			CallHeader header = parser.parse_call();
			if (header.value)
				check_loop_state(*header.value);
			prog.push_back(Instr::Call{std::move(header.name), std::move(header.value), tok.offset});
			break;
		}
	}
}

[[nodiscard]] Template TemplateCompiler::compile()
{
	Lexer lexer(m_source);
	while (const auto tok = lexer.next())
	{
		switch (tok->type)
		{
			case Token::Type::LITERAL:
				literal(*tok);
				break;
			case Token::Type::RAW:
				raw(*tok);
				break;
			case Token::Type::MARKUP:
				markup(*tok);
				break;
		}
	}
	flush();

	if (!m_blocks.empty())
	{
		const Block& block = m_blocks.back();
		error(fmt::format("Unclosed `{}` block", getBlockName(block.kind)), block.offset, block.count);
	}

	return std::move(m_tmpl);
}
} // Stencil
