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

#include "Expression.hpp"
#include "Error.hpp"
#include <charconv>
#include <fmt/format.h>

using namespace std::literals;

namespace Stencil
{
static constexpr auto loop_keywords = make_array<std::string_view>("@index"sv, "@first"sv, "@last"sv);
static constexpr auto reserved_names = make_array<std::string_view>("true"sv, "false"sv, "null"sv, "in"sv, "not"sv);

[[nodiscard]] static constexpr bool isIdentStart(char c) noexcept
{
	return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

[[nodiscard]] static constexpr bool isIdentChar(char c) noexcept
{
	return isIdentStart(c) || (c >= '0' && c <= '9');
}

[[nodiscard]] static constexpr bool isDigit(char c) noexcept
{
	return c >= '0' && c <= '9';
}

[[nodiscard]] bool Path::is_loop_keyword() const noexcept
{
	return segments.size() == 1
		&& std::find(loop_keywords.cbegin(), loop_keywords.cend(), segments.front()) != loop_keywords.cend();
}

[[nodiscard]] std::string Path::str() const
{
	std::string s;
	for (const auto& seg : segments)
	{
		if (!s.empty())
			s.push_back('.');
		s.append(seg);
	}
	return s;
}

[[nodiscard]] std::string ValueExpr::str() const
{
	std::string s = std::visit(overloaded{
		[](const Path& p) { return p.str(); },
		[](const Value& v) { return v.repr(); },
	}, source);

	for (const auto& pipe : pipes)
	{
		s.append(" | ").append(pipe.name);
		if (pipe.args.empty())
			continue;

		s.push_back('(');
		for (std::size_t i = 0; i < pipe.args.size(); ++i)
		{
			if (i != 0)
				s.append(", ");
			s.append(pipe.args[i].str());
		}
		s.push_back(')');
	}

	return s;
}

[[nodiscard]] std::string Condition::str() const
{
	return std::visit(overloaded{
		[](const Truthy& c) { return c.value.str(); },
		[](const Equals& c) { return fmt::format("{} == {}", c.lhs.str(), c.rhs.str()); },
		[](const NotEquals& c) { return fmt::format("{} != {}", c.lhs.str(), c.rhs.str()); },
		[](const Not& c) { return fmt::format("not {}", c.cond->str()); },
	}, data);
}

void forEachPath(const ValueExpr& expr, const std::function<void(const Path&, std::size_t)>& fn)
{
	if (const Path* p = expr.path())
		fn(*p, expr.offset);

	for (const auto& pipe : expr.pipes)
		for (const auto& arg : pipe.args)
			forEachPath(arg, fn);
}

void forEachPath(const Condition& cond, const std::function<void(const Path&, std::size_t)>& fn)
{
	std::visit(overloaded{
		[&](const Condition::Truthy& c) { forEachPath(c.value, fn); },
		[&](const Condition::Equals& c) { forEachPath(c.lhs, fn); forEachPath(c.rhs, fn); },
		[&](const Condition::NotEquals& c) { forEachPath(c.lhs, fn); forEachPath(c.rhs, fn); },
		[&](const Condition::Not& c) { forEachPath(*c.cond, fn); },
	}, cond.data);
}

void ExpressionParser::error(std::string&& msg, std::size_t pos, std::size_t count) const
{
	throw ParseError(m_source, std::move(msg), m_base + std::min(pos, m_text.size()), count);
}

void ExpressionParser::skip() noexcept
{
	while (m_pos < m_text.size() && is_space(m_text[m_pos]))
		++m_pos;
}

[[nodiscard]] bool ExpressionParser::eof() noexcept
{
	skip();
	return m_pos >= m_text.size();
}

[[nodiscard]] bool ExpressionParser::peek(std::string_view s) noexcept
{
	skip();
	return m_text.substr(m_pos).starts_with(s);
}

[[nodiscard]] bool ExpressionParser::consume(std::string_view s) noexcept
{
	if (!peek(s))
		return false;

	m_pos += s.size();
	return true;
}

[[nodiscard]] bool ExpressionParser::keyword(std::string_view s) noexcept
{
	if (!peek(s))
		return false;
	if (m_pos + s.size() < m_text.size() && isIdentChar(m_text[m_pos + s.size()]))
		return false;

	m_pos += s.size();
	return true;
}

void ExpressionParser::expect_end()
{
	if (eof())
		return;

	const std::string_view rest = m_text.substr(m_pos);
	error(fmt::format("Unexpected `{}`", rest), m_pos, rest.size());
}

[[nodiscard]] std::string ExpressionParser::identifier(std::string_view what)
{
	skip();
	if (m_pos >= m_text.size())
		error(fmt::format("Expected {}", what), m_pos);
	if (!isIdentStart(m_text[m_pos]))
		error(fmt::format("Expected {}, found `{}`", what, m_text[m_pos]), m_pos);

	const std::size_t start = m_pos;
	while (m_pos < m_text.size() && isIdentChar(m_text[m_pos]))
		++m_pos;

	return std::string{m_text.substr(start, m_pos-start)};
}

[[nodiscard]] Path ExpressionParser::path()
{
	skip();
	const std::size_t start = m_pos;
	Path p;

	// Loop state
	if (m_pos < m_text.size() && m_text[m_pos] == '@')
	{
		++m_pos;
		if (m_pos >= m_text.size() || !isIdentStart(m_text[m_pos]))
			error("Expected loop variable name after `@`", m_pos);
		std::string name = "@" + identifier("loop variable name after `@`");
		if (std::find(loop_keywords.cbegin(), loop_keywords.cend(), name) == loop_keywords.cend())
			error(fmt::format("Unknown loop variable `{}`, expected one of `@index`, `@first`, `@last`", name), start, m_pos-start);
		if (m_pos < m_text.size() && m_text[m_pos] == '.')
			error(fmt::format("Loop variable `{}` has no fields", name), m_pos);

		p.segments.push_back(std::move(name));
		return p;
	}

	if (m_pos >= m_text.size())
		error("Expected a path", m_pos);
	if (!isIdentStart(m_text[m_pos]))
		error(fmt::format("Invalid character `{}` at start of path", m_text[m_pos]), m_pos);
	p.segments.push_back(identifier("a path"));

	while (m_pos < m_text.size() && m_text[m_pos] == '.')
	{
		++m_pos;
		if (m_pos >= m_text.size() || !(isIdentStart(m_text[m_pos]) || isDigit(m_text[m_pos])))
			error(fmt::format("Empty path segment after `{}`", p.str()), m_pos-1);

		if (isDigit(m_text[m_pos])) // Index
		{
			const std::size_t seg = m_pos;
			while (m_pos < m_text.size() && isDigit(m_text[m_pos]))
				++m_pos;
			if (m_pos < m_text.size() && isIdentChar(m_text[m_pos]))
				error("Path segment cannot start with a digit", seg, m_pos-seg+1);
			p.segments.emplace_back(m_text.substr(seg, m_pos-seg));
		}
		else
			p.segments.push_back(identifier("a path segment"));
	}

	return p;
}

[[nodiscard]] std::optional<Value> ExpressionParser::literal()
{
	if (eof())
		return std::nullopt;

	const std::size_t start = m_pos;
	const char c = m_text[m_pos];

	// String
	if (c == '"' || c == '\'')
	{
		std::string s;
		++m_pos;
		while (m_pos < m_text.size() && m_text[m_pos] != c)
		{
			if (m_text[m_pos] == '\\' && m_pos+1 < m_text.size())
			{
				++m_pos;
				switch (m_text[m_pos])
				{
					case 'n': s.push_back('\n'); break;
					case 't': s.push_back('\t'); break;
					case 'r': s.push_back('\r'); break;
					case '\\': s.push_back('\\'); break;
					case '"': s.push_back('"'); break;
					case '\'': s.push_back('\''); break;
					default:
						error(fmt::format("Unknown escape sequence `\\{}`", m_text[m_pos]), m_pos-1, 2);
				}
			}
			else
				s.push_back(m_text[m_pos]);
			++m_pos;
		}
		if (m_pos >= m_text.size())
			error("Unterminated string literal", start);
		++m_pos;

		return Value{std::move(s)};
	}

	// Number
	if (isDigit(c) || (c == '-' && m_pos+1 < m_text.size() && isDigit(m_text[m_pos+1])))
	{
		bool is_float = false;
		if (c == '-')
			++m_pos;
		while (m_pos < m_text.size() && isDigit(m_text[m_pos]))
			++m_pos;
		if (m_pos+1 < m_text.size() && m_text[m_pos] == '.' && isDigit(m_text[m_pos+1]))
		{
			is_float = true;
			++m_pos;
			while (m_pos < m_text.size() && isDigit(m_text[m_pos]))
				++m_pos;
		}
		if (m_pos < m_text.size() && (m_text[m_pos] == 'e' || m_text[m_pos] == 'E'))
		{
			is_float = true;
			++m_pos;
			if (m_pos < m_text.size() && (m_text[m_pos] == '+' || m_text[m_pos] == '-'))
				++m_pos;
			if (m_pos >= m_text.size() || !isDigit(m_text[m_pos]))
				error("Invalid exponent in number", start, m_pos-start);
			while (m_pos < m_text.size() && isDigit(m_text[m_pos]))
				++m_pos;
		}
		if (m_pos < m_text.size() && isIdentChar(m_text[m_pos]))
			error("Invalid number", start, m_pos-start+1);

		const std::string_view num = m_text.substr(start, m_pos-start);
		if (is_float)
		{
			double d;
			const auto [ptr, ec] = std::from_chars(num.data(), num.data()+num.size(), d);
			if (ec != std::errc{} || ptr != num.data()+num.size())
				error(fmt::format("Cannot represent number `{}`", num), start, num.size());
			return Value{d};
		}

		std::int64_t n;
		const auto [ptr, ec] = std::from_chars(num.data(), num.data()+num.size(), n);
		if (ec != std::errc{} || ptr != num.data()+num.size())
			error(fmt::format("Cannot represent number `{}` (out of range)", num), start, num.size());
		return Value{n};
	}

	if (keyword("true"))
		return Value{true};
	if (keyword("false"))
		return Value{false};
	if (keyword("null"))
		return Value{};

	return std::nullopt;
}

[[nodiscard]] ValueExpr ExpressionParser::value()
{
	if (eof())
		error("Expected an expression", m_pos);

	ValueExpr e;
	e.offset = m_base + m_pos;
	if (auto lit = literal())
		e.source = std::move(*lit);
	else
		e.source = path();

	while (!eof() && m_text[m_pos] == '|')
	{
		++m_pos;
		skip();

		Pipe pipe;
		pipe.offset = m_base + m_pos;
		pipe.name = identifier("formatter name after `|`");
		if (m_pos < m_text.size() && m_text[m_pos] == '(')
		{
			if (m_depth == max_depth)
				error(fmt::format("Formatter arguments nested deeper than {} levels", max_depth), m_pos);
			++m_pos;
			if (!consume(")"))
			{
				++m_depth;
				do
					pipe.args.push_back(value());
				while (consume(","));
				--m_depth;

				if (!consume(")"))
					error(fmt::format("Expected `,` or `)` in arguments of formatter `{}`", pipe.name), m_pos);
			}
		}
		e.pipes.push_back(std::move(pipe));
	}

	return e;
}

[[nodiscard]] Condition ExpressionParser::condition()
{
	const auto negation = [this]
	{
		skip();
		return keyword("not")
			|| (m_pos < m_text.size() && m_text[m_pos] == '!' && !peek("!=") && consume("!"));
	};

	// Pairs of negations cancel out
	bool negated = false;
	while (negation())
		negated = !negated;

	Condition cond;
	ValueExpr lhs = value();
	if (consume("=="))
		cond.data = Condition::Equals{std::move(lhs), value()};
	else if (consume("!="))
		cond.data = Condition::NotEquals{std::move(lhs), value()};
	else
		cond.data = Condition::Truthy{std::move(lhs)};

	if (negated)
		return Condition{Condition::Not{std::make_shared<const Condition>(std::move(cond))}};
	return cond;
}

[[nodiscard]] ValueExpr ExpressionParser::parse_value()
{
	ValueExpr e = value();
	expect_end();
	return e;
}

[[nodiscard]] Condition ExpressionParser::parse_condition()
{
	Condition c = condition();
	expect_end();
	return c;
}

[[nodiscard]] ForHeader ExpressionParser::parse_for()
{
	auto checkName = [this](const std::string& name, std::size_t pos)
	{
		if (std::find(reserved_names.cbegin(), reserved_names.cend(), name) != reserved_names.cend())
			error(fmt::format("`{}` cannot be used as a loop variable", name), pos, name.size());
	};

	ForHeader h;
	skip();
	std::size_t pos = m_pos;
	std::string first = identifier("loop variable name");
	checkName(first, pos);
	if (consume(","))
	{
		skip();
		pos = m_pos;
		h.index_name = std::move(first);
		h.binding = identifier("loop variable name after `,`");
		checkName(h.binding, pos);
		if (h.binding == h.index_name)
			error(fmt::format("Loop variables must have different names, got `{}` twice", h.binding), pos, h.binding.size());
	}
	else
		h.binding = std::move(first);

	if (!keyword("in"))
		error(fmt::format("Expected `in` after loop variable `{}`", h.binding), m_pos);

	h.collection = value();
	expect_end();
	return h;
}

[[nodiscard]] WithHeader ExpressionParser::parse_with()
{
	WithHeader h{.value = value()};
	if (keyword("as"))
	{
		skip();
		const std::size_t pos = m_pos;
		h.name = identifier("name after `as`");
		if (std::find(reserved_names.cbegin(), reserved_names.cend(), h.name) != reserved_names.cend())
			error(fmt::format("`{}` cannot be used as a name", h.name), pos, h.name.size());
	}
	expect_end();
	return h;
}

[[nodiscard]] CallHeader ExpressionParser::parse_call()
{
	skip();
	const std::size_t start = m_pos;
	while (m_pos < m_text.size() && !is_space(m_text[m_pos]))
		++m_pos;
	if (m_pos == start)
		error("Expected template name after `call`", m_pos);

	CallHeader h{.name = std::string{m_text.substr(start, m_pos-start)}};
	if (keyword("with"))
		h.value = value();
	expect_end();
	return h;
}
} // Stencil
