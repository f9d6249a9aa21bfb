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

#ifndef STENCIL_EXPRESSION_HPP
#define STENCIL_EXPRESSION_HPP

#include <functional>
#include <memory>
#include <optional>
#include <variant>
#include <vector>
#include "Value.hpp"

namespace Stencil
{
/**
 * @brief Dotted lookup path, e.g `user.name` or `items.0`
 */
struct Path
{
	std::vector<std::string> segments; ///< Non-empty list of segments

	/**
	 * @brief Gets whether this path refers to the state of the innermost loop
	 *
	 * @returns true for `@index`, `@first` and `@last`
	 */
	[[nodiscard]] bool is_loop_keyword() const noexcept;

	/**
	 * @brief Gets the path as written in the template
	 */
	[[nodiscard]] std::string str() const;

	[[nodiscard]] friend bool operator==(const Path&, const Path&) = default;
};

struct ValueExpr;

/**
 * @brief Formatter applied to a value, `| name(args...)`
 */
struct Pipe
{
	std::string name; ///< Formatter's name
	std::vector<ValueExpr> args; ///< Formatter's arguments
	std::size_t offset; ///< Offset of the formatter name in the source
};

/**
 * @brief Expression resolved to a value at render time
 *
 * A source (path or literal) followed by pipes applied left to right:
 * `a | f | g` is `g(f(a))`.
 */
struct ValueExpr
{
	std::variant<Path, Value> source; ///< Path to look up, or literal
	std::vector<Pipe> pipes; ///< Formatters to apply, in order
	std::size_t offset; ///< Offset of the expression in the source

	/**
	 * @brief Gets the expression as written in the template
	 */
	[[nodiscard]] std::string str() const;

	/**
	 * @brief Gets the path of the expression
	 *
	 * @returns nullptr for literals
	 */
	[[nodiscard]] const Path* path() const noexcept { return std::get_if<Path>(&source); }
};

/**
 * @brief Condition of an `if` block
 */
struct Condition
{
	struct Truthy
	{
		ValueExpr value;
	};
	struct Equals
	{
		ValueExpr lhs, rhs;
	};
	struct NotEquals
	{
		ValueExpr lhs, rhs;
	};
	struct Not
	{
		std::shared_ptr<const Condition> cond;
	};

	std::variant<Truthy, Equals, NotEquals, Not> data;

	/**
	 * @brief Gets the condition as written in the template
	 */
	[[nodiscard]] std::string str() const;
};

/**
 * @brief Header of a `for` block: `[index,] binding in collection`
 */
struct ForHeader
{
	std::string binding; ///< Name bound to the current element
	std::string index_name; ///< Name bound to the current index (may be empty)
	ValueExpr collection; ///< Collection to iterate
};

/**
 * @brief Header of a `with` block: `value [as name]`
 */
struct WithHeader
{
	ValueExpr value; ///< Value to push
	std::string name; ///< Binding name, empty to expose the value's fields
};

/**
 * @brief Header of a `call` tag: `name [with value]`
 */
struct CallHeader
{
	std::string name; ///< Template to call
	std::optional<ValueExpr> value; ///< Value to render the template against
};

/**
 * @brief Calls fn on every path of an expression, pipe arguments included
 *
 * @param expr Expression
 * @param fn Callback
 */
void forEachPath(const ValueExpr& expr, const std::function<void(const Path&, std::size_t)>& fn);

/**
 * @brief Calls fn on every path of a condition
 *
 * @param cond Condition
 * @param fn Callback
 */
void forEachPath(const Condition& cond, const std::function<void(const Path&, std::size_t)>& fn);

/**
 * @brief Parses the body of a markup tag
 *
 * Every parse method consumes the whole body and throws ParseError if
 * anything is left.
 */
class ExpressionParser
{
	const Source& m_source; ///< Source the body comes from (for errors)
	std::string_view m_text; ///< Body to parse
	std::size_t m_base; ///< Offset of m_text in source
	std::size_t m_pos = 0; ///< Position in m_text
	std::size_t m_depth = 0; ///< Nesting of formatter arguments

	/**
	 * @brief Maximum nesting of formatter arguments, `f(g(h(...)))`
	 */
	static constexpr std::size_t max_depth = 32;

	[[noreturn]] void error(std::string&& msg, std::size_t pos, std::size_t count = 1) const;
	void skip() noexcept;
	[[nodiscard]] bool eof() noexcept;
	[[nodiscard]] bool peek(std::string_view s) noexcept;
	[[nodiscard]] bool consume(std::string_view s) noexcept;
	[[nodiscard]] bool keyword(std::string_view s) noexcept;
	void expect_end();

	[[nodiscard]] std::string identifier(std::string_view what);
	[[nodiscard]] Path path();
	[[nodiscard]] std::optional<Value> literal();
	[[nodiscard]] ValueExpr value();
	[[nodiscard]] Condition condition();
public:
	/**
	 * @brief Constructor
	 *
	 * @param source Source the body comes from
	 * @param text Body to parse
	 * @param base Offset of text in source
	 */
	[[nodiscard]] ExpressionParser(const Source& source, std::string_view text, std::size_t base) noexcept:
		m_source{source}, m_text{text}, m_base{base} {}

	/**
	 * @brief Parses a value expression: `path | formatter(args)`
	 */
	[[nodiscard]] ValueExpr parse_value();

	/**
	 * @brief Parses a condition: `[not] value [(==|!=) value]`
	 */
	[[nodiscard]] Condition parse_condition();

	/**
	 * @brief Parses a for header: `[index,] name in value`
	 */
	[[nodiscard]] ForHeader parse_for();

	/**
	 * @brief Parses a with header: `value [as name]`
	 */
	[[nodiscard]] WithHeader parse_with();

	/**
	 * @brief Parses a call header: `name [with value]`
	 */
	[[nodiscard]] CallHeader parse_call();
};
} // Stencil

#endif // STENCIL_EXPRESSION_HPP
