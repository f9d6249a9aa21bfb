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

#ifndef STENCIL_RENDERER_HPP
#define STENCIL_RENDERER_HPP

#include <deque>
#include "Template.hpp"
#include "Error.hpp"

namespace Stencil
{
/**
 * @brief Runs a template's program against a value
 *
 * A renderer holds the state of a single render: its scope stack and the
 * values created by `with` blocks. It is not reusable.
 */
class Renderer
{
	/**
	 * @brief Maximum depth of nested `call`
	 */
	static constexpr std::size_t max_calls = 64;

	/**
	 * @brief A frame of the scope stack
	 */
	struct Scope
	{
		enum class Type : std::uint8_t
		{
			ROOT, ///< Fields of the root value
			OBJECT, ///< Fields of a `with` value
			NAMED, ///< `with ... as name`
			LOOP, ///< `for`
		};

		Type type;
		const Value* value; ///< Scope's value (current element for loops)
		std::string_view name; ///< Bound name (NAMED, LOOP)
		std::string_view index_name; ///< Index name (LOOP, may be empty)
		const Sequence* seq = nullptr; ///< Collection (LOOP)
		std::size_t index = 0; ///< Current index (LOOP)
		Value index_value; ///< Current index as a value (LOOP)
		bool owned = false; ///< Value is stored in m_owned
	};

	const Template& m_tmpl;
	const FormatterRegistry& m_formatters;
	const TemplateMap* m_templates; ///< Templates for `call`, may be nullptr
	std::size_t m_calls; ///< Depth of nested `call`

	/**
	 * @brief Scope stack, innermost scope last
	 *
	 * Frames are only pushed and popped at the back, so pointers to a loop
	 * frame's `index_value` held by inner frames stay valid.
	 */
	std::deque<Scope> m_scopes;
	std::deque<Value> m_owned; ///< Computed values pushed by `with`
	std::string* m_out = nullptr;

	[[noreturn]] void error(RenderError::Kind kind, std::string&& msg, std::size_t offset,
			std::vector<std::string> path = {}, std::string name = {}) const;

	/**
	 * @brief Looks up a path in the scope stack, innermost scope first
	 *
	 * @throws RenderError MISSING_FIELD
	 */
	[[nodiscard]] const Value& lookup(const Path& path, std::size_t offset) const;

	/**
	 * @brief Evaluates an expression
	 *
	 * @param expr Expression
	 * @param storage Storage for computed values
	 * @returns The value, either in storage or owned by the context or template
	 */
	[[nodiscard]] const Value& evaluate(const ValueExpr& expr, Value& storage) const;

	[[nodiscard]] bool test(const Condition& cond) const;

	/**
	 * @brief Gets the innermost scope's value
	 */
	[[nodiscard]] const Value& current() const noexcept;

	std::size_t exec(const Instr::EmitLiteral& instr, std::size_t pc);
	std::size_t exec(const Instr::EmitValue& instr, std::size_t pc);
	std::size_t exec(const Instr::Branch& instr, std::size_t pc);
	std::size_t exec(const Instr::Jump& instr, std::size_t pc);
	std::size_t exec(const Instr::IterStart& instr, std::size_t pc);
	std::size_t exec(const Instr::IterNext& instr, std::size_t pc);
	std::size_t exec(const Instr::IterEnd& instr, std::size_t pc);
	std::size_t exec(const Instr::PushScope& instr, std::size_t pc);
	std::size_t exec(const Instr::PopScope& instr, std::size_t pc);
	std::size_t exec(const Instr::Call& instr, std::size_t pc);
public:
	/**
	 * @brief Constructor
	 *
	 * @param tmpl Template to render
	 * @param formatters Formatters for pipes
	 * @param templates Templates for `call`, may be nullptr
	 * @param calls Depth of nested `call`
	 */
	[[nodiscard]] Renderer(const Template& tmpl, const FormatterRegistry& formatters,
			const TemplateMap* templates = nullptr, std::size_t calls = 0) noexcept:
		m_tmpl{tmpl}, m_formatters{formatters}, m_templates{templates}, m_calls{calls} {}

	/**
	 * @brief Renders the template
	 *
	 * @param root Root value, must outlive the render
	 * @param out Output, appended to
	 * @throws RenderError
	 */
	void render(const Value& root, std::string& out);
};
} // Stencil

#endif // STENCIL_RENDERER_HPP
