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

#ifndef STENCIL_ERROR_HPP
#define STENCIL_ERROR_HPP

#include "Util.hpp"
#include <vector>

namespace Stencil
{
/**
 * @brief Error raised while compiling a template
 *
 * what() returns a full diagnostic (source name, line, column and the
 * offending line), message() only the message.
 */
class CompileError : public Error
{
	std::string m_message; ///< Message without diagnostic
	std::size_t m_offset; ///< Byte offset in source
	std::size_t m_line; ///< Line (starting at 1)
	std::size_t m_column; ///< Column in codepoints (starting at 1)

public:
	/**
	 * @brief Constructor
	 *
	 * @param source Source the error happened in
	 * @param category Error category
	 * @param msg Error message
	 * @param offset Error's position
	 * @param count Number of characters to highlight
	 */
	CompileError(const Source& source, std::string_view category, std::string&& msg, std::size_t offset, std::size_t count);

	[[nodiscard]] const std::string& message() const noexcept { return m_message; }
	[[nodiscard]] std::size_t offset() const noexcept { return m_offset; }
	[[nodiscard]] std::size_t line() const noexcept { return m_line; }
	[[nodiscard]] std::size_t column() const noexcept { return m_column; }
};

/**
 * @brief Malformed delimiter structure
 */
class LexError : public CompileError
{
public:
	LexError(const Source& source, std::string&& msg, std::size_t offset, std::size_t count = 2):
		CompileError(source, "Lex error", std::move(msg), offset, count) {}
};

/**
 * @brief Malformed expression or unbalanced blocks
 */
class ParseError : public CompileError
{
public:
	ParseError(const Source& source, std::string&& msg, std::size_t offset, std::size_t count = 1):
		CompileError(source, "Parse error", std::move(msg), offset, count) {}
};

/**
 * @brief Thrown by formatters to report a failure
 */
class FormatterError : public Error
{
public:
	FormatterError(const std::string& msg, const std::source_location& loc = std::source_location::current()):
		Error(msg, loc) {}
};

/**
 * @brief Error raised while rendering a template
 */
class RenderError : public Error
{
public:
	/**
	 * @brief Kind of render errors
	 */
	enum class Kind : std::uint8_t
	{
		MISSING_FIELD,
		NOT_ITERABLE,
		AMBIGUOUS_VALUE,
		FORMATTER_ERROR,
		NOT_AN_OBJECT,
		UNKNOWN_TEMPLATE,
		RECURSION_LIMIT,
	};

	/**
	 * @brief Extra information about the error
	 */
	struct Details
	{
		std::string tmpl; ///< Template being rendered
		std::size_t offset = 0; ///< Offset of the offending expression in the template's source
		std::vector<std::string> path; ///< Offending path
		std::size_t depth = 0; ///< Scope depth
		std::string name; ///< Formatter or template name
	};

private:
	Kind m_kind;
	Details m_details;
	std::string m_message;

public:
	/**
	 * @brief Constructor
	 *
	 * @param kind Kind of error
	 * @param msg Message
	 * @param details Error details
	 */
	RenderError(Kind kind, std::string&& msg, Details&& details);

	[[nodiscard]] Kind kind() const noexcept { return m_kind; }
	[[nodiscard]] const std::vector<std::string>& path() const noexcept { return m_details.path; }
	[[nodiscard]] std::size_t depth() const noexcept { return m_details.depth; }
	[[nodiscard]] const std::string& name() const noexcept { return m_details.name; }
	[[nodiscard]] const std::string& template_name() const noexcept { return m_details.tmpl; }
	[[nodiscard]] std::size_t offset() const noexcept { return m_details.offset; }
	[[nodiscard]] const std::string& message() const noexcept { return m_message; }
};

/**
 * @brief Gets the name of a render error kind
 *
 * @param kind Kind
 * @returns Kind's name
 */
[[nodiscard]] std::string_view getKindName(RenderError::Kind kind) noexcept;
} // Stencil

#endif // STENCIL_ERROR_HPP
