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

#include "Error.hpp"
#include <fmt/format.h>

using namespace std::literals;

namespace Stencil
{
CompileError::CompileError(const Source& source, std::string_view category, std::string&& msg, std::size_t offset, std::size_t count):
	Error(source.get_error_message(category, msg, offset, count)),
	m_message{std::move(msg)}, m_offset{offset}
{
	const auto&& [line, column] = source.get_position(offset);
	m_line = line;
	m_column = column;
}

RenderError::RenderError(Kind kind, std::string&& msg, Details&& details):
	Error(fmt::format("{}: {} (in template `{}`, offset {}, scope depth {})",
		getKindName(kind), msg, details.tmpl, details.offset, details.depth)),
	m_kind{kind}, m_details{std::move(details)}, m_message{std::move(msg)}
{
}

[[nodiscard]] std::string_view getKindName(RenderError::Kind kind) noexcept
{
	static constexpr auto names = make_array<std::string_view>(
		"Missing field",
		"Not iterable",
		"Ambiguous value",
		"Formatter error",
		"Not an object",
		"Unknown template",
		"Recursion limit"
	);

	return names[static_cast<std::size_t>(kind)];
}
} // Stencil
