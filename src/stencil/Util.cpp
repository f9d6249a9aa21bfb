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

#include "Util.hpp"
#include <cmath>
#include <utf8.h>
#include <fmt/format.h>

using namespace std::literals;

namespace Stencil
{
bool Colors::enabled = true;
const std::string_view Colors::reset = "\033[0m"sv;
const std::string_view Colors::bold = "\033[1m"sv;
const std::string_view Colors::red = "\033[31m"sv;
const std::string_view Colors::magenta = "\033[35m"sv;

Error::Error(const std::string& msg, const std::source_location& loc):
	m_msg{msg}, m_loc{loc}
{
}

std::string Error::what() const throw()
{
	return m_msg;
}

std::string Error::where() const
{
	return fmt::format("{}({}:{}) `{}`", m_loc.file_name(), m_loc.line(), m_loc.column(), m_loc.function_name());
}

[[nodiscard]] std::string_view trim(std::string_view s) noexcept
{
	while (!s.empty() && is_space(s.front()))
		s.remove_prefix(1);
	while (!s.empty() && is_space(s.back()))
		s.remove_suffix(1);
	return s;
}

[[nodiscard]] std::string_view Source::get_line(std::size_t start) const noexcept
{
	const std::size_t end = content.find('\n', start);
	if (end == std::string_view::npos)
		return content.substr(start);
	return content.substr(start, end-start);
}

[[nodiscard]] static std::size_t lineStart(std::string_view content, std::size_t pos) noexcept
{
	if (pos == 0 || content.empty())
		return 0;

	const std::size_t start = content.rfind('\n', std::min(pos, content.size()) - 1);
	if (start == std::string_view::npos) [[unlikely]]
		return 0;
	return start+1;
}

[[nodiscard]] std::pair<std::size_t, std::size_t> Source::get_position(std::size_t pos) const noexcept
{
	pos = std::min(pos, content.size());
	const std::size_t start = lineStart(content, pos);

	const std::size_t line_number = std::count(content.cbegin(), content.cbegin()+start, '\n'); // Line number
	const std::size_t line_pos = utf8::unchecked::distance(content.cbegin()+start, content.cbegin()+pos); // Position in line

	return {line_number+1, line_pos+1};
}

[[nodiscard]] std::string Source::get_error_message(std::string_view category, std::string_view msg,
		std::size_t pos, std::size_t count) const
{
	pos = std::min(pos, content.size());
	const std::size_t start = lineStart(content, pos);

	const auto&& [line_number, column] = get_position(pos);
	const std::string_view line = get_line(start);

	constexpr std::size_t width = 70; // Line printing width
	std::string r("\n");

	// Print source name
	if (Colors::enabled)
		r.append(Colors::bold);
	r.append(fmt::format("{}:{}:{}: ", name, line_number, column));
	if (Colors::enabled)
		r.append(Colors::reset).append(Colors::magenta);
	r.append(category).append(": ");
	if (Colors::enabled)
		r.append(Colors::reset);
	r.append(msg).append("\n");

	// Print line number
	const std::size_t line_number_width = 4 * (static_cast<std::size_t>(std::log10(line_number))/4 + 1);
	r.append(fmt::format("{: >{}} | ", line_number, line_number_width));

	// Truncate line
	const std::size_t line_pos = pos - start;
	std::string_view truncated;
	std::size_t highlight_start, highlight_count;
	{
		highlight_count = std::min(count, width);
		const std::size_t skip = std::min(std::max(count+line_pos, width) - width, line_pos);
		highlight_start = line_pos - skip;

		truncated = line.substr(skip);
	}
	if (Colors::enabled)
		r.append(truncated.substr(0, highlight_start))
		 .append(Colors::red)
		 .append(truncated.substr(std::min(truncated.size(), highlight_start), highlight_count))
		 .append(Colors::reset)
		 .append(truncated.substr(std::min(truncated.size(), highlight_start + highlight_count)));
	else
		r.append(truncated);

	// Print indicator
	const std::size_t indicator = utf8::unchecked::distance(truncated.cbegin(), truncated.cbegin()+std::min(truncated.size(), highlight_start));
	r.append(fmt::format("\n{: >{}} | ", "", line_number_width));
	if (Colors::enabled)
		r.append(Colors::red);
	r.append(fmt::format("{: >{}}{:~<{}}\n", "", indicator, "^", std::max<std::size_t>(highlight_count, 1)));
	if (Colors::enabled)
		r.append(Colors::reset);

	return r;
}
} // Stencil
