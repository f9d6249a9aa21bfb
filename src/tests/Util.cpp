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
#include <utility>
#include <array>
#include <iterator>
#include <ranges>
#include <utf8.h>

static constexpr std::array<std::pair<std::uint32_t, std::uint32_t>, 12> ranges = {
	std::make_pair<std::uint32_t, std::uint32_t>(0x9, 0xA), // Tab, newline
	std::make_pair<std::uint32_t, std::uint32_t>(0x20, 0x7A), // Basic Latin, up to `z`
	std::make_pair<std::uint32_t, std::uint32_t>(0x7C, 0x7E), // `|`, `}`, `~`
	std::make_pair<std::uint32_t, std::uint32_t>(0xA0, 0xFF), // Latin-1 Supplement
	std::make_pair<std::uint32_t, std::uint32_t>(0x370, 0x3FF), // Greek and Coptic
	std::make_pair<std::uint32_t, std::uint32_t>(0x400, 0x4FF), // Cyrillic
	std::make_pair<std::uint32_t, std::uint32_t>(0x5D0, 0x5EA), // Hebrew letters
	std::make_pair<std::uint32_t, std::uint32_t>(0x3040, 0x309F), // Hiragana
	std::make_pair<std::uint32_t, std::uint32_t>(0x4E00, 0x9FFF), // CJK Unified Ideographs
	std::make_pair<std::uint32_t, std::uint32_t>(0xFF01, 0xFF5A), // Fullwidth forms
	std::make_pair<std::uint32_t, std::uint32_t>(0x1F300, 0x1F5FF), // Miscellaneous Symbols And Pictographs
	std::make_pair<std::uint32_t, std::uint32_t>(0x1F601, 0x1F64F), // Emoticons
};

std::string randomText(std::mt19937& mt, std::size_t len)
{
	auto getCodepoint = [&mt] -> std::uint32_t
	{
		std::uniform_int_distribution<std::size_t> distrib(0uz, ranges.size()-1uz);
		auto&& [lo, hi] = ranges[distrib(mt)];

		std::uniform_int_distribution<std::uint32_t> codepoint(lo, hi);
		return codepoint(mt);
	};

	std::string r;
	for ([[maybe_unused]] const auto _ : std::ranges::iota_view{0uz, len})
		utf8::append(getCodepoint(), std::back_inserter(r));

	return r;
}
