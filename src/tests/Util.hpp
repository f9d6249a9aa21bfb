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

#ifndef STENCIL_TESTS_UTIL_HPP
#define STENCIL_TESTS_UTIL_HPP

#include <string>
#include <random>
#include <optional>

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/generators/catch_generators_adapters.hpp>

/**
 * @brief Generates a random unicode string
 *
 * Never contains `{`, so the string is always plain template text.
 *
 * @param mt Random source
 * @param len String length (in codepoints)
 */
std::string randomText(std::mt19937& mt, std::size_t len);

/**
 * @brief Runs fn and captures an exception of type E
 *
 * @returns The exception, nothing if fn did not throw
 */
template <class E, class F>
[[nodiscard]] std::optional<E> catchError(F&& fn)
{
	try
	{
		fn();
	}
	catch (E& e)
	{
		return e;
	}
	return std::nullopt;
}

namespace
{
	class TextGenerator : public Catch::Generators::IGenerator<std::string>
	{
		std::mt19937 m_mt;
		std::uniform_int_distribution<std::size_t> m_dist;

		std::string m_current;
	public:
		TextGenerator(std::size_t lo, std::size_t hi):
			m_mt(std::mt19937(std::random_device{}())),
			m_dist(lo, hi)
		{
			next();
		}

		const std::string& get() const override { return m_current; }

		bool next() override
		{
			m_current = randomText(m_mt, m_dist(m_mt));
			return true;
		}
	};

	/**
	 * @brief Random template texts of lo to hi codepoints
	 */
	[[maybe_unused]] Catch::Generators::GeneratorWrapper<std::string> randomTexts(std::size_t lo, std::size_t hi)
	{
		return Catch::Generators::GeneratorWrapper<std::string>(
			Catch::Detail::make_unique<TextGenerator>(lo, hi));
	}
}

#endif // STENCIL_TESTS_UTIL_HPP
