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

#include <cctype>
#include <cxxopts.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "stencil/Definitions.hpp"
#include "stencil/Engine.hpp"
#include "stencil/Error.hpp"

using namespace Stencil;

[[nodiscard]] static std::string readFile(const std::string& path)
{
	std::ifstream in(path);
	if (!in.good())
		throw Error(fmt::format("Could not open file '{}'", path));

	return std::string((std::istreambuf_iterator<char>(in)), (std::istreambuf_iterator<char>()));
}

[[nodiscard]] static std::string mapCase(const Value& value, const std::vector<Value>& args, int (*fn)(int))
{
	std::string s = Formatters::plain(value, args);
	for (auto& c : s)
		c = static_cast<char>(fn(static_cast<unsigned char>(c)));
	return s;
}

int main(int argc, char* argv[])
{
	cxxopts::Options opts("stencil", "Stencil renders text templates");

	std::string in_file, out_file;
	std::vector<std::string> defines, templates;
	opts.add_options()
		("h,help", "Displays help", cxxopts::value<bool>()->default_value("false"))
		("v,version", "Displays version", cxxopts::value<bool>()->default_value("false"))
		("i,input", "Sets input template", cxxopts::value<std::string>(in_file))
		("o,output", "Sets output file", cxxopts::value<std::string>(out_file))
		("D,define", "Defines a value: path=value", cxxopts::value<std::vector<std::string>>(defines))
		("t,template", "Adds a template for `call`: name=file", cxxopts::value<std::vector<std::string>>(templates))
		("d,dump", "Prints compiled instructions instead of rendering", cxxopts::value<bool>()->default_value("false"))
		("no-colors", "Disables colors in messages", cxxopts::value<bool>()->default_value("false"));

	decltype(opts.parse(argc, argv)) result;
	try
	{
		result = opts.parse(argc, argv);
	}
	catch (cxxopts::option_not_exists_exception& e)
	{
		std::cerr << e.what() << std::endl;
		std::exit(EXIT_FAILURE);
	}
	catch (cxxopts::option_syntax_exception& e)
	{
		std::cerr << e.what() << std::endl;
		std::exit(EXIT_FAILURE);
	}
	catch (cxxopts::missing_argument_exception& e)
	{
		std::cerr << e.what() << std::endl;
		std::exit(EXIT_FAILURE);
	}

	if (result["help"].as<bool>())
	{
		std::cout << opts.help() << std::endl;
		std::exit(EXIT_SUCCESS);
	}

	if (result["version"].as<bool>())
	{
		std::cout << "Stencil v0.1\n"
			<< "License: GNU Affero General Public License version 3 (AGPLv3)\n"
			<< "see <https://www.gnu.org/licenses/agpl-3.0.en.html>\n"
			<< "This is free software: you are free to change and redistribute it.\n"
			<< "There is NO WARRANTY, to the extent permitted by law.\n"
			<< "\n"
			<< "Author(s):\n"
			<< " - ef3d0c3e <ef3d0c3e@pundalik.org>\n";

		std::exit(EXIT_SUCCESS);
	}

	Colors::enabled = !result["no-colors"].as<bool>();

	if (!result.count("input"))
	{
		std::cerr << "You must specify an input file." << std::endl;
		std::exit(EXIT_FAILURE);
	}

	try
	{
		Engine engine;
		engine.add_formatter("upper", [](const Value& v, const std::vector<Value>& args) { return mapCase(v, args, ::toupper); });
		engine.add_formatter("lower", [](const Value& v, const std::vector<Value>& args) { return mapCase(v, args, ::tolower); });

		for (const auto& t : templates)
		{
			const std::size_t eq = t.find('=');
			if (eq == std::string::npos || eq == 0)
			{
				std::cerr << "Invalid template '" << t << "', expected name=file." << std::endl;
				std::exit(EXIT_FAILURE);
			}
			engine.add_template(t.substr(0, eq), readFile(t.substr(eq+1)));
		}

		const std::string name = std::filesystem::path{in_file}.filename().string();
		engine.add_template(name, readFile(in_file));

		if (result["dump"].as<bool>())
		{
			fmt::print("{}", engine.find(name)->dump());
			return EXIT_SUCCESS;
		}

		Object root;
		for (const auto& def : defines)
			define(root, def);

		const std::string res = engine.render(name, root);
		if (!result.count("output"))
			std::cout << res;
		else
		{
			std::ofstream out(out_file);
			if (!out.good())
			{
				std::cerr << "Unable to open output file" << std::endl;
				std::exit(EXIT_FAILURE);
			}
			out.write(res.data(), res.size());
			out.close();
		}
	}
	catch (Error& e)
	{
		std::cerr << e.what() << std::endl;
		std::exit(EXIT_FAILURE);
	}

	return EXIT_SUCCESS;
}
