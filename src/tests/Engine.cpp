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
#include "stencil/Engine.hpp"
#include "stencil/Error.hpp"
#include <fmt/format.h>

using namespace Stencil;
using namespace std::literals;

TEST_CASE("Named templates", "[engine]")
{
	Engine engine;
	engine.add_template("header", "<h1>{{ title }}</h1>");
	engine.add_template("page", "{{ call header }}{{ body }}");

	CHECK(engine.render("page", Object{{"title", "T"}, {"body", "B"}}) == "<h1>T</h1>B");
	CHECK(engine.find("header"));
	CHECK(!engine.find("footer"));
	CHECK(engine.templates().size() == 2);

	SECTION("Replacing a template")
	{
		engine.add_template("header", "[{{ title }}]");
		CHECK(engine.render("page", Object{{"title", "T"}, {"body", "B"}}) == "[T]B");
	}

	SECTION("Unknown template")
	{
		const auto e = catchError<RenderError>([&]{ return engine.render("footer", Object{}); });
		REQUIRE(e);
		CHECK(e->kind() == RenderError::Kind::UNKNOWN_TEMPLATE);
		CHECK(e->name() == "footer");
	}

	SECTION("Invalid template is not added")
	{
		CHECK(catchError<ParseError>([&]{ engine.add_template("broken", "{{ if x }}"); }));
		CHECK(!engine.find("broken"));
	}
}

TEST_CASE("Calls", "[engine]")
{
	Engine engine;
	engine.add_template("user", "[{{ name }}]");
	const Value root = Object{{"users", Sequence{Object{{"name", "a"}}, Object{{"name", "b"}}}}};

	SECTION("With a value")
	{
		engine.add_template("list", "{{ for u in users }}{{ call user with u }}{{ endfor }}");
		CHECK(engine.render("list", root) == "[a][b]");
	}

	SECTION("With the innermost value")
	{
		engine.add_template("list", "{{ for u in users }}{{ call user }}{{ endfor }}");
		CHECK(engine.render("list", root) == "[a][b]");
	}

	SECTION("Fresh scopes")
	{
		engine.add_template("list", "{{ for u in users }}{{ call outer with u }}{{ endfor }}");
		engine.add_template("outer", "{{ users }}");
		const auto e = catchError<RenderError>([&]{ return engine.render("list", root); });
		REQUIRE(e);
		CHECK(e->kind() == RenderError::Kind::MISSING_FIELD);
		CHECK(e->template_name() == "outer");
		CHECK(e->depth() == 1);
	}

	SECTION("Unknown template")
	{
		engine.add_template("list", "{{ call missing }}");
		const auto e = catchError<RenderError>([&]{ return engine.render("list", root); });
		REQUIRE(e);
		CHECK(e->kind() == RenderError::Kind::UNKNOWN_TEMPLATE);
		CHECK(e->name() == "missing");
	}
}

TEST_CASE("Recursive calls", "[engine]")
{
	Engine engine;

	SECTION("Terminating")
	{
		engine.add_template("node", "{{ name }}{{ for c in children }}({{ call node with c }}){{ endfor }}");
		const Value tree = Object{
			{"name", "a"},
			{"children", Sequence{
				Object{{"name", "b"}, {"children", Sequence{}}},
				Object{{"name", "c"}, {"children", Sequence{Object{{"name", "d"}, {"children", Sequence{}}}}}},
			}},
		};
		CHECK(engine.render("node", tree) == "a(b)(c(d))");
	}

	SECTION("Unbounded")
	{
		engine.add_template("loop", "x{{ call loop }}");
		const auto e = catchError<RenderError>([&]{ return engine.render("loop", Object{}); });
		REQUIRE(e);
		CHECK(e->kind() == RenderError::Kind::RECURSION_LIMIT);
		CHECK(e->name() == "loop");
	}
}

TEST_CASE("Engine formatters", "[engine]")
{
	Engine engine;
	engine.add_formatter("wrap", [](const Value& value, const std::vector<Value>& args)
	{
		return fmt::format("({})", Formatters::plain(value, args));
	});
	engine.add_template("inner", "{{ x | wrap }}");
	engine.add_template("outer", "{{ x | wrap }}{{ call inner }}");

	CHECK(engine.render("outer", Object{{"x", 1}}) == "(1)(1)");

	CHECK(catchError<Error>([&]{ engine.add_formatter("default", Formatters::plain); }));
	CHECK(catchError<Error>([&]{ engine.add_formatter("html", Formatters::plain); }));
	CHECK(catchError<Error>([&]{ engine.add_formatter("not valid", Formatters::plain); }));
	CHECK(catchError<Error>([&]{ engine.add_formatter("empty", Formatter{}); }));
	CHECK(FormatterRegistry::reserved("default"));
	CHECK(!FormatterRegistry::reserved("wrap"));
}
