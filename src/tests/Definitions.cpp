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
#include "stencil/Definitions.hpp"

using namespace Stencil;
using namespace std::literals;

TEST_CASE("Definition values", "[definitions]")
{
	CHECK(parseDefinitionValue("true") == Value{true});
	CHECK(parseDefinitionValue("null").is_null());
	CHECK(parseDefinitionValue("12").is_integer());
	CHECK(parseDefinitionValue("-3.5") == Value{-3.5});
	CHECK(parseDefinitionValue("inf") == Value{"inf"});
	CHECK(parseDefinitionValue("12px") == Value{"12px"});
	CHECK(parseDefinitionValue("") == Value{""});
	CHECK(parseDefinitionValue("[a, b ,c]") == Value{Sequence{"a", "b", "c"}});
	CHECK(parseDefinitionValue("[]") == Value{Sequence{}});
}

TEST_CASE("Definitions", "[definitions]")
{
	Object root;
	define(root, "title=Hello world");
	define(root, "page.number=3");
	define(root, "page.tags=[x,y]");
	define(root, "page.number=4");

	CHECK(root.at("title") == Value{"Hello world"});
	const Value& page = root.at("page");
	REQUIRE(page.is_object());
	CHECK(*page.find("number") == Value{4});
	CHECK(*page.find("tags") == Value{Sequence{"x", "y"}});

	SECTION("Errors")
	{
		const auto definition = GENERATE(as<std::string>{}, "novalue", "=1", "a..b=1", "page.=1", "title.sub=1");
		CAPTURE(definition);
		CHECK(catchError<Error>([&]{ define(root, definition); }));
	}
}
