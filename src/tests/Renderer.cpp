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
#include "stencil/Error.hpp"
#include "stencil/Template.hpp"
#include <cctype>

using namespace Stencil;
using namespace std::literals;

[[nodiscard]] static std::string upper(const Value& value, const std::vector<Value>& args)
{
	std::string s = Formatters::plain(value, args);
	for (auto& c : s)
		c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
	return s;
}

[[nodiscard]] static std::string render(std::string_view text, const Value& root,
		const FormatterRegistry& formatters = FormatterRegistry{})
{
	return Template::compile(text, "test").render(root, formatters);
}

[[nodiscard]] static std::optional<RenderError> renderError(std::string_view text, const Value& root,
		const FormatterRegistry& formatters = FormatterRegistry{})
{
	const auto tmpl = Template::compile(text, "test");
	return catchError<RenderError>([&]{ return tmpl.render(root, formatters); });
}

TEST_CASE("Literal templates render to themselves", "[renderer]")
{
	CHECK(render("Hello, world!", Value{}) == "Hello, world!");
	CHECK(render("", Value{}).empty());

	const auto text = GENERATE(take(50, randomTexts(0, 64)));
	CHECK(render(text, Value{}) == text);
}

TEST_CASE("Value substitution", "[renderer]")
{
	const Value root = Object{
		{"name", "Ann"},
		{"age", 42},
		{"ratio", 2.5},
		{"admin", true},
		{"nothing", nullptr},
		{"user", Object{{"address", Object{{"city", "Paris"}}}}},
		{"items", Sequence{"first", "second"}},
	};

	CHECK(render("Hi {{ name }}", root) == "Hi Ann");
	CHECK(render("{{ age }} {{ ratio }} {{ admin }} [{{ nothing }}]", root) == "42 2.5 true []");
	CHECK(render("{{ user.address.city }}", root) == "Paris");
	CHECK(render("{{ items.1 }}", root) == "second");
	CHECK(render("{{ \"lit\" }} {{ 7 }} {{ -0.5 }} {{ false }}", root) == "lit 7 -0.5 false");

	SECTION("Missing field")
	{
		const auto e = renderError("Hi {{ name }}", Object{});
		REQUIRE(e);
		CHECK(e->kind() == RenderError::Kind::MISSING_FIELD);
		CHECK(e->path() == std::vector<std::string>{"name"});
		CHECK(e->depth() == 1);
		CHECK(e->offset() == 6);
		CHECK(e->template_name() == "test");
	}

	SECTION("Missing nested field")
	{
		for (const auto text : {"{{ user.address.zip }}"sv, "{{ items.2 }}"sv, "{{ name.first }}"sv, "{{ items.x }}"sv})
		{
			CAPTURE(text);
			const auto e = renderError(text, root);
			REQUIRE(e);
			CHECK(e->kind() == RenderError::Kind::MISSING_FIELD);
		}
	}

	SECTION("Ambiguous value")
	{
		for (const auto text : {"{{ items }}"sv, "{{ user }}"sv})
		{
			CAPTURE(text);
			const auto e = renderError(text, root);
			REQUIRE(e);
			CHECK(e->kind() == RenderError::Kind::AMBIGUOUS_VALUE);
		}
	}

	SECTION("Non-object root")
	{
		const auto e = renderError("{{ name }}", Value{"text"});
		REQUIRE(e);
		CHECK(e->kind() == RenderError::Kind::MISSING_FIELD);
	}
}

TEST_CASE("Conditional rendering", "[renderer]")
{
	const auto text = "{{ if admin }}Admin{{ else }}User{{ endif }}"sv;
	CHECK(render(text, Object{{"admin", true}}) == "Admin");
	CHECK(render(text, Object{{"admin", false}}) == "User");

	SECTION("Truthiness")
	{
		const auto [value, truthy] = GENERATE(
			std::make_pair(Value{}, false),
			std::make_pair(Value{false}, false),
			std::make_pair(Value{0}, false),
			std::make_pair(Value{0.0}, false),
			std::make_pair(Value{""}, false),
			std::make_pair(Value{Sequence{}}, false),
			std::make_pair(Value{true}, true),
			std::make_pair(Value{-1}, true),
			std::make_pair(Value{0.1}, true),
			std::make_pair(Value{"0"}, true),
			std::make_pair(Value{Sequence{Value{}}}, true),
			std::make_pair(Value{Object{}}, true)
		);
		CAPTURE(value.repr());
		CHECK(render("{{ if v }}yes{{ endif }}", Object{{"v", value}}) == (truthy ? "yes" : ""));
		CHECK(render("{{ if not v }}no{{ endif }}", Object{{"v", value}}) == (truthy ? "" : "no"));
	}

	SECTION("Equality")
	{
		const Value root = Object{{"n", 1}, {"f", 1.0}, {"s", "1"}, {"list", Sequence{1, 2}}};
		CHECK(render("{{ if n == f }}eq{{ endif }}", root) == "eq");
		CHECK(render("{{ if n == 1.0 }}eq{{ endif }}", root) == "eq");
		CHECK(render("{{ if n == s }}eq{{ else }}ne{{ endif }}", root) == "ne");
		CHECK(render("{{ if s != \"1\" }}ne{{ else }}eq{{ endif }}", root) == "eq");
		CHECK(render("{{ if list == list }}eq{{ endif }}", root) == "eq");
		CHECK(render("{{ if missing == null }}{{ endif }}", Object{{"missing", nullptr}}).empty());
		CHECK(render("{{ if ! n == 2 }}ne{{ endif }}", root) == "ne");
	}

	SECTION("Missing condition field is an error")
	{
		const auto e = renderError("{{ if flag }}x{{ endif }}", Object{});
		REQUIRE(e);
		CHECK(e->kind() == RenderError::Kind::MISSING_FIELD);
	}
}

TEST_CASE("Loop rendering", "[renderer]")
{
	const auto text = "{{ for x in xs }}{{ x }},{{ endfor }}"sv;
	CHECK(render(text, Object{{"xs", Sequence{1, 2, 3}}}) == "1,2,3,");
	CHECK(render(text, Object{{"xs", Sequence{}}}).empty());

	SECTION("Loop state")
	{
		const Value root = Object{{"xs", Sequence{"a", "b", "c"}}};
		CHECK(render("{{ for x in xs }}{{ @index }}:{{ x }}{{ if not @last }}, {{ endif }}{{ endfor }}", root)
			== "0:a, 1:b, 2:c");
		CHECK(render("{{ for x in xs }}{{ if @first }}[{{ endif }}{{ x }}{{ endfor }}", root) == "[abc");
		CHECK(render("{{ for i, x in xs }}{{ i }}={{ x }};{{ endfor }}", root) == "0=a;1=b;2=c;");
	}

	SECTION("Nested loops")
	{
		const Value root = Object{{"rows", Sequence{Sequence{1, 2}, Sequence{}, Sequence{3}}}};
		CHECK(render("{{ for r in rows }}{{ @index }}({{ for c in r }}{{ @index }}{{ c }}{{ endfor }}){{ endfor }}", root)
			== "0(0112)1()2(03)");
	}

	SECTION("Outer names stay visible")
	{
		const Value root = Object{{"xs", Sequence{"a", "b"}}, {"sep", "-"}, {"x", "outer"}};
		CHECK(render("{{ for x in xs }}{{ x }}{{ sep }}{{ endfor }}{{ x }}", root) == "a-b-outer");
	}

	SECTION("Empty loop binds nothing")
	{
		const auto e = renderError("{{ for x in xs }}{{ endfor }}{{ x }}", Object{{"xs", Sequence{}}});
		REQUIRE(e);
		CHECK(e->kind() == RenderError::Kind::MISSING_FIELD);
		CHECK(e->path() == std::vector<std::string>{"x"});
	}

	SECTION("Not iterable")
	{
		for (const auto& value : {Value{5}, Value{"abc"}, Value{Object{}}, Value{}})
		{
			CAPTURE(value.repr());
			const auto e = renderError(text, Object{{"xs", value}});
			REQUIRE(e);
			CHECK(e->kind() == RenderError::Kind::NOT_ITERABLE);
			CHECK(e->path() == std::vector<std::string>{"xs"});
		}
	}

	SECTION("Scope depth")
	{
		const auto e = renderError("{{ for x in xs }}{{ y }}{{ endfor }}", Object{{"xs", Sequence{1}}});
		REQUIRE(e);
		CHECK(e->depth() == 2);
	}
}

TEST_CASE("With blocks", "[renderer]")
{
	const Value root = Object{
		{"user", Object{{"name", "Ann"}, {"role", "admin"}}},
		{"name", "root"},
	};

	CHECK(render("{{ with user }}{{ name }} {{ role }}{{ endwith }} {{ name }}", root) == "Ann admin root");
	CHECK(render("{{ with user as u }}{{ u.name }} {{ name }}{{ endwith }}", root) == "Ann root");

	FormatterRegistry formatters;
	formatters.add("upper", upper);
	CHECK(render("{{ with name | upper as n }}{{ n }}{{ endwith }}", root, formatters) == "ROOT");
	CHECK(render("{{ with 'lit' as n }}{{ n }}{{ endwith }}", root) == "lit");

	SECTION("Loop state")
	{
		const Value loop = Object{{"xs", Sequence{"a", "b", "c"}}};
		CHECK(render("{{ for i, x in xs }}{{ with i as n }}[{{ n }}]{{ endwith }}{{ endfor }}", loop) == "[0][1][2]");
		CHECK(render("{{ for x in xs }}{{ with @index as n }}{{ with @first as f }}{{ n }}{{ f }}{{ endwith }}{{ endwith }};{{ endfor }}",
			loop) == "0true;1false;2false;");

		std::string text = "{{ for i, x in xs }}";
		for (std::size_t i = 0; i < 40; ++i)
			text.append("{{ with i as n }}");
		text.append("{{ n }}{{ x }}");
		for (std::size_t i = 0; i < 40; ++i)
			text.append("{{ endwith }}");
		text.append("{{ endfor }}");
		CHECK(render(text, loop) == "0a1b2c");
	}

	SECTION("Inside loops")
	{
		const Value users = Object{
			{"users", Sequence{Object{{"name", "Ann"}}, Object{{"name", "Bob"}}}},
			{"name", "root"},
		};
		CHECK(render("{{ for u in users }}{{ with u }}{{ name }}:{{ @index }}{{ if @last }}.{{ endif }} {{ endwith }}{{ endfor }}{{ name }}",
			users) == "Ann:0 Bob:1. root");
		CHECK(render("{{ for u in users }}{{ with u.name as n }}{{ n }}{{ endwith }}{{ endfor }}", users) == "AnnBob");
	}

	SECTION("Not an object")
	{
		const auto e = renderError("{{ with name }}{{ endwith }}", root);
		REQUIRE(e);
		CHECK(e->kind() == RenderError::Kind::NOT_AN_OBJECT);
	}

	SECTION("Scope is closed")
	{
		const auto e = renderError("{{ with user }}{{ endwith }}{{ role }}", root);
		REQUIRE(e);
		CHECK(e->kind() == RenderError::Kind::MISSING_FIELD);
	}
}

TEST_CASE("Formatters", "[renderer]")
{
	FormatterRegistry formatters;
	formatters.add("upper", upper);
	formatters.add("repeat", [](const Value& value, const std::vector<Value>& args)
	{
		if (args.size() != 1 || !args[0].is_integer())
			throw FormatterError("Expected a repeat count");

		std::string s;
		for (std::int64_t i = 0; i < args[0].as_integer(); ++i)
			s.append(Formatters::plain(value, {}));
		return s;
	});

	const Value root = Object{{"name", "abc"}, {"n", 2}, {"html", "<a href=\"x\">&'"}, {"xs", Sequence{1}}};

	CHECK(render("{{ name | upper }}", root, formatters) == "ABC");
	CHECK(render("{{ name | repeat(n) | upper }}", root, formatters) == "ABCABC");
	CHECK(render("{{ n | repeat(3) }}", root, formatters) == "222");
	CHECK(render("{{ html | html }}", root) == "&lt;a href=&quot;x&quot;&gt;&amp;&#39;");
	CHECK(render("{{ n | default }}", root) == "2");

	SECTION("Unknown formatter")
	{
		const auto e = renderError("{{ name | upper }}", root);
		REQUIRE(e);
		CHECK(e->kind() == RenderError::Kind::FORMATTER_ERROR);
		CHECK(e->name() == "upper");
	}

	SECTION("Failing formatter")
	{
		const auto e = renderError("{{ name | repeat }}", root, formatters);
		REQUIRE(e);
		CHECK(e->kind() == RenderError::Kind::FORMATTER_ERROR);
		CHECK(e->name() == "repeat");
		CHECK(e->message().find("Expected a repeat count") != std::string::npos);
	}

	SECTION("Built-ins reject collections")
	{
		const auto e = renderError("{{ xs | html }}", root);
		REQUIRE(e);
		CHECK(e->kind() == RenderError::Kind::FORMATTER_ERROR);
		CHECK(e->name() == "html");
	}
}

TEST_CASE("Rendering is deterministic", "[renderer]")
{
	const auto tmpl = Template::compile("{{ for x in xs }}{{ x.k }}{{ if x.b }}!{{ endif }}{{ endfor }}");
	const Value root = Object{{"xs", Sequence{
		Object{{"k", "a"}, {"b", true}},
		Object{{"k", "b"}, {"b", false}},
	}}};

	const std::string first = tmpl.render(root);
	CHECK(first == "a!b");
	for (int i = 0; i < 10; ++i)
		CHECK(tmpl.render(root) == first);
}

TEST_CASE("Calls need an engine", "[renderer]")
{
	const auto e = renderError("{{ call other }}", Object{});
	REQUIRE(e);
	CHECK(e->kind() == RenderError::Kind::UNKNOWN_TEMPLATE);
	CHECK(e->name() == "other");
}
