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

#include "Renderer.hpp"
#include <charconv>
#include <fmt/format.h>

using namespace std::literals;

namespace Stencil
{
void Renderer::error(RenderError::Kind kind, std::string&& msg, std::size_t offset,
		std::vector<std::string> path, std::string name) const
{
	throw RenderError(kind, std::move(msg), RenderError::Details{
		.tmpl = m_tmpl.name(),
		.offset = offset,
		.path = std::move(path),
		.depth = m_scopes.size(),
		.name = std::move(name),
	});
}

[[nodiscard]] const Value& Renderer::lookup(const Path& path, std::size_t offset) const
{
	static const Value yes{true}, no{false};
	const std::string& head = path.segments.front();

	// Loop state
	if (path.is_loop_keyword())
	{
		for (auto it = m_scopes.crbegin(); it != m_scopes.crend(); ++it)
		{
			if (it->type != Scope::Type::LOOP)
				continue;

			if (head == "@index"sv)
				return it->index_value;
			else if (head == "@first"sv)
				return it->index == 0 ? yes : no;
			else
				return it->index+1 == it->seq->size() ? yes : no;
		}
		error(RenderError::Kind::MISSING_FIELD, fmt::format("`{}` used outside of a loop", head), offset, path.segments);
	}

	const Value* v = nullptr;
	for (auto it = m_scopes.crbegin(); it != m_scopes.crend() && !v; ++it)
	{
		switch (it->type)
		{
			case Scope::Type::ROOT:
			case Scope::Type::OBJECT:
				v = it->value->find(head);
				break;
			case Scope::Type::NAMED:
				if (it->name == head)
					v = it->value;
				break;
			case Scope::Type::LOOP:
				if (it->name == head)
					v = it->value;
				else if (!it->index_name.empty() && it->index_name == head)
					v = &it->index_value;
				break;
		}
	}
	if (!v)
		error(RenderError::Kind::MISSING_FIELD, fmt::format("`{}` not found in any scope", head), offset, path.segments);

	for (std::size_t i = 1; i < path.segments.size(); ++i)
	{
		const std::string& seg = path.segments[i];
		const Value* next = nullptr;
		if (v->is_sequence())
		{
			std::size_t index;
			const auto [ptr, ec] = std::from_chars(seg.data(), seg.data()+seg.size(), index);
			if (ec == std::errc{} && ptr == seg.data()+seg.size())
				next = v->at(index);
		}
		else
			next = v->find(seg);

		if (!next)
		{
			const Path parent{std::vector<std::string>(path.segments.cbegin(), path.segments.cbegin()+i)};
			if (v->is_object() || v->is_sequence())
				error(RenderError::Kind::MISSING_FIELD,
					fmt::format("No field `{}` in `{}`", seg, parent.str()), offset, path.segments);
			error(RenderError::Kind::MISSING_FIELD,
				fmt::format("Cannot access field `{}` of `{}`, a value of type `{}`", seg, parent.str(), getTypeName(v->type())),
				offset, path.segments);
		}
		v = next;
	}

	return *v;
}

[[nodiscard]] const Value& Renderer::evaluate(const ValueExpr& expr, Value& storage) const
{
	const Value* input = std::visit(overloaded{
		[&](const Path& p) { return &lookup(p, expr.offset); },
		[](const Value& v) { return &v; },
	}, expr.source);

	for (const auto& pipe : expr.pipes)
	{
		const Formatter* fn = m_formatters.find(pipe.name);
		if (!fn)
			error(RenderError::Kind::FORMATTER_ERROR, fmt::format("Unknown formatter `{}`", pipe.name),
				pipe.offset, {}, pipe.name);

		std::vector<Value> args;
		args.reserve(pipe.args.size());
		for (const auto& arg : pipe.args)
		{
			Value tmp;
			args.push_back(evaluate(arg, tmp));
		}

		std::string result;
		try
		{
			result = (*fn)(*input, args);
		}
		catch (FormatterError& e)
		{
			error(RenderError::Kind::FORMATTER_ERROR, fmt::format("Formatter `{}` failed: {}", pipe.name, e.what()),
				pipe.offset, {}, pipe.name);
		}
		storage = Value{std::move(result)};
		input = &storage;
	}

	return *input;
}

[[nodiscard]] bool Renderer::test(const Condition& cond) const
{
	return std::visit(overloaded{
		[&](const Condition::Truthy& c)
		{
			Value storage;
			return evaluate(c.value, storage).truthy();
		},
		[&](const Condition::Equals& c)
		{
			Value lhs, rhs;
			return evaluate(c.lhs, lhs) == evaluate(c.rhs, rhs);
		},
		[&](const Condition::NotEquals& c)
		{
			Value lhs, rhs;
			return !(evaluate(c.lhs, lhs) == evaluate(c.rhs, rhs));
		},
		[&](const Condition::Not& c)
		{
			return !test(*c.cond);
		},
	}, cond.data);
}

[[nodiscard]] const Value& Renderer::current() const noexcept
{
	return *m_scopes.back().value;
}

std::size_t Renderer::exec(const Instr::EmitLiteral& instr, std::size_t pc)
{
	m_out->append(m_tmpl.literal(instr.literal));
	return pc+1;
}

std::size_t Renderer::exec(const Instr::EmitValue& instr, std::size_t pc)
{
	Value storage;
	const Value& v = evaluate(instr.value, storage);
	if (!instr.value.pipes.empty())
	{
		m_out->append(v.as_string());
		return pc+1;
	}

	const auto s = v.to_string();
	if (!s)
	{
		const Path* path = instr.value.path();
		error(RenderError::Kind::AMBIGUOUS_VALUE,
			fmt::format("Cannot output `{}`, a value of type `{}`, without a formatter", instr.value.str(), getTypeName(v.type())),
			instr.value.offset, path ? path->segments : std::vector<std::string>{});
	}
	m_out->append(*s);

	return pc+1;
}

std::size_t Renderer::exec(const Instr::Branch& instr, std::size_t pc)
{
	if (!test(instr.condition))
		return instr.target;
	return pc+1;
}

std::size_t Renderer::exec(const Instr::Jump& instr, [[maybe_unused]] std::size_t pc)
{
	return instr.target;
}

std::size_t Renderer::exec(const Instr::IterStart& instr, std::size_t pc)
{
	Value storage;
	const Value& coll = evaluate(instr.collection, storage);
	if (!coll.is_sequence())
	{
		const Path* path = instr.collection.path();
		error(RenderError::Kind::NOT_ITERABLE,
			fmt::format("Cannot iterate over `{}`, a value of type `{}`", instr.collection.str(), getTypeName(coll.type())),
			instr.collection.offset, path ? path->segments : std::vector<std::string>{});
	}

	const Sequence& seq = coll.as_sequence();
	if (seq.empty())
		return instr.target;

	m_scopes.push_back(Scope{
		.type = Scope::Type::LOOP,
		.value = &seq.front(),
		.name = instr.binding,
		.index_name = instr.index_name,
		.seq = &seq,
		.index = 0,
		.index_value = Value{0},
	});
	return pc+1;
}

std::size_t Renderer::exec(const Instr::IterNext& instr, std::size_t pc)
{
	Scope& scope = m_scopes.back();
	if (++scope.index < scope.seq->size())
	{
		scope.value = &(*scope.seq)[scope.index];
		scope.index_value = Value{scope.index};
		return instr.target;
	}

	m_scopes.pop_back();
	return pc+1;
}

std::size_t Renderer::exec([[maybe_unused]] const Instr::IterEnd& instr, std::size_t pc)
{
	return pc+1;
}

std::size_t Renderer::exec(const Instr::PushScope& instr, std::size_t pc)
{
	Value storage;
	const Value* v = &evaluate(instr.value, storage);
	bool owned = false;
	if (v == &storage)
	{
		m_owned.push_back(std::move(storage));
		v = &m_owned.back();
		owned = true;
	}

	if (!instr.name.empty())
	{
		m_scopes.push_back(Scope{.type = Scope::Type::NAMED, .value = v, .name = instr.name, .owned = owned});
		return pc+1;
	}

	if (!v->is_object())
	{
		const Path* path = instr.value.path();
		error(RenderError::Kind::NOT_AN_OBJECT,
			fmt::format("Cannot open the fields of `{}`, a value of type `{}`", instr.value.str(), getTypeName(v->type())),
			instr.value.offset, path ? path->segments : std::vector<std::string>{});
	}
	m_scopes.push_back(Scope{.type = Scope::Type::OBJECT, .value = v, .owned = owned});
	return pc+1;
}

std::size_t Renderer::exec([[maybe_unused]] const Instr::PopScope& instr, std::size_t pc)
{
	if (m_scopes.back().owned)
		m_owned.pop_back();
	m_scopes.pop_back();
	return pc+1;
}

std::size_t Renderer::exec(const Instr::Call& instr, std::size_t pc)
{
	if (!m_templates)
		error(RenderError::Kind::UNKNOWN_TEMPLATE,
			fmt::format("Cannot call `{}`, no other templates are available", instr.name), instr.offset, {}, instr.name);

	const auto it = m_templates->find(instr.name);
	if (it == m_templates->cend())
		error(RenderError::Kind::UNKNOWN_TEMPLATE, fmt::format("Unknown template `{}`", instr.name), instr.offset, {}, instr.name);
	if (m_calls+1 > max_calls)
		error(RenderError::Kind::RECURSION_LIMIT,
			fmt::format("Calling `{}` exceeds the maximum of {} nested calls", instr.name, max_calls), instr.offset, {}, instr.name);

	Value storage;
	const Value& root = instr.value ? evaluate(*instr.value, storage) : current();

	Renderer renderer(it->second, m_formatters, m_templates, m_calls+1);
	renderer.render(root, *m_out);

	return pc+1;
}

void Renderer::render(const Value& root, std::string& out)
{
	m_out = &out;
	m_scopes.clear();
	m_owned.clear();
	m_scopes.push_back(Scope{.type = Scope::Type::ROOT, .value = &root});

	const auto& prog = m_tmpl.instructions();
	std::size_t pc = 0;
	while (pc < prog.size())
		pc = std::visit([&](const auto& instr) { return exec(instr, pc); }, prog[pc]);
}
} // Stencil
