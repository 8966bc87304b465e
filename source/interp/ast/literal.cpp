// literal.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include <algorithm>

#include "interp/ast.h"
#include "interp/value.h"
#include "interp/evaluator.h"
#include "interp/eval_result.h"

namespace snip::interp::ast
{
	ErrorOr<EvalResult> UndefLit::evaluate_impl(Evaluator* ev) const
	{
		return EvalResult::ofValue(Value::undef());
	}

	ErrorOr<EvalResult> BooleanLit::evaluate_impl(Evaluator* ev) const
	{
		return EvalResult::ofValue(Value::boolean(this->value));
	}

	ErrorOr<EvalResult> NumberLit::evaluate_impl(Evaluator* ev) const
	{
		if(this->is_floating)
			return EvalResult::ofValue(Value::floating(float_value));
		else
			return EvalResult::ofValue(Value::integer(int_value));
	}

	ErrorOr<EvalResult> StringLit::evaluate_impl(Evaluator* ev) const
	{
		return EvalResult::ofValue(Value::string(this->string));
	}

	ErrorOr<EvalResult> BareWord::evaluate_impl(Evaluator* ev) const
	{
		return EvalResult::ofValue(Value::string(this->name));
	}

	ErrorOr<EvalResult> ArrayLit::evaluate_impl(Evaluator* ev) const
	{
		std::vector<Value> values {};
		for(auto& elm : this->elements)
			values.push_back(TRY_VALUE(elm->evaluate(ev)));

		return EvalResult::ofValue(Value::array(std::move(values)));
	}

	ErrorOr<EvalResult> HashLit::evaluate_impl(Evaluator* ev) const
	{
		Value::HashEntries entries {};
		for(auto& [k, v] : this->entries)
		{
			auto key = TRY_VALUE(k->evaluate(ev));
			if(not key.isString() && not key.isNumeric())
				return ErrMsg(ev, "hash keys must be strings, not {}", Value::kindToString(key.kind()));

			auto key_str = key.toString();
			auto value = TRY_VALUE(v->evaluate(ev));

			// later keys replace earlier ones, but keep their position
			auto it = std::find_if(entries.begin(), entries.end(), [&key_str](auto& e) { return e.first == key_str; });
			if(it != entries.end())
				it->second = std::move(value);
			else
				entries.emplace_back(std::move(key_str), std::move(value));
		}

		return EvalResult::ofValue(Value::hash(std::move(entries)));
	}
}
