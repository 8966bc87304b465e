// in_op.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "interp/ast.h"
#include "interp/evaluator.h"
#include "interp/eval_result.h"

namespace snip::interp::ast
{
	ErrorOr<EvalResult> InOp::evaluate_impl(Evaluator* ev) const
	{
		auto needle = TRY_VALUE(this->needle->evaluate(ev));
		auto haystack = TRY_VALUE(this->haystack->evaluate(ev));

		if(haystack.isString())
		{
			if(not needle.isString())
				return ErrMsg(ev, "cannot search for {} in a string", Value::kindToString(needle.kind()));

			auto found = haystack.getString().find(needle.getString()) != std::string::npos;
			return EvalResult::ofValue(Value::boolean(found));
		}
		else if(haystack.isArray())
		{
			for(auto& x : haystack.getArray())
			{
				if(x.equals(needle))
					return EvalResult::ofValue(Value::boolean(true));
			}

			return EvalResult::ofValue(Value::boolean(false));
		}
		else if(haystack.isHash())
		{
			auto key = needle.toString();
			return EvalResult::ofValue(Value::boolean(haystack.getHashEntry(key) != nullptr));
		}

		return ErrMsg(ev, "'in' expects a string, array or hash on the right, got {}", Value::kindToString(haystack.kind()));
	}
}
