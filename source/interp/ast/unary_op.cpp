// unary_op.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "interp/ast.h"
#include "interp/evaluator.h"
#include "interp/eval_result.h"

namespace snip::interp::ast
{
	ErrorOr<EvalResult> UnaryOp::evaluate_impl(Evaluator* ev) const
	{
		auto val = TRY_VALUE(this->expr->evaluate(ev));

		if(this->op == Op::Not)
			return EvalResult::ofValue(Value::boolean(not val.isTruthy()));

		auto num = TRY(toNumber(ev, val));
		if(num.isInteger())
		{
			int64_t ret = 0;
			if(__builtin_sub_overflow(int64_t(0), num.getInteger(), &ret))
				return ErrMsg(ev, "integer overflow");

			return EvalResult::ofValue(Value::integer(ret));
		}
		else
			return EvalResult::ofValue(Value::floating(-num.getFloating()));
	}
}
