// logical_op.cpp
// Copyright (c) 2022, yuki / zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "interp/ast.h"
#include "interp/evaluator.h"
#include "interp/eval_result.h"

namespace snip::interp::ast
{
	ErrorOr<EvalResult> LogicalBinOp::evaluate_impl(Evaluator* ev) const
	{
		auto lval = TRY_VALUE(this->lhs->evaluate(ev)).isTruthy();

		// short circuit
		if(this->op == Op::And && not lval)
			return EvalResult::ofValue(Value::boolean(false));
		else if(this->op == Op::Or && lval)
			return EvalResult::ofValue(Value::boolean(true));

		auto rval = TRY_VALUE(this->rhs->evaluate(ev)).isTruthy();
		return EvalResult::ofValue(Value::boolean(rval));
	}
}
