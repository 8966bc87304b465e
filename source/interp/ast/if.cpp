// if.cpp
// Copyright (c) 2022, yuki / zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "interp/ast.h"
#include "interp/evaluator.h"
#include "interp/eval_result.h"

namespace snip::interp::ast
{
	ErrorOr<EvalResult> IfStmt::evaluate_impl(Evaluator* ev) const
	{
		auto cond = TRY_VALUE(this->if_cond->evaluate(ev)).isTruthy();
		if(this->is_unless)
			cond = not cond;

		if(cond)
			TRY(this->if_body->evaluate(ev));
		else if(this->else_body != nullptr)
			TRY(this->else_body->evaluate(ev));

		return EvalResult::ofVoid();
	}
}
