// assign_op.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "interp/ast.h"
#include "interp/evaluator.h"
#include "interp/eval_result.h"

namespace snip::interp::ast
{
	ErrorOr<EvalResult> VariableAssign::evaluate_impl(Evaluator* ev) const
	{
		auto value = TRY_VALUE(this->value->evaluate(ev));
		TRY(ev->setVariable(this->name, std::move(value)));

		return EvalResult::ofVoid();
	}
}
