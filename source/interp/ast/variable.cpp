// variable.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "interp/ast.h"
#include "interp/evaluator.h"
#include "interp/eval_result.h"

namespace snip::interp::ast
{
	ErrorOr<EvalResult> VariableRef::evaluate_impl(Evaluator* ev) const
	{
		return EvalResult::ofValue(TRY(ev->lookupVariable(this->name)));
	}
}
