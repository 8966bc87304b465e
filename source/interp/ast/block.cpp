// block.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "interp/ast.h"
#include "interp/evaluator.h"
#include "interp/eval_result.h"

namespace snip::interp::ast
{
	// blocks do not introduce a scope; only classes and defined types do
	ErrorOr<EvalResult> Block::evaluate_impl(Evaluator* ev) const
	{
		for(auto& stmt : this->body)
			TRY(stmt->evaluate(ev));

		return EvalResult::ofVoid();
	}
}
