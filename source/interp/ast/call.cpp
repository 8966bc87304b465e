// call.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "interp/ast.h"
#include "interp/evaluator.h"
#include "interp/eval_result.h"

namespace snip::interp::ast
{
	ErrorOr<EvalResult> FunctionCall::evaluate_impl(Evaluator* ev) const
	{
		std::vector<Value> args {};
		for(auto& arg : this->arguments)
			args.push_back(TRY_VALUE(arg->evaluate(ev)));

		auto ret = TRY(ev->callFunction(this->name, args, this->is_statement));
		if(this->is_statement)
			return EvalResult::ofVoid();

		return Ok(std::move(ret));
	}
}
