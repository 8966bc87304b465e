// fstring.cpp
// Copyright (c) 2022, yuki / zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "interp/ast.h"
#include "interp/evaluator.h"
#include "interp/eval_result.h"

namespace snip::interp::ast
{
	ErrorOr<EvalResult> InterpolatedString::evaluate_impl(Evaluator* ev) const
	{
		std::string str {};

		for(auto& part : this->parts)
		{
			if(auto expr = std::get_if<std::unique_ptr<Expr>>(&part); expr != nullptr)
				str += TRY_VALUE((*expr)->evaluate(ev)).toString();
			else
				str += std::get<std::string>(part);
		}

		return EvalResult::ofValue(Value::string(std::move(str)));
	}
}
