// case.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "interp/ast.h"
#include "interp/evaluator.h"
#include "interp/eval_result.h"

namespace snip::interp::ast
{
	ErrorOr<EvalResult> CaseStmt::evaluate_impl(Evaluator* ev) const
	{
		auto value = TRY_VALUE(this->expr->evaluate(ev));

		// the first matching arm wins; `default` only runs if nothing else matched,
		// wherever it appears.
		const Case* default_case = nullptr;
		for(auto& c : this->cases)
		{
			if(c.is_default)
			{
				default_case = &c;
				continue;
			}

			for(auto& m : c.matches)
			{
				auto match = TRY_VALUE(m->evaluate(ev));
				if(value.equals(match))
				{
					TRY(c.body->evaluate(ev));
					return EvalResult::ofVoid();
				}
			}
		}

		if(default_case != nullptr)
			TRY(default_case->body->evaluate(ev));

		return EvalResult::ofVoid();
	}
}
