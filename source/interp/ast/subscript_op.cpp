// subscript_op.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "interp/ast.h"
#include "interp/evaluator.h"
#include "interp/eval_result.h"

namespace snip::interp::ast
{
	ErrorOr<EvalResult> SubscriptOp::evaluate_impl(Evaluator* ev) const
	{
		auto container = TRY_VALUE(this->container->evaluate(ev));
		auto index = TRY_VALUE(this->index->evaluate(ev));

		if(container.isArray())
		{
			auto idx = TRY(toNumber(ev, index));
			if(not idx.isInteger())
				return ErrMsg(ev, "array index must be an integer");

			// negative indices count from the back; anything out of range is undef
			auto arr = std::move(container).takeArray();
			auto i = idx.getInteger();
			if(i < 0)
				i += static_cast<int64_t>(arr.size());

			if(i < 0 || static_cast<size_t>(i) >= arr.size())
				return EvalResult::ofValue(Value::undef());

			return EvalResult::ofValue(std::move(arr[static_cast<size_t>(i)]));
		}
		else if(container.isHash())
		{
			auto entry = container.getHashEntry(index.toString());
			if(entry == nullptr)
				return EvalResult::ofValue(Value::undef());

			return EvalResult::ofValue(entry->clone());
		}

		return ErrMsg(ev, "cannot subscript a value of type {}", Value::kindToString(container.kind()));
	}
}
