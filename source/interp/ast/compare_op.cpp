// compare_op.cpp
// Copyright (c) 2022, yuki / zhiayang
// SPDX-License-Identifier: Apache-2.0

#include <cctype>
#include <algorithm>

#include "interp/ast.h"
#include "interp/value.h"
#include "interp/evaluator.h"
#include "interp/eval_result.h"

namespace snip::interp::ast
{
	static int compare_strings(const std::string& a, const std::string& b)
	{
		for(size_t i = 0; i < std::min(a.size(), b.size()); i++)
		{
			auto x = tolower(static_cast<unsigned char>(a[i]));
			auto y = tolower(static_cast<unsigned char>(b[i]));

			if(x != y)
				return x < y ? -1 : 1;
		}

		if(a.size() == b.size())
			return 0;

		return a.size() < b.size() ? -1 : 1;
	}

	static ErrorOr<int> compare_values(Evaluator* ev, const Value& lhs, const Value& rhs)
	{
		auto a = toNumber(ev, lhs);
		auto b = toNumber(ev, rhs);
		if(a.ok() && b.ok())
		{
			auto x = a->getNumber();
			auto y = b->getNumber();
			return Ok(x < y ? -1 : (x > y ? 1 : 0));
		}

		if(lhs.isString() && rhs.isString())
			return Ok(compare_strings(lhs.getString(), rhs.getString()));

		return ErrMsg(ev, "cannot order {} and {}", Value::kindToString(lhs.kind()), Value::kindToString(rhs.kind()));
	}

	ErrorOr<EvalResult> ComparisonOp::evaluate_impl(Evaluator* ev) const
	{
		auto lval = TRY_VALUE(this->lhs->evaluate(ev));
		auto rval = TRY_VALUE(this->rhs->evaluate(ev));

		if(this->op == Op::EQ)
			return EvalResult::ofValue(Value::boolean(lval.equals(rval)));
		else if(this->op == Op::NE)
			return EvalResult::ofValue(Value::boolean(not lval.equals(rval)));

		auto cmp = TRY(compare_values(ev, lval, rval));
		switch(this->op)
		{
			case Op::LT: return EvalResult::ofValue(Value::boolean(cmp < 0));
			case Op::GT: return EvalResult::ofValue(Value::boolean(cmp > 0));
			case Op::LE: return EvalResult::ofValue(Value::boolean(cmp <= 0));
			case Op::GE: return EvalResult::ofValue(Value::boolean(cmp >= 0));
			default: snip::internal_error("invalid comparison op");
		}
	}
}
