// binary_op.cpp
// Copyright (c) 2022, yuki / zhiayang
// SPDX-License-Identifier: Apache-2.0

#include <cmath>
#include <limits>
#include <charconv>

#include "util.h" // for is_one_of

#include "interp/ast.h"
#include "interp/value.h"
#include "interp/evaluator.h"
#include "interp/eval_result.h"

namespace snip::interp::ast
{
	// numeric-looking strings ("3", "2.5") take part in arithmetic as numbers
	ErrorOr<Value> toNumber(Evaluator* ev, const Value& value)
	{
		if(value.isNumeric())
			return Ok(value.clone());

		if(not value.isString())
			return ErrMsg(ev, "expected a number, got {}", Value::kindToString(value.kind()));

		auto& str = value.getString();
		auto begin = str.data();
		auto end = str.data() + str.size();

		int64_t i = 0;
		if(auto [ptr, ec] = std::from_chars(begin, end, i); ec == std::errc() && ptr == end && not str.empty())
			return Ok(Value::integer(i));

		double d = 0;
		if(auto [ptr, ec] = std::from_chars(begin, end, d); ec == std::errc() && ptr == end && not str.empty())
			return Ok(Value::floating(d));

		return ErrMsg(ev, "'{}' is not a number", str);
	}

	// the divisor is already known to be non-zero
	static ErrorOr<int64_t> integer_arith(Evaluator* ev, BinaryOp::Op op, int64_t x, int64_t y)
	{
		int64_t ret = 0;
		bool overflow = false;
		switch(op)
		{
			case BinaryOp::Add: overflow = __builtin_add_overflow(x, y, &ret); break;
			case BinaryOp::Subtract: overflow = __builtin_sub_overflow(x, y, &ret); break;
			case BinaryOp::Multiply: overflow = __builtin_mul_overflow(x, y, &ret); break;

			case BinaryOp::Divide:
			case BinaryOp::Modulo: {
				overflow = (x == std::numeric_limits<int64_t>::min() && y == -1);
				if(not overflow)
					ret = (op == BinaryOp::Divide ? x / y : x % y);
				break;
			}
		}

		if(overflow)
			return ErrMsg(ev, "integer overflow");

		return Ok(ret);
	}

	ErrorOr<EvalResult> BinaryOp::evaluate_impl(Evaluator* ev) const
	{
		auto lval = TRY_VALUE(this->lhs->evaluate(ev));
		auto rval = TRY_VALUE(this->rhs->evaluate(ev));

		// array concatenation is the only non-numeric operation
		if(this->op == Op::Add && lval.isArray() && rval.isArray())
		{
			auto l = std::move(lval).takeArray();
			for(auto& x : std::move(rval).takeArray())
				l.push_back(std::move(x));

			return EvalResult::ofValue(Value::array(std::move(l)));
		}

		auto a = TRY(toNumber(ev, lval));
		auto b = TRY(toNumber(ev, rval));

		if(util::is_one_of(this->op, Op::Divide, Op::Modulo) && b.getNumber() == 0)
			return ErrMsg(ev, "division by zero");

		if(a.isInteger() && b.isInteger())
			return EvalResult::ofValue(Value::integer(TRY(integer_arith(ev, this->op, a.getInteger(), b.getInteger()))));

		auto x = a.getNumber();
		auto y = b.getNumber();
		switch(this->op)
		{
			case Op::Add: return EvalResult::ofValue(Value::floating(x + y));
			case Op::Subtract: return EvalResult::ofValue(Value::floating(x - y));
			case Op::Multiply: return EvalResult::ofValue(Value::floating(x * y));
			case Op::Divide: return EvalResult::ofValue(Value::floating(x / y));
			case Op::Modulo: return EvalResult::ofValue(Value::floating(fmod(x, y)));
		}

		snip::internal_error("invalid binary op");
	}
}
