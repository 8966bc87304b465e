// arrays.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "interp/evaluator.h"
#include "interp/builtin_fns.h"

namespace snip::interp::builtin
{
	ErrorOr<EvalResult> member(Evaluator* ev, std::vector<Value>& args)
	{
		assert(args.size() == 2);
		if(not args[0].isArray())
			return ErrMsg(ev, "member: expected an array, got {}", Value::kindToString(args[0].kind()));

		for(auto& v : args[0].getArray())
		{
			if(v.equals(args[1]))
				return EvalResult::ofValue(Value::boolean(true));
		}

		return EvalResult::ofValue(Value::boolean(false));
	}

	ErrorOr<EvalResult> join(Evaluator* ev, std::vector<Value>& args)
	{
		assert(args.size() == 1 || args.size() == 2);
		if(not args[0].isArray())
			return ErrMsg(ev, "join: expected an array, got {}", Value::kindToString(args[0].kind()));

		std::string sep {};
		if(args.size() == 2)
		{
			if(not args[1].isString())
				return ErrMsg(ev, "join: expected a string separator, got {}", Value::kindToString(args[1].kind()));

			sep = args[1].getString();
		}

		auto str = util::join(args[0].getArray(), sep, [](const Value& v) { return v.toString(); });
		return EvalResult::ofValue(Value::string(std::move(str)));
	}
}
