// classes.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "interp/evaluator.h"
#include "interp/builtin_fns.h"

namespace snip::interp::builtin
{
	static ErrorOr<void> include_one(Evaluator* ev, const Value& name)
	{
		if(name.isArray())
		{
			for(auto& n : name.getArray())
				TRY(include_one(ev, n));

			return Ok();
		}

		if(not name.isString())
			return ErrMsg(ev, "include: expected a class name, got {}", Value::kindToString(name.kind()));

		return ev->includeClass(name.getString());
	}

	ErrorOr<EvalResult> include_class(Evaluator* ev, std::vector<Value>& args)
	{
		for(auto& arg : args)
			TRY(include_one(ev, arg));

		return EvalResult::ofVoid();
	}
}
