// include.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "interp/include.h"
#include "interp/evaluator.h"
#include "interp/builtin_fns.h"

namespace snip::interp::builtin
{
	ErrorOr<EvalResult> include_file(Evaluator* ev, std::vector<Value>& args)
	{
		assert(args.size() == 1);
		if(not args[0].isString())
			return ErrMsg(ev, "include_file: expected a string, got {}", Value::kindToString(args[0].kind()));

		TRY(includeFile(ev, args[0].getString(), ev->callerContext()));
		return EvalResult::ofVoid();
	}
}
