// print.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "util.h"

#include "interp/value.h"       // for Value
#include "interp/evaluator.h"   // for Evaluator
#include "interp/eval_result.h" // for EvalResult
#include "interp/builtin_fns.h"

namespace snip::interp::builtin
{
	static std::string join_values(const std::vector<Value>& values)
	{
		return util::join(values, " ", [](const Value& v) { return v.toString(); });
	}

	// messages are attributed to the scope they came from, like `Scope(Class[foo])`
	static std::string who(Evaluator* ev)
	{
		return zpr::sprint("Scope({})", ev->scope()->name());
	}

	ErrorOr<EvalResult> notice(Evaluator* ev, std::vector<Value>& args)
	{
		util::log(who(ev).c_str(), "{}", join_values(args));
		return EvalResult::ofVoid();
	}

	ErrorOr<EvalResult> info(Evaluator* ev, std::vector<Value>& args)
	{
		util::info(who(ev).c_str(), "{}", join_values(args));
		return EvalResult::ofVoid();
	}

	ErrorOr<EvalResult> debug(Evaluator* ev, std::vector<Value>& args)
	{
		util::debug(who(ev).c_str(), "{}", join_values(args));
		return EvalResult::ofVoid();
	}

	ErrorOr<EvalResult> warning(Evaluator* ev, std::vector<Value>& args)
	{
		util::warn(who(ev).c_str(), "{}", join_values(args));
		return EvalResult::ofVoid();
	}

	ErrorOr<EvalResult> err(Evaluator* ev, std::vector<Value>& args)
	{
		util::error(who(ev).c_str(), "{}", join_values(args));
		return EvalResult::ofVoid();
	}

	ErrorOr<EvalResult> fail(Evaluator* ev, std::vector<Value>& args)
	{
		if(args.empty())
			return ErrMsg(ev, "failed");

		return ErrMsg(ev, "{}", join_values(args));
	}
}
