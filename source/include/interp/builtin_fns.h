// builtin_fns.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include "util.h"

#include "interp/value.h"       // for Value
#include "interp/eval_result.h" // for EvalResult

namespace snip::interp
{
	struct Evaluator;

	namespace builtin
	{
		ErrorOr<EvalResult> include_file(Evaluator* ev, std::vector<Value>& args);
		ErrorOr<EvalResult> include_class(Evaluator* ev, std::vector<Value>& args);

		ErrorOr<EvalResult> notice(Evaluator* ev, std::vector<Value>& args);
		ErrorOr<EvalResult> info(Evaluator* ev, std::vector<Value>& args);
		ErrorOr<EvalResult> debug(Evaluator* ev, std::vector<Value>& args);
		ErrorOr<EvalResult> warning(Evaluator* ev, std::vector<Value>& args);
		ErrorOr<EvalResult> err(Evaluator* ev, std::vector<Value>& args);
		ErrorOr<EvalResult> fail(Evaluator* ev, std::vector<Value>& args);

		ErrorOr<EvalResult> member(Evaluator* ev, std::vector<Value>& args);
		ErrorOr<EvalResult> defined(Evaluator* ev, std::vector<Value>& args);
		ErrorOr<EvalResult> join(Evaluator* ev, std::vector<Value>& args);
	}

	enum class FunctionKind
	{
		Statement,
		RValue,
	};

	using BuiltinFn = ErrorOr<EvalResult> (*)(Evaluator*, std::vector<Value>&);

	struct BuiltinFunction
	{
		const char* name;
		FunctionKind kind;

		size_t min_args;
		size_t max_args;

		BuiltinFn function;
	};

	const BuiltinFunction* lookupBuiltin(zst::str_view name);
}
