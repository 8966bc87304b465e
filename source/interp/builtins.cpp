// builtins.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include <limits>

#include "interp/builtin_fns.h"

namespace snip::interp
{
	constexpr size_t VARIADIC = std::numeric_limits<size_t>::max();

	// clang-format off
	static constexpr BuiltinFunction BUILTIN_FUNCTIONS[] = {
		{ "include_file",   FunctionKind::Statement,    1,  1,          &builtin::include_file },
		{ "include",        FunctionKind::Statement,    1,  VARIADIC,   &builtin::include_class },

		{ "notice",         FunctionKind::Statement,    1,  VARIADIC,   &builtin::notice },
		{ "info",           FunctionKind::Statement,    1,  VARIADIC,   &builtin::info },
		{ "debug",          FunctionKind::Statement,    1,  VARIADIC,   &builtin::debug },
		{ "warning",        FunctionKind::Statement,    1,  VARIADIC,   &builtin::warning },
		{ "err",            FunctionKind::Statement,    1,  VARIADIC,   &builtin::err },
		{ "fail",           FunctionKind::Statement,    0,  VARIADIC,   &builtin::fail },

		{ "member",         FunctionKind::RValue,       2,  2,          &builtin::member },
		{ "defined",        FunctionKind::RValue,       1,  1,          &builtin::defined },
		{ "join",           FunctionKind::RValue,       1,  2,          &builtin::join },
	};
	// clang-format on

	const BuiltinFunction* lookupBuiltin(zst::str_view name)
	{
		for(auto& fn : BUILTIN_FUNCTIONS)
		{
			if(name == fn.name)
				return &fn;
		}

		return nullptr;
	}
}
