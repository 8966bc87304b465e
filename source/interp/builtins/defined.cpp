// defined.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include <cctype>

#include "interp/evaluator.h"
#include "interp/builtin_fns.h"

namespace snip::interp::builtin
{
	static std::string lowercase(zst::str_view sv)
	{
		std::string ret {};
		for(char c : sv)
			ret += static_cast<char>(tolower(static_cast<unsigned char>(c)));

		return ret;
	}

	static ErrorOr<bool> is_defined(Evaluator* ev, const Value& thing)
	{
		if(thing.isArray())
		{
			for(auto& x : thing.getArray())
			{
				if(not TRY(is_defined(ev, x)))
					return Ok(false);
			}

			return Ok(true);
		}

		if(not thing.isString())
			return ErrMsg(ev, "defined: expected a string, got {}", Value::kindToString(thing.kind()));

		auto name = zst::str_view(thing.getString());
		if(name.starts_with("$"))
			return Ok(ev->isVariableDefined(name.drop(1)));

		// `File[/etc/motd]`, from a resource reference
		if(auto i = name.find('['); i != (size_t) -1 && name.ends_with("]"))
		{
			auto type = lowercase(name.take(i));
			auto title = name.drop(i + 1).drop_last(1);

			return Ok(ev->catalog().find(type, title) != nullptr);
		}

		auto type = lowercase(name);
		if(Catalog::isNativeType(type))
			return Ok(true);

		if(TRY(ev->findDefine(type)) != nullptr)
			return Ok(true);

		return Ok(TRY(ev->findClass(type)) != nullptr);
	}

	ErrorOr<EvalResult> defined(Evaluator* ev, std::vector<Value>& args)
	{
		assert(args.size() == 1);
		return EvalResult::ofValue(Value::boolean(TRY(is_defined(ev, args[0]))));
	}
}
