// resource.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include <algorithm>

#include "interp/ast.h"
#include "interp/evaluator.h"
#include "interp/eval_result.h"

namespace snip::interp::ast
{
	static ErrorOr<void> collect_titles(Evaluator* ev, Value value, std::vector<std::string>& titles)
	{
		if(value.isArray())
		{
			for(auto& v : std::move(value).takeArray())
				TRY(collect_titles(ev, std::move(v), titles));

			return Ok();
		}

		if(value.isHash() || value.isUndef())
			return ErrMsg(ev, "resource title cannot be {}", Value::kindToString(value.kind()));

		auto title = value.toString();
		if(title.empty())
			return ErrMsg(ev, "resource title cannot be empty");

		titles.push_back(std::move(title));
		return Ok();
	}

	ErrorOr<EvalResult> ResourceDecl::evaluate_impl(Evaluator* ev) const
	{
		for(auto& body : this->bodies)
		{
			auto _ = ev->pushLocation(body.loc);

			std::vector<std::string> titles {};
			TRY(collect_titles(ev, TRY_VALUE(body.title->evaluate(ev)), titles));

			std::vector<std::pair<std::string, Value>> attrs {};
			for(auto& attr : body.attributes)
			{
				auto it = std::find_if(attrs.begin(), attrs.end(), [&attr](auto& a) { return a.first == attr.name; });
				if(it != attrs.end())
					return ErrMsg(ErrorKind::Evaluation, attr.loc, "attribute '{}' was already specified", attr.name);

				attrs.emplace_back(attr.name, TRY_VALUE(attr.value->evaluate(ev)));
			}

			// an array of titles declares one resource per title, all with the same attributes
			for(size_t i = 0; i < titles.size(); i++)
			{
				if(i + 1 == titles.size())
				{
					TRY(ev->declareResource(this->type_name, std::move(titles[i]), std::move(attrs), body.loc));
					break;
				}

				std::vector<std::pair<std::string, Value>> copy {};
				for(auto& [k, v] : attrs)
					copy.emplace_back(k, v.clone());

				TRY(ev->declareResource(this->type_name, std::move(titles[i]), std::move(copy), body.loc));
			}
		}

		return EvalResult::ofVoid();
	}

	// `Package['foo']` -> "Package[foo]"
	ErrorOr<EvalResult> ResourceRef::evaluate_impl(Evaluator* ev) const
	{
		std::vector<Value> refs {};
		for(auto& t : this->titles)
		{
			std::vector<std::string> titles {};
			TRY(collect_titles(ev, TRY_VALUE(t->evaluate(ev)), titles));

			for(auto& title : titles)
				refs.push_back(Value::string(zpr::sprint("{}[{}]", this->type_name, title)));
		}

		if(refs.size() == 1)
			return EvalResult::ofValue(std::move(refs[0]));

		return EvalResult::ofValue(Value::array(std::move(refs)));
	}
}
