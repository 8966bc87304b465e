// definition.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "interp/ast.h"
#include "interp/evaluator.h"
#include "interp/eval_result.h"

namespace snip::interp::ast
{
	const Definition::Param* Definition::lookupParam(zst::str_view name) const
	{
		for(auto& p : this->params)
		{
			if(zst::str_view(p.name) == name)
				return &p;
		}

		return nullptr;
	}

	ErrorOr<void> Definition::bindParameters(Evaluator* ev,
	    std::vector<std::pair<std::string, Value>> args,
	    const Location& call_site) const
	{
		for(auto& [name, value] : args)
		{
			if(this->lookupParam(name) == nullptr)
			{
				return Err(ErrorMessage(ErrorKind::Evaluation, call_site,
				    zpr::sprint("{} '{}' has no parameter named '{}'", this->kindString(), this->name, name))
				               .addInfo(m_location, "defined here"));
			}

			TRY(ev->setVariable(name, std::move(value)));
		}

		// defaults are evaluated in order, after every supplied value is bound
		for(auto& param : this->params)
		{
			if(ev->scope()->lookupLocal(param.name) != nullptr)
				continue;

			if(param.default_value == nullptr)
			{
				return Err(ErrorMessage(ErrorKind::Evaluation, call_site,
				    zpr::sprint("missing value for parameter '${}' of {} '{}'", param.name, this->kindString(), this->name))
				               .addInfo(param.loc, "parameter declared here"));
			}

			auto _ = ev->pushLocation(param.default_value->loc());
			auto value = TRY_VALUE(param.default_value->evaluate(ev));

			TRY(ev->setVariable(param.name, std::move(value)));
		}

		return Ok();
	}
}
