// interp.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "location.h" // for error

#include "interp/ast.h"         // for Stmt, Definition
#include "interp/interp.h"      // for Interpreter
#include "interp/include.h"     // for UnitParser
#include "interp/eval_result.h" // for EvalResult

namespace snip::interp
{
	Interpreter::Interpreter(const config::Settings& settings)
	    : m_environment(new Environment(settings.environment, settings.module_paths))
	    , m_catalog(new Catalog())
	    , m_unit_parser(new FileUnitParser())
	    , m_evaluator(new Evaluator(m_environment.get(), m_catalog.get(), m_unit_parser.get(), settings.max_depth))
	{
	}

	ErrorOr<void> Interpreter::set_facts(const std::string& manifest, const std::vector<std::pair<std::string, std::string>>& facts)
	{
		auto& top = m_evaluator->topScope();

		// facts given on the command line may be repeated; the last one wins.
		util::hashmap<std::string, std::string> values {};
		values["environment"] = m_environment->name();
		values["manifest"] = manifest;

		for(auto& [k, v] : facts)
			values[k] = v;

		for(auto& [k, v] : values)
		{
			if(auto e = top->setVariable(k, Value::string(v)); e.is_err())
				return ErrMsg(m_evaluator.get(), "{}", e.error());

			util::debug("compile", "fact ${} = '{}'", k, v);
		}

		return Ok();
	}

	ErrorOr<void> Interpreter::compile(const std::string& manifest, const std::vector<std::pair<std::string, std::string>>& facts)
	{
		TRY(this->set_facts(manifest, facts));

		util::info("compile", "compiling '{}' in environment '{}'", manifest, m_environment->name());

		auto unit = TRY(m_unit_parser->parseFile(Location::builtin(), manifest, *m_environment));
		TRY(spliceAndEvaluate(m_evaluator.get(), std::move(unit), m_evaluator->topScope()));

		util::info("compile", "catalog has {} resource{}", m_catalog->size(), m_catalog->size() == 1 ? "" : "s");
		return Ok();
	}



	ast::Stmt::~Stmt()
	{
	}

	ast::Definition::~Definition()
	{
	}

	UnitParser::~UnitParser()
	{
	}

	ErrorOr<EvalResult> ast::Stmt::evaluate(Evaluator* ev) const
	{
		auto _ = ev->pushLocation(m_location);
		return this->evaluate_impl(ev);
	}
}
