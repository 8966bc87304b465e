// interp.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "util.h"

#include "snip/config.h"

#include "interp/catalog.h"
#include "interp/include.h"
#include "interp/evaluator.h"
#include "interp/environment.h"

namespace snip::interp
{
	/*
	    One whole-program compilation: owns the environment, the catalog, the unit parser
	    (and through it, every file that was read), and the evaluator.
	*/
	struct Interpreter
	{
		explicit Interpreter(const config::Settings& settings);

		Evaluator& evaluator() { return *m_evaluator; }
		Environment& environment() { return *m_environment; }
		const Catalog& catalog() const { return *m_catalog; }
		FileUnitParser& unitParser() { return *m_unit_parser; }

		/*
		    Sets the top-scope facts, then parses and evaluates the main manifest in the
		    top scope. The catalog is left for the caller.
		*/
		ErrorOr<void> compile(const std::string& manifest, const std::vector<std::pair<std::string, std::string>>& facts);

	private:
		ErrorOr<void> set_facts(const std::string& manifest, const std::vector<std::pair<std::string, std::string>>& facts);

		std::unique_ptr<Environment> m_environment;
		std::unique_ptr<Catalog> m_catalog;
		std::unique_ptr<FileUnitParser> m_unit_parser;
		std::unique_ptr<Evaluator> m_evaluator;
	};
}
