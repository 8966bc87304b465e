// evaluator.h
// Copyright (c) 2022, yuki / zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <vector>

#include "util.h"

#include "interp/ast.h"
#include "interp/scope.h"
#include "interp/value.h"
#include "interp/catalog.h"
#include "interp/eval_result.h"
#include "interp/environment.h"

namespace snip::interp
{
	struct UnitParser;
	struct CallerContext;

	constexpr inline size_t DEFAULT_MAX_DEPTH = 128;

	struct Evaluator
	{
		Evaluator(Environment* env, Catalog* catalog, UnitParser* parser, size_t max_depth = DEFAULT_MAX_DEPTH);

		Environment& environment() { return *m_environment; }
		Catalog& catalog() { return *m_catalog; }
		UnitParser& unitParser() { return *m_unit_parser; }

		const std::shared_ptr<Scope>& scope() const;
		const std::shared_ptr<Scope>& topScope() const;
		[[nodiscard]] util::Defer<> pushScope(std::shared_ptr<Scope> scope);
		void popScope();

		[[nodiscard]] Location loc() const;
		[[nodiscard]] util::Defer<> pushLocation(const Location& loc);
		void popLocation();

		/*
		    Every nested evaluation (class bodies, defined type bodies, included files)
		    goes through here; it fails once `max_depth` levels are active. Nothing else
		    stops a file from including itself forever.
		*/
		ErrorOr<void> enterNested(zst::str_view what);
		void leaveNested();

		size_t depth() const { return m_depth; }

		// the file, line, environment and scope of whatever is being evaluated right now
		CallerContext callerContext() const;

		ErrorOr<Value> lookupVariable(zst::str_view name) const;
		bool isVariableDefined(zst::str_view name) const;
		ErrorOr<void> setVariable(std::string name, Value value);

		ErrorOr<EvalResult> callFunction(const std::string& name, std::vector<Value>& args, bool as_statement);

		// these return null if there is no such definition, even after trying to autoload it
		ErrorOr<const ast::DefineDefn*> findDefine(zst::str_view name);
		ErrorOr<const ast::ClassDefn*> findClass(zst::str_view name);

		ErrorOr<void> declareResource(std::string type,
		    std::string title,
		    std::vector<std::pair<std::string, Value>> attributes,
		    const Location& loc);

		// evaluates the class the first time it is included; later includes do nothing
		ErrorOr<void> includeClass(zst::str_view name);
		bool isClassIncluded(zst::str_view name) const;
		std::shared_ptr<Scope> classScope(zst::str_view name) const;

	private:
		ErrorOr<void> instantiate_define(const ast::DefineDefn* defn,
		    std::string title,
		    std::vector<std::pair<std::string, Value>> attributes,
		    const Location& loc);

		ErrorOr<void> autoload(zst::str_view name);

	private:
		Environment* m_environment;
		Catalog* m_catalog;
		UnitParser* m_unit_parser;

		size_t m_depth = 0;
		size_t m_max_depth;

		std::vector<std::shared_ptr<Scope>> m_scope_stack;
		std::vector<Location> m_location_stack;

		util::hashmap<std::string, std::shared_ptr<Scope>> m_class_scopes;
		util::hashmap<std::string, Location> m_define_instances;
	};
}
