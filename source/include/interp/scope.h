// scope.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "util.h"
#include "interp/value.h"

namespace snip::interp
{
	/*
	    A named set of variable bindings with a parent. Scopes are shared: the evaluator
	    holds the current one, classes keep theirs alive so `$class::var` works after the
	    class body has finished, and `include_file` evaluates straight into its caller's.
	*/
	struct Scope
	{
		Scope(std::string name, std::shared_ptr<Scope> parent);

		const std::string& name() const { return m_name; }
		const std::shared_ptr<Scope>& parent() const { return m_parent; }

		const Value* lookup(zst::str_view name) const;
		const Value* lookupLocal(zst::str_view name) const;

		// fails if `name` is already bound in this scope (not its parents)
		StrErrorOr<void> setVariable(std::string name, Value value);

		size_t size() const { return m_values.size(); }
		std::vector<std::string> variableNames() const;

	private:
		std::string m_name;
		std::shared_ptr<Scope> m_parent;

		util::hashmap<std::string, Value> m_values;
	};
}
