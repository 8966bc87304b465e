// environment.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>
#include <vector>
#include <optional>

#include "util.h"
#include "interp/ast.h"

namespace snip::interp
{
	/*
	    Everything that was loaded for one environment: the module search path, and
	    every `define` and `class` that has been registered so far. Definitions are owned
	    here, so they outlive the unit that declared them.
	*/
	struct Environment
	{
		Environment(std::string name, std::vector<std::string> module_paths);

		const std::string& name() const { return m_name; }
		const std::vector<std::string>& modulePaths() const { return m_module_paths; }

		// registers all of them, or none if any name is already taken
		ErrorOr<void> addDefinitions(std::vector<std::unique_ptr<ast::Definition>> defns);

		const ast::DefineDefn* lookupDefine(zst::str_view name) const;
		const ast::ClassDefn* lookupClass(zst::str_view name) const;

		// the file that would hold `name` according to the module layout, if there is one
		std::optional<std::string> findAutoloadFile(zst::str_view name) const;

		bool wasAutoloaded(zst::str_view path) const;
		void markAutoloaded(std::string path);

		size_t numDefinitions() const { return m_defines.size() + m_classes.size(); }

	private:
		const ast::Definition* lookup_same_kind(const ast::Definition& defn) const;
		void insert(std::unique_ptr<ast::Definition> defn);

		std::string m_name;
		std::vector<std::string> m_module_paths;

		util::hashmap<std::string, std::unique_ptr<ast::DefineDefn>> m_defines;
		util::hashmap<std::string, std::unique_ptr<ast::ClassDefn>> m_classes;

		util::hashset<std::string> m_autoloaded_files;
	};
}
