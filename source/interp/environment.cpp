// environment.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "snip/paths.h"

#include "interp/environment.h"

namespace snip::interp
{
	Environment::Environment(std::string name, std::vector<std::string> module_paths)
	    : m_name(std::move(name)), m_module_paths(std::move(module_paths))
	{
	}

	static ErrorOr<void> redefinition_error(const ast::Definition& defn, const ast::Definition& existing)
	{
		return Err(ErrorMessage(ErrorKind::Syntax, defn.loc(), zpr::sprint("redefinition of {} '{}'", defn.kindString(), defn.name))
		               .addInfo(existing.loc(), "previously defined here"));
	}

	// defines and classes live in separate namespaces, as far as duplicates go
	const ast::Definition* Environment::lookup_same_kind(const ast::Definition& defn) const
	{
		if(defn.isClass())
			return this->lookupClass(defn.name);
		else
			return this->lookupDefine(defn.name);
	}

	void Environment::insert(std::unique_ptr<ast::Definition> defn)
	{
		auto name = defn->name;
		util::debug("env", "registered {} '{}'", defn->kindString(), name);

		if(defn->isClass())
			m_classes.emplace(std::move(name), util::static_pointer_cast<ast::ClassDefn>(std::move(defn)));
		else
			m_defines.emplace(std::move(name), util::static_pointer_cast<ast::DefineDefn>(std::move(defn)));
	}

	ErrorOr<void> Environment::addDefinitions(std::vector<std::unique_ptr<ast::Definition>> defns)
	{
		// all or nothing: every name is checked (against the environment and the rest of
		// the batch) before any of them is registered
		for(size_t i = 0; i < defns.size(); i++)
		{
			if(auto existing = this->lookup_same_kind(*defns[i]); existing != nullptr)
				return redefinition_error(*defns[i], *existing);

			for(size_t k = 0; k < i; k++)
			{
				if(defns[k]->kind() == defns[i]->kind() && defns[k]->name == defns[i]->name)
					return redefinition_error(*defns[i], *defns[k]);
			}
		}

		for(auto& defn : defns)
			this->insert(std::move(defn));

		return Ok();
	}

	const ast::DefineDefn* Environment::lookupDefine(zst::str_view name) const
	{
		if(auto it = m_defines.find(name); it != m_defines.end())
			return it->second.get();

		return nullptr;
	}

	const ast::ClassDefn* Environment::lookupClass(zst::str_view name) const
	{
		if(auto it = m_classes.find(name); it != m_classes.end())
			return it->second.get();

		return nullptr;
	}

	std::optional<std::string> Environment::findAutoloadFile(zst::str_view name) const
	{
		return paths::resolveAutoload(name, m_module_paths);
	}

	bool Environment::wasAutoloaded(zst::str_view path) const
	{
		return m_autoloaded_files.contains(path);
	}

	void Environment::markAutoloaded(std::string path)
	{
		m_autoloaded_files.insert(std::move(path));
	}
}
