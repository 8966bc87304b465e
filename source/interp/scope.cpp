// scope.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include <algorithm>

#include "interp/scope.h"

namespace snip::interp
{
	Scope::Scope(std::string name, std::shared_ptr<Scope> parent) : m_name(std::move(name)), m_parent(std::move(parent))
	{
	}

	const Value* Scope::lookupLocal(zst::str_view name) const
	{
		if(auto it = m_values.find(name); it != m_values.end())
			return &it->second;

		return nullptr;
	}

	const Value* Scope::lookup(zst::str_view name) const
	{
		for(auto scope = this; scope != nullptr; scope = scope->m_parent.get())
		{
			if(auto v = scope->lookupLocal(name); v != nullptr)
				return v;
		}

		return nullptr;
	}

	StrErrorOr<void> Scope::setVariable(std::string name, Value value)
	{
		if(m_values.contains(name))
			return ErrFmt("cannot reassign variable '${}' in scope '{}'", name, m_name);

		m_values.emplace(std::move(name), std::move(value));
		return Ok();
	}

	std::vector<std::string> Scope::variableNames() const
	{
		std::vector<std::string> ret {};
		for(auto& [k, v] : m_values)
			ret.push_back(k);

		std::sort(ret.begin(), ret.end());
		return ret;
	}
}
