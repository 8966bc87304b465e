// catalog.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include <cctype>

#include "interp/catalog.h"

namespace snip::interp
{
	static constexpr const char* NATIVE_TYPES[] = {
		"file",
		"package",
		"service",
		"exec",
		"user",
		"group",
		"notify",
		"cron",
		"host",
		"mount",
		"yumrepo",
		"ssh_authorized_key",
	};

	static std::string capitalise_type(zst::str_view type)
	{
		// `foo::bar` -> `Foo::Bar`
		std::string ret {};
		bool start = true;
		for(char c : type)
		{
			ret += start ? static_cast<char>(toupper(static_cast<unsigned char>(c))) : c;
			start = (c == ':');
		}

		return ret;
	}

	static std::string make_key(zst::str_view type, zst::str_view title)
	{
		return zpr::sprint("{}[{}]", type, title);
	}

	std::string Resource::ref() const
	{
		return zpr::sprint("{}['{}']", capitalise_type(this->type), this->title);
	}

	const Value* Resource::getAttribute(zst::str_view name) const
	{
		for(auto& [k, v] : this->attributes)
		{
			if(zst::str_view(k) == name)
				return &v;
		}

		return nullptr;
	}

	bool Catalog::isNativeType(zst::str_view type)
	{
		for(auto t : NATIVE_TYPES)
		{
			if(type == t)
				return true;
		}

		return false;
	}

	const Resource* Catalog::find(zst::str_view type, zst::str_view title) const
	{
		if(auto it = m_index.find(make_key(type, title)); it != m_index.end())
			return &m_resources[it->second];

		return nullptr;
	}

	const Resource& Catalog::add(Resource resource)
	{
		m_index[make_key(resource.type, resource.title)] = m_resources.size();
		return m_resources.emplace_back(std::move(resource));
	}

	std::string Catalog::serialise() const
	{
		std::string ret {};
		for(auto& res : m_resources)
		{
			ret += zpr::sprint("{} {{ {}:\n", res.type, Value::string(res.title).serialise());
			for(auto& [k, v] : res.attributes)
				ret += zpr::sprint("  {} => {},\n", k, v.serialise());

			ret += "}\n";
		}

		return ret;
	}
}
