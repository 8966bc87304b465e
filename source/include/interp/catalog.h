// catalog.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <vector>

#include "util.h"
#include "location.h"
#include "interp/value.h"

namespace snip::interp
{
	struct Resource
	{
		std::string type;
		std::string title;
		std::vector<std::pair<std::string, Value>> attributes;

		// where it was declared, and the name of the scope that declared it
		Location location;
		std::string scope;

		std::string ref() const;
		const Value* getAttribute(zst::str_view name) const;
	};

	struct Catalog
	{
		const Resource* find(zst::str_view type, zst::str_view title) const;
		const Resource& add(Resource resource);

		const std::vector<Resource>& resources() const { return m_resources; }
		size_t size() const { return m_resources.size(); }

		std::string serialise() const;

		static bool isNativeType(zst::str_view type);

	private:
		std::vector<Resource> m_resources;
		util::hashmap<std::string, size_t> m_index;
	};
}
