// paths.cpp
// Copyright (c) 2022, yuki / zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "snip/paths.h"

namespace snip::paths
{
	std::string directoryOf(zst::str_view path)
	{
		if(path.empty())
			return ".";

		// trailing slashes don't count, unless the whole thing is slashes
		while(path.size() > 1 && path.back() == '/')
			path.remove_suffix(1);

		auto i = path.rfind('/');
		if(i == std::string::npos)
			return ".";

		auto dir = path.take(i);
		while(dir.size() > 1 && dir.back() == '/')
			dir.remove_suffix(1);

		if(dir.empty())
			return "/";

		return dir.str();
	}

	ErrorOr<std::string> resolveInclude(const Location& loc, zst::str_view include_path, zst::str_view caller_file)
	{
		if(include_path.empty())
			return ErrMsg(ErrorKind::InvalidPath, loc, "include path cannot be empty");

		if(include_path.starts_with('/'))
			return Ok(include_path.str());

		return Ok(zpr::sprint("{}/{}", directoryOf(caller_file), include_path));
	}

	std::optional<std::string> resolveAutoload(zst::str_view name, const std::vector<std::string>& module_paths)
	{
		std::vector<std::string> segments {};
		while(true)
		{
			auto i = name.find("::");
			if(i == std::string::npos)
			{
				segments.push_back(name.str());
				break;
			}

			segments.push_back(name.take(i).str());
			name.remove_prefix(i + 2);
		}

		if(segments.empty() || segments[0].empty())
			return std::nullopt;

		auto module = segments[0];
		auto relative = stdfs::path(module) / "manifests";
		if(segments.size() == 1)
		{
			relative /= "init.pp";
		}
		else
		{
			for(size_t i = 1; i + 1 < segments.size(); i++)
				relative /= segments[i];

			relative /= segments.back() + ".pp";
		}

		for(auto& dir : module_paths)
		{
			if(auto p = stdfs::path(dir) / relative; stdfs::is_regular_file(p))
				return p.string();
		}

		return std::nullopt;
	}
}
