// config.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>
#include <string>
#include <optional>

#include "util.h"

namespace snip::config
{
	constexpr inline auto DEFAULT_ENVIRONMENT = "production";
	constexpr inline auto DEFAULT_CONFIG_FILE = "snip.conf";

	struct Settings
	{
		std::string environment = DEFAULT_ENVIRONMENT;
		std::vector<std::string> module_paths;

		util::LogLevel log_level = util::LogLevel::Notice;
		size_t max_depth = 128;
	};

	/*
	    `[main]` is read first, then the section named after the active environment (if
	    there is one) overrides it. The active environment is `environment_override` if
	    given, otherwise whatever `[main]` says.
	*/
	StrErrorOr<Settings> parseSettings(zst::str_view contents, std::optional<std::string> environment_override);

	StrErrorOr<std::vector<std::string>> parseModulePath(zst::str_view value);
}
