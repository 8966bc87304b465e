// paths.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <vector>
#include <optional>

#include "util.h"
#include "location.h"

namespace snip::paths
{
	// `dirname` rules: "/a/b/c.pp" -> "/a/b", "c.pp" -> ".", "/c.pp" -> "/"
	std::string directoryOf(zst::str_view path);

	/*
	    Absolute paths come back untouched; anything else is glued onto the directory of
	    `caller_file` with a '/'. Nothing is normalised, and whether the file exists is
	    not checked here.
	*/
	ErrorOr<std::string> resolveInclude(const Location& loc, zst::str_view include_path, zst::str_view caller_file);

	// where `module::a::b` lives under one of `module_paths`: `<path>/module/manifests/a/b.pp`
	std::optional<std::string> resolveAutoload(zst::str_view name, const std::vector<std::string>& module_paths);
}
