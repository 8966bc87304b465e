// defs.h
// Copyright (c) 2021, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <vector>
#include <utility>
#include <filesystem>
#include <unordered_map>
#include <unordered_set>

#include <zpr.h>
#include <zst/zst.h>

#include "error.h"

namespace stdfs = std::filesystem;

namespace snip
{
	template <typename T>
	using StrErrorOr = zst::Result<T, std::string>;

	using zst::Ok;
	using zst::Err;
	using zst::ErrFmt;

	using zst::Result;

	namespace config
	{
		struct Settings;
	}

	using Facts = std::vector<std::pair<std::string, std::string>>;

	// an empty `output_file` means stdout
	bool compile(zst::str_view manifest, zst::str_view output_file, const config::Settings& settings, const Facts& facts);
}

#define __TRY(x, L) __extension__({                                       \
		auto&& __r##L = x;                                                \
		using R = std::decay_t<decltype(__r##L)>;                         \
		using V = typename R::value_type;                                 \
		using E = typename R::error_type;                                 \
		if((__r##L).is_err())                                             \
			return Err(std::move((__r##L).error()));                      \
		util::impl::extract_value_or_return_void<V, E>().extract(__r##L); \
	})

#define _TRY(x, L) __TRY(x, L)
#define TRY(x) _TRY(x, __COUNTER__)

inline void zst::error_and_exit(const char* str, size_t len)
{
	snip::internal_error("{}", zst::str_view(str, len));
}
