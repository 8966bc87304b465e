// compile.cpp
// Copyright (c) 2022, yuki
// SPDX-License-Identifier: Apache-2.0

#include <cstdio>
#include <cerrno>

#include "snip/config.h"

#include "interp/interp.h"
#include "interp/catalog.h"

namespace snip
{
	static bool write_catalog(const interp::Catalog& catalog, zst::str_view output_file)
	{
		auto str = catalog.serialise();
		if(output_file.empty())
		{
			zpr::print("{}", str);
			return true;
		}

		auto f = fopen(output_file.str().c_str(), "wb");
		if(f == nullptr)
		{
			util::error("snip", "failed to open '{}' for writing: {}", output_file, strerror(errno));
			return false;
		}

		auto _ = util::Defer([f]() { fclose(f); });
		if(fwrite(str.data(), 1, str.size(), f) != str.size())
		{
			util::error("snip", "failed to write '{}': {}", output_file, strerror(errno));
			return false;
		}

		util::log("snip", "wrote {} resource{} to '{}'", catalog.size(), catalog.size() == 1 ? "" : "s", output_file);
		return true;
	}

	bool compile(zst::str_view manifest, zst::str_view output_file, const config::Settings& settings, const Facts& facts)
	{
		auto interp = interp::Interpreter(settings);

		if(auto r = interp.compile(manifest.str(), facts); r.is_err())
			return r.error().display(), false;

		return write_catalog(interp.catalog(), output_file);
	}
}
