// test-config.cpp
// Copyright (c) 2024, yuki
// SPDX-License-Identifier: Apache-2.0

#include "tester.h"

#include "snip/config.h"

namespace test
{
	using snip::config::Settings;
	using snip::config::parseSettings;
	using snip::config::parseModulePath;

	static void test_valid(Context& ctx)
	{
		auto text = "# global settings\n"
		            "[main]\n"
		            "  modulepath = /etc/snip/modules:/opt/modules  # two of them\n"
		            "  environment = staging\n"
		            "  log_level = warning\n"
		            "\n"
		            "[staging]\n"
		            "max_depth = 16\n"
		            "modulepath = /srv/staging/modules\n"
		            "\n"
		            "[production]\n"
		            "max_depth = 4\n";

		auto s = parseSettings(text, std::nullopt);
		if(check(ctx, s.ok(), "valid settings failed: {}", s.is_err() ? s.error() : ""))
		{
			check(ctx, s->environment == "staging", "environment is '{}'", s->environment);
			check(ctx, s->log_level == util::LogLevel::Warning, "log_level was not applied");
			check(ctx, s->max_depth == 16, "max_depth from [staging] is {}", s->max_depth);
			check(ctx, s->module_paths.size() == 1 && s->module_paths[0] == "/srv/staging/modules",
			    "[staging] modulepath did not replace the [main] one");
		}

		// an override picks a different section, even if [main] names one
		auto p = parseSettings(text, "production");
		if(check(ctx, p.ok(), "overridden settings failed: {}", p.is_err() ? p.error() : ""))
		{
			check(ctx, p->environment == "production", "environment is '{}'", p->environment);
			check(ctx, p->max_depth == 4, "max_depth from [production] is {}", p->max_depth);
			check(ctx, p->module_paths.size() == 2, "[main] modulepath should survive, got {} entries", p->module_paths.size());
		}

		// an environment without a section of its own just uses [main]
		auto d = parseSettings(text, "dev");
		if(check(ctx, d.ok(), "settings for 'dev' failed: {}", d.is_err() ? d.error() : ""))
			check(ctx, d->max_depth == Settings().max_depth, "max_depth should be the default");

		auto empty = parseSettings("", std::nullopt);
		if(check(ctx, empty.ok(), "empty settings failed"))
		{
			check(ctx, empty->environment == snip::config::DEFAULT_ENVIRONMENT, "default environment is '{}'",
			    empty->environment);
			check(ctx, empty->module_paths.empty(), "default module path should be empty");
		}
	}

	static void test_invalid(Context& ctx)
	{
		struct Case
		{
			const char* text;
			const char* message;
		};

		auto cases = {
			Case { "[main]\nfrobs = 3\n", "line 2: unknown setting 'frobs'" },
			Case { "modulepath = /x\n", "line 1: 'modulepath' is not inside a section" },
			Case { "[main]\n[production]\nenvironment = dev\n", "line 3: 'environment' can only be set in [main]" },
			Case { "[main]\nlog_level = loud\n", "invalid log level 'loud'" },
			Case { "[main]\nmax_depth = 0\n", "'max_depth' must be greater than zero" },
			Case { "[main]\nmax_depth = lots\n", "invalid value 'lots' for 'max_depth'" },
			Case { "[main\n", "line 1: expected ']'" },
			Case { "[ ]\n", "section name cannot be empty" },
			Case { "[main]\njust some words\n", "line 2: expected 'key = value'" },
			Case { "[main]\n = 1\n", "missing key" },
		};

		for(auto& c : cases)
		{
			auto s = parseSettings(c.text, std::nullopt);
			if(not check(ctx, s.is_err(), "'{}' should have failed", c.text))
				continue;

			check(ctx, s.error().find(c.message) != std::string::npos, "expected '{}' in '{}'", c.message, s.error());
		}
	}

	static void test_module_path(Context& ctx)
	{
		auto a = parseModulePath(" /a : /b/c ::/d ");
		check(ctx, a.ok() && a->size() == 3 && (*a)[0] == "/a" && (*a)[1] == "/b/c" && (*a)[2] == "/d",
		    "module path was not split properly");

		auto b = parseModulePath("");
		check(ctx, b.ok() && b->empty(), "an empty module path should have no entries");
	}

	void test_config(Context& ctx)
	{
		zpr::println("config");

		test_valid(ctx);
		test_invalid(ctx);
		test_module_path(ctx);
	}
}
