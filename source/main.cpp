// main.cpp
// Copyright (c) 2021, yuki
// SPDX-License-Identifier: Apache-2.0

#define ZARG_IMPLEMENTATION
#include <zarg.h>

#include "snip/config.h"

namespace snip
{
	static StrErrorOr<config::Settings> load_settings(const std::optional<std::string>& config_file,
	    const stdfs::path& manifest,
	    const std::optional<std::string>& environment)
	{
		auto path = config_file.value_or((manifest.parent_path() / config::DEFAULT_CONFIG_FILE).string());

		// the default settings file is optional; one given with -c is not
		if(not config_file.has_value() && not stdfs::exists(path))
		{
			auto settings = config::Settings();
			if(environment.has_value())
				settings.environment = *environment;

			return Ok(std::move(settings));
		}

		auto contents = TRY(util::readEntireFile(path));
		util::debug("config", "reading settings from '{}'", path);

		auto settings = config::parseSettings(zst::str_view((const char*) contents.get(), contents.size()), environment);
		if(settings.is_err())
			return ErrFmt("{}: {}", path, settings.error());

		return Ok(settings.take_value());
	}

	static StrErrorOr<Facts> parse_facts(const zarg::ArgumentList& args)
	{
		Facts facts {};
		for(auto& opt : args.options)
		{
			if(opt.long_name != "fact")
				continue;

			auto fact = zst::str_view(*opt.value);
			auto i = fact.find('=');
			if(i == (size_t) -1 || i == 0)
				return ErrFmt("invalid fact '{}', expected 'key=value'", fact);

			facts.emplace_back(fact.take(i).str(), fact.drop(i + 1).str());
		}

		return Ok(std::move(facts));
	}
}

int main(int argc, char** argv)
{
	auto arg_list = zarg::Parser()
	                    .add_option('c', true, "settings file")
	                    .add_option('o', true, "output filename (default: stdout)")
	                    .add_option('M', true, "prepend a module search path")
	                    .add_option('E', "environment", true, "environment name")
	                    .add_option("fact", true, "set a top-scope fact (key=value)")
	                    .add_option("debug", false, "print debug output")
	                    .allow_options_after_positionals(true)
	                    .parse(argc, argv);

	auto args = arg_list.set();
	if(args.positional.size() != 1)
	{
		zpr::fprintln(stderr, "expected exactly one input file");
		return 1;
	}

	if(args.options.contains("debug"))
		util::setLogLevel(util::LogLevel::Debug);

	auto manifest = stdfs::weakly_canonical(args.positional[0]);
	auto settings = snip::load_settings(args.get_option("c"), manifest, args.get_option("environment"));
	if(settings.is_err())
	{
		util::error("snip", "{}", settings.error());
		return 1;
	}

	// -M entries go in front, in the order they were given
	std::vector<std::string> module_paths {};
	for(auto& opt : arg_list.options)
	{
		if(opt.short_name == 'M')
			module_paths.push_back(*opt.value);
	}

	module_paths.insert(module_paths.end(), settings->module_paths.begin(), settings->module_paths.end());
	settings->module_paths = std::move(module_paths);

	if(not args.options.contains("debug"))
		util::setLogLevel(settings->log_level);

	auto facts = snip::parse_facts(arg_list);
	if(facts.is_err())
	{
		util::error("snip", "{}", facts.error());
		return 1;
	}

	auto output_file = args.get_option("o").value_or("");
	return snip::compile(manifest.string(), output_file, *settings, *facts) ? 0 : 1;
}
