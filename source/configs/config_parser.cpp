// config_parser.cpp
// Copyright (c) 2022, yuki
// SPDX-License-Identifier: Apache-2.0

#include <charconv>

#include "snip/config.h"

namespace snip::config
{
	namespace
	{
		struct Entry
		{
			size_t line;
			zst::str_view key;
			zst::str_view value;
		};

		struct Section
		{
			size_t line;
			zst::str_view name;
			std::vector<Entry> entries;
		};
	}

	static void skip_line_space(zst::str_view& sv)
	{
		while(not sv.empty() && util::is_one_of(sv[0], ' ', '\t'))
			sv.remove_prefix(1);
	}

	static zst::str_view consume_line(zst::str_view& sv)
	{
		skip_line_space(sv);
		size_t i = 0;
		while((i = sv.find_first_of("#\r\n", i)) != std::string::npos)
		{
			if(sv[i] == '#')
			{
				if(i == 0 || sv[i - 1] != '\\')
					break;

				i += 1;
			}
			else
			{
				break;
			}
		}

		// trim the line of whitespace
		auto line = sv.take_prefix(i);
		while(line.ends_with(' ') || line.ends_with('\t'))
			line.remove_suffix(1);

		// and throw away the rest of it (the comment, if any)
		sv = sv.drop_until('\n');
		if(not sv.empty())
			sv.remove_prefix(1);

		return line;
	}

	static StrErrorOr<size_t> parse_count(size_t line, zst::str_view key, zst::str_view sv)
	{
		size_t ret = 0;
		auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), ret);
		if(ec != std::errc() || ptr != sv.data() + sv.size())
			return ErrFmt("line {}: invalid value '{}' for '{}' (expected a number)", line, sv, key);

		if(ret == 0)
			return ErrFmt("line {}: '{}' must be greater than zero", line, key);

		return Ok(ret);
	}

	static StrErrorOr<std::vector<Section>> parse_sections(zst::str_view sv)
	{
		std::vector<Section> sections {};

		size_t line_num = 0;
		while(not sv.empty())
		{
			line_num += 1;

			auto line = consume_line(sv);
			if(line.empty())
				continue;

			if(line.starts_with('['))
			{
				if(not line.ends_with(']'))
					return ErrFmt("line {}: expected ']' to end section header", line_num);

				auto name = line.drop(1).drop_last(1).trim_whitespace();
				if(name.empty())
					return ErrFmt("line {}: section name cannot be empty", line_num);

				sections.push_back(Section { .line = line_num, .name = name, .entries = {} });
				continue;
			}

			auto eq = line.find('=');
			if(eq == std::string::npos)
				return ErrFmt("line {}: expected 'key = value', got '{}'", line_num, line);

			auto key = line.take(eq).trim_whitespace();
			auto value = line.drop(eq + 1).trim_whitespace();

			if(key.empty())
				return ErrFmt("line {}: missing key before '='", line_num);

			if(sections.empty())
				return ErrFmt("line {}: '{}' is not inside a section", line_num, key);

			sections.back().entries.push_back(Entry { .line = line_num, .key = key, .value = value });
		}

		return Ok(std::move(sections));
	}

	static StrErrorOr<void> apply_entry(Settings& settings, const Entry& entry, bool allow_environment)
	{
		if(entry.key == "modulepath")
		{
			settings.module_paths = TRY(parseModulePath(entry.value));
		}
		else if(entry.key == "environment")
		{
			if(not allow_environment)
				return ErrFmt("line {}: 'environment' can only be set in [main]", entry.line);

			if(entry.value.empty())
				return ErrFmt("line {}: environment name cannot be empty", entry.line);

			settings.environment = entry.value.str();
		}
		else if(entry.key == "log_level")
		{
			auto level = util::logLevelFromString(entry.value);
			if(not level.has_value())
			{
				return ErrFmt("line {}: invalid log level '{}' (expected one of debug, info, notice, warning, err)",
				    entry.line, entry.value);
			}

			settings.log_level = *level;
		}
		else if(entry.key == "max_depth")
		{
			settings.max_depth = TRY(parse_count(entry.line, entry.key, entry.value));
		}
		else
		{
			return ErrFmt("line {}: unknown setting '{}'", entry.line, entry.key);
		}

		return Ok();
	}

	StrErrorOr<std::vector<std::string>> parseModulePath(zst::str_view value)
	{
		std::vector<std::string> ret {};
		while(not value.empty())
		{
			auto i = value.find(':');
			auto part = (i == std::string::npos ? value : value.take(i)).trim_whitespace();

			if(not part.empty())
				ret.push_back(part.str());

			if(i == std::string::npos)
				break;

			value.remove_prefix(i + 1);
		}

		return Ok(std::move(ret));
	}

	StrErrorOr<Settings> parseSettings(zst::str_view contents, std::optional<std::string> environment_override)
	{
		auto sections = TRY(parse_sections(contents));

		Settings settings {};
		for(auto& sec : sections)
		{
			if(sec.name != "main")
				continue;

			for(auto& entry : sec.entries)
				TRY(apply_entry(settings, entry, /* allow_environment: */ true));
		}

		if(environment_override.has_value())
			settings.environment = std::move(*environment_override);

		for(auto& sec : sections)
		{
			if(sec.name != settings.environment)
				continue;

			for(auto& entry : sec.entries)
				TRY(apply_entry(settings, entry, /* allow_environment: */ false));
		}

		return Ok(std::move(settings));
	}
}
