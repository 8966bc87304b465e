// error.cpp
// Copyright (c) 2022, yuki / zhiayang
// SPDX-License-Identifier: Apache-2.0

#include <unistd.h>

#include "error.h"

#include "snip/frontend.h"
#include "interp/evaluator.h"

namespace snip
{
	inline constexpr const char* COLOUR_RESET = "\033[0m";
	inline constexpr const char* COLOUR_BLUE = "\033[34m";
	inline constexpr const char* COLOUR_BLACK_BOLD = "\033[1m";
	inline constexpr const char* COLOUR_RED_BOLD = "\033[1m\033[31m";
	inline constexpr const char* COLOUR_YELLOW_BOLD = "\033[1m\033[33m";
	inline constexpr const char* COLOUR_BLUE_BOLD = "\033[1m\033[34m";
	inline constexpr const char* COLOUR_GREY_BOLD = "\033[30;1m";

	static void show_message(const char* error_text,
	    const char* _error_colour,
	    const Location& loc,
	    const std::string& message)
	{
		bool coloured = isatty(STDERR_FILENO);

		const char* colour_error = coloured ? _error_colour : "";
		const char* colour_black_bold = coloured ? COLOUR_BLACK_BOLD : "";
		const char* colour_blue = coloured ? COLOUR_BLUE : "";
		const char* colour_reset = coloured ? COLOUR_RESET : "";

		zpr::fprintln(stderr, "{}{}:{} {}{}{}", colour_error, error_text, colour_reset, colour_black_bold, message,
		    colour_reset);

		if(loc.is_builtin)
			return;

		zpr::fprintln(stderr, "{} at:{} {}{}:{}:{}{}", colour_blue, colour_reset, colour_black_bold, loc.filename,
		    loc.line + 1, loc.column + 1, colour_reset);

		// errors about files that could not be read have nothing to show
		if(loc.file_contents.empty() || loc.byte_offset > loc.file_contents.size())
			return;

		size_t tmp = loc.file_contents.take(loc.byte_offset).rfind('\n');
		if(tmp == std::string::npos)
			tmp = 0;
		else
			tmp += 1;

		auto current_line = loc.file_contents.drop(tmp).take_until('\n');
		current_line.remove_suffix((not current_line.empty() && current_line.back() == '\r') ? 1 : 0);

		auto line_num = std::to_string(loc.line + 1);
		auto line_num_padding = std::string(line_num.size(), ' ');

		size_t col = loc.column;
		while(not current_line.empty() && col > 0)
		{
			if(current_line[0] == ' ')
				col -= 1, current_line.remove_prefix(1);
			else if(current_line[0] == '\t' && col >= frontend::TAB_WIDTH)
				col -= frontend::TAB_WIDTH, current_line.remove_prefix(1);
			else
				break;
		}

		auto caret_spaces = std::string(col + 1, ' ');
		auto carets = std::string(std::max(loc.length, uint32_t(1)), '^');

		zpr::fprintln(stderr, "{}{} |{}", colour_blue, line_num_padding, colour_reset);
		zpr::fprintln(stderr, "{}{} |  {} {}", colour_blue, line_num, colour_reset, current_line);
		zpr::fprintln(stderr, "{}{} |  {}{}{}{}{}", colour_blue, line_num_padding, colour_reset, colour_error,
		    caret_spaces, carets, colour_reset);
		zpr::fprintln(stderr, "");
	}

	const char* errorKindToString(ErrorKind kind)
	{
		switch(kind)
		{
			case ErrorKind::InvalidPath: return "invalid path";
			case ErrorKind::FileNotFound: return "file not found";
			case ErrorKind::EmptyFile: return "empty file";
			case ErrorKind::Syntax: return "syntax error";
			case ErrorKind::Evaluation: return "evaluation error";
		}

		return "error";
	}


	ErrorMessage::ErrorMessage(ErrorKind kind, Location loc, const std::string& msg)
	    : m_kind(kind), m_location(std::move(loc)), m_message(msg)
	{
	}

	ErrorMessage::ErrorMessage(const interp::Evaluator* ev, const std::string& msg)
	    : ErrorMessage(ErrorKind::Evaluation, ev->loc(), msg)
	{
	}

	ErrorMessage& ErrorMessage::addInfo(Location loc, const std::string& msg)
	{
		m_infos.emplace_back(loc, msg);
		return *this;
	}

	ErrorMessage& ErrorMessage::addInfo(const interp::Evaluator* ev, const std::string& msg)
	{
		return this->addInfo(ev->loc(), msg);
	}

	const std::string& ErrorMessage::string() const
	{
		return m_message;
	}

	void ErrorMessage::display() const
	{
		show_message(errorKindToString(m_kind), COLOUR_RED_BOLD, m_location, m_message);
		for(auto& [loc, info] : m_infos)
			show_message("note", COLOUR_GREY_BOLD, loc, info);
	}
}

namespace util
{
	static LogLevel g_log_level = LogLevel::Notice;

	LogLevel logLevel()
	{
		return g_log_level;
	}

	void setLogLevel(LogLevel level)
	{
		g_log_level = level;
	}

	std::optional<LogLevel> logLevelFromString(zst::str_view name)
	{
		if(name == "debug")
			return LogLevel::Debug;
		else if(name == "info")
			return LogLevel::Info;
		else if(name == "notice")
			return LogLevel::Notice;
		else if(name == "warning")
			return LogLevel::Warning;
		else if(name == "err")
			return LogLevel::Error;
		else
			return std::nullopt;
	}
}

namespace util::impl
{
	void log_impl(const char* prefix, LogLevel level, const std::string& msg, const char* who)
	{
		const bool coloured = isatty(STDERR_FILENO);

		const char* grey_bold = coloured ? snip::COLOUR_GREY_BOLD : "";
		const char* yellow_bold = coloured ? snip::COLOUR_YELLOW_BOLD : "";
		const char* red_bold = coloured ? snip::COLOUR_RED_BOLD : "";
		const char* blue_bold = coloured ? snip::COLOUR_BLUE_BOLD : "";

		const char* prefix_colour = level <= LogLevel::Notice ? grey_bold
		                          : level == LogLevel::Warning ? yellow_bold
		                                                       : red_bold;

		const char* colour_reset = coloured ? snip::COLOUR_RESET : "";

		zpr::fprintln(stderr, "{}[{}]{}{}{}{}{}{} {}", prefix_colour, prefix, colour_reset, who ? blue_bold : "",
		    who ? " " : "", who ? who : "", who ? colour_reset : "", who ? ":" : "", msg);
	}
}
