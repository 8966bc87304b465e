// error.h
// Copyright (c) 2021, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdio>
#include <cstdlib>

#include <string>
#include <vector>
#include <utility>

#include <zpr.h>
#include <zst/zst.h>

#include "location.h"

namespace snip
{
	namespace interp
	{
		struct Evaluator;
	}

	enum class ErrorKind
	{
		InvalidPath,
		FileNotFound,
		EmptyFile,
		Syntax,
		Evaluation,
	};

	const char* errorKindToString(ErrorKind kind);

	struct ErrorMessage
	{
		ErrorMessage() = default;
		explicit ErrorMessage(ErrorKind kind, Location loc, const std::string& msg);
		explicit ErrorMessage(const interp::Evaluator* ev, const std::string& msg);

		ErrorMessage& addInfo(Location loc, const std::string& msg);
		ErrorMessage& addInfo(const interp::Evaluator* ev, const std::string& msg);

		void display() const;
		ErrorKind kind() const { return m_kind; }
		const Location& location() const { return m_location; }
		const std::string& string() const;

	private:
		ErrorKind m_kind = ErrorKind::Evaluation;
		Location m_location;
		std::string m_message;
		std::vector<std::pair<Location, std::string>> m_infos;
	};

	template <typename T>
	using ErrorOr = zst::Result<T, ErrorMessage>;

	// frontend errors are always syntax errors
	template <typename... Args>
	[[nodiscard]] zst::Err<ErrorMessage> ErrMsg(const Location& location, const char* fmt, Args&&... args)
	{
		return zst::Err<ErrorMessage>(ErrorKind::Syntax, location, zpr::sprint(fmt, static_cast<Args&&>(args)...));
	}

	template <typename... Args>
	[[nodiscard]] zst::Err<ErrorMessage> ErrMsg(const interp::Evaluator* ev, const char* fmt, Args&&... args)
	{
		return zst::Err<ErrorMessage>(ev, zpr::sprint(fmt, static_cast<Args&&>(args)...));
	}

	template <typename... Args>
	[[nodiscard]] zst::Err<ErrorMessage>
	ErrMsg(ErrorKind kind, const Location& location, const char* fmt, Args&&... args)
	{
		return zst::Err<ErrorMessage>(kind, location, zpr::sprint(fmt, static_cast<Args&&>(args)...));
	}




	template <typename... Args>
	[[noreturn]] inline void internal_error(const char* fmt, Args&&... args)
	{
		zpr::fprintln(stderr, "internal error: {}", zpr::fwd(fmt, static_cast<Args&&>(args)...));
		abort();
	}
}

template <>
struct zpr::print_formatter<snip::ErrorMessage>
{
	template <typename Cb>
	ZPR_ALWAYS_INLINE void print(const snip::ErrorMessage& err, Cb&& cb, format_args args)
	{
		detail::print_one(cb, static_cast<format_args&&>(args), err.string());
	}
};
