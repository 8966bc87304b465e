// util.h
// Copyright (c) 2021, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <bit>
#include <tuple>
#include <limits>
#include <memory>
#include <string>
#include <vector>
#include <cassert>
#include <cstring>
#include <concepts>
#include <optional>
#include <string_view>

#include <zpr.h>
#include <zst/zst.h>

#include <xxhash.h>
#include <ankerl/unordered_dense.h>

#include "defs.h"

namespace util
{
	template <typename T, std::equality_comparable_with<T>... Ts>
	static constexpr bool is_one_of(T foo, Ts... foos)
	{
		return (false || ... || (foo == foos));
	}

	snip::StrErrorOr<zst::unique_span<uint8_t[]>> readEntireFile(const std::string& path);

	template <std::integral To, std::integral From>
	    requires requires() { requires sizeof(To) < sizeof(From); }
	To checked_cast(From f)
	{
		if constexpr(std::signed_integral<To> && std::unsigned_integral<From>)
		{
			assert(f <= static_cast<From>(std::numeric_limits<To>::max()));
		}
		else if constexpr(std::unsigned_integral<To> && std::signed_integral<From>)
		{
			assert(f >= 0);
			assert(f <= static_cast<From>(std::numeric_limits<To>::max()));
		}
		else
		{
			// same signedness
			assert(f >= static_cast<From>(std::numeric_limits<To>::min()));
			assert(f <= static_cast<From>(std::numeric_limits<To>::max()));
		}
		return static_cast<To>(f);
	}

	template <std::integral To, std::integral From>
	    requires requires() { requires sizeof(To) >= sizeof(From); }
	To checked_cast(From f)
	{
		if constexpr(std::unsigned_integral<To> && std::signed_integral<From>)
		{
			assert(f >= 0);
		}
		return static_cast<To>(f);
	}


	// https://en.cppreference.com/w/cpp/container/unordered_map/find
	// stupid language
	struct hasher
	{
		using is_transparent = void;

		static constexpr uint64_t SEED = 0xe575ed3ae41ead6dull;
		size_t operator()(const char* str) const { return XXH64(str, strlen(str), SEED); }
		size_t operator()(zst::str_view str) const { return XXH64(str.data(), str.size(), SEED); }
		size_t operator()(std::string_view str) const { return XXH64(str.data(), str.size(), SEED); }
		size_t operator()(const std::string& str) const { return XXH64(str.data(), str.size(), SEED); }

		template <typename T>
		    requires(std::is_enum_v<T> || std::is_integral_v<T> || std::is_pointer_v<T>)
		size_t operator()(T x) const
		{
			return std::hash<T> {}(x);
		}
	};

	template <typename K, typename V, typename H = hasher, typename E = std::equal_to<>>
	using hashmap = ankerl::unordered_dense::map<K, V, H, E>;

	template <typename T, typename H = hasher, typename E = std::equal_to<>>
	using hashset = ankerl::unordered_dense::set<T, H, E>;




	template <typename To, typename From>
	inline std::unique_ptr<To> static_pointer_cast(std::unique_ptr<From>&& from) //
	    noexcept
	    requires std::derived_from<To, From>
	{
		return std::unique_ptr<To>(static_cast<To*>(from.release()));
	}


	namespace impl
	{
		template <typename T, typename E>
		struct extract_value_or_return_void
		{
			T extract(zst::Result<T, E>& result) { return std::move(result.unwrap()); }
		};

		template <typename E>
		struct extract_value_or_return_void<void, E>
		{
			void extract([[maybe_unused]] zst::Result<void, E>& result) { }
		};
	}

	template <size_t STORAGE_SIZE = 16>
	struct Defer
	{
		struct Base
		{
			virtual ~Base() { }
			virtual void operator()() const = 0;
		};

		template <typename Callback>
		[[nodiscard]] Defer(Callback cb) : m_cancel(false)
		{
			struct Derived : Base
			{
				Derived(Callback&& cb) : cb(std::move(cb)) { }
				virtual void operator()() const override { cb(); }
				Callback cb;
			};

			static_assert(sizeof(Derived) <= STORAGE_SIZE);
			new(&m_storage[0]) Derived(std::move(cb));
		}

		~Defer()
		{
			if(not m_cancel)
				(*(Base*) &m_storage[0])();

			((Base*) &m_storage[0])->~Base();
		}

		void cancel() { m_cancel = true; }

		Defer(const Defer&) = delete;
		Defer& operator=(const Defer&) = delete;

	private:
		bool m_cancel;
		alignas(std::max_align_t) uint8_t m_storage[STORAGE_SIZE];
	};

	template <typename Callback>
	Defer(Callback cb) -> Defer<sizeof(std::tuple<void*, Callback>)>;




	template <typename T, typename Fn>
	std::string join(const std::vector<T>& xs, zst::str_view sep, Fn&& fn)
	{
		std::string ret {};
		for(size_t i = 0; i < xs.size(); i++)
		{
			if(i > 0)
				ret += sep.sv();
			ret += fn(xs[i]);
		}

		return ret;
	}




	enum class LogLevel
	{
		Debug = 0,
		Info = 1,
		Notice = 2,
		Warning = 3,
		Error = 4,
	};

	LogLevel logLevel();
	void setLogLevel(LogLevel level);
	std::optional<LogLevel> logLevelFromString(zst::str_view name);

	namespace impl
	{
		void log_impl(const char* prefix, LogLevel level, const std::string& msg, const char* who);
	}

	template <typename... Args>
	void debug(const char* who, const char* fmt, Args&&... args)
	{
		if(logLevel() <= LogLevel::Debug)
			impl::log_impl("dbg", LogLevel::Debug, zpr::sprint(fmt, static_cast<Args&&>(args)...), who);
	}

	template <typename... Args>
	void info(const char* who, const char* fmt, Args&&... args)
	{
		if(logLevel() <= LogLevel::Info)
			impl::log_impl("inf", LogLevel::Info, zpr::sprint(fmt, static_cast<Args&&>(args)...), who);
	}

	template <typename... Args>
	void log(const char* who, const char* fmt, Args&&... args)
	{
		if(logLevel() <= LogLevel::Notice)
			impl::log_impl("log", LogLevel::Notice, zpr::sprint(fmt, static_cast<Args&&>(args)...), who);
	}

	template <typename... Args>
	void warn(const char* who, const char* fmt, Args&&... args)
	{
		if(logLevel() <= LogLevel::Warning)
			impl::log_impl("wrn", LogLevel::Warning, zpr::sprint(fmt, static_cast<Args&&>(args)...), who);
	}

	template <typename... Args>
	void error(const char* who, const char* fmt, Args&&... args)
	{
		impl::log_impl("err", LogLevel::Error, zpr::sprint(fmt, static_cast<Args&&>(args)...), who);
	}
}

using util::checked_cast;
