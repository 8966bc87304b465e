// eval_result.h
// Copyright (c) 2022, yuki / zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional> // for optional, nullopt

#include "interp/value.h" // for Value

namespace snip::interp
{
	struct EvalResult
	{
		bool hasValue() const { return m_result.has_value(); }

		const Value& get() const
		{
			assert(this->hasValue());
			return *m_result;
		}

		Value& get()
		{
			assert(this->hasValue());
			return *m_result;
		}

		Value take()
		{
			assert(this->hasValue());
			return std::move(*m_result);
		}

		static ErrorOr<EvalResult> ofVoid() { return Ok(EvalResult(std::nullopt)); }
		static ErrorOr<EvalResult> ofValue(Value value) { return Ok(EvalResult(std::move(value))); }

	private:
		explicit EvalResult(std::optional<Value> value) : m_result(std::move(value)) { }

		std::optional<Value> m_result = std::nullopt;
	};


#define __TRY_VALUE(x, L)                                                                   \
	__extension__({                                                                         \
		auto&& __r##L = x;                                                                  \
		using R = std::decay_t<decltype(__r##L)>;                                           \
		using V = typename R::value_type;                                                   \
		using E = typename R::error_type;                                                   \
		static_assert(not std::is_same_v<V, void>, "cannot use TRY_VALUE on Result<void>"); \
		if((__r##L).is_err())                                                               \
			return Err<E>((__r##L).take_error());                                           \
		if(not(__r##L)->hasValue())                                                         \
			snip::internal_error("unexpected void value");                                  \
		std::move(__r##L)->take();                                                          \
	})
}

#define _TRY_VALUE(x, L) __TRY_VALUE(x, L)
#define TRY_VALUE(x) _TRY_VALUE(x, __COUNTER__)
