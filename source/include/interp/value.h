// value.h
// Copyright (c) 2022, yuki / zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <vector>
#include <variant>
#include <cstdint>
#include <utility>

#include "util.h"

namespace snip::interp
{
	struct Value
	{
		enum class Kind
		{
			Undef,
			Boolean,
			Integer,
			Floating,
			String,
			Array,
			Hash,
		};

		using HashEntries = std::vector<std::pair<std::string, Value>>;

		Kind kind() const { return m_kind; }
		static const char* kindToString(Kind kind);

		bool getBool() const;
		double getFloating() const;
		int64_t getInteger() const;
		const std::string& getString() const;

		const std::vector<Value>& getArray() const;
		std::vector<Value> takeArray() &&;

		const HashEntries& getHash() const;
		const Value* getHashEntry(zst::str_view key) const;

		// integers and floats, as a double
		double getNumber() const;

		bool isUndef() const { return m_kind == Kind::Undef; }
		bool isBool() const { return m_kind == Kind::Boolean; }
		bool isInteger() const { return m_kind == Kind::Integer; }
		bool isFloating() const { return m_kind == Kind::Floating; }
		bool isNumeric() const { return this->isInteger() || this->isFloating(); }
		bool isString() const { return m_kind == Kind::String; }
		bool isArray() const { return m_kind == Kind::Array; }
		bool isHash() const { return m_kind == Kind::Hash; }

		bool isTruthy() const;
		bool equals(const Value& other) const;

		/*
		    `toString` is what you get when interpolating a value into a string; strings come
		    out verbatim. `serialise` is the catalog form, where strings are quoted.
		*/
		std::string toString() const;
		std::string serialise() const;

		Value clone() const;

		Value(const Value&) = delete;
		Value& operator=(const Value&) = delete;

		Value();
		~Value();

		Value(Value&& val);
		Value& operator=(Value&& val);

		static Value undef();
		static Value boolean(bool value);
		static Value integer(int64_t num);
		static Value floating(double num);
		static Value string(std::string str);
		static Value array(std::vector<Value> arr);
		static Value hash(HashEntries entries);

	private:
		using Storage = std::variant<std::monostate, bool, int64_t, double, std::string, std::vector<Value>, HashEntries>;

		explicit Value(Kind kind, Storage storage);

		Kind m_kind = Kind::Undef;
		Storage m_value {};
	};
}
