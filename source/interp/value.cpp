// value.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include <cmath>
#include <cctype>
#include <charconv>

#include "interp/value.h"

namespace snip::interp
{
	Value::Value() = default;
	Value::~Value() = default;

	Value::Value(Value&& val) = default;
	Value& Value::operator=(Value&& val) = default;

	Value::Value(Kind kind, Storage storage) : m_kind(kind), m_value(std::move(storage))
	{
	}

	const char* Value::kindToString(Kind kind)
	{
		switch(kind)
		{
			case Kind::Undef: return "undef";
			case Kind::Boolean: return "boolean";
			case Kind::Integer: return "integer";
			case Kind::Floating: return "float";
			case Kind::String: return "string";
			case Kind::Array: return "array";
			case Kind::Hash: return "hash";
		}

		return "?";
	}

	bool Value::getBool() const
	{
		assert(this->isBool());
		return std::get<bool>(m_value);
	}

	double Value::getFloating() const
	{
		assert(this->isFloating());
		return std::get<double>(m_value);
	}

	int64_t Value::getInteger() const
	{
		assert(this->isInteger());
		return std::get<int64_t>(m_value);
	}

	const std::string& Value::getString() const
	{
		assert(this->isString());
		return std::get<std::string>(m_value);
	}

	const std::vector<Value>& Value::getArray() const
	{
		assert(this->isArray());
		return std::get<std::vector<Value>>(m_value);
	}

	std::vector<Value> Value::takeArray() &&
	{
		assert(this->isArray());
		return std::move(std::get<std::vector<Value>>(m_value));
	}

	const Value::HashEntries& Value::getHash() const
	{
		assert(this->isHash());
		return std::get<HashEntries>(m_value);
	}

	const Value* Value::getHashEntry(zst::str_view key) const
	{
		for(auto& [k, v] : this->getHash())
		{
			if(zst::str_view(k) == key)
				return &v;
		}

		return nullptr;
	}

	double Value::getNumber() const
	{
		if(this->isInteger())
			return static_cast<double>(this->getInteger());

		return this->getFloating();
	}

	bool Value::isTruthy() const
	{
		switch(m_kind)
		{
			case Kind::Undef: return false;
			case Kind::Boolean: return this->getBool();
			case Kind::String: return not this->getString().empty();
			default: return true;
		}
	}

	static bool strings_equal(zst::str_view a, zst::str_view b)
	{
		if(a.size() != b.size())
			return false;

		for(size_t i = 0; i < a.size(); i++)
		{
			if(tolower(static_cast<unsigned char>(a[i])) != tolower(static_cast<unsigned char>(b[i])))
				return false;
		}

		return true;
	}

	static std::optional<double> string_as_number(const std::string& str)
	{
		double ret = 0;
		auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), ret);
		if(str.empty() || ec != std::errc() || ptr != str.data() + str.size())
			return std::nullopt;

		return ret;
	}

	bool Value::equals(const Value& other) const
	{
		if(this->isNumeric() && other.isNumeric())
			return this->getNumber() == other.getNumber();

		// "1" == 1
		if(this->isNumeric() && other.isString())
			return string_as_number(other.getString()) == this->getNumber();
		else if(this->isString() && other.isNumeric())
			return string_as_number(this->getString()) == other.getNumber();

		if(m_kind != other.m_kind)
			return false;

		switch(m_kind)
		{
			case Kind::Undef: return true;
			case Kind::Boolean: return this->getBool() == other.getBool();
			case Kind::String: return strings_equal(this->getString(), other.getString());

			case Kind::Array: {
				auto& a = this->getArray();
				auto& b = other.getArray();
				if(a.size() != b.size())
					return false;

				for(size_t i = 0; i < a.size(); i++)
				{
					if(not a[i].equals(b[i]))
						return false;
				}

				return true;
			}

			case Kind::Hash: {
				auto& a = this->getHash();
				auto& b = other.getHash();
				if(a.size() != b.size())
					return false;

				for(auto& [k, v] : a)
				{
					auto x = other.getHashEntry(k);
					if(x == nullptr || not v.equals(*x))
						return false;
				}

				return true;
			}

			default: return false;
		}
	}

	static std::string format_floating(double d)
	{
		char buf[64] {};
		auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
		if(ec != std::errc())
			return zpr::sprint("{}", d);

		auto ret = std::string(buf, ptr);
		if(std::isfinite(d) && ret.find_first_of(".e") == std::string::npos)
			ret += ".0";

		return ret;
	}

	static std::string quote_string(const std::string& str)
	{
		std::string ret = "'";
		for(char c : str)
		{
			if(c == '\\' || c == '\'')
				ret += '\\';
			ret += c;
		}

		return ret + "'";
	}

	std::string Value::toString() const
	{
		switch(m_kind)
		{
			case Kind::Undef: return "";
			case Kind::Boolean: return this->getBool() ? "true" : "false";
			case Kind::Integer: return std::to_string(this->getInteger());
			case Kind::Floating: return format_floating(this->getFloating());
			case Kind::String: return this->getString();

			case Kind::Array: {
				std::string ret {};
				for(auto& v : this->getArray())
					ret += v.toString();

				return ret;
			}

			case Kind::Hash: return this->serialise();
		}

		return "";
	}

	std::string Value::serialise() const
	{
		switch(m_kind)
		{
			case Kind::Undef: return "undef";
			case Kind::String: return quote_string(this->getString());

			case Kind::Array: {
				return zpr::sprint("[{}]", util::join(this->getArray(), ", ", [](const Value& v) {
					return v.serialise();
				}));
			}

			case Kind::Hash: {
				return zpr::sprint("{{{}}}", util::join(this->getHash(), ", ", [](const auto& kv) {
					return zpr::sprint("{} => {}", quote_string(kv.first), kv.second.serialise());
				}));
			}

			default: return this->toString();
		}
	}

	Value Value::clone() const
	{
		switch(m_kind)
		{
			case Kind::Undef: return Value::undef();
			case Kind::Boolean: return Value::boolean(this->getBool());
			case Kind::Integer: return Value::integer(this->getInteger());
			case Kind::Floating: return Value::floating(this->getFloating());
			case Kind::String: return Value::string(this->getString());

			case Kind::Array: {
				std::vector<Value> arr {};
				arr.reserve(this->getArray().size());

				for(auto& v : this->getArray())
					arr.push_back(v.clone());

				return Value::array(std::move(arr));
			}

			case Kind::Hash: {
				HashEntries entries {};
				entries.reserve(this->getHash().size());

				for(auto& [k, v] : this->getHash())
					entries.emplace_back(k, v.clone());

				return Value::hash(std::move(entries));
			}
		}

		snip::internal_error("invalid value kind");
	}

	Value Value::undef()
	{
		return Value(Kind::Undef, std::monostate {});
	}

	Value Value::boolean(bool value)
	{
		return Value(Kind::Boolean, value);
	}

	Value Value::integer(int64_t num)
	{
		return Value(Kind::Integer, num);
	}

	Value Value::floating(double num)
	{
		return Value(Kind::Floating, num);
	}

	Value Value::string(std::string str)
	{
		return Value(Kind::String, std::move(str));
	}

	Value Value::array(std::vector<Value> arr)
	{
		return Value(Kind::Array, std::move(arr));
	}

	Value Value::hash(HashEntries entries)
	{
		return Value(Kind::Hash, std::move(entries));
	}
}
