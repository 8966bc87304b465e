// frontend.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>

#include "util.h"
#include "location.h"

namespace snip::interp::ast
{
	struct Unit;
	struct Expr;
}

namespace snip::frontend
{
#define TOKEN_TYPES_LIST \
	X(Invalid)           \
	X(EndOfFile)         \
	X(Identifier)        \
	X(Variable)          \
	X(Number)            \
	X(String)            \
	X(SingleString)      \
	X(LParen)            \
	X(RParen)            \
	X(LSquare)           \
	X(RSquare)           \
	X(LBrace)            \
	X(RBrace)            \
	X(LAngle)            \
	X(RAngle)            \
	X(Colon)             \
	X(Comma)             \
	X(Semicolon)         \
	X(Plus)              \
	X(Minus)             \
	X(Asterisk)          \
	X(Slash)             \
	X(Percent)           \
	X(Equal)             \
	X(Exclamation)       \
	X(FatArrow)          \
	X(LAngleEqual)       \
	X(RAngleEqual)       \
	X(EqualEqual)        \
	X(ExclamationEqual)  \
	X(KW_If)             \
	X(KW_Elsif)          \
	X(KW_Else)           \
	X(KW_Unless)         \
	X(KW_Case)           \
	X(KW_Default)        \
	X(KW_Define)         \
	X(KW_Class)          \
	X(KW_Inherits)       \
	X(KW_True)           \
	X(KW_False)          \
	X(KW_Undef)          \
	X(KW_And)            \
	X(KW_Or)             \
	X(KW_In)             \
	X(KW_Node)

#define X(x) x,
	enum class TokenType
	{
		TOKEN_TYPES_LIST
	};
#undef X

#define X(x) { TokenType::x, #x },
	static const util::hashmap<TokenType, std::string> TOKEN_TYPE_TO_STRING = { TOKEN_TYPES_LIST };
#undef X

	struct Token
	{
		Location loc;
		TokenType type = TokenType::Invalid;
		zst::str_view text;

		inline operator TokenType() const { return this->type; }
		std::string str() const { return this->text.str(); }
	};

	/*
	    Tokens are fetched one at a time; lookahead is limited to one via `peek()`, and
	    anything further needs a `save()` / `rewind()` pair.

	    Strings are not unescaped by the lexer; the token text is whatever was between the
	    quotes, and the parser deals with escapes and interpolation.
	*/
	struct Lexer
	{
	private:
		struct SaveState
		{
			zst::str_view stream {};
			Location location {};
		};

	public:
		Lexer(zst::str_view filename, zst::str_view contents);

		// lexes `fragment`, a piece of an already-loaded file that starts at `start`
		Lexer(const Location& start, zst::str_view fragment);

		bool eof() const;
		Token peek() const;
		ErrorOr<Token> next();

		bool expect(TokenType type);
		std::optional<Token> match(TokenType type);

		SaveState save();
		void rewind(SaveState st);

		zst::str_view stream() const { return m_stream; }

		Location location() const;
		void setLocation(Location loc) { m_location = std::move(loc); }

	private:
		void update_location() const;

	private:
		zst::str_view m_file_contents {};
		zst::str_view m_stream {};

		mutable Location m_location {};
	};

	constexpr inline size_t TAB_WIDTH = 4;

	/*
	    Parses `contents` as one self-contained compilation unit. Nothing is evaluated
	    and nothing is registered anywhere; `define` and `class` bodies come back in
	    `Unit::definitions`, in source order.
	*/
	ErrorOr<std::unique_ptr<interp::ast::Unit>> parseUnit(zst::str_view filename, zst::str_view contents);
}
