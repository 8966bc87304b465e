// lexer.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "util.h"     // for checked_cast, is_one_of
#include "location.h" // for Location

#include "snip/frontend.h" // for Token, Lexer, TokenType

namespace snip::frontend
{
	using TT = TokenType;

	static bool is_name_start(char c)
	{
		return isascii(c) && (isalpha(c) || c == '_');
	}

	static bool is_name_char(char c)
	{
		return isascii(c) && (isalnum(c) || c == '_');
	}

	static ErrorOr<Token> advance_and_return(zst::str_view& stream, Location& loc, Token tok, size_t n)
	{
		loc.column += checked_cast<uint32_t>(n);
		tok.loc.length = checked_cast<uint32_t>(n);
		tok.loc.byte_offset = checked_cast<size_t>(tok.text.data() - tok.loc.file_contents.data());

		stream.remove_prefix(n);
		return Ok(std::move(tok));
	}

	static void advance_over(zst::str_view& stream, Location& loc, size_t n)
	{
		for(size_t i = 0; i < n; i++)
		{
			if(stream[i] == '\n')
				loc.line++, loc.column = 0;
			else if(stream[i] == '\t')
				loc.column += TAB_WIDTH;
			else if(stream[i] != '\r')
				loc.column++;
		}

		stream.remove_prefix(n);
	}

	static ErrorOr<bool> parse_comment(zst::str_view& stream, Location& loc)
	{
		if(stream.starts_with("/*"))
		{
			auto start_loc = loc;
			start_loc.length = 2;

			auto i = stream.find("*/");
			if(i == (size_t) -1)
				return ErrMsg(start_loc, "unterminated block comment (reached end of file)");

			advance_over(stream, loc, i + 2);
			return Ok(true);
		}
		else if(stream.starts_with("#"))
		{
			auto i = stream.find_first_of("\r\n");
			if(i == (size_t) -1)
				i = stream.size();

			advance_over(stream, loc, i);
			return Ok(true);
		}
		else
		{
			return Ok(false);
		}
	}

	static size_t consume_name(zst::str_view stream, size_t start)
	{
		size_t n = start;
		while(true)
		{
			if(n >= stream.size() || not is_name_start(stream[n]))
				return n;

			while(n < stream.size() && is_name_char(stream[n]))
				n++;

			if(stream.drop(n).starts_with("::") && n + 2 < stream.size() && is_name_start(stream[n + 2]))
				n += 2;
			else
				return n;
		}
	}

	static ErrorOr<Token> consume_string(zst::str_view& stream, Location& loc, TokenType tt, char terminating_char)
	{
		auto start_loc = loc;

		size_t n = 1;
		while(true)
		{
			if(n == stream.size())
			{
				start_loc.length = 1;
				return ErrMsg(start_loc, "unterminated string literal");
			}

			// escapes are not processed here, but an escaped quote must not end the string
			if(stream[n] == '\\')
			{
				if(n + 1 == stream.size())
					return ErrMsg(start_loc, "unterminated escape sequence");

				n += 2;
				continue;
			}
			else if(stream[n] == terminating_char)
			{
				n++;
				break;
			}

			n++;
		}

		// strings may span lines, so the location is fixed up afterwards.
		auto tok = Token {
			.loc = start_loc,
			.type = tt,
			.text = stream.drop(1).take(n - 2),
		};

		tok.loc.length = checked_cast<uint32_t>(n);
		tok.loc.byte_offset = checked_cast<size_t>(stream.data() - tok.loc.file_contents.data());

		advance_over(stream, loc, n);
		return Ok(std::move(tok));
	}

	static ErrorOr<Token> consume_token(zst::str_view& stream, Location& loc)
	{
		// skip whitespace
		while(stream.size() > 0)
		{
			if(util::is_one_of(stream[0], ' ', '\t', '\r', '\n'))
				advance_over(stream, loc, 1);
			else
				break;
		}

		if(stream.empty())
		{
			return Ok(Token { .loc = loc, .type = TT::EndOfFile, .text = stream });
		}
		else if(stream.starts_with("#") || stream.starts_with("/*"))
		{
			(void) TRY(parse_comment(stream, loc));
			return consume_token(stream, loc);
		}
		else if(stream.starts_with("*/"))
		{
			return ErrMsg(loc, "unexpected end of block comment");
		}
		else if(stream.starts_with("=>"))
		{
			return advance_and_return(stream, loc, //
			    Token { .loc = loc, .type = TT::FatArrow, .text = stream.take(2) }, 2);
		}
		else if(stream.starts_with("<="))
		{
			return advance_and_return(stream, loc, //
			    Token { .loc = loc, .type = TT::LAngleEqual, .text = stream.take(2) }, 2);
		}
		else if(stream.starts_with(">="))
		{
			return advance_and_return(stream, loc, //
			    Token { .loc = loc, .type = TT::RAngleEqual, .text = stream.take(2) }, 2);
		}
		else if(stream.starts_with("=="))
		{
			return advance_and_return(stream, loc, //
			    Token { .loc = loc, .type = TT::EqualEqual, .text = stream.take(2) }, 2);
		}
		else if(stream.starts_with("!="))
		{
			return advance_and_return(stream, loc, //
			    Token { .loc = loc, .type = TT::ExclamationEqual, .text = stream.take(2) }, 2);
		}
		else if(stream[0] == '"')
		{
			return consume_string(stream, loc, TT::String, '"');
		}
		else if(stream[0] == '\'')
		{
			return consume_string(stream, loc, TT::SingleString, '\'');
		}
		else if(stream[0] == '$')
		{
			// the token text excludes the '$', but keeps a leading '::'
			size_t start = stream.drop(1).starts_with("::") ? 3 : 1;
			size_t n = consume_name(stream, start);

			if(n == start)
				return ErrMsg(loc, "expected variable name after '$'");

			auto tok = Token { .loc = loc, .type = TT::Variable, .text = stream.drop(1).take(n - 1) };
			tok.loc.length = checked_cast<uint32_t>(n);
			tok.loc.byte_offset = checked_cast<size_t>(stream.data() - tok.loc.file_contents.data());

			loc.column += checked_cast<uint32_t>(n);
			stream.remove_prefix(n);
			return Ok(std::move(tok));
		}
		else if(stream.starts_with("::") && stream.size() > 2 && is_name_start(stream[2]))
		{
			// `include ::foo` is the same as `include foo`
			size_t n = consume_name(stream, 2);
			auto tok = Token { .loc = loc, .type = TT::Identifier, .text = stream.drop(2).take(n - 2) };
			tok.loc.length = checked_cast<uint32_t>(n);
			tok.loc.byte_offset = checked_cast<size_t>(stream.data() - tok.loc.file_contents.data());

			loc.column += checked_cast<uint32_t>(n);
			stream.remove_prefix(n);
			return Ok(std::move(tok));
		}
		else if(is_name_start(stream[0]))
		{
			size_t n = consume_name(stream, 0);

			auto text = stream.take(n);
			auto tt = TT::Identifier;

			if(text == "if")
				tt = TT::KW_If;
			else if(text == "in")
				tt = TT::KW_In;
			else if(text == "or")
				tt = TT::KW_Or;
			else if(text == "and")
				tt = TT::KW_And;
			else if(text == "else")
				tt = TT::KW_Else;
			else if(text == "case")
				tt = TT::KW_Case;
			else if(text == "true")
				tt = TT::KW_True;
			else if(text == "node")
				tt = TT::KW_Node;
			else if(text == "elsif")
				tt = TT::KW_Elsif;
			else if(text == "class")
				tt = TT::KW_Class;
			else if(text == "false")
				tt = TT::KW_False;
			else if(text == "undef")
				tt = TT::KW_Undef;
			else if(text == "unless")
				tt = TT::KW_Unless;
			else if(text == "define")
				tt = TT::KW_Define;
			else if(text == "default")
				tt = TT::KW_Default;
			else if(text == "inherits")
				tt = TT::KW_Inherits;

			return advance_and_return(stream, loc, Token { .loc = loc, .type = tt, .text = text }, n);
		}
		else if(isascii(stream[0]) && isdigit(stream[0]))
		{
			size_t n = 0;
			while(n < stream.size() && isascii(stream[n]) && isdigit(stream[n]))
				n++;

			if(n + 1 < stream.size() && stream[n] == '.' && isascii(stream[n + 1]) && isdigit(stream[n + 1]))
			{
				n++;
				while(n < stream.size() && isascii(stream[n]) && isdigit(stream[n]))
					n++;
			}

			if(n < stream.size() && is_name_char(stream[n]))
				return ErrMsg(loc, "invalid number literal '{}'", stream.take(n + 1));

			return advance_and_return(stream, loc, //
			    Token { .loc = loc, .type = TT::Number, .text = stream.take(n) }, n);
		}
		else
		{
			auto tt = TT::Invalid;
			switch(stream[0])
			{
				case '(': tt = TT::LParen; break;
				case ')': tt = TT::RParen; break;
				case '[': tt = TT::LSquare; break;
				case ']': tt = TT::RSquare; break;
				case '{': tt = TT::LBrace; break;
				case '}': tt = TT::RBrace; break;
				case '<': tt = TT::LAngle; break;
				case '>': tt = TT::RAngle; break;
				case ':': tt = TT::Colon; break;
				case ',': tt = TT::Comma; break;
				case ';': tt = TT::Semicolon; break;
				case '+': tt = TT::Plus; break;
				case '-': tt = TT::Minus; break;
				case '*': tt = TT::Asterisk; break;
				case '/': tt = TT::Slash; break;
				case '%': tt = TT::Percent; break;
				case '=': tt = TT::Equal; break;
				case '!': tt = TT::Exclamation; break;

				default: return ErrMsg(loc, "unknown token '{}'", stream[0]);
			}

			return advance_and_return(stream, loc, Token { .loc = loc, .type = tt, .text = stream.take(1) }, 1);
		}
	}





	Lexer::Lexer(zst::str_view filename, zst::str_view contents) : m_file_contents(contents), m_stream(contents)
	{
		m_location = Location {
			.line = 0,
			.column = 0,
			.length = 1,
			.byte_offset = 0,
			.filename = filename,
			.file_contents = contents,
		};
	}

	Lexer::Lexer(const Location& start, zst::str_view fragment)
	    : m_file_contents(start.file_contents), m_stream(fragment), m_location(start)
	{
		this->update_location();
	}

	Token Lexer::peek() const
	{
		// copy them
		auto foo = m_stream;
		auto bar = m_location;

		return consume_token(foo, bar).or_else(Token { .type = TT::Invalid });
	}

	bool Lexer::eof() const
	{
		auto x = this->peek();
		return x == TT::Invalid || x == TT::EndOfFile;
	}

	void Lexer::update_location() const
	{
		m_location.byte_offset = checked_cast<size_t>(m_stream.data() - m_file_contents.data());
	}

	ErrorOr<Token> Lexer::next()
	{
		this->update_location();
		return consume_token(m_stream, m_location);
	}

	bool Lexer::expect(TokenType type)
	{
		if(auto t = this->peek(); t == type)
		{
			this->next().unwrap();
			return true;
		}

		return false;
	}

	std::optional<Token> Lexer::match(TokenType type)
	{
		if(this->peek() == type)
			return this->next().unwrap();

		return std::nullopt;
	}

	Location Lexer::location() const
	{
		this->update_location();
		return m_location;
	}

	Lexer::SaveState Lexer::save()
	{
		return SaveState { .stream = m_stream, .location = m_location };
	}

	void Lexer::rewind(SaveState st)
	{
		m_stream = st.stream;
		m_location = st.location;
	}
}
