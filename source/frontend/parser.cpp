// parser.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include <cctype>
#include <charconv>
#include <algorithm>

#include "util.h"     // for is_one_of
#include "location.h" // for Location

#include "snip/frontend.h" // for Token, Lexer, TokenType

#include "interp/ast.h" // for Expr, Stmt, Unit, Definition...

namespace snip::frontend
{
	namespace ast = snip::interp::ast;

	using TT = TokenType;

	template <typename T>
	using ErrorOrUniquePtr = ErrorOr<std::unique_ptr<T>>;

	static ErrorOrUniquePtr<ast::Stmt> parse_stmt(Lexer& lexer);
	static ErrorOrUniquePtr<ast::Expr> parse_expr(Lexer& lexer);
	static ErrorOrUniquePtr<ast::Expr> parse_unary(Lexer& lexer);
	static ErrorOrUniquePtr<ast::Expr> parse_primary(Lexer& lexer);
	static ErrorOrUniquePtr<ast::Block> parse_block(Lexer& lexer);

	static std::string token_description(const Token& tok)
	{
		if(tok == TT::EndOfFile)
			return "end of file";

		return zpr::sprint("'{}'", tok.text);
	}

	// peek, but if the next token is malformed, report why.
	static ErrorOr<Token> peek_token(Lexer& lexer)
	{
		auto tok = lexer.peek();
		if(tok == TT::Invalid)
		{
			auto saved = lexer.save();
			auto result = lexer.next();
			lexer.rewind(saved);

			if(result.is_err())
				return Err(result.take_error());
		}

		return Ok(std::move(tok));
	}

	static ErrorOr<Token> expect_token(Lexer& lexer, TokenType type, const char* what)
	{
		auto tok = TRY(peek_token(lexer));
		if(tok != type)
			return ErrMsg(tok.loc, "expected {}, found {}", what, token_description(tok));

		return lexer.next();
	}

	// keywords are fine as attribute names (`unless => ...` on an exec, for instance)
	static bool is_word_token(const Token& tok)
	{
		return tok == TT::Identifier
		    || util::is_one_of(tok.type, TT::KW_If, TT::KW_Elsif, TT::KW_Else, TT::KW_Unless, TT::KW_Case,
		        TT::KW_Default, TT::KW_Define, TT::KW_Class, TT::KW_Inherits, TT::KW_True, TT::KW_False,
		        TT::KW_Undef, TT::KW_And, TT::KW_Or, TT::KW_In, TT::KW_Node);
	}

	static bool is_name(zst::str_view sv)
	{
		if(sv.empty())
			return false;

		if(sv.starts_with("::"))
			sv.remove_prefix(2);

		for(size_t i = 0; i < sv.size(); i++)
		{
			if(sv[i] == ':')
			{
				if(i + 2 >= sv.size() || sv[i + 1] != ':')
					return false;
				i += 1;
			}
			else if(not(isascii(sv[i]) && (isalnum(sv[i]) || sv[i] == '_')))
			{
				return false;
			}
		}

		return true;
	}

	static Location location_in_string(const Token& tok, size_t offset)
	{
		// +1 for the opening quote
		auto loc = tok.loc;
		loc.length = 1;
		loc.byte_offset += 1;
		loc.column += 1;

		for(size_t i = 0; i < offset && i < tok.text.size(); i++)
		{
			loc.byte_offset += 1;
			if(tok.text[i] == '\n')
				loc.line++, loc.column = 0;
			else if(tok.text[i] == '\t')
				loc.column += TAB_WIDTH;
			else
				loc.column++;
		}

		return loc;
	}

	static std::string unescape_single_quoted(zst::str_view text)
	{
		std::string ret {};
		ret.reserve(text.size());

		while(not text.empty())
		{
			if(text[0] == '\\' && text.size() > 1 && util::is_one_of(text[1], '\\', '\''))
			{
				ret += text[1];
				text.remove_prefix(2);
			}
			else
			{
				ret += text[0];
				text.remove_prefix(1);
			}
		}

		return ret;
	}

	static ErrorOr<size_t> find_interpolation_end(const Token& tok, size_t start)
	{
		// `start` points just past "${"
		int depth = 1;
		for(size_t i = start; i < tok.text.size(); i++)
		{
			if(tok.text[i] == '{')
			{
				depth++;
			}
			else if(tok.text[i] == '}')
			{
				if(--depth == 0)
					return Ok(i);
			}
			else if(tok.text[i] == '\'')
			{
				auto k = tok.text.drop(i + 1).find('\'');
				if(k == std::string::npos)
					break;
				i += k + 1;
			}
		}

		return ErrMsg(location_in_string(tok, start - 2), "unterminated '${' in string");
	}

	static ErrorOrUniquePtr<ast::Expr> parse_interpolated_expr(const Token& tok, size_t start, size_t end)
	{
		auto inner = tok.text.drop(start).take(end - start).trim_whitespace();
		auto loc = location_in_string(tok, start);

		if(inner.empty())
			return ErrMsg(loc, "empty interpolation");

		// `${name}` means the variable, not the bareword
		if(is_name(inner))
		{
			loc.length = checked_cast<uint32_t>(inner.size());
			return Ok(std::make_unique<ast::VariableRef>(loc, inner.str()));
		}

		auto sub = Lexer(loc, tok.text.drop(start).take(end - start));
		auto expr = TRY(parse_expr(sub));

		if(auto t = TRY(peek_token(sub)); t != TT::EndOfFile)
			return ErrMsg(t.loc, "unexpected {} in interpolation", token_description(t));

		return Ok(std::move(expr));
	}

	static ErrorOrUniquePtr<ast::Expr> parse_double_quoted(const Token& tok)
	{
		auto text = tok.text;

		std::vector<std::variant<std::string, std::unique_ptr<ast::Expr>>> parts {};
		std::string current {};

		auto flush = [&]() {
			if(not current.empty())
				parts.push_back(std::move(current));
			current.clear();
		};

		size_t i = 0;
		while(i < text.size())
		{
			if(text[i] == '\\' && i + 1 < text.size())
			{
				switch(text[i + 1])
				{
					case 'n': current += '\n'; break;
					case 't': current += '\t'; break;
					case 'r': current += '\r'; break;
					case 's': current += ' '; break;
					case '\\': current += '\\'; break;
					case '"': current += '"'; break;
					case '$': current += '$'; break;
					case '\'': current += '\''; break;
					case '\n': break;

					// unknown escapes are kept as they are
					default:
						current += '\\';
						current += text[i + 1];
						break;
				}

				i += 2;
			}
			else if(text[i] == '$' && i + 1 < text.size() && text[i + 1] == '{')
			{
				flush();

				auto end = TRY(find_interpolation_end(tok, i + 2));
				parts.push_back(TRY(parse_interpolated_expr(tok, i + 2, end)));

				i = end + 1;
			}
			else if(text[i] == '$' && i + 1 < text.size()
			        && ((isascii(text[i + 1]) && isalpha(text[i + 1])) || text[i + 1] == '_'
			            || text.drop(i + 1).starts_with("::")))
			{
				flush();

				size_t k = i + 1;
				if(text.drop(k).starts_with("::"))
					k += 2;

				while(true)
				{
					while(k < text.size() && isascii(text[k]) && (isalnum(text[k]) || text[k] == '_'))
						k++;

					if(text.drop(k).starts_with("::") && k + 2 < text.size()
					    && ((isascii(text[k + 2]) && isalpha(text[k + 2])) || text[k + 2] == '_'))
						k += 2;
					else
						break;
				}

				auto loc = location_in_string(tok, i);
				loc.length = checked_cast<uint32_t>(k - i);

				parts.push_back(std::make_unique<ast::VariableRef>(loc, text.drop(i + 1).take(k - i - 1).str()));
				i = k;
			}
			else
			{
				current += text[i];
				i += 1;
			}
		}

		bool interpolated = std::any_of(parts.begin(), parts.end(), [](auto& p) {
			return std::holds_alternative<std::unique_ptr<ast::Expr>>(p);
		});

		if(not interpolated)
		{
			std::string str {};
			for(auto& p : parts)
				str += std::get<std::string>(p);

			str += current;
			return Ok(std::make_unique<ast::StringLit>(tok.loc, std::move(str)));
		}

		flush();

		auto ret = std::make_unique<ast::InterpolatedString>(tok.loc);
		ret->parts = std::move(parts);
		return Ok(std::move(ret));
	}

	static ErrorOrUniquePtr<ast::NumberLit> parse_number(const Token& tok)
	{
		auto ret = std::make_unique<ast::NumberLit>(tok.loc);
		auto sv = tok.text;

		if(sv.find('.') != std::string::npos)
		{
			auto copy = sv.str();

			char* end_ptr = 0;
			ret->is_floating = true;
			ret->float_value = strtod(copy.c_str(), &end_ptr);

			if(end_ptr != copy.c_str() + copy.size())
				return ErrMsg(tok.loc, "invalid number literal '{}'", sv);
		}
		else
		{
			auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), ret->int_value);
			if(ec == std::errc::result_out_of_range)
				return ErrMsg(tok.loc, "integer literal '{}' is too large", sv);
			else if(ec != std::errc() || ptr != sv.data() + sv.size())
				return ErrMsg(tok.loc, "invalid number literal '{}'", sv);
		}

		return Ok(std::move(ret));
	}





	static int get_front_token_precedence(Lexer& lexer)
	{
		switch(lexer.peek())
		{
			case TT::Asterisk:
			case TT::Percent:
			case TT::Slash: return 400;

			case TT::Plus:
			case TT::Minus: return 300;

			case TT::KW_In: return 250;

			case TT::LAngle:
			case TT::RAngle:
			case TT::EqualEqual:
			case TT::LAngleEqual:
			case TT::RAngleEqual:
			case TT::ExclamationEqual: return 200;

			case TT::KW_And: return 50;
			case TT::KW_Or: return 40;

			default: return -1;
		}
	}

	static bool is_regular_binary_op(TokenType tok)
	{
		return util::is_one_of(tok, TT::Plus, TT::Minus, TT::Asterisk, TT::Slash, TT::Percent);
	}

	static bool is_comparison_op(TokenType tok)
	{
		return util::is_one_of(tok, TT::LAngle, TT::RAngle, TT::LAngleEqual, TT::RAngleEqual, TT::EqualEqual,
		    TT::ExclamationEqual);
	}

	static bool is_logical_binary_op(TokenType tok)
	{
		return util::is_one_of(tok, TT::KW_And, TT::KW_Or);
	}

	static ast::BinaryOp::Op convert_binop(TokenType tok)
	{
		switch(tok)
		{
			case TT::Plus: return ast::BinaryOp::Add;
			case TT::Minus: return ast::BinaryOp::Subtract;
			case TT::Asterisk: return ast::BinaryOp::Multiply;
			case TT::Slash: return ast::BinaryOp::Divide;
			case TT::Percent: return ast::BinaryOp::Modulo;
			default: snip::internal_error("not a binary operator");
		}
	}

	static ast::LogicalBinOp::Op convert_logical_binop(TokenType tok)
	{
		switch(tok)
		{
			case TT::KW_And: return ast::LogicalBinOp::Op::And;
			case TT::KW_Or: return ast::LogicalBinOp::Op::Or;
			default: snip::internal_error("not a logical operator");
		}
	}

	static ast::ComparisonOp::Op convert_comparison_op(TokenType tok)
	{
		switch(tok)
		{
			case TT::LAngle: return ast::ComparisonOp::LT;
			case TT::RAngle: return ast::ComparisonOp::GT;
			case TT::LAngleEqual: return ast::ComparisonOp::LE;
			case TT::RAngleEqual: return ast::ComparisonOp::GE;
			case TT::EqualEqual: return ast::ComparisonOp::EQ;
			case TT::ExclamationEqual: return ast::ComparisonOp::NE;
			default: snip::internal_error("not a comparison operator");
		}
	}

	static ErrorOrUniquePtr<ast::Expr> parse_rhs(Lexer& lexer, std::unique_ptr<ast::Expr> lhs, int prio)
	{
		if(lexer.eof())
			return Ok(std::move(lhs));

		while(true)
		{
			int prec = get_front_token_precedence(lexer);
			if(prec < prio)
				return Ok(std::move(lhs));

			auto op_tok = TRY(lexer.next());

			auto rhs = TRY(parse_unary(lexer));
			int next = get_front_token_precedence(lexer);

			if(next > prec)
				rhs = TRY(parse_rhs(lexer, std::move(rhs), prec + 1));

			if(is_comparison_op(op_tok))
			{
				auto tmp = std::make_unique<ast::ComparisonOp>(op_tok.loc);
				tmp->lhs = std::move(lhs);
				tmp->rhs = std::move(rhs);
				tmp->op = convert_comparison_op(op_tok);

				lhs = std::move(tmp);
			}
			else if(is_regular_binary_op(op_tok))
			{
				auto tmp = std::make_unique<ast::BinaryOp>(op_tok.loc);
				tmp->lhs = std::move(lhs);
				tmp->rhs = std::move(rhs);
				tmp->op = convert_binop(op_tok);

				lhs = std::move(tmp);
			}
			else if(is_logical_binary_op(op_tok))
			{
				auto tmp = std::make_unique<ast::LogicalBinOp>(op_tok.loc);
				tmp->lhs = std::move(lhs);
				tmp->rhs = std::move(rhs);
				tmp->op = convert_logical_binop(op_tok);

				lhs = std::move(tmp);
			}
			else if(op_tok == TT::KW_In)
			{
				auto tmp = std::make_unique<ast::InOp>(op_tok.loc);
				tmp->needle = std::move(lhs);
				tmp->haystack = std::move(rhs);

				lhs = std::move(tmp);
			}
			else
			{
				return ErrMsg(op_tok.loc, "unknown operator '{}'", op_tok.text);
			}
		}
	}

	static ErrorOr<std::vector<std::unique_ptr<ast::Expr>>> parse_call_args(Lexer& lexer)
	{
		// the open paren was already consumed
		std::vector<std::unique_ptr<ast::Expr>> args {};
		while(true)
		{
			if(lexer.expect(TT::RParen))
				break;

			args.push_back(TRY(parse_expr(lexer)));

			if(lexer.expect(TT::Comma))
				continue;

			TRY(expect_token(lexer, TT::RParen, "')' or ','"));
			break;
		}

		return Ok(std::move(args));
	}

	static ErrorOrUniquePtr<ast::Expr> parse_subscripts(Lexer& lexer, std::unique_ptr<ast::Expr> lhs)
	{
		while(lexer.peek() == TT::LSquare)
		{
			auto open = TRY(lexer.next());

			auto op = std::make_unique<ast::SubscriptOp>(open.loc);
			op->container = std::move(lhs);
			op->index = TRY(parse_expr(lexer));

			TRY(expect_token(lexer, TT::RSquare, "']'"));
			lhs = std::move(op);
		}

		return Ok(std::move(lhs));
	}

	static ErrorOrUniquePtr<ast::Expr> parse_array_literal(Lexer& lexer, const Location& loc)
	{
		auto ret = std::make_unique<ast::ArrayLit>(loc);
		while(true)
		{
			if(lexer.expect(TT::RSquare))
				break;

			ret->elements.push_back(TRY(parse_expr(lexer)));

			if(lexer.expect(TT::Comma))
				continue;

			TRY(expect_token(lexer, TT::RSquare, "']' or ','"));
			break;
		}

		return Ok(std::move(ret));
	}

	static ErrorOrUniquePtr<ast::Expr> parse_hash_literal(Lexer& lexer, const Location& loc)
	{
		auto ret = std::make_unique<ast::HashLit>(loc);
		while(true)
		{
			if(lexer.expect(TT::RBrace))
				break;

			auto key = TRY(parse_expr(lexer));
			TRY(expect_token(lexer, TT::FatArrow, "'=>'"));
			auto value = TRY(parse_expr(lexer));

			ret->entries.emplace_back(std::move(key), std::move(value));

			if(lexer.expect(TT::Comma))
				continue;

			TRY(expect_token(lexer, TT::RBrace, "'}' or ','"));
			break;
		}

		return Ok(std::move(ret));
	}

	static ErrorOrUniquePtr<ast::Expr> parse_primary(Lexer& lexer)
	{
		auto tok = TRY(peek_token(lexer));
		switch(tok.type)
		{
			case TT::String: {
				lexer.next();
				return parse_double_quoted(tok);
			}

			case TT::SingleString: {
				lexer.next();
				return Ok(std::make_unique<ast::StringLit>(tok.loc, unescape_single_quoted(tok.text)));
			}

			case TT::Number: {
				lexer.next();
				return Ok(TRY(parse_number(tok)));
			}

			case TT::KW_True:
			case TT::KW_False: {
				lexer.next();
				return Ok(std::make_unique<ast::BooleanLit>(tok.loc, tok == TT::KW_True));
			}

			case TT::KW_Undef: {
				lexer.next();
				return Ok(std::make_unique<ast::UndefLit>(tok.loc));
			}

			case TT::Variable: {
				lexer.next();
				return parse_subscripts(lexer, std::make_unique<ast::VariableRef>(tok.loc, tok.str()));
			}

			case TT::LSquare: {
				lexer.next();
				return parse_subscripts(lexer, TRY(parse_array_literal(lexer, tok.loc)));
			}

			case TT::LBrace: {
				lexer.next();
				return parse_subscripts(lexer, TRY(parse_hash_literal(lexer, tok.loc)));
			}

			case TT::LParen: {
				lexer.next();
				auto inside = TRY(parse_expr(lexer));
				TRY(expect_token(lexer, TT::RParen, "')'"));

				return parse_subscripts(lexer, std::move(inside));
			}

			case TT::Identifier: {
				lexer.next();
				if(lexer.expect(TT::LParen))
				{
					auto call = std::make_unique<ast::FunctionCall>(tok.loc);
					call->name = tok.str();
					call->arguments = TRY(parse_call_args(lexer));
					call->is_statement = false;

					return parse_subscripts(lexer, std::move(call));
				}
				else if(isupper(tok.text[0]) && lexer.expect(TT::LSquare))
				{
					auto ref = std::make_unique<ast::ResourceRef>(tok.loc);
					ref->type_name = tok.str();

					while(true)
					{
						ref->titles.push_back(TRY(parse_expr(lexer)));
						if(lexer.expect(TT::Comma))
							continue;

						TRY(expect_token(lexer, TT::RSquare, "']' or ','"));
						break;
					}

					return Ok(std::move(ref));
				}

				return Ok(std::make_unique<ast::BareWord>(tok.loc, tok.str()));
			}

			case TT::EndOfFile: return ErrMsg(tok.loc, "unexpected end of file");

			default: return ErrMsg(tok.loc, "invalid start of expression {}", token_description(tok));
		}
	}

	static ErrorOrUniquePtr<ast::Expr> parse_unary(Lexer& lexer)
	{
		if(auto t = lexer.peek(); t == TT::Exclamation || t == TT::Minus)
		{
			lexer.next();

			auto ret = std::make_unique<ast::UnaryOp>(t.loc);
			ret->op = (t == TT::Exclamation ? ast::UnaryOp::Not : ast::UnaryOp::Negate);
			ret->expr = TRY(parse_unary(lexer));

			return Ok(std::move(ret));
		}

		return parse_primary(lexer);
	}

	static ErrorOrUniquePtr<ast::Expr> parse_expr(Lexer& lexer)
	{
		auto lhs = TRY(parse_unary(lexer));
		return parse_rhs(lexer, std::move(lhs), 0);
	}





	static ErrorOrUniquePtr<ast::Block> parse_block(Lexer& lexer)
	{
		auto open = TRY(expect_token(lexer, TT::LBrace, "'{'"));
		auto block = std::make_unique<ast::Block>(open.loc);

		while(true)
		{
			auto tok = TRY(peek_token(lexer));
			if(tok == TT::RBrace)
			{
				lexer.next();
				break;
			}
			else if(tok == TT::EndOfFile)
			{
				return ErrMsg(open.loc, "unterminated block (expected '}')");
			}

			block->body.push_back(TRY(parse_stmt(lexer)));
		}

		return Ok(std::move(block));
	}

	static ErrorOrUniquePtr<ast::IfStmt> parse_if_stmt(Lexer& lexer)
	{
		auto kw = TRY(lexer.next());
		assert(kw == TT::KW_If || kw == TT::KW_Elsif || kw == TT::KW_Unless);

		auto ret = std::make_unique<ast::IfStmt>(kw.loc);
		ret->is_unless = (kw == TT::KW_Unless);
		ret->if_cond = TRY(parse_expr(lexer));
		ret->if_body = TRY(parse_block(lexer));

		if(auto t = lexer.peek(); t == TT::KW_Elsif)
		{
			if(ret->is_unless)
				return ErrMsg(t.loc, "'unless' cannot have 'elsif' branches");

			auto else_block = std::make_unique<ast::Block>(t.loc);
			else_block->body.push_back(TRY(parse_if_stmt(lexer)));

			ret->else_body = std::move(else_block);
		}
		else if(lexer.expect(TT::KW_Else))
		{
			ret->else_body = TRY(parse_block(lexer));
		}

		return Ok(std::move(ret));
	}

	static ErrorOrUniquePtr<ast::CaseStmt> parse_case_stmt(Lexer& lexer)
	{
		auto kw = TRY(lexer.next());
		assert(kw == TT::KW_Case);

		auto ret = std::make_unique<ast::CaseStmt>(kw.loc);
		ret->expr = TRY(parse_expr(lexer));

		TRY(expect_token(lexer, TT::LBrace, "'{'"));
		while(true)
		{
			auto tok = TRY(peek_token(lexer));
			if(tok == TT::RBrace)
			{
				lexer.next();
				break;
			}
			else if(tok == TT::EndOfFile)
			{
				return ErrMsg(kw.loc, "unterminated case statement (expected '}')");
			}

			auto c = ast::CaseStmt::Case { .loc = tok.loc };
			while(true)
			{
				if(lexer.peek() == TT::KW_Default)
				{
					lexer.next();
					c.is_default = true;
				}
				else
				{
					c.matches.push_back(TRY(parse_expr(lexer)));
				}

				if(lexer.expect(TT::Comma))
					continue;

				TRY(expect_token(lexer, TT::Colon, "':' or ','"));
				break;
			}

			c.body = TRY(parse_block(lexer));
			ret->cases.push_back(std::move(c));
		}

		return Ok(std::move(ret));
	}

	static ErrorOrUniquePtr<ast::ResourceDecl> parse_resource_decl(Lexer& lexer)
	{
		auto type = TRY(lexer.next());
		assert(type == TT::Identifier);

		if(isupper(type.text[0]))
			return ErrMsg(type.loc, "resource defaults ('{}') are not supported", type.text);

		auto ret = std::make_unique<ast::ResourceDecl>(type.loc);
		ret->type_name = type.str();

		auto open = TRY(expect_token(lexer, TT::LBrace, "'{'"));
		while(true)
		{
			auto tok = TRY(peek_token(lexer));
			if(tok == TT::RBrace)
			{
				lexer.next();
				break;
			}
			else if(tok == TT::EndOfFile)
			{
				return ErrMsg(open.loc, "unterminated resource declaration (expected '}')");
			}

			auto body = ast::ResourceDecl::Body { .loc = tok.loc };
			body.title = TRY(parse_expr(lexer));

			TRY(expect_token(lexer, TT::Colon, "':' after resource title"));

			while(true)
			{
				auto attr = TRY(peek_token(lexer));
				if(attr == TT::Semicolon || attr == TT::RBrace)
					break;

				if(not is_word_token(attr))
					return ErrMsg(attr.loc, "expected attribute name, found {}", token_description(attr));

				lexer.next();
				TRY(expect_token(lexer, TT::FatArrow, "'=>'"));

				body.attributes.push_back(ast::ResourceDecl::Attribute {
				    .loc = attr.loc,
				    .name = attr.str(),
				    .value = TRY(parse_expr(lexer)),
				});

				if(not lexer.expect(TT::Comma))
					break;
			}

			ret->bodies.push_back(std::move(body));

			// bodies are separated by ';', and the last one may have one too
			if(lexer.expect(TT::Semicolon))
				continue;

			TRY(expect_token(lexer, TT::RBrace, "'}' or ';'"));
			break;
		}

		if(ret->bodies.empty())
			return ErrMsg(ret->loc(), "resource declaration for '{}' has no titles", ret->type_name);

		return Ok(std::move(ret));
	}

	static ErrorOr<std::vector<ast::Definition::Param>> parse_params(Lexer& lexer)
	{
		std::vector<ast::Definition::Param> params {};
		if(not lexer.expect(TT::LParen))
			return Ok(std::move(params));

		while(true)
		{
			if(lexer.expect(TT::RParen))
				break;

			auto var = TRY(expect_token(lexer, TT::Variable, "parameter name"));
			if(var.text.find(':') != std::string::npos)
				return ErrMsg(var.loc, "parameter name '{}' cannot be qualified", var.text);

			auto param = ast::Definition::Param { .loc = var.loc, .name = var.str() };

			for(auto& p : params)
			{
				if(p.name == param.name)
					return ErrMsg(var.loc, "duplicate parameter '${}'", param.name);
			}

			if(lexer.expect(TT::Equal))
				param.default_value = TRY(parse_expr(lexer));

			params.push_back(std::move(param));

			if(lexer.expect(TT::Comma))
				continue;

			TRY(expect_token(lexer, TT::RParen, "')' or ','"));
			break;
		}

		return Ok(std::move(params));
	}

	static ErrorOrUniquePtr<ast::Definition> parse_definition(Lexer& lexer)
	{
		auto kw = TRY(lexer.next());
		assert(kw == TT::KW_Define || kw == TT::KW_Class);

		auto name = TRY(expect_token(lexer, TT::Identifier, kw == TT::KW_Class ? "class name" : "definition name"));

		std::unique_ptr<ast::Definition> defn {};
		if(kw == TT::KW_Define)
		{
			defn = std::make_unique<ast::DefineDefn>(name.loc);
			defn->name = name.str();
			defn->params = TRY(parse_params(lexer));
		}
		else
		{
			auto cls = std::make_unique<ast::ClassDefn>(name.loc);
			cls->name = name.str();
			cls->params = TRY(parse_params(lexer));

			if(lexer.expect(TT::KW_Inherits))
				cls->parent_class = TRY(expect_token(lexer, TT::Identifier, "parent class name")).str();

			defn = std::move(cls);
		}

		defn->body = TRY(parse_block(lexer));
		return Ok(std::move(defn));
	}

	static ErrorOrUniquePtr<ast::Stmt> parse_stmt(Lexer& lexer)
	{
		auto tok = TRY(peek_token(lexer));
		std::unique_ptr<ast::Stmt> stmt {};

		switch(tok.type)
		{
			case TT::KW_If:
			case TT::KW_Unless: stmt = TRY(parse_if_stmt(lexer)); break;

			case TT::KW_Case: stmt = TRY(parse_case_stmt(lexer)); break;

			case TT::KW_Define:
			case TT::KW_Class:
				return ErrMsg(tok.loc, "'{}' is only allowed at the top level of a file", tok.text);

			case TT::KW_Node: return ErrMsg(tok.loc, "node definitions are not supported");

			case TT::KW_Elsif:
			case TT::KW_Else: return ErrMsg(tok.loc, "'{}' without a preceding 'if'", tok.text);

			case TT::Variable: {
				lexer.next();
				if(tok.text.find(':') != std::string::npos)
					return ErrMsg(tok.loc, "cannot assign to qualified variable '${}'", tok.text);

				auto eq = TRY(expect_token(lexer, TT::Equal, "'=' after variable"));

				auto assign = std::make_unique<ast::VariableAssign>(eq.loc);
				assign->name = tok.str();
				assign->value = TRY(parse_expr(lexer));

				stmt = std::move(assign);
				break;
			}

			case TT::Identifier: {
				auto saved = lexer.save();
				lexer.next();

				auto after = lexer.peek();
				if(after == TT::LBrace)
				{
					lexer.rewind(saved);
					stmt = TRY(parse_resource_decl(lexer));
					break;
				}

				auto call = std::make_unique<ast::FunctionCall>(tok.loc);
				call->name = tok.str();
				call->is_statement = true;

				if(lexer.expect(TT::LParen))
				{
					call->arguments = TRY(parse_call_args(lexer));
				}
				else
				{
					// `include foo, bar` without parentheses
					while(true)
					{
						call->arguments.push_back(TRY(parse_expr(lexer)));
						if(not lexer.expect(TT::Comma))
							break;
					}
				}

				stmt = std::move(call);
				break;
			}

			case TT::EndOfFile: return ErrMsg(tok.loc, "unexpected end of file");

			default: return ErrMsg(tok.loc, "expected a statement, found {}", token_description(tok));
		}

		// semicolons between statements are optional
		while(lexer.expect(TT::Semicolon))
			;

		return Ok(std::move(stmt));
	}

	ErrorOr<std::unique_ptr<ast::Unit>> parseUnit(zst::str_view filename, zst::str_view contents)
	{
		auto lexer = Lexer(filename, contents);
		auto unit = std::make_unique<ast::Unit>(filename.str());

		while(true)
		{
			auto tok = TRY(peek_token(lexer));
			if(tok == TT::EndOfFile)
				break;

			if(tok == TT::KW_Define || tok == TT::KW_Class)
			{
				// `class { 'foo': }` is a resource-style class declaration, which we don't do
				auto saved = lexer.save();
				lexer.next();
				if(lexer.peek() == TT::LBrace)
					return ErrMsg(tok.loc, "resource-style class declarations are not supported; use 'include'");

				lexer.rewind(saved);
				unit->definitions.push_back(TRY(parse_definition(lexer)));

				while(lexer.expect(TT::Semicolon))
					;
			}
			else
			{
				unit->statements.push_back(TRY(parse_stmt(lexer)));
			}
		}

		return Ok(std::move(unit));
	}
}
