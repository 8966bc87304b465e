// ast.h
// Copyright (c) 2022, yuki / zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>
#include <vector>
#include <variant>
#include <optional>

#include "util.h"     // for ErrorOr, Ok, TRY
#include "location.h" // for Location

namespace snip::interp
{
	struct Value;
	struct Scope;
	struct Evaluator;
	struct EvalResult;
}

namespace snip::interp::ast
{
	struct Stmt
	{
		explicit Stmt(Location loc) : m_location(std::move(loc)) { }

		virtual ~Stmt();
		virtual ErrorOr<EvalResult> evaluate_impl(Evaluator* ev) const = 0;

		[[nodiscard]] virtual ErrorOr<EvalResult> evaluate(Evaluator* ev) const;

		const Location& loc() const { return m_location; }

	protected:
		Location m_location;
	};

	struct Expr : Stmt
	{
		explicit Expr(Location loc) : Stmt(std::move(loc)) { }
	};

	struct UndefLit : Expr
	{
		explicit UndefLit(Location loc) : Expr(std::move(loc)) { }

		virtual ErrorOr<EvalResult> evaluate_impl(Evaluator* ev) const override;
	};

	struct BooleanLit : Expr
	{
		explicit BooleanLit(Location loc, bool value_) : Expr(std::move(loc)), value(value_) { }

		virtual ErrorOr<EvalResult> evaluate_impl(Evaluator* ev) const override;

		bool value;
	};

	struct NumberLit : Expr
	{
		explicit NumberLit(Location loc) : Expr(std::move(loc)) { }

		virtual ErrorOr<EvalResult> evaluate_impl(Evaluator* ev) const override;

		bool is_floating = false;
		int64_t int_value = 0;
		double float_value = 0;
	};

	struct StringLit : Expr
	{
		explicit StringLit(Location loc, std::string str) : Expr(std::move(loc)), string(std::move(str)) { }

		virtual ErrorOr<EvalResult> evaluate_impl(Evaluator* ev) const override;

		std::string string;
	};

	// a double-quoted string containing at least one `$var` or `${expr}`
	struct InterpolatedString : Expr
	{
		explicit InterpolatedString(Location loc) : Expr(std::move(loc)) { }

		virtual ErrorOr<EvalResult> evaluate_impl(Evaluator* ev) const override;

		std::vector<std::variant<std::string, std::unique_ptr<Expr>>> parts;
	};

	struct ArrayLit : Expr
	{
		explicit ArrayLit(Location loc) : Expr(std::move(loc)) { }

		virtual ErrorOr<EvalResult> evaluate_impl(Evaluator* ev) const override;

		std::vector<std::unique_ptr<Expr>> elements;
	};

	struct HashLit : Expr
	{
		explicit HashLit(Location loc) : Expr(std::move(loc)) { }

		virtual ErrorOr<EvalResult> evaluate_impl(Evaluator* ev) const override;

		std::vector<std::pair<std::unique_ptr<Expr>, std::unique_ptr<Expr>>> entries;
	};

	// unquoted words in value position evaluate to themselves
	struct BareWord : Expr
	{
		explicit BareWord(Location loc, std::string name_) : Expr(std::move(loc)), name(std::move(name_)) { }

		virtual ErrorOr<EvalResult> evaluate_impl(Evaluator* ev) const override;

		std::string name;
	};

	// `Package['x']`, which evaluates to the string "Package[x]" (or an array of them)
	struct ResourceRef : Expr
	{
		explicit ResourceRef(Location loc) : Expr(std::move(loc)) { }

		virtual ErrorOr<EvalResult> evaluate_impl(Evaluator* ev) const override;

		std::string type_name;
		std::vector<std::unique_ptr<Expr>> titles;
	};

	struct VariableRef : Expr
	{
		explicit VariableRef(Location loc, std::string name_) : Expr(std::move(loc)), name(std::move(name_)) { }

		virtual ErrorOr<EvalResult> evaluate_impl(Evaluator* ev) const override;

		std::string name;
	};

	struct SubscriptOp : Expr
	{
		explicit SubscriptOp(Location loc) : Expr(std::move(loc)) { }

		virtual ErrorOr<EvalResult> evaluate_impl(Evaluator* ev) const override;

		std::unique_ptr<Expr> container;
		std::unique_ptr<Expr> index;
	};

	struct UnaryOp : Expr
	{
		explicit UnaryOp(Location loc) : Expr(std::move(loc)) { }

		virtual ErrorOr<EvalResult> evaluate_impl(Evaluator* ev) const override;

		enum Op
		{
			Not,
			Negate,
		};

		Op op;
		std::unique_ptr<Expr> expr;
	};

	struct BinaryOp : Expr
	{
		explicit BinaryOp(Location loc) : Expr(std::move(loc)) { }

		virtual ErrorOr<EvalResult> evaluate_impl(Evaluator* ev) const override;

		enum Op
		{
			Add,
			Subtract,
			Multiply,
			Divide,
			Modulo,
		};

		std::unique_ptr<Expr> lhs;
		std::unique_ptr<Expr> rhs;
		Op op;
	};

	struct ComparisonOp : Expr
	{
		explicit ComparisonOp(Location loc) : Expr(std::move(loc)) { }

		virtual ErrorOr<EvalResult> evaluate_impl(Evaluator* ev) const override;

		enum Op
		{
			EQ,
			NE,
			LT,
			GT,
			LE,
			GE,
		};

		std::unique_ptr<Expr> lhs;
		std::unique_ptr<Expr> rhs;
		Op op;
	};

	struct LogicalBinOp : Expr
	{
		explicit LogicalBinOp(Location loc) : Expr(std::move(loc)) { }

		virtual ErrorOr<EvalResult> evaluate_impl(Evaluator* ev) const override;

		enum class Op
		{
			And,
			Or,
		};

		std::unique_ptr<Expr> lhs;
		std::unique_ptr<Expr> rhs;
		Op op;
	};

	// `x in y`: substring, array membership, or hash key
	struct InOp : Expr
	{
		explicit InOp(Location loc) : Expr(std::move(loc)) { }

		virtual ErrorOr<EvalResult> evaluate_impl(Evaluator* ev) const override;

		std::unique_ptr<Expr> needle;
		std::unique_ptr<Expr> haystack;
	};

	struct FunctionCall : Expr
	{
		explicit FunctionCall(Location loc) : Expr(std::move(loc)) { }

		virtual ErrorOr<EvalResult> evaluate_impl(Evaluator* ev) const override;

		std::string name;
		std::vector<std::unique_ptr<Expr>> arguments;

		// whether the call appeared in statement position
		bool is_statement = false;
	};

	struct Block : Stmt
	{
		explicit Block(Location loc) : Stmt(std::move(loc)) { }

		virtual ErrorOr<EvalResult> evaluate_impl(Evaluator* ev) const override;

		std::vector<std::unique_ptr<Stmt>> body;
	};

	struct VariableAssign : Stmt
	{
		explicit VariableAssign(Location loc) : Stmt(std::move(loc)) { }

		virtual ErrorOr<EvalResult> evaluate_impl(Evaluator* ev) const override;

		std::string name;
		std::unique_ptr<Expr> value;
	};

	// also handles `unless`, which has no `elsif` arms
	struct IfStmt : Stmt
	{
		explicit IfStmt(Location loc) : Stmt(std::move(loc)) { }

		virtual ErrorOr<EvalResult> evaluate_impl(Evaluator* ev) const override;

		bool is_unless = false;
		std::unique_ptr<Expr> if_cond;
		std::unique_ptr<Block> if_body;

		// `elsif` is represented as another IfStmt inside the else block
		std::unique_ptr<Block> else_body;
	};

	struct CaseStmt : Stmt
	{
		explicit CaseStmt(Location loc) : Stmt(std::move(loc)) { }

		virtual ErrorOr<EvalResult> evaluate_impl(Evaluator* ev) const override;

		struct Case
		{
			Location loc;
			bool is_default = false;
			std::vector<std::unique_ptr<Expr>> matches;
			std::unique_ptr<Block> body;
		};

		std::unique_ptr<Expr> expr;
		std::vector<Case> cases;
	};

	struct ResourceDecl : Stmt
	{
		explicit ResourceDecl(Location loc) : Stmt(std::move(loc)) { }

		virtual ErrorOr<EvalResult> evaluate_impl(Evaluator* ev) const override;

		struct Attribute
		{
			Location loc;
			std::string name;
			std::unique_ptr<Expr> value;
		};

		struct Body
		{
			Location loc;
			std::unique_ptr<Expr> title;
			std::vector<Attribute> attributes;
		};

		std::string type_name;
		std::vector<Body> bodies;
	};

	/*
	    `define` and `class` are not statements; they never run in place. The parser
	    collects them into the unit, and they get registered with the environment once
	    the whole unit has parsed.
	*/
	struct Definition
	{
		enum class Kind
		{
			Define,
			Class,
		};

		struct Param
		{
			Location loc;
			std::string name;
			std::unique_ptr<Expr> default_value;
		};

		Definition(Location loc, Kind kind) : m_location(std::move(loc)), m_kind(kind) { }
		virtual ~Definition();

		Kind kind() const { return m_kind; }
		const Location& loc() const { return m_location; }

		bool isClass() const { return m_kind == Kind::Class; }
		bool isDefine() const { return m_kind == Kind::Define; }

		const char* kindString() const { return this->isClass() ? "class" : "defined type"; }

		const Param* lookupParam(zst::str_view name) const;

		/*
		    binds parameters into the evaluator's current scope: supplied values first, then
		    defaults (evaluated in that scope, so a default may refer to an earlier parameter),
		    and errors out on unknown or missing parameters.
		*/
		ErrorOr<void> bindParameters(Evaluator* ev,
		    std::vector<std::pair<std::string, Value>> args,
		    const Location& call_site) const;

		std::string name;
		std::vector<Param> params;
		std::unique_ptr<Block> body;

	private:
		Location m_location;
		Kind m_kind;
	};

	struct DefineDefn : Definition
	{
		explicit DefineDefn(Location loc) : Definition(std::move(loc), Kind::Define) { }
	};

	struct ClassDefn : Definition
	{
		explicit ClassDefn(Location loc) : Definition(std::move(loc), Kind::Class) { }

		std::optional<std::string> parent_class;
	};

	// numbers, and strings that spell one; anything else is an error
	ErrorOr<Value> toNumber(Evaluator* ev, const Value& value);

	struct Unit
	{
		explicit Unit(std::string filename_) : filename(std::move(filename_)) { }

		std::string filename;
		std::vector<std::unique_ptr<Stmt>> statements;
		std::vector<std::unique_ptr<Definition>> definitions;
	};
}
