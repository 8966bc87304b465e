// test-parser.cpp
// Copyright (c) 2024, yuki
// SPDX-License-Identifier: Apache-2.0

#include "tester.h"

#include "snip/frontend.h"

#include "interp/ast.h"

namespace test
{
	// `filename` and `contents` must outlive the result, since locations point into them
	static snip::ErrorOr<std::unique_ptr<snip::interp::ast::Unit>> parse_file(const std::string& filename,
	    zst::unique_span<uint8_t[]>& contents)
	{
		auto file = util::readEntireFile(filename);
		if(file.is_err())
			return snip::ErrMsg(snip::ErrorKind::FileNotFound, snip::Location::builtin(), "{}", file.error());

		contents = file.take_value();
		return snip::frontend::parseUnit(filename, zst::str_view((const char*) contents.get(), contents.size()));
	}

	static void run_test(Context& ctx, const stdfs::path& test)
	{
		auto filename = test.string();
		auto contents = zst::unique_span<uint8_t[]>();
		auto unit = parse_file(filename, contents);

		if(unit.is_err())
		{
			zpr::println("  {}: {}", test.filename().string(), unit.error().string());
			return ctx.failed++, void();
		}

		ctx.passed++;
	}

	static void run_error_test(Context& ctx, const stdfs::path& test)
	{
		auto filename = test.string();
		auto contents = zst::unique_span<uint8_t[]>();
		auto unit = parse_file(filename, contents);

		if(not check(ctx, unit.is_err(), "{}: parsed, but should not have", test.filename().string()))
			return;

		auto& err = unit.error();
		check(ctx, err.kind() == snip::ErrorKind::Syntax, "{}: expected a syntax error, got '{}'",
		    test.filename().string(), snip::errorKindToString(err.kind()));

		check(ctx, err.location().filename == filename, "{}: error does not name the file ('{}')",
		    test.filename().string(), err.location().filename);
	}

	static void test_parse_structure(Context& ctx)
	{
		auto src = zst::str_view(R"(
			$x = 1
			define foo::bar($a, $b = 2) { notice($a) }
			class foo inherits base { $y = [1, 2] }
			include foo, bar
			file { '/tmp/x': ensure => present; '/tmp/y': }
		)");

		auto unit = snip::frontend::parseUnit("structure.pp", src);
		if(not check(ctx, unit.ok(), "structure.pp failed to parse: {}", unit.is_err() ? unit.error().string() : ""))
			return;

		check(ctx, unit->get()->statements.size() == 3, "expected 3 statements, got {}", unit->get()->statements.size());
		check(ctx, unit->get()->definitions.size() == 2, "expected 2 definitions, got {}",
		    unit->get()->definitions.size());

		if(unit->get()->definitions.size() == 2)
		{
			auto& defn = unit->get()->definitions[0];
			check(ctx, defn->isDefine() && defn->name == "foo::bar", "first definition should be 'define foo::bar'");
			check(ctx, defn->params.size() == 2 && defn->params[1].default_value != nullptr,
			    "foo::bar should have two parameters, the second with a default");

			auto cls = dynamic_cast<snip::interp::ast::ClassDefn*>(unit->get()->definitions[1].get());
			check(ctx, cls != nullptr && cls->parent_class == "base", "class foo should inherit from 'base'");
		}

		// the paren-less `include foo, bar` is a statement call with two arguments
		if(unit->get()->statements.size() == 3)
		{
			auto call = dynamic_cast<snip::interp::ast::FunctionCall*>(unit->get()->statements[1].get());
			check(ctx, call != nullptr && call->is_statement && call->arguments.size() == 2,
			    "'include foo, bar' should be a call with 2 arguments");

			auto res = dynamic_cast<snip::interp::ast::ResourceDecl*>(unit->get()->statements[2].get());
			check(ctx, res != nullptr && res->bodies.size() == 2, "file { } should have two bodies");
		}
	}

	void test_parser(Context& ctx, const stdfs::path& test_dir)
	{
		zpr::println("parser");

		auto test_cases = find_files_ext(test_dir / "lang" / "parser", ".pp");
		check(ctx, not test_cases.empty(), "no parser test cases found in '{}'", (test_dir / "lang" / "parser").string());

		for(auto& tc : test_cases)
			run_test(ctx, tc);

		auto error_cases = find_files_ext(test_dir / "lang" / "parser" / "errors", ".pp");
		check(ctx, not error_cases.empty(), "no parser error cases found");

		for(auto& tc : error_cases)
			run_error_test(ctx, tc);

		test_parse_structure(ctx);
	}
}
