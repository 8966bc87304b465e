// test-include.cpp
// Copyright (c) 2024, yuki
// SPDX-License-Identifier: Apache-2.0

#include "tester.h"

#include "snip/config.h"

#include "interp/interp.h"
#include "interp/include.h"

namespace test
{
	using snip::ErrorKind;
	using snip::interp::Value;
	using snip::interp::Interpreter;

	static Interpreter make_interp(size_t max_depth = snip::interp::DEFAULT_MAX_DEPTH)
	{
		auto settings = snip::config::Settings();
		settings.max_depth = max_depth;

		return Interpreter(settings);
	}

	static const Value* top_var(Interpreter& interp, zst::str_view name)
	{
		return interp.evaluator().topScope()->lookupLocal(name);
	}

	static bool expect_error(Context& ctx, const snip::ErrorOr<void>& result, ErrorKind kind, const char* what)
	{
		if(not check(ctx, result.is_err(), "{}: expected an error", what))
			return false;

		return check(ctx, result.error().kind() == kind, "{}: expected '{}', got '{}' ({})", what,
		    snip::errorKindToString(kind), snip::errorKindToString(result.error().kind()), result.error().string());
	}

	static void test_splice_matches_inline(Context& ctx)
	{
		auto dir = TempDir("splice");
		dir.write("vars.pp", "$a = 'one'\n$b = [1, 'two']\n$c = { 'k' => 'v' }\n");

		auto included = make_interp();
		auto r1 = compile_string(included, dir, "include_file('vars.pp')\n");
		if(not check(ctx, r1.ok(), "including vars.pp failed: {}", r1.is_err() ? r1.error().string() : ""))
			return;

		auto inline_dir = TempDir("splice-inline");
		auto written = make_interp();
		auto r2 = compile_string(written, inline_dir, "$a = 'one'\n$b = [1, 'two']\n$c = { 'k' => 'v' }\n");
		if(not check(ctx, r2.ok(), "inline version failed: {}", r2.is_err() ? r2.error().string() : ""))
			return;

		for(auto name : { "a", "b", "c" })
		{
			auto x = top_var(included, name);
			auto y = top_var(written, name);

			if(check(ctx, x != nullptr, "${} is not visible after include_file", name) && y != nullptr)
				check(ctx, x->equals(*y), "${}: included {} != inline {}", name, x->serialise(), y->serialise());
		}
	}

	static void test_splice_into_given_scope(Context& ctx)
	{
		auto dir = TempDir("scope");
		dir.write("vars.pp", "$a = 'one'\n");

		auto interp = make_interp();
		auto& ev = interp.evaluator();

		auto scope = std::make_shared<snip::interp::Scope>("caller", ev.topScope());
		auto caller = snip::interp::CallerContext {
			.file = (dir.path() / "caller.pp").string(),
			.line = 1,
			.environment = &interp.environment(),
			.scope = scope,
		};

		auto r = snip::interp::includeFile(&ev, "vars.pp", caller);
		if(not check(ctx, r.ok(), "includeFile failed: {}", r.is_err() ? r.error().string() : ""))
			return;

		auto a = scope->lookupLocal("a");
		check(ctx, a != nullptr && a->isString() && a->getString() == "one", "$a did not land in the caller's scope");
		check(ctx, ev.topScope()->lookupLocal("a") == nullptr, "$a leaked into the parent scope");
		check(ctx, ev.scope() == ev.topScope(), "scope stack was not restored");
		check(ctx, ev.depth() == 0, "nesting depth was not restored");
	}

	static void test_failures_leave_scope_alone(Context& ctx)
	{
		auto dir = TempDir("failures");
		dir.write("empty.pp", "");
		dir.write("broken.pp", "$x = 1\n$y = = 2\n");

		struct Case
		{
			const char* manifest;
			ErrorKind kind;
			const char* what;
		};

		auto cases = {
			Case { "$before = 1\ninclude_file('missing.pp')\n$after = 2\n", ErrorKind::FileNotFound, "missing file" },
			Case { "$before = 1\ninclude_file('empty.pp')\n$after = 2\n", ErrorKind::EmptyFile, "empty file" },
			Case { "$before = 1\ninclude_file('broken.pp')\n$after = 2\n", ErrorKind::Syntax, "syntax error" },
			Case { "$before = 1\ninclude_file('.')\n$after = 2\n", ErrorKind::FileNotFound, "directory" },
			Case { "$before = 1\ninclude_file('')\n$after = 2\n", ErrorKind::InvalidPath, "empty path" },
		};

		for(auto& c : cases)
		{
			auto interp = make_interp();
			auto r = compile_string(interp, dir, c.manifest);
			if(not expect_error(ctx, r, c.kind, c.what))
				continue;

			// $environment, $manifest and $before
			auto& top = interp.evaluator().topScope();
			auto names = top->variableNames();
			check(ctx, names == std::vector<std::string> { "before", "environment", "manifest" },
			    "{}: top scope has {} variables, expected 3", c.what, top->size());
			check(ctx, top_var(interp, "before") != nullptr, "{}: statements before the include were undone", c.what);
			check(ctx, top_var(interp, "after") == nullptr, "{}: evaluation continued after the error", c.what);
			check(ctx, top_var(interp, "x") == nullptr, "{}: part of a broken file was evaluated", c.what);
		}

		// the syntax error must point into the included file, not the caller
		auto interp = make_interp();
		auto r = compile_string(interp, dir, "include_file('broken.pp')\n");
		if(r.is_err())
		{
			auto& loc = r.error().location();
			check(ctx, loc.filename == (dir.path() / "broken.pp").string(), "syntax error names '{}', not broken.pp",
			    loc.filename);
			check(ctx, loc.line == 1, "syntax error is on line {}, expected 2", loc.line + 1);
		}
	}

	static void test_partial_effects_stay(Context& ctx)
	{
		auto dir = TempDir("partial");
		dir.write("partial.pp", "$p = 1\nfail('stop here')\n$q = 2\n");

		auto interp = make_interp();
		auto r = compile_string(interp, dir, "include_file('partial.pp')\n");

		expect_error(ctx, r, ErrorKind::Evaluation, "fail() in an included file");
		check(ctx, top_var(interp, "p") != nullptr, "assignments before the failure were rolled back");
		check(ctx, top_var(interp, "q") == nullptr, "evaluation continued after fail()");
	}

	static void test_self_inclusion(Context& ctx)
	{
		auto dir = TempDir("self");
		dir.write("self.pp", "include_file('self.pp')\n");

		auto interp = make_interp(/* max_depth: */ 8);
		auto r = compile_string(interp, dir, "include_file('self.pp')\n");

		if(expect_error(ctx, r, ErrorKind::Evaluation, "self inclusion"))
		{
			check(ctx, r.error().string().find("maximum nesting depth") != std::string::npos,
			    "self inclusion failed for the wrong reason: {}", r.error().string());
		}

		check(ctx, interp.evaluator().depth() == 0, "nesting depth was not unwound after the error");
	}

	static void test_nested_relative_includes(Context& ctx)
	{
		auto dir = TempDir("nested");
		dir.write("sub/inner.pp", "$inner = true\ninclude_file('leaf.pp')\n");
		dir.write("sub/leaf.pp", "$leaf = 'leaf'\n");

		auto interp = make_interp();
		auto r = compile_string(interp, dir, "include_file('sub/inner.pp')\n");

		if(check(ctx, r.ok(), "nested include failed: {}", r.is_err() ? r.error().string() : ""))
		{
			check(ctx, top_var(interp, "inner") != nullptr, "$inner missing");
			check(ctx, top_var(interp, "leaf") != nullptr, "leaf.pp was not resolved relative to sub/inner.pp");

			// main.pp, inner.pp and leaf.pp
			check(ctx, interp.unitParser().numLoadedFiles() == 3, "{} files were loaded, expected 3",
			    interp.unitParser().numLoadedFiles());
		}
	}

	static void test_definitions(Context& ctx)
	{
		auto dir = TempDir("defs");
		dir.write("defs.pp", "define greet($msg) {\n  notify { $title: message => $msg }\n}\n");
		dir.write("baddefs.pp", "define never() { }\n$x = = 1\n");

		auto interp = make_interp();
		auto r = compile_string(interp, dir, "include_file('defs.pp')\ngreet { 'hi': msg => 'hello' }\n");

		if(check(ctx, r.ok(), "using a define from an included file failed: {}", r.is_err() ? r.error().string() : ""))
		{
			check(ctx, interp.environment().numDefinitions() == 1, "expected exactly one definition, got {}",
			    interp.environment().numDefinitions());

			auto res = interp.catalog().find("notify", "hi");
			check(ctx, res != nullptr, "Notify['hi'] was not declared");

			if(res != nullptr)
			{
				auto msg = res->getAttribute("message");
				check(ctx, msg != nullptr && msg->isString() && msg->getString() == "hello", "Notify['hi'] has the wrong message");
			}
		}

		auto interp2 = make_interp();
		auto r2 = compile_string(interp2, dir, "include_file('baddefs.pp')\n");
		expect_error(ctx, r2, ErrorKind::Syntax, "broken file with a define");
		check(ctx, interp2.environment().lookupDefine("never") == nullptr,
		    "definitions from a file that failed to parse were registered");

		// a clash anywhere in a file means none of its definitions are registered
		dir.write("clash.pp", "define fresh() { }\nclass greet { }\ndefine greet($x) { }\n");
		dir.write("twice.pp", "define twice() { }\ndefine twice() { }\n");

		auto interp3 = make_interp();
		auto r3 = compile_string(interp3, dir, "include_file('defs.pp')\ninclude_file('clash.pp')\n");
		if(expect_error(ctx, r3, ErrorKind::Syntax, "redefining a define from another file"))
		{
			check(ctx, interp3.environment().lookupDefine("fresh") == nullptr, "'fresh' was registered before the clash");
			check(ctx, interp3.environment().lookupClass("greet") == nullptr, "class 'greet' was registered before the clash");
			check(ctx, interp3.environment().numDefinitions() == 1, "expected only 'greet' from defs.pp, got {} definitions",
			    interp3.environment().numDefinitions());
		}

		auto interp4 = make_interp();
		auto r4 = compile_string(interp4, dir, "include_file('twice.pp')\n");
		expect_error(ctx, r4, ErrorKind::Syntax, "the same define twice in one file");
		check(ctx, interp4.environment().lookupDefine("twice") == nullptr, "the first of two clashing defines was registered");
	}

	static void test_include_in_define(Context& ctx)
	{
		auto dir = TempDir("define");
		dir.write("metavars.pp", "$metavars = ['foo', 'bar', 'baz']\n");

		// every instance includes the file again, into its own scope
		auto interp = make_interp();
		auto r = compile_string(interp, dir,
		    "define check_meta() {\n"
		    "  include_file('metavars.pp')\n"
		    "  if member($metavars, $name) {\n"
		    "    notify { \"meta-${name}\": }\n"
		    "  } else {\n"
		    "    notify { \"other-${name}\": }\n"
		    "  }\n"
		    "}\n"
		    "check_meta { ['foo', 'qux', 'baz']: }\n");

		if(not check(ctx, r.ok(), "include_file inside a define failed: {}", r.is_err() ? r.error().string() : ""))
			return;

		auto& cat = interp.catalog();
		check(ctx, cat.find("notify", "meta-foo") != nullptr, "Notify['meta-foo'] missing");
		check(ctx, cat.find("notify", "other-qux") != nullptr, "Notify['other-qux'] missing");
		check(ctx, cat.find("notify", "meta-baz") != nullptr, "Notify['meta-baz'] missing");
		check(ctx, cat.size() == 3, "expected 3 resources, got {}", cat.size());
		check(ctx, top_var(interp, "metavars") == nullptr, "$metavars leaked out of the define instances");

		// main.pp and one copy of metavars.pp, however often it was included
		check(ctx, interp.unitParser().numLoadedFiles() == 2, "{} files were loaded, expected 2",
		    interp.unitParser().numLoadedFiles());
		check(ctx, interp.unitParser().numKeptCopies() == 2, "{} copies of file text were kept, expected 2",
		    interp.unitParser().numKeptCopies());
	}

	static void test_repeated_includes(Context& ctx)
	{
		constexpr size_t INSTANCES = 2000;

		auto dir = TempDir("repeat");
		dir.write("v.pp", "$v = 1\n");

		auto titles = std::string();
		for(size_t i = 0; i < INSTANCES; i++)
			titles += zpr::sprint("{}'t{}'", i == 0 ? "" : ", ", i);

		auto interp = make_interp();
		auto r = compile_string(interp, dir, zpr::sprint("define d() {{ include_file('v.pp') }}\nd {{ [{}]: }}\n", titles));

		if(not check(ctx, r.ok(), "including one file {} times failed: {}", INSTANCES, r.is_err() ? r.error().string() : ""))
			return;

		auto& parser = interp.unitParser();
		check(ctx, parser.numKeptCopies() == 2, "{} copies of file text were kept, expected 2", parser.numKeptCopies());

		// new contents under the same path get their own copy, but only once
		dir.write("v.pp", "$w = 2\n");

		auto& ev = interp.evaluator();
		for(int i = 0; i < 2; i++)
		{
			auto caller = snip::interp::CallerContext {
				.file = (dir.path() / "main.pp").string(),
				.line = 1,
				.environment = &interp.environment(),
				.scope = std::make_shared<snip::interp::Scope>("caller", ev.topScope()),
			};

			auto r2 = snip::interp::includeFile(&ev, "v.pp", caller);
			check(ctx, r2.ok(), "including the rewritten v.pp failed: {}", r2.is_err() ? r2.error().string() : "");
			check(ctx, caller.scope->lookupLocal("w") != nullptr, "$w missing after including the rewritten v.pp");
		}

		check(ctx, parser.numLoadedFiles() == 2, "{} files were loaded, expected 2", parser.numLoadedFiles());
		check(ctx, parser.numKeptCopies() == 3, "{} copies of file text were kept, expected 3", parser.numKeptCopies());
	}

	static void test_include_in_class(Context& ctx)
	{
		auto dir = TempDir("class");
		dir.write("vars.pp", "$a = 'one'\n");

		auto interp = make_interp();
		auto r = compile_string(interp, dir, "class c {\n  include_file('vars.pp')\n}\ninclude c\n$z = $c::a\n");

		if(check(ctx, r.ok(), "include_file inside a class failed: {}", r.is_err() ? r.error().string() : ""))
		{
			check(ctx, top_var(interp, "a") == nullptr, "$a leaked out of the class scope");

			auto z = top_var(interp, "z");
			check(ctx, z != nullptr && z->isString() && z->getString() == "one", "$c::a is not the included value");
		}
	}

	static void test_misuse(Context& ctx)
	{
		auto dir = TempDir("misuse");
		dir.write("vars.pp", "$a = 'one'\n");

		auto cases = {
			std::pair { "$x = include_file('vars.pp')\n", "used as a value" },
			std::pair { "include_file()\n", "no arguments" },
			std::pair { "include_file('vars.pp', 'vars.pp')\n", "two arguments" },
			std::pair { "include_file(1)\n", "not a string" },
			std::pair { "$a = 'zero'\ninclude_file('vars.pp')\n", "reassigning a variable" },
		};

		for(auto& [manifest, what] : cases)
		{
			auto interp = make_interp();
			expect_error(ctx, compile_string(interp, dir, manifest), ErrorKind::Evaluation, what);
		}
	}

	void test_include(Context& ctx)
	{
		zpr::println("include_file");

		test_splice_matches_inline(ctx);
		test_splice_into_given_scope(ctx);
		test_failures_leave_scope_alone(ctx);
		test_partial_effects_stay(ctx);
		test_self_inclusion(ctx);
		test_nested_relative_includes(ctx);
		test_definitions(ctx);
		test_include_in_define(ctx);
		test_repeated_includes(ctx);
		test_include_in_class(ctx);
		test_misuse(ctx);
	}
}
