// test-eval.cpp
// Copyright (c) 2024, yuki
// SPDX-License-Identifier: Apache-2.0

#include "tester.h"

#include "snip/config.h"

#include "interp/interp.h"

namespace test
{
	using snip::ErrorKind;
	using snip::interp::Interpreter;

	static Interpreter make_interp(std::vector<std::string> module_paths = {})
	{
		auto settings = snip::config::Settings();
		settings.module_paths = std::move(module_paths);

		return Interpreter(settings);
	}

	// the catalog form of a top-scope variable, so values can be compared as strings
	static std::string top_var(Interpreter& interp, zst::str_view name)
	{
		if(auto v = interp.evaluator().topScope()->lookupLocal(name); v != nullptr)
			return v->serialise();

		return "<unset>";
	}

	struct VarCase
	{
		const char* manifest;
		const char* variable;
		const char* expected;
	};

	static void run_var_cases(Context& ctx, std::initializer_list<VarCase> cases)
	{
		auto dir = TempDir("eval");
		for(auto& c : cases)
		{
			auto interp = make_interp();
			auto r = compile_string(interp, dir, c.manifest);
			if(not check(ctx, r.ok(), "'{}' failed: {}", c.manifest, r.is_err() ? r.error().string() : ""))
				continue;

			auto value = top_var(interp, c.variable);
			check(ctx, value == c.expected, "${}: expected {}, got {}\n    in: {}", c.variable, c.expected, value, c.manifest);
		}
	}

	static void test_expressions(Context& ctx)
	{
		run_var_cases(ctx, {
		    { "$a = 1 + 2 * 3", "a", "7" },
		    { "$a = (1 + 2) * 3 - 10 / 4 % 2", "a", "9" },
		    { "$a = 2.5 * 2", "a", "5.0" },
		    { "$a = '3' + 4", "a", "7" },
		    { "$a = -(2 + 3)", "a", "-5" },
		    { "$a = -7 / 2", "a", "-3" },
		    { "$a = -7 % 3", "a", "-1" },
		    { "$a = 9223372036854775806 + 1", "a", "9223372036854775807" },
		    { "$a = [1, 2] + [3]", "a", "[1, 2, 3]" },
		    { "$a = 'ABC' == 'abc'", "a", "true" },
		    { "$a = '1' == 1", "a", "true" },
		    { "$a = 1 != 1.0", "a", "false" },
		    { "$a = 'b' > 'A'", "a", "true" },
		    { "$a = 2 <= 1 or 3 >= 3 and !false", "a", "true" },
		    { "$a = undef or ''", "a", "false" },
		    { "$a = 'ell' in 'hello'", "a", "true" },
		    { "$a = 'x' in ['a', 'X']", "a", "true" },
		    { "$a = 'k' in { 'k' => 1 }", "a", "true" },
		    { "$arr = [1, 2, 3]\n$a = $arr[-1]", "a", "3" },
		    { "$arr = [1, 2, 3]\n$a = $arr[5]", "a", "undef" },
		    { "$h = { 'k' => ['v'] }\n$a = $h['k'][0]", "a", "'v'" },
		    { "$h = { 'k' => 1, 'k' => 2 }\n$a = $h", "a", "{'k' => 2}" },
		    { "$a = present", "a", "'present'" },
		    { "$a = Package['nginx']", "a", "'Package[nginx]'" },
		    { "$x = 7\n$a = \"x=${x}, x=$x, y=${$x + 1}\\n\"", "a", "'x=7, x=7, y=8\n'" },
		    { "$arr = ['a', 'b']\n$a = \"${arr}\"", "a", "'ab'" },
		    { "$a = 'it\\'s'", "a", "'it\\'s'" },
		    { "$x = 1\n$a = \"$\xc3\xa9 and $x::\xc3\xbc\"", "a", "'$\xc3\xa9 and 1::\xc3\xbc'" },
		});
	}

	static void test_statements(Context& ctx)
	{
		run_var_cases(ctx, {
		    { "$os = 'RedHat'\nif $os == 'debian' { $p = 'apache2' } elsif $os == 'redhat' { $p = 'httpd' } else { $p = 'x' }",
		        "p", "'httpd'" },
		    { "if 0 { $p = 'zero is true' } else { $p = 'no' }", "p", "'zero is true'" },
		    { "unless '' { $p = 'empty is false' }", "p", "'empty is false'" },
		    { "case 'www' { default: { $p = 'default' } 'web', 'WWW': { $p = 'web' } }", "p", "'web'" },
		    { "case 'db' { 'web': { $p = 'web' } default: { $p = 'default' } }", "p", "'default'" },
		    { "$a = member(['a', 'b'], 'b')", "a", "true" },
		    { "$a = join([1, 'b', 2.5], ', ')", "a", "'1, b, 2.5'" },
		    { "$a = join(['x', 'y'])", "a", "'xy'" },
		    { "$x = 1\n$a = defined('$x')", "a", "true" },
		    { "$a = defined('$nope')", "a", "false" },
		    { "$a = defined('file')", "a", "true" },
		    { "define d() { }\n$a = defined('d')", "a", "true" },
		    { "file { '/x': }\n$a = defined(File['/x'])", "a", "true" },
		    { "notice('hello', 1)\nwarning 'careful'\n$a = 1", "a", "1" },
		});
	}

	static void test_classes_and_defines(Context& ctx)
	{
		run_var_cases(ctx, {
		    // inheritance: the parent is evaluated first, and the child's scope sees it
		    { "class base { $v = 1 }\nclass child inherits base { $w = $v + 1 }\ninclude child\n$r = $child::w", "r", "2" },

		    // dynamic scoping: a class sees the scope that included it
		    { "class c { $inner = $outer }\n$outer = 'x'\ninclude c\n$r = $c::inner", "r", "'x'" },

		    // `$::x` always means the top scope
		    { "$x = 'top'\nclass c { $x = 'local'\n$y = $::x }\ninclude c\n$r = $c::y", "r", "'top'" },

		    // class parameters take their defaults
		    { "class c($p = 'dflt') { }\ninclude c\n$r = $c::p", "r", "'dflt'" },

		    // including a class twice evaluates it once
		    { "class c { notify { 'once': } }\ninclude c\ninclude c, c\n$r = 1", "r", "1" },
		});

		auto dir = TempDir("defines");

		{
			auto interp = make_interp();
			auto r = compile_string(interp, dir,
			    "define d($a, $b = \"${a}!\") {\n  notify { $title: message => $b, name => $name }\n}\n"
			    "d { 'x': a => 'hi' }\nd { 'y': a => 'yo', name => 'why' }\n");

			if(check(ctx, r.ok(), "define instances failed: {}", r.is_err() ? r.error().string() : ""))
			{
				auto x = interp.catalog().find("notify", "x");
				auto y = interp.catalog().find("notify", "y");

				if(check(ctx, x != nullptr && y != nullptr, "define bodies did not declare their resources"))
				{
					check(ctx, x->getAttribute("message")->serialise() == "'hi!'", "defaults cannot see earlier parameters");
					check(ctx, x->getAttribute("name")->serialise() == "'x'", "$name should default to the title");
					check(ctx, y->getAttribute("name")->serialise() == "'why'", "$name should be overridable");
				}
			}
		}

		{
			auto interp = make_interp();
			auto r = compile_string(interp, dir,
			    "file { ['/a', '/b']: ensure => present }\n"
			    "file { '/etc/motd': content => 'hello', mode => 420; '/etc/issue': }\n");

			if(check(ctx, r.ok(), "resource declarations failed: {}", r.is_err() ? r.error().string() : ""))
			{
				auto expected = "file { '/a':\n  ensure => 'present',\n}\n"
				                "file { '/b':\n  ensure => 'present',\n}\n"
				                "file { '/etc/motd':\n  content => 'hello',\n  mode => 420,\n}\n"
				                "file { '/etc/issue':\n}\n";

				check(ctx, interp.catalog().resources().size() == 4, "expected 4 resources");

				auto cat = interp.catalog().serialise();
				check(ctx, cat == expected, "wrong catalog:\n{}", cat);
			}
		}
	}

	static void test_autoload(Context& ctx)
	{
		auto dir = TempDir("autoload");
		dir.write("modules/apache/manifests/init.pp", "class apache { $port = 80 }\n$ignored = 1\n");
		dir.write("modules/apache/manifests/vhost.pp", "define apache::vhost() { notify { $title: } }\n");
		dir.write("modules/apache/manifests/mod/ssl.pp", "class apache::mod::ssl { $enabled = true }\n");

		auto interp = make_interp({ (dir.path() / "nothing-here").string(), (dir.path() / "modules").string() });
		auto r = compile_string(interp, dir,
		    "include apache, 'apache::mod::ssl'\napache::vhost { 'site': }\n$p = $apache::port\n$s = $apache::mod::ssl::enabled\n");

		if(check(ctx, r.ok(), "autoloading failed: {}", r.is_err() ? r.error().string() : ""))
		{
			check(ctx, top_var(interp, "p") == "80", "$apache::port is {}", top_var(interp, "p"));
			check(ctx, top_var(interp, "s") == "true", "$apache::mod::ssl::enabled is {}", top_var(interp, "s"));
			check(ctx, top_var(interp, "ignored") == "<unset>", "top-level statements of an autoloaded file ran");
			check(ctx, interp.catalog().find("notify", "site") != nullptr, "apache::vhost was not autoloaded");
		}

		auto interp2 = make_interp({ (dir.path() / "modules").string() });
		auto r2 = compile_string(interp2, dir, "include nginx\n");
		check(ctx, r2.is_err() && r2.error().kind() == ErrorKind::Evaluation, "including an unknown class should fail");
	}

	static void test_facts(Context& ctx)
	{
		auto dir = TempDir("facts");
		auto path = dir.write("site.pp", "$r = \"${role} in ${environment}\"\n");

		auto settings = snip::config::Settings();
		settings.environment = "staging";

		auto interp = Interpreter(settings);
		auto r = interp.compile(path, { { "role", "web" }, { "role", "db" } });

		if(check(ctx, r.ok(), "compiling with facts failed: {}", r.is_err() ? r.error().string() : ""))
		{
			check(ctx, top_var(interp, "r") == "'db in staging'", "facts: got {}", top_var(interp, "r"));
			check(ctx, top_var(interp, "manifest") == zpr::sprint("'{}'", path), "$manifest is {}", top_var(interp, "manifest"));
		}
	}

	static void test_errors(Context& ctx)
	{
		struct Case
		{
			const char* manifest;
			const char* message;
		};

		auto cases = {
			Case { "$a = $nope", "unknown variable '$nope'" },
			Case { "$a = $nope::x", "class 'nope' has not been evaluated" },
			Case { "frobnicate(1)", "unknown function 'frobnicate'" },
			Case { "join(['a'])", "cannot be used as a statement" },
			Case { "$a = notice('x')", "does not return a value" },
			Case { "member([1])", "takes exactly 2 arguments" },
			Case { "$a = 1\n$a = 2", "cannot reassign variable '$a'" },
			Case { "file { '/x': }\nfile { '/x': }", "duplicate declaration of File['/x']" },
			Case { "frob { 'x': }", "unknown resource type 'frob'" },
			Case { "file { '/x': ensure => present, ensure => absent }", "attribute 'ensure' was already specified" },
			Case { "define d($a) { }\nd { 'x': }", "missing value for parameter '$a'" },
			Case { "define d() { }\nd { 'x': bogus => 1 }", "has no parameter named 'bogus'" },
			Case { "define d() { }\nd { 'x': }\nd { 'x': }", "duplicate declaration of d['x']" },
			Case { "$a = 1 / 0", "division by zero" },
			Case { "$a = 9223372036854775807 + 1", "integer overflow" },
			Case { "$a = -9223372036854775807 - 2", "integer overflow" },
			Case { "$a = 4611686018427387904 * 2", "integer overflow" },
			Case { "$a = '-9223372036854775808' / -1", "integer overflow" },
			Case { "$a = '-9223372036854775808' % -1", "integer overflow" },
			Case { "$m = '-9223372036854775808' + 0\n$a = -$m", "integer overflow" },
			Case { "$a = 'abc' + 1", "'abc' is not a number" },
			Case { "$a = [1] < 2", "cannot order" },
			Case { "fail('custom', 'message')", "custom message" },
			Case { "include nope", "unknown class 'nope'" },
		};

		auto dir = TempDir("errors");
		for(auto& c : cases)
		{
			auto interp = make_interp();
			auto r = compile_string(interp, dir, c.manifest);
			if(not check(ctx, r.is_err(), "'{}' should have failed", c.manifest))
				continue;

			check(ctx, r.error().kind() == ErrorKind::Evaluation, "'{}': expected an evaluation error, got '{}'",
			    c.manifest, snip::errorKindToString(r.error().kind()));

			check(ctx, r.error().string().find(c.message) != std::string::npos, "'{}': expected '{}' in '{}'", c.manifest,
			    c.message, r.error().string());
		}

		// redefinitions are caught when the file is loaded, before anything runs
		auto interp = make_interp();
		auto r = compile_string(interp, dir, "class a { }\nclass a { }\n");
		check(ctx, r.is_err() && r.error().kind() == ErrorKind::Syntax, "redefining a class should be a syntax error");
	}

	void test_eval(Context& ctx)
	{
		zpr::println("evaluation");

		test_expressions(ctx);
		test_statements(ctx);
		test_classes_and_defines(ctx);
		test_autoload(ctx);
		test_facts(ctx);
		test_errors(ctx);
	}
}
