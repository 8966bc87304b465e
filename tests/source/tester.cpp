// tester.cpp
// Copyright (c) 2024, yuki
// SPDX-License-Identifier: Apache-2.0

#include <cstdio>
#include <unistd.h>

#include "tester.h"

#include "interp/interp.h"

namespace test
{
	TempDir::TempDir(const std::string& name)
	{
		m_path = stdfs::temp_directory_path() / zpr::sprint("snip-test-{}-{}", name, getpid());
		stdfs::remove_all(m_path);
		stdfs::create_directories(m_path);
	}

	TempDir::~TempDir()
	{
		std::error_code ec {};
		stdfs::remove_all(m_path, ec);
	}

	std::string TempDir::write(const std::string& name, zst::str_view contents) const
	{
		auto path = m_path / name;
		stdfs::create_directories(path.parent_path());

		auto f = fopen(path.string().c_str(), "wb");
		if(f == nullptr)
			snip::internal_error("failed to create '{}'", path.string());

		fwrite(contents.data(), 1, contents.size(), f);
		fclose(f);

		return path.string();
	}

	snip::ErrorOr<void> compile_string(snip::interp::Interpreter& interp, const TempDir& dir, zst::str_view contents)
	{
		auto path = dir.write("main.pp", contents);
		return interp.compile(path, {});
	}
}

int main(int argc, char** argv)
{
	if(argc != 2)
	{
		zpr::println("usage: snip-test <test dir>");
		return 0;
	}

	const auto test_dir = stdfs::path(argv[1]);

	// errors are expected and checked, no need to see them
	util::setLogLevel(util::LogLevel::Error);

	test::Context context {};

	test::test_paths(context);
	test::test_parser(context, test_dir);
	test::test_include(context);
	test::test_eval(context);
	test::test_config(context);
	test::test_site(context, test_dir);

	zpr::println("{} passed, {} failed, {} skipped", context.passed, context.failed, context.skipped);
	return context.failed == 0 ? 0 : 1;
}
