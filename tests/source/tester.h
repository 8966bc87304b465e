// tester.h
// Copyright (c) 2024, yuki
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "defs.h"
#include "util.h"

namespace snip::interp
{
	struct Interpreter;
}

namespace test
{
	struct Context
	{
		size_t passed;
		size_t failed;
		size_t skipped;
	};

	void test_paths(Context& ctx);
	void test_parser(Context& ctx, const stdfs::path& test_dir);
	void test_include(Context& ctx);
	void test_eval(Context& ctx);
	void test_config(Context& ctx);
	void test_site(Context& ctx, const stdfs::path& test_dir);




	template <typename... Args>
	inline bool check(Context& ctx, bool cond, const char* fmt, Args&&... args)
	{
		if(cond)
			return ctx.passed++, true;

		ctx.failed++;
		zpr::println("  FAIL: {}", zpr::sprint(fmt, static_cast<Args&&>(args)...));
		return false;
	}

	// a fresh directory under the system temp dir, removed again when this goes away
	struct TempDir
	{
		explicit TempDir(const std::string& name);
		~TempDir();

		TempDir(const TempDir&) = delete;
		TempDir& operator=(const TempDir&) = delete;

		const stdfs::path& path() const { return m_path; }

		// writes `contents` to `path() / name`, creating directories as needed; returns the full path
		std::string write(const std::string& name, zst::str_view contents) const;

	private:
		stdfs::path m_path;
	};

	/*
	    Writes `contents` to `main.pp` in `dir`, then compiles it as the main manifest. Includes
	    from the manifest are thus relative to `dir`.
	*/
	snip::ErrorOr<void> compile_string(snip::interp::Interpreter& interp, const TempDir& dir, zst::str_view contents);




	// helpers and stuff
	template <typename Iter, typename Predicate>
	inline void find_files_helper(std::vector<stdfs::path>& list, const stdfs::path& dir, Predicate&& pred)
	{
		// i guess this is not an error...?
		if(!stdfs::is_directory(dir))
			return;

		auto iter = Iter(dir);
		for(auto& ent : iter)
		{
			if((ent.is_regular_file() || ent.is_symlink()) && pred(ent))
				list.push_back(ent.path());
		}
	}

	/*
	    Search for files in the given directory (non-recursively), returning a list of paths
	    that match the given predicate. Note that the predicate should accept a `stdfs::directory_entry`,
	    *NOT* a `stdfs::path`.
	*/
	template <typename Predicate>
	inline std::vector<stdfs::path> find_files(const stdfs::path& dir, Predicate&& pred)
	{
		std::vector<stdfs::path> ret {};
		find_files_helper<stdfs::directory_iterator>(ret, dir, pred);
		return ret;
	}

	inline std::vector<stdfs::path> find_files_ext(const stdfs::path& dir, std::string_view ext)
	{
		return find_files(dir, [&ext](auto ent) -> bool { return ent.path().extension() == ext; });
	}
}
