// include.cpp
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#include <algorithm>

#include "snip/paths.h"
#include "snip/frontend.h"

#include "interp/ast.h"
#include "interp/include.h"
#include "interp/evaluator.h"

namespace snip::interp
{
	size_t FileUnitParser::numKeptCopies() const
	{
		size_t ret = 0;
		for(auto& [_, file] : m_files)
			ret += file->contents.size();

		return ret;
	}

	ErrorOr<std::unique_ptr<ast::Unit>> FileUnitParser::parseFile(const Location& loc,
	    const std::string& path,
	    Environment& env)
	{
		std::error_code ec {};
		if(not stdfs::is_regular_file(path, ec))
			return ErrMsg(ErrorKind::FileNotFound, loc, "file '{}' does not exist", path);

		// the mapping goes away at the end of this block
		std::string text {};
		{
			auto file = util::readEntireFile(path);
			if(file.is_err())
				return ErrMsg(ErrorKind::FileNotFound, loc, "{}", file.error());

			text = std::string((const char*) file->get(), file->size());
		}

		if(text.empty())
			return ErrMsg(ErrorKind::EmptyFile, loc, "file '{}' is empty", path);

		auto it = m_files.find(path);
		if(it == m_files.end())
			it = m_files.emplace(path, std::make_unique<LoadedFile>(LoadedFile { .path = path, .contents = {} })).first;

		auto& loaded = *it->second;

		auto copy = std::find(loaded.contents.begin(), loaded.contents.end(), text);
		if(copy == loaded.contents.end())
			copy = loaded.contents.insert(loaded.contents.end(), std::move(text));

		auto unit = TRY(frontend::parseUnit(loaded.path, *copy));
		TRY(env.addDefinitions(std::move(unit->definitions)));

		return Ok(std::move(unit));
	}



	ErrorOr<void> spliceAndEvaluate(Evaluator* ev, std::unique_ptr<ast::Unit> unit, const std::shared_ptr<Scope>& scope)
	{
		auto _ = ev->pushScope(scope);
		for(auto& stmt : unit->statements)
			TRY(stmt->evaluate(ev));

		return Ok();
	}

	ErrorOr<void> includeFile(Evaluator* ev, zst::str_view include_path, const CallerContext& caller)
	{
		util::debug("include_file", "inserting '{}' into '{}' at line {}", include_path, caller.file, caller.line);

		auto resolved = TRY(paths::resolveInclude(ev->loc(), include_path, caller.file));

		TRY(ev->enterNested(zpr::sprint("'{}'", resolved)));
		auto _ = util::Defer([ev]() { ev->leaveNested(); });

		util::debug("include_file", "parsing '{}'", resolved);
		auto unit = TRY(ev->unitParser().parseFile(ev->loc(), resolved, *caller.environment));

		util::debug("include_file", "evaluating the ast from '{}'", resolved);
		TRY(spliceAndEvaluate(ev, std::move(unit), caller.scope));

		util::debug("include_file", "done inserting '{}' into '{}' at line {}", include_path, caller.file, caller.line);
		return Ok();
	}
}
