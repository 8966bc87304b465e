// include.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "util.h"
#include "location.h"

#include "interp/ast.h"
#include "interp/scope.h"
#include "interp/environment.h"

namespace snip::interp
{
	struct Evaluator;

	/*
	    What an included file gets to see of the statement that included it. The scope is
	    shared, not copied: whatever the included file assigns ends up in the caller's
	    scope object, and the caller keeps ownership of it.
	*/
	struct CallerContext
	{
		std::string file;
		size_t line = 0;

		Environment* environment = nullptr;
		std::shared_ptr<Scope> scope;
	};

	/*
	    Parses one file as a self-contained compilation unit. This is the only way
	    `include_file` gets at the parser; it never goes through `Interpreter::compile`,
	    which sets up the top scope and facts for a whole program.
	*/
	struct UnitParser
	{
		virtual ~UnitParser();

		/*
		    Reads and parses `path`; `loc` is where the request came from, for errors.
		    Definitions in the unit are added to `env` only if the whole file parsed.
		*/
		virtual ErrorOr<std::unique_ptr<ast::Unit>> parseFile(const Location& loc,
		    const std::string& path,
		    Environment& env)
		    = 0;
	};

	struct FileUnitParser : UnitParser
	{
		virtual ErrorOr<std::unique_ptr<ast::Unit>> parseFile(const Location& loc,
		    const std::string& path,
		    Environment& env) override;

		// distinct paths read so far, and the copies of their text that are being kept
		size_t numLoadedFiles() const { return m_files.size(); }
		size_t numKeptCopies() const;

	private:
		/*
		    The AST is thrown away after evaluation, but locations (and hence error
		    messages) point into the source text and the file name, so those stay. The
		    file itself is unmapped as soon as it has been copied; a file that is read
		    again with the same contents reuses the copy.
		*/
		struct LoadedFile
		{
			std::string path;
			std::deque<std::string> contents;
		};

		util::hashmap<std::string, std::unique_ptr<LoadedFile>> m_files;
	};

	/*
	    Evaluates every top-level statement of `unit` with `scope` as the current scope,
	    then drops the unit. Errors propagate as they are.
	*/
	ErrorOr<void> spliceAndEvaluate(Evaluator* ev, std::unique_ptr<ast::Unit> unit, const std::shared_ptr<Scope>& scope);

	ErrorOr<void> includeFile(Evaluator* ev, zst::str_view include_path, const CallerContext& caller);
}
