// evaluator.cpp
// Copyright (c) 2022, yuki / zhiayang
// SPDX-License-Identifier: Apache-2.0

#include "interp/ast.h"
#include "interp/include.h"
#include "interp/evaluator.h"
#include "interp/builtin_fns.h"

namespace snip::interp
{
	Evaluator::Evaluator(Environment* env, Catalog* catalog, UnitParser* parser, size_t max_depth)
	    : m_environment(env), m_catalog(catalog), m_unit_parser(parser), m_max_depth(max_depth)
	{
		// always start with the top scope.
		m_scope_stack.push_back(std::make_shared<Scope>("::", nullptr));
		m_location_stack.push_back(Location::builtin());
	}

	[[nodiscard]] Location Evaluator::loc() const
	{
		return m_location_stack.back();
	}

	[[nodiscard]] util::Defer<> Evaluator::pushLocation(const Location& loc)
	{
		m_location_stack.push_back(loc);
		return util::Defer([this]() { this->popLocation(); });
	}

	void Evaluator::popLocation()
	{
		assert(m_location_stack.size() > 1);
		m_location_stack.pop_back();
	}

	const std::shared_ptr<Scope>& Evaluator::scope() const
	{
		return m_scope_stack.back();
	}

	const std::shared_ptr<Scope>& Evaluator::topScope() const
	{
		return m_scope_stack.front();
	}

	[[nodiscard]] util::Defer<> Evaluator::pushScope(std::shared_ptr<Scope> scope)
	{
		m_scope_stack.push_back(std::move(scope));
		return util::Defer([this]() { this->popScope(); });
	}

	void Evaluator::popScope()
	{
		assert(m_scope_stack.size() > 1);
		m_scope_stack.pop_back();
	}



	ErrorOr<void> Evaluator::enterNested(zst::str_view what)
	{
		if(m_depth >= m_max_depth)
			return ErrMsg(this, "maximum nesting depth ({}) exceeded while evaluating {}", m_max_depth, what);

		m_depth++;
		return Ok();
	}

	void Evaluator::leaveNested()
	{
		assert(m_depth > 0);
		m_depth--;
	}

	CallerContext Evaluator::callerContext() const
	{
		auto l = this->loc();
		return CallerContext {
			.file = l.filename.str(),
			.line = l.line + 1,
			.environment = m_environment,
			.scope = this->scope(),
		};
	}



	// splits `foo::bar::baz` into `foo::bar` and `baz`
	static std::pair<zst::str_view, zst::str_view> split_qualified_name(zst::str_view name)
	{
		auto i = name.rfind("::");
		if(i == (size_t) -1)
			return { "", name };

		return { name.take(i), name.drop(i + 2) };
	}

	static zst::str_view strip_top_prefix(zst::str_view name)
	{
		if(name.starts_with("::"))
			return name.drop(2);

		return name;
	}

	ErrorOr<Value> Evaluator::lookupVariable(zst::str_view name) const
	{
		const Value* ret = nullptr;
		if(name.starts_with("::") && split_qualified_name(name.drop(2)).first.empty())
		{
			ret = this->topScope()->lookupLocal(name.drop(2));
		}
		else if(auto [cls, var] = split_qualified_name(strip_top_prefix(name)); not cls.empty())
		{
			auto scope = this->classScope(cls);
			if(scope == nullptr)
				return ErrMsg(this, "cannot look up '${}': class '{}' has not been evaluated", name, cls);

			ret = scope->lookupLocal(var);
		}
		else
		{
			ret = this->scope()->lookup(name);
		}

		if(ret == nullptr)
			return ErrMsg(this, "unknown variable '${}'", name);

		return Ok(ret->clone());
	}

	bool Evaluator::isVariableDefined(zst::str_view name) const
	{
		if(name.starts_with("::") && split_qualified_name(name.drop(2)).first.empty())
			return this->topScope()->lookupLocal(name.drop(2)) != nullptr;

		if(auto [cls, var] = split_qualified_name(strip_top_prefix(name)); not cls.empty())
		{
			auto scope = this->classScope(cls);
			return scope != nullptr && scope->lookupLocal(var) != nullptr;
		}

		return this->scope()->lookup(name) != nullptr;
	}

	ErrorOr<void> Evaluator::setVariable(std::string name, Value value)
	{
		if(auto e = this->scope()->setVariable(std::move(name), std::move(value)); e.is_err())
			return ErrMsg(this, "{}", e.error());

		return Ok();
	}



	ErrorOr<EvalResult> Evaluator::callFunction(const std::string& name, std::vector<Value>& args, bool as_statement)
	{
		auto fn = lookupBuiltin(name);
		if(fn == nullptr)
			return ErrMsg(this, "unknown function '{}'", name);

		if(as_statement && fn->kind == FunctionKind::RValue)
			return ErrMsg(this, "function '{}' returns a value and cannot be used as a statement", name);
		else if(not as_statement && fn->kind == FunctionKind::Statement)
			return ErrMsg(this, "function '{}' does not return a value", name);

		if(args.size() < fn->min_args || args.size() > fn->max_args)
		{
			if(fn->min_args == fn->max_args)
			{
				return ErrMsg(this, "function '{}' takes exactly {} argument{}, but {} were given", name,
				    fn->min_args, fn->min_args == 1 ? "" : "s", args.size());
			}
			else if(args.size() < fn->min_args)
			{
				return ErrMsg(this, "function '{}' takes at least {} argument{}, but {} were given", name,
				    fn->min_args, fn->min_args == 1 ? "" : "s", args.size());
			}
			else
			{
				return ErrMsg(this, "function '{}' takes at most {} argument{}, but {} were given", name,
				    fn->max_args, fn->max_args == 1 ? "" : "s", args.size());
			}
		}

		return fn->function(this, args);
	}



	ErrorOr<void> Evaluator::autoload(zst::str_view name)
	{
		auto path = m_environment->findAutoloadFile(name);
		if(not path.has_value() || m_environment->wasAutoloaded(*path))
			return Ok();

		m_environment->markAutoloaded(*path);
		util::debug("autoload", "loading '{}' for '{}'", *path, name);

		auto unit = TRY(m_unit_parser->parseFile(this->loc(), *path, *m_environment));
		if(not unit->statements.empty())
		{
			util::warn("autoload", "ignoring {} top-level statement{} in '{}'", unit->statements.size(),
			    unit->statements.size() == 1 ? "" : "s", *path);
		}

		return Ok();
	}

	ErrorOr<const ast::DefineDefn*> Evaluator::findDefine(zst::str_view name)
	{
		name = strip_top_prefix(name);
		if(auto defn = m_environment->lookupDefine(name); defn != nullptr)
			return Ok(defn);

		TRY(this->autoload(name));
		return Ok(m_environment->lookupDefine(name));
	}

	ErrorOr<const ast::ClassDefn*> Evaluator::findClass(zst::str_view name)
	{
		name = strip_top_prefix(name);
		if(auto defn = m_environment->lookupClass(name); defn != nullptr)
			return Ok(defn);

		TRY(this->autoload(name));
		return Ok(m_environment->lookupClass(name));
	}



	ErrorOr<void> Evaluator::declareResource(std::string type,
	    std::string title,
	    std::vector<std::pair<std::string, Value>> attributes,
	    const Location& loc)
	{
		if(type == "class")
			return ErrMsg(ErrorKind::Evaluation, loc, "resource-style class declarations are not supported, use 'include'");

		const ast::DefineDefn* defn = nullptr;
		if(not Catalog::isNativeType(type))
		{
			defn = TRY(this->findDefine(type));
			if(defn == nullptr)
				return ErrMsg(ErrorKind::Evaluation, loc, "unknown resource type '{}'", type);
		}

		if(defn == nullptr)
		{
			if(auto prev = m_catalog->find(type, title); prev != nullptr)
			{
				return Err(ErrorMessage(ErrorKind::Evaluation, loc, zpr::sprint("duplicate declaration of {}", prev->ref()))
				               .addInfo(prev->location, "previously declared here"));
			}

			util::debug("catalog", "adding {}['{}']", type, title);
			m_catalog->add(Resource {
			    .type = std::move(type),
			    .title = std::move(title),
			    .attributes = std::move(attributes),
			    .location = loc,
			    .scope = this->scope()->name(),
			});

			return Ok();
		}

		return this->instantiate_define(defn, std::move(title), std::move(attributes), loc);
	}

	ErrorOr<void> Evaluator::instantiate_define(const ast::DefineDefn* defn,
	    std::string title,
	    std::vector<std::pair<std::string, Value>> attributes,
	    const Location& loc)
	{
		// instances are not catalog entries (only what their bodies declare is), but they
		// still can't be declared twice.
		auto key = zpr::sprint("{}[{}]", defn->name, title);
		if(auto it = m_define_instances.find(key); it != m_define_instances.end())
		{
			return Err(ErrorMessage(ErrorKind::Evaluation, loc, zpr::sprint("duplicate declaration of {}['{}']", defn->name, title))
			               .addInfo(it->second, "previously declared here"));
		}

		m_define_instances.emplace(key, loc);
		auto scope = std::make_shared<Scope>(std::move(key), this->scope());

		TRY(this->enterNested(zpr::sprint("{} '{}'", defn->kindString(), defn->name)));
		auto _ = util::Defer([this]() { this->leaveNested(); });

		auto _s = this->pushScope(scope);

		auto name = Value::string(title);
		for(auto it = attributes.begin(); it != attributes.end(); ++it)
		{
			if(it->first == "name")
			{
				name = std::move(it->second);
				attributes.erase(it);
				break;
			}
		}

		TRY(this->setVariable("title", Value::string(std::move(title))));
		TRY(this->setVariable("name", std::move(name)));

		TRY(defn->bindParameters(this, std::move(attributes), loc));
		return defn->body->evaluate(this).remove_value();
	}



	bool Evaluator::isClassIncluded(zst::str_view name) const
	{
		return m_class_scopes.contains(strip_top_prefix(name));
	}

	std::shared_ptr<Scope> Evaluator::classScope(zst::str_view name) const
	{
		if(auto it = m_class_scopes.find(strip_top_prefix(name)); it != m_class_scopes.end())
			return it->second;

		return nullptr;
	}

	ErrorOr<void> Evaluator::includeClass(zst::str_view name)
	{
		name = strip_top_prefix(name);
		if(this->isClassIncluded(name))
			return Ok();

		auto cls = TRY(this->findClass(name));
		if(cls == nullptr)
			return ErrMsg(this, "unknown class '{}'", name);

		auto parent_scope = this->scope();
		if(cls->parent_class.has_value())
		{
			auto& parent = *cls->parent_class;
			TRY(this->includeClass(parent));

			parent_scope = this->classScope(parent);
		}

		util::debug("eval", "evaluating class '{}'", name);

		// registered before the body runs, so a class that includes itself is a no-op
		auto scope = std::make_shared<Scope>(cls->name, std::move(parent_scope));
		m_class_scopes.emplace(cls->name, scope);

		TRY(this->enterNested(zpr::sprint("class '{}'", cls->name)));
		auto _ = util::Defer([this]() { this->leaveNested(); });

		auto _s = this->pushScope(scope);

		TRY(cls->bindParameters(this, {}, this->loc()));
		return cls->body->evaluate(this).remove_value();
	}
}
