#include <chklib/lang/scope_analysis.hh>
#include <chklib/macros/throw.hh>
#include <vector>

namespace chk::lang {

const ScopeInfo& ScopeTable::scope_of(const Node& node) const {
    auto it = scopes_.find(&node);
    if (it == scopes_.end()) {
        THROW("no scope for node ", node_kind_name(node.kind), " at line ", node.line);
    }
    return *it->second;
}

class ScopeAnalyzer {
    ScopeTable& table_;

    struct Context {
        ScopeInfo* scope;
        bool in_function;
        size_t loop_depth;
    };

    struct NonlocalDeclaration {
        const ScopeInfo* scope;
        std::string name;
        size_t line;
    };

    std::vector<NonlocalDeclaration> nonlocals_;

public:
    explicit ScopeAnalyzer(ScopeTable& table) noexcept : table_{table} {}

    void analyze(const Module& module) {
        auto* scope = new_scope(module, ScopeInfo::Kind::MODULE, nullptr);
        table_.module_scope_ = scope;
        Context ctx{.scope = scope, .in_function = false, .loop_depth = 0};
        visit_body(module.body, ctx);
        check_nonlocals();
    }

private:
    ScopeInfo* new_scope(const Node& node, ScopeInfo::Kind kind, const ScopeInfo* parent) {
        auto scope = std::make_unique<ScopeInfo>(ScopeInfo{.kind = kind, .parent = parent});
        auto* res = scope.get();
        table_.scopes_[&node] = std::move(scope);
        return res;
    }

    static void bind(const std::string& name, Context& ctx) {
        if (not ctx.scope->globals.contains(name) and not ctx.scope->nonlocals.contains(name)) {
            ctx.scope->locals.emplace(name);
        }
    }

    void bind_target(const Expr& target, Context& ctx) {
        switch (target.kind) {
        case NodeKind::Name: bind(static_cast<const NameExpr&>(target).id, ctx); return;
        case NodeKind::Tuple:
        case NodeKind::List:
            for (const auto& elt : static_cast<const CollectionExpr&>(target).elts) {
                bind_target(*elt, ctx);
            }
            return;
        case NodeKind::Starred: bind_target(*static_cast<const StarredExpr&>(target).value, ctx); return;
        default: visit(target, ctx); return; // attribute or subscript, only reads names
        }
    }

    void visit_body(const Body& body, Context& ctx) {
        for (const auto& stmt : body) {
            visit(*stmt, ctx);
        }
    }

    void visit_children(const Node& node, Context& ctx) {
        for_each_child(node, [&](const Node& child) { visit(child, ctx); });
    }

    void visit_arguments_defaults(const Arguments& args, Context& ctx) {
        for (const auto& def : args.defaults) {
            visit(*def, ctx);
        }
        for (const auto& def : args.kw_defaults) {
            if (def) {
                visit(*def, ctx);
            }
        }
        auto visit_annotation = [&](const std::unique_ptr<Arg>& arg) {
            if (arg and arg->annotation) {
                visit(*arg->annotation, ctx);
            }
        };
        for (const auto* list : {&args.posonlyargs, &args.args, &args.kwonlyargs}) {
            for (const auto& arg : *list) {
                visit_annotation(arg);
            }
        }
        visit_annotation(args.vararg);
        visit_annotation(args.kwarg);
    }

    static void bind_parameters(const Arguments& args, Context& ctx) {
        std::unordered_set<std::string> seen;
        auto add = [&](const std::unique_ptr<Arg>& arg) {
            if (not arg) {
                return;
            }
            if (not seen.emplace(arg->name).second) {
                throw SyntaxErrorException(
                    arg->line, "duplicate argument '", arg->name, "' in function definition"
                );
            }
            ctx.scope->locals.emplace(arg->name);
        };
        for (const auto& arg : args.posonlyargs) {
            add(arg);
        }
        for (const auto& arg : args.args) {
            add(arg);
        }
        add(args.vararg);
        for (const auto& arg : args.kwonlyargs) {
            add(arg);
        }
        add(args.kwarg);
    }

    void visit_function(const Node& node, const Arguments& args, Context& outer, auto&& visit_body_func) {
        auto* scope = new_scope(node, ScopeInfo::Kind::FUNCTION, outer.scope);
        Context ctx{.scope = scope, .in_function = true, .loop_depth = 0};
        bind_parameters(args, ctx);
        visit_body_func(ctx);
    }

    void visit_comprehension(const ComprehensionExpr& comp, Context& outer) {
        // The first iterable is evaluated in the enclosing scope
        visit(*comp.generators.front()->iter, outer);
        auto* scope = new_scope(comp, ScopeInfo::Kind::COMPREHENSION, outer.scope);
        Context ctx{.scope = scope, .in_function = outer.in_function, .loop_depth = 0};
        for (size_t i = 0; i < comp.generators.size(); ++i) {
            const auto& gen = *comp.generators[i];
            if (i > 0) {
                visit(*gen.iter, ctx);
            }
            bind_target(*gen.target, ctx);
            for (const auto& cond : gen.ifs) {
                visit(*cond, ctx);
            }
        }
        if (comp.key) {
            visit(*comp.key, ctx);
        }
        visit(*comp.elt, ctx);
    }

    void declare_names(const NamesStmt& stmt, Context& ctx) {
        bool is_global = stmt.kind == NodeKind::Global;
        std::string_view what = is_global ? "global" : "nonlocal";
        if (not is_global and ctx.scope->kind == ScopeInfo::Kind::MODULE) {
            throw SyntaxErrorException(stmt.line, "nonlocal declaration not allowed at module level");
        }
        for (const auto& name : stmt.names) {
            auto& other = is_global ? ctx.scope->nonlocals : ctx.scope->globals;
            if (other.contains(name)) {
                throw SyntaxErrorException(stmt.line, "name '", name, "' is nonlocal and global");
            }
            if (ctx.scope->kind != ScopeInfo::Kind::MODULE and ctx.scope->locals.contains(name)) {
                throw SyntaxErrorException(
                    stmt.line, "name '", name, "' is assigned to before ", what, " declaration"
                );
            }
            if (is_global) {
                ctx.scope->globals.emplace(name);
            } else {
                ctx.scope->nonlocals.emplace(name);
                nonlocals_.emplace_back(NonlocalDeclaration{
                    .scope = ctx.scope,
                    .name = name,
                    .line = stmt.line,
                });
            }
        }
    }

    void check_nonlocals() const {
        for (const auto& decl : nonlocals_) {
            bool found = false;
            for (const auto* scope = decl.scope->parent; scope and not found; scope = scope->parent) {
                if (scope->kind == ScopeInfo::Kind::MODULE) {
                    break;
                }
                found = scope->is_local(decl.name) or scope->nonlocals.contains(decl.name);
            }
            if (not found) {
                throw SyntaxErrorException(decl.line, "no binding for nonlocal '", decl.name, "' found");
            }
        }
    }

    void visit(const Node& node, Context& ctx) {
        switch (node.kind) {
        case NodeKind::FunctionDef: {
            const auto& def = static_cast<const FunctionDefStmt&>(node);
            for (const auto& decorator : def.decorator_list) {
                visit(*decorator, ctx);
            }
            visit_arguments_defaults(*def.args, ctx);
            if (def.returns) {
                visit(*def.returns, ctx);
            }
            bind(def.name, ctx);
            visit_function(node, *def.args, ctx, [&](Context& inner) { visit_body(def.body, inner); });
            return;
        }
        case NodeKind::Lambda: {
            const auto& lambda = static_cast<const LambdaExpr&>(node);
            visit_arguments_defaults(*lambda.args, ctx);
            visit_function(node, *lambda.args, ctx, [&](Context& inner) {
                visit(*lambda.body, inner);
            });
            return;
        }
        case NodeKind::ClassDef: {
            const auto& def = static_cast<const ClassDefStmt&>(node);
            for (const auto& decorator : def.decorator_list) {
                visit(*decorator, ctx);
            }
            for (const auto& base : def.bases) {
                visit(*base, ctx);
            }
            for (const auto& kw : def.keywords) {
                visit(*kw->value, ctx);
            }
            bind(def.name, ctx);
            auto* scope = new_scope(node, ScopeInfo::Kind::FUNCTION, ctx.scope);
            Context inner{.scope = scope, .in_function = false, .loop_depth = 0};
            visit_body(def.body, inner);
            return;
        }
        case NodeKind::ListComp:
        case NodeKind::SetComp:
        case NodeKind::DictComp:
        case NodeKind::GeneratorExp:
            visit_comprehension(static_cast<const ComprehensionExpr&>(node), ctx);
            return;
        case NodeKind::Return:
            if (not ctx.in_function) {
                throw SyntaxErrorException(node.line, "'return' outside function");
            }
            visit_children(node, ctx);
            return;
        case NodeKind::Break:
            if (ctx.loop_depth == 0) {
                throw SyntaxErrorException(node.line, "'break' outside loop");
            }
            return;
        case NodeKind::Continue:
            if (ctx.loop_depth == 0) {
                throw SyntaxErrorException(node.line, "'continue' not properly in loop");
            }
            return;
        case NodeKind::For: {
            const auto& stmt = static_cast<const ForStmt&>(node);
            visit(*stmt.iter, ctx);
            bind_target(*stmt.target, ctx);
            ++ctx.loop_depth;
            visit_body(stmt.body, ctx);
            --ctx.loop_depth;
            visit_body(stmt.orelse, ctx);
            return;
        }
        case NodeKind::While: {
            const auto& stmt = static_cast<const WhileStmt&>(node);
            visit(*stmt.test, ctx);
            ++ctx.loop_depth;
            visit_body(stmt.body, ctx);
            --ctx.loop_depth;
            visit_body(stmt.orelse, ctx);
            return;
        }
        case NodeKind::Global:
        case NodeKind::Nonlocal: declare_names(static_cast<const NamesStmt&>(node), ctx); return;
        case NodeKind::Assign: {
            const auto& stmt = static_cast<const AssignStmt&>(node);
            visit(*stmt.value, ctx);
            for (const auto& target : stmt.targets) {
                bind_target(*target, ctx);
            }
            return;
        }
        case NodeKind::AugAssign: {
            const auto& stmt = static_cast<const AugAssignStmt&>(node);
            visit(*stmt.value, ctx);
            bind_target(*stmt.target, ctx);
            return;
        }
        case NodeKind::AnnAssign: {
            const auto& stmt = static_cast<const AnnAssignStmt&>(node);
            visit(*stmt.annotation, ctx);
            if (stmt.value) {
                visit(*stmt.value, ctx);
                bind_target(*stmt.target, ctx);
            } else if (stmt.target->kind == NodeKind::Name) {
                bind(static_cast<const NameExpr&>(*stmt.target).id, ctx);
            } else {
                visit(*stmt.target, ctx);
            }
            return;
        }
        case NodeKind::Delete:
            for (const auto& target : static_cast<const DeleteStmt&>(node).targets) {
                bind_target(*target, ctx);
            }
            return;
        case NodeKind::withitem: {
            const auto& item = static_cast<const WithItem&>(node);
            visit(*item.context_expr, ctx);
            if (item.optional_vars) {
                bind_target(*item.optional_vars, ctx);
            }
            return;
        }
        case NodeKind::ExceptHandler: {
            const auto& handler = static_cast<const ExceptHandler&>(node);
            if (handler.type) {
                visit(*handler.type, ctx);
            }
            if (handler.name) {
                bind(*handler.name, ctx);
            }
            visit_body(handler.body, ctx);
            return;
        }
        case NodeKind::Import:
        case NodeKind::ImportFrom: {
            const auto& names = node.kind == NodeKind::Import
                ? static_cast<const ImportStmt&>(node).names
                : static_cast<const ImportFromStmt&>(node).names;
            for (const auto& alias : names) {
                if (alias->name == "*") {
                    continue;
                }
                if (alias->asname) {
                    bind(*alias->asname, ctx);
                } else {
                    bind(alias->name.substr(0, alias->name.find('.')), ctx);
                }
            }
            return;
        }
        default: visit_children(node, ctx); return;
        }
    }
};

Result<ScopeTable, SyntaxError> analyze_scopes(const Module& module) {
    ScopeTable table;
    try {
        ScopeAnalyzer{table}.analyze(module);
    } catch (const SyntaxErrorException& e) {
        return Err{e.error()};
    }
    return Ok{std::move(table)};
}

} // namespace chk::lang
