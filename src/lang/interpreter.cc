#include "call_args.hh"

#include <algorithm>
#include <chklib/defer.hh>
#include <chklib/lang/capability_whitelist.hh>
#include <chklib/lang/interpreter.hh>
#include <chklib/lang/operations.hh>
#include <chklib/macros/throw.hh>
#include <chklib/throw_assert.hh>
#include <pthread.h>

namespace chk::lang {

namespace {

std::string quoted_names(const std::vector<std::string_view>& names) {
    std::string res;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            res += names.size() == 2 ? " and " : (i + 1 == names.size() ? ", and " : ", ");
        }
        back_insert(res, '\'', names[i], '\'');
    }
    return res;
}

bool is_iterable(const Value& val) noexcept {
    if (std::holds_alternative<StrPtr>(val)) {
        return true;
    }
    const auto* ref = std::get_if<ObjRef>(&val);
    if (not ref) {
        return false;
    }
    switch ((*ref)->kind) {
    case ObjectKind::LIST:
    case ObjectKind::TUPLE:
    case ObjectKind::DICT:
    case ObjectKind::SET:
    case ObjectKind::RANGE:
    case ObjectKind::ITERATOR:
    case ObjectKind::DICT_VIEW: return true;
    default: return false;
    }
}

} // namespace

Interpreter::Interpreter(
    const Module& module, const ScopeTable& scopes, const Deadline& deadline, size_t heap_limit_in_bytes
)
: heap_{heap_limit_in_bytes}
, module_{module}
, scopes_{scopes}
, deadline_{deadline} {
    for (const auto& entry : capability_whitelist()) {
        if (entry.builtin) {
            builtins_.emplace(entry.name, heap_.make<BuiltinFunctionObject>(*entry.builtin, entry.name));
        } else {
            builtins_.emplace(entry.name, heap_.make<ExceptionClassObject>(*entry.exception_kind));
        }
    }
    module_scope_ = heap_.make<ScopeObject>(&scopes_.module_scope(), ObjRef{});
    static_cast<ScopeObject&>(*module_scope_).vars.emplace("__name__", new_str("__student_code__"));

    pthread_attr_t attr;
    if (pthread_getattr_np(pthread_self(), &attr) == 0) {
        void* stack_addr = nullptr;
        size_t stack_size = 0;
        if (pthread_attr_getstack(&attr, &stack_addr, &stack_size) == 0) {
            stack_limit_ = reinterpret_cast<uintptr_t>(stack_addr) + limits::min_free_stack_in_bytes;
        }
        (void)pthread_attr_destroy(&attr);
    }
}

void Interpreter::run_module() {
    Frame frame{module_scope_};
    (void)exec_body(module_.body, frame);
}

std::optional<Value> Interpreter::lookup_global(const std::string& name) const {
    const auto& vars = static_cast<const ScopeObject&>(*module_scope_).vars;
    auto it = vars.find(name);
    if (it == vars.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Interpreter::is_callable(const Value& val) noexcept {
    const auto* ref = std::get_if<ObjRef>(&val);
    if (not ref) {
        return false;
    }
    switch ((*ref)->kind) {
    case ObjectKind::FUNCTION:
    case ObjectKind::BUILTIN_FUNCTION:
    case ObjectKind::BOUND_METHOD:
    case ObjectKind::EXCEPTION_CLASS: return true;
    default: return false;
    }
}

void Interpreter::enter_call() {
    tick();
    if (call_depth_ >= limits::max_call_depth) {
        raise(ExceptionKind::RECURSION_ERROR, "maximum recursion depth exceeded");
    }
    char marker = 0;
    if (reinterpret_cast<uintptr_t>(&marker) < stack_limit_) {
        raise(ExceptionKind::RECURSION_ERROR, "maximum recursion depth exceeded");
    }
}

Value Interpreter::call(const Value& callee, std::vector<Value> args, KwArgs kwargs) {
    enter_call();
    ++call_depth_;
    Defer depth_guard = [&] { --call_depth_; };
    Value func = callee; // the callee may be stored in something the call modifies
    if (auto* function = as<FunctionObject>(func)) {
        return call_function(*function, std::move(args), std::move(kwargs));
    }
    if (auto* builtin = as<BuiltinFunctionObject>(func)) {
        return call_builtin(builtin->builtin, builtin->name, std::move(args), std::move(kwargs));
    }
    if (auto* method = as<BoundMethodObject>(func)) {
        return call_method(method->self, method->name, std::move(args), std::move(kwargs));
    }
    if (auto* cls = as<ExceptionClassObject>(func)) {
        if (not kwargs.empty()) {
            raise(
                ExceptionKind::TYPE_ERROR,
                exception_kind_name(cls->exception_kind),
                "() takes no keyword arguments"
            );
        }
        auto obj = heap_.make<ExceptionObject>(cls->exception_kind);
        static_cast<ExceptionObject&>(*obj).args = std::move(args);
        return obj;
    }
    raise(ExceptionKind::TYPE_ERROR, "'", type_name(func), "' object is not callable");
}

Value Interpreter::from_literal(const LiteralValue& val) {
    return std::visit(
        [&](const auto& x) -> Value {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return new_str(x);
            } else if constexpr (std::is_same_v<T, LiteralValue::List>) {
                std::vector<Value> items;
                for (const auto& item : x.items) {
                    items.emplace_back(from_literal(item));
                }
                return new_list(std::move(items));
            } else if constexpr (std::is_same_v<T, LiteralValue::Tuple>) {
                std::vector<Value> items;
                for (const auto& item : x.items) {
                    items.emplace_back(from_literal(item));
                }
                return new_tuple(std::move(items));
            } else if constexpr (std::is_same_v<T, LiteralValue::Set>) {
                auto res = new_set();
                auto& set = *as<SetObject>(res);
                for (const auto& item : x.items) {
                    set.table.insert(from_literal(item), NoneType{});
                }
                recharge(set);
                return res;
            } else if constexpr (std::is_same_v<T, LiteralValue::Dict>) {
                auto res = new_dict();
                auto& dict = *as<DictObject>(res);
                for (size_t i = 0; i < x.keys.size(); ++i) {
                    dict.table.insert(from_literal(x.keys[i]), from_literal(x.values[i]));
                }
                recharge(dict);
                return res;
            } else {
                return x;
            }
        },
        val.value
    );
}

/* Values */

Value Interpreter::new_str(std::string str) { return heap_.make_str(std::move(str)); }

Value Interpreter::new_list(std::vector<Value> items) {
    auto obj = heap_.make<ListObject>();
    auto& list = static_cast<ListObject&>(*obj);
    list.items = std::move(items);
    recharge(list);
    return obj;
}

Value Interpreter::new_tuple(std::vector<Value> items) {
    auto obj = heap_.make<TupleObject>();
    auto& tuple = static_cast<TupleObject&>(*obj);
    tuple.items = std::move(items);
    recharge(tuple);
    return obj;
}

Value Interpreter::new_dict() { return heap_.make<DictObject>(); }

Value Interpreter::new_set() { return heap_.make<SetObject>(); }

void Interpreter::recharge(ListObject& obj) {
    heap_.recharge(obj, sizeof(ListObject) + obj.items.capacity() * sizeof(Value));
}

void Interpreter::recharge(TupleObject& obj) {
    heap_.recharge(obj, sizeof(TupleObject) + obj.items.capacity() * sizeof(Value));
}

void Interpreter::recharge(DictObject& obj) {
    heap_.recharge(obj, sizeof(DictObject) + obj.table.memory_usage());
}

void Interpreter::recharge(SetObject& obj) {
    heap_.recharge(obj, sizeof(SetObject) + obj.table.memory_usage());
}

void Interpreter::raise_key_error(const Value& key) {
    auto obj = heap_.make<ExceptionObject>(ExceptionKind::KEY_ERROR);
    static_cast<ExceptionObject&>(*obj).args.emplace_back(key);
    throw RaisedException(ExceptionKind::KEY_ERROR, repr(key), std::move(obj));
}

ObjRef Interpreter::exception_instance(RaisedException& exc) {
    if (not exc.instance()) {
        auto obj = heap_.make<ExceptionObject>(exc.kind());
        if (not exc.message().empty()) {
            static_cast<ExceptionObject&>(*obj).args.emplace_back(new_str(exc.message()));
        }
        exc.set_instance(std::move(obj));
    }
    return exc.instance();
}

/* Names */

ObjRef Interpreter::make_scope(const ScopeInfo& info, Frame& frame) {
    ObjRef parent;
    if (frame.scope.info->kind != ScopeInfo::Kind::MODULE) {
        parent = frame.scope_ref;
    }
    return heap_.make<ScopeObject>(&info, std::move(parent));
}

ScopeObject* Interpreter::find_enclosing(const std::string& name, const Frame& frame) const {
    for (Object* obj = frame.scope.parent.get(); obj;
         obj = static_cast<ScopeObject*>(obj)->parent.get())
    {
        auto& scope = static_cast<ScopeObject&>(*obj);
        if (scope.info->globals.contains(name)) {
            return nullptr;
        }
        if (scope.info->is_local(name)) {
            return &scope;
        }
    }
    return nullptr;
}

Value Interpreter::load_name(const std::string& name, Frame& frame) {
    const auto& info = *frame.scope.info;
    if (info.kind == ScopeInfo::Kind::MODULE or info.globals.contains(name)) {
        return load_global(name);
    }
    if (info.locals.contains(name)) {
        auto it = frame.scope.vars.find(name);
        if (it == frame.scope.vars.end()) {
            raise(
                ExceptionKind::UNBOUND_LOCAL_ERROR,
                "cannot access local variable '",
                name,
                "' where it is not associated with a value"
            );
        }
        return it->second;
    }
    if (auto* scope = find_enclosing(name, frame)) {
        auto it = scope->vars.find(name);
        if (it == scope->vars.end()) {
            raise(
                ExceptionKind::NAME_ERROR,
                "cannot access free variable '",
                name,
                "' where it is not associated with a value in enclosing scope"
            );
        }
        return it->second;
    }
    return load_global(name);
}

Value Interpreter::load_global(const std::string& name) {
    const auto& vars = static_cast<ScopeObject&>(*module_scope_).vars;
    if (auto it = vars.find(name); it != vars.end()) {
        return it->second;
    }
    if (auto it = builtins_.find(name); it != builtins_.end()) {
        return it->second;
    }
    raise(ExceptionKind::NAME_ERROR, "name '", name, "' is not defined");
}

void Interpreter::store_name(const std::string& name, Value val, Frame& frame) {
    const auto& info = *frame.scope.info;
    if (info.kind == ScopeInfo::Kind::MODULE or info.globals.contains(name)) {
        static_cast<ScopeObject&>(*module_scope_).vars.insert_or_assign(name, std::move(val));
        return;
    }
    if (info.nonlocals.contains(name)) {
        auto* scope = find_enclosing(name, frame);
        throw_assert(scope);
        scope->vars.insert_or_assign(name, std::move(val));
        return;
    }
    frame.scope.vars.insert_or_assign(name, std::move(val));
}

void Interpreter::delete_name(const std::string& name, Frame& frame) {
    const auto& info = *frame.scope.info;
    if (info.kind == ScopeInfo::Kind::MODULE or info.globals.contains(name)) {
        if (static_cast<ScopeObject&>(*module_scope_).vars.erase(name) == 0) {
            raise(ExceptionKind::NAME_ERROR, "name '", name, "' is not defined");
        }
        return;
    }
    auto* scope = info.nonlocals.contains(name) ? find_enclosing(name, frame) : &frame.scope;
    throw_assert(scope);
    if (scope->vars.erase(name) == 0) {
        raise(
            ExceptionKind::UNBOUND_LOCAL_ERROR,
            "cannot access local variable '",
            name,
            "' where it is not associated with a value"
        );
    }
}

void Interpreter::unbind_name(const std::string& name, Frame& frame) noexcept {
    const auto& info = *frame.scope.info;
    if (info.kind == ScopeInfo::Kind::MODULE or info.globals.contains(name)) {
        static_cast<ScopeObject&>(*module_scope_).vars.erase(name);
    } else if (info.nonlocals.contains(name)) {
        if (auto* scope = find_enclosing(name, frame)) {
            scope->vars.erase(name);
        }
    } else {
        frame.scope.vars.erase(name);
    }
}

/* Statements */

Interpreter::ExecStatus Interpreter::exec_body(const Body& body, Frame& frame) {
    for (const auto& stmt : body) {
        auto status = exec(*stmt, frame);
        if (status != ExecStatus::NORMAL) {
            return status;
        }
    }
    return ExecStatus::NORMAL;
}

Interpreter::ExecStatus Interpreter::exec(const Stmt& stmt, Frame& frame) {
    tick();
    switch (stmt.kind) {
    case NodeKind::Expr: (void)eval(*static_cast<const ExprStmt&>(stmt).value, frame); break;
    case NodeKind::Assign: {
        const auto& assign_stmt = static_cast<const AssignStmt&>(stmt);
        auto val = eval(*assign_stmt.value, frame);
        for (const auto& target : assign_stmt.targets) {
            assign(*target, val, frame);
        }
        break;
    }
    case NodeKind::AugAssign: exec_aug_assign(static_cast<const AugAssignStmt&>(stmt), frame); break;
    case NodeKind::AnnAssign: {
        const auto& ann_assign = static_cast<const AnnAssignStmt&>(stmt);
        if (ann_assign.value) {
            auto val = eval(*ann_assign.value, frame);
            assign(*ann_assign.target, std::move(val), frame);
        }
        break;
    }
    case NodeKind::For: return exec_for(static_cast<const ForStmt&>(stmt), frame);
    case NodeKind::While: return exec_while(static_cast<const WhileStmt&>(stmt), frame);
    case NodeKind::If: {
        const auto& if_stmt = static_cast<const IfStmt&>(stmt);
        if (is_truthy(eval(*if_stmt.test, frame))) {
            return exec_body(if_stmt.body, frame);
        }
        return exec_body(if_stmt.orelse, frame);
    }
    case NodeKind::With: {
        const auto& with_stmt = static_cast<const WithStmt&>(stmt);
        auto manager = eval(*with_stmt.items.front()->context_expr, frame);
        raise(
            ExceptionKind::TYPE_ERROR,
            "'",
            type_name(manager),
            "' object does not support the context manager protocol"
        );
    }
    case NodeKind::Raise: exec_raise(static_cast<const RaiseStmt&>(stmt), frame); break;
    case NodeKind::Try: return exec_try(static_cast<const TryStmt&>(stmt), frame);
    case NodeKind::Assert: {
        const auto& assert_stmt = static_cast<const AssertStmt&>(stmt);
        if (not is_truthy(eval(*assert_stmt.test, frame))) {
            auto obj = heap_.make<ExceptionObject>(ExceptionKind::ASSERTION_ERROR);
            auto& exc = static_cast<ExceptionObject&>(*obj);
            if (assert_stmt.msg) {
                exc.args.emplace_back(eval(*assert_stmt.msg, frame));
            }
            auto message = exception_message(ExceptionKind::ASSERTION_ERROR, exc.args);
            throw RaisedException(ExceptionKind::ASSERTION_ERROR, std::move(message), std::move(obj));
        }
        break;
    }
    case NodeKind::Import:
    case NodeKind::ImportFrom: raise(ExceptionKind::IMPORT_ERROR, "__import__ not found");
    case NodeKind::Delete:
        for (const auto& target : static_cast<const DeleteStmt&>(stmt).targets) {
            exec_delete(*target, frame);
        }
        break;
    case NodeKind::FunctionDef:
        exec_function_def(static_cast<const FunctionDefStmt&>(stmt), frame);
        break;
    case NodeKind::ClassDef: raise(ExceptionKind::NAME_ERROR, "__build_class__ not found");
    case NodeKind::Return: {
        const auto& return_stmt = static_cast<const ReturnStmt&>(stmt);
        frame.return_value =
            return_stmt.value ? eval(*return_stmt.value, frame) : Value{NoneType{}};
        return ExecStatus::RETURN;
    }
    case NodeKind::Break: return ExecStatus::BREAK;
    case NodeKind::Continue: return ExecStatus::CONTINUE;
    case NodeKind::Global:
    case NodeKind::Nonlocal:
    case NodeKind::Pass: break;
    default: THROW("unexpected statement: ", node_kind_name(stmt.kind));
    }
    return ExecStatus::NORMAL;
}

Interpreter::ExecStatus Interpreter::exec_for(const ForStmt& stmt, Frame& frame) {
    auto iter = get_iter(eval(*stmt.iter, frame));
    auto& it = static_cast<IteratorObject&>(*iter);
    for (;;) {
        tick();
        auto val = next(it);
        if (not val) {
            break;
        }
        assign(*stmt.target, std::move(*val), frame);
        auto status = exec_body(stmt.body, frame);
        if (status == ExecStatus::BREAK) {
            return ExecStatus::NORMAL;
        }
        if (status == ExecStatus::RETURN) {
            return status;
        }
    }
    return exec_body(stmt.orelse, frame);
}

Interpreter::ExecStatus Interpreter::exec_while(const WhileStmt& stmt, Frame& frame) {
    for (;;) {
        tick();
        if (not is_truthy(eval(*stmt.test, frame))) {
            break;
        }
        auto status = exec_body(stmt.body, frame);
        if (status == ExecStatus::BREAK) {
            return ExecStatus::NORMAL;
        }
        if (status == ExecStatus::RETURN) {
            return status;
        }
    }
    return exec_body(stmt.orelse, frame);
}

Interpreter::ExecStatus Interpreter::exec_try(const TryStmt& stmt, Frame& frame) {
    if (stmt.finalbody.empty()) {
        return exec_try_except(stmt, frame);
    }
    ExecStatus status = ExecStatus::NORMAL;
    try {
        status = exec_try_except(stmt, frame);
    } catch (const RaisedException&) {
        // break, continue or return in the finally block discards the exception
        auto final_status = exec_body(stmt.finalbody, frame);
        if (final_status != ExecStatus::NORMAL) {
            return final_status;
        }
        throw;
    }
    auto final_status = exec_body(stmt.finalbody, frame);
    return final_status == ExecStatus::NORMAL ? status : final_status;
}

Interpreter::ExecStatus Interpreter::exec_try_except(const TryStmt& stmt, Frame& frame) {
    ExecStatus status = ExecStatus::NORMAL;
    try {
        status = exec_body(stmt.body, frame);
    } catch (RaisedException& exc) {
        for (const auto& handler : stmt.handlers) {
            if (handler_matches(*handler, exc, frame)) {
                return run_handler(*handler, exc, frame);
            }
        }
        throw;
    }
    if (status == ExecStatus::NORMAL) {
        return exec_body(stmt.orelse, frame);
    }
    return status;
}

bool Interpreter::handler_matches(
    const ExceptHandler& handler, const RaisedException& exc, Frame& frame
) {
    if (not handler.type) {
        return true;
    }
    auto type = eval(*handler.type, frame);
    auto matches = [&](const Value& cls) {
        const auto* exc_class = as<ExceptionClassObject>(cls);
        if (not exc_class) {
            raise(
                ExceptionKind::TYPE_ERROR,
                "catching classes that do not inherit from BaseException is not allowed"
            );
        }
        return is_exception_subclass(exc.kind(), exc_class->exception_kind);
    };
    if (const auto* tuple = as<TupleObject>(type)) {
        return std::any_of(tuple->items.begin(), tuple->items.end(), matches);
    }
    return matches(type);
}

Interpreter::ExecStatus
Interpreter::run_handler(const ExceptHandler& handler, RaisedException& exc, Frame& frame) {
    handling_.emplace_back(exc);
    Defer pop_guard = [&] { handling_.pop_back(); };
    if (handler.name) {
        store_name(*handler.name, exception_instance(handling_.back()), frame);
    }
    Defer unbind_guard = [&] {
        if (handler.name) {
            unbind_name(*handler.name, frame);
        }
    };
    return exec_body(handler.body, frame);
}

void Interpreter::exec_raise(const RaiseStmt& stmt, Frame& frame) {
    if (not stmt.exc) {
        if (handling_.empty()) {
            raise(ExceptionKind::RUNTIME_ERROR, "No active exception to reraise");
        }
        throw RaisedException{handling_.back()};
    }
    auto val = eval(*stmt.exc, frame);
    if (stmt.cause) {
        auto cause = eval(*stmt.cause, frame);
        if (not std::holds_alternative<NoneType>(cause) and not as<ExceptionClassObject>(cause) and
            not as<ExceptionObject>(cause))
        {
            raise(ExceptionKind::TYPE_ERROR, "exception causes must derive from BaseException");
        }
    }
    if (as<ExceptionClassObject>(val)) {
        val = call(val, {}, {});
    }
    if (const auto* exc = as<ExceptionObject>(val)) {
        throw RaisedException(
            exc->exception_kind,
            exception_message(exc->exception_kind, exc->args),
            std::get<ObjRef>(val)
        );
    }
    raise(ExceptionKind::TYPE_ERROR, "exceptions must derive from BaseException");
}

void Interpreter::exec_delete(const Expr& target, Frame& frame) {
    switch (target.kind) {
    case NodeKind::Name: delete_name(static_cast<const NameExpr&>(target).id, frame); return;
    case NodeKind::Tuple:
    case NodeKind::List:
        for (const auto& elt : static_cast<const CollectionExpr&>(target).elts) {
            exec_delete(*elt, frame);
        }
        return;
    case NodeKind::Subscript: {
        const auto& subscript = static_cast<const SubscriptExpr&>(target);
        auto obj = eval(*subscript.value, frame);
        if (subscript.slice->kind == NodeKind::Slice) {
            auto slice = eval_slice(static_cast<const SliceExpr&>(*subscript.slice), frame);
            delete_slice(obj, slice);
        } else {
            delete_item(obj, eval(*subscript.slice, frame));
        }
        return;
    }
    case NodeKind::Attribute: {
        const auto& attribute = static_cast<const AttributeExpr&>(target);
        auto obj = eval(*attribute.value, frame);
        raise(
            ExceptionKind::ATTRIBUTE_ERROR,
            "'",
            type_name(obj),
            "' object has no attribute '",
            attribute.attr,
            "'"
        );
    }
    default: THROW("unexpected delete target: ", node_kind_name(target.kind));
    }
}

void Interpreter::exec_aug_assign(const AugAssignStmt& stmt, Frame& frame) {
    const auto& target = *stmt.target;
    switch (target.kind) {
    case NodeKind::Name: {
        const auto& name = static_cast<const NameExpr&>(target).id;
        auto cur = load_name(name, frame);
        auto rhs = eval(*stmt.value, frame);
        store_name(name, inplace_op(cur, stmt.op, rhs), frame);
        return;
    }
    case NodeKind::Subscript: {
        const auto& subscript = static_cast<const SubscriptExpr&>(target);
        auto obj = eval(*subscript.value, frame);
        if (subscript.slice->kind == NodeKind::Slice) {
            auto slice = eval_slice(static_cast<const SliceExpr&>(*subscript.slice), frame);
            auto cur = get_slice(obj, slice);
            auto rhs = eval(*stmt.value, frame);
            set_slice(obj, slice, inplace_op(cur, stmt.op, rhs));
        } else {
            auto key = eval(*subscript.slice, frame);
            auto cur = get_item(obj, key);
            auto rhs = eval(*stmt.value, frame);
            set_item(obj, key, inplace_op(cur, stmt.op, rhs));
        }
        return;
    }
    case NodeKind::Attribute: {
        const auto& attribute = static_cast<const AttributeExpr&>(target);
        auto obj = eval(*attribute.value, frame);
        (void)get_attribute(obj, attribute.attr);
        raise(
            ExceptionKind::ATTRIBUTE_ERROR,
            "'",
            type_name(obj),
            "' object attribute '",
            attribute.attr,
            "' is read-only"
        );
    }
    default: THROW("unexpected augmented assignment target: ", node_kind_name(target.kind));
    }
}

void Interpreter::exec_function_def(const FunctionDefStmt& stmt, Frame& frame) {
    std::vector<Value> decorators;
    for (const auto& decorator : stmt.decorator_list) {
        decorators.emplace_back(eval(*decorator, frame));
    }
    auto func = make_function(stmt.name, stmt, *stmt.args, &stmt.body, nullptr, frame);
    if (stmt.returns) {
        (void)eval(*stmt.returns, frame);
    }
    for (auto it = decorators.rbegin(); it != decorators.rend(); ++it) {
        std::vector<Value> args;
        args.emplace_back(std::move(func));
        func = call(*it, std::move(args), {});
    }
    store_name(stmt.name, std::move(func), frame);
}

Value Interpreter::make_function(
    std::string name,
    const Node& node,
    const Arguments& args,
    const Body* body,
    const Expr* lambda_body,
    Frame& frame
) {
    auto obj = heap_.make<FunctionObject>();
    auto& func = static_cast<FunctionObject&>(*obj);
    func.name = std::move(name);
    func.args = &args;
    func.body = body;
    func.lambda_body = lambda_body;
    func.scope_info = &scopes_.scope_of(node);
    for (const auto& def : args.defaults) {
        func.defaults.emplace_back(eval(*def, frame));
    }
    for (const auto& def : args.kw_defaults) {
        if (def) {
            func.kw_defaults.emplace_back(eval(*def, frame));
        } else {
            func.kw_defaults.emplace_back(std::nullopt);
        }
    }
    auto eval_annotation = [&](const std::unique_ptr<Arg>& arg) {
        if (arg and arg->annotation) {
            (void)eval(*arg->annotation, frame);
        }
    };
    for (const auto* list : {&args.posonlyargs, &args.args, &args.kwonlyargs}) {
        for (const auto& arg : *list) {
            eval_annotation(arg);
        }
    }
    eval_annotation(args.vararg);
    eval_annotation(args.kwarg);
    if (frame.scope.info->kind != ScopeInfo::Kind::MODULE) {
        func.closure = frame.scope_ref;
    }
    return obj;
}

/* Assignment */

void Interpreter::assign(const Expr& target, Value val, Frame& frame) {
    switch (target.kind) {
    case NodeKind::Name: store_name(static_cast<const NameExpr&>(target).id, std::move(val), frame); return;
    case NodeKind::Tuple:
    case NodeKind::List: unpack(static_cast<const CollectionExpr&>(target), val, frame); return;
    case NodeKind::Subscript: {
        const auto& subscript = static_cast<const SubscriptExpr&>(target);
        auto obj = eval(*subscript.value, frame);
        if (subscript.slice->kind == NodeKind::Slice) {
            auto slice = eval_slice(static_cast<const SliceExpr&>(*subscript.slice), frame);
            set_slice(obj, slice, val);
        } else {
            auto key = eval(*subscript.slice, frame);
            set_item(obj, key, std::move(val));
        }
        return;
    }
    case NodeKind::Attribute: {
        const auto& attribute = static_cast<const AttributeExpr&>(target);
        auto obj = eval(*attribute.value, frame);
        raise(
            ExceptionKind::ATTRIBUTE_ERROR,
            "'",
            type_name(obj),
            "' object has no attribute '",
            attribute.attr,
            "'"
        );
    }
    default: THROW("unexpected assignment target: ", node_kind_name(target.kind));
    }
}

void Interpreter::unpack(const CollectionExpr& target, const Value& val, Frame& frame) {
    if (not is_iterable(val)) {
        raise(ExceptionKind::TYPE_ERROR, "cannot unpack non-iterable ", type_name(val), " object");
    }
    auto items = to_vector(val);
    const auto& elts = target.elts;
    auto star = std::find_if(elts.begin(), elts.end(), [](const ExprPtr& elt) {
        return elt->kind == NodeKind::Starred;
    });
    if (star == elts.end()) {
        if (items.size() < elts.size()) {
            raise(
                ExceptionKind::VALUE_ERROR,
                "not enough values to unpack (expected ",
                elts.size(),
                ", got ",
                items.size(),
                ")"
            );
        }
        if (items.size() > elts.size()) {
            raise(ExceptionKind::VALUE_ERROR, "too many values to unpack (expected ", elts.size(), ")");
        }
        for (size_t i = 0; i < elts.size(); ++i) {
            assign(*elts[i], std::move(items[i]), frame);
        }
        return;
    }
    size_t before = star - elts.begin();
    size_t after = elts.size() - before - 1;
    if (items.size() < before + after) {
        raise(
            ExceptionKind::VALUE_ERROR,
            "not enough values to unpack (expected at least ",
            before + after,
            ", got ",
            items.size(),
            ")"
        );
    }
    for (size_t i = 0; i < before; ++i) {
        assign(*elts[i], std::move(items[i]), frame);
    }
    std::vector<Value> rest(
        std::make_move_iterator(items.begin() + static_cast<ptrdiff_t>(before)),
        std::make_move_iterator(items.end() - static_cast<ptrdiff_t>(after))
    );
    assign(*static_cast<const StarredExpr&>(**star).value, new_list(std::move(rest)), frame);
    for (size_t i = 0; i < after; ++i) {
        assign(*elts[before + 1 + i], std::move(items[items.size() - after + i]), frame);
    }
}

/* Comprehensions */

Value Interpreter::eval_comprehension(const ComprehensionExpr& expr, Frame& frame) {
    auto first_iter = get_iter(eval(*expr.generators.front()->iter, frame));
    Frame inner{make_scope(scopes_.scope_of(expr), frame)};
    switch (expr.kind) {
    case NodeKind::ListComp: {
        auto res = new_list({});
        auto& list = *as<ListObject>(res);
        run_generators(expr, 0, std::move(first_iter), inner, [&] {
            list.items.emplace_back(eval(*expr.elt, inner));
            recharge(list);
        });
        return res;
    }
    case NodeKind::SetComp: {
        auto res = new_set();
        auto& set = *as<SetObject>(res);
        run_generators(expr, 0, std::move(first_iter), inner, [&] {
            set.table.insert(eval(*expr.elt, inner), NoneType{});
            recharge(set);
        });
        return res;
    }
    case NodeKind::DictComp: {
        auto res = new_dict();
        auto& dict = *as<DictObject>(res);
        run_generators(expr, 0, std::move(first_iter), inner, [&] {
            auto key = eval(*expr.key, inner);
            auto val = eval(*expr.elt, inner);
            dict.table.insert(std::move(key), std::move(val));
            recharge(dict);
        });
        return res;
    }
    case NodeKind::GeneratorExp: {
        // Generator expressions are evaluated eagerly, their values are then
        // served by an iterator
        auto values = new_tuple({});
        auto& tuple = *as<TupleObject>(values);
        run_generators(expr, 0, std::move(first_iter), inner, [&] {
            tuple.items.emplace_back(eval(*expr.elt, inner));
            recharge(tuple);
        });
        auto iter = heap_.make<IteratorObject>(IteratorObject::Source::GENERATOR);
        static_cast<IteratorObject&>(*iter).target = std::get<ObjRef>(values);
        return iter;
    }
    default: THROW("unexpected comprehension: ", node_kind_name(expr.kind));
    }
}

void Interpreter::run_generators(
    const ComprehensionExpr& expr,
    size_t idx,
    ObjRef iter,
    Frame& frame,
    const std::function<void()>& emit
) {
    const auto& gen = *expr.generators[idx];
    auto& it = static_cast<IteratorObject&>(*iter);
    for (;;) {
        tick();
        auto val = next(it);
        if (not val) {
            return;
        }
        assign(*gen.target, std::move(*val), frame);
        bool selected = std::all_of(gen.ifs.begin(), gen.ifs.end(), [&](const ExprPtr& cond) {
            return is_truthy(eval(*cond, frame));
        });
        if (not selected) {
            continue;
        }
        if (idx + 1 == expr.generators.size()) {
            emit();
        } else {
            run_generators(
                expr, idx + 1, get_iter(eval(*expr.generators[idx + 1]->iter, frame)), frame, emit
            );
        }
    }
}

/* Calls */

Value Interpreter::call_function(FunctionObject& func, std::vector<Value> args, KwArgs kwargs) {
    Frame frame{heap_.make<ScopeObject>(func.scope_info, func.closure)};
    bind_arguments(func, std::move(args), std::move(kwargs), frame.scope);
    if (func.lambda_body) {
        return eval(*func.lambda_body, frame);
    }
    if (exec_body(*func.body, frame) == ExecStatus::RETURN) {
        return std::move(frame.return_value);
    }
    return NoneType{};
}

void Interpreter::bind_arguments(
    FunctionObject& func, std::vector<Value> args, KwArgs kwargs, ScopeObject& scope
) {
    const Arguments& params = *func.args;
    std::vector<const Arg*> positional;
    for (const auto& arg : params.posonlyargs) {
        positional.emplace_back(arg.get());
    }
    for (const auto& arg : params.args) {
        positional.emplace_back(arg.get());
    }
    size_t posonly_num = params.posonlyargs.size();
    size_t pos_num = positional.size();
    size_t kwonly_num = params.kwonlyargs.size();
    size_t first_default = pos_num - func.defaults.size();

    if (args.size() > pos_num and not params.vararg) {
        bool exact = first_default == pos_num;
        auto takes = exact ? concat_tostr(pos_num) : concat_tostr("from ", first_default, " to ", pos_num);
        raise(
            ExceptionKind::TYPE_ERROR,
            func.name,
            "() takes ",
            takes,
            exact and pos_num == 1 ? " positional argument but " : " positional arguments but ",
            args.size(),
            args.size() == 1 ? " was given" : " were given"
        );
    }

    std::vector<std::optional<Value>> slots(pos_num + kwonly_num);
    for (size_t i = 0; i < std::min(args.size(), pos_num); ++i) {
        slots[i] = std::move(args[i]);
    }
    if (params.vararg) {
        std::vector<Value> rest;
        for (size_t i = pos_num; i < args.size(); ++i) {
            rest.emplace_back(std::move(args[i]));
        }
        scope.vars.insert_or_assign(params.vararg->name, new_tuple(std::move(rest)));
    }

    Value kwargs_dict;
    DictObject* kw_dict = nullptr;
    if (params.kwarg) {
        kwargs_dict = new_dict();
        kw_dict = as<DictObject>(kwargs_dict);
    }
    std::vector<std::string_view> posonly_passed_as_keyword;
    for (auto& kwarg : kwargs) {
        const auto& name = kwarg.first;
        auto& val = kwarg.second;
        auto find_slot = [&]() -> std::optional<size_t> {
            for (size_t i = posonly_num; i < pos_num; ++i) {
                if (positional[i]->name == name) {
                    return i;
                }
            }
            for (size_t i = 0; i < kwonly_num; ++i) {
                if (params.kwonlyargs[i]->name == name) {
                    return pos_num + i;
                }
            }
            return std::nullopt;
        };
        if (auto slot = find_slot()) {
            if (slots[*slot]) {
                raise(
                    ExceptionKind::TYPE_ERROR,
                    func.name,
                    "() got multiple values for argument '",
                    name,
                    "'"
                );
            }
            slots[*slot] = std::move(val);
            continue;
        }
        if (kw_dict) {
            kw_dict->table.insert(new_str(name), std::move(val));
            recharge(*kw_dict);
            continue;
        }
        bool is_posonly = std::any_of(
            params.posonlyargs.begin(),
            params.posonlyargs.end(),
            [&](const std::unique_ptr<Arg>& arg) { return arg->name == name; }
        );
        if (is_posonly) {
            posonly_passed_as_keyword.emplace_back(name);
            continue;
        }
        raise(
            ExceptionKind::TYPE_ERROR,
            func.name,
            "() got an unexpected keyword argument '",
            name,
            "'"
        );
    }
    if (not posonly_passed_as_keyword.empty()) {
        raise(
            ExceptionKind::TYPE_ERROR,
            func.name,
            "() got some positional-only arguments passed as keyword arguments: ",
            quoted_names(posonly_passed_as_keyword)
        );
    }

    std::vector<std::string_view> missing;
    for (size_t i = 0; i < pos_num; ++i) {
        if (slots[i]) {
            continue;
        }
        if (i >= first_default) {
            slots[i] = func.defaults[i - first_default];
        } else {
            missing.emplace_back(positional[i]->name);
        }
    }
    if (not missing.empty()) {
        raise(
            ExceptionKind::TYPE_ERROR,
            func.name,
            "() missing ",
            missing.size(),
            missing.size() == 1 ? " required positional argument: "
                                : " required positional arguments: ",
            quoted_names(missing)
        );
    }
    for (size_t i = 0; i < kwonly_num; ++i) {
        auto& slot = slots[pos_num + i];
        if (not slot) {
            if (func.kw_defaults[i]) {
                slot = *func.kw_defaults[i];
            } else {
                missing.emplace_back(params.kwonlyargs[i]->name);
            }
        }
    }
    if (not missing.empty()) {
        raise(
            ExceptionKind::TYPE_ERROR,
            func.name,
            "() missing ",
            missing.size(),
            missing.size() == 1 ? " required keyword-only argument: "
                                : " required keyword-only arguments: ",
            quoted_names(missing)
        );
    }

    for (size_t i = 0; i < pos_num; ++i) {
        scope.vars.insert_or_assign(positional[i]->name, std::move(*slots[i]));
    }
    for (size_t i = 0; i < kwonly_num; ++i) {
        scope.vars.insert_or_assign(params.kwonlyargs[i]->name, std::move(*slots[pos_num + i]));
    }
    if (params.kwarg) {
        scope.vars.insert_or_assign(params.kwarg->name, std::move(kwargs_dict));
    }
}

} // namespace chk::lang
