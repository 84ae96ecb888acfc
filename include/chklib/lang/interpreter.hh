#pragma once

#include <chklib/lang/ast.hh>
#include <chklib/lang/deadline.hh>
#include <chklib/lang/exceptions.hh>
#include <chklib/lang/heap.hh>
#include <chklib/lang/literal.hh>
#include <chklib/lang/scope_analysis.hh>
#include <chklib/lang/value.hh>
#include <chklib/limits.hh>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace chk::lang {

/**
 * @brief Tree-walking interpreter of the teaching language
 * @details The interpreter sees only the names of the capability whitelist
 *   and the names the executed code defines. Every value obtained from the
 *   interpreter has to be destroyed before the interpreter is, and the
 *   interpreter has to be used only by the thread that created it.
 *
 *   Errors of the executed code are thrown as RaisedException, the passing of
 *   the deadline as ExecutionTimeout.
 */
class Interpreter {
public:
    enum class ExecStatus : uint8_t {
        NORMAL,
        BREAK,
        CONTINUE,
        RETURN,
    };

private:
    struct Frame {
        ObjRef scope_ref;
        ScopeObject& scope;
        Value return_value;

        explicit Frame(ObjRef scope) noexcept
        : scope_ref{std::move(scope)}
        , scope{static_cast<ScopeObject&>(*scope_ref)} {}
    };

    // Evaluated parts of a slice, None for an omitted part
    struct SliceArgs {
        Value lower;
        Value upper;
        Value step;
    };

    struct SliceBounds {
        int64_t start;
        int64_t stop;
        int64_t step;
        int64_t length; // number of selected elements
    };

    Heap heap_; // has to outlive every other member
    const Module& module_;
    const ScopeTable& scopes_;
    const Deadline& deadline_;
    std::unordered_map<std::string_view, Value> builtins_;
    ObjRef module_scope_;
    std::vector<RaisedException> handling_; // exceptions whose handlers are running
    size_t call_depth_ = 0;
    uintptr_t stack_limit_ = 0; // lowest address native recursion may reach
    std::string output_;
    bool output_truncated_ = false;

public:
    Interpreter(
        const Module& module,
        const ScopeTable& scopes,
        const Deadline& deadline,
        size_t heap_limit_in_bytes = limits::heap_limit_in_bytes
    );

    Interpreter(const Interpreter&) = delete;
    Interpreter(Interpreter&&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;
    Interpreter& operator=(Interpreter&&) = delete;

    ~Interpreter() = default;

    // Executes the module's body
    void run_module();

    // Value of the module-level variable @p name
    [[nodiscard]] std::optional<Value> lookup_global(const std::string& name) const;

    [[nodiscard]] static bool is_callable(const Value& val) noexcept;

    Value call(const Value& callee, std::vector<Value> args, KwArgs kwargs);

    // Creates the value described by @p val in the interpreter's heap
    Value from_literal(const LiteralValue& val);

    // Text printed by the executed code
    [[nodiscard]] const std::string& output() const noexcept { return output_; }

    // Whether the printed text exceeded the capture limit and was cut
    [[nodiscard]] bool output_truncated() const noexcept { return output_truncated_; }

    [[nodiscard]] const Heap& heap() const noexcept { return heap_; }

private:
    void tick() const { deadline_.check(); }

    void enter_call();

    /* Values */

    Value new_str(std::string str);
    Value new_list(std::vector<Value> items);
    Value new_tuple(std::vector<Value> items);
    Value new_dict();
    Value new_set();

    // Charges @p obj for the memory its items use
    void recharge(ListObject& obj);
    void recharge(TupleObject& obj);
    void recharge(DictObject& obj);
    void recharge(SetObject& obj);

    [[noreturn]] void raise_key_error(const Value& key);

    // Instance of the exception being handled, created on first use
    ObjRef exception_instance(RaisedException& exc);

    /* Names */

    ObjRef make_scope(const ScopeInfo& info, Frame& frame);
    ScopeObject* find_enclosing(const std::string& name, const Frame& frame) const;
    Value load_name(const std::string& name, Frame& frame);
    Value load_global(const std::string& name);
    void store_name(const std::string& name, Value val, Frame& frame);
    void delete_name(const std::string& name, Frame& frame);
    void unbind_name(const std::string& name, Frame& frame) noexcept;

    /* Statements */

    ExecStatus exec_body(const Body& body, Frame& frame);
    ExecStatus exec(const Stmt& stmt, Frame& frame);
    ExecStatus exec_for(const ForStmt& stmt, Frame& frame);
    ExecStatus exec_while(const WhileStmt& stmt, Frame& frame);
    ExecStatus exec_try(const TryStmt& stmt, Frame& frame);
    ExecStatus exec_try_except(const TryStmt& stmt, Frame& frame);
    bool handler_matches(const ExceptHandler& handler, const RaisedException& exc, Frame& frame);
    ExecStatus run_handler(const ExceptHandler& handler, RaisedException& exc, Frame& frame);
    void exec_raise(const RaiseStmt& stmt, Frame& frame);
    void exec_delete(const Expr& target, Frame& frame);
    void exec_aug_assign(const AugAssignStmt& stmt, Frame& frame);
    void exec_function_def(const FunctionDefStmt& stmt, Frame& frame);

    void assign(const Expr& target, Value val, Frame& frame);
    void unpack(const CollectionExpr& target, const Value& val, Frame& frame);

    /* Expressions */

    Value eval(const Expr& expr, Frame& frame);
    Value eval_bool_op(const BoolOpExpr& expr, Frame& frame);
    Value eval_compare(const CompareExpr& expr, Frame& frame);
    Value eval_call(const CallExpr& expr, Frame& frame);
    std::vector<Value> eval_elements(const std::vector<ExprPtr>& elts, Frame& frame);
    Value eval_dict(const DictExpr& expr, Frame& frame);
    Value eval_comprehension(const ComprehensionExpr& expr, Frame& frame);
    void run_generators(
        const ComprehensionExpr& expr,
        size_t idx,
        ObjRef iter,
        Frame& frame,
        const std::function<void()>& emit
    );
    Value eval_joined_str(const JoinedStrExpr& expr, Frame& frame);
    Value eval_subscript(const SubscriptExpr& expr, Frame& frame);
    Value make_function(
        std::string name,
        const Node& node,
        const Arguments& args,
        const Body* body,
        const Expr* lambda_body,
        Frame& frame
    );

    Value binary_op(const Value& a, BinaryOperator op, const Value& b);
    Value inplace_op(const Value& a, BinaryOperator op, const Value& b);
    Value unary_op(UnaryOperator op, const Value& val);
    bool compare(const Value& a, CompareOperator op, const Value& b);
    bool contains(const Value& container, const Value& item);

    SliceArgs eval_slice(const SliceExpr& slice, Frame& frame);
    static SliceBounds slice_bounds(const SliceArgs& slice, int64_t length);
    Value get_item(const Value& obj, const Value& key);
    Value get_slice(const Value& obj, const SliceArgs& slice);
    void set_item(const Value& obj, const Value& key, Value val);
    void set_slice(const Value& obj, const SliceArgs& slice, const Value& val);
    void delete_item(const Value& obj, const Value& key);
    void delete_slice(const Value& obj, const SliceArgs& slice);
    Value get_attribute(const Value& obj, const std::string& name);

    /* Iteration */

    ObjRef get_iter(const Value& val);
    std::optional<Value> next(IteratorObject& it);
    std::vector<Value> to_vector(const Value& iterable);

    /* Calls */

    Value call_function(FunctionObject& func, std::vector<Value> args, KwArgs kwargs);
    void bind_arguments(
        FunctionObject& func, std::vector<Value> args, KwArgs kwargs, ScopeObject& scope
    );
    Value
    call_builtin(Builtin builtin, std::string_view name, std::vector<Value> args, KwArgs kwargs);
    Value
    call_method(const Value& self, std::string_view name, std::vector<Value> args, KwArgs kwargs);
    Value call_str_method(
        const StrPtr& self, std::string_view name, std::vector<Value>& args, KwArgs& kwargs
    );
    Value call_list_method(
        ListObject& self, std::string_view name, std::vector<Value>& args, KwArgs& kwargs
    );
    Value call_dict_method(
        DictObject& self,
        const Value& self_val,
        std::string_view name,
        std::vector<Value>& args,
        KwArgs& kwargs
    );
    Value call_set_method(
        SetObject& self, std::string_view name, std::vector<Value>& args, KwArgs& kwargs
    );

    void sort_values(std::vector<Value>& items, const Value& key, bool reverse);
    Value
    min_max(std::string_view name, std::vector<Value> args, KwArgs kwargs, CompareOperator op);
    void print(std::vector<Value> args, KwArgs kwargs);
};

// Name of the method @p name of @p val's type as a static string, nullopt if
// the type has no such method
std::optional<std::string_view> find_method(const Value& val, std::string_view name) noexcept;

} // namespace chk::lang
