#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace chk::lang {

// Node kinds are named after the classes of Python's ast module, so that
// structure rules can refer to them by those names
enum class NodeKind : uint8_t {
    Module,
    // Statements
    FunctionDef,
    ClassDef,
    Return,
    Delete,
    Assign,
    AugAssign,
    AnnAssign,
    For,
    While,
    If,
    With,
    Raise,
    Try,
    Assert,
    Import,
    ImportFrom,
    Global,
    Nonlocal,
    Expr,
    Pass,
    Break,
    Continue,
    // Expressions
    BoolOp,
    BinOp,
    UnaryOp,
    Lambda,
    IfExp,
    Dict,
    Set,
    ListComp,
    SetComp,
    DictComp,
    GeneratorExp,
    Compare,
    Call,
    JoinedStr,
    FormattedValue,
    Constant,
    Attribute,
    Subscript,
    Starred,
    Name,
    List,
    Tuple,
    Slice,
    // Helper nodes
    arguments,
    arg,
    keyword,
    comprehension,
    ExceptHandler,
    alias,
    withitem,
};

std::string_view node_kind_name(NodeKind kind) noexcept;

enum class BinaryOperator : uint8_t {
    ADD,
    SUB,
    MULT,
    MAT_MULT,
    DIV,
    MOD,
    POW,
    LSHIFT,
    RSHIFT,
    BIT_OR,
    BIT_XOR,
    BIT_AND,
    FLOOR_DIV,
};

enum class UnaryOperator : uint8_t {
    INVERT,
    NOT,
    UADD,
    USUB,
};

enum class BoolOperator : uint8_t {
    AND,
    OR,
};

enum class CompareOperator : uint8_t {
    EQ,
    NOT_EQ,
    LT,
    LT_E,
    GT,
    GT_E,
    IS,
    IS_NOT,
    IN,
    NOT_IN,
};

// Python's ast class name of the operator, e.g. "Add"
std::string_view operator_node_name(BinaryOperator op) noexcept;
std::string_view operator_node_name(UnaryOperator op) noexcept;
std::string_view operator_node_name(BoolOperator op) noexcept;
std::string_view operator_node_name(CompareOperator op) noexcept;

// Source form of the operator, e.g. "+"
std::string_view operator_symbol(BinaryOperator op) noexcept;
std::string_view operator_symbol(UnaryOperator op) noexcept;
std::string_view operator_symbol(CompareOperator op) noexcept;

struct NoneType {
    constexpr bool operator==(const NoneType&) const noexcept = default;
};

struct EllipsisType {
    constexpr bool operator==(const EllipsisType&) const noexcept = default;
};

using StrPtr = std::shared_ptr<const std::string>;

using ConstantValue = std::variant<NoneType, EllipsisType, bool, int64_t, double, StrPtr>;

struct Node {
    const NodeKind kind;
    const size_t line;

    Node(NodeKind kind, size_t line) noexcept : kind{kind}, line{line} {}

    Node(const Node&) = delete;
    Node(Node&&) = delete;
    Node& operator=(const Node&) = delete;
    Node& operator=(Node&&) = delete;

    virtual ~Node() = default;
};

struct Expr : Node {
    using Node::Node;
};

struct Stmt : Node {
    using Node::Node;
};

using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;
using Body = std::vector<StmtPtr>;

/* Helper nodes */

struct Arg : Node {
    std::string name;
    ExprPtr annotation; // may be null

    explicit Arg(size_t line) noexcept : Node{NodeKind::arg, line} {}
};

struct Arguments : Node {
    std::vector<std::unique_ptr<Arg>> posonlyargs;
    std::vector<std::unique_ptr<Arg>> args;
    std::unique_ptr<Arg> vararg; // may be null
    std::vector<std::unique_ptr<Arg>> kwonlyargs;
    std::vector<ExprPtr> kw_defaults; // parallel to kwonlyargs, null for no default
    std::unique_ptr<Arg> kwarg; // may be null
    std::vector<ExprPtr> defaults; // for the last posonlyargs + args

    explicit Arguments(size_t line) noexcept : Node{NodeKind::arguments, line} {}
};

struct Keyword : Node {
    std::optional<std::string> arg; // nullopt for **mapping
    ExprPtr value;

    explicit Keyword(size_t line) noexcept : Node{NodeKind::keyword, line} {}
};

struct Comprehension : Node {
    ExprPtr target;
    ExprPtr iter;
    std::vector<ExprPtr> ifs;

    explicit Comprehension(size_t line) noexcept : Node{NodeKind::comprehension, line} {}
};

struct ExceptHandler : Node {
    ExprPtr type; // may be null
    std::optional<std::string> name;
    Body body;

    explicit ExceptHandler(size_t line) noexcept : Node{NodeKind::ExceptHandler, line} {}
};

struct Alias : Node {
    std::string name;
    std::optional<std::string> asname;

    explicit Alias(size_t line) noexcept : Node{NodeKind::alias, line} {}
};

struct WithItem : Node {
    ExprPtr context_expr;
    ExprPtr optional_vars; // may be null

    explicit WithItem(size_t line) noexcept : Node{NodeKind::withitem, line} {}
};

/* Expressions */

struct BoolOpExpr : Expr {
    BoolOperator op{};
    std::vector<ExprPtr> values;

    explicit BoolOpExpr(size_t line) noexcept : Expr{NodeKind::BoolOp, line} {}
};

struct BinOpExpr : Expr {
    ExprPtr left;
    BinaryOperator op{};
    ExprPtr right;

    explicit BinOpExpr(size_t line) noexcept : Expr{NodeKind::BinOp, line} {}
};

struct UnaryOpExpr : Expr {
    UnaryOperator op{};
    ExprPtr operand;

    explicit UnaryOpExpr(size_t line) noexcept : Expr{NodeKind::UnaryOp, line} {}
};

struct LambdaExpr : Expr {
    std::unique_ptr<Arguments> args;
    ExprPtr body;

    explicit LambdaExpr(size_t line) noexcept : Expr{NodeKind::Lambda, line} {}
};

struct IfExpExpr : Expr {
    ExprPtr test;
    ExprPtr body;
    ExprPtr orelse;

    explicit IfExpExpr(size_t line) noexcept : Expr{NodeKind::IfExp, line} {}
};

struct DictExpr : Expr {
    std::vector<ExprPtr> keys; // null key means **mapping in values
    std::vector<ExprPtr> values;

    explicit DictExpr(size_t line) noexcept : Expr{NodeKind::Dict, line} {}
};

// List, Tuple or Set display
struct CollectionExpr : Expr {
    std::vector<ExprPtr> elts;

    CollectionExpr(NodeKind kind, size_t line) noexcept : Expr{kind, line} {}
};

// ListComp, SetComp, DictComp or GeneratorExp
struct ComprehensionExpr : Expr {
    ExprPtr key; // DictComp only
    ExprPtr elt; // value for DictComp
    std::vector<std::unique_ptr<Comprehension>> generators;

    ComprehensionExpr(NodeKind kind, size_t line) noexcept : Expr{kind, line} {}
};

struct CompareExpr : Expr {
    ExprPtr left;
    std::vector<CompareOperator> ops;
    std::vector<ExprPtr> comparators;

    explicit CompareExpr(size_t line) noexcept : Expr{NodeKind::Compare, line} {}
};

struct CallExpr : Expr {
    ExprPtr func;
    std::vector<ExprPtr> args; // may contain StarredExpr
    std::vector<std::unique_ptr<Keyword>> keywords;

    explicit CallExpr(size_t line) noexcept : Expr{NodeKind::Call, line} {}
};

struct JoinedStrExpr : Expr {
    std::vector<ExprPtr> values; // ConstantExpr (str) and FormattedValueExpr

    explicit JoinedStrExpr(size_t line) noexcept : Expr{NodeKind::JoinedStr, line} {}
};

struct FormattedValueExpr : Expr {
    ExprPtr value;
    char conversion = 0; // 0, 's', 'r' or 'a'
    std::unique_ptr<JoinedStrExpr> format_spec; // may be null

    explicit FormattedValueExpr(size_t line) noexcept : Expr{NodeKind::FormattedValue, line} {}
};

struct ConstantExpr : Expr {
    ConstantValue value;

    ConstantExpr(size_t line, ConstantValue value) noexcept
    : Expr{NodeKind::Constant, line}
    , value{std::move(value)} {}
};

struct AttributeExpr : Expr {
    ExprPtr value;
    std::string attr;

    explicit AttributeExpr(size_t line) noexcept : Expr{NodeKind::Attribute, line} {}
};

struct SubscriptExpr : Expr {
    ExprPtr value;
    ExprPtr slice;

    explicit SubscriptExpr(size_t line) noexcept : Expr{NodeKind::Subscript, line} {}
};

struct StarredExpr : Expr {
    ExprPtr value;

    explicit StarredExpr(size_t line) noexcept : Expr{NodeKind::Starred, line} {}
};

struct NameExpr : Expr {
    std::string id;

    NameExpr(size_t line, std::string id) noexcept : Expr{NodeKind::Name, line}, id{std::move(id)} {}
};

struct SliceExpr : Expr {
    ExprPtr lower; // may be null
    ExprPtr upper; // may be null
    ExprPtr step; // may be null

    explicit SliceExpr(size_t line) noexcept : Expr{NodeKind::Slice, line} {}
};

/* Statements */

struct FunctionDefStmt : Stmt {
    std::string name;
    std::unique_ptr<Arguments> args;
    Body body;
    std::vector<ExprPtr> decorator_list;
    ExprPtr returns; // may be null

    explicit FunctionDefStmt(size_t line) noexcept : Stmt{NodeKind::FunctionDef, line} {}
};

struct ClassDefStmt : Stmt {
    std::string name;
    std::vector<ExprPtr> bases;
    std::vector<std::unique_ptr<Keyword>> keywords;
    Body body;
    std::vector<ExprPtr> decorator_list;

    explicit ClassDefStmt(size_t line) noexcept : Stmt{NodeKind::ClassDef, line} {}
};

struct ReturnStmt : Stmt {
    ExprPtr value; // may be null

    explicit ReturnStmt(size_t line) noexcept : Stmt{NodeKind::Return, line} {}
};

struct DeleteStmt : Stmt {
    std::vector<ExprPtr> targets;

    explicit DeleteStmt(size_t line) noexcept : Stmt{NodeKind::Delete, line} {}
};

struct AssignStmt : Stmt {
    std::vector<ExprPtr> targets;
    ExprPtr value;

    explicit AssignStmt(size_t line) noexcept : Stmt{NodeKind::Assign, line} {}
};

struct AugAssignStmt : Stmt {
    ExprPtr target;
    BinaryOperator op{};
    ExprPtr value;

    explicit AugAssignStmt(size_t line) noexcept : Stmt{NodeKind::AugAssign, line} {}
};

struct AnnAssignStmt : Stmt {
    ExprPtr target;
    ExprPtr annotation;
    ExprPtr value; // may be null

    explicit AnnAssignStmt(size_t line) noexcept : Stmt{NodeKind::AnnAssign, line} {}
};

struct ForStmt : Stmt {
    ExprPtr target;
    ExprPtr iter;
    Body body;
    Body orelse;

    explicit ForStmt(size_t line) noexcept : Stmt{NodeKind::For, line} {}
};

struct WhileStmt : Stmt {
    ExprPtr test;
    Body body;
    Body orelse;

    explicit WhileStmt(size_t line) noexcept : Stmt{NodeKind::While, line} {}
};

struct IfStmt : Stmt {
    ExprPtr test;
    Body body;
    Body orelse;

    explicit IfStmt(size_t line) noexcept : Stmt{NodeKind::If, line} {}
};

struct WithStmt : Stmt {
    std::vector<std::unique_ptr<WithItem>> items;
    Body body;

    explicit WithStmt(size_t line) noexcept : Stmt{NodeKind::With, line} {}
};

struct RaiseStmt : Stmt {
    ExprPtr exc; // may be null
    ExprPtr cause; // may be null

    explicit RaiseStmt(size_t line) noexcept : Stmt{NodeKind::Raise, line} {}
};

struct TryStmt : Stmt {
    Body body;
    std::vector<std::unique_ptr<ExceptHandler>> handlers;
    Body orelse;
    Body finalbody;

    explicit TryStmt(size_t line) noexcept : Stmt{NodeKind::Try, line} {}
};

struct AssertStmt : Stmt {
    ExprPtr test;
    ExprPtr msg; // may be null

    explicit AssertStmt(size_t line) noexcept : Stmt{NodeKind::Assert, line} {}
};

struct ImportStmt : Stmt {
    std::vector<std::unique_ptr<Alias>> names;

    explicit ImportStmt(size_t line) noexcept : Stmt{NodeKind::Import, line} {}
};

struct ImportFromStmt : Stmt {
    std::optional<std::string> module;
    std::vector<std::unique_ptr<Alias>> names;
    size_t level = 0;

    explicit ImportFromStmt(size_t line) noexcept : Stmt{NodeKind::ImportFrom, line} {}
};

// Global or Nonlocal
struct NamesStmt : Stmt {
    std::vector<std::string> names;

    NamesStmt(NodeKind kind, size_t line) noexcept : Stmt{kind, line} {}
};

struct ExprStmt : Stmt {
    ExprPtr value;

    explicit ExprStmt(size_t line) noexcept : Stmt{NodeKind::Expr, line} {}
};

// Pass, Break or Continue
struct SimpleStmt : Stmt {
    SimpleStmt(NodeKind kind, size_t line) noexcept : Stmt{kind, line} {}
};

struct Module : Node {
    Body body;

    Module() noexcept : Node{NodeKind::Module, 1} {}
};

/**
 * @brief Calls @p func on every direct child of @p node
 * @details Children are visited in source order. Operators are not nodes
 *   here, see operator_node_name().
 */
void for_each_child(const Node& node, const std::function<void(const Node&)>& func);

} // namespace chk::lang
