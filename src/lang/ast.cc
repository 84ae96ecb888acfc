#include <chklib/lang/ast.hh>

namespace chk::lang {

std::string_view node_kind_name(NodeKind kind) noexcept {
    switch (kind) {
    case NodeKind::Module: return "Module";
    case NodeKind::FunctionDef: return "FunctionDef";
    case NodeKind::ClassDef: return "ClassDef";
    case NodeKind::Return: return "Return";
    case NodeKind::Delete: return "Delete";
    case NodeKind::Assign: return "Assign";
    case NodeKind::AugAssign: return "AugAssign";
    case NodeKind::AnnAssign: return "AnnAssign";
    case NodeKind::For: return "For";
    case NodeKind::While: return "While";
    case NodeKind::If: return "If";
    case NodeKind::With: return "With";
    case NodeKind::Raise: return "Raise";
    case NodeKind::Try: return "Try";
    case NodeKind::Assert: return "Assert";
    case NodeKind::Import: return "Import";
    case NodeKind::ImportFrom: return "ImportFrom";
    case NodeKind::Global: return "Global";
    case NodeKind::Nonlocal: return "Nonlocal";
    case NodeKind::Expr: return "Expr";
    case NodeKind::Pass: return "Pass";
    case NodeKind::Break: return "Break";
    case NodeKind::Continue: return "Continue";
    case NodeKind::BoolOp: return "BoolOp";
    case NodeKind::BinOp: return "BinOp";
    case NodeKind::UnaryOp: return "UnaryOp";
    case NodeKind::Lambda: return "Lambda";
    case NodeKind::IfExp: return "IfExp";
    case NodeKind::Dict: return "Dict";
    case NodeKind::Set: return "Set";
    case NodeKind::ListComp: return "ListComp";
    case NodeKind::SetComp: return "SetComp";
    case NodeKind::DictComp: return "DictComp";
    case NodeKind::GeneratorExp: return "GeneratorExp";
    case NodeKind::Compare: return "Compare";
    case NodeKind::Call: return "Call";
    case NodeKind::JoinedStr: return "JoinedStr";
    case NodeKind::FormattedValue: return "FormattedValue";
    case NodeKind::Constant: return "Constant";
    case NodeKind::Attribute: return "Attribute";
    case NodeKind::Subscript: return "Subscript";
    case NodeKind::Starred: return "Starred";
    case NodeKind::Name: return "Name";
    case NodeKind::List: return "List";
    case NodeKind::Tuple: return "Tuple";
    case NodeKind::Slice: return "Slice";
    case NodeKind::arguments: return "arguments";
    case NodeKind::arg: return "arg";
    case NodeKind::keyword: return "keyword";
    case NodeKind::comprehension: return "comprehension";
    case NodeKind::ExceptHandler: return "ExceptHandler";
    case NodeKind::alias: return "alias";
    case NodeKind::withitem: return "withitem";
    }
    return "unknown";
}

std::string_view operator_node_name(BinaryOperator op) noexcept {
    switch (op) {
    case BinaryOperator::ADD: return "Add";
    case BinaryOperator::SUB: return "Sub";
    case BinaryOperator::MULT: return "Mult";
    case BinaryOperator::MAT_MULT: return "MatMult";
    case BinaryOperator::DIV: return "Div";
    case BinaryOperator::MOD: return "Mod";
    case BinaryOperator::POW: return "Pow";
    case BinaryOperator::LSHIFT: return "LShift";
    case BinaryOperator::RSHIFT: return "RShift";
    case BinaryOperator::BIT_OR: return "BitOr";
    case BinaryOperator::BIT_XOR: return "BitXor";
    case BinaryOperator::BIT_AND: return "BitAnd";
    case BinaryOperator::FLOOR_DIV: return "FloorDiv";
    }
    return "unknown";
}

std::string_view operator_node_name(UnaryOperator op) noexcept {
    switch (op) {
    case UnaryOperator::INVERT: return "Invert";
    case UnaryOperator::NOT: return "Not";
    case UnaryOperator::UADD: return "UAdd";
    case UnaryOperator::USUB: return "USub";
    }
    return "unknown";
}

std::string_view operator_node_name(BoolOperator op) noexcept {
    switch (op) {
    case BoolOperator::AND: return "And";
    case BoolOperator::OR: return "Or";
    }
    return "unknown";
}

std::string_view operator_node_name(CompareOperator op) noexcept {
    switch (op) {
    case CompareOperator::EQ: return "Eq";
    case CompareOperator::NOT_EQ: return "NotEq";
    case CompareOperator::LT: return "Lt";
    case CompareOperator::LT_E: return "LtE";
    case CompareOperator::GT: return "Gt";
    case CompareOperator::GT_E: return "GtE";
    case CompareOperator::IS: return "Is";
    case CompareOperator::IS_NOT: return "IsNot";
    case CompareOperator::IN: return "In";
    case CompareOperator::NOT_IN: return "NotIn";
    }
    return "unknown";
}

std::string_view operator_symbol(BinaryOperator op) noexcept {
    switch (op) {
    case BinaryOperator::ADD: return "+";
    case BinaryOperator::SUB: return "-";
    case BinaryOperator::MULT: return "*";
    case BinaryOperator::MAT_MULT: return "@";
    case BinaryOperator::DIV: return "/";
    case BinaryOperator::MOD: return "%";
    case BinaryOperator::POW: return "** or pow()";
    case BinaryOperator::LSHIFT: return "<<";
    case BinaryOperator::RSHIFT: return ">>";
    case BinaryOperator::BIT_OR: return "|";
    case BinaryOperator::BIT_XOR: return "^";
    case BinaryOperator::BIT_AND: return "&";
    case BinaryOperator::FLOOR_DIV: return "//";
    }
    return "?";
}

std::string_view operator_symbol(UnaryOperator op) noexcept {
    switch (op) {
    case UnaryOperator::INVERT: return "~";
    case UnaryOperator::NOT: return "not";
    case UnaryOperator::UADD: return "+";
    case UnaryOperator::USUB: return "-";
    }
    return "?";
}

std::string_view operator_symbol(CompareOperator op) noexcept {
    switch (op) {
    case CompareOperator::EQ: return "==";
    case CompareOperator::NOT_EQ: return "!=";
    case CompareOperator::LT: return "<";
    case CompareOperator::LT_E: return "<=";
    case CompareOperator::GT: return ">";
    case CompareOperator::GT_E: return ">=";
    case CompareOperator::IS: return "is";
    case CompareOperator::IS_NOT: return "is not";
    case CompareOperator::IN: return "in";
    case CompareOperator::NOT_IN: return "not in";
    }
    return "?";
}

namespace {

template <class Ptr>
void visit_opt(const Ptr& ptr, const std::function<void(const Node&)>& func) {
    if (ptr) {
        func(*ptr);
    }
}

template <class Vec>
void visit_all(const Vec& vec, const std::function<void(const Node&)>& func) {
    for (const auto& ptr : vec) {
        visit_opt(ptr, func);
    }
}

} // namespace

void for_each_child(const Node& node, const std::function<void(const Node&)>& func) {
    switch (node.kind) {
    case NodeKind::Module: visit_all(static_cast<const Module&>(node).body, func); return;
    case NodeKind::FunctionDef: {
        const auto& n = static_cast<const FunctionDefStmt&>(node);
        visit_all(n.decorator_list, func);
        func(*n.args);
        visit_opt(n.returns, func);
        visit_all(n.body, func);
        return;
    }
    case NodeKind::ClassDef: {
        const auto& n = static_cast<const ClassDefStmt&>(node);
        visit_all(n.decorator_list, func);
        visit_all(n.bases, func);
        visit_all(n.keywords, func);
        visit_all(n.body, func);
        return;
    }
    case NodeKind::Return: visit_opt(static_cast<const ReturnStmt&>(node).value, func); return;
    case NodeKind::Delete: visit_all(static_cast<const DeleteStmt&>(node).targets, func); return;
    case NodeKind::Assign: {
        const auto& n = static_cast<const AssignStmt&>(node);
        visit_all(n.targets, func);
        func(*n.value);
        return;
    }
    case NodeKind::AugAssign: {
        const auto& n = static_cast<const AugAssignStmt&>(node);
        func(*n.target);
        func(*n.value);
        return;
    }
    case NodeKind::AnnAssign: {
        const auto& n = static_cast<const AnnAssignStmt&>(node);
        func(*n.target);
        func(*n.annotation);
        visit_opt(n.value, func);
        return;
    }
    case NodeKind::For: {
        const auto& n = static_cast<const ForStmt&>(node);
        func(*n.target);
        func(*n.iter);
        visit_all(n.body, func);
        visit_all(n.orelse, func);
        return;
    }
    case NodeKind::While: {
        const auto& n = static_cast<const WhileStmt&>(node);
        func(*n.test);
        visit_all(n.body, func);
        visit_all(n.orelse, func);
        return;
    }
    case NodeKind::If: {
        const auto& n = static_cast<const IfStmt&>(node);
        func(*n.test);
        visit_all(n.body, func);
        visit_all(n.orelse, func);
        return;
    }
    case NodeKind::With: {
        const auto& n = static_cast<const WithStmt&>(node);
        visit_all(n.items, func);
        visit_all(n.body, func);
        return;
    }
    case NodeKind::Raise: {
        const auto& n = static_cast<const RaiseStmt&>(node);
        visit_opt(n.exc, func);
        visit_opt(n.cause, func);
        return;
    }
    case NodeKind::Try: {
        const auto& n = static_cast<const TryStmt&>(node);
        visit_all(n.body, func);
        visit_all(n.handlers, func);
        visit_all(n.orelse, func);
        visit_all(n.finalbody, func);
        return;
    }
    case NodeKind::Assert: {
        const auto& n = static_cast<const AssertStmt&>(node);
        func(*n.test);
        visit_opt(n.msg, func);
        return;
    }
    case NodeKind::Import: visit_all(static_cast<const ImportStmt&>(node).names, func); return;
    case NodeKind::ImportFrom:
        visit_all(static_cast<const ImportFromStmt&>(node).names, func);
        return;
    case NodeKind::Expr: func(*static_cast<const ExprStmt&>(node).value); return;
    case NodeKind::Global:
    case NodeKind::Nonlocal:
    case NodeKind::Pass:
    case NodeKind::Break:
    case NodeKind::Continue:
    case NodeKind::Constant:
    case NodeKind::Name:
    case NodeKind::alias: return;
    case NodeKind::BoolOp: visit_all(static_cast<const BoolOpExpr&>(node).values, func); return;
    case NodeKind::BinOp: {
        const auto& n = static_cast<const BinOpExpr&>(node);
        func(*n.left);
        func(*n.right);
        return;
    }
    case NodeKind::UnaryOp: func(*static_cast<const UnaryOpExpr&>(node).operand); return;
    case NodeKind::Lambda: {
        const auto& n = static_cast<const LambdaExpr&>(node);
        func(*n.args);
        func(*n.body);
        return;
    }
    case NodeKind::IfExp: {
        const auto& n = static_cast<const IfExpExpr&>(node);
        func(*n.test);
        func(*n.body);
        func(*n.orelse);
        return;
    }
    case NodeKind::Dict: {
        const auto& n = static_cast<const DictExpr&>(node);
        for (size_t i = 0; i < n.values.size(); ++i) {
            visit_opt(n.keys[i], func);
            func(*n.values[i]);
        }
        return;
    }
    case NodeKind::Set:
    case NodeKind::List:
    case NodeKind::Tuple: visit_all(static_cast<const CollectionExpr&>(node).elts, func); return;
    case NodeKind::ListComp:
    case NodeKind::SetComp:
    case NodeKind::DictComp:
    case NodeKind::GeneratorExp: {
        const auto& n = static_cast<const ComprehensionExpr&>(node);
        visit_opt(n.key, func);
        func(*n.elt);
        visit_all(n.generators, func);
        return;
    }
    case NodeKind::Compare: {
        const auto& n = static_cast<const CompareExpr&>(node);
        func(*n.left);
        visit_all(n.comparators, func);
        return;
    }
    case NodeKind::Call: {
        const auto& n = static_cast<const CallExpr&>(node);
        func(*n.func);
        visit_all(n.args, func);
        visit_all(n.keywords, func);
        return;
    }
    case NodeKind::JoinedStr: visit_all(static_cast<const JoinedStrExpr&>(node).values, func); return;
    case NodeKind::FormattedValue: {
        const auto& n = static_cast<const FormattedValueExpr&>(node);
        func(*n.value);
        visit_opt(n.format_spec, func);
        return;
    }
    case NodeKind::Attribute: func(*static_cast<const AttributeExpr&>(node).value); return;
    case NodeKind::Subscript: {
        const auto& n = static_cast<const SubscriptExpr&>(node);
        func(*n.value);
        func(*n.slice);
        return;
    }
    case NodeKind::Starred: func(*static_cast<const StarredExpr&>(node).value); return;
    case NodeKind::Slice: {
        const auto& n = static_cast<const SliceExpr&>(node);
        visit_opt(n.lower, func);
        visit_opt(n.upper, func);
        visit_opt(n.step, func);
        return;
    }
    case NodeKind::arguments: {
        const auto& n = static_cast<const Arguments&>(node);
        visit_all(n.posonlyargs, func);
        visit_all(n.args, func);
        visit_opt(n.vararg, func);
        visit_all(n.kwonlyargs, func);
        visit_all(n.kw_defaults, func);
        visit_opt(n.kwarg, func);
        visit_all(n.defaults, func);
        return;
    }
    case NodeKind::arg: visit_opt(static_cast<const Arg&>(node).annotation, func); return;
    case NodeKind::keyword: func(*static_cast<const Keyword&>(node).value); return;
    case NodeKind::comprehension: {
        const auto& n = static_cast<const Comprehension&>(node);
        func(*n.target);
        func(*n.iter);
        visit_all(n.ifs, func);
        return;
    }
    case NodeKind::ExceptHandler: {
        const auto& n = static_cast<const ExceptHandler&>(node);
        visit_opt(n.type, func);
        visit_all(n.body, func);
        return;
    }
    case NodeKind::withitem: {
        const auto& n = static_cast<const WithItem&>(node);
        func(*n.context_expr);
        visit_opt(n.optional_vars, func);
        return;
    }
    }
}

} // namespace chk::lang
