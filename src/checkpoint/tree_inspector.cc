#include <chklib/checkpoint/tree_inspector.hh>

using chk::lang::NodeKind;

namespace chk {

namespace {

// Matches the node itself and the operators it carries
bool node_matches(const lang::Node& node, std::string_view node_kind) {
    if (lang::node_kind_name(node.kind) == node_kind) {
        return true;
    }
    switch (node.kind) {
    case NodeKind::BoolOp:
        return lang::operator_node_name(static_cast<const lang::BoolOpExpr&>(node).op) == node_kind;
    case NodeKind::BinOp:
        return lang::operator_node_name(static_cast<const lang::BinOpExpr&>(node).op) == node_kind;
    case NodeKind::AugAssign:
        return lang::operator_node_name(static_cast<const lang::AugAssignStmt&>(node).op) ==
            node_kind;
    case NodeKind::UnaryOp:
        return lang::operator_node_name(static_cast<const lang::UnaryOpExpr&>(node).op) ==
            node_kind;
    case NodeKind::Compare:
        for (auto op : static_cast<const lang::CompareExpr&>(node).ops) {
            if (lang::operator_node_name(op) == node_kind) {
                return true;
            }
        }
        return false;
    default: return false;
    }
}

bool walk(const lang::Node& node, std::string_view node_kind) {
    if (node_matches(node, node_kind)) {
        return true;
    }
    bool found = false;
    lang::for_each_child(node, [&](const lang::Node& child) {
        found = found or walk(child, node_kind);
    });
    return found;
}

template <class Enum>
bool is_operator_name(std::string_view name, Enum last) noexcept {
    for (int i = 0; i <= static_cast<int>(last); ++i) {
        if (lang::operator_node_name(static_cast<Enum>(i)) == name) {
            return true;
        }
    }
    return false;
}

} // namespace

bool contains_node_kind(const lang::Module& module, std::string_view node_kind) {
    return walk(module, node_kind);
}

bool is_known_node_kind(std::string_view node_kind) noexcept {
    for (int i = 0; i <= static_cast<int>(NodeKind::withitem); ++i) {
        if (lang::node_kind_name(static_cast<NodeKind>(i)) == node_kind) {
            return true;
        }
    }
    return is_operator_name(node_kind, lang::BinaryOperator::FLOOR_DIV) or
        is_operator_name(node_kind, lang::UnaryOperator::USUB) or
        is_operator_name(node_kind, lang::BoolOperator::OR) or
        is_operator_name(node_kind, lang::CompareOperator::NOT_IN);
}

} // namespace chk
