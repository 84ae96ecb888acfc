#include <chklib/concat_tostr.hh>
#include <chklib/lang/literal.hh>
#include <chklib/lang/operations.hh>
#include <chklib/lang/parser.hh>
#include <chklib/overloaded.hh>
#include <limits>
#include <stdexcept>

namespace chk::lang {
namespace {

class MalformedLiteral : public std::runtime_error {
public:
    explicit MalformedLiteral(const Node& node)
    : runtime_error(
          concat_tostr("malformed node or string on line ", node.line, ": ", node_kind_name(node.kind))
      ) {}
};

LiteralValue number_from(const Expr& expr) {
    if (expr.kind == NodeKind::Constant) {
        const auto& value = static_cast<const ConstantExpr&>(expr).value;
        if (const auto* i = std::get_if<int64_t>(&value)) {
            return {.value = *i};
        }
        if (const auto* d = std::get_if<double>(&value)) {
            return {.value = *d};
        }
    }
    throw MalformedLiteral(expr);
}

LiteralValue convert(const Expr& expr) {
    switch (expr.kind) {
    case NodeKind::Constant: {
        return std::visit(
            overloaded{
                [&](const EllipsisType&) -> LiteralValue { throw MalformedLiteral(expr); },
                [](const StrPtr& s) -> LiteralValue { return {.value = *s}; },
                [](const auto& v) -> LiteralValue { return {.value = v}; },
            },
            static_cast<const ConstantExpr&>(expr).value
        );
    }
    case NodeKind::UnaryOp: {
        const auto& unary = static_cast<const UnaryOpExpr&>(expr);
        if (unary.op != UnaryOperator::USUB and unary.op != UnaryOperator::UADD) {
            throw MalformedLiteral(expr);
        }
        auto res = number_from(*unary.operand);
        if (unary.op == UnaryOperator::USUB) {
            if (auto* i = std::get_if<int64_t>(&res.value)) {
                if (*i == std::numeric_limits<int64_t>::min()) {
                    throw MalformedLiteral(expr);
                }
                *i = -*i;
            } else {
                auto& d = std::get<double>(res.value);
                d = -d;
            }
        }
        return res;
    }
    case NodeKind::List:
    case NodeKind::Tuple:
    case NodeKind::Set: {
        std::vector<LiteralValue> items;
        for (const auto& elt : static_cast<const CollectionExpr&>(expr).elts) {
            items.emplace_back(convert(*elt));
        }
        switch (expr.kind) {
        case NodeKind::List: return {.value = LiteralValue::List{std::move(items)}};
        case NodeKind::Tuple: return {.value = LiteralValue::Tuple{std::move(items)}};
        default: return {.value = LiteralValue::Set{std::move(items)}};
        }
    }
    case NodeKind::Dict: {
        const auto& dict = static_cast<const DictExpr&>(expr);
        LiteralValue::Dict res;
        for (size_t i = 0; i < dict.keys.size(); ++i) {
            if (not dict.keys[i]) {
                throw MalformedLiteral(*dict.values[i]);
            }
            res.keys.emplace_back(convert(*dict.keys[i]));
            res.values.emplace_back(convert(*dict.values[i]));
        }
        return {.value = std::move(res)};
    }
    case NodeKind::Call: {
        // set() is the only way to write an empty set
        const auto& call = static_cast<const CallExpr&>(expr);
        if (call.func->kind == NodeKind::Name and
            static_cast<const NameExpr&>(*call.func).id == "set" and call.args.empty() and
            call.keywords.empty())
        {
            return {.value = LiteralValue::Set{}};
        }
        throw MalformedLiteral(expr);
    }
    default: throw MalformedLiteral(expr);
    }
}

Result<LiteralValue, std::string> convert_parsed(Result<ExprPtr, SyntaxError> parsed) {
    if (parsed.is_err()) {
        auto err = std::move(parsed).unwrap_err();
        return Err{concat_tostr("line ", err.line, ": ", err.message)};
    }
    auto expr = std::move(parsed).unwrap();
    try {
        return Ok{convert(*expr)};
    } catch (const MalformedLiteral& e) {
        return Err{std::string{e.what()}};
    }
}

void repr_items(std::string& out, const std::vector<LiteralValue>& items) {
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += repr(items[i]);
    }
}

} // namespace

Result<LiteralValue, std::string> parse_literal(std::string_view text) {
    return convert_parsed(parse_expression(text));
}

Result<LiteralValue, std::string> parse_literal(std::vector<Token> tokens) {
    return convert_parsed(parse_expression(std::move(tokens)));
}

std::string repr(const LiteralValue& val) {
    return std::visit(
        overloaded{
            [](const NoneType&) -> std::string { return "None"; },
            [](bool b) -> std::string { return b ? "True" : "False"; },
            [](int64_t i) -> std::string { return concat_tostr(i); },
            [](double d) { return float_repr(d); },
            [](const std::string& s) {
                return repr(Value{std::make_shared<const std::string>(s)});
            },
            [](const LiteralValue::List& list) {
                std::string res = "[";
                repr_items(res, list.items);
                return res += ']';
            },
            [](const LiteralValue::Tuple& tuple) {
                std::string res = "(";
                repr_items(res, tuple.items);
                if (tuple.items.size() == 1) {
                    res += ',';
                }
                return res += ')';
            },
            [](const LiteralValue::Set& set) {
                if (set.items.empty()) {
                    return std::string{"set()"};
                }
                std::string res = "{";
                repr_items(res, set.items);
                return res += '}';
            },
            [](const LiteralValue::Dict& dict) {
                std::string res = "{";
                for (size_t i = 0; i < dict.keys.size(); ++i) {
                    if (i > 0) {
                        res += ", ";
                    }
                    res += repr(dict.keys[i]);
                    res += ": ";
                    res += repr(dict.values[i]);
                }
                return res += '}';
            },
        },
        val.value
    );
}

} // namespace chk::lang
