#include "call_args.hh"

#include <algorithm>
#include <chklib/defer.hh>
#include <chklib/lang/format.hh>
#include <chklib/lang/interpreter.hh>
#include <chklib/lang/operations.hh>
#include <chklib/limits.hh>
#include <chklib/macros/throw.hh>
#include <cmath>
#include <limits>

namespace chk::lang {

namespace {

constexpr int64_t int64_min = std::numeric_limits<int64_t>::min();

bool is_int_like(const Value& val) noexcept {
    return std::holds_alternative<int64_t>(val) or std::holds_alternative<bool>(val);
}

bool is_numeric(const Value& val) noexcept {
    return is_int_like(val) or std::holds_alternative<double>(val);
}

int64_t int_of(const Value& val) noexcept {
    if (const auto* b = std::get_if<bool>(&val)) {
        return *b ? 1 : 0;
    }
    return std::get<int64_t>(val);
}

double float_of(const Value& val) noexcept {
    if (const auto* d = std::get_if<double>(&val)) {
        return *d;
    }
    return static_cast<double>(int_of(val));
}

int64_t checked_add(int64_t a, int64_t b) {
    int64_t res = 0;
    if (__builtin_add_overflow(a, b, &res)) {
        raise(ExceptionKind::OVERFLOW_ERROR, "integer overflow");
    }
    return res;
}

int64_t checked_sub(int64_t a, int64_t b) {
    int64_t res = 0;
    if (__builtin_sub_overflow(a, b, &res)) {
        raise(ExceptionKind::OVERFLOW_ERROR, "integer overflow");
    }
    return res;
}

int64_t checked_mul(int64_t a, int64_t b) {
    int64_t res = 0;
    if (__builtin_mul_overflow(a, b, &res)) {
        raise(ExceptionKind::OVERFLOW_ERROR, "integer overflow");
    }
    return res;
}

int64_t floor_div(int64_t a, int64_t b) {
    if (b == 0) {
        raise(ExceptionKind::ZERO_DIVISION_ERROR, "integer division or modulo by zero");
    }
    if (a == int64_min and b == -1) {
        raise(ExceptionKind::OVERFLOW_ERROR, "integer overflow");
    }
    int64_t quot = a / b;
    if (a % b != 0 and ((a < 0) != (b < 0))) {
        --quot;
    }
    return quot;
}

int64_t floor_mod(int64_t a, int64_t b) {
    if (b == 0) {
        raise(ExceptionKind::ZERO_DIVISION_ERROR, "integer modulo by zero");
    }
    if (b == -1) {
        return 0;
    }
    int64_t rem = a % b;
    if (rem != 0 and ((rem < 0) != (b < 0))) {
        rem += b;
    }
    return rem;
}

int64_t int_pow(int64_t base, int64_t exp) {
    int64_t res = 1;
    while (exp > 0) {
        if (exp & 1) {
            res = checked_mul(res, base);
        }
        exp >>= 1;
        if (exp > 0) {
            base = checked_mul(base, base);
        }
    }
    return res;
}

double float_floor_div(double a, double b) {
    if (b == 0) {
        raise(ExceptionKind::ZERO_DIVISION_ERROR, "float floor division by zero");
    }
    double mod = std::fmod(a, b);
    double div = (a - mod) / b;
    if (mod != 0 and ((b < 0) != (mod < 0))) {
        div -= 1.0;
    }
    if (div == 0) {
        return std::copysign(0.0, a / b);
    }
    double floor_div = std::floor(div);
    if (div - floor_div > 0.5) {
        floor_div += 1.0;
    }
    return floor_div;
}

double float_mod(double a, double b) {
    if (b == 0) {
        raise(ExceptionKind::ZERO_DIVISION_ERROR, "float modulo by zero");
    }
    double mod = std::fmod(a, b);
    if (mod != 0) {
        if ((b < 0) != (mod < 0)) {
            mod += b;
        }
    } else {
        mod = std::copysign(0.0, b);
    }
    return mod;
}

double float_pow(double base, double exp) {
    if (base == 0 and exp < 0) {
        raise(ExceptionKind::ZERO_DIVISION_ERROR, "0.0 cannot be raised to a negative power");
    }
    if (base < 0 and std::isfinite(exp) and exp != std::floor(exp)) {
        raise(ExceptionKind::VALUE_ERROR, "negative number cannot be raised to a fractional power");
    }
    double res = std::pow(base, exp);
    if (std::isinf(res) and std::isfinite(base) and std::isfinite(exp)) {
        raise(ExceptionKind::OVERFLOW_ERROR, "(34, 'Numerical result out of range')");
    }
    return res;
}

int64_t shift_left(int64_t a, int64_t b) {
    if (b < 0) {
        raise(ExceptionKind::VALUE_ERROR, "negative shift count");
    }
    if (a == 0) {
        return 0;
    }
    if (b >= 63) {
        raise(ExceptionKind::OVERFLOW_ERROR, "integer overflow");
    }
    auto res = static_cast<int64_t>(static_cast<uint64_t>(a) << b);
    if ((res >> b) != a) {
        raise(ExceptionKind::OVERFLOW_ERROR, "integer overflow");
    }
    return res;
}

int64_t shift_right(int64_t a, int64_t b) {
    if (b < 0) {
        raise(ExceptionKind::VALUE_ERROR, "negative shift count");
    }
    if (b >= 64) {
        return a < 0 ? -1 : 0;
    }
    return a >> b;
}

bool identical(const Value& a, const Value& b) {
    if (a.index() != b.index()) {
        return false;
    }
    return std::visit(
        [&b](const auto& x) -> bool {
            using T = std::decay_t<decltype(x)>;
            const auto& y = std::get<T>(b);
            if constexpr (std::is_same_v<T, NoneType> or std::is_same_v<T, EllipsisType>) {
                return true;
            } else if constexpr (std::is_same_v<T, StrPtr>) {
                return x == y or *x == *y;
            } else if constexpr (std::is_same_v<T, ObjRef>) {
                return x.get() == y.get();
            } else {
                return x == y;
            }
        },
        a
    );
}

// Index of the element at @p idx (possibly negative) or nullopt if out of range
std::optional<size_t> normalize_index(int64_t idx, size_t length) noexcept {
    auto len = static_cast<int64_t>(length);
    if (idx < 0) {
        idx += len;
    }
    if (idx < 0 or idx >= len) {
        return std::nullopt;
    }
    return static_cast<size_t>(idx);
}

template <class T>
std::vector<T> repeat(const std::vector<T>& items, int64_t times) {
    std::vector<T> res;
    if (times <= 0 or items.empty()) {
        return res;
    }
    if (static_cast<uint64_t>(times) > limits::heap_limit_in_bytes / sizeof(Value) / items.size()) {
        raise(ExceptionKind::MEMORY_ERROR, "memory limit exceeded");
    }
    res.reserve(items.size() * static_cast<size_t>(times));
    for (int64_t i = 0; i < times; ++i) {
        res.insert(res.end(), items.begin(), items.end());
    }
    return res;
}

std::string repeat(const std::string& str, int64_t times) {
    std::string res;
    if (times <= 0 or str.empty()) {
        return res;
    }
    if (static_cast<uint64_t>(times) > limits::max_string_length / str.size()) {
        raise(ExceptionKind::MEMORY_ERROR, "string is too long");
    }
    res.reserve(str.size() * static_cast<size_t>(times));
    for (int64_t i = 0; i < times; ++i) {
        res += str;
    }
    return res;
}

const OrderedTable* table_of(const Value& val) noexcept {
    if (const auto* set = as<SetObject>(val)) {
        return &set->table;
    }
    return nullptr;
}

[[noreturn]] void raise_unsupported(const Value& a, BinaryOperator op, const Value& b) {
    raise(
        ExceptionKind::TYPE_ERROR,
        "unsupported operand type(s) for ",
        operator_symbol(op),
        ": '",
        type_name(a),
        "' and '",
        type_name(b),
        "'"
    );
}

} // namespace

/* Expressions */

Value Interpreter::eval(const Expr& expr, Frame& frame) {
    switch (expr.kind) {
    case NodeKind::Constant:
        return std::visit(
            [](const auto& x) -> Value { return x; }, static_cast<const ConstantExpr&>(expr).value
        );
    case NodeKind::Name: return load_name(static_cast<const NameExpr&>(expr).id, frame);
    case NodeKind::BoolOp: return eval_bool_op(static_cast<const BoolOpExpr&>(expr), frame);
    case NodeKind::BinOp: {
        const auto& bin_op = static_cast<const BinOpExpr&>(expr);
        auto left = eval(*bin_op.left, frame);
        auto right = eval(*bin_op.right, frame);
        return binary_op(left, bin_op.op, right);
    }
    case NodeKind::UnaryOp: {
        const auto& unary = static_cast<const UnaryOpExpr&>(expr);
        return unary_op(unary.op, eval(*unary.operand, frame));
    }
    case NodeKind::Lambda: {
        const auto& lambda = static_cast<const LambdaExpr&>(expr);
        return make_function("<lambda>", expr, *lambda.args, nullptr, lambda.body.get(), frame);
    }
    case NodeKind::IfExp: {
        const auto& if_exp = static_cast<const IfExpExpr&>(expr);
        return is_truthy(eval(*if_exp.test, frame)) ? eval(*if_exp.body, frame)
                                                      : eval(*if_exp.orelse, frame);
    }
    case NodeKind::Dict: return eval_dict(static_cast<const DictExpr&>(expr), frame);
    case NodeKind::Set: {
        auto items = eval_elements(static_cast<const CollectionExpr&>(expr).elts, frame);
        auto res = new_set();
        auto& set = *as<SetObject>(res);
        for (auto& item : items) {
            set.table.insert(std::move(item), NoneType{});
        }
        recharge(set);
        return res;
    }
    case NodeKind::List:
        return new_list(eval_elements(static_cast<const CollectionExpr&>(expr).elts, frame));
    case NodeKind::Tuple:
        return new_tuple(eval_elements(static_cast<const CollectionExpr&>(expr).elts, frame));
    case NodeKind::ListComp:
    case NodeKind::SetComp:
    case NodeKind::DictComp:
    case NodeKind::GeneratorExp:
        return eval_comprehension(static_cast<const ComprehensionExpr&>(expr), frame);
    case NodeKind::Compare: return eval_compare(static_cast<const CompareExpr&>(expr), frame);
    case NodeKind::Call: return eval_call(static_cast<const CallExpr&>(expr), frame);
    case NodeKind::JoinedStr: return eval_joined_str(static_cast<const JoinedStrExpr&>(expr), frame);
    case NodeKind::Attribute: {
        const auto& attribute = static_cast<const AttributeExpr&>(expr);
        return get_attribute(eval(*attribute.value, frame), attribute.attr);
    }
    case NodeKind::Subscript: return eval_subscript(static_cast<const SubscriptExpr&>(expr), frame);
    default: THROW("unexpected expression: ", node_kind_name(expr.kind));
    }
}

Value Interpreter::eval_bool_op(const BoolOpExpr& expr, Frame& frame) {
    Value val;
    for (const auto& operand : expr.values) {
        val = eval(*operand, frame);
        bool truthy = is_truthy(val);
        if ((expr.op == BoolOperator::AND and not truthy) or (expr.op == BoolOperator::OR and truthy)) {
            break;
        }
    }
    return val;
}

Value Interpreter::eval_compare(const CompareExpr& expr, Frame& frame) {
    auto left = eval(*expr.left, frame);
    for (size_t i = 0; i < expr.ops.size(); ++i) {
        auto right = eval(*expr.comparators[i], frame);
        if (not compare(left, expr.ops[i], right)) {
            return false;
        }
        left = std::move(right);
    }
    return true;
}

std::vector<Value> Interpreter::eval_elements(const std::vector<ExprPtr>& elts, Frame& frame) {
    std::vector<Value> res;
    for (const auto& elt : elts) {
        if (elt->kind == NodeKind::Starred) {
            auto items = to_vector(eval(*static_cast<const StarredExpr&>(*elt).value, frame));
            res.insert(
                res.end(), std::make_move_iterator(items.begin()), std::make_move_iterator(items.end())
            );
        } else {
            res.emplace_back(eval(*elt, frame));
        }
    }
    return res;
}

Value Interpreter::eval_dict(const DictExpr& expr, Frame& frame) {
    auto res = new_dict();
    auto& dict = *as<DictObject>(res);
    for (size_t i = 0; i < expr.keys.size(); ++i) {
        if (not expr.keys[i]) {
            auto mapping = eval(*expr.values[i], frame);
            const auto* other = as<DictObject>(mapping);
            if (not other) {
                raise(ExceptionKind::TYPE_ERROR, "'", type_name(mapping), "' object is not a mapping");
            }
            for (const auto& slot : other->table.slots()) {
                if (slot) {
                    dict.table.insert(slot->key, slot->value);
                }
            }
        } else {
            auto key = eval(*expr.keys[i], frame);
            auto val = eval(*expr.values[i], frame);
            dict.table.insert(std::move(key), std::move(val));
        }
        recharge(dict);
    }
    return res;
}

Value Interpreter::eval_call(const CallExpr& expr, Frame& frame) {
    auto func = eval(*expr.func, frame);
    auto callee_name = [&]() -> std::string {
        if (const auto* function = as<FunctionObject>(func)) {
            return function->name;
        }
        if (const auto* builtin = as<BuiltinFunctionObject>(func)) {
            return std::string{builtin->name};
        }
        if (const auto* method = as<BoundMethodObject>(func)) {
            return std::string{method->name};
        }
        return std::string{type_name(func)};
    };

    std::vector<Value> args;
    for (const auto& arg : expr.args) {
        if (arg->kind != NodeKind::Starred) {
            args.emplace_back(eval(*arg, frame));
            continue;
        }
        auto iterable = eval(*static_cast<const StarredExpr&>(*arg).value, frame);
        if (not std::holds_alternative<StrPtr>(iterable) and not std::holds_alternative<ObjRef>(iterable)) {
            raise(
                ExceptionKind::TYPE_ERROR,
                callee_name(),
                "() argument after * must be an iterable, not ",
                type_name(iterable)
            );
        }
        auto items = to_vector(iterable);
        args.insert(args.end(), std::make_move_iterator(items.begin()), std::make_move_iterator(items.end()));
    }

    KwArgs kwargs;
    auto add_kwarg = [&](std::string name, Value val) {
        for (const auto& kwarg : kwargs) {
            if (kwarg.first == name) {
                raise(
                    ExceptionKind::TYPE_ERROR,
                    callee_name(),
                    "() got multiple values for keyword argument '",
                    name,
                    "'"
                );
            }
        }
        kwargs.emplace_back(std::move(name), std::move(val));
    };
    for (const auto& keyword : expr.keywords) {
        if (keyword->arg) {
            add_kwarg(*keyword->arg, eval(*keyword->value, frame));
            continue;
        }
        auto mapping = eval(*keyword->value, frame);
        const auto* dict = as<DictObject>(mapping);
        if (not dict) {
            raise(
                ExceptionKind::TYPE_ERROR,
                callee_name(),
                "() argument after ** must be a mapping, not ",
                type_name(mapping)
            );
        }
        for (const auto& slot : dict->table.slots()) {
            if (not slot) {
                continue;
            }
            const auto* key = std::get_if<StrPtr>(&slot->key);
            if (not key) {
                raise(ExceptionKind::TYPE_ERROR, "keywords must be strings");
            }
            add_kwarg(**key, slot->value);
        }
    }
    return call(func, std::move(args), std::move(kwargs));
}

Value Interpreter::eval_joined_str(const JoinedStrExpr& expr, Frame& frame) {
    std::string res;
    for (const auto& part : expr.values) {
        if (part->kind == NodeKind::Constant) {
            res += *std::get<StrPtr>(static_cast<const ConstantExpr&>(*part).value);
            continue;
        }
        const auto& formatted = static_cast<const FormattedValueExpr&>(*part);
        auto val = eval(*formatted.value, frame);
        switch (formatted.conversion) {
        case 's': val = new_str(str(val)); break;
        case 'r':
        case 'a': val = new_str(repr(val)); break;
        default: break;
        }
        std::string spec;
        if (formatted.format_spec) {
            spec = *std::get<StrPtr>(eval_joined_str(*formatted.format_spec, frame));
        }
        res += format_value(val, spec);
        if (res.size() > limits::max_string_length) {
            raise(ExceptionKind::MEMORY_ERROR, "string is too long");
        }
    }
    return new_str(std::move(res));
}

Value Interpreter::eval_subscript(const SubscriptExpr& expr, Frame& frame) {
    auto obj = eval(*expr.value, frame);
    if (expr.slice->kind == NodeKind::Slice) {
        auto slice = eval_slice(static_cast<const SliceExpr&>(*expr.slice), frame);
        return get_slice(obj, slice);
    }
    return get_item(obj, eval(*expr.slice, frame));
}

/* Operators */

Value Interpreter::binary_op(const Value& a, BinaryOperator op, const Value& b) {
    using Op = BinaryOperator;
    if (is_numeric(a) and is_numeric(b)) {
        bool ints = is_int_like(a) and is_int_like(b);
        switch (op) {
        case Op::ADD:
            return ints ? Value{checked_add(int_of(a), int_of(b))} : Value{float_of(a) + float_of(b)};
        case Op::SUB:
            return ints ? Value{checked_sub(int_of(a), int_of(b))} : Value{float_of(a) - float_of(b)};
        case Op::MULT:
            return ints ? Value{checked_mul(int_of(a), int_of(b))} : Value{float_of(a) * float_of(b)};
        case Op::DIV:
            if (float_of(b) == 0) {
                raise(
                    ExceptionKind::ZERO_DIVISION_ERROR,
                    ints ? "division by zero" : "float division by zero"
                );
            }
            return float_of(a) / float_of(b);
        case Op::FLOOR_DIV:
            return ints ? Value{floor_div(int_of(a), int_of(b))}
                        : Value{float_floor_div(float_of(a), float_of(b))};
        case Op::MOD:
            return ints ? Value{floor_mod(int_of(a), int_of(b))}
                        : Value{float_mod(float_of(a), float_of(b))};
        case Op::POW:
            if (ints and int_of(b) >= 0) {
                return int_pow(int_of(a), int_of(b));
            }
            return float_pow(float_of(a), float_of(b));
        case Op::LSHIFT:
        case Op::RSHIFT:
        case Op::BIT_OR:
        case Op::BIT_XOR:
        case Op::BIT_AND: {
            if (not ints) {
                raise_unsupported(a, op, b);
            }
            if (std::holds_alternative<bool>(a) and std::holds_alternative<bool>(b)) {
                bool x = std::get<bool>(a);
                bool y = std::get<bool>(b);
                if (op == Op::BIT_OR) {
                    return x or y;
                }
                if (op == Op::BIT_AND) {
                    return x and y;
                }
                if (op == Op::BIT_XOR) {
                    return x != y;
                }
            }
            int64_t x = int_of(a);
            int64_t y = int_of(b);
            switch (op) {
            case Op::LSHIFT: return shift_left(x, y);
            case Op::RSHIFT: return shift_right(x, y);
            case Op::BIT_OR: return x | y;
            case Op::BIT_XOR: return x ^ y;
            default: return x & y;
            }
        }
        case Op::MAT_MULT: raise_unsupported(a, op, b);
        }
    }

    const auto* sa = std::get_if<StrPtr>(&a);
    const auto* sb = std::get_if<StrPtr>(&b);
    switch (op) {
    case Op::ADD:
        if (sa) {
            if (not sb) {
                raise(
                    ExceptionKind::TYPE_ERROR,
                    "can only concatenate str (not \"",
                    type_name(b),
                    "\") to str"
                );
            }
            if ((*sa)->size() + (*sb)->size() > limits::max_string_length) {
                raise(ExceptionKind::MEMORY_ERROR, "string is too long");
            }
            return new_str(**sa + **sb);
        }
        if (const auto* la = as<ListObject>(a)) {
            const auto* lb = as<ListObject>(b);
            if (not lb) {
                raise(
                    ExceptionKind::TYPE_ERROR,
                    "can only concatenate list (not \"",
                    type_name(b),
                    "\") to list"
                );
            }
            auto items = la->items;
            items.insert(items.end(), lb->items.begin(), lb->items.end());
            return new_list(std::move(items));
        }
        if (const auto* ta = as<TupleObject>(a)) {
            const auto* tb = as<TupleObject>(b);
            if (not tb) {
                raise(
                    ExceptionKind::TYPE_ERROR,
                    "can only concatenate tuple (not \"",
                    type_name(b),
                    "\") to tuple"
                );
            }
            auto items = ta->items;
            items.insert(items.end(), tb->items.begin(), tb->items.end());
            return new_tuple(std::move(items));
        }
        break;
    case Op::MULT: {
        const Value* seq = &a;
        const Value* count = &b;
        if (is_int_like(a)) {
            std::swap(seq, count);
        }
        bool is_sequence = std::holds_alternative<StrPtr>(*seq) or as<ListObject>(*seq) or
            as<TupleObject>(*seq);
        if (not is_sequence) {
            break;
        }
        if (not is_int_like(*count)) {
            raise(
                ExceptionKind::TYPE_ERROR,
                "can't multiply sequence by non-int of type '",
                type_name(*count),
                "'"
            );
        }
        int64_t times = int_of(*count);
        if (const auto* s = std::get_if<StrPtr>(seq)) {
            return new_str(repeat(**s, times));
        }
        if (const auto* list = as<ListObject>(*seq)) {
            return new_list(repeat(list->items, times));
        }
        return new_tuple(repeat(as<TupleObject>(*seq)->items, times));
    }
    case Op::MOD:
        if (sa) {
            return new_str(percent_format(**sa, b));
        }
        break;
    case Op::BIT_OR:
        if (const auto* da = as<DictObject>(a)) {
            if (const auto* db = as<DictObject>(b)) {
                auto res = new_dict();
                auto& dict = *as<DictObject>(res);
                for (const auto* table : {&da->table, &db->table}) {
                    for (const auto& slot : table->slots()) {
                        if (slot) {
                            dict.table.insert(slot->key, slot->value);
                        }
                    }
                }
                recharge(dict);
                return res;
            }
        }
        [[fallthrough]];
    case Op::BIT_AND:
    case Op::BIT_XOR:
    case Op::SUB: {
        const auto* ta = table_of(a);
        const auto* tb = table_of(b);
        if (not ta or not tb) {
            break;
        }
        auto res = new_set();
        auto& set = *as<SetObject>(res);
        auto add_if = [&](const OrderedTable& from, auto&& pred) {
            for (const auto& slot : from.slots()) {
                if (slot and pred(slot->key)) {
                    set.table.insert(slot->key, NoneType{});
                }
            }
        };
        auto in_b = [&](const Value& key) { return tb->find(key).has_value(); };
        auto in_a = [&](const Value& key) { return ta->find(key).has_value(); };
        switch (op) {
        case Op::BIT_OR:
            add_if(*ta, [](const Value&) { return true; });
            add_if(*tb, [](const Value&) { return true; });
            break;
        case Op::BIT_AND: add_if(*ta, in_b); break;
        case Op::SUB: add_if(*ta, [&](const Value& key) { return not in_b(key); }); break;
        default:
            add_if(*ta, [&](const Value& key) { return not in_b(key); });
            add_if(*tb, [&](const Value& key) { return not in_a(key); });
            break;
        }
        recharge(set);
        return res;
    }
    default: break;
    }
    raise_unsupported(a, op, b);
}

Value Interpreter::inplace_op(const Value& a, BinaryOperator op, const Value& b) {
    if (auto* list = as<ListObject>(a)) {
        if (op == BinaryOperator::ADD) {
            auto items = to_vector(b);
            list->items.insert(
                list->items.end(),
                std::make_move_iterator(items.begin()),
                std::make_move_iterator(items.end())
            );
            recharge(*list);
            return a;
        }
        if (op == BinaryOperator::MULT and is_int_like(b)) {
            list->items = repeat(list->items, int_of(b));
            recharge(*list);
            return a;
        }
    }
    if (auto* set = as<SetObject>(a); set and table_of(b)) {
        switch (op) {
        case BinaryOperator::BIT_OR:
        case BinaryOperator::BIT_AND:
        case BinaryOperator::BIT_XOR:
        case BinaryOperator::SUB: {
            auto res = binary_op(a, op, b);
            std::swap(set->table, as<SetObject>(res)->table);
            recharge(*set);
            return a;
        }
        default: break;
        }
    }
    if (auto* dict = as<DictObject>(a); dict and op == BinaryOperator::BIT_OR) {
        if (const auto* other = as<DictObject>(b)) {
            auto slots = other->table.slots();
            for (const auto& slot : slots) {
                if (slot) {
                    dict->table.insert(slot->key, slot->value);
                }
            }
            recharge(*dict);
            return a;
        }
    }
    return binary_op(a, op, b);
}

Value Interpreter::unary_op(UnaryOperator op, const Value& val) {
    switch (op) {
    case UnaryOperator::NOT: return not is_truthy(val);
    case UnaryOperator::USUB:
        if (is_int_like(val)) {
            return checked_sub(0, int_of(val));
        }
        if (const auto* d = std::get_if<double>(&val)) {
            return -*d;
        }
        break;
    case UnaryOperator::UADD:
        if (is_int_like(val)) {
            return int_of(val);
        }
        if (const auto* d = std::get_if<double>(&val)) {
            return *d;
        }
        break;
    case UnaryOperator::INVERT:
        if (is_int_like(val)) {
            return ~int_of(val);
        }
        break;
    }
    raise(
        ExceptionKind::TYPE_ERROR,
        "bad operand type for unary ",
        operator_symbol(op),
        ": '",
        type_name(val),
        "'"
    );
}

bool Interpreter::compare(const Value& a, CompareOperator op, const Value& b) {
    switch (op) {
    case CompareOperator::EQ: return values_equal(a, b);
    case CompareOperator::NOT_EQ: return not values_equal(a, b);
    case CompareOperator::LT:
    case CompareOperator::LT_E:
    case CompareOperator::GT:
    case CompareOperator::GT_E: return compare_order(a, op, b);
    case CompareOperator::IS: return identical(a, b);
    case CompareOperator::IS_NOT: return not identical(a, b);
    case CompareOperator::IN: return contains(b, a);
    case CompareOperator::NOT_IN: return not contains(b, a);
    }
    return false;
}

bool Interpreter::contains(const Value& container, const Value& item) {
    auto equal = [&item](const Value& val) { return identical(val, item) or values_equal(val, item); };
    if (const auto* s = std::get_if<StrPtr>(&container)) {
        const auto* sub = std::get_if<StrPtr>(&item);
        if (not sub) {
            raise(
                ExceptionKind::TYPE_ERROR,
                "'in <string>' requires string as left operand, not ",
                type_name(item)
            );
        }
        return (*s)->find(**sub) != std::string::npos;
    }
    if (const auto* ref = std::get_if<ObjRef>(&container)) {
        switch ((*ref)->kind) {
        case ObjectKind::LIST: {
            const auto& items = static_cast<const ListObject&>(**ref).items;
            // The list may change while comparing, so it is indexed on every step
            for (size_t i = 0; i < items.size(); ++i) {
                if (equal(items[i])) {
                    return true;
                }
            }
            return false;
        }
        case ObjectKind::TUPLE: {
            const auto& items = static_cast<const TupleObject&>(**ref).items;
            return std::any_of(items.begin(), items.end(), equal);
        }
        case ObjectKind::DICT: return static_cast<const DictObject&>(**ref).table.find(item).has_value();
        case ObjectKind::SET: return static_cast<const SetObject&>(**ref).table.find(item).has_value();
        case ObjectKind::RANGE: {
            const auto& range = static_cast<const RangeObject&>(**ref);
            if (is_int_like(item)) {
                int64_t x = int_of(item);
                int64_t len = range.length();
                if (len == 0) {
                    return false;
                }
                int64_t last = range.at(len - 1);
                bool in_bounds = range.step > 0 ? (x >= range.start and x <= last)
                                                : (x <= range.start and x >= last);
                return in_bounds and
                    (static_cast<uint64_t>(x) - static_cast<uint64_t>(range.start)) %
                        static_cast<uint64_t>(range.step > 0 ? range.step : -range.step) ==
                    0;
            }
            break; // compared by iterating
        }
        case ObjectKind::DICT_VIEW: {
            const auto& view = static_cast<const DictViewObject&>(**ref);
            const auto& table = static_cast<const DictObject&>(*view.dict).table;
            switch (view.view) {
            case DictViewObject::View::KEYS: return table.find(item).has_value();
            case DictViewObject::View::ITEMS: {
                const auto* pair = as<TupleObject>(item);
                if (not pair or pair->items.size() != 2) {
                    return false;
                }
                auto pos = table.find(pair->items[0]);
                return pos and values_equal(table.slots()[*pos]->value, pair->items[1]);
            }
            case DictViewObject::View::VALUES: break;
            }
            break;
        }
        case ObjectKind::ITERATOR: break;
        default:
            raise(
                ExceptionKind::TYPE_ERROR,
                "argument of type '",
                type_name(container),
                "' is not iterable"
            );
        }
        auto iter = get_iter(container);
        auto& it = static_cast<IteratorObject&>(*iter);
        while (auto val = next(it)) {
            tick();
            if (equal(*val)) {
                return true;
            }
        }
        return false;
    }
    raise(ExceptionKind::TYPE_ERROR, "argument of type '", type_name(container), "' is not iterable");
}

/* Subscripts */

Interpreter::SliceArgs Interpreter::eval_slice(const SliceExpr& slice, Frame& frame) {
    auto part = [&](const ExprPtr& expr) -> Value {
        return expr ? eval(*expr, frame) : Value{NoneType{}};
    };
    SliceArgs res;
    res.lower = part(slice.lower);
    res.upper = part(slice.upper);
    res.step = part(slice.step);
    return res;
}

Interpreter::SliceBounds Interpreter::slice_bounds(const SliceArgs& slice, int64_t length) {
    auto get = [](const Value& val) -> std::optional<int64_t> {
        if (std::holds_alternative<NoneType>(val)) {
            return std::nullopt;
        }
        if (not is_int_like(val)) {
            raise(
                ExceptionKind::TYPE_ERROR,
                "slice indices must be integers or None or have an __index__ method"
            );
        }
        return int_of(val);
    };
    int64_t step = get(slice.step).value_or(1);
    if (step == 0) {
        raise(ExceptionKind::VALUE_ERROR, "slice step cannot be zero");
    }
    step = std::max(step, -std::numeric_limits<int64_t>::max());
    auto adjust = [&](std::optional<int64_t> idx, int64_t default_idx) {
        if (not idx) {
            return default_idx;
        }
        int64_t res = *idx;
        if (res < 0) {
            res += length;
            if (res < 0) {
                res = step < 0 ? -1 : 0;
            }
        } else if (res >= length) {
            res = step < 0 ? length - 1 : length;
        }
        return res;
    };
    int64_t start = adjust(get(slice.lower), step < 0 ? length - 1 : 0);
    int64_t stop = adjust(get(slice.upper), step < 0 ? -1 : length);
    int64_t len = 0;
    if (step > 0 and stop > start) {
        len = (stop - start - 1) / step + 1;
    } else if (step < 0 and start > stop) {
        len = (start - stop - 1) / (-step) + 1;
    }
    return {.start = start, .stop = stop, .step = step, .length = len};
}

Value Interpreter::get_item(const Value& obj, const Value& key) {
    if (const auto* s = std::get_if<StrPtr>(&obj)) {
        if (not is_int_like(key)) {
            raise(ExceptionKind::TYPE_ERROR, "string indices must be integers, not '", type_name(key), "'");
        }
        auto idx = normalize_index(int_of(key), utf8_length(**s));
        if (not idx) {
            raise(ExceptionKind::INDEX_ERROR, "string index out of range");
        }
        size_t pos = utf8_offset(**s, *idx);
        return new_str((*s)->substr(pos, utf8_char_length(**s, pos)));
    }
    const auto* ref = std::get_if<ObjRef>(&obj);
    if (ref) {
        switch ((*ref)->kind) {
        case ObjectKind::LIST:
        case ObjectKind::TUPLE: {
            bool is_list = (*ref)->kind == ObjectKind::LIST;
            std::string_view name = is_list ? "list" : "tuple";
            const auto& items = is_list ? static_cast<const ListObject&>(**ref).items
                                        : static_cast<const TupleObject&>(**ref).items;
            if (not is_int_like(key)) {
                raise(
                    ExceptionKind::TYPE_ERROR,
                    name,
                    " indices must be integers or slices, not ",
                    type_name(key)
                );
            }
            auto idx = normalize_index(int_of(key), items.size());
            if (not idx) {
                raise(ExceptionKind::INDEX_ERROR, name, " index out of range");
            }
            return items[*idx];
        }
        case ObjectKind::RANGE: {
            const auto& range = static_cast<const RangeObject&>(**ref);
            if (not is_int_like(key)) {
                raise(
                    ExceptionKind::TYPE_ERROR,
                    "range indices must be integers or slices, not ",
                    type_name(key)
                );
            }
            auto idx = normalize_index(int_of(key), static_cast<size_t>(range.length()));
            if (not idx) {
                raise(ExceptionKind::INDEX_ERROR, "range object index out of range");
            }
            return range.at(static_cast<int64_t>(*idx));
        }
        case ObjectKind::DICT: {
            auto& table = static_cast<DictObject&>(**ref).table;
            if (const auto* val = table.find_value(key)) {
                return *val;
            }
            raise_key_error(key);
        }
        default: break;
        }
    }
    raise(ExceptionKind::TYPE_ERROR, "'", type_name(obj), "' object is not subscriptable");
}

Value Interpreter::get_slice(const Value& obj, const SliceArgs& slice) {
    if (const auto* s = std::get_if<StrPtr>(&obj)) {
        const std::string& text = **s;
        std::vector<size_t> offsets; // of every code point
        for (size_t pos = 0; pos < text.size(); pos += utf8_char_length(text, pos)) {
            offsets.emplace_back(pos);
        }
        auto bounds = slice_bounds(slice, static_cast<int64_t>(offsets.size()));
        std::string res;
        int64_t idx = bounds.start;
        for (int64_t i = 0; i < bounds.length; ++i, idx += bounds.step) {
            auto pos = offsets[static_cast<size_t>(idx)];
            res.append(text, pos, utf8_char_length(text, pos));
        }
        return new_str(std::move(res));
    }
    auto pick = [&](const std::vector<Value>& items) {
        auto bounds = slice_bounds(slice, static_cast<int64_t>(items.size()));
        std::vector<Value> res;
        res.reserve(static_cast<size_t>(bounds.length));
        int64_t idx = bounds.start;
        for (int64_t i = 0; i < bounds.length; ++i, idx += bounds.step) {
            res.emplace_back(items[static_cast<size_t>(idx)]);
        }
        return res;
    };
    if (const auto* list = as<ListObject>(obj)) {
        return new_list(pick(list->items));
    }
    if (const auto* tuple = as<TupleObject>(obj)) {
        return new_tuple(pick(tuple->items));
    }
    if (const auto* range = as<RangeObject>(obj)) {
        auto bounds = slice_bounds(slice, range->length());
        int64_t step = checked_mul(range->step, bounds.step);
        int64_t start = bounds.length > 0 ? range->at(bounds.start) : range->start;
        int64_t stop = checked_add(start, checked_mul(bounds.length, step));
        return heap_.make<RangeObject>(start, stop, step);
    }
    raise(ExceptionKind::TYPE_ERROR, "'", type_name(obj), "' object is not subscriptable");
}

void Interpreter::set_item(const Value& obj, const Value& key, Value val) {
    if (auto* list = as<ListObject>(obj)) {
        if (not is_int_like(key)) {
            raise(
                ExceptionKind::TYPE_ERROR, "list indices must be integers or slices, not ", type_name(key)
            );
        }
        auto idx = normalize_index(int_of(key), list->items.size());
        if (not idx) {
            raise(ExceptionKind::INDEX_ERROR, "list assignment index out of range");
        }
        list->items[*idx] = std::move(val);
        return;
    }
    if (auto* dict = as<DictObject>(obj)) {
        dict->table.insert(key, std::move(val));
        recharge(*dict);
        return;
    }
    raise(ExceptionKind::TYPE_ERROR, "'", type_name(obj), "' object does not support item assignment");
}

void Interpreter::set_slice(const Value& obj, const SliceArgs& slice, const Value& val) {
    auto* list = as<ListObject>(obj);
    if (not list) {
        raise(
            ExceptionKind::TYPE_ERROR, "'", type_name(obj), "' object does not support item assignment"
        );
    }
    if (not std::holds_alternative<StrPtr>(val) and not std::holds_alternative<ObjRef>(val)) {
        raise(ExceptionKind::TYPE_ERROR, "can only assign an iterable");
    }
    auto values = to_vector(val);
    auto bounds = slice_bounds(slice, static_cast<int64_t>(list->items.size()));
    auto& items = list->items;
    if (bounds.step == 1) {
        auto first = items.begin() + bounds.start;
        auto last = items.begin() + std::max(bounds.start, bounds.stop);
        auto pos = items.erase(first, last);
        items.insert(pos, std::make_move_iterator(values.begin()), std::make_move_iterator(values.end()));
        recharge(*list);
        return;
    }
    if (static_cast<int64_t>(values.size()) != bounds.length) {
        raise(
            ExceptionKind::VALUE_ERROR,
            "attempt to assign sequence of size ",
            values.size(),
            " to extended slice of size ",
            bounds.length
        );
    }
    int64_t idx = bounds.start;
    for (auto& value : values) {
        items[static_cast<size_t>(idx)] = std::move(value);
        idx += bounds.step;
    }
}

void Interpreter::delete_item(const Value& obj, const Value& key) {
    if (auto* list = as<ListObject>(obj)) {
        if (not is_int_like(key)) {
            raise(
                ExceptionKind::TYPE_ERROR, "list indices must be integers or slices, not ", type_name(key)
            );
        }
        auto idx = normalize_index(int_of(key), list->items.size());
        if (not idx) {
            raise(ExceptionKind::INDEX_ERROR, "list assignment index out of range");
        }
        auto removed = std::move(list->items[*idx]);
        list->items.erase(list->items.begin() + static_cast<ptrdiff_t>(*idx));
        return;
    }
    if (auto* dict = as<DictObject>(obj)) {
        if (not dict->table.erase(key)) {
            raise_key_error(key);
        }
        return;
    }
    raise(ExceptionKind::TYPE_ERROR, "'", type_name(obj), "' object doesn't support item deletion");
}

void Interpreter::delete_slice(const Value& obj, const SliceArgs& slice) {
    auto* list = as<ListObject>(obj);
    if (not list) {
        raise(ExceptionKind::TYPE_ERROR, "'", type_name(obj), "' object doesn't support item deletion");
    }
    auto bounds = slice_bounds(slice, static_cast<int64_t>(list->items.size()));
    std::vector<bool> removed(list->items.size(), false);
    int64_t idx = bounds.start;
    for (int64_t i = 0; i < bounds.length; ++i, idx += bounds.step) {
        removed[static_cast<size_t>(idx)] = true;
    }
    std::vector<Value> kept;
    std::vector<Value> dropped; // destroyed after the list is consistent again
    for (size_t i = 0; i < list->items.size(); ++i) {
        (removed[i] ? dropped : kept).emplace_back(std::move(list->items[i]));
    }
    list->items = std::move(kept);
}

Value Interpreter::get_attribute(const Value& obj, const std::string& name) {
    bool is_dunder = name.size() > 4 and name.starts_with("__") and name.ends_with("__");
    if (not is_dunder) {
        if (const auto* exc = as<ExceptionObject>(obj); exc and name == "args") {
            return new_tuple(exc->args);
        }
        if (auto method = find_method(obj, name)) {
            return heap_.make<BoundMethodObject>(obj, *method);
        }
    }
    if (const auto* builtin = as<BuiltinFunctionObject>(obj); builtin and type_name(obj) == "type") {
        raise(
            ExceptionKind::ATTRIBUTE_ERROR,
            "type object '",
            builtin->name,
            "' has no attribute '",
            name,
            "'"
        );
    }
    raise(
        ExceptionKind::ATTRIBUTE_ERROR, "'", type_name(obj), "' object has no attribute '", name, "'"
    );
}

/* Iteration */

ObjRef Interpreter::get_iter(const Value& val) {
    using Source = IteratorObject::Source;
    if (const auto* s = std::get_if<StrPtr>(&val)) {
        auto iter = heap_.make<IteratorObject>(Source::STRING);
        static_cast<IteratorObject&>(*iter).str = *s;
        return iter;
    }
    if (const auto* ref = std::get_if<ObjRef>(&val)) {
        auto make = [&](Source source, ObjRef target, size_t expected_size = 0) {
            auto iter = heap_.make<IteratorObject>(source);
            auto& it = static_cast<IteratorObject&>(*iter);
            it.target = std::move(target);
            it.expected_size = expected_size;
            return iter;
        };
        switch ((*ref)->kind) {
        case ObjectKind::LIST:
        case ObjectKind::TUPLE: return make(Source::SEQUENCE, *ref);
        case ObjectKind::RANGE: return make(Source::RANGE, *ref);
        case ObjectKind::DICT:
            return make(Source::TABLE_KEYS, *ref, static_cast<const DictObject&>(**ref).table.size());
        case ObjectKind::SET:
            return make(Source::TABLE_KEYS, *ref, static_cast<const SetObject&>(**ref).table.size());
        case ObjectKind::DICT_VIEW: {
            const auto& view = static_cast<const DictViewObject&>(**ref);
            size_t size = static_cast<const DictObject&>(*view.dict).table.size();
            switch (view.view) {
            case DictViewObject::View::KEYS: return make(Source::TABLE_KEYS, view.dict, size);
            case DictViewObject::View::VALUES: return make(Source::TABLE_VALUES, view.dict, size);
            case DictViewObject::View::ITEMS: return make(Source::TABLE_ITEMS, view.dict, size);
            }
            break;
        }
        case ObjectKind::ITERATOR: return *ref;
        default: break;
        }
    }
    raise(ExceptionKind::TYPE_ERROR, "'", type_name(val), "' object is not iterable");
}

std::optional<Value> Interpreter::next(IteratorObject& it) {
    using Source = IteratorObject::Source;
    if (it.exhausted) {
        return std::nullopt;
    }
    auto inner = [&](size_t idx) -> IteratorObject& {
        return static_cast<IteratorObject&>(*it.inner[idx]);
    };
    switch (it.source) {
    case Source::SEQUENCE:
    case Source::GENERATOR: {
        const auto& items = it.target->kind == ObjectKind::LIST
            ? static_cast<const ListObject&>(*it.target).items
            : static_cast<const TupleObject&>(*it.target).items;
        if (it.pos < items.size()) {
            return items[it.pos++];
        }
        break;
    }
    case Source::STRING:
        if (it.pos < it.str->size()) {
            size_t len = utf8_char_length(*it.str, it.pos);
            auto res = new_str(it.str->substr(it.pos, len));
            it.pos += len;
            return res;
        }
        break;
    case Source::RANGE: {
        const auto& range = static_cast<const RangeObject&>(*it.target);
        if (static_cast<int64_t>(it.pos) < range.length()) {
            return range.at(static_cast<int64_t>(it.pos++));
        }
        break;
    }
    case Source::TABLE_KEYS:
    case Source::TABLE_VALUES:
    case Source::TABLE_ITEMS: {
        bool is_set = it.target->kind == ObjectKind::SET;
        const auto& table = is_set ? static_cast<const SetObject&>(*it.target).table
                                   : static_cast<const DictObject&>(*it.target).table;
        if (table.size() != it.expected_size) {
            it.exhausted = true;
            raise(
                ExceptionKind::RUNTIME_ERROR,
                is_set ? "Set changed size during iteration" : "dictionary changed size during iteration"
            );
        }
        const auto& slots = table.slots();
        while (it.pos < slots.size()) {
            const auto& slot = slots[it.pos++];
            if (not slot) {
                continue;
            }
            if (it.source == Source::TABLE_KEYS) {
                return slot->key;
            }
            if (it.source == Source::TABLE_VALUES) {
                return slot->value;
            }
            return new_tuple({slot->key, slot->value});
        }
        break;
    }
    case Source::ENUMERATE:
    case Source::ZIP:
    case Source::MAP:
    case Source::FILTER: {
        // Iterators nested in one another recurse like calls
        enter_call();
        ++call_depth_;
        Defer depth_guard = [&] { --call_depth_; };
        if (it.source == Source::ENUMERATE) {
            if (auto val = next(inner(0))) {
                return new_tuple({it.counter++, std::move(*val)});
            }
            break;
        }
        if (it.source == Source::FILTER) {
            while (auto val = next(inner(0))) {
                tick();
                bool selected = std::holds_alternative<NoneType>(it.func)
                    ? is_truthy(*val)
                    : is_truthy(call(it.func, {*val}, {}));
                if (selected) {
                    return val;
                }
            }
            break;
        }
        std::vector<Value> values;
        for (size_t i = 0; i < it.inner.size(); ++i) {
            auto val = next(inner(i));
            if (not val) {
                it.exhausted = true;
                return std::nullopt;
            }
            values.emplace_back(std::move(*val));
        }
        if (it.source == Source::ZIP) {
            if (values.empty()) {
                break;
            }
            return new_tuple(std::move(values));
        }
        return call(it.func, std::move(values), {});
    }
    }
    it.exhausted = true;
    return std::nullopt;
}

std::vector<Value> Interpreter::to_vector(const Value& iterable) {
    if (const auto* list = as<ListObject>(iterable)) {
        return list->items;
    }
    if (const auto* tuple = as<TupleObject>(iterable)) {
        return tuple->items;
    }
    std::vector<Value> res;
    auto iter = get_iter(iterable);
    auto& it = static_cast<IteratorObject&>(*iter);
    while (auto val = next(it)) {
        tick();
        res.emplace_back(std::move(*val));
        if (res.size() > limits::heap_limit_in_bytes / sizeof(Value)) {
            raise(ExceptionKind::MEMORY_ERROR, "memory limit exceeded");
        }
    }
    return res;
}

} // namespace chk::lang
