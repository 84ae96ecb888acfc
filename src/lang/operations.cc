#include <algorithm>
#include <charconv>
#include <chklib/defer.hh>
#include <chklib/lang/exceptions.hh>
#include <chklib/lang/operations.hh>
#include <chklib/limits.hh>
#include <cmath>
#include <functional>

namespace chk::lang {

namespace {

// Bounds the native recursion over nested containers
thread_local size_t nesting_depth = 0; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

class NestingGuard {
public:
    explicit NestingGuard(std::string_view action) {
        if (++nesting_depth > limits::max_call_depth) {
            --nesting_depth;
            raise(ExceptionKind::RECURSION_ERROR, "maximum recursion depth exceeded ", action);
        }
    }

    NestingGuard(const NestingGuard&) = delete;
    NestingGuard(NestingGuard&&) = delete;
    NestingGuard& operator=(const NestingGuard&) = delete;
    NestingGuard& operator=(NestingGuard&&) = delete;

    ~NestingGuard() { --nesting_depth; }
};

// Containers being printed, for printing a self reference as [...]
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
thread_local std::vector<const Object*> repr_stack;

bool is_number(const Value& val) noexcept {
    return std::holds_alternative<bool>(val) or std::holds_alternative<int64_t>(val) or
        std::holds_alternative<double>(val);
}

// Precondition: is_number(val) and val is not a float
int64_t as_integer(const Value& val) noexcept {
    if (const auto* b = std::get_if<bool>(&val)) {
        return *b ? 1 : 0;
    }
    return std::get<int64_t>(val);
}

// Precondition: is_number(val)
double as_double(const Value& val) noexcept {
    if (const auto* d = std::get_if<double>(&val)) {
        return *d;
    }
    return static_cast<double>(as_integer(val));
}

bool same_or_equal(const Value& a, const Value& b) {
    const auto* ra = std::get_if<ObjRef>(&a);
    const auto* rb = std::get_if<ObjRef>(&b);
    if (ra and rb and ra->get() == rb->get()) {
        return true;
    }
    return values_equal(a, b);
}

bool tables_equal(const OrderedTable& a, const OrderedTable& b, bool compare_values) {
    if (a.size() != b.size()) {
        return false;
    }
    for (const auto& slot : a.slots()) {
        if (not slot) {
            continue;
        }
        auto pos = b.find(slot->key);
        if (not pos) {
            return false;
        }
        if (compare_values and not same_or_equal(slot->value, b.slots()[*pos]->value)) {
            return false;
        }
    }
    return true;
}

bool objects_equal(const Object& a, const Object& b) {
    if (&a == &b) {
        return true;
    }
    if (a.kind != b.kind) {
        return false;
    }
    auto sequences_equal = [](const std::vector<Value>& x, const std::vector<Value>& y) {
        if (x.size() != y.size()) {
            return false;
        }
        for (size_t i = 0; i < x.size(); ++i) {
            if (not same_or_equal(x[i], y[i])) {
                return false;
            }
        }
        return true;
    };

    switch (a.kind) {
    case ObjectKind::LIST:
        return sequences_equal(
            static_cast<const ListObject&>(a).items, static_cast<const ListObject&>(b).items
        );
    case ObjectKind::TUPLE:
        return sequences_equal(
            static_cast<const TupleObject&>(a).items, static_cast<const TupleObject&>(b).items
        );
    case ObjectKind::DICT:
        return tables_equal(
            static_cast<const DictObject&>(a).table, static_cast<const DictObject&>(b).table, true
        );
    case ObjectKind::SET:
        return tables_equal(
            static_cast<const SetObject&>(a).table, static_cast<const SetObject&>(b).table, false
        );
    case ObjectKind::RANGE: {
        const auto& x = static_cast<const RangeObject&>(a);
        const auto& y = static_cast<const RangeObject&>(b);
        auto len = x.length();
        if (len != y.length()) {
            return false;
        }
        return len == 0 or (x.start == y.start and (len == 1 or x.step == y.step));
    }
    case ObjectKind::BUILTIN_FUNCTION:
        return static_cast<const BuiltinFunctionObject&>(a).builtin ==
            static_cast<const BuiltinFunctionObject&>(b).builtin;
    case ObjectKind::EXCEPTION_CLASS:
        return static_cast<const ExceptionClassObject&>(a).exception_kind ==
            static_cast<const ExceptionClassObject&>(b).exception_kind;
    case ObjectKind::BOUND_METHOD: {
        const auto& x = static_cast<const BoundMethodObject&>(a);
        const auto& y = static_cast<const BoundMethodObject&>(b);
        const auto* rx = std::get_if<ObjRef>(&x.self);
        const auto* ry = std::get_if<ObjRef>(&y.self);
        return x.name == y.name and
            (rx and ry ? rx->get() == ry->get() : values_equal(x.self, y.self));
    }
    case ObjectKind::ITERATOR:
    case ObjectKind::FUNCTION:
    case ObjectKind::EXCEPTION:
    case ObjectKind::DICT_VIEW:
    case ObjectKind::SCOPE: return false;
    }
    return false;
}

std::string_view iterator_type_name(const IteratorObject& it) noexcept {
    using Source = IteratorObject::Source;
    switch (it.source) {
    case Source::SEQUENCE:
        return it.target->kind == ObjectKind::TUPLE ? "tuple_iterator" : "list_iterator";
    case Source::GENERATOR: return "generator";
    case Source::STRING: return "str_iterator";
    case Source::RANGE: return "range_iterator";
    case Source::TABLE_KEYS:
        return it.target->kind == ObjectKind::SET ? "set_iterator" : "dict_keyiterator";
    case Source::TABLE_VALUES: return "dict_valueiterator";
    case Source::TABLE_ITEMS: return "dict_itemiterator";
    case Source::ENUMERATE: return "enumerate";
    case Source::ZIP: return "zip";
    case Source::MAP: return "map";
    case Source::FILTER: return "filter";
    }
    return "iterator";
}

bool is_type_builtin(Builtin builtin) noexcept {
    switch (builtin) {
    case Builtin::STR:
    case Builtin::INT:
    case Builtin::FLOAT:
    case Builtin::BOOL:
    case Builtin::LIST:
    case Builtin::DICT:
    case Builtin::TUPLE:
    case Builtin::SET:
    case Builtin::RANGE:
    case Builtin::ENUMERATE:
    case Builtin::ZIP:
    case Builtin::MAP:
    case Builtin::FILTER: return true;
    case Builtin::LEN:
    case Builtin::SORTED:
    case Builtin::SUM:
    case Builtin::MIN:
    case Builtin::MAX:
    case Builtin::ABS:
    case Builtin::ROUND:
    case Builtin::PRINT: return false;
    }
    return false;
}

void append_str_repr(std::string& res, std::string_view str) {
    char quote = '\'';
    if (str.find('\'') != std::string_view::npos and str.find('"') == std::string_view::npos) {
        quote = '"';
    }
    res += quote;
    for (char c : str) {
        switch (c) {
        case '\\': res += "\\\\"; break;
        case '\n': res += "\\n"; break;
        case '\r': res += "\\r"; break;
        case '\t': res += "\\t"; break;
        default:
            if (c == quote) {
                back_insert(res, '\\', c);
            } else if (static_cast<unsigned char>(c) < 0x20 or c == 0x7f) {
                constexpr char digits[] = "0123456789abcdef";
                auto uc = static_cast<unsigned char>(c);
                back_insert(res, "\\x", digits[uc >> 4], digits[uc & 15]);
            } else {
                res += c;
            }
        }
    }
    res += quote;
}

void append_repr(std::string& res, const Value& val);

void append_items(std::string& res, const std::vector<Value>& items) {
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            res += ", ";
        }
        append_repr(res, items[i]);
    }
}

void append_table(std::string& res, const OrderedTable& table, bool with_values) {
    bool first = true;
    for (const auto& slot : table.slots()) {
        if (not slot) {
            continue;
        }
        if (not first) {
            res += ", ";
        }
        first = false;
        append_repr(res, slot->key);
        if (with_values) {
            res += ": ";
            append_repr(res, slot->value);
        }
    }
}

void append_object_repr(std::string& res, const Object& obj) {
    switch (obj.kind) {
    case ObjectKind::LIST:
        back_insert(res, '[');
        append_items(res, static_cast<const ListObject&>(obj).items);
        back_insert(res, ']');
        return;
    case ObjectKind::TUPLE: {
        const auto& items = static_cast<const TupleObject&>(obj).items;
        back_insert(res, '(');
        append_items(res, items);
        back_insert(res, items.size() == 1 ? ",)" : ")");
        return;
    }
    case ObjectKind::DICT:
        res += '{';
        append_table(res, static_cast<const DictObject&>(obj).table, true);
        res += '}';
        return;
    case ObjectKind::SET: {
        const auto& table = static_cast<const SetObject&>(obj).table;
        if (table.empty()) {
            res += "set()";
            return;
        }
        res += '{';
        append_table(res, table, false);
        res += '}';
        return;
    }
    case ObjectKind::RANGE: {
        const auto& range = static_cast<const RangeObject&>(obj);
        back_insert(res, "range(", range.start, ", ", range.stop);
        if (range.step != 1) {
            back_insert(res, ", ", range.step);
        }
        res += ')';
        return;
    }
    case ObjectKind::ITERATOR:
        back_insert(res, '<', iterator_type_name(static_cast<const IteratorObject&>(obj)), " object>");
        return;
    case ObjectKind::FUNCTION:
        back_insert(res, "<function ", static_cast<const FunctionObject&>(obj).name, '>');
        return;
    case ObjectKind::BUILTIN_FUNCTION: {
        const auto& func = static_cast<const BuiltinFunctionObject&>(obj);
        if (is_type_builtin(func.builtin)) {
            back_insert(res, "<class '", func.name, "'>");
        } else {
            back_insert(res, "<built-in function ", func.name, '>');
        }
        return;
    }
    case ObjectKind::BOUND_METHOD: {
        const auto& method = static_cast<const BoundMethodObject&>(obj);
        back_insert(res, "<built-in method ", method.name, " of ", type_name(method.self), " object>");
        return;
    }
    case ObjectKind::EXCEPTION_CLASS:
        back_insert(
            res,
            "<class '",
            exception_kind_name(static_cast<const ExceptionClassObject&>(obj).exception_kind),
            "'>"
        );
        return;
    case ObjectKind::EXCEPTION: {
        const auto& exc = static_cast<const ExceptionObject&>(obj);
        back_insert(res, exception_kind_name(exc.exception_kind), '(');
        append_items(res, exc.args);
        res += ')';
        return;
    }
    case ObjectKind::DICT_VIEW: {
        const auto& view = static_cast<const DictViewObject&>(obj);
        const auto& table = static_cast<const DictObject&>(*view.dict).table;
        std::string_view name = view.view == DictViewObject::View::KEYS ? "dict_keys"
            : view.view == DictViewObject::View::VALUES                 ? "dict_values"
                                                                        : "dict_items";
        back_insert(res, name, "([");
        bool first = true;
        for (const auto& slot : table.slots()) {
            if (not slot) {
                continue;
            }
            if (not first) {
                res += ", ";
            }
            first = false;
            switch (view.view) {
            case DictViewObject::View::KEYS: append_repr(res, slot->key); break;
            case DictViewObject::View::VALUES: append_repr(res, slot->value); break;
            case DictViewObject::View::ITEMS:
                res += '(';
                append_repr(res, slot->key);
                res += ", ";
                append_repr(res, slot->value);
                res += ')';
                break;
            }
        }
        res += "])";
        return;
    }
    case ObjectKind::SCOPE: res += "<scope>"; return;
    }
}

void append_repr(std::string& res, const Value& val) {
    std::visit(
        [&res](const auto& x) {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, NoneType>) {
                res += "None";
            } else if constexpr (std::is_same_v<T, EllipsisType>) {
                res += "Ellipsis";
            } else if constexpr (std::is_same_v<T, bool>) {
                res += x ? "True" : "False";
            } else if constexpr (std::is_same_v<T, int64_t>) {
                back_insert(res, x);
            } else if constexpr (std::is_same_v<T, double>) {
                res += float_repr(x);
            } else if constexpr (std::is_same_v<T, StrPtr>) {
                append_str_repr(res, *x);
            } else {
                static_assert(std::is_same_v<T, ObjRef>);
                const Object* obj = x.get();
                if (std::find(repr_stack.begin(), repr_stack.end(), obj) != repr_stack.end()) {
                    res += obj->kind == ObjectKind::LIST ? "[...]"
                        : obj->kind == ObjectKind::TUPLE ? "(...)"
                                                         : "{...}";
                    return;
                }
                NestingGuard guard{"while getting the repr of an object"};
                repr_stack.emplace_back(obj);
                Defer pop_guard = [] { repr_stack.pop_back(); };
                append_object_repr(res, *obj);
            }
        },
        val
    );
}

size_t combine_hashes(size_t seed, size_t hash) noexcept {
    return seed ^ (hash + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

} // namespace

std::string_view type_name(const Value& val) noexcept {
    return std::visit(
        [](const auto& x) -> std::string_view {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, NoneType>) {
                return "NoneType";
            } else if constexpr (std::is_same_v<T, EllipsisType>) {
                return "ellipsis";
            } else if constexpr (std::is_same_v<T, bool>) {
                return "bool";
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return "int";
            } else if constexpr (std::is_same_v<T, double>) {
                return "float";
            } else if constexpr (std::is_same_v<T, StrPtr>) {
                return "str";
            } else {
                switch (x->kind) {
                case ObjectKind::LIST: return "list";
                case ObjectKind::TUPLE: return "tuple";
                case ObjectKind::DICT: return "dict";
                case ObjectKind::SET: return "set";
                case ObjectKind::RANGE: return "range";
                case ObjectKind::ITERATOR:
                    return iterator_type_name(static_cast<const IteratorObject&>(*x));
                case ObjectKind::FUNCTION: return "function";
                case ObjectKind::BUILTIN_FUNCTION:
                    return is_type_builtin(static_cast<const BuiltinFunctionObject&>(*x).builtin)
                        ? "type"
                        : "builtin_function_or_method";
                case ObjectKind::BOUND_METHOD: return "builtin_function_or_method";
                case ObjectKind::EXCEPTION_CLASS: return "type";
                case ObjectKind::EXCEPTION:
                    return exception_kind_name(static_cast<const ExceptionObject&>(*x).exception_kind);
                case ObjectKind::DICT_VIEW:
                    switch (static_cast<const DictViewObject&>(*x).view) {
                    case DictViewObject::View::KEYS: return "dict_keys";
                    case DictViewObject::View::VALUES: return "dict_values";
                    case DictViewObject::View::ITEMS: return "dict_items";
                    }
                    return "dict_keys";
                case ObjectKind::SCOPE: return "scope";
                }
                return "object";
            }
        },
        val
    );
}

bool is_truthy(const Value& val) {
    return std::visit(
        [](const auto& x) -> bool {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, NoneType>) {
                return false;
            } else if constexpr (std::is_same_v<T, EllipsisType>) {
                return true;
            } else if constexpr (std::is_same_v<T, bool>) {
                return x;
            } else if constexpr (std::is_same_v<T, int64_t> or std::is_same_v<T, double>) {
                return x != 0;
            } else if constexpr (std::is_same_v<T, StrPtr>) {
                return not x->empty();
            } else {
                switch (x->kind) {
                case ObjectKind::LIST: return not static_cast<const ListObject&>(*x).items.empty();
                case ObjectKind::TUPLE: return not static_cast<const TupleObject&>(*x).items.empty();
                case ObjectKind::DICT: return not static_cast<const DictObject&>(*x).table.empty();
                case ObjectKind::SET: return not static_cast<const SetObject&>(*x).table.empty();
                case ObjectKind::RANGE: return static_cast<const RangeObject&>(*x).length() > 0;
                case ObjectKind::DICT_VIEW:
                    return not static_cast<const DictObject&>(
                                   *static_cast<const DictViewObject&>(*x).dict
                    )
                                   .table.empty();
                default: return true;
                }
            }
        },
        val
    );
}

bool values_equal(const Value& a, const Value& b) {
    if (is_number(a) and is_number(b)) {
        if (std::holds_alternative<double>(a) or std::holds_alternative<double>(b)) {
            return as_double(a) == as_double(b);
        }
        return as_integer(a) == as_integer(b);
    }
    if (a.index() != b.index()) {
        return false;
    }
    if (std::holds_alternative<NoneType>(a) or std::holds_alternative<EllipsisType>(a)) {
        return true;
    }
    if (const auto* sa = std::get_if<StrPtr>(&a)) {
        const auto& sb = std::get<StrPtr>(b);
        return sa->get() == sb.get() or **sa == *sb;
    }
    NestingGuard guard{"in comparison"};
    return objects_equal(*std::get<ObjRef>(a), *std::get<ObjRef>(b));
}

bool compare_order(const Value& a, CompareOperator op, const Value& b) {
    auto apply = [op](auto x, auto y) {
        switch (op) {
        case CompareOperator::LT: return x < y;
        case CompareOperator::LT_E: return x <= y;
        case CompareOperator::GT: return x > y;
        case CompareOperator::GT_E: return x >= y;
        default: return false;
        }
    };

    if (is_number(a) and is_number(b)) {
        if (std::holds_alternative<double>(a) or std::holds_alternative<double>(b)) {
            return apply(as_double(a), as_double(b));
        }
        return apply(as_integer(a), as_integer(b));
    }
    if (const auto* sa = std::get_if<StrPtr>(&a)) {
        if (const auto* sb = std::get_if<StrPtr>(&b)) {
            return apply(std::string_view{**sa}.compare(**sb), 0);
        }
    }

    auto sequence_compare = [&](const std::vector<Value>& x, const std::vector<Value>& y) {
        NestingGuard guard{"in comparison"};
        size_t common = std::min(x.size(), y.size());
        for (size_t i = 0; i < common; ++i) {
            if (not same_or_equal(x[i], y[i])) {
                return compare_order(x[i], op, y[i]);
            }
        }
        return apply(x.size(), y.size());
    };
    if (const auto* la = as<ListObject>(a)) {
        if (const auto* lb = as<ListObject>(b)) {
            return sequence_compare(la->items, lb->items);
        }
    }
    if (const auto* ta = as<TupleObject>(a)) {
        if (const auto* tb = as<TupleObject>(b)) {
            return sequence_compare(ta->items, tb->items);
        }
    }
    if (const auto* sa = as<SetObject>(a)) {
        if (const auto* sb = as<SetObject>(b)) {
            auto is_subset = [](const OrderedTable& x, const OrderedTable& y) {
                if (x.size() > y.size()) {
                    return false;
                }
                return std::all_of(x.slots().begin(), x.slots().end(), [&y](const auto& slot) {
                    return not slot or y.find(slot->key).has_value();
                });
            };
            switch (op) {
            case CompareOperator::LT:
                return sa->table.size() < sb->table.size() and is_subset(sa->table, sb->table);
            case CompareOperator::LT_E: return is_subset(sa->table, sb->table);
            case CompareOperator::GT:
                return sa->table.size() > sb->table.size() and is_subset(sb->table, sa->table);
            case CompareOperator::GT_E: return is_subset(sb->table, sa->table);
            default: return false;
            }
        }
    }
    raise(
        ExceptionKind::TYPE_ERROR,
        '\'',
        operator_symbol(op),
        "' not supported between instances of '",
        type_name(a),
        "' and '",
        type_name(b),
        '\''
    );
}

size_t hash_value(const Value& val) {
    return std::visit(
        [&val](const auto& x) -> size_t {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, NoneType>) {
                return 0x4e6f6e65;
            } else if constexpr (std::is_same_v<T, EllipsisType>) {
                return 0x456c6c69;
            } else if constexpr (std::is_same_v<T, bool>) {
                return std::hash<int64_t>{}(x ? 1 : 0);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return std::hash<int64_t>{}(x);
            } else if constexpr (std::is_same_v<T, double>) {
                if (std::isnan(x)) {
                    return 0;
                }
                // Equal int and float values hash equally
                if (std::trunc(x) == x and std::abs(x) < 9.2e18) {
                    return std::hash<int64_t>{}(static_cast<int64_t>(x));
                }
                return std::hash<double>{}(x);
            } else if constexpr (std::is_same_v<T, StrPtr>) {
                return std::hash<std::string_view>{}(*x);
            } else {
                switch (x->kind) {
                case ObjectKind::TUPLE: {
                    NestingGuard guard{"while hashing"};
                    size_t seed = 0x7475706c;
                    for (const auto& item : static_cast<const TupleObject&>(*x).items) {
                        seed = combine_hashes(seed, hash_value(item));
                    }
                    return seed;
                }
                case ObjectKind::RANGE: {
                    const auto& range = static_cast<const RangeObject&>(*x);
                    auto len = range.length();
                    size_t seed = std::hash<int64_t>{}(len);
                    if (len > 0) {
                        seed = combine_hashes(seed, std::hash<int64_t>{}(range.start));
                    }
                    if (len > 1) {
                        seed = combine_hashes(seed, std::hash<int64_t>{}(range.step));
                    }
                    return seed;
                }
                case ObjectKind::BUILTIN_FUNCTION:
                    return std::hash<int>{}(
                        static_cast<int>(static_cast<const BuiltinFunctionObject&>(*x).builtin)
                    );
                case ObjectKind::EXCEPTION_CLASS:
                    return std::hash<int>{}(static_cast<int>(
                        static_cast<const ExceptionClassObject&>(*x).exception_kind
                    ));
                case ObjectKind::LIST:
                case ObjectKind::DICT:
                case ObjectKind::SET:
                case ObjectKind::DICT_VIEW:
                    raise(ExceptionKind::TYPE_ERROR, "unhashable type: '", type_name(val), '\'');
                case ObjectKind::BOUND_METHOD: {
                    const auto& method = static_cast<const BoundMethodObject&>(*x);
                    return combine_hashes(
                        std::hash<std::string_view>{}(method.name), hash_value(method.self)
                    );
                }
                case ObjectKind::ITERATOR:
                case ObjectKind::FUNCTION:
                case ObjectKind::EXCEPTION:
                case ObjectKind::SCOPE: return std::hash<const Object*>{}(x.get());
                }
                return 0;
            }
        },
        val
    );
}

std::string repr(const Value& val) {
    std::string res;
    append_repr(res, val);
    return res;
}

std::string str(const Value& val) {
    if (const auto* s = std::get_if<StrPtr>(&val)) {
        return **s;
    }
    if (const auto* exc = as<ExceptionObject>(val)) {
        return exception_message(exc->exception_kind, exc->args);
    }
    return repr(val);
}

std::string exception_message(ExceptionKind kind, const std::vector<Value>& args) {
    if (args.empty()) {
        return "";
    }
    if (args.size() == 1) {
        return kind == ExceptionKind::KEY_ERROR ? repr(args[0]) : str(args[0]);
    }
    std::string res = "(";
    append_items(res, args);
    res += ')';
    return res;
}

std::string float_repr(double x) {
    if (std::isnan(x)) {
        return "nan";
    }
    if (std::isinf(x)) {
        return x > 0 ? "inf" : "-inf";
    }
    if (x == 0) {
        return std::signbit(x) ? "-0.0" : "0.0";
    }

    // Shortest round-trip digits d.ddd and the decimal exponent
    char buff[64];
    auto [ptr, ec] = std::to_chars(buff, buff + sizeof(buff), x, std::chars_format::scientific);
    std::string_view sci{buff, static_cast<size_t>(ptr - buff)};
    std::string res;
    if (sci.front() == '-') {
        res += '-';
        sci.remove_prefix(1);
    }
    size_t e_pos = sci.find('e');
    std::string digits;
    for (char c : sci.substr(0, e_pos)) {
        if (c != '.') {
            digits += c;
        }
    }
    auto exp_str = sci.substr(e_pos + 1);
    bool negative_exp = exp_str.front() == '-';
    if (exp_str.front() == '-' or exp_str.front() == '+') {
        exp_str.remove_prefix(1);
    }
    int exponent = 0;
    std::from_chars(exp_str.data(), exp_str.data() + exp_str.size(), exponent);
    if (negative_exp) {
        exponent = -exponent;
    }

    if (exponent >= -4 and exponent < 16) {
        if (exponent >= 0) {
            auto int_digits = static_cast<size_t>(exponent) + 1;
            if (digits.size() <= int_digits) {
                res += digits;
                res.append(int_digits - digits.size(), '0');
                res += ".0";
            } else {
                back_insert(
                    res,
                    std::string_view{digits}.substr(0, int_digits),
                    '.',
                    std::string_view{digits}.substr(int_digits)
                );
            }
        } else {
            res += "0.";
            res.append(static_cast<size_t>(-exponent - 1), '0');
            res += digits;
        }
        return res;
    }

    res += digits[0];
    if (digits.size() > 1) {
        back_insert(res, '.', std::string_view{digits}.substr(1));
    }
    back_insert(res, 'e', exponent < 0 ? '-' : '+');
    int abs_exp = std::abs(exponent);
    if (abs_exp < 10) {
        res += '0';
    }
    back_insert(res, abs_exp);
    return res;
}

size_t utf8_char_length(std::string_view str, size_t pos) noexcept {
    auto c = static_cast<unsigned char>(str[pos]);
    size_t len = c < 0x80 ? 1 : (c >> 5) == 0x6 ? 2 : (c >> 4) == 0xe ? 3 : (c >> 3) == 0x1e ? 4 : 1;
    return std::min(len, str.size() - pos);
}

size_t utf8_length(std::string_view str) noexcept {
    return static_cast<size_t>(std::count_if(str.begin(), str.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xc0) != 0x80;
    }));
}

size_t utf8_offset(std::string_view str, size_t idx) noexcept {
    size_t pos = 0;
    while (idx > 0 and pos < str.size()) {
        pos += utf8_char_length(str, pos);
        --idx;
    }
    return pos;
}

void append_utf8(std::string& out, uint32_t code_point) {
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xc0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3f));
    } else if (code_point < 0x10000) {
        out += static_cast<char>(0xe0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3f));
        out += static_cast<char>(0x80 | (code_point & 0x3f));
    } else {
        out += static_cast<char>(0xf0 | (code_point >> 18));
        out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3f));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3f));
        out += static_cast<char>(0x80 | (code_point & 0x3f));
    }
}

} // namespace chk::lang
