#include "call_args.hh"

#include <algorithm>
#include <chklib/ctype.hh>
#include <chklib/lang/interpreter.hh>
#include <chklib/lang/operations.hh>
#include <chklib/limits.hh>
#include <chklib/macros/throw.hh>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <numeric>

namespace chk::lang {

namespace {

std::string_view strip_spaces(std::string_view str) noexcept {
    while (not str.empty() and is_space(str.front())) {
        str.remove_prefix(1);
    }
    while (not str.empty() and is_space(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

int digit_value(char c) noexcept {
    if (is_digit(c)) {
        return c - '0';
    }
    if (is_alpha(c)) {
        return to_lower(c) - 'a' + 10;
    }
    return 99;
}

// Python's int(str, base)
int64_t parse_int(const std::string& text, int64_t base) {
    auto invalid = [&]() {
        raise(
            ExceptionKind::VALUE_ERROR,
            "invalid literal for int() with base ",
            base,
            ": ",
            repr(std::make_shared<const std::string>(text))
        );
    };
    auto str = strip_spaces(text);
    bool negative = false;
    if (not str.empty() and (str.front() == '+' or str.front() == '-')) {
        negative = str.front() == '-';
        str.remove_prefix(1);
    }
    auto has_prefix = [&](char letter) {
        return str.size() >= 2 and str[0] == '0' and to_lower(str[1]) == letter;
    };
    int64_t actual_base = base;
    if (base == 0 or base == 16 or base == 8 or base == 2) {
        char letter = 0;
        if (has_prefix('x') and (base == 0 or base == 16)) {
            letter = 'x', actual_base = 16;
        } else if (has_prefix('o') and (base == 0 or base == 8)) {
            letter = 'o', actual_base = 8;
        } else if (has_prefix('b') and (base == 0 or base == 2)) {
            letter = 'b', actual_base = 2;
        }
        if (letter) {
            str.remove_prefix(2);
            // An underscore may follow the prefix
            if (not str.empty() and str.front() == '_') {
                str.remove_prefix(1);
            }
        } else if (base == 0) {
            actual_base = 10;
            if (str.size() > 1 and str.front() == '0' and
                str.find_first_not_of("0_") != std::string_view::npos)
            {
                invalid();
            }
        }
    }
    if (str.empty() or str.front() == '_' or str.back() == '_') {
        invalid();
    }
    uint64_t magnitude = 0;
    char prev = 0;
    for (char c : str) {
        if (c == '_') {
            if (prev == '_') {
                invalid();
            }
            prev = c;
            continue;
        }
        int digit = digit_value(c);
        if (digit >= actual_base) {
            invalid();
        }
        if (magnitude > (std::numeric_limits<uint64_t>::max() - static_cast<uint64_t>(digit)) /
                static_cast<uint64_t>(actual_base))
        {
            raise(ExceptionKind::OVERFLOW_ERROR, "integer overflow");
        }
        magnitude = magnitude * static_cast<uint64_t>(actual_base) + static_cast<uint64_t>(digit);
        prev = c;
    }
    uint64_t limit = negative ? uint64_t{1} << 63 : (uint64_t{1} << 63) - 1;
    if (magnitude > limit) {
        raise(ExceptionKind::OVERFLOW_ERROR, "integer overflow");
    }
    return negative ? static_cast<int64_t>(~magnitude + 1) : static_cast<int64_t>(magnitude);
}

int64_t float_to_int(double x) {
    if (std::isnan(x)) {
        raise(ExceptionKind::VALUE_ERROR, "cannot convert float NaN to integer");
    }
    if (std::isinf(x)) {
        raise(ExceptionKind::OVERFLOW_ERROR, "cannot convert float infinity to integer");
    }
    x = std::trunc(x);
    // 2^63 is exactly representable, every smaller double fits in int64_t
    if (x >= 9223372036854775808.0 or x < -9223372036854775808.0) {
        raise(ExceptionKind::OVERFLOW_ERROR, "integer overflow");
    }
    return static_cast<int64_t>(x);
}

// Python's float(str)
double parse_float(const std::string& text) {
    auto invalid = [&]() {
        raise(
            ExceptionKind::VALUE_ERROR,
            "could not convert string to float: ",
            repr(std::make_shared<const std::string>(text))
        );
    };
    auto str = strip_spaces(text);
    std::string lower;
    for (char c : str) {
        lower += to_lower(c);
    }
    std::string_view unsigned_part = lower;
    bool negative = false;
    if (not unsigned_part.empty() and (unsigned_part.front() == '+' or unsigned_part.front() == '-')) {
        negative = unsigned_part.front() == '-';
        unsigned_part.remove_prefix(1);
    }
    if (unsigned_part == "inf" or unsigned_part == "infinity") {
        return negative ? -HUGE_VAL : HUGE_VAL;
    }
    if (unsigned_part == "nan") {
        return negative ? -NAN : NAN;
    }

    // [digits][.digits][e[sign]digits], underscores only between digits
    std::string cleaned;
    size_t digits = 0;
    size_t i = 0;
    auto scan_digits = [&]() {
        size_t count = 0;
        while (i < unsigned_part.size()) {
            char c = unsigned_part[i];
            if (is_digit(c)) {
                cleaned += c;
                ++count;
            } else if (c == '_' and count > 0 and i + 1 < unsigned_part.size() and
                       is_digit(unsigned_part[i + 1]))
            {
                // skipped
            } else {
                break;
            }
            ++i;
        }
        return count;
    };
    digits += scan_digits();
    if (i < unsigned_part.size() and unsigned_part[i] == '.') {
        cleaned += '.';
        ++i;
        digits += scan_digits();
    }
    if (digits == 0) {
        invalid();
    }
    if (i < unsigned_part.size() and unsigned_part[i] == 'e') {
        cleaned += 'e';
        ++i;
        if (i < unsigned_part.size() and (unsigned_part[i] == '+' or unsigned_part[i] == '-')) {
            cleaned += unsigned_part[i++];
        }
        if (scan_digits() == 0) {
            invalid();
        }
    }
    if (i != unsigned_part.size()) {
        invalid();
    }
    double res = std::strtod(cleaned.c_str(), nullptr);
    return negative ? -res : res;
}

// Rounds half to even
double round_half_even(double x) noexcept {
    double rounded = std::round(x);
    if (std::fabs(x - std::trunc(x)) == 0.5) {
        rounded = 2.0 * std::round(x / 2.0);
    }
    return rounded;
}

double round_float(double x, int64_t ndigits) {
    if (not std::isfinite(x) or x == 0) {
        return x;
    }
    if (ndigits > 22) {
        return x;
    }
    if (ndigits >= 0) {
        // printf rounds the exact binary value correctly, like Python's round()
        int len = std::snprintf(nullptr, 0, "%.*f", static_cast<int>(ndigits), x);
        std::string buff(static_cast<size_t>(len) + 1, '\0');
        std::snprintf(buff.data(), buff.size(), "%.*f", static_cast<int>(ndigits), x);
        return std::strtod(buff.c_str(), nullptr);
    }
    if (ndigits < -308) {
        return std::copysign(0.0, x);
    }
    double pow10 = std::pow(10.0, static_cast<double>(-ndigits));
    double res = round_half_even(x / pow10) * pow10;
    if (std::isinf(res)) {
        raise(ExceptionKind::OVERFLOW_ERROR, "rounded value too large to represent");
    }
    return std::copysign(res, x);
}

int64_t round_int(int64_t x, int64_t ndigits) {
    if (ndigits >= 0) {
        return x;
    }
    if (ndigits < -18) {
        return 0;
    }
    int64_t pow10 = 1;
    for (int64_t i = 0; i < -ndigits; ++i) {
        pow10 *= 10;
    }
    int64_t quot = x / pow10;
    int64_t rem = x % pow10;
    if (rem < 0) {
        --quot;
        rem += pow10;
    }
    if (rem * 2 > pow10 or (rem * 2 == pow10 and quot % 2 != 0)) {
        ++quot;
    }
    int64_t res = 0;
    if (__builtin_mul_overflow(quot, pow10, &res)) {
        raise(ExceptionKind::OVERFLOW_ERROR, "integer overflow");
    }
    return res;
}

} // namespace

Value Interpreter::call_builtin(
    Builtin builtin, std::string_view name, std::vector<Value> args, KwArgs kwargs
) {
    switch (builtin) {
    case Builtin::STR: {
        check_no_kwargs(name, kwargs);
        check_args_num(name, args, 0, 1);
        if (args.empty()) {
            return new_str("");
        }
        if (std::holds_alternative<StrPtr>(args[0])) {
            return args[0];
        }
        return new_str(str(args[0]));
    }
    case Builtin::INT: {
        auto base_kwarg = take_kwarg(kwargs, "base");
        check_kwargs_consumed(name, kwargs);
        check_args_num(name, args, 0, base_kwarg ? 1 : 2);
        if (base_kwarg) {
            args.emplace_back(std::move(*base_kwarg));
        }
        if (args.empty()) {
            return int64_t{0};
        }
        if (args.size() == 2) {
            int64_t base = to_index(args[1]);
            if (base != 0 and (base < 2 or base > 36)) {
                raise(ExceptionKind::VALUE_ERROR, "int() base must be >= 2 and <= 36, or 0");
            }
            const auto* s = std::get_if<StrPtr>(&args[0]);
            if (not s) {
                raise(ExceptionKind::TYPE_ERROR, "int() can't convert non-string with explicit base");
            }
            return parse_int(**s, base);
        }
        const auto& val = args[0];
        if (const auto* i = std::get_if<int64_t>(&val)) {
            return *i;
        }
        if (const auto* b = std::get_if<bool>(&val)) {
            return int64_t{*b ? 1 : 0};
        }
        if (const auto* d = std::get_if<double>(&val)) {
            return float_to_int(*d);
        }
        if (const auto* s = std::get_if<StrPtr>(&val)) {
            return parse_int(**s, 10);
        }
        raise(
            ExceptionKind::TYPE_ERROR,
            "int() argument must be a string, a bytes-like object or a real number, not '",
            type_name(val),
            "'"
        );
    }
    case Builtin::FLOAT: {
        check_no_kwargs(name, kwargs);
        check_args_num(name, args, 0, 1);
        if (args.empty()) {
            return 0.0;
        }
        const auto& val = args[0];
        if (const auto* d = std::get_if<double>(&val)) {
            return *d;
        }
        if (const auto* i = std::get_if<int64_t>(&val)) {
            return static_cast<double>(*i);
        }
        if (const auto* b = std::get_if<bool>(&val)) {
            return *b ? 1.0 : 0.0;
        }
        if (const auto* s = std::get_if<StrPtr>(&val)) {
            return parse_float(**s);
        }
        raise(
            ExceptionKind::TYPE_ERROR,
            "float() argument must be a string or a real number, not '",
            type_name(val),
            "'"
        );
    }
    case Builtin::BOOL:
        check_no_kwargs(name, kwargs);
        check_args_num(name, args, 0, 1);
        return not args.empty() and is_truthy(args[0]);
    case Builtin::LIST:
    case Builtin::TUPLE: {
        check_no_kwargs(name, kwargs);
        check_args_num(name, args, 0, 1);
        auto items = args.empty() ? std::vector<Value>{} : to_vector(args[0]);
        return builtin == Builtin::LIST ? new_list(std::move(items)) : new_tuple(std::move(items));
    }
    case Builtin::SET: {
        check_no_kwargs(name, kwargs);
        check_args_num(name, args, 0, 1);
        auto res = new_set();
        if (not args.empty()) {
            auto& set = *as<SetObject>(res);
            for (auto& item : to_vector(args[0])) {
                set.table.insert(std::move(item), NoneType{});
            }
            recharge(set);
        }
        return res;
    }
    case Builtin::DICT: {
        check_args_num(name, args, 0, 1);
        auto res = new_dict();
        auto& dict = *as<DictObject>(res);
        if (not args.empty()) {
            if (const auto* other = as<DictObject>(args[0])) {
                for (const auto& slot : other->table.slots()) {
                    if (slot) {
                        dict.table.insert(slot->key, slot->value);
                    }
                }
            } else {
                auto elements = to_vector(args[0]);
                for (size_t i = 0; i < elements.size(); ++i) {
                    const auto& element = elements[i];
                    if (not std::holds_alternative<StrPtr>(element) and
                        not std::holds_alternative<ObjRef>(element))
                    {
                        raise(
                            ExceptionKind::TYPE_ERROR,
                            "cannot convert dictionary update sequence element #",
                            i,
                            " to a sequence"
                        );
                    }
                    auto pair = to_vector(element);
                    if (pair.size() != 2) {
                        raise(
                            ExceptionKind::VALUE_ERROR,
                            "dictionary update sequence element #",
                            i,
                            " has length ",
                            pair.size(),
                            "; 2 is required"
                        );
                    }
                    dict.table.insert(std::move(pair[0]), std::move(pair[1]));
                }
            }
        }
        for (auto& [key, val] : kwargs) {
            dict.table.insert(new_str(key), std::move(val));
        }
        recharge(dict);
        return res;
    }
    case Builtin::LEN: {
        check_no_kwargs(name, kwargs);
        check_args_num(name, args, 1, 1);
        const auto& val = args[0];
        if (const auto* s = std::get_if<StrPtr>(&val)) {
            return static_cast<int64_t>(utf8_length(**s));
        }
        if (const auto* list = as<ListObject>(val)) {
            return static_cast<int64_t>(list->items.size());
        }
        if (const auto* tuple = as<TupleObject>(val)) {
            return static_cast<int64_t>(tuple->items.size());
        }
        if (const auto* dict = as<DictObject>(val)) {
            return static_cast<int64_t>(dict->table.size());
        }
        if (const auto* set = as<SetObject>(val)) {
            return static_cast<int64_t>(set->table.size());
        }
        if (const auto* range = as<RangeObject>(val)) {
            return range->length();
        }
        if (const auto* view = as<DictViewObject>(val)) {
            return static_cast<int64_t>(static_cast<const DictObject&>(*view->dict).table.size());
        }
        raise(ExceptionKind::TYPE_ERROR, "object of type '", type_name(val), "' has no len()");
    }
    case Builtin::RANGE: {
        check_no_kwargs(name, kwargs);
        if (args.empty()) {
            raise(ExceptionKind::TYPE_ERROR, "range expected at least 1 argument, got 0");
        }
        if (args.size() > 3) {
            raise(ExceptionKind::TYPE_ERROR, "range expected at most 3 arguments, got ", args.size());
        }
        int64_t start = 0;
        int64_t stop = 0;
        int64_t step = 1;
        if (args.size() == 1) {
            stop = to_index(args[0]);
        } else {
            start = to_index(args[0]);
            stop = to_index(args[1]);
            if (args.size() == 3) {
                step = to_index(args[2]);
            }
        }
        if (step == 0) {
            raise(ExceptionKind::VALUE_ERROR, "range() arg 3 must not be zero");
        }
        return heap_.make<RangeObject>(start, stop, step);
    }
    case Builtin::ENUMERATE: {
        auto start_kwarg = take_kwarg(kwargs, "start");
        check_kwargs_consumed(name, kwargs);
        check_args_num(name, args, 1, start_kwarg ? 1 : 2);
        int64_t start = 0;
        if (args.size() == 2) {
            start = to_index(args[1]);
        } else if (start_kwarg) {
            start = to_index(*start_kwarg);
        }
        auto iter = heap_.make<IteratorObject>(IteratorObject::Source::ENUMERATE);
        auto& it = static_cast<IteratorObject&>(*iter);
        it.inner.emplace_back(get_iter(args[0]));
        it.counter = start;
        return iter;
    }
    case Builtin::ZIP: {
        check_kwargs_consumed(name, kwargs);
        auto iter = heap_.make<IteratorObject>(IteratorObject::Source::ZIP);
        auto& it = static_cast<IteratorObject&>(*iter);
        for (const auto& arg : args) {
            it.inner.emplace_back(get_iter(arg));
        }
        return iter;
    }
    case Builtin::MAP: {
        check_no_kwargs(name, kwargs);
        if (args.size() < 2) {
            raise(ExceptionKind::TYPE_ERROR, "map() must have at least two arguments.");
        }
        auto iter = heap_.make<IteratorObject>(IteratorObject::Source::MAP);
        auto& it = static_cast<IteratorObject&>(*iter);
        it.func = args[0];
        for (size_t i = 1; i < args.size(); ++i) {
            it.inner.emplace_back(get_iter(args[i]));
        }
        return iter;
    }
    case Builtin::FILTER: {
        check_no_kwargs(name, kwargs);
        if (args.size() != 2) {
            raise(ExceptionKind::TYPE_ERROR, "filter expected 2 arguments, got ", args.size());
        }
        auto iter = heap_.make<IteratorObject>(IteratorObject::Source::FILTER);
        auto& it = static_cast<IteratorObject&>(*iter);
        it.func = args[0];
        it.inner.emplace_back(get_iter(args[1]));
        return iter;
    }
    case Builtin::SORTED: {
        if (args.size() != 1) {
            raise(ExceptionKind::TYPE_ERROR, "sorted expected 1 argument, got ", args.size());
        }
        auto key = take_kwarg(kwargs, "key");
        auto reverse = take_kwarg(kwargs, "reverse");
        check_kwargs_consumed(name, kwargs);
        auto items = to_vector(args[0]);
        sort_values(items, key.value_or(NoneType{}), reverse and is_truthy(*reverse));
        return new_list(std::move(items));
    }
    case Builtin::SUM: {
        auto start_kwarg = take_kwarg(kwargs, "start");
        check_kwargs_consumed(name, kwargs);
        check_args_num(name, args, 1, start_kwarg ? 1 : 2);
        Value total = args.size() == 2 ? args[1] : start_kwarg.value_or(int64_t{0});
        if (std::holds_alternative<StrPtr>(total)) {
            raise(ExceptionKind::TYPE_ERROR, "sum() can't sum strings [use ''.join(seq) instead]");
        }
        auto iter = get_iter(args[0]);
        auto& it = static_cast<IteratorObject&>(*iter);
        while (auto val = next(it)) {
            tick();
            total = binary_op(total, BinaryOperator::ADD, *val);
        }
        return total;
    }
    case Builtin::MIN: return min_max(name, std::move(args), std::move(kwargs), CompareOperator::LT);
    case Builtin::MAX: return min_max(name, std::move(args), std::move(kwargs), CompareOperator::GT);
    case Builtin::ABS: {
        check_no_kwargs(name, kwargs);
        check_args_num(name, args, 1, 1);
        const auto& val = args[0];
        if (const auto* i = std::get_if<int64_t>(&val)) {
            if (*i == std::numeric_limits<int64_t>::min()) {
                raise(ExceptionKind::OVERFLOW_ERROR, "integer overflow");
            }
            return *i < 0 ? -*i : *i;
        }
        if (const auto* b = std::get_if<bool>(&val)) {
            return int64_t{*b ? 1 : 0};
        }
        if (const auto* d = std::get_if<double>(&val)) {
            return std::fabs(*d);
        }
        raise(ExceptionKind::TYPE_ERROR, "bad operand type for abs(): '", type_name(val), "'");
    }
    case Builtin::ROUND: {
        auto ndigits_kwarg = take_kwarg(kwargs, "ndigits");
        check_kwargs_consumed(name, kwargs);
        check_args_num(name, args, 1, ndigits_kwarg ? 1 : 2);
        std::optional<Value> ndigits_val = args.size() == 2 ? std::optional{args[1]} : ndigits_kwarg;
        std::optional<int64_t> ndigits;
        if (ndigits_val and not std::holds_alternative<NoneType>(*ndigits_val)) {
            ndigits = to_index(*ndigits_val);
        }
        const auto& val = args[0];
        if (const auto* d = std::get_if<double>(&val)) {
            if (not ndigits) {
                return float_to_int(round_half_even(*d));
            }
            return round_float(*d, *ndigits);
        }
        if (std::holds_alternative<int64_t>(val) or std::holds_alternative<bool>(val)) {
            int64_t x = to_index(val);
            return ndigits ? round_int(x, *ndigits) : x;
        }
        raise(ExceptionKind::TYPE_ERROR, "type ", type_name(val), " doesn't define __round__ method");
    }
    case Builtin::PRINT:
        print(std::move(args), std::move(kwargs));
        return NoneType{};
    }
    THROW("unknown builtin: ", name);
}

void Interpreter::sort_values(std::vector<Value>& items, const Value& key, bool reverse) {
    std::vector<Value> keys;
    if (std::holds_alternative<NoneType>(key)) {
        keys = items;
    } else {
        keys.reserve(items.size());
        for (const auto& item : items) {
            keys.emplace_back(call(key, {item}, {}));
        }
    }
    std::vector<size_t> order(items.size());
    std::iota(order.begin(), order.end(), 0);
    // Comparisons may throw, then the items are left untouched
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        tick();
        return reverse ? compare_order(keys[b], CompareOperator::LT, keys[a])
                       : compare_order(keys[a], CompareOperator::LT, keys[b]);
    });
    std::vector<Value> sorted;
    sorted.reserve(items.size());
    for (size_t idx : order) {
        sorted.emplace_back(std::move(items[idx]));
    }
    items = std::move(sorted);
}

Value Interpreter::min_max(
    std::string_view name, std::vector<Value> args, KwArgs kwargs, CompareOperator op
) {
    auto key = take_kwarg(kwargs, "key");
    auto default_val = take_kwarg(kwargs, "default");
    check_kwargs_consumed(name, kwargs);
    if (args.empty()) {
        raise(ExceptionKind::TYPE_ERROR, name, " expected at least 1 argument, got 0");
    }
    std::vector<Value> candidates;
    if (args.size() == 1) {
        candidates = to_vector(args[0]);
    } else {
        if (default_val) {
            raise(
                ExceptionKind::TYPE_ERROR,
                "Cannot specify a default for ",
                name,
                "() with multiple positional arguments"
            );
        }
        candidates = std::move(args);
    }
    if (candidates.empty()) {
        if (default_val) {
            return *default_val;
        }
        raise(ExceptionKind::VALUE_ERROR, name, "() iterable argument is empty");
    }
    bool has_key = key and not std::holds_alternative<NoneType>(*key);
    size_t best = 0;
    Value best_key = has_key ? call(*key, {candidates[0]}, {}) : candidates[0];
    for (size_t i = 1; i < candidates.size(); ++i) {
        tick();
        Value cur_key = has_key ? call(*key, {candidates[i]}, {}) : candidates[i];
        if (compare_order(cur_key, op, best_key)) {
            best = i;
            best_key = std::move(cur_key);
        }
    }
    return candidates[best];
}

void Interpreter::print(std::vector<Value> args, KwArgs kwargs) {
    auto separator = [&](std::string_view kwarg_name, const char* default_val) -> std::string {
        auto val = take_kwarg(kwargs, kwarg_name);
        if (not val or std::holds_alternative<NoneType>(*val)) {
            return default_val;
        }
        if (const auto* s = std::get_if<StrPtr>(&*val)) {
            return **s;
        }
        raise(
            ExceptionKind::TYPE_ERROR, kwarg_name, " must be None or a string, not ", type_name(*val)
        );
    };
    auto sep = separator("sep", " ");
    auto end = separator("end", "\n");
    (void)take_kwarg(kwargs, "flush");
    check_kwargs_consumed("print", kwargs);

    std::string text;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            text += sep;
        }
        text += str(args[i]);
        if (text.size() > limits::max_string_length) {
            raise(ExceptionKind::MEMORY_ERROR, "string is too long");
        }
    }
    text += end;
    if (output_truncated_) {
        return;
    }
    size_t room = limits::max_print_output_in_bytes - output_.size();
    if (text.size() > room) {
        output_.append(text, 0, room);
        output_truncated_ = true;
    } else {
        output_ += text;
    }
}

} // namespace chk::lang
