#include <algorithm>
#include <chklib/ctype.hh>
#include <chklib/lang/exceptions.hh>
#include <chklib/lang/format.hh>
#include <chklib/lang/operations.hh>
#include <chklib/limits.hh>
#include <cmath>
#include <cstdio>
#include <optional>

namespace chk::lang {

namespace {

struct FormatSpec {
    std::string fill = " ";
    char align = 0; // 0, '<', '>', '^' or '='
    char sign = 0; // 0, '+', '-' or ' '
    bool alternate = false;
    bool zero = false;
    size_t width = 0;
    char grouping = 0; // 0, ',' or '_'
    std::optional<size_t> precision;
    char type = 0;
};

size_t parse_number(std::string_view spec, size_t& pos) {
    size_t res = 0;
    while (pos < spec.size() and is_digit(spec[pos])) {
        res = res * 10 + static_cast<size_t>(spec[pos] - '0');
        if (res > limits::max_string_length) {
            raise(ExceptionKind::MEMORY_ERROR, "string is too long");
        }
        ++pos;
    }
    return res;
}

bool is_align(char c) noexcept { return c == '<' or c == '>' or c == '^' or c == '='; }

FormatSpec parse_spec(std::string_view spec, std::string_view type_name) {
    FormatSpec res;
    size_t pos = 0;
    if (not spec.empty()) {
        size_t first_len = utf8_char_length(spec, 0);
        if (first_len < spec.size() and is_align(spec[first_len])) {
            res.fill = std::string{spec.substr(0, first_len)};
            res.align = spec[first_len];
            pos = first_len + 1;
        } else if (is_align(spec[0])) {
            res.align = spec[0];
            pos = 1;
        }
    }
    if (pos < spec.size() and (spec[pos] == '+' or spec[pos] == '-' or spec[pos] == ' ')) {
        res.sign = spec[pos++];
    }
    if (pos < spec.size() and spec[pos] == '#') {
        res.alternate = true;
        ++pos;
    }
    if (pos < spec.size() and spec[pos] == '0') {
        res.zero = true;
        ++pos;
    }
    res.width = parse_number(spec, pos);
    if (pos < spec.size() and (spec[pos] == ',' or spec[pos] == '_')) {
        res.grouping = spec[pos++];
    }
    if (pos < spec.size() and spec[pos] == '.') {
        ++pos;
        if (pos == spec.size() or not is_digit(spec[pos])) {
            raise(ExceptionKind::VALUE_ERROR, "Format specifier missing precision");
        }
        res.precision = parse_number(spec, pos);
    }
    if (pos + 1 == spec.size()) {
        res.type = spec[pos++];
    }
    if (pos != spec.size()) {
        raise(
            ExceptionKind::VALUE_ERROR,
            "Invalid format specifier '",
            spec,
            "' for object of type '",
            type_name,
            "'"
        );
    }
    if (res.zero and not res.align) {
        res.fill = "0";
        res.align = '=';
    }
    return res;
}

[[noreturn]] void raise_unknown_code(char type, std::string_view type_name) {
    raise(
        ExceptionKind::VALUE_ERROR,
        "Unknown format code '",
        type,
        "' for object of type '",
        type_name,
        "'"
    );
}

// Pads @p sign + @p body to the spec's width
std::string pad(std::string_view sign, std::string_view body, const FormatSpec& spec, char default_align) {
    size_t len = utf8_length(sign) + utf8_length(body);
    char align = spec.align ? spec.align : default_align;
    std::string res;
    if (len >= spec.width) {
        res.append(sign);
        res.append(body);
        return res;
    }
    size_t padding = spec.width - len;
    auto append_fill = [&](size_t count) {
        for (size_t i = 0; i < count; ++i) {
            res += spec.fill;
        }
    };
    switch (align) {
    case '<':
        res.append(sign);
        res.append(body);
        append_fill(padding);
        break;
    case '^':
        append_fill(padding / 2);
        res.append(sign);
        res.append(body);
        append_fill(padding - padding / 2);
        break;
    case '=':
        res.append(sign);
        append_fill(padding);
        res.append(body);
        break;
    default:
        append_fill(padding);
        res.append(sign);
        res.append(body);
        break;
    }
    return res;
}

// Inserts @p separator between groups of @p group_size digits of the leading digit run
std::string group_digits(std::string_view digits, char separator, size_t group_size) {
    size_t end = 0;
    while (end < digits.size() and (group_size == 4 ? is_xdigit(digits[end]) : is_digit(digits[end]))) {
        ++end;
    }
    std::string res;
    for (size_t i = 0; i < end; ++i) {
        if (i > 0 and (end - i) % group_size == 0) {
            res += separator;
        }
        res += digits[i];
    }
    res.append(digits.substr(end));
    return res;
}

std::string sign_of(bool negative, char sign) {
    if (negative) {
        return "-";
    }
    if (sign == '+') {
        return "+";
    }
    if (sign == ' ') {
        return " ";
    }
    return "";
}

std::string format_string(std::string_view str, const FormatSpec& spec) {
    if (spec.type != 0 and spec.type != 's') {
        raise_unknown_code(spec.type, "str");
    }
    if (spec.sign) {
        raise(ExceptionKind::VALUE_ERROR, "Sign not allowed in string format specifier");
    }
    if (spec.alternate) {
        raise(ExceptionKind::VALUE_ERROR, "Alternate form (#) not allowed in string format specifier");
    }
    if (spec.align == '=') {
        raise(ExceptionKind::VALUE_ERROR, "'=' alignment not allowed in string format specifier");
    }
    if (spec.grouping) {
        raise(ExceptionKind::VALUE_ERROR, "Cannot specify '", spec.grouping, "' with 's'.");
    }
    if (spec.precision) {
        str = str.substr(0, utf8_offset(str, std::min(*spec.precision, utf8_length(str))));
    }
    return pad("", str, spec, '<');
}

std::string format_float(double x, const FormatSpec& spec, std::string_view type_name);

std::string format_int(int64_t x, const FormatSpec& spec, std::string_view type_name) {
    switch (spec.type) {
    case 'e':
    case 'E':
    case 'f':
    case 'F':
    case 'g':
    case 'G':
    case '%': return format_float(static_cast<double>(x), spec, type_name);
    case 0:
    case 'd':
    case 'n':
    case 'b':
    case 'o':
    case 'x':
    case 'X':
    case 'c': break;
    default: raise_unknown_code(spec.type, type_name);
    }
    if (spec.precision) {
        raise(ExceptionKind::VALUE_ERROR, "Precision not allowed in integer format specifier");
    }
    if (spec.type == 'c') {
        if (spec.sign) {
            raise(ExceptionKind::VALUE_ERROR, "Sign not allowed with integer format specifier 'c'");
        }
        if (x < 0 or x > 0x10ffff) {
            raise(ExceptionKind::OVERFLOW_ERROR, "%c arg not in range(0x110000)");
        }
        std::string chr;
        append_utf8(chr, static_cast<uint32_t>(x));
        return pad("", chr, spec, '<');
    }

    uint64_t magnitude = x < 0 ? ~static_cast<uint64_t>(x) + 1 : static_cast<uint64_t>(x);
    unsigned base = 10;
    std::string prefix;
    switch (spec.type) {
    case 'b': base = 2, prefix = "0b"; break;
    case 'o': base = 8, prefix = "0o"; break;
    case 'x': base = 16, prefix = "0x"; break;
    case 'X': base = 16, prefix = "0X"; break;
    default: break;
    }
    std::string digits;
    do {
        digits += "0123456789abcdef"[magnitude % base];
        magnitude /= base;
    } while (magnitude > 0);
    std::reverse(digits.begin(), digits.end());
    if (spec.type == 'X') {
        for (auto& c : digits) {
            c = to_upper(c);
        }
    }
    if (spec.grouping) {
        if (spec.grouping == ',' and base != 10) {
            raise(ExceptionKind::VALUE_ERROR, "Cannot specify ',' with '", spec.type, "'.");
        }
        digits = group_digits(digits, spec.grouping, base == 10 ? 3 : 4);
    }
    auto sign = sign_of(x < 0, spec.sign);
    if (spec.alternate) {
        sign += prefix;
    }
    return pad(sign, digits, spec, '>');
}

std::string format_float(double x, const FormatSpec& spec, std::string_view type_name) {
    char type = spec.type;
    switch (type) {
    case 0:
    case 'e':
    case 'E':
    case 'f':
    case 'F':
    case 'g':
    case 'G':
    case 'n':
    case '%': break;
    default: raise_unknown_code(type, type_name);
    }
    if (type == 'n') {
        type = 'g';
    }
    double value = type == '%' ? x * 100 : x;
    std::string body;
    if (type == 0 and not spec.precision) {
        body = float_repr(std::fabs(value));
    } else {
        int precision = static_cast<int>(spec.precision.value_or(6));
        char conversion = type == 0 ? 'g' : (type == '%' ? 'f' : type);
        if (type == 0 and precision == 0) {
            precision = 1;
        }
        char fmt[] = {'%', '.', '*', conversion, '\0'};
        int len = std::snprintf(nullptr, 0, fmt, precision, std::fabs(value));
        if (len < 0 or static_cast<size_t>(len) > limits::max_string_length) {
            raise(ExceptionKind::MEMORY_ERROR, "string is too long");
        }
        body.resize(static_cast<size_t>(len) + 1);
        std::snprintf(body.data(), body.size(), fmt, precision, std::fabs(value));
        body.resize(static_cast<size_t>(len));
        if (type == 0 and std::isfinite(value) and
            body.find_first_of(".e") == std::string::npos)
        {
            body += ".0";
        }
        if (type == '%') {
            body += '%';
        }
    }
    if (spec.grouping) {
        body = group_digits(body, spec.grouping, 3);
    }
    return pad(sign_of(std::signbit(value) and not std::isnan(value), spec.sign), body, spec, '>');
}

std::string format_with_spec(const Value& val, std::string_view spec) {
    if (const auto* s = std::get_if<StrPtr>(&val)) {
        return format_string(**s, parse_spec(spec, "str"));
    }
    if (const auto* b = std::get_if<bool>(&val)) {
        if (spec.empty()) {
            return *b ? "True" : "False";
        }
        return format_int(*b ? 1 : 0, parse_spec(spec, "bool"), "bool");
    }
    if (const auto* i = std::get_if<int64_t>(&val)) {
        return format_int(*i, parse_spec(spec, "int"), "int");
    }
    if (const auto* d = std::get_if<double>(&val)) {
        return format_float(*d, parse_spec(spec, "float"), "float");
    }
    if (spec.empty()) {
        return str(val);
    }
    raise(ExceptionKind::TYPE_ERROR, "unsupported format string passed to ", type_name(val), ".__format__");
}

void check_length(const std::string& str) {
    if (str.size() > limits::max_string_length) {
        raise(ExceptionKind::MEMORY_ERROR, "string is too long");
    }
}

/* str.format() */

class Formatter {
    const std::vector<Value>& args_;
    const KwArgs& kwargs_;
    size_t next_auto_ = 0;
    enum class Numbering : uint8_t { NONE, AUTO, MANUAL } numbering_ = Numbering::NONE;

    const Value& field_value(std::string_view name) {
        if (name.empty()) {
            if (numbering_ == Numbering::MANUAL) {
                raise(
                    ExceptionKind::VALUE_ERROR,
                    "cannot switch from manual field specification to automatic field numbering"
                );
            }
            numbering_ = Numbering::AUTO;
            return positional(next_auto_++);
        }
        if (std::all_of(name.begin(), name.end(), is_digit<char>)) {
            if (numbering_ == Numbering::AUTO) {
                raise(
                    ExceptionKind::VALUE_ERROR,
                    "cannot switch from automatic field numbering to manual field specification"
                );
            }
            numbering_ = Numbering::MANUAL;
            size_t pos = 0;
            return positional(parse_number(name, pos));
        }
        if (name.find_first_of(".[") != std::string_view::npos) {
            raise(
                ExceptionKind::VALUE_ERROR,
                "attribute and item access is not supported in format fields: '",
                name,
                "'"
            );
        }
        for (const auto& [key, val] : kwargs_) {
            if (key == name) {
                return val;
            }
        }
        raise(ExceptionKind::KEY_ERROR, "'", name, "'");
    }

    const Value& positional(size_t idx) {
        if (idx >= args_.size()) {
            raise(
                ExceptionKind::INDEX_ERROR,
                "Replacement index ",
                idx,
                " out of range for positional args tuple"
            );
        }
        return args_[idx];
    }

    std::string replace_field(std::string_view field, int depth) {
        size_t name_end = field.find_first_of("!:");
        auto name = field.substr(0, name_end);
        char conversion = 0;
        std::string_view spec;
        if (name_end != std::string_view::npos and field[name_end] == '!') {
            if (name_end + 1 >= field.size()) {
                raise(ExceptionKind::VALUE_ERROR, "end of string while looking for conversion specifier");
            }
            conversion = field[name_end + 1];
            if (name_end + 2 < field.size() and field[name_end + 2] != ':') {
                raise(ExceptionKind::VALUE_ERROR, "expected ':' after conversion specifier");
            }
            if (name_end + 2 < field.size()) {
                spec = field.substr(name_end + 3);
            }
        } else if (name_end != std::string_view::npos) {
            spec = field.substr(name_end + 1);
        }
        const Value& val = field_value(name);
        auto expanded_spec = expand(spec, depth + 1);
        switch (conversion) {
        case 0: return format_with_spec(val, expanded_spec);
        case 's': return format_string(str(val), parse_spec(expanded_spec, "str"));
        case 'r':
        case 'a': return format_string(repr(val), parse_spec(expanded_spec, "str"));
        default:
            raise(ExceptionKind::VALUE_ERROR, "Unknown conversion specifier ", conversion);
        }
    }

public:
    Formatter(const std::vector<Value>& args, const KwArgs& kwargs) noexcept
    : args_{args}
    , kwargs_{kwargs} {}

    std::string expand(std::string_view fmt, int depth) {
        if (depth > 2) {
            raise(ExceptionKind::VALUE_ERROR, "Max string recursion exceeded");
        }
        std::string res;
        for (size_t i = 0; i < fmt.size(); ++i) {
            char c = fmt[i];
            if (c == '}') {
                if (i + 1 < fmt.size() and fmt[i + 1] == '}') {
                    res += '}';
                    ++i;
                    continue;
                }
                raise(ExceptionKind::VALUE_ERROR, "Single '}' encountered in format string");
            }
            if (c != '{') {
                res += c;
                continue;
            }
            if (i + 1 < fmt.size() and fmt[i + 1] == '{') {
                res += '{';
                ++i;
                continue;
            }
            size_t nesting = 1;
            size_t end = i + 1;
            for (; end < fmt.size(); ++end) {
                if (fmt[end] == '{') {
                    ++nesting;
                } else if (fmt[end] == '}' and --nesting == 0) {
                    break;
                }
            }
            if (end == fmt.size()) {
                raise(ExceptionKind::VALUE_ERROR, "Single '{' encountered in format string");
            }
            res += replace_field(fmt.substr(i + 1, end - i - 1), depth);
            check_length(res);
            i = end;
        }
        return res;
    }
};

/* printf-style formatting */

double to_real(const Value& val, char conversion) {
    if (const auto* d = std::get_if<double>(&val)) {
        return *d;
    }
    if (const auto* i = std::get_if<int64_t>(&val)) {
        return static_cast<double>(*i);
    }
    if (const auto* b = std::get_if<bool>(&val)) {
        return *b ? 1 : 0;
    }
    if (conversion == 'd' or conversion == 'i' or conversion == 'u') {
        raise(
            ExceptionKind::TYPE_ERROR,
            "%",
            conversion,
            " format: a real number is required, not ",
            type_name(val)
        );
    }
    raise(ExceptionKind::TYPE_ERROR, "must be real number, not ", type_name(val));
}

int64_t to_integer(const Value& val, char conversion) {
    if (const auto* i = std::get_if<int64_t>(&val)) {
        return *i;
    }
    if (const auto* b = std::get_if<bool>(&val)) {
        return *b ? 1 : 0;
    }
    if (conversion == 'd' or conversion == 'i' or conversion == 'u') {
        double x = to_real(val, conversion);
        if (std::isnan(x)) {
            raise(ExceptionKind::VALUE_ERROR, "cannot convert float NaN to integer");
        }
        if (std::isinf(x)) {
            raise(ExceptionKind::OVERFLOW_ERROR, "cannot convert float infinity to integer");
        }
        if (std::fabs(x) >= 9.2233720368547758e18) {
            raise(ExceptionKind::OVERFLOW_ERROR, "integer overflow");
        }
        return static_cast<int64_t>(x);
    }
    raise(
        ExceptionKind::TYPE_ERROR,
        "%",
        conversion,
        " format: an integer is required, not ",
        type_name(val)
    );
}

} // namespace

std::string format_value(const Value& val, std::string_view spec) {
    auto res = format_with_spec(val, spec);
    check_length(res);
    return res;
}

std::string str_format(std::string_view fmt, const std::vector<Value>& args, const KwArgs& kwargs) {
    return Formatter{args, kwargs}.expand(fmt, 0);
}

std::string percent_format(std::string_view fmt, const Value& args) {
    std::vector<Value> items;
    const DictObject* mapping = as<DictObject>(args);
    if (const auto* tuple = as<TupleObject>(args)) {
        items = tuple->items;
    } else {
        items.emplace_back(args);
    }
    size_t next_arg = 0;
    auto take_arg = [&]() -> const Value& {
        if (next_arg >= items.size()) {
            raise(ExceptionKind::TYPE_ERROR, "not enough arguments for format string");
        }
        return items[next_arg++];
    };

    std::string res;
    for (size_t i = 0; i < fmt.size(); ++i) {
        if (fmt[i] != '%') {
            res += fmt[i];
            continue;
        }
        ++i;
        auto at_end = [&] {
            if (i >= fmt.size()) {
                raise(ExceptionKind::VALUE_ERROR, "incomplete format");
            }
        };
        at_end();

        std::optional<Value> keyed;
        if (fmt[i] == '(') {
            if (not mapping) {
                raise(ExceptionKind::TYPE_ERROR, "format requires a mapping");
            }
            size_t nesting = 1;
            size_t key_start = ++i;
            for (; i < fmt.size() and nesting > 0; ++i) {
                if (fmt[i] == '(') {
                    ++nesting;
                } else if (fmt[i] == ')') {
                    --nesting;
                }
            }
            if (nesting > 0) {
                raise(ExceptionKind::VALUE_ERROR, "incomplete format key");
            }
            std::string key{fmt.substr(key_start, i - key_start - 1)};
            Value key_val = std::make_shared<const std::string>(key);
            auto pos = mapping->table.find(key_val);
            if (not pos) {
                raise(ExceptionKind::KEY_ERROR, repr(key_val));
            }
            keyed = mapping->table.slots()[*pos]->value;
            at_end();
        }

        FormatSpec spec;
        bool left = false;
        for (; i < fmt.size(); ++i) {
            char flag = fmt[i];
            if (flag == '-') {
                left = true;
            } else if (flag == '+') {
                spec.sign = '+';
            } else if (flag == ' ') {
                if (spec.sign != '+') {
                    spec.sign = ' ';
                }
            } else if (flag == '#') {
                spec.alternate = true;
            } else if (flag == '0') {
                spec.zero = true;
            } else {
                break;
            }
        }
        at_end();
        auto star_or_number = [&]() -> size_t {
            if (fmt[i] == '*') {
                ++i;
                const auto& val = take_arg();
                if (not std::holds_alternative<int64_t>(val) and not std::holds_alternative<bool>(val)) {
                    raise(ExceptionKind::TYPE_ERROR, "* wants int");
                }
                auto num = std::holds_alternative<bool>(val) ? int64_t{std::get<bool>(val)}
                                                             : std::get<int64_t>(val);
                if (num < 0) {
                    left = true;
                    num = -num;
                }
                if (static_cast<uint64_t>(num) > limits::max_string_length) {
                    raise(ExceptionKind::MEMORY_ERROR, "string is too long");
                }
                return static_cast<size_t>(num);
            }
            return parse_number(fmt, i);
        };
        spec.width = star_or_number();
        at_end();
        std::optional<size_t> precision;
        if (fmt[i] == '.') {
            ++i;
            at_end();
            precision = star_or_number();
        }
        at_end();
        while (fmt[i] == 'h' or fmt[i] == 'l' or fmt[i] == 'L') {
            ++i;
            at_end();
        }

        char conversion = fmt[i];
        if (conversion == '%') {
            res += '%';
            continue;
        }
        const Value& val = keyed ? *keyed : take_arg();
        if (left) {
            spec.align = '<';
        } else if (spec.zero and conversion != 's' and conversion != 'r' and conversion != 'a' and
                   conversion != 'c')
        {
            spec.fill = "0";
            spec.align = '=';
        } else {
            spec.align = '>';
        }
        spec.zero = false;

        switch (conversion) {
        case 's':
        case 'r':
        case 'a': {
            auto text = conversion == 's' ? str(val) : repr(val);
            FormatSpec str_spec{
                .fill = " ", .align = spec.align, .width = spec.width, .precision = precision
            };
            res += format_string(text, str_spec);
            break;
        }
        case 'd':
        case 'i':
        case 'u':
        case 'x':
        case 'X':
        case 'o': {
            int64_t x = to_integer(val, conversion);
            spec.type = conversion == 'i' or conversion == 'u' ? 'd' : conversion;
            auto formatted = format_int(x, spec, type_name(val));
            if (precision and *precision > 0) {
                // Precision of an integer conversion is its minimal number of digits
                size_t digits_start = formatted.find_first_of("0123456789abcdefABCDEF");
                if (spec.alternate and conversion != 'd') {
                    digits_start += 2;
                }
                size_t digits_end = digits_start;
                while (digits_end < formatted.size() and is_xdigit(formatted[digits_end])) {
                    ++digits_end;
                }
                if (digits_end - digits_start < *precision) {
                    formatted.insert(digits_start, *precision - (digits_end - digits_start), '0');
                }
            }
            res += formatted;
            break;
        }
        case 'e':
        case 'E':
        case 'f':
        case 'F':
        case 'g':
        case 'G': {
            spec.type = conversion;
            spec.precision = precision.value_or(6);
            res += format_float(to_real(val, conversion), spec, type_name(val));
            break;
        }
        case 'c': {
            std::string chr;
            if (const auto* s = std::get_if<StrPtr>(&val)) {
                if (utf8_length(**s) != 1) {
                    raise(
                        ExceptionKind::TYPE_ERROR,
                        "%c requires an int or a unicode character, not a string of length ",
                        utf8_length(**s)
                    );
                }
                chr = **s;
            } else if (std::holds_alternative<int64_t>(val) or std::holds_alternative<bool>(val)) {
                int64_t code = to_integer(val, 'c');
                if (code < 0 or code > 0x10ffff) {
                    raise(ExceptionKind::OVERFLOW_ERROR, "%c arg not in range(0x110000)");
                }
                append_utf8(chr, static_cast<uint32_t>(code));
            } else {
                raise(
                    ExceptionKind::TYPE_ERROR,
                    "%c requires an int or a unicode character, not ",
                    type_name(val)
                );
            }
            FormatSpec chr_spec{.fill = " ", .align = spec.align == '<' ? '<' : '>', .width = spec.width};
            res += format_string(chr, chr_spec);
            break;
        }
        default:
            raise(
                ExceptionKind::VALUE_ERROR,
                "unsupported format character '",
                conversion,
                "' (0x",
                "0123456789abcdef"[static_cast<unsigned char>(conversion) >> 4],
                "0123456789abcdef"[static_cast<unsigned char>(conversion) & 15],
                ") at index ",
                i
            );
        }
        check_length(res);
    }
    if (not mapping and next_arg < items.size()) {
        raise(ExceptionKind::TYPE_ERROR, "not all arguments converted during string formatting");
    }
    return res;
}

} // namespace chk::lang
