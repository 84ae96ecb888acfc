#include "call_args.hh"

#include <algorithm>
#include <array>
#include <chklib/concat_tostr.hh>
#include <chklib/ctype.hh>
#include <chklib/lang/format.hh>
#include <chklib/lang/interpreter.hh>
#include <chklib/lang/operations.hh>
#include <chklib/macros/throw.hh>

namespace chk::lang {

namespace {

constexpr std::array str_methods = {
    std::string_view{"capitalize"},
    std::string_view{"casefold"},
    std::string_view{"center"},
    std::string_view{"count"},
    std::string_view{"endswith"},
    std::string_view{"find"},
    std::string_view{"format"},
    std::string_view{"index"},
    std::string_view{"isalnum"},
    std::string_view{"isalpha"},
    std::string_view{"isdecimal"},
    std::string_view{"isdigit"},
    std::string_view{"islower"},
    std::string_view{"isnumeric"},
    std::string_view{"isspace"},
    std::string_view{"istitle"},
    std::string_view{"isupper"},
    std::string_view{"join"},
    std::string_view{"ljust"},
    std::string_view{"lower"},
    std::string_view{"lstrip"},
    std::string_view{"partition"},
    std::string_view{"removeprefix"},
    std::string_view{"removesuffix"},
    std::string_view{"replace"},
    std::string_view{"rfind"},
    std::string_view{"rindex"},
    std::string_view{"rjust"},
    std::string_view{"rpartition"},
    std::string_view{"rsplit"},
    std::string_view{"rstrip"},
    std::string_view{"split"},
    std::string_view{"splitlines"},
    std::string_view{"startswith"},
    std::string_view{"strip"},
    std::string_view{"swapcase"},
    std::string_view{"title"},
    std::string_view{"upper"},
    std::string_view{"zfill"},
};

constexpr std::array list_methods = {
    std::string_view{"append"},
    std::string_view{"clear"},
    std::string_view{"copy"},
    std::string_view{"count"},
    std::string_view{"extend"},
    std::string_view{"index"},
    std::string_view{"insert"},
    std::string_view{"pop"},
    std::string_view{"remove"},
    std::string_view{"reverse"},
    std::string_view{"sort"},
};

constexpr std::array tuple_methods = {
    std::string_view{"count"},
    std::string_view{"index"},
};

constexpr std::array dict_methods = {
    std::string_view{"clear"},
    std::string_view{"copy"},
    std::string_view{"get"},
    std::string_view{"items"},
    std::string_view{"keys"},
    std::string_view{"pop"},
    std::string_view{"popitem"},
    std::string_view{"setdefault"},
    std::string_view{"update"},
    std::string_view{"values"},
};

constexpr std::array set_methods = {
    std::string_view{"add"},
    std::string_view{"clear"},
    std::string_view{"copy"},
    std::string_view{"difference"},
    std::string_view{"difference_update"},
    std::string_view{"discard"},
    std::string_view{"intersection"},
    std::string_view{"intersection_update"},
    std::string_view{"isdisjoint"},
    std::string_view{"issubset"},
    std::string_view{"issuperset"},
    std::string_view{"pop"},
    std::string_view{"remove"},
    std::string_view{"symmetric_difference"},
    std::string_view{"symmetric_difference_update"},
    std::string_view{"union"},
    std::string_view{"update"},
};

template <size_t N>
std::optional<std::string_view>
find_in(const std::array<std::string_view, N>& methods, std::string_view name) noexcept {
    auto it = std::find(methods.begin(), methods.end(), name);
    if (it == methods.end()) {
        return std::nullopt;
    }
    return *it;
}

bool values_match(const Value& a, const Value& b) {
    if (a.index() == b.index()) {
        if (const auto* ra = std::get_if<ObjRef>(&a); ra and ra->get() == std::get<ObjRef>(b).get()) {
            return true;
        }
    }
    return values_equal(a, b);
}

// Code points of @p str
std::vector<std::string_view> code_points(std::string_view str) {
    std::vector<std::string_view> res;
    for (size_t pos = 0; pos < str.size();) {
        size_t len = utf8_char_length(str, pos);
        res.emplace_back(str.substr(pos, len));
        pos += len;
    }
    return res;
}

bool is_ascii_space(std::string_view chr) noexcept {
    return chr.size() == 1 and (is_space(chr[0]) or (chr[0] >= '\x1c' and chr[0] <= '\x1f'));
}

// Range [start, end) in code points given by the optional start and end
// arguments of str methods, with slice-like clamping
std::pair<size_t, size_t> substring_range(const std::vector<Value>& args, size_t first_arg, size_t length) {
    auto arg = [&](size_t idx, int64_t default_val) -> int64_t {
        if (idx >= args.size() or std::holds_alternative<NoneType>(args[idx])) {
            return default_val;
        }
        if (not std::holds_alternative<int64_t>(args[idx]) and not std::holds_alternative<bool>(args[idx])) {
            raise(
                ExceptionKind::TYPE_ERROR,
                "slice indices must be integers or None or have an __index__ method"
            );
        }
        return to_index(args[idx]);
    };
    auto len = static_cast<int64_t>(length);
    auto clamp = [len](int64_t idx) {
        if (idx < 0) {
            idx = std::max<int64_t>(idx + len, 0);
        }
        return std::min(idx, len);
    };
    int64_t start = clamp(arg(first_arg, 0));
    int64_t end = clamp(arg(first_arg + 1, len));
    return {static_cast<size_t>(start), static_cast<size_t>(std::max(start, end))};
}

std::string ascii_lower(std::string_view str) {
    std::string res{str};
    for (auto& c : res) {
        c = to_lower(c);
    }
    return res;
}

std::string ascii_upper(std::string_view str) {
    std::string res{str};
    for (auto& c : res) {
        c = to_upper(c);
    }
    return res;
}

} // namespace

std::optional<std::string_view> find_method(const Value& val, std::string_view name) noexcept {
    if (std::holds_alternative<StrPtr>(val)) {
        return find_in(str_methods, name);
    }
    const auto* ref = std::get_if<ObjRef>(&val);
    if (not ref) {
        return std::nullopt;
    }
    switch ((*ref)->kind) {
    case ObjectKind::LIST: return find_in(list_methods, name);
    case ObjectKind::TUPLE: return find_in(tuple_methods, name);
    case ObjectKind::DICT: return find_in(dict_methods, name);
    case ObjectKind::SET: return find_in(set_methods, name);
    default: return std::nullopt;
    }
}

Value Interpreter::call_method(
    const Value& self, std::string_view name, std::vector<Value> args, KwArgs kwargs
) {
    if (const auto* s = std::get_if<StrPtr>(&self)) {
        StrPtr str = *s;
        return call_str_method(str, name, args, kwargs);
    }
    if (auto* list = as<ListObject>(self)) {
        return call_list_method(*list, name, args, kwargs);
    }
    if (auto* dict = as<DictObject>(self)) {
        return call_dict_method(*dict, self, name, args, kwargs);
    }
    if (auto* set = as<SetObject>(self)) {
        return call_set_method(*set, name, args, kwargs);
    }
    if (const auto* tuple = as<TupleObject>(self)) {
        auto qualified = concat_tostr("tuple.", name);
        check_no_kwargs(qualified, kwargs);
        if (name == "count") {
            check_args_num(qualified, args, 1, 1);
            return static_cast<int64_t>(std::count_if(
                tuple->items.begin(), tuple->items.end(), [&](const Value& item) {
                    return values_match(item, args[0]);
                }
            ));
        }
        if (name == "index") {
            check_args_num(qualified, args, 1, 3);
            auto [start, end] = substring_range(args, 1, tuple->items.size());
            for (size_t i = start; i < end; ++i) {
                if (values_match(tuple->items[i], args[0])) {
                    return static_cast<int64_t>(i);
                }
            }
            raise(ExceptionKind::VALUE_ERROR, "tuple.index(x): x not in tuple");
        }
    }
    THROW("no method ", name, " of ", type_name(self));
}

Value Interpreter::call_str_method(
    const StrPtr& self, std::string_view name, std::vector<Value>& args, KwArgs& kwargs
) {
    const std::string& text = *self;
    auto qualified = concat_tostr("str.", name);
    auto no_args = [&] {
        check_no_kwargs(qualified, kwargs);
        check_args_num(qualified, args, 0, 0);
    };
    auto str_arg = [&](size_t idx) -> const std::string& {
        return *to_str_arg(args[idx], concat_tostr(name, "() argument ", idx + 1));
    };
    auto all_chars = [&](auto&& pred) {
        no_args();
        if (text.empty()) {
            return false;
        }
        return std::all_of(text.begin(), text.end(), [&](char c) {
            return static_cast<unsigned char>(c) < 0x80 and pred(c);
        });
    };

    if (name == "upper") {
        no_args();
        return new_str(ascii_upper(text));
    }
    if (name == "lower" or name == "casefold") {
        no_args();
        return new_str(ascii_lower(text));
    }
    if (name == "swapcase") {
        no_args();
        std::string res = text;
        for (auto& c : res) {
            c = is_upper(c) ? to_lower(c) : to_upper(c);
        }
        return new_str(std::move(res));
    }
    if (name == "capitalize") {
        no_args();
        std::string res = ascii_lower(text);
        if (not res.empty()) {
            res[0] = to_upper(res[0]);
        }
        return new_str(std::move(res));
    }
    if (name == "title") {
        no_args();
        std::string res = text;
        bool prev_cased = false;
        for (auto& c : res) {
            c = prev_cased ? to_lower(c) : to_upper(c);
            prev_cased = is_alpha(c);
        }
        return new_str(std::move(res));
    }
    if (name == "isdigit" or name == "isdecimal" or name == "isnumeric") {
        return all_chars([](char c) { return is_digit(c); });
    }
    if (name == "isalpha") {
        return all_chars([](char c) { return is_alpha(c); });
    }
    if (name == "isalnum") {
        return all_chars([](char c) { return is_alnum(c); });
    }
    if (name == "isspace") {
        return all_chars([](char c) { return is_space(c) or (c >= '\x1c' and c <= '\x1f'); });
    }
    if (name == "islower" or name == "isupper") {
        no_args();
        bool want_lower = name == "islower";
        bool cased = false;
        for (char c : text) {
            if (is_lower(c) or is_upper(c)) {
                if (is_lower(c) != want_lower) {
                    return false;
                }
                cased = true;
            }
        }
        return cased;
    }
    if (name == "istitle") {
        no_args();
        bool prev_cased = false;
        bool cased = false;
        for (char c : text) {
            if (is_upper(c)) {
                if (prev_cased) {
                    return false;
                }
                prev_cased = cased = true;
            } else if (is_lower(c)) {
                if (not prev_cased) {
                    return false;
                }
                prev_cased = cased = true;
            } else {
                prev_cased = false;
            }
        }
        return cased;
    }
    if (name == "strip" or name == "lstrip" or name == "rstrip") {
        check_no_kwargs(qualified, kwargs);
        check_args_num(qualified, args, 0, 1);
        std::optional<std::vector<std::string_view>> chars;
        if (not args.empty() and not std::holds_alternative<NoneType>(args[0])) {
            const auto& chars_str = *to_str_arg(args[0], concat_tostr(name, " arg"));
            chars = code_points(chars_str);
        }
        auto strips = [&](std::string_view chr) {
            if (not chars) {
                return is_ascii_space(chr);
            }
            return std::find(chars->begin(), chars->end(), chr) != chars->end();
        };
        auto cps = code_points(text);
        size_t begin = 0;
        size_t end = cps.size();
        if (name != "rstrip") {
            while (begin < end and strips(cps[begin])) {
                ++begin;
            }
        }
        if (name != "lstrip") {
            while (end > begin and strips(cps[end - 1])) {
                --end;
            }
        }
        if (begin == end) {
            return new_str("");
        }
        auto first = static_cast<size_t>(cps[begin].data() - text.data());
        auto last = static_cast<size_t>(cps[end - 1].data() - text.data()) + cps[end - 1].size();
        return new_str(text.substr(first, last - first));
    }
    if (name == "split" or name == "rsplit") {
        auto sep_kwarg = take_kwarg(kwargs, "sep");
        auto maxsplit_kwarg = take_kwarg(kwargs, "maxsplit");
        check_kwargs_consumed(qualified, kwargs);
        check_args_num(qualified, args, 0, 2);
        if (sep_kwarg) {
            args.insert(args.begin(), std::move(*sep_kwarg));
        }
        if (maxsplit_kwarg) {
            if (args.empty()) {
                args.emplace_back(NoneType{});
            }
            args.emplace_back(std::move(*maxsplit_kwarg));
        }
        int64_t maxsplit = args.size() >= 2 ? to_index(args[1]) : -1;
        bool from_right = name == "rsplit";
        std::vector<std::string> parts;
        if (args.empty() or std::holds_alternative<NoneType>(args[0])) {
            auto cps = code_points(text);
            // Words as [begin, end) code point ranges
            std::vector<std::pair<size_t, size_t>> words;
            size_t i = 0;
            while (i < cps.size()) {
                while (i < cps.size() and is_ascii_space(cps[i])) {
                    ++i;
                }
                size_t word_start = i;
                while (i < cps.size() and not is_ascii_space(cps[i])) {
                    ++i;
                }
                if (word_start < i) {
                    words.emplace_back(word_start, i);
                }
            }
            auto byte_pos = [&](size_t cp) {
                return cp == cps.size() ? text.size() : static_cast<size_t>(cps[cp].data() - text.data());
            };
            auto piece = [&](size_t b, size_t e) {
                return text.substr(byte_pos(b), byte_pos(e) - byte_pos(b));
            };
            if (maxsplit < 0 or static_cast<size_t>(maxsplit) + 1 >= words.size()) {
                for (auto [b, e] : words) {
                    parts.emplace_back(piece(b, e));
                }
            } else if (not from_right) {
                auto count = static_cast<size_t>(maxsplit);
                for (size_t w = 0; w < count; ++w) {
                    parts.emplace_back(piece(words[w].first, words[w].second));
                }
                // The rest keeps its inner whitespace but not the trailing one
                parts.emplace_back(piece(words[count].first, words.back().second));
            } else {
                auto count = static_cast<size_t>(maxsplit);
                size_t first_kept = words.size() - count;
                parts.emplace_back(piece(words[0].first, words[first_kept - 1].second));
                for (size_t w = first_kept; w < words.size(); ++w) {
                    parts.emplace_back(piece(words[w].first, words[w].second));
                }
            }
        } else {
            const auto* sep_ptr = std::get_if<StrPtr>(&args[0]);
            if (not sep_ptr) {
                raise(ExceptionKind::TYPE_ERROR, "must be str or None, not ", type_name(args[0]));
            }
            const auto& sep = **sep_ptr;
            if (sep.empty()) {
                raise(ExceptionKind::VALUE_ERROR, "empty separator");
            }
            if (not from_right) {
                size_t pos = 0;
                for (int64_t splits = 0; maxsplit < 0 or splits < maxsplit; ++splits) {
                    size_t found = text.find(sep, pos);
                    if (found == std::string::npos) {
                        break;
                    }
                    parts.emplace_back(text.substr(pos, found - pos));
                    pos = found + sep.size();
                }
                parts.emplace_back(text.substr(pos));
            } else {
                size_t end = text.size();
                for (int64_t splits = 0; maxsplit < 0 or splits < maxsplit; ++splits) {
                    if (end < sep.size()) {
                        break;
                    }
                    size_t found = text.rfind(sep, end - sep.size());
                    if (found == std::string::npos) {
                        break;
                    }
                    parts.emplace_back(text.substr(found + sep.size(), end - found - sep.size()));
                    end = found;
                }
                parts.emplace_back(text.substr(0, end));
                std::reverse(parts.begin(), parts.end());
            }
        }
        std::vector<Value> items;
        items.reserve(parts.size());
        for (auto& part : parts) {
            tick();
            items.emplace_back(new_str(std::move(part)));
        }
        return new_list(std::move(items));
    }
    if (name == "splitlines") {
        auto keepends_kwarg = take_kwarg(kwargs, "keepends");
        check_kwargs_consumed(qualified, kwargs);
        check_args_num(qualified, args, 0, keepends_kwarg ? 0 : 1);
        bool keepends = (not args.empty() and is_truthy(args[0])) or
            (keepends_kwarg and is_truthy(*keepends_kwarg));
        std::vector<Value> items;
        size_t line_start = 0;
        for (size_t i = 0; i < text.size(); ++i) {
            char c = text[i];
            bool is_break = c == '\n' or c == '\r' or c == '\v' or c == '\f' or
                (c >= '\x1c' and c <= '\x1e');
            if (not is_break) {
                continue;
            }
            size_t break_len = c == '\r' and i + 1 < text.size() and text[i + 1] == '\n' ? 2 : 1;
            size_t line_end = keepends ? i + break_len : i;
            items.emplace_back(new_str(text.substr(line_start, line_end - line_start)));
            i += break_len - 1;
            line_start = i + 1;
        }
        if (line_start < text.size()) {
            items.emplace_back(new_str(text.substr(line_start)));
        }
        return new_list(std::move(items));
    }
    if (name == "join") {
        check_no_kwargs(qualified, kwargs);
        check_args_num(qualified, args, 1, 1);
        auto items = to_vector(args[0]);
        std::string res;
        for (size_t i = 0; i < items.size(); ++i) {
            const auto* item = std::get_if<StrPtr>(&items[i]);
            if (not item) {
                raise(
                    ExceptionKind::TYPE_ERROR,
                    "sequence item ",
                    i,
                    ": expected str instance, ",
                    type_name(items[i]),
                    " found"
                );
            }
            if (i > 0) {
                res += text;
            }
            res += **item;
            if (res.size() > limits::max_string_length) {
                raise(ExceptionKind::MEMORY_ERROR, "string is too long");
            }
        }
        return new_str(std::move(res));
    }
    if (name == "replace") {
        check_no_kwargs(qualified, kwargs);
        check_args_num(qualified, args, 2, 3);
        const auto& old = *to_str_arg(args[0], "replace() argument 1");
        const auto& replacement = *to_str_arg(args[1], "replace() argument 2");
        int64_t count = args.size() == 3 ? to_index(args[2]) : -1;
        std::string res;
        if (old.empty()) {
            auto cps = code_points(text);
            int64_t inserted = 0;
            for (auto cp : cps) {
                if (count < 0 or inserted < count) {
                    res += replacement;
                    ++inserted;
                }
                res.append(cp);
                if (res.size() > limits::max_string_length) {
                    raise(ExceptionKind::MEMORY_ERROR, "string is too long");
                }
            }
            if (count < 0 or inserted < count) {
                res += replacement;
            }
            return new_str(std::move(res));
        }
        size_t pos = 0;
        for (int64_t replaced = 0; count < 0 or replaced < count; ++replaced) {
            size_t found = text.find(old, pos);
            if (found == std::string::npos) {
                break;
            }
            res.append(text, pos, found - pos);
            res += replacement;
            pos = found + old.size();
            if (res.size() > limits::max_string_length) {
                raise(ExceptionKind::MEMORY_ERROR, "string is too long");
            }
        }
        res.append(text, pos);
        return new_str(std::move(res));
    }
    if (name == "find" or name == "rfind" or name == "index" or name == "rindex" or name == "count") {
        check_no_kwargs(qualified, kwargs);
        check_args_num(qualified, args, 1, 3);
        const auto& sub = *to_str_arg(args[0], concat_tostr(name, "() argument 1"));
        size_t length = utf8_length(text);
        auto [start, end] = substring_range(args, 1, length);
        size_t byte_start = utf8_offset(text, start);
        size_t byte_end = utf8_offset(text, end);
        std::string_view range = std::string_view{text}.substr(byte_start, byte_end - byte_start);
        if (name == "count") {
            if (sub.empty()) {
                return static_cast<int64_t>(end - start + 1);
            }
            int64_t count = 0;
            for (size_t pos = range.find(sub); pos != std::string_view::npos;
                 pos = range.find(sub, pos + sub.size()))
            {
                ++count;
            }
            return count;
        }
        bool from_right = name == "rfind" or name == "rindex";
        size_t found = from_right ? range.rfind(sub) : range.find(sub);
        if (found == std::string_view::npos) {
            if (name == "index" or name == "rindex") {
                raise(ExceptionKind::VALUE_ERROR, "substring not found");
            }
            return int64_t{-1};
        }
        return static_cast<int64_t>(start + utf8_length(range.substr(0, found)));
    }
    if (name == "startswith" or name == "endswith") {
        check_no_kwargs(qualified, kwargs);
        check_args_num(qualified, args, 1, 3);
        std::vector<Value> candidates;
        if (const auto* tuple = as<TupleObject>(args[0])) {
            candidates = tuple->items;
        } else {
            candidates.emplace_back(args[0]);
        }
        size_t length = utf8_length(text);
        auto [start, end] = substring_range(args, 1, length);
        // An explicit start past the end never matches, even an empty prefix
        if (args.size() >= 2 and not std::holds_alternative<NoneType>(args[1]) and
            to_index(args[1]) > static_cast<int64_t>(length))
        {
            return false;
        }
        size_t byte_start = utf8_offset(text, start);
        size_t byte_end = utf8_offset(text, end);
        std::string_view range = std::string_view{text}.substr(byte_start, byte_end - byte_start);
        for (const auto& candidate : candidates) {
            const auto* affix = std::get_if<StrPtr>(&candidate);
            if (not affix) {
                if (as<TupleObject>(args[0])) {
                    raise(
                        ExceptionKind::TYPE_ERROR,
                        "tuple for ",
                        name,
                        " must only contain str, not ",
                        type_name(candidate)
                    );
                }
                raise(
                    ExceptionKind::TYPE_ERROR,
                    name,
                    " first arg must be str or a tuple of str, not ",
                    type_name(candidate)
                );
            }
            if (name == "startswith" ? range.starts_with(**affix) : range.ends_with(**affix)) {
                return true;
            }
        }
        return false;
    }
    if (name == "center" or name == "ljust" or name == "rjust") {
        check_no_kwargs(qualified, kwargs);
        check_args_num(qualified, args, 1, 2);
        int64_t width = to_index(args[0]);
        std::string fill = " ";
        if (args.size() == 2) {
            const auto& fill_arg = *to_str_arg(args[1], concat_tostr(name, "() argument 2"));
            if (utf8_length(fill_arg) != 1) {
                raise(ExceptionKind::TYPE_ERROR, "The fill character must be exactly one character long");
            }
            fill = fill_arg;
        }
        auto length = static_cast<int64_t>(utf8_length(text));
        if (width <= length) {
            return self;
        }
        if (static_cast<uint64_t>(width) > limits::max_string_length) {
            raise(ExceptionKind::MEMORY_ERROR, "string is too long");
        }
        auto padding = static_cast<size_t>(width - length);
        size_t left = 0;
        if (name == "rjust") {
            left = padding;
        } else if (name == "center") {
            // The odd padding character goes left only for odd widths
            left = padding / 2 + (padding & static_cast<size_t>(width) & 1);
        }
        std::string res;
        for (size_t i = 0; i < left; ++i) {
            res += fill;
        }
        res += text;
        for (size_t i = left; i < padding; ++i) {
            res += fill;
        }
        return new_str(std::move(res));
    }
    if (name == "zfill") {
        check_no_kwargs(qualified, kwargs);
        check_args_num(qualified, args, 1, 1);
        int64_t width = to_index(args[0]);
        auto length = static_cast<int64_t>(utf8_length(text));
        if (width <= length) {
            return self;
        }
        if (static_cast<uint64_t>(width) > limits::max_string_length) {
            raise(ExceptionKind::MEMORY_ERROR, "string is too long");
        }
        std::string res = text;
        size_t sign_len = not res.empty() and (res[0] == '+' or res[0] == '-') ? 1 : 0;
        res.insert(sign_len, static_cast<size_t>(width - length), '0');
        return new_str(std::move(res));
    }
    if (name == "format") {
        return new_str(str_format(text, args, kwargs));
    }
    if (name == "partition" or name == "rpartition") {
        check_no_kwargs(qualified, kwargs);
        check_args_num(qualified, args, 1, 1);
        const auto* sep_ptr = std::get_if<StrPtr>(&args[0]);
        if (not sep_ptr) {
            raise(ExceptionKind::TYPE_ERROR, "must be str, not ", type_name(args[0]));
        }
        const auto& sep = **sep_ptr;
        if (sep.empty()) {
            raise(ExceptionKind::VALUE_ERROR, "empty separator");
        }
        size_t found = name == "partition" ? text.find(sep) : text.rfind(sep);
        if (found == std::string::npos) {
            if (name == "partition") {
                return new_tuple({self, new_str(""), new_str("")});
            }
            return new_tuple({new_str(""), new_str(""), self});
        }
        return new_tuple(
            {new_str(text.substr(0, found)), args[0], new_str(text.substr(found + sep.size()))}
        );
    }
    if (name == "removeprefix" or name == "removesuffix") {
        check_no_kwargs(qualified, kwargs);
        check_args_num(qualified, args, 1, 1);
        const auto& affix = str_arg(0);
        if (name == "removeprefix" and text.starts_with(affix)) {
            return new_str(text.substr(affix.size()));
        }
        if (name == "removesuffix" and text.ends_with(affix) and not affix.empty()) {
            return new_str(text.substr(0, text.size() - affix.size()));
        }
        return self;
    }
    THROW("no method str.", name);
}

Value Interpreter::call_list_method(
    ListObject& self, std::string_view name, std::vector<Value>& args, KwArgs& kwargs
) {
    auto qualified = concat_tostr("list.", name);
    if (name == "sort") {
        if (not args.empty()) {
            raise(ExceptionKind::TYPE_ERROR, "sort() takes no positional arguments");
        }
        auto key = take_kwarg(kwargs, "key");
        auto reverse = take_kwarg(kwargs, "reverse");
        check_kwargs_consumed("sort", kwargs);
        auto items = self.items;
        sort_values(items, key.value_or(NoneType{}), reverse and is_truthy(*reverse));
        self.items = std::move(items);
        return NoneType{};
    }
    check_no_kwargs(qualified, kwargs);
    auto& items = self.items;
    if (name == "append") {
        check_args_num(qualified, args, 1, 1);
        items.emplace_back(std::move(args[0]));
        recharge(self);
        return NoneType{};
    }
    if (name == "extend") {
        check_args_num(qualified, args, 1, 1);
        auto values = to_vector(args[0]);
        items.insert(
            items.end(), std::make_move_iterator(values.begin()), std::make_move_iterator(values.end())
        );
        recharge(self);
        return NoneType{};
    }
    if (name == "insert") {
        check_args_num(qualified, args, 2, 2);
        int64_t idx = to_index(args[0]);
        auto len = static_cast<int64_t>(items.size());
        if (idx < 0) {
            idx = std::max<int64_t>(idx + len, 0);
        }
        idx = std::min(idx, len);
        items.insert(items.begin() + idx, std::move(args[1]));
        recharge(self);
        return NoneType{};
    }
    if (name == "remove") {
        check_args_num(qualified, args, 1, 1);
        for (size_t i = 0; i < items.size(); ++i) {
            if (values_match(items[i], args[0])) {
                auto removed = std::move(items[i]);
                items.erase(items.begin() + static_cast<ptrdiff_t>(i));
                return NoneType{};
            }
        }
        raise(ExceptionKind::VALUE_ERROR, "list.remove(x): x not in list");
    }
    if (name == "pop") {
        check_args_num(qualified, args, 0, 1);
        if (items.empty()) {
            raise(ExceptionKind::INDEX_ERROR, "pop from empty list");
        }
        int64_t idx = args.empty() ? -1 : to_index(args[0]);
        auto len = static_cast<int64_t>(items.size());
        if (idx < 0) {
            idx += len;
        }
        if (idx < 0 or idx >= len) {
            raise(ExceptionKind::INDEX_ERROR, "pop index out of range");
        }
        auto res = std::move(items[static_cast<size_t>(idx)]);
        items.erase(items.begin() + idx);
        return res;
    }
    if (name == "clear") {
        check_args_num(qualified, args, 0, 0);
        auto removed = std::move(items);
        items.clear();
        recharge(self);
        return NoneType{};
    }
    if (name == "copy") {
        check_args_num(qualified, args, 0, 0);
        return new_list(items);
    }
    if (name == "reverse") {
        check_args_num(qualified, args, 0, 0);
        std::reverse(items.begin(), items.end());
        return NoneType{};
    }
    if (name == "count") {
        check_args_num(qualified, args, 1, 1);
        int64_t count = 0;
        for (size_t i = 0; i < items.size(); ++i) {
            count += values_match(items[i], args[0]) ? 1 : 0;
        }
        return count;
    }
    if (name == "index") {
        check_args_num(qualified, args, 1, 3);
        auto [start, end] = substring_range(args, 1, items.size());
        for (size_t i = start; i < end and i < items.size(); ++i) {
            if (values_match(items[i], args[0])) {
                return static_cast<int64_t>(i);
            }
        }
        raise(ExceptionKind::VALUE_ERROR, repr(args[0]), " is not in list");
    }
    THROW("no method list.", name);
}

Value Interpreter::call_dict_method(
    DictObject& self,
    const Value& self_val,
    std::string_view name,
    std::vector<Value>& args,
    KwArgs& kwargs
) {
    auto qualified = concat_tostr("dict.", name);
    auto& table = self.table;
    if (name == "update") {
        check_args_num(qualified, args, 0, 1);
        auto other = call_builtin(Builtin::DICT, "dict", std::move(args), std::move(kwargs));
        for (const auto& slot : as<DictObject>(other)->table.slots()) {
            if (slot) {
                table.insert(slot->key, slot->value);
            }
        }
        recharge(self);
        return NoneType{};
    }
    check_no_kwargs(qualified, kwargs);
    auto view = [&](DictViewObject::View kind) -> Value {
        check_args_num(qualified, args, 0, 0);
        return heap_.make<DictViewObject>(std::get<ObjRef>(self_val), kind);
    };
    if (name == "keys") {
        return view(DictViewObject::View::KEYS);
    }
    if (name == "values") {
        return view(DictViewObject::View::VALUES);
    }
    if (name == "items") {
        return view(DictViewObject::View::ITEMS);
    }
    if (name == "get") {
        check_args_num(qualified, args, 1, 2);
        if (const auto* val = table.find_value(args[0])) {
            return *val;
        }
        return args.size() == 2 ? args[1] : Value{NoneType{}};
    }
    if (name == "setdefault") {
        check_args_num(qualified, args, 1, 2);
        if (const auto* val = table.find_value(args[0])) {
            return *val;
        }
        Value default_val = args.size() == 2 ? args[1] : Value{NoneType{}};
        table.insert(args[0], default_val);
        recharge(self);
        return default_val;
    }
    if (name == "pop") {
        check_args_num(qualified, args, 1, 2);
        auto pos = table.find(args[0]);
        if (not pos) {
            if (args.size() == 2) {
                return args[1];
            }
            raise_key_error(args[0]);
        }
        auto res = table.slots()[*pos]->value;
        table.erase_at(*pos);
        return res;
    }
    if (name == "popitem") {
        check_args_num(qualified, args, 0, 0);
        const auto& slots = table.slots();
        for (size_t pos = slots.size(); pos > 0; --pos) {
            if (slots[pos - 1]) {
                auto res = new_tuple({slots[pos - 1]->key, slots[pos - 1]->value});
                table.erase_at(pos - 1);
                return res;
            }
        }
        raise(ExceptionKind::KEY_ERROR, "'popitem(): dictionary is empty'");
    }
    if (name == "clear") {
        check_args_num(qualified, args, 0, 0);
        table.clear();
        recharge(self);
        return NoneType{};
    }
    if (name == "copy") {
        check_args_num(qualified, args, 0, 0);
        auto res = new_dict();
        auto& copy = *as<DictObject>(res);
        for (const auto& slot : table.slots()) {
            if (slot) {
                copy.table.insert(slot->key, slot->value);
            }
        }
        recharge(copy);
        return res;
    }
    THROW("no method dict.", name);
}

Value Interpreter::call_set_method(
    SetObject& self, std::string_view name, std::vector<Value>& args, KwArgs& kwargs
) {
    auto qualified = concat_tostr("set.", name);
    check_no_kwargs(qualified, kwargs);
    auto& table = self.table;
    // Any iterable argument as a set
    auto to_set = [&](const Value& val) -> Value {
        if (as<SetObject>(val)) {
            return val;
        }
        auto res = new_set();
        auto& set = *as<SetObject>(res);
        for (auto& item : to_vector(val)) {
            set.table.insert(std::move(item), NoneType{});
        }
        recharge(set);
        return res;
    };
    auto copy_of_self = [&]() -> Value {
        auto res = new_set();
        auto& set = *as<SetObject>(res);
        for (const auto& slot : table.slots()) {
            if (slot) {
                set.table.insert(slot->key, NoneType{});
            }
        }
        recharge(set);
        return res;
    };
    auto replace_contents = [&](Value& with) {
        std::swap(table, as<SetObject>(with)->table);
        recharge(self);
    };

    if (name == "add") {
        check_args_num(qualified, args, 1, 1);
        table.insert(args[0], NoneType{});
        recharge(self);
        return NoneType{};
    }
    if (name == "remove" or name == "discard") {
        check_args_num(qualified, args, 1, 1);
        if (not table.erase(args[0]) and name == "remove") {
            raise_key_error(args[0]);
        }
        return NoneType{};
    }
    if (name == "pop") {
        check_args_num(qualified, args, 0, 0);
        const auto& slots = table.slots();
        for (size_t pos = 0; pos < slots.size(); ++pos) {
            if (slots[pos]) {
                auto res = slots[pos]->key;
                table.erase_at(pos);
                return res;
            }
        }
        raise(ExceptionKind::KEY_ERROR, "'pop from an empty set'");
    }
    if (name == "clear") {
        check_args_num(qualified, args, 0, 0);
        table.clear();
        recharge(self);
        return NoneType{};
    }
    if (name == "copy") {
        check_args_num(qualified, args, 0, 0);
        return copy_of_self();
    }
    if (name == "isdisjoint" or name == "issubset" or name == "issuperset") {
        check_args_num(qualified, args, 1, 1);
        auto other_val = to_set(args[0]);
        const auto& other = as<SetObject>(other_val)->table;
        auto all_in = [](const OrderedTable& from, const OrderedTable& in) {
            for (const auto& slot : from.slots()) {
                if (slot and not in.find(slot->key)) {
                    return false;
                }
            }
            return true;
        };
        if (name == "issubset") {
            return all_in(table, other);
        }
        if (name == "issuperset") {
            return all_in(other, table);
        }
        for (const auto& slot : other.slots()) {
            if (slot and table.find(slot->key)) {
                return false;
            }
        }
        return true;
    }

    std::optional<BinaryOperator> op;
    bool in_place = false;
    if (name == "union" or name == "update") {
        op = BinaryOperator::BIT_OR;
        in_place = name == "update";
    } else if (name == "intersection" or name == "intersection_update") {
        op = BinaryOperator::BIT_AND;
        in_place = name == "intersection_update";
    } else if (name == "difference" or name == "difference_update") {
        op = BinaryOperator::SUB;
        in_place = name == "difference_update";
    } else if (name == "symmetric_difference" or name == "symmetric_difference_update") {
        check_args_num(qualified, args, 1, 1);
        op = BinaryOperator::BIT_XOR;
        in_place = name == "symmetric_difference_update";
    }
    if (not op) {
        THROW("no method set.", name);
    }
    Value res = copy_of_self();
    for (const auto& arg : args) {
        res = binary_op(res, *op, to_set(arg));
    }
    if (in_place) {
        replace_contents(res);
        return NoneType{};
    }
    return res;
}

} // namespace chk::lang
