#include <chklib/lang/capability_whitelist.hh>
#include <iterator>

namespace chk::lang {
namespace {

constexpr WhitelistEntry type(std::string_view name, Builtin builtin) noexcept {
    return {.name = name, .capability = Capability::TYPE, .builtin = builtin, .exception_kind = {}};
}

constexpr WhitelistEntry function(std::string_view name, Builtin builtin) noexcept {
    return {
        .name = name,
        .capability = Capability::PURE_FUNCTION,
        .builtin = builtin,
        .exception_kind = {},
    };
}

constexpr WhitelistEntry exception(std::string_view name, ExceptionKind kind) noexcept {
    return {
        .name = name,
        .capability = Capability::EXCEPTION_KIND,
        .builtin = {},
        .exception_kind = kind,
    };
}

constexpr WhitelistEntry whitelist[] = {
    type("str", Builtin::STR),
    type("int", Builtin::INT),
    type("float", Builtin::FLOAT),
    type("bool", Builtin::BOOL),
    type("list", Builtin::LIST),
    type("dict", Builtin::DICT),
    type("tuple", Builtin::TUPLE),
    type("set", Builtin::SET),
    function("len", Builtin::LEN),
    type("range", Builtin::RANGE),
    type("enumerate", Builtin::ENUMERATE),
    type("zip", Builtin::ZIP),
    type("map", Builtin::MAP),
    type("filter", Builtin::FILTER),
    function("sorted", Builtin::SORTED),
    function("sum", Builtin::SUM),
    function("min", Builtin::MIN),
    function("max", Builtin::MAX),
    function("abs", Builtin::ABS),
    function("round", Builtin::ROUND),
    {.name = "print", .capability = Capability::OUTPUT, .builtin = Builtin::PRINT, .exception_kind = {}},
    exception("ValueError", ExceptionKind::VALUE_ERROR),
    exception("TypeError", ExceptionKind::TYPE_ERROR),
    exception("KeyError", ExceptionKind::KEY_ERROR),
    exception("IndexError", ExceptionKind::INDEX_ERROR),
};

constexpr size_t builtins_num = static_cast<size_t>(Builtin::PRINT) + 1;

// Every builtin the runtime implements is reachable through exactly one
// entry, and every entry is backed by something the runtime implements
constexpr bool is_closed() noexcept {
    size_t uses[builtins_num] = {};
    for (const auto& entry : whitelist) {
        if (entry.capability == Capability::EXCEPTION_KIND) {
            if (entry.builtin or not entry.exception_kind) {
                return false;
            }
            continue;
        }
        if (not entry.builtin or entry.exception_kind) {
            return false;
        }
        auto idx = static_cast<size_t>(*entry.builtin);
        if (idx >= builtins_num) {
            return false;
        }
        ++uses[idx];
    }
    for (auto use : uses) {
        if (use != 1) {
            return false;
        }
    }
    return true;
}

constexpr bool has_unique_names() noexcept {
    for (size_t i = 0; i < std::size(whitelist); ++i) {
        for (size_t j = i + 1; j < std::size(whitelist); ++j) {
            if (whitelist[i].name == whitelist[j].name) {
                return false;
            }
        }
    }
    return true;
}

static_assert(is_closed());
static_assert(has_unique_names());
static_assert(std::size(whitelist) == 25);

} // namespace

std::span<const WhitelistEntry> capability_whitelist() noexcept { return whitelist; }

const WhitelistEntry* find_whitelisted(std::string_view name) noexcept {
    for (const auto& entry : whitelist) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

std::string_view to_str(Capability capability) noexcept {
    switch (capability) {
    case Capability::TYPE: return "type";
    case Capability::PURE_FUNCTION: return "pure function";
    case Capability::OUTPUT: return "output";
    case Capability::EXCEPTION_KIND: return "exception kind";
    }
    return "unknown";
}

} // namespace chk::lang
