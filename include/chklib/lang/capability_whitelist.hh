#pragma once

#include <chklib/lang/exceptions.hh>
#include <chklib/lang/value.hh>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace chk::lang {

enum class Capability : uint8_t {
    TYPE, // a built-in type, callable as a conversion
    PURE_FUNCTION,
    OUTPUT, // print, writes only to the capture buffer of the execution
    EXCEPTION_KIND,
};

struct WhitelistEntry {
    std::string_view name;
    Capability capability;
    std::optional<Builtin> builtin; // for TYPE, PURE_FUNCTION and OUTPUT
    std::optional<ExceptionKind> exception_kind; // for EXCEPTION_KIND
};

// The only names learner code can see besides its own
std::span<const WhitelistEntry> capability_whitelist() noexcept;

const WhitelistEntry* find_whitelisted(std::string_view name) noexcept;

std::string_view to_str(Capability capability) noexcept;

} // namespace chk::lang
