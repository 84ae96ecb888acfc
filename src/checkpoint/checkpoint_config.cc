#include <chklib/checkpoint/checkpoint_config.hh>

namespace chk {

std::string_view to_str(CheckRule::Kind kind) noexcept {
    switch (kind) {
    case CheckRule::Kind::PATTERN: return "pattern";
    case CheckRule::Kind::STRUCTURE: return "structure";
    }
    return "unknown";
}

} // namespace chk
