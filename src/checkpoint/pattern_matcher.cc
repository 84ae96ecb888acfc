#include <chklib/checkpoint/pattern_matcher.hh>
#include <chklib/concat_tostr.hh>

namespace chk {

Result<PatternMatcher, std::string> PatternMatcher::compile(const std::string& pattern) {
    try {
        return Ok{PatternMatcher{
            std::regex{pattern, std::regex::ECMAScript | std::regex::multiline}
        }};
    } catch (const std::regex_error& e) {
        return Err{concat_tostr("invalid regular expression `", pattern, "`: ", e.what())};
    }
}

bool PatternMatcher::search(std::string_view text) const {
    return std::regex_search(text.begin(), text.end(), regex_);
}

} // namespace chk
