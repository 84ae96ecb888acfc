#pragma once

#include <chklib/result.hh>
#include <regex>
#include <string>
#include <string_view>
#include <utility>

namespace chk {

// Searches the raw source text for a regular expression
class PatternMatcher {
    std::regex regex_;

    explicit PatternMatcher(std::regex regex) noexcept : regex_{std::move(regex)} {}

public:
    /**
     * @brief Compiles @p pattern as an ECMAScript regular expression in
     *   multiline mode (`^` and `$` match at line boundaries)
     *
     * @errors Returns a description of the error if @p pattern is invalid
     */
    static Result<PatternMatcher, std::string> compile(const std::string& pattern);

    /**
     * @brief Checks whether the pattern matches anywhere in @p text
     *
     * @errors Throws std::regex_error if matching exceeds the regex engine's
     *   complexity or stack limits
     */
    [[nodiscard]] bool search(std::string_view text) const;
};

} // namespace chk
