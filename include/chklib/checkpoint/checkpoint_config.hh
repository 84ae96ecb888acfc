#pragma once

#include <chklib/lang/literal.hh>
#include <chklib/limits.hh>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chk {

struct CheckRule {
    enum class Kind : uint8_t {
        PATTERN, // regular expression searched for in the source text
        STRUCTURE, // node kind searched for in the syntax tree
    };

    Kind kind = Kind::PATTERN;
    std::string pattern; // the regex or the node kind name, depending on kind
    std::string message = "Check failed";
    bool required = true; // an unmet optional rule only produces a hint
};

std::string_view to_str(CheckRule::Kind kind) noexcept;

struct TestCase {
    // Keyword arguments of the entry point call, in call order
    std::vector<std::pair<std::string, lang::LiteralValue>> input;
    lang::LiteralValue expected;
    std::optional<std::string> description; // "Test <i>" if absent
};

// Describes how a single checkpoint validates a submission
struct CheckpointConfig {
    std::string validator_kind = "static"; // "static" or "execution"

    // static
    std::vector<CheckRule> rules;

    // execution
    std::vector<TestCase> tests;
    std::string entry_point;
    std::chrono::nanoseconds timeout = limits::default_execution_timeout;
};

} // namespace chk
