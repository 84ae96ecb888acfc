#include "common.hh"

#include <chklib/checkpoint/pattern_matcher.hh>
#include <chklib/checkpoint/static_validator.hh>
#include <chklib/checkpoint/tree_inspector.hh>
#include <chklib/lang/parser.hh>
#include <optional>
#include <regex>

using std::string_view;
using std::vector;

namespace chk {

namespace {

bool rule_satisfied(
    const CheckRule& rule,
    string_view code,
    const lang::Module& module,
    const std::optional<PatternMatcher>& matcher,
    ValidationLogger* logger
) {
    switch (rule.kind) {
    case CheckRule::Kind::PATTERN: return matcher->search(code);
    case CheckRule::Kind::STRUCTURE:
        if (logger and not is_known_node_kind(rule.pattern)) {
            logger->warning(concat_tostr(
                "no syntax tree node is named `", rule.pattern, "`, the rule is never satisfied"
            ));
        }
        return contains_node_kind(module, rule.pattern);
    }
    return false;
}

} // namespace

ValidationResult
validate_static(string_view code, const vector<CheckRule>& rules, ValidationLogger* logger) {
    if (auto res = detail::check_submission_size(code)) {
        return *std::move(res);
    }

    auto parsed = lang::parse_module(code);
    if (parsed.is_err()) {
        return detail::syntax_error_result(std::move(parsed).unwrap_err());
    }
    auto module = std::move(parsed).unwrap();

    vector<std::optional<PatternMatcher>> matchers;
    matchers.reserve(rules.size());
    for (const auto& rule : rules) {
        if (rule.kind != CheckRule::Kind::PATTERN) {
            matchers.emplace_back(std::nullopt);
            continue;
        }
        auto matcher = PatternMatcher::compile(rule.pattern);
        if (matcher.is_err()) {
            return detail::configuration_error_result(std::move(matcher).unwrap_err());
        }
        matchers.emplace_back(std::move(matcher).unwrap());
    }

    ValidationResult res;
    for (size_t i = 0; i < rules.size(); ++i) {
        const auto& rule = rules[i];
        bool satisfied = false;
        try {
            satisfied = rule_satisfied(rule, code, *module, matchers[i], logger);
        } catch (const std::regex_error& e) {
            return detail::configuration_error_result(concat_tostr(
                "regular expression `", rule.pattern, "` cannot be matched: ", e.what()
            ));
        }
        if (logger) {
            logger->rule(rule, satisfied);
        }
        if (not satisfied) {
            (rule.required ? res.errors : res.hints).emplace_back(rule.message);
        }
    }

    res.passed = res.errors.empty();
    res.message = res.passed ? "All checks passed!" : "Some checks failed";
    return res;
}

} // namespace chk
