#pragma once

#include <chklib/lang/ast.hh>
#include <chklib/lang/syntax_error.hh>
#include <chklib/result.hh>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace chk::lang {

// Names bound by a module, a function, a lambda or a comprehension
struct ScopeInfo {
    enum class Kind : uint8_t {
        MODULE,
        FUNCTION,
        COMPREHENSION,
    };

    Kind kind;
    const ScopeInfo* parent; // nullptr for the module
    std::unordered_set<std::string> locals; // assigned to and not declared global or nonlocal
    std::unordered_set<std::string> globals;
    std::unordered_set<std::string> nonlocals;

    [[nodiscard]] bool is_local(const std::string& name) const {
        return kind != Kind::MODULE and locals.contains(name);
    }
};

class ScopeTable {
    std::unordered_map<const Node*, std::unique_ptr<ScopeInfo>> scopes_;
    const ScopeInfo* module_scope_ = nullptr;

    friend class ScopeAnalyzer;

public:
    [[nodiscard]] const ScopeInfo& module_scope() const noexcept { return *module_scope_; }

    /**
     * @brief Returns the scope created by @p node
     *
     * @param node FunctionDef, Lambda, ListComp, SetComp, DictComp or GeneratorExp
     *
     * @errors Throws std::runtime_error if @p node was not analyzed
     */
    [[nodiscard]] const ScopeInfo& scope_of(const Node& node) const;
};

/**
 * @brief Resolves the scopes of @p module and performs the checks Python does
 *   when compiling: `return` outside function, `break` and `continue` outside
 *   loop, conflicting global and nonlocal declarations, duplicate parameters
 *
 * @errors Returns the first error found
 */
Result<ScopeTable, SyntaxError> analyze_scopes(const Module& module);

} // namespace chk::lang
