#pragma once

#include <chklib/lang/ast.hh>
#include <string_view>

namespace chk {

/**
 * @brief Checks whether @p module contains, anywhere, a node named
 *   @p node_kind
 * @details Names are the class names of Python's ast module, including helper
 *   nodes (e.g. "arguments", "ExceptHandler") and operators (e.g. "Add",
 *   "NotIn"). A name that no node carries never matches.
 */
bool contains_node_kind(const lang::Module& module, std::string_view node_kind);

// Whether a syntax tree can contain a node named @p node_kind at all
bool is_known_node_kind(std::string_view node_kind) noexcept;

} // namespace chk
