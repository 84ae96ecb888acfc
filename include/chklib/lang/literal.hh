#pragma once

#include <chklib/lang/ast.hh>
#include <chklib/lang/token.hh>
#include <chklib/result.hh>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace chk::lang {

// Value of a literal expression, independent of any heap
struct LiteralValue {
    struct List {
        std::vector<LiteralValue> items;
    };

    struct Tuple {
        std::vector<LiteralValue> items;
    };

    struct Set {
        std::vector<LiteralValue> items;
    };

    struct Dict {
        std::vector<LiteralValue> keys;
        std::vector<LiteralValue> values; // parallel to keys
    };

    std::variant<NoneType, bool, int64_t, double, std::string, List, Tuple, Set, Dict> value;
};

/**
 * @brief Evaluates an expression consisting only of literals, like Python's
 *   ast.literal_eval()
 * @details Accepted: numbers (with unary `+` and `-`), strings, None, True,
 *   False, lists, tuples, dicts, sets and `set()`.
 *
 * @errors Returns a message describing the syntax error or the first
 *   non-literal part of the expression
 */
Result<LiteralValue, std::string> parse_literal(std::string_view text);

// Same as above, @p tokens have to end with END_MARKER
Result<LiteralValue, std::string> parse_literal(std::vector<Token> tokens);

// Python's repr() of the value that @p val describes
std::string repr(const LiteralValue& val);

} // namespace chk::lang
