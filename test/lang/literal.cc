#include <chklib/lang/literal.hh>
#include <gtest/gtest.h>
#include <string>

using chk::lang::LiteralValue;
using chk::lang::parse_literal;

namespace {

// repr() of the parsed literal or "error: <message>"
std::string eval(std::string_view text) {
    auto res = parse_literal(text);
    if (res.is_err()) {
        return "error: " + std::move(res).unwrap_err();
    }
    return repr(std::move(res).unwrap());
}

} // namespace

// NOLINTNEXTLINE
TEST(literal, scalars) {
    EXPECT_EQ(eval("42"), "42");
    EXPECT_EQ(eval("-7"), "-7");
    EXPECT_EQ(eval("+3"), "3");
    EXPECT_EQ(eval("2.5"), "2.5");
    EXPECT_EQ(eval("-0.5"), "-0.5");
    EXPECT_EQ(eval("1.0"), "1.0");
    EXPECT_EQ(eval("None"), "None");
    EXPECT_EQ(eval("True"), "True");
    EXPECT_EQ(eval("'hello'"), "'hello'");
    EXPECT_EQ(eval("\"it's\""), "\"it's\"");
    EXPECT_EQ(eval("  0x10"), "16");
}

// NOLINTNEXTLINE
TEST(literal, containers) {
    EXPECT_EQ(eval("[1, 'a', [2.5]]"), "[1, 'a', [2.5]]");
    EXPECT_EQ(eval("(1,)"), "(1,)");
    EXPECT_EQ(eval("()"), "()");
    EXPECT_EQ(eval("1, 2"), "(1, 2)");
    EXPECT_EQ(eval("{'a': 1, 'b': [None]}"), "{'a': 1, 'b': [None]}");
    EXPECT_EQ(eval("{1, 2}"), "{1, 2}");
    EXPECT_EQ(eval("set()"), "set()");
    EXPECT_EQ(eval("{}"), "{}");
}

// NOLINTNEXTLINE
TEST(literal, parsed_structure) {
    auto res = parse_literal("{'x': [1, 2]}");
    ASSERT_TRUE(res.is_ok());
    auto val = std::move(res).unwrap();
    const auto* dict = std::get_if<LiteralValue::Dict>(&val.value);
    ASSERT_NE(dict, nullptr);
    ASSERT_EQ(dict->keys.size(), 1);
    EXPECT_EQ(std::get<std::string>(dict->keys[0].value), "x");
    const auto* list = std::get_if<LiteralValue::List>(&dict->values[0].value);
    ASSERT_NE(list, nullptr);
    ASSERT_EQ(list->items.size(), 2);
    EXPECT_EQ(std::get<int64_t>(list->items[1].value), 2);
}

// NOLINTNEXTLINE
TEST(literal, non_literals_are_rejected) {
    EXPECT_EQ(eval("x"), "error: malformed node or string on line 1: Name");
    EXPECT_EQ(eval("1 + 2"), "error: malformed node or string on line 1: BinOp");
    EXPECT_EQ(eval("[f(1)]"), "error: malformed node or string on line 1: Call");
    EXPECT_EQ(eval("-'a'"), "error: malformed node or string on line 1: Constant");
    EXPECT_EQ(eval("not True"), "error: malformed node or string on line 1: UnaryOp");
    EXPECT_EQ(eval("{**d}"), "error: malformed node or string on line 1: Name");
    EXPECT_EQ(eval("..."), "error: malformed node or string on line 1: Constant");
    EXPECT_EQ(eval("[1,"), "error: line 1: '[' was never closed");
}
