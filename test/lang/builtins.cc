#include "run_code.hh"

#include <gtest/gtest.h>
#include <string>

namespace {

// Output of printing @p expr, without the trailing newline
std::string printed(std::string_view expr) {
    auto out = run_code(concat_tostr("print(", expr, ")"));
    if (not out.empty() and out.back() == '\n') {
        out.pop_back();
    }
    return out;
}

} // namespace

// NOLINTNEXTLINE
TEST(builtins, conversions) {
    EXPECT_EQ(printed("str(1.0), str(None), str([1, 'a'])"), "1.0 None [1, 'a']");
    EXPECT_EQ(
        printed("int('  42 '), int(-3.9), int(True), int('0x1f', 16), int('101', 2)"),
        "42 -3 1 31 5"
    );
    EXPECT_EQ(printed("int('z')"), "ValueError: invalid literal for int() with base 10: 'z'");
    EXPECT_EQ(printed("int('1', 1)"), "ValueError: int() base must be >= 2 and <= 36, or 0");
    EXPECT_EQ(
        printed("int([])"),
        "TypeError: int() argument must be a string, a bytes-like object or a real number, not 'list'"
    );
    EXPECT_EQ(printed("float('1e3'), float(2), float(' -inf ')"), "1000.0 2.0 -inf");
    EXPECT_EQ(printed("float('abc')"), "ValueError: could not convert string to float: 'abc'");
    EXPECT_EQ(printed("bool([]), bool('x'), bool(0.0)"), "False True False");
}

// NOLINTNEXTLINE
TEST(builtins, containers) {
    EXPECT_EQ(
        printed("list('ab'), tuple(range(3)), set([1, 1, 2])"),
        "['a', 'b'] (0, 1, 2) {1, 2}"
    );
    EXPECT_EQ(printed("dict([('a', 1)]), dict(b=2), dict()"), "{'a': 1} {'b': 2} {}");
    EXPECT_EQ(printed("len('zażółć'), len([1, 2]), len({}), len(range(0, 10, 3))"), "6 2 0 4");
    EXPECT_EQ(printed("len(5)"), "TypeError: object of type 'int' has no len()");
    EXPECT_EQ(printed("len('a', 'b')"), "TypeError: len() takes exactly one argument (2 given)");
    EXPECT_EQ(printed("len(x=1)"), "TypeError: len() takes no keyword arguments");
}

// NOLINTNEXTLINE
TEST(builtins, ranges) {
    EXPECT_EQ(
        printed("list(range(4)), list(range(1, 10, 3)), list(range(5, 0, -2))"),
        "[0, 1, 2, 3] [1, 4, 7] [5, 3, 1]"
    );
    EXPECT_EQ(printed("list(range(3, 3))"), "[]");
    EXPECT_EQ(printed("range()"), "TypeError: range expected at least 1 argument, got 0");
    EXPECT_EQ(printed("range(1, 2, 0)"), "ValueError: range() arg 3 must not be zero");
}

// NOLINTNEXTLINE
TEST(builtins, iterators) {
    EXPECT_EQ(printed("list(enumerate(['a', 'b'], 1))"), "[(1, 'a'), (2, 'b')]");
    EXPECT_EQ(printed("list(enumerate('x', start=5))"), "[(5, 'x')]");
    EXPECT_EQ(printed("list(zip([1, 2, 3], 'ab'))"), "[(1, 'a'), (2, 'b')]");
    EXPECT_EQ(printed("list(map(lambda x: x * 2, [1, 2]))"), "[2, 4]");
    EXPECT_EQ(printed("list(map(lambda a, b: a + b, [1, 2], [10, 20]))"), "[11, 22]");
    EXPECT_EQ(printed("list(filter(lambda x: x % 2, range(6)))"), "[1, 3, 5]");
    EXPECT_EQ(printed("map(len)"), "TypeError: map() must have at least two arguments.");
    EXPECT_EQ(run_code("it = zip('ab', 'cd')\nfor a, b in it:\n    print(a + b)"), "ac\nbd\n");
}

// NOLINTNEXTLINE
TEST(builtins, sorting) {
    EXPECT_EQ(printed("sorted([3, 1, 2])"), "[1, 2, 3]");
    EXPECT_EQ(printed("sorted([3, 1, 2], reverse=True)"), "[3, 2, 1]");
    EXPECT_EQ(printed("sorted(['bb', 'a', 'ccc'], key=len)"), "['a', 'bb', 'ccc']");
    // Stable for equal keys
    EXPECT_EQ(
        printed("sorted([(1, 'b'), (0, 'x'), (1, 'a')], key=lambda p: p[0])"),
        "[(0, 'x'), (1, 'b'), (1, 'a')]"
    );
    EXPECT_EQ(
        printed("sorted([1, 'a'])"),
        "TypeError: '<' not supported between instances of 'str' and 'int'"
    );
}

// NOLINTNEXTLINE
TEST(builtins, aggregates) {
    EXPECT_EQ(printed("sum([1, 2, 3]), sum([1, 2], 10), sum([0.5, 0.25])"), "6 13 0.75");
    EXPECT_EQ(
        printed("sum(['a'], '')"),
        "TypeError: sum() can't sum strings [use ''.join(seq) instead]"
    );
    EXPECT_EQ(printed("min([3, 1, 2]), max('abc'), max(1, 5, 2), min([], default=0)"), "1 c 5 0");
    EXPECT_EQ(printed("max(['aa', 'b'], key=len)"), "aa");
    EXPECT_EQ(printed("min([])"), "ValueError: min() iterable argument is empty");
    EXPECT_EQ(printed("max()"), "TypeError: max expected at least 1 argument, got 0");
}

// NOLINTNEXTLINE
TEST(builtins, numbers) {
    EXPECT_EQ(printed("abs(-3), abs(-2.5), abs(True)"), "3 2.5 1");
    EXPECT_EQ(printed("abs('a')"), "TypeError: bad operand type for abs(): 'str'");
    EXPECT_EQ(printed("round(2.5), round(3.5), round(-0.5)"), "2 4 0");
    EXPECT_EQ(printed("round(3.14159, 2), round(1234, -2), round(7, 1)"), "3.14 1200 7");
    EXPECT_EQ(printed("round('a')"), "TypeError: type str doesn't define __round__ method");
}

// NOLINTNEXTLINE
TEST(builtins, print) {
    EXPECT_EQ(run_code("print()"), "\n");
    EXPECT_EQ(run_code("print('a', 1, None, sep=', ')"), "a, 1, None\n");
    EXPECT_EQ(run_code("print('x', end='')\nprint('y')"), "xy\n");
    EXPECT_EQ(run_code("print('x', sep=1)"), "TypeError: sep must be None or a string, not int");
    EXPECT_EQ(
        run_code("print('x', file=None)"),
        "TypeError: 'file' is an invalid keyword argument for print()"
    );
}
