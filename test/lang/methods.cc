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
TEST(methods, str_case) {
    EXPECT_EQ(
        printed("'Hello'.upper(), 'Hello'.lower(), 'hello world'.title()"),
        "HELLO hello Hello World"
    );
    EXPECT_EQ(printed("'hELLO'.capitalize(), 'aB'.swapcase()"), "Hello Ab");
    EXPECT_EQ(
        printed("'abc'.isalpha(), '123'.isdigit(), 'a1'.isalnum(), ' '.isspace()"),
        "True True True True"
    );
    EXPECT_EQ(printed("'ABC'.isupper(), 'abc'.islower(), ''.isalpha()"), "True True False");
}

// NOLINTNEXTLINE
TEST(methods, str_search) {
    EXPECT_EQ(printed("'banana'.find('an'), 'banana'.rfind('an'), 'banana'.find('x')"), "1 3 -1");
    EXPECT_EQ(printed("'banana'.count('a'), 'banana'.index('n')"), "3 2");
    EXPECT_EQ(printed("'banana'.index('x')"), "ValueError: substring not found");
    EXPECT_EQ(printed("'file.py'.endswith('.py'), 'file.py'.startswith(('a', 'f'))"), "True True");
    EXPECT_EQ(printed("'a' in 'cat', 'at' not in 'cat'"), "True False");
}

// NOLINTNEXTLINE
TEST(methods, str_transform) {
    EXPECT_EQ(
        printed("repr('  x  '.strip()), repr('xxaxx'.lstrip('x')), repr('a\\n'.rstrip())"),
        "'x' 'axx' 'a'"
    );
    EXPECT_EQ(
        printed("'a,b,,c'.split(','), ' a  b '.split(), 'a b c'.split(' ', 1)"),
        "['a', 'b', '', 'c'] ['a', 'b'] ['a', 'b c']"
    );
    EXPECT_EQ(printed("'a b c'.rsplit(None, 1)"), "['a b', 'c']");
    EXPECT_EQ(printed("'x'.split('')"), "ValueError: empty separator");
    EXPECT_EQ(printed("'-'.join(['a', 'b', 'c'])"), "a-b-c");
    EXPECT_EQ(
        printed("''.join([1])"),
        "TypeError: sequence item 0: expected str instance, int found"
    );
    EXPECT_EQ(printed("'aaa'.replace('a', 'b', 2)"), "bba");
    EXPECT_EQ(printed("'l1\\nl2\\r\\nl3'.splitlines()"), "['l1', 'l2', 'l3']");
    EXPECT_EQ(
        printed("'ab'.center(6, '*'), 'ab'.ljust(4) + '|', 'ab'.rjust(4), '42'.zfill(5)"),
        "**ab** ab   |   ab 00042"
    );
    EXPECT_EQ(
        printed("'a=b=c'.partition('='), 'a=b=c'.rpartition('=')"),
        "('a', '=', 'b=c') ('a=b', '=', 'c')"
    );
    EXPECT_EQ(
        printed("'test.py'.removesuffix('.py'), 'test.py'.removeprefix('x')"),
        "test test.py"
    );
    EXPECT_EQ(printed("'{}!'.format('hi')"), "hi!");
}

// NOLINTNEXTLINE
TEST(methods, list_methods) {
    EXPECT_EQ(
        run_code(
            "xs = [3, 1]\n"
            "xs.append(2)\n"
            "xs.extend((5, 4))\n"
            "xs.insert(0, 9)\n"
            "print(xs)\n"
            "xs.remove(9)\n"
            "print(xs.pop(), xs.pop(0), xs)\n"
            "xs.sort()\n"
            "print(xs, xs.index(2), xs.count(2))\n"
            "xs.reverse()\n"
            "ys = xs.copy()\n"
            "xs.clear()\n"
            "print(xs, ys)\n"
        ),
        "[9, 3, 1, 2, 5, 4]\n4 3 [1, 2, 5]\n[1, 2, 5] 1 1\n[] [5, 2, 1]\n"
    );
    EXPECT_EQ(printed("[].pop()"), "IndexError: pop from empty list");
    EXPECT_EQ(printed("[1].pop(5)"), "IndexError: pop index out of range");
    EXPECT_EQ(printed("[1].remove(2)"), "ValueError: list.remove(x): x not in list");
    EXPECT_EQ(printed("[1].index(2)"), "ValueError: 2 is not in list");
    EXPECT_EQ(printed("[1].sort(1)"), "TypeError: sort() takes no positional arguments");
    EXPECT_EQ(
        run_code("xs = ['bb', 'a']\nxs.sort(key=len, reverse=True)\nprint(xs)"),
        "['bb', 'a']\n"
    );
}

// NOLINTNEXTLINE
TEST(methods, tuple_methods) {
    EXPECT_EQ(printed("(1, 2, 1).count(1), (1, 2).index(2)"), "2 1");
    EXPECT_EQ(printed("(1,).index(3)"), "ValueError: tuple.index(x): x not in tuple");
}

// NOLINTNEXTLINE
TEST(methods, dict_methods) {
    EXPECT_EQ(
        run_code(
            "d = {'a': 1}\n"
            "d.update({'b': 2}, c=3)\n"
            "print(list(d.keys()), list(d.values()), list(d.items()))\n"
            "print(d.get('x'), d.get('x', 0), d.setdefault('e', 5), d['e'])\n"
            "print(d.pop('a'), d.pop('a', None), d.popitem())\n"
            "c = d.copy()\n"
            "d.clear()\n"
            "print(d, c)\n"
        ),
        "['a', 'b', 'c'] [1, 2, 3] [('a', 1), ('b', 2), ('c', 3)]\n"
        "None 0 5 5\n"
        "1 None ('e', 5)\n"
        "{} {'b': 2, 'c': 3}\n"
    );
    EXPECT_EQ(printed("{}.pop('k')"), "KeyError: 'k'");
    EXPECT_EQ(printed("{}.popitem()"), "KeyError: 'popitem(): dictionary is empty'");
}

// NOLINTNEXTLINE
TEST(methods, set_methods) {
    EXPECT_EQ(
        run_code(
            "s = {1, 2}\n"
            "s.add(3)\n"
            "s.discard(7)\n"
            "s.remove(1)\n"
            "print(s, s.union({4}), s.intersection([2, 9]), s.difference({2}))\n"
            "print({1, 2}.issubset({1, 2, 3}), {1}.issuperset([1]), {1}.isdisjoint({2}))\n"
        ),
        "{2, 3} {2, 3, 4} {2} {3}\nTrue True True\n"
    );
    EXPECT_EQ(printed("set().remove(1)"), "KeyError: 1");
    EXPECT_EQ(printed("set().pop()"), "KeyError: 'pop from an empty set'");
}

// NOLINTNEXTLINE
TEST(methods, unknown_methods) {
    EXPECT_EQ(printed("'x'.encode()"), "AttributeError: 'str' object has no attribute 'encode'");
    EXPECT_EQ(printed("[].push(1)"), "AttributeError: 'list' object has no attribute 'push'");
    EXPECT_EQ(printed("(5).real"), "AttributeError: 'int' object has no attribute 'real'");
}
