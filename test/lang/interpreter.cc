#include "run_code.hh"

#include <chklib/lang/capability_whitelist.hh>
#include <chklib/lang/interpreter.hh>
#include <chklib/lang/literal.hh>
#include <chklib/lang/operations.hh>
#include <gtest/gtest.h>

using chk::lang::Deadline;
using chk::lang::ExecutionTimeout;
using chk::lang::Interpreter;

// NOLINTNEXTLINE
TEST(interpreter, arithmetic) {
    EXPECT_EQ(run_code("print(1 + 2 * 3, 7 // 2, -7 // 2, 7 % -3, 2 ** 10)"), "7 3 -4 -2 1024\n");
    EXPECT_EQ(run_code("print(7 / 2, 6 / 3, 0.1 + 0.2)"), "3.5 2.0 0.30000000000000004\n");
    EXPECT_EQ(run_code("print(1 / 0)"), "ZeroDivisionError: division by zero");
    EXPECT_EQ(run_code("print(5 % 0)"), "ZeroDivisionError: integer modulo by zero");
    EXPECT_EQ(run_code("print(2 ** -1, -2 ** 2, (-2) ** 2)"), "0.5 -4 4\n");
    EXPECT_EQ(run_code("print(1 << 4, 255 >> 4, 6 & 3, 6 | 3, 6 ^ 3, ~5)"), "16 15 2 7 5 -6\n");
    EXPECT_EQ(run_code("print(True + True, 3 * 1.5, 10 - 0.5)"), "2 4.5 9.5\n");
}

// NOLINTNEXTLINE
TEST(interpreter, integer_overflow) {
    EXPECT_EQ(run_code("x = 9223372036854775807\nx + 1"), "OverflowError: integer overflow");
    EXPECT_EQ(run_code("print(2 ** 62)"), "4611686018427387904\n");
}

// NOLINTNEXTLINE
TEST(interpreter, strings) {
    EXPECT_EQ(run_code("s = 'abc'\nprint(s * 2, s[0], s[-1], s[1:], s[::-1], len(s))"),
              "abcabc a c bc cba 3\n");
    EXPECT_EQ(run_code("print('zażółć'[2], len('zażółć'))"), "ż 6\n");
    EXPECT_EQ(run_code("print(repr('it\\'s'), repr(\"a\\nb\"))"), "\"it's\" 'a\\nb'\n");
    EXPECT_EQ(run_code("print('b' in 'abc', 'x' not in 'abc')"), "True True\n");
    EXPECT_EQ(run_code("'abc'[3]"), "IndexError: string index out of range");
    EXPECT_EQ(
        run_code("'a' + 1"), "TypeError: can only concatenate str (not \"int\") to str"
    );
}

// NOLINTNEXTLINE
TEST(interpreter, f_strings) {
    EXPECT_EQ(
        run_code("x = 3.14159\nname = 'Ala'\nprint(f'{name!r} has {x:.2f} and {x:>8.1f}|{42:05d}')"),
        "'Ala' has 3.14 and      3.1|00042\n"
    );
    EXPECT_EQ(run_code("print(f'{{literal}} {1 + 1}')"), "{literal} 2\n");
    EXPECT_EQ(run_code("print(f'{1234567:,}')"), "1,234,567\n");
}

// NOLINTNEXTLINE
TEST(interpreter, collections) {
    EXPECT_EQ(
        run_code("l = [3, 1, 2]\nl.append(0)\nl.sort()\nprint(l, l[1:3], l[::2], len(l))"),
        "[0, 1, 2, 3] [1, 2] [0, 2] 4\n"
    );
    EXPECT_EQ(
        run_code("d = {'a': 1}\nd['b'] = 2\nprint(d, list(d.items()), d.get('c', 0))"),
        "{'a': 1, 'b': 2} [('a', 1), ('b', 2)] 0\n"
    );
    EXPECT_EQ(run_code("print((1,), (), set(), {1, 2} | {3})"), "(1,) () set() {1, 2, 3}\n");
    EXPECT_EQ(run_code("d = {}\nd['missing']"), "KeyError: 'missing'");
    EXPECT_EQ(run_code("[1, 2][5]"), "IndexError: list index out of range");
    EXPECT_EQ(run_code("{[1]: 2}"), "TypeError: unhashable type: 'list'");
    EXPECT_EQ(run_code("print([1, [2, 3]] == [1, [2, 3]], (1, 2) < (1, 3))"), "True True\n");
    EXPECT_EQ(run_code("print({1: 'a'} == {1.0: 'a'}, 1 == 1.0 == True)"), "True True\n");
}

// NOLINTNEXTLINE
TEST(interpreter, unpacking) {
    EXPECT_EQ(run_code("a, b = 1, 2\na, b = b, a\nprint(a, b)"), "2 1\n");
    EXPECT_EQ(run_code("first, *rest = [1, 2, 3]\nprint(first, rest)"), "1 [2, 3]\n");
    EXPECT_EQ(run_code("a, b = [1, 2, 3]"), "ValueError: too many values to unpack (expected 2)");
    EXPECT_EQ(run_code("a, b = 1"), "TypeError: cannot unpack non-iterable int object");
}

// NOLINTNEXTLINE
TEST(interpreter, control_flow) {
    EXPECT_EQ(
        run_code(R"(
total = 0
for i in range(10):
    if i % 2 == 0:
        continue
    if i > 7:
        break
    total += i
else:
    total = -1
print(total)
n = 0
while n < 3:
    n += 1
else:
    print('while else', n)
)"),
        "16\nwhile else 3\n"
    );
}

// NOLINTNEXTLINE
TEST(interpreter, functions) {
    EXPECT_EQ(
        run_code(R"(
def greet(name, greeting='Hello', *args, sep=', ', **kwargs):
    return greeting + sep + name + str(args) + str(kwargs)

print(greet('Ala'))
print(greet('Ola', 'Hi', 1, 2, sep=' - ', extra=True))
)"),
        "Hello, Ala(){}\nHi - Ola(1, 2){'extra': True}\n"
    );
    EXPECT_EQ(
        run_code("def f(x):\n    return x\nf()"),
        "TypeError: f() missing 1 required positional argument: 'x'"
    );
    EXPECT_EQ(
        run_code("def f(x):\n    return x\nf(1, y=2)"),
        "TypeError: f() got an unexpected keyword argument 'y'"
    );
    EXPECT_EQ(run_code("print((lambda a, b=2: a * b)(3))"), "6\n");
}

// NOLINTNEXTLINE
TEST(interpreter, closures_and_scopes) {
    EXPECT_EQ(
        run_code(R"(
def counter():
    count = 0
    def inc():
        nonlocal count
        count += 1
        return count
    return inc

c = counter()
c()
print(c(), c())

g = 1
def set_global():
    global g
    g = 5
set_global()
print(g)
)"),
        "2 3\n5\n"
    );
    EXPECT_EQ(
        run_code("x = 1\ndef f():\n    print(x)\n    x = 2\nf()"),
        "UnboundLocalError: cannot access local variable 'x' where it is not associated with a "
        "value"
    );
}

// NOLINTNEXTLINE
TEST(interpreter, comprehensions) {
    EXPECT_EQ(
        run_code(R"(
print([x * x for x in range(5) if x % 2 == 0])
print({k: v for k, v in zip('ab', [1, 2])})
print({x % 3 for x in range(10)})
print(sum(x for x in range(101)))
print([(i, j) for i in range(2) for j in range(i + 1)])
)"),
        "[0, 4, 16]\n{'a': 1, 'b': 2}\n{0, 1, 2}\n5050\n[(0, 0), (1, 0), (1, 1)]\n"
    );
    // The comprehension variable does not leak
    EXPECT_EQ(run_code("[i for i in range(3)]\nprint(i)"), "NameError: name 'i' is not defined");
}

// NOLINTNEXTLINE
TEST(interpreter, exceptions) {
    EXPECT_EQ(
        run_code(R"(
def check(age):
    if age < 0:
        raise ValueError('age cannot be negative')
    return age

try:
    check(-1)
except (TypeError, ValueError) as e:
    print('caught', e, repr(e))
finally:
    print('finally')

try:
    {}['k']
except KeyError as e:
    print('key', e)

try:
    1 / 0
except:
    print('bare except')
)"),
        "caught age cannot be negative ValueError('age cannot be negative')\nfinally\nkey 'k'\n"
        "bare except\n"
    );
    EXPECT_EQ(run_code("raise TypeError"), "TypeError: ");
    EXPECT_EQ(run_code("raise 5"), "TypeError: exceptions must derive from BaseException");
    EXPECT_EQ(
        run_code("try:\n    raise ValueError('x')\nexcept ValueError:\n    raise"),
        "ValueError: x"
    );
    EXPECT_EQ(run_code("assert 1 == 2, 'math'"), "AssertionError: math");
}

// NOLINTNEXTLINE
TEST(interpreter, whitelist_closure) {
    EXPECT_EQ(run_code("import os"), "ImportError: __import__ not found");
    EXPECT_EQ(run_code("from os import path"), "ImportError: __import__ not found");
    EXPECT_EQ(run_code("open('/etc/passwd')"), "NameError: name 'open' is not defined");
    EXPECT_EQ(run_code("eval('1')"), "NameError: name 'eval' is not defined");
    EXPECT_EQ(run_code("__import__('os')"), "NameError: name '__import__' is not defined");
    EXPECT_EQ(run_code("class A:\n    pass"), "NameError: __build_class__ not found");
    EXPECT_EQ(run_code("ZeroDivisionError"), "NameError: name 'ZeroDivisionError' is not defined");
    EXPECT_EQ(
        run_code("print.__self__"), "AttributeError: 'builtin_function_or_method' object has no "
                                    "attribute '__self__'"
    );
    EXPECT_EQ(
        run_code("().__class__"), "AttributeError: 'tuple' object has no attribute '__class__'"
    );
}

// NOLINTNEXTLINE
TEST(interpreter, recursion_limit) {
    EXPECT_EQ(
        run_code("def f(n):\n    return f(n + 1)\nf(0)"),
        "RecursionError: maximum recursion depth exceeded"
    );
    EXPECT_EQ(
        run_code("def fact(n):\n    return 1 if n <= 1 else n * fact(n - 1)\nprint(fact(20))"),
        "2432902008176640000\n"
    );
}

// NOLINTNEXTLINE
TEST(interpreter, memory_limit) {
    EXPECT_EQ(run_code("x = 'a' * (1 << 40)").substr(0, 12), "MemoryError:");
    EXPECT_EQ(
        run_code("l = []\nwhile True:\n    l.append([0] * 1000)").substr(0, 12), "MemoryError:"
    );
}

// NOLINTNEXTLINE
TEST(interpreter, print_output_is_bounded) {
    auto out = run_code("for i in range(100000):\n    print('line', i)");
    EXPECT_EQ(out.size(), chk::limits::max_print_output_in_bytes);
    EXPECT_EQ(run_code("print(1, 2, sep='-', end='!')"), "1-2!");
}

// NOLINTNEXTLINE
TEST(interpreter, deadline_stops_infinite_loop) {
    auto module = chk::lang::parse_module("while True:\n    pass\n");
    ASSERT_TRUE(module.is_ok());
    auto parsed = std::move(module).unwrap();
    auto scopes = chk::lang::analyze_scopes(*parsed);
    ASSERT_TRUE(scopes.is_ok());
    auto scope_table = std::move(scopes).unwrap();

    Deadline deadline{std::chrono::milliseconds{100}};
    Interpreter interpreter{*parsed, scope_table, deadline};
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(interpreter.run_module(), ExecutionTimeout);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{5});
}

// NOLINTNEXTLINE
TEST(interpreter, timeout_cannot_be_caught) {
    auto module = chk::lang::parse_module(
        "while True:\n    try:\n        pass\n    except:\n        pass\n"
    );
    ASSERT_TRUE(module.is_ok());
    auto parsed = std::move(module).unwrap();
    auto scopes = chk::lang::analyze_scopes(*parsed);
    ASSERT_TRUE(scopes.is_ok());
    auto scope_table = std::move(scopes).unwrap();

    Deadline deadline{std::chrono::milliseconds{50}};
    Interpreter interpreter{*parsed, scope_table, deadline};
    EXPECT_THROW(interpreter.run_module(), ExecutionTimeout);
}

// NOLINTNEXTLINE
TEST(interpreter, call_defined_function) {
    auto module = chk::lang::parse_module("def add(a, b):\n    return a + b\nvalue = 7\n");
    ASSERT_TRUE(module.is_ok());
    auto parsed = std::move(module).unwrap();
    auto scopes = chk::lang::analyze_scopes(*parsed);
    ASSERT_TRUE(scopes.is_ok());
    auto scope_table = std::move(scopes).unwrap();

    Deadline deadline;
    Interpreter interpreter{*parsed, scope_table, deadline};
    interpreter.run_module();

    auto add = interpreter.lookup_global("add");
    ASSERT_TRUE(add);
    EXPECT_TRUE(Interpreter::is_callable(*add));
    auto value = interpreter.lookup_global("value");
    ASSERT_TRUE(value);
    EXPECT_FALSE(Interpreter::is_callable(*value));
    EXPECT_FALSE(interpreter.lookup_global("missing"));
    // Builtins are not globals of the module
    EXPECT_FALSE(interpreter.lookup_global("print"));

    auto arg = chk::lang::parse_literal("[1, 2]");
    ASSERT_TRUE(arg.is_ok());
    auto list = interpreter.from_literal(std::move(arg).unwrap());
    chk::lang::KwArgs kwargs;
    kwargs.emplace_back("a", list);
    kwargs.emplace_back("b", list);
    auto res = interpreter.call(*add, {}, std::move(kwargs));
    EXPECT_EQ(chk::lang::repr(res), "[1, 2, 1, 2]");
}
