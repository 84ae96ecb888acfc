#include <chklib/lang/parser.hh>
#include <chklib/lang/scope_analysis.hh>
#include <gtest/gtest.h>
#include <memory>
#include <string>

using namespace chk::lang;

namespace {

std::unique_ptr<Module> parse(std::string_view code) {
    auto res = parse_module(code);
    if (res.is_err()) {
        ADD_FAILURE() << std::move(res).unwrap_err().message;
        return std::make_unique<Module>();
    }
    return std::move(res).unwrap();
}

// Returns "OK" or "line <n>: <message>"
std::string analyze(std::string_view code) {
    auto module = parse(code);
    auto res = analyze_scopes(*module);
    if (res.is_ok()) {
        return "OK";
    }
    auto err = std::move(res).unwrap_err();
    return "line " + std::to_string(err.line) + ": " + err.message;
}

} // namespace

// NOLINTNEXTLINE
TEST(scope_analysis, function_locals) {
    auto module = parse(
        "g = 1\n"
        "def f(a, *args, k=2, **kw):\n"
        "    global g\n"
        "    b = a\n"
        "    for i in args:\n"
        "        pass\n"
        "    g = b\n"
        "    return [x for x in kw]\n"
    );
    auto res = analyze_scopes(*module);
    ASSERT_TRUE(res.is_ok());
    auto table = std::move(res).unwrap();

    const auto& func = *module->body[1];
    const auto& scope = table.scope_of(func);
    EXPECT_EQ(scope.kind, ScopeInfo::Kind::FUNCTION);
    EXPECT_EQ(scope.parent, &table.module_scope());
    for (const char* name : {"a", "args", "k", "kw", "b", "i"}) {
        EXPECT_TRUE(scope.is_local(name)) << name;
    }
    EXPECT_FALSE(scope.is_local("g"));
    EXPECT_TRUE(scope.globals.contains("g"));
    EXPECT_FALSE(scope.is_local("x"));

    // Module level names are never local
    EXPECT_FALSE(table.module_scope().is_local("g"));
    EXPECT_THROW((void)table.scope_of(*module->body[0]), std::runtime_error);
}

// NOLINTNEXTLINE
TEST(scope_analysis, comprehension_has_own_scope) {
    auto module = parse("ys = [x * 2 for x in range(3)]\n");
    auto res = analyze_scopes(*module);
    ASSERT_TRUE(res.is_ok());
    auto table = std::move(res).unwrap();

    const auto& assign = static_cast<const AssignStmt&>(*module->body[0]);
    const auto& scope = table.scope_of(*assign.value);
    EXPECT_EQ(scope.kind, ScopeInfo::Kind::COMPREHENSION);
    EXPECT_TRUE(scope.is_local("x"));
}

// NOLINTNEXTLINE
TEST(scope_analysis, nonlocal_resolution) {
    EXPECT_EQ(
        analyze(
            "def outer():\n"
            "    n = 0\n"
            "    def inner():\n"
            "        nonlocal n\n"
            "        n += 1\n"
            "    return inner\n"
        ),
        "OK"
    );
    EXPECT_EQ(
        analyze(
            "def outer():\n"
            "    def inner():\n"
            "        nonlocal n\n"
            "    return inner\n"
        ),
        "line 3: no binding for nonlocal 'n' found"
    );
    EXPECT_EQ(analyze("nonlocal x\n"), "line 1: nonlocal declaration not allowed at module level");
}

// NOLINTNEXTLINE
TEST(scope_analysis, compile_time_errors) {
    EXPECT_EQ(analyze("return 1\n"), "line 1: 'return' outside function");
    EXPECT_EQ(analyze("x = 1\nbreak\n"), "line 2: 'break' outside loop");
    EXPECT_EQ(analyze("def f():\n    continue\n"), "line 2: 'continue' not properly in loop");
    EXPECT_EQ(
        analyze("def f(a, a):\n    pass\n"), "line 1: duplicate argument 'a' in function definition"
    );
    EXPECT_EQ(
        analyze("def f():\n    x = 1\n    global x\n"),
        "line 3: name 'x' is assigned to before global declaration"
    );
    EXPECT_EQ(
        analyze("def f():\n    global x\n    nonlocal x\n"), "line 3: name 'x' is nonlocal and global"
    );
    EXPECT_EQ(analyze("while True:\n    break\nfor i in []:\n    continue\n"), "OK");
}
