#include "run_code.hh"

#include <chklib/lang/capability_whitelist.hh>
#include <gtest/gtest.h>
#include <set>
#include <string>

using namespace chk::lang;

// NOLINTNEXTLINE
TEST(capability_whitelist, contents) {
    std::set<std::string_view> names;
    size_t exception_kinds = 0;
    for (const auto& entry : capability_whitelist()) {
        EXPECT_TRUE(names.emplace(entry.name).second) << entry.name;
        EXPECT_EQ(find_whitelisted(entry.name), &entry);
        if (entry.capability == Capability::EXCEPTION_KIND) {
            ++exception_kinds;
            ASSERT_TRUE(entry.exception_kind.has_value());
            EXPECT_EQ(exception_kind_name(*entry.exception_kind), entry.name);
        } else {
            EXPECT_TRUE(entry.builtin.has_value()) << entry.name;
        }
    }
    EXPECT_EQ(names.size(), 25);
    EXPECT_EQ(exception_kinds, 4);
    EXPECT_EQ(find_whitelisted("print")->capability, Capability::OUTPUT);
    EXPECT_EQ(find_whitelisted("len")->capability, Capability::PURE_FUNCTION);
    EXPECT_EQ(find_whitelisted("range")->capability, Capability::TYPE);
}

// NOLINTNEXTLINE
TEST(capability_whitelist, everything_else_is_absent) {
    for (const char* name : {"open", "eval", "exec", "compile", "__import__", "globals", "input",
                             "getattr", "type", "object", "vars", "dir", "id", "hash", "iter"})
    {
        EXPECT_EQ(find_whitelisted(name), nullptr) << name;
        EXPECT_EQ(run_code(name), concat_tostr("NameError: name '", name, "' is not defined"));
    }
}

// NOLINTNEXTLINE
TEST(capability_whitelist, every_entry_is_usable) {
    for (const auto& entry : capability_whitelist()) {
        auto code = concat_tostr("x = ", entry.name, "\nprint('ok')");
        EXPECT_EQ(run_code(code), "ok\n") << entry.name;
    }
}

// NOLINTNEXTLINE
TEST(capability_whitelist, whitelisted_names_can_be_shadowed) {
    EXPECT_EQ(run_code("len = 5\nprint(len)"), "5\n");
    EXPECT_EQ(run_code("def f():\n    print = 1\n    return print\nprint(f())"), "1\n");
}

// NOLINTNEXTLINE
TEST(capability_whitelist, capability_names) {
    EXPECT_EQ(to_str(Capability::TYPE), "type");
    EXPECT_EQ(to_str(Capability::PURE_FUNCTION), "pure function");
    EXPECT_EQ(to_str(Capability::OUTPUT), "output");
    EXPECT_EQ(to_str(Capability::EXCEPTION_KIND), "exception kind");
}
