#include <chklib/config_file.hh>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using std::string;
using std::vector;

// NOLINTNEXTLINE
TEST(ConfigFile, strings) {
    ConfigFile cf;
    cf.add_vars("a", "b", "c", "d", "e", "missing");
    cf.load_config_from_string(R"===(# comment
a: bare value with spaces   # trailing comment
b = 'It''s quoted'
c: "tab\tquote\" \x41"
d:
e: [ignored because of redefinition]
e: last
unknown: ignored
)===");

    EXPECT_EQ(cf["a"].as_string(), "bare value with spaces");
    EXPECT_EQ(cf["a"].line(), 2);
    EXPECT_EQ(cf["b"].as_string(), "It's quoted");
    EXPECT_EQ(cf["c"].as_string(), "tab\tquote\" A");
    EXPECT_TRUE(cf["d"].is_set());
    EXPECT_EQ(cf["d"].as_string(), "");
    EXPECT_FALSE(cf["e"].is_array());
    EXPECT_EQ(cf["e"].as_string(), "last");
    EXPECT_EQ(cf["e"].line(), 7);
    EXPECT_FALSE(cf["missing"].is_set());
    EXPECT_FALSE(cf["unknown"].is_set());
    EXPECT_EQ(cf.get_vars().count("unknown"), 0);
}

// NOLINTNEXTLINE
TEST(ConfigFile, arrays) {
    ConfigFile cf;
    cf.add_vars("inline", "multiline", "empty");
    cf.load_config_from_string(R"===(inline = [an, inline, array]
multiline: [
    # comments and empty lines are ignored

    '1, with comma',
    2
    "3" # newline is a delimiter too
    ,,4
]
empty: []
)===");

    ASSERT_TRUE(cf["inline"].is_array());
    EXPECT_EQ(cf["inline"].as_array(), (vector<string>{"an", "inline", "array"}));
    EXPECT_EQ(cf["inline"].array_lines(), (vector<size_t>{1, 1, 1}));

    ASSERT_TRUE(cf["multiline"].is_array());
    EXPECT_EQ(cf["multiline"].line(), 2);
    EXPECT_EQ(cf["multiline"].as_array(), (vector<string>{"1, with comma", "2", "3", "4"}));
    EXPECT_EQ(cf["multiline"].array_lines(), (vector<size_t>{5, 6, 7, 8}));

    EXPECT_TRUE(cf["empty"].is_array());
    EXPECT_TRUE(cf["empty"].as_array().empty());
}

// NOLINTNEXTLINE
TEST(ConfigFile, load_all) {
    ConfigFile cf;
    cf.load_config_from_string("x: 1\ny: [2]\n", true);
    EXPECT_EQ(cf["x"].as_string(), "1");
    EXPECT_EQ(cf["y"].as_array(), vector<string>{"2"});
}

// NOLINTNEXTLINE
TEST(ConfigFile, parse_errors) {
    auto error_of = [](string config) -> string {
        ConfigFile cf;
        try {
            cf.load_config_from_string(std::move(config), true);
        } catch (const ConfigFile::ParseError& e) {
            return e.what();
        }
        return "no error";
    };

    EXPECT_EQ(error_of("a: 'abc\n"), "line 1:8: Missing terminating ' character");
    EXPECT_EQ(error_of("a: 1\nb: \"abc\n"), "line 2:8: Missing terminating \" character");
    EXPECT_EQ(error_of("a: \"\\q\"\n"), "line 1:6: Unknown escape sequence: `\\q`");
    EXPECT_EQ(error_of("a: 1\n: b\n"), "line 2:1: Invalid or missing variable's name");
    EXPECT_EQ(error_of("a\n"), "line 1:2: Incomplete directive: `a`");
    EXPECT_EQ(error_of("a - b\n"), "line 1:3: Invalid assignment operator: `-`");
    EXPECT_EQ(
        error_of("a: [1, 2\n"), "line 2:1: Missing terminating ] character at the end of an array"
    );
    EXPECT_EQ(error_of("a: 'x' y\n"), "line 1:8: Unknown sequence after the value: `y`");
}

// NOLINTNEXTLINE
TEST(ConfigFile, parse_error_diagnostics) {
    ConfigFile cf;
    try {
        cf.load_config_from_string("a: 1\nb: 'x' y\n");
        ADD_FAILURE();
    } catch (const ConfigFile::ParseError& e) {
        EXPECT_EQ(e.diagnostics(), "b: 'x' y\n       ^");
    }
}
