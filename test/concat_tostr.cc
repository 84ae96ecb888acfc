#include <chklib/concat_tostr.hh>
#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <string_view>

// NOLINTNEXTLINE
TEST(concat_tostr, mixed_arguments) {
    EXPECT_EQ(concat_tostr(), "");
    EXPECT_EQ(concat_tostr("abc", 'd', std::string{"ef"}, std::string_view{"gh"}), "abcdefgh");
    EXPECT_EQ(
        concat_tostr(0, ' ', -17, ' ', uint64_t{18446744073709551615U}),
        "0 -17 18446744073709551615"
    );
    EXPECT_EQ(concat_tostr(true, ' ', false), "true false");
}

// NOLINTNEXTLINE
TEST(back_insert, appends) {
    std::string str = "line ";
    back_insert(str, 12, ':', 3, ": ", "message");
    EXPECT_EQ(str, "line 12:3: message");
}
