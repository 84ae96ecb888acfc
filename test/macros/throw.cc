#include <chklib/concat_tostr.hh>
#include <chklib/macros/throw.hh>
#include <gtest/gtest.h>

// NOLINTNEXTLINE
TEST(THROW, message_names_origin) {
    try {
        THROW("value: ", 42, ' ', std::string_view{"abc"});
        ADD_FAILURE();
    } catch (const std::runtime_error& e) {
        constexpr auto line = __LINE__;
        EXPECT_EQ(
            e.what(), concat_tostr("value: 42 abc (thrown at ", __FILE__, ':', line - 3, ')')
        );
    }
}
