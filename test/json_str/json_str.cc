#include <chklib/json_str/json_str.hh>
#include <gtest/gtest.h>
#include <string>
#include <vector>

// NOLINTNEXTLINE
TEST(json_str, empty_obj) {
    json_str::Object obj;
    EXPECT_EQ(std::move(obj).into_str(), "{}");
}

// NOLINTNEXTLINE
TEST(json_str, props) {
    json_str::Object obj;
    obj.prop("passed", false);
    obj.prop("ok", true);
    obj.prop("message", std::string{"done"});
    EXPECT_EQ(std::move(obj).into_str(), R"({"passed":false,"ok":true,"message":"done"})");
}

// NOLINTNEXTLINE
TEST(json_str, arrays) {
    std::vector<std::string> items = {"a", "b"};
    json_str::Object obj;
    obj.prop_arr("empty", [](auto& /*arr*/) {});
    obj.prop_arr("items", [&](auto& arr) {
        for (const auto& item : items) {
            arr.val(item);
        }
    });
    obj.prop("last", "x");
    EXPECT_EQ(std::move(obj).into_str(), R"({"empty":[],"items":["a","b"],"last":"x"})");
}

// NOLINTNEXTLINE
TEST(json_str, escaping) {
    json_str::Object obj;
    obj.prop_arr("strings", [](auto& arr) {
        arr.val("quote \" backslash \\");
        arr.val("tab\tnewline\ncr\r");
        arr.val(std::string_view{"\x01\x1f", 2});
        arr.val("zażółć");
    });
    EXPECT_EQ(
        std::move(obj).into_str(),
        R"({"strings":["quote \" backslash \\","tab\tnewline\ncr\r","\u0001\u001f","zażółć"]})"
    );
}
