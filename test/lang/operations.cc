#include <chklib/lang/exceptions.hh>
#include <chklib/lang/heap.hh>
#include <chklib/lang/operations.hh>
#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <memory>
#include <string>

using namespace chk::lang;

namespace {

Value str_value(std::string s) { return std::make_shared<const std::string>(std::move(s)); }

std::string type_error_of(const Value& a, CompareOperator op, const Value& b) {
    try {
        (void)compare_order(a, op, b);
    } catch (const RaisedException& e) {
        EXPECT_EQ(e.kind(), ExceptionKind::TYPE_ERROR);
        return e.message();
    }
    return "no error";
}

} // namespace

// NOLINTNEXTLINE
TEST(operations, type_names) {
    EXPECT_EQ(type_name(NoneType{}), "NoneType");
    EXPECT_EQ(type_name(true), "bool");
    EXPECT_EQ(type_name(int64_t{1}), "int");
    EXPECT_EQ(type_name(1.5), "float");
    EXPECT_EQ(type_name(str_value("x")), "str");

    Heap heap{1 << 20};
    Value list = heap.make<ListObject>();
    EXPECT_EQ(type_name(list), "list");
}

// NOLINTNEXTLINE
TEST(operations, truthiness) {
    EXPECT_FALSE(is_truthy(NoneType{}));
    EXPECT_FALSE(is_truthy(int64_t{0}));
    EXPECT_TRUE(is_truthy(int64_t{-3}));
    EXPECT_FALSE(is_truthy(0.0));
    EXPECT_FALSE(is_truthy(str_value("")));
    EXPECT_TRUE(is_truthy(str_value("0")));

    Heap heap{1 << 20};
    ObjRef list = heap.make<ListObject>();
    EXPECT_FALSE(is_truthy(Value{list}));
    static_cast<ListObject&>(*list).items.emplace_back(NoneType{});
    EXPECT_TRUE(is_truthy(Value{list}));
}

// NOLINTNEXTLINE
TEST(operations, equality_across_numeric_types) {
    EXPECT_TRUE(values_equal(int64_t{1}, 1.0));
    EXPECT_TRUE(values_equal(true, int64_t{1}));
    EXPECT_FALSE(values_equal(int64_t{1}, str_value("1")));
    EXPECT_TRUE(values_equal(str_value("ab"), str_value("ab")));
    EXPECT_FALSE(values_equal(NoneType{}, int64_t{0}));
    double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(values_equal(nan, nan));

    Heap heap{1 << 20};
    ObjRef a = heap.make<ListObject>();
    ObjRef b = heap.make<ListObject>();
    static_cast<ListObject&>(*a).items = {int64_t{1}, str_value("x")};
    static_cast<ListObject&>(*b).items = {1.0, str_value("x")};
    EXPECT_TRUE(values_equal(Value{a}, Value{b}));
    static_cast<ListObject&>(*b).items.emplace_back(NoneType{});
    EXPECT_FALSE(values_equal(Value{a}, Value{b}));
}

// NOLINTNEXTLINE
TEST(operations, ordering) {
    EXPECT_TRUE(compare_order(int64_t{1}, CompareOperator::LT, 1.5));
    EXPECT_TRUE(compare_order(str_value("abc"), CompareOperator::LT, str_value("abd")));
    EXPECT_TRUE(compare_order(str_value("b"), CompareOperator::GT_E, str_value("ab")));

    Heap heap{1 << 20};
    ObjRef a = heap.make<TupleObject>();
    ObjRef b = heap.make<TupleObject>();
    static_cast<TupleObject&>(*a).items = {int64_t{1}, int64_t{2}};
    static_cast<TupleObject&>(*b).items = {int64_t{1}, int64_t{2}, int64_t{0}};
    EXPECT_TRUE(compare_order(Value{a}, CompareOperator::LT, Value{b}));

    EXPECT_EQ(
        type_error_of(int64_t{1}, CompareOperator::LT, str_value("a")),
        "'<' not supported between instances of 'int' and 'str'"
    );
    EXPECT_EQ(
        type_error_of(NoneType{}, CompareOperator::GT_E, NoneType{}),
        "'>=' not supported between instances of 'NoneType' and 'NoneType'"
    );
}

// NOLINTNEXTLINE
TEST(operations, hashing) {
    EXPECT_EQ(hash_value(int64_t{3}), hash_value(3.0));
    EXPECT_EQ(hash_value(true), hash_value(int64_t{1}));
    EXPECT_EQ(hash_value(str_value("abc")), hash_value(str_value("abc")));

    Heap heap{1 << 20};
    Value list = heap.make<ListObject>();
    try {
        (void)hash_value(list);
        FAIL() << "expected TypeError";
    } catch (const RaisedException& e) {
        EXPECT_EQ(e.kind(), ExceptionKind::TYPE_ERROR);
        EXPECT_EQ(e.message(), "unhashable type: 'list'");
    }
}

// NOLINTNEXTLINE
TEST(operations, float_repr) {
    EXPECT_EQ(float_repr(0.1), "0.1");
    EXPECT_EQ(float_repr(2.0), "2.0");
    EXPECT_EQ(float_repr(-1.5), "-1.5");
    EXPECT_EQ(float_repr(123456.789), "123456.789");
    EXPECT_EQ(float_repr(0.1 + 0.2), "0.30000000000000004");
    EXPECT_EQ(float_repr(1e16), "1e+16");
    EXPECT_EQ(float_repr(1.5e-7), "1.5e-07");
    EXPECT_EQ(float_repr(0.0001), "0.0001");
    EXPECT_EQ(float_repr(-0.0), "-0.0");
    EXPECT_EQ(float_repr(std::numeric_limits<double>::infinity()), "inf");
    EXPECT_EQ(float_repr(std::nan("")), "nan");
}

// NOLINTNEXTLINE
TEST(operations, repr_and_str) {
    EXPECT_EQ(repr(str_value("it's")), "\"it's\"");
    EXPECT_EQ(repr(str_value("a\nb")), "'a\\nb'");
    EXPECT_EQ(str(str_value("a\nb")), "a\nb");
    EXPECT_EQ(repr(NoneType{}), "None");
    EXPECT_EQ(str(false), "False");
    EXPECT_EQ(repr(2.5), "2.5");

    Heap heap{1 << 20};
    ObjRef tuple = heap.make<TupleObject>();
    static_cast<TupleObject&>(*tuple).items = {str_value("x")};
    EXPECT_EQ(repr(Value{tuple}), "('x',)");
    EXPECT_EQ(str(Value{tuple}), "('x',)");
}

// NOLINTNEXTLINE
TEST(operations, exception_messages) {
    EXPECT_EQ(exception_message(ExceptionKind::VALUE_ERROR, {}), "");
    EXPECT_EQ(exception_message(ExceptionKind::VALUE_ERROR, {str_value("bad")}), "bad");
    EXPECT_EQ(exception_message(ExceptionKind::KEY_ERROR, {str_value("k")}), "'k'");
    EXPECT_EQ(
        exception_message(ExceptionKind::VALUE_ERROR, {str_value("a"), int64_t{1}}), "('a', 1)"
    );
}

// NOLINTNEXTLINE
TEST(operations, utf8_helpers) {
    std::string s = "a\xc5\x82\xe2\x82\xac!"; // a, l with stroke, euro sign, !
    EXPECT_EQ(utf8_length(s), 4);
    EXPECT_EQ(utf8_offset(s, 2), 3);
    EXPECT_EQ(utf8_offset(s, 4), s.size());
    EXPECT_EQ(utf8_char_length(s, 3), 3);

    std::string out;
    append_utf8(out, 0x20ac);
    EXPECT_EQ(out, "\xe2\x82\xac");
}
