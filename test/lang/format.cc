#include "run_code.hh"

#include <chklib/lang/exceptions.hh>
#include <chklib/lang/format.hh>
#include <gtest/gtest.h>
#include <memory>
#include <string>

using namespace chk::lang;

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
TEST(format, format_value) {
    EXPECT_EQ(format_value(int64_t{42}, ""), "42");
    EXPECT_EQ(format_value(int64_t{42}, "5d"), "   42");
    EXPECT_EQ(format_value(int64_t{7}, "03"), "007");
    EXPECT_EQ(format_value(int64_t{5}, "+d"), "+5");
    EXPECT_EQ(format_value(int64_t{-5}, "<4"), "-5  ");
    EXPECT_EQ(format_value(int64_t{1234567}, ","), "1,234,567");
    EXPECT_EQ(format_value(3.14159, ".2f"), "3.14");
    EXPECT_EQ(format_value(0.25, "%"), "25.000000%");
    EXPECT_EQ(format_value(12345.678, "e"), "1.234568e+04");
    EXPECT_EQ(format_value(1.5, "g"), "1.5");
    EXPECT_EQ(format_value(2.0, ""), "2.0");
    EXPECT_EQ(format_value(std::make_shared<const std::string>("ab"), "*^6"), "**ab**");
    EXPECT_EQ(format_value(std::make_shared<const std::string>("abcdef"), ".3"), "abc");
    EXPECT_EQ(format_value(true, ""), "True");
    EXPECT_EQ(format_value(NoneType{}, ""), "None");
}

// NOLINTNEXTLINE
TEST(format, invalid_specifications) {
    auto error_of = [](const Value& val, std::string_view spec) -> std::string {
        try {
            (void)format_value(val, spec);
        } catch (const RaisedException& e) {
            return concat_tostr(exception_kind_name(e.kind()), ": ", e.message());
        }
        return "no error";
    };
    EXPECT_EQ(
        error_of(std::make_shared<const std::string>("a"), "d"),
        "ValueError: Unknown format code 'd' for object of type 'str'"
    );
    EXPECT_EQ(
        error_of(std::make_shared<const std::string>("a"), "+"),
        "ValueError: Sign not allowed in string format specifier"
    );
    EXPECT_EQ(
        error_of(int64_t{1}, ".2d"), "ValueError: Precision not allowed in integer format specifier"
    );
    EXPECT_EQ(
        error_of(NoneType{}, ">5"),
        "TypeError: unsupported format string passed to NoneType.__format__"
    );
}

// NOLINTNEXTLINE
TEST(format, f_strings) {
    EXPECT_EQ(run_code("x = 3\nprint(f'{x} + {x * 2} = {x + x * 2}')"), "3 + 6 = 9\n");
    EXPECT_EQ(printed("f'{\"ab\"!r:>6}|'"), "  'ab'|");
    EXPECT_EQ(printed("f'{3.14159:.{1 + 1}f}'"), "3.14");
    EXPECT_EQ(printed("f'{{literal}}'"), "{literal}");
    EXPECT_EQ(
        printed("f'{[1]:>5}'"),
        "TypeError: unsupported format string passed to list.__format__"
    );
}

// NOLINTNEXTLINE
TEST(format, str_format) {
    EXPECT_EQ(printed("'{} {}'.format(1, 'a')"), "1 a");
    EXPECT_EQ(printed("'{1}{0}'.format('a', 'b')"), "ba");
    EXPECT_EQ(printed("'{x}-{y:>3}'.format(x=1, y=2)"), "1-  2");
    EXPECT_EQ(printed("'{{}}'.format()"), "{}");
    EXPECT_EQ(printed("'{!r}'.format('q')"), "'q'");
    EXPECT_EQ(printed("'{'.format()"), "ValueError: Single '{' encountered in format string");
    EXPECT_EQ(printed("'}'.format()"), "ValueError: Single '}' encountered in format string");
    EXPECT_EQ(
        printed("'{} {}'.format(1)"),
        "IndexError: Replacement index 1 out of range for positional args tuple"
    );
    EXPECT_EQ(
        printed("'{0} {}'.format(1, 2)"),
        "ValueError: cannot switch from manual field specification to automatic field numbering"
    );
    EXPECT_EQ(printed("'{z}'.format(x=1)"), "KeyError: 'z'");
}

// NOLINTNEXTLINE
TEST(format, percent_format) {
    EXPECT_EQ(printed("'%d items' % 3"), "3 items");
    EXPECT_EQ(printed("'%s=%r' % ('a', 'b')"), "a='b'");
    EXPECT_EQ(printed("'%5.1f|' % 3.14159"), "  3.1|");
    EXPECT_EQ(printed("'%-4d|' % 7"), "7   |");
    EXPECT_EQ(printed("'%05d' % -42"), "-0042");
    EXPECT_EQ(printed("'%x %o' % (255, 8)"), "ff 10");
    EXPECT_EQ(printed("'%(n)s!' % {'n': 1}"), "1!");
    EXPECT_EQ(printed("'100%%' % ()"), "100%");
    EXPECT_EQ(printed("'%d %d' % (1,)"), "TypeError: not enough arguments for format string");
    EXPECT_EQ(
        printed("'%d' % (1, 2)"), "TypeError: not all arguments converted during string formatting"
    );
}
