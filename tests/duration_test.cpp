#include <chrono>

#include "loadopts/duration.hpp"
#include "loadopts/errors.hpp"
#include "test_helpers.hpp"

using namespace loadopts;
using namespace std::chrono_literals;

static void test_format()
{
    TEST_START("format_duration");

    TEST_ASSERT_STR_EQ(format_duration(2min), "2m0s", "two minutes");
    TEST_ASSERT_STR_EQ(format_duration(10s), "10s", "ten seconds");
    TEST_ASSERT_STR_EQ(format_duration(1h), "1h0m0s", "one hour");
    TEST_ASSERT_STR_EQ(format_duration(1500ms), "1.5s", "fractional seconds");
    TEST_ASSERT_STR_EQ(format_duration(250ms), "250ms", "milliseconds");
    TEST_ASSERT_STR_EQ(format_duration(1us), "1\xC2\xB5s", "microseconds");
    TEST_ASSERT_STR_EQ(format_duration(42ns), "42ns", "nanoseconds");
    TEST_ASSERT_STR_EQ(format_duration(Duration::zero()), "0s", "zero");
    TEST_ASSERT_STR_EQ(format_duration(-90s), "-1m30s", "negative");
}

static void test_parse()
{
    TEST_START("parse_duration");

    TEST_ASSERT(parse_duration("10s") == 10s, "seconds");
    TEST_ASSERT(parse_duration("2m0s") == 2min, "compound");
    TEST_ASSERT(parse_duration("1h30m") == 90min, "hours and minutes");
    TEST_ASSERT(parse_duration("1.5h") == 90min, "fractional hours");
    TEST_ASSERT(parse_duration("300ms") == 300ms, "milliseconds");
    TEST_ASSERT(parse_duration("5us") == 5us, "us spelling");
    TEST_ASSERT(parse_duration("5\xCE\xBCs") == 5us, "greek mu spelling");
    TEST_ASSERT(parse_duration("0") == Duration::zero(), "bare zero");
    TEST_ASSERT(parse_duration("-1m30s") == -90s, "negative");
    TEST_ASSERT(parse_duration("+3s") == 3s, "explicit plus");
    TEST_ASSERT(parse_duration(".5s") == 500ms, "leading dot");
}

static void test_parse_errors()
{
    TEST_START("parse_duration rejects malformed text");

    TEST_ASSERT_THROWS(parse_duration(""), ParseError, "empty text");
    TEST_ASSERT_THROWS(parse_duration("10"), ParseError, "missing unit");
    TEST_ASSERT_THROWS(parse_duration("10x"), ParseError, "unknown unit");
    TEST_ASSERT_THROWS(parse_duration("s"), ParseError, "unit without number");
    TEST_ASSERT_THROWS(parse_duration("-"), ParseError, "sign only");
    TEST_ASSERT_THROWS(parse_duration("."), ParseError, "dot only");
    TEST_ASSERT_THROWS(parse_duration("9999999999h"), ParseError, "overflow");
}

static void test_format_parses_back()
{
    TEST_START("formatted text parses to the same span");

    const Duration spans[] = {1s, 2min, 1h + 1ms, 1500us, 7ns, -3s};
    for (const auto span : spans)
        TEST_ASSERT(parse_duration(format_duration(span)) == span, format_duration(span).c_str());
}

int main()
{
    TEST_SUITE_START("Duration");

    test_format();
    test_parse();
    test_parse_errors();
    test_format_parses_back();

    TEST_SUITE_END();
    return TEST_RESULT();
}
