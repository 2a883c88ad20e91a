#include <chrono>

#include "loadopts/errors.hpp"
#include "loadopts/stage.hpp"
#include "test_helpers.hpp"

using namespace loadopts;
using namespace std::chrono_literals;

static void test_single_duration()
{
    TEST_START("\"1s\" is one stage without target");

    const auto stages = parse_stages("1s");
    TEST_ASSERT_INT_EQ(stages.size(), 1, "one stage");
    TEST_ASSERT(stages[0].duration == null_duration(1s), "duration is 1s");
    TEST_ASSERT(!stages[0].target.valid, "target unset");
}

static void test_duration_and_target()
{
    TEST_START("\"1s:100\" carries a target");

    const auto stages = parse_stages("1s:100");
    TEST_ASSERT_INT_EQ(stages.size(), 1, "one stage");
    TEST_ASSERT(stages[0].duration == null_duration(1s), "duration is 1s");
    TEST_ASSERT(stages[0].target == null_int(100), "target is 100");
}

static void test_list_keeps_order()
{
    TEST_START("\"1s,2s:100\" keeps order");

    const auto stages = parse_stages("1s,2s:100");
    TEST_ASSERT_INT_EQ(stages.size(), 2, "two stages");
    TEST_ASSERT(stages[0] == (Stage{null_duration(1s), NullInt{}}), "first stage");
    TEST_ASSERT(stages[1] == (Stage{null_duration(2s), null_int(100)}), "second stage");
}

static void test_empty_input()
{
    TEST_START("empty input yields no stages");

    TEST_ASSERT(parse_stages("").empty(), "empty string");
    TEST_ASSERT(parse_stages("   ").empty(), "blank string");
}

static void test_whitespace_and_zero_target()
{
    TEST_START("segments are trimmed and zero targets kept");

    const auto stages = parse_stages(" 30s:0 , 1m:-5 ");
    TEST_ASSERT_INT_EQ(stages.size(), 2, "two stages");
    TEST_ASSERT(stages[0].target == null_int(0), "explicit zero target");
    TEST_ASSERT(stages[1].duration == null_duration(1min), "minute duration");
    TEST_ASSERT(stages[1].target == null_int(-5), "negative target parses");
}

static void test_malformed()
{
    TEST_START("malformed segments are rejected");

    TEST_ASSERT_THROWS(parse_stages("1x"), ParseError, "bad duration");
    TEST_ASSERT_THROWS(parse_stages("1s:abc"), ParseError, "non-integer target");
    TEST_ASSERT_THROWS(parse_stages("1s:"), ParseError, "empty target");
    TEST_ASSERT_THROWS(parse_stages("1s,,2s"), ParseError, "empty segment");
    TEST_ASSERT_THROWS(parse_stages(":100"), ParseError, "missing duration");

    bool names_segment = false;
    try
    {
        parse_stages("1s,2q:5");
    }
    catch (const ParseError& ex)
    {
        names_segment = std::string(ex.what()).find("2q:5") != std::string::npos;
    }
    TEST_ASSERT(names_segment, "error names the offending segment");
}

static void test_format()
{
    TEST_START("format_stages");

    TEST_ASSERT_STR_EQ(format_stages(parse_stages("1s,2m0s:100")), "1s,2m0s:100", "text survives");
    TEST_ASSERT_STR_EQ(format_stages({}), "", "no stages");
}

int main()
{
    TEST_SUITE_START("Stages");

    test_single_duration();
    test_duration_and_target();
    test_list_keeps_order();
    test_empty_input();
    test_whitespace_and_zero_target();
    test_malformed();
    test_format();

    TEST_SUITE_END();
    return TEST_RESULT();
}
