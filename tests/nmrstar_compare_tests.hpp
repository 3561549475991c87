#ifndef NMRSTAR_TESTS_COMPARE__
#define NMRSTAR_TESTS_COMPARE__

#include "nmrstar_test_harness.hpp"
#include "../include/nmrstar_parser.hpp"
#include "../include/nmrstar_compare.hpp"

namespace nmrstar::tests
{

constexpr std::string_view ordered_src =
    "data_x\n"
    "save_a\n"
    "   _A.Sf_category a\n"
    "   _A.Name first\n"
    "   loop_\n"
    "      _L.ID _L.Val\n"
    "      1 x\n"
    "      2 y\n"
    "   stop_\n"
    "save_\n"
    "save_b\n"
    "   _B.Sf_category b\n"
    "save_\n";

constexpr std::string_view reordered_src =
    "data_x\n"
    "save_b\n"
    "   _B.Sf_category b\n"
    "save_\n"
    "save_a\n"
    "   _A.name first\n"
    "   _A.Sf_category a\n"
    "   loop_\n"
    "      _L.Val _L.ID\n"
    "      y 2\n"
    "      x 1\n"
    "   stop_\n"
    "save_\n";

inline bool reordered_entries_are_equivalent()
{
    auto a = parse(ordered_src);
    auto b = parse(reordered_src);
    EXPECT(!a.has_errors() && !b.has_errors(), "parse error");

    EXPECT(!(a.result == b.result), "exact comparison sees the order difference");
    EXPECT(compare(a.result, b.result).empty(), "semantic comparison ignores order");
    EXPECT(equivalent(a.result, b.result), "equivalent() agrees");
    EXPECT(compare(b.result, a.result).empty(), "and is symmetric here");

    return true;
}

inline bool value_difference_reported()
{
    auto a = parse(ordered_src);
    auto b = parse(ordered_src);
    auto * sf = b.result.get_saveframe_by_name("a");
    EXPECT(sf && sf->add_tag("Name", "second", true), "setup");

    auto diffs = compare(a.result, b.result);
    EXPECT(diffs.size() == 1, "one difference");
    EXPECT(diffs[0].find("value mismatch") != std::string::npos, "value mismatch message");
    EXPECT(diffs[0].find("_A.Name") != std::string::npos, "names the tag");

    return true;
}

inline bool loop_differences_reported()
{
    auto a = parse(ordered_src);
    auto b = parse(ordered_src);

    auto * l = b.result.get_saveframe_by_name("a")->get_loop("L");
    EXPECT(l && l->set_value(1, "Val", "z"), "setup");
    auto data = compare(a.result, b.result);
    EXPECT(data.size() == 1 && data[0].find("data mismatch") != std::string::npos, "data mismatch");

    EXPECT(l->add_row({ "3", "w" }), "setup");
    auto rows = compare(a.result, b.result);
    EXPECT(rows.size() == 1 && rows[0].find("row count") != std::string::npos, "row count mismatch");

    EXPECT(l->add_tag("Extra", true), "setup");
    auto tags = compare(a.result, b.result);
    EXPECT(tags.size() == 1 && tags[0].find("tag mismatch") != std::string::npos, "tag mismatch short-circuits");

    return true;
}

inline bool missing_and_extra_saveframes()
{
    auto a = parse(ordered_src);
    auto b = parse(ordered_src);
    EXPECT(b.result.remove_saveframe("b"), "setup");

    auto forward = compare(a.result, b.result);
    EXPECT(forward.size() == 2, "count mismatch and missing saveframe");
    EXPECT(forward[1].find("no saveframe 'b'") != std::string::npos, "missing saveframe named");

    auto backward = compare(b.result, a.result);
    EXPECT(backward.size() == 2, "count mismatch and extra saveframe");
    EXPECT(backward[1].find("extra saveframe 'b'") != std::string::npos, "extra saveframe named");

    return true;
}

inline bool saveframe_name_short_circuits()
{
    auto a = parse(ordered_src);
    auto const & sa = *a.result.get_saveframe_by_name("a");
    auto const & sb = *a.result.get_saveframe_by_name("b");

    auto diffs = compare(sa, sb);
    EXPECT(diffs.size() == 1, "only the name is reported");
    EXPECT(diffs[0].find("name mismatch") != std::string::npos, "name mismatch message");

    return true;
}

inline bool saveframe_names_ignore_case()
{
    auto a = parse("data_x\nsave_Shifts\n   _L.V 1\nsave_\n");
    auto b = parse("data_x\nsave_shifts\n   _L.V 1\nsave_\n");
    EXPECT(!a.has_errors() && !b.has_errors(), "parse error");

    EXPECT(compare(a.result.saveframes()[0], b.result.saveframes()[0]).empty(), "saveframe names match like entry lookup");
    EXPECT(equivalent(a.result, b.result), "entries equivalent");
    EXPECT(!(a.result == b.result), "exact comparison still sees the case");

    return true;
}

inline void run_compare_tests()
{
    SUBCAT("Equivalence");
    RUN_TEST(reordered_entries_are_equivalent);

    SUBCAT("Discrepancies");
    RUN_TEST(value_difference_reported);
    RUN_TEST(loop_differences_reported);
    RUN_TEST(missing_and_extra_saveframes);
    RUN_TEST(saveframe_name_short_circuits);
    RUN_TEST(saveframe_names_ignore_case);
}

}

#endif
