#ifndef NMRSTAR_TESTS_INTEGRATION__
#define NMRSTAR_TESTS_INTEGRATION__

#include "nmrstar_test_harness.hpp"
#include "nmrstar_schema_tests.hpp"
#include "../include/nmrstar.hpp"

#include <filesystem>
#include <fstream>

namespace nmrstar::tests
{

inline bool load_file_reads_disk()
{
    auto path = std::filesystem::temp_directory_path() / "nmrstar_integration_load.str";
    {
        std::ofstream out(path, std::ios::binary);
        out << "data_disk\r\nsave_a\r\n   _A.B c\r\nsave_\r\n";
    }

    auto ctx = load_file(path);
    EXPECT(!ctx.has_errors(), "parse error");
    EXPECT(ctx.result.entry_id() == "disk", "entry id");
    EXPECT(ctx.result == load("data_disk\nsave_a\n   _A.B c\nsave_\n").result, "CRLF read like LF");

    std::error_code ec;
    std::filesystem::remove(path, ec);

    auto missing = load_file(path);
    EXPECT(missing.has_errors(), "missing file");
    EXPECT(missing.errors[0].kind == parse_error_kind::io_failure, "reported as io failure");
    EXPECT(missing.result.empty() && missing.result.entry_id().empty(), "no partial entry");

    return true;
}

inline bool edit_validate_write_pipeline()
{
    constexpr std::string_view src =
        "data_15000\n"
        "save_info\n"
        "   _Entry.Sf_category entry_information\n"
        "   _Entry.ID 15000\n"
        "   loop_\n"
        "      _Entry_author.Family_name\n"
        "      Smith\n"
        "      Jones\n"
        "   stop_\n"
        "save_\n";

    auto s = fixture_schema();
    auto ctx = load(src);
    EXPECT(!ctx.has_errors(), "parse error");
    auto & e = ctx.result;

    auto before = validate(e, s);
    EXPECT(before.empty(), "nothing wrong with the tags present");

    editor ed(e);
    EXPECT(ed.add_missing_tags(s), "add failed");
    EXPECT(count_kind(validate(e, s), issue_kind::null_not_allowed) == 4, "new loop columns hold '.'");

    auto * authors = e.get_saveframe_by_name("info")->get_loop("Entry_author");
    EXPECT(authors->renumber_rows("Ordinal"), "renumber failed");
    EXPECT(ed.set_entry_id("15000", &s), "set id failed");
    ed.normalize(s);

    auto issues = validate(e, s);
    EXPECT(issues.empty(), "entry valid after editing");

    auto text = format(e);
    EXPECT(!text.has_errors(), "format error");

    auto again = load(text.result);
    EXPECT(!again.has_errors(), "written text does not parse");
    EXPECT(again.result == e, "round trip exact");
    EXPECT(equivalent(again.result, e), "round trip equivalent");
    EXPECT(again.result.get_tag("_Entry_author.Ordinal") == (std::vector<std::string>{ "1", "2" }), "ordinals");

    auto json = entry_from_json(to_json(again.result));
    EXPECT(!json.has_errors() && json.result == e, "JSON agrees");

    return true;
}

inline void run_integration_tests()
{
    SUBCAT("Files");
    RUN_TEST(load_file_reads_disk);

    SUBCAT("Pipeline");
    RUN_TEST(edit_validate_write_pipeline);
}

}

#endif
