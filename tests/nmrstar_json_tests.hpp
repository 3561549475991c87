#ifndef NMRSTAR_TESTS_JSON__
#define NMRSTAR_TESTS_JSON__

#include "nmrstar_test_harness.hpp"
#include "../include/nmrstar_parser.hpp"
#include "../include/nmrstar_json.hpp"

#include <json/json.h>

namespace nmrstar::tests
{

constexpr std::string_view json_src =
    "data_4020\n"
    "save_entry_information\n"
    "   _Entry.Sf_category entry_information\n"
    "   _Entry.Title 'A title'\n"
    "   _Entry.Details\n"
    ";\n"
    "two\n"
    "lines\n"
    ";\n"
    "   loop_\n"
    "      _Entry_author.Ordinal _Entry_author.Family_name\n"
    "      1 Smith\n"
    "      2 .\n"
    "   stop_\n"
    "save_\n"
    "save_untyped\n"
    "   _Misc.Value ?\n"
    "save_\n";

inline Json::Value reparse(std::string const & text)
{
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string err;
    reader->parse(text.data(), text.data() + text.size(), &root, &err);
    return root;
}

inline bool entry_shape()
{
    auto ctx = parse(json_src);
    EXPECT(!ctx.has_errors(), "parse error");

    auto root = reparse(to_json(ctx.result));
    EXPECT(root.isObject(), "valid JSON object");
    EXPECT(root["entry_id"].asString() == "4020", "entry id");
    EXPECT(root["saveframes"].size() == 2, "saveframes");

    auto const & info = root["saveframes"][0];
    EXPECT(info["name"].asString() == "entry_information", "saveframe name");
    EXPECT(info["category"].asString() == "entry_information", "category from Sf_category");
    EXPECT(info["tag_prefix"].asString() == "_Entry", "tag prefix with underscore");
    EXPECT(info["tags"][1][0].asString() == "Title" && info["tags"][1][1].asString() == "A title", "tag pair");
    EXPECT(info["tags"][2][1].asString() == "two\nlines", "multi-line value unquoted");

    auto const & authors = info["loops"][0];
    EXPECT(authors["category"].asString() == "_Entry_author", "loop category");
    EXPECT(authors["tags"].size() == 2, "loop tags");
    EXPECT(authors["data"][1][1].asString() == ".", "null marker passes through");

    EXPECT(root["saveframes"][1]["category"].isNull(), "missing Sf_category is null");

    return true;
}

inline bool pretty_output()
{
    auto ctx = parse(json_src);
    auto compact = to_json(ctx.result);
    auto pretty = to_json(ctx.result, json_options{ true });

    EXPECT(pretty.find('\n') != std::string::npos, "pretty output is indented");
    EXPECT(pretty.size() > compact.size(), "compact output is smaller");
    EXPECT(reparse(pretty) == reparse(compact), "same content");

    return true;
}

inline bool json_round_trip()
{
    auto ctx = parse(json_src);

    auto back = entry_from_json(to_json(ctx.result));
    EXPECT(!back.has_errors(), "read error");
    EXPECT(back.result == ctx.result, "entry survives JSON");

    auto const & sf = ctx.result.saveframes()[0];
    auto sf_back = saveframe_from_json(to_json(sf));
    EXPECT(!sf_back.has_errors() && sf_back.result == sf, "saveframe survives JSON");

    auto l_back = loop_from_json(to_json(sf.loops()[0]));
    EXPECT(!l_back.has_errors() && l_back.result == sf.loops()[0], "loop survives JSON");

    return true;
}

inline bool malformed_json()
{
    auto bad = entry_from_json("{ \"entry_id\": ");
    EXPECT(bad.has_errors(), "syntax error");
    EXPECT(bad.errors[0].kind == state_error_kind::invalid_json, "reported as invalid JSON");

    auto wrong_shape = entry_from_json("[1, 2]");
    EXPECT(wrong_shape.has_errors() && wrong_shape.errors[0].kind == state_error_kind::invalid_json, "not an object");

    auto numeric = saveframe_from_json("{ \"name\": \"a\", \"tags\": [[\"_A.X\", 1]] }");
    EXPECT(numeric.has_errors() && numeric.errors[0].kind == state_error_kind::invalid_json, "values must be strings");

    return true;
}

inline bool model_rules_apply_to_json()
{
    auto ragged = loop_from_json("{ \"category\": \"_L\", \"tags\": [\"A\", \"B\"], \"data\": [[\"1\"]] }");
    EXPECT(ragged.has_errors(), "short row rejected");
    EXPECT(ragged.errors[0].kind == state_error_kind::row_length_mismatch, "model error kind kept");

    auto twice = entry_from_json(
        "{ \"entry_id\": \"1\", \"saveframes\": [ { \"name\": \"a\" }, { \"name\": \"A\" } ] }");
    EXPECT(twice.has_errors() && twice.errors[0].kind == state_error_kind::duplicate_name, "duplicate saveframe");

    auto empty_value = saveframe_from_json("{ \"name\": \"a\", \"tags\": [[\"_A.X\", \"\"]] }");
    EXPECT(empty_value.has_errors() && empty_value.errors[0].kind == state_error_kind::empty_value, "empty value");

    // "category" is informational; the tags decide
    auto informational = saveframe_from_json(
        "{ \"name\": \"a\", \"category\": \"other\", \"tags\": [[\"_A.Sf_category\", \"mine\"]] }");
    EXPECT(!informational.has_errors(), "read error");
    EXPECT(informational.result.category() == "mine", "Sf_category tag wins");

    return true;
}

inline void run_json_tests()
{
    SUBCAT("Writing");
    RUN_TEST(entry_shape);
    RUN_TEST(pretty_output);

    SUBCAT("Reading");
    RUN_TEST(json_round_trip);
    RUN_TEST(malformed_json);
    RUN_TEST(model_rules_apply_to_json);
}

}

#endif
