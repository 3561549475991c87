#ifndef NMRSTAR_TESTS_SCHEMA__
#define NMRSTAR_TESTS_SCHEMA__

#include "nmrstar_test_harness.hpp"
#include "../include/nmrstar_parser.hpp"
#include "../include/nmrstar_schema.hpp"
#include "../include/nmrstar_validate.hpp"

namespace nmrstar::tests
{

constexpr std::string_view schema_fixture =
    "Dictionary sequence,SFCategory,ADIT category view name,Tag,Data Type,Nullable,BMRB data type,Loopflag,Default value,entryIdFlg\n"
    "Some description row,,,,,,,,,\n"
    "TBL_BEGIN,,,3.2.1.0,,,,,,\n"
    "10,entry_information,,_Entry.Sf_category,VARCHAR(127),NOT NULL,line,N,,N\n"
    "20,entry_information,,_Entry.Sf_framecode,VARCHAR(127),NOT NULL,framecode,N,,N\n"
    "30,entry_information,,_Entry.ID,CHAR(12),NOT NULL,code,N,,Y\n"
    "40,entry_information,,_Entry.Title,TEXT,,text,N,,N\n"
    "50,entry_information,,_Entry.Submission_date,DATETIME year to day,,yyyy-mm-dd,N,,N\n"
    "60,entry_information,,_Entry.Version_type,VARCHAR(31),NOT NULL,line,N,original,N\n"
    "100,entry_information,,_Entry_author.Ordinal,INTEGER,NOT NULL,int,Y,,N\n"
    "110,entry_information,,_Entry_author.Family_name,VARCHAR(127),NOT NULL,line,Y,,N\n"
    "120,entry_information,,_Entry_author.Entry_ID,CHAR(12),NOT NULL,code,Y,,Y\n"
    "200,entity,,_Entity.Sf_category,VARCHAR(127),NOT NULL,line,N,,N\n"
    "210,entity,,_Entity.Sf_framecode,VARCHAR(127),NOT NULL,framecode,N,,N\n"
    "220,entity,,_Entity.ID,INTEGER,NOT NULL,int,N,,N\n"
    "230,entity,,_Entity.Entry_ID,CHAR(12),NOT NULL,code,N,,Y\n"
    "240,entity,,_Entity.Formula_weight,FLOAT,,float,N,,N\n"
    "250,entity,,_Entity.Details,TEXT,,text,N,,N\n"
    "TBL_END,,,,,,,,,\n"
    "999,entity,,_After.End,TEXT,,text,N,,N\n";

constexpr std::string_view data_types_fixture =
    "int,-?[0-9]+\n"
    "float,\"[-+]?[0-9]*\\.?[0-9]+([eE][-+]?[0-9]+)?\"\n"
    "code,[A-Za-z0-9]+\n"
    "framecode,[^\\s]+\n"
    "broken,([\n";

inline dictionary_schema fixture_schema()
{
    auto ctx = load_schema_csv(schema_fixture, data_types_fixture);
    return ctx.result;
}

inline size_t count_kind(std::vector<validation_issue> const & issues, issue_kind kind)
{
    return static_cast<size_t>(std::count_if(issues.begin(), issues.end(),
        [kind](validation_issue const & i) { return i.kind == kind; }));
}

//---------------------------------------------------------------------------
// Loading
//---------------------------------------------------------------------------

inline bool load_fixture()
{
    auto ctx = load_schema_csv(schema_fixture, data_types_fixture);
    EXPECT(!ctx.has_errors(), "load error");
    EXPECT(ctx.warnings.size() == 1, "the broken regex gives one warning");

    auto const & s = ctx.result;
    EXPECT(s.version() == "3.2.1.0", "version from TBL_BEGIN");
    EXPECT(s.size() == 15, "rows between TBL_BEGIN and TBL_END");
    EXPECT(!s.lookup("_After.End"), "rows after TBL_END ignored");

    auto def = s.lookup("_entry.id");
    EXPECT(def, "lookup is case-insensitive");
    EXPECT(def->tag == "_Entry.ID", "canonical capitalisation kept");
    EXPECT(def->max_length == 12u, "CHAR length");
    EXPECT(!def->nullable, "NOT NULL");
    EXPECT(def->entry_id_flag, "entry id flag");
    EXPECT(def->pattern == "[A-Za-z0-9]+", "pattern from the data types table");

    auto version = s.lookup("_Entry.Version_type");
    EXPECT(version && version->default_value == "original", "default value");

    auto date_def = s.lookup("_Entry.Submission_date");
    EXPECT(date_def && date_def->type == value_type::date, "date type");
    EXPECT(!date_def->pattern.empty(), "date pattern derived from the SQL type");

    auto text = s.lookup("_Entry.Title");
    EXPECT(text && text->pattern.empty() && !text->regex, "text has no pattern");

    return true;
}

inline bool schema_ordering()
{
    auto s = fixture_schema();

    EXPECT((s.category_order() == std::vector<std::string>{ "Entry", "Entry_author", "Entity" }), "category order");
    EXPECT(s.tags_in_category("_Entry_author").size() == 3, "tags of one category");
    EXPECT(s.tag_order("_Entry.ID") < s.tag_order("_Entry.Title"), "dictionary sequence");
    EXPECT(s.tag_order("_Nope.Nope") == npos(), "unknown tags sort last");

    dictionary_schema odd;
    auto add = [&odd](std::string tag, double order)
    {
        tag_definition def;
        def.tag = std::move(tag);
        def.data_type = "TEXT";
        def.sort_order = order;
        return bool(odd.add_tag(def));
    };
    EXPECT(add("_A.Nan", std::nan("")), "add nan");
    EXPECT(add("_A.Negative", -5.0), "add negative");
    EXPECT(add("_A.Huge", 1e30), "add huge");
    EXPECT(add("_A.Inf", HUGE_VAL), "add inf");
    EXPECT(add("_A.Fine", 7.5), "add fine");
    EXPECT(odd.tag_order("_A.Nan") == npos(), "nan sorts last");
    EXPECT(odd.tag_order("_A.Negative") == npos(), "negative sorts last");
    EXPECT(odd.tag_order("_A.Huge") == npos(), "out of range sorts last");
    EXPECT(odd.tag_order("_A.Inf") == npos(), "infinity sorts last");
    EXPECT(odd.tag_order("_A.Fine") == 7u, "fraction truncated");

    return true;
}

inline bool load_failures()
{
    auto no_begin = load_schema_csv("Tag,Nullable,Data Type\nx,y,z\n");
    EXPECT(no_begin.has_errors(), "missing TBL_BEGIN");

    auto no_columns = load_schema_csv("Foo,Bar\nTBL_BEGIN\n");
    EXPECT(no_columns.has_errors() && no_columns.errors[0].kind == state_error_kind::not_found, "missing columns");

    auto bad_csv = load_schema_csv("Tag,\"unterminated\n");
    EXPECT(bad_csv.has_errors(), "unterminated CSV quote");

    auto bad_type = load_schema_csv("Tag,Nullable,Data Type\nTBL_BEGIN\n_A.B,,BLOB\nTBL_END\n");
    EXPECT(!bad_type.has_errors() && bad_type.warnings.size() == 1, "unknown SQL type is a warning");
    EXPECT(bad_type.result.size() == 0, "and the tag is skipped");

    auto missing = load_schema_file("/nonexistent/xlschem_ann.csv");
    EXPECT(missing.has_errors() && missing.errors[0].kind == state_error_kind::io_failure, "missing file");

    dictionary_schema s;
    tag_definition def;
    def.tag = "_A.B";
    def.data_type = "INTEGER";
    EXPECT(s.add_tag(def), "first add");
    EXPECT(!s.add_tag(def), "duplicate rejected");

    return true;
}

inline bool typed_conversion()
{
    auto s = fixture_schema();

    auto id = s.lookup("_Entity.ID");
    auto v = convert_value(*id, "42");
    EXPECT(v && std::get<int64_t>(*v) == 42, "integer conversion");
    EXPECT(!convert_value(*id, "4.2"), "not an integer");

    auto null_v = convert_value(*id, "?");
    EXPECT(null_v && std::holds_alternative<std::monostate>(*null_v), "null becomes monostate");

    auto weight = convert_value(*s.lookup("_Entity.Formula_weight"), "8565.2");
    EXPECT(weight && std::get<double>(*weight) > 8565.0, "float conversion");

    auto d = convert_value(*s.lookup("_Entry.Submission_date"), "2019-06-01");
    EXPECT(d && std::get<date>(*d) == (date{ 2019, 6, 1 }), "date conversion");
    EXPECT(!parse_date("2019-13-01"), "month out of range");

    auto t = convert_value(*s.lookup("_Entry.Title"), "Some title");
    EXPECT(t && std::get<std::string>(*t) == "Some title", "text stays a string");

    return true;
}

inline bool conversion_range_checks()
{
    auto s = fixture_schema();
    auto const & id = *s.lookup("_Entity.ID");

    EXPECT(!convert_value(id, "99999999999999999999"), "integer overflow rejected");
    EXPECT(!convert_value(id, "-99999999999999999999"), "integer underflow rejected");
    auto biggest = convert_value(id, "9223372036854775807");
    EXPECT(biggest && std::get<int64_t>(*biggest) == INT64_MAX, "largest integer kept");

    auto const & weight = *s.lookup("_Entity.Formula_weight");
    EXPECT(!convert_value(weight, "1e999"), "infinite float rejected");
    EXPECT(!convert_value(weight, "nan"), "nan rejected");
    EXPECT(!convert_value(weight, "inf"), "inf rejected");

    EXPECT(!parse_date("2017-02-31"), "no February 31st");
    EXPECT(!parse_date("2019-04-31"), "April has 30 days");
    EXPECT(!parse_date("2019-02-29"), "not a leap year");
    EXPECT(!parse_date("1900-02-29"), "century is not a leap year");
    EXPECT(parse_date("2000-02-29"), "400-year leap day");
    EXPECT(parse_date("2020-02-29"), "leap day");
    EXPECT(!parse_date("99999999999-01-01"), "year out of range");
    EXPECT(!parse_date("0000-01-01"), "year zero");

    return true;
}

//---------------------------------------------------------------------------
// Validation
//---------------------------------------------------------------------------

constexpr std::string_view validation_src =
    "data_15000\n"
    "save_entry_information\n"
    "   _Entry.Sf_category entry_information\n"
    "   _Entry.Sf_framecode entry_information\n"
    "   _Entry.ID 15000\n"
    "   _Entry.Submission_date 'June 2019'\n"
    "   _Entry.version_type original\n"
    "   _Entry.Bogus x\n"
    "   loop_\n"
    "      _Entry_author.Ordinal _Entry_author.Family_name _Entry_author.Entry_ID\n"
    "      1 Smith 15000\n"
    "      two Jones 15000\n"
    "      3 . 15000\n"
    "   stop_\n"
    "save_\n"
    "save_entity_1\n"
    "   _Entity.Sf_category entity\n"
    "   _Entity.Sf_framecode entity_1\n"
    "   _Entity.ID 1\n"
    "   _Entity.Entry_ID 15000\n"
    "   _Entity.Formula_weight 8565.2\n"
    "   _Entity.Details $missing_frame\n"
    "save_\n";

inline bool validate_entry_issues()
{
    auto s = fixture_schema();
    auto ctx = parse(validation_src);
    EXPECT(!ctx.has_errors(), "parse error");

    auto issues = validate(ctx.result, s);

    EXPECT(count_kind(issues, issue_kind::unknown_tag) == 1, "one unknown tag");
    EXPECT(count_kind(issues, issue_kind::type_mismatch) == 2, "date and ordinal mismatches");
    EXPECT(count_kind(issues, issue_kind::capitalization) == 1, "one capitalisation issue");
    EXPECT(count_kind(issues, issue_kind::null_not_allowed) == 1, "one null in a NOT NULL column");
    EXPECT(count_kind(issues, issue_kind::dangling_reference) == 1, "one dangling reference");
    EXPECT(count_kind(issues, issue_kind::wrong_category) == 0, "no category problems");
    EXPECT(issues.size() == 6, "nothing else reported");

    auto date_issue = std::find_if(issues.begin(), issues.end(),
        [](validation_issue const & i) { return i.tag == "_Entry.Submission_date"; });
    EXPECT(date_issue != issues.end(), "date issue present");
    EXPECT(date_issue->location == "line 6", "located by line");
    EXPECT(date_issue->value == "June 2019", "offending value");

    auto row_issue = std::find_if(issues.begin(), issues.end(),
        [](validation_issue const & i) { return i.value == "two"; });
    EXPECT(row_issue != issues.end(), "row issue present");
    EXPECT(row_issue->location == "row 2 tag 1 of loop _Entry_author", "located by row and column");

    return true;
}

inline bool validate_single_values()
{
    auto s = fixture_schema();

    auto wrong = check_value(s, "_Entry.Title", "x", std::string("entity"), "here");
    EXPECT(wrong && wrong->kind == issue_kind::wrong_category, "wrong saveframe category");
    EXPECT(wrong->expected == "entry_information", "expected category reported");

    auto long_id = check_value(s, "_Entry.ID", "1234567890123", std::nullopt, "here");
    EXPECT(long_id && long_id->kind == issue_kind::too_long, "too long for CHAR(12)");

    EXPECT(!check_value(s, "_Entry.Title", ".", std::nullopt, "here"), "nullable tag accepts '.'");
    EXPECT(!check_value(s, "_Entity.ID", "-3", std::nullopt, "here"), "negative integer matches");

    auto null_id = check_value(s, "_Entity.ID", "?", std::nullopt, "here");
    EXPECT(null_id && null_id->kind == issue_kind::null_not_allowed, "'?' is null too");

    auto overflow = check_value(s, "_Entity.ID", "99999999999999999999", std::nullopt, "here");
    EXPECT(overflow && overflow->kind == issue_kind::type_mismatch, "integer out of range");

    auto bad_day = check_value(s, "_Entry.Submission_date", "2017-02-31", std::nullopt, "here");
    EXPECT(bad_day && bad_day->kind == issue_kind::type_mismatch, "not a calendar date");
    EXPECT(!check_value(s, "_Entry.Submission_date", "2016-02-29", std::nullopt, "here"), "leap day accepted");

    return true;
}

inline bool references_ignore_case()
{
    auto s = fixture_schema();
    auto ctx = parse(
        "data_x\n"
        "save_entity_1\n"
        "   _Entity.Sf_category entity\n"
        "   _Entity.Details $ENTITY_1\n"
        "   loop_\n"
        "      _Note.Ref\n"
        "      $Entity_1\n"
        "      $entity_2\n"
        "   stop_\n"
        "save_\n");
    EXPECT(!ctx.has_errors(), "parse error");

    auto issues = validate(ctx.result, s);
    EXPECT(count_kind(issues, issue_kind::dangling_reference) == 1, "only the missing frame dangles");

    auto dangling = std::find_if(issues.begin(), issues.end(),
        [](validation_issue const & i) { return i.kind == issue_kind::dangling_reference; });
    EXPECT(dangling != issues.end() && dangling->value == "$entity_2", "missing frame named");

    return true;
}

inline bool validate_saveframe_without_category()
{
    auto s = fixture_schema();
    auto sf = saveframe::from_scratch("bare", "Entity").result;
    EXPECT(sf.add_tag("ID", "1"), "setup");

    auto issues = validate(sf, s);
    EXPECT(count_kind(issues, issue_kind::missing_category) == 1, "missing Sf_category reported");
    EXPECT(issues.size() == 1, "the tag itself is fine");

    return true;
}

inline bool validation_is_read_only()
{
    auto s = fixture_schema();
    auto ctx = parse(validation_src);
    auto before = ctx.result;

    auto issues = validate(ctx.result, s);
    EXPECT(!issues.empty(), "issues found");
    EXPECT(ctx.result == before, "document unchanged");

    return true;
}

inline void run_schema_tests()
{
    SUBCAT("Schema loading");
    RUN_TEST(load_fixture);
    RUN_TEST(schema_ordering);
    RUN_TEST(load_failures);
    RUN_TEST(typed_conversion);
    RUN_TEST(conversion_range_checks);

    SUBCAT("Validation");
    RUN_TEST(validate_entry_issues);
    RUN_TEST(validate_single_values);
    RUN_TEST(references_ignore_case);
    RUN_TEST(validate_saveframe_without_category);
    RUN_TEST(validation_is_read_only);
}

}

#endif
