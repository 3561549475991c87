#ifndef NMRSTAR_TESTS_TOKENIZER__
#define NMRSTAR_TESTS_TOKENIZER__

#include "nmrstar_test_harness.hpp"
#include "../include/nmrstar_tokenizer.hpp"

namespace nmrstar::tests
{

inline bool plain_tokens_and_lines()
{
    constexpr std::string_view src =
        "data_dates\n"
        "save_first\n"
        "   _Entry.ID   15000\n";

    auto ctx = tokenize(src);
    EXPECT(!ctx.has_errors(), "error emitted");
    EXPECT(ctx.result.size() == 4, "expected four tokens");

    EXPECT(ctx.result[0].text == "data_dates", "first token text");
    EXPECT(ctx.result[0].kw == keyword::data, "data_ keyword not classified");
    EXPECT(ctx.result[0].line == 1, "data_ on line 1");
    EXPECT(ctx.result[1].kw == keyword::save, "save_ keyword not classified");
    EXPECT(ctx.result[2].text == "_Entry.ID", "tag token text");
    EXPECT(ctx.result[2].line == 3, "tag on line 3");
    EXPECT(ctx.result[3].text == "15000", "value token text");
    EXPECT(ctx.result[3].delim == delineator::whitespace, "plain value delineator");

    return true;
}

inline bool quoted_tokens_strip_delimiters()
{
    auto ctx = tokenize("'a b' \"c d\"");
    EXPECT(!ctx.has_errors(), "error emitted");
    EXPECT(ctx.result.size() == 2, "expected two tokens");
    EXPECT(ctx.result[0].text == "a b", "single-quoted text");
    EXPECT(ctx.result[0].delim == delineator::single_quote, "single quote delineator");
    EXPECT(ctx.result[1].text == "c d", "double-quoted text");
    EXPECT(ctx.result[1].delim == delineator::double_quote, "double quote delineator");

    return true;
}

inline bool embedded_quote_not_followed_by_space()
{
    auto ctx = tokenize("'it's here' next");
    EXPECT(!ctx.has_errors(), "error emitted");
    EXPECT(ctx.result.size() == 2, "expected two tokens");
    EXPECT(ctx.result[0].text == "it's here", "embedded quote should stay in value");
    EXPECT(ctx.result[1].text == "next", "following token");

    return true;
}

inline bool semicolon_block_token()
{
    constexpr std::string_view src =
        "_Tag\n"
        ";\n"
        "line one\n"
        "line two\n"
        ";\n"
        "after\n";

    auto ctx = tokenize(src);
    EXPECT(!ctx.has_errors(), "error emitted");
    EXPECT(ctx.result.size() == 3, "expected three tokens");
    EXPECT(ctx.result[1].delim == delineator::semicolon, "semicolon delineator");
    EXPECT(ctx.result[1].text == "line one\nline two", "block text excludes delimiters");
    EXPECT(ctx.result[1].line == 2, "block starts on line 2");
    EXPECT(ctx.result[2].text == "after", "token after block");
    EXPECT(ctx.result[2].line == 6, "line count after block");

    return true;
}

inline bool semicolon_mid_line_is_plain()
{
    auto ctx = tokenize("a;b ;c");
    EXPECT(!ctx.has_errors(), "error emitted");
    EXPECT(ctx.result.size() == 2, "expected two tokens");
    EXPECT(ctx.result[1].text == ";c", "mid-line semicolon is ordinary text");
    EXPECT(ctx.result[1].delim == delineator::whitespace, "plain delineator");

    return true;
}

inline bool comments_are_tokens()
{
    auto ctx = tokenize("# hello\nvalue # trailing\n");
    EXPECT(!ctx.has_errors(), "error emitted");
    EXPECT(ctx.result.size() == 3, "expected three tokens");
    EXPECT(ctx.result[0].delim == delineator::comment, "comment delineator");
    EXPECT(ctx.result[0].text == " hello", "comment text without '#'");
    EXPECT(ctx.result[1].line == 2, "value on line 2");
    EXPECT(ctx.result[2].delim == delineator::comment, "trailing comment");

    return true;
}

inline bool hash_inside_value_is_not_comment()
{
    auto ctx = tokenize("a#b");
    EXPECT(ctx.result.size() == 1, "expected one token");
    EXPECT(ctx.result[0].text == "a#b", "hash inside a value");

    return true;
}

inline bool references_are_flagged()
{
    auto ctx = tokenize("$entry_info '$quoted'");
    EXPECT(ctx.result.size() == 2, "expected two tokens");
    EXPECT(ctx.result[0].is_reference, "unquoted '$' is a reference");
    EXPECT(!ctx.result[1].is_reference, "quoted '$' is a plain value");

    return true;
}

inline bool keyword_classification()
{
    EXPECT(classify_keyword("DATA_x") == keyword::data, "data_ is case-insensitive");
    EXPECT(classify_keyword("save_") == keyword::save, "bare save_");
    EXPECT(classify_keyword("Loop_") == keyword::loop, "loop_ is case-insensitive");
    EXPECT(classify_keyword("stop_") == keyword::stop, "stop_");
    EXPECT(classify_keyword("global_") == keyword::global, "global_");
    EXPECT(classify_keyword("loop_x") == keyword::none, "loop_x is not a keyword");
    EXPECT(classify_keyword("value") == keyword::none, "ordinary value");

    auto ctx = tokenize("'data_x'");
    EXPECT(ctx.result.size() == 1 && ctx.result[0].kw == keyword::none, "quoted keywords are values");

    return true;
}

inline bool crlf_line_endings()
{
    auto ctx = tokenize("a\r\nb\rc\n");
    EXPECT(!ctx.has_errors(), "error emitted");
    EXPECT(ctx.result.size() == 3, "expected three tokens");
    EXPECT(ctx.result[1].line == 2 && ctx.result[2].line == 3, "CR and CRLF count as newlines");

    return true;
}

//---------------------------------------------------------------------------

inline bool unterminated_quote_reports_start_line()
{
    constexpr std::string_view src =
        "first\n"
        "second\n"
        "'never closed\n";

    auto ctx = tokenize(src);
    EXPECT(ctx.has_errors(), "unterminated quote should fail");
    EXPECT(ctx.errors[0].kind == parse_error_kind::quote_spans_lines ||
           ctx.errors[0].kind == parse_error_kind::unterminated_quote, "quote error kind");
    EXPECT(ctx.errors[0].loc.line == 3, "error should point at the opening line");

    return true;
}

inline bool quote_at_end_of_input()
{
    auto ctx = tokenize("'open");
    EXPECT(ctx.has_errors(), "should fail");
    EXPECT(ctx.errors[0].kind == parse_error_kind::unterminated_quote, "unterminated quote kind");
    EXPECT(ctx.errors[0].loc.line == 1, "line 1");

    return true;
}

inline bool unterminated_semicolon_block()
{
    auto ctx = tokenize("x\n;\nbody\nmore\n");
    EXPECT(ctx.has_errors(), "should fail");
    EXPECT(ctx.errors[0].kind == parse_error_kind::unterminated_semicolon, "semicolon error kind");
    EXPECT(ctx.errors[0].loc.line == 2, "error on the opening line");
    EXPECT(ctx.result.size() == 1, "tokens before the error are kept");

    return true;
}

inline bool lazy_tokenizer_stops_after_failure()
{
    tokenizer tok("ok 'bad\n");
    auto first = tok.next();
    EXPECT(first && first->text == "ok", "first token");
    EXPECT(!tok.next(), "second call fails");
    EXPECT(tok.failed(), "failure recorded");
    EXPECT(!tok.next(), "no tokens after a failure");

    return true;
}

inline bool unwrap_indent()
{
    EXPECT(unwrap_indented_text("   a\n   b") == "a\nb", "three space indent removed");
    EXPECT(unwrap_indented_text("   a\n\n   b") == "a\n\nb", "empty lines allowed");
    EXPECT(unwrap_indented_text("   a\nb") == "   a\nb", "partial indent kept");

    return true;
}

inline void run_tokenizer_tests()
{
    SUBCAT("Tokens");
    RUN_TEST(plain_tokens_and_lines);
    RUN_TEST(quoted_tokens_strip_delimiters);
    RUN_TEST(embedded_quote_not_followed_by_space);
    RUN_TEST(semicolon_block_token);
    RUN_TEST(semicolon_mid_line_is_plain);
    RUN_TEST(comments_are_tokens);
    RUN_TEST(hash_inside_value_is_not_comment);
    RUN_TEST(references_are_flagged);
    RUN_TEST(keyword_classification);
    RUN_TEST(crlf_line_endings);

    SUBCAT("Errors");
    RUN_TEST(unterminated_quote_reports_start_line);
    RUN_TEST(quote_at_end_of_input);
    RUN_TEST(unterminated_semicolon_block);
    RUN_TEST(lazy_tokenizer_stops_after_failure);

    SUBCAT("Text blocks");
    RUN_TEST(unwrap_indent);
}

}

#endif
