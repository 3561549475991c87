// nmrstar_parser.hpp - NMR-STAR reader/writer - Parser
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef NMRSTAR_PARSER_HPP
#define NMRSTAR_PARSER_HPP

#include "nmrstar_core.hpp"
#include "nmrstar_tokenizer.hpp"
#include "nmrstar_document.hpp"

#include <iostream>

namespace nmrstar
{
//========================================================================
// PARSER API
//========================================================================

    struct parse_options
    {
        bool strict = false;                // mismatched save_<name> and tagless saveframes are errors
        bool raise_parse_warnings = false;  // every warning becomes an error
        bool keep_comments = true;          // attach comments to the following saveframe
        bool unwrap_indented_text = false;  // strip the 3-space block indent
        bool verbose = false;               // echo warnings to std::clog
    };

    using parse_context = context<entry, parse_error>;

    // On error the result is an empty entry; no partial tree is returned.
    parse_context parse(std::string_view input, parse_options opts = {});

    context<saveframe, parse_error> parse_saveframe(std::string_view input, parse_options opts = {});
    context<loop, parse_error> parse_loop(std::string_view input, parse_options opts = {});

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        struct parser_impl
        {
            parser_impl(std::string_view input, parse_options opts)
                : opts(opts), tok(std::string(input))
            {}

            parse_options opts;
            tokenizer tok;

            std::vector<parse_error> errors;
            std::vector<parse_error> warnings;

            std::optional<token> cur;
            std::vector<std::string> pending_comments;
            size_t last_line {1};
            bool failed {false};

            bool advance();
            void fail(parse_error_kind kind, size_t line, std::string message);
            void warn(parse_error_kind kind, size_t line, std::string message);

            std::string value_text() const;

            void run_entry(entry & out);
            void run_saveframe(saveframe & out);
            void run_loop(loop & out);

            bool parse_saveframe(entry & target);
            bool parse_loop(saveframe & target);
        };

//---------------------------------------------------------------------------

        inline bool parser_impl::advance()
        {
            while (true)
            {
                cur = tok.next();

                if (!cur)
                {
                    if (tok.failed() && !failed)
                    {
                        failed = true;
                        errors.push_back(tok.error());
                    }
                    return false;
                }

                last_line = cur->line;

                if (cur->delim != delineator::comment)
                    return true;

                if (opts.keep_comments)
                    pending_comments.push_back(cur->text);
            }
        }

        inline void parser_impl::fail(parse_error_kind kind, size_t line, std::string message)
        {
            if (failed)
                return;
            failed = true;
            errors.push_back({ kind, { line }, std::move(message) });
        }

        inline void parser_impl::warn(parse_error_kind kind, size_t line, std::string message)
        {
            if (opts.raise_parse_warnings)
            {
                fail(kind, line, std::move(message));
                return;
            }

            if (opts.verbose)
                std::clog << "nmrstar: line " << line << ": " << message << '\n';

            warnings.push_back({ kind, { line }, std::move(message) });
        }

        inline std::string parser_impl::value_text() const
        {
            if (cur->delim == delineator::semicolon && opts.unwrap_indented_text)
                return unwrap_indented_text(cur->text);
            return cur->text;
        }

//---------------------------------------------------------------------------

        inline void parser_impl::run_entry(entry & out)
        {
            if (!advance())
            {
                fail(parse_error_kind::missing_data_header, last_line,
                     "input is empty; NMR-STAR files must start with 'data_<name>'");
                return;
            }

            if (cur->kw != keyword::data)
            {
                if (cur->is_quoted() && istarts_with(cur->text, "data_"))
                    fail(parse_error_kind::quoted_keyword, cur->line,
                         "the data_ keyword may not be quoted or semicolon-delimited");
                else
                    fail(parse_error_kind::missing_data_header, cur->line,
                         "NMR-STAR files must start with 'data_<name>'; found '" + cur->text + "'");
                return;
            }

            if (cur->text.size() <= 5)
            {
                fail(parse_error_kind::invalid_data_header, cur->line,
                     "'data_' must be followed by a data name");
                return;
            }

            if (auto s = out.set_entry_id(cur->text.substr(5)); !s)
            {
                fail(parse_error_kind::invalid_data_header, cur->line, s.message());
                return;
            }

            while (advance())
            {
                if (cur->kw != keyword::save)
                {
                    if (cur->is_quoted() && istarts_with(cur->text, "save_"))
                        fail(parse_error_kind::quoted_keyword, cur->line,
                             "the save_ keyword may not be quoted or semicolon-delimited");
                    else
                        fail(parse_error_kind::unexpected_token, cur->line,
                             "only 'save_NAME' is valid in the body of an NMR-STAR file; found '" + cur->text + "'");
                    return;
                }

                if (!parse_saveframe(out))
                    return;
            }
        }

//---------------------------------------------------------------------------

        inline bool parser_impl::parse_saveframe(entry & target)
        {
            size_t start_line = cur->line;

            if (cur->text.size() <= 5)
            {
                fail(parse_error_kind::invalid_saveframe_name, start_line,
                     "'save_' must be followed by a saveframe name");
                return false;
            }

            std::string header_name = cur->text.substr(5);

            saveframe sf;
            if (auto s = sf.set_name(header_name); !s)
            {
                fail(parse_error_kind::invalid_saveframe_name, start_line, s.message());
                return false;
            }
            sf.set_line(start_line);
            sf.set_comments(std::move(pending_comments));
            pending_comments.clear();

            while (advance())
            {
                if (cur->kw == keyword::loop)
                {
                    if (!parse_loop(sf))
                        return false;
                    continue;
                }

                if (cur->kw == keyword::save)
                {
                    std::string closing = cur->text.substr(5);
                    if (!closing.empty() && !iequals(closing, header_name))
                    {
                        std::string msg = "saveframe '" + header_name + "' closed by 'save_" + closing + "'";
                        if (opts.strict)
                        {
                            fail(parse_error_kind::saveframe_name_mismatch, cur->line, msg);
                            return false;
                        }
                        warn(parse_error_kind::saveframe_name_mismatch_tolerated, cur->line, msg);
                    }

                    if (sf.tags().empty())
                    {
                        std::string msg = "saveframe '" + sf.name() + "' has no tags";
                        if (opts.strict)
                            fail(parse_error_kind::saveframe_without_tags, cur->line, msg);
                        else
                            warn(parse_error_kind::saveframe_without_tags, cur->line, msg);
                    }

                    if (failed)
                        return false;

                    if (auto s = target.add_saveframe(std::move(sf)); !s)
                    {
                        fail(parse_error_kind::duplicate_saveframe, start_line, s.message());
                        return false;
                    }
                    return true;
                }

                if (cur->kw != keyword::none)
                {
                    fail(parse_error_kind::unexpected_token, cur->line,
                         "invalid token in saveframe '" + sf.name() +
                         "': expected a tag, 'loop_' or 'save_' but found '" + cur->text + "'");
                    return false;
                }

                if (!cur->text.starts_with('_'))
                {
                    fail(parse_error_kind::unexpected_token, cur->line,
                         "invalid token in saveframe '" + sf.name() +
                         "': expected a tag, 'loop_' or 'save_' but found '" + cur->text + "'");
                    return false;
                }

                if (cur->is_quoted())
                {
                    fail(parse_error_kind::invalid_tag_name, cur->line,
                         "saveframe tags may not be quoted or semicolon-delimited: '" + cur->text + "'");
                    return false;
                }

                std::string tag_name = cur->text;
                size_t tag_line = cur->line;

                if (!advance())
                {
                    fail(parse_error_kind::unterminated_saveframe, tag_line,
                         "tag '" + tag_name + "' has no value before end of input");
                    return false;
                }

                if (!cur->is_quoted())
                {
                    if (cur->kw != keyword::none)
                    {
                        fail(parse_error_kind::invalid_tag_value, cur->line,
                             "keywords may not be used as values unless quoted: '" + cur->text + "'");
                        return false;
                    }
                    if (cur->text.starts_with('_'))
                    {
                        fail(parse_error_kind::invalid_tag_value, cur->line,
                             "a value starting with '_' must be quoted; is a value missing for '" +
                             tag_name + "'? Found '" + cur->text + "'");
                        return false;
                    }
                }

                std::string value = value_text();

                if (iequals(format_tag(tag_name), "Sf_framecode") && !is_null(value) && value != header_name)
                {
                    warn(parse_error_kind::framecode_mismatch, tag_line,
                         "Sf_framecode '" + value + "' differs from saveframe header 'save_" + header_name + "'");
                    if (failed)
                        return false;
                }

                if (auto s = sf.add_tag(tag_name, std::move(value), false, tag_line); !s)
                {
                    parse_error_kind kind = parse_error_kind::invalid_tag_name;
                    if (s.kind() == state_error_kind::duplicate_tag)
                        kind = parse_error_kind::duplicate_tag;
                    else if (s.kind() == state_error_kind::empty_value)
                        kind = parse_error_kind::invalid_tag_value;
                    else if (s.kind() == state_error_kind::duplicate_name)
                        kind = parse_error_kind::duplicate_saveframe;

                    fail(kind, tag_line, s.message());
                    return false;
                }
            }

            fail(parse_error_kind::unterminated_saveframe, last_line,
                 "saveframe '" + sf.name() + "' was not terminated with 'save_' before end of input");
            return false;
        }

//---------------------------------------------------------------------------

        inline bool parser_impl::parse_loop(saveframe & target)
        {
            size_t loop_line = cur->line;

            loop lp;
            lp.set_line(loop_line);

            std::vector<std::string> values;
            size_t row_start_line = loop_line;

            while (advance())
            {
                if (cur->kw == keyword::stop)
                {
                    size_t stop_line = cur->line;

                    if (lp.tags().empty())
                    {
                        warn(parse_error_kind::loop_without_tags, stop_line, "loop with no tags; it was dropped");
                        return !failed;
                    }

                    if (values.empty())
                    {
                        warn(parse_error_kind::empty_loop, stop_line,
                             "loop '_" + lp.category() + "' has no data");
                        if (failed)
                            return false;
                    }

                    size_t width = lp.tags().size();
                    if (values.size() % width != 0)
                    {
                        size_t row_no = values.size() / width + 1;
                        fail(parse_error_kind::loop_cardinality, row_start_line,
                             "loop '_" + lp.category() + "' does not have the expected number of data elements: row " +
                             std::to_string(row_no) + " has " + std::to_string(values.size() % width) +
                             " of " + std::to_string(width) + " values");
                        return false;
                    }

                    if (!values.empty())
                    {
                        if (auto s = lp.add_data(values); !s)
                        {
                            fail(parse_error_kind::invalid_tag_value, loop_line, s.message());
                            return false;
                        }
                    }

                    if (auto s = target.add_loop(std::move(lp)); !s)
                    {
                        fail(parse_error_kind::duplicate_loop, loop_line, s.message());
                        return false;
                    }
                    return true;
                }

                if (cur->kw != keyword::none)
                {
                    fail(parse_error_kind::unexpected_token, cur->line,
                         "keywords may not be used as loop values unless quoted; was the loop terminated with "
                         "'stop_'? Found '" + cur->text + "'");
                    return false;
                }

                if (!cur->is_quoted() && cur->text.starts_with('_'))
                {
                    if (!values.empty())
                    {
                        fail(parse_error_kind::tag_after_loop_data, cur->line,
                             "loop tags may not follow loop data; a value starting with '_' must be quoted. Found '" +
                             cur->text + "'");
                        return false;
                    }

                    if (auto s = lp.add_tag(cur->text); !s)
                    {
                        parse_error_kind kind = s.kind() == state_error_kind::duplicate_tag
                                                    ? parse_error_kind::duplicate_tag
                                                    : parse_error_kind::invalid_tag_name;
                        fail(kind, cur->line, s.message());
                        return false;
                    }
                    continue;
                }

                if (lp.tags().empty())
                {
                    fail(parse_error_kind::data_before_tags, cur->line,
                         "data value found in loop before any loop tags: '" + cur->text + "'");
                    return false;
                }

                if (values.size() % lp.tags().size() == 0)
                    row_start_line = cur->line;

                values.push_back(value_text());
            }

            if (!failed)
                fail(parse_error_kind::unterminated_loop, loop_line,
                     "loop was not terminated with 'stop_' before end of input");
            return false;
        }

//---------------------------------------------------------------------------

        inline void parser_impl::run_saveframe(saveframe & out)
        {
            if (!advance())
            {
                fail(parse_error_kind::unexpected_token, last_line, "input is empty; expected 'save_<name>'");
                return;
            }

            if (cur->kw != keyword::save)
            {
                fail(parse_error_kind::unexpected_token, cur->line,
                     "expected 'save_<name>' but found '" + cur->text + "'");
                return;
            }

            entry holder;
            if (!parse_saveframe(holder))
                return;

            if (advance())
            {
                fail(parse_error_kind::unexpected_token, cur->line,
                     "unexpected '" + cur->text + "' after the saveframe");
                return;
            }
            if (failed)
                return;

            out = holder.saveframes().front();
        }

        inline void parser_impl::run_loop(loop & out)
        {
            if (!advance())
            {
                fail(parse_error_kind::unexpected_token, last_line, "input is empty; expected 'loop_'");
                return;
            }

            if (cur->kw != keyword::loop)
            {
                fail(parse_error_kind::unexpected_token, cur->line,
                     "expected 'loop_' but found '" + cur->text + "'");
                return;
            }

            saveframe holder;
            if (!parse_loop(holder))
                return;

            if (advance())
            {
                fail(parse_error_kind::unexpected_token, cur->line,
                     "unexpected '" + cur->text + "' after the loop");
                return;
            }
            if (failed || holder.loops().empty())
                return;

            out = holder.loops().front();
        }

    } // namespace detail

//========================================================================
// Parser API implementation
//========================================================================

    inline parse_context parse(std::string_view input, parse_options opts)
    {
        detail::parser_impl p(input, opts);
        parse_context ctx;

        entry parsed;
        p.run_entry(parsed);

        ctx.errors   = std::move(p.errors);
        ctx.warnings = std::move(p.warnings);
        if (!ctx.has_errors())
            ctx.result = std::move(parsed);
        return ctx;
    }

    inline context<saveframe, parse_error> parse_saveframe(std::string_view input, parse_options opts)
    {
        detail::parser_impl p(input, opts);
        context<saveframe, parse_error> ctx;

        p.run_saveframe(ctx.result);

        ctx.errors   = std::move(p.errors);
        ctx.warnings = std::move(p.warnings);
        if (ctx.has_errors())
            ctx.result = saveframe{};
        return ctx;
    }

    inline context<loop, parse_error> parse_loop(std::string_view input, parse_options opts)
    {
        detail::parser_impl p(input, opts);
        context<loop, parse_error> ctx;

        p.run_loop(ctx.result);

        ctx.errors   = std::move(p.errors);
        ctx.warnings = std::move(p.warnings);
        if (ctx.has_errors())
            ctx.result = loop{};
        return ctx;
    }

} // namespace nmrstar

#endif // NMRSTAR_PARSER_HPP
