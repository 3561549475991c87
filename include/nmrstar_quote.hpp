// nmrstar_quote.hpp - NMR-STAR reader/writer - Value quoting
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef NMRSTAR_QUOTE_HPP
#define NMRSTAR_QUOTE_HPP

#include "nmrstar_core.hpp"
#include "nmrstar_tokenizer.hpp"

namespace nmrstar
{
//========================================================================
// QUOTING API
//========================================================================

    using quote_context = context<std::string, state_error>;

    // Returns the text that re-tokenizes to exactly `value`.
    // Multi-line results are complete ";\n...\n;" blocks.
    quote_context quote_value(std::string_view value);

    inline bool is_multiline_block(std::string_view quoted)
    {
        return quoted.find('\n') != std::string_view::npos;
    }

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        inline std::string semicolon_block(std::string_view value)
        {
            std::string out = ";\n";

            if (needs_block_indent(value))
            {
                out += BLOCK_INDENT;
                for (char c : value)
                {
                    out += c;
                    if (c == '\n')
                        out += BLOCK_INDENT;
                }
            }
            else
            {
                out += value;
            }

            out += "\n;";
            return out;
        }

        // A quote followed by whitespace (or ending the value) would terminate
        // a value wrapped in that quote.
        inline bool can_wrap_in(std::string_view value, char quote)
        {
            for (size_t i = 0; i < value.size(); ++i)
            {
                if (value[i] != quote)
                    continue;
                if (i + 1 == value.size() || is_whitespace(value[i + 1]))
                    return false;
            }
            return true;
        }

        inline bool needs_wrapping(std::string_view value)
        {
            if (value.starts_with('_') || value.starts_with('\'') || value.starts_with('"') || value.starts_with(';'))
                return true;

            if (starts_with_keyword(value))
                return true;

            if (contains_whitespace(value))
                return true;

            for (size_t i = 0; i < value.size(); ++i)
            {
                if (value[i] == '#' && (i == 0 || is_whitespace(value[i - 1])))
                    return true;
            }

            return false;
        }
    }

    inline quote_context quote_value(std::string_view value)
    {
        quote_context ctx;

        if (value.empty())
        {
            ctx.errors.push_back({ state_error_kind::empty_value, {},
                "empty string is not a valid STAR value; use '.' or '?' instead" });
            return ctx;
        }

        // The reader turns CR and CRLF into LF, so the block is written that way.
        if (value.find('\r') != std::string_view::npos)
        {
            ctx.result = detail::semicolon_block(detail::normalize_newlines(std::string(value)));
            return ctx;
        }

        if (value.find('\n') != std::string_view::npos)
        {
            ctx.result = detail::semicolon_block(value);
            return ctx;
        }

        bool has_single = value.find('\'') != std::string_view::npos;
        bool has_double = value.find('"')  != std::string_view::npos;

        if (has_single && has_double)
        {
            if (detail::can_wrap_in(value, '\''))
                ctx.result = "'" + std::string(value) + "'";
            else if (detail::can_wrap_in(value, '"'))
                ctx.result = "\"" + std::string(value) + "\"";
            else
                ctx.result = detail::semicolon_block(value);
            return ctx;
        }

        if (detail::needs_wrapping(value))
        {
            char q = has_single ? '"' : '\'';
            ctx.result = q + std::string(value) + q;
            return ctx;
        }

        ctx.result = std::string(value);
        return ctx;
    }

} // namespace nmrstar

#endif // NMRSTAR_QUOTE_HPP
