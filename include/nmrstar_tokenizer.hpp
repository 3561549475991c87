// nmrstar_tokenizer.hpp - NMR-STAR reader/writer - Tokenizer
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef NMRSTAR_TOKENIZER_HPP
#define NMRSTAR_TOKENIZER_HPP

#include "nmrstar_core.hpp"

namespace nmrstar
{
//========================================================================
// Tokens
//========================================================================

    // The marker that opened a token
    enum class delineator
    {
        whitespace,
        single_quote,
        double_quote,
        semicolon,
        comment
    };

    enum class keyword
    {
        none,
        data,
        save,
        loop,
        stop,
        global
    };

    struct token
    {
        std::string text;
        size_t      line = 0;
        delineator  delim = delineator::whitespace;
        keyword     kw = keyword::none;
        bool        is_reference = false;   // unquoted and starts with '$'

        bool is_quoted() const { return delim != delineator::whitespace; }
    };

//========================================================================
// TOKENIZER API
//========================================================================

    // Lazy, single-pass scanner. Create a fresh instance to re-scan.
    class tokenizer
    {
    public:
        explicit tokenizer(std::string source);

        // Next token, or nullopt at end of input or after a failure.
        std::optional<token> next();

        bool failed() const noexcept { return err_.has_value(); }
        parse_error const & error() const { return *err_; }

        size_t line() const noexcept { return line_; }

    private:
        std::string src_;
        size_t      pos_  {0};
        size_t      line_ {1};
        std::optional<parse_error> err_;

        void skip_whitespace();
        std::optional<token> fail(parse_error_kind kind, size_t line, std::string message);

        token scan_comment();
        std::optional<token> scan_semicolon_block();
        std::optional<token> scan_quoted(char quote);
        token scan_plain();
    };

    using token_context = context<std::vector<token>, parse_error>;

    // Eager convenience over tokenizer; stops at the first error.
    token_context tokenize(std::string_view source);

    keyword classify_keyword(std::string_view text);

    // Strips a three space indent from every line if all non-empty lines carry it.
    std::string unwrap_indented_text(std::string_view text);

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        inline std::string normalize_newlines(std::string s)
        {
            if (s.find('\r') == std::string::npos)
                return s;

            std::string out;
            out.reserve(s.size());
            for (size_t i = 0; i < s.size(); ++i)
            {
                if (s[i] == '\r')
                {
                    out += '\n';
                    if (i + 1 < s.size() && s[i + 1] == '\n')
                        ++i;
                }
                else
                {
                    out += s[i];
                }
            }
            return out;
        }

        constexpr std::string_view BLOCK_INDENT = "   ";

        inline bool writer_indented(std::string_view text);

        // A body line starting with ';' would close the block.
        inline bool needs_block_indent(std::string_view value)
        {
            return value.starts_with(';') || value.find("\n;") != std::string_view::npos ||
                   writer_indented(value);
        }

        inline std::string strip_block_indent(std::string_view text)
        {
            std::string out;
            out.reserve(text.size());
            size_t start = 0;
            while (true)
            {
                size_t nl = text.find('\n', start);
                auto line = text.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start);
                if (line.starts_with(BLOCK_INDENT))
                    line.remove_prefix(BLOCK_INDENT.size());
                out += line;
                if (nl == std::string_view::npos)
                    break;
                out += '\n';
                start = nl + 1;
            }
            return out;
        }

        // True for block text the writer indented: every line carries the
        // indent and the unindented text could not be written bare.
        inline bool writer_indented(std::string_view text)
        {
            size_t start = 0;
            while (true)
            {
                if (!text.substr(start).starts_with(BLOCK_INDENT))
                    return false;
                size_t nl = text.find('\n', start);
                if (nl == std::string_view::npos)
                    break;
                start = nl + 1;
            }
            return needs_block_indent(strip_block_indent(text));
        }
    }

    inline keyword classify_keyword(std::string_view text)
    {
        using detail::iequals;
        using detail::istarts_with;

        if (istarts_with(text, "data_"))   return keyword::data;
        if (istarts_with(text, "save_"))   return keyword::save;
        if (istarts_with(text, "global_")) return keyword::global;
        if (iequals(text, "loop_"))        return keyword::loop;
        if (iequals(text, "stop_"))        return keyword::stop;
        return keyword::none;
    }

    inline std::string unwrap_indented_text(std::string_view text)
    {
        constexpr std::string_view indent = "   ";

        std::vector<std::string_view> lines;
        size_t start = 0;
        while (true)
        {
            size_t nl = text.find('\n', start);
            lines.push_back(text.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start));
            if (nl == std::string_view::npos)
                break;
            start = nl + 1;
        }

        for (auto l : lines)
            if (!l.empty() && !l.starts_with(indent))
                return std::string(text);

        std::string out;
        out.reserve(text.size());
        for (size_t i = 0; i < lines.size(); ++i)
        {
            if (i > 0) out += '\n';
            auto l = lines[i];
            if (l.starts_with(indent))
                l.remove_prefix(indent.size());
            out += l;
        }
        return out;
    }

    inline tokenizer::tokenizer(std::string source)
        : src_(detail::normalize_newlines(std::move(source)))
    {}

//---------------------------------------------------------------------------

    inline void tokenizer::skip_whitespace()
    {
        while (pos_ < src_.size() && detail::is_whitespace(src_[pos_]))
        {
            if (src_[pos_] == '\n')
                ++line_;
            ++pos_;
        }
    }

//---------------------------------------------------------------------------

    inline std::optional<token> tokenizer::fail(parse_error_kind kind, size_t line, std::string message)
    {
        err_ = parse_error{ kind, { line }, std::move(message) };
        pos_ = src_.size();
        return std::nullopt;
    }

//---------------------------------------------------------------------------

    inline std::optional<token> tokenizer::next()
    {
        if (err_)
            return std::nullopt;

        skip_whitespace();

        if (pos_ >= src_.size())
            return std::nullopt;

        char c = src_[pos_];

        if (c == '#')
            return scan_comment();

        if (c == ';' && (pos_ == 0 || src_[pos_ - 1] == '\n'))
            return scan_semicolon_block();

        if (c == '\'' || c == '"')
            return scan_quoted(c);

        return scan_plain();
    }

//---------------------------------------------------------------------------

    inline token tokenizer::scan_comment()
    {
        size_t end = src_.find('\n', pos_);
        if (end == std::string::npos)
            end = src_.size();

        token t;
        t.text  = src_.substr(pos_ + 1, end - pos_ - 1);
        t.line  = line_;
        t.delim = delineator::comment;

        // the newline itself is counted by the next skip
        pos_ = end;
        return t;
    }

//---------------------------------------------------------------------------

    inline std::optional<token> tokenizer::scan_semicolon_block()
    {
        size_t start_line = line_;
        size_t close = src_.find("\n;", pos_ + 1);

        if (close == std::string::npos)
        {
            return fail(parse_error_kind::unterminated_semicolon, start_line,
                        "semicolon-delineated value was not terminated");
        }

        size_t content = pos_ + 1;
        if (content < src_.size() && src_[content] == '\n')
            ++content;

        token t;
        t.text  = content < close ? src_.substr(content, close - content) : std::string{};
        if (detail::writer_indented(t.text))
            t.text = detail::strip_block_indent(t.text);
        t.line  = start_line;
        t.delim = delineator::semicolon;

        line_ += static_cast<size_t>(std::count(src_.begin() + static_cast<std::ptrdiff_t>(pos_),
                                                src_.begin() + static_cast<std::ptrdiff_t>(close + 1), '\n'));
        pos_ = close + 2;
        return t;
    }

//---------------------------------------------------------------------------

    inline std::optional<token> tokenizer::scan_quoted(char quote)
    {
        size_t start_line = line_;
        size_t search = pos_ + 1;

        while (true)
        {
            size_t close = src_.find(quote, search);
            if (close == std::string::npos)
            {
                return fail(parse_error_kind::unterminated_quote, start_line,
                            std::string("quoted value (") + quote + ") was not terminated");
            }

            // a quote followed by non-whitespace is part of the value
            if (close + 1 < src_.size() && !detail::is_whitespace(src_[close + 1]))
            {
                search = close + 1;
                continue;
            }

            std::string_view body(src_.data() + pos_ + 1, close - pos_ - 1);
            if (body.find('\n') != std::string_view::npos)
            {
                return fail(parse_error_kind::quote_spans_lines, start_line,
                            std::string("quoted value (") + quote + ") was not terminated on the line it began");
            }

            token t;
            t.text  = std::string(body);
            t.line  = start_line;
            t.delim = quote == '\'' ? delineator::single_quote : delineator::double_quote;

            pos_ = close + 1;
            return t;
        }
    }

//---------------------------------------------------------------------------

    inline token tokenizer::scan_plain()
    {
        size_t end = src_.find_first_of(detail::WHITESPACE, pos_);
        if (end == std::string::npos)
            end = src_.size();

        token t;
        t.text  = src_.substr(pos_, end - pos_);
        t.line  = line_;
        t.delim = delineator::whitespace;
        t.kw    = classify_keyword(t.text);
        t.is_reference = t.text.starts_with('$');

        pos_ = end;
        return t;
    }

//---------------------------------------------------------------------------

    inline token_context tokenize(std::string_view source)
    {
        token_context ctx;
        tokenizer tok{ std::string(source) };

        while (auto t = tok.next())
            ctx.result.push_back(std::move(*t));

        if (tok.failed())
            ctx.errors.push_back(tok.error());

        return ctx;
    }

} // namespace nmrstar

#endif // NMRSTAR_TOKENIZER_HPP
