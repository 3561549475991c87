// nmrstar_core.hpp - NMR-STAR reader/writer - Core definitions
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef NMRSTAR_CORE_HPP
#define NMRSTAR_CORE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>

namespace nmrstar
{
//========================================================================
// Forward declarations
//========================================================================

    class loop;
    class saveframe;
    class entry;

    inline constexpr size_t npos() { return static_cast<size_t>(-1); }

//========================================================================
// Diagnostics
//========================================================================

    struct source_location
    {
        size_t line = 0;    // 1-based; 0 when not derivable
    };

    template <typename Kind>
    struct error
    {
        Kind            kind;
        source_location loc;
        std::string     message;
    };

    enum class parse_error_kind
    {
        unterminated_semicolon,
        unterminated_quote,
        quote_spans_lines,
        missing_data_header,
        invalid_data_header,
        quoted_keyword,
        invalid_saveframe_name,
        unexpected_token,
        invalid_tag_name,
        invalid_tag_value,
        tag_after_loop_data,
        data_before_tags,
        loop_cardinality,
        duplicate_saveframe,
        duplicate_loop,
        duplicate_tag,
        unterminated_loop,
        unterminated_saveframe,
        saveframe_name_mismatch,
        io_failure,
    // warnings
        empty_loop,
        loop_without_tags,
        saveframe_without_tags,
        framecode_mismatch,
        saveframe_name_mismatch_tolerated,
    };

    enum class state_error_kind
    {
        empty_value,
        invalid_name,
        duplicate_name,
        duplicate_category,
        duplicate_tag,
        row_length_mismatch,
        no_tags,
        category_mismatch,
        not_found,
        not_numeric,
        io_failure,
        invalid_json,
    };

    using parse_error = error<parse_error_kind>;
    using state_error = error<state_error_kind>;

//========================================================================
// Result context
//========================================================================

    template <typename T, typename Error>
    struct context
    {
        T result;
        std::vector<Error> errors;
        std::vector<Error> warnings;

        bool has_errors() const { return !errors.empty(); }
        bool has_warnings() const { return !warnings.empty(); }
    };

//========================================================================
// Status of a single mutation
//========================================================================

    class status
    {
    public:
        status() = default;

        static status success() { return {}; }

        static status failure(state_error_kind kind, std::string message)
        {
            status s;
            s.err_ = state_error{ kind, {}, std::move(message) };
            return s;
        }

        bool ok() const noexcept { return !err_.has_value(); }
        explicit operator bool() const noexcept { return ok(); }

        // Only meaningful when !ok()
        state_error const & error() const { return *err_; }
        state_error_kind kind() const { return err_->kind; }
        std::string const & message() const { return err_->message; }

    private:
        std::optional<state_error> err_;
    };

//========================================================================
// Schema value types
//========================================================================

    enum class value_type
    {
        string,
        integer,
        decimal,
        date
    };

    struct date
    {
        int year  = 0;
        int month = 0;
        int day   = 0;

        auto operator<=>(date const &) const = default;
    };

//========================================================================
// UTILITY FUNCTIONS
//========================================================================

    namespace detail
    {
        constexpr std::string_view WHITESPACE = " \t\n\r\v";
        constexpr std::string_view NULL_DEFINITE = ".";
        constexpr std::string_view NULL_UNKNOWN  = "?";

        constexpr std::array<std::string_view, 5> RESERVED_KEYWORDS =
        {
            "data_", "save_", "loop_", "stop_", "global_"
        };

        inline bool is_whitespace(char c)
        {
            return WHITESPACE.find(c) != std::string_view::npos;
        }

        inline bool contains_whitespace(std::string_view s)
        {
            return s.find_first_of(WHITESPACE) != std::string_view::npos;
        }

        inline bool is_null(std::string_view s)
        {
            return s == NULL_DEFINITE || s == NULL_UNKNOWN;
        }

        inline std::string to_lower(std::string_view s)
        {
            std::string result(s);
            std::transform(result.begin(), result.end(), result.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return result;
        }

        inline bool iequals(std::string_view a, std::string_view b)
        {
            if (a.size() != b.size())
                return false;

            for (size_t i = 0; i < a.size(); ++i)
            {
                if (std::tolower(static_cast<unsigned char>(a[i])) !=
                    std::tolower(static_cast<unsigned char>(b[i])))
                    return false;
            }
            return true;
        }

        inline bool istarts_with(std::string_view s, std::string_view prefix)
        {
            return s.size() >= prefix.size() && iequals(s.substr(0, prefix.size()), prefix);
        }

        inline bool starts_with_keyword(std::string_view s)
        {
            for (auto kw : RESERVED_KEYWORDS)
                if (istarts_with(s, kw))
                    return true;
            return false;
        }

        // "_Entity.ID" -> "Entity"
        inline std::string format_category(std::string_view tag)
        {
            if (tag.starts_with('_'))
                tag.remove_prefix(1);
            if (auto dot = tag.find('.'); dot != std::string_view::npos)
                tag = tag.substr(0, dot);
            return std::string(tag);
        }

        // "_Entity.ID" -> "ID"
        inline std::string format_tag(std::string_view tag)
        {
            if (auto dot = tag.find('.'); dot != std::string_view::npos)
                return std::string(tag.substr(dot + 1));
            if (tag.starts_with('_'))
                tag.remove_prefix(1);
            return std::string(tag);
        }

        inline bool is_qualified(std::string_view tag)
        {
            return tag.find('.') != std::string_view::npos;
        }

        inline std::string qualify(std::string_view category, std::string_view tag)
        {
            std::string out;
            out.reserve(category.size() + tag.size() + 2);
            out += '_';
            out += category;
            out += '.';
            out += tag;
            return out;
        }

        inline std::string_view trim_sv(std::string_view s)
        {
            size_t start = s.find_first_not_of(" \t\r\n\v");
            if (start == std::string_view::npos) return {};
            size_t end = s.find_last_not_of(" \t\r\n\v");
            return s.substr(start, end - start + 1);
        }
    }

    inline std::string_view to_string(parse_error_kind kind)
    {
        switch (kind)
        {
            case parse_error_kind::unterminated_semicolon:   return "unterminated semicolon block";
            case parse_error_kind::unterminated_quote:       return "unterminated quote";
            case parse_error_kind::quote_spans_lines:        return "quoted value spans lines";
            case parse_error_kind::missing_data_header:      return "missing data header";
            case parse_error_kind::invalid_data_header:      return "invalid data header";
            case parse_error_kind::quoted_keyword:           return "quoted keyword";
            case parse_error_kind::invalid_saveframe_name:   return "invalid saveframe name";
            case parse_error_kind::unexpected_token:         return "unexpected token";
            case parse_error_kind::invalid_tag_name:         return "invalid tag name";
            case parse_error_kind::invalid_tag_value:        return "invalid tag value";
            case parse_error_kind::tag_after_loop_data:      return "tag after loop data";
            case parse_error_kind::data_before_tags:         return "data before loop tags";
            case parse_error_kind::loop_cardinality:         return "loop cardinality";
            case parse_error_kind::duplicate_saveframe:      return "duplicate saveframe";
            case parse_error_kind::duplicate_loop:           return "duplicate loop";
            case parse_error_kind::duplicate_tag:            return "duplicate tag";
            case parse_error_kind::unterminated_loop:        return "unterminated loop";
            case parse_error_kind::unterminated_saveframe:   return "unterminated saveframe";
            case parse_error_kind::saveframe_name_mismatch:  return "saveframe name mismatch";
            case parse_error_kind::io_failure:               return "i/o failure";
            case parse_error_kind::empty_loop:               return "empty loop";
            case parse_error_kind::loop_without_tags:        return "loop without tags";
            case parse_error_kind::saveframe_without_tags:   return "saveframe without tags";
            case parse_error_kind::framecode_mismatch:       return "framecode mismatch";
            case parse_error_kind::saveframe_name_mismatch_tolerated: return "saveframe name mismatch";
        }
        return "unknown";
    }

} // namespace nmrstar

#endif // NMRSTAR_CORE_HPP
