// nmrstar_schema.hpp - NMR-STAR reader/writer - Schema dictionary
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef NMRSTAR_SCHEMA_HPP
#define NMRSTAR_SCHEMA_HPP

#include "nmrstar_core.hpp"
#include "nmrstar_document.hpp"

#include <cmath>
#include <fstream>
#include <filesystem>
#include <memory>
#include <sstream>
#include <unordered_map>
#include <variant>

#include <re2/re2.h>

namespace nmrstar
{
//========================================================================
// Tag definitions
//========================================================================

    struct tag_definition
    {
        std::string tag;                    // canonical capitalisation, "_Cat.Tag"
        std::string data_type;              // INTEGER, FLOAT, CHAR(n), VARCHAR(n), TEXT, DATETIME year to day
        std::string bmrb_type;              // name of the regex class, may be empty
        value_type  type = value_type::string;
        std::optional<size_t> max_length;   // CHAR/VARCHAR only
        bool        nullable = true;
        std::string sf_category;
        std::optional<std::string> default_value;
        bool        loop_flag = false;
        std::optional<double> sort_order;
        bool        entry_id_flag = false;

        std::string pattern;                // empty: any value matches
        std::shared_ptr<const re2::RE2> regex;
    };

//========================================================================
// SCHEMA API
//========================================================================

    class schema
    {
    public:
        virtual ~schema() = default;

        // Case-insensitive on the full "_Cat.Tag" name.
        virtual tag_definition const * lookup(std::string_view tag) const = 0;

        // Definitions whose tag prefix is `category`, in dictionary order.
        virtual std::vector<tag_definition const*> tags_in_category(std::string_view category) const = 0;

        // Tag categories ("Entity", "Entity_assembly", ...) in dictionary order.
        virtual std::vector<std::string> const & category_order() const = 0;

        virtual std::string const & version() const = 0;

        // Position of the tag in dictionary order; unknown tags sort last.
        size_t tag_order(std::string_view tag) const
        {
            auto def = lookup(tag);
            if (!def || !def->sort_order)
                return npos();
            double v = *def->sort_order;
            if (!std::isfinite(v) || v < 0 || v >= static_cast<double>(npos()))
                return npos();
            return static_cast<size_t>(v);
        }
    };

    // In-memory dictionary; the concrete schema behind load_schema_csv.
    class dictionary_schema : public schema
    {
    public:
        dictionary_schema() = default;
        explicit dictionary_schema(std::string version) : version_(std::move(version)) {}

        tag_definition const * lookup(std::string_view tag) const override;
        std::vector<tag_definition const*> tags_in_category(std::string_view category) const override;
        std::vector<std::string> const & category_order() const override { return category_order_; }
        std::string const & version() const override { return version_; }

        void set_version(std::string v) { version_ = std::move(v); }

        // Validates the type string, fills in type, length and pattern when
        // not already set, and appends to dictionary order.
        status add_tag(tag_definition def);

        // Regex for a BMRB data type name; overrides the type-derived pattern.
        status add_data_type(std::string name, std::string regex);

        size_t size() const noexcept { return order_.size(); }

    private:
        std::string version_ = "unknown";
        std::vector<tag_definition> defs_;
        std::unordered_map<std::string, size_t> index_;     // lower-case tag -> defs_ position
        std::vector<size_t> order_;
        std::vector<std::string> category_order_;
        std::unordered_map<std::string, std::string> data_types_;
    };

    using schema_context = context<dictionary_schema, state_error>;

    // BMRB xlschem_ann.csv layout; the data types CSV maps type names to regexes.
    schema_context load_schema_csv(std::string_view schema_csv, std::string_view data_types_csv = {});
    schema_context load_schema_file(std::filesystem::path const & schema_path,
                                    std::filesystem::path const & data_types_path = {});

//========================================================================
// Typed values
//========================================================================

    // Both null markers collapse to monostate at this layer.
    using typed_value = std::variant<std::monostate, std::string, int64_t, double, date>;

    std::optional<typed_value> convert_value(tag_definition const & def, std::string_view raw);
    std::optional<date> parse_date(std::string_view s);

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        constexpr std::string_view INTEGER_PATTERN = "-?[0-9]+";
        constexpr std::string_view FLOAT_PATTERN   = "[-+]?([0-9]+\\.?[0-9]*|\\.[0-9]+)([eE][-+]?[0-9]+)?";
        constexpr std::string_view DATE_PATTERN    = "[0-9]{4}-[0-9]{1,2}-[0-9]{1,2}";

        inline std::string to_upper(std::string_view s)
        {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return out;
        }

        inline std::shared_ptr<const re2::RE2> compile_pattern(std::string const & pattern, std::string & error_out)
        {
            re2::RE2::Options options;
            options.set_log_errors(false);

            auto re = std::make_shared<const re2::RE2>(pattern, options);
            if (!re->ok())
            {
                error_out = re->error();
                return nullptr;
            }
            return re;
        }

        // Parses the SQL type into the definition; false if unrecognised.
        inline bool apply_sql_type(tag_definition & def)
        {
            auto upper = to_upper(trim_sv(def.data_type));

            if (upper == "INTEGER")
            {
                def.data_type = "INTEGER";
                def.type = value_type::integer;
                return true;
            }
            if (upper == "FLOAT")
            {
                def.data_type = "FLOAT";
                def.type = value_type::decimal;
                return true;
            }
            if (upper == "TEXT")
            {
                def.data_type = "TEXT";
                def.type = value_type::string;
                return true;
            }
            if (upper == "DATETIME YEAR TO DAY")
            {
                def.data_type = "DATETIME year to day";
                def.type = value_type::date;
                return true;
            }
            if (upper.starts_with("CHAR(") || upper.starts_with("VARCHAR("))
            {
                auto open  = upper.find('(');
                auto close = upper.find(')');
                if (close == std::string::npos || close <= open + 1)
                    return false;

                auto len = as_integer(std::string_view(upper).substr(open + 1, close - open - 1));
                if (!len || *len <= 0)
                    return false;

                def.data_type  = upper.substr(0, close + 1);
                def.type       = value_type::string;
                def.max_length = static_cast<size_t>(*len);
                return true;
            }
            return false;
        }

        inline std::string_view default_pattern(value_type t)
        {
            switch (t)
            {
                case value_type::integer: return INTEGER_PATTERN;
                case value_type::decimal: return FLOAT_PATTERN;
                case value_type::date:    return DATE_PATTERN;
                default:                  return {};
            }
        }

//---------------------------------------------------------------------------
// CSV reading
//---------------------------------------------------------------------------

        using csv_row = std::vector<std::string>;

        // RFC 4180 style: quoted fields may hold separators, doubled quotes
        // and newlines.
        inline std::vector<csv_row> read_csv(std::string_view text, std::string & error_out)
        {
            std::vector<csv_row> rows;
            csv_row current;
            std::string field;
            bool in_quotes = false;
            bool row_has_content = false;
            size_t line = 1;

            for (size_t i = 0; i < text.size(); ++i)
            {
                char c = text[i];

                if (in_quotes)
                {
                    if (c == '"')
                    {
                        if (i + 1 < text.size() && text[i + 1] == '"')
                        {
                            field += '"';
                            ++i;
                        }
                        else
                        {
                            in_quotes = false;
                        }
                    }
                    else
                    {
                        if (c == '\n') ++line;
                        field += c;
                    }
                    continue;
                }

                switch (c)
                {
                    case '"':
                        in_quotes = true;
                        row_has_content = true;
                        break;
                    case ',':
                        current.push_back(std::move(field));
                        field.clear();
                        row_has_content = true;
                        break;
                    case '\r':
                        break;
                    case '\n':
                        ++line;
                        if (row_has_content || !field.empty())
                        {
                            current.push_back(std::move(field));
                            rows.push_back(std::move(current));
                        }
                        field.clear();
                        current.clear();
                        row_has_content = false;
                        break;
                    default:
                        field += c;
                        row_has_content = true;
                        break;
                }
            }

            if (in_quotes)
            {
                error_out = "unclosed quoted field at line " + std::to_string(line);
                return {};
            }

            if (row_has_content || !field.empty())
            {
                current.push_back(std::move(field));
                rows.push_back(std::move(current));
            }
            return rows;
        }

        inline std::optional<size_t> column_of(csv_row const & header, std::string_view name)
        {
            for (size_t i = 0; i < header.size(); ++i)
                if (iequals(trim_sv(header[i]), name))
                    return i;
            return std::nullopt;
        }

        inline std::string field_at(csv_row const & r, std::optional<size_t> col)
        {
            if (!col || *col >= r.size())
                return {};
            return std::string(trim_sv(r[*col]));
        }

        inline bool read_file(std::filesystem::path const & path, std::string & out)
        {
            std::ifstream file(path, std::ios::binary);
            if (!file)
                return false;
            std::ostringstream ss;
            ss << file.rdbuf();
            out = ss.str();
            return true;
        }
    }

//========================================================
// dictionary_schema
//========================================================

    inline tag_definition const * dictionary_schema::lookup(std::string_view tag) const
    {
        std::string key = detail::to_lower(tag);
        if (!key.starts_with('_'))
            key.insert(key.begin(), '_');

        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &defs_[it->second];
    }

    inline std::vector<tag_definition const*> dictionary_schema::tags_in_category(std::string_view category) const
    {
        auto cat = detail::format_category(category);

        std::vector<tag_definition const*> out;
        for (auto i : order_)
            if (detail::iequals(detail::format_category(defs_[i].tag), cat))
                out.push_back(&defs_[i]);
        return out;
    }

    inline status dictionary_schema::add_data_type(std::string name, std::string regex)
    {
        std::string err;
        if (!detail::compile_pattern(regex, err))
            return status::failure(state_error_kind::invalid_name,
                "data type '" + name + "' has an invalid regular expression: " + err);

        data_types_[std::move(name)] = std::move(regex);
        return status::success();
    }

    inline status dictionary_schema::add_tag(tag_definition def)
    {
        if (def.tag.empty())
            return status::failure(state_error_kind::invalid_name, "schema tag without a name");
        if (!def.tag.starts_with('_'))
            def.tag.insert(def.tag.begin(), '_');

        if (!detail::is_qualified(def.tag))
            return status::failure(state_error_kind::invalid_name,
                "schema tag '" + def.tag + "' must be of the form _Category.Tag");

        auto key = detail::to_lower(def.tag);
        if (index_.contains(key))
            return status::failure(state_error_kind::duplicate_tag,
                "tag '" + def.tag + "' is already in the schema");

        if (!detail::apply_sql_type(def))
            return status::failure(state_error_kind::invalid_name,
                "tag '" + def.tag + "' has an invalid data type '" + def.data_type + "'");

        if (def.pattern.empty())
        {
            if (auto it = data_types_.find(def.bmrb_type); !def.bmrb_type.empty() && it != data_types_.end())
                def.pattern = it->second;
            else
                def.pattern = std::string(detail::default_pattern(def.type));
        }

        if (!def.pattern.empty())
        {
            std::string err;
            def.regex = detail::compile_pattern(def.pattern, err);
            if (!def.regex)
                return status::failure(state_error_kind::invalid_name,
                    "tag '" + def.tag + "' has an invalid pattern: " + err);
        }

        if (!def.sort_order)
            def.sort_order = static_cast<double>(order_.size()) * 10.0;

        auto cat = detail::format_category(def.tag);
        if (std::find(category_order_.begin(), category_order_.end(), cat) == category_order_.end())
            category_order_.push_back(cat);

        index_.emplace(std::move(key), defs_.size());
        order_.push_back(defs_.size());
        defs_.push_back(std::move(def));
        return status::success();
    }

//========================================================
// CSV loading
//========================================================

    inline schema_context load_schema_csv(std::string_view schema_csv, std::string_view data_types_csv)
    {
        schema_context ctx;
        std::string err;

        if (!data_types_csv.empty())
        {
            auto type_rows = detail::read_csv(data_types_csv, err);
            if (!err.empty())
            {
                ctx.errors.push_back({ state_error_kind::io_failure, {}, "data types CSV: " + err });
                return ctx;
            }

            for (auto const & r : type_rows)
            {
                if (r.size() < 2 || r[0].empty())
                    continue;
                if (auto s = ctx.result.add_data_type(r[0], r[1]); !s)
                    ctx.warnings.push_back(s.error());
            }
        }

        auto rows = detail::read_csv(schema_csv, err);
        if (!err.empty())
        {
            ctx.errors.push_back({ state_error_kind::io_failure, {}, "schema CSV: " + err });
            return ctx;
        }
        if (rows.empty())
        {
            ctx.errors.push_back({ state_error_kind::io_failure, {}, "schema CSV is empty" });
            return ctx;
        }

        auto const & header = rows.front();
        auto col_tag      = detail::column_of(header, "Tag");
        auto col_nullable = detail::column_of(header, "Nullable");
        auto col_category = detail::column_of(header, "SFCategory");
        auto col_type     = detail::column_of(header, "Data Type");
        auto col_bmrb     = detail::column_of(header, "BMRB data type");
        auto col_loop     = detail::column_of(header, "Loopflag");
        auto col_sequence = detail::column_of(header, "Dictionary sequence");
        auto col_default  = detail::column_of(header, "Default value");
        auto col_entry_id = detail::column_of(header, "entryIdFlg");

        if (!col_tag || !col_nullable || !col_type)
        {
            ctx.errors.push_back({ state_error_kind::not_found, {},
                "schema CSV header lacks one of the 'Tag', 'Nullable' or 'Data Type' columns" });
            return ctx;
        }

        size_t i = 1;
        while (i < rows.size() && (rows[i].empty() || detail::trim_sv(rows[i][0]) != "TBL_BEGIN"))
            ++i;

        if (i == rows.size())
        {
            ctx.errors.push_back({ state_error_kind::not_found, {}, "schema CSV has no TBL_BEGIN marker" });
            return ctx;
        }

        if (rows[i].size() > 3 && !rows[i][3].empty())
            ctx.result.set_version(std::string(detail::trim_sv(rows[i][3])));

        for (++i; i < rows.size(); ++i)
        {
            auto const & r = rows[i];
            if (!r.empty() && detail::trim_sv(r[0]) == "TBL_END")
                break;

            auto tag_name = detail::field_at(r, col_tag);
            if (tag_name.empty())
                continue;

            tag_definition def;
            def.tag         = tag_name;
            def.data_type   = detail::field_at(r, col_type);
            def.bmrb_type   = detail::field_at(r, col_bmrb);
            def.nullable    = detail::field_at(r, col_nullable) != "NOT NULL";
            def.sf_category = detail::field_at(r, col_category);
            def.loop_flag   = detail::iequals(detail::field_at(r, col_loop), "Y");
            def.entry_id_flag = detail::iequals(detail::field_at(r, col_entry_id), "Y");

            if (auto d = detail::field_at(r, col_default); !d.empty())
                def.default_value = d;

            if (auto seq = detail::as_number(detail::field_at(r, col_sequence)))
                def.sort_order = *seq;

            if (auto s = ctx.result.add_tag(std::move(def)); !s)
                ctx.warnings.push_back(s.error());
        }

        return ctx;
    }

    inline schema_context load_schema_file(std::filesystem::path const & schema_path,
                                           std::filesystem::path const & data_types_path)
    {
        std::string schema_text;
        if (!detail::read_file(schema_path, schema_text))
        {
            schema_context ctx;
            ctx.errors.push_back({ state_error_kind::io_failure, {},
                "cannot read schema file '" + schema_path.string() + "'" });
            return ctx;
        }

        std::string types_text;
        if (!data_types_path.empty() && !detail::read_file(data_types_path, types_text))
        {
            schema_context ctx;
            ctx.errors.push_back({ state_error_kind::io_failure, {},
                "cannot read data types file '" + data_types_path.string() + "'" });
            return ctx;
        }

        return load_schema_csv(schema_text, types_text);
    }

//========================================================
// Typed access
//========================================================

    inline std::optional<date> parse_date(std::string_view s)
    {
        auto first = s.find('-');
        if (first == std::string_view::npos)
            return std::nullopt;
        auto second = s.find('-', first + 1);
        if (second == std::string_view::npos)
            return std::nullopt;

        auto y = detail::as_integer(s.substr(0, first));
        auto m = detail::as_integer(s.substr(first + 1, second - first - 1));
        auto d = detail::as_integer(s.substr(second + 1));
        if (!y || !m || !d)
            return std::nullopt;
        if (*y < 1 || *y > 9999 || *m < 1 || *m > 12 || *d < 1)
            return std::nullopt;

        constexpr int month_days[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
        bool leap = (*y % 4 == 0 && *y % 100 != 0) || *y % 400 == 0;
        int last = month_days[*m - 1] + (*m == 2 && leap ? 1 : 0);
        if (*d > last)
            return std::nullopt;

        return date{ static_cast<int>(*y), static_cast<int>(*m), static_cast<int>(*d) };
    }

    inline std::optional<typed_value> convert_value(tag_definition const & def, std::string_view raw)
    {
        if (detail::is_null(raw))
            return typed_value{ std::monostate{} };

        switch (def.type)
        {
            case value_type::integer:
                if (auto v = detail::as_integer(raw))
                    return typed_value{ *v };
                return std::nullopt;

            case value_type::decimal:
                if (auto v = detail::as_number(raw))
                    return typed_value{ *v };
                return std::nullopt;

            case value_type::date:
                if (auto v = parse_date(raw))
                    return typed_value{ *v };
                return std::nullopt;

            default:
                return typed_value{ std::string(raw) };
        }
    }

} // namespace nmrstar

#endif // NMRSTAR_SCHEMA_HPP
