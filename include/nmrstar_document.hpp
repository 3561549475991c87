// nmrstar_document.hpp - NMR-STAR reader/writer - Document Model
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef NMRSTAR_DOCUMENT_HPP
#define NMRSTAR_DOCUMENT_HPP

#include "nmrstar_core.hpp"

#include <map>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <numeric>

namespace nmrstar
{
    using row = std::vector<std::string>;

//========================================================================
// Loop
//========================================================================

    class loop
    {
    public:
        loop() = default;
        explicit loop(std::string_view category) : category_(detail::format_category(category)) {}

        // A copy is detached from any saveframe; a move keeps the owner.
        loop(loop const & other);
        loop(loop && other) noexcept;
        loop & operator=(loop const & other);
        loop & operator=(loop && other) noexcept;

        static loop from_scratch(std::string_view category = {}) { return loop(category); }

        //------------------------------------------------------------------------
        // Read access
        //------------------------------------------------------------------------

        std::string const & category() const noexcept { return category_; }
        std::vector<std::string> const & tags() const noexcept { return tags_; }
        std::vector<row> const & data() const noexcept { return rows_; }

        size_t row_count() const noexcept { return rows_.size(); }
        size_t tag_count() const noexcept { return tags_.size(); }

        std::optional<size_t> line() const noexcept { return line_; }
        void set_line(size_t line) { line_ = line; }

        // Accepts "Tag", "_Cat.Tag" or "Cat.Tag"; the category must match.
        std::optional<size_t> tag_index(std::string_view name) const;

        // Fully qualified tag names, "_Cat.Tag".
        std::vector<std::string> tag_names() const;

        std::optional<std::vector<std::string>> get_tag(std::string_view name) const;
        std::optional<std::vector<row>> get_tags(std::vector<std::string> const & names) const;

        // Zero rows, or every cell a null marker.
        bool empty() const;

        //------------------------------------------------------------------------
        // Mutation; a failed call leaves the loop unchanged
        //------------------------------------------------------------------------

        status set_category(std::string_view category);

        status add_tag(std::string_view name, bool update_data = false);
        status add_tags(std::vector<std::string> const & names, bool update_data = false);
        status remove_tag(std::string_view name);

        status add_row(row values);
        status add_data(std::vector<std::string> const & flat);

        // One value at a time, in tag order. The row joins data() when its
        // last value arrives; until then it is only visible as pending_row().
        status add_data_by_tag(std::string_view tag, std::string value);
        row const & pending_row() const noexcept { return pending_; }

        status remove_row(size_t index);
        status set_value(size_t row_index, std::string_view tag, std::string value);
        void clear_data() { rows_.clear(); pending_.clear(); }

        std::vector<row> remove_data_by_tag_value(std::string_view tag, std::string_view value);

        status sort_rows(std::vector<std::string> const & tags);
        status renumber_rows(std::string_view tag, int64_t start_value = 1, bool maintain_ordering = false);

        // New loop holding only the named columns, in the given order.
        context<loop, state_error> filter(std::vector<std::string> const & names) const;

        // Header line of tag names, then one line per row; fields holding a
        // comma, quote or line break are double-quoted.
        std::string get_data_as_csv(bool header = true, bool show_category = true) const;

        bool operator==(loop const & other) const
        {
            return category_ == other.category_ && tags_ == other.tags_ && rows_ == other.rows_;
        }

    private:
        friend class saveframe;
        friend class editor;

        std::string               category_;
        std::vector<std::string>  tags_;
        std::vector<row>          rows_;
        row                       pending_;
        std::optional<size_t>     line_;
        saveframe*                owner_ = nullptr;

        status check_category_free(std::string_view category) const;
    };

//========================================================================
// Saveframe
//========================================================================

    struct tag
    {
        std::string name;       // without prefix
        std::string value;
        std::optional<size_t> line;

        bool operator==(tag const & other) const
        {
            return name == other.name && value == other.value;
        }
    };

    class saveframe
    {
    public:
        saveframe() = default;

        // A copy is detached from any entry; a move keeps the owner.
        saveframe(saveframe const & other);
        saveframe(saveframe && other) noexcept;
        saveframe & operator=(saveframe const & other);
        saveframe & operator=(saveframe && other) noexcept;

        static context<saveframe, state_error> from_scratch(std::string_view name, std::string_view tag_prefix = {});

        //------------------------------------------------------------------------
        // Name and prefix
        //------------------------------------------------------------------------

        std::string const & name() const noexcept { return name_; }

        // Keeps a Sf_framecode tag in step.
        status set_name(std::string_view name);

        std::string const & tag_prefix() const noexcept { return tag_prefix_; }
        status set_tag_prefix(std::string_view prefix);

        // Value of the Sf_category tag.
        std::optional<std::string> category() const;

        //------------------------------------------------------------------------
        // Tags
        //------------------------------------------------------------------------

        std::vector<tag> const & tags() const noexcept { return tags_; }

        status add_tag(std::string_view name, std::string value, bool update = false,
                       std::optional<size_t> line = std::nullopt);
        status add_tags(std::vector<std::pair<std::string, std::string>> const & tags, bool update = false);
        status remove_tag(std::string_view name);

        tag const * find_tag(std::string_view name) const;
        std::optional<std::string> tag_value(std::string_view name) const;

        // Own tag value, or a loop column when the tag names a loop category.
        std::vector<std::string> get_tag(std::string_view name) const;

        // Tag names on the header line, their values on the next.
        std::string get_data_as_csv(bool header = true, bool show_category = true) const;

        //------------------------------------------------------------------------
        // Loops
        //------------------------------------------------------------------------

        std::vector<loop> const & loops() const noexcept { return loops_; }

        status add_loop(loop l);
        status remove_loop(std::string_view category);

        loop * get_loop(std::string_view category);
        loop const * get_loop(std::string_view category) const;

        //------------------------------------------------------------------------
        // Comments and source position
        //------------------------------------------------------------------------

        std::vector<std::string> const & comments() const noexcept { return comments_; }
        void set_comments(std::vector<std::string> comments) { comments_ = std::move(comments); }

        std::optional<size_t> line() const noexcept { return line_; }
        void set_line(size_t line) { line_ = line; }

        // Every tag null and every loop empty.
        bool empty() const;

        bool operator==(saveframe const & other) const
        {
            return name_ == other.name_ && tag_prefix_ == other.tag_prefix_ &&
                   tags_ == other.tags_ && loops_ == other.loops_;
        }

    private:
        friend class loop;
        friend class entry;
        friend class editor;

        std::string               name_;
        std::string               tag_prefix_;
        std::vector<tag>          tags_;
        std::vector<loop>         loops_;
        std::vector<std::string>  comments_;
        std::optional<size_t>     line_;
        entry*                    owner_ = nullptr;

        void adopt_loops() noexcept { for (auto & l : loops_) l.owner_ = this; }
        status check_name(std::string_view name) const;
        std::vector<tag>::iterator locate_tag(std::string_view name);
    };

//========================================================================
// Entry
//========================================================================

    class entry
    {
    public:
        entry() = default;
        explicit entry(std::string entry_id) : entry_id_(std::move(entry_id)) {}

        entry(entry const & other);
        entry(entry && other) noexcept;
        entry & operator=(entry const & other);
        entry & operator=(entry && other) noexcept;

        static entry from_scratch(std::string_view entry_id) { return entry(std::string(entry_id)); }

        std::string const & entry_id() const noexcept { return entry_id_; }

        // Only the id; see editor::set_entry_id for the tag rewrite.
        status set_entry_id(std::string_view id);

        //------------------------------------------------------------------------
        // Saveframes
        //------------------------------------------------------------------------

        std::vector<saveframe> const & saveframes() const noexcept { return saveframes_; }
        size_t size() const noexcept { return saveframes_.size(); }

        status add_saveframe(saveframe sf);
        status remove_saveframe(std::string_view name);

        saveframe * get_saveframe_by_name(std::string_view name);
        saveframe const * get_saveframe_by_name(std::string_view name) const;

        std::vector<saveframe const*> get_saveframes_by_category(std::string_view category) const;
        std::vector<saveframe*> get_saveframes_by_category(std::string_view category);
        std::vector<saveframe const*> get_saveframes_by_tag_and_value(std::string_view tag, std::string_view value) const;
        std::vector<loop const*> get_loops_by_category(std::string_view category) const;

        //------------------------------------------------------------------------
        // Tag queries across the whole entry
        //------------------------------------------------------------------------

        std::vector<std::string> get_tag(std::string_view full_tag) const;
        std::map<std::string, std::vector<std::string>> get_tags(std::vector<std::string> const & tags) const;

        // Distinct Sf_category values in saveframe order.
        std::vector<std::string> category_list() const;

        bool empty() const;

        bool operator==(entry const & other) const
        {
            return entry_id_ == other.entry_id_ && saveframes_ == other.saveframes_;
        }

    private:
        friend class saveframe;
        friend class editor;

        std::string            entry_id_;
        std::vector<saveframe> saveframes_;

        void adopt_saveframes() noexcept { for (auto & sf : saveframes_) sf.owner_ = this; }
        bool name_taken(std::string_view name, saveframe const * except) const;
    };

//================================================================================================================
//
// Implementations
//
//================================================================================================================

    namespace detail
    {
        inline status check_value(std::string_view value)
        {
            if (value.empty())
                return status::failure(state_error_kind::empty_value,
                    "empty string is not a valid value; use '.' or '?'");
            return status::success();
        }

        inline status check_tag_part(std::string_view name)
        {
            if (name.empty() || contains_whitespace(name))
                return status::failure(state_error_kind::invalid_name,
                    "invalid tag name '" + std::string(name) + "'");
            return status::success();
        }

        inline std::optional<double> as_number(std::string_view s)
        {
            if (s.empty())
                return std::nullopt;
            std::string tmp(s);
            char* end = nullptr;
            double v = std::strtod(tmp.c_str(), &end);
            if (end != tmp.c_str() + tmp.size() || !std::isfinite(v))
                return std::nullopt;
            return v;
        }

        inline std::optional<int64_t> as_integer(std::string_view s)
        {
            if (s.empty())
                return std::nullopt;
            std::string tmp(s);
            char* end = nullptr;
            errno = 0;
            long long v = std::strtoll(tmp.c_str(), &end, 10);
            if (end != tmp.c_str() + tmp.size() || errno == ERANGE)
                return std::nullopt;
            return static_cast<int64_t>(v);
        }
    }

//========================================================
// loop
//========================================================

    inline loop::loop(loop const & other)
        : category_(other.category_), tags_(other.tags_), rows_(other.rows_),
          pending_(other.pending_), line_(other.line_)
    {}

    inline loop::loop(loop && other) noexcept
        : category_(std::move(other.category_)), tags_(std::move(other.tags_)),
          rows_(std::move(other.rows_)), pending_(std::move(other.pending_)),
          line_(other.line_), owner_(other.owner_)
    {}

    // An owned loop refuses a category held by a sibling and stays unchanged.
    inline loop & loop::operator=(loop const & other)
    {
        if (this != &other)
        {
            if (!check_category_free(other.category_))
                return *this;

            category_ = other.category_;
            tags_     = other.tags_;
            rows_     = other.rows_;
            pending_  = other.pending_;
            line_     = other.line_;
        }
        return *this;
    }

    inline loop & loop::operator=(loop && other) noexcept
    {
        // moves within one saveframe only reorder its loops
        if (other.owner_ != owner_ && !check_category_free(other.category_))
            return *this;

        category_ = std::move(other.category_);
        tags_     = std::move(other.tags_);
        rows_     = std::move(other.rows_);
        pending_  = std::move(other.pending_);
        line_     = other.line_;
        return *this;
    }

//---------------------------------------------------------------------------

    inline std::optional<size_t> loop::tag_index(std::string_view name) const
    {
        if (detail::is_qualified(name) &&
            !detail::iequals(detail::format_category(name), category_))
            return std::nullopt;

        auto bare = detail::format_tag(name);
        for (size_t i = 0; i < tags_.size(); ++i)
            if (detail::iequals(tags_[i], bare))
                return i;
        return std::nullopt;
    }

    inline std::vector<std::string> loop::tag_names() const
    {
        std::vector<std::string> out;
        out.reserve(tags_.size());
        for (auto const & t : tags_)
            out.push_back(detail::qualify(category_, t));
        return out;
    }

    inline std::optional<std::vector<std::string>> loop::get_tag(std::string_view name) const
    {
        auto idx = tag_index(name);
        if (!idx)
            return std::nullopt;

        std::vector<std::string> out;
        out.reserve(rows_.size());
        for (auto const & r : rows_)
            out.push_back(r[*idx]);
        return out;
    }

    inline std::optional<std::vector<row>> loop::get_tags(std::vector<std::string> const & names) const
    {
        std::vector<size_t> cols;
        for (auto const & n : names)
        {
            auto idx = tag_index(n);
            if (!idx)
                return std::nullopt;
            cols.push_back(*idx);
        }

        std::vector<row> out;
        out.reserve(rows_.size());
        for (auto const & r : rows_)
        {
            row picked;
            for (auto c : cols)
                picked.push_back(r[c]);
            out.push_back(std::move(picked));
        }
        return out;
    }

    inline bool loop::empty() const
    {
        for (auto const & r : rows_)
            for (auto const & v : r)
                if (!detail::is_null(v))
                    return false;
        return true;
    }

//---------------------------------------------------------------------------

    inline status loop::check_category_free(std::string_view category) const
    {
        if (!owner_)
            return status::success();

        for (auto const & other : owner_->loops_)
        {
            if (&other != this && detail::iequals(other.category_, category))
                return status::failure(state_error_kind::duplicate_category,
                    "saveframe '" + owner_->name_ + "' already has a loop of category '_" + std::string(category) + "'");
        }
        return status::success();
    }

    inline status loop::set_category(std::string_view category)
    {
        auto formatted = detail::format_category(category);
        if (formatted.empty() || detail::contains_whitespace(formatted))
            return status::failure(state_error_kind::invalid_name,
                "invalid loop category '" + std::string(category) + "'");

        if (auto s = check_category_free(formatted); !s)
            return s;

        category_ = std::move(formatted);
        return status::success();
    }

    inline status loop::add_tag(std::string_view name, bool update_data)
    {
        std::string new_category = category_;

        if (detail::is_qualified(name))
        {
            auto cat = detail::format_category(name);
            if (category_.empty())
            {
                if (cat.empty() || detail::contains_whitespace(cat))
                    return status::failure(state_error_kind::invalid_name,
                        "invalid tag category in '" + std::string(name) + "'");
                if (auto s = check_category_free(cat); !s)
                    return s;
                new_category = cat;
            }
            else if (!detail::iequals(cat, category_))
            {
                return status::failure(state_error_kind::category_mismatch,
                    "tag '" + std::string(name) + "' does not belong to loop category '_" + category_ + "'");
            }
        }

        auto bare = detail::format_tag(name);
        if (auto s = detail::check_tag_part(bare); !s)
            return s;

        for (auto const & t : tags_)
        {
            if (detail::iequals(t, bare))
                return status::failure(state_error_kind::duplicate_tag,
                    "duplicate tag '" + detail::qualify(new_category, bare) + "' in loop");
        }

        if (!rows_.empty() && !update_data)
            return status::failure(state_error_kind::row_length_mismatch,
                "cannot add tag '" + bare + "' to a loop with data unless its rows are extended");
        if (!pending_.empty())
            return status::failure(state_error_kind::row_length_mismatch,
                "cannot add tag '" + bare + "' while a row of loop '_" + category_ + "' is incomplete");

        category_ = std::move(new_category);
        tags_.push_back(std::move(bare));
        for (auto & r : rows_)
            r.emplace_back(detail::NULL_DEFINITE);

        return status::success();
    }

    inline status loop::add_tags(std::vector<std::string> const & names, bool update_data)
    {
        auto saved_category = category_;
        auto saved_tags     = tags_;
        auto saved_rows     = rows_;

        for (auto const & n : names)
        {
            if (auto s = add_tag(n, update_data); !s)
            {
                category_ = std::move(saved_category);
                tags_     = std::move(saved_tags);
                rows_     = std::move(saved_rows);
                return s;
            }
        }
        return status::success();
    }

    inline status loop::remove_tag(std::string_view name)
    {
        auto idx = tag_index(name);
        if (!idx)
            return status::failure(state_error_kind::not_found,
                "no tag '" + std::string(name) + "' in loop '_" + category_ + "'");
        if (!pending_.empty())
            return status::failure(state_error_kind::row_length_mismatch,
                "cannot remove tag '" + std::string(name) + "' while a row of loop '_" + category_ + "' is incomplete");

        tags_.erase(tags_.begin() + static_cast<std::ptrdiff_t>(*idx));
        for (auto & r : rows_)
            r.erase(r.begin() + static_cast<std::ptrdiff_t>(*idx));
        return status::success();
    }

//---------------------------------------------------------------------------

    inline status loop::add_row(row values)
    {
        if (tags_.empty())
            return status::failure(state_error_kind::no_tags,
                "cannot add data to loop '_" + category_ + "' before it has tags");

        if (values.size() != tags_.size())
            return status::failure(state_error_kind::row_length_mismatch,
                "row has " + std::to_string(values.size()) + " values but loop '_" + category_ +
                "' has " + std::to_string(tags_.size()) + " tags");

        for (auto const & v : values)
            if (auto s = detail::check_value(v); !s)
                return s;

        rows_.push_back(std::move(values));
        return status::success();
    }

    inline status loop::add_data(std::vector<std::string> const & flat)
    {
        if (tags_.empty())
            return status::failure(state_error_kind::no_tags,
                "cannot add data to loop '_" + category_ + "' before it has tags");

        size_t width = tags_.size();
        if (flat.size() % width != 0)
            return status::failure(state_error_kind::row_length_mismatch,
                std::to_string(flat.size()) + " values do not fill whole rows of " +
                std::to_string(width) + " tags in loop '_" + category_ + "'");

        for (auto const & v : flat)
            if (auto s = detail::check_value(v); !s)
                return s;

        for (size_t i = 0; i < flat.size(); i += width)
            rows_.emplace_back(flat.begin() + static_cast<std::ptrdiff_t>(i),
                               flat.begin() + static_cast<std::ptrdiff_t>(i + width));
        return status::success();
    }

    inline status loop::add_data_by_tag(std::string_view tag, std::string value)
    {
        if (detail::is_qualified(tag) && !detail::iequals(detail::format_category(tag), category_))
            return status::failure(state_error_kind::category_mismatch,
                "tag '" + std::string(tag) + "' does not belong to loop category '_" + category_ + "'");

        auto col = tag_index(tag);
        if (!col)
            return status::failure(state_error_kind::not_found,
                "no tag '" + std::string(tag) + "' in loop '_" + category_ + "'; add the tag before its data");
        if (*col != pending_.size())
            return status::failure(state_error_kind::row_length_mismatch,
                "value for '" + std::string(tag) + "' given out of tag order; expected '" +
                detail::qualify(category_, tags_[pending_.size()]) + "'");
        if (auto s = detail::check_value(value); !s)
            return s;

        pending_.push_back(std::move(value));
        if (pending_.size() == tags_.size())
        {
            rows_.push_back(std::move(pending_));
            pending_.clear();
        }
        return status::success();
    }

    inline status loop::remove_row(size_t index)
    {
        if (index >= rows_.size())
            return status::failure(state_error_kind::not_found,
                "row " + std::to_string(index) + " out of range in loop '_" + category_ + "'");

        rows_.erase(rows_.begin() + static_cast<std::ptrdiff_t>(index));
        return status::success();
    }

    inline status loop::set_value(size_t row_index, std::string_view tag, std::string value)
    {
        auto col = tag_index(tag);
        if (!col)
            return status::failure(state_error_kind::not_found,
                "no tag '" + std::string(tag) + "' in loop '_" + category_ + "'");
        if (row_index >= rows_.size())
            return status::failure(state_error_kind::not_found,
                "row " + std::to_string(row_index) + " out of range in loop '_" + category_ + "'");
        if (auto s = detail::check_value(value); !s)
            return s;

        rows_[row_index][*col] = std::move(value);
        return status::success();
    }

    inline std::vector<row> loop::remove_data_by_tag_value(std::string_view tag, std::string_view value)
    {
        std::vector<row> removed;
        auto col = tag_index(tag);
        if (!col)
            return removed;

        std::vector<row> kept;
        for (auto & r : rows_)
        {
            if (r[*col] == value)
                removed.push_back(std::move(r));
            else
                kept.push_back(std::move(r));
        }
        rows_ = std::move(kept);
        return removed;
    }

//---------------------------------------------------------------------------

    // Tags are in increasing order of priority: the last one is the primary key.
    inline status loop::sort_rows(std::vector<std::string> const & tags)
    {
        std::vector<size_t> cols;
        for (auto const & t : tags)
        {
            auto idx = tag_index(t);
            if (!idx)
                return status::failure(state_error_kind::not_found,
                    "cannot sort by '" + t + "': not a tag of loop '_" + category_ + "'");
            cols.push_back(*idx);
        }

        for (auto col : cols)
        {
            bool numeric = std::all_of(rows_.begin(), rows_.end(),
                [col](row const & r) { return detail::as_number(r[col]).has_value(); });

            if (numeric)
            {
                std::stable_sort(rows_.begin(), rows_.end(), [col](row const & a, row const & b)
                {
                    return *detail::as_number(a[col]) < *detail::as_number(b[col]);
                });
            }
            else
            {
                std::stable_sort(rows_.begin(), rows_.end(), [col](row const & a, row const & b)
                {
                    return a[col] < b[col];
                });
            }
        }
        return status::success();
    }

    inline status loop::renumber_rows(std::string_view tag, int64_t start_value, bool maintain_ordering)
    {
        auto col = tag_index(tag);
        if (!col)
            return status::failure(state_error_kind::not_found,
                "cannot renumber '" + std::string(tag) + "': not a tag of loop '_" + category_ + "'");

        if (rows_.empty())
            return status::success();

        if (!maintain_ordering)
        {
            for (size_t i = 0; i < rows_.size(); ++i)
                rows_[i][*col] = std::to_string(start_value + static_cast<int64_t>(i));
            return status::success();
        }

        // 2,3,3,5 -> 1,2,2,4
        std::vector<int64_t> current;
        for (auto const & r : rows_)
        {
            auto v = detail::as_integer(r[*col]);
            if (!v)
                return status::failure(state_error_kind::not_numeric,
                    "cannot renumber non-integer value '" + r[*col] + "' while maintaining ordering");
            current.push_back(*v);
        }

        int64_t offset = start_value - current.front();
        for (size_t i = 0; i < rows_.size(); ++i)
            rows_[i][*col] = std::to_string(current[i] + offset);
        return status::success();
    }

    namespace detail
    {
        inline std::string csv_field(std::string_view v)
        {
            if (v.find_first_of(",\"\r\n") == std::string_view::npos)
                return std::string(v);

            std::string out = "\"";
            for (char c : v)
            {
                if (c == '"')
                    out += '"';
                out += c;
            }
            out += '"';
            return out;
        }

        inline void csv_line(std::string & out, std::vector<std::string> const & fields)
        {
            for (size_t i = 0; i < fields.size(); ++i)
            {
                if (i > 0)
                    out += ',';
                out += csv_field(fields[i]);
            }
            out += '\n';
        }
    }

    inline std::string loop::get_data_as_csv(bool header, bool show_category) const
    {
        std::string out;
        if (header)
            detail::csv_line(out, show_category ? tag_names() : tags_);
        for (auto const & r : rows_)
            detail::csv_line(out, r);
        return out;
    }

    inline context<loop, state_error> loop::filter(std::vector<std::string> const & names) const
    {
        context<loop, state_error> ctx;
        ctx.result = loop(category_);

        std::vector<size_t> cols;
        for (auto const & n : names)
        {
            auto idx = tag_index(n);
            if (!idx)
            {
                ctx.errors.push_back({ state_error_kind::not_found, {},
                    "no tag '" + n + "' in loop '_" + category_ + "'" });
                continue;
            }
            if (std::find(cols.begin(), cols.end(), *idx) != cols.end())
                continue;
            cols.push_back(*idx);
            ctx.result.tags_.push_back(tags_[*idx]);
        }

        for (auto const & r : rows_)
        {
            row picked;
            picked.reserve(cols.size());
            for (auto c : cols)
                picked.push_back(r[c]);
            ctx.result.rows_.push_back(std::move(picked));
        }
        return ctx;
    }

//========================================================
// saveframe
//========================================================

    inline saveframe::saveframe(saveframe const & other)
        : name_(other.name_), tag_prefix_(other.tag_prefix_), tags_(other.tags_),
          loops_(other.loops_), comments_(other.comments_), line_(other.line_)
    {
        adopt_loops();
    }

    inline saveframe::saveframe(saveframe && other) noexcept
        : name_(std::move(other.name_)), tag_prefix_(std::move(other.tag_prefix_)),
          tags_(std::move(other.tags_)), loops_(std::move(other.loops_)),
          comments_(std::move(other.comments_)), line_(other.line_), owner_(other.owner_)
    {
        adopt_loops();
    }

    // An owned saveframe refuses a name held by a sibling and stays unchanged.
    inline saveframe & saveframe::operator=(saveframe const & other)
    {
        if (this != &other)
        {
            if (owner_ && owner_->name_taken(other.name_, this))
                return *this;

            std::vector<loop> loops(other.loops_);
            name_       = other.name_;
            tag_prefix_ = other.tag_prefix_;
            tags_       = other.tags_;
            loops_      = std::move(loops);
            comments_   = other.comments_;
            line_       = other.line_;
            adopt_loops();
        }
        return *this;
    }

    inline saveframe & saveframe::operator=(saveframe && other) noexcept
    {
        if (owner_ && other.owner_ != owner_ && owner_->name_taken(other.name_, this))
            return *this;

        name_       = std::move(other.name_);
        tag_prefix_ = std::move(other.tag_prefix_);
        tags_       = std::move(other.tags_);
        loops_      = std::move(other.loops_);
        comments_   = std::move(other.comments_);
        line_       = other.line_;
        adopt_loops();
        return *this;
    }

    inline context<saveframe, state_error> saveframe::from_scratch(std::string_view name, std::string_view tag_prefix)
    {
        context<saveframe, state_error> ctx;

        if (auto s = ctx.result.set_name(name); !s)
            ctx.errors.push_back(s.error());

        if (!tag_prefix.empty())
            if (auto s = ctx.result.set_tag_prefix(tag_prefix); !s)
                ctx.errors.push_back(s.error());

        return ctx;
    }

//---------------------------------------------------------------------------

    inline status saveframe::check_name(std::string_view name) const
    {
        if (name.empty() || detail::contains_whitespace(name))
            return status::failure(state_error_kind::invalid_name,
                "invalid saveframe name '" + std::string(name) + "': must be non-empty without whitespace");

        if (owner_ && owner_->name_taken(name, this))
            return status::failure(state_error_kind::duplicate_name,
                "a saveframe named '" + std::string(name) + "' already exists in entry '" + owner_->entry_id_ + "'");

        return status::success();
    }

    inline status saveframe::set_name(std::string_view name)
    {
        if (auto s = check_name(name); !s)
            return s;

        name_ = std::string(name);
        if (auto it = locate_tag("Sf_framecode"); it != tags_.end())
            it->value = name_;
        return status::success();
    }

    inline status saveframe::set_tag_prefix(std::string_view prefix)
    {
        auto formatted = detail::format_category(prefix);
        if (formatted.empty() || detail::contains_whitespace(formatted))
            return status::failure(state_error_kind::invalid_name,
                "invalid tag prefix '" + std::string(prefix) + "'");

        tag_prefix_ = std::move(formatted);
        return status::success();
    }

    inline std::optional<std::string> saveframe::category() const
    {
        auto v = tag_value("Sf_category");
        if (!v || detail::is_null(*v))
            return std::nullopt;
        return v;
    }

//---------------------------------------------------------------------------

    inline std::vector<tag>::iterator saveframe::locate_tag(std::string_view name)
    {
        auto bare = detail::format_tag(name);
        return std::find_if(tags_.begin(), tags_.end(),
            [&](tag const & t) { return detail::iequals(t.name, bare); });
    }

    inline tag const * saveframe::find_tag(std::string_view name) const
    {
        if (detail::is_qualified(name) && !detail::iequals(detail::format_category(name), tag_prefix_))
            return nullptr;

        auto bare = detail::format_tag(name);
        for (auto const & t : tags_)
            if (detail::iequals(t.name, bare))
                return &t;
        return nullptr;
    }

    inline std::optional<std::string> saveframe::tag_value(std::string_view name) const
    {
        if (auto t = find_tag(name))
            return t->value;
        return std::nullopt;
    }

    inline std::vector<std::string> saveframe::get_tag(std::string_view name) const
    {
        if (auto t = find_tag(name))
            return { t->value };

        if (detail::is_qualified(name))
        {
            if (auto l = get_loop(detail::format_category(name)))
                if (auto col = l->get_tag(name))
                    return *col;
        }
        return {};
    }

    inline std::string saveframe::get_data_as_csv(bool header, bool show_category) const
    {
        std::vector<std::string> names;
        std::vector<std::string> values;
        for (auto const & t : tags_)
        {
            names.push_back(show_category ? detail::qualify(tag_prefix_, t.name) : t.name);
            values.push_back(t.value);
        }

        std::string out;
        if (header)
            detail::csv_line(out, names);
        detail::csv_line(out, values);
        return out;
    }

    inline status saveframe::add_tag(std::string_view name, std::string value, bool update, std::optional<size_t> line)
    {
        std::string new_prefix = tag_prefix_;

        if (detail::is_qualified(name))
        {
            auto prefix = detail::format_category(name);
            if (tag_prefix_.empty())
            {
                if (prefix.empty() || detail::contains_whitespace(prefix))
                    return status::failure(state_error_kind::invalid_name,
                        "invalid tag prefix in '" + std::string(name) + "'");
                new_prefix = prefix;
            }
            else if (!detail::iequals(prefix, tag_prefix_))
            {
                return status::failure(state_error_kind::category_mismatch,
                    "tag '" + std::string(name) + "' does not match saveframe prefix '_" + tag_prefix_ + "'");
            }
        }

        auto bare = detail::format_tag(name);
        if (auto s = detail::check_tag_part(bare); !s)
            return s;
        if (auto s = detail::check_value(value); !s)
            return s;

        auto it = locate_tag(bare);
        if (it != tags_.end() && !update)
            return status::failure(state_error_kind::duplicate_tag,
                "duplicate tag '" + detail::qualify(new_prefix, bare) + "' in saveframe '" + name_ + "'");

        bool framecode = detail::iequals(bare, "Sf_framecode") && !detail::is_null(value);
        if (framecode && value != name_)
        {
            if (auto s = check_name(value); !s)
                return s;
        }

        tag_prefix_ = std::move(new_prefix);
        if (framecode)
            name_ = value;

        if (it != tags_.end())
        {
            it->value = std::move(value);
            if (line)
                it->line = line;
        }
        else
        {
            tags_.push_back(tag{ std::move(bare), std::move(value), line });
        }
        return status::success();
    }

    inline status saveframe::add_tags(std::vector<std::pair<std::string, std::string>> const & tags, bool update)
    {
        auto saved_name   = name_;
        auto saved_prefix = tag_prefix_;
        auto saved_tags   = tags_;

        for (auto const & [n, v] : tags)
        {
            if (auto s = add_tag(n, v, update); !s)
            {
                name_       = std::move(saved_name);
                tag_prefix_ = std::move(saved_prefix);
                tags_       = std::move(saved_tags);
                return s;
            }
        }
        return status::success();
    }

    inline status saveframe::remove_tag(std::string_view name)
    {
        if (!find_tag(name))
            return status::failure(state_error_kind::not_found,
                "no tag '" + std::string(name) + "' in saveframe '" + name_ + "'");

        tags_.erase(locate_tag(name));
        return status::success();
    }

//---------------------------------------------------------------------------

    inline status saveframe::add_loop(loop l)
    {
        if (l.category_.empty())
            return status::failure(state_error_kind::invalid_name,
                "cannot add a loop without a category to saveframe '" + name_ + "'");

        if (get_loop(l.category_))
            return status::failure(state_error_kind::duplicate_category,
                "saveframe '" + name_ + "' already has a loop of category '_" + l.category_ + "'");

        loops_.push_back(std::move(l));
        adopt_loops();
        return status::success();
    }

    inline status saveframe::remove_loop(std::string_view category)
    {
        auto cat = detail::format_category(category);
        auto it = std::find_if(loops_.begin(), loops_.end(),
            [&](loop const & l) { return detail::iequals(l.category_, cat); });

        if (it == loops_.end())
            return status::failure(state_error_kind::not_found,
                "no loop of category '_" + cat + "' in saveframe '" + name_ + "'");

        loops_.erase(it);
        adopt_loops();
        return status::success();
    }

    inline loop * saveframe::get_loop(std::string_view category)
    {
        auto cat = detail::format_category(category);
        for (auto & l : loops_)
            if (detail::iequals(l.category_, cat))
                return &l;
        return nullptr;
    }

    inline loop const * saveframe::get_loop(std::string_view category) const
    {
        auto cat = detail::format_category(category);
        for (auto const & l : loops_)
            if (detail::iequals(l.category_, cat))
                return &l;
        return nullptr;
    }

    inline bool saveframe::empty() const
    {
        for (auto const & t : tags_)
            if (!detail::is_null(t.value))
                return false;
        for (auto const & l : loops_)
            if (!l.empty())
                return false;
        return true;
    }

//========================================================
// entry
//========================================================

    inline entry::entry(entry const & other)
        : entry_id_(other.entry_id_), saveframes_(other.saveframes_)
    {
        adopt_saveframes();
    }

    inline entry::entry(entry && other) noexcept
        : entry_id_(std::move(other.entry_id_)), saveframes_(std::move(other.saveframes_))
    {
        adopt_saveframes();
    }

    inline entry & entry::operator=(entry const & other)
    {
        if (this != &other)
        {
            entry_id_   = other.entry_id_;
            std::vector<saveframe> frames(other.saveframes_);
            saveframes_ = std::move(frames);
            adopt_saveframes();
        }
        return *this;
    }

    inline entry & entry::operator=(entry && other) noexcept
    {
        entry_id_   = std::move(other.entry_id_);
        saveframes_ = std::move(other.saveframes_);
        adopt_saveframes();
        return *this;
    }

    inline status entry::set_entry_id(std::string_view id)
    {
        if (id.empty() || detail::contains_whitespace(id))
            return status::failure(state_error_kind::invalid_name,
                "invalid entry id '" + std::string(id) + "'");

        entry_id_ = std::string(id);
        return status::success();
    }

//---------------------------------------------------------------------------

    inline bool entry::name_taken(std::string_view name, saveframe const * except) const
    {
        for (auto const & sf : saveframes_)
            if (&sf != except && detail::iequals(sf.name_, name))
                return true;
        return false;
    }

    inline status entry::add_saveframe(saveframe sf)
    {
        if (sf.name_.empty() || detail::contains_whitespace(sf.name_))
            return status::failure(state_error_kind::invalid_name,
                "invalid saveframe name '" + sf.name_ + "'");

        if (name_taken(sf.name_, nullptr))
            return status::failure(state_error_kind::duplicate_name,
                "a saveframe named '" + sf.name_ + "' already exists in entry '" + entry_id_ + "'");

        saveframes_.push_back(std::move(sf));
        adopt_saveframes();
        return status::success();
    }

    inline status entry::remove_saveframe(std::string_view name)
    {
        auto it = std::find_if(saveframes_.begin(), saveframes_.end(),
            [&](saveframe const & sf) { return detail::iequals(sf.name_, name); });

        if (it == saveframes_.end())
            return status::failure(state_error_kind::not_found,
                "no saveframe named '" + std::string(name) + "' in entry '" + entry_id_ + "'");

        saveframes_.erase(it);
        adopt_saveframes();
        return status::success();
    }

    inline saveframe * entry::get_saveframe_by_name(std::string_view name)
    {
        for (auto & sf : saveframes_)
            if (detail::iequals(sf.name_, name))
                return &sf;
        return nullptr;
    }

    inline saveframe const * entry::get_saveframe_by_name(std::string_view name) const
    {
        for (auto const & sf : saveframes_)
            if (detail::iequals(sf.name_, name))
                return &sf;
        return nullptr;
    }

    inline std::vector<saveframe const*> entry::get_saveframes_by_category(std::string_view category) const
    {
        std::vector<saveframe const*> out;
        for (auto const & sf : saveframes_)
            if (auto c = sf.category(); c && *c == category)
                out.push_back(&sf);
        return out;
    }

    inline std::vector<saveframe*> entry::get_saveframes_by_category(std::string_view category)
    {
        std::vector<saveframe*> out;
        for (auto & sf : saveframes_)
            if (auto c = sf.category(); c && *c == category)
                out.push_back(&sf);
        return out;
    }

    inline std::vector<saveframe const*> entry::get_saveframes_by_tag_and_value(std::string_view tag, std::string_view value) const
    {
        std::vector<saveframe const*> out;
        for (auto const & sf : saveframes_)
            if (auto v = sf.tag_value(tag); v && *v == value)
                out.push_back(&sf);
        return out;
    }

    inline std::vector<loop const*> entry::get_loops_by_category(std::string_view category) const
    {
        std::vector<loop const*> out;
        for (auto const & sf : saveframes_)
            if (auto l = sf.get_loop(category))
                out.push_back(l);
        return out;
    }

//---------------------------------------------------------------------------

    inline std::vector<std::string> entry::get_tag(std::string_view full_tag) const
    {
        std::vector<std::string> out;
        if (!detail::is_qualified(full_tag))
            return out;

        for (auto const & sf : saveframes_)
        {
            auto values = sf.get_tag(full_tag);
            out.insert(out.end(), values.begin(), values.end());
        }
        return out;
    }

    inline std::map<std::string, std::vector<std::string>> entry::get_tags(std::vector<std::string> const & tags) const
    {
        std::map<std::string, std::vector<std::string>> out;
        for (auto const & t : tags)
            out[t] = get_tag(t);
        return out;
    }

    inline std::vector<std::string> entry::category_list() const
    {
        std::vector<std::string> out;
        for (auto const & sf : saveframes_)
        {
            auto c = sf.category();
            if (c && std::find(out.begin(), out.end(), *c) == out.end())
                out.push_back(*c);
        }
        return out;
    }

    inline bool entry::empty() const
    {
        return std::all_of(saveframes_.begin(), saveframes_.end(),
                           [](saveframe const & sf) { return sf.empty(); });
    }

} // namespace nmrstar

#endif // NMRSTAR_DOCUMENT_HPP
