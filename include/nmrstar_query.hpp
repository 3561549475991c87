// nmrstar_query.hpp - NMR-STAR reader/writer - Query Interface
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef NMRSTAR_QUERY_HPP
#define NMRSTAR_QUERY_HPP

#include "nmrstar_document.hpp"

#include <iterator>

namespace nmrstar
{
    //========================================================================
    // FORWARD DECLARATIONS
    //========================================================================

    class loop_view;
    class row_view;

    //========================================================================
    // LOOP ROW VIEW
    //========================================================================

    // Non-owning; valid while the viewed loop is neither moved nor mutated.
    class row_view
    {
    public:
        row_view(loop const * l, size_t index)
            : loop_(l), index_(index) {}

        // Index-based access
        std::string const & operator[](size_t column) const { return raw()[column]; }

        // Name-based access; "Tag" or "_Cat.Tag"
        std::optional<std::string_view> get(std::string_view tag) const;

        // Convenience typed getters; nullopt for an unknown tag, a null
        // marker, or text that does not convert
        std::optional<int64_t> get_int(std::string_view tag) const;
        std::optional<double> get_float(std::string_view tag) const;

        // True only for a known tag holding '.' or '?'
        bool is_null(std::string_view tag) const;

        size_t index() const noexcept { return index_; }
        row const & raw() const { return loop_->data()[index_]; }

    private:
        loop const * loop_;
        size_t       index_;
    };

    //========================================================================
    // LOOP VIEW
    //========================================================================

    class loop_view
    {
    public:
        // Iterator for row traversal in loop order
        class iterator
        {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type        = row_view;
            using difference_type   = std::ptrdiff_t;
            using pointer           = void;
            using reference         = row_view;

            iterator(loop const * l, size_t index) : loop_(l), index_(index) {}

            row_view operator*() const { return row_view(loop_, index_); }
            iterator & operator++() { ++index_; return *this; }
            iterator operator++(int) { auto tmp = *this; ++index_; return tmp; }
            bool operator==(iterator const & other) const
            {
                return loop_ == other.loop_ && index_ == other.index_;
            }

        private:
            loop const * loop_;
            size_t       index_;
        };

        explicit loop_view(loop const & l) : loop_(&l) {}

        std::string const & category() const { return loop_->category(); }
        std::optional<size_t> column_index(std::string_view tag) const { return loop_->tag_index(tag); }

        size_t size() const { return loop_->row_count(); }
        row_view row(size_t index) const { return row_view(loop_, index); }

        iterator begin() const { return iterator(loop_, 0); }
        iterator end() const { return iterator(loop_, loop_->row_count()); }

        // Rows whose `tag` cell equals `value` exactly; empty for an unknown tag.
        std::vector<row_view> where(std::string_view tag, std::string_view value) const;

        loop const & raw() const { return *loop_; }

    private:
        loop const * loop_;
    };

    //========================================================================
    // IMPLEMENTATION
    //========================================================================

    inline std::optional<std::string_view> row_view::get(std::string_view tag) const
    {
        auto col = loop_->tag_index(tag);
        if (!col)
            return std::nullopt;
        return std::string_view(raw()[*col]);
    }

    inline std::optional<int64_t> row_view::get_int(std::string_view tag) const
    {
        auto v = get(tag);
        if (!v || detail::is_null(*v))
            return std::nullopt;
        return detail::as_integer(*v);
    }

    inline std::optional<double> row_view::get_float(std::string_view tag) const
    {
        auto v = get(tag);
        if (!v || detail::is_null(*v))
            return std::nullopt;
        return detail::as_number(*v);
    }

    inline bool row_view::is_null(std::string_view tag) const
    {
        auto v = get(tag);
        return v && detail::is_null(*v);
    }

    inline std::vector<row_view> loop_view::where(std::string_view tag, std::string_view value) const
    {
        std::vector<row_view> out;

        auto col = loop_->tag_index(tag);
        if (!col)
            return out;

        for (size_t r = 0; r < loop_->row_count(); ++r)
            if (loop_->data()[r][*col] == value)
                out.emplace_back(loop_, r);

        return out;
    }

} // namespace nmrstar

#endif // NMRSTAR_QUERY_HPP
