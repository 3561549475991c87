// nmrstar_compare.hpp - NMR-STAR reader/writer - Semantic comparison
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef NMRSTAR_COMPARE_HPP
#define NMRSTAR_COMPARE_HPP

#include "nmrstar_document.hpp"

namespace nmrstar
{
//========================================================================
// COMPARISON API
//========================================================================
//
// operator== on the document types is exact: order and capitalisation
// matter. compare() is NMR-STAR aware: tags match case-insensitively,
// saveframes match by name without regard to case, loops by category, and
// rows are compared as a multiset. The result lists discrepancies in
// discovery order; an empty list means the nodes are equivalent.
//
//========================================================================

    std::vector<std::string> compare(loop const & a, loop const & b);
    std::vector<std::string> compare(saveframe const & a, saveframe const & b);
    std::vector<std::string> compare(entry const & a, entry const & b);

    template <typename Node>
    bool equivalent(Node const & a, Node const & b) { return compare(a, b).empty(); }

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        inline std::vector<std::string> lowered_sorted(std::vector<std::string> const & in)
        {
            std::vector<std::string> out;
            out.reserve(in.size());
            for (auto const & s : in)
                out.push_back(to_lower(s));
            std::sort(out.begin(), out.end());
            return out;
        }

        // Rows of `l` with columns in the order of `tags`, then sorted.
        inline std::vector<row> canonical_rows(loop const & l, std::vector<std::string> const & tags)
        {
            auto picked = l.get_tags(tags);
            std::vector<row> rows = picked ? std::move(*picked) : std::vector<row>{};
            std::sort(rows.begin(), rows.end());
            return rows;
        }
    }

    inline std::vector<std::string> compare(loop const & a, loop const & b)
    {
        std::vector<std::string> diffs;

        if (!detail::iequals(a.category(), b.category()))
        {
            diffs.push_back("loop category mismatch: '_" + a.category() + "' vs '_" + b.category() + "'");
            return diffs;
        }

        if (detail::lowered_sorted(a.tags()) != detail::lowered_sorted(b.tags()))
        {
            diffs.push_back("tag mismatch in loop '_" + a.category() + "': " +
                            std::to_string(a.tags().size()) + " tags vs " + std::to_string(b.tags().size()) +
                            " tags, or differently named");
            return diffs;
        }

        if (a.row_count() != b.row_count())
        {
            diffs.push_back("row count mismatch in loop '_" + a.category() + "': " +
                            std::to_string(a.row_count()) + " vs " + std::to_string(b.row_count()));
            return diffs;
        }

        if (detail::canonical_rows(a, a.tags()) != detail::canonical_rows(b, a.tags()))
            diffs.push_back("data mismatch in loop '_" + a.category() + "'");

        return diffs;
    }

    inline std::vector<std::string> compare(saveframe const & a, saveframe const & b)
    {
        std::vector<std::string> diffs;

        if (!detail::iequals(a.name(), b.name()))
        {
            diffs.push_back("saveframe name mismatch: '" + a.name() + "' vs '" + b.name() + "'");
            return diffs;
        }

        if (!detail::iequals(a.tag_prefix(), b.tag_prefix()))
        {
            diffs.push_back("tag prefix mismatch in saveframe '" + a.name() + "': '_" +
                            a.tag_prefix() + "' vs '_" + b.tag_prefix() + "'");
            return diffs;
        }

        if (a.tags().size() != b.tags().size())
            diffs.push_back("tag count mismatch in saveframe '" + a.name() + "': " +
                            std::to_string(a.tags().size()) + " vs " + std::to_string(b.tags().size()));

        for (auto const & t : a.tags())
        {
            auto full = detail::qualify(a.tag_prefix(), t.name);
            auto other = b.find_tag(t.name);
            if (!other)
                diffs.push_back("no tag '" + full + "' in compared saveframe '" + b.name() + "'");
            else if (other->value != t.value)
                diffs.push_back("value mismatch for tag '" + full + "': '" + t.value + "' vs '" + other->value + "'");
        }

        if (a.loops().size() != b.loops().size())
            diffs.push_back("loop count mismatch in saveframe '" + a.name() + "': " +
                            std::to_string(a.loops().size()) + " vs " + std::to_string(b.loops().size()));

        for (auto const & l : a.loops())
        {
            auto other = b.get_loop(l.category());
            if (!other)
            {
                diffs.push_back("no loop '_" + l.category() + "' in compared saveframe '" + b.name() + "'");
                continue;
            }
            auto sub = compare(l, *other);
            diffs.insert(diffs.end(), sub.begin(), sub.end());
        }

        return diffs;
    }

    inline std::vector<std::string> compare(entry const & a, entry const & b)
    {
        std::vector<std::string> diffs;

        if (a.entry_id() != b.entry_id())
            diffs.push_back("entry id mismatch: '" + a.entry_id() + "' vs '" + b.entry_id() + "'");

        if (a.size() != b.size())
            diffs.push_back("saveframe count mismatch: " + std::to_string(a.size()) + " vs " + std::to_string(b.size()));

        for (auto const & sf : a.saveframes())
        {
            auto other = b.get_saveframe_by_name(sf.name());
            if (!other)
            {
                diffs.push_back("no saveframe '" + sf.name() + "' in compared entry");
                continue;
            }
            auto sub = compare(sf, *other);
            diffs.insert(diffs.end(), sub.begin(), sub.end());
        }

        for (auto const & sf : b.saveframes())
        {
            if (!a.get_saveframe_by_name(sf.name()))
                diffs.push_back("extra saveframe '" + sf.name() + "' in compared entry");
        }

        return diffs;
    }

} // namespace nmrstar

#endif // NMRSTAR_COMPARE_HPP
