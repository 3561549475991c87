// nmrstar_editor.hpp - NMR-STAR reader/writer - Entry Editor
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef NMRSTAR_EDITOR_HPP
#define NMRSTAR_EDITOR_HPP

#include "nmrstar_document.hpp"
#include "nmrstar_schema.hpp"

#include <algorithm>
#include <limits>
#include <numeric>

namespace nmrstar
{
    // Mutations that span more than one saveframe, or that need a schema.
    class editor
    {
    public:
        explicit editor(entry & e) noexcept
            : entry_(e)
        {}

    //============================================================
    // Names and references
    //============================================================

        // Renames and rewrites every "$old" value to "$new".
        status rename_saveframe(std::string_view old_name, std::string_view new_name);

        // Updates the id and every entry-id tag (flagged in the schema, or
        // named Entry_ID when no schema is given).
        status set_entry_id(std::string_view id, schema const * s = nullptr);

    //============================================================
    // Pruning
    //============================================================

        size_t remove_empty_saveframes();

    //============================================================
    // Schema driven (explicit, opt-in)
    //============================================================

        // Adds the mandatory tags of each saveframe and loop category, or all
        // of them, using schema defaults or '.'.
        status add_missing_tags(schema const & s, bool all_tags = false);

        void sort_tags(schema const & s);

        // One saveframe and its loops.
        static void sort_tags(saveframe & sf, schema const & s);

        // Schema order for saveframes, loops and tags; rows by Ordinal.
        void normalize(schema const & s);

    private:

        entry & entry_;

    //========================================================
    // Internal helpers; not exposed for clients
    //========================================================

        static status fill_saveframe(saveframe & sf, schema const & s, bool all_tags);
        static status fill_loop(loop & l, schema const & s, bool all_tags);
        static void sort_loop_tags(loop & l, schema const & s);
        static size_t category_rank(schema const & s, std::string_view category);
    };

//============================================================
// Templates
//============================================================

    // Empty loop with the NOT NULL tags of `category`, or all of them.
    context<loop, state_error> loop_from_template(schema const & s, std::string_view category, bool all_tags = false);

    // Saveframe of one schema saveframe category. Sf_category, Sf_framecode and
    // entry-id tags are filled in, the rest hold '.' or, with default_values,
    // the schema default. Each loop category gets an empty loop.
    context<saveframe, state_error> saveframe_from_template(schema const & s, std::string_view sf_category,
                                                            std::string_view name = {},
                                                            std::string_view entry_id = {},
                                                            bool all_tags = false,
                                                            bool default_values = false);

    // One saveframe per schema saveframe category, named "<category>_1".
    context<entry, state_error> entry_from_template(schema const & s, std::string_view entry_id,
                                                    bool all_tags = false, bool default_values = false);

//================================================================================================================
//
// Editor implementations
//
//================================================================================================================

//============================================================
// Names and references
//============================================================

    inline status editor::rename_saveframe(std::string_view old_name, std::string_view new_name)
    {
        if (old_name.starts_with('$')) old_name.remove_prefix(1);
        if (new_name.starts_with('$')) new_name.remove_prefix(1);

        auto* sf = entry_.get_saveframe_by_name(old_name);
        if (!sf)
            return status::failure(state_error_kind::not_found,
                "no saveframe named '" + std::string(old_name) + "' in entry '" + entry_.entry_id() + "'");

        std::string old_reference = "$" + sf->name();
        if (auto s = sf->set_name(new_name); !s)
            return s;
        std::string new_reference = "$" + std::string(new_name);

        for (auto & frame : entry_.saveframes_)
        {
            for (auto & t : frame.tags_)
                if (t.value == old_reference)
                    t.value = new_reference;

            for (auto & l : frame.loops_)
                for (auto & r : l.rows_)
                    for (auto & v : r)
                        if (v == old_reference)
                            v = new_reference;
        }
        return status::success();
    }

    inline status editor::set_entry_id(std::string_view id, schema const * s)
    {
        if (auto st = entry_.set_entry_id(id); !st)
            return st;

        auto is_id_tag = [s](std::string const & full)
        {
            if (s)
            {
                auto def = s->lookup(full);
                return def && def->entry_id_flag;
            }
            return detail::iequals(detail::format_tag(full), "Entry_ID");
        };

        for (auto & frame : entry_.saveframes_)
        {
            for (auto & t : frame.tags_)
                if (is_id_tag(detail::qualify(frame.tag_prefix_, t.name)))
                    t.value = std::string(id);

            for (auto & l : frame.loops_)
            {
                for (size_t c = 0; c < l.tags_.size(); ++c)
                {
                    if (!is_id_tag(detail::qualify(l.category_, l.tags_[c])))
                        continue;
                    for (auto & r : l.rows_)
                        r[c] = std::string(id);
                }
            }
        }
        return status::success();
    }

//============================================================
// Pruning
//============================================================

    inline size_t editor::remove_empty_saveframes()
    {
        auto & frames = entry_.saveframes_;
        size_t before = frames.size();

        frames.erase(std::remove_if(frames.begin(), frames.end(),
                                    [](saveframe const & sf) { return sf.empty(); }),
                     frames.end());
        entry_.adopt_saveframes();

        return before - frames.size();
    }

//============================================================
// Schema driven
//============================================================

    inline status editor::fill_saveframe(saveframe & sf, schema const & s, bool all_tags)
    {
        if (sf.tag_prefix().empty())
            return status::success();

        for (auto const * def : s.tags_in_category(sf.tag_prefix()))
        {
            if (def->loop_flag || (!all_tags && def->nullable))
                continue;
            if (sf.find_tag(def->tag))
                continue;

            std::string value = def->default_value.value_or(std::string(detail::NULL_DEFINITE));
            if (detail::iequals(detail::format_tag(def->tag), "Sf_framecode"))
                value = sf.name();
            else if (detail::iequals(detail::format_tag(def->tag), "Sf_category") && !def->sf_category.empty())
                value = def->sf_category;

            if (auto st = sf.add_tag(def->tag, std::move(value)); !st)
                return st;
        }
        return status::success();
    }

    inline status editor::fill_loop(loop & l, schema const & s, bool all_tags)
    {
        for (auto const * def : s.tags_in_category(l.category()))
        {
            if (!all_tags && def->nullable)
                continue;
            if (l.tag_index(def->tag))
                continue;

            if (auto st = l.add_tag(def->tag, true); !st)
                return st;

            if (def->default_value)
            {
                size_t col = l.tags_.size() - 1;
                for (auto & r : l.rows_)
                    r[col] = *def->default_value;
            }
        }
        return status::success();
    }

    inline status editor::add_missing_tags(schema const & s, bool all_tags)
    {
        // Work on a copy so a failure leaves the entry untouched.
        entry working = entry_;
        editor ed(working);

        for (auto & frame : working.saveframes_)
        {
            if (auto st = fill_saveframe(frame, s, all_tags); !st)
                return st;
            for (auto & l : frame.loops_)
                if (auto st = fill_loop(l, s, all_tags); !st)
                    return st;
        }

        ed.sort_tags(s);
        entry_ = std::move(working);
        return status::success();
    }

//---------------------------------------------------------------------------

    inline void editor::sort_tags(saveframe & sf, schema const & s)
    {
        auto const & prefix = sf.tag_prefix_;
        std::stable_sort(sf.tags_.begin(), sf.tags_.end(), [&](tag const & a, tag const & b)
        {
            return s.tag_order(detail::qualify(prefix, a.name)) < s.tag_order(detail::qualify(prefix, b.name));
        });

        for (auto & l : sf.loops_)
            sort_loop_tags(l, s);
    }

    inline void editor::sort_loop_tags(loop & l, schema const & s)
    {
        std::vector<size_t> perm(l.tags_.size());
        std::iota(perm.begin(), perm.end(), size_t{0});

        std::stable_sort(perm.begin(), perm.end(), [&](size_t a, size_t b)
        {
            return s.tag_order(detail::qualify(l.category_, l.tags_[a])) <
                   s.tag_order(detail::qualify(l.category_, l.tags_[b]));
        });

        if (std::is_sorted(perm.begin(), perm.end()))
            return;

        std::vector<std::string> tags;
        for (auto i : perm)
            tags.push_back(l.tags_[i]);
        l.tags_ = std::move(tags);

        for (auto & r : l.rows_)
        {
            row reordered;
            reordered.reserve(r.size());
            for (auto i : perm)
                reordered.push_back(std::move(r[i]));
            r = std::move(reordered);
        }
    }

    inline void editor::sort_tags(schema const & s)
    {
        for (auto & frame : entry_.saveframes_)
            sort_tags(frame, s);
    }

    inline size_t editor::category_rank(schema const & s, std::string_view category)
    {
        auto const & order = s.category_order();
        for (size_t i = 0; i < order.size(); ++i)
            if (detail::iequals(order[i], category))
                return i;
        return order.size();
    }

    inline void editor::normalize(schema const & s)
    {
        sort_tags(s);

        for (auto & frame : entry_.saveframes_)
        {
            for (auto & l : frame.loops_)
            {
                if (l.tag_index("Ordinal"))
                {
                    auto st = l.sort_rows({ "Ordinal" });
                    (void)st;   // the tag exists, so sorting cannot fail
                }
            }

            std::stable_sort(frame.loops_.begin(), frame.loops_.end(), [&](loop const & a, loop const & b)
            {
                return category_rank(s, a.category_) < category_rank(s, b.category_);
            });
            frame.adopt_loops();
        }

        auto sf_key = [&](saveframe const & sf)
        {
            double id = std::numeric_limits<double>::infinity();
            if (auto v = sf.tag_value("ID"))
                if (auto n = detail::as_integer(*v))
                    id = static_cast<double>(*n);
            return std::pair{ category_rank(s, sf.tag_prefix_), id };
        };

        std::stable_sort(entry_.saveframes_.begin(), entry_.saveframes_.end(),
                         [&](saveframe const & a, saveframe const & b) { return sf_key(a) < sf_key(b); });
        entry_.adopt_saveframes();
    }

//============================================================
// Templates
//============================================================

    inline context<loop, state_error> loop_from_template(schema const & s, std::string_view category, bool all_tags)
    {
        context<loop, state_error> ctx;
        auto cat = detail::format_category(category);
        ctx.result = loop(cat);

        for (auto const * def : s.tags_in_category(cat))
        {
            if (!all_tags && def->nullable)
                continue;
            if (auto st = ctx.result.add_tag(def->tag); !st)
            {
                ctx.errors.push_back(st.error());
                return ctx;
            }
        }

        if (ctx.result.tags().empty())
            ctx.errors.push_back({ state_error_kind::not_found, {},
                                   "schema " + s.version() + " has no " + (all_tags ? "" : "mandatory ") +
                                   "tags for loop category '_" + cat + "'" });
        return ctx;
    }

    inline context<saveframe, state_error> saveframe_from_template(schema const & s, std::string_view sf_category,
                                                                   std::string_view name, std::string_view entry_id,
                                                                   bool all_tags, bool default_values)
    {
        context<saveframe, state_error> ctx;

        std::vector<tag_definition const*> defs;
        for (auto const & cat : s.category_order())
            for (auto const * def : s.tags_in_category(cat))
                if (detail::iequals(def->sf_category, sf_category))
                    defs.push_back(def);

        auto first = std::find_if(defs.begin(), defs.end(),
                                  [](tag_definition const * d) { return !d->loop_flag; });
        if (first == defs.end())
        {
            ctx.errors.push_back({ state_error_kind::not_found, {},
                                   "schema " + s.version() + " has no saveframe tags for category '" +
                                   std::string(sf_category) + "'" });
            return ctx;
        }

        std::string frame_name(name.empty() ? sf_category : name);
        auto made = saveframe::from_scratch(frame_name, detail::format_category((*first)->tag));
        if (made.has_errors())
        {
            ctx.errors = std::move(made.errors);
            return ctx;
        }
        ctx.result = std::move(made.result);
        auto & sf = ctx.result;

        std::vector<std::string> loops_added;
        for (auto const * def : defs)
        {
            auto cat = detail::format_category(def->tag);

            if (def->loop_flag)
            {
                if (std::find(loops_added.begin(), loops_added.end(), cat) != loops_added.end())
                    continue;
                loops_added.push_back(cat);

                // a loop category without mandatory tags is left out
                auto l = loop_from_template(s, cat, all_tags);
                if (l.has_errors())
                    continue;
                if (auto st = sf.add_loop(std::move(l.result)); !st)
                {
                    ctx.errors.push_back(st.error());
                    return ctx;
                }
                continue;
            }

            if (!detail::iequals(cat, sf.tag_prefix()))
                continue;

            auto bare = detail::format_tag(def->tag);
            std::string value(detail::NULL_DEFINITE);

            if (detail::iequals(bare, "Sf_category"))
                value = def->sf_category;
            else if (detail::iequals(bare, "Sf_framecode"))
                value = frame_name;
            else if (def->entry_id_flag && !entry_id.empty())
                value = std::string(entry_id);
            else if (!all_tags && def->nullable)
                continue;
            else if (default_values && def->default_value && !def->default_value->empty() &&
                     *def->default_value != detail::NULL_UNKNOWN)
                value = *def->default_value;

            if (auto st = sf.add_tag(def->tag, std::move(value)); !st)
            {
                ctx.errors.push_back(st.error());
                return ctx;
            }
        }
        return ctx;
    }

    inline context<entry, state_error> entry_from_template(schema const & s, std::string_view entry_id,
                                                           bool all_tags, bool default_values)
    {
        context<entry, state_error> ctx;
        if (auto st = ctx.result.set_entry_id(entry_id); !st)
        {
            ctx.errors.push_back(st.error());
            return ctx;
        }

        std::vector<std::string> sf_categories;
        for (auto const & cat : s.category_order())
        {
            for (auto const * def : s.tags_in_category(cat))
            {
                if (def->sf_category.empty())
                    continue;
                bool seen = std::any_of(sf_categories.begin(), sf_categories.end(),
                                        [def](std::string const & c) { return detail::iequals(c, def->sf_category); });
                if (!seen)
                    sf_categories.push_back(def->sf_category);
            }
        }

        for (auto const & sfc : sf_categories)
        {
            auto sf = saveframe_from_template(s, sfc, sfc + "_1", entry_id, all_tags, default_values);
            if (sf.has_errors())
            {
                ctx.warnings.insert(ctx.warnings.end(), sf.errors.begin(), sf.errors.end());
                continue;
            }
            if (auto st = ctx.result.add_saveframe(std::move(sf.result)); !st)
            {
                ctx.errors.push_back(st.error());
                return ctx;
            }
        }

        auto info = ctx.result.get_saveframes_by_category("entry_information");
        if (!info.empty())
        {
            for (auto const * version_tag : { "NMR_STAR_version", "Original_NMR_STAR_version" })
            {
                if (auto st = info.front()->add_tag(version_tag, s.version(), true); !st)
                {
                    ctx.errors.push_back(st.error());
                    return ctx;
                }
            }
        }
        return ctx;
    }

} // namespace nmrstar

#endif // NMRSTAR_EDITOR_HPP
