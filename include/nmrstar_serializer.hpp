// nmrstar_serializer.hpp - NMR-STAR reader/writer - Serializer
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef NMRSTAR_SERIALIZER_HPP
#define NMRSTAR_SERIALIZER_HPP

#include "nmrstar_core.hpp"
#include "nmrstar_document.hpp"
#include "nmrstar_quote.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <variant>

namespace nmrstar
{
//========================================================================
// SERIALIZER API
//========================================================================

    struct format_options
    {
        bool skip_empty_loops = false;  // omit loops without tags, rows or non-null cells
        bool skip_empty_tags  = false;  // omit null saveframe tags and all-null loop columns
        bool show_comments    = true;   // emit comments attached to saveframes
    };

    using format_context = context<std::string, state_error>;

    // Formatting never mutates the node. Output is produced only when
    // the whole node formats cleanly.
    class serializer
    {
    public:
        explicit serializer(entry const & e, format_options opts = {}) : node_(&e), opts_(opts) {}
        explicit serializer(saveframe const & sf, format_options opts = {}) : node_(&sf), opts_(opts) {}
        explicit serializer(loop const & l, format_options opts = {}) : node_(&l), opts_(opts) {}

        format_context format() const;
        status write(std::ostream & out) const;

    private:
        std::variant<entry const*, saveframe const*, loop const*> node_;
        format_options opts_;
    };

    format_context format(entry const & e, format_options opts = {});
    format_context format(saveframe const & sf, format_options opts = {});
    format_context format(loop const & l, format_options opts = {});

    // Formats in memory, writes a sibling temporary, then renames it into place.
    status write_to_file(std::filesystem::path const & path, entry const & e, format_options opts = {});

//========================================================================
// SERIALIZER IMPLEMENTATION
//========================================================================

    namespace detail
    {
        class serializer_impl
        {
        public:
            explicit serializer_impl(format_options opts) : opts_(opts) {}

            status write_entry(std::ostringstream & out, entry const & e)
            {
                if (e.entry_id().empty())
                    return status::failure(state_error_kind::invalid_name, "cannot format an entry without an id");

                out << "data_" << e.entry_id() << "\n\n";

                bool first = true;
                for (auto const & sf : e.saveframes())
                {
                    if (!first)
                        out << "\n";
                    first = false;

                    if (auto s = write_saveframe(out, sf); !s)
                        return s;
                }
                return status::success();
            }

            status write_saveframe(std::ostringstream & out, saveframe const & sf)
            {
                if (sf.name().empty())
                    return status::failure(state_error_kind::invalid_name, "cannot format a saveframe without a name");

                if (!sf.tags().empty() && sf.tag_prefix().empty())
                    return status::failure(state_error_kind::invalid_name,
                        "saveframe '" + sf.name() + "' has tags but no tag prefix");

                if (opts_.show_comments)
                    for (auto const & c : sf.comments())
                        out << "#" << c << "\n";

                out << "save_" << sf.name() << "\n";

                size_t width = 0;
                for (auto const & t : sf.tags())
                    width = std::max(width, qualify(sf.tag_prefix(), t.name).size());

                for (auto const & t : sf.tags())
                {
                    if (opts_.skip_empty_tags && is_null(t.value))
                        continue;

                    auto q = quote_value(t.value);
                    if (q.has_errors())
                        return status::failure(q.errors.front().kind,
                            "tag '" + qualify(sf.tag_prefix(), t.name) + "' in saveframe '" + sf.name() +
                            "': " + q.errors.front().message);

                    auto full = qualify(sf.tag_prefix(), t.name);
                    if (is_multiline_block(q.result))
                        out << "   " << full << "\n" << q.result << "\n";
                    else
                        out << "   " << std::left << std::setw(static_cast<int>(width)) << full << "  " << q.result << "\n";
                }

                for (auto const & l : sf.loops())
                {
                    if (opts_.skip_empty_loops && (l.tags().empty() || l.empty()))
                        continue;

                    if (auto s = write_loop(out, l); !s)
                        return s;
                }

                out << "\nsave_\n";
                return status::success();
            }

            status write_loop(std::ostringstream & out, loop const & l)
            {
                if (l.tags().empty())
                {
                    out << "\n   loop_\n\n   stop_\n";
                    return status::success();
                }

                if (l.category().empty())
                    return status::failure(state_error_kind::invalid_name, "cannot format a loop without a category");

                std::vector<size_t> columns;
                for (size_t c = 0; c < l.tags().size(); ++c)
                {
                    if (opts_.skip_empty_tags && column_is_null(l, c))
                        continue;
                    columns.push_back(c);
                }

                // every column dropped: the loop itself is empty
                if (columns.empty())
                    return status::success();

                // Quote every cell before emitting anything.
                std::vector<std::vector<std::string>> quoted(l.data().size());
                std::vector<size_t> widths(columns.size(), 4);

                for (size_t r = 0; r < l.data().size(); ++r)
                {
                    for (size_t i = 0; i < columns.size(); ++i)
                    {
                        auto const & raw = l.data()[r][columns[i]];
                        auto q = quote_value(raw);
                        if (q.has_errors())
                            return status::failure(q.errors.front().kind,
                                "row " + std::to_string(r + 1) + " tag '" + qualify(l.category(), l.tags()[columns[i]]) +
                                "': " + q.errors.front().message);

                        if (!is_multiline_block(q.result))
                            widths[i] = std::max(widths[i], q.result.size() + 3);
                        quoted[r].push_back(std::move(q.result));
                    }
                }

                out << "\n   loop_\n";
                for (auto c : columns)
                    out << "      " << qualify(l.category(), l.tags()[c]) << "\n";
                out << "\n";

                for (auto const & cells : quoted)
                {
                    out << "     ";
                    bool line_open = true;
                    for (size_t i = 0; i < cells.size(); ++i)
                    {
                        if (is_multiline_block(cells[i]))
                        {
                            out << "\n" << cells[i] << "\n";
                            line_open = false;
                            continue;
                        }

                        if (!line_open)
                        {
                            out << "     ";
                            line_open = true;
                        }
                        out << std::left << std::setw(static_cast<int>(widths[i])) << cells[i];
                    }
                    if (line_open)
                        out << "\n";
                }

                out << "\n   stop_\n";
                return status::success();
            }

        private:
            format_options opts_;

            static bool column_is_null(loop const & l, size_t col)
            {
                return std::all_of(l.data().begin(), l.data().end(),
                                   [col](row const & r) { return is_null(r[col]); });
            }
        };

        template <typename Node, typename Fn>
        format_context run_serializer(format_options opts, Node const & node, Fn fn)
        {
            format_context ctx;
            serializer_impl impl(opts);
            std::ostringstream out;

            if (auto s = (impl.*fn)(out, node); !s)
                ctx.errors.push_back(s.error());
            else
                ctx.result = out.str();
            return ctx;
        }
    }

//========================================================================
// PUBLIC SERIALIZER API IMPLEMENTATION
//========================================================================

    inline format_context format(entry const & e, format_options opts)
    {
        return detail::run_serializer(opts, e, &detail::serializer_impl::write_entry);
    }

    inline format_context format(saveframe const & sf, format_options opts)
    {
        return detail::run_serializer(opts, sf, &detail::serializer_impl::write_saveframe);
    }

    inline format_context format(loop const & l, format_options opts)
    {
        return detail::run_serializer(opts, l, &detail::serializer_impl::write_loop);
    }

    inline format_context serializer::format() const
    {
        return std::visit([this](auto const * node) { return nmrstar::format(*node, opts_); }, node_);
    }

    inline status serializer::write(std::ostream & out) const
    {
        auto ctx = format();
        if (ctx.has_errors())
            return status::failure(ctx.errors.front().kind, ctx.errors.front().message);

        out << ctx.result;
        if (!out)
            return status::failure(state_error_kind::io_failure, "failed writing formatted output to stream");
        return status::success();
    }

    inline status write_to_file(std::filesystem::path const & path, entry const & e, format_options opts)
    {
        auto ctx = format(e, opts);
        if (ctx.has_errors())
            return status::failure(ctx.errors.front().kind, ctx.errors.front().message);

        auto tmp = path;
        tmp += ".tmp";

        {
            std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
            if (!file)
                return status::failure(state_error_kind::io_failure, "cannot open '" + tmp.string() + "' for writing");

            file << ctx.result;
            file.close();
            if (!file)
            {
                std::error_code ignored;
                std::filesystem::remove(tmp, ignored);
                return status::failure(state_error_kind::io_failure, "failed writing '" + tmp.string() + "'");
            }
        }

        std::error_code ec;
        std::filesystem::rename(tmp, path, ec);
        if (ec)
        {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            return status::failure(state_error_kind::io_failure,
                "cannot move '" + tmp.string() + "' to '" + path.string() + "': " + ec.message());
        }
        return status::success();
    }

} // namespace nmrstar

#endif // NMRSTAR_SERIALIZER_HPP
