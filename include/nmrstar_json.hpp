// nmrstar_json.hpp - NMR-STAR reader/writer - JSON projection
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef NMRSTAR_JSON_HPP
#define NMRSTAR_JSON_HPP

#include "nmrstar_document.hpp"

#include <memory>
#include <sstream>

#include <json/json.h>

namespace nmrstar
{
//========================================================================
// JSON API
//========================================================================
//
// Shape:
//
//   {"entry_id": "...",
//    "saveframes": [{"name": "...", "category": "...", "tag_prefix": "_X",
//                    "tags": [["Tag", "value"], ...],
//                    "loops": [{"category": "_Cat", "tags": ["A", "B"],
//                               "data": [["1", "2"], ...]}]}]}
//
// Every value is a JSON string; '.' and '?' pass through unchanged.
// "category" is informational on input; Sf_category is read from the tags.
//
//========================================================================

    struct json_options
    {
        bool pretty = false;    // indented output; compact otherwise
    };

    std::string to_json(entry const & e, json_options opts = {});
    std::string to_json(saveframe const & sf, json_options opts = {});
    std::string to_json(loop const & l, json_options opts = {});

    context<entry, state_error>     entry_from_json(std::string_view text);
    context<saveframe, state_error> saveframe_from_json(std::string_view text);
    context<loop, state_error>      loop_from_json(std::string_view text);

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        inline Json::Value loop_to_value(loop const & l)
        {
            Json::Value out(Json::objectValue);
            out["category"] = "_" + l.category();

            Json::Value tags(Json::arrayValue);
            for (auto const & t : l.tags())
                tags.append(t);
            out["tags"] = tags;

            Json::Value data(Json::arrayValue);
            for (auto const & r : l.data())
            {
                Json::Value cells(Json::arrayValue);
                for (auto const & v : r)
                    cells.append(v);
                data.append(cells);
            }
            out["data"] = data;
            return out;
        }

        inline Json::Value saveframe_to_value(saveframe const & sf)
        {
            Json::Value out(Json::objectValue);
            out["name"] = sf.name();

            auto category = sf.category();
            out["category"] = category ? Json::Value(*category) : Json::Value(Json::nullValue);
            out["tag_prefix"] = sf.tag_prefix().empty() ? std::string() : "_" + sf.tag_prefix();

            Json::Value tags(Json::arrayValue);
            for (auto const & t : sf.tags())
            {
                Json::Value pair(Json::arrayValue);
                pair.append(t.name);
                pair.append(t.value);
                tags.append(pair);
            }
            out["tags"] = tags;

            Json::Value loops(Json::arrayValue);
            for (auto const & l : sf.loops())
                loops.append(loop_to_value(l));
            out["loops"] = loops;
            return out;
        }

        inline Json::Value entry_to_value(entry const & e)
        {
            Json::Value out(Json::objectValue);
            out["entry_id"] = e.entry_id();

            Json::Value frames(Json::arrayValue);
            for (auto const & sf : e.saveframes())
                frames.append(saveframe_to_value(sf));
            out["saveframes"] = frames;
            return out;
        }

        inline std::string write_json(Json::Value const & v, json_options opts)
        {
            Json::StreamWriterBuilder builder;
            builder["indentation"] = opts.pretty ? "  " : "";
            return Json::writeString(builder, v);
        }

    //--------------------------------------------------------------------
    // Reading
    //--------------------------------------------------------------------

        template <typename T>
        void json_fail(context<T, state_error> & ctx, std::string message)
        {
            ctx.errors.push_back({ state_error_kind::invalid_json, {}, std::move(message) });
        }

        inline bool read_json(std::string_view text, Json::Value & root, std::string & error_out)
        {
            Json::CharReaderBuilder builder;
            builder["collectComments"] = false;
            std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
            return reader->parse(text.data(), text.data() + text.size(), &root, &error_out);
        }

        inline bool string_array(Json::Value const & v, std::vector<std::string> & out)
        {
            if (!v.isArray())
                return false;
            for (auto const & item : v)
            {
                if (!item.isString())
                    return false;
                out.push_back(item.asString());
            }
            return true;
        }

        inline status loop_from_value(Json::Value const & v, loop & out)
        {
            auto bad = [](std::string msg) { return status::failure(state_error_kind::invalid_json, std::move(msg)); };

            if (!v.isObject() || !v["category"].isString())
                return bad("loop object needs a string 'category'");

            if (auto s = out.set_category(v["category"].asString()); !s)
                return s;

            std::vector<std::string> tags;
            if (v.isMember("tags") && !string_array(v["tags"], tags))
                return bad("loop 'tags' must be an array of strings");
            if (auto s = out.add_tags(tags); !s)
                return s;

            if (!v.isMember("data"))
                return status::success();
            if (!v["data"].isArray())
                return bad("loop 'data' must be an array of rows");

            for (auto const & r : v["data"])
            {
                row cells;
                if (!string_array(r, cells))
                    return bad("loop '" + v["category"].asString() + "' has a row that is not an array of strings");
                if (auto s = out.add_row(std::move(cells)); !s)
                    return s;
            }
            return status::success();
        }

        inline status saveframe_from_value(Json::Value const & v, saveframe & out)
        {
            auto bad = [](std::string msg) { return status::failure(state_error_kind::invalid_json, std::move(msg)); };

            if (!v.isObject() || !v["name"].isString())
                return bad("saveframe object needs a string 'name'");

            if (auto s = out.set_name(v["name"].asString()); !s)
                return s;

            if (v.isMember("tag_prefix"))
            {
                if (!v["tag_prefix"].isString())
                    return bad("saveframe 'tag_prefix' must be a string");
                auto prefix = v["tag_prefix"].asString();
                if (!prefix.empty())
                    if (auto s = out.set_tag_prefix(prefix); !s)
                        return s;
            }

            if (v.isMember("tags"))
            {
                if (!v["tags"].isArray())
                    return bad("saveframe 'tags' must be an array of [name, value] pairs");
                for (auto const & pair : v["tags"])
                {
                    if (!pair.isArray() || pair.size() != 2 || !pair[0].isString() || !pair[1].isString())
                        return bad("saveframe '" + out.name() + "' has a tag that is not a [name, value] pair");
                    if (auto s = out.add_tag(pair[0].asString(), pair[1].asString()); !s)
                        return s;
                }
            }

            if (v.isMember("loops"))
            {
                if (!v["loops"].isArray())
                    return bad("saveframe 'loops' must be an array");
                for (auto const & lv : v["loops"])
                {
                    loop l;
                    if (auto s = loop_from_value(lv, l); !s)
                        return s;
                    if (auto s = out.add_loop(std::move(l)); !s)
                        return s;
                }
            }
            return status::success();
        }

        inline status entry_from_value(Json::Value const & v, entry & out)
        {
            if (!v.isObject() || !v["entry_id"].isString())
                return status::failure(state_error_kind::invalid_json, "entry object needs a string 'entry_id'");

            if (auto s = out.set_entry_id(v["entry_id"].asString()); !s)
                return s;

            if (!v.isMember("saveframes"))
                return status::success();
            if (!v["saveframes"].isArray())
                return status::failure(state_error_kind::invalid_json, "entry 'saveframes' must be an array");

            for (auto const & sv : v["saveframes"])
            {
                saveframe sf;
                if (auto s = saveframe_from_value(sv, sf); !s)
                    return s;
                if (auto s = out.add_saveframe(std::move(sf)); !s)
                    return s;
            }
            return status::success();
        }

        template <typename T, typename Fn>
        context<T, state_error> run_from_json(std::string_view text, Fn fn)
        {
            context<T, state_error> ctx;

            Json::Value root;
            std::string err;
            if (!read_json(text, root, err))
            {
                json_fail(ctx, "malformed JSON: " + err);
                return ctx;
            }

            T node;
            if (auto s = fn(root, node); !s)
            {
                ctx.errors.push_back(s.error());
                return ctx;
            }
            ctx.result = std::move(node);
            return ctx;
        }
    }

//---------------------------------------------------------------------------

    inline std::string to_json(entry const & e, json_options opts)
    {
        return detail::write_json(detail::entry_to_value(e), opts);
    }

    inline std::string to_json(saveframe const & sf, json_options opts)
    {
        return detail::write_json(detail::saveframe_to_value(sf), opts);
    }

    inline std::string to_json(loop const & l, json_options opts)
    {
        return detail::write_json(detail::loop_to_value(l), opts);
    }

    inline context<entry, state_error> entry_from_json(std::string_view text)
    {
        return detail::run_from_json<entry>(text, detail::entry_from_value);
    }

    inline context<saveframe, state_error> saveframe_from_json(std::string_view text)
    {
        return detail::run_from_json<saveframe>(text, detail::saveframe_from_value);
    }

    inline context<loop, state_error> loop_from_json(std::string_view text)
    {
        return detail::run_from_json<loop>(text, detail::loop_from_value);
    }

} // namespace nmrstar

#endif // NMRSTAR_JSON_HPP
