// nmrstar_validate.hpp - NMR-STAR reader/writer - Schema validation
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef NMRSTAR_VALIDATE_HPP
#define NMRSTAR_VALIDATE_HPP

#include "nmrstar_document.hpp"
#include "nmrstar_schema.hpp"

#include <set>

namespace nmrstar
{
//========================================================================
// VALIDATION API
//========================================================================

    enum class issue_kind
    {
        unknown_tag,
        wrong_category,
        null_not_allowed,
        type_mismatch,
        too_long,
        capitalization,
        missing_category,
        dangling_reference,
        duplicate_saveframe
    };

    struct validation_issue
    {
        issue_kind  kind;
        std::string tag;
        std::string value;
        std::string location;   // "line N", or a structural locator
        std::string expected;
        std::string message;
    };

    // Read-only; user-data problems are reported, never raised.
    std::vector<validation_issue> validate(entry const & e, schema const & s);
    std::vector<validation_issue> validate(saveframe const & sf, schema const & s);
    std::vector<validation_issue> validate(loop const & l, schema const & s,
                                           std::optional<std::string> const & sf_category = std::nullopt);

    // Checks one value against its definition.
    std::optional<validation_issue> check_value(schema const & s, std::string_view tag, std::string_view value,
                                                std::optional<std::string> const & sf_category,
                                                std::string location);

//========================================================================
// Implementation
//========================================================================

    inline std::optional<validation_issue> check_value(schema const & s, std::string_view tag, std::string_view value,
                                                       std::optional<std::string> const & sf_category,
                                                       std::string location)
    {
        auto make = [&](issue_kind kind, std::string expected, std::string message)
        {
            return validation_issue{ kind, std::string(tag), std::string(value), location,
                                     std::move(expected), std::move(message) };
        };

        auto def = s.lookup(tag);
        if (!def)
            return make(issue_kind::unknown_tag, {},
                        "tag '" + std::string(tag) + "' not found in schema (" + location + ")");

        if (sf_category && !def->sf_category.empty() && *sf_category != def->sf_category)
            return make(issue_kind::wrong_category, def->sf_category,
                        "tag '" + def->tag + "' in category '" + *sf_category +
                        "' should be in category '" + def->sf_category + "'");

        if (detail::is_null(value))
        {
            if (!def->nullable)
                return make(issue_kind::null_not_allowed, def->data_type,
                            "value of '" + def->tag + "' cannot be null but is '" + std::string(value) +
                            "' (" + location + ")");
            return std::nullopt;
        }

        if (def->max_length && value.size() > *def->max_length)
            return make(issue_kind::too_long, def->data_type,
                        "length " + std::to_string(value.size()) + " is too long for " + def->data_type +
                        ": '" + def->tag + "' (" + location + ")");

        if (def->regex && !re2::RE2::FullMatch(re2::StringPiece(value.data(), value.size()), *def->regex))
        {
            std::string type_name = def->bmrb_type.empty() ? def->data_type : def->bmrb_type;
            return make(issue_kind::type_mismatch, type_name + " /" + def->pattern + "/",
                        "value '" + std::string(value) + "' of '" + def->tag + "' does not match type " +
                        type_name + " (" + location + ")");
        }

        // Matches the pattern but has no typed value: out of range or not a calendar date.
        if (!convert_value(*def, value))
            return make(issue_kind::type_mismatch, def->data_type,
                        "value '" + std::string(value) + "' of '" + def->tag + "' is not a valid " +
                        def->data_type + " (" + location + ")");

        if (tag != def->tag)
            return make(issue_kind::capitalization, def->tag,
                        "tag '" + std::string(tag) + "' is improperly capitalized; should be '" + def->tag + "'");

        return std::nullopt;
    }

//---------------------------------------------------------------------------

    inline std::vector<validation_issue> validate(loop const & l, schema const & s,
                                                  std::optional<std::string> const & sf_category)
    {
        std::vector<validation_issue> issues;
        auto names = l.tag_names();

        for (size_t r = 0; r < l.data().size(); ++r)
        {
            auto const & cells = l.data()[r];
            for (size_t c = 0; c < cells.size() && c < names.size(); ++c)
            {
                std::string where = "row " + std::to_string(r + 1) + " tag " + std::to_string(c + 1) +
                                    " of loop _" + l.category();
                if (auto issue = check_value(s, names[c], cells[c], sf_category, std::move(where)))
                    issues.push_back(std::move(*issue));
            }
        }
        return issues;
    }

    inline std::vector<validation_issue> validate(saveframe const & sf, schema const & s)
    {
        std::vector<validation_issue> issues;

        auto category = sf.category();
        if (!category)
        {
            issues.push_back({ issue_kind::missing_category, "Sf_category", {}, "saveframe " + sf.name(), {},
                               "cannot properly validate saveframe '" + sf.name() + "': no Sf_category tag" });
        }

        for (auto const & t : sf.tags())
        {
            std::string where = t.line ? "line " + std::to_string(*t.line) : "saveframe " + sf.name();
            auto full = detail::qualify(sf.tag_prefix(), t.name);
            if (auto issue = check_value(s, full, t.value, category, std::move(where)))
                issues.push_back(std::move(*issue));
        }

        for (auto const & l : sf.loops())
        {
            auto sub = validate(l, s, category);
            issues.insert(issues.end(), std::make_move_iterator(sub.begin()), std::make_move_iterator(sub.end()));
        }
        return issues;
    }

    inline std::vector<validation_issue> validate(entry const & e, schema const & s)
    {
        std::vector<validation_issue> issues;

        std::set<std::string> seen;
        for (auto const & sf : e.saveframes())
        {
            auto lowered = detail::to_lower(sf.name());
            if (!seen.insert(lowered).second)
                issues.push_back({ issue_kind::duplicate_saveframe, {}, sf.name(), "saveframe " + sf.name(), {},
                                   "multiple saveframes with the same name: '" + sf.name() + "'" });
        }

        // saveframe names are unique without regard to case, so references resolve the same way
        auto check_reference = [&](std::string const & value, std::string tag, std::string where)
        {
            if (value.size() > 1 && value.starts_with('$') && !seen.contains(detail::to_lower(value.substr(1))))
                issues.push_back({ issue_kind::dangling_reference, tag, value, std::move(where), {},
                                   "dangling saveframe reference '" + value + "' in tag '" + tag + "'" });
        };

        for (auto const & sf : e.saveframes())
        {
            for (auto const & t : sf.tags())
            {
                std::string where = t.line ? "line " + std::to_string(*t.line) : "saveframe " + sf.name();
                check_reference(t.value, detail::qualify(sf.tag_prefix(), t.name), std::move(where));
            }

            for (auto const & l : sf.loops())
            {
                auto tag_names = l.tag_names();
                for (size_t r = 0; r < l.data().size(); ++r)
                    for (size_t c = 0; c < l.data()[r].size(); ++c)
                        check_reference(l.data()[r][c], tag_names[c],
                                        "row " + std::to_string(r + 1) + " tag " + std::to_string(c + 1) +
                                        " of loop _" + l.category());
            }
        }

        for (auto const & sf : e.saveframes())
        {
            auto sub = validate(sf, s);
            issues.insert(issues.end(), std::make_move_iterator(sub.begin()), std::make_move_iterator(sub.end()));
        }
        return issues;
    }

} // namespace nmrstar

#endif // NMRSTAR_VALIDATE_HPP
