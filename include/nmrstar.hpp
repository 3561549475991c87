// nmrstar.hpp - NMR-STAR reader/writer
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

//========================================================================
// Core Principles:
//========================================================================
//
// The Round-Trip Principle
// ------------------------
// Values are stored exactly as read, minus their delimiters.
// Formatting picks the quoting; parsing what was formatted gives the
// same tree back.
//
//
// The Null-Marker Principle
// -------------------------
// '.' and '?' are ordinary values to the document model.
// Only the schema layer gives them meaning.
//
//
// The Valid-State Principle
// -------------------------
// A mutation that would produce unformattable text is refused where it is
// made, and leaves the node unchanged.
//
//
// The Quiet-Schema Principle
// --------------------------
// Parsing never consults a schema. Validation reports; it never raises.
//
//========================================================================


#ifndef NMRSTAR_READER_WRITER
#define NMRSTAR_READER_WRITER

#include "nmrstar_core.hpp"
#include "nmrstar_tokenizer.hpp"
#include "nmrstar_quote.hpp"
#include "nmrstar_document.hpp"
#include "nmrstar_parser.hpp"
#include "nmrstar_serializer.hpp"
#include "nmrstar_compare.hpp"
#include "nmrstar_schema.hpp"
#include "nmrstar_validate.hpp"
#include "nmrstar_editor.hpp"
#include "nmrstar_query.hpp"
#include "nmrstar_json.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace nmrstar
{
//========================================================================
// Document loading
//========================================================================

    inline parse_context load(std::string_view text, parse_options opts = {})
    {
        return parse(text, opts);
    }

    inline parse_context load_file(std::filesystem::path const & path, parse_options opts = {})
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
        {
            parse_context out;
            out.errors.push_back({ parse_error_kind::io_failure, {},
                                   "cannot open '" + path.string() + "' for reading" });
            return out;
        }

        std::ostringstream buffer;
        buffer << in.rdbuf();
        if (in.bad())
        {
            parse_context out;
            out.errors.push_back({ parse_error_kind::io_failure, {},
                                   "failed reading '" + path.string() + "'" });
            return out;
        }

        return parse(buffer.str(), opts);
    }

}

#endif
