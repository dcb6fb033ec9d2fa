// rtini.hpp - Round-trip INI
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

//========================================================================
// rtini Core Principles:
//========================================================================
//
// The Placement Principle
// -----------------------
// A comment belongs to the node it precedes, a blank line to the node it
// follows. Editing a node carries its decoration with it; nothing else
// moves.
//
//
// The Canonical-Form Principle
// ----------------------------
// Spacing is normalised, content is not. Rendering the rendered text again
// yields the same text.
//
//
// The No-Partial-Tree Principle
// -----------------------------
// A parse either yields the whole document or the first error with its
// position. Edits cannot fail and rendering cannot fail.
//
//========================================================================


#ifndef RTINI_ROUND_TRIP_INI
#define RTINI_ROUND_TRIP_INI

#include "rtini_core.hpp"
#include "rtini_log.hpp"
#include "rtini_lexer.hpp"
#include "rtini_document.hpp"
#include "rtini_parser.hpp"
#include "rtini_editor.hpp"
#include "rtini_serializer.hpp"

namespace rtini
{
//========================================================================
// Reformatting
//========================================================================

    using format_context = context<std::string, any_error>;

    // Parse and render in one go, for formatter-style callers.
    inline format_context reformat(std::string_view source_label, std::string_view text,
                                   parse_options popt = {}, serializer_options sopt = {});


    inline format_context reformat(
        std::string_view source_label,
        std::string_view text,
        parse_options popt,
        serializer_options sopt)
    {
        format_context out{};

        auto ctx = parse(source_label, text, popt);
        out.errors = std::move(ctx.errors);

        if (ctx.result)
            out.result = serialize(*ctx.result, sopt);

        return out;
    }

}

#endif
