// rtini_serializer.hpp - Round-trip INI - Serializer
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef RTINI_SERIALIZER_HPP
#define RTINI_SERIALIZER_HPP

#include "rtini_core.hpp"
#include "rtini_document.hpp"

#include <ostream>

namespace rtini
{
    //========================================================================
    // SERIALIZER API
    //========================================================================

    struct serializer_options
    {
        bool emit_comments       = true;
        bool emit_blank_lines    = true;
        bool compact_blank_lines = false;  // at most one blank line per node
    };

    // Canonical rendering: no leading blank lines, one newline after every
    // line, "[name]" headers and "key = value" pairs. Comments are written
    // before their node and blank lines after it, verbatim and in order.
    class serializer
    {
    public:
        explicit serializer(document const & doc, serializer_options opts = {})
            : doc_(doc), opts_(opts)
        {}

        void write(std::ostream & out) const;

        std::string str() const
        {
            std::ostringstream out;
            write(out);
            return out.str();
        }

    private:
        document const &   doc_;
        serializer_options opts_;

        void write_comments(std::ostream & out, std::vector<std::string> const & comments) const;
        void write_blank_lines(std::ostream & out, std::vector<std::string> const & blanks) const;
        void write_property(std::ostream & out, property const & prop) const;
        void write_section(std::ostream & out, section const & sect) const;
        static void write_value(std::ostream & out, value const & val);
    };

    inline std::string serialize(document const & doc, serializer_options opts = {});

    //========================================================================
    // SERIALIZER IMPLEMENTATION
    //========================================================================

    inline void serializer::write(std::ostream & out) const
    {
        // The document's own leading blank lines are not rendered.
        for (auto const & prop : doc_.properties())
            write_property(out, prop);

        for (auto const & sect : doc_.sections())
            write_section(out, sect);
    }

    inline void serializer::write_comments(std::ostream & out, std::vector<std::string> const & comments) const
    {
        if (!opts_.emit_comments)
            return;

        for (auto const & line : comments)
            out << line << '\n';
    }

    inline void serializer::write_blank_lines(std::ostream & out, std::vector<std::string> const & blanks) const
    {
        if (!opts_.emit_blank_lines || blanks.empty())
            return;

        size_t n = opts_.compact_blank_lines ? 1 : blanks.size();
        for (size_t i = 0; i < n; ++i)
            out << '\n';
    }

    inline void serializer::write_property(std::ostream & out, property const & prop) const
    {
        write_comments(out, prop.comments);

        out << prop.key << " = ";
        write_value(out, prop.val);
        out << '\n';

        write_blank_lines(out, prop.blank_lines);
    }

    inline void serializer::write_section(std::ostream & out, section const & sect) const
    {
        write_comments(out, sect.comments);

        out << '[' << sect.name << "]\n";

        write_blank_lines(out, sect.blank_lines);

        for (auto const & prop : sect.properties)
            write_property(out, prop);
    }

    inline void serializer::write_value(std::ostream & out, value const & val)
    {
        std::visit([&out](auto const & v)
        {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, string_value>)
                out << detail::quote(v.text);
            else if constexpr (std::is_same_v<T, number_value>)
                out << detail::format_number(v.magnitude);
            else
                static_assert(always_false<T>, "unhandled value alternative");
        }, val);
    }

    //========================================================================
    // PUBLIC SERIALIZER API IMPLEMENTATION
    //========================================================================

    inline std::string serialize(document const & doc, serializer_options opts)
    {
        return serializer(doc, opts).str();
    }

} // namespace rtini

#endif // RTINI_SERIALIZER_HPP
