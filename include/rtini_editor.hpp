// rtini_editor.hpp - Round-trip INI - Document Editor
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef RTINI_EDITOR_HPP
#define RTINI_EDITOR_HPP

#include "rtini_document.hpp"
#include "rtini_log.hpp"

namespace rtini
{
    // Structural edits by path. Absent targets are never an error: add
    // creates what is missing, the removals do nothing.
    //
    // Keys and section names must be identifiers ([A-Za-z][A-Za-z0-9_]*), so
    // that whatever the editor builds renders to text that parses again.
    class editor
    {
    public:
        explicit editor(document& doc) noexcept
            : doc_(doc)
        {}

    //============================================================
    // Properties
    //============================================================

        // Replaces the value of the first matching property, keeping its
        // comments and blank lines. Otherwise appends a bare property to the
        // scope, creating the section at the end of the document if needed.
        // Returns false, changing nothing, when the key or the section name is
        // not an identifier or the value is a number that cannot be rendered.
        bool add( std::string_view path, value v );

        // Removes the first matching property with its comments and blank
        // lines. Never touches a section of the same name.
        void remove( std::string_view path );

    //============================================================
    // Sections
    //============================================================

        // Removes the first section with that name and everything it owns.
        // Never touches a global property of the same name.
        void remove_section( std::string_view name );

    //============================================================
    // Comments
    //============================================================

        // Lines lacking a '#' or ';' introducer get "# " prepended. A line
        // containing a newline rejects the whole call.
        bool set_comments( std::string_view path, std::vector<std::string> lines );
        bool append_comment( std::string_view path, std::string line );
        bool set_section_comments( std::string_view name, std::vector<std::string> lines );

    private:

        document& doc_;

    //========================================================
    // Internal helpers; not exposed for clients
    //========================================================

        std::vector<property>* scope_of( std::string_view section_name ) noexcept;

        static bool normalise_comment( std::string& line );
        static bool normalise_comments( std::vector<std::string>& lines );
    };

//================================================================================================================
//
// Editor implementations
//
//================================================================================================================

//========================================================
// Internal helpers; not exposed for clients
//========================================================

    inline std::vector<property>* editor::scope_of(std::string_view section_name) noexcept
    {
        if (section_name.empty())
            return &doc_.properties_;

        auto* sect = doc_.lookup_section(section_name);
        return sect ? &sect->properties : nullptr;
    }

    inline bool editor::normalise_comment(std::string& line)
    {
        if (line.find_first_of("\r\n") != std::string::npos)
            return false;

        if (!detail::is_comment_text(line))
            line.insert(0, "# ");

        return true;
    }

    inline bool editor::normalise_comments(std::vector<std::string>& lines)
    {
        for (auto& line : lines)
        {
            if (!normalise_comment(line))
                return false;
        }
        return true;
    }

//============================================================
// Properties
//============================================================

    inline bool editor::add(std::string_view path, value v)
    {
        auto [sect, key] = detail::split_path(path);

        if (!detail::is_identifier(key) || (!sect.empty() && !detail::is_identifier(sect)) || !is_renderable(v))
        {
            RTINI_LOG(debug) << "rejected add at \"" << path << "\"";
            return false;
        }

        if (auto* props = scope_of(sect))
        {
            size_t i = detail::property_index(*props, key);
            if (i < props->size())
            {
                (*props)[i].val = std::move(v);
                return true;
            }

            property prop;
            prop.key = std::string(key);
            prop.val = std::move(v);
            props->push_back(std::move(prop));
            return true;
        }

        section created;
        created.name = std::string(sect);

        property prop;
        prop.key = std::string(key);
        prop.val = std::move(v);
        created.properties.push_back(std::move(prop));

        doc_.sections_.push_back(std::move(created));

        RTINI_LOG(debug) << "created section \"" << sect << "\" for key \"" << key << "\"";
        return true;
    }

    inline void editor::remove(std::string_view path)
    {
        auto [sect, key] = detail::split_path(path);

        auto* props = scope_of(sect);
        if (!props)
            return;

        size_t i = detail::property_index(*props, key);
        if (i >= props->size())
            return;

        props->erase(props->begin() + static_cast<std::ptrdiff_t>(i));

        RTINI_LOG(debug) << "removed property \"" << path << "\"";
    }

//============================================================
// Sections
//============================================================

    inline void editor::remove_section(std::string_view name)
    {
        size_t i = detail::section_index(doc_.sections_, name);
        if (i >= doc_.sections_.size())
            return;

        doc_.sections_.erase(doc_.sections_.begin() + static_cast<std::ptrdiff_t>(i));

        RTINI_LOG(debug) << "removed section \"" << name << "\"";
    }

//============================================================
// Comments
//============================================================

    inline bool editor::set_comments(std::string_view path, std::vector<std::string> lines)
    {
        auto* prop = doc_.lookup(path);
        if (!prop || !normalise_comments(lines))
            return false;

        prop->comments = std::move(lines);
        return true;
    }

    inline bool editor::append_comment(std::string_view path, std::string line)
    {
        auto* prop = doc_.lookup(path);
        if (!prop || !normalise_comment(line))
            return false;

        prop->comments.push_back(std::move(line));
        return true;
    }

    inline bool editor::set_section_comments(std::string_view name, std::vector<std::string> lines)
    {
        auto* sect = doc_.lookup_section(name);
        if (!sect || !normalise_comments(lines))
            return false;

        sect->comments = std::move(lines);
        return true;
    }

} // namespace rtini

#endif // RTINI_EDITOR_HPP
