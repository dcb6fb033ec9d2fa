// rtini_document.hpp - Round-trip INI - Authoritative Document Model
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef RTINI_DOCUMENT_HPP
#define RTINI_DOCUMENT_HPP

#include "rtini_core.hpp"

#include <span>

namespace rtini
{
//========================================================================
// Nodes
//========================================================================

    // Comments are the lines textually preceding the node, blank lines the
    // empty lines textually following it. Both are kept verbatim.

    struct property
    {
        std::vector<std::string> comments;
        std::string              key;
        value                    val;
        std::vector<std::string> blank_lines;
        source_location          loc;

        // Locations are not content.
        bool operator==(property const & o) const
        {
            return comments == o.comments && key == o.key && val == o.val && blank_lines == o.blank_lines;
        }
    };

    struct section
    {
        std::vector<std::string> comments;
        std::string              name;
        std::vector<std::string> blank_lines;
        std::vector<property>    properties;
        source_location          loc;

        bool operator==(section const & o) const
        {
            return comments == o.comments && name == o.name && blank_lines == o.blank_lines
                && properties == o.properties;
        }
    };

    namespace detail
    {
        struct parser_impl;

        // Index of the first node whose name matches, or npos.
        template <typename Node, typename Name>
        size_t index_of(std::vector<Node> const & nodes, std::string_view name, Name node_name)
        {
            for (size_t i = 0; i < nodes.size(); ++i)
            {
                if (node_name(nodes[i]) == name)
                    return i;
            }
            return static_cast<size_t>(-1);
        }

        inline size_t property_index(std::vector<property> const & props, std::string_view key)
        {
            return index_of(props, key, [](property const & p) -> std::string_view { return p.key; });
        }

        inline size_t section_index(std::vector<section> const & sects, std::string_view name)
        {
            return index_of(sects, name, [](section const & s) -> std::string_view { return s.name; });
        }
    }

//========================================================================
// Document
//========================================================================

    // Sole owner of every node. Pointers handed out by lookup() and
    // lookup_section() stay valid until the next structural edit.
    class document
    {
    public:
        document() = default;

        //------------------------------------------------------------------------
        // Read-only views
        //------------------------------------------------------------------------

        // Blank lines met before any content. Kept but never rendered.
        std::span<const std::string> blank_lines() const noexcept { return blank_lines_; }

        std::span<const property> properties() const noexcept { return properties_; }

        std::span<const section> sections() const noexcept { return sections_; }

        bool empty() const noexcept { return properties_.empty() && sections_.empty(); }

        size_t property_count() const noexcept
        {
            size_t n = properties_.size();
            for (auto const & s : sections_)
                n += s.properties.size();
            return n;
        }

        //------------------------------------------------------------------------
        // Lookup by path
        //------------------------------------------------------------------------

        // "key" searches the global scope, "section/key" the first section
        // with that name. Returns nullptr when either part is absent.
        property const * lookup(std::string_view path) const noexcept;
        property *       lookup(std::string_view path) noexcept;

        section const * lookup_section(std::string_view name) const noexcept;
        section *       lookup_section(std::string_view name) noexcept;

        bool operator==(document const & o) const
        {
            return blank_lines_ == o.blank_lines_ && properties_ == o.properties_ && sections_ == o.sections_;
        }

    private:
        std::vector<std::string> blank_lines_;
        std::vector<property>    properties_;
        std::vector<section>     sections_;

        friend class editor;
        friend struct detail::parser_impl;
    };

//========================================================================
// document member implementations
//========================================================================

    inline property const * document::lookup(std::string_view path) const noexcept
    {
        auto [sect, key] = detail::split_path(path);

        if (sect.empty())
        {
            size_t i = detail::property_index(properties_, key);
            return i < properties_.size() ? &properties_[i] : nullptr;
        }

        auto const * s = lookup_section(sect);
        if (!s)
            return nullptr;

        size_t i = detail::property_index(s->properties, key);
        return i < s->properties.size() ? &s->properties[i] : nullptr;
    }

    inline property * document::lookup(std::string_view path) noexcept
    {
        return const_cast<property *>(std::as_const(*this).lookup(path));
    }

    inline section const * document::lookup_section(std::string_view name) const noexcept
    {
        size_t i = detail::section_index(sections_, name);
        return i < sections_.size() ? &sections_[i] : nullptr;
    }

    inline section * document::lookup_section(std::string_view name) noexcept
    {
        return const_cast<section *>(std::as_const(*this).lookup_section(name));
    }

} // namespace rtini

#endif // RTINI_DOCUMENT_HPP
