// rtini_parser.hpp - Round-trip INI - Parser
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

//========================================================================
// Grammar
//========================================================================
//
//   document  := newline* property* section*
//   property  := (comment newline)* ident '=' value newline? newline*
//   section   := (comment newline)* '[' ident ']' newline? newline* property*
//   value     := string | number
//
// A comment run is shared by the two decorated productions; which one it
// belongs to is decided by the first token after the run.
//
//========================================================================

#ifndef RTINI_PARSER_HPP
#define RTINI_PARSER_HPP

#include "rtini_core.hpp"
#include "rtini_lexer.hpp"
#include "rtini_document.hpp"
#include "rtini_log.hpp"

#include <cstdlib>

namespace rtini
{
//========================================================================
// PARSER API
//========================================================================

    struct parse_options
    {
        size_t max_input_bytes = detail::MAX_INPUT_BYTES;
        bool   accept_crlf     = true;
    };

    enum class parse_error_kind
    {
        unexpected_token,
        expected_value,
        unclosed_section,
        orphan_comment,
        input_too_large
    };

    using parse_error = error<parse_error_kind>;

    using any_error = std::variant<lex_error, parse_error>;

    inline bool is_lex_error(any_error const & e) { return std::holds_alternative<lex_error>(e); }
    inline bool is_parse_error(any_error const & e) { return std::holds_alternative<parse_error>(e); }

    inline lex_error_kind get_lex_error(any_error const & e) { return std::get<lex_error>(e).kind; }
    inline parse_error_kind get_parse_error(any_error const & e) { return std::get<parse_error>(e).kind; }

    inline source_location error_location(any_error const & e)
    {
        return std::visit([](auto const & err) { return err.loc; }, e);
    }

    inline std::string describe(any_error const & e)
    {
        return std::visit([](auto const & err) { return err.to_string(); }, e);
    }

    using parse_context = context<document, any_error>;

    // source_label only decorates error messages.
    inline parse_context parse(std::string_view source_label, std::string_view text, parse_options opts = {});

//========================================================================
// Grammar definition
//========================================================================

    namespace detail
    {
        struct decorated_production
        {
            std::string_view name;
            token_kind       lead;
        };

        // The productions a comment run may decorate, keyed by the token that
        // follows the run.
        inline constexpr std::array<decorated_production, 2> DECORATED_PRODUCTIONS =
        {{
            { "property",       token_kind::ident    },
            { "section header", token_kind::lbracket },
        }};

        inline bool grammar_is_well_formed()
        {
            auto clashes_with_other_rules = [](char c)
            {
                return is_ident_char(c) || c == '"' || c == '\n' || c == '\r'
                    || COMMENT_INTRODUCERS.find(c) != std::string_view::npos
                    || HORIZONTAL_SPACE.find(c) != std::string_view::npos;
            };

            for (size_t i = 0; i < PUNCTUATION.size(); ++i)
            {
                if (clashes_with_other_rules(PUNCTUATION[i].ch))
                    return false;

                for (size_t j = i + 1; j < PUNCTUATION.size(); ++j)
                {
                    if (PUNCTUATION[i].ch == PUNCTUATION[j].ch || PUNCTUATION[i].kind == PUNCTUATION[j].kind)
                        return false;
                }
            }

            for (char c : COMMENT_INTRODUCERS)
            {
                if (is_ident_char(c) || c == '"' || HORIZONTAL_SPACE.find(c) != std::string_view::npos)
                    return false;
            }

            auto lexer_produces = [](token_kind k)
            {
                if (k == token_kind::ident)
                    return true;
                for (auto const & rule : PUNCTUATION)
                {
                    if (rule.kind == k)
                        return true;
                }
                return false;
            };

            for (size_t i = 0; i < DECORATED_PRODUCTIONS.size(); ++i)
            {
                if (!lexer_produces(DECORATED_PRODUCTIONS[i].lead))
                    return false;

                for (size_t j = i + 1; j < DECORATED_PRODUCTIONS.size(); ++j)
                {
                    if (DECORATED_PRODUCTIONS[i].lead == DECORATED_PRODUCTIONS[j].lead)
                        return false;
                }
            }

            return true;
        }

        // Runs once per process and aborts on a malformed grammar. Never
        // depends on input.
        inline void require_well_formed_grammar()
        {
            static bool const checked = []
            {
                if (!grammar_is_well_formed())
                {
                    RTINI_LOG(error) << "grammar definition is inconsistent; aborting";
                    std::abort();
                }
                return true;
            }();
            (void)checked;
        }
    }

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        struct parser_impl
        {
            parser_impl(std::string_view label, std::string_view text, parse_options const & opts)
                : label_(label), lex_(text, opts.accept_crlf)
            {}

            // What follows a run of (comment newline) pairs starting at the
            // current position. distance is the number of tokens in the run.
            struct lookahead
            {
                token_kind kind;
                size_t     distance;
            };

            lookahead classify_decorated();

            bool parse_document(document & doc);

            std::optional<any_error> failure;

            token const & peek(size_t n = 0);

        private:
            std::string        label_;
            lexer              lex_;
            std::vector<token> buffer_;
            size_t             head_ {0};

            token take();

            bool parse_comments(std::vector<std::string> & into);
            bool parse_blank_lines(std::vector<std::string> & into);
            bool parse_property(std::vector<property> & into);
            bool parse_section(std::vector<section> & into);
            bool parse_value(value & out);

            bool fail(parse_error_kind kind, token const & at, std::string message, std::vector<std::string> expected = {});
            bool fail_lexical(lex_error_kind kind, source_location at, std::string message);
            bool expect(token_kind kind, parse_error_kind on_error, std::string const & what);
        };

//---------------------------------------------------------------------------

        inline token const & parser_impl::peek(size_t n)
        {
            while (buffer_.size() <= head_ + n)
            {
                if (!buffer_.empty())
                {
                    auto last = buffer_.back().kind;
                    if (last == token_kind::end || last == token_kind::invalid)
                        return buffer_.back();
                }
                buffer_.push_back(lex_.next());
            }
            return buffer_[head_ + n];
        }

        inline token parser_impl::take()
        {
            token t = peek();
            if (head_ < buffer_.size() && t.kind != token_kind::end && t.kind != token_kind::invalid)
                ++head_;

            // drop consumed tokens once the window is drained
            if (head_ == buffer_.size())
            {
                buffer_.clear();
                head_ = 0;
            }
            return t;
        }

//---------------------------------------------------------------------------

        inline parser_impl::lookahead parser_impl::classify_decorated()
        {
            size_t i = 0;
            while (peek(i).kind == token_kind::comment && peek(i + 1).kind == token_kind::newline)
                i += 2;
            return lookahead{ peek(i).kind, i };
        }

//---------------------------------------------------------------------------

        inline bool parser_impl::fail(
            parse_error_kind kind,
            token const & at,
            std::string message,
            std::vector<std::string> expected)
        {
            if (at.kind == token_kind::invalid && lex_.error())
            {
                lex_error err = *lex_.error();
                err.source_label = label_;
                failure = std::move(err);
                return false;
            }

            failure = parse_error{ kind, at.loc, std::move(message), label_, std::move(expected) };
            return false;
        }

        inline bool parser_impl::fail_lexical(lex_error_kind kind, source_location at, std::string message)
        {
            failure = lex_error{ kind, at, std::move(message), label_, {} };
            return false;
        }

        inline bool parser_impl::expect(token_kind kind, parse_error_kind on_error, std::string const & what)
        {
            token const & t = peek();
            if (t.kind != kind)
            {
                return fail(on_error, t,
                            "unexpected " + std::string(token_kind_name(t.kind)) + " " + what,
                            { std::string(token_kind_name(kind)) });
            }
            take();
            return true;
        }

//---------------------------------------------------------------------------

        inline bool parser_impl::parse_document(document & doc)
        {
            if (!parse_blank_lines(doc.blank_lines_))
                return false;

            while (classify_decorated().kind == token_kind::ident)
            {
                if (!parse_property(doc.properties_))
                    return false;
            }

            while (classify_decorated().kind == token_kind::lbracket)
            {
                if (!parse_section(doc.sections_))
                    return false;
            }

            auto la = classify_decorated();
            if (la.distance == 0 && la.kind == token_kind::end)
                return true;

            token const & t = peek();

            if (la.kind == token_kind::invalid)
                return fail(parse_error_kind::unexpected_token, peek(la.distance), {});

            if (t.kind == token_kind::comment)
            {
                return fail(parse_error_kind::orphan_comment, t,
                            "comment is not followed by a property or a section header",
                            { "property", "section header" });
            }

            return fail(parse_error_kind::unexpected_token, t,
                        "unexpected " + std::string(token_kind_name(t.kind)),
                        { "property", "section header", "end of input" });
        }

        inline bool parser_impl::parse_comments(std::vector<std::string> & into)
        {
            while (peek().kind == token_kind::comment)
            {
                into.emplace_back(take().text);
                if (!expect(token_kind::newline, parse_error_kind::orphan_comment, "after comment"))
                    return false;
            }
            return true;
        }

        inline bool parser_impl::parse_blank_lines(std::vector<std::string> & into)
        {
            while (peek().kind == token_kind::newline)
                into.emplace_back(take().text);
            return peek().kind != token_kind::invalid || fail(parse_error_kind::unexpected_token, peek(), {});
        }

        inline bool parser_impl::parse_property(std::vector<property> & into)
        {
            property prop;
            prop.loc = peek().loc;

            if (!parse_comments(prop.comments))
                return false;

            token const & name = peek();
            if (name.kind != token_kind::ident)
            {
                return fail(parse_error_kind::unexpected_token, name,
                            "unexpected " + std::string(token_kind_name(name.kind)),
                            { "property key" });
            }
            prop.key = std::string(take().text);

            if (!expect(token_kind::equals, parse_error_kind::unexpected_token, "after key \"" + prop.key + "\""))
                return false;

            if (!parse_value(prop.val))
                return false;

            if (peek().kind == token_kind::newline)
                take();

            if (!parse_blank_lines(prop.blank_lines))
                return false;

            into.push_back(std::move(prop));
            return true;
        }

        inline bool parser_impl::parse_section(std::vector<section> & into)
        {
            section sect;
            sect.loc = peek().loc;

            if (!parse_comments(sect.comments))
                return false;

            if (!expect(token_kind::lbracket, parse_error_kind::unexpected_token, "before section name"))
                return false;

            token const & name = peek();
            if (name.kind != token_kind::ident)
            {
                return fail(parse_error_kind::unexpected_token, name,
                            "unexpected " + std::string(token_kind_name(name.kind)) + " in section header",
                            { "section name" });
            }
            sect.name = std::string(take().text);

            if (!expect(token_kind::rbracket, parse_error_kind::unclosed_section, "in header of section \"" + sect.name + "\""))
                return false;

            if (peek().kind == token_kind::newline)
                take();

            if (!parse_blank_lines(sect.blank_lines))
                return false;

            while (classify_decorated().kind == token_kind::ident)
            {
                if (!parse_property(sect.properties))
                    return false;
            }

            into.push_back(std::move(sect));
            return true;
        }

        inline bool parser_impl::parse_value(value & out)
        {
            token const & t = peek();

            switch (t.kind)
            {
                case token_kind::string:
                {
                    std::string_view body = t.text.substr(1, t.text.size() - 2);
                    size_t bad_at = 0;
                    auto text = unescape(body, bad_at);
                    if (!text)
                    {
                        source_location at = t.loc;
                        at.column += 1 + bad_at;
                        at.offset += 1 + bad_at;
                        return fail_lexical(lex_error_kind::invalid_escape, at, "invalid escape sequence in string literal");
                    }
                    out = string_value{ std::move(*text) };
                    take();
                    return true;
                }

                case token_kind::number:
                {
                    auto d = parse_number(t.text);
                    if (!d)
                    {
                        return fail_lexical(lex_error_kind::malformed_number, t.loc,
                                            "number \"" + std::string(t.text) + "\" is out of range");
                    }
                    out = number_value{ *d };
                    take();
                    return true;
                }

                default:
                    return fail(parse_error_kind::expected_value, t,
                                "unexpected " + std::string(token_kind_name(t.kind)) + " where a value was expected",
                                { "string", "number" });
            }
        }

    } // namespace detail

//========================================================================
// Parser API implementation
//========================================================================

    inline parse_context parse(std::string_view source_label, std::string_view text, parse_options opts)
    {
        detail::require_well_formed_grammar();

        parse_context ctx;

        if (text.size() > opts.max_input_bytes)
        {
            ctx.errors.push_back(parse_error{
                parse_error_kind::input_too_large,
                {},
                "input of " + std::to_string(text.size()) + " bytes exceeds the limit of "
                    + std::to_string(opts.max_input_bytes),
                std::string(source_label),
                {}
            });
            RTINI_LOG(debug) << describe(ctx.errors.back());
            return ctx;
        }

        detail::parser_impl p(source_label, text, opts);
        document doc;

        if (!p.parse_document(doc))
        {
            ctx.errors.push_back(std::move(*p.failure));
            RTINI_LOG(debug) << "parse failed: " << describe(ctx.errors.back());
            return ctx;
        }

        RTINI_LOG(debug) << "parsed " << (source_label.empty() ? "<input>" : source_label) << ": "
                         << doc.properties().size() << " global properties, "
                         << doc.sections().size() << " sections";

        ctx.result = std::move(doc);
        return ctx;
    }

} // namespace rtini

#endif // RTINI_PARSER_HPP
