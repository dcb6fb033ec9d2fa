// rtini_lexer.hpp - Round-trip INI - Tokenizer
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef RTINI_LEXER_HPP
#define RTINI_LEXER_HPP

#include "rtini_core.hpp"

namespace rtini
{
//========================================================================
// Tokens
//========================================================================

    enum class token_kind
    {
        ident,
        string,
        number,
        lbracket,
        rbracket,
        equals,
        comment,
        newline,
        end,
        invalid
    };

    enum class lex_error_kind
    {
        unrecognised_character,
        unterminated_string,
        malformed_number,
        invalid_escape
    };

    using lex_error = error<lex_error_kind>;

    struct token
    {
        token_kind       kind {token_kind::end};
        std::string_view text;
        source_location  loc;
    };

    inline std::string_view token_kind_name(token_kind k)
    {
        switch (k)
        {
            case token_kind::ident:    return "identifier";
            case token_kind::string:   return "string";
            case token_kind::number:   return "number";
            case token_kind::lbracket: return "'['";
            case token_kind::rbracket: return "']'";
            case token_kind::equals:   return "'='";
            case token_kind::comment:  return "comment";
            case token_kind::newline:  return "newline";
            case token_kind::end:      return "end of input";
            case token_kind::invalid:  return "invalid token";
        }
        return "unknown";
    }

//========================================================================
// Lexical rules
//========================================================================

    namespace detail
    {
        struct punct_rule
        {
            char       ch;
            token_kind kind;
        };

        inline constexpr std::array<punct_rule, 3> PUNCTUATION =
        {{
            { '[', token_kind::lbracket },
            { ']', token_kind::rbracket },
            { '=', token_kind::equals   },
        }};

        inline constexpr std::string_view COMMENT_INTRODUCERS = "#;";
        inline constexpr std::string_view HORIZONTAL_SPACE    = " \t";
    }

//========================================================================
// LEXER
//========================================================================

    // Produces tokens on demand. Horizontal whitespace is skipped and never
    // reported. Once end or invalid has been produced it is produced forever,
    // until reset().
    class lexer
    {
    public:
        explicit lexer(std::string_view src, bool accept_crlf = true) noexcept
            : src_(src), accept_crlf_(accept_crlf)
        {}

        token next();

        void reset() noexcept
        {
            pos_ = 0;
            loc_ = {};
            error_.reset();
        }

        std::vector<token> tokenize();

        // Set once next() has produced token_kind::invalid.
        std::optional<lex_error> const & error() const noexcept { return error_; }

    private:
        std::string_view src_;
        bool             accept_crlf_;
        size_t           pos_ {0};
        source_location  loc_;
        std::optional<lex_error> error_;

        bool at_end() const noexcept { return pos_ >= src_.size(); }
        char peek(size_t ahead = 0) const noexcept
        {
            return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
        }

        void advance(size_t n) noexcept;

        token make(token_kind kind, size_t start, source_location at)
        {
            return token{ kind, src_.substr(start, pos_ - start), at };
        }

        token fail(lex_error_kind kind, source_location at, std::string message, std::vector<std::string> expected = {});

        token lex_string(source_location at);
        token lex_number(source_location at);
    };

//========================================================================
// Implementation
//========================================================================

    inline void lexer::advance(size_t n) noexcept
    {
        for (size_t i = 0; i < n && pos_ < src_.size(); ++i)
        {
            if (src_[pos_] == '\n')
            {
                ++loc_.line;
                loc_.column = 1;
            }
            else
            {
                ++loc_.column;
            }
            ++pos_;
            loc_.offset = pos_;
        }
    }

    inline token lexer::fail(
        lex_error_kind kind,
        source_location at,
        std::string message,
        std::vector<std::string> expected)
    {
        error_ = lex_error{ kind, at, std::move(message), {}, std::move(expected) };
        pos_ = src_.size();
        return token{ token_kind::invalid, {}, at };
    }

    inline token lexer::next()
    {
        if (error_)
            return token{ token_kind::invalid, {}, error_->loc };

        while (!at_end() && detail::HORIZONTAL_SPACE.find(peek()) != std::string_view::npos)
            advance(1);

        source_location at = loc_;
        size_t start = pos_;

        if (at_end())
            return token{ token_kind::end, {}, at };

        char c = peek();

        if (c == '\n')
        {
            advance(1);
            return make(token_kind::newline, start, at);
        }

        if (c == '\r' && accept_crlf_ && peek(1) == '\n')
        {
            advance(2);
            return make(token_kind::newline, start, at);
        }

        if (detail::COMMENT_INTRODUCERS.find(c) != std::string_view::npos)
        {
            // a comment never holds a '\r'; without CRLF support it is then rejected
            while (!at_end() && peek() != '\n' && peek() != '\r')
                advance(1);
            return make(token_kind::comment, start, at);
        }

        for (auto const & rule : detail::PUNCTUATION)
        {
            if (rule.ch == c)
            {
                advance(1);
                return make(rule.kind, start, at);
            }
        }

        if (detail::is_ident_start(c))
        {
            while (!at_end() && detail::is_ident_char(peek()))
                advance(1);
            return make(token_kind::ident, start, at);
        }

        if (c == '"')
            return lex_string(at);

        if (detail::is_digit(c))
            return lex_number(at);

        std::string shown = (static_cast<unsigned char>(c) < 0x20 || static_cast<unsigned char>(c) >= 0x7F)
            ? detail::quote(std::string_view(&c, 1))
            : std::string("'") + c + "'";

        return fail(lex_error_kind::unrecognised_character, at, "unrecognised character " + shown);
    }

    inline token lexer::lex_string(source_location at)
    {
        size_t start = pos_;
        advance(1); // opening quote

        while (!at_end())
        {
            char c = peek();
            if (c == '"')
            {
                advance(1);
                return make(token_kind::string, start, at);
            }
            if (c == '\n')
                break;
            if (c == '\\')
            {
                if (peek(1) == '\n' || pos_ + 1 >= src_.size())
                    break;
                advance(2);
                continue;
            }
            advance(1);
        }

        return fail(lex_error_kind::unterminated_string, at, "unterminated string literal", { "'\"'" });
    }

    inline token lexer::lex_number(source_location at)
    {
        size_t start = pos_;

        while (detail::is_digit(peek()))
            advance(1);

        if (peek() == '.')
        {
            if (!detail::is_digit(peek(1)))
            {
                advance(1);
                return fail(lex_error_kind::malformed_number, at,
                            "malformed number \"" + std::string(src_.substr(start, pos_ - start)) + "\"",
                            { "digit after '.'" });
            }

            advance(1);
            while (detail::is_digit(peek()))
                advance(1);
        }

        return make(token_kind::number, start, at);
    }

    inline std::vector<token> lexer::tokenize()
    {
        std::vector<token> out;
        for (;;)
        {
            token t = next();
            out.push_back(t);
            if (t.kind == token_kind::end || t.kind == token_kind::invalid)
                break;
        }
        return out;
    }

} // namespace rtini

#endif // RTINI_LEXER_HPP
