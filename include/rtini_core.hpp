// rtini_core.hpp - Round-trip INI - Core Data Structures
// Version 0.3.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef RTINI_CORE_HPP
#define RTINI_CORE_HPP

#include <array>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace rtini
{
//========================================================================
// Values
//========================================================================

    struct string_value
    {
        std::string text;

        bool operator==(string_value const &) const = default;
    };

    struct number_value
    {
        double magnitude {0.0};

        bool operator==(number_value const &) const = default;
    };

    // Closed union. Every consumer visits it exhaustively; a new alternative
    // must fail to compile wherever it is not handled.
    using value = std::variant<string_value, number_value>;

    enum class value_type
    {
        string,
        number
    };

    template <typename>
    inline constexpr bool always_false = false;

    inline value_type held_type(value const & v)
    {
        return std::visit([](auto const & alt) -> value_type
        {
            using T = std::decay_t<decltype(alt)>;
            if constexpr (std::is_same_v<T, string_value>)
                return value_type::string;
            else if constexpr (std::is_same_v<T, number_value>)
                return value_type::number;
            else
                static_assert(always_false<T>, "unhandled value alternative");
        }, v);
    }

    // Numbers are written unsigned and in fixed notation, so only finite,
    // non-negative magnitudes can be rendered.
    inline bool is_valid_magnitude(double magnitude)
    {
        return std::isfinite(magnitude) && !std::signbit(magnitude);
    }

    inline value make_string(std::string text) { return string_value{ std::move(text) }; }

    // nullopt for a magnitude that is negative, infinite or NaN. Negative zero
    // becomes zero.
    inline std::optional<value> make_number(double magnitude)
    {
        if (magnitude == 0.0)
            magnitude = 0.0;
        if (!is_valid_magnitude(magnitude))
            return std::nullopt;
        return value{ number_value{ magnitude } };
    }

    // False for a number_value built directly around an unrenderable magnitude.
    inline bool is_renderable(value const & v)
    {
        auto const * n = std::get_if<number_value>(&v);
        return !n || is_valid_magnitude(n->magnitude);
    }

//========================================================================
// Source positions and errors
//========================================================================

    struct source_location
    {
        size_t line   {1};
        size_t column {1};
        size_t offset {0};

        bool operator==(source_location const &) const = default;
    };

    template <typename Kind>
    struct error
    {
        Kind                     kind;
        source_location          loc;
        std::string              message;
        std::string              source_label;
        std::vector<std::string> expected;

        std::string to_string() const
        {
            std::ostringstream out;
            if (!source_label.empty())
                out << source_label << ':';
            out << loc.line << ':' << loc.column << ": " << message;

            if (!expected.empty())
            {
                out << " (expected ";
                for (size_t i = 0; i < expected.size(); ++i)
                {
                    if (i > 0) out << ", ";
                    out << expected[i];
                }
                out << ')';
            }
            return out.str();
        }
    };

//========================================================================
// Document generation context
//========================================================================

    template <typename T, typename Error>
    struct context
    {
        std::optional<T>   result;
        std::vector<Error> errors;

        bool has_errors() const { return !errors.empty(); }
    };

//========================================================================
// UTILITY FUNCTIONS
//========================================================================

    namespace detail
    {
        constexpr size_t MAX_INPUT_BYTES = 64u * 1024u * 1024u;

        inline bool is_ident_start(char c)
        {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        }

        inline bool is_ident_char(char c)
        {
            return is_ident_start(c) || (c >= '0' && c <= '9') || c == '_';
        }

        inline bool is_digit(char c) { return c >= '0' && c <= '9'; }

        inline bool is_identifier(std::string_view s)
        {
            if (s.empty() || !is_ident_start(s.front()))
                return false;
            for (char c : s)
            {
                if (!is_ident_char(c))
                    return false;
            }
            return true;
        }

        inline bool is_hex_digit(char c)
        {
            return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        }

        inline unsigned hex_value(char c)
        {
            if (is_digit(c)) return static_cast<unsigned>(c - '0');
            if (c >= 'a' && c <= 'f') return static_cast<unsigned>(c - 'a' + 10);
            return static_cast<unsigned>(c - 'A' + 10);
        }

        inline void append_utf8(std::string & out, char32_t cp)
        {
            if (cp < 0x80)
            {
                out += static_cast<char>(cp);
            }
            else if (cp < 0x800)
            {
                out += static_cast<char>(0xC0 | (cp >> 6));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
            else if (cp < 0x10000)
            {
                out += static_cast<char>(0xE0 | (cp >> 12));
                out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
            else
            {
                out += static_cast<char>(0xF0 | (cp >> 18));
                out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
                out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
        }

        // Decodes the body of a quoted literal (quotes already stripped).
        // On failure returns nullopt and sets bad_at to the offending offset
        // within body.
        inline std::optional<std::string> unescape(std::string_view body, size_t & bad_at)
        {
            std::string out;
            out.reserve(body.size());

            for (size_t i = 0; i < body.size(); ++i)
            {
                char c = body[i];
                if (c != '\\')
                {
                    out += c;
                    continue;
                }

                bad_at = i;
                if (++i >= body.size())
                    return std::nullopt;

                switch (body[i])
                {
                    case 'a':  out += '\a'; break;
                    case 'b':  out += '\b'; break;
                    case 'f':  out += '\f'; break;
                    case 'n':  out += '\n'; break;
                    case 'r':  out += '\r'; break;
                    case 't':  out += '\t'; break;
                    case 'v':  out += '\v'; break;
                    case '\\': out += '\\'; break;
                    case '"':  out += '"';  break;

                    case 'x':
                    {
                        if (i + 2 >= body.size())
                            return std::nullopt;
                        if (!is_hex_digit(body[i + 1]) || !is_hex_digit(body[i + 2]))
                            return std::nullopt;
                        out += static_cast<char>(hex_value(body[i + 1]) * 16 + hex_value(body[i + 2]));
                        i += 2;
                        break;
                    }

                    case 'u':
                    case 'U':
                    {
                        size_t digits = body[i] == 'u' ? 4 : 8;
                        if (i + digits >= body.size())
                            return std::nullopt;
                        char32_t cp = 0;
                        for (size_t d = 1; d <= digits; ++d)
                        {
                            if (!is_hex_digit(body[i + d]))
                                return std::nullopt;
                            cp = cp * 16 + hex_value(body[i + d]);
                        }
                        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
                            return std::nullopt;
                        append_utf8(out, cp);
                        i += digits;
                        break;
                    }

                    default:
                    {
                        // three octal digits, value <= 0377
                        if (i + 2 >= body.size())
                            return std::nullopt;
                        unsigned v = 0;
                        for (size_t d = 0; d < 3; ++d)
                        {
                            char o = body[i + d];
                            if (o < '0' || o > '7')
                                return std::nullopt;
                            v = v * 8 + static_cast<unsigned>(o - '0');
                        }
                        if (v > 0377)
                            return std::nullopt;
                        out += static_cast<char>(v);
                        i += 2;
                        break;
                    }
                }
            }

            return out;
        }

        inline std::string quote(std::string_view s)
        {
            static constexpr char hex[] = "0123456789abcdef";

            std::string out;
            out.reserve(s.size() + 2);
            out += '"';

            for (char ch : s)
            {
                auto c = static_cast<unsigned char>(ch);
                switch (ch)
                {
                    case '"':  out += "\\\""; break;
                    case '\\': out += "\\\\"; break;
                    case '\a': out += "\\a";  break;
                    case '\b': out += "\\b";  break;
                    case '\f': out += "\\f";  break;
                    case '\n': out += "\\n";  break;
                    case '\r': out += "\\r";  break;
                    case '\t': out += "\\t";  break;
                    case '\v': out += "\\v";  break;
                    default:
                        if (c < 0x20 || c == 0x7F)
                        {
                            out += "\\x";
                            out += hex[c >> 4];
                            out += hex[c & 0x0F];
                        }
                        else
                        {
                            out += ch;
                        }
                }
            }

            out += '"';
            return out;
        }

        // Shortest fixed-notation text that reads back as the same double.
        // The largest finite double takes 309 digits.
        inline std::string format_number(double d)
        {
            std::array<char, 1024> buf{};
            auto res = std::to_chars(buf.data(), buf.data() + buf.size(), d, std::chars_format::fixed);
            return std::string(buf.data(), res.ptr);
        }

        inline std::optional<double> parse_number(std::string_view s)
        {
            double d = 0.0;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), d, std::chars_format::fixed);
            if (ec != std::errc{} || ptr != s.data() + s.size())
                return std::nullopt;
            return d;
        }

        // "a/b/c" -> { "a/b", "c" }, "c" -> { "", "c" }, "/c" -> { "", "c" }
        inline std::pair<std::string_view, std::string_view> split_path(std::string_view path)
        {
            auto slash = path.rfind('/');
            if (slash == std::string_view::npos)
                return { {}, path };
            return { path.substr(0, slash), path.substr(slash + 1) };
        }

        inline bool is_comment_text(std::string_view s)
        {
            return !s.empty() && (s.front() == '#' || s.front() == ';');
        }
    }

} // namespace rtini

#endif // RTINI_CORE_HPP
