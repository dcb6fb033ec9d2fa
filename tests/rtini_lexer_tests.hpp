#ifndef RTINI_TESTS_LEXER__
#define RTINI_TESTS_LEXER__

#include "rtini_test_harness.hpp"
#include "../include/rtini_lexer.hpp"

namespace rtini::tests
{
//------------------------------------------
// HELPERS
//------------------------------------------

    inline std::vector<token_kind> kinds_of(std::vector<token> const & toks)
    {
        std::vector<token_kind> out;
        for (auto const & t : toks)
            out.push_back(t.kind);
        return out;
    }

//------------------------------------------
// TESTS
//------------------------------------------

static bool lexer_classifies_key_value_line()
{
    lexer lx("name = \"Bob\"\n");
    auto toks = lx.tokenize();

    std::vector<token_kind> want = {
        token_kind::ident, token_kind::equals, token_kind::string,
        token_kind::newline, token_kind::end
    };

    EXPECT(kinds_of(toks) == want, "unexpected token kinds");
    EXPECT(toks[0].text == "name", "identifier text");
    EXPECT(toks[2].text == "\"Bob\"", "string token keeps its quotes");
    return true;
}

static bool lexer_skips_horizontal_whitespace()
{
    lexer lx(" \t[ s1 ]\t ");
    auto toks = lx.tokenize();

    std::vector<token_kind> want = {
        token_kind::lbracket, token_kind::ident, token_kind::rbracket, token_kind::end
    };

    EXPECT(kinds_of(toks) == want, "whitespace must not be emitted");
    return true;
}

static bool lexer_reads_both_comment_introducers()
{
    lexer lx("# hash comment\n; semi comment");
    auto toks = lx.tokenize();

    EXPECT(toks.size() == 4, "two comments, one newline, end");
    EXPECT(toks[0].kind == token_kind::comment && toks[0].text == "# hash comment", "hash comment");
    EXPECT(toks[2].kind == token_kind::comment && toks[2].text == "; semi comment", "semicolon comment");
    return true;
}

static bool lexer_reads_integers_and_decimals()
{
    lexer lx("21 1.25 007");
    auto toks = lx.tokenize();

    EXPECT(toks.size() == 4, "three numbers and end");
    EXPECT(toks[0].kind == token_kind::number && toks[0].text == "21", "integer");
    EXPECT(toks[1].kind == token_kind::number && toks[1].text == "1.25", "decimal");
    EXPECT(toks[2].kind == token_kind::number && toks[2].text == "007", "leading zeros");
    return true;
}

static bool lexer_identifier_may_contain_digits_and_underscore()
{
    lexer lx("another_blank2");
    auto t = lx.next();

    EXPECT(t.kind == token_kind::ident, "identifier");
    EXPECT(t.text == "another_blank2", "whole identifier consumed");
    return true;
}

static bool lexer_tracks_positions()
{
    lexer lx("a = 1\n  [s]");
    auto toks = lx.tokenize();

    EXPECT(toks[0].loc.line == 1 && toks[0].loc.column == 1, "first token at 1:1");
    EXPECT(toks[2].loc.column == 5 && toks[2].loc.offset == 4, "number at column 5");
    EXPECT(toks[4].kind == token_kind::lbracket, "bracket after newline");
    EXPECT(toks[4].loc.line == 2 && toks[4].loc.column == 3, "bracket at 2:3");
    return true;
}

static bool lexer_string_with_escaped_quote_is_one_token()
{
    lexer lx(R"(s = "say \"hi\"")");
    auto toks = lx.tokenize();

    EXPECT(toks.size() == 4, "ident, equals, string, end");
    EXPECT(toks[2].text == R"("say \"hi\"")", "escaped quote does not terminate");
    return true;
}

static bool lexer_accepts_crlf_newlines()
{
    lexer lx("a = 1\r\nb = 2");
    auto toks = lx.tokenize();

    EXPECT(toks[3].kind == token_kind::newline, "CRLF is a newline");
    EXPECT(toks[3].text == "\r\n", "newline keeps its raw text");
    EXPECT(toks[4].kind == token_kind::ident && toks[4].loc.line == 2, "next line");
    return true;
}

static bool lexer_rejects_crlf_when_disabled()
{
    lexer lx("a = 1\r\n", false);
    auto toks = lx.tokenize();

    EXPECT(toks.back().kind == token_kind::invalid, "bare CR is not a token");
    EXPECT(lx.error().has_value(), "error recorded");
    EXPECT(lx.error()->kind == lex_error_kind::unrecognised_character, "wrong error kind");
    return true;
}

static bool lexer_comment_stops_at_carriage_return()
{
    lexer crlf("# c\r\na = 1");
    auto toks = crlf.tokenize();
    EXPECT(toks[0].kind == token_kind::comment && toks[0].text == "# c", "comment text excludes the CR");
    EXPECT(toks[1].kind == token_kind::newline, "CRLF after the comment");

    lexer plain("# c\r\na = 1", false);
    auto bad = plain.tokenize();
    EXPECT(bad[0].text == "# c", "comment text excludes the CR");
    EXPECT(bad.back().kind == token_kind::invalid, "bare CR is not a token");
    EXPECT(plain.error()->kind == lex_error_kind::unrecognised_character, "wrong error kind");
    EXPECT(plain.error()->loc.column == 4, "points at the CR");
    return true;
}

//------------------------------------------

static bool lexer_reports_unrecognised_character()
{
    lexer lx("a = @");
    auto toks = lx.tokenize();

    EXPECT(toks.back().kind == token_kind::invalid, "invalid token emitted");
    EXPECT(lx.error().has_value(), "error recorded");
    EXPECT(lx.error()->kind == lex_error_kind::unrecognised_character, "wrong kind");
    EXPECT(lx.error()->loc.column == 5, "error column");
    return true;
}

static bool lexer_reports_unterminated_string()
{
    lexer lx("a = \"open\nb = 2");
    auto toks = lx.tokenize();

    EXPECT(toks.back().kind == token_kind::invalid, "invalid token emitted");
    EXPECT(lx.error()->kind == lex_error_kind::unterminated_string, "wrong kind");
    EXPECT(lx.error()->loc.line == 1 && lx.error()->loc.column == 5, "points at opening quote");
    return true;
}

static bool lexer_reports_malformed_number()
{
    lexer lx("a = 1.");
    lx.tokenize();

    EXPECT(lx.error().has_value(), "error recorded");
    EXPECT(lx.error()->kind == lex_error_kind::malformed_number, "wrong kind");
    return true;
}

static bool lexer_rejects_signed_numbers()
{
    lexer lx("a = -1");
    lx.tokenize();

    EXPECT(lx.error().has_value(), "sign is not part of the grammar");
    EXPECT(lx.error()->kind == lex_error_kind::unrecognised_character, "wrong kind");
    return true;
}

static bool lexer_stays_at_end()
{
    lexer lx("a");
    EXPECT(lx.next().kind == token_kind::ident, "identifier");
    EXPECT(lx.next().kind == token_kind::end, "end");
    EXPECT(lx.next().kind == token_kind::end, "end is sticky");
    return true;
}

static bool lexer_is_restartable()
{
    lexer lx("[s]\nx = 1\n");
    auto first = lx.tokenize();

    lx.reset();
    auto second = lx.tokenize();

    EXPECT(kinds_of(first) == kinds_of(second), "same kinds after reset");
    EXPECT(second[0].loc.line == 1 && second[0].loc.offset == 0, "positions restart");
    return true;
}

//----------------------------------------------------------------------------

inline void run_lexer_tests()
{
    SUBCAT("Token classes");
    RUN_TEST(lexer_classifies_key_value_line);
    RUN_TEST(lexer_skips_horizontal_whitespace);
    RUN_TEST(lexer_reads_both_comment_introducers);
    RUN_TEST(lexer_reads_integers_and_decimals);
    RUN_TEST(lexer_identifier_may_contain_digits_and_underscore);
    RUN_TEST(lexer_tracks_positions);
    RUN_TEST(lexer_string_with_escaped_quote_is_one_token);
    RUN_TEST(lexer_accepts_crlf_newlines);
    RUN_TEST(lexer_rejects_crlf_when_disabled);
    RUN_TEST(lexer_comment_stops_at_carriage_return);

    SUBCAT("Errors");
    RUN_TEST(lexer_reports_unrecognised_character);
    RUN_TEST(lexer_reports_unterminated_string);
    RUN_TEST(lexer_reports_malformed_number);
    RUN_TEST(lexer_rejects_signed_numbers);

    SUBCAT("Sequence");
    RUN_TEST(lexer_stays_at_end);
    RUN_TEST(lexer_is_restartable);
}

} // ns rtini::tests

#endif
