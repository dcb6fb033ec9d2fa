#ifndef RTINI_TESTS_MUTATION__
#define RTINI_TESTS_MUTATION__

#include "rtini_test_harness.hpp"

#include <random>

namespace rtini::tests
{
//------------------------------------------
// HELPERS
//------------------------------------------

    inline std::vector<std::string> const & mutation_corpus()
    {
        static std::vector<std::string> const corpus =
        {
            "\nname = \"Johnny Stecchino\"",
            "\nage = 21\nscore = 1.2",
            "\n[address]\ncity = \"Bologna\"",
            "\ntop = 0\n[section 1]\ns1 = 1\n[section 2]\ns2 = 2\n",
            "# c1\n; c2\nk = \"v\\t\"\n\n# s\n[s]\n\nx = 0.5\n",
        };
        return corpus;
    }

    // One random insertion, deletion or replacement drawn from the
    // characters the grammar cares about.
    inline std::string mutate(std::string s, std::mt19937 & rng)
    {
        static constexpr std::string_view alphabet = "ab_19.=[]#; \t\n\r\"\\xu@";

        std::uniform_int_distribution<size_t> pick_char(0, alphabet.size() - 1);
        std::uniform_int_distribution<int> pick_op(0, 2);

        std::uniform_int_distribution<size_t> pick_pos(0, s.size());
        size_t pos = pick_pos(rng);

        switch (pick_op(rng))
        {
            case 0:
                s.insert(pos, 1, alphabet[pick_char(rng)]);
                break;
            case 1:
                if (pos < s.size()) s.erase(pos, 1);
                break;
            default:
                if (pos < s.size()) s[pos] = alphabet[pick_char(rng)];
                break;
        }
        return s;
    }

//------------------------------------------
// TESTS
//------------------------------------------

// Whatever the input, a parse either fails with a positioned message and no
// tree, or yields a tree whose rendering is stable.
static bool mutated_inputs_fail_cleanly_or_render_stably()
{
    std::mt19937 rng(20221019u);

    size_t accepted = 0;

    for (auto const & seed : mutation_corpus())
    {
        std::string input = seed;

        for (int round = 0; round < 400; ++round)
        {
            input = mutate(input, rng);

            auto ctx = parse("mutant", input);

            if (ctx.has_errors())
            {
                EXPECT(!ctx.result.has_value(), "error with a tree");
                EXPECT(ctx.errors.size() == 1, "more than one error");
                EXPECT(error_location(ctx.errors.front()).line >= 1, "error without a line");
                EXPECT(!describe(ctx.errors.front()).empty(), "error without a message");

                // restart the chain from something parseable
                input = seed;
                continue;
            }

            ++accepted;
            EXPECT(ctx.result.has_value(), "success without a tree");

            for (auto const & prop : ctx.result->properties())
            {
                bool is_str = std::holds_alternative<string_value>(prop.val);
                bool is_num = std::holds_alternative<number_value>(prop.val);
                EXPECT(is_str != is_num, "value is neither or both alternatives");
            }

            std::string once = serialize(*ctx.result);
            auto again = parse_doc(once);
            EXPECT(again.has_value(), "rendering does not parse");
            EXPECT(serialize(*again) == once, "rendering is not a fixed point");
        }
    }

    EXPECT(accepted > 0, "no mutant was accepted; the corpus is not exercising rendering");
    return true;
}

//----------------------------------------------------------------------------

inline void run_mutation_tests()
{
    RUN_TEST(mutated_inputs_fail_cleanly_or_render_stably);
}

} // ns rtini::tests

#endif
