#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "matching/EditDistanceScorer.hpp"
#include "matching/NGramScorer.hpp"
#include "matching/PhoneticScorer.hpp"

using namespace matching;
using Catch::Matchers::WithinAbs;

TEST_CASE("NGramScorer - Identity and disjointness", "[scorer][ngram]")
{
    NGramScorer scorer;

    SECTION("Identical strings score 1.0")
    {
        for (const std::string text : { "a", "JS Plumbing", "John Smith Plumbing", "カタカナ" })
        {
            REQUIRE_THAT(scorer.score(text, text), WithinAbs(1.0, 1e-9));
        }
    }

    SECTION("Strings without a shared trigram score 0.0")
    {
        REQUIRE_THAT(scorer.score("abc", "xyz"), WithinAbs(0.0, 1e-9));
    }

    SECTION("Empty against non-empty scores 0.0")
    {
        REQUIRE_THAT(scorer.score("", "abc"), WithinAbs(0.0, 1e-9));
    }
}

TEST_CASE("NGramScorer - Padded overlap values", "[scorer][ngram]")
{
    NGramScorer scorer;

    SECTION("One trailing difference")
    {
        // $$a $ab abc shared; bcd cd$ d$$ vs bce ce$ e$$ differ: 3 / (6 + 6 - 3)
        REQUIRE_THAT(scorer.score("abcd", "abce"), WithinAbs(1.0 / 3.0, 1e-9));
    }

    SECTION("Misspelled business name")
    {
        // 15 shared of 21 and 20 trigrams
        REQUIRE_THAT(scorer.score("John Smith Plumbing", "Jon Smyth Plumbing"), WithinAbs(15.0 / 26.0, 1e-9));
    }

    SECTION("Repeated grams count with multiplicity")
    {
        // "$$aaaa$$": $$a $aa aaa aaa aa$ a$$, "$$aaa$$": $$a $aa aaa aa$ a$$ -> 5 / (6 + 5 - 5)
        REQUIRE_THAT(scorer.score("aaaa", "aaa"), WithinAbs(5.0 / 6.0, 1e-9));
    }

    SECTION("Case matters")
    {
        REQUIRE(scorer.score("plumbing", "PLUMBING") < 0.5);
    }
}

TEST_CASE("NGramScorer - Symmetry and range", "[scorer][ngram]")
{
    NGramScorer scorer;
    std::vector<std::string> samples = { "JS Plumbing", "Jon Smyth Plumbing", "JB Electrical", "", "CJ Bakery" };

    for (const auto& a : samples)
    {
        for (const auto& b : samples)
        {
            double ab = scorer.score(a, b);
            REQUIRE_THAT(ab, WithinAbs(scorer.score(b, a), 1e-12));
            REQUIRE(ab >= 0.0);
            REQUIRE(ab <= 1.0);
        }
    }
}

TEST_CASE("NGramScorer - Configurable size", "[scorer][ngram]")
{
    SECTION("Bigrams see more overlap than trigrams")
    {
        NGramScorer bigram(2);
        NGramScorer trigram(3);
        REQUIRE(bigram.size() == 2);
        REQUIRE(bigram.score("abcd", "abce") > trigram.score("abcd", "abce"));
    }

    SECTION("Zero is clamped to unigrams")
    {
        NGramScorer unigram(0);
        REQUIRE(unigram.size() == 1);
        REQUIRE_THAT(unigram.score("", ""), WithinAbs(1.0, 1e-9));
        REQUIRE_THAT(unigram.score("ab", "ba"), WithinAbs(1.0, 1e-9));
    }
}

TEST_CASE("PhoneticScorer - Soundex codes", "[scorer][phonetic]")
{
    PhoneticScorer scorer;

    SECTION("Reference codes")
    {
        REQUIRE(scorer.encode("Robert") == "R163");
        REQUIRE(scorer.encode("Rupert") == "R163");
        REQUIRE(scorer.encode("Tymczak") == "T522");
        REQUIRE(scorer.encode("Honeyman") == "H555");
        REQUIRE(scorer.encode("Lee") == "L000");
    }

    SECTION("H and W do not separate equal digits")
    {
        REQUIRE(scorer.encode("Ashcraft") == "A261");
    }

    SECTION("First letter's digit suppresses an equal second digit")
    {
        REQUIRE(scorer.encode("Pfister") == "P236");
    }

    SECTION("Case-insensitive")
    {
        REQUIRE(scorer.encode("robert") == "R163");
    }

    SECTION("Spaces separate consonant groups")
    {
        REQUIRE(scorer.encode("John Smith Plumbing") == "J525");
        REQUIRE(scorer.encode("JS Plumbing") == "J145");
        REQUIRE(scorer.encode("JB Electrical") == "J142");
    }

    SECTION("Accents are decomposed before encoding")
    {
        REQUIRE(scorer.encode("\xC3\x89mile") == scorer.encode("Emile"));
        REQUIRE(scorer.encode("Emile") == "E540");
    }

    SECTION("Empty input has an empty code")
    {
        REQUIRE(scorer.encode("").empty());
    }
}

TEST_CASE("PhoneticScorer - Binary score", "[scorer][phonetic]")
{
    PhoneticScorer scorer;

    SECTION("Sound-alike names score 1")
    {
        REQUIRE(scorer.score("John Smith Plumbing", "Jon Smyth Plumbing") == 1.0);
        REQUIRE(scorer.score("Robert", "Rupert") == 1.0);
    }

    SECTION("Different codes score 0")
    {
        REQUIRE(scorer.score("John Smith Plumbing", "JB Electrical") == 0.0);
    }

    SECTION("Symmetric")
    {
        std::vector<std::string> samples = { "JS Plumbing", "Jon Smyth Plumbing", "Robert", "", "Rupert" };
        for (const auto& a : samples)
        {
            for (const auto& b : samples)
            {
                double ab = scorer.score(a, b);
                REQUIRE(ab == scorer.score(b, a));
                REQUIRE((ab == 0.0 || ab == 1.0));
            }
        }
    }
}

TEST_CASE("EditDistanceScorer - Normalized ratio", "[scorer][levenshtein]")
{
    EditDistanceScorer scorer;

    SECTION("Identical strings score 1.0")
    {
        REQUIRE_THAT(scorer.score("John Smith Plumbing", "John Smith Plumbing"), WithinAbs(1.0, 1e-9));
    }

    SECTION("Substitution costs one deletion and one insertion")
    {
        // Indel distance 2 over 8 characters
        REQUIRE_THAT(scorer.score("abcd", "abce"), WithinAbs(0.75, 1e-9));
    }

    SECTION("Completely different strings score 0.0")
    {
        REQUIRE_THAT(scorer.score("abc", "xyz"), WithinAbs(0.0, 1e-9));
    }

    SECTION("Multi-byte characters count once")
    {
        // One of four code points differs
        REQUIRE_THAT(scorer.score("caf\xC3\xA9", "cafe"), WithinAbs(0.75, 1e-9));
    }

    SECTION("Scores stay within range")
    {
        double score = scorer.score("JS Plumbing", "Jon Smyth Plumbing");
        REQUIRE(score > 0.0);
        REQUIRE(score < 1.0);
    }
}

TEST_CASE("createScorer - Factory", "[scorer]")
{
    SECTION("Creates each kind")
    {
        REQUIRE(createScorer(ScorerKind::NGram)->kind() == ScorerKind::NGram);
        REQUIRE(createScorer(ScorerKind::Phonetic)->kind() == ScorerKind::Phonetic);
        REQUIRE(createScorer(ScorerKind::Levenshtein)->kind() == ScorerKind::Levenshtein);
    }

    SECTION("Passes the n-gram size through")
    {
        ScorerOptions options;
        options.ngram_size = 2;
        auto scorer = createScorer(ScorerKind::NGram, options);
        REQUIRE_THAT(scorer->score("abcd", "abce"), WithinAbs(NGramScorer(2).score("abcd", "abce"), 1e-12));
    }

    SECTION("Column names are scoped to the scorer")
    {
        REQUIRE(scoreColumnName(ScorerKind::NGram) == "ngram_score");
        REQUIRE(formColumnName(ScorerKind::NGram) == "best_ngram_form");
        REQUIRE(scoreColumnName(ScorerKind::Phonetic) == "phonetic_match");
        REQUIRE(formColumnName(ScorerKind::Phonetic) == "best_phonetic_form");
        REQUIRE(scoreColumnName(ScorerKind::Levenshtein) == "levenshtein_score");
        REQUIRE(formColumnName(ScorerKind::Levenshtein) == "best_levenshtein_form");
    }
}
