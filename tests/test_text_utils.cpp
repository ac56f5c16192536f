#include <catch2/catch_test_macros.hpp>
#include "processing/Diagnostics.hpp"
#include "processing/NFKDTextNormalizer.hpp"
#include "processing/TextUtils.hpp"
#include <string>

using namespace processing;

TEST_CASE("splitWords - Whitespace splitting", "[text]")
{
    SECTION("Splits on single spaces")
    {
        REQUIRE(splitWords("JS Plumbing Ltd") == std::vector<std::string>{ "JS", "Plumbing", "Ltd" });
    }

    SECTION("Collapses runs and trims the ends")
    {
        REQUIRE(splitWords("  JS \t\n Plumbing  ") == std::vector<std::string>{ "JS", "Plumbing" });
    }

    SECTION("Unicode spaces separate words")
    {
        // Ideographic space
        REQUIRE(splitWords("主人公　冒険 者") == std::vector<std::string>{ "主人公", "冒険", "者" });
    }

    SECTION("Empty and blank input yield no words")
    {
        REQUIRE(splitWords("").empty());
        REQUIRE(splitWords("   ").empty());
    }

    SECTION("joinWords uses single spaces")
    {
        REQUIRE(joinWords({ "John", "Smith", "Plumbing" }) == "John Smith Plumbing");
        REQUIRE(joinWords({}).empty());
    }
}

TEST_CASE("utf8ToUtf32 - Code point conversion", "[text]")
{
    REQUIRE(utf8ToUtf32("caf\xC3\xA9").size() == 4);
    REQUIRE(utf32ToUtf8(utf8ToUtf32("カタカナ")) == "カタカナ");

    SECTION("Invalid bytes are replaced and the rest of the text is kept")
    {
        // Latin-1 e-acute is not valid UTF-8
        const std::u32string decoded = utf8ToUtf32("JS Caf\xE9 Plumbing");
        REQUIRE(decoded == U"JS Caf\uFFFD Plumbing");
    }

    SECTION("Truncated sequence at the end")
    {
        REQUIRE(utf8ToUtf32("ab\xE3\x82") == std::u32string{ U'a', U'b', kReplacementChar, kReplacementChar });
    }

    SECTION("Words after an invalid byte survive splitting")
    {
        REQUIRE(splitWords("JS Caf\xE9 Plumbing") ==
                std::vector<std::string>{ "JS", "Caf\xEF\xBF\xBD", "Plumbing" });
    }
}

TEST_CASE("NFKDTextNormalizer - Decomposition", "[text][normalizer]")
{
    NFKDTextNormalizer normalizer;

    SECTION("Accented letters split into base and combining mark")
    {
        REQUIRE(normalizer.normalize("\xC3\xA9") == "e\xCC\x81");
    }

    SECTION("Compatibility characters fold to ASCII")
    {
        REQUIRE(normalizer.normalize("ＡＢＣ") == "ABC");
    }

    SECTION("Empty string is unchanged")
    {
        REQUIRE(normalizer.normalize("").empty());
    }

    SECTION("toUpper handles non-ASCII letters")
    {
        REQUIRE(normalizer.toUpper("j\xC3\xB3n smith") == "J\xC3\x93N SMITH");
    }
}

TEST_CASE("Diagnostics - Preview", "[diagnostics]")
{
    Diagnostics::SetMaxPreview(8);

    SECTION("Short text is quoted and escaped")
    {
        REQUIRE(Diagnostics::Preview("a\tb") == "\"a\\tb\"");
    }

    SECTION("Long text is clipped with its size")
    {
        REQUIRE(Diagnostics::Preview("John Smith Plumbing") == "\"John Smi\"...(19 bytes)");
    }

    Diagnostics::SetMaxPreview(80);
}
