#include <catch2/catch_test_macros.hpp>
#include "config/MatcherConfig.hpp"
#include "utils/ErrorReporter.hpp"
#include <filesystem>
#include <fstream>

using config::MatcherConfig;
using matching::MatchMethod;
namespace fs = std::filesystem;

TEST_CASE("MatcherConfig - Defaults", "[config]")
{
    MatcherConfig cfg;

    REQUIRE(cfg.method == MatchMethod::Hybrid);
    REQUIRE(cfg.top_n == 5);
    REQUIRE(cfg.ngram_size == 3);
    REQUIRE(cfg.acronyms.empty());
    REQUIRE(cfg.logging.level == 4);
    REQUIRE_FALSE(cfg.logging.verbose);

    SECTION("Missing file keeps defaults")
    {
        REQUIRE(cfg.load("no_such_config.toml"));
        REQUIRE(cfg.method == MatchMethod::Hybrid);
        REQUIRE(cfg.lastError().empty());
    }
}

TEST_CASE("MatcherConfig - Parsing", "[config]")
{
    MatcherConfig cfg;

    SECTION("Reads every section")
    {
        REQUIRE(cfg.loadFromString(R"(
[matching]
method = "levenshtein"
top_n = 10
ngram_size = 2

[acronyms]
JS = "John Smith"
CJ = "Catherine Jones"

[logging]
level = 5
file = ""
console = true
verbose = true
)"));

        REQUIRE(cfg.method == MatchMethod::Levenshtein);
        REQUIRE(cfg.top_n == 10);
        REQUIRE(cfg.ngram_size == 2);
        REQUIRE(cfg.acronyms.size() == 2);
        REQUIRE(cfg.acronyms.at("JS") == "John Smith");
        REQUIRE(cfg.logging.level == 5);
        REQUIRE(cfg.logging.file.empty());
        REQUIRE(cfg.logging.console);
        REQUIRE(cfg.logging.verbose);
    }

    SECTION("Partial files only override what they name")
    {
        REQUIRE(cfg.loadFromString("[matching]\ntop_n = 3\n"));
        REQUIRE(cfg.top_n == 3);
        REQUIRE(cfg.method == MatchMethod::Hybrid);
    }

    SECTION("Non-string acronym values are skipped")
    {
        REQUIRE(cfg.loadFromString("[acronyms]\nJS = \"John Smith\"\nN = 5\n"));
        REQUIRE(cfg.acronyms.size() == 1);
    }
}

TEST_CASE("MatcherConfig - Invalid values", "[config]")
{
    utils::ErrorReporter::GetPendingErrors();
    MatcherConfig cfg;

    SECTION("Unknown method name is rejected and nothing is applied")
    {
        REQUIRE_FALSE(cfg.loadFromString("[matching]\ntop_n = 9\nmethod = \"banana\"\n"));
        REQUIRE(cfg.method == MatchMethod::Hybrid);
        REQUIRE(cfg.top_n == 5);
        REQUIRE_FALSE(cfg.lastError().empty());
        auto reports = utils::ErrorReporter::GetPendingErrors();
        REQUIRE_FALSE(reports.empty());
        REQUIRE(reports.back().category == utils::ErrorCategory::Configuration);
    }

    SECTION("Out of range values")
    {
        REQUIRE_FALSE(cfg.loadFromString("[matching]\nngram_size = 0\n"));
        REQUIRE_FALSE(cfg.loadFromString("[matching]\ntop_n = -1\n"));
        REQUIRE_FALSE(cfg.loadFromString("[logging]\nlevel = 9\n"));
        REQUIRE(cfg.ngram_size == 3);
    }

    SECTION("Oversized values are rejected instead of wrapping")
    {
        REQUIRE_FALSE(cfg.loadFromString("[matching]\nngram_size = 4611686018427387904\n"));
        REQUIRE_FALSE(cfg.loadFromString("[matching]\nngram_size = 17\n"));
        REQUIRE_FALSE(cfg.loadFromString("[matching]\ntop_n = 3000000000\n"));
        REQUIRE(cfg.ngram_size == 3);
        REQUIRE(cfg.top_n == 5);

        REQUIRE(cfg.loadFromString("[matching]\nngram_size = 16\n"));
        REQUIRE(cfg.ngram_size == MatcherConfig::kMaxNgramSize);
    }

    SECTION("Syntax errors")
    {
        REQUIRE_FALSE(cfg.loadFromString("[matching\nmethod = \"ngram\"\n"));
        REQUIRE(cfg.method == MatchMethod::Hybrid);
    }

    utils::ErrorReporter::GetPendingErrors();
}

TEST_CASE("checkedTopN - Range", "[config]")
{
    REQUIRE(config::checkedTopN(0) == 0);
    REQUIRE(config::checkedTopN(7) == 7);
    REQUIRE(config::checkedTopN(2147483647) == 2147483647);
    REQUIRE_FALSE(config::checkedTopN(-1).has_value());
    REQUIRE_FALSE(config::checkedTopN(3000000000LL).has_value());
}

TEST_CASE("MatcherConfig - File loading", "[config]")
{
    const std::string path = "test_matcher_config_temp.toml";
    {
        std::ofstream file(path);
        file << "[matching]\nmethod = \"phonetic\"\n";
    }

    MatcherConfig cfg;
    REQUIRE(cfg.load(path));
    REQUIRE(cfg.method == MatchMethod::Phonetic);

    fs::remove(path);
}
