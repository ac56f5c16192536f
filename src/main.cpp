#include "config/MatcherConfig.hpp"
#include "matching/AcronymExpander.hpp"
#include "matching/CandidateTable.hpp"
#include "matching/MatchErrors.hpp"
#include "matching/TopMatches.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>


namespace
{

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitMatchError = 2;

void PrintUsage(const char* program_name)
{
    std::cout << "Usage: " << program_name << " [OPTIONS] <query>\n";
    std::cout << "acromatch - acronym-aware fuzzy name matching\n\n";
    std::cout << "Options:\n";
    std::cout << "  --candidates <file>  Candidate records, one JSON object per line (required)\n";
    std::cout << "  --column <name>      Field to match against (required)\n";
    std::cout << "  --acronyms <file>    JSON object of acronym -> expansion, merged over the config\n";
    std::cout << "  --method <name>      hybrid (default), ngram, phonetic or levenshtein\n";
    std::cout << "  --top <n>            Number of results (default 5)\n";
    std::cout << "  --config <file>      TOML configuration (default config.toml)\n";
    std::cout << "  --verbose            Trace every candidate score to the log\n";
    std::cout << "  --version            Show version information\n";
    std::cout << "  --help               Show this help message\n";
}

void PrintVersion()
{
    std::cout << "acromatch 1.0.0\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

void FlushErrors()
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        std::cerr << utils::ErrorReporter::Format(report) << "\n";
    }
}

struct Options
{
    std::string query;
    std::string candidates_path;
    std::string column;
    std::string acronyms_path;
    std::string config_path = config::MatcherConfig::kDefaultPath;
    std::optional<std::string> method;
    std::optional<int> top_n;
    bool verbose = false;
};

/// Returns std::nullopt when the run should stop; exit_code then holds the status
std::optional<Options> ParseArguments(int argc, char* argv[], int& exit_code)
{
    Options opts;
    exit_code = kExitOk;

    for (int i = 1; i < argc; ++i)
    {
        const char* arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (std::strcmp(arg, "--version") == 0)
        {
            PrintVersion();
            return std::nullopt;
        }
        else if (std::strcmp(arg, "--help") == 0)
        {
            PrintUsage(argv[0]);
            return std::nullopt;
        }
        else if (std::strcmp(arg, "--verbose") == 0)
        {
            opts.verbose = true;
        }
        else if (std::strcmp(arg, "--candidates") == 0 && has_value)
        {
            opts.candidates_path = argv[++i];
        }
        else if (std::strcmp(arg, "--column") == 0 && has_value)
        {
            opts.column = argv[++i];
        }
        else if (std::strcmp(arg, "--acronyms") == 0 && has_value)
        {
            opts.acronyms_path = argv[++i];
        }
        else if (std::strcmp(arg, "--config") == 0 && has_value)
        {
            opts.config_path = argv[++i];
        }
        else if (std::strcmp(arg, "--method") == 0 && has_value)
        {
            opts.method = argv[++i];
        }
        else if (std::strcmp(arg, "--top") == 0 && has_value)
        {
            const char* value = argv[++i];
            char* end = nullptr;
            errno = 0;
            long long n = std::strtoll(value, &end, 10);
            auto top_n = config::checkedTopN(n);
            if (end == value || *end != '\0' || errno == ERANGE || !top_n)
            {
                std::cerr << "ERROR: invalid value for --top: " << value << "\n";
                exit_code = kExitUsage;
                return std::nullopt;
            }
            opts.top_n = *top_n;
        }
        else if (std::strncmp(arg, "--", 2) == 0)
        {
            std::cerr << "ERROR: unknown option or missing value: " << arg << "\n";
            exit_code = kExitUsage;
            return std::nullopt;
        }
        else
        {
            // Unquoted multi-word queries arrive as separate arguments
            if (!opts.query.empty())
                opts.query += ' ';
            opts.query += arg;
        }
    }

    if (opts.query.empty() || opts.candidates_path.empty() || opts.column.empty())
    {
        PrintUsage(argv[0]);
        exit_code = kExitUsage;
        return std::nullopt;
    }

    return opts;
}

} // namespace

int main(int argc, char* argv[])
{
    int exit_code = kExitOk;
    std::optional<Options> opts = ParseArguments(argc, argv, exit_code);
    if (!opts)
        return exit_code;

    config::MatcherConfig cfg;
    bool config_ok = cfg.load(opts->config_path);
    if (opts->verbose)
        cfg.logging.verbose = true;

    utils::LogManager::Initialize(cfg.logging);
    if (!config_ok)
    {
        FlushErrors();
        return kExitUsage;
    }

    matching::AcronymDictionary acronyms = cfg.acronyms;
    if (!opts->acronyms_path.empty())
    {
        auto loaded = matching::loadAcronymDictionary(opts->acronyms_path);
        if (!loaded)
        {
            FlushErrors();
            return kExitUsage;
        }
        for (auto& [acronym, expansion] : *loaded)
        {
            acronyms[acronym] = std::move(expansion);
        }
    }

    auto candidates = matching::CandidateTable::loadJsonLines(opts->candidates_path);
    if (!candidates)
    {
        FlushErrors();
        return kExitUsage;
    }

    try
    {
        matching::MatchMethod method = opts->method ? matching::parseMatchMethod(*opts->method) : cfg.method;
        int top_n = opts->top_n.value_or(cfg.top_n);

        matching::ScorerOptions scorer_options;
        scorer_options.ngram_size = cfg.ngram_size;

        matching::CandidateTable result = matching::findTopMatches(opts->query, *candidates, opts->column, acronyms,
                                                                   top_n, method, scorer_options);

        FlushErrors();
        std::cout << "Top " << result.rowCount() << " " << matching::toString(method) << " matches for '"
                  << opts->query << "':\n";
        std::cout << result.toString();
    }
    catch (const matching::MatchError& e)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Matching, "Matching failed", e.what());
        FlushErrors();
        exit_code = kExitMatchError;
    }

    utils::LogManager::Shutdown();
    return exit_code;
}
