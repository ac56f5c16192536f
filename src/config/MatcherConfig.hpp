#pragma once

#include "../matching/AcronymExpander.hpp"
#include "../matching/MatchMethod.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <toml++/toml.h>

namespace config
{

struct LoggingSettings
{
    int level = 4;                                // plog::Severity, 0 (none) .. 6 (verbose)
    std::string file = "logs/acromatch.log";      // Empty disables the file appender
    bool console = false;
    bool verbose = false;                         // Per-candidate traces on the diagnostics channel
};

/// Accepts 0 .. INT_MAX; shared by the config file and the --top flag
std::optional<int> checkedTopN(std::int64_t value);

/**
 * @brief Defaults for matching runs, read from a TOML file.
 *
 * @code
 * [matching]
 * method = "hybrid"
 * top_n = 5
 * ngram_size = 3
 *
 * [acronyms]
 * JS = "John Smith"
 *
 * [logging]
 * level = 4
 * file = "logs/acromatch.log"
 * console = false
 * verbose = false
 * @endcode
 *
 * Every key is optional. A missing file keeps the defaults. Parse errors and invalid
 * values are reported through utils::ErrorReporter and leave the defaults in place.
 */
class MatcherConfig
{
public:
    static constexpr const char* kDefaultPath = "config.toml";
    static constexpr std::size_t kMaxNgramSize = 16;

    matching::MatchMethod method = matching::MatchMethod::Hybrid;
    int top_n = 5;
    std::size_t ngram_size = 3;
    matching::AcronymDictionary acronyms;
    LoggingSettings logging;

    /// Returns false if the file exists but could not be applied; see lastError()
    bool load(const std::string& path = kDefaultPath);

    bool loadFromString(std::string_view toml_text, std::string_view source_name = "<string>");

    const std::string& lastError() const { return last_error_; }

private:
    bool apply(const toml::table& root);
    bool fail(const std::string& message, const std::string& details);

    std::string last_error_;
};

} // namespace config
