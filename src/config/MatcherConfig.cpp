#include "MatcherConfig.hpp"
#include "../matching/MatchErrors.hpp"
#include "../utils/ErrorReporter.hpp"

#include <toml++/toml.h>
#include <plog/Log.h>
#include <filesystem>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace config
{

std::optional<int> checkedTopN(std::int64_t value)
{
    if (value < 0 || value > std::numeric_limits<int>::max())
        return std::nullopt;
    return static_cast<int>(value);
}

bool MatcherConfig::load(const std::string& path)
{
    last_error_.clear();

    if (!fs::exists(path))
    {
        PLOG_INFO << "[MatcherConfig] " << path << " not found, using defaults";
        return true;
    }

    try
    {
        toml::table root = toml::parse_file(path);
        return apply(root);
    }
    catch (const toml::parse_error& e)
    {
        std::ostringstream details;
        details << path << ":" << e.source().begin.line << ": " << e.description();
        return fail("Failed to parse configuration file", details.str());
    }
}

bool MatcherConfig::loadFromString(std::string_view toml_text, std::string_view source_name)
{
    last_error_.clear();

    try
    {
        toml::table root = toml::parse(toml_text, source_name);
        return apply(root);
    }
    catch (const toml::parse_error& e)
    {
        std::ostringstream details;
        details << source_name << ":" << e.source().begin.line << ": " << e.description();
        return fail("Failed to parse configuration", details.str());
    }
}

bool MatcherConfig::apply(const toml::table& root)
{
    // Validate into a scratch copy so a bad value leaves every default untouched
    MatcherConfig next = *this;

    if (auto matching_tbl = root["matching"].as_table())
    {
        if (auto method = (*matching_tbl)["method"].value<std::string>())
        {
            try
            {
                next.method = matching::parseMatchMethod(*method);
            }
            catch (const matching::InvalidMethodError& e)
            {
                return fail("Invalid matching.method", e.what());
            }
        }

        if (auto top_n = (*matching_tbl)["top_n"].value<int64_t>())
        {
            auto checked = checkedTopN(*top_n);
            if (!checked)
                return fail("matching.top_n out of range", std::to_string(*top_n));
            next.top_n = *checked;
        }

        if (auto ngram_size = (*matching_tbl)["ngram_size"].value<int64_t>())
        {
            if (*ngram_size < 1 || *ngram_size > static_cast<int64_t>(kMaxNgramSize))
                return fail("matching.ngram_size must be between 1 and " + std::to_string(kMaxNgramSize),
                            std::to_string(*ngram_size));
            next.ngram_size = static_cast<std::size_t>(*ngram_size);
        }
    }

    if (auto acronyms_tbl = root["acronyms"].as_table())
    {
        for (auto&& [key, node] : *acronyms_tbl)
        {
            if (auto expansion = node.value<std::string>())
            {
                next.acronyms[std::string(key.str())] = *expansion;
            }
            else
            {
                PLOG_WARNING << "[MatcherConfig] Skipping non-string acronym expansion for key: " << key.str();
            }
        }
    }

    if (auto logging_tbl = root["logging"].as_table())
    {
        if (auto level = (*logging_tbl)["level"].value<int64_t>())
        {
            if (*level < 0 || *level > 6)
                return fail("logging.level must be between 0 and 6", std::to_string(*level));
            next.logging.level = static_cast<int>(*level);
        }
        if (auto file = (*logging_tbl)["file"].value<std::string>())
            next.logging.file = *file;
        if (auto console = (*logging_tbl)["console"].value<bool>())
            next.logging.console = *console;
        if (auto verbose = (*logging_tbl)["verbose"].value<bool>())
            next.logging.verbose = *verbose;
    }

    next.last_error_.clear();
    *this = std::move(next);
    return true;
}

bool MatcherConfig::fail(const std::string& message, const std::string& details)
{
    last_error_ = message + ": " + details;
    utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, message, details);
    return false;
}

} // namespace config
