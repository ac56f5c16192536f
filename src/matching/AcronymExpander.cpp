#include "AcronymExpander.hpp"
#include "../processing/TextUtils.hpp"
#include "../utils/ErrorReporter.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <plog/Log.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace matching
{

std::vector<std::string> expandAcronyms(const std::string& text, const AcronymDictionary& dictionary)
{
    std::vector<std::string> variations{ text };
    if (dictionary.empty())
        return variations;

    const std::vector<std::string> words = processing::splitWords(text);
    for (std::size_t i = 0; i < words.size(); ++i)
    {
        auto it = dictionary.find(words[i]);
        if (it == dictionary.end())
            continue;

        std::vector<std::string> expanded = words;
        expanded[i] = it->second;
        variations.push_back(processing::joinWords(expanded));
    }

    return variations;
}

std::optional<AcronymDictionary> loadAcronymDictionary(const std::string& file_path)
{
    using utils::ErrorCategory;
    using utils::ErrorReporter;

    if (!fs::exists(file_path))
    {
        ErrorReporter::ReportError(ErrorCategory::Input, "Acronym file not found", file_path);
        return std::nullopt;
    }

    std::ifstream file(file_path);
    if (!file.is_open())
    {
        ErrorReporter::ReportError(ErrorCategory::Input, "Failed to open acronym file", file_path);
        return std::nullopt;
    }

    try
    {
        json j;
        file >> j;

        if (!j.is_object())
        {
            ErrorReporter::ReportError(ErrorCategory::Input, "Invalid acronym file (expected a JSON object)",
                                       file_path);
            return std::nullopt;
        }

        AcronymDictionary dictionary;
        for (auto& [acronym, expansion] : j.items())
        {
            if (expansion.is_string())
            {
                dictionary[acronym] = expansion.get<std::string>();
            }
            else
            {
                PLOG_WARNING << "[AcronymExpander] Skipping non-string expansion for key: " << acronym;
            }
        }

        PLOG_INFO << "[AcronymExpander] Loaded " << dictionary.size() << " acronyms from " << file_path;
        return dictionary;
    }
    catch (const json::exception& e)
    {
        ErrorReporter::ReportError(ErrorCategory::Input, "JSON parse error in acronym file",
                                   file_path + ": " + e.what());
        return std::nullopt;
    }
}

} // namespace matching
