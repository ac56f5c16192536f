#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace matching
{

/// Whole-word, case-sensitive acronym -> expansion mapping
using AcronymDictionary = std::unordered_map<std::string, std::string>;

/**
 * @brief All single-substitution variations of a text value.
 *
 * The text is split on whitespace. For every word that is a key of `dictionary`,
 * one variation is produced with only that word replaced by its expansion and the
 * words re-joined with single spaces. Expansions never compound.
 *
 * @return The unmodified `text` first, then one variation per matching word position,
 *         left to right
 */
std::vector<std::string> expandAcronyms(const std::string& text, const AcronymDictionary& dictionary);

/**
 * @brief Load a dictionary from a flat JSON object: { "JS": "John Smith", ... }.
 *
 * Non-string values are skipped with a warning. Failures are reported through
 * utils::ErrorReporter.
 *
 * @return The dictionary, or std::nullopt if the file is missing, unreadable or not an object
 */
std::optional<AcronymDictionary> loadAcronymDictionary(const std::string& file_path);

} // namespace matching
