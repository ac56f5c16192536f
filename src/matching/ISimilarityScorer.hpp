#pragma once

#include <cstddef>
#include <memory>
#include <string>

namespace matching
{

/**
 * @brief Similarity measures available to the per-method matcher.
 */
enum class ScorerKind
{
    NGram,       // Padded character trigram overlap, continuous in [0, 1]
    Phonetic,    // Soundex code equality, 0 or 1
    Levenshtein  // Normalized edit similarity, continuous in [0, 1]
};

struct ScorerOptions
{
    std::size_t ngram_size = 3;
};

/**
 * @brief A symmetric string similarity measure.
 *
 * Implementations are stateless apart from construction-time options, so a single
 * instance may be shared by concurrent matching calls.
 */
class ISimilarityScorer
{
public:
    virtual ~ISimilarityScorer() = default;

    /**
     * @brief Similarity between two strings.
     * @return Score in [0.0, 1.0]; 1.0 means the strings are equal under this measure
     */
    virtual double score(const std::string& a, const std::string& b) const = 0;

    virtual ScorerKind kind() const = 0;
};

/// Column holding the best score in a match table, e.g. "ngram_score" or "phonetic_match"
std::string scoreColumnName(ScorerKind kind);

/// Column holding the variation that achieved the best score, e.g. "best_ngram_form"
std::string formColumnName(ScorerKind kind);

std::string toString(ScorerKind kind);

// Factory function to create scorers by kind
std::unique_ptr<ISimilarityScorer> createScorer(ScorerKind kind, const ScorerOptions& options = {});

} // namespace matching
