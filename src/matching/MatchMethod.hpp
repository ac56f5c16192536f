#pragma once

#include "ISimilarityScorer.hpp"

#include <optional>
#include <string>

namespace matching
{

enum class MatchMethod
{
    NGram,
    Phonetic,
    Levenshtein,
    Hybrid  // Phonetic gate, then n-gram ranking
};

/// Parse "ngram", "phonetic", "levenshtein" or "hybrid"; throws InvalidMethodError otherwise
MatchMethod parseMatchMethod(const std::string& name);

std::string toString(MatchMethod method);

/// Scorer behind a single-method ranking; std::nullopt for Hybrid
std::optional<ScorerKind> scorerFor(MatchMethod method);

} // namespace matching
