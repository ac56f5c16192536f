#pragma once

#include "AcronymExpander.hpp"
#include "CandidateTable.hpp"
#include "ISimilarityScorer.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace matching
{

/**
 * @brief Best result of one scorer over one candidate's variation set.
 */
struct MatchRecord
{
    std::size_t row = 0;     // Row index in the candidate table
    double score = 0.0;      // Highest score over all variations
    std::string best_form;   // Variation that first reached that score
};

/**
 * @brief Score every candidate against the query with a single scorer.
 *
 * Each candidate value is expanded with expandAcronyms() and every variation is scored;
 * the highest score is kept, the earliest variation winning ties (the unexpanded value
 * comes first). When no variation scores above zero the unexpanded value is reported.
 *
 * @throws InvalidColumnError if `column` is not a column of `candidates`
 * @return One record per candidate, in table order
 */
std::vector<MatchRecord> scoreCandidates(const std::string& query, const CandidateTable& candidates,
                                         const std::string& column, const AcronymDictionary& dictionary,
                                         const ISimilarityScorer& scorer);

/**
 * @brief Table form of scoreCandidates().
 *
 * Returns a copy of `candidates` with two columns appended, named after the scorer
 * (see scoreColumnName() and formColumnName()). Phonetic scores are stored as the
 * integers 0 and 1.
 *
 * @throws InvalidColumnError if `column` is not a column of `candidates`
 */
CandidateTable matchCandidates(const std::string& query, const CandidateTable& candidates, const std::string& column,
                               const AcronymDictionary& dictionary, const ISimilarityScorer& scorer);

CandidateTable matchCandidates(const std::string& query, const CandidateTable& candidates, const std::string& column,
                               const AcronymDictionary& dictionary, ScorerKind kind,
                               const ScorerOptions& options = {});

} // namespace matching
