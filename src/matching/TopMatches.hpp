#pragma once

#include "AcronymExpander.hpp"
#include "CandidateTable.hpp"
#include "MatchMethod.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace matching
{

/**
 * @brief One ranked candidate.
 *
 * For single-method rankings `score` is that scorer's score. For Hybrid it is the
 * n-gram score and `phonetic` is always 1.
 */
struct RankedMatch
{
    std::size_t row = 0;
    double score = 0.0;
    double phonetic = 0.0;
    std::string best_form;
};

struct RankingOptions
{
    int top_n = 5;
    MatchMethod method = MatchMethod::Hybrid;
    ScorerOptions scorer;
};

/**
 * @brief Rank candidates against a query.
 *
 * Single methods sort all candidates by their score. Hybrid runs the n-gram and phonetic
 * matchers over the whole table, drops every candidate whose phonetic score is not 1 and
 * sorts the rest by n-gram score. Sorting is stable (table order breaks ties) and at most
 * `top_n` entries are returned; `top_n <= 0` yields no entries.
 *
 * @throws InvalidColumnError if `column` is not a column of `candidates`
 */
std::vector<RankedMatch> rankCandidates(const std::string& query, const CandidateTable& candidates,
                                        const std::string& column, const AcronymDictionary& dictionary,
                                        const RankingOptions& options = {});

/**
 * @brief Table form of rankCandidates().
 *
 * Rows of `candidates` in rank order, with the method's score columns appended:
 * "ngram_score", "phonetic_match" or "levenshtein_score", and both "ngram_score"
 * and "phonetic_match" for Hybrid.
 *
 * @throws InvalidColumnError if `column` is not a column of `candidates`
 */
CandidateTable findTopMatches(const std::string& query, const CandidateTable& candidates, const std::string& column,
                              const AcronymDictionary& dictionary = {}, int top_n = 5,
                              MatchMethod method = MatchMethod::Hybrid, const ScorerOptions& scorer_options = {});

/**
 * @brief Same as above with the method given by name.
 *
 * @throws InvalidMethodError if `method` is not one of ngram, phonetic, levenshtein, hybrid
 * @throws InvalidColumnError if `column` is not a column of `candidates`
 */
CandidateTable findTopMatches(const std::string& query, const CandidateTable& candidates, const std::string& column,
                              const AcronymDictionary& dictionary, int top_n, const std::string& method,
                              const ScorerOptions& scorer_options = {});

} // namespace matching
