#pragma once

#include <qms/catalog/movie.h>
#include <qms/search/query_tokenizer.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace qms::search {

/**
 * @brief Configuration shared by the relevance scorer and both rankers
 */
struct RankingConfig {
    // Weight per query token found in title + overview
    double matchWeight = 10.0;

    // Weight applied to catalog popularity
    double popularityWeight = 0.1;

    // Relative margin the runner-up's raw score must exceed the amplified
    // winner's by before the tunneling correction replaces it (0.15 = 15%)
    double tunnelingMargin = 0.15;

    // Candidates scoring above mean * multiplier are marked for the oracle
    double relevanceThresholdMultiplier = 1.0;

    // Upper bound on candidate set size, 0 disables the limit
    size_t maxCandidates = 0;

    [[nodiscard]] nlohmann::json toJson() const {
        return nlohmann::json{{"match_weight", matchWeight},
                              {"popularity_weight", popularityWeight},
                              {"tunneling_margin", tunnelingMargin},
                              {"relevance_threshold_multiplier", relevanceThresholdMultiplier},
                              {"max_candidates", maxCandidates}};
    }
};

/**
 * @brief Scores per candidate, in candidate order
 */
using ScoreVector = std::vector<double>;

/**
 * @brief Lexical + popularity relevance scoring
 *
 * score = matchCount * matchWeight + popularity * popularityWeight, where
 * matchCount is the number of query tokens present in the movie's combined
 * title and overview token set. Pure and deterministic.
 */
class RelevanceScorer {
public:
    explicit RelevanceScorer(const RankingConfig& config = {});

    const RankingConfig& getConfig() const { return config_; }

    /**
     * @brief Number of query tokens found in the movie's title + overview
     */
    size_t countMatches(const catalog::Movie& movie, const TokenSet& queryTokens) const;

    /**
     * @brief Relevance score of one movie against a normalized query
     */
    double calculateScore(const catalog::Movie& movie, const TokenSet& queryTokens) const;

    /**
     * @brief Score every candidate, preserving order
     */
    ScoreVector scoreAll(const std::vector<catalog::Movie>& candidates,
                         const TokenSet& queryTokens) const;

private:
    RankingConfig config_;
    QueryTokenizer tokenizer_;
};

/**
 * @brief Strict "ranks ahead of" ordering used by both rankers
 *
 * Higher value wins; equal values fall back to higher popularity, then to the
 * lower index.
 */
bool ranksAhead(double valueA, double popularityA, size_t indexA, double valueB,
                double popularityB, size_t indexB);

/**
 * @brief Index of the best entry under ranksAhead, optionally skipping one index
 *
 * Returns values.size() when no eligible entry exists.
 */
size_t selectBest(const std::vector<double>& values,
                  const std::vector<catalog::Movie>& candidates, size_t excluded = SIZE_MAX);

} // namespace qms::search
