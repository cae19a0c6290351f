#pragma once

#include <qms/catalog/movie.h>
#include <qms/core/types.h>
#include <qms/search/relevance_scorer.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace qms::search {

enum class RankingMode { Classical, Quantum };

[[nodiscard]] constexpr const char* rankingModeToString(RankingMode mode) noexcept {
    switch (mode) {
        case RankingMode::Classical:
            return "classical";
        case RankingMode::Quantum:
            return "quantum";
    }
    return "unknown";
}

/**
 * @brief Parse "classical" or "quantum" (case-insensitive)
 */
Result<RankingMode> parseRankingMode(std::string_view text);

/**
 * @brief Outcome of one ranking call
 */
struct RankingResult {
    size_t index = 0; // position in the input candidate sequence
    MovieId movieId = 0;
    RankingMode mode = RankingMode::Classical;

    // Diagnostics
    size_t iterations = 0;     // amplification rounds (0 for classical)
    size_t markedCount = 0;    // oracle targets (0 for classical)
    double topScore = 0.0;     // raw relevance score of the selection
    double topProbability = 0.0; // selection probability (1.0 for classical)
    bool tunneled = false;
    bool exactTitleMatch = false;

    [[nodiscard]] nlohmann::json toJson() const {
        return nlohmann::json{{"index", index},
                              {"movie_id", movieId},
                              {"mode", rankingModeToString(mode)},
                              {"iterations", iterations},
                              {"marked_count", markedCount},
                              {"top_score", topScore},
                              {"top_probability", topProbability},
                              {"tunneled", tunneled},
                              {"exact_title_match", exactTitleMatch}};
    }
};

/**
 * @brief Ranking strategy interface
 *
 * Implementations receive an already validated, non-empty candidate set and a
 * non-empty normalized query. They still reject an empty candidate set
 * (EmptyCandidateSet) and an empty token set (InvalidQuery) so they are safe
 * to call directly; an empty query never degrades to popularity-only ordering.
 */
class IMovieRanker {
public:
    virtual ~IMovieRanker() = default;

    virtual RankingMode mode() const = 0;

    virtual Result<RankingResult> rank(const std::vector<catalog::Movie>& candidates,
                                       const TokenSet& queryTokens) const = 0;
};

} // namespace qms::search
