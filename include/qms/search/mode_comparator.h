#pragma once

#include <qms/search/classical_ranker.h>
#include <qms/search/quantum_ranker.h>

#include <nlohmann/json.hpp>

namespace qms::search {

/**
 * @brief Side-by-side outcome of both ranking modes
 */
struct ComparisonResult {
    size_t classicalIndex = 0;
    size_t quantumIndex = 0;
    size_t quantumIterations = 0;
    double diversity = 0.0; // 1.0 = disjoint tag sets, 0.0 = identical
    bool agree = true;

    RankingResult classical;
    RankingResult quantum;

    [[nodiscard]] nlohmann::json toJson() const {
        return nlohmann::json{{"classical_index", classicalIndex},
                              {"quantum_index", quantumIndex},
                              {"quantum_iterations", quantumIterations},
                              {"diversity", diversity},
                              {"agree", agree},
                              {"classical", classical.toJson()},
                              {"quantum", quantum.toJson()}};
    }
};

/**
 * @brief Jaccard distance between the tag sets of two movies
 *
 * Two movies without tags are treated as identical (0.0).
 */
double tagDiversity(const catalog::Movie& a, const catalog::Movie& b);

/**
 * @brief Runs both rankers over the same candidates and reports both picks
 *
 * Purely observational: disagreements are surfaced, never resolved.
 */
class ModeComparator {
public:
    explicit ModeComparator(const RankingConfig& config = {});

    Result<ComparisonResult> compare(const std::vector<catalog::Movie>& candidates,
                                     const TokenSet& queryTokens) const;

private:
    ClassicalRanker classical_;
    QuantumRanker quantum_;
};

} // namespace qms::search
