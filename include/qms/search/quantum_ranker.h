#pragma once

#include <qms/search/movie_ranker.h>

#include <cstddef>
#include <vector>

namespace qms::search {

/**
 * @brief Simulated amplitudes, one per candidate, same indexing
 */
using AmplitudeVector = std::vector<double>;

/**
 * @brief Classical simulation of Grover-style amplitude amplification
 *
 * The state is an ordinary vector of real amplitudes. Each round applies the
 * oracle (sign flip on marked entries) followed by diffusion (reflection of
 * every amplitude about the mean). Both steps preserve the squared norm.
 */
class AmplitudeSimulator {
public:
    /**
     * @brief Uniform superposition over @p count entries (each 1/sqrt(count))
     */
    static AmplitudeVector uniform(size_t count);

    /**
     * @brief Grover iteration count floor(pi/4 * sqrt(N/M)), clamped to [1, N]
     */
    static size_t iterationCount(size_t candidateCount, size_t markedCount);

    /**
     * @brief Oracle step: negate the amplitude of every marked entry
     */
    static void applyOracle(AmplitudeVector& amplitudes, const std::vector<bool>& marked);

    /**
     * @brief Diffusion step: a -> 2 * mean - a for every amplitude
     */
    static void applyDiffusion(AmplitudeVector& amplitudes);

    /**
     * @brief Squared amplitudes
     */
    static std::vector<double> probabilities(const AmplitudeVector& amplitudes);

    /**
     * @brief Sum of squared amplitudes (1.0 for a normalized state)
     */
    static double squaredNorm(const AmplitudeVector& amplitudes);
};

/**
 * @brief Ranker driven by simulated amplitude amplification
 *
 * Candidates scoring above mean * relevanceThresholdMultiplier are marked;
 * when none qualifies the single best candidate is marked. After
 * amplification the most probable candidate is selected, subject to a
 * tunneling correction toward the runner-up when its raw score is clearly
 * higher.
 */
class QuantumRanker : public IMovieRanker {
public:
    explicit QuantumRanker(const RankingConfig& config = {});

    RankingMode mode() const override { return RankingMode::Quantum; }

    Result<RankingResult> rank(const std::vector<catalog::Movie>& candidates,
                               const TokenSet& queryTokens) const override;

    /**
     * @brief Oracle marks for a score vector
     */
    std::vector<bool> markRelevant(const ScoreVector& scores,
                                   const std::vector<catalog::Movie>& candidates) const;

private:
    RankingConfig config_;
    RelevanceScorer scorer_;
};

} // namespace qms::search
