#include <qms/search/quantum_ranker.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <numeric>

namespace qms::search {

AmplitudeVector AmplitudeSimulator::uniform(size_t count) {
    if (count == 0) {
        return {};
    }
    return AmplitudeVector(count, 1.0 / std::sqrt(static_cast<double>(count)));
}

size_t AmplitudeSimulator::iterationCount(size_t candidateCount, size_t markedCount) {
    if (candidateCount == 0) {
        return 0;
    }
    markedCount = std::clamp<size_t>(markedCount, 1, candidateCount);

    double ratio = static_cast<double>(candidateCount) / static_cast<double>(markedCount);
    auto rounds = static_cast<size_t>(std::floor(std::numbers::pi / 4.0 * std::sqrt(ratio)));
    return std::clamp<size_t>(rounds, 1, candidateCount);
}

void AmplitudeSimulator::applyOracle(AmplitudeVector& amplitudes, const std::vector<bool>& marked) {
    const size_t n = std::min(amplitudes.size(), marked.size());
    for (size_t i = 0; i < n; ++i) {
        if (marked[i]) {
            amplitudes[i] = -amplitudes[i];
        }
    }
}

void AmplitudeSimulator::applyDiffusion(AmplitudeVector& amplitudes) {
    if (amplitudes.empty()) {
        return;
    }
    const double mean = std::accumulate(amplitudes.begin(), amplitudes.end(), 0.0) /
                        static_cast<double>(amplitudes.size());
    for (auto& a : amplitudes) {
        a = 2.0 * mean - a;
    }
}

std::vector<double> AmplitudeSimulator::probabilities(const AmplitudeVector& amplitudes) {
    std::vector<double> probs;
    probs.reserve(amplitudes.size());
    for (double a : amplitudes) {
        probs.push_back(a * a);
    }
    return probs;
}

double AmplitudeSimulator::squaredNorm(const AmplitudeVector& amplitudes) {
    double sum = 0.0;
    for (double a : amplitudes) {
        sum += a * a;
    }
    return sum;
}

QuantumRanker::QuantumRanker(const RankingConfig& config) : config_(config), scorer_(config) {}

std::vector<bool> QuantumRanker::markRelevant(const ScoreVector& scores,
                                              const std::vector<catalog::Movie>& candidates) const {
    std::vector<bool> marked(scores.size(), false);
    if (scores.empty()) {
        return marked;
    }

    const double mean =
        std::accumulate(scores.begin(), scores.end(), 0.0) / static_cast<double>(scores.size());
    const double threshold = mean * config_.relevanceThresholdMultiplier;

    bool any = false;
    for (size_t i = 0; i < scores.size(); ++i) {
        if (scores[i] > threshold) {
            marked[i] = true;
            any = true;
        }
    }

    // Uniform scores leave nothing above the bar; amplify the classical pick instead.
    if (!any) {
        marked[selectBest(scores, candidates)] = true;
    }
    return marked;
}

Result<RankingResult> QuantumRanker::rank(const std::vector<catalog::Movie>& candidates,
                                          const TokenSet& queryTokens) const {
    const size_t n = candidates.size();
    if (n == 0) {
        return Error{ErrorCode::EmptyCandidateSet, "no candidates to rank"};
    }
    if (queryTokens.empty()) {
        return Error{ErrorCode::InvalidQuery, "query has no searchable tokens"};
    }

    auto scores = scorer_.scoreAll(candidates, queryTokens);
    auto marked = markRelevant(scores, candidates);
    const auto markedCount = static_cast<size_t>(std::count(marked.begin(), marked.end(), true));

    auto amplitudes = AmplitudeSimulator::uniform(n);
    const size_t rounds = AmplitudeSimulator::iterationCount(n, markedCount);

    for (size_t r = 0; r < rounds; ++r) {
        AmplitudeSimulator::applyOracle(amplitudes, marked);
        AmplitudeSimulator::applyDiffusion(amplitudes);
    }

    auto probs = AmplitudeSimulator::probabilities(amplitudes);
    size_t selected = selectBest(probs, candidates);
    bool tunneled = false;

    size_t runnerUp = selectBest(probs, candidates, selected);
    if (runnerUp < n && scores[runnerUp] > scores[selected] * (1.0 + config_.tunnelingMargin)) {
        spdlog::info("Tunneling correction: index {} (score {:.3f}) replaces index {} "
                     "(score {:.3f})",
                     runnerUp, scores[runnerUp], selected, scores[selected]);
        selected = runnerUp;
        tunneled = true;
    }

    RankingResult result;
    result.index = selected;
    result.movieId = candidates[selected].id;
    result.mode = RankingMode::Quantum;
    result.iterations = rounds;
    result.markedCount = markedCount;
    result.topScore = scores[selected];
    result.topProbability = probs[selected];
    result.tunneled = tunneled;

    spdlog::debug("Quantum ranking: N={} M={} R={}, selected index {} (p={:.4f})", n, markedCount,
                  rounds, selected, probs[selected]);
    return result;
}

} // namespace qms::search
