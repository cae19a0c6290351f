#include <qms/search/classical_ranker.h>

#include <spdlog/spdlog.h>

namespace qms::search {

ClassicalRanker::ClassicalRanker(const RankingConfig& config) : scorer_(config) {}

Result<RankingResult> ClassicalRanker::rank(const std::vector<catalog::Movie>& candidates,
                                            const TokenSet& queryTokens) const {
    if (candidates.empty()) {
        return Error{ErrorCode::EmptyCandidateSet, "no candidates to rank"};
    }
    if (queryTokens.empty()) {
        return Error{ErrorCode::InvalidQuery, "query has no searchable tokens"};
    }

    auto scores = scorer_.scoreAll(candidates, queryTokens);
    size_t best = selectBest(scores, candidates);

    RankingResult result;
    result.index = best;
    result.movieId = candidates[best].id;
    result.mode = RankingMode::Classical;
    result.topScore = scores[best];
    result.topProbability = 1.0;

    spdlog::debug("Classical ranking: {} candidates, selected index {} (score {:.3f})",
                  candidates.size(), best, scores[best]);
    return result;
}

} // namespace qms::search
