#pragma once

#include <qms/search/movie_ranker.h>

namespace qms::search {

/**
 * @brief Picks the candidate with the maximum relevance score
 */
class ClassicalRanker : public IMovieRanker {
public:
    explicit ClassicalRanker(const RankingConfig& config = {});

    RankingMode mode() const override { return RankingMode::Classical; }

    Result<RankingResult> rank(const std::vector<catalog::Movie>& candidates,
                               const TokenSet& queryTokens) const override;

private:
    RelevanceScorer scorer_;
};

} // namespace qms::search
