#include <qms/search/relevance_scorer.h>

namespace qms::search {

RelevanceScorer::RelevanceScorer(const RankingConfig& config) : config_(config) {}

size_t RelevanceScorer::countMatches(const catalog::Movie& movie,
                                     const TokenSet& queryTokens) const {
    std::string text;
    text.reserve(movie.title.size() + movie.overview.size() + 1);
    text.append(movie.title).append(" ").append(movie.overview);
    auto movieTokens = tokenizer_.tokenize(text);

    size_t matches = 0;
    for (const auto& token : queryTokens) {
        if (QueryTokenizer::contains(movieTokens, token)) {
            ++matches;
        }
    }
    return matches;
}

double RelevanceScorer::calculateScore(const catalog::Movie& movie,
                                       const TokenSet& queryTokens) const {
    double base = static_cast<double>(countMatches(movie, queryTokens)) * config_.matchWeight;
    double popularityBoost = movie.popularity * config_.popularityWeight;
    return base + popularityBoost;
}

ScoreVector RelevanceScorer::scoreAll(const std::vector<catalog::Movie>& candidates,
                                      const TokenSet& queryTokens) const {
    ScoreVector scores;
    scores.reserve(candidates.size());
    for (const auto& movie : candidates) {
        scores.push_back(calculateScore(movie, queryTokens));
    }
    return scores;
}

bool ranksAhead(double valueA, double popularityA, size_t indexA, double valueB,
                double popularityB, size_t indexB) {
    if (valueA != valueB) {
        return valueA > valueB;
    }
    if (popularityA != popularityB) {
        return popularityA > popularityB;
    }
    return indexA < indexB;
}

size_t selectBest(const std::vector<double>& values,
                  const std::vector<catalog::Movie>& candidates, size_t excluded) {
    size_t best = values.size();
    for (size_t i = 0; i < values.size(); ++i) {
        if (i == excluded) {
            continue;
        }
        if (best == values.size() ||
            ranksAhead(values[i], candidates[i].popularity, i, values[best],
                       candidates[best].popularity, best)) {
            best = i;
        }
    }
    return best;
}

} // namespace qms::search
