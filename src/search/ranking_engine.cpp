#include <qms/search/ranking_engine.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace qms::search {

Result<RankingMode> parseRankingMode(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "classical") {
        return RankingMode::Classical;
    }
    if (lowered == "quantum") {
        return RankingMode::Quantum;
    }
    return Error{ErrorCode::InvalidArgument, "unknown ranking mode: " + std::string(text)};
}

RankingEngine::RankingEngine(const RankingConfig& config)
    : config_(config), classical_(config), quantum_(config), comparator_(config) {}

Result<TokenSet> RankingEngine::validate(const std::vector<catalog::Movie>& candidates,
                                         std::string_view query) const {
    if (candidates.empty()) {
        return Error{ErrorCode::EmptyCandidateSet, "no candidates to rank"};
    }
    if (config_.maxCandidates > 0 && candidates.size() > config_.maxCandidates) {
        return Error{ErrorCode::InvalidArgument,
                     "candidate set of " + std::to_string(candidates.size()) +
                         " exceeds limit of " + std::to_string(config_.maxCandidates)};
    }
    for (size_t i = 0; i < candidates.size(); ++i) {
        const double popularity = candidates[i].popularity;
        if (!std::isfinite(popularity) || popularity < 0.0) {
            return Error{ErrorCode::InvalidArgument,
                         "candidate " + std::to_string(i) + " has invalid popularity"};
        }
    }
    return tokenizer_.normalizeQuery(query);
}

Result<RankingResult> RankingEngine::rankWith(const IMovieRanker& ranker,
                                              const std::vector<catalog::Movie>& candidates,
                                              std::string_view query) const {
    auto tokens = validate(candidates, query);
    if (!tokens) {
        spdlog::debug("Rejected {} ranking request: {}", rankingModeToString(ranker.mode()),
                      tokens.error().message);
        return tokens.error();
    }
    return ranker.rank(candidates, tokens.value());
}

Result<RankingResult> RankingEngine::rankClassical(const std::vector<catalog::Movie>& candidates,
                                                   std::string_view query) const {
    return rankWith(classical_, candidates, query);
}

Result<RankingResult> RankingEngine::rankQuantum(const std::vector<catalog::Movie>& candidates,
                                                 std::string_view query) const {
    return rankWith(quantum_, candidates, query);
}

Result<ComparisonResult> RankingEngine::compareModes(const std::vector<catalog::Movie>& candidates,
                                                     std::string_view query) const {
    auto tokens = validate(candidates, query);
    if (!tokens) {
        return tokens.error();
    }
    return comparator_.compare(candidates, tokens.value());
}

std::optional<size_t> RankingEngine::findExactTitleMatch(
    const std::vector<catalog::Movie>& candidates, std::string_view title, std::string_view year) {
    const auto wantedTitle = QueryTokenizer::normalizeTitle(title);
    const auto wantedYear = QueryTokenizer::normalizeTitle(year);
    if (wantedTitle.empty() || wantedYear.empty()) {
        return std::nullopt;
    }

    for (size_t i = 0; i < candidates.size(); ++i) {
        if (QueryTokenizer::normalizeTitle(candidates[i].title) == wantedTitle &&
            candidates[i].releaseYear() == wantedYear) {
            return i;
        }
    }
    return std::nullopt;
}

Result<RankingResult> RankingEngine::search(const std::vector<catalog::Movie>& candidates,
                                            const SearchRequest& request) const {
    const IMovieRanker& ranker =
        request.mode == RankingMode::Quantum ? static_cast<const IMovieRanker&>(quantum_)
                                             : static_cast<const IMovieRanker&>(classical_);

    auto tokens = validate(candidates, request.query);
    if (!tokens) {
        spdlog::debug("Rejected {} search request: {}", rankingModeToString(ranker.mode()),
                      tokens.error().message);
        return tokens.error();
    }

    if (request.likelyYear) {
        if (auto hit = findExactTitleMatch(candidates, request.query, *request.likelyYear)) {
            spdlog::debug("Exact title/year match for '{}' ({}) at index {}", request.query,
                          *request.likelyYear, *hit);
            RankingResult result;
            result.index = *hit;
            result.movieId = candidates[*hit].id;
            result.mode = request.mode;
            result.topScore = RelevanceScorer(config_).calculateScore(candidates[*hit],
                                                                      tokens.value());
            result.topProbability = 1.0;
            result.exactTitleMatch = true;
            return result;
        }
    }

    // Tokens are already validated; rank them directly
    return ranker.rank(candidates, tokens.value());
}

} // namespace qms::search
