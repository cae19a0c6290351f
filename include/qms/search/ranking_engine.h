#pragma once

#include <qms/search/mode_comparator.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qms::search {

/**
 * @brief A ranking request as handed over by the request-handling layer
 */
struct SearchRequest {
    std::string query;
    RankingMode mode = RankingMode::Classical;

    // Release year suggested by query understanding; enables the exact
    // title/year shortcut when present
    std::optional<std::string> likelyYear;
};

/**
 * @brief Entry point of the ranking core
 *
 * Validates the candidate set and query, then delegates to the classical
 * ranker, the quantum ranker, or the mode comparator. Stateless apart from
 * its configuration; safe to share between threads.
 *
 * Validation order: empty candidate set, size limit, popularity values,
 * query tokens. Nothing is scored before all checks pass.
 */
class RankingEngine {
public:
    explicit RankingEngine(const RankingConfig& config = {});

    const RankingConfig& getConfig() const { return config_; }

    Result<RankingResult> rankClassical(const std::vector<catalog::Movie>& candidates,
                                        std::string_view query) const;

    Result<RankingResult> rankQuantum(const std::vector<catalog::Movie>& candidates,
                                      std::string_view query) const;

    Result<ComparisonResult> compareModes(const std::vector<catalog::Movie>& candidates,
                                          std::string_view query) const;

    /**
     * @brief Rank with the requested mode, preferring an exact title/year hit
     */
    Result<RankingResult> search(const std::vector<catalog::Movie>& candidates,
                                 const SearchRequest& request) const;

    /**
     * @brief Index of the candidate whose title equals @p title (trimmed,
     * case-insensitive) and whose release year equals @p year
     */
    static std::optional<size_t> findExactTitleMatch(const std::vector<catalog::Movie>& candidates,
                                                     std::string_view title,
                                                     std::string_view year);

private:
    Result<TokenSet> validate(const std::vector<catalog::Movie>& candidates,
                              std::string_view query) const;

    Result<RankingResult> rankWith(const IMovieRanker& ranker,
                                   const std::vector<catalog::Movie>& candidates,
                                   std::string_view query) const;

    RankingConfig config_;
    QueryTokenizer tokenizer_;
    ClassicalRanker classical_;
    QuantumRanker quantum_;
    ModeComparator comparator_;
};

} // namespace qms::search
