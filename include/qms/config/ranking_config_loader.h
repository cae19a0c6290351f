#pragma once

#include <qms/core/types.h>
#include <qms/search/relevance_scorer.h>

#include <filesystem>

namespace qms::config {

/**
 * @brief Resolve the ranking configuration (defaults -> config file -> environment)
 *
 * File keys live in the [ranking] section: match_weight, popularity_weight,
 * tunneling_margin, relevance_threshold_multiplier, max_candidates.
 * Environment overrides: QMS_MATCH_WEIGHT, QMS_POPULARITY_WEIGHT,
 * QMS_TUNNELING_MARGIN, QMS_RELEVANCE_THRESHOLD, QMS_MAX_CANDIDATES.
 *
 * A missing config file is not an error. Malformed or negative values are
 * reported as InvalidData naming the offending key.
 */
Result<search::RankingConfig> loadRankingConfig(const std::filesystem::path& configPath);

/**
 * @brief Apply environment overrides on top of @p config
 */
Result<void> applyEnvironmentOverrides(search::RankingConfig& config);

} // namespace qms::config
