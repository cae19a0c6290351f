#include <qms/config/config_helpers.h>
#include <qms/config/ranking_config_loader.h>

#include <spdlog/spdlog.h>

#include <array>
#include <cstdlib>
#include <string>

namespace qms::config {

namespace {

enum class Field { MatchWeight, PopularityWeight, TunnelingMargin, ThresholdMultiplier, MaxCandidates };

struct FieldBinding {
    Field field;
    const char* key;
    const char* env;
};

constexpr std::array<FieldBinding, 5> kBindings{{
    {Field::MatchWeight, "match_weight", "QMS_MATCH_WEIGHT"},
    {Field::PopularityWeight, "popularity_weight", "QMS_POPULARITY_WEIGHT"},
    {Field::TunnelingMargin, "tunneling_margin", "QMS_TUNNELING_MARGIN"},
    {Field::ThresholdMultiplier, "relevance_threshold_multiplier", "QMS_RELEVANCE_THRESHOLD"},
    {Field::MaxCandidates, "max_candidates", "QMS_MAX_CANDIDATES"},
}};

Result<void> assign(search::RankingConfig& config, const FieldBinding& binding,
                    const std::string& raw, const char* origin) {
    auto fail = [&](const Error& e) {
        return Error{ErrorCode::InvalidData,
                     std::string(origin) + " " + binding.key + ": " + e.message};
    };

    if (binding.field == Field::MaxCandidates) {
        auto parsed = parse_size(raw);
        if (!parsed) {
            return fail(parsed.error());
        }
        config.maxCandidates = parsed.value();
        return {};
    }

    auto parsed = parse_double(raw);
    if (!parsed) {
        return fail(parsed.error());
    }
    const double value = parsed.value();
    if (value < 0.0) {
        return fail(Error{ErrorCode::InvalidData, "must be non-negative"});
    }

    switch (binding.field) {
        case Field::MatchWeight:
            config.matchWeight = value;
            break;
        case Field::PopularityWeight:
            config.popularityWeight = value;
            break;
        case Field::TunnelingMargin:
            config.tunnelingMargin = value;
            break;
        case Field::ThresholdMultiplier:
            config.relevanceThresholdMultiplier = value;
            break;
        case Field::MaxCandidates:
            break;
    }
    return {};
}

} // namespace

Result<void> applyEnvironmentOverrides(search::RankingConfig& config) {
    for (const auto& binding : kBindings) {
        const char* env = std::getenv(binding.env);
        if (!env || !*env) {
            continue;
        }
        if (auto r = assign(config, binding, env, binding.env); !r) {
            return r;
        }
        spdlog::debug("Ranking config: {} overridden from environment", binding.key);
    }
    return {};
}

Result<search::RankingConfig> loadRankingConfig(const std::filesystem::path& configPath) {
    search::RankingConfig config;

    std::error_code ec;
    if (!configPath.empty() && std::filesystem::exists(configPath, ec)) {
        const auto origin = configPath.string();
        for (const auto& binding : kBindings) {
            auto raw = parse_config_value(configPath, "ranking", binding.key);
            if (raw.empty()) {
                continue;
            }
            if (auto r = assign(config, binding, raw, origin.c_str()); !r) {
                return r.error();
            }
        }
        spdlog::debug("Loaded ranking config from {}", origin);
    } else {
        spdlog::debug("No config file at '{}', using defaults", configPath.string());
    }

    if (auto r = applyEnvironmentOverrides(config); !r) {
        return r.error();
    }
    return config;
}

} // namespace qms::config
