#include <qms/cli/qms_cli.h>

#include <qms/config/config_helpers.h>
#include <qms/config/ranking_config_loader.h>
#include <qms/version.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <string>

namespace qms::cli {

using json = nlohmann::json;

namespace {

template <typename T> bool report(const Result<T>& result, const char* what) {
    if (result) {
        return true;
    }
    spdlog::error("{} failed: {} ({})", what, result.error().message,
                  errorToString(result.error().code));
    return false;
}

} // namespace

json rankOutput(const search::RankingResult& result, const std::vector<catalog::Movie>& candidates) {
    json out = result.toJson();
    out["movie"] = candidates[result.index].toJson();
    return out;
}

json compareOutput(const search::ComparisonResult& comparison,
                   const std::vector<catalog::Movie>& candidates) {
    json out = comparison.toJson();
    out["classical_movie"] = candidates[comparison.classicalIndex].toJson();
    out["quantum_movie"] = candidates[comparison.quantumIndex].toJson();
    return out;
}

QmsCLI::QmsCLI(std::ostream& out) : out_(out) {}

int QmsCLI::run(int argc, char* argv[]) {
    try {
        CLI::App app{"Movie ranking with classical and simulated quantum search", "qms-cli"};
        app.set_version_flag("--version", QMS_VERSION_STRING);
        app.require_subcommand(1);

        std::string configPath;
        bool verbose = false;
        app.add_option("--config", configPath, "Path to config.toml");
        app.add_flag("-v,--verbose", verbose, "Enable debug logging");

        std::string query;
        std::string candidatesPath;

        // rank
        auto* rankCmd = app.add_subcommand("rank", "Select the best matching movie");
        std::string modeName = "classical";
        std::string year;
        rankCmd->add_option("query", query, "Search query")->required();
        rankCmd->add_option("-c,--candidates", candidatesPath, "Candidate set JSON file")
            ->required()
            ->check(CLI::ExistingFile);
        rankCmd->add_option("-m,--mode", modeName, "Ranking mode")
            ->check(CLI::IsMember({"classical", "quantum"}, CLI::ignore_case))
            ->default_val("classical");
        rankCmd->add_option("-y,--year", year, "Likely release year for an exact title match");

        // compare
        auto* compareCmd = app.add_subcommand("compare", "Run both modes and compare the picks");
        compareCmd->add_option("query", query, "Search query")->required();
        compareCmd->add_option("-c,--candidates", candidatesPath, "Candidate set JSON file")
            ->required()
            ->check(CLI::ExistingFile);

        CLI11_PARSE(app, argc, argv);

        spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);

        auto config = config::loadRankingConfig(config::get_config_path(configPath));
        if (!report(config, "Loading configuration")) {
            return 1;
        }
        spdlog::debug("Ranking config: {}", config.value().toJson().dump());

        auto movies = catalog::loadCandidates(candidatesPath);
        if (!report(movies, "Loading candidates")) {
            return 1;
        }

        search::RankingEngine engine(config.value());

        if (rankCmd->parsed()) {
            auto mode = search::parseRankingMode(modeName);
            if (!report(mode, "Parsing mode")) {
                return 1;
            }

            search::SearchRequest request;
            request.query = query;
            request.mode = mode.value();
            if (!year.empty()) {
                request.likelyYear = year;
            }

            spdlog::info("Ranking {} candidates for '{}' ({})", movies.value().size(), query,
                         search::rankingModeToString(request.mode));
            auto result = engine.search(movies.value(), request);
            if (!report(result, "Ranking")) {
                return 1;
            }
            out_ << rankOutput(result.value(), movies.value()).dump(2) << std::endl;
        } else if (compareCmd->parsed()) {
            auto comparison = engine.compareModes(movies.value(), query);
            if (!report(comparison, "Comparison")) {
                return 1;
            }
            out_ << compareOutput(comparison.value(), movies.value()).dump(2) << std::endl;
        }

        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}

} // namespace qms::cli
