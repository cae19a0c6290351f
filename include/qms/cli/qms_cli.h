#pragma once

#include <qms/catalog/movie.h>
#include <qms/search/ranking_engine.h>

#include <nlohmann/json.hpp>

#include <iostream>
#include <vector>

namespace qms::cli {

/**
 * @brief Command-line front end for the ranking engine
 *
 * Subcommands:
 *   rank <query> -c FILE [-m classical|quantum] [-y YEAR]
 *   compare <query> -c FILE
 *
 * Results are written as JSON to the output stream given at construction;
 * diagnostics go through spdlog. Each run() parses a fresh argument set, so
 * one instance can serve several invocations.
 */
class QmsCLI {
public:
    explicit QmsCLI(std::ostream& out = std::cout);

    /**
     * @brief Parse arguments and execute the selected subcommand
     * @return 0 on success, non-zero on parse or ranking failure
     */
    int run(int argc, char* argv[]);

private:
    std::ostream& out_;
};

/**
 * @brief JSON printed by `rank`: the ranking result plus the selected movie
 */
nlohmann::json rankOutput(const search::RankingResult& result,
                          const std::vector<catalog::Movie>& candidates);

/**
 * @brief JSON printed by `compare`: both outcomes plus the two selected movies
 */
nlohmann::json compareOutput(const search::ComparisonResult& comparison,
                             const std::vector<catalog::Movie>& candidates);

} // namespace qms::cli
