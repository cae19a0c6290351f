#pragma once

#include <qms/core/types.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace qms::catalog {

/**
 * @brief A movie record as delivered by the catalog service.
 *
 * Read-only to the ranking engine. Tags carry genre and cast markers
 * (e.g. "genre:878", "cast:Leonardo DiCaprio") used by the mode comparator.
 */
struct Movie {
    MovieId id = 0;
    std::string title;
    std::string overview;
    double popularity = 0.0;
    std::string releaseDate; // YYYY-MM-DD, may be empty
    std::vector<std::string> tags;

    /**
     * @brief Four-digit release year, or empty when the date is missing.
     */
    std::string releaseYear() const {
        return releaseDate.size() >= 4 ? releaseDate.substr(0, 4) : std::string{};
    }

    [[nodiscard]] nlohmann::json toJson() const {
        return nlohmann::json{{"id", id},
                              {"title", title},
                              {"overview", overview},
                              {"popularity", popularity},
                              {"release_date", releaseDate},
                              {"tags", tags}};
    }
};

/**
 * @brief Parse a candidate set from JSON.
 *
 * Accepts a plain array of movie objects or a search response object with a
 * "results" array. genre_ids, genres and cast are folded into tags.
 * Movie ids must fit MovieId and be unique within the set.
 */
Result<std::vector<Movie>> parseCandidates(const nlohmann::json& doc);

/**
 * @brief Parse a candidate set from JSON text.
 */
Result<std::vector<Movie>> parseCandidatesText(std::string_view text);

/**
 * @brief Load a candidate set from a JSON file on disk.
 */
Result<std::vector<Movie>> loadCandidates(const std::filesystem::path& path);

} // namespace qms::catalog
