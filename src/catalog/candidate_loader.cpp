#include <qms/catalog/movie.h>

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <unordered_set>

namespace qms::catalog {

using json = nlohmann::json;

namespace {

Error invalidElement(size_t index, const std::string& what) {
    return Error{ErrorCode::InvalidData, "candidate[" + std::to_string(index) + "]: " + what};
}

Result<Movie> parseMovie(const json& j, size_t index) {
    if (!j.is_object()) {
        return invalidElement(index, "expected an object");
    }

    auto idIt = j.find("id");
    if (idIt == j.end() || !idIt->is_number_integer()) {
        return invalidElement(index, "missing integer 'id'");
    }
    if (idIt->is_number_unsigned() &&
        idIt->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<MovieId>::max())) {
        return invalidElement(index, "'id' out of range");
    }
    auto titleIt = j.find("title");
    if (titleIt == j.end() || !titleIt->is_string()) {
        return invalidElement(index, "missing string 'title'");
    }

    Movie movie;
    movie.id = idIt->get<MovieId>();
    movie.title = titleIt->get<std::string>();

    if (auto it = j.find("overview"); it != j.end() && it->is_string()) {
        movie.overview = it->get<std::string>();
    }
    if (auto it = j.find("release_date"); it != j.end() && it->is_string()) {
        movie.releaseDate = it->get<std::string>();
    }
    if (auto it = j.find("popularity"); it != j.end() && !it->is_null()) {
        if (!it->is_number()) {
            return invalidElement(index, "'popularity' must be a number");
        }
        movie.popularity = it->get<double>();
        if (!std::isfinite(movie.popularity) || movie.popularity < 0.0) {
            return invalidElement(index, "'popularity' must be non-negative");
        }
    }

    if (auto it = j.find("tags"); it != j.end() && it->is_array()) {
        for (const auto& tag : *it) {
            if (tag.is_string()) {
                movie.tags.push_back(tag.get<std::string>());
            }
        }
    }
    if (auto it = j.find("genre_ids"); it != j.end() && it->is_array()) {
        for (const auto& gid : *it) {
            if (gid.is_number_integer()) {
                movie.tags.push_back("genre:" + std::to_string(gid.get<int64_t>()));
            }
        }
    }
    if (auto it = j.find("genres"); it != j.end() && it->is_array()) {
        for (const auto& genre : *it) {
            if (genre.is_string()) {
                movie.tags.push_back("genre:" + genre.get<std::string>());
            } else if (genre.is_object() && genre.contains("name") && genre["name"].is_string()) {
                movie.tags.push_back("genre:" + genre["name"].get<std::string>());
            }
        }
    }
    if (auto it = j.find("cast"); it != j.end() && it->is_array()) {
        for (const auto& member : *it) {
            if (member.is_string()) {
                movie.tags.push_back("cast:" + member.get<std::string>());
            } else if (member.is_object() && member.contains("name") &&
                       member["name"].is_string()) {
                movie.tags.push_back("cast:" + member["name"].get<std::string>());
            }
        }
    }

    return movie;
}

} // namespace

Result<std::vector<Movie>> parseCandidates(const json& doc) {
    const json* items = &doc;
    if (doc.is_object()) {
        auto it = doc.find("results");
        if (it == doc.end()) {
            return Error{ErrorCode::InvalidData, "object has no 'results' array"};
        }
        items = &(*it);
    }
    if (!items->is_array()) {
        return Error{ErrorCode::InvalidData, "expected an array of movies"};
    }

    std::vector<Movie> movies;
    movies.reserve(items->size());
    std::unordered_set<MovieId> seenIds;
    for (size_t i = 0; i < items->size(); ++i) {
        auto movie = parseMovie((*items)[i], i);
        if (!movie) {
            return movie.error();
        }
        if (!seenIds.insert(movie.value().id).second) {
            return invalidElement(i, "duplicate id " + std::to_string(movie.value().id));
        }
        movies.push_back(std::move(movie).value());
    }
    return movies;
}

Result<std::vector<Movie>> parseCandidatesText(std::string_view text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidData, std::string("malformed JSON: ") + e.what()};
    }
    return parseCandidates(doc);
}

Result<std::vector<Movie>> loadCandidates(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "cannot open " + path.string()};
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    auto movies = parseCandidatesText(buffer.str());
    if (movies) {
        spdlog::debug("Loaded {} candidates from {}", movies.value().size(), path.string());
    }
    return movies;
}

} // namespace qms::catalog
