#include <qms/config/config_helpers.h>

#include <charconv>
#include <cmath>
#include <fstream>

namespace qms::config {

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments
        size_t comment = v.find('#');
        if (comment != std::string::npos) {
            v = v.substr(0, comment);
            trim(v);
        }

        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

Result<double> parse_double(std::string_view raw) {
    std::string s(raw);
    trim(s);
    if (s.empty()) {
        return Error{ErrorCode::InvalidData, "empty numeric value"};
    }

    const char* begin = s.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end != begin + s.size() || !std::isfinite(value)) {
        return Error{ErrorCode::InvalidData, "not a number: '" + s + "'"};
    }
    return value;
}

Result<size_t> parse_size(std::string_view raw) {
    std::string s(raw);
    trim(s);

    size_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size()) {
        return Error{ErrorCode::InvalidData, "not a non-negative integer: '" + s + "'"};
    }
    return value;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    if (const char* env = std::getenv("QMS_CONFIG"); env && *env) {
        return expand_tilde(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path(".config") / "qmsearch" / "config.toml";
    }

    return configHome / "qmsearch" / "config.toml";
}

} // namespace qms::config
