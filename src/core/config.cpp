#include "core/config.hpp"
#include "core/paths.hpp"
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

namespace crew::core::config {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2) {
        char first = value.front();
        if ((first == '"' || first == '\'') && value.back() == first) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

// Returns the number of variables applied from the file.
int apply_dotenv(const std::filesystem::path& env_path) {
    std::ifstream file(env_path);
    if (!file) {
        spdlog::warn("Could not open {}", env_path.string());
        return 0;
    }

    int applied = 0;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = unquote(trim(line.substr(eq_pos + 1)));

        // The process environment always wins over the file.
        if (!key.empty() && std::getenv(key.c_str()) == nullptr) {
            setenv(key.c_str(), value.c_str(), 0);
            ++applied;
        }
    }
    return applied;
}

} // namespace

void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths) {
    static bool loaded = false;
    if (loaded) return;
    loaded = true;

    std::vector<std::filesystem::path> search_paths = paths::project_search_paths();
    search_paths.insert(search_paths.end(), extra_search_paths.begin(), extra_search_paths.end());

    for (const auto& base : search_paths) {
        auto env_path = base / ".env";
        std::error_code ec;
        if (!std::filesystem::exists(env_path, ec)) {
            continue;
        }
        int applied = apply_dotenv(env_path);
        spdlog::debug("Loaded {} variable(s) from {}", applied, env_path.string());
        break;
    }
}

std::string get_env(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string();
}

std::string get_env_or(const std::string& key, const std::string& fallback) {
    auto value = get_env(key);
    return value.empty() ? fallback : value;
}

int64_t get_env_int(const std::string& key, int64_t fallback) {
    auto value = get_env(key);
    if (value.empty()) return fallback;
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            spdlog::warn("Ignoring {}={} (not an integer)", key, value);
            return fallback;
        }
        return static_cast<int64_t>(parsed);
    } catch (const std::exception&) {
        spdlog::warn("Ignoring {}={} (not an integer)", key, value);
        return fallback;
    }
}

} // namespace crew::core::config
