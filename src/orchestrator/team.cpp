#include "orchestrator/team.hpp"
#include "core/paths.hpp"
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace crew::orchestrator {

std::vector<runtime::WorkerConfig> default_team() {
    return {
        {"Mike Rodriguez", "Sales Consultant",
         "You help customers find the right vehicle: understand their needs, budget and "
         "preferences, search inventory, compare features, and schedule test drives. "
         "Be consultative and keep first answers under 200 words.", ""},
        {"Sarah Chen", "Appraisal Manager",
         "You assess vehicle condition, analyse market value and history, and produce "
         "trade-in valuations with specific dollar amounts and clear reasoning.", ""},
        {"David Williams", "Finance Manager",
         "You structure loans, analyse credit tiers, and compare financing scenarios with "
         "concrete monthly payments and total cost for each option.", ""},
        {"Jennifer Thompson", "Store Manager",
         "You monitor team performance, customer satisfaction and process quality, and give "
         "actionable recommendations with specific metrics.", ""}
    };
}

std::vector<runtime::WorkerConfig> load_team(const json& roster) {
    std::vector<runtime::WorkerConfig> team;
    if (!roster.is_array()) {
        spdlog::error("Team roster must be a JSON array");
        return team;
    }

    for (size_t i = 0; i < roster.size(); ++i) {
        const auto& entry = roster[i];
        if (!entry.is_object()) {
            spdlog::error("Team entry {} is not an object", i);
            continue;
        }

        runtime::WorkerConfig config;
        config.name = entry.value("name", std::string());
        config.role = entry.value("role", std::string());
        config.capability = entry.value("capability", std::string());
        config.model = entry.value("model", std::string());

        if (config.name.empty() || config.role.empty()) {
            spdlog::error("Team entry {} needs both name and role", i);
            continue;
        }
        team.push_back(std::move(config));
    }
    return team;
}

std::optional<std::vector<runtime::WorkerConfig>> load_team_file(const std::string& path) {
    std::filesystem::path resolved = path;
    std::error_code ec;
    if (!std::filesystem::exists(resolved, ec)) {
        auto found = core::paths::find_relative(path);
        if (!found) {
            spdlog::error("Team file not found: {}", path);
            return std::nullopt;
        }
        resolved = *found;
    }

    std::ifstream file(resolved);
    if (!file) {
        spdlog::error("Cannot open team file {}", resolved.string());
        return std::nullopt;
    }

    try {
        auto roster = json::parse(file);
        auto team = load_team(roster);
        spdlog::info("Loaded {} worker(s) from {}", team.size(), resolved.string());
        return team;
    } catch (const json::exception& e) {
        spdlog::error("Invalid team file {}: {}", resolved.string(), e.what());
        return std::nullopt;
    }
}

} // namespace crew::orchestrator
