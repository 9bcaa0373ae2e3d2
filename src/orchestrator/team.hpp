#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "runtime/types.hpp"

namespace crew::orchestrator {

// The four-person store team: sales, appraisal, finance, store manager.
std::vector<runtime::WorkerConfig> default_team();

// Parse [{"name", "role", "capability", "model"?}, ...]. Entries without a
// name or role are skipped with an error log.
std::vector<runtime::WorkerConfig> load_team(const nlohmann::json& roster);

// Read a roster file; relative paths are also searched under the project roots.
std::optional<std::vector<runtime::WorkerConfig>> load_team_file(const std::string& path);

} // namespace crew::orchestrator
