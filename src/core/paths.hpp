#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace crew::core::paths {

// Directory of the running executable; empty if /proc/self/exe is unreadable.
std::filesystem::path executable_dir();

// Working directory and executable directory, each with two parents, de-duplicated.
std::vector<std::filesystem::path> project_search_paths();

// Find a relative path under any of the search roots.
std::optional<std::filesystem::path> find_relative(const std::string& relative);

} // namespace crew::core::paths
