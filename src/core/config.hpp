#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace crew::core::config {

// Load environment variables from a .env file (idempotent).
void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths = {});

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

// Get an integer environment variable; fallback when missing or not a number.
int64_t get_env_int(const std::string& key, int64_t fallback);

} // namespace crew::core::config
