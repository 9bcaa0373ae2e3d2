#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/paths.hpp"
#include "orchestrator/config.hpp"

using namespace crew;

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char* key : {"CREW_BACKEND_URL", "CREW_MODEL", "CREW_MAX_ATTEMPTS",
                                "CREW_BACKOFF_BASE_MS", "CREW_BACKOFF_MAX_MS",
                                "CREW_REQUEST_TIMEOUT_MS", "CREW_CANCEL_GRACE_MS",
                                "CREW_RETRY_DEADLINE_MS",
                                "CREW_TEST_INT"}) {
            unsetenv(key);
        }
    }
};

TEST_F(ConfigTest, EnvHelpersFallBack) {
    EXPECT_EQ(core::config::get_env("CREW_TEST_INT"), "");
    EXPECT_EQ(core::config::get_env_or("CREW_TEST_INT", "fallback"), "fallback");
    EXPECT_EQ(core::config::get_env_int("CREW_TEST_INT", 7), 7);

    setenv("CREW_TEST_INT", "42", 1);
    EXPECT_EQ(core::config::get_env_int("CREW_TEST_INT", 7), 42);

    setenv("CREW_TEST_INT", "42ms", 1);
    EXPECT_EQ(core::config::get_env_int("CREW_TEST_INT", 7), 7);
}

TEST_F(ConfigTest, DefaultsWhenEnvironmentIsEmpty) {
    auto config = orchestrator::OrchestratorConfig::from_env();
    EXPECT_EQ(config.generation.base_url, "http://localhost:11434");
    EXPECT_EQ(config.generation.model, "llama3.2");
    EXPECT_EQ(config.generation.retry.max_attempts, 3u);
    EXPECT_EQ(config.generation.request_timeout, std::chrono::milliseconds(60000));
    EXPECT_EQ(config.cancel_grace, std::chrono::milliseconds(5000));
}

TEST_F(ConfigTest, ReadsOverridesFromEnvironment) {
    setenv("CREW_BACKEND_URL", "http://gpu-box:11434", 1);
    setenv("CREW_MODEL", "mistral", 1);
    setenv("CREW_MAX_ATTEMPTS", "5", 1);
    setenv("CREW_BACKOFF_BASE_MS", "250", 1);
    setenv("CREW_BACKOFF_MAX_MS", "4000", 1);
    setenv("CREW_REQUEST_TIMEOUT_MS", "15000", 1);
    setenv("CREW_CANCEL_GRACE_MS", "100", 1);

    auto config = orchestrator::OrchestratorConfig::from_env();

    EXPECT_EQ(config.generation.base_url, "http://gpu-box:11434");
    EXPECT_EQ(config.generation.model, "mistral");
    EXPECT_EQ(config.generation.retry.max_attempts, 5u);
    EXPECT_EQ(config.generation.retry.base_delay, std::chrono::milliseconds(250));
    EXPECT_EQ(config.generation.retry.max_delay, std::chrono::milliseconds(4000));
    EXPECT_EQ(config.generation.request_timeout, std::chrono::milliseconds(15000));
    EXPECT_EQ(config.cancel_grace, std::chrono::milliseconds(100));
}

TEST_F(ConfigTest, ZeroAttemptsIsRaisedToOne) {
    setenv("CREW_MAX_ATTEMPTS", "0", 1);
    EXPECT_EQ(orchestrator::OrchestratorConfig::from_env().generation.retry.max_attempts, 1u);
}

TEST_F(ConfigTest, NonPositiveTimeoutsFallBackToDefaults) {
    setenv("CREW_REQUEST_TIMEOUT_MS", "0", 1);
    setenv("CREW_RETRY_DEADLINE_MS", "-5", 1);

    auto config = orchestrator::OrchestratorConfig::from_env();

    EXPECT_EQ(config.generation.request_timeout, std::chrono::milliseconds(60000));
    EXPECT_EQ(config.generation.retry.overall_deadline, std::chrono::milliseconds(180000));
}

TEST_F(ConfigTest, HugeAttemptCountIsClampedNotWrapped) {
    setenv("CREW_MAX_ATTEMPTS", "4294967296", 1);
    EXPECT_EQ(orchestrator::OrchestratorConfig::from_env().generation.retry.max_attempts,
              std::numeric_limits<uint32_t>::max());
}

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(core::log_level_from_string("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(core::log_level_from_string("warning"), spdlog::level::warn);
    EXPECT_EQ(core::log_level_from_string("error"), spdlog::level::err);
    EXPECT_EQ(core::log_level_from_string("off"), spdlog::level::off);
    EXPECT_EQ(core::log_level_from_string("chatty"), spdlog::level::info);
}

TEST(LoggerTest, InitInstallsCrewLoggerOnce) {
    core::init_logger();
    core::init_logger();

    auto logger = spdlog::get("crew");
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(spdlog::default_logger(), logger);

    core::set_log_level(spdlog::level::warn);
    EXPECT_EQ(logger->level(), spdlog::level::warn);
    core::set_log_level(spdlog::level::info);
}

TEST(PathsTest, FindsFilesRelativeToWorkingDirectory) {
    auto dir = std::filesystem::current_path() / "crew_paths_test";
    std::filesystem::create_directories(dir);
    {
        std::ofstream out(dir / "team.json");
        out << "[]";
    }

    auto found = core::paths::find_relative("crew_paths_test/team.json");
    std::filesystem::remove_all(dir);

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->filename(), "team.json");
    EXPECT_FALSE(core::paths::find_relative("crew_paths_test/missing.json").has_value());
    EXPECT_FALSE(core::paths::project_search_paths().empty());
}
