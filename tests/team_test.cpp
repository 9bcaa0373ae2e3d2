#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include "orchestrator/team.hpp"

using namespace crew::orchestrator;
using json = nlohmann::json;

TEST(TeamTest, DefaultTeamHasFourDistinctRoles) {
    auto team = default_team();
    ASSERT_EQ(team.size(), 4u);
    EXPECT_EQ(team[0].role, "Sales Consultant");
    EXPECT_EQ(team[1].role, "Appraisal Manager");
    EXPECT_EQ(team[2].role, "Finance Manager");
    EXPECT_EQ(team[3].role, "Store Manager");
    for (const auto& member : team) {
        EXPECT_FALSE(member.name.empty());
        EXPECT_FALSE(member.capability.empty());
    }
}

TEST(TeamTest, LoadTeamParsesEntriesAndSkipsIncompleteOnes) {
    auto roster = json::parse(R"([
        {"name": "Ana", "role": "Greeter", "capability": "Welcome customers.", "model": "phi3"},
        {"name": "NoRole"},
        {"role": "Nameless"},
        42,
        {"name": "Ben", "role": "Detailer"}
    ])");

    auto team = load_team(roster);

    ASSERT_EQ(team.size(), 2u);
    EXPECT_EQ(team[0].name, "Ana");
    EXPECT_EQ(team[0].model, "phi3");
    EXPECT_EQ(team[0].capability, "Welcome customers.");
    EXPECT_EQ(team[1].name, "Ben");
    EXPECT_TRUE(team[1].model.empty());
}

TEST(TeamTest, LoadTeamRejectsNonArray) {
    EXPECT_TRUE(load_team(json::object()).empty());
}

TEST(TeamTest, LoadTeamFileReadsJson) {
    auto path = std::filesystem::temp_directory_path() / "crew_team_test.json";
    {
        std::ofstream out(path);
        out << R"([{"name": "Cara", "role": "Service Advisor"}])";
    }

    auto team = load_team_file(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(team.has_value());
    ASSERT_EQ(team->size(), 1u);
    EXPECT_EQ((*team)[0].role, "Service Advisor");
}

TEST(TeamTest, LoadTeamFileReportsMissingAndInvalidFiles) {
    EXPECT_FALSE(load_team_file("definitely/not/here/team.json").has_value());

    auto path = std::filesystem::temp_directory_path() / "crew_team_broken.json";
    {
        std::ofstream out(path);
        out << "[{\"name\": ";
    }
    EXPECT_FALSE(load_team_file(path.string()).has_value());
    std::filesystem::remove(path);
}
