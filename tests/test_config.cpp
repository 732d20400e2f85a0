#include "config.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <unistd.h>

using namespace mcplink;
using json = nlohmann::json;

namespace {

class ConfigFileTest : public ::testing::Test {
protected:
    fs::path dir_;

    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("mcplink_config_" + std::to_string(getpid()));
        fs::create_directories(dir_);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string write(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream(path) << content;
        return path.string();
    }
};

} // namespace

TEST(ConfigTest, ParsesServersSortedByName) {
    auto j = json::parse(R"({
        "log_level": "debug",
        "mcp_servers": {
            "zeta":  { "command": "zeta-server" },
            "alpha": { "command": "npx", "args": ["-y", "pkg"], "env": {"FOO": "bar"}, "enabled": false }
        }
    })");
    auto cfg = Config::from_json(j);

    EXPECT_EQ(cfg.log_level, "debug");
    ASSERT_EQ(cfg.mcp_servers.size(), 2u);
    EXPECT_EQ(cfg.mcp_servers[0].name, "alpha");
    EXPECT_EQ(cfg.mcp_servers[0].args, (std::vector<std::string>{"-y", "pkg"}));
    EXPECT_EQ(cfg.mcp_servers[0].env.at("FOO"), "bar");
    EXPECT_FALSE(cfg.mcp_servers[0].enabled);
    EXPECT_EQ(cfg.mcp_servers[1].name, "zeta");
    EXPECT_TRUE(cfg.mcp_servers[1].enabled);

    auto enabled = cfg.enabled_servers();
    ASSERT_EQ(enabled.size(), 1u);
    EXPECT_EQ(enabled[0].name, "zeta");

    ASSERT_NE(cfg.find_server("alpha"), nullptr);
    EXPECT_EQ(cfg.find_server("missing"), nullptr);
}

TEST(ConfigTest, SkipsMalformedEntries) {
    auto cfg = Config::from_json(json::parse(R"({
        "mcp_servers": { "bad": 42, "good": { "command": "x", "args": ["a", 1, "b"] } }
    })"));
    ASSERT_EQ(cfg.mcp_servers.size(), 1u);
    EXPECT_EQ(cfg.mcp_servers[0].args, (std::vector<std::string>{"a", "b"}));
}

TEST(ConfigTest, ValidateReportsProblems) {
    Config cfg;
    cfg.mcp_servers.push_back({"empty", "", {}, {}, true});
    cfg.mcp_servers.push_back({"off", "", {}, {}, false});
    cfg.mcp_servers.push_back({"a.b", "cmd", {}, {}, true});

    auto warnings = cfg.validate();
    EXPECT_EQ(warnings.size(), 2u);
    EXPECT_TRUE(Config::make_default().validate().empty());
}

TEST_F(ConfigFileTest, MissingOrBrokenFileFallsBackToDefaults) {
    auto missing = Config::load((dir_ / "nope.json").string());
    EXPECT_TRUE(missing.mcp_servers.empty());
    EXPECT_EQ(missing.log_level, "info");

    auto broken = Config::load(write("broken.json", "{ not json"));
    EXPECT_TRUE(broken.mcp_servers.empty());
}

TEST_F(ConfigFileTest, SaveThenLoadKeepsServers) {
    Config cfg;
    cfg.log_level = "warn";
    cfg.mcp_servers.push_back({"files", "npx", {"-y", "server-filesystem"}, {{"ROOT", "/tmp"}}, true});

    auto path = (dir_ / "nested" / "config.json").string();
    cfg.save(path);
    ASSERT_TRUE(fs::exists(path));

    auto loaded = Config::load(path);
    EXPECT_EQ(loaded.log_level, "warn");
    ASSERT_EQ(loaded.mcp_servers.size(), 1u);
    EXPECT_EQ(loaded.mcp_servers[0].command, "npx");
    EXPECT_EQ(loaded.mcp_servers[0].env.at("ROOT"), "/tmp");
}
