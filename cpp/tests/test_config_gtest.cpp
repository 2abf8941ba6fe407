// ==============================================================================
// test_config_gtest.cpp - Тесты конфигурации (GoogleTest)
// ==============================================================================
//
// config: YAML-файл (yaml-cpp), переопределения окружения, цепочка источников
//
// ==============================================================================

#include "bridge/config.hpp"
#include "bridge/paths.hpp"
#include "bridge/platform.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace bridge::config::test {

namespace {

void set_env(const char* name, const std::string& value) {
#ifdef _WIN32
    _putenv_s(name, value.c_str());
#else
    setenv(name, value.c_str(), 1);
#endif
}

void unset_env(const char* name) {
#ifdef _WIN32
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}

}  // namespace

// ==============================================================================
// Test Fixture
// ==============================================================================

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("bridge_config_") + test_info->test_case_name() +
                                  "_" + test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );

        test_dir_ = std::filesystem::temp_directory_path() / unique_name;

        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);

        clear_env();
    }

    void TearDown() override {
        clear_env();
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    static void clear_env() {
        unset_env(ENV_CONFIG);
        unset_env(ENV_CODEX_DIR);
        unset_env(ENV_CLAUDE_DIR);
        unset_env(ENV_GEMINI_DIR);
        unset_env(ENV_CURSOR_DIR);
    }

    std::filesystem::path write_config(const std::string& content) {
        std::filesystem::path path = test_dir_ / "config.yml";
        std::ofstream file(path);
        file << content;
        return path;
    }

    static Config base_config() {
        Config cfg;
        cfg.dirs = default_agent_dirs();
        return cfg;
    }
};

// ==============================================================================
// Умолчания
// ==============================================================================

TEST_F(ConfigTest, Defaults_UnderHomeDirectory) {
    AgentDirs dirs = default_agent_dirs();

    EXPECT_EQ(dirs.codex, io::normalize_path("~/.codex/sessions"));
    EXPECT_EQ(dirs.claude, io::normalize_path("~/.claude/projects"));
    EXPECT_EQ(dirs.gemini, io::normalize_path("~/.gemini/tmp"));
    EXPECT_FALSE(dirs.cursor.empty());
}

TEST_F(ConfigTest, DirAccessor_MapsAgents) {
    AgentDirs dirs;
    dirs.dir(agents::Agent::Gemini) = "/g";

    EXPECT_EQ(dirs.gemini, std::filesystem::path("/g"));
    EXPECT_EQ(dirs.dir(agents::Agent::Gemini), std::filesystem::path("/g"));
}

// ==============================================================================
// load_config
// ==============================================================================

TEST_F(ConfigTest, Load_FullAndShortAgentForms) {
    // Arrange
    auto path = write_config(
        "agents:\n"
        "  codex:\n"
        "    dir: /nonexistent_bridge_root/codex\n"
        "  cursor: /nonexistent_bridge_root/cursor/\n"
        "defaults:\n"
        "  last: 3\n"
        "  limit: 25\n");

    // Act
    auto result = load_config(path, base_config());

    // Assert
    ASSERT_TRUE(result) << result.error.format();
    EXPECT_EQ(result.config.dirs.codex, std::filesystem::path("/nonexistent_bridge_root/codex"));
    EXPECT_EQ(result.config.dirs.cursor, std::filesystem::path("/nonexistent_bridge_root/cursor"));
    EXPECT_EQ(result.config.dirs.claude, default_agent_dirs().claude);
    EXPECT_EQ(result.config.defaults.last, 3u);
    EXPECT_EQ(result.config.defaults.limit, 25u);
    ASSERT_TRUE(result.config.source.has_value());
    EXPECT_EQ(*result.config.source, path);
}

TEST_F(ConfigTest, Load_EmptyFile_KeepsBase) {
    auto path = write_config("");

    auto result = load_config(path, base_config());

    ASSERT_TRUE(result);
    EXPECT_EQ(result.config.defaults.last, 1u);
    EXPECT_EQ(result.config.defaults.limit, 10u);
}

TEST_F(ConfigTest, Load_MissingFile_Error) {
    auto result = load_config(test_dir_ / "absent.yml", base_config());

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.message, "config file not found");
    EXPECT_EQ(result.error.format(), "failed to load config '" +
                                         platform::path_to_utf8(test_dir_ / "absent.yml") +
                                         "' - config file not found");
}

TEST_F(ConfigTest, Load_UnknownAgent_Error) {
    auto path = write_config("agents:\n  copilot: /x\n");

    auto result = load_config(path, base_config());

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.message, "unknown agent 'copilot'");
}

TEST_F(ConfigTest, Load_UnknownTopLevelKey_Error) {
    auto path = write_config("theme: dark\n");

    auto result = load_config(path, base_config());

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.message, "unknown key 'theme'");
}

TEST_F(ConfigTest, Load_NonPositiveDefault_Error) {
    auto path = write_config("defaults:\n  limit: 0\n");

    auto result = load_config(path, base_config());

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.message, "defaults.limit must be >= 1");
}

TEST_F(ConfigTest, Load_AgentWithoutDir_Error) {
    auto path = write_config("agents:\n  claude:\n    path: /x\n");

    auto result = load_config(path, base_config());

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.message, "agent 'claude' must define 'dir'");
}

TEST_F(ConfigTest, Load_MalformedYaml_ParseError) {
    auto path = write_config("agents: [unclosed\n");

    auto result = load_config(path, base_config());

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.message.rfind("YAML parse error: ", 0), 0u);
}

TEST_F(ConfigTest, Load_NonMappingRoot_Error) {
    auto path = write_config("- a\n- b\n");

    auto result = load_config(path, base_config());

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error.message, "config root must be a mapping");
}

// ==============================================================================
// Окружение и цепочка
// ==============================================================================

TEST_F(ConfigTest, EnvOverride_ReplacesDirectory) {
    set_env(ENV_GEMINI_DIR, "/nonexistent_bridge_root/gemini/");
    AgentDirs dirs = default_agent_dirs();

    apply_env_overrides(dirs);

    EXPECT_EQ(dirs.gemini, std::filesystem::path("/nonexistent_bridge_root/gemini"));
    EXPECT_EQ(dirs.codex, default_agent_dirs().codex);
}

TEST_F(ConfigTest, Resolve_ExplicitPathThenEnvWins) {
    // Arrange
    auto path = write_config("agents:\n  codex: /nonexistent_bridge_root/from_yaml\n");
    set_env(ENV_CODEX_DIR, "/nonexistent_bridge_root/from_env");

    // Act
    auto result = resolve_config(path);

    // Assert
    ASSERT_TRUE(result);
    EXPECT_EQ(result.config.dirs.codex, std::filesystem::path("/nonexistent_bridge_root/from_env"));
}

TEST_F(ConfigTest, Resolve_ConfigFromEnvironmentVariable) {
    auto path = write_config("defaults:\n  last: 4\n");
    set_env(ENV_CONFIG, platform::path_to_utf8(path));

    auto result = resolve_config(std::nullopt);

    ASSERT_TRUE(result);
    EXPECT_EQ(result.config.defaults.last, 4u);
}

TEST_F(ConfigTest, Resolve_ExplicitMissingFile_Error) {
    auto result = resolve_config(test_dir_ / "missing.yml");

    EXPECT_FALSE(result);
}

}  // namespace bridge::config::test
