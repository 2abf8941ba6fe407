// ==============================================================================
// bridge/config.hpp - Конфигурация: базовые директории агентов и умолчания
// ==============================================================================
//
// Источники (по возрастанию приоритета):
// 1. Встроенные умолчания под $HOME
// 2. YAML-файл: --config <path>, иначе $BRIDGE_CONFIG,
//    иначе ~/.config/agent-bridge/config.yml (если существует)
// 3. Переменные окружения BRIDGE_*_DIR
//
// Формат YAML:
//   agents:
//     codex:  { dir: ~/.codex/sessions }
//     claude: { dir: ~/.claude/projects }
//     gemini: { dir: ~/.gemini/tmp }
//     cursor: { dir: ~/.cursor }
//   defaults:
//     last: 1
//     limit: 10
//
// ==============================================================================

#ifndef BRIDGE_CONFIG_HPP
#define BRIDGE_CONFIG_HPP

#include <bridge/session.hpp>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace bridge::config {

// Переменные окружения
constexpr const char* ENV_CONFIG = "BRIDGE_CONFIG";
constexpr const char* ENV_CODEX_DIR = "BRIDGE_CODEX_SESSIONS_DIR";
constexpr const char* ENV_CLAUDE_DIR = "BRIDGE_CLAUDE_PROJECTS_DIR";
constexpr const char* ENV_GEMINI_DIR = "BRIDGE_GEMINI_TMP_DIR";
constexpr const char* ENV_CURSOR_DIR = "BRIDGE_CURSOR_DATA_DIR";

/// Базовые директории четырёх агентов
struct AgentDirs {
    std::filesystem::path codex;
    std::filesystem::path claude;
    std::filesystem::path gemini;
    std::filesystem::path cursor;

    const std::filesystem::path& dir(agents::Agent agent) const;
    std::filesystem::path& dir(agents::Agent agent);
};

struct Defaults {
    std::size_t last = 1;
    std::size_t limit = 10;
};

struct Config {
    AgentDirs dirs;
    Defaults defaults;

    /// Прочитанный YAML-файл (если был)
    std::optional<std::filesystem::path> source;
};

struct ConfigError {
    std::string message;
    std::string path;

    /// "failed to load config '<path>' - <message>"
    std::string format() const;
};

struct ConfigResult {
    bool ok = false;
    Config config;
    ConfigError error;

    explicit operator bool() const { return ok; }
};

/// Умолчания под домашней директорией (cursor зависит от ОС)
AgentDirs default_agent_dirs();

/// ~/.config/agent-bridge/config.yml
std::filesystem::path default_config_path();

/// Прочитать YAML поверх base. Неизвестные агенты и ключи - ошибка.
ConfigResult load_config(const std::filesystem::path& path, Config base);

/// Применить BRIDGE_*_DIR поверх dirs
void apply_env_overrides(AgentDirs& dirs);

/// Полная цепочка: умолчания -> YAML -> окружение
/// @param cli_path путь из --config (явно заданный файл обязан существовать)
ConfigResult resolve_config(const std::optional<std::filesystem::path>& cli_path);

}  // namespace bridge::config

#endif  // BRIDGE_CONFIG_HPP
