// ==============================================================================
// config.cpp - Конфигурация
// ==============================================================================
//
// yaml-cpp бросает исключения (YAML::Exception); они перехватываются здесь
// и превращаются в ConfigResult с текстом ошибки.
//
// ==============================================================================

#include "bridge/config.hpp"

#include "bridge/paths.hpp"
#include "bridge/platform.hpp"

#include <stdexcept>
#include <system_error>
#include <yaml-cpp/yaml.h>

namespace bridge::config {

namespace {

struct EnvBinding {
    const char* name;
    agents::Agent agent;
};

const EnvBinding ENV_BINDINGS[] = {
    {ENV_CODEX_DIR, agents::Agent::Codex},
    {ENV_CLAUDE_DIR, agents::Agent::Claude},
    {ENV_GEMINI_DIR, agents::Agent::Gemini},
    {ENV_CURSOR_DIR, agents::Agent::Cursor},
};

std::size_t parse_positive(const YAML::Node& node, const char* key) {
    long long value = node.as<long long>();
    if (value < 1) {
        throw std::runtime_error(std::string("defaults.") + key + " must be >= 1");
    }
    return static_cast<std::size_t>(value);
}

void parse_agents(const YAML::Node& node, AgentDirs& dirs) {
    if (!node.IsMap()) {
        throw std::runtime_error("'agents' must be a mapping");
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
        const std::string name = it->first.as<std::string>();
        auto agent = agents::agent_from_string(name);
        if (!agent) {
            throw std::runtime_error("unknown agent '" + name + "'");
        }

        // Краткая форма "codex: ~/dir" и полная "codex: { dir: ~/dir }"
        const YAML::Node& entry = it->second;
        std::string dir;
        if (entry.IsScalar()) {
            dir = entry.as<std::string>();
        } else if (entry.IsMap() && entry["dir"]) {
            dir = entry["dir"].as<std::string>();
        } else {
            throw std::runtime_error("agent '" + name + "' must define 'dir'");
        }
        dirs.dir(*agent) = io::normalize_path(dir);
    }
}

void parse_defaults(const YAML::Node& node, Defaults& defaults) {
    if (!node.IsMap()) {
        throw std::runtime_error("'defaults' must be a mapping");
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        if (key == "last") {
            defaults.last = parse_positive(it->second, "last");
        } else if (key == "limit") {
            defaults.limit = parse_positive(it->second, "limit");
        } else {
            throw std::runtime_error("unknown key 'defaults." + key + "'");
        }
    }
}

}  // namespace

// ----------------------------------------------------------------------------
// AgentDirs
// ----------------------------------------------------------------------------

const std::filesystem::path& AgentDirs::dir(agents::Agent agent) const {
    switch (agent) {
    case agents::Agent::Codex:
        return codex;
    case agents::Agent::Claude:
        return claude;
    case agents::Agent::Gemini:
        return gemini;
    case agents::Agent::Cursor:
        return cursor;
    }
    return codex;
}

std::filesystem::path& AgentDirs::dir(agents::Agent agent) {
    return const_cast<std::filesystem::path&>(static_cast<const AgentDirs&>(*this).dir(agent));
}

std::string ConfigError::format() const {
    return "failed to load config '" + path + "' - " + message;
}

// ----------------------------------------------------------------------------
// Умолчания
// ----------------------------------------------------------------------------

AgentDirs default_agent_dirs() {
    AgentDirs dirs;
    dirs.codex = io::normalize_path("~/.codex/sessions");
    dirs.claude = io::normalize_path("~/.claude/projects");
    dirs.gemini = io::normalize_path("~/.gemini/tmp");
    if (platform::os_name() == "macOS") {
        dirs.cursor = io::normalize_path("~/Library/Application Support/Cursor");
    } else {
        dirs.cursor = io::normalize_path("~/.cursor");
    }
    return dirs;
}

std::filesystem::path default_config_path() {
    return io::expand_home("~/.config/agent-bridge/config.yml");
}

// ----------------------------------------------------------------------------
// YAML
// ----------------------------------------------------------------------------

ConfigResult load_config(const std::filesystem::path& path, Config base) {
    ConfigResult result;
    result.ok = false;
    result.error.path = platform::path_to_utf8(path);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        result.error.message = "config file not found";
        return result;
    }

    try {
        YAML::Node root = YAML::LoadFile(platform::path_to_utf8(path));

        // Пустой файл - ничего не переопределяет
        if (root && !root.IsNull()) {
            if (!root.IsMap()) {
                result.error.message = "config root must be a mapping";
                return result;
            }
            for (auto it = root.begin(); it != root.end(); ++it) {
                const std::string key = it->first.as<std::string>();
                if (key == "agents") {
                    parse_agents(it->second, base.dirs);
                } else if (key == "defaults") {
                    parse_defaults(it->second, base.defaults);
                } else {
                    result.error.message = "unknown key '" + key + "'";
                    return result;
                }
            }
        }

        base.source = path;
        result.config = std::move(base);
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error.message = std::string("YAML parse error: ") + e.what();
    } catch (const std::exception& e) {
        result.error.message = e.what();
    }

    return result;
}

void apply_env_overrides(AgentDirs& dirs) {
    for (const auto& binding : ENV_BINDINGS) {
        if (auto value = platform::get_env(binding.name)) {
            dirs.dir(binding.agent) = io::normalize_path(*value);
        }
    }
}

ConfigResult resolve_config(const std::optional<std::filesystem::path>& cli_path) {
    Config base;
    base.dirs = default_agent_dirs();

    std::optional<std::filesystem::path> path = cli_path;
    if (!path) {
        if (auto env = platform::get_env(ENV_CONFIG)) {
            path = io::expand_home(*env);
        }
    }
    if (!path) {
        // Файл по умолчанию необязателен
        std::error_code ec;
        std::filesystem::path fallback = default_config_path();
        if (std::filesystem::is_regular_file(fallback, ec) && !ec) {
            path = fallback;
        }
    }

    ConfigResult result;
    if (path) {
        result = load_config(*path, std::move(base));
        if (!result) {
            return result;
        }
    } else {
        result.ok = true;
        result.config = std::move(base);
    }

    apply_env_overrides(result.config.dirs);
    return result;
}

}  // namespace bridge::config
