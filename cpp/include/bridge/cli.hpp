// ==============================================================================
// bridge/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv в типизированную команду
// - Генерация --help / --version
// - Диагностика ошибок использования (exit code 2, либо JSON-ошибка при --json)
//
// ==============================================================================

#ifndef BRIDGE_CLI_HPP
#define BRIDGE_CLI_HPP

#include <bridge/error.hpp>
#include <bridge/session.hpp>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace bridge::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;     // -v (repeatable)
    bool quiet = false;  // -q

    std::optional<std::filesystem::path> config;  // --config
    std::optional<std::filesystem::path> output;  // -o, --output
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// read - последнее сообщение (или N последних) сессии агента
struct ReadCommand {
    agents::Agent agent = agents::Agent::Codex;  // --agent
    std::optional<std::string> id;               // --id
    std::optional<std::string> cwd;              // --cwd
    std::optional<std::string> chats_dir;        // --chats-dir
    std::optional<std::size_t> last;             // --last (по умолчанию из конфига)
    bool json = false;                           // --json
};

/// compare - отчёт analyze по нескольким источникам
struct CompareCommand {
    std::vector<std::string> sources;  // --source agent[:id] (хотя бы один)
    std::optional<std::string> cwd;    // --cwd
    bool normalize = false;            // --normalize
    bool json = false;                 // --json
};

/// report - отчёт по handoff-пакету
struct ReportCommand {
    std::filesystem::path handoff;   // --handoff
    std::optional<std::string> cwd;  // --cwd
    bool json = false;               // --json
};

/// list - последние сессии агента
struct ListCommand {
    agents::Agent agent = agents::Agent::Codex;
    std::optional<std::string> cwd;
    std::optional<std::size_t> limit;  // --limit (по умолчанию из конфига)
    bool json = false;
};

/// search - сессии, содержащие подстроку (без учёта регистра)
struct SearchCommand {
    std::string query;
    agents::Agent agent = agents::Agent::Codex;
    std::optional<std::string> cwd;
    std::optional<std::size_t> limit;
    bool json = false;
};

/// redact - очистить файл (или stdin) от секретов
struct RedactCommand {
    std::optional<std::filesystem::path> file;
};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;  // опциональная подкоманда для справки
};

/// version - показать версию
struct VersionCommand {};

// ----------------------------------------------------------------------------
// Command - вариант команды
// ----------------------------------------------------------------------------

using Command = std::variant<ReadCommand, CompareCommand, ReportCommand, ListCommand,
                             SearchCommand, RedactCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;

    /// При --json ошибка печатается как {"error_code","message"} в stdout, exit 1
    bool json = false;
    BridgeError error;
};

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help (для конкретной команды или общий)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT = "Agent Bridge CLI";

}  // namespace bridge::cli

#endif  // BRIDGE_CLI_HPP
