// ==============================================================================
// bridge/agents.hpp - Провайдеры сессий: разрешение, разбор, каталог
// ==============================================================================
//
// Назначение:
// - Закрытая таблица провайдеров (codex, claude, gemini, cursor), выбор по тегу
// - resolve_session: выбор одного файла и сборка Session
// - list_sessions / search_sessions: каталог без полного разбора
//
// Лестница выбора файла (каждый шаг - optional-проба, предупреждения копятся):
//   1. Явный id: рекурсивный поиск файлов, путь которых содержит id
//   2. cwd: самый свежий файл, нормализованный cwd которого совпадает с запросом
//   3. Запасной вариант: самый свежий файл + предупреждение
//
// Ядро ничего не печатает: предупреждения возвращаются в Session::warnings.
//
// ==============================================================================

#ifndef BRIDGE_AGENTS_HPP
#define BRIDGE_AGENTS_HPP

#include <bridge/config.hpp>
#include <bridge/discovery.hpp>
#include <bridge/error.hpp>
#include <bridge/reader.hpp>
#include <bridge/session.hpp>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bridge::agents {

// ----------------------------------------------------------------------------
// Запрос и результаты
// ----------------------------------------------------------------------------

struct ResolveRequest {
    std::optional<std::string> session_id;

    /// Рабочая директория для привязки (как передана, нормализуется внутри)
    std::string cwd;

    /// Явная директория: заменяет базовую (codex/claude/cursor) или
    /// набор директорий chats (gemini)
    std::optional<std::string> explicit_dir;

    std::size_t last_n = 1;
};

/// Выбранный файл и накопленные предупреждения
struct Located {
    std::filesystem::path path;
    std::vector<std::string> warnings;
};

using LocateResult = std::variant<Located, BridgeError>;
using ParseResult = std::variant<ParsedSession, BridgeError>;
using ResolveResult = std::variant<Session, BridgeError>;

// ----------------------------------------------------------------------------
// Таблица провайдеров
// ----------------------------------------------------------------------------

struct Provider {
    Agent agent;

    /// Выбрать файл сессии под базовой директорией
    LocateResult (*locate)(const ResolveRequest& req, const std::filesystem::path& base);

    /// Разобрать один файл
    ParseResult (*parse)(const std::filesystem::path& file);

    /// Каталог: самые свежие сессии (cwd - уже нормализованный, если задан)
    std::vector<SessionEntry> (*list)(const std::filesystem::path& base,
                                      const std::optional<std::string>& cwd, std::size_t limit);

    /// Каталог: поиск подстроки (без учёта регистра) в сыром содержимом
    std::vector<SessionEntry> (*search)(const std::filesystem::path& base, std::string_view query,
                                        const std::optional<std::string>& cwd, std::size_t limit);
};

const Provider& provider(Agent agent);

// ----------------------------------------------------------------------------
// Публичные операции
// ----------------------------------------------------------------------------

/// Разрешить и разобрать сессию агента
ResolveResult resolve_session(Agent agent, const ResolveRequest& req,
                              const config::AgentDirs& dirs);

/// Не более limit записей, самые свежие первыми.
/// Для codex/claude/gemini cwd ограничивает выборку проектом.
std::vector<SessionEntry> list_sessions(Agent agent, const std::optional<std::string>& cwd,
                                        std::size_t limit, const config::AgentDirs& dirs);

/// Не более limit записей, содержащих query (без учёта регистра)
std::vector<SessionEntry> search_sessions(Agent agent, std::string_view query,
                                          const std::optional<std::string>& cwd,
                                          std::size_t limit, const config::AgentDirs& dirs);

// ----------------------------------------------------------------------------
// Общие помощники провайдеров
// ----------------------------------------------------------------------------

/// Извлечение cwd из файла сессии (nullopt, если не найден)
using CwdProbe = std::optional<std::string> (*)(const std::filesystem::path& file);

/// Самый свежий файл, нормализованный cwd которого равен expected_cwd
std::optional<std::filesystem::path> find_latest_by_cwd(const std::vector<io::FileEntry>& files,
                                                        const std::string& expected_cwd,
                                                        CwdProbe probe);

/// "Warning: no <Agent> session matched cwd <cwd>; falling back to latest session."
std::string fallback_warning(Agent agent, const std::string& cwd);

/// Базовая директория с учётом ResolveRequest::explicit_dir
std::filesystem::path effective_base(const ResolveRequest& req, const std::filesystem::path& base);

/// Файл содержит needle без учёта регистра ASCII.
/// Файлы больше MAX_FILE_SIZE и нечитаемые файлы считаются несовпавшими.
bool file_contains_icase(const std::filesystem::path& file, std::string_view needle);

/// Файл содержит needle как есть (с той же границей размера)
bool file_contains(const std::filesystem::path& file, std::string_view needle);

/// Строка каталога: id - имя файла без расширения
SessionEntry make_entry(Agent agent, const io::FileEntry& file,
                        const std::optional<std::string>& cwd);

/// Преобразовать ReaderError в BridgeError (TooLarge/IoError -> IoError и т.д.)
BridgeError reader_error_to_bridge(const io::ReaderError& error);

// ----------------------------------------------------------------------------
// Провайдеры
// ----------------------------------------------------------------------------

/// codex: JSONL-журнал событий, ~/.codex/sessions/**.jsonl
namespace codex {
LocateResult locate(const ResolveRequest& req, const std::filesystem::path& base);
ParseResult parse(const std::filesystem::path& file);
std::optional<std::string> session_cwd(const std::filesystem::path& file);
std::vector<SessionEntry> list(const std::filesystem::path& base,
                               const std::optional<std::string>& cwd, std::size_t limit);
std::vector<SessionEntry> search(const std::filesystem::path& base, std::string_view query,
                                 const std::optional<std::string>& cwd, std::size_t limit);
}  // namespace codex

/// claude: JSONL-записи сообщений, ~/.claude/projects/**.jsonl
namespace claude {
LocateResult locate(const ResolveRequest& req, const std::filesystem::path& base);
ParseResult parse(const std::filesystem::path& file);
std::optional<std::string> session_cwd(const std::filesystem::path& file);
std::vector<SessionEntry> list(const std::filesystem::path& base,
                               const std::optional<std::string>& cwd, std::size_t limit);
std::vector<SessionEntry> search(const std::filesystem::path& base, std::string_view query,
                                 const std::optional<std::string>& cwd, std::size_t limit);
}  // namespace claude

/// gemini: JSON-документ, <tmp>/<sha256(cwd)>/chats/session-*.json
namespace gemini {
/// <tmp>/<sha256(normalized cwd)>/chats
std::filesystem::path scoped_chats_dir(const std::filesystem::path& tmp_base,
                                       const std::string& cwd);

/// Все существующие <tmp>/*/chats в порядке имён (просматривается не больше
/// MAX_SCAN_FILES записей <tmp>)
std::vector<std::filesystem::path> all_chats_dirs(const std::filesystem::path& tmp_base);

LocateResult locate(const ResolveRequest& req, const std::filesystem::path& base);
ParseResult parse(const std::filesystem::path& file);
std::vector<SessionEntry> list(const std::filesystem::path& base,
                               const std::optional<std::string>& cwd, std::size_t limit);
std::vector<SessionEntry> search(const std::filesystem::path& base, std::string_view query,
                                 const std::optional<std::string>& cwd, std::size_t limit);
}  // namespace gemini

/// cursor: файлы чатов в <data>/User/workspaceStorage/**
namespace cursor {
/// Имя файла .json/.jsonl и содержит chat, composer или conversation
bool is_cursor_file(const std::filesystem::path& file);

std::filesystem::path workspaces_dir(const std::filesystem::path& base);

LocateResult locate(const ResolveRequest& req, const std::filesystem::path& base);
ParseResult parse(const std::filesystem::path& file);
std::vector<SessionEntry> list(const std::filesystem::path& base,
                               const std::optional<std::string>& cwd, std::size_t limit);
std::vector<SessionEntry> search(const std::filesystem::path& base, std::string_view query,
                                 const std::optional<std::string>& cwd, std::size_t limit);
}  // namespace cursor

}  // namespace bridge::agents

#endif  // BRIDGE_AGENTS_HPP
