// ==============================================================================
// bridge/session.hpp - Нормализованная модель сессии
// ==============================================================================
//
// Назначение:
// - Закрытое множество агентов (Agent)
// - Session: результат разрешения, неизменяем после построения
// - SessionEntry: строка каталога (list / search)
// - ParsedSession: промежуточный результат парсера одного провайдера
// - Единая политика выбора сообщений и финальная очистка секретов
//
// ==============================================================================

#ifndef BRIDGE_SESSION_HPP
#define BRIDGE_SESSION_HPP

#include <bridge/value.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bridge::agents {

// ----------------------------------------------------------------------------
// Agent
// ----------------------------------------------------------------------------

enum class Agent { Codex, Claude, Gemini, Cursor };

/// "codex", "claude", "gemini", "cursor"
const char* agent_to_string(Agent agent);

/// "Codex", "Claude", "Gemini", "Cursor"
const char* agent_display_name(Agent agent);

/// Разбор имени агента (без учёта регистра)
std::optional<Agent> agent_from_string(std::string_view name);

/// Все агенты в фиксированном порядке
const std::vector<Agent>& all_agents();

// ----------------------------------------------------------------------------
// Модель
// ----------------------------------------------------------------------------

struct Message {
    std::string role;
    std::string text;
};

struct Session {
    Agent agent = Agent::Codex;
    std::string content;  // после redact
    std::string source;   // абсолютный путь прочитанного файла
    std::vector<std::string> warnings;
    std::string session_id;
    std::optional<std::string> cwd;
    std::string timestamp;  // mtime, YYYY-MM-DDTHH:MM:SS.mmmZ
    std::size_t message_count = 0;
    std::size_t messages_returned = 0;
};

struct SessionEntry {
    std::string session_id;
    Agent agent = Agent::Codex;
    std::optional<std::string> cwd;
    std::string modified_at;
    std::string file_path;
};

/// Результат парсера одного файла, до выбора сообщений
struct ParsedSession {
    /// Записи распознанных ролей в порядке файла
    std::vector<Message> messages;

    /// Последние непустые сырые строки (JSONL)
    std::vector<std::string> raw_tail;

    std::uint64_t skipped_lines = 0;
    std::optional<std::string> session_id;
    std::optional<std::string> cwd;

    /// Текст документа целиком, когда сообщений в нём нет (cursor)
    std::optional<std::string> document_text;
};

// ----------------------------------------------------------------------------
// Выбор сообщений
// ----------------------------------------------------------------------------

/// Разделитель между несколькими выбранными сообщениями
constexpr const char* MESSAGE_SEPARATOR = "\n---\n";

constexpr const char* NO_TEXT_CONTENT = "[No text content]";

constexpr const char* RAW_TAIL_HEADER =
    "Could not extract structured messages. Showing last 20 raw lines:\n";

struct Selection {
    std::string content;  // до redact
    std::size_t message_count = 0;
    std::size_t messages_returned = 0;
};

bool is_assistant_role(std::string_view role);

/// Политика выбора:
/// 1. last_n > 1 и есть сообщения ассистента: последние last_n через MESSAGE_SEPARATOR
/// 2. иначе последнее сообщение ассистента
/// 3. иначе последняя запись любой роли
/// 4. иначе document_text
/// 5. иначе RAW_TAIL_HEADER + сырой хвост (messages_returned = 0)
Selection select_messages(const ParsedSession& parsed, std::size_t last_n);

/// Собрать Session: предупреждение о пропущенных строках, id из имени файла
/// при отсутствии в содержимом, timestamp из mtime, redact содержимого.
Session build_session(Agent agent, const std::filesystem::path& file, const ParsedSession& parsed,
                      std::size_t last_n, std::vector<std::string> warnings);

/// "Warning: skipped <k> unparseable line(s) in <path>"
std::string skipped_lines_warning(std::uint64_t skipped, const std::string& path);

/// Время модификации файла в ISO-8601 (пустая строка при ошибке stat)
std::string file_timestamp(const std::filesystem::path& file);

// ----------------------------------------------------------------------------
// Извлечение текста
// ----------------------------------------------------------------------------

/// Строка, либо массив частей (строка или объект со строковым "text") подряд
std::string extract_text(const Value* content);

/// Как extract_text, но объектные части учитываются только при type == "text"
std::string extract_claude_text(const Value* content);

}  // namespace bridge::agents

#endif  // BRIDGE_SESSION_HPP
