// ==============================================================================
// bridge/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr (ядро ничего не печатает)
// - Сообщения с префиксами [+] [!] [x] [*] [~], цвет только на TTY
// - JSON-представления сессии, каталога и ошибки (RapidJSON)
// - Таблица каталога (Unicode box-drawing)
// - Очистка недоверенного текста перед выводом в терминал
// - Вывод в файл (--output)
//
// ==============================================================================

#ifndef BRIDGE_OUTPUT_HPP
#define BRIDGE_OUTPUT_HPP

#include <bridge/error.hpp>
#include <bridge/session.hpp>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <rapidjson/document.h>
#include <string>
#include <string_view>
#include <vector>

namespace bridge::output {

// ----------------------------------------------------------------------------
// Потоки и цвета
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

enum class Color {
    Default,
    Green,   // Информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;  // -q: подавить info/warn
    int verbose = 0;     // -v: уровень подробности (0..2+)

    // Путь для вывода stdout (--output)
    std::optional<std::filesystem::path> output_path;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами (всегда stderr)
    // -------------------------------------------------------------------------

    /// "[+] <message>" (подавляется при quiet)
    void info(std::string_view message);

    /// "[!] <message>" (подавляется при quiet)
    void warn(std::string_view message);

    /// "[x] <message>" (всегда)
    void error(std::string_view message);

    /// "[*] <message>" (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" (только при verbose > 1)
    void trace(std::string_view message);

    // JSON
    // -------------------------------------------------------------------------

    /// Pretty JSON (отступ 2) + newline в stdout
    void write_json_pretty(const rapidjson::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

    /// Открыть файл для вывода (при заданном output_path)
    bool open_output_file();

    void close_output_file();

    bool has_output_file() const { return output_file_ != nullptr; }

private:
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);

    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц
// ----------------------------------------------------------------------------

class Table {
public:
    Table();

    void set_headers(const std::vector<std::string>& headers);

    void add_row(const std::vector<std::string>& cells);

    /// Вывести таблицу в stdout через Writer
    void print(Writer& w);

    std::string to_string() const;

    /// Количество строк (без заголовка)
    size_t row_count() const { return rows_.size(); }

private:
    /// 'T' - верхняя линия, 'M' - разделитель заголовка, 'B' - нижняя линия
    std::string format_line(char position, const std::vector<size_t>& widths) const;

    std::string format_row(const std::vector<std::string>& cells,
                           const std::vector<size_t>& widths) const;

    std::vector<size_t> column_widths() const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// Представления
// ----------------------------------------------------------------------------

/// {"agent","source","content","warnings","session_id","cwd","timestamp",
///  "message_count","messages_returned"}; cwd == null при отсутствии
rapidjson::Document session_to_json(const agents::Session& session);

/// Массив {"session_id","agent","cwd","modified_at","file_path"}
rapidjson::Document entries_to_json(const std::vector<agents::SessionEntry>& entries);

/// {"error_code","message"}
rapidjson::Document error_to_json(const BridgeError& error);

/// Сериализовать JSON (pretty: отступ 2)
std::string json_to_string(const rapidjson::Value& value, bool pretty);

/// Таблица каталога: SESSION | AGENT | MODIFIED | CWD | FILE
Table entries_table(const std::vector<agents::SessionEntry>& entries);

/// "SOURCE: <Agent> Session (<path>)\n---\n<content>" (очищено для терминала)
std::string format_session_text(const agents::Session& session);

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Удалить ANSI escape-последовательности и управляющие символы
/// (кроме \n и \t; \r\n сводится к \n)
std::string sanitize_for_terminal(std::string_view text);

std::string ansi_color_code(Color color);

std::string ansi_reset_code();

/// Поддерживает ли поток цвета (TTY)
bool supports_color(Stream s);

}  // namespace bridge::output

#endif  // BRIDGE_OUTPUT_HPP
