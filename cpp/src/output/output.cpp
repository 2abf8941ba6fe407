// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr. Байты первичны: std::endl
// не используется, переводы строк пишутся явно.
//
// ==============================================================================

#include "bridge/output.hpp"

#include "bridge/platform.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace bridge::output {

namespace {

// ANSI SGR коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// Unicode box-drawing (UTF-8)
constexpr const char* BOX_V = "\xe2\x94\x82";      // │ U+2502
constexpr const char* BOX_H = "\xe2\x94\x80";      // ─ U+2500
constexpr const char* BOX_TL = "\xe2\x94\x8c";     // ┌ U+250C
constexpr const char* BOX_TR = "\xe2\x94\x90";     // ┐ U+2510
constexpr const char* BOX_BL = "\xe2\x94\x94";     // └ U+2514
constexpr const char* BOX_BR = "\xe2\x94\x98";     // ┘ U+2518
constexpr const char* BOX_LT = "\xe2\x94\x9c";     // ├ U+251C
constexpr const char* BOX_RT = "\xe2\x94\xa4";     // ┤ U+2524
constexpr const char* BOX_TT = "\xe2\x94\xac";     // ┬ U+252C
constexpr const char* BOX_BT = "\xe2\x94\xb4";     // ┴ U+2534
constexpr const char* BOX_CROSS = "\xe2\x94\xbc";  // ┼ U+253C

constexpr char ESC = '\x1b';
constexpr char BEL = '\x07';

/// Ширина строки в символах UTF-8
size_t display_width(std::string_view text) {
    size_t width = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

/// Пропустить escape-последовательность, начинающуюся с ESC в позиции pos.
/// Возвращает позицию первого байта после неё.
size_t skip_escape(std::string_view text, size_t pos) {
    size_t i = pos + 1;
    if (i >= text.size()) {
        return i;
    }

    // CSI: ESC [ <параметры> <финальный байт 0x40..0x7E>
    if (text[i] == '[') {
        ++i;
        while (i < text.size()) {
            const auto c = static_cast<unsigned char>(text[i]);
            ++i;
            if (c >= 0x40 && c <= 0x7E) {
                break;
            }
        }
        return i;
    }

    // OSC: ESC ] ... (BEL | ESC \)
    if (text[i] == ']') {
        ++i;
        while (i < text.size()) {
            if (text[i] == BEL) {
                return i + 1;
            }
            if (text[i] == ESC && i + 1 < text.size() && text[i + 1] == '\\') {
                return i + 2;
            }
            ++i;
        }
        return i;
    }

    // Двухбайтовая последовательность
    return i + 1;
}

void write_string(rapidjson::Value& out, const std::string& text,
                  rapidjson::Document::AllocatorType& alloc) {
    out.SetString(text.c_str(), static_cast<rapidjson::SizeType>(text.size()), alloc);
}

void add_string(rapidjson::Value& object, const char* key, const std::string& text,
                rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value value;
    write_string(value, text, alloc);
    object.AddMember(rapidjson::StringRef(key), value, alloc);
}

void add_optional(rapidjson::Value& object, const char* key,
                  const std::optional<std::string>& text,
                  rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value value;
    if (text) {
        write_string(value, *text, alloc);
    }
    object.AddMember(rapidjson::StringRef(key), value, alloc);
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.output_path.has_value()) {
        open_output_file();
    }
}

Writer::~Writer() {
    close_output_file();
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    // stdout уходит в файл, если задан --output
    FILE* f = (s == Stream::Stdout && output_file_ != nullptr) ? output_file_ : get_file(s);
    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::write_prefixed(std::string_view prefix, Color color, std::string_view message) {
    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, prefix);
    }
    write_line(Stream::Stderr, message);
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[+] ", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[!] ", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются даже при --quiet
    write_prefixed("[x] ", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefixed("[*] ", Color::Cyan, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    write_prefixed("[~] ", Color::Magenta, message);
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    write(Stream::Stdout, json_to_string(value, true));
    write(Stream::Stdout, "\n");
    flush();
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
    }
}

bool Writer::open_output_file() {
    if (!config_.output_path.has_value()) {
        return false;
    }

    const auto& path = config_.output_path.value();
#ifdef _WIN32
    output_file_ = _wfopen(path.c_str(), L"wb");
#else
    output_file_ = std::fopen(platform::path_to_utf8(path).c_str(), "wb");
#endif

    return output_file_ != nullptr;
}

void Writer::close_output_file() {
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
        std::fclose(output_file_);
        output_file_ = nullptr;
    }
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

Table::Table() = default;

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
}

std::vector<size_t> Table::column_widths() const {
    size_t num_cols = headers_.size();
    for (const auto& row : rows_) {
        num_cols = std::max(num_cols, row.size());
    }

    std::vector<size_t> widths(num_cols, 0);
    for (size_t i = 0; i < headers_.size(); ++i) {
        widths[i] = std::max(widths[i], display_width(headers_[i]));
    }
    for (const auto& row : rows_) {
        for (size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], display_width(row[i]));
        }
    }
    return widths;
}

std::string Table::format_line(char position, const std::vector<size_t>& widths) const {
    const char* left = BOX_LT;
    const char* middle = BOX_CROSS;
    const char* right = BOX_RT;
    if (position == 'T') {
        left = BOX_TL;
        middle = BOX_TT;
        right = BOX_TR;
    } else if (position == 'B') {
        left = BOX_BL;
        middle = BOX_BT;
        right = BOX_BR;
    }

    std::string line = left;
    for (size_t i = 0; i < widths.size(); ++i) {
        // 1 пробел отступа с каждой стороны
        for (size_t j = 0; j < widths[i] + 2; ++j) {
            line += BOX_H;
        }
        if (i + 1 < widths.size()) {
            line += middle;
        }
    }
    line += right;
    return line;
}

std::string Table::format_row(const std::vector<std::string>& cells,
                              const std::vector<size_t>& widths) const {
    std::string line = BOX_V;
    for (size_t i = 0; i < widths.size(); ++i) {
        const std::string cell = (i < cells.size()) ? cells[i] : "";
        line += ' ';
        line += cell;
        const size_t width = display_width(cell);
        if (width < widths[i]) {
            line.append(widths[i] - width, ' ');
        }
        line += ' ';
        line += BOX_V;
    }
    return line;
}

std::string Table::to_string() const {
    const std::vector<size_t> widths = column_widths();

    std::string result = format_line('T', widths);
    result += '\n';

    if (!headers_.empty()) {
        result += format_row(headers_, widths);
        result += '\n';
        result += format_line('M', widths);
        result += '\n';
    }

    for (const auto& row : rows_) {
        result += format_row(row, widths);
        result += '\n';
    }

    result += format_line('B', widths);
    result += '\n';
    return result;
}

void Table::print(Writer& w) {
    w.write(Stream::Stdout, to_string());
}

// ----------------------------------------------------------------------------
// Представления
// ----------------------------------------------------------------------------

rapidjson::Document session_to_json(const agents::Session& session) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    add_string(doc, "agent", agents::agent_to_string(session.agent), alloc);
    add_string(doc, "source", session.source, alloc);
    add_string(doc, "content", session.content, alloc);

    rapidjson::Value warnings(rapidjson::kArrayType);
    for (const auto& warning : session.warnings) {
        rapidjson::Value item;
        write_string(item, warning, alloc);
        warnings.PushBack(item, alloc);
    }
    doc.AddMember("warnings", warnings, alloc);

    add_string(doc, "session_id", session.session_id, alloc);
    add_optional(doc, "cwd", session.cwd, alloc);
    add_string(doc, "timestamp", session.timestamp, alloc);
    doc.AddMember("message_count", static_cast<std::uint64_t>(session.message_count), alloc);
    doc.AddMember("messages_returned", static_cast<std::uint64_t>(session.messages_returned), alloc);
    return doc;
}

rapidjson::Document entries_to_json(const std::vector<agents::SessionEntry>& entries) {
    rapidjson::Document doc;
    doc.SetArray();
    auto& alloc = doc.GetAllocator();

    for (const auto& entry : entries) {
        rapidjson::Value item(rapidjson::kObjectType);
        add_string(item, "session_id", entry.session_id, alloc);
        add_string(item, "agent", agents::agent_to_string(entry.agent), alloc);
        add_optional(item, "cwd", entry.cwd, alloc);
        add_string(item, "modified_at", entry.modified_at, alloc);
        add_string(item, "file_path", entry.file_path, alloc);
        doc.PushBack(item, alloc);
    }
    return doc;
}

rapidjson::Document error_to_json(const BridgeError& error) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();
    add_string(doc, "error_code", error_kind_to_code(error.kind), alloc);
    add_string(doc, "message", error.message, alloc);
    return doc;
}

std::string json_to_string(const rapidjson::Value& value, bool pretty) {
    rapidjson::StringBuffer buffer;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        value.Accept(writer);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        value.Accept(writer);
    }
    return std::string(buffer.GetString(), buffer.GetSize());
}

Table entries_table(const std::vector<agents::SessionEntry>& entries) {
    Table table;
    table.set_headers({"SESSION", "AGENT", "MODIFIED", "CWD", "FILE"});
    for (const auto& entry : entries) {
        table.add_row({sanitize_for_terminal(entry.session_id), agents::agent_to_string(entry.agent),
                       entry.modified_at, sanitize_for_terminal(entry.cwd.value_or("-")),
                       sanitize_for_terminal(entry.file_path)});
    }
    return table;
}

std::string format_session_text(const agents::Session& session) {
    std::string text = "SOURCE: ";
    text += agents::agent_display_name(session.agent);
    text += " Session (";
    text += session.source;
    text += ")\n---\n";
    text += session.content;
    return sanitize_for_terminal(text);
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string sanitize_for_terminal(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        const auto c = static_cast<unsigned char>(text[i]);

        if (c == static_cast<unsigned char>(ESC)) {
            i = skip_escape(text, i);
            continue;
        }

        // C1 control (U+0080..U+009F): 0xC2 0x80..0x9F
        if (c == 0xC2 && i + 1 < text.size()) {
            const auto next = static_cast<unsigned char>(text[i + 1]);
            if (next >= 0x80 && next <= 0x9F) {
                i += 2;
                continue;
            }
        }

        if ((c < 0x20 && c != '\n' && c != '\t') || c == 0x7F) {
            ++i;
            continue;
        }

        result += static_cast<char>(c);
        ++i;
    }
    return result;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

std::string ansi_reset_code() {
    return ANSI_RESET;
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace bridge::output
