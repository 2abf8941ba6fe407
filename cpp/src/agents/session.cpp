// ==============================================================================
// session.cpp - Нормализованная модель сессии и выбор сообщений
// ==============================================================================
//
// Выбор сообщений одинаков для всех провайдеров: парсер отдаёт ParsedSession,
// дальше работает только select_messages / build_session.
// redact применяется последним шагом, к уже собранному тексту.
//
// ==============================================================================

#include "bridge/session.hpp"

#include "bridge/platform.hpp"
#include "bridge/redact.hpp"

#include <algorithm>
#include <system_error>

namespace bridge::agents {

namespace {

char ascii_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (ascii_lower(a[i]) != ascii_lower(b[i])) {
            return false;
        }
    }
    return true;
}

const std::string& text_or_placeholder(const std::string& text) {
    static const std::string placeholder = NO_TEXT_CONTENT;
    return text.empty() ? placeholder : text;
}

}  // namespace

// ----------------------------------------------------------------------------
// Agent
// ----------------------------------------------------------------------------

const char* agent_to_string(Agent agent) {
    switch (agent) {
    case Agent::Codex:
        return "codex";
    case Agent::Claude:
        return "claude";
    case Agent::Gemini:
        return "gemini";
    case Agent::Cursor:
        return "cursor";
    }
    return "unknown";
}

const char* agent_display_name(Agent agent) {
    switch (agent) {
    case Agent::Codex:
        return "Codex";
    case Agent::Claude:
        return "Claude";
    case Agent::Gemini:
        return "Gemini";
    case Agent::Cursor:
        return "Cursor";
    }
    return "Unknown";
}

std::optional<Agent> agent_from_string(std::string_view name) {
    for (Agent agent : all_agents()) {
        if (iequals(name, agent_to_string(agent))) {
            return agent;
        }
    }
    return std::nullopt;
}

const std::vector<Agent>& all_agents() {
    static const std::vector<Agent> agents = {Agent::Codex, Agent::Claude, Agent::Gemini,
                                              Agent::Cursor};
    return agents;
}

// ----------------------------------------------------------------------------
// Выбор сообщений
// ----------------------------------------------------------------------------

bool is_assistant_role(std::string_view role) {
    return iequals(role, "assistant");
}

Selection select_messages(const ParsedSession& parsed, std::size_t last_n) {
    Selection selection;

    std::vector<const Message*> assistant;
    for (const auto& message : parsed.messages) {
        if (is_assistant_role(message.role)) {
            assistant.push_back(&message);
        }
    }
    selection.message_count = assistant.size();

    if (last_n > 1 && !assistant.empty()) {
        std::size_t take = std::min(last_n, assistant.size());
        std::size_t first = assistant.size() - take;
        for (std::size_t i = first; i < assistant.size(); ++i) {
            if (i != first) {
                selection.content += MESSAGE_SEPARATOR;
            }
            selection.content += text_or_placeholder(assistant[i]->text);
        }
        selection.messages_returned = take;
        return selection;
    }

    if (!assistant.empty()) {
        selection.content = text_or_placeholder(assistant.back()->text);
        selection.messages_returned = 1;
        return selection;
    }

    // Нет ответов ассистента: последняя запись любой роли
    if (!parsed.messages.empty()) {
        selection.content = text_or_placeholder(parsed.messages.back().text);
        selection.messages_returned = 1;
        return selection;
    }

    if (parsed.document_text) {
        selection.content = *parsed.document_text;
        selection.messages_returned = 1;
        return selection;
    }

    selection.content = RAW_TAIL_HEADER;
    for (std::size_t i = 0; i < parsed.raw_tail.size(); ++i) {
        if (i > 0) {
            selection.content += '\n';
        }
        selection.content += parsed.raw_tail[i];
    }
    selection.messages_returned = 0;
    return selection;
}

std::string skipped_lines_warning(std::uint64_t skipped, const std::string& path) {
    return "Warning: skipped " + std::to_string(skipped) + " unparseable line(s) in " + path;
}

std::string file_timestamp(const std::filesystem::path& file) {
    std::error_code ec;
    std::int64_t mtime = platform::file_mtime_ns(file, ec);
    if (ec) {
        return {};
    }
    return platform::format_iso8601_utc(mtime);
}

Session build_session(Agent agent, const std::filesystem::path& file, const ParsedSession& parsed,
                      std::size_t last_n, std::vector<std::string> warnings) {
    Session session;
    session.agent = agent;
    session.source = platform::path_to_utf8(file);
    session.warnings = std::move(warnings);

    if (parsed.skipped_lines > 0) {
        session.warnings.push_back(skipped_lines_warning(parsed.skipped_lines, session.source));
    }

    session.session_id =
        parsed.session_id ? *parsed.session_id : platform::path_to_utf8(file.stem());
    session.cwd = parsed.cwd;
    session.timestamp = file_timestamp(file);

    Selection selection = select_messages(parsed, last_n);
    session.content = redact::redact(selection.content);
    session.message_count = selection.message_count;
    session.messages_returned = selection.messages_returned;
    return session;
}

// ----------------------------------------------------------------------------
// Извлечение текста
// ----------------------------------------------------------------------------

std::string extract_text(const Value* content) {
    if (content == nullptr) {
        return {};
    }
    if (const auto* text = content->get_string()) {
        return *text;
    }

    std::string result;
    if (const auto* parts = content->get_array()) {
        for (const auto& part : *parts) {
            if (const auto* raw = part.get_string()) {
                result += *raw;
            } else if (const auto* text = part.get_string("text")) {
                result += *text;
            }
        }
    }
    return result;
}

std::string extract_claude_text(const Value* content) {
    if (content == nullptr) {
        return {};
    }
    if (const auto* text = content->get_string()) {
        return *text;
    }

    std::string result;
    if (const auto* parts = content->get_array()) {
        for (const auto& part : *parts) {
            if (const auto* raw = part.get_string()) {
                result += *raw;
                continue;
            }
            // tool_use, tool_result, thinking и прочие части пропускаются
            const auto* type = part.get_string("type");
            const auto* text = part.get_string("text");
            if (type != nullptr && *type == "text" && text != nullptr) {
                result += *text;
            }
        }
    }
    return result;
}

}  // namespace bridge::agents
