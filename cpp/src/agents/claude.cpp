// ==============================================================================
// claude.cpp - Провайдер Claude (JSONL-записи сообщений)
// ==============================================================================
//
// Запись либо содержит обёртку "message" (role/content внутри), либо хранит
// role/content на верхнем уровне. type == "assistant" тоже означает ход
// ассистента. Текстом считаются только строки и части {"type":"text"}.
//
// ==============================================================================

#include "bridge/agents.hpp"

#include "bridge/paths.hpp"
#include "bridge/platform.hpp"
#include "bridge/reader.hpp"

#include <system_error>

namespace bridge::agents::claude {

namespace {

bool is_session_file(const std::filesystem::path& file) {
    return io::has_extension(file, ".jsonl");
}

std::vector<io::FileEntry> session_files(const std::filesystem::path& base,
                                         const io::FilePredicate& predicate) {
    io::DiscoveryOptions opt;
    opt.recursive = true;
    return io::scan_files(base, predicate, opt);
}

BridgeError not_found() {
    return BridgeError{ErrorKind::NotFound, "No Claude session found."};
}

std::vector<SessionEntry> collect(const std::filesystem::path& base, std::string_view query,
                                  bool match_query, const std::optional<std::string>& cwd,
                                  std::size_t limit) {
    std::vector<SessionEntry> entries;
    for (const auto& file : session_files(base, is_session_file)) {
        if (entries.size() >= limit) {
            break;
        }
        auto file_cwd = session_cwd(file.path);
        std::optional<std::string> normalized;
        if (file_cwd) {
            normalized = io::normalize_path_string(*file_cwd);
        }
        if (cwd && normalized != cwd) {
            continue;
        }
        if (match_query && !file_contains_icase(file.path, query)) {
            continue;
        }
        entries.push_back(make_entry(Agent::Claude, file, normalized));
    }
    return entries;
}

}  // namespace

// ----------------------------------------------------------------------------
// Выбор файла
// ----------------------------------------------------------------------------

LocateResult locate(const ResolveRequest& req, const std::filesystem::path& base) {
    const std::filesystem::path root = effective_base(req, base);

    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec) || ec) {
        return BridgeError{ErrorKind::NotFound,
                           "Claude projects directory not found: " + platform::path_to_utf8(root)};
    }

    if (req.session_id) {
        const std::string id = *req.session_id;
        auto files = session_files(root, [&id](const std::filesystem::path& file) {
            return is_session_file(file) && io::path_contains(file, id);
        });
        if (files.empty()) {
            return not_found();
        }
        return Located{files.front().path, {}};
    }

    auto files = session_files(root, is_session_file);
    if (files.empty()) {
        return not_found();
    }

    const std::string expected = io::normalize_path_string(req.cwd);
    if (auto scoped = find_latest_by_cwd(files, expected, session_cwd)) {
        return Located{*scoped, {}};
    }

    return Located{files.front().path, {fallback_warning(Agent::Claude, expected)}};
}

std::optional<std::string> session_cwd(const std::filesystem::path& file) {
    auto opened = io::Reader::open(file);
    if (!opened) {
        return std::nullopt;
    }

    // Первая запись со строковым cwd
    io::Document doc;
    while (opened.reader->next(doc)) {
        if (const auto* cwd = doc.data.get_string("cwd")) {
            return *cwd;
        }
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// Разбор
// ----------------------------------------------------------------------------

ParseResult parse(const std::filesystem::path& file) {
    auto opened = io::Reader::open(file);
    if (!opened) {
        return reader_error_to_bridge(opened.error);
    }

    ParsedSession parsed;
    io::Document doc;
    while (opened.reader->next(doc)) {
        const Value& record = doc.data;
        if (!record.is_object()) {
            continue;
        }

        if (!parsed.cwd) {
            if (const auto* cwd = record.get_string("cwd")) {
                parsed.cwd = *cwd;
            }
        }
        if (!parsed.session_id) {
            if (const auto* id = record.get_string("sessionId")) {
                parsed.session_id = *id;
            }
        }

        const Value* wrapper = record.get("message");
        const Value& message = (wrapper != nullptr && wrapper->is_object()) ? *wrapper : record;

        const Value* content = message.get("content");
        if (content == nullptr) {
            content = record.get("content");
        }

        const auto* type = record.get_string("type");
        const auto* role = message.get_string("role");
        bool assistant =
            (type != nullptr && *type == "assistant") || (role != nullptr && is_assistant_role(*role));

        if (assistant) {
            // Ходы только с tool_use / thinking не считаются сообщениями
            std::string text = extract_claude_text(content);
            if (!text.empty()) {
                parsed.messages.push_back(Message{"assistant", std::move(text)});
            }
        } else if (role != nullptr) {
            parsed.messages.push_back(Message{*role, extract_claude_text(content)});
        }
    }

    parsed.skipped_lines = opened.reader->skipped_lines();
    parsed.raw_tail = opened.reader->raw_tail();
    return parsed;
}

// ----------------------------------------------------------------------------
// Каталог
// ----------------------------------------------------------------------------

std::vector<SessionEntry> list(const std::filesystem::path& base,
                               const std::optional<std::string>& cwd, std::size_t limit) {
    return collect(base, {}, false, cwd, limit);
}

std::vector<SessionEntry> search(const std::filesystem::path& base, std::string_view query,
                                 const std::optional<std::string>& cwd, std::size_t limit) {
    return collect(base, query, true, cwd, limit);
}

}  // namespace bridge::agents::claude
