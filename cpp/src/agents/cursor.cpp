// ==============================================================================
// cursor.cpp - Провайдер Cursor (файлы чатов в workspaceStorage)
// ==============================================================================
//
// Файл ищется по имени (chat / composer / conversation, .json или .jsonl).
// Формат не фиксирован: сначала JSON-документ, затем JSON Lines.
// cwd в файлах нет, поэтому привязка к проекту - подстрока пути в содержимом.
//
// ==============================================================================

#include "bridge/agents.hpp"

#include "bridge/paths.hpp"
#include "bridge/platform.hpp"
#include "bridge/reader.hpp"

#include <system_error>

namespace bridge::agents::cursor {

namespace {

constexpr const char* NO_ASSISTANT_MESSAGES = "[No assistant messages found]";

const char* const NAME_KEYWORDS[] = {"chat", "composer", "conversation"};

std::vector<io::FileEntry> session_files(const std::filesystem::path& base,
                                         const io::FilePredicate& predicate) {
    io::DiscoveryOptions opt;
    opt.recursive = true;
    return io::scan_files(workspaces_dir(base), predicate, opt);
}

bool is_directory(const std::filesystem::path& dir) {
    std::error_code ec;
    return std::filesystem::is_directory(dir, ec) && !ec;
}

void parse_document(const Value& root, ParsedSession& parsed) {
    if (const auto* messages = root.get_array("messages")) {
        if (messages->empty()) {
            parsed.document_text = NO_ASSISTANT_MESSAGES;
            return;
        }
        for (const auto& message : *messages) {
            const auto* role = message.get_string("role");
            parsed.messages.push_back(
                Message{role != nullptr ? *role : std::string(), extract_text(message.get("content"))});
        }
        return;
    }

    if (const auto* content = root.get_string("content")) {
        parsed.messages.push_back(Message{"assistant", *content});
        return;
    }

    // Неизвестная форма: документ целиком
    parsed.document_text = root.to_json_string(true);
}

}  // namespace

// ----------------------------------------------------------------------------
// Файлы
// ----------------------------------------------------------------------------

bool is_cursor_file(const std::filesystem::path& file) {
    if (!io::has_extension(file, ".json") && !io::has_extension(file, ".jsonl")) {
        return false;
    }
    const std::string name = platform::path_to_utf8(file.filename());
    for (const char* keyword : NAME_KEYWORDS) {
        if (name.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::filesystem::path workspaces_dir(const std::filesystem::path& base) {
    return base / "User" / "workspaceStorage";
}

// ----------------------------------------------------------------------------
// Выбор файла
// ----------------------------------------------------------------------------

LocateResult locate(const ResolveRequest& req, const std::filesystem::path& base) {
    const std::filesystem::path root = effective_base(req, base);
    if (!is_directory(root)) {
        return BridgeError{ErrorKind::NotFound,
                           "Cursor data directory not found: " + platform::path_to_utf8(root)};
    }
    if (!is_directory(workspaces_dir(root))) {
        return BridgeError{ErrorKind::NotFound, "No Cursor session found."};
    }

    if (req.session_id) {
        const std::string id = *req.session_id;
        auto files = session_files(root, [&id](const std::filesystem::path& file) {
            return is_cursor_file(file) && io::path_contains(file, id);
        });
        if (files.empty()) {
            return BridgeError{ErrorKind::NotFound, "No Cursor session found."};
        }
        return Located{files.front().path, {}};
    }

    auto files = session_files(root, is_cursor_file);
    if (files.empty()) {
        return BridgeError{ErrorKind::NotFound, "No Cursor session found."};
    }

    const std::string expected = io::normalize_path_string(req.cwd);
    for (const auto& file : files) {
        if (file_contains(file.path, expected)) {
            return Located{file.path, {}};
        }
    }

    return Located{files.front().path, {fallback_warning(Agent::Cursor, expected)}};
}

// ----------------------------------------------------------------------------
// Разбор
// ----------------------------------------------------------------------------

ParseResult parse(const std::filesystem::path& file) {
    auto opened = io::Reader::open(file, true);
    if (!opened) {
        return reader_error_to_bridge(opened.error);
    }

    ParsedSession parsed;
    io::Document doc;

    if (opened.reader->kind() == io::DocumentKind::Json) {
        if (opened.reader->next(doc)) {
            parse_document(doc.data, parsed);
        }
        return parsed;
    }

    while (opened.reader->next(doc)) {
        const auto* role = doc.data.get_string("role");
        const auto* content = doc.data.get_string("content");
        if (role != nullptr && content != nullptr) {
            parsed.messages.push_back(Message{*role, *content});
        }
    }

    parsed.skipped_lines = opened.reader->skipped_lines();
    parsed.raw_tail = opened.reader->raw_tail();
    return parsed;
}

// ----------------------------------------------------------------------------
// Каталог (cwd не поддерживается и игнорируется)
// ----------------------------------------------------------------------------

std::vector<SessionEntry> list(const std::filesystem::path& base,
                               const std::optional<std::string>& /*cwd*/, std::size_t limit) {
    std::vector<SessionEntry> entries;
    for (const auto& file : session_files(base, is_cursor_file)) {
        if (entries.size() >= limit) {
            break;
        }
        entries.push_back(make_entry(Agent::Cursor, file, std::nullopt));
    }
    return entries;
}

std::vector<SessionEntry> search(const std::filesystem::path& base, std::string_view query,
                                 const std::optional<std::string>& /*cwd*/, std::size_t limit) {
    std::vector<SessionEntry> entries;
    for (const auto& file : session_files(base, is_cursor_file)) {
        if (entries.size() >= limit) {
            break;
        }
        if (!file_contains_icase(file.path, query)) {
            continue;
        }
        entries.push_back(make_entry(Agent::Cursor, file, std::nullopt));
    }
    return entries;
}

}  // namespace bridge::agents::cursor
