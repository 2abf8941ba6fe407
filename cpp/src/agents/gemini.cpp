// ==============================================================================
// gemini.cpp - Провайдер Gemini (один JSON-документ на сессию)
// ==============================================================================
//
// Раскладка: <tmp>/<sha256(нормализованный cwd)>/chats/session-*.json
// cwd в файле не хранится; привязка к проекту - по хешу имени директории.
//
// Схемы документа:
//   {"sessionId": "...", "messages": [{"type": "user|gemini|model|assistant", "content": ...}]}
//   {"history": [{"role": "user|model", "parts": [{"text": "..."}] | "..."}]}
//
// ==============================================================================

#include "bridge/agents.hpp"

#include "bridge/paths.hpp"
#include "bridge/platform.hpp"
#include "bridge/reader.hpp"

#include <algorithm>
#include <system_error>

namespace bridge::agents::gemini {

namespace {

std::string ascii_lowercase(const std::string& text) {
    std::string out = text;
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return out;
}

bool is_gemini_role(const std::string* type) {
    if (type == nullptr) {
        return false;
    }
    const std::string lower = ascii_lowercase(*type);
    return lower == "gemini" || lower == "assistant" || lower == "model";
}

bool is_session_file(const std::filesystem::path& file) {
    const std::string name = platform::path_to_utf8(file.filename());
    return io::has_extension(file, ".json") && name.rfind("session-", 0) == 0;
}

io::FilePredicate id_predicate(const std::string& id) {
    return [id](const std::filesystem::path& file) {
        return io::has_extension(file, ".json") && io::path_contains(file, id);
    };
}

bool is_directory(const std::filesystem::path& dir) {
    std::error_code ec;
    return std::filesystem::is_directory(dir, ec) && !ec;
}

/// Файлы из нескольких директорий chats (без рекурсии) с общим лимитом обхода,
/// самые свежие первыми
std::vector<io::FileEntry> scan_dirs(const std::vector<std::filesystem::path>& dirs,
                                     const io::FilePredicate& predicate) {
    return io::scan_roots(dirs, predicate);
}

/// Директории для каталога: только проект при заданном cwd, иначе все
std::vector<std::filesystem::path> catalog_dirs(const std::filesystem::path& base,
                                                const std::optional<std::string>& cwd) {
    if (!cwd) {
        return all_chats_dirs(base);
    }
    std::filesystem::path scoped = scoped_chats_dir(base, *cwd);
    if (!is_directory(scoped)) {
        return {};
    }
    return {scoped};
}

std::string text_of_parts(const Value& turn) {
    const Value* parts = turn.get("parts");
    if (parts == nullptr) {
        return {};
    }
    if (const auto* raw = parts->get_string()) {
        return *raw;
    }
    std::string text;
    if (const auto* items = parts->get_array()) {
        for (std::size_t i = 0; i < items->size(); ++i) {
            if (i > 0) {
                text += '\n';
            }
            if (const auto* part = (*items)[i].get_string("text")) {
                text += *part;
            }
        }
    }
    return text;
}

}  // namespace

// ----------------------------------------------------------------------------
// Директории
// ----------------------------------------------------------------------------

std::filesystem::path scoped_chats_dir(const std::filesystem::path& tmp_base,
                                       const std::string& cwd) {
    return tmp_base / io::hash_path(cwd) / "chats";
}

std::vector<std::filesystem::path> all_chats_dirs(const std::filesystem::path& tmp_base) {
    std::vector<std::filesystem::path> dirs;

    std::error_code ec;
    std::filesystem::directory_iterator it(tmp_base, ec);
    if (ec) {
        return dirs;
    }
    std::size_t visited = 0;
    for (; it != std::filesystem::directory_iterator() && visited < io::MAX_SCAN_FILES;
         it.increment(ec)) {
        if (ec) {
            break;
        }
        ++visited;
        std::error_code status_ec;
        auto status = it->symlink_status(status_ec);
        if (status_ec || !std::filesystem::is_directory(status)) {
            continue;
        }
        std::filesystem::path chats = it->path() / "chats";
        if (is_directory(chats)) {
            dirs.push_back(std::move(chats));
        }
    }

    std::sort(dirs.begin(), dirs.end());
    return dirs;
}

// ----------------------------------------------------------------------------
// Выбор файла
// ----------------------------------------------------------------------------

LocateResult locate(const ResolveRequest& req, const std::filesystem::path& base) {
    io::FilePredicate predicate = req.session_id ? id_predicate(*req.session_id)
                                                 : io::FilePredicate(is_session_file);

    // Явная директория chats заменяет весь набор
    if (req.explicit_dir) {
        const std::filesystem::path dir = io::normalize_path(*req.explicit_dir);
        const std::string dir_text = platform::path_to_utf8(dir);
        if (io::is_system_directory(dir)) {
            return BridgeError{ErrorKind::IoError, "Refusing to scan system directory: " + dir_text};
        }
        auto files = scan_dirs({dir}, predicate);
        if (files.empty()) {
            return BridgeError{ErrorKind::NotFound,
                               "No Gemini session found. Searched chats directories: " + dir_text};
        }
        return Located{files.front().path, {}};
    }

    if (!is_directory(base)) {
        return BridgeError{ErrorKind::NotFound,
                           "Gemini tmp directory not found: " + platform::path_to_utf8(base)};
    }

    const std::string expected = io::normalize_path_string(req.cwd);
    const std::filesystem::path scoped = scoped_chats_dir(base, expected);

    // id ищется во всех проектах, предупреждение не нужно
    if (req.session_id) {
        auto files = scan_dirs(all_chats_dirs(base), predicate);
        if (files.empty()) {
            return BridgeError{ErrorKind::NotFound, "No Gemini session found."};
        }
        return Located{files.front().path, {}};
    }

    auto scoped_files = scan_dirs({scoped}, predicate);
    if (!scoped_files.empty()) {
        return Located{scoped_files.front().path, {}};
    }

    auto files = scan_dirs(all_chats_dirs(base), predicate);
    if (files.empty()) {
        return BridgeError{ErrorKind::NotFound, "No Gemini session found."};
    }
    return Located{files.front().path, {fallback_warning(Agent::Gemini, expected)}};
}

// ----------------------------------------------------------------------------
// Разбор
// ----------------------------------------------------------------------------

ParseResult parse(const std::filesystem::path& file) {
    auto opened = io::Reader::open(file);
    if (!opened) {
        return reader_error_to_bridge(opened.error);
    }

    io::Document doc;
    if (!opened.reader->next(doc)) {
        return BridgeError{ErrorKind::ParseFailed,
                           "Failed to parse Gemini JSON: " + platform::path_to_utf8(file)};
    }
    const Value& root = doc.data;

    ParsedSession parsed;
    if (const auto* id = root.get_string("sessionId")) {
        parsed.session_id = *id;
    }

    if (const auto* messages = root.get_array("messages")) {
        if (messages->empty()) {
            return BridgeError{ErrorKind::EmptySession, "Gemini session has no messages."};
        }
        for (const auto& message : *messages) {
            const auto* type = message.get_string("type");
            std::string role = is_gemini_role(type) ? "assistant" : (type ? *type : "user");
            parsed.messages.push_back(Message{std::move(role), extract_text(message.get("content"))});
        }
        return parsed;
    }

    if (const auto* history = root.get_array("history")) {
        if (history->empty()) {
            return BridgeError{ErrorKind::EmptySession, "Gemini history is empty."};
        }
        for (const auto& turn : *history) {
            // Любая роль, кроме user, считается ответом модели
            const auto* role = turn.get_string("role");
            bool user = role != nullptr && ascii_lowercase(*role) == "user";
            parsed.messages.push_back(Message{user ? "user" : "assistant", text_of_parts(turn)});
        }
        return parsed;
    }

    return BridgeError{ErrorKind::ParseFailed,
                       "Unknown Gemini session schema. Supported fields: messages, history."};
}

// ----------------------------------------------------------------------------
// Каталог
// ----------------------------------------------------------------------------

std::vector<SessionEntry> list(const std::filesystem::path& base,
                               const std::optional<std::string>& cwd, std::size_t limit) {
    std::vector<SessionEntry> entries;
    for (const auto& file : scan_dirs(catalog_dirs(base, cwd), is_session_file)) {
        if (entries.size() >= limit) {
            break;
        }
        entries.push_back(make_entry(Agent::Gemini, file, std::nullopt));
    }
    return entries;
}

std::vector<SessionEntry> search(const std::filesystem::path& base, std::string_view query,
                                 const std::optional<std::string>& cwd, std::size_t limit) {
    std::vector<SessionEntry> entries;
    for (const auto& file : scan_dirs(catalog_dirs(base, cwd), is_session_file)) {
        if (entries.size() >= limit) {
            break;
        }
        if (!file_contains_icase(file.path, query)) {
            continue;
        }
        entries.push_back(make_entry(Agent::Gemini, file, std::nullopt));
    }
    return entries;
}

}  // namespace bridge::agents::gemini
