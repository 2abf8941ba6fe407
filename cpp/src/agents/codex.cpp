// ==============================================================================
// codex.cpp - Провайдер Codex (JSONL-журнал событий)
// ==============================================================================
//
// Формат записи:
//   {"type":"session_meta","payload":{"id":"...","cwd":"/path",...}}
//   {"type":"response_item","payload":{"type":"message","role":"assistant","content":[...]}}
//   {"type":"event_msg","payload":{"type":"agent_message","message":"..."}}
//
// cwd сессии берётся из первой записи session_meta.
//
// ==============================================================================

#include "bridge/agents.hpp"

#include "bridge/paths.hpp"
#include "bridge/reader.hpp"

#include <system_error>

namespace bridge::agents::codex {

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

bool type_is(const Value& record, const char* expected) {
    const auto* type = record.get_string("type");
    return type != nullptr && *type == expected;
}

BridgeError not_found() {
    return BridgeError{ErrorKind::NotFound, "No Codex session found."};
}

/// list (match_query = false) и search: фильтр по cwd, затем по содержимому
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
        entries.push_back(make_entry(Agent::Codex, file, normalized));
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
        return not_found();
    }

    // 1. Явный id
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

    // 2. Привязка к cwd
    const std::string expected = io::normalize_path_string(req.cwd);
    if (auto scoped = find_latest_by_cwd(files, expected, session_cwd)) {
        return Located{*scoped, {}};
    }

    // 3. Самая свежая сессия
    return Located{files.front().path, {fallback_warning(Agent::Codex, expected)}};
}

std::optional<std::string> session_cwd(const std::filesystem::path& file) {
    auto opened = io::Reader::open(file);
    if (!opened) {
        return std::nullopt;
    }

    io::Document doc;
    if (!opened.reader->next(doc) || !type_is(doc.data, "session_meta")) {
        return std::nullopt;
    }
    const Value* payload = doc.data.get("payload");
    if (payload == nullptr) {
        return std::nullopt;
    }
    if (const auto* cwd = payload->get_string("cwd")) {
        return *cwd;
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
        const Value* payload = record.get("payload");
        if (payload == nullptr) {
            continue;
        }

        if (type_is(record, "session_meta")) {
            if (const auto* cwd = payload->get_string("cwd")) {
                parsed.cwd = *cwd;
            }
            const auto* id = payload->get_string("session_id");
            if (id == nullptr) {
                id = payload->get_string("id");
            }
            if (id != nullptr) {
                parsed.session_id = *id;
            }
            continue;
        }

        if (type_is(record, "response_item") && type_is(*payload, "message")) {
            const auto* role = payload->get_string("role");
            parsed.messages.push_back(
                Message{role != nullptr ? *role : std::string(), extract_text(payload->get("content"))});
        } else if (type_is(record, "event_msg") && type_is(*payload, "agent_message")) {
            parsed.messages.push_back(Message{"assistant", extract_text(payload->get("message"))});
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

}  // namespace bridge::agents::codex
