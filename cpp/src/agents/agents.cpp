// ==============================================================================
// agents.cpp - Таблица провайдеров и общие операции
// ==============================================================================
//
// resolve_session = provider.locate -> provider.parse -> build_session.
// Каждый шаг возвращает std::variant<T, BridgeError>; первая ошибка прерывает
// цепочку, предупреждения копятся в Located::warnings.
//
// ==============================================================================

#include "bridge/agents.hpp"

#include "bridge/paths.hpp"
#include "bridge/platform.hpp"

#include <algorithm>

namespace bridge::agents {

namespace {

const Provider PROVIDERS[] = {
    {Agent::Codex, codex::locate, codex::parse, codex::list, codex::search},
    {Agent::Claude, claude::locate, claude::parse, claude::list, claude::search},
    {Agent::Gemini, gemini::locate, gemini::parse, gemini::list, gemini::search},
    {Agent::Cursor, cursor::locate, cursor::parse, cursor::list, cursor::search},
};

std::string ascii_lowercase(std::string_view text) {
    std::string out(text);
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return out;
}

std::optional<std::string> normalized_cwd(const std::optional<std::string>& cwd) {
    if (!cwd) {
        return std::nullopt;
    }
    return io::normalize_path_string(*cwd);
}

}  // namespace

// ----------------------------------------------------------------------------
// Таблица
// ----------------------------------------------------------------------------

const Provider& provider(Agent agent) {
    for (const auto& entry : PROVIDERS) {
        if (entry.agent == agent) {
            return entry;
        }
    }
    return PROVIDERS[0];
}

// ----------------------------------------------------------------------------
// Публичные операции
// ----------------------------------------------------------------------------

ResolveResult resolve_session(Agent agent, const ResolveRequest& req,
                              const config::AgentDirs& dirs) {
    const Provider& p = provider(agent);

    LocateResult located = p.locate(req, dirs.dir(agent));
    if (auto* err = std::get_if<BridgeError>(&located)) {
        return *err;
    }
    Located& target = std::get<Located>(located);

    ParseResult parsed = p.parse(target.path);
    if (auto* err = std::get_if<BridgeError>(&parsed)) {
        return *err;
    }

    return build_session(agent, target.path, std::get<ParsedSession>(parsed),
                         std::max<std::size_t>(req.last_n, 1), std::move(target.warnings));
}

std::vector<SessionEntry> list_sessions(Agent agent, const std::optional<std::string>& cwd,
                                        std::size_t limit, const config::AgentDirs& dirs) {
    if (limit == 0) {
        return {};
    }
    return provider(agent).list(dirs.dir(agent), normalized_cwd(cwd), limit);
}

std::vector<SessionEntry> search_sessions(Agent agent, std::string_view query,
                                          const std::optional<std::string>& cwd,
                                          std::size_t limit, const config::AgentDirs& dirs) {
    if (limit == 0) {
        return {};
    }
    return provider(agent).search(dirs.dir(agent), query, normalized_cwd(cwd), limit);
}

// ----------------------------------------------------------------------------
// Общие помощники
// ----------------------------------------------------------------------------

std::optional<std::filesystem::path> find_latest_by_cwd(const std::vector<io::FileEntry>& files,
                                                        const std::string& expected_cwd,
                                                        CwdProbe probe) {
    // files уже отсортированы: самые свежие первыми
    for (const auto& file : files) {
        auto cwd = probe(file.path);
        if (cwd && io::normalize_path_string(*cwd) == expected_cwd) {
            return file.path;
        }
    }
    return std::nullopt;
}

std::string fallback_warning(Agent agent, const std::string& cwd) {
    return std::string("Warning: no ") + agent_display_name(agent) + " session matched cwd " +
           cwd + "; falling back to latest session.";
}

std::filesystem::path effective_base(const ResolveRequest& req,
                                     const std::filesystem::path& base) {
    if (req.explicit_dir) {
        return io::normalize_path(*req.explicit_dir);
    }
    return base;
}

bool file_contains(const std::filesystem::path& file, std::string_view needle) {
    std::string content;
    if (io::read_file_text(file, content)) {
        return false;
    }
    return content.find(needle) != std::string::npos;
}

bool file_contains_icase(const std::filesystem::path& file, std::string_view needle) {
    std::string content;
    if (io::read_file_text(file, content)) {
        return false;
    }
    return ascii_lowercase(content).find(ascii_lowercase(needle)) != std::string::npos;
}

SessionEntry make_entry(Agent agent, const io::FileEntry& file,
                        const std::optional<std::string>& cwd) {
    SessionEntry entry;
    entry.session_id = platform::path_to_utf8(file.path.stem());
    entry.agent = agent;
    entry.cwd = cwd;
    entry.modified_at = platform::format_iso8601_utc(file.mtime_ns);
    entry.file_path = platform::path_to_utf8(file.path);
    return entry;
}

BridgeError reader_error_to_bridge(const io::ReaderError& error) {
    switch (error.kind) {
    case io::ReaderErrorKind::FileNotFound:
        return BridgeError{ErrorKind::NotFound, error.format()};
    case io::ReaderErrorKind::ParseError:
        return BridgeError{ErrorKind::ParseFailed, error.format()};
    case io::ReaderErrorKind::TooLarge:
    case io::ReaderErrorKind::UnsupportedFormat:
    case io::ReaderErrorKind::IoError:
        return BridgeError{ErrorKind::IoError, error.format()};
    }
    return BridgeError{ErrorKind::IoError, error.format()};
}

}  // namespace bridge::agents
