// ==============================================================================
// report.cpp - Отчёт о расхождениях между агентами
// ==============================================================================
//
// Ошибка одного источника никогда не прерывает отчёт: она превращается
// в находку P1 и открытый вопрос.
//
// ==============================================================================

#include "bridge/report.hpp"

#include "bridge/agents.hpp"
#include "bridge/reader.hpp"

#include <cstdio>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <set>

namespace bridge::report {

namespace {

constexpr std::size_t EVIDENCE_ID_CHARS = 8;

constexpr double CONFIDENCE_UNAVAILABLE = 0.9;
constexpr double CONFIDENCE_WARNING = 0.75;
constexpr double CONFIDENCE_DIVERGENT = 0.75;
constexpr double CONFIDENCE_ALIGNED = 0.9;
constexpr double CONFIDENCE_INSUFFICIENT = 0.5;

const char* const HANDOFF_KEYS[] = {"mode", "task", "success_criteria", "sources", "constraints"};

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string trim(std::string_view text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && is_space(text[begin])) {
        ++begin;
    }
    while (end > begin && is_space(text[end - 1])) {
        --end;
    }
    return std::string(text.substr(begin, end - begin));
}

std::string ascii_lowercase(std::string_view text) {
    std::string out(text);
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return out;
}

/// Первые n символов UTF-8 (не байтов)
std::string utf8_prefix(const std::string& text, std::size_t n) {
    std::size_t count = 0;
    std::size_t i = 0;
    for (; i < text.size(); ++i) {
        const auto byte = static_cast<unsigned char>(text[i]);
        if ((byte & 0xC0) != 0x80) {
            if (count == n) {
                break;
            }
            ++count;
        }
    }
    return text.substr(0, i);
}

std::string join(const std::vector<std::string>& items, const char* separator) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += items[i];
    }
    return out;
}

BridgeError invalid(std::string message) {
    return BridgeError{ErrorKind::InvalidHandoff, std::move(message)};
}

/// Строковые элементы массива (прочие пропускаются)
std::vector<std::string> string_items(const Value::Array& items) {
    std::vector<std::string> out;
    for (const auto& item : items) {
        if (const auto* text = item.get_string()) {
            out.push_back(*text);
        }
    }
    return out;
}

std::variant<SourceSpec, BridgeError> parse_handoff_source(const Value& node) {
    if (!node.is_object()) {
        return invalid("Each source must be a JSON object");
    }

    const auto* agent_name = node.get_string("agent");
    if (agent_name == nullptr) {
        return invalid("Each source must include string field: agent");
    }
    const std::string lowered = ascii_lowercase(*agent_name);
    auto agent = agents::agent_from_string(lowered);
    if (!agent) {
        return BridgeError{ErrorKind::UnsupportedAgent, "Unsupported agent: " + lowered};
    }

    SourceSpec spec;
    spec.agent = *agent;
    if (const auto* id = node.get_string("session_id")) {
        spec.session_id = *id;
    }
    if (const Value* current = node.get("current_session")) {
        if (const auto* flag = current->get_bool()) {
            spec.current_session = *flag;
        }
    }
    if (!spec.session_id && !spec.current_session) {
        return invalid("Each source must provide session_id or set current_session=true");
    }
    if (const auto* cwd = node.get_string("cwd")) {
        spec.cwd = *cwd;
    }
    return spec;
}

}  // namespace

// ----------------------------------------------------------------------------
// Режим и важность
// ----------------------------------------------------------------------------

const char* mode_to_string(Mode mode) {
    switch (mode) {
    case Mode::Verify:
        return "verify";
    case Mode::Steer:
        return "steer";
    case Mode::Analyze:
        return "analyze";
    case Mode::Feedback:
        return "feedback";
    }
    return "analyze";
}

std::optional<Mode> mode_from_string(std::string_view name) {
    const std::string lowered = ascii_lowercase(name);
    for (Mode mode : {Mode::Verify, Mode::Steer, Mode::Analyze, Mode::Feedback}) {
        if (lowered == mode_to_string(mode)) {
            return mode;
        }
    }
    return std::nullopt;
}

const char* severity_to_string(Severity severity) {
    switch (severity) {
    case Severity::P1:
        return "P1";
    case Severity::P2:
        return "P2";
    case Severity::P3:
        return "P3";
    }
    return "P2";
}

// ----------------------------------------------------------------------------
// Разбор запроса
// ----------------------------------------------------------------------------

std::variant<SourceSpec, BridgeError> parse_source_arg(std::string_view raw) {
    std::string_view agent_part = raw;
    std::optional<std::string> session_id;

    std::size_t colon = raw.find(':');
    if (colon != std::string_view::npos) {
        agent_part = raw.substr(0, colon);
        std::string id = trim(raw.substr(colon + 1));
        if (!id.empty()) {
            session_id = std::move(id);
        }
    }

    const std::string agent_name = ascii_lowercase(trim(agent_part));
    auto agent = agents::agent_from_string(agent_name);
    if (!agent) {
        return BridgeError{ErrorKind::UnsupportedAgent, "Unsupported agent: " + agent_name};
    }

    SourceSpec spec;
    spec.agent = *agent;
    spec.current_session = !session_id.has_value();
    spec.session_id = std::move(session_id);
    return spec;
}

std::variant<ReportRequest, BridgeError> load_handoff(const std::filesystem::path& path) {
    const std::string path_text = path.string();

    std::string raw;
    if (auto err = io::read_file_text(path, raw, MAX_HANDOFF_SIZE)) {
        if (err->kind == io::ReaderErrorKind::TooLarge) {
            return invalid("Invalid handoff: file exceeds 1MB size limit");
        }
        return BridgeError{ErrorKind::IoError, "Failed to read handoff file: " + path_text};
    }

    std::string parse_error;
    auto root = io::parse_json(raw, &parse_error);
    if (!root) {
        return invalid("Failed to parse handoff JSON: " + path_text + " (" + parse_error + ")");
    }

    const auto* object = root->get_object();
    if (object == nullptr) {
        return invalid("Invalid handoff: must be a JSON object");
    }

    std::vector<std::string> unexpected;
    for (const auto& [key, value] : *object) {
        bool allowed = false;
        for (const char* name : HANDOFF_KEYS) {
            allowed = allowed || key == name;
        }
        if (!allowed) {
            unexpected.push_back(key);
        }
    }
    if (!unexpected.empty()) {
        return invalid("Invalid handoff: unexpected fields: " + join(unexpected, ", "));
    }

    ReportRequest request;

    const auto* mode_name = root->get_string("mode");
    if (mode_name == nullptr) {
        return invalid("Handoff is missing required string field: mode");
    }
    auto mode = mode_from_string(*mode_name);
    if (!mode) {
        return BridgeError{ErrorKind::UnsupportedMode,
                           "Unsupported mode: " + ascii_lowercase(*mode_name)};
    }
    request.mode = *mode;

    const auto* task = root->get_string("task");
    if (task == nullptr) {
        return invalid("Handoff is missing required string field: task");
    }
    request.task = *task;

    const auto* criteria = root->get_array("success_criteria");
    if (criteria == nullptr) {
        return invalid("Handoff is missing required array field: success_criteria");
    }
    request.success_criteria = string_items(*criteria);
    if (request.success_criteria.empty()) {
        return invalid("Handoff success_criteria must contain at least one string");
    }

    const auto* sources = root->get_array("sources");
    if (sources == nullptr) {
        return invalid("Handoff is missing required array field: sources");
    }
    if (sources->empty()) {
        return invalid("Handoff sources must contain at least one source");
    }
    for (const auto& node : *sources) {
        auto parsed = parse_handoff_source(node);
        if (auto* err = std::get_if<BridgeError>(&parsed)) {
            return *err;
        }
        request.sources.push_back(std::get<SourceSpec>(std::move(parsed)));
    }

    if (const auto* constraints = root->get_array("constraints")) {
        request.constraints = string_items(*constraints);
    }

    return request;
}

// ----------------------------------------------------------------------------
// Построение отчёта
// ----------------------------------------------------------------------------

std::string evidence_tag(const SourceSpec& source) {
    std::string id;
    if (source.session_id) {
        id = utf8_prefix(*source.session_id, EVIDENCE_ID_CHARS);
    } else if (source.current_session) {
        id = "latest";
    } else {
        id = "unspecified";
    }
    return std::string("[") + agents::agent_to_string(source.agent) + ":" + id + "]";
}

std::string normalize_whitespace(std::string_view text) {
    std::string out;
    bool pending_space = false;
    for (char c : text) {
        if (is_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += c;
    }
    return out;
}

Report build_report(const ReportRequest& request, const std::string& default_cwd,
                    const config::AgentDirs& dirs) {
    struct Available {
        std::string evidence;
        agents::Session session;
    };
    struct Missing {
        const SourceSpec* source;
        std::string evidence;
        std::string message;
    };

    std::vector<Available> available;
    std::vector<Missing> missing;

    for (const auto& source : request.sources) {
        agents::ResolveRequest req;
        req.session_id = source.session_id;
        req.cwd = source.cwd ? *source.cwd : default_cwd;
        req.explicit_dir = source.explicit_dir;
        req.last_n = 1;

        auto resolved = agents::resolve_session(source.agent, req, dirs);
        if (auto* err = std::get_if<BridgeError>(&resolved)) {
            missing.push_back(Missing{&source, evidence_tag(source), err->message});
        } else {
            available.push_back(
                Available{evidence_tag(source), std::get<agents::Session>(std::move(resolved))});
        }
    }

    Report report;
    report.mode = request.mode;
    report.task = request.task;
    report.success_criteria = request.success_criteria;

    for (const auto& item : missing) {
        report.findings.push_back(Finding{Severity::P1,
                                          std::string("Source unavailable: ") +
                                              agents::agent_to_string(item.source->agent) + " (" +
                                              item.message + ")",
                                          {item.evidence},
                                          CONFIDENCE_UNAVAILABLE});
    }

    for (const auto& item : available) {
        for (const auto& warning : item.session.warnings) {
            report.findings.push_back(Finding{Severity::P2, "Source warning: " + warning,
                                              {item.evidence}, CONFIDENCE_WARNING});
        }
    }

    std::set<std::string> distinct;
    std::vector<std::string> all_evidence;
    for (const auto& item : available) {
        std::string text = trim(item.session.content);
        distinct.insert(request.normalize ? normalize_whitespace(text) : text);
        all_evidence.push_back(item.evidence);
    }

    if (available.size() >= 2) {
        if (distinct.size() > 1) {
            report.findings.push_back(Finding{Severity::P1, "Divergent agent outputs detected",
                                              all_evidence, CONFIDENCE_DIVERGENT});
        } else {
            report.findings.push_back(Finding{Severity::P3,
                                              "All available agent outputs are aligned",
                                              all_evidence, CONFIDENCE_ALIGNED});
        }
    } else {
        report.findings.push_back(Finding{Severity::P2, "Insufficient comparable sources",
                                          all_evidence, CONFIDENCE_INSUFFICIENT});
    }

    if (!missing.empty()) {
        report.recommended_next_actions.push_back(
            "Provide valid session identifiers or cwd values for unavailable sources.");
    }
    if (distinct.size() > 1) {
        report.recommended_next_actions.push_back(
            "Inspect full transcripts for diverging sources before final decisions.");
    }
    if (!request.constraints.empty()) {
        report.recommended_next_actions.push_back("Verify recommendations against constraints: " +
                                                  join(request.constraints, "; ") + ".");
    }
    if (report.recommended_next_actions.empty()) {
        report.recommended_next_actions.push_back("No immediate action required.");
    }

    for (const auto& item : missing) {
        report.open_questions.push_back(std::string("Missing source ") +
                                        agents::agent_to_string(item.source->agent) + ": " +
                                        item.message);
    }

    for (const auto& item : available) {
        report.sources_used.push_back(item.evidence + " " + item.session.source);
    }

    // Вердикт
    if (available.empty()) {
        report.verdict = "INCOMPLETE";
    } else {
        switch (request.mode) {
        case Mode::Verify:
            report.verdict = (missing.empty() && distinct.size() <= 1) ? "PASS" : "FAIL";
            break;
        case Mode::Steer:
            report.verdict = "STEERING_PLAN_READY";
            break;
        case Mode::Analyze:
            report.verdict = "ANALYSIS_COMPLETE";
            break;
        case Mode::Feedback:
            report.verdict = "FEEDBACK_COMPLETE";
            break;
        }
    }

    return report;
}

// ----------------------------------------------------------------------------
// Вывод
// ----------------------------------------------------------------------------

std::string render_markdown(const Report& report) {
    std::vector<std::string> lines;
    lines.push_back("### Agent Bridge Coordinator Report");
    lines.push_back("");
    lines.push_back(std::string("**Mode:** ") + mode_to_string(report.mode));
    lines.push_back("**Task:** " + report.task);
    lines.push_back("**Success Criteria:**");
    for (const auto& criterion : report.success_criteria) {
        lines.push_back("- " + criterion);
    }

    lines.push_back("");
    lines.push_back("**Sources Used:**");
    for (const auto& source : report.sources_used) {
        lines.push_back("- " + source);
    }

    lines.push_back("");
    lines.push_back("**Verdict:** " + report.verdict);
    lines.push_back("");
    lines.push_back("**Findings:**");
    for (const auto& finding : report.findings) {
        char confidence[32];
        std::snprintf(confidence, sizeof(confidence), "%.2f", finding.confidence);
        lines.push_back(std::string("- **") + severity_to_string(finding.severity) + ":** " +
                        finding.summary + " (evidence: " + join(finding.evidence, ", ") +
                        "; confidence: " + confidence + ")");
    }

    lines.push_back("");
    lines.push_back("**Recommended Next Actions:**");
    for (std::size_t i = 0; i < report.recommended_next_actions.size(); ++i) {
        lines.push_back(std::to_string(i + 1) + ". " + report.recommended_next_actions[i]);
    }

    if (!report.open_questions.empty()) {
        lines.push_back("");
        lines.push_back("**Open Questions:**");
        for (const auto& question : report.open_questions) {
            lines.push_back("- " + question);
        }
    }

    return join(lines, "\n");
}

std::string report_to_json(const Report& report) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);

    auto write_strings = [&writer](const std::vector<std::string>& items) {
        writer.StartArray();
        for (const auto& item : items) {
            writer.String(item.c_str(), static_cast<rapidjson::SizeType>(item.size()));
        }
        writer.EndArray();
    };

    writer.StartObject();
    writer.Key("mode");
    writer.String(mode_to_string(report.mode));
    writer.Key("task");
    writer.String(report.task.c_str(), static_cast<rapidjson::SizeType>(report.task.size()));
    writer.Key("success_criteria");
    write_strings(report.success_criteria);
    writer.Key("sources_used");
    write_strings(report.sources_used);
    writer.Key("verdict");
    writer.String(report.verdict.c_str(), static_cast<rapidjson::SizeType>(report.verdict.size()));

    writer.Key("findings");
    writer.StartArray();
    for (const auto& finding : report.findings) {
        writer.StartObject();
        writer.Key("severity");
        writer.String(severity_to_string(finding.severity));
        writer.Key("summary");
        writer.String(finding.summary.c_str(),
                      static_cast<rapidjson::SizeType>(finding.summary.size()));
        writer.Key("evidence");
        write_strings(finding.evidence);
        writer.Key("confidence");
        writer.Double(finding.confidence);
        writer.EndObject();
    }
    writer.EndArray();

    writer.Key("recommended_next_actions");
    write_strings(report.recommended_next_actions);
    writer.Key("open_questions");
    write_strings(report.open_questions);
    writer.EndObject();

    return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace bridge::report
