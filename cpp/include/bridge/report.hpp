// ==============================================================================
// bridge/report.hpp - Отчёт о расхождениях между агентами
// ==============================================================================
//
// Назначение:
// - Разрешить несколько источников (SourceSpec) и сравнить их содержимое
// - Отсутствующий источник не прерывает отчёт: он становится находкой P1
// - Вердикт зависит от режима (verify / steer / analyze / feedback)
// - Handoff-пакет: JSON-файл с запросом отчёта (не больше MAX_HANDOFF_SIZE)
//
// Порядок находок:
//   1. P1 "Source unavailable" на каждый отсутствующий источник
//   2. P2 "Source warning" на каждое предупреждение успешного источника
//   3. Одна итоговая находка сравнения (P1 / P3 / P2)
//
// ==============================================================================

#ifndef BRIDGE_REPORT_HPP
#define BRIDGE_REPORT_HPP

#include <bridge/config.hpp>
#include <bridge/error.hpp>
#include <bridge/session.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bridge::report {

/// Потолок размера handoff-файла: 1 MiB
constexpr std::uintmax_t MAX_HANDOFF_SIZE = 1024ULL * 1024ULL;

// ----------------------------------------------------------------------------
// Режим и важность
// ----------------------------------------------------------------------------

enum class Mode { Verify, Steer, Analyze, Feedback };

const char* mode_to_string(Mode mode);

/// Без учёта регистра
std::optional<Mode> mode_from_string(std::string_view name);

enum class Severity { P1, P2, P3 };

const char* severity_to_string(Severity severity);

// ----------------------------------------------------------------------------
// Запрос
// ----------------------------------------------------------------------------

struct SourceSpec {
    agents::Agent agent = agents::Agent::Codex;

    /// Задан session_id, либо current_session == true
    std::optional<std::string> session_id;
    bool current_session = false;

    std::optional<std::string> cwd;
    std::optional<std::string> explicit_dir;
};

struct ReportRequest {
    Mode mode = Mode::Analyze;
    std::string task;
    std::vector<std::string> success_criteria;
    std::vector<SourceSpec> sources;
    std::vector<std::string> constraints;

    /// Сравнивать содержимое со схлопнутыми пробелами
    bool normalize = false;
};

// ----------------------------------------------------------------------------
// Отчёт
// ----------------------------------------------------------------------------

struct Finding {
    Severity severity = Severity::P2;
    std::string summary;
    std::vector<std::string> evidence;
    double confidence = 0.0;
};

struct Report {
    Mode mode = Mode::Analyze;
    std::string task;
    std::vector<std::string> success_criteria;
    std::vector<std::string> sources_used;
    std::string verdict;
    std::vector<Finding> findings;
    std::vector<std::string> recommended_next_actions;
    std::vector<std::string> open_questions;
};

// ----------------------------------------------------------------------------
// Операции
// ----------------------------------------------------------------------------

/// "agent[:session]" -> SourceSpec (агент в нижнем регистре, пустой id -> текущая сессия)
std::variant<SourceSpec, BridgeError> parse_source_arg(std::string_view raw);

/// Прочитать и проверить handoff-пакет.
/// Разрешённые ключи: mode, task, success_criteria, sources, constraints.
std::variant<ReportRequest, BridgeError> load_handoff(const std::filesystem::path& path);

/// Построить отчёт. Источники разрешаются последовательно в порядке запроса.
Report build_report(const ReportRequest& request, const std::string& default_cwd,
                    const config::AgentDirs& dirs);

/// "[<agent>:<первые 8 символов id>]", "[<agent>:latest]" или "[<agent>:unspecified]"
std::string evidence_tag(const SourceSpec& source);

/// Схлопнуть все пробельные последовательности в один пробел
std::string normalize_whitespace(std::string_view text);

/// Markdown ("### Agent Bridge Coordinator Report")
std::string render_markdown(const Report& report);

/// JSON с отступом 2 и фиксированным порядком ключей
std::string report_to_json(const Report& report);

}  // namespace bridge::report

#endif  // BRIDGE_REPORT_HPP
