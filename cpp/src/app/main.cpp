// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Загрузка конфигурации (config)
// 4. Dispatch команды
// 5. Возврат exit code: 0 - успех, 1 - ошибка, 2 - ошибка использования
//
// При --json любая ошибка печатается в stdout как {"error_code","message"}.
//
// ==============================================================================

#include "bridge/agents.hpp"
#include "bridge/cli.hpp"
#include "bridge/config.hpp"
#include "bridge/output.hpp"
#include "bridge/platform.hpp"
#include "bridge/reader.hpp"
#include "bridge/redact.hpp"
#include "bridge/report.hpp"

#include <exception>
#include <iostream>
#include <iterator>
#include <string>
#include <system_error>
#include <type_traits>
#include <variant>

namespace {

using namespace bridge;

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

bool is_json_mode(const cli::Command& command) {
    return std::visit(
        [](auto&& cmd) -> bool {
            using T = std::decay_t<decltype(cmd)>;
            if constexpr (std::is_same_v<T, cli::ReadCommand> ||
                          std::is_same_v<T, cli::CompareCommand> ||
                          std::is_same_v<T, cli::ReportCommand> ||
                          std::is_same_v<T, cli::ListCommand> ||
                          std::is_same_v<T, cli::SearchCommand>) {
                return cmd.json;
            } else {
                return false;
            }
        },
        command);
}

/// --cwd, иначе текущая директория процесса
std::string effective_cwd(const std::optional<std::string>& cwd) {
    if (cwd) {
        return *cwd;
    }
    std::error_code ec;
    auto current = std::filesystem::current_path(ec);
    if (ec) {
        return ".";
    }
    return platform::path_to_utf8(current);
}

int emit_error(output::Writer& writer, const BridgeError& error, bool json) {
    if (json) {
        writer.write_json_pretty(output::error_to_json(error));
    } else {
        writer.error(output::sanitize_for_terminal(error.message));
    }
    return 1;
}

void emit_report(output::Writer& writer, const report::Report& result, bool json) {
    if (json) {
        writer.write_line(output::Stream::Stdout, report::report_to_json(result));
    } else {
        writer.write_line(output::Stream::Stdout,
                          output::sanitize_for_terminal(report::render_markdown(result)));
    }
}

void emit_entries(output::Writer& writer, const std::vector<agents::SessionEntry>& entries,
                  bool json) {
    if (json) {
        writer.write_json_pretty(output::entries_to_json(entries));
        return;
    }
    if (entries.empty()) {
        writer.info("No sessions found");
        return;
    }
    output::entries_table(entries).print(writer);
}

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

int run_read(const cli::ReadCommand& cmd, const config::Config& cfg, output::Writer& writer) {
    agents::ResolveRequest req;
    req.session_id = cmd.id;
    req.cwd = effective_cwd(cmd.cwd);
    req.explicit_dir = cmd.chats_dir;
    req.last_n = cmd.last.value_or(cfg.defaults.last);

    writer.debug(std::string("Resolving ") + agents::agent_to_string(cmd.agent) +
                 " session for " + req.cwd);

    auto resolved = agents::resolve_session(cmd.agent, req, cfg.dirs);
    if (auto* err = std::get_if<BridgeError>(&resolved)) {
        return emit_error(writer, *err, cmd.json);
    }
    const auto& session = std::get<agents::Session>(resolved);
    writer.debug("Selected " + session.source);

    if (cmd.json) {
        writer.write_json_pretty(output::session_to_json(session));
        return 0;
    }

    for (const auto& warning : session.warnings) {
        writer.warn(output::sanitize_for_terminal(warning));
    }
    writer.write_line(output::Stream::Stdout, output::format_session_text(session));
    return 0;
}

int run_compare(const cli::CompareCommand& cmd, const config::Config& cfg,
                output::Writer& writer) {
    report::ReportRequest request;
    request.mode = report::Mode::Analyze;
    request.task = "Compare agent outputs";
    request.success_criteria = {"Identify agreements and contradictions",
                                "Highlight unavailable sources"};
    request.normalize = cmd.normalize;

    for (const auto& raw : cmd.sources) {
        auto parsed = report::parse_source_arg(raw);
        if (auto* err = std::get_if<BridgeError>(&parsed)) {
            return emit_error(writer, *err, cmd.json);
        }
        request.sources.push_back(std::get<report::SourceSpec>(parsed));
    }

    auto result = report::build_report(request, effective_cwd(cmd.cwd), cfg.dirs);
    emit_report(writer, result, cmd.json);
    return 0;
}

int run_report(const cli::ReportCommand& cmd, const config::Config& cfg,
               output::Writer& writer) {
    writer.debug("Loading handoff " + platform::path_to_utf8(cmd.handoff));

    auto loaded = report::load_handoff(cmd.handoff);
    if (auto* err = std::get_if<BridgeError>(&loaded)) {
        return emit_error(writer, *err, cmd.json);
    }

    auto result = report::build_report(std::get<report::ReportRequest>(loaded),
                                       effective_cwd(cmd.cwd), cfg.dirs);
    emit_report(writer, result, cmd.json);
    return 0;
}

int run_list(const cli::ListCommand& cmd, const config::Config& cfg, output::Writer& writer) {
    auto entries = agents::list_sessions(cmd.agent, cmd.cwd,
                                         cmd.limit.value_or(cfg.defaults.limit), cfg.dirs);
    emit_entries(writer, entries, cmd.json);
    return 0;
}

int run_search(const cli::SearchCommand& cmd, const config::Config& cfg,
               output::Writer& writer) {
    auto entries = agents::search_sessions(cmd.agent, cmd.query, cmd.cwd,
                                           cmd.limit.value_or(cfg.defaults.limit), cfg.dirs);
    emit_entries(writer, entries, cmd.json);
    return 0;
}

int run_redact(const cli::RedactCommand& cmd, output::Writer& writer) {
    std::string text;
    if (cmd.file) {
        if (auto err = io::read_file_text(*cmd.file, text)) {
            writer.error(err->format());
            return 1;
        }
    } else {
        text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    writer.write(output::Stream::Stdout, redact::redact(text));
    return 0;
}

// ----------------------------------------------------------------------------
// run
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    // 1. Парсинг аргументов
    cli::ParseResult parse_result = cli::parse(argc, argv);

    // 2. Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    if (parse_result.ok) {
        out_cfg.output_path = parse_result.global.output;
    }
    output::Writer writer(out_cfg);

    if (!parse_result.ok) {
        if (parse_result.diagnostic.json) {
            writer.write_json_pretty(output::error_to_json(parse_result.diagnostic.error));
            return 1;
        }
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    const bool json = is_json_mode(parse_result.command);
    if (out_cfg.output_path && !writer.has_output_file()) {
        return emit_error(writer,
                          BridgeError{ErrorKind::IoError,
                                      "Failed to open output file: " +
                                          platform::path_to_utf8(*out_cfg.output_path)},
                          json);
    }

    // 3. Команды без конфигурации
    if (const auto* help = std::get_if<cli::HelpCommand>(&parse_result.command)) {
        writer.write(output::Stream::Stdout, cli::render_help(help->command));
        return 0;
    }
    if (std::holds_alternative<cli::VersionCommand>(parse_result.command)) {
        writer.write(output::Stream::Stdout, cli::render_version());
        return 0;
    }
    if (const auto* redact_cmd = std::get_if<cli::RedactCommand>(&parse_result.command)) {
        return run_redact(*redact_cmd, writer);
    }

    // 4. Конфигурация
    config::ConfigResult cfg = config::resolve_config(parse_result.global.config);
    if (!cfg) {
        return emit_error(writer, BridgeError{ErrorKind::IoError, cfg.error.format()}, json);
    }
    if (cfg.config.source) {
        writer.debug("Loaded config " + platform::path_to_utf8(*cfg.config.source));
    }
    writer.trace("codex: " + platform::path_to_utf8(cfg.config.dirs.codex));
    writer.trace("claude: " + platform::path_to_utf8(cfg.config.dirs.claude));
    writer.trace("gemini: " + platform::path_to_utf8(cfg.config.dirs.gemini));
    writer.trace("cursor: " + platform::path_to_utf8(cfg.config.dirs.cursor));

    // 5. Dispatch
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::ReadCommand>) {
                return run_read(cmd, cfg.config, writer);
            } else if constexpr (std::is_same_v<T, cli::CompareCommand>) {
                return run_compare(cmd, cfg.config, writer);
            } else if constexpr (std::is_same_v<T, cli::ReportCommand>) {
                return run_report(cmd, cfg.config, writer);
            } else if constexpr (std::is_same_v<T, cli::ListCommand>) {
                return run_list(cmd, cfg.config, writer);
            } else if constexpr (std::is_same_v<T, cli::SearchCommand>) {
                return run_search(cmd, cfg.config, writer);
            } else {
                // help / version / redact обработаны выше
                return 1;
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Перехват исключений на границе приложения
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "[x] Unknown error occurred\n";
        return 1;
    }
}
