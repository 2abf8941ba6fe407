// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Сообщения об ошибках использования повторяют формат clap:
//   error: <что не так>
//
//   Usage: bridge <команда> ...
//
//   For more information, try '--help'.
//
// Длинные опции принимаются как "--opt value" и "--opt=value".
// Глобальные опции (-q, -v, --config, -o) допустимы и после подкоманды.
//
// ==============================================================================

#include "bridge/cli.hpp"

#include "bridge/platform.hpp"

#include <charconv>
#include <cstring>

namespace bridge::cli {

namespace {

constexpr const char* HELP_HINT = "For more information, try '--help'.\n";

constexpr const char* USAGE_MAIN = "Usage: bridge [OPTIONS] <COMMAND>";
constexpr const char* USAGE_READ = "Usage: bridge read [OPTIONS] --agent <AGENT>";
constexpr const char* USAGE_COMPARE = "Usage: bridge compare [OPTIONS] --source <SOURCE>";
constexpr const char* USAGE_REPORT = "Usage: bridge report [OPTIONS] --handoff <HANDOFF>";
constexpr const char* USAGE_LIST = "Usage: bridge list [OPTIONS] --agent <AGENT>";
constexpr const char* USAGE_SEARCH = "Usage: bridge search [OPTIONS] --agent <AGENT> <QUERY>";
constexpr const char* USAGE_REDACT = "Usage: bridge redact [OPTIONS] [FILE]";

bool starts_with(const std::string& str, const char* prefix) {
    return str.compare(0, std::strlen(prefix), prefix) == 0;
}

/// argv -> список токенов; "--opt=value" разбивается на два токена
std::vector<std::string> tokenize(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::size_t eq = arg.find('=');
        if (starts_with(arg, "--") && arg.size() > 2 && eq != std::string::npos) {
            args.push_back(arg.substr(0, eq));
            args.push_back(arg.substr(eq + 1));
        } else {
            args.push_back(std::move(arg));
        }
    }
    return args;
}

// ----------------------------------------------------------------------------
// ArgParser - разбор аргументов одной подкоманды
// ----------------------------------------------------------------------------

class ArgParser {
public:
    ArgParser(const std::vector<std::string>& args, std::size_t start, ParseResult& result,
              const char* usage)
        : args_(args), pos_(start), result_(result), usage_(usage) {
        for (const auto& arg : args_) {
            json_ = json_ || arg == "--json";
        }
    }

    bool done() const { return failed_ || pos_ >= args_.size(); }
    std::size_t position() const { return pos_; }
    bool failed() const { return failed_; }

    /// Следующий токен (сдвигает позицию)
    const std::string& next() { return args_[pos_++]; }

    bool is_help(const std::string& arg) const { return arg == "-h" || arg == "--help"; }

    /// Обработать глобальную опцию; false если arg не глобальная опция
    bool global(const std::string& arg) {
        if (arg == "-q" || arg == "--quiet") {
            result_.global.quiet = true;
            return true;
        }
        if (arg == "-v" || arg == "--verbose") {
            result_.global.verbose++;
            return true;
        }
        if (arg == "--config") {
            std::string value;
            if (take_value("--config <CONFIG>", value)) {
                result_.global.config = platform::path_from_utf8(value);
            }
            return true;
        }
        if (arg == "-o" || arg == "--output") {
            std::string value;
            if (take_value("--output <OUTPUT>", value)) {
                result_.global.output = platform::path_from_utf8(value);
            }
            return true;
        }
        return false;
    }

    /// Значение опции; при отсутствии - ошибка использования
    bool take_value(const char* flag, std::string& out) {
        if (pos_ >= args_.size()) {
            fail(std::string("error: a value is required for '") + flag +
                 "' but none was supplied");
            return false;
        }
        out = args_[pos_++];
        return true;
    }

    bool take_optional(const char* flag, std::optional<std::string>& out) {
        std::string value;
        if (!take_value(flag, value)) {
            return false;
        }
        out = std::move(value);
        return true;
    }

    bool take_count(const char* flag, std::optional<std::size_t>& out) {
        std::string value;
        if (!take_value(flag, value)) {
            return false;
        }
        std::size_t parsed = 0;
        const char* begin = value.data();
        const char* end = value.data() + value.size();
        auto [ptr, ec] = std::from_chars(begin, end, parsed);
        if (value.empty() || ec != std::errc() || ptr != end) {
            fail("error: invalid value '" + value + "' for '" + flag +
                 "': invalid digit found in string");
            return false;
        }
        out = parsed;
        return true;
    }

    bool take_agent(std::optional<agents::Agent>& out) {
        std::string value;
        if (!take_value("--agent <AGENT>", value)) {
            return false;
        }
        auto agent = agents::agent_from_string(value);
        if (!agent) {
            fail("error: invalid value '" + value +
                     "' for '--agent <AGENT>'\n  [possible values: codex, gemini, claude, cursor]",
                 BridgeError{ErrorKind::UnsupportedAgent, "Unsupported agent: " + value});
            return false;
        }
        out = agent;
        return true;
    }

    void unexpected(const std::string& arg) {
        fail("error: unexpected argument '" + arg + "' found");
    }

    void missing(const char* what) {
        fail(std::string("error: the following required arguments were not provided:\n  ") + what);
    }

    void fail(const std::string& message) {
        std::string first_line = message.substr(0, message.find('\n'));
        fail(message, BridgeError{ErrorKind::IoError, first_line});
    }

    void fail(const std::string& message, BridgeError error) {
        failed_ = true;
        result_.ok = false;
        result_.diagnostic.exit_code = 2;
        result_.diagnostic.stderr_message =
            message + "\n\n" + usage_ + "\n\n" + HELP_HINT;
        result_.diagnostic.json = json_;
        result_.diagnostic.error = std::move(error);
    }

private:
    const std::vector<std::string>& args_;
    std::size_t pos_;
    ParseResult& result_;
    const char* usage_;
    bool json_ = false;
    bool failed_ = false;
};

void help_for(ParseResult& result, const char* command) {
    result.ok = true;
    result.command = HelpCommand{command};
}

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

void parse_read(const std::vector<std::string>& args, std::size_t start, ParseResult& result) {
    ArgParser p(args, start, result, USAGE_READ);
    ReadCommand cmd;
    std::optional<agents::Agent> agent;

    while (!p.done()) {
        const std::string& arg = p.next();
        if (p.is_help(arg)) {
            return help_for(result, "read");
        } else if (p.global(arg)) {
            continue;
        } else if (arg == "--agent") {
            p.take_agent(agent);
        } else if (arg == "--id") {
            p.take_optional("--id <ID>", cmd.id);
        } else if (arg == "--cwd") {
            p.take_optional("--cwd <CWD>", cmd.cwd);
        } else if (arg == "--chats-dir") {
            p.take_optional("--chats-dir <CHATS_DIR>", cmd.chats_dir);
        } else if (arg == "--last") {
            p.take_count("--last <LAST>", cmd.last);
        } else if (arg == "--json") {
            cmd.json = true;
        } else {
            p.unexpected(arg);
        }
    }
    if (p.failed()) {
        return;
    }
    if (!agent) {
        return p.missing("--agent <AGENT>");
    }

    cmd.agent = *agent;
    result.ok = true;
    result.command = cmd;
}

void parse_compare(const std::vector<std::string>& args, std::size_t start,
                   ParseResult& result) {
    ArgParser p(args, start, result, USAGE_COMPARE);
    CompareCommand cmd;

    while (!p.done()) {
        const std::string& arg = p.next();
        if (p.is_help(arg)) {
            return help_for(result, "compare");
        } else if (p.global(arg)) {
            continue;
        } else if (arg == "--source") {
            std::string value;
            if (p.take_value("--source <SOURCE>", value)) {
                cmd.sources.push_back(std::move(value));
            }
        } else if (arg == "--cwd") {
            p.take_optional("--cwd <CWD>", cmd.cwd);
        } else if (arg == "--normalize") {
            cmd.normalize = true;
        } else if (arg == "--json") {
            cmd.json = true;
        } else {
            p.unexpected(arg);
        }
    }
    if (p.failed()) {
        return;
    }
    if (cmd.sources.empty()) {
        return p.missing("--source <SOURCE>");
    }

    result.ok = true;
    result.command = cmd;
}

void parse_report(const std::vector<std::string>& args, std::size_t start,
                  ParseResult& result) {
    ArgParser p(args, start, result, USAGE_REPORT);
    ReportCommand cmd;
    std::optional<std::string> handoff;

    while (!p.done()) {
        const std::string& arg = p.next();
        if (p.is_help(arg)) {
            return help_for(result, "report");
        } else if (p.global(arg)) {
            continue;
        } else if (arg == "--handoff") {
            p.take_optional("--handoff <HANDOFF>", handoff);
        } else if (arg == "--cwd") {
            p.take_optional("--cwd <CWD>", cmd.cwd);
        } else if (arg == "--json") {
            cmd.json = true;
        } else {
            p.unexpected(arg);
        }
    }
    if (p.failed()) {
        return;
    }
    if (!handoff) {
        return p.missing("--handoff <HANDOFF>");
    }

    cmd.handoff = platform::path_from_utf8(*handoff);
    result.ok = true;
    result.command = cmd;
}

void parse_list(const std::vector<std::string>& args, std::size_t start, ParseResult& result) {
    ArgParser p(args, start, result, USAGE_LIST);
    ListCommand cmd;
    std::optional<agents::Agent> agent;

    while (!p.done()) {
        const std::string& arg = p.next();
        if (p.is_help(arg)) {
            return help_for(result, "list");
        } else if (p.global(arg)) {
            continue;
        } else if (arg == "--agent") {
            p.take_agent(agent);
        } else if (arg == "--cwd") {
            p.take_optional("--cwd <CWD>", cmd.cwd);
        } else if (arg == "--limit") {
            p.take_count("--limit <LIMIT>", cmd.limit);
        } else if (arg == "--json") {
            cmd.json = true;
        } else {
            p.unexpected(arg);
        }
    }
    if (p.failed()) {
        return;
    }
    if (!agent) {
        return p.missing("--agent <AGENT>");
    }

    cmd.agent = *agent;
    result.ok = true;
    result.command = cmd;
}

void parse_search(const std::vector<std::string>& args, std::size_t start,
                  ParseResult& result) {
    ArgParser p(args, start, result, USAGE_SEARCH);
    SearchCommand cmd;
    std::optional<agents::Agent> agent;
    std::optional<std::string> query;

    while (!p.done()) {
        const std::string& arg = p.next();
        if (p.is_help(arg)) {
            return help_for(result, "search");
        } else if (p.global(arg)) {
            continue;
        } else if (arg == "--agent") {
            p.take_agent(agent);
        } else if (arg == "--cwd") {
            p.take_optional("--cwd <CWD>", cmd.cwd);
        } else if (arg == "--limit") {
            p.take_count("--limit <LIMIT>", cmd.limit);
        } else if (arg == "--json") {
            cmd.json = true;
        } else if (!query && (arg.empty() || arg[0] != '-')) {
            query = arg;
        } else {
            p.unexpected(arg);
        }
    }
    if (p.failed()) {
        return;
    }
    if (!agent) {
        return p.missing("--agent <AGENT>");
    }
    if (!query) {
        return p.missing("<QUERY>");
    }

    cmd.agent = *agent;
    cmd.query = *query;
    result.ok = true;
    result.command = cmd;
}

void parse_redact(const std::vector<std::string>& args, std::size_t start,
                  ParseResult& result) {
    ArgParser p(args, start, result, USAGE_REDACT);
    RedactCommand cmd;

    while (!p.done()) {
        const std::string& arg = p.next();
        if (p.is_help(arg)) {
            return help_for(result, "redact");
        } else if (p.global(arg)) {
            continue;
        } else if (!cmd.file && (arg == "-" || arg.empty() || arg[0] != '-')) {
            // "-" означает stdin
            if (arg != "-") {
                cmd.file = platform::path_from_utf8(arg);
            }
        } else {
            p.unexpected(arg);
        }
    }
    if (p.failed()) {
        return;
    }

    result.ok = true;
    result.command = cmd;
}

}  // namespace

// ----------------------------------------------------------------------------
// render_version
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("bridge ") + VERSION + "\n";
}

// ----------------------------------------------------------------------------
// render_help
// ----------------------------------------------------------------------------

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: bridge [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  read     Read a session from an agent\n"
               "  compare  Compare sources and return an analyze-mode report\n"
               "  report   Build a report from a handoff packet JSON file\n"
               "  list     List sessions for an agent\n"
               "  search   Search sessions for a keyword\n"
               "  redact   Redact secrets from a file or stdin\n"
               "  help     Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "      --config <CONFIG>  Path to a YAML config file\n"
               "  -o, --output <OUTPUT>  Save output to a file\n"
               "  -q, --quiet            Suppress informational messages and warnings\n"
               "  -v...                  Print verbose output\n"
               "  -h, --help             Print help\n"
               "  -V, --version          Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Read the latest Codex answer for the current project:\n"
               "        bridge read --agent codex\n"
               "\n"
               "    Compare the latest Claude and Gemini answers:\n"
               "        bridge compare --source claude --source gemini\n"
               "\n"
               "    Search Claude sessions for a keyword:\n"
               "        bridge search auth --agent claude --limit 5\n";
    } else if (*command == "read") {
        return "Read a session from an agent\n"
               "\n"
               "Usage: bridge read [OPTIONS] --agent <AGENT>\n"
               "\n"
               "Options:\n"
               "      --agent <AGENT>          Agent to read from [possible values: codex, "
               "gemini, claude, cursor]\n"
               "      --id <ID>                Session ID or UUID (substring match supported)\n"
               "      --cwd <CWD>              Working directory to scope search (defaults to "
               "current directory)\n"
               "      --chats-dir <CHATS_DIR>  Explicit path to chats directory (Gemini only)\n"
               "      --last <LAST>            Number of last assistant messages to return\n"
               "      --json                   Emit structured JSON instead of text\n"
               "  -h, --help                   Print help\n";
    } else if (*command == "compare") {
        return "Compare sources and return an analyze-mode report\n"
               "\n"
               "Usage: bridge compare [OPTIONS] --source <SOURCE>\n"
               "\n"
               "Options:\n"
               "      --source <SOURCE>  Source spec: <agent> or <agent>:<session-substring>\n"
               "      --cwd <CWD>        Working directory to scope current-session lookups\n"
               "      --normalize        Apply whitespace normalization before comparing\n"
               "      --json             Emit structured JSON instead of markdown\n"
               "  -h, --help             Print help\n";
    } else if (*command == "report") {
        return "Build a report from a handoff packet JSON file\n"
               "\n"
               "Usage: bridge report [OPTIONS] --handoff <HANDOFF>\n"
               "\n"
               "Options:\n"
               "      --handoff <HANDOFF>  Path to handoff JSON file\n"
               "      --cwd <CWD>          Working directory fallback for source lookups\n"
               "      --json               Emit structured JSON instead of markdown\n"
               "  -h, --help               Print help\n";
    } else if (*command == "list") {
        return "List sessions for an agent\n"
               "\n"
               "Usage: bridge list [OPTIONS] --agent <AGENT>\n"
               "\n"
               "Options:\n"
               "      --agent <AGENT>  Agent to list sessions for\n"
               "      --cwd <CWD>      Working directory to scope search\n"
               "      --limit <LIMIT>  Maximum number of sessions to return\n"
               "      --json           Emit structured JSON instead of text\n"
               "  -h, --help           Print help\n";
    } else if (*command == "search") {
        return "Search sessions for a keyword\n"
               "\n"
               "Usage: bridge search [OPTIONS] --agent <AGENT> <QUERY>\n"
               "\n"
               "Arguments:\n"
               "  <QUERY>  Keyword to search for\n"
               "\n"
               "Options:\n"
               "      --agent <AGENT>  Agent to search\n"
               "      --cwd <CWD>      Working directory to scope search\n"
               "      --limit <LIMIT>  Maximum number of sessions to return\n"
               "      --json           Emit structured JSON instead of text\n"
               "  -h, --help           Print help\n";
    } else if (*command == "redact") {
        return "Redact secrets from a file or stdin\n"
               "\n"
               "Usage: bridge redact [OPTIONS] [FILE]\n"
               "\n"
               "Arguments:\n"
               "  [FILE]  File to redact (reads stdin when omitted)\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    }
    return "error: unrecognized subcommand '" + *command + "'\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    const std::vector<std::string> args = tokenize(argc, argv);

    // Глобальные опции до подкоманды
    ArgParser globals(args, 0, result, USAGE_MAIN);
    std::optional<std::string> cmd;
    while (!globals.done()) {
        const std::string& arg = globals.next();
        if (arg == "-h" || arg == "--help") {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (arg == "-V" || arg == "--version") {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (globals.global(arg)) {
            continue;
        } else if (!arg.empty() && arg[0] != '-') {
            cmd = arg;
            break;
        } else {
            globals.unexpected(arg);
        }
    }
    if (globals.failed()) {
        return result;
    }

    if (!cmd) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const std::size_t start = globals.position();

    if (*cmd == "read") {
        parse_read(args, start, result);
    } else if (*cmd == "compare") {
        parse_compare(args, start, result);
    } else if (*cmd == "report") {
        parse_report(args, start, result);
    } else if (*cmd == "list") {
        parse_list(args, start, result);
    } else if (*cmd == "search") {
        parse_search(args, start, result);
    } else if (*cmd == "redact") {
        parse_redact(args, start, result);
    } else if (*cmd == "help") {
        result.ok = true;
        if (start < args.size()) {
            result.command = HelpCommand{args[start]};
        } else {
            result.command = HelpCommand{};
        }
    } else {
        globals.fail("error: unrecognized subcommand '" + *cmd + "'");
    }

    return result;
}

}  // namespace bridge::cli
