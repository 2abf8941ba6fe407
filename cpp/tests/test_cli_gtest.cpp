// ==============================================================================
// test_cli_gtest.cpp - Тесты CLI модуля (GoogleTest)
// ==============================================================================
//
// cli: глобальные опции, подкоманды, ошибки использования, справка
//
// ==============================================================================

#include "bridge/cli.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <variant>
#include <vector>

namespace bridge::cli::test {

// ==============================================================================
// Вспомогательные функции
// ==============================================================================

// Конвертация вектора строк в argc/argv
struct Args {
    std::vector<std::string> strings;
    std::vector<char*> ptrs;

    explicit Args(std::initializer_list<std::string> args) : strings(args) {
        for (auto& s : strings) {
            ptrs.push_back(s.data());
        }
        ptrs.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(strings.size()); }

    char** argv() { return ptrs.data(); }
};

template <typename T>
const T& command_as(const ParseResult& result) {
    return std::get<T>(result.command);
}

// ==============================================================================
// Справка и версия
// ==============================================================================

TEST(CliTest, Parse_NoArguments_HelpOnStderrExit2) {
    Args args{"bridge"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message, render_help());
}

TEST(CliTest, Parse_Help_ReturnsHelpCommand) {
    Args args{"bridge", "--help"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    EXPECT_FALSE(command_as<HelpCommand>(result).command.has_value());
}

TEST(CliTest, Parse_Version_ReturnsVersionCommand) {
    Args args{"bridge", "-V"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<VersionCommand>(result.command));
    EXPECT_EQ(render_version(), "bridge 0.1.0\n");
}

TEST(CliTest, Parse_SubcommandHelp) {
    Args args{"bridge", "search", "--help"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(std::holds_alternative<HelpCommand>(result.command));
    ASSERT_TRUE(command_as<HelpCommand>(result).command.has_value());
    EXPECT_EQ(*command_as<HelpCommand>(result).command, "search");
}

TEST(CliTest, Parse_HelpSubcommand) {
    Args args{"bridge", "help", "report"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(command_as<HelpCommand>(result).command.has_value());
    EXPECT_EQ(*command_as<HelpCommand>(result).command, "report");
}

TEST(CliTest, RenderHelp_MentionsAllCommands) {
    std::string help = render_help();

    for (const char* name : {"read", "compare", "report", "list", "search", "redact"}) {
        EXPECT_NE(help.find(std::string("  ") + name + " "), std::string::npos) << name;
    }
    EXPECT_EQ(help.rfind("Agent Bridge CLI\n", 0), 0u);
}

TEST(CliTest, RenderHelp_Subcommands) {
    EXPECT_NE(render_help(std::string("read")).find("--chats-dir <CHATS_DIR>"), std::string::npos);
    EXPECT_NE(render_help(std::string("compare")).find("--normalize"), std::string::npos);
    EXPECT_EQ(render_help(std::string("bogus")), "error: unrecognized subcommand 'bogus'\n");
}

// ==============================================================================
// Глобальные опции
// ==============================================================================

TEST(CliTest, Parse_GlobalOptionsBeforeAndAfterCommand) {
    // Arrange
    Args args{"bridge", "-q", "--config", "/etc/bridge.yml", "list", "--agent", "codex", "-v",
              "-v", "-o", "out.txt"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    EXPECT_TRUE(result.global.quiet);
    EXPECT_EQ(result.global.verbose, 2);
    ASSERT_TRUE(result.global.config.has_value());
    EXPECT_EQ(*result.global.config, std::filesystem::path("/etc/bridge.yml"));
    ASSERT_TRUE(result.global.output.has_value());
    EXPECT_EQ(*result.global.output, std::filesystem::path("out.txt"));
    EXPECT_TRUE(std::holds_alternative<ListCommand>(result.command));
}

TEST(CliTest, Parse_UnrecognizedSubcommand_UsageError) {
    Args args{"bridge", "frobnicate"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message,
              "error: unrecognized subcommand 'frobnicate'\n\n"
              "Usage: bridge [OPTIONS] <COMMAND>\n\n"
              "For more information, try '--help'.\n");
}

// ==============================================================================
// read
// ==============================================================================

TEST(CliTest, Parse_Read_AllOptions) {
    // Arrange
    Args args{"bridge", "read",   "--agent", "Gemini",        "--id",          "abc",
              "--cwd",  "/work",  "--last",  "3",             "--chats-dir=/c", "--json"};

    // Act
    ParseResult result = parse(args.argc(), args.argv());

    // Assert
    ASSERT_TRUE(result.ok) << result.diagnostic.stderr_message;
    const auto& cmd = command_as<ReadCommand>(result);
    EXPECT_EQ(cmd.agent, agents::Agent::Gemini);
    ASSERT_TRUE(cmd.id.has_value());
    EXPECT_EQ(*cmd.id, "abc");
    ASSERT_TRUE(cmd.cwd.has_value());
    EXPECT_EQ(*cmd.cwd, "/work");
    ASSERT_TRUE(cmd.last.has_value());
    EXPECT_EQ(*cmd.last, 3u);
    ASSERT_TRUE(cmd.chats_dir.has_value());
    EXPECT_EQ(*cmd.chats_dir, "/c");
    EXPECT_TRUE(cmd.json);
}

TEST(CliTest, Parse_Read_DefaultsLeftUnset) {
    Args args{"bridge", "read", "--agent", "codex"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto& cmd = command_as<ReadCommand>(result);
    EXPECT_FALSE(cmd.last.has_value());
    EXPECT_FALSE(cmd.id.has_value());
    EXPECT_FALSE(cmd.json);
}

TEST(CliTest, Parse_Read_MissingAgent) {
    Args args{"bridge", "read"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message,
              "error: the following required arguments were not provided:\n"
              "  --agent <AGENT>\n\n"
              "Usage: bridge read [OPTIONS] --agent <AGENT>\n\n"
              "For more information, try '--help'.\n");
    EXPECT_FALSE(result.diagnostic.json);
}

TEST(CliTest, Parse_Read_InvalidAgent_JsonDiagnostic) {
    Args args{"bridge", "read", "--agent", "copilot", "--json"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(result.diagnostic.json);
    EXPECT_EQ(result.diagnostic.error.kind, ErrorKind::UnsupportedAgent);
    EXPECT_EQ(result.diagnostic.error.message, "Unsupported agent: copilot");
    EXPECT_EQ(result.diagnostic.stderr_message.rfind(
                  "error: invalid value 'copilot' for '--agent <AGENT>'\n"
                  "  [possible values: codex, gemini, claude, cursor]\n\n",
                  0),
              0u);
}

TEST(CliTest, Parse_Read_MissingValue) {
    Args args{"bridge", "read", "--agent", "codex", "--id"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.error.kind, ErrorKind::IoError);
    EXPECT_EQ(result.diagnostic.error.message,
              "error: a value is required for '--id <ID>' but none was supplied");
}

TEST(CliTest, Parse_Read_UnexpectedArgument) {
    Args args{"bridge", "read", "--agent", "codex", "--bogus"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.stderr_message.rfind("error: unexpected argument '--bogus' found\n", 0),
              0u);
}

// ==============================================================================
// compare / report
// ==============================================================================

TEST(CliTest, Parse_Compare_RepeatedSources) {
    Args args{"bridge", "compare", "--source", "codex", "--source", "claude:abc", "--normalize"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto& cmd = command_as<CompareCommand>(result);
    EXPECT_EQ(cmd.sources, (std::vector<std::string>{"codex", "claude:abc"}));
    EXPECT_TRUE(cmd.normalize);
    EXPECT_FALSE(cmd.json);
}

TEST(CliTest, Parse_Compare_NoSource) {
    Args args{"bridge", "compare", "--json"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(result.diagnostic.json);
    EXPECT_EQ(result.diagnostic.error.message,
              "error: the following required arguments were not provided:");
}

TEST(CliTest, Parse_Report_Handoff) {
    Args args{"bridge", "report", "--handoff", "packet.json", "--cwd", "/w"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto& cmd = command_as<ReportCommand>(result);
    EXPECT_EQ(cmd.handoff, std::filesystem::path("packet.json"));
    ASSERT_TRUE(cmd.cwd.has_value());
    EXPECT_EQ(*cmd.cwd, "/w");
}

TEST(CliTest, Parse_Report_MissingHandoff) {
    Args args{"bridge", "report"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("  --handoff <HANDOFF>"), std::string::npos);
}

// ==============================================================================
// list / search
// ==============================================================================

TEST(CliTest, Parse_List_Limit) {
    Args args{"bridge", "list", "--agent", "cursor", "--limit=25"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto& cmd = command_as<ListCommand>(result);
    EXPECT_EQ(cmd.agent, agents::Agent::Cursor);
    ASSERT_TRUE(cmd.limit.has_value());
    EXPECT_EQ(*cmd.limit, 25u);
}

TEST(CliTest, Parse_List_InvalidLimit) {
    Args args{"bridge", "list", "--agent", "codex", "--limit", "ten"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.error.message,
              "error: invalid value 'ten' for '--limit <LIMIT>': invalid digit found in string");
}

TEST(CliTest, Parse_List_NegativeLimitRejected) {
    Args args{"bridge", "list", "--agent", "codex", "--limit", "-1"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
}

TEST(CliTest, Parse_Search_QueryPositional) {
    Args args{"bridge", "search", "auth flow", "--agent", "claude", "--limit", "5"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto& cmd = command_as<SearchCommand>(result);
    EXPECT_EQ(cmd.query, "auth flow");
    EXPECT_EQ(cmd.agent, agents::Agent::Claude);
    ASSERT_TRUE(cmd.limit.has_value());
    EXPECT_EQ(*cmd.limit, 5u);
}

TEST(CliTest, Parse_Search_MissingQuery) {
    Args args{"bridge", "search", "--agent", "claude"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.diagnostic.stderr_message.find("  <QUERY>\n"), std::string::npos);
}

TEST(CliTest, Parse_Search_SecondPositional_Unexpected) {
    Args args{"bridge", "search", "one", "two", "--agent", "claude"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.stderr_message.rfind("error: unexpected argument 'two' found", 0),
              0u);
}

// ==============================================================================
// redact
// ==============================================================================

TEST(CliTest, Parse_Redact_FileArgument) {
    Args args{"bridge", "redact", "notes.txt"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto& cmd = command_as<RedactCommand>(result);
    ASSERT_TRUE(cmd.file.has_value());
    EXPECT_EQ(*cmd.file, std::filesystem::path("notes.txt"));
}

TEST(CliTest, Parse_Redact_DashMeansStdin) {
    Args args{"bridge", "redact", "-"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_FALSE(command_as<RedactCommand>(result).file.has_value());
}

}  // namespace bridge::cli::test
