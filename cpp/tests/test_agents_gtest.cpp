// ==============================================================================
// test_agents_gtest.cpp - Тесты разрешения сессий провайдеров (GoogleTest)
// ==============================================================================
//
// agents::resolve_session для codex, claude, gemini, cursor:
// лестница выбора файла (id -> cwd -> запасной вариант), разбор форматов,
// ошибки NotFound / ParseFailed / EmptySession / IoError
//
// ==============================================================================

#include "bridge/agents.hpp"
#include "bridge/paths.hpp"
#include "bridge/platform.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <variant>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace bridge::agents::test {

// ==============================================================================
// Test Fixture: временные базовые директории всех провайдеров
// ==============================================================================

class AgentsTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;
    config::AgentDirs dirs_;
    std::string project_;
    std::string other_project_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("bridge_agents_") + test_info->test_case_name() +
                                  "_" + test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );

        test_dir_ = std::filesystem::temp_directory_path() / unique_name;

        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);

        dirs_.codex = test_dir_ / "codex" / "sessions";
        dirs_.claude = test_dir_ / "claude" / "projects";
        dirs_.gemini = test_dir_ / "gemini" / "tmp";
        dirs_.cursor = test_dir_ / "cursor";

        std::filesystem::create_directories(test_dir_ / "work" / "app");
        std::filesystem::create_directories(test_dir_ / "work" / "other");
        project_ = io::normalize_path_string(platform::path_to_utf8(test_dir_ / "work" / "app"));
        other_project_ =
            io::normalize_path_string(platform::path_to_utf8(test_dir_ / "work" / "other"));
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    // Файл с mtime = сейчас - age
    std::filesystem::path write_file(const std::filesystem::path& path, const std::string& content,
                                     std::chrono::minutes age = std::chrono::minutes(1)) {
        std::filesystem::create_directories(path.parent_path());
        {
            std::ofstream file(path, std::ios::binary);
            file << content;
        }
        std::filesystem::last_write_time(path,
                                         std::filesystem::file_time_type::clock::now() - age);
        return path;
    }

    ResolveRequest request(const std::string& cwd) const {
        ResolveRequest req;
        req.cwd = cwd;
        return req;
    }

    static const Session& session_of(const ResolveResult& result) {
        return std::get<Session>(result);
    }

    static const BridgeError& error_of(const ResolveResult& result) {
        return std::get<BridgeError>(result);
    }

    // ------------------------------------------------------------------------
    // Записи провайдеров
    // ------------------------------------------------------------------------

    static std::string codex_meta(const std::string& id, const std::string& cwd) {
        return "{\"type\":\"session_meta\",\"payload\":{\"id\":\"" + id + "\",\"cwd\":\"" + cwd +
               "\"}}\n";
    }

    static std::string codex_message(const std::string& role, const std::string& text) {
        return "{\"type\":\"response_item\",\"payload\":{\"type\":\"message\",\"role\":\"" + role +
               "\",\"content\":[{\"type\":\"output_text\",\"text\":\"" + text + "\"}]}}\n";
    }

    static std::string claude_record(const std::string& role, const std::string& text,
                                     const std::string& cwd) {
        return "{\"type\":\"" + role + "\",\"sessionId\":\"claude-1\",\"cwd\":\"" + cwd +
               "\",\"message\":{\"role\":\"" + role + "\",\"content\":[{\"type\":\"text\",\"text\":\"" +
               text + "\"}]}}\n";
    }
};

// ==============================================================================
// Codex
// ==============================================================================

TEST_F(AgentsTest, Codex_MatchingCwdPreferredOverNewerFile) {
    // Arrange
    write_file(dirs_.codex / "2026" / "01" / "a.jsonl",
               codex_meta("sess-a", project_) + codex_message("assistant", "from app"),
               std::chrono::minutes(30));
    write_file(dirs_.codex / "2026" / "02" / "b.jsonl",
               codex_meta("sess-b", other_project_) + codex_message("assistant", "from other"),
               std::chrono::minutes(1));

    // Act
    auto result = resolve_session(Agent::Codex, request(project_ + "/"), dirs_);

    // Assert
    ASSERT_TRUE(std::holds_alternative<Session>(result));
    const Session& session = session_of(result);
    EXPECT_EQ(session.content, "from app");
    EXPECT_EQ(session.session_id, "sess-a");
    ASSERT_TRUE(session.cwd.has_value());
    EXPECT_EQ(*session.cwd, project_);
    EXPECT_TRUE(session.warnings.empty());
}

TEST_F(AgentsTest, Codex_NoCwdMatch_FallsBackToLatestWithWarning) {
    write_file(dirs_.codex / "old.jsonl",
               codex_meta("old", other_project_) + codex_message("assistant", "old"),
               std::chrono::minutes(30));
    write_file(dirs_.codex / "new.jsonl",
               codex_meta("new", other_project_) + codex_message("assistant", "new"),
               std::chrono::minutes(1));

    auto result = resolve_session(Agent::Codex, request(project_), dirs_);

    ASSERT_TRUE(std::holds_alternative<Session>(result));
    const Session& session = session_of(result);
    EXPECT_EQ(session.content, "new");
    ASSERT_EQ(session.warnings.size(), 1u);
    EXPECT_EQ(session.warnings[0], "Warning: no Codex session matched cwd " + project_ +
                                       "; falling back to latest session.");
}

TEST_F(AgentsTest, Codex_ExplicitIdMatchesPath) {
    // Arrange
    write_file(dirs_.codex / "rollout-target-123.jsonl",
               codex_meta("target-123", other_project_) + codex_message("assistant", "target"),
               std::chrono::minutes(30));
    write_file(dirs_.codex / "rollout-newer.jsonl",
               codex_meta("newer", project_) + codex_message("assistant", "newer"));
    ResolveRequest req = request(project_);
    req.session_id = "target-123";

    // Act
    auto result = resolve_session(Agent::Codex, req, dirs_);

    // Assert
    ASSERT_TRUE(std::holds_alternative<Session>(result));
    EXPECT_EQ(session_of(result).content, "target");
    EXPECT_TRUE(session_of(result).warnings.empty());
}

TEST_F(AgentsTest, Codex_UnknownId_NotFound) {
    write_file(dirs_.codex / "a.jsonl", codex_meta("a", project_));
    ResolveRequest req = request(project_);
    req.session_id = "missing-id";

    auto result = resolve_session(Agent::Codex, req, dirs_);

    ASSERT_TRUE(std::holds_alternative<BridgeError>(result));
    EXPECT_EQ(error_of(result).kind, ErrorKind::NotFound);
    EXPECT_EQ(error_of(result).message, "No Codex session found.");
}

TEST_F(AgentsTest, Codex_MissingBaseDirectory_NotFound) {
    auto result = resolve_session(Agent::Codex, request(project_), dirs_);

    ASSERT_TRUE(std::holds_alternative<BridgeError>(result));
    EXPECT_EQ(error_of(result).kind, ErrorKind::NotFound);
}

TEST_F(AgentsTest, Codex_AgentMessageEventsAndLastN) {
    // Arrange
    write_file(dirs_.codex / "s.jsonl",
               codex_meta("s", project_) + codex_message("user", "question") +
                   "{\"type\":\"event_msg\",\"payload\":{\"type\":\"agent_message\",\"message\":\"first\"}}\n" +
                   codex_message("assistant", "second"));
    ResolveRequest req = request(project_);
    req.last_n = 2;

    // Act
    auto result = resolve_session(Agent::Codex, req, dirs_);

    // Assert
    ASSERT_TRUE(std::holds_alternative<Session>(result));
    EXPECT_EQ(session_of(result).content, "first\n---\nsecond");
    EXPECT_EQ(session_of(result).message_count, 2u);
    EXPECT_EQ(session_of(result).messages_returned, 2u);
}

TEST_F(AgentsTest, Codex_MalformedLines_WarningAndRedactedContent) {
    auto file = write_file(dirs_.codex / "s.jsonl",
                           codex_meta("s", project_) + "not json\n" +
                               codex_message("assistant", "token=abc123secret"));

    auto result = resolve_session(Agent::Codex, request(project_), dirs_);

    ASSERT_TRUE(std::holds_alternative<Session>(result));
    const Session& session = session_of(result);
    EXPECT_EQ(session.content, "token=[REDACTED]");
    ASSERT_EQ(session.warnings.size(), 1u);
    EXPECT_EQ(session.warnings[0],
              "Warning: skipped 1 unparseable line(s) in " + platform::path_to_utf8(file));
}

TEST_F(AgentsTest, Codex_ExplicitDirectoryReplacesBase) {
    auto alt = test_dir_ / "alt_sessions";
    write_file(alt / "x.jsonl", codex_meta("x", project_) + codex_message("assistant", "alt"));
    ResolveRequest req = request(project_);
    req.explicit_dir = platform::path_to_utf8(alt);

    auto result = resolve_session(Agent::Codex, req, dirs_);

    ASSERT_TRUE(std::holds_alternative<Session>(result));
    EXPECT_EQ(session_of(result).content, "alt");
}

// ==============================================================================
// Claude
// ==============================================================================

TEST_F(AgentsTest, Claude_MissingProjectsDir_NotFoundWithPath) {
    auto result = resolve_session(Agent::Claude, request(project_), dirs_);

    ASSERT_TRUE(std::holds_alternative<BridgeError>(result));
    EXPECT_EQ(error_of(result).kind, ErrorKind::NotFound);
    EXPECT_EQ(error_of(result).message,
              "Claude projects directory not found: " + platform::path_to_utf8(dirs_.claude));
}

TEST_F(AgentsTest, Claude_WrappedMessagesAndCwdMatch) {
    // Arrange
    write_file(dirs_.claude / "-work-app" / "c1.jsonl",
               claude_record("user", "hi", project_) +
                   claude_record("assistant", "Hello from Claude", project_),
               std::chrono::minutes(20));
    write_file(dirs_.claude / "-work-other" / "c2.jsonl",
               claude_record("assistant", "other project", other_project_));

    // Act
    auto result = resolve_session(Agent::Claude, request(project_), dirs_);

    // Assert
    ASSERT_TRUE(std::holds_alternative<Session>(result));
    const Session& session = session_of(result);
    EXPECT_EQ(session.content, "Hello from Claude");
    EXPECT_EQ(session.session_id, "claude-1");
    EXPECT_TRUE(session.warnings.empty());
}

TEST_F(AgentsTest, Claude_ToolOnlyTurnsIgnored) {
    write_file(dirs_.claude / "p" / "c.jsonl",
               claude_record("assistant", "real answer", project_) +
                   "{\"type\":\"assistant\",\"cwd\":\"" + project_ +
                   "\",\"message\":{\"role\":\"assistant\",\"content\":[{\"type\":\"tool_use\",\"name\":\"bash\"}]}}\n");

    auto result = resolve_session(Agent::Claude, request(project_), dirs_);

    ASSERT_TRUE(std::holds_alternative<Session>(result));
    EXPECT_EQ(session_of(result).content, "real answer");
    EXPECT_EQ(session_of(result).message_count, 1u);
}

TEST_F(AgentsTest, Claude_TopLevelRoleAndStringContent) {
    write_file(dirs_.claude / "p" / "c.jsonl",
               "{\"role\":\"assistant\",\"content\":\"plain answer\",\"cwd\":\"" + project_ + "\"}\n");

    auto result = resolve_session(Agent::Claude, request(project_), dirs_);

    ASSERT_TRUE(std::holds_alternative<Session>(result));
    EXPECT_EQ(session_of(result).content, "plain answer");
}

TEST_F(AgentsTest, Claude_EmptyProjectsDir_NoSession) {
    std::filesystem::create_directories(dirs_.claude);

    auto result = resolve_session(Agent::Claude, request(project_), dirs_);

    ASSERT_TRUE(std::holds_alternative<BridgeError>(result));
    EXPECT_EQ(error_of(result).message, "No Claude session found.");
}

// ==============================================================================
// Gemini
// ==============================================================================

TEST_F(AgentsTest, Gemini_ScopedDirectoryByCwdHash) {
    // Arrange
    write_file(gemini::scoped_chats_dir(dirs_.gemini, project_) / "session-1.json",
               R"({"sessionId":"g-app","messages":[{"type":"user","content":"q"},{"type":"gemini","content":"app answer"}]})",
               std::chrono::minutes(30));
    write_file(gemini::scoped_chats_dir(dirs_.gemini, other_project_) / "session-2.json",
               R"({"sessionId":"g-other","messages":[{"type":"gemini","content":"other answer"}]})");

    // Act
    auto result = resolve_session(Agent::Gemini, request(project_), dirs_);

    // Assert
    ASSERT_TRUE(std::holds_alternative<Session>(result));
    const Session& session = session_of(result);
    EXPECT_EQ(session.content, "app answer");
    EXPECT_EQ(session.session_id, "g-app");
    EXPECT_TRUE(session.warnings.empty());
}

TEST_F(AgentsTest, Gemini_ScopedDirectoryLayout) {
    auto dir = gemini::scoped_chats_dir("/base", "/nonexistent_bridge_root/app");
    EXPECT_EQ(dir, std::filesystem::path("/base") /
                       io::sha256_hex("/nonexistent_bridge_root/app") / "chats");
}

TEST_F(AgentsTest, Gemini_NoScopedSession_FallbackWarning) {
    write_file(gemini::scoped_chats_dir(dirs_.gemini, other_project_) / "session-2.json",
               R"({"messages":[{"type":"model","content":"other answer"}]})");

    auto result = resolve_session(Agent::Gemini, request(project_), dirs_);

    ASSERT_TRUE(std::holds_alternative<Session>(result));
    const Session& session = session_of(result);
    EXPECT_EQ(session.content, "other answer");
    EXPECT_EQ(session.session_id, "session-2");
    ASSERT_EQ(session.warnings.size(), 1u);
    EXPECT_NE(session.warnings[0].find("no Gemini session matched cwd"), std::string::npos);
}

TEST_F(AgentsTest, Gemini_HistorySchema) {
    write_file(gemini::scoped_chats_dir(dirs_.gemini, project_) / "session-h.json",
               R"({"history":[{"role":"user","parts":[{"text":"q"}]},{"role":"model","parts":[{"text":"line 1"},{"text":"line 2"}]}]})");

    auto result = resolve_session(Agent::Gemini, request(project_), dirs_);

    ASSERT_TRUE(std::holds_alternative<Session>(result));
    EXPECT_EQ(session_of(result).content, "line 1\nline 2");
}

TEST_F(AgentsTest, Gemini_EmptyMessages_EmptySession) {
    write_file(gemini::scoped_chats_dir(dirs_.gemini, project_) / "session-e.json",
               R"({"messages":[]})");

    auto result = resolve_session(Agent::Gemini, request(project_), dirs_);

    ASSERT_TRUE(std::holds_alternative<BridgeError>(result));
    EXPECT_EQ(error_of(result).kind, ErrorKind::EmptySession);
    EXPECT_EQ(error_of(result).message, "Gemini session has no messages.");
}

TEST_F(AgentsTest, Gemini_UnknownSchema_ParseFailed) {
    write_file(gemini::scoped_chats_dir(dirs_.gemini, project_) / "session-u.json",
               R"({"turns":[]})");

    auto result = resolve_session(Agent::Gemini, request(project_), dirs_);

    ASSERT_TRUE(std::holds_alternative<BridgeError>(result));
    EXPECT_EQ(error_of(result).kind, ErrorKind::ParseFailed);
    EXPECT_EQ(error_of(result).message,
              "Unknown Gemini session schema. Supported fields: messages, history.");
}

TEST_F(AgentsTest, Gemini_ExplicitIdSearchesAllProjects) {
    write_file(gemini::scoped_chats_dir(dirs_.gemini, other_project_) / "session-abc123.json",
               R"({"messages":[{"type":"gemini","content":"found by id"}]})");
    write_file(gemini::scoped_chats_dir(dirs_.gemini, project_) / "session-newer.json",
               R"({"messages":[{"type":"gemini","content":"scoped"}]})");
    ResolveRequest req = request(project_);
    req.session_id = "abc123";

    auto result = resolve_session(Agent::Gemini, req, dirs_);

    ASSERT_TRUE(std::holds_alternative<Session>(result));
    EXPECT_EQ(session_of(result).content, "found by id");
    EXPECT_TRUE(session_of(result).warnings.empty());
}

TEST_F(AgentsTest, Gemini_SystemChatsDir_Refused) {
    ResolveRequest req = request(project_);
    req.explicit_dir = "/etc";

    auto result = resolve_session(Agent::Gemini, req, dirs_);

    ASSERT_TRUE(std::holds_alternative<BridgeError>(result));
    EXPECT_EQ(error_of(result).kind, ErrorKind::IoError);
    EXPECT_EQ(error_of(result).message, "Refusing to scan system directory: /etc");
}

TEST_F(AgentsTest, Gemini_ExplicitChatsDirEmpty_NotFoundListsDir) {
    auto chats = test_dir_ / "custom_chats";
    std::filesystem::create_directories(chats);
    ResolveRequest req = request(project_);
    req.explicit_dir = platform::path_to_utf8(chats);

    auto result = resolve_session(Agent::Gemini, req, dirs_);

    ASSERT_TRUE(std::holds_alternative<BridgeError>(result));
    EXPECT_EQ(error_of(result).kind, ErrorKind::NotFound);
    EXPECT_EQ(error_of(result).message,
              "No Gemini session found. Searched chats directories: " +
                  io::normalize_path_string(platform::path_to_utf8(chats)));
}

TEST_F(AgentsTest, Gemini_MissingTmpDir_NotFound) {
    auto result = resolve_session(Agent::Gemini, request(project_), dirs_);

    ASSERT_TRUE(std::holds_alternative<BridgeError>(result));
    EXPECT_EQ(error_of(result).message,
              "Gemini tmp directory not found: " + platform::path_to_utf8(dirs_.gemini));
}

// ==============================================================================
// Cursor
// ==============================================================================

TEST_F(AgentsTest, Cursor_IsCursorFile) {
    EXPECT_TRUE(cursor::is_cursor_file("/x/chatData.json"));
    EXPECT_TRUE(cursor::is_cursor_file("/x/composer-1.jsonl"));
    EXPECT_TRUE(cursor::is_cursor_file("/x/conversation.json"));
    EXPECT_FALSE(cursor::is_cursor_file("/x/state.json"));
    EXPECT_FALSE(cursor::is_cursor_file("/x/chat.txt"));
}

TEST_F(AgentsTest, Cursor_MissingDataDir_NotFound) {
    auto result = resolve_session(Agent::Cursor, request(project_), dirs_);

    ASSERT_TRUE(std::holds_alternative<BridgeError>(result));
    EXPECT_EQ(error_of(result).message,
              "Cursor data directory not found: " + platform::path_to_utf8(dirs_.cursor));
}

TEST_F(AgentsTest, Cursor_FileMentioningCwdPreferred) {
    // Arrange
    auto ws = cursor::workspaces_dir(dirs_.cursor);
    write_file(ws / "w1" / "chat.json",
               "{\"workspace\":\"" + project_ +
                   "\",\"messages\":[{\"role\":\"user\",\"content\":\"q\"},{\"role\":\"assistant\",\"content\":\"cursor answer\"}]}",
               std::chrono::minutes(30));
    write_file(ws / "w2" / "chat.json",
               R"({"messages":[{"role":"assistant","content":"unrelated"}]})");

    // Act
    auto result = resolve_session(Agent::Cursor, request(project_), dirs_);

    // Assert
    ASSERT_TRUE(std::holds_alternative<Session>(result));
    EXPECT_EQ(session_of(result).content, "cursor answer");
    EXPECT_TRUE(session_of(result).warnings.empty());
}

TEST_F(AgentsTest, Cursor_JsonlRecords) {
    write_file(cursor::workspaces_dir(dirs_.cursor) / "w" / "composer.jsonl",
               "{\"role\":\"user\",\"content\":\"q\"}\n{\"role\":\"assistant\",\"content\":\"jsonl answer\"}\n");

    auto result = resolve_session(Agent::Cursor, request(project_), dirs_);

    ASSERT_TRUE(std::holds_alternative<Session>(result));
    EXPECT_EQ(session_of(result).content, "jsonl answer");
    EXPECT_EQ(session_of(result).warnings.size(), 1u);
}

TEST_F(AgentsTest, Cursor_EmptyMessages_Placeholder) {
    write_file(cursor::workspaces_dir(dirs_.cursor) / "w" / "chat.json", R"({"messages":[]})");

    auto result = resolve_session(Agent::Cursor, request(project_), dirs_);

    ASSERT_TRUE(std::holds_alternative<Session>(result));
    EXPECT_EQ(session_of(result).content, "[No assistant messages found]");
}

TEST_F(AgentsTest, Cursor_UnknownShape_WholeDocument) {
    write_file(cursor::workspaces_dir(dirs_.cursor) / "w" / "conversation.json",
               R"({"tabs":[{"title":"refactor"}]})");

    auto result = resolve_session(Agent::Cursor, request(project_), dirs_);

    ASSERT_TRUE(std::holds_alternative<Session>(result));
    EXPECT_NE(session_of(result).content.find("refactor"), std::string::npos);
    EXPECT_NE(session_of(result).content.find("tabs"), std::string::npos);
}

}  // namespace bridge::agents::test
