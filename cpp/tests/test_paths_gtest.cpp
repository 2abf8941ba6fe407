// ==============================================================================
// test_paths_gtest.cpp - Тесты нормализации путей (GoogleTest)
// ==============================================================================
//
// io::paths: expand_home, normalize_path, hash_path, is_system_directory
//
// ==============================================================================

#include "bridge/paths.hpp"
#include "bridge/platform.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace bridge::io::test {

// ==============================================================================
// Test Fixture
// ==============================================================================

class PathsTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("bridge_paths_") + test_info->test_case_name() +
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
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }
};

// ==============================================================================
// expand_home
// ==============================================================================

TEST_F(PathsTest, ExpandHome_BareTilde_ReturnsHome) {
    EXPECT_EQ(expand_home("~"), platform::home_dir());
}

TEST_F(PathsTest, ExpandHome_TildeSlash_JoinsHome) {
    EXPECT_EQ(expand_home("~/projects/app"), platform::home_dir() / "projects/app");
}

TEST_F(PathsTest, ExpandHome_TildeUser_NotExpanded) {
    EXPECT_EQ(expand_home("~other/x"), std::filesystem::path("~other/x"));
}

TEST_F(PathsTest, ExpandHome_AbsolutePath_Unchanged) {
    EXPECT_EQ(expand_home("/opt/work"), std::filesystem::path("/opt/work"));
}

// ==============================================================================
// normalize_path
// ==============================================================================

TEST_F(PathsTest, NormalizePath_ExistingDirWithDotDot_ReturnsCanonical) {
    // Arrange
    std::filesystem::create_directories(test_dir_ / "a" / "b");
    std::string spelled = platform::path_to_utf8(test_dir_ / "a" / ".." / "a" / "b");

    // Act
    auto normalized = normalize_path(spelled);

    // Assert
    EXPECT_EQ(normalized, std::filesystem::canonical(test_dir_ / "a" / "b"));
}

TEST_F(PathsTest, NormalizePath_ExistingDirTrailingSlash_SameAsWithout) {
    std::filesystem::create_directories(test_dir_ / "project");
    std::string plain = platform::path_to_utf8(test_dir_ / "project");

    EXPECT_EQ(normalize_path_string(plain + "/"), normalize_path_string(plain));
}

TEST_F(PathsTest, NormalizePath_MissingPath_LexicalWithoutTrailingSeparator) {
    // Arrange
    std::string missing = platform::path_to_utf8(test_dir_ / "missing" / "sub") + "/";

    // Act
    auto normalized = normalize_path(missing);

    // Assert
    EXPECT_EQ(normalized, (test_dir_ / "missing" / "sub").lexically_normal());
}

TEST_F(PathsTest, NormalizePath_MissingPathWithDotDot_Collapsed) {
    EXPECT_EQ(normalize_path_string("/nonexistent_bridge_root/a/../b"),
              "/nonexistent_bridge_root/b");
}

TEST_F(PathsTest, NormalizePath_RelativePath_ResolvedAgainstProcessCwd) {
    // Arrange
    const auto previous = std::filesystem::current_path();
    std::filesystem::current_path(test_dir_);
    const auto base = std::filesystem::current_path();

    // Act
    auto normalized = normalize_path("not_created_yet");

    // Assert
    std::filesystem::current_path(previous);
    EXPECT_EQ(normalized, (base / "not_created_yet").lexically_normal());
}

// ==============================================================================
// hash_path / sha256_hex
// ==============================================================================

TEST_F(PathsTest, Sha256Hex_KnownVectors) {
    EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(PathsTest, HashPath_EqualsSha256OfNormalizedString) {
    std::string dir = platform::path_to_utf8(test_dir_);
    EXPECT_EQ(hash_path(dir), sha256_hex(normalize_path_string(dir)));
}

TEST_F(PathsTest, HashPath_DifferentSpellingsOfSameDir_SameHash) {
    std::filesystem::create_directories(test_dir_ / "repo");
    std::string dir = platform::path_to_utf8(test_dir_ / "repo");

    EXPECT_EQ(hash_path(dir), hash_path(dir + "/"));
    EXPECT_EQ(hash_path(dir), hash_path(dir + "/./"));
    EXPECT_EQ(hash_path(dir), hash_path(platform::path_to_utf8(test_dir_ / "repo" / ".." / "repo")));
}

TEST_F(PathsTest, HashPath_IsLowercaseHex64) {
    std::string hash = hash_path("/some/project");
    ASSERT_EQ(hash.size(), 64u);
    for (char c : hash) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << c;
    }
}

TEST_F(PathsTest, HashPath_DifferentDirs_DifferentHash) {
    EXPECT_NE(hash_path("/work/alpha"), hash_path("/work/beta"));
}

// ==============================================================================
// is_system_directory
// ==============================================================================

TEST_F(PathsTest, IsSystemDirectory_SystemRoots_True) {
    EXPECT_TRUE(is_system_directory("/etc"));
    EXPECT_TRUE(is_system_directory("/usr"));
    EXPECT_TRUE(is_system_directory("/usr/local/share"));
    EXPECT_TRUE(is_system_directory("/System/Library"));
}

TEST_F(PathsTest, IsSystemDirectory_PrefixWithoutSeparator_False) {
    EXPECT_FALSE(is_system_directory("/etcetera"));
    EXPECT_FALSE(is_system_directory("/usrdata/chats"));
}

TEST_F(PathsTest, IsSystemDirectory_UserDirectory_False) {
    EXPECT_FALSE(is_system_directory("/home/dev/.gemini/tmp/abc/chats"));
}

}  // namespace bridge::io::test
