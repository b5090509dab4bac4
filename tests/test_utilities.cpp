/**
 * @file test_utilities.cpp
 * @brief Unit tests for shared utility helpers
 *
 * Tests utilities including:
 * - Log level parsing and logger reconfiguration
 * - ISO 8601 formatting
 * - SHA-256 digests and UUID generation
 * - File reading
 * - Case folding and affix checks
 */

#include <gtest/gtest.h>
#include "ipcguard/utilities.hpp"
#include <filesystem>
#include <fstream>
#include <set>
#include <string>

using namespace ipcguard::utilities;
namespace fs = std::filesystem;

// Test fixture for utilities tests
class UtilitiesTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "ipcguard_utilities_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        initialize_logging("", LogLevel::INFO);
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    fs::path test_dir_;
};

// ============================================================================
// Logging Tests
// ============================================================================

TEST_F(UtilitiesTest, ParsesLogLevels) {
    auto debug = string_to_log_level("debug");
    ASSERT_TRUE(debug.has_value());
    EXPECT_TRUE(*debug == LogLevel::DEBUG);

    auto warning = string_to_log_level("Warning");
    ASSERT_TRUE(warning.has_value());
    EXPECT_TRUE(*warning == LogLevel::WARN);

    EXPECT_FALSE(string_to_log_level("verbose").has_value());
    EXPECT_FALSE(string_to_log_level("").has_value());
}

TEST_F(UtilitiesTest, LogsToRotatingFile) {
    fs::path log_file = test_dir_ / "ipcguard.log";
    initialize_logging(log_file.string(), LogLevel::DEBUG);

    log_debug("UtilitiesTest: debug line");
    log_error("UtilitiesTest: error line");

    // Replacing the logger drops the file sink and flushes it
    initialize_logging("", LogLevel::INFO);

    auto content = read_file(log_file.string());
    ASSERT_TRUE(content.has_value());
    EXPECT_NE(content->find("UtilitiesTest: debug line"), std::string::npos);
    EXPECT_NE(content->find("UtilitiesTest: error line"), std::string::npos);
}

// ============================================================================
// Time Tests
// ============================================================================

TEST_F(UtilitiesTest, FormatsTimestamp) {
    EXPECT_EQ(format_timestamp(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(format_timestamp(1762788645), "2025-11-10T15:30:45Z");
}

TEST_F(UtilitiesTest, CurrentTimeIsAfter2025) {
    EXPECT_GT(current_unix_time_ms(), 1735689600000ULL);
}

// ============================================================================
// Hashing and Identifier Tests
// ============================================================================

TEST_F(UtilitiesTest, Sha256KnownDigests) {
    EXPECT_EQ(sha256_hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(UtilitiesTest, UuidFormat) {
    std::string uuid = generate_uuid();
    ASSERT_EQ(uuid.size(), 36u);
    EXPECT_EQ(uuid[8], '-');
    EXPECT_EQ(uuid[13], '-');
    EXPECT_EQ(uuid[18], '-');
    EXPECT_EQ(uuid[23], '-');
    EXPECT_EQ(uuid[14], '4');
    EXPECT_NE(std::string("89ab").find(uuid[19]), std::string::npos);
}

TEST_F(UtilitiesTest, UuidsAreUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        seen.insert(generate_uuid());
    }
    EXPECT_EQ(seen.size(), 1000u);
}

// ============================================================================
// File Tests
// ============================================================================

TEST_F(UtilitiesTest, ReadFile) {
    fs::path path = test_dir_ / "data.txt";
    {
        std::ofstream out(path, std::ios::binary);
        out << "line one\nline two\n";
    }

    auto content = read_file(path.string());
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "line one\nline two\n");

    EXPECT_FALSE(read_file((test_dir_ / "missing.txt").string()).has_value());
}

// ============================================================================
// String Tests
// ============================================================================

TEST_F(UtilitiesTest, CaseFolding) {
    EXPECT_EQ(to_lowercase("JavaScript:"), "javascript:");
    EXPECT_EQ(to_uppercase("select"), "SELECT");
}

TEST_F(UtilitiesTest, AffixChecks) {
    EXPECT_TRUE(starts_with("https://example.com", "https://"));
    EXPECT_FALSE(starts_with("http", "https://"));
    EXPECT_TRUE(ends_with("report.exe", ".exe"));
    EXPECT_FALSE(ends_with("exe", ".exe"));
    EXPECT_TRUE(ends_with("anything", ""));
}
