/**
 * @file test_gateway_config.cpp
 * @brief Unit tests for GatewayConfig
 *
 * Tests gateway configuration including:
 * - Defaults
 * - Parsing of each section
 * - Rejection of malformed documents
 * - Loading from disk
 */

#include <gtest/gtest.h>
#include "ipcguard/gateway_config.hpp"
#include <filesystem>
#include <fstream>

using namespace ipcguard;
using json = nlohmann::json;
namespace fs = std::filesystem;

// Test fixture for gateway config tests
class GatewayConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "ipcguard_gateway_config_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    fs::path write_file(const std::string& name, const std::string& content) {
        fs::path path = test_dir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    fs::path test_dir_;
};

// ============================================================================
// Default Tests
// ============================================================================

TEST_F(GatewayConfigTest, Defaults) {
    GatewayConfig config;

    EXPECT_EQ(config.commands.size(), CommandWhitelist::default_profiles().size());
    EXPECT_TRUE(config.aliases.empty());
    EXPECT_TRUE(config.endpoint_rate_limits.empty());
    EXPECT_EQ(config.maintenance_interval, security::CLEANUP_INTERVAL);
    EXPECT_FALSE(config.escalate_violations_to_session);
    EXPECT_EQ(config.default_rate_limit.requests_per_minute, security::RATE_LIMIT_PER_MINUTE);
}

TEST_F(GatewayConfigTest, EmptyDocumentKeepsDefaults) {
    auto config = GatewayConfig::from_json(json::object());
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->commands.size(), CommandWhitelist::default_profiles().size());
    EXPECT_EQ(config->maintenance_interval, security::CLEANUP_INTERVAL);
}

TEST_F(GatewayConfigTest, ToJsonParsesBack) {
    GatewayConfig original;
    original.aliases["settings"] = "get_settings";
    original.escalate_violations_to_session = true;

    auto parsed = GatewayConfig::from_json(original.to_json());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->aliases, original.aliases);
    EXPECT_TRUE(parsed->escalate_violations_to_session);
    EXPECT_EQ(parsed->commands.size(), original.commands.size());
    EXPECT_EQ(parsed->permission_hierarchy, original.permission_hierarchy);
}

// ============================================================================
// Section Parsing Tests
// ============================================================================

TEST_F(GatewayConfigTest, RateLimitSections) {
    json j = {
        {"rate_limits", {
            {"default", {{"requests_per_minute", 50}}},
            {"endpoints", {
                {"save_settings", {{"requests_per_second", 2}}}
            }}
        }}
    };

    auto config = GatewayConfig::from_json(j);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->default_rate_limit.requests_per_minute, 50u);

    ASSERT_EQ(config->endpoint_rate_limits.count("save_settings"), 1u);
    const auto& endpoint = config->endpoint_rate_limits.at("save_settings");
    EXPECT_EQ(endpoint.requests_per_second, 2u);

    // Endpoint overrides start from the configured default
    EXPECT_EQ(endpoint.requests_per_minute, 50u);
}

TEST_F(GatewayConfigTest, SanitizerSessionsAndAudit) {
    json j = {
        {"sanitizer", {{"max_string_length", 500}, {"max_argument_bytes", 2048},
                       {"allowed_url_schemes", {"https"}}}},
        {"sessions", {{"require_ip_validation", true}}},
        {"audit", {{"persist", false}, {"alert_threshold", "ERROR"}}}
    };

    auto config = GatewayConfig::from_json(j);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->sanitizer.max_string_length, 500u);
    EXPECT_EQ(config->sanitizer.max_argument_bytes, 2048u);
    EXPECT_EQ(config->sanitizer.allowed_url_schemes, std::vector<std::string>{"https"});
    EXPECT_EQ(config->sanitizer.max_array_length, security::MAX_ARRAY_LENGTH);
    EXPECT_TRUE(config->sessions.require_ip_validation);
    EXPECT_FALSE(config->audit.persist);
    EXPECT_EQ(config->audit.alert_threshold, SecuritySeverity::ERROR);
}

TEST_F(GatewayConfigTest, CommandsReplaceDefaults) {
    json j = {
        {"commands", json::array({
            {{"name", "ping"}, {"classification", "PUBLIC"}, {"max_rate_per_minute", 10}},
            {{"name", "shutdown"}, {"classification", "BLOCKED"}, {"risk_score", 100}}
        })},
        {"aliases", {{"p", "ping"}}},
        {"permission_hierarchy", {{"admin", {"ops"}}}}
    };

    auto config = GatewayConfig::from_json(j);
    ASSERT_TRUE(config.has_value());
    ASSERT_EQ(config->commands.size(), 2u);
    EXPECT_EQ(config->commands[0].name, "ping");
    ASSERT_TRUE(config->commands[0].max_rate_per_minute.has_value());
    EXPECT_EQ(*config->commands[0].max_rate_per_minute, 10u);
    EXPECT_EQ(config->commands[1].classification, SecurityClassification::BLOCKED);
    EXPECT_EQ(config->aliases.at("p"), "ping");
    ASSERT_EQ(config->permission_hierarchy.size(), 1u);
    EXPECT_EQ(config->permission_hierarchy.at("admin"), PermissionSet{"ops"});
}

TEST_F(GatewayConfigTest, MaintenanceAndEscalation) {
    json j = {
        {"maintenance_interval_seconds", 5},
        {"escalate_violations_to_session", true}
    };

    auto config = GatewayConfig::from_json(j);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->maintenance_interval, std::chrono::seconds(5));
    EXPECT_TRUE(config->escalate_violations_to_session);
}

// ============================================================================
// Malformed Document Tests
// ============================================================================

TEST_F(GatewayConfigTest, RejectsNonObject) {
    EXPECT_FALSE(GatewayConfig::from_json(json::array()).has_value());
    EXPECT_FALSE(GatewayConfig::from_json(json("config")).has_value());
}

TEST_F(GatewayConfigTest, RejectsInvalidSections) {
    EXPECT_FALSE(GatewayConfig::from_json(
        json{{"rate_limits", {{"default", {{"requests_per_minute", 0}}}}}}).has_value());
    EXPECT_FALSE(GatewayConfig::from_json(
        json{{"rate_limits", {{"endpoints", {{"ping", {{"strategy", "RANDOM"}}}}}}}}).has_value());
    EXPECT_FALSE(GatewayConfig::from_json(
        json{{"sessions", {{"max_failed_attempts", 0}}}}).has_value());
    EXPECT_FALSE(GatewayConfig::from_json(
        json{{"audit", {{"buffer_size", 0}}}}).has_value());
    EXPECT_FALSE(GatewayConfig::from_json(
        json{{"commands", json::array({{{"name", "x"}, {"classification", "SECRET"}}})}}).has_value());
    EXPECT_FALSE(GatewayConfig::from_json(
        json{{"sanitizer", {{"max_string_length", "long"}}}}).has_value());
    EXPECT_FALSE(GatewayConfig::from_json(
        json{{"aliases", json::array({1, 2})}}).has_value());
}

TEST_F(GatewayConfigTest, RejectsNonPositiveInterval) {
    EXPECT_FALSE(GatewayConfig::from_json(json{{"maintenance_interval_seconds", 0}}).has_value());
    EXPECT_FALSE(GatewayConfig::from_json(json{{"maintenance_interval_seconds", -10}}).has_value());
}

// ============================================================================
// File Loading Tests
// ============================================================================

TEST_F(GatewayConfigTest, LoadFromFile) {
    fs::path path = write_file("gateway.json", R"({
        "aliases": {"settings": "get_settings"},
        "maintenance_interval_seconds": 30
    })");

    auto config = GatewayConfig::load_from_file(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->aliases.at("settings"), "get_settings");
    EXPECT_EQ(config->maintenance_interval, std::chrono::seconds(30));
}

TEST_F(GatewayConfigTest, LoadFromMissingFile) {
    EXPECT_FALSE(GatewayConfig::load_from_file(test_dir_ / "missing.json").has_value());
}

TEST_F(GatewayConfigTest, LoadFromInvalidJson) {
    fs::path path = write_file("broken.json", "{ \"aliases\": ");
    EXPECT_FALSE(GatewayConfig::load_from_file(path).has_value());
}
