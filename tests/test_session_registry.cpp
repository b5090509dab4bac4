/**
 * @file test_session_registry.cpp
 * @brief Unit tests for InMemorySessionRegistry
 *
 * Tests session management including:
 * - Session creation and default permissions
 * - Validation outcomes (valid, unknown, expired, suspended, MFA pending)
 * - IP binding
 * - Failed attempts and suspension
 * - MFA enable / verify
 * - Permission updates, termination and cleanup
 * - Configuration JSON and statistics
 */

#include <gtest/gtest.h>
#include "ipcguard/session_registry.hpp"
#include <thread>
#include <vector>
#include <set>

using namespace ipcguard;
using json = nlohmann::json;

// Test fixture for session registry tests
class SessionRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = std::make_unique<InMemorySessionRegistry>();
    }

    void TearDown() override {
        registry_.reset();
    }

    std::unique_ptr<InMemorySessionRegistry> registry_;
};

// ============================================================================
// Creation Tests
// ============================================================================

TEST_F(SessionRegistryTest, AnonymousSessionDefaults) {
    Session session = registry_->create_session("main");

    EXPECT_FALSE(session.session_id.empty());
    EXPECT_EQ(session.window_label, "main");
    EXPECT_FALSE(session.user_id.has_value());
    EXPECT_EQ(session.auth_state, AuthenticationState::ANONYMOUS);
    EXPECT_FALSE(session.is_authenticated());
    EXPECT_FALSE(session.mfa_verified);
    EXPECT_EQ(session.permissions, (PermissionSet{"basic.read", "ui.interact", "settings.read",
                                                  "project.read", "fs.read"}));
    EXPECT_GT(session.expires_at, session.created_at);
}

TEST_F(SessionRegistryTest, AuthenticatedSessionGetsExtraPermissions) {
    Session session = registry_->create_session("main", std::string("alice"));

    EXPECT_EQ(session.auth_state, AuthenticationState::AUTHENTICATED);
    EXPECT_TRUE(session.is_authenticated());
    EXPECT_EQ(session.permissions.count("settings.read"), 1u);
    EXPECT_EQ(session.permissions.count("settings.write"), 1u);
    EXPECT_EQ(session.permissions.count("user.authenticated"), 1u);
    EXPECT_EQ(session.permissions.count("admin"), 0u);
}

TEST_F(SessionRegistryTest, SessionIdsAreUnique) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        ids.insert(registry_->create_session("main").session_id);
    }
    EXPECT_EQ(ids.size(), 100u);
    EXPECT_EQ(registry_->get_session_count(), 100u);
}

TEST_F(SessionRegistryTest, InitialRiskDependsOnContext) {
    Session bare = registry_->create_session("main");
    Session known = registry_->create_session("main", std::nullopt, std::string("10.0.0.1"),
                                              std::string("agent"), SessionSecurityLevel::STRICT);
    Session restricted = registry_->create_session("main", std::nullopt, std::nullopt,
                                                   std::nullopt, SessionSecurityLevel::RESTRICTED);

    EXPECT_EQ(bare.risk_score, 45);
    EXPECT_EQ(known.risk_score, 5);
    EXPECT_EQ(restricted.risk_score, 75);
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST_F(SessionRegistryTest, ValidSessionValidates) {
    Session session = registry_->create_session("main");

    SessionValidation validation = registry_->validate_session(session.session_id);
    EXPECT_EQ(validation.status, SessionStatus::VALID);
    ASSERT_TRUE(validation.session.has_value());
    EXPECT_EQ(validation.session->session_id, session.session_id);
}

TEST_F(SessionRegistryTest, ValidationLowersRisk) {
    Session session = registry_->create_session("main");
    registry_->validate_session(session.session_id);

    auto stored = registry_->get_session(session.session_id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->risk_score, session.risk_score - 1);
}

TEST_F(SessionRegistryTest, UnknownSessionIsInvalid) {
    SessionValidation validation = registry_->validate_session("no-such-session");
    EXPECT_EQ(validation.status, SessionStatus::INVALID);
    EXPECT_FALSE(validation.session.has_value());
    EXPECT_FALSE(validation.reason.empty());
}

TEST_F(SessionRegistryTest, MalformedSessionIdIsInvalid) {
    EXPECT_EQ(registry_->validate_session("").status, SessionStatus::INVALID);
    EXPECT_EQ(registry_->validate_session("id with spaces").status, SessionStatus::INVALID);
    EXPECT_EQ(registry_->validate_session(std::string(100, 'a')).status, SessionStatus::INVALID);
}

TEST_F(SessionRegistryTest, ZeroLifetimeExpiresImmediately) {
    SessionConfig config;
    config.session_lifetime = std::chrono::seconds(0);
    registry_ = std::make_unique<InMemorySessionRegistry>(config);

    Session session = registry_->create_session("main");
    SessionValidation validation = registry_->validate_session(session.session_id);
    EXPECT_EQ(validation.status, SessionStatus::EXPIRED);

    auto stored = registry_->get_session(session.session_id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->auth_state, AuthenticationState::EXPIRED);
}

TEST_F(SessionRegistryTest, InactiveSessionExpires) {
    SessionConfig config;
    config.max_inactive = std::chrono::seconds(0);
    registry_ = std::make_unique<InMemorySessionRegistry>(config);

    Session session = registry_->create_session("main");
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    EXPECT_EQ(registry_->validate_session(session.session_id).status, SessionStatus::EXPIRED);
}

TEST_F(SessionRegistryTest, IpBindingRejectsMismatch) {
    SessionConfig config;
    config.require_ip_validation = true;
    registry_ = std::make_unique<InMemorySessionRegistry>(config);

    Session session = registry_->create_session("main", std::nullopt, std::string("10.0.0.1"));

    EXPECT_EQ(registry_->validate_session(session.session_id, std::string("10.0.0.1")).status,
              SessionStatus::VALID);

    SessionValidation mismatch = registry_->validate_session(session.session_id, std::string("10.0.0.2"));
    EXPECT_EQ(mismatch.status, SessionStatus::INVALID);
    ASSERT_TRUE(mismatch.session.has_value());
    EXPECT_GT(mismatch.session->risk_score, session.risk_score);
}

TEST_F(SessionRegistryTest, IpIgnoredWithoutBinding) {
    Session session = registry_->create_session("main", std::nullopt, std::string("10.0.0.1"));
    EXPECT_EQ(registry_->validate_session(session.session_id, std::string("10.9.9.9")).status,
              SessionStatus::VALID);
}

// ============================================================================
// Failed Attempt Tests
// ============================================================================

TEST_F(SessionRegistryTest, SuspendAfterMaxFailedAttempts) {
    Session session = registry_->create_session("main", std::string("alice"));

    for (uint32_t i = 0; i < security::SESSION_MAX_FAILED_ATTEMPTS - 1; ++i) {
        EXPECT_TRUE(registry_->record_failed_attempt(session.session_id));
    }
    EXPECT_EQ(registry_->validate_session(session.session_id).status, SessionStatus::VALID);

    EXPECT_TRUE(registry_->record_failed_attempt(session.session_id));
    EXPECT_EQ(registry_->validate_session(session.session_id).status, SessionStatus::SUSPENDED);
}

TEST_F(SessionRegistryTest, FailedAttemptRaisesRisk) {
    Session session = registry_->create_session("main");
    registry_->record_failed_attempt(session.session_id);

    auto stored = registry_->get_session(session.session_id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->failed_attempts, 1u);
    EXPECT_EQ(stored->risk_score, session.risk_score + 15);
}

TEST_F(SessionRegistryTest, FailedAttemptOnUnknownSession) {
    EXPECT_FALSE(registry_->record_failed_attempt("no-such-session"));
}

// ============================================================================
// MFA Tests
// ============================================================================

TEST_F(SessionRegistryTest, MfaPendingRequiresVerification) {
    Session session = registry_->create_session("main", std::string("alice"));

    ASSERT_TRUE(registry_->enable_mfa(session.session_id));
    EXPECT_EQ(registry_->validate_session(session.session_id).status, SessionStatus::REQUIRES_MFA);

    ASSERT_TRUE(registry_->verify_mfa(session.session_id));
    SessionValidation validation = registry_->validate_session(session.session_id);
    EXPECT_EQ(validation.status, SessionStatus::VALID);
    ASSERT_TRUE(validation.session.has_value());
    EXPECT_TRUE(validation.session->mfa_verified);
    EXPECT_EQ(validation.session->auth_state, AuthenticationState::MFA_AUTHENTICATED);
    EXPECT_TRUE(validation.session->is_authenticated());
}

TEST_F(SessionRegistryTest, VerifyMfaRefusedWhenSuspended) {
    Session session = registry_->create_session("main");
    for (uint32_t i = 0; i < security::SESSION_MAX_FAILED_ATTEMPTS; ++i) {
        registry_->record_failed_attempt(session.session_id);
    }

    EXPECT_FALSE(registry_->verify_mfa(session.session_id));
    EXPECT_FALSE(registry_->verify_mfa("no-such-session"));
    EXPECT_FALSE(registry_->enable_mfa("no-such-session"));
}

// ============================================================================
// Permission and Lifecycle Tests
// ============================================================================

TEST_F(SessionRegistryTest, UpdatePermissionsReplaces) {
    Session session = registry_->create_session("main");

    ASSERT_TRUE(registry_->update_permissions(session.session_id, {"admin"}));

    auto stored = registry_->get_session(session.session_id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->permissions, PermissionSet{"admin"});

    EXPECT_FALSE(registry_->update_permissions("no-such-session", {"admin"}));
}

TEST_F(SessionRegistryTest, TerminateSession) {
    Session session = registry_->create_session("main");

    EXPECT_TRUE(registry_->terminate_session(session.session_id));
    EXPECT_FALSE(registry_->terminate_session(session.session_id));
    EXPECT_EQ(registry_->validate_session(session.session_id).status, SessionStatus::INVALID);
}

TEST_F(SessionRegistryTest, CleanupRemovesExpiredSessions) {
    SessionConfig config;
    config.session_lifetime = std::chrono::seconds(0);
    registry_ = std::make_unique<InMemorySessionRegistry>(config);

    registry_->create_session("a");
    registry_->create_session("b");

    EXPECT_EQ(registry_->cleanup_expired(), 2u);
    EXPECT_EQ(registry_->get_session_count(), 0u);
}

TEST_F(SessionRegistryTest, CleanupKeepsLiveSessions) {
    registry_->create_session("a");
    EXPECT_EQ(registry_->cleanup_expired(), 0u);
    EXPECT_EQ(registry_->get_session_count(), 1u);
}

// ============================================================================
// Serialization and Statistics Tests
// ============================================================================

TEST_F(SessionRegistryTest, ConfigFromJson) {
    json j = {
        {"session_lifetime_seconds", 3600},
        {"require_ip_validation", true},
        {"anonymous_permissions", {"basic.read"}}
    };

    auto config = SessionConfig::from_json(j);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->session_lifetime, std::chrono::seconds(3600));
    EXPECT_TRUE(config->require_ip_validation);
    EXPECT_EQ(config->anonymous_permissions, PermissionSet{"basic.read"});
    EXPECT_EQ(config->max_failed_attempts, security::SESSION_MAX_FAILED_ATTEMPTS);
}

TEST_F(SessionRegistryTest, ConfigFromJsonRejectsInvalid) {
    EXPECT_FALSE(SessionConfig::from_json(json{{"max_failed_attempts", 0}}).has_value());
    EXPECT_FALSE(SessionConfig::from_json(json{{"session_lifetime_seconds", -5}}).has_value());
    EXPECT_FALSE(SessionConfig::from_json(json{{"require_ip_validation", "yes"}}).has_value());
    EXPECT_FALSE(SessionConfig::from_json(json("session")).has_value());
}

TEST_F(SessionRegistryTest, SessionToJson) {
    Session session = registry_->create_session("main", std::string("alice"));
    json j = session.to_json();

    EXPECT_EQ(j["session_id"], session.session_id);
    EXPECT_EQ(j["user_id"], "alice");
    EXPECT_EQ(j["window_label"], "main");
    EXPECT_EQ(j["auth_state"], "AUTHENTICATED");
    EXPECT_EQ(j["security_level"], "BASIC");
    EXPECT_FALSE(j["mfa_verified"].get<bool>());
}

TEST_F(SessionRegistryTest, Statistics) {
    registry_->create_session("a");
    registry_->create_session("b", std::string("alice"));

    json stats = registry_->get_statistics();
    EXPECT_EQ(stats["active_sessions"], 2);
    EXPECT_EQ(stats["authentication_states"]["ANONYMOUS"], 1);
    EXPECT_EQ(stats["authentication_states"]["AUTHENTICATED"], 1);
    EXPECT_EQ(stats["average_risk_score"], 45);
}

TEST_F(SessionRegistryTest, SecurityLevelStrings) {
    EXPECT_EQ(security_level_to_string(SessionSecurityLevel::STRICT), "STRICT");
    auto level = string_to_security_level("ENHANCED");
    ASSERT_TRUE(level.has_value());
    EXPECT_EQ(*level, SessionSecurityLevel::ENHANCED);
    EXPECT_FALSE(string_to_security_level("strict").has_value());
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

TEST_F(SessionRegistryTest, ConcurrentCreateAndValidate) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this]() {
            for (int i = 0; i < 50; ++i) {
                Session session = registry_->create_session("main");
                registry_->validate_session(session.session_id);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(registry_->get_session_count(), 400u);
}
