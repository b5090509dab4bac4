/**
 * @file session_registry.hpp
 * @brief Session and authentication state for IPC callers
 *
 * IPCGuard - IPC Command Authorization Pipeline
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * The gateway depends only on the SessionRegistry interface; any status
 * other than VALID stops a request.
 */

#pragma once

#include "ipcguard/security_types.hpp"
#include "ipcguard/security_config.hpp"

#include <string>
#include <chrono>
#include <shared_mutex>
#include <unordered_map>
#include <optional>

#include <nlohmann/json.hpp>

namespace ipcguard {

/**
 * @brief Result of validating a session
 */
enum class SessionStatus {
    VALID,
    INVALID,        ///< Unknown, revoked or IP mismatch
    REQUIRES_MFA,
    SUSPENDED,
    EXPIRED
};

/**
 * @brief Authentication state of a session
 */
enum class AuthenticationState {
    ANONYMOUS,
    AUTHENTICATED,
    MFA_PENDING,
    MFA_AUTHENTICATED,
    EXPIRED,
    REVOKED,
    SUSPENDED
};

/**
 * @brief Security level requested at session creation
 */
enum class SessionSecurityLevel {
    BASIC,
    ENHANCED,
    STRICT,
    RESTRICTED
};

std::string session_status_to_string(SessionStatus status);
std::string auth_state_to_string(AuthenticationState state);
std::string security_level_to_string(SessionSecurityLevel level);
std::optional<SessionSecurityLevel> string_to_security_level(const std::string& str);

/**
 * @brief Session registry configuration
 */
struct SessionConfig {
    std::chrono::seconds session_lifetime =
        std::chrono::duration_cast<std::chrono::seconds>(security::SESSION_LIFETIME);
    std::chrono::seconds max_inactive =
        std::chrono::duration_cast<std::chrono::seconds>(security::SESSION_MAX_INACTIVE);
    uint32_t max_failed_attempts = security::SESSION_MAX_FAILED_ATTEMPTS;
    bool require_ip_validation = false;
    PermissionSet anonymous_permissions = {
        "basic.read", "ui.interact", "settings.read", "project.read", "fs.read"
    };
    /// Granted in addition to anonymous_permissions when a user is known
    PermissionSet authenticated_permissions = {
        "user.authenticated", "settings.write", "project.create", "fs.write"
    };

    nlohmann::json to_json() const;
    static std::optional<SessionConfig> from_json(
        const nlohmann::json& j,
        const SessionConfig& base
    );
    static std::optional<SessionConfig> from_json(const nlohmann::json& j) {
        return from_json(j, SessionConfig());
    }
};

/**
 * @brief Security context of one session (snapshot)
 */
struct Session {
    using TimePoint = std::chrono::system_clock::time_point;

    std::string session_id;
    std::optional<std::string> user_id;
    std::string window_label;
    PermissionSet permissions;
    AuthenticationState auth_state = AuthenticationState::ANONYMOUS;
    SessionSecurityLevel security_level = SessionSecurityLevel::BASIC;
    std::optional<std::string> source_ip;
    std::optional<std::string> user_agent;
    TimePoint created_at;
    TimePoint last_activity;
    TimePoint expires_at;
    uint32_t failed_attempts = 0;
    bool mfa_verified = false;
    uint8_t risk_score = 0;

    bool is_authenticated() const {
        return auth_state == AuthenticationState::AUTHENTICATED ||
               auth_state == AuthenticationState::MFA_AUTHENTICATED;
    }

    nlohmann::json to_json() const;
};

/**
 * @brief Outcome of SessionRegistry::validate_session
 */
struct SessionValidation {
    SessionStatus status = SessionStatus::INVALID;
    std::optional<Session> session;   ///< Snapshot when the session exists
    std::string reason;
};

/**
 * @brief Session component consumed by the gateway
 */
class SessionRegistry {
public:
    virtual ~SessionRegistry() = default;

    /**
     * @brief Establish a session
     * @param window_label UI window that owns the session
     * @param user_id Authenticated user, if any
     * @param source_ip Caller address, if known
     * @param user_agent Caller user agent, if known
     * @param level Requested security level
     * @return New session snapshot
     */
    virtual Session create_session(
        const std::string& window_label,
        const std::optional<std::string>& user_id = std::nullopt,
        const std::optional<std::string>& source_ip = std::nullopt,
        const std::optional<std::string>& user_agent = std::nullopt,
        SessionSecurityLevel level = SessionSecurityLevel::BASIC
    ) = 0;

    /**
     * @brief Validate a session and refresh its activity on success
     * @param session_id Session identifier
     * @param source_ip Current caller address (checked when IP binding is enabled)
     */
    virtual SessionValidation validate_session(
        const std::string& session_id,
        const std::optional<std::string>& source_ip = std::nullopt
    ) = 0;

    virtual std::optional<Session> get_session(const std::string& session_id) const = 0;

    /**
     * @brief Record a failed attempt; suspends at max_failed_attempts
     * @return true if the session exists
     */
    virtual bool record_failed_attempt(const std::string& session_id) = 0;

    virtual bool enable_mfa(const std::string& session_id) = 0;
    virtual bool verify_mfa(const std::string& session_id) = 0;

    /**
     * @brief Replace a session's permissions wholesale
     * @return true if the session exists
     */
    virtual bool update_permissions(const std::string& session_id, const PermissionSet& permissions) = 0;

    virtual bool terminate_session(const std::string& session_id) = 0;

    /**
     * @brief Remove expired sessions
     * @return Number of sessions removed
     */
    virtual size_t cleanup_expired() = 0;

    virtual nlohmann::json get_statistics() const = 0;
};

/**
 * @brief InMemorySessionRegistry - default SessionRegistry
 *
 * Thread-safe, sessions held in memory only.
 */
class InMemorySessionRegistry : public SessionRegistry {
public:
    explicit InMemorySessionRegistry(SessionConfig config = SessionConfig());

    ~InMemorySessionRegistry() override = default;

    InMemorySessionRegistry(const InMemorySessionRegistry&) = delete;
    InMemorySessionRegistry& operator=(const InMemorySessionRegistry&) = delete;
    InMemorySessionRegistry(InMemorySessionRegistry&&) = delete;
    InMemorySessionRegistry& operator=(InMemorySessionRegistry&&) = delete;

    Session create_session(
        const std::string& window_label,
        const std::optional<std::string>& user_id = std::nullopt,
        const std::optional<std::string>& source_ip = std::nullopt,
        const std::optional<std::string>& user_agent = std::nullopt,
        SessionSecurityLevel level = SessionSecurityLevel::BASIC
    ) override;

    SessionValidation validate_session(
        const std::string& session_id,
        const std::optional<std::string>& source_ip = std::nullopt
    ) override;

    std::optional<Session> get_session(const std::string& session_id) const override;
    bool record_failed_attempt(const std::string& session_id) override;
    bool enable_mfa(const std::string& session_id) override;
    bool verify_mfa(const std::string& session_id) override;
    bool update_permissions(const std::string& session_id, const PermissionSet& permissions) override;
    bool terminate_session(const std::string& session_id) override;
    size_t cleanup_expired() override;

    /**
     * @brief Statistics
     * @return JSON with active_sessions, authentication_states, average_risk_score
     */
    nlohmann::json get_statistics() const override;

    size_t get_session_count() const;

    const SessionConfig& get_config() const { return config_; }

private:
    SessionConfig config_;
    std::unordered_map<std::string, Session> sessions_;
    mutable std::shared_mutex mutex_;

    static uint8_t initial_risk_score(
        SessionSecurityLevel level,
        const std::optional<std::string>& source_ip,
        const std::optional<std::string>& user_agent
    );

    bool is_expired(const Session& session, Session::TimePoint now) const;
};

} // namespace ipcguard
