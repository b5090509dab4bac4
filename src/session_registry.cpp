/**
 * @file session_registry.cpp
 * @brief Implementation of the in-memory session registry
 *
 * IPCGuard - IPC Command Authorization Pipeline
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "ipcguard/session_registry.hpp"
#include "ipcguard/utilities.hpp"

#include <algorithm>
#include <mutex>

using json = nlohmann::json;

namespace ipcguard {

namespace {
    constexpr uint8_t MAX_RISK = 100;
    constexpr uint8_t FAILED_ATTEMPT_RISK = 15;
    constexpr uint8_t IP_MISMATCH_RISK = 20;
    constexpr uint8_t MFA_RISK_REDUCTION = 20;

    uint8_t add_risk(uint8_t risk, uint8_t amount) {
        return static_cast<uint8_t>(std::min<int>(MAX_RISK, risk + amount));
    }

    uint64_t to_unix(Session::TimePoint tp) {
        return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    }
}

// ============================================================================
// String Conversion
// ============================================================================

std::string session_status_to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::VALID: return "VALID";
        case SessionStatus::INVALID: return "INVALID";
        case SessionStatus::REQUIRES_MFA: return "REQUIRES_MFA";
        case SessionStatus::SUSPENDED: return "SUSPENDED";
        case SessionStatus::EXPIRED: return "EXPIRED";
        default: return "UNKNOWN";
    }
}

std::string auth_state_to_string(AuthenticationState state) {
    switch (state) {
        case AuthenticationState::ANONYMOUS: return "ANONYMOUS";
        case AuthenticationState::AUTHENTICATED: return "AUTHENTICATED";
        case AuthenticationState::MFA_PENDING: return "MFA_PENDING";
        case AuthenticationState::MFA_AUTHENTICATED: return "MFA_AUTHENTICATED";
        case AuthenticationState::EXPIRED: return "EXPIRED";
        case AuthenticationState::REVOKED: return "REVOKED";
        case AuthenticationState::SUSPENDED: return "SUSPENDED";
        default: return "UNKNOWN";
    }
}

std::string security_level_to_string(SessionSecurityLevel level) {
    switch (level) {
        case SessionSecurityLevel::BASIC: return "BASIC";
        case SessionSecurityLevel::ENHANCED: return "ENHANCED";
        case SessionSecurityLevel::STRICT: return "STRICT";
        case SessionSecurityLevel::RESTRICTED: return "RESTRICTED";
        default: return "UNKNOWN";
    }
}

std::optional<SessionSecurityLevel> string_to_security_level(const std::string& str) {
    if (str == "BASIC") return SessionSecurityLevel::BASIC;
    if (str == "ENHANCED") return SessionSecurityLevel::ENHANCED;
    if (str == "STRICT") return SessionSecurityLevel::STRICT;
    if (str == "RESTRICTED") return SessionSecurityLevel::RESTRICTED;
    return std::nullopt;
}

// ============================================================================
// Serialization
// ============================================================================

json SessionConfig::to_json() const {
    json j;
    j["session_lifetime_seconds"] = session_lifetime.count();
    j["max_inactive_seconds"] = max_inactive.count();
    j["max_failed_attempts"] = max_failed_attempts;
    j["require_ip_validation"] = require_ip_validation;
    j["anonymous_permissions"] = anonymous_permissions;
    j["authenticated_permissions"] = authenticated_permissions;
    return j;
}

std::optional<SessionConfig> SessionConfig::from_json(const json& j, const SessionConfig& base) {
    try {
        if (!j.is_object()) {
            return std::nullopt;
        }

        SessionConfig config = base;
        config.session_lifetime = std::chrono::seconds(
            j.value("session_lifetime_seconds", static_cast<int64_t>(base.session_lifetime.count())));
        config.max_inactive = std::chrono::seconds(
            j.value("max_inactive_seconds", static_cast<int64_t>(base.max_inactive.count())));
        config.max_failed_attempts = j.value("max_failed_attempts", base.max_failed_attempts);
        config.require_ip_validation = j.value("require_ip_validation", base.require_ip_validation);
        config.anonymous_permissions = j.value("anonymous_permissions", base.anonymous_permissions);
        config.authenticated_permissions = j.value("authenticated_permissions", base.authenticated_permissions);

        if (config.session_lifetime.count() < 0 || config.max_inactive.count() < 0 ||
            config.max_failed_attempts == 0) {
            return std::nullopt;
        }

        return config;

    } catch (const json::exception&) {
        return std::nullopt;
    }
}

json Session::to_json() const {
    json j;
    j["session_id"] = session_id;
    j["user_id"] = user_id ? json(*user_id) : json(nullptr);
    j["window_label"] = window_label;
    j["permissions"] = permissions;
    j["auth_state"] = auth_state_to_string(auth_state);
    j["security_level"] = security_level_to_string(security_level);
    j["created_at"] = utilities::format_timestamp(to_unix(created_at));
    j["last_activity"] = utilities::format_timestamp(to_unix(last_activity));
    j["expires_at"] = utilities::format_timestamp(to_unix(expires_at));
    j["failed_attempts"] = failed_attempts;
    j["mfa_verified"] = mfa_verified;
    j["risk_score"] = risk_score;
    return j;
}

// ============================================================================
// Constructor
// ============================================================================

InMemorySessionRegistry::InMemorySessionRegistry(SessionConfig config)
    : config_(std::move(config))
{
}

// ============================================================================
// Session Lifecycle
// ============================================================================

Session InMemorySessionRegistry::create_session(
    const std::string& window_label,
    const std::optional<std::string>& user_id,
    const std::optional<std::string>& source_ip,
    const std::optional<std::string>& user_agent,
    SessionSecurityLevel level
) {
    auto now = std::chrono::system_clock::now();

    Session session;
    session.session_id = utilities::generate_uuid();
    session.user_id = user_id;
    session.window_label = window_label;
    session.permissions = config_.anonymous_permissions;
    session.auth_state = AuthenticationState::ANONYMOUS;
    if (user_id) {
        session.permissions.insert(config_.authenticated_permissions.begin(),
                                   config_.authenticated_permissions.end());
        session.auth_state = AuthenticationState::AUTHENTICATED;
    }
    session.security_level = level;
    session.source_ip = source_ip;
    session.user_agent = user_agent;
    session.created_at = now;
    session.last_activity = now;
    session.expires_at = now + config_.session_lifetime;
    session.risk_score = initial_risk_score(level, source_ip, user_agent);

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        sessions_[session.session_id] = session;
    }

    utilities::log_info("SessionRegistry: created session " + session.session_id +
                        " for window '" + window_label + "' (" +
                        auth_state_to_string(session.auth_state) + ")");
    return session;
}

SessionValidation InMemorySessionRegistry::validate_session(
    const std::string& session_id,
    const std::optional<std::string>& source_ip
) {
    SessionValidation validation;

    if (!security::validate_identifier(session_id)) {
        validation.status = SessionStatus::INVALID;
        validation.reason = "Malformed session id";
        return validation;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        validation.status = SessionStatus::INVALID;
        validation.reason = "Session not found";
        return validation;
    }

    Session& session = it->second;
    auto now = std::chrono::system_clock::now();

    switch (session.auth_state) {
        case AuthenticationState::REVOKED:
            validation.status = SessionStatus::INVALID;
            validation.reason = "Session revoked";
            validation.session = session;
            return validation;
        case AuthenticationState::SUSPENDED:
            validation.status = SessionStatus::SUSPENDED;
            validation.reason = "Session suspended";
            validation.session = session;
            return validation;
        default:
            break;
    }

    if (is_expired(session, now)) {
        session.auth_state = AuthenticationState::EXPIRED;
        validation.status = SessionStatus::EXPIRED;
        validation.reason = "Session expired";
        validation.session = session;
        return validation;
    }

    if (config_.require_ip_validation && session.source_ip && source_ip &&
        *session.source_ip != *source_ip) {
        session.risk_score = add_risk(session.risk_score, IP_MISMATCH_RISK);
        utilities::log_warn("SessionRegistry: IP mismatch for session " + session_id);
        validation.status = SessionStatus::INVALID;
        validation.reason = "IP address validation failed";
        validation.session = session;
        return validation;
    }

    if (session.auth_state == AuthenticationState::MFA_PENDING) {
        validation.status = SessionStatus::REQUIRES_MFA;
        validation.reason = "MFA verification pending";
        validation.session = session;
        return validation;
    }

    session.last_activity = now;

    // Good behaviour slowly reduces risk
    if (session.risk_score > 0) {
        session.risk_score--;
    }

    validation.status = SessionStatus::VALID;
    validation.session = session;
    return validation;
}

std::optional<Session> InMemorySessionRegistry::get_session(const std::string& session_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemorySessionRegistry::record_failed_attempt(const std::string& session_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return false;
    }

    Session& session = it->second;
    session.failed_attempts++;
    session.risk_score = add_risk(session.risk_score, FAILED_ATTEMPT_RISK);

    if (session.failed_attempts >= config_.max_failed_attempts &&
        session.auth_state != AuthenticationState::SUSPENDED) {
        session.auth_state = AuthenticationState::SUSPENDED;
        utilities::log_warn("SessionRegistry: session " + session_id + " suspended after " +
                            std::to_string(session.failed_attempts) + " failed attempts");
    }

    return true;
}

bool InMemorySessionRegistry::enable_mfa(const std::string& session_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return false;
    }

    it->second.auth_state = AuthenticationState::MFA_PENDING;
    it->second.mfa_verified = false;
    return true;
}

bool InMemorySessionRegistry::verify_mfa(const std::string& session_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return false;
    }

    Session& session = it->second;
    if (session.auth_state == AuthenticationState::SUSPENDED ||
        session.auth_state == AuthenticationState::REVOKED ||
        session.auth_state == AuthenticationState::EXPIRED) {
        return false;
    }

    session.mfa_verified = true;
    session.auth_state = AuthenticationState::MFA_AUTHENTICATED;
    session.risk_score = session.risk_score > MFA_RISK_REDUCTION
        ? static_cast<uint8_t>(session.risk_score - MFA_RISK_REDUCTION) : 0;
    return true;
}

bool InMemorySessionRegistry::update_permissions(
    const std::string& session_id,
    const PermissionSet& permissions
) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return false;
    }

    it->second.permissions = permissions;
    return true;
}

bool InMemorySessionRegistry::terminate_session(const std::string& session_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (sessions_.erase(session_id) == 0) {
        return false;
    }

    utilities::log_info("SessionRegistry: terminated session " + session_id);
    return true;
}

size_t InMemorySessionRegistry::cleanup_expired() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    size_t removed = 0;

    for (auto it = sessions_.begin(); it != sessions_.end(); ) {
        const Session& session = it->second;
        bool dead = session.auth_state == AuthenticationState::EXPIRED ||
                    session.auth_state == AuthenticationState::REVOKED ||
                    is_expired(session, now);
        if (dead) {
            it = sessions_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    return removed;
}

// ============================================================================
// Statistics
// ============================================================================

json InMemorySessionRegistry::get_statistics() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    json states = json::object();
    uint64_t risk_total = 0;
    for (const auto& entry : sessions_) {
        std::string key = auth_state_to_string(entry.second.auth_state);
        states[key] = states.value(key, 0) + 1;
        risk_total += entry.second.risk_score;
    }

    json stats;
    stats["active_sessions"] = sessions_.size();
    stats["authentication_states"] = states;
    stats["average_risk_score"] = sessions_.empty() ? 0 : risk_total / sessions_.size();
    return stats;
}

size_t InMemorySessionRegistry::get_session_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sessions_.size();
}

// ============================================================================
// Private Helper Functions
// ============================================================================

uint8_t InMemorySessionRegistry::initial_risk_score(
    SessionSecurityLevel level,
    const std::optional<std::string>& source_ip,
    const std::optional<std::string>& user_agent
) {
    int risk = 0;
    switch (level) {
        case SessionSecurityLevel::BASIC:      risk = 20; break;
        case SessionSecurityLevel::ENHANCED:   risk = 10; break;
        case SessionSecurityLevel::STRICT:     risk = 5; break;
        case SessionSecurityLevel::RESTRICTED: risk = 50; break;
    }

    if (!source_ip) {
        risk += 15;
    }
    if (!user_agent) {
        risk += 10;
    }

    return static_cast<uint8_t>(std::min(risk, static_cast<int>(MAX_RISK)));
}

bool InMemorySessionRegistry::is_expired(const Session& session, Session::TimePoint now) const {
    return now >= session.expires_at || now - session.last_activity > config_.max_inactive;
}

} // namespace ipcguard
