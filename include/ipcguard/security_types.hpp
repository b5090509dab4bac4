/**
 * @file security_types.hpp
 * @brief Decision types shared by every stage of the authorization pipeline
 *
 * IPCGuard - IPC Command Authorization Pipeline
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - Command security classification tiers
 * - Violation taxonomy
 * - ValidationResult (tagged union returned to callers)
 */

#pragma once

#include <string>
#include <vector>
#include <set>
#include <cstdint>
#include <optional>

#include <nlohmann/json.hpp>

namespace ipcguard {

/// Set of permission strings held by or required of a session
using PermissionSet = std::set<std::string>;

/**
 * @brief Security tier of a command
 *
 * BLOCKED is an absolute veto checked before any permission logic.
 */
enum class SecurityClassification {
    PUBLIC,          ///< No session permissions required
    AUTHENTICATED,   ///< Requires basic user permissions
    PRIVILEGED,      ///< Requires elevated permissions
    ADMINISTRATIVE,  ///< Requires admin permissions
    RESTRICTED,      ///< Restricted to specific contexts
    BLOCKED          ///< Never executable
};

/**
 * @brief Reason a request was denied
 */
enum class ViolationType {
    UNKNOWN_COMMAND,
    COMMAND_BLOCKED,
    MALICIOUS_PATTERN,
    INVALID_ARGUMENTS,
    INSUFFICIENT_PERMISSIONS,
    RATE_LIMITED,
    RATE_LIMIT_BLOCKED,
    INPUT_REJECTED,
    SESSION_INVALID,
    SESSION_SUSPENDED,
    SESSION_EXPIRED,
    INTERNAL_ERROR
};

/**
 * @brief Decision variant of a ValidationResult
 */
enum class Decision {
    ALLOWED,
    DENIED,
    REQUIRES_ELEVATION,
    CONDITIONALLY_ALLOWED
};

/**
 * @brief Outcome of authorizing one command request
 *
 * Closed set of variants selected by `decision`:
 * - ALLOWED: sanitized_args, risk_score, required_permissions
 * - DENIED: reason, risk_score, violation
 * - REQUIRES_ELEVATION: required_permissions, reason
 * - CONDITIONALLY_ALLOWED: conditions, sanitized_args
 *
 * `detail` carries diagnostic text (matched pattern, profile name) between
 * components. It is never serialized, and SecurityGateway moves it into the
 * audit event and clears it before returning a decision.
 */
struct ValidationResult {
    Decision decision = Decision::DENIED;
    std::string command;                          ///< Canonical command name (if resolved)
    nlohmann::json sanitized_args;                ///< Arguments the caller may use
    uint8_t risk_score = 0;                       ///< 0-100
    PermissionSet required_permissions;           ///< Permissions the command needs
    std::vector<std::string> conditions;          ///< Conditions attached to a conditional allow
    std::string reason;                           ///< Short caller-visible reason
    ViolationType violation = ViolationType::INTERNAL_ERROR; ///< Meaningful for DENIED
    std::string detail;                           ///< Audit-only diagnostic detail

    static ValidationResult allowed(
        const std::string& command,
        const nlohmann::json& sanitized_args,
        uint8_t risk_score,
        const PermissionSet& required_permissions
    );

    static ValidationResult denied(
        ViolationType violation,
        const std::string& reason,
        uint8_t risk_score,
        const std::string& detail = ""
    );

    static ValidationResult requires_elevation(
        const PermissionSet& required_permissions,
        const std::string& reason
    );

    static ValidationResult conditionally_allowed(
        const std::vector<std::string>& conditions,
        const nlohmann::json& sanitized_args
    );

    bool is_allowed() const { return decision == Decision::ALLOWED; }
    bool is_denied() const { return decision == Decision::DENIED; }

    /**
     * @brief Serialize as a tagged union ({"type": "Allowed", ...})
     * @return JSON object without audit-only detail
     */
    nlohmann::json to_json() const;
};

// ============================================================================
// String Conversion
// ============================================================================

std::string classification_to_string(SecurityClassification classification);
std::optional<SecurityClassification> string_to_classification(const std::string& str);

std::string violation_to_string(ViolationType violation);
std::string decision_to_string(Decision decision);

} // namespace ipcguard
