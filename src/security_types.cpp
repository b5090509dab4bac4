/**
 * @file security_types.cpp
 * @brief ValidationResult factories and enum string conversion
 *
 * IPCGuard - IPC Command Authorization Pipeline
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "ipcguard/security_types.hpp"

using json = nlohmann::json;

namespace ipcguard {

// ============================================================================
// ValidationResult Factories
// ============================================================================

ValidationResult ValidationResult::allowed(
    const std::string& command,
    const json& sanitized_args,
    uint8_t risk_score,
    const PermissionSet& required_permissions
) {
    ValidationResult result;
    result.decision = Decision::ALLOWED;
    result.command = command;
    result.sanitized_args = sanitized_args;
    result.risk_score = risk_score;
    result.required_permissions = required_permissions;
    return result;
}

ValidationResult ValidationResult::denied(
    ViolationType violation,
    const std::string& reason,
    uint8_t risk_score,
    const std::string& detail
) {
    ValidationResult result;
    result.decision = Decision::DENIED;
    result.violation = violation;
    result.reason = reason;
    result.risk_score = risk_score;
    result.detail = detail;
    return result;
}

ValidationResult ValidationResult::requires_elevation(
    const PermissionSet& required_permissions,
    const std::string& reason
) {
    ValidationResult result;
    result.decision = Decision::REQUIRES_ELEVATION;
    result.required_permissions = required_permissions;
    result.reason = reason;
    return result;
}

ValidationResult ValidationResult::conditionally_allowed(
    const std::vector<std::string>& conditions,
    const json& sanitized_args
) {
    ValidationResult result;
    result.decision = Decision::CONDITIONALLY_ALLOWED;
    result.conditions = conditions;
    result.sanitized_args = sanitized_args;
    return result;
}

json ValidationResult::to_json() const {
    json j;
    switch (decision) {
        case Decision::ALLOWED:
            j["type"] = "Allowed";
            j["sanitized_args"] = sanitized_args;
            j["risk_score"] = risk_score;
            j["required_permissions"] = required_permissions;
            break;
        case Decision::DENIED:
            j["type"] = "Denied";
            j["reason"] = reason;
            j["risk_score"] = risk_score;
            j["violation_type"] = violation_to_string(violation);
            break;
        case Decision::REQUIRES_ELEVATION:
            j["type"] = "RequiresElevation";
            j["required_permissions"] = required_permissions;
            j["reason"] = reason;
            break;
        case Decision::CONDITIONALLY_ALLOWED:
            j["type"] = "ConditionallyAllowed";
            j["conditions"] = conditions;
            j["sanitized_args"] = sanitized_args;
            break;
    }
    return j;
}

// ============================================================================
// String Conversion
// ============================================================================

std::string classification_to_string(SecurityClassification classification) {
    switch (classification) {
        case SecurityClassification::PUBLIC: return "PUBLIC";
        case SecurityClassification::AUTHENTICATED: return "AUTHENTICATED";
        case SecurityClassification::PRIVILEGED: return "PRIVILEGED";
        case SecurityClassification::ADMINISTRATIVE: return "ADMINISTRATIVE";
        case SecurityClassification::RESTRICTED: return "RESTRICTED";
        case SecurityClassification::BLOCKED: return "BLOCKED";
        default: return "UNKNOWN";
    }
}

std::optional<SecurityClassification> string_to_classification(const std::string& str) {
    if (str == "PUBLIC") return SecurityClassification::PUBLIC;
    if (str == "AUTHENTICATED") return SecurityClassification::AUTHENTICATED;
    if (str == "PRIVILEGED") return SecurityClassification::PRIVILEGED;
    if (str == "ADMINISTRATIVE") return SecurityClassification::ADMINISTRATIVE;
    if (str == "RESTRICTED") return SecurityClassification::RESTRICTED;
    if (str == "BLOCKED") return SecurityClassification::BLOCKED;
    return std::nullopt;
}

std::string violation_to_string(ViolationType violation) {
    switch (violation) {
        case ViolationType::UNKNOWN_COMMAND: return "UNKNOWN_COMMAND";
        case ViolationType::COMMAND_BLOCKED: return "COMMAND_BLOCKED";
        case ViolationType::MALICIOUS_PATTERN: return "MALICIOUS_PATTERN";
        case ViolationType::INVALID_ARGUMENTS: return "INVALID_ARGUMENTS";
        case ViolationType::INSUFFICIENT_PERMISSIONS: return "INSUFFICIENT_PERMISSIONS";
        case ViolationType::RATE_LIMITED: return "RATE_LIMITED";
        case ViolationType::RATE_LIMIT_BLOCKED: return "RATE_LIMIT_BLOCKED";
        case ViolationType::INPUT_REJECTED: return "INPUT_REJECTED";
        case ViolationType::SESSION_INVALID: return "SESSION_INVALID";
        case ViolationType::SESSION_SUSPENDED: return "SESSION_SUSPENDED";
        case ViolationType::SESSION_EXPIRED: return "SESSION_EXPIRED";
        case ViolationType::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

std::string decision_to_string(Decision decision) {
    switch (decision) {
        case Decision::ALLOWED: return "ALLOWED";
        case Decision::DENIED: return "DENIED";
        case Decision::REQUIRES_ELEVATION: return "REQUIRES_ELEVATION";
        case Decision::CONDITIONALLY_ALLOWED: return "CONDITIONALLY_ALLOWED";
        default: return "UNKNOWN";
    }
}

} // namespace ipcguard
