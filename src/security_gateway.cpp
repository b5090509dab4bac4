/**
 * @file security_gateway.cpp
 * @brief Implementation of the command authorization pipeline
 *
 * IPCGuard - IPC Command Authorization Pipeline
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "ipcguard/security_gateway.hpp"
#include "ipcguard/utilities.hpp"

#include <algorithm>
#include <stdexcept>

using json = nlohmann::json;

namespace ipcguard {

using namespace utilities;

namespace {
    constexpr uint8_t UNKNOWN_COMMAND_RISK = 50;
    constexpr uint8_t CRITICAL_DENIAL_RISK = 90;

    const std::string MFA_PERMISSION = "mfa.verified";
    const std::string SANITIZED_CONDITION = "arguments_sanitized";

    // Shared rate-limit endpoint for every unresolved command name
    const std::string UNKNOWN_ENDPOINT = "<unknown>";
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

GatewayComponents SecurityGateway::make_default_components(const GatewayConfig& config) {
    GatewayComponents components;
    components.sanitizer = std::make_shared<InputSanitizer>(config.sanitizer);
    components.whitelist = std::make_shared<CommandWhitelist>(
        config.commands, config.permission_hierarchy, config.aliases);
    components.rate_limiter = std::make_shared<RateLimiter>(config.default_rate_limit);
    components.sessions = std::make_shared<InMemorySessionRegistry>(config.sessions);
    components.audit = std::make_shared<AuditLogger>(config.audit);
    return components;
}

SecurityGateway::SecurityGateway(const GatewayConfig& config)
    : SecurityGateway(make_default_components(config), config)
{
}

SecurityGateway::SecurityGateway(GatewayComponents components, const GatewayConfig& config)
    : components_(std::move(components))
    , maintenance_interval_(config.maintenance_interval)
    , escalate_violations_(config.escalate_violations_to_session)
{
    if (!components_.sanitizer || !components_.whitelist || !components_.rate_limiter ||
        !components_.sessions || !components_.audit) {
        throw std::invalid_argument("SecurityGateway: every component is required");
    }

    if (maintenance_interval_.count() <= 0) {
        throw std::invalid_argument("SecurityGateway: maintenance interval must be positive");
    }

    register_endpoint_limits(config);

    log_info("SecurityGateway: initialized with " +
             std::to_string(components_.whitelist->list_profiles().size()) + " command profiles");
}

SecurityGateway::~SecurityGateway() {
    stop_maintenance();

    try {
        components_.audit->flush();
    } catch (const std::exception& e) {
        log_error("SecurityGateway: audit flush on shutdown failed: " + std::string(e.what()));
    }
}

void SecurityGateway::register_endpoint_limits(const GatewayConfig& config) {
    for (const auto& [endpoint, limits] : config.endpoint_rate_limits) {
        components_.rate_limiter->set_endpoint_config(endpoint, limits);
    }

    // Per-command caps apply unless an explicit override exists
    for (const auto& profile : components_.whitelist->list_profiles()) {
        if (!profile.max_rate_per_minute || components_.rate_limiter->has_endpoint_config(profile.name)) {
            continue;
        }

        RateLimitConfig limits = config.default_rate_limit;
        limits.requests_per_minute = *profile.max_rate_per_minute;
        components_.rate_limiter->set_endpoint_config(profile.name, limits);
        log_debug("SecurityGateway: " + profile.name + " limited to " +
                  std::to_string(limits.requests_per_minute) + " requests/minute");
    }
}

// ============================================================================
// Authorization
// ============================================================================

ValidationResult SecurityGateway::validate_command(
    const std::string& command,
    const json& args,
    const std::string& session_id,
    const std::optional<std::string>& source_ip
) {
    total_requests_++;

    RequestTrace trace;
    ValidationResult result;

    try {
        result = evaluate(command, args, session_id, source_ip, trace);
    } catch (const std::exception& e) {
        internal_errors_++;
        log_error("SecurityGateway: " + trace.stage + " stage failed for '" + command + "': " + e.what());
        result = ValidationResult::denied(ViolationType::INTERNAL_ERROR, "internal error", 100,
                                          trace.stage + " stage failed: " + e.what());
    }

    // Diagnostic detail goes to the audit trail only
    trace.detail = std::move(result.detail);
    result.detail.clear();

    count_decision(result);
    audit_decision(command, session_id, result, trace);
    return result;
}

ValidationResult SecurityGateway::evaluate(
    const std::string& command,
    const json& args,
    const std::string& session_id,
    const std::optional<std::string>& source_ip,
    RequestTrace& trace
) {
    // Session lookup
    trace.stage = "session";
    SessionValidation validation = components_.sessions->validate_session(session_id, source_ip);
    if (validation.session) {
        trace.user_id = validation.session->user_id;
    }

    switch (validation.status) {
        case SessionStatus::VALID:
            break;
        case SessionStatus::REQUIRES_MFA:
            return ValidationResult::requires_elevation({MFA_PERMISSION}, "mfa required");
        case SessionStatus::SUSPENDED:
            return ValidationResult::denied(ViolationType::SESSION_SUSPENDED, "session suspended", 60,
                                            validation.reason);
        case SessionStatus::EXPIRED:
            return ValidationResult::denied(ViolationType::SESSION_EXPIRED, "session expired", 30,
                                            validation.reason);
        default:
            return ValidationResult::denied(ViolationType::SESSION_INVALID, "invalid session", 50,
                                            validation.reason);
    }

    if (!validation.session) {
        return ValidationResult::denied(ViolationType::SESSION_INVALID, "invalid session", 50,
                                        "session registry returned no session");
    }
    const Session& session = *validation.session;

    // Input validation
    trace.stage = "input";
    json sanitized_args;
    InputValidationResult input = components_.sanitizer->validate_ipc_input(command, args, &sanitized_args);
    if (input.is_invalid()) {
        trace.input_code = input.code;
        if (escalate_violations_) {
            escalate(session_id, "rejected input");
        }
        uint8_t risk = input.code == security::ERR_BLOCKED_PATTERN ? 80 : 40;
        return ValidationResult::denied(ViolationType::INPUT_REJECTED, "invalid input", risk,
                                        input.reason + " (code " + std::to_string(input.code) + ")");
    }
    bool arguments_sanitized = input.is_sanitized();

    // Rate limiting
    trace.stage = "rate_limit";
    trace.canonical_command = components_.whitelist->resolve_command(command);
    trace.command_risk = UNKNOWN_COMMAND_RISK;
    if (trace.canonical_command) {
        auto profile = components_.whitelist->get_profile(*trace.canonical_command);
        if (profile) {
            trace.command_risk = profile->risk_score;
        }
    }

    const std::string& endpoint = trace.canonical_command ? *trace.canonical_command : UNKNOWN_ENDPOINT;
    RateLimitResult rate = components_.rate_limiter->check_rate_limit(session_id, endpoint, trace.command_risk);
    switch (rate.status) {
        case RateLimitStatus::ALLOWED:
            break;
        case RateLimitStatus::LIMITED:
            return ValidationResult::denied(ViolationType::RATE_LIMITED, "rate limit exceeded", 40,
                                            rate.reason + ", retry after " +
                                            std::to_string(rate.retry_after.count()) + "ms");
        case RateLimitStatus::BLOCKED:
            return ValidationResult::denied(ViolationType::RATE_LIMIT_BLOCKED, "rate limit penalty active", 70,
                                            rate.reason + ", unblock after " +
                                            std::to_string(rate.unblock_after.count()) + "ms");
    }

    // Whitelist and permissions
    trace.stage = "command";
    ValidationResult result = components_.whitelist->validate_command(
        command, args, session.permissions, session.mfa_verified);

    if (result.is_denied() && escalate_violations_ &&
        (result.violation == ViolationType::MALICIOUS_PATTERN ||
         result.violation == ViolationType::COMMAND_BLOCKED)) {
        escalate(session_id, violation_to_string(result.violation));
    }

    if (result.is_allowed() && arguments_sanitized) {
        ValidationResult conditional = ValidationResult::conditionally_allowed({SANITIZED_CONDITION}, sanitized_args);
        conditional.command = result.command;
        conditional.risk_score = result.risk_score;
        conditional.required_permissions = result.required_permissions;
        return conditional;
    }

    return result;
}

void SecurityGateway::escalate(const std::string& session_id, const std::string& why) {
    if (components_.sessions->record_failed_attempt(session_id)) {
        log_warn("SecurityGateway: failed attempt recorded for session " + session_id + " (" + why + ")");
    }
}

void SecurityGateway::count_decision(const ValidationResult& result) {
    switch (result.decision) {
        case Decision::ALLOWED: allowed_++; break;
        case Decision::CONDITIONALLY_ALLOWED: conditionally_allowed_++; break;
        case Decision::REQUIRES_ELEVATION: requires_elevation_++; break;
        case Decision::DENIED: denied_++; break;
    }
}

// ============================================================================
// Audit
// ============================================================================

void SecurityGateway::audit_decision(
    const std::string& command,
    const std::string& session_id,
    const ValidationResult& result,
    const RequestTrace& trace
) {
    SecurityEvent event;
    event.session_id = session_id;
    event.user_id = trace.user_id;
    event.command = trace.canonical_command ? *trace.canonical_command : command;

    json details;
    details["decision"] = decision_to_string(result.decision);
    details["stage"] = trace.stage;
    details["reason"] = result.reason;

    switch (result.decision) {
        case Decision::ALLOWED:
            event.event_type = SecurityEventType::COMMAND_ALLOWED;
            event.severity = SecuritySeverity::INFO;
            event.outcome = SecurityOutcome::SUCCESS;
            event.risk_score = result.risk_score;
            break;

        case Decision::CONDITIONALLY_ALLOWED:
            event.event_type = SecurityEventType::INPUT_SANITIZED;
            event.severity = SecuritySeverity::INFO;
            event.outcome = SecurityOutcome::SANITIZED;
            event.risk_score = std::max<uint8_t>(result.risk_score, 20);
            details["conditions"] = result.conditions;
            break;

        case Decision::REQUIRES_ELEVATION:
            event.event_type = SecurityEventType::PERMISSION_DENIED;
            event.severity = SecuritySeverity::WARNING;
            event.outcome = SecurityOutcome::FAILURE;
            event.risk_score = trace.command_risk;
            details["required_permissions"] = result.required_permissions;
            break;

        case Decision::DENIED:
            event.outcome = SecurityOutcome::BLOCKED;
            event.severity = SecuritySeverity::WARNING;
            event.risk_score = result.risk_score;
            details["violation"] = violation_to_string(result.violation);
            details["detail"] = trace.detail;

            switch (result.violation) {
                case ViolationType::SESSION_EXPIRED:
                    event.event_type = SecurityEventType::SESSION_EXPIRED;
                    break;
                case ViolationType::SESSION_SUSPENDED:
                    event.event_type = SecurityEventType::SUSPICIOUS_ACTIVITY;
                    break;
                case ViolationType::SESSION_INVALID:
                    event.event_type = SecurityEventType::PERMISSION_DENIED;
                    break;
                case ViolationType::INPUT_REJECTED:
                    event.event_type = trace.input_code == security::ERR_BLOCKED_PATTERN
                        ? SecurityEventType::INJECTION_ATTEMPT
                        : SecurityEventType::INPUT_REJECTED;
                    details["code"] = trace.input_code;
                    break;
                case ViolationType::RATE_LIMITED:
                    event.event_type = SecurityEventType::RATE_LIMIT_EXCEEDED;
                    break;
                case ViolationType::RATE_LIMIT_BLOCKED:
                    event.event_type = SecurityEventType::RATE_LIMIT_EXCEEDED;
                    event.severity = SecuritySeverity::ERROR;
                    break;
                case ViolationType::MALICIOUS_PATTERN:
                    event.event_type = SecurityEventType::ATTACK_DETECTED;
                    event.severity = SecuritySeverity::ERROR;
                    break;
                case ViolationType::COMMAND_BLOCKED:
                    event.event_type = SecurityEventType::COMMAND_BLOCKED;
                    event.severity = SecuritySeverity::ERROR;
                    break;
                case ViolationType::INTERNAL_ERROR:
                    event.event_type = SecurityEventType::SECURITY_VIOLATION;
                    event.severity = SecuritySeverity::ERROR;
                    event.outcome = SecurityOutcome::FAILURE;
                    break;
                default:
                    event.event_type = SecurityEventType::COMMAND_BLOCKED;
                    break;
            }

            if (result.risk_score >= CRITICAL_DENIAL_RISK) {
                event.severity = SecuritySeverity::CRITICAL;
            }
            break;
    }

    event.details = std::move(details);

    try {
        components_.audit->log_event(std::move(event));
    } catch (const std::exception& e) {
        log_error("SecurityGateway: audit sink failed for '" + command + "': " + e.what());
    }
}

// ============================================================================
// Sessions
// ============================================================================

std::string SecurityGateway::create_session(
    const std::string& window_label,
    const std::optional<std::string>& user_id,
    const std::optional<std::string>& source_ip,
    const std::optional<std::string>& user_agent,
    SessionSecurityLevel level
) {
    Session session = components_.sessions->create_session(window_label, user_id, source_ip, user_agent, level);

    SecurityEvent event;
    event.event_type = SecurityEventType::SESSION_CREATED;
    event.severity = SecuritySeverity::INFO;
    event.session_id = session.session_id;
    event.user_id = session.user_id;
    event.command = "create_session";
    event.outcome = SecurityOutcome::SUCCESS;
    event.risk_score = session.risk_score;
    event.details = {
        {"window_label", window_label},
        {"security_level", security_level_to_string(level)},
        {"auth_state", auth_state_to_string(session.auth_state)}
    };

    try {
        components_.audit->log_event(std::move(event));
    } catch (const std::exception& e) {
        log_error("SecurityGateway: audit sink failed for session creation: " + std::string(e.what()));
    }

    return session.session_id;
}

// ============================================================================
// Maintenance
// ============================================================================

json SecurityGateway::get_security_statistics() const {
    json stats;
    stats["gateway"] = {
        {"total_requests", total_requests_.load()},
        {"allowed", allowed_.load()},
        {"conditionally_allowed", conditionally_allowed_.load()},
        {"denied", denied_.load()},
        {"requires_elevation", requires_elevation_.load()},
        {"internal_errors", internal_errors_.load()},
        {"maintenance_running", is_maintenance_running()}
    };
    stats["commands"] = components_.whitelist->get_security_stats();
    stats["rate_limiter"] = components_.rate_limiter->get_statistics();
    stats["sessions"] = components_.sessions->get_statistics();
    stats["audit"] = components_.audit->get_statistics();
    return stats;
}

void SecurityGateway::flush_audit_log() {
    try {
        components_.audit->flush();
    } catch (const std::exception& e) {
        log_error("SecurityGateway: audit flush failed: " + std::string(e.what()));
    }
}

void SecurityGateway::cleanup_expired_state() {
    size_t sessions_removed = 0;
    size_t keys_removed = 0;

    try {
        sessions_removed = components_.sessions->cleanup_expired();
    } catch (const std::exception& e) {
        log_error("SecurityGateway: session cleanup failed: " + std::string(e.what()));
    }

    try {
        keys_removed = components_.rate_limiter->cleanup_expired_states();
    } catch (const std::exception& e) {
        log_error("SecurityGateway: rate limiter cleanup failed: " + std::string(e.what()));
    }

    flush_audit_log();

    if (sessions_removed > 0 || keys_removed > 0) {
        log_debug("SecurityGateway: cleanup removed " + std::to_string(sessions_removed) +
                  " sessions and " + std::to_string(keys_removed) + " rate limit keys");
    }
}

void SecurityGateway::start_maintenance() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (maintenance_thread_.joinable()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(maintenance_mutex_);
        stop_requested_ = false;
    }

    maintenance_thread_ = std::thread(&SecurityGateway::maintenance_loop, this);
    log_info("SecurityGateway: maintenance started (interval " +
             std::to_string(maintenance_interval_.count()) + "s)");
}

void SecurityGateway::stop_maintenance() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!maintenance_thread_.joinable()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(maintenance_mutex_);
        stop_requested_ = true;
    }
    maintenance_cv_.notify_all();
    maintenance_thread_.join();

    log_info("SecurityGateway: maintenance stopped");
}

bool SecurityGateway::is_maintenance_running() const {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    return maintenance_thread_.joinable();
}

void SecurityGateway::maintenance_loop() {
    std::unique_lock<std::mutex> lock(maintenance_mutex_);
    while (!stop_requested_) {
        if (maintenance_cv_.wait_for(lock, maintenance_interval_, [this]() { return stop_requested_; })) {
            break;
        }

        lock.unlock();
        try {
            cleanup_expired_state();
        } catch (const std::exception& e) {
            log_error("SecurityGateway: maintenance pass failed: " + std::string(e.what()));
        }
        lock.lock();
    }
}

} // namespace ipcguard
