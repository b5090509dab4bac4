/**
 * @file security_gateway.hpp
 * @brief Fail-closed authorization pipeline for inbound IPC commands
 *
 * IPCGuard - IPC Command Authorization Pipeline
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * SecurityGateway composes the pipeline stages:
 * - Session lookup (SessionRegistry)
 * - Argument sanitization (InputValidator)
 * - Rate limiting (RequestThrottle)
 * - Whitelist and permission check (CommandAuthorizer)
 * - Audit (AuditSink), exactly one event per decision
 *
 * Privileged command handlers call validate_command() before executing and
 * treat anything other than ALLOWED as a hard stop.
 */

#pragma once

#include "ipcguard/gateway_config.hpp"
#include "ipcguard/security_types.hpp"
#include "ipcguard/input_sanitizer.hpp"
#include "ipcguard/command_whitelist.hpp"
#include "ipcguard/rate_limiter.hpp"
#include "ipcguard/session_registry.hpp"
#include "ipcguard/audit_logger.hpp"

#include <string>
#include <memory>
#include <optional>
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <chrono>

#include <nlohmann/json.hpp>

namespace ipcguard {

/**
 * @brief Component handles used by a SecurityGateway
 *
 * All handles are required.
 */
struct GatewayComponents {
    std::shared_ptr<InputValidator> sanitizer;
    std::shared_ptr<CommandAuthorizer> whitelist;
    std::shared_ptr<RequestThrottle> rate_limiter;
    std::shared_ptr<SessionRegistry> sessions;
    std::shared_ptr<AuditSink> audit;
};

/**
 * @brief SecurityGateway - single entry point for command authorization
 *
 * Thread-safe. validate_command() never throws; any fault in a component
 * resolves to DENIED with INTERNAL_ERROR.
 */
class SecurityGateway {
public:
    /**
     * @brief Construct gateway with the default components
     * @param config Configuration of every component
     * @throws std::invalid_argument if a configured pattern does not compile
     * @throws std::runtime_error if the audit log cannot be opened
     */
    explicit SecurityGateway(const GatewayConfig& config = GatewayConfig());

    /**
     * @brief Construct gateway from explicit components
     * @param components Component handles (none may be null)
     * @param config Supplies endpoint rate limits, maintenance interval and
     *        escalation policy; component sections are ignored
     * @throws std::invalid_argument if a component is null
     */
    explicit SecurityGateway(GatewayComponents components, const GatewayConfig& config = GatewayConfig());

    /**
     * @brief Destructor - stops maintenance and flushes the audit log
     */
    ~SecurityGateway();

    // Disable copy and move
    SecurityGateway(const SecurityGateway&) = delete;
    SecurityGateway& operator=(const SecurityGateway&) = delete;
    SecurityGateway(SecurityGateway&&) = delete;
    SecurityGateway& operator=(SecurityGateway&&) = delete;

    // ========================================================================
    // Authorization
    // ========================================================================

    /**
     * @brief Authorize one command request
     * @param command Command name or alias
     * @param args Argument payload
     * @param session_id Caller session
     * @param source_ip Caller address, if known
     * @return Decision; only ALLOWED permits execution
     */
    ValidationResult validate_command(
        const std::string& command,
        const nlohmann::json& args,
        const std::string& session_id,
        const std::optional<std::string>& source_ip = std::nullopt
    );

    // ========================================================================
    // Sessions
    // ========================================================================

    /**
     * @brief Establish a session and audit its creation
     * @return New session identifier
     */
    std::string create_session(
        const std::string& window_label,
        const std::optional<std::string>& user_id = std::nullopt,
        const std::optional<std::string>& source_ip = std::nullopt,
        const std::optional<std::string>& user_agent = std::nullopt,
        SessionSecurityLevel level = SessionSecurityLevel::BASIC
    );

    // ========================================================================
    // Maintenance
    // ========================================================================

    /**
     * @brief Aggregate statistics of the gateway and every component
     * @return JSON with gateway, commands, rate_limiter, sessions and audit sections
     */
    nlohmann::json get_security_statistics() const;

    void flush_audit_log();

    /**
     * @brief Remove expired sessions and idle rate-limit keys, flush the audit buffer
     */
    void cleanup_expired_state();

    /**
     * @brief Run cleanup_expired_state() every maintenance interval on a background thread
     */
    void start_maintenance();

    void stop_maintenance();

    bool is_maintenance_running() const;

    const GatewayComponents& get_components() const { return components_; }

    static GatewayComponents make_default_components(const GatewayConfig& config);

private:
    /// Context gathered while a request moves through the pipeline
    struct RequestTrace {
        std::string stage = "session";
        std::optional<std::string> user_id;
        std::optional<std::string> canonical_command;
        uint8_t command_risk = 0;
        uint16_t input_code = 0;
        std::string detail;
    };

    GatewayComponents components_;
    std::chrono::seconds maintenance_interval_;
    bool escalate_violations_;

    // Decision counters
    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> allowed_{0};
    std::atomic<uint64_t> conditionally_allowed_{0};
    std::atomic<uint64_t> denied_{0};
    std::atomic<uint64_t> requires_elevation_{0};
    std::atomic<uint64_t> internal_errors_{0};

    // Maintenance thread
    std::thread maintenance_thread_;
    mutable std::mutex lifecycle_mutex_;
    std::mutex maintenance_mutex_;
    std::condition_variable maintenance_cv_;
    bool stop_requested_ = false;

    ValidationResult evaluate(
        const std::string& command,
        const nlohmann::json& args,
        const std::string& session_id,
        const std::optional<std::string>& source_ip,
        RequestTrace& trace
    );

    void register_endpoint_limits(const GatewayConfig& config);
    void escalate(const std::string& session_id, const std::string& why);
    void count_decision(const ValidationResult& result);
    void audit_decision(
        const std::string& command,
        const std::string& session_id,
        const ValidationResult& result,
        const RequestTrace& trace
    );
    void maintenance_loop();
};

} // namespace ipcguard
