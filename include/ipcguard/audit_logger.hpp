/**
 * @file audit_logger.hpp
 * @brief Tamper-evident security audit log
 *
 * IPCGuard - IPC Command Authorization Pipeline
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - One JSON record per line, append-only
 * - Each record carries a sequence number, the previous record's hash and
 *   its own SHA-256 hash (hash chain per file)
 * - CRITICAL and EMERGENCY events are written synchronously, others are
 *   buffered and written in batches
 * - Events at or above the alert threshold (or risk >= 70) raise an alert
 * - Size-based rotation
 */

#pragma once

#include "ipcguard/security_config.hpp"

#include <string>
#include <vector>
#include <deque>
#include <map>
#include <mutex>
#include <atomic>
#include <functional>
#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

namespace ipcguard {

/**
 * @brief Severity of a security event (ordered)
 */
enum class SecuritySeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL,
    EMERGENCY
};

/**
 * @brief Kind of security event
 */
enum class SecurityEventType {
    LOGIN_ATTEMPT,
    LOGIN_SUCCESS,
    LOGIN_FAILURE,
    SESSION_CREATED,
    SESSION_EXPIRED,
    SESSION_TERMINATED,
    PERMISSION_GRANTED,
    PERMISSION_DENIED,
    PRIVILEGE_ESCALATION,
    COMMAND_VALIDATION,
    COMMAND_ALLOWED,
    COMMAND_BLOCKED,
    RATE_LIMIT_EXCEEDED,
    INPUT_SANITIZED,
    INPUT_REJECTED,
    INJECTION_ATTEMPT,
    CONFIGURATION_CHANGED,
    SUSPICIOUS_ACTIVITY,
    ATTACK_DETECTED,
    SECURITY_VIOLATION
};

/**
 * @brief Outcome recorded with an event
 */
enum class SecurityOutcome {
    SUCCESS,
    FAILURE,
    BLOCKED,
    SANITIZED,
    WARNING
};

/**
 * @brief Kind of input validation finding
 */
enum class InputFinding {
    BLOCKED,
    SANITIZED,
    INJECTION_ATTEMPT
};

std::string severity_to_string(SecuritySeverity severity);
std::optional<SecuritySeverity> string_to_severity(const std::string& str);
std::string event_type_to_string(SecurityEventType type);
std::optional<SecurityEventType> string_to_event_type(const std::string& str);
std::string outcome_to_string(SecurityOutcome outcome);
std::optional<SecurityOutcome> string_to_outcome(const std::string& str);

/**
 * @brief One audit record
 */
struct SecurityEvent {
    std::string id;                           ///< Stamped by the logger if empty
    uint64_t timestamp_ms = 0;                ///< Unix ms, stamped by the logger if 0
    SecurityEventType event_type = SecurityEventType::COMMAND_VALIDATION;
    SecuritySeverity severity = SecuritySeverity::INFO;
    std::string session_id;
    std::optional<std::string> user_id;
    std::string command;
    SecurityOutcome outcome = SecurityOutcome::SUCCESS;
    uint8_t risk_score = 0;
    nlohmann::json details = nlohmann::json::object();

    nlohmann::json to_json() const;
    static std::optional<SecurityEvent> from_json(const nlohmann::json& j);
};

/**
 * @brief Audit logger configuration
 */
struct AuditConfig {
    /// Audit file; empty selects <log directory>/security_audit.log
    std::filesystem::path log_file;
    bool persist = true;
    SecuritySeverity alert_threshold = SecuritySeverity::WARNING;
    size_t buffer_size = security::AUDIT_BUFFER_SIZE;
    uint64_t max_file_size = security::AUDIT_MAX_FILE_SIZE;
    size_t max_log_files = security::AUDIT_MAX_LOG_FILES;

    nlohmann::json to_json() const;
    static std::optional<AuditConfig> from_json(
        const nlohmann::json& j,
        const AuditConfig& base
    );
    static std::optional<AuditConfig> from_json(const nlohmann::json& j) {
        return from_json(j, AuditConfig());
    }
};

/**
 * @brief Filter for AuditLogger::query_events
 */
struct AuditQuery {
    std::optional<uint64_t> from_ms;                ///< Inclusive
    std::optional<uint64_t> to_ms;                  ///< Inclusive
    std::optional<SecurityEventType> event_type;
    std::optional<SecuritySeverity> min_severity;
    std::optional<std::string> session_id;
    size_t limit = 1000;
};

/**
 * @brief Audit stage of the pipeline
 */
class AuditSink {
public:
    virtual ~AuditSink() = default;

    /**
     * @brief Record an event (stamps id and timestamp when missing)
     */
    virtual void log_event(SecurityEvent event) = 0;

    /**
     * @brief Write buffered events
     */
    virtual void flush() = 0;

    virtual nlohmann::json get_statistics() const = 0;
};

/**
 * @brief AuditLogger - default AuditSink writing a hash-chained JSON lines file
 */
class AuditLogger : public AuditSink {
public:
    using AlertHandler = std::function<void(const SecurityEvent&)>;

    /**
     * @brief Construct audit logger
     * @param config Logger configuration
     * @throws std::runtime_error if libsodium cannot be initialized or the
     *         log directory cannot be created
     */
    explicit AuditLogger(AuditConfig config = AuditConfig());

    /**
     * @brief Destructor (flushes buffered events)
     */
    ~AuditLogger() override;

    AuditLogger(const AuditLogger&) = delete;
    AuditLogger& operator=(const AuditLogger&) = delete;
    AuditLogger(AuditLogger&&) = delete;
    AuditLogger& operator=(AuditLogger&&) = delete;

    void log_event(SecurityEvent event) override;

    /**
     * @brief Record an authentication event
     *
     * FAILURE maps to WARNING, BLOCKED to ERROR, others to INFO. Risk is 30
     * for LOGIN_FAILURE, 80 for PRIVILEGE_ESCALATION, 10 otherwise.
     */
    void log_authentication(
        SecurityEventType event_type,
        const std::string& session_id,
        const std::optional<std::string>& user_id,
        SecurityOutcome outcome,
        const nlohmann::json& details = nlohmann::json::object()
    );

    /**
     * @brief Record an IPC command decision
     *
     * BLOCKED maps to WARNING/50, FAILURE to ERROR/70, others to INFO/5.
     */
    void log_ipc_command(
        const std::string& session_id,
        const std::string& command,
        SecurityOutcome outcome,
        const nlohmann::json& details = nlohmann::json::object()
    );

    /**
     * @brief Record an input validation finding
     *
     * BLOCKED maps to WARNING/40, SANITIZED to INFO/20,
     * INJECTION_ATTEMPT to ERROR/80.
     */
    void log_input_validation(
        const std::string& session_id,
        const std::string& command,
        InputFinding finding,
        const nlohmann::json& details = nlohmann::json::object()
    );

    void flush() override;

    /**
     * @brief Rolling statistics
     * @return JSON with total_events, events_by_type, events_by_severity,
     *         events_last_hour, events_last_day, high_risk_events_today,
     *         alerts_triggered, write_failures
     */
    nlohmann::json get_statistics() const override;

    /**
     * @brief Search persisted events of the current log file
     * @param query Filter
     * @return Matching events in log order (buffered events are flushed first)
     */
    std::vector<SecurityEvent> query_events(const AuditQuery& query);

    /**
     * @brief Install a callback for the synchronous alert path
     */
    void set_alert_handler(AlertHandler handler);

    /**
     * @brief Rotate the log if it exceeds max_file_size
     * @return true if a rotation happened
     */
    bool rotate_logs_if_needed();

    /**
     * @brief Recompute the hash chain of a log file
     * @param path Audit log file
     * @return true if every record links to its predecessor and its hash matches
     */
    static bool verify_log_integrity(const std::filesystem::path& path);

    std::filesystem::path get_log_path() const { return log_path_; }

    /// Previous-hash value of the first record in a file
    static const std::string GENESIS_HASH;

private:
    AuditConfig config_;
    std::filesystem::path log_path_;

    // Writer state
    std::vector<SecurityEvent> buffer_;
    std::string last_hash_;
    uint64_t next_sequence_ = 0;
    mutable std::mutex write_mutex_;

    // Statistics
    uint64_t total_events_ = 0;
    std::map<std::string, uint64_t> events_by_type_;
    std::map<std::string, uint64_t> events_by_severity_;
    std::deque<uint64_t> recent_events_ms_;      ///< Last 24h
    std::deque<uint64_t> recent_high_risk_ms_;   ///< Last 24h, risk >= AUDIT_HIGH_RISK
    uint64_t alerts_triggered_ = 0;
    mutable std::mutex stats_mutex_;

    std::atomic<uint64_t> write_failures_{0};

    AlertHandler alert_handler_;
    std::mutex alert_mutex_;

    void update_statistics(const SecurityEvent& event);
    bool should_alert(const SecurityEvent& event) const;
    void trigger_alert(const SecurityEvent& event);

    // Caller holds write_mutex_
    void write_events_locked(const std::vector<SecurityEvent>& events);
    void load_chain_state_locked();
    bool rotate_locked(bool force = false);

    static std::string compute_record_hash(const std::string& previous_hash, const nlohmann::json& record);
};

} // namespace ipcguard
