/**
 * @file audit_logger.cpp
 * @brief Implementation of the hash-chained security audit log
 *
 * IPCGuard - IPC Command Authorization Pipeline
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "ipcguard/audit_logger.hpp"
#include "ipcguard/utilities.hpp"

#include <sodium.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace ipcguard {

namespace {
    constexpr uint64_t HOUR_MS = 3600ULL * 1000;
    constexpr uint64_t DAY_MS = 24ULL * HOUR_MS;

    std::string dump_record(const json& record) {
        return record.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    size_t count_since(const std::deque<uint64_t>& timestamps, uint64_t since_ms) {
        auto first = std::lower_bound(timestamps.begin(), timestamps.end(), since_ms);
        return static_cast<size_t>(std::distance(first, timestamps.end()));
    }
}

const std::string AuditLogger::GENESIS_HASH(64, '0');

// ============================================================================
// String Conversion
// ============================================================================

std::string severity_to_string(SecuritySeverity severity) {
    switch (severity) {
        case SecuritySeverity::INFO: return "INFO";
        case SecuritySeverity::WARNING: return "WARNING";
        case SecuritySeverity::ERROR: return "ERROR";
        case SecuritySeverity::CRITICAL: return "CRITICAL";
        case SecuritySeverity::EMERGENCY: return "EMERGENCY";
        default: return "UNKNOWN";
    }
}

std::optional<SecuritySeverity> string_to_severity(const std::string& str) {
    if (str == "INFO") return SecuritySeverity::INFO;
    if (str == "WARNING") return SecuritySeverity::WARNING;
    if (str == "ERROR") return SecuritySeverity::ERROR;
    if (str == "CRITICAL") return SecuritySeverity::CRITICAL;
    if (str == "EMERGENCY") return SecuritySeverity::EMERGENCY;
    return std::nullopt;
}

std::string event_type_to_string(SecurityEventType type) {
    switch (type) {
        case SecurityEventType::LOGIN_ATTEMPT: return "LOGIN_ATTEMPT";
        case SecurityEventType::LOGIN_SUCCESS: return "LOGIN_SUCCESS";
        case SecurityEventType::LOGIN_FAILURE: return "LOGIN_FAILURE";
        case SecurityEventType::SESSION_CREATED: return "SESSION_CREATED";
        case SecurityEventType::SESSION_EXPIRED: return "SESSION_EXPIRED";
        case SecurityEventType::SESSION_TERMINATED: return "SESSION_TERMINATED";
        case SecurityEventType::PERMISSION_GRANTED: return "PERMISSION_GRANTED";
        case SecurityEventType::PERMISSION_DENIED: return "PERMISSION_DENIED";
        case SecurityEventType::PRIVILEGE_ESCALATION: return "PRIVILEGE_ESCALATION";
        case SecurityEventType::COMMAND_VALIDATION: return "COMMAND_VALIDATION";
        case SecurityEventType::COMMAND_ALLOWED: return "COMMAND_ALLOWED";
        case SecurityEventType::COMMAND_BLOCKED: return "COMMAND_BLOCKED";
        case SecurityEventType::RATE_LIMIT_EXCEEDED: return "RATE_LIMIT_EXCEEDED";
        case SecurityEventType::INPUT_SANITIZED: return "INPUT_SANITIZED";
        case SecurityEventType::INPUT_REJECTED: return "INPUT_REJECTED";
        case SecurityEventType::INJECTION_ATTEMPT: return "INJECTION_ATTEMPT";
        case SecurityEventType::CONFIGURATION_CHANGED: return "CONFIGURATION_CHANGED";
        case SecurityEventType::SUSPICIOUS_ACTIVITY: return "SUSPICIOUS_ACTIVITY";
        case SecurityEventType::ATTACK_DETECTED: return "ATTACK_DETECTED";
        case SecurityEventType::SECURITY_VIOLATION: return "SECURITY_VIOLATION";
        default: return "UNKNOWN";
    }
}

std::optional<SecurityEventType> string_to_event_type(const std::string& str) {
    if (str == "LOGIN_ATTEMPT") return SecurityEventType::LOGIN_ATTEMPT;
    if (str == "LOGIN_SUCCESS") return SecurityEventType::LOGIN_SUCCESS;
    if (str == "LOGIN_FAILURE") return SecurityEventType::LOGIN_FAILURE;
    if (str == "SESSION_CREATED") return SecurityEventType::SESSION_CREATED;
    if (str == "SESSION_EXPIRED") return SecurityEventType::SESSION_EXPIRED;
    if (str == "SESSION_TERMINATED") return SecurityEventType::SESSION_TERMINATED;
    if (str == "PERMISSION_GRANTED") return SecurityEventType::PERMISSION_GRANTED;
    if (str == "PERMISSION_DENIED") return SecurityEventType::PERMISSION_DENIED;
    if (str == "PRIVILEGE_ESCALATION") return SecurityEventType::PRIVILEGE_ESCALATION;
    if (str == "COMMAND_VALIDATION") return SecurityEventType::COMMAND_VALIDATION;
    if (str == "COMMAND_ALLOWED") return SecurityEventType::COMMAND_ALLOWED;
    if (str == "COMMAND_BLOCKED") return SecurityEventType::COMMAND_BLOCKED;
    if (str == "RATE_LIMIT_EXCEEDED") return SecurityEventType::RATE_LIMIT_EXCEEDED;
    if (str == "INPUT_SANITIZED") return SecurityEventType::INPUT_SANITIZED;
    if (str == "INPUT_REJECTED") return SecurityEventType::INPUT_REJECTED;
    if (str == "INJECTION_ATTEMPT") return SecurityEventType::INJECTION_ATTEMPT;
    if (str == "CONFIGURATION_CHANGED") return SecurityEventType::CONFIGURATION_CHANGED;
    if (str == "SUSPICIOUS_ACTIVITY") return SecurityEventType::SUSPICIOUS_ACTIVITY;
    if (str == "ATTACK_DETECTED") return SecurityEventType::ATTACK_DETECTED;
    if (str == "SECURITY_VIOLATION") return SecurityEventType::SECURITY_VIOLATION;
    return std::nullopt;
}

std::string outcome_to_string(SecurityOutcome outcome) {
    switch (outcome) {
        case SecurityOutcome::SUCCESS: return "SUCCESS";
        case SecurityOutcome::FAILURE: return "FAILURE";
        case SecurityOutcome::BLOCKED: return "BLOCKED";
        case SecurityOutcome::SANITIZED: return "SANITIZED";
        case SecurityOutcome::WARNING: return "WARNING";
        default: return "UNKNOWN";
    }
}

std::optional<SecurityOutcome> string_to_outcome(const std::string& str) {
    if (str == "SUCCESS") return SecurityOutcome::SUCCESS;
    if (str == "FAILURE") return SecurityOutcome::FAILURE;
    if (str == "BLOCKED") return SecurityOutcome::BLOCKED;
    if (str == "SANITIZED") return SecurityOutcome::SANITIZED;
    if (str == "WARNING") return SecurityOutcome::WARNING;
    return std::nullopt;
}

// ============================================================================
// Serialization
// ============================================================================

json SecurityEvent::to_json() const {
    json j;
    j["id"] = id;
    j["timestamp_ms"] = timestamp_ms;
    j["timestamp"] = utilities::format_timestamp(timestamp_ms / 1000);
    j["event_type"] = event_type_to_string(event_type);
    j["severity"] = severity_to_string(severity);
    j["session_id"] = session_id;
    j["user_id"] = user_id ? json(*user_id) : json(nullptr);
    j["command"] = command;
    j["outcome"] = outcome_to_string(outcome);
    j["risk_score"] = risk_score;
    j["details"] = details;
    return j;
}

std::optional<SecurityEvent> SecurityEvent::from_json(const json& j) {
    try {
        SecurityEvent event;
        event.id = j.at("id").get<std::string>();
        event.timestamp_ms = j.at("timestamp_ms").get<uint64_t>();

        auto type = string_to_event_type(j.at("event_type").get<std::string>());
        auto severity = string_to_severity(j.at("severity").get<std::string>());
        auto outcome = string_to_outcome(j.at("outcome").get<std::string>());
        if (!type || !severity || !outcome) {
            return std::nullopt;
        }
        event.event_type = *type;
        event.severity = *severity;
        event.outcome = *outcome;

        event.session_id = j.value("session_id", std::string());
        if (j.contains("user_id") && j["user_id"].is_string()) {
            event.user_id = j["user_id"].get<std::string>();
        }
        event.command = j.value("command", std::string());
        event.risk_score = j.value("risk_score", static_cast<uint8_t>(0));
        event.details = j.value("details", json::object());
        return event;

    } catch (const json::exception&) {
        return std::nullopt;
    }
}

json AuditConfig::to_json() const {
    json j;
    j["log_file"] = log_file.string();
    j["persist"] = persist;
    j["alert_threshold"] = severity_to_string(alert_threshold);
    j["buffer_size"] = buffer_size;
    j["max_file_size"] = max_file_size;
    j["max_log_files"] = max_log_files;
    return j;
}

std::optional<AuditConfig> AuditConfig::from_json(const json& j, const AuditConfig& base) {
    try {
        if (!j.is_object()) {
            return std::nullopt;
        }

        AuditConfig config = base;
        if (j.contains("log_file")) {
            config.log_file = j["log_file"].get<std::string>();
        }
        config.persist = j.value("persist", base.persist);
        config.buffer_size = j.value("buffer_size", base.buffer_size);
        config.max_file_size = j.value("max_file_size", base.max_file_size);
        config.max_log_files = j.value("max_log_files", base.max_log_files);

        if (j.contains("alert_threshold")) {
            auto threshold = string_to_severity(j["alert_threshold"].get<std::string>());
            if (!threshold) {
                return std::nullopt;
            }
            config.alert_threshold = *threshold;
        }

        if (config.buffer_size == 0 || config.max_file_size == 0) {
            return std::nullopt;
        }

        return config;

    } catch (const json::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

AuditLogger::AuditLogger(AuditConfig config)
    : config_(std::move(config))
    , last_hash_(GENESIS_HASH)
{
    if (sodium_init() < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
    }

    if (!config_.persist) {
        return;
    }

    try {
        log_path_ = config_.log_file.empty()
            ? security::get_log_directory() / "security_audit.log"
            : config_.log_file;

        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Failed to prepare audit log directory: ") + ex.what());
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    load_chain_state_locked();

    utilities::log_info("AuditLogger: writing to " + log_path_.string());
}

AuditLogger::~AuditLogger() {
    try {
        flush();
    } catch (const std::exception& ex) {
        utilities::log_error(std::string("AuditLogger: flush on shutdown failed: ") + ex.what());
    }
}

// ============================================================================
// Logging
// ============================================================================

void AuditLogger::log_event(SecurityEvent event) {
    if (event.id.empty()) {
        event.id = utilities::generate_uuid();
    }
    if (event.timestamp_ms == 0) {
        event.timestamp_ms = utilities::current_unix_time_ms();
    }

    update_statistics(event);

    if (should_alert(event)) {
        trigger_alert(event);
    }

    if (!config_.persist) {
        return;
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    buffer_.push_back(std::move(event));

    // High-severity events are written before returning, after anything queued ahead of them
    if (buffer_.back().severity >= SecuritySeverity::CRITICAL || buffer_.size() >= config_.buffer_size) {
        write_events_locked(buffer_);
        buffer_.clear();
    }
}

void AuditLogger::log_authentication(
    SecurityEventType event_type,
    const std::string& session_id,
    const std::optional<std::string>& user_id,
    SecurityOutcome outcome,
    const json& details
) {
    SecurityEvent event;
    event.event_type = event_type;
    event.session_id = session_id;
    event.user_id = user_id;
    event.command = "authentication";
    event.outcome = outcome;
    event.details = details;

    switch (outcome) {
        case SecurityOutcome::FAILURE: event.severity = SecuritySeverity::WARNING; break;
        case SecurityOutcome::BLOCKED: event.severity = SecuritySeverity::ERROR; break;
        default: event.severity = SecuritySeverity::INFO; break;
    }

    switch (event_type) {
        case SecurityEventType::LOGIN_FAILURE: event.risk_score = 30; break;
        case SecurityEventType::PRIVILEGE_ESCALATION: event.risk_score = 80; break;
        default: event.risk_score = 10; break;
    }

    log_event(std::move(event));
}

void AuditLogger::log_ipc_command(
    const std::string& session_id,
    const std::string& command,
    SecurityOutcome outcome,
    const json& details
) {
    SecurityEvent event;
    event.session_id = session_id;
    event.command = command;
    event.outcome = outcome;
    event.details = details;

    switch (outcome) {
        case SecurityOutcome::BLOCKED:
            event.event_type = SecurityEventType::COMMAND_BLOCKED;
            event.severity = SecuritySeverity::WARNING;
            event.risk_score = 50;
            break;
        case SecurityOutcome::FAILURE:
            event.event_type = SecurityEventType::COMMAND_VALIDATION;
            event.severity = SecuritySeverity::ERROR;
            event.risk_score = 70;
            break;
        default:
            event.event_type = SecurityEventType::COMMAND_ALLOWED;
            event.severity = SecuritySeverity::INFO;
            event.risk_score = 5;
            break;
    }

    log_event(std::move(event));
}

void AuditLogger::log_input_validation(
    const std::string& session_id,
    const std::string& command,
    InputFinding finding,
    const json& details
) {
    SecurityEvent event;
    event.session_id = session_id;
    event.command = command;
    event.details = details;

    switch (finding) {
        case InputFinding::BLOCKED:
            event.event_type = SecurityEventType::INPUT_REJECTED;
            event.severity = SecuritySeverity::WARNING;
            event.outcome = SecurityOutcome::BLOCKED;
            event.risk_score = 40;
            break;
        case InputFinding::SANITIZED:
            event.event_type = SecurityEventType::INPUT_SANITIZED;
            event.severity = SecuritySeverity::INFO;
            event.outcome = SecurityOutcome::SANITIZED;
            event.risk_score = 20;
            break;
        case InputFinding::INJECTION_ATTEMPT:
            event.event_type = SecurityEventType::INJECTION_ATTEMPT;
            event.severity = SecuritySeverity::ERROR;
            event.outcome = SecurityOutcome::BLOCKED;
            event.risk_score = 80;
            break;
    }

    log_event(std::move(event));
}

void AuditLogger::flush() {
    if (!config_.persist) {
        return;
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!buffer_.empty()) {
        write_events_locked(buffer_);
        buffer_.clear();
    }
}

// ============================================================================
// Alerts
// ============================================================================

bool AuditLogger::should_alert(const SecurityEvent& event) const {
    return event.severity >= config_.alert_threshold || event.risk_score >= security::AUDIT_ALERT_RISK;
}

void AuditLogger::trigger_alert(const SecurityEvent& event) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        alerts_triggered_++;
    }

    std::string message = "AuditLogger: SECURITY ALERT " + event_type_to_string(event.event_type) +
                          " [" + severity_to_string(event.severity) + "] session=" + event.session_id +
                          " command=" + event.command + " risk=" + std::to_string(event.risk_score);
    if (event.severity >= SecuritySeverity::CRITICAL) {
        utilities::log_critical(message);
    } else {
        utilities::log_warn(message);
    }

    AlertHandler handler;
    {
        std::lock_guard<std::mutex> lock(alert_mutex_);
        handler = alert_handler_;
    }

    if (handler) {
        try {
            handler(event);
        } catch (const std::exception& ex) {
            utilities::log_error(std::string("AuditLogger: alert handler failed: ") + ex.what());
        }
    }
}

void AuditLogger::set_alert_handler(AlertHandler handler) {
    std::lock_guard<std::mutex> lock(alert_mutex_);
    alert_handler_ = std::move(handler);
}

// ============================================================================
// Statistics
// ============================================================================

void AuditLogger::update_statistics(const SecurityEvent& event) {
    uint64_t now = utilities::current_unix_time_ms();

    std::lock_guard<std::mutex> lock(stats_mutex_);
    total_events_++;
    events_by_type_[event_type_to_string(event.event_type)]++;
    events_by_severity_[severity_to_string(event.severity)]++;

    recent_events_ms_.push_back(now);
    if (event.risk_score >= security::AUDIT_HIGH_RISK) {
        recent_high_risk_ms_.push_back(now);
    }

    uint64_t cutoff = now > DAY_MS ? now - DAY_MS : 0;
    while (!recent_events_ms_.empty() && recent_events_ms_.front() < cutoff) {
        recent_events_ms_.pop_front();
    }
    while (!recent_high_risk_ms_.empty() && recent_high_risk_ms_.front() < cutoff) {
        recent_high_risk_ms_.pop_front();
    }
}

json AuditLogger::get_statistics() const {
    uint64_t now = utilities::current_unix_time_ms();

    json stats;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats["total_events"] = total_events_;
        stats["events_by_type"] = events_by_type_;
        stats["events_by_severity"] = events_by_severity_;
        stats["events_last_hour"] = count_since(recent_events_ms_, now > HOUR_MS ? now - HOUR_MS : 0);
        stats["events_last_day"] = count_since(recent_events_ms_, now > DAY_MS ? now - DAY_MS : 0);
        stats["high_risk_events_today"] = count_since(recent_high_risk_ms_, now > DAY_MS ? now - DAY_MS : 0);
        stats["alerts_triggered"] = alerts_triggered_;
    }
    stats["write_failures"] = write_failures_.load();

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        stats["buffered_events"] = buffer_.size();
        stats["log_file"] = log_path_.string();
    }

    return stats;
}

// ============================================================================
// Persistence
// ============================================================================

std::string AuditLogger::compute_record_hash(const std::string& previous_hash, const json& record) {
    return utilities::sha256_hex(previous_hash + dump_record(record));
}

void AuditLogger::write_events_locked(const std::vector<SecurityEvent>& events) {
    if (events.empty()) {
        return;
    }

    try {
        rotate_locked();

        std::string previous = last_hash_;
        uint64_t sequence = next_sequence_;
        std::string batch;

        for (const auto& event : events) {
            json record = event.to_json();
            record["sequence"] = sequence;
            record["prev_hash"] = previous;

            std::string hash = compute_record_hash(previous, record);
            record["hash"] = hash;

            batch += dump_record(record);
            batch += '\n';

            previous = hash;
            sequence++;
        }

        std::ofstream out(log_path_, std::ios::out | std::ios::app);
        if (!out.is_open()) {
            write_failures_ += events.size();
            utilities::log_error("AuditLogger: failed to open " + log_path_.string() + ", " +
                                 std::to_string(events.size()) + " events lost");
            return;
        }

        out << batch;
        out.flush();
        if (!out.good()) {
            write_failures_ += events.size();
            utilities::log_error("AuditLogger: write to " + log_path_.string() + " failed");
            return;
        }

        last_hash_ = previous;
        next_sequence_ = sequence;

    } catch (const std::exception& ex) {
        write_failures_ += events.size();
        utilities::log_error(std::string("AuditLogger: write failed: ") + ex.what());
    }
}

void AuditLogger::load_chain_state_locked() {
    last_hash_ = GENESIS_HASH;
    next_sequence_ = 0;

    if (!std::filesystem::exists(log_path_)) {
        return;
    }

    std::ifstream in(log_path_);
    std::string line;
    std::string last_line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            last_line = line;
        }
    }

    if (last_line.empty()) {
        return;
    }

    try {
        json record = json::parse(last_line);
        last_hash_ = record.at("hash").get<std::string>();
        next_sequence_ = record.at("sequence").get<uint64_t>() + 1;
    } catch (const json::exception& ex) {
        // Start a fresh chain, the unreadable file is kept as a rotated log
        utilities::log_warn("AuditLogger: cannot continue chain of " + log_path_.string() +
                            " (" + ex.what() + "), rotating");
        last_hash_ = GENESIS_HASH;
        next_sequence_ = 0;
        rotate_locked(true);
    }
}

bool AuditLogger::rotate_logs_if_needed() {
    if (!config_.persist) {
        return false;
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    return rotate_locked();
}

bool AuditLogger::rotate_locked(bool force) {
    std::error_code ec;
    if (!std::filesystem::exists(log_path_, ec)) {
        return false;
    }

    auto size = std::filesystem::file_size(log_path_, ec);
    if (ec || (!force && size <= config_.max_file_size)) {
        return false;
    }

    auto rotated = [this](size_t index) {
        return std::filesystem::path(log_path_.string() + "." + std::to_string(index));
    };

    if (config_.max_log_files == 0) {
        std::filesystem::remove(log_path_, ec);
    } else {
        std::filesystem::remove(rotated(config_.max_log_files), ec);
        for (size_t i = config_.max_log_files; i > 1; --i) {
            if (std::filesystem::exists(rotated(i - 1), ec)) {
                std::filesystem::rename(rotated(i - 1), rotated(i), ec);
            }
        }
        std::filesystem::rename(log_path_, rotated(1), ec);
    }

    if (ec) {
        utilities::log_error("AuditLogger: rotation of " + log_path_.string() + " failed: " + ec.message());
        return false;
    }

    // Each file carries its own chain
    last_hash_ = GENESIS_HASH;
    next_sequence_ = 0;

    utilities::log_info("AuditLogger: rotated " + log_path_.string());
    return true;
}

// ============================================================================
// Query / Verification
// ============================================================================

std::vector<SecurityEvent> AuditLogger::query_events(const AuditQuery& query) {
    std::vector<SecurityEvent> results;
    if (!config_.persist) {
        return results;
    }

    flush();

    std::ifstream in;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        in.open(log_path_);
    }
    if (!in.is_open()) {
        return results;
    }

    std::string line;
    while (std::getline(in, line) && results.size() < query.limit) {
        if (line.empty()) {
            continue;
        }

        std::optional<SecurityEvent> event;
        try {
            event = SecurityEvent::from_json(json::parse(line));
        } catch (const json::parse_error& ex) {
            utilities::log_warn(std::string("AuditLogger: skipping unreadable record: ") + ex.what());
            continue;
        }
        if (!event) {
            continue;
        }

        if (query.from_ms && event->timestamp_ms < *query.from_ms) continue;
        if (query.to_ms && event->timestamp_ms > *query.to_ms) continue;
        if (query.event_type && event->event_type != *query.event_type) continue;
        if (query.min_severity && event->severity < *query.min_severity) continue;
        if (query.session_id && event->session_id != *query.session_id) continue;

        results.push_back(std::move(*event));
    }

    return results;
}

bool AuditLogger::verify_log_integrity(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        utilities::log_error("AuditLogger: cannot open " + path.string() + " for verification");
        return false;
    }

    std::string expected_previous = GENESIS_HASH;
    uint64_t expected_sequence = 0;
    size_t line_number = 0;
    std::string line;

    while (std::getline(in, line)) {
        line_number++;
        if (line.empty()) {
            continue;
        }

        try {
            json record = json::parse(line);
            std::string stored_hash = record.at("hash").get<std::string>();
            std::string previous = record.at("prev_hash").get<std::string>();
            uint64_t sequence = record.at("sequence").get<uint64_t>();

            record.erase("hash");
            if (sequence != expected_sequence || previous != expected_previous ||
                compute_record_hash(previous, record) != stored_hash) {
                utilities::log_error("AuditLogger: integrity check failed at line " +
                                     std::to_string(line_number) + " of " + path.string());
                return false;
            }

            expected_previous = stored_hash;
            expected_sequence++;

        } catch (const json::exception& ex) {
            utilities::log_error("AuditLogger: malformed record at line " + std::to_string(line_number) +
                                 " of " + path.string() + ": " + ex.what());
            return false;
        }
    }

    return true;
}

} // namespace ipcguard
