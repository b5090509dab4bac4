/**
 * @file security_config.hpp
 * @brief Security limits, error codes and default tunables for IPCGuard
 *
 * IPCGuard - IPC Command Authorization Pipeline
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstdint>
#include <chrono>
#include <string>
#include <filesystem>

namespace ipcguard {
namespace security {

// ============================================================================
// Input Limits
// ============================================================================

/// Maximum length of a single string argument
constexpr size_t MAX_STRING_LENGTH = 10000;

/// Maximum number of elements in an argument array
constexpr size_t MAX_ARRAY_LENGTH = 1000;

/// Maximum nesting depth of an argument structure
constexpr size_t MAX_OBJECT_DEPTH = 10;

/// Maximum number of properties in an argument object
constexpr size_t MAX_OBJECT_PROPERTIES = 100;

/// Maximum command name length
constexpr size_t MAX_COMMAND_NAME_LENGTH = 100;

/// Maximum identifier length (session ID, window label)
constexpr size_t MAX_IDENTIFIER_LENGTH = 64;

/// Maximum size of the serialized argument structure; bounds every regex scan
constexpr size_t MAX_ARGUMENT_BYTES = 10 * 1024;

// ============================================================================
// Sanitizer Error Codes
// ============================================================================

constexpr uint16_t ERR_STRING_TOO_LONG = 1001;
constexpr uint16_t ERR_BLOCKED_PATTERN = 1002;
constexpr uint16_t ERR_INVALID_CHARACTERS = 1003;
constexpr uint16_t ERR_URL_SCHEME = 1004;
constexpr uint16_t ERR_URL_FORMAT = 1005;
constexpr uint16_t ERR_PATH_TRAVERSAL = 1006;
constexpr uint16_t ERR_PATH_OUTSIDE_BASE = 1007;
constexpr uint16_t ERR_BLOCKED_EXTENSION = 1008;
constexpr uint16_t ERR_COMMAND_CHARACTERS = 1009;
constexpr uint16_t ERR_COMMAND_LENGTH = 1010;
constexpr uint16_t ERR_JSON_DEPTH = 1011;
constexpr uint16_t ERR_JSON_PROPERTIES = 1012;
constexpr uint16_t ERR_ARRAY_LENGTH = 1013;
constexpr uint16_t ERR_SQL_KEYWORD = 1014;
constexpr uint16_t ERR_SQL_INJECTION = 1015;
constexpr uint16_t ERR_INTERNAL_REGEX = 1016;
constexpr uint16_t ERR_EMAIL_FORMAT = 1017;
constexpr uint16_t ERR_NUMBER_BELOW_MIN = 1018;
constexpr uint16_t ERR_NUMBER_ABOVE_MAX = 1019;
constexpr uint16_t ERR_NUMBER_NOT_FINITE = 1020;
constexpr uint16_t ERR_ARGUMENTS_TOO_LARGE = 1021;

// ============================================================================
// Rate Limiting
// ============================================================================

/// Requests per second per (session, endpoint)
constexpr uint32_t RATE_LIMIT_PER_SECOND = 10;

/// Requests per minute per (session, endpoint)
constexpr uint32_t RATE_LIMIT_PER_MINUTE = 100;

/// Requests allowed inside the burst window
constexpr uint32_t RATE_LIMIT_BURST = 20;

/// Burst evaluation window
constexpr auto RATE_LIMIT_BURST_WINDOW = std::chrono::seconds(5);

/// Limited outcomes before a penalty is applied
constexpr uint32_t RATE_LIMIT_VIOLATION_THRESHOLD = 5;

/// Base cooldown before the penalty multiplier is applied
constexpr auto RATE_LIMIT_COOLDOWN = std::chrono::seconds(300);

/// Default penalty multiplier
constexpr double RATE_LIMIT_PENALTY_MULTIPLIER = 0.5;

/// Idle keys older than this are pruned
constexpr auto RATE_LIMIT_IDLE_TIMEOUT = std::chrono::hours(1);

/// Number of lock shards in the rate limiter
constexpr size_t RATE_LIMIT_SHARDS = 16;

// ============================================================================
// Sessions
// ============================================================================

/// Absolute session lifetime
constexpr auto SESSION_LIFETIME = std::chrono::hours(24);

/// Inactivity timeout
constexpr auto SESSION_MAX_INACTIVE = std::chrono::minutes(30);

/// Failed attempts before a session is suspended
constexpr uint32_t SESSION_MAX_FAILED_ATTEMPTS = 5;

// ============================================================================
// Audit
// ============================================================================

/// Buffered events before a batch write
constexpr size_t AUDIT_BUFFER_SIZE = 100;

/// Audit file size before rotation (100MB)
constexpr uint64_t AUDIT_MAX_FILE_SIZE = 100ULL * 1024 * 1024;

/// Rotated audit files kept
constexpr size_t AUDIT_MAX_LOG_FILES = 10;

/// Risk score at or above which an alert is raised
constexpr uint8_t AUDIT_ALERT_RISK = 70;

/// Risk score counted as high-risk in statistics
constexpr uint8_t AUDIT_HIGH_RISK = 50;

// ============================================================================
// Maintenance
// ============================================================================

/// Background sweep interval
constexpr auto CLEANUP_INTERVAL = std::chrono::seconds(60);

// ============================================================================
// Directory Configuration
// ============================================================================

/**
 * @brief Data directory: IPCGUARD_DATA_DIR or /opt/fsi/var/ipcguard, created on demand
 * @throws std::filesystem::filesystem_error if the directory cannot be created
 */
std::filesystem::path get_data_directory();

/// `logs/` under the data directory; default home of the audit log
std::filesystem::path get_log_directory();

// ============================================================================
// Input Validation
// ============================================================================

/**
 * @brief Check an identifier such as a session id: non-empty, at most max_length,
 *        ASCII letters, digits, '_' and '-' only
 */
bool validate_identifier(const std::string& identifier, size_t max_length = MAX_IDENTIFIER_LENGTH);

/**
 * @brief Whether path resolves to base_dir or somewhere beneath it
 *
 * Both paths are resolved with symlinks and ".." collapsed before the
 * component-wise comparison. Resolution errors count as unsafe.
 */
bool is_safe_path(const std::filesystem::path& path, const std::filesystem::path& base_dir);

} // namespace security
} // namespace ipcguard
