/**
 * @file utilities.hpp
 * @brief Shared helpers for IPCGuard components
 *
 * IPCGuard - IPC Command Authorization Pipeline
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Helpers used across the pipeline:
 * - Diagnostic logging (spdlog)
 * - Clock and ISO 8601 formatting
 * - Audit hashing and random identifiers (libsodium)
 * - Case folding and affix checks for the sanitizer
 */

#pragma once

#include <string>
#include <cstdint>
#include <optional>

namespace ipcguard {
namespace utilities {

// ============================================================================
// Diagnostic Logging
// ============================================================================

/**
 * @brief Diagnostic log levels
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Parse a level name ("debug", "WARN", ...); case-insensitive
 * @return Level or std::nullopt if the name is unknown
 */
std::optional<LogLevel> string_to_log_level(const std::string& name);

/**
 * @brief (Re)configure the diagnostic logger
 *
 * Messages go to a colored stdout sink and, when log_file is non-empty,
 * to a rotating file. Without a call the logger is set up lazily at INFO.
 *
 * @param log_file Rotating log file path (empty for stdout only)
 * @param level Minimum level emitted
 */
void initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

void log(LogLevel level, const std::string& message);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);
void log_critical(const std::string& message);

// ============================================================================
// Time
// ============================================================================

/**
 * @brief Format Unix seconds as UTC ISO 8601 (e.g. "2025-11-10T15:30:45Z")
 */
std::string format_timestamp(uint64_t timestamp);

/// Wall clock in milliseconds since the epoch
uint64_t current_unix_time_ms();

// ============================================================================
// Files, Hashing and Identifiers
// ============================================================================

/**
 * @brief Read a whole file
 * @return Contents or std::nullopt if the file cannot be read
 */
std::optional<std::string> read_file(const std::string& file_path);

/**
 * @brief SHA-256 digest as 64 lowercase hex characters
 * @throws std::runtime_error if libsodium cannot be initialized
 */
std::string sha256_hex(const std::string& input);

/**
 * @brief Random RFC 4122 version 4 UUID from the libsodium CSPRNG
 * @throws std::runtime_error if libsodium cannot be initialized
 */
std::string generate_uuid();

// ============================================================================
// Strings
// ============================================================================

std::string to_lowercase(std::string str);
std::string to_uppercase(std::string str);

bool starts_with(const std::string& str, const std::string& prefix);
bool ends_with(const std::string& str, const std::string& suffix);

} // namespace utilities
} // namespace ipcguard
