/**
 * @file utilities.cpp
 * @brief Shared helpers for IPCGuard components
 *
 * IPCGuard - IPC Command Authorization Pipeline
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "ipcguard/utilities.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <sodium.h>

#include <array>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace ipcguard {
namespace utilities {

namespace {

// ============================================================================
// Logger State
// ============================================================================

constexpr const char* LOGGER_NAME = "ipcguard";
constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr size_t LOG_FILE_SIZE = 10 * 1024 * 1024;
constexpr size_t LOG_FILE_COUNT = 3;

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

spdlog::level::level_enum spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:    return spdlog::level::debug;
        case LogLevel::INFO:     return spdlog::level::info;
        case LogLevel::WARN:     return spdlog::level::warn;
        case LogLevel::ERROR:    return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

// Caller holds g_logger_mutex
void build_logger(const std::string& log_file, LogLevel level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (!log_file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, LOG_FILE_SIZE, LOG_FILE_COUNT));
        }

        auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        logger->set_level(spdlog_level(level));
        logger->set_pattern(LOG_PATTERN);

        spdlog::set_default_logger(logger);
        g_logger = std::move(logger);
    } catch (const spdlog::spdlog_ex& ex) {
        std::fprintf(stderr, "IPCGuard: logger setup failed: %s\n", ex.what());
    }
}

std::shared_ptr<spdlog::logger> current_logger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger) {
        build_logger("", LogLevel::INFO);
    }
    return g_logger;
}

// ============================================================================
// libsodium
// ============================================================================

void ensure_sodium() {
    static const int status = sodium_init();
    if (status < 0) {
        throw std::runtime_error("libsodium initialization failed");
    }
}

} // anonymous namespace

// ============================================================================
// Logging
// ============================================================================

std::optional<LogLevel> string_to_log_level(const std::string& name) {
    const std::string upper = to_uppercase(name);
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    return std::nullopt;
}

void initialize_logging(const std::string& log_file, LogLevel level) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    build_logger(log_file, level);
}

void log(LogLevel level, const std::string& message) {
    if (auto logger = current_logger()) {
        logger->log(spdlog_level(level), message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

void log_debug(const std::string& message) { log(LogLevel::DEBUG, message); }
void log_info(const std::string& message) { log(LogLevel::INFO, message); }
void log_warn(const std::string& message) { log(LogLevel::WARN, message); }
void log_error(const std::string& message) { log(LogLevel::ERROR, message); }
void log_critical(const std::string& message) { log(LogLevel::CRITICAL, message); }

// ============================================================================
// Time
// ============================================================================

std::string format_timestamp(uint64_t timestamp) {
    const std::time_t seconds = static_cast<std::time_t>(timestamp);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buffer[sizeof("YYYY-MM-DDTHH:MM:SSZ") + 8];
    const size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buffer, written);
}

uint64_t current_unix_time_ms() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

// ============================================================================
// Files, Hashing and Identifiers
// ============================================================================

std::optional<std::string> read_file(const std::string& file_path) {
    std::ifstream in(file_path, std::ios::binary);
    if (!in) {
        log_warn("Utilities: cannot open " + file_path);
        return std::nullopt;
    }

    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        log_error("Utilities: read error on " + file_path);
        return std::nullopt;
    }
    return content;
}

std::string sha256_hex(const std::string& input) {
    ensure_sodium();

    std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
    crypto_hash_sha256(digest.data(),
                       reinterpret_cast<const unsigned char*>(input.data()),
                       input.size());

    std::array<char, crypto_hash_sha256_BYTES * 2 + 1> hex{};
    sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
    return std::string(hex.data(), crypto_hash_sha256_BYTES * 2);
}

std::string generate_uuid() {
    ensure_sodium();

    std::array<unsigned char, 16> bytes{};
    randombytes_buf(bytes.data(), bytes.size());
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    static const char digits[] = "0123456789abcdef";
    std::string uuid;
    uuid.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            uuid.push_back('-');
        }
        uuid.push_back(digits[bytes[i] >> 4]);
        uuid.push_back(digits[bytes[i] & 0x0F]);
    }
    return uuid;
}

// ============================================================================
// Strings
// ============================================================================

std::string to_lowercase(std::string str) {
    for (char& c : str) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return str;
}

std::string to_uppercase(std::string str) {
    for (char& c : str) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return str;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace utilities
} // namespace ipcguard
