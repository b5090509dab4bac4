/**
 * @file gateway_config.hpp
 * @brief Aggregate runtime configuration of the security gateway
 *
 * IPCGuard - IPC Command Authorization Pipeline
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * JSON layout (every key optional, missing keys keep defaults):
 * {
 *   "sanitizer": {...},
 *   "rate_limits": {"default": {...}, "endpoints": {"name": {...}}},
 *   "sessions": {...},
 *   "audit": {...},
 *   "commands": [profile, ...],
 *   "aliases": {"alias": "command"},
 *   "permission_hierarchy": {"permission": ["implied", ...]},
 *   "maintenance_interval_seconds": 60,
 *   "escalate_violations_to_session": false
 * }
 */

#pragma once

#include "ipcguard/input_sanitizer.hpp"
#include "ipcguard/command_whitelist.hpp"
#include "ipcguard/rate_limiter.hpp"
#include "ipcguard/session_registry.hpp"
#include "ipcguard/audit_logger.hpp"
#include "ipcguard/security_config.hpp"

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

namespace ipcguard {

/**
 * @brief Configuration of every default component of a SecurityGateway
 */
struct GatewayConfig {
    SanitizationConfig sanitizer;
    RateLimitConfig default_rate_limit;
    std::map<std::string, RateLimitConfig> endpoint_rate_limits;   ///< Explicit per-command overrides
    SessionConfig sessions;
    AuditConfig audit;
    std::vector<CommandProfile> commands = CommandWhitelist::default_profiles();
    std::map<std::string, std::string> aliases;
    PermissionHierarchy permission_hierarchy = CommandWhitelist::default_hierarchy();
    std::chrono::seconds maintenance_interval = security::CLEANUP_INTERVAL;

    /// Record a failed attempt on the session for rejected input, malicious
    /// patterns and blocked commands
    bool escalate_violations_to_session = false;

    nlohmann::json to_json() const;

    /**
     * @brief Parse a configuration document
     * @param j JSON object
     * @return Config or std::nullopt if any section is malformed
     */
    static std::optional<GatewayConfig> from_json(const nlohmann::json& j);

    /**
     * @brief Load a configuration document from disk
     * @param path JSON file
     * @return Config or std::nullopt if unreadable or malformed
     */
    static std::optional<GatewayConfig> load_from_file(const std::filesystem::path& path);
};

} // namespace ipcguard
