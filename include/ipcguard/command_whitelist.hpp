/**
 * @file command_whitelist.hpp
 * @brief Command security profiles, aliases and permission hierarchy
 *
 * IPCGuard - IPC Command Authorization Pipeline
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Validation order for a command:
 * 1. Resolve alias; unknown name is denied (UNKNOWN_COMMAND, risk 50)
 * 2. BLOCKED classification is denied unconditionally
 * 3. Global attack patterns over command + arguments (MALICIOUS_PATTERN, risk 90)
 * 4. Required permissions against the expanded permission set
 * 5. MFA requirement
 * 6. Per-command blocked / allowed argument patterns (INVALID_ARGUMENTS)
 */

#pragma once

#include "ipcguard/security_types.hpp"

#include <string>
#include <vector>
#include <map>
#include <regex>
#include <optional>
#include <shared_mutex>

#include <nlohmann/json.hpp>

namespace ipcguard {

/**
 * @brief Security profile of one command
 */
struct CommandProfile {
    std::string name;                                   ///< Canonical command name
    SecurityClassification classification = SecurityClassification::AUTHENTICATED;
    PermissionSet required_permissions;                 ///< All must be held
    std::vector<std::string> allowed_arg_patterns;      ///< Every string argument must match one
    std::vector<std::string> blocked_arg_patterns;      ///< Any match denies
    uint8_t risk_score = 0;                             ///< 0-100
    std::optional<uint32_t> max_rate_per_minute;        ///< Per-command rate cap
    bool requires_mfa = false;
    std::string description;

    nlohmann::json to_json() const;

    /**
     * @brief Parse a profile
     * @param j JSON object with at least "name" and "classification"
     * @return Profile or std::nullopt if malformed
     */
    static std::optional<CommandProfile> from_json(const nlohmann::json& j);
};

/// Permission -> permissions it directly implies
using PermissionHierarchy = std::map<std::string, PermissionSet>;

/**
 * @brief Command classification and permission stage of the pipeline
 */
class CommandAuthorizer {
public:
    virtual ~CommandAuthorizer() = default;

    /**
     * @brief Authorize a command for a permission set
     * @param command Command name or alias
     * @param args Argument payload
     * @param user_permissions Permissions held by the session (unexpanded)
     * @param mfa_verified Whether the session completed MFA
     * @return ALLOWED, DENIED or REQUIRES_ELEVATION
     */
    virtual ValidationResult validate_command(
        const std::string& command,
        const nlohmann::json& args,
        const PermissionSet& user_permissions,
        bool mfa_verified
    ) const = 0;

    /**
     * @brief Resolve a name or alias to a registered canonical name
     * @return Canonical name or std::nullopt if unknown
     */
    virtual std::optional<std::string> resolve_command(const std::string& command) const = 0;

    virtual std::optional<CommandProfile> get_profile(const std::string& command) const = 0;

    virtual std::vector<CommandProfile> list_profiles() const = 0;

    virtual nlohmann::json get_security_stats() const = 0;
};

/**
 * @brief CommandWhitelist - default CommandAuthorizer
 *
 * Thread-safe: validation takes a shared lock, management operations an
 * exclusive one.
 */
class CommandWhitelist : public CommandAuthorizer {
public:
    /**
     * @brief Construct whitelist
     * @param profiles Initial command profiles
     * @param hierarchy Permission inheritance map
     * @param aliases Alias -> canonical name
     * @throws std::invalid_argument if a profile pattern does not compile
     */
    explicit CommandWhitelist(
        const std::vector<CommandProfile>& profiles = default_profiles(),
        PermissionHierarchy hierarchy = default_hierarchy(),
        const std::map<std::string, std::string>& aliases = {}
    );

    ~CommandWhitelist() override = default;

    CommandWhitelist(const CommandWhitelist&) = delete;
    CommandWhitelist& operator=(const CommandWhitelist&) = delete;
    CommandWhitelist(CommandWhitelist&&) = delete;
    CommandWhitelist& operator=(CommandWhitelist&&) = delete;

    ValidationResult validate_command(
        const std::string& command,
        const nlohmann::json& args,
        const PermissionSet& user_permissions,
        bool mfa_verified
    ) const override;

    std::optional<std::string> resolve_command(const std::string& command) const override;
    std::optional<CommandProfile> get_profile(const std::string& command) const override;
    std::vector<CommandProfile> list_profiles() const override;

    // ========================================================================
    // Management
    // ========================================================================

    /**
     * @brief Add or replace a command profile
     * @param profile Profile to register
     * @throws std::invalid_argument if a pattern does not compile or name is empty
     */
    void add_command(const CommandProfile& profile);

    /**
     * @brief Replace an existing command profile
     * @return true if the command existed and was replaced
     * @throws std::invalid_argument if a pattern does not compile
     */
    bool update_command(const CommandProfile& profile);

    /**
     * @brief Remove a command and every alias pointing at it
     * @return true if the command existed
     */
    bool remove_command(const std::string& command);

    /**
     * @brief Register an alias
     * @param alias Alternate name
     * @param target Canonical command name (must be registered)
     * @return true if registered, false if target unknown
     */
    bool add_alias(const std::string& alias, const std::string& target);

    bool remove_alias(const std::string& alias);

    /**
     * @brief Set the permissions implied by a permission (replaces previous entry)
     */
    void set_permission_inheritance(const std::string& permission, const PermissionSet& implied);

    /**
     * @brief Transitive closure of a permission set through the hierarchy
     * @param permissions Held permissions
     * @return Expanded set (idempotent)
     */
    PermissionSet expand_permissions(const PermissionSet& permissions) const;

    /**
     * @brief Non-blocked commands executable with the given permissions
     */
    std::vector<CommandProfile> list_available_commands(const PermissionSet& permissions) const;

    /**
     * @brief Registry statistics
     * @return JSON with total_commands, commands_by_classification,
     *         blocked_patterns, aliases, high_risk_commands
     */
    nlohmann::json get_security_stats() const override;

    // ========================================================================
    // Defaults
    // ========================================================================

    static std::vector<CommandProfile> default_profiles();
    static PermissionHierarchy default_hierarchy();
    static std::vector<std::string> default_global_patterns();

private:
    struct CompiledPattern {
        std::string source;
        std::regex regex;
    };

    /// Profile with its argument patterns compiled
    struct CompiledProfile {
        CommandProfile profile;
        std::vector<CompiledPattern> allowed;
        std::vector<CompiledPattern> blocked;
    };

    std::map<std::string, CompiledProfile> commands_;
    std::map<std::string, std::string> aliases_;
    PermissionHierarchy hierarchy_;
    std::vector<CompiledPattern> global_patterns_;

    mutable std::shared_mutex mutex_;

    static CompiledProfile compile_profile(const CommandProfile& profile);

    // Callers hold mutex_
    std::optional<std::string> resolve_locked(const std::string& command) const;
    PermissionSet expand_locked(const PermissionSet& permissions) const;
    std::optional<std::string> match_global_patterns(
        const std::string& command,
        const nlohmann::json& args
    ) const;
    static std::optional<std::string> check_arguments(
        const CompiledProfile& compiled,
        const nlohmann::json& args
    );
};

} // namespace ipcguard
