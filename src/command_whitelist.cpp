/**
 * @file command_whitelist.cpp
 * @brief Implementation of command profiles and permission checks
 *
 * IPCGuard - IPC Command Authorization Pipeline
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "ipcguard/command_whitelist.hpp"
#include "ipcguard/security_config.hpp"
#include "ipcguard/utilities.hpp"

#include <algorithm>
#include <stdexcept>
#include <mutex>

using json = nlohmann::json;

namespace ipcguard {

namespace {
    constexpr uint8_t UNKNOWN_COMMAND_RISK = 50;
    constexpr uint8_t MALICIOUS_PATTERN_RISK = 90;
    constexpr uint8_t INVALID_ARGUMENTS_PENALTY = 20;
    constexpr uint8_t HIGH_RISK_COMMAND = 70;

    void collect_string_leaves(const json& value, std::vector<std::string>& leaves) {
        if (value.is_string()) {
            leaves.push_back(value.get<std::string>());
        } else if (value.is_structured()) {
            for (const auto& item : value) {
                collect_string_leaves(item, leaves);
            }
        }
    }

    std::string serialize_args(const json& args) {
        return args.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    CommandProfile make_profile(
        const std::string& name,
        SecurityClassification classification,
        PermissionSet permissions,
        std::optional<uint32_t> max_rate,
        std::vector<std::string> allowed,
        std::vector<std::string> blocked,
        uint8_t risk,
        bool mfa,
        const std::string& description
    ) {
        CommandProfile profile;
        profile.name = name;
        profile.classification = classification;
        profile.required_permissions = std::move(permissions);
        profile.max_rate_per_minute = max_rate;
        profile.allowed_arg_patterns = std::move(allowed);
        profile.blocked_arg_patterns = std::move(blocked);
        profile.risk_score = risk;
        profile.requires_mfa = mfa;
        profile.description = description;
        return profile;
    }
}

// ============================================================================
// CommandProfile Serialization
// ============================================================================

json CommandProfile::to_json() const {
    json j;
    j["name"] = name;
    j["classification"] = classification_to_string(classification);
    j["required_permissions"] = required_permissions;
    j["allowed_arg_patterns"] = allowed_arg_patterns;
    j["blocked_arg_patterns"] = blocked_arg_patterns;
    j["risk_score"] = risk_score;
    if (max_rate_per_minute) {
        j["max_rate_per_minute"] = *max_rate_per_minute;
    } else {
        j["max_rate_per_minute"] = nullptr;
    }
    j["requires_mfa"] = requires_mfa;
    j["description"] = description;
    return j;
}

std::optional<CommandProfile> CommandProfile::from_json(const json& j) {
    try {
        if (!j.is_object()) {
            return std::nullopt;
        }

        CommandProfile profile;
        profile.name = j.at("name").get<std::string>();
        if (profile.name.empty()) {
            return std::nullopt;
        }

        auto classification = string_to_classification(j.at("classification").get<std::string>());
        if (!classification) {
            return std::nullopt;
        }
        profile.classification = *classification;

        profile.required_permissions = j.value("required_permissions", PermissionSet{});
        profile.allowed_arg_patterns = j.value("allowed_arg_patterns", std::vector<std::string>{});
        profile.blocked_arg_patterns = j.value("blocked_arg_patterns", std::vector<std::string>{});

        int risk = j.value("risk_score", 0);
        if (risk < 0 || risk > 100) {
            return std::nullopt;
        }
        profile.risk_score = static_cast<uint8_t>(risk);

        if (j.contains("max_rate_per_minute") && !j["max_rate_per_minute"].is_null()) {
            profile.max_rate_per_minute = j["max_rate_per_minute"].get<uint32_t>();
        }
        profile.requires_mfa = j.value("requires_mfa", false);
        profile.description = j.value("description", std::string());

        return profile;

    } catch (const json::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// Constructor
// ============================================================================

CommandWhitelist::CommandWhitelist(
    const std::vector<CommandProfile>& profiles,
    PermissionHierarchy hierarchy,
    const std::map<std::string, std::string>& aliases
)
    : hierarchy_(std::move(hierarchy))
{
    for (const auto& pattern : default_global_patterns()) {
        global_patterns_.push_back({pattern, std::regex(pattern)});
    }

    for (const auto& profile : profiles) {
        if (profile.name.empty()) {
            throw std::invalid_argument("Command profile with empty name");
        }
        commands_[profile.name] = compile_profile(profile);
    }

    for (const auto& entry : aliases) {
        if (commands_.find(entry.second) == commands_.end()) {
            utilities::log_warn("CommandWhitelist: alias '" + entry.first +
                                "' targets unknown command '" + entry.second + "'");
            continue;
        }
        aliases_[entry.first] = entry.second;
    }
}

CommandWhitelist::CompiledProfile CommandWhitelist::compile_profile(const CommandProfile& profile) {
    CompiledProfile compiled;
    compiled.profile = profile;

    auto compile = [&profile](const std::string& pattern) {
        try {
            return CompiledPattern{pattern, std::regex(pattern)};
        } catch (const std::regex_error& ex) {
            throw std::invalid_argument("Invalid pattern '" + pattern + "' in command '" +
                                        profile.name + "': " + ex.what());
        }
    };

    for (const auto& pattern : profile.allowed_arg_patterns) {
        compiled.allowed.push_back(compile(pattern));
    }
    for (const auto& pattern : profile.blocked_arg_patterns) {
        compiled.blocked.push_back(compile(pattern));
    }

    return compiled;
}

// ============================================================================
// Validation
// ============================================================================

ValidationResult CommandWhitelist::validate_command(
    const std::string& command,
    const json& args,
    const PermissionSet& user_permissions,
    bool mfa_verified
) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto resolved = resolve_locked(command);
    if (!resolved) {
        return ValidationResult::denied(
            ViolationType::UNKNOWN_COMMAND, "Unknown command", UNKNOWN_COMMAND_RISK,
            "command '" + command + "' is not registered");
    }

    const CompiledProfile& compiled = commands_.at(*resolved);
    const CommandProfile& profile = compiled.profile;

    // Absolute veto, evaluated before any permission logic
    if (profile.classification == SecurityClassification::BLOCKED) {
        auto result = ValidationResult::denied(
            ViolationType::COMMAND_BLOCKED, "Command is permanently blocked", profile.risk_score,
            "profile '" + profile.name + "' is BLOCKED");
        result.command = *resolved;
        return result;
    }

    // Pattern scans recurse per character; refuse unbounded input before any regex runs
    const size_t argument_bytes = serialize_args(args).size();
    if (argument_bytes > security::MAX_ARGUMENT_BYTES) {
        uint8_t risk = static_cast<uint8_t>(
            std::min<int>(100, profile.risk_score + INVALID_ARGUMENTS_PENALTY));
        auto result = ValidationResult::denied(
            ViolationType::INVALID_ARGUMENTS, "Invalid arguments", risk,
            "arguments of " + std::to_string(argument_bytes) + " bytes exceed " +
            std::to_string(security::MAX_ARGUMENT_BYTES));
        result.command = *resolved;
        return result;
    }

    if (auto pattern = match_global_patterns(command, args)) {
        auto result = ValidationResult::denied(
            ViolationType::MALICIOUS_PATTERN, "Request contains a blocked pattern",
            MALICIOUS_PATTERN_RISK, "global pattern: " + *pattern);
        result.command = *resolved;
        return result;
    }

    PermissionSet expanded = expand_locked(user_permissions);
    bool has_permissions = std::includes(
        expanded.begin(), expanded.end(),
        profile.required_permissions.begin(), profile.required_permissions.end());
    if (!has_permissions) {
        auto result = ValidationResult::requires_elevation(
            profile.required_permissions, "insufficient permissions");
        result.command = *resolved;
        return result;
    }

    if (profile.requires_mfa && !mfa_verified) {
        auto result = ValidationResult::requires_elevation({"mfa.verified"}, "mfa required");
        result.command = *resolved;
        return result;
    }

    if (auto violation = check_arguments(compiled, args)) {
        uint8_t risk = static_cast<uint8_t>(
            std::min<int>(100, profile.risk_score + INVALID_ARGUMENTS_PENALTY));
        auto result = ValidationResult::denied(
            ViolationType::INVALID_ARGUMENTS, "Invalid arguments", risk, *violation);
        result.command = *resolved;
        return result;
    }

    return ValidationResult::allowed(*resolved, args, profile.risk_score, profile.required_permissions);
}

std::optional<std::string> CommandWhitelist::match_global_patterns(
    const std::string& command,
    const json& args
) const {
    std::vector<std::string> texts;
    texts.push_back(command + " " + serialize_args(args));
    collect_string_leaves(args, texts);

    for (const auto& pattern : global_patterns_) {
        for (const auto& text : texts) {
            if (std::regex_search(text, pattern.regex)) {
                return pattern.source;
            }
        }
    }

    return std::nullopt;
}

std::optional<std::string> CommandWhitelist::check_arguments(
    const CompiledProfile& compiled,
    const json& args
) {
    std::vector<std::string> leaves;
    collect_string_leaves(args, leaves);
    std::string serialized = serialize_args(args);

    for (const auto& pattern : compiled.blocked) {
        if (std::regex_search(serialized, pattern.regex)) {
            return "blocked argument pattern: " + pattern.source;
        }
        for (const auto& leaf : leaves) {
            if (std::regex_search(leaf, pattern.regex)) {
                return "blocked argument pattern: " + pattern.source;
            }
        }
    }

    if (compiled.allowed.empty()) {
        return std::nullopt;
    }

    for (const auto& leaf : leaves) {
        bool matched = std::any_of(compiled.allowed.begin(), compiled.allowed.end(),
            [&leaf](const CompiledPattern& pattern) {
                return std::regex_search(leaf, pattern.regex);
            });
        if (!matched) {
            return "argument does not match any allowed pattern";
        }
    }

    return std::nullopt;
}

// ============================================================================
// Lookup
// ============================================================================

std::optional<std::string> CommandWhitelist::resolve_locked(const std::string& command) const {
    auto alias = aliases_.find(command);
    const std::string& name = (alias != aliases_.end()) ? alias->second : command;

    if (commands_.find(name) == commands_.end()) {
        return std::nullopt;
    }
    return name;
}

std::optional<std::string> CommandWhitelist::resolve_command(const std::string& command) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return resolve_locked(command);
}

std::optional<CommandProfile> CommandWhitelist::get_profile(const std::string& command) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto resolved = resolve_locked(command);
    if (!resolved) {
        return std::nullopt;
    }
    return commands_.at(*resolved).profile;
}

std::vector<CommandProfile> CommandWhitelist::list_profiles() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<CommandProfile> profiles;
    profiles.reserve(commands_.size());
    for (const auto& entry : commands_) {
        profiles.push_back(entry.second.profile);
    }
    return profiles;
}

// ============================================================================
// Permission Hierarchy
// ============================================================================

PermissionSet CommandWhitelist::expand_locked(const PermissionSet& permissions) const {
    PermissionSet expanded = permissions;

    // Repeat until no new permission is added
    bool grew = true;
    while (grew) {
        grew = false;
        PermissionSet snapshot = expanded;
        for (const auto& permission : snapshot) {
            auto it = hierarchy_.find(permission);
            if (it == hierarchy_.end()) {
                continue;
            }
            for (const auto& implied : it->second) {
                if (expanded.insert(implied).second) {
                    grew = true;
                }
            }
        }
    }

    return expanded;
}

PermissionSet CommandWhitelist::expand_permissions(const PermissionSet& permissions) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return expand_locked(permissions);
}

void CommandWhitelist::set_permission_inheritance(
    const std::string& permission,
    const PermissionSet& implied
) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    hierarchy_[permission] = implied;
}

// ============================================================================
// Management
// ============================================================================

void CommandWhitelist::add_command(const CommandProfile& profile) {
    if (profile.name.empty()) {
        throw std::invalid_argument("Command profile with empty name");
    }

    // Compile outside the lock
    CompiledProfile compiled = compile_profile(profile);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    commands_[profile.name] = std::move(compiled);
    utilities::log_info("CommandWhitelist: registered command '" + profile.name + "' (" +
                        classification_to_string(profile.classification) + ")");
}

bool CommandWhitelist::update_command(const CommandProfile& profile) {
    CompiledProfile compiled = compile_profile(profile);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = commands_.find(profile.name);
    if (it == commands_.end()) {
        return false;
    }
    it->second = std::move(compiled);
    return true;
}

bool CommandWhitelist::remove_command(const std::string& command) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (commands_.erase(command) == 0) {
        return false;
    }

    for (auto it = aliases_.begin(); it != aliases_.end(); ) {
        if (it->second == command) {
            it = aliases_.erase(it);
        } else {
            ++it;
        }
    }
    return true;
}

bool CommandWhitelist::add_alias(const std::string& alias, const std::string& target) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (alias.empty() || commands_.find(target) == commands_.end()) {
        return false;
    }
    aliases_[alias] = target;
    return true;
}

bool CommandWhitelist::remove_alias(const std::string& alias) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return aliases_.erase(alias) > 0;
}

std::vector<CommandProfile> CommandWhitelist::list_available_commands(
    const PermissionSet& permissions
) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    PermissionSet expanded = expand_locked(permissions);
    std::vector<CommandProfile> available;

    for (const auto& entry : commands_) {
        const CommandProfile& profile = entry.second.profile;
        if (profile.classification == SecurityClassification::BLOCKED) {
            continue;
        }
        if (std::includes(expanded.begin(), expanded.end(),
                          profile.required_permissions.begin(),
                          profile.required_permissions.end())) {
            available.push_back(profile);
        }
    }

    return available;
}

json CommandWhitelist::get_security_stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    json by_classification = json::object();
    size_t high_risk = 0;
    for (const auto& entry : commands_) {
        const CommandProfile& profile = entry.second.profile;
        std::string key = classification_to_string(profile.classification);
        by_classification[key] = by_classification.value(key, 0) + 1;
        if (profile.risk_score >= HIGH_RISK_COMMAND) {
            high_risk++;
        }
    }

    json stats;
    stats["total_commands"] = commands_.size();
    stats["commands_by_classification"] = by_classification;
    stats["blocked_patterns"] = global_patterns_.size();
    stats["aliases"] = aliases_.size();
    stats["high_risk_commands"] = high_risk;
    return stats;
}

// ============================================================================
// Defaults
// ============================================================================

std::vector<CommandProfile> CommandWhitelist::default_profiles() {
    using SC = SecurityClassification;

    return {
        make_profile("get_app_info", SC::PUBLIC, {}, 60, {}, {}, 0, false,
                     "Get application information"),
        make_profile("get_system_info", SC::PUBLIC, {}, 30, {}, {}, 5, false,
                     "Get basic system information"),
        make_profile("get_settings", SC::AUTHENTICATED, {"settings.read"}, 120,
                     {R"(^[a-zA-Z0-9._-]+$)"}, {R"(\.\.)", R"(\/)"}, 10, false,
                     "Get user settings"),
        make_profile("save_settings", SC::AUTHENTICATED, {"settings.write"}, 30,
                     {}, {R"(<script)", R"(javascript:)", R"(eval\()"}, 20, false,
                     "Save user settings"),
        make_profile("create_project", SC::PRIVILEGED, {"project.create"}, 10,
                     {R"(^[a-zA-Z0-9._-]+$)"},
                     {R"(\.\.)", R"(\/etc\/)", R"(\/root\/)", R"(\.exe$)"}, 40, false,
                     "Create new project"),
        make_profile("run_command", SC::PRIVILEGED, {"system.execute"}, 5,
                     {R"(^npm )", R"(^yarn )", R"(^git )"},
                     {R"(rm -rf)", R"(sudo )", R"(chmod )", R"(\.sh$)", R"(\.exe$)",
                      R"(powershell)", R"(cmd\.exe)"}, 70, false,
                     "Execute allowed system commands"),
        make_profile("update_app", SC::ADMINISTRATIVE, {"app.update", "admin"}, 2,
                     {}, {}, 60, true,
                     "Update application"),
        make_profile("install_extension", SC::ADMINISTRATIVE, {"extension.install", "admin"}, 3,
                     {R"(^https://[a-zA-Z0-9.-]+/)"},
                     {R"(javascript:)", R"(data:)", R"(file://)"}, 80, true,
                     "Install application extension"),
        make_profile("execute_system_command", SC::BLOCKED, {}, std::nullopt, {}, {}, 100, false,
                     "Direct system command execution"),
        make_profile("read_sensitive_files", SC::BLOCKED, {}, std::nullopt, {}, {}, 100, false,
                     "Read sensitive system files"),
        make_profile("modify_system_settings", SC::BLOCKED, {}, std::nullopt, {}, {}, 100, false,
                     "Modify operating system settings")
    };
}

PermissionHierarchy CommandWhitelist::default_hierarchy() {
    return {
        {"admin", {"poweruser", "project.delete", "app.update", "extension.install", "user.manage"}},
        {"poweruser", {"user", "project.create", "system.execute"}},
        {"user", {"settings.read", "settings.write"}}
    };
}

std::vector<std::string> CommandWhitelist::default_global_patterns() {
    return {
        R"(<script[\s\S]*?</script>)",
        R"(javascript:)",
        R"(data:text/html)",
        R"(eval\s*\()",
        R"(Function\s*\()",
        R"(setTimeout\s*\()",
        R"(setInterval\s*\()",
        R"(\.\./)",
        R"(\.\.\\)",
        R"(/etc/passwd)",
        R"(/etc/shadow)",
        R"(C:\\Windows\\System32)",
        R"(rm\s+-rf\s+/)",
        R"(sudo\s+rm)",
        R"(>\s*/dev/null\s+2>&1)",
        R"(\|\s*sh)",
        R"(\|\s*bash)",
        R"(\$\([^)]+\))",
        R"(`[^`]+`)"
    };
}

} // namespace ipcguard
