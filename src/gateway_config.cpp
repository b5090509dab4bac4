/**
 * @file gateway_config.cpp
 * @brief Implementation of gateway configuration loading
 *
 * IPCGuard - IPC Command Authorization Pipeline
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "ipcguard/gateway_config.hpp"
#include "ipcguard/utilities.hpp"

using json = nlohmann::json;

namespace ipcguard {

namespace {

json sanitizer_to_json(const SanitizationConfig& config) {
    json j;
    j["max_string_length"] = config.max_string_length;
    j["max_array_length"] = config.max_array_length;
    j["max_object_depth"] = config.max_object_depth;
    j["max_object_properties"] = config.max_object_properties;
    j["max_command_name_length"] = config.max_command_name_length;
    j["max_argument_bytes"] = config.max_argument_bytes;
    j["allowed_url_schemes"] = config.allowed_url_schemes;
    j["allowed_base_directories"] = config.allowed_base_directories;
    j["blocked_extensions"] = config.blocked_extensions;
    j["blocked_patterns"] = config.blocked_patterns;
    return j;
}

// Throws json::exception on type mismatch
SanitizationConfig sanitizer_from_json(const json& j, const SanitizationConfig& base) {
    SanitizationConfig config = base;
    config.max_string_length = j.value("max_string_length", base.max_string_length);
    config.max_array_length = j.value("max_array_length", base.max_array_length);
    config.max_object_depth = j.value("max_object_depth", base.max_object_depth);
    config.max_object_properties = j.value("max_object_properties", base.max_object_properties);
    config.max_command_name_length = j.value("max_command_name_length", base.max_command_name_length);
    config.max_argument_bytes = j.value("max_argument_bytes", base.max_argument_bytes);
    config.allowed_url_schemes = j.value("allowed_url_schemes", base.allowed_url_schemes);
    config.allowed_base_directories = j.value("allowed_base_directories", base.allowed_base_directories);
    config.blocked_extensions = j.value("blocked_extensions", base.blocked_extensions);
    config.blocked_patterns = j.value("blocked_patterns", base.blocked_patterns);
    return config;
}

} // anonymous namespace

json GatewayConfig::to_json() const {
    json j;
    j["sanitizer"] = sanitizer_to_json(sanitizer);

    json endpoints = json::object();
    for (const auto& [name, limits] : endpoint_rate_limits) {
        endpoints[name] = limits.to_json();
    }
    j["rate_limits"] = {{"default", default_rate_limit.to_json()}, {"endpoints", endpoints}};

    j["sessions"] = sessions.to_json();
    j["audit"] = audit.to_json();

    json profiles = json::array();
    for (const auto& profile : commands) {
        profiles.push_back(profile.to_json());
    }
    j["commands"] = profiles;
    j["aliases"] = aliases;

    json hierarchy = json::object();
    for (const auto& [permission, implied] : permission_hierarchy) {
        hierarchy[permission] = implied;
    }
    j["permission_hierarchy"] = hierarchy;

    j["maintenance_interval_seconds"] = maintenance_interval.count();
    j["escalate_violations_to_session"] = escalate_violations_to_session;
    return j;
}

std::optional<GatewayConfig> GatewayConfig::from_json(const json& j) {
    if (!j.is_object()) {
        utilities::log_error("GatewayConfig: configuration must be a JSON object");
        return std::nullopt;
    }

    try {
        GatewayConfig config;

        if (j.contains("sanitizer")) {
            config.sanitizer = sanitizer_from_json(j.at("sanitizer"), config.sanitizer);
        }

        if (j.contains("rate_limits")) {
            const auto& rate_limits = j.at("rate_limits");

            if (rate_limits.contains("default")) {
                auto limits = RateLimitConfig::from_json(rate_limits.at("default"));
                if (!limits) {
                    utilities::log_error("GatewayConfig: invalid default rate limit");
                    return std::nullopt;
                }
                config.default_rate_limit = *limits;
            }

            if (rate_limits.contains("endpoints")) {
                for (const auto& item : rate_limits.at("endpoints").items()) {
                    auto limits = RateLimitConfig::from_json(item.value(), config.default_rate_limit);
                    if (!limits) {
                        utilities::log_error("GatewayConfig: invalid rate limit for endpoint " + item.key());
                        return std::nullopt;
                    }
                    config.endpoint_rate_limits[item.key()] = *limits;
                }
            }
        }

        if (j.contains("sessions")) {
            auto sessions = SessionConfig::from_json(j.at("sessions"));
            if (!sessions) {
                utilities::log_error("GatewayConfig: invalid sessions section");
                return std::nullopt;
            }
            config.sessions = *sessions;
        }

        if (j.contains("audit")) {
            auto audit = AuditConfig::from_json(j.at("audit"));
            if (!audit) {
                utilities::log_error("GatewayConfig: invalid audit section");
                return std::nullopt;
            }
            config.audit = *audit;
        }

        if (j.contains("commands")) {
            config.commands.clear();
            for (const auto& entry : j.at("commands")) {
                auto profile = CommandProfile::from_json(entry);
                if (!profile) {
                    utilities::log_error("GatewayConfig: invalid command profile " + entry.dump());
                    return std::nullopt;
                }
                config.commands.push_back(*profile);
            }
        }

        if (j.contains("aliases")) {
            config.aliases = j.at("aliases").get<std::map<std::string, std::string>>();
        }

        if (j.contains("permission_hierarchy")) {
            config.permission_hierarchy.clear();
            for (const auto& item : j.at("permission_hierarchy").items()) {
                config.permission_hierarchy[item.key()] = item.value().get<PermissionSet>();
            }
        }

        if (j.contains("maintenance_interval_seconds")) {
            auto seconds = j.at("maintenance_interval_seconds").get<int64_t>();
            if (seconds <= 0) {
                utilities::log_error("GatewayConfig: maintenance_interval_seconds must be positive");
                return std::nullopt;
            }
            config.maintenance_interval = std::chrono::seconds(seconds);
        }

        config.escalate_violations_to_session =
            j.value("escalate_violations_to_session", config.escalate_violations_to_session);

        return config;

    } catch (const json::exception& e) {
        utilities::log_error("GatewayConfig: malformed configuration: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::optional<GatewayConfig> GatewayConfig::load_from_file(const std::filesystem::path& path) {
    auto content = utilities::read_file(path.string());
    if (!content) {
        utilities::log_error("GatewayConfig: cannot read " + path.string());
        return std::nullopt;
    }

    try {
        return from_json(json::parse(*content));
    } catch (const json::parse_error& e) {
        utilities::log_error("GatewayConfig: " + path.string() + " is not valid JSON: " + e.what());
        return std::nullopt;
    }
}

} // namespace ipcguard
