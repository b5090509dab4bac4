/**
 * @file gateway_example.cpp
 * @brief Gateway example - Authorize a handful of IPC commands
 *
 * IPCGuard - IPC Command Authorization Pipeline
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Demonstrates:
 * - Loading a gateway configuration (optional JSON file)
 * - Creating sessions
 * - Authorizing allowed, sanitized, blocked and under-privileged commands
 * - Reading aggregate statistics and verifying the audit chain
 */

#include "ipcguard/security_gateway.hpp"
#include "ipcguard/utilities.hpp"

#include <cstdlib>
#include <iostream>
#include <filesystem>

using namespace ipcguard;
using json = nlohmann::json;

namespace {

void show(const std::string& label, const ValidationResult& result) {
    std::cout << "  " << label << "\n    -> " << result.to_json().dump() << "\n";
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        std::cout << "\n=== IPCGuard Gateway Example ===\n\n";

        auto level = utilities::LogLevel::WARN;
        if (const char* env_level = std::getenv("IPCGUARD_LOG_LEVEL")) {
            level = utilities::string_to_log_level(env_level).value_or(level);
        }
        utilities::initialize_logging("", level);

        GatewayConfig config;
        if (argc >= 2) {
            auto loaded = GatewayConfig::load_from_file(argv[1]);
            if (!loaded) {
                std::cerr << "Invalid configuration file: " << argv[1] << "\n";
                return 1;
            }
            config = *loaded;
        } else {
            config.audit.log_file = std::filesystem::temp_directory_path() / "ipcguard_example" / "audit.log";
        }

        SecurityGateway gateway(config);
        gateway.start_maintenance();

        std::string guest = gateway.create_session("main");
        std::string user = gateway.create_session("main", std::string("alice"), std::string("127.0.0.1"),
                                                  std::string("example/1.0"));

        std::cout << "Sessions:\n";
        std::cout << "  guest: " << guest << "\n";
        std::cout << "  user:  " << user << "\n\n";

        std::cout << "Decisions:\n";
        show("user  save_settings {theme: dark}",
             gateway.validate_command("save_settings", {{"theme", "dark"}}, user));
        show("user  save_settings {note: \"a & b\"}",
             gateway.validate_command("save_settings", {{"note", "a & b"}}, user));
        show("user  save_settings {theme: <script>}",
             gateway.validate_command("save_settings", {{"theme", "<script>alert(1)</script>"}}, user));
        show("guest save_settings {theme: dark}",
             gateway.validate_command("save_settings", {{"theme", "dark"}}, guest));
        show("user  execute_system_command",
             gateway.validate_command("execute_system_command", {{"cmd", "ls"}}, user));
        show("user  format_disk",
             gateway.validate_command("format_disk", json::object(), user));
        show("nobody get_app_info",
             gateway.validate_command("get_app_info", json::object(), "no-such-session"));

        gateway.stop_maintenance();
        gateway.flush_audit_log();

        std::cout << "\nStatistics:\n" << gateway.get_security_statistics().dump(2) << "\n";

        auto audit = std::dynamic_pointer_cast<AuditLogger>(gateway.get_components().audit);
        if (audit) {
            bool intact = AuditLogger::verify_log_integrity(audit->get_log_path());
            std::cout << "\nAudit log " << audit->get_log_path() << ": "
                      << (intact ? "chain intact" : "CHAIN BROKEN") << "\n";
        }

        std::cout << "\nExample complete.\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
