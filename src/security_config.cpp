/**
 * @file security_config.cpp
 * @brief Directory resolution and identifier/path checks
 *
 * IPCGuard - IPC Command Authorization Pipeline
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "ipcguard/security_config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iterator>
#include <system_error>

namespace ipcguard {
namespace security {

namespace {

constexpr const char* DATA_DIR_ENV = "IPCGUARD_DATA_DIR";
constexpr const char* DEFAULT_DATA_DIR = "/opt/fsi/var/ipcguard";

std::filesystem::path ensure_directory(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::filesystem::filesystem_error("cannot create directory", dir, ec);
    }
    return dir;
}

} // anonymous namespace

// ============================================================================
// Directory Configuration
// ============================================================================

std::filesystem::path get_data_directory() {
    const char* configured = std::getenv(DATA_DIR_ENV);
    if (configured != nullptr && *configured != '\0') {
        return ensure_directory(configured);
    }
    return ensure_directory(DEFAULT_DATA_DIR);
}

std::filesystem::path get_log_directory() {
    return ensure_directory(get_data_directory() / "logs");
}

// ============================================================================
// Input Validation
// ============================================================================

bool validate_identifier(const std::string& identifier, size_t max_length) {
    if (identifier.empty() || identifier.size() > max_length) {
        return false;
    }
    return std::all_of(identifier.begin(), identifier.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
    });
}

bool is_safe_path(const std::filesystem::path& path, const std::filesystem::path& base_dir) {
    std::error_code ec;
    const auto resolved = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        return false;
    }
    const auto base = std::filesystem::weakly_canonical(base_dir, ec);
    if (ec) {
        return false;
    }

    // Component-wise containment; a trailing separator leaves an empty last element
    auto base_it = base.begin();
    auto path_it = resolved.begin();
    for (; base_it != base.end(); ++base_it, ++path_it) {
        if (base_it->empty() && std::next(base_it) == base.end()) {
            break;
        }
        if (path_it == resolved.end() || *path_it != *base_it) {
            return false;
        }
    }
    return true;
}

} // namespace security
} // namespace ipcguard
