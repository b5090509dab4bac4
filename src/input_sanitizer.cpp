/**
 * @file input_sanitizer.cpp
 * @brief Implementation of IPC argument validation
 *
 * IPCGuard - IPC Command Authorization Pipeline
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "ipcguard/input_sanitizer.hpp"
#include "ipcguard/utilities.hpp"

#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <algorithm>

using json = nlohmann::json;

namespace ipcguard {

namespace {
    const std::vector<std::string> SQL_KEYWORDS = {
        "SELECT", "INSERT", "UPDATE", "DELETE", "DROP", "CREATE", "ALTER", "EXEC",
        "EXECUTE", "UNION", "SCRIPT", "--", "/*", "*/", "XP_", "SP_"
    };

    // Matched against upper-cased input
    const std::vector<std::string> SQL_INJECTION_PATTERNS = {
        R"('[\s]*;)",
        R"('[\s]*\|\|)",
        R"('[\s]*OR[\s])",
        R"('[\s]*AND[\s])",
        R"(\bOR\b[\s]*\d+[\s]*=[\s]*\d+)",
        R"(\bAND\b[\s]*\d+[\s]*=[\s]*\d+)"
    };

    std::string format_number(double value) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    }
}

// ============================================================================
// Result Factories
// ============================================================================

InputValidationResult InputValidationResult::valid() {
    return InputValidationResult();
}

InputValidationResult InputValidationResult::sanitized_value(
    const std::string& original,
    const std::string& sanitized
) {
    InputValidationResult result;
    result.status = InputStatus::SANITIZED;
    result.original = original;
    result.sanitized = sanitized;
    return result;
}

InputValidationResult InputValidationResult::invalid(const std::string& reason, uint16_t code) {
    InputValidationResult result;
    result.status = InputStatus::INVALID;
    result.reason = reason;
    result.code = code;
    return result;
}

std::vector<std::string> SanitizationConfig::default_blocked_patterns() {
    return {
        R"(<script[\s\S]*?</script>)",
        R"(javascript:)",
        R"(data:text/html)",
        R"(eval\s*\()",
        R"(setTimeout\s*\()",
        R"(setInterval\s*\()",
        R"(Function\s*\()",
        R"(\.\.[\\/])",
        R"((rm\s+-rf|sudo\s+rm))"
    };
}

// ============================================================================
// Constructor
// ============================================================================

InputSanitizer::InputSanitizer(SanitizationConfig config)
    : config_(std::move(config))
    , email_regex_(R"(^[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}$)")
    , url_scheme_regex_(R"(^([a-zA-Z][a-zA-Z0-9+.-]*):(.*)$)")
{
    for (const auto& pattern : config_.blocked_patterns) {
        try {
            blocked_patterns_.push_back({
                pattern,
                std::regex(pattern, std::regex::ECMAScript | std::regex::icase)
            });
        } catch (const std::regex_error& ex) {
            throw std::invalid_argument("Invalid blocked pattern '" + pattern + "': " + ex.what());
        }
    }

    for (const auto& pattern : SQL_INJECTION_PATTERNS) {
        sql_patterns_.push_back({pattern, std::regex(pattern)});
    }
}

// ============================================================================
// String Rules
// ============================================================================

InputValidationResult InputSanitizer::sanitize_string(const std::string& input) const {
    if (input.length() > config_.max_string_length) {
        return InputValidationResult::invalid(
            "String length " + std::to_string(input.length()) +
            " exceeds maximum " + std::to_string(config_.max_string_length),
            security::ERR_STRING_TOO_LONG);
    }

    // Signature scan runs on the raw input
    for (const auto& pattern : blocked_patterns_) {
        if (std::regex_search(input, pattern.regex)) {
            return InputValidationResult::invalid(
                "Input contains blocked pattern: " + pattern.source,
                security::ERR_BLOCKED_PATTERN);
        }
    }

    for (char c : input) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc > 0x7F || !(std::isgraph(uc) || std::isspace(uc))) {
            return InputValidationResult::invalid(
                "Input contains non-printable or non-ASCII characters",
                security::ERR_INVALID_CHARACTERS);
        }
    }

    std::string encoded = html_encode(input);
    if (encoded != input) {
        return InputValidationResult::sanitized_value(input, encoded);
    }

    return InputValidationResult::valid();
}

std::string InputSanitizer::html_encode(const std::string& input) {
    std::string result;
    result.reserve(input.length() * 2);

    for (char c : input) {
        switch (c) {
            case '<':  result += "&lt;"; break;
            case '>':  result += "&gt;"; break;
            case '&':  result += "&amp;"; break;
            case '"':  result += "&quot;"; break;
            case '\'': result += "&#39;"; break;
            case '/':  result += "&#x2F;"; break;
            case '\\': result += "&#x5C;"; break;
            default:   result += c; break;
        }
    }

    return result;
}

// ============================================================================
// Typed Validators
// ============================================================================

InputValidationResult InputSanitizer::validate_url(const std::string& url) const {
    if (url.empty()) {
        return InputValidationResult::invalid("Invalid URL format: empty", security::ERR_URL_FORMAT);
    }

    for (char c : url) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc > 0x7F || std::iscntrl(uc) || std::isspace(uc)) {
            return InputValidationResult::invalid(
                "Invalid URL format: illegal character", security::ERR_URL_FORMAT);
        }
    }

    std::smatch match;
    if (!std::regex_match(url, match, url_scheme_regex_)) {
        return InputValidationResult::invalid(
            "Invalid URL format: missing scheme", security::ERR_URL_FORMAT);
    }

    std::string scheme = utilities::to_lowercase(match[1].str());
    std::string rest = match[2].str();

    auto allowed = std::find(
        config_.allowed_url_schemes.begin(), config_.allowed_url_schemes.end(), scheme);
    if (allowed == config_.allowed_url_schemes.end()) {
        return InputValidationResult::invalid(
            "URL scheme '" + scheme + "' is not allowed", security::ERR_URL_SCHEME);
    }

    // Hierarchical schemes need a host
    if (scheme == "http" || scheme == "https") {
        if (!utilities::starts_with(rest, "//")) {
            return InputValidationResult::invalid(
                "Invalid URL format: missing authority", security::ERR_URL_FORMAT);
        }
        std::string authority = rest.substr(2);
        authority = authority.substr(0, authority.find_first_of("/?#"));
        auto at = authority.rfind('@');
        if (at != std::string::npos) {
            authority = authority.substr(at + 1);
        }
        std::string host = authority.substr(0, authority.find(':'));
        if (host.empty()) {
            return InputValidationResult::invalid(
                "Invalid URL format: empty host", security::ERR_URL_FORMAT);
        }
    }

    return InputValidationResult::valid();
}

InputValidationResult InputSanitizer::validate_file_path(const std::string& path) const {
    if (path.find("..") != std::string::npos || path.find('~') != std::string::npos) {
        return InputValidationResult::invalid(
            "Path contains traversal patterns", security::ERR_PATH_TRAVERSAL);
    }

    if (utilities::starts_with(path, "/")) {
        bool inside_base = false;
        for (const auto& base : config_.allowed_base_directories) {
            if (utilities::starts_with(path, base) && security::is_safe_path(path, base)) {
                inside_base = true;
                break;
            }
        }
        if (!inside_base) {
            return InputValidationResult::invalid(
                "Absolute path outside allowed directories", security::ERR_PATH_OUTSIDE_BASE);
        }
    }

    std::string lowered = utilities::to_lowercase(path);
    for (const auto& ext : config_.blocked_extensions) {
        if (utilities::ends_with(lowered, utilities::to_lowercase(ext))) {
            return InputValidationResult::invalid(
                "File extension '" + ext + "' is not allowed", security::ERR_BLOCKED_EXTENSION);
        }
    }

    return InputValidationResult::valid();
}

InputValidationResult InputSanitizer::validate_command_name(const std::string& command) const {
    if (command.empty() || command.length() > config_.max_command_name_length) {
        return InputValidationResult::invalid(
            "Command name length is invalid", security::ERR_COMMAND_LENGTH);
    }

    for (char c : command) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return InputValidationResult::invalid(
                "Command name contains invalid characters", security::ERR_COMMAND_CHARACTERS);
        }
    }

    return InputValidationResult::valid();
}

InputValidationResult InputSanitizer::sanitize_sql_input(const std::string& input) const {
    std::string upper = utilities::to_uppercase(input);

    for (const auto& keyword : SQL_KEYWORDS) {
        if (upper.find(keyword) != std::string::npos) {
            return InputValidationResult::invalid(
                "Input contains SQL keyword: " + keyword, security::ERR_SQL_KEYWORD);
        }
    }

    for (const auto& pattern : sql_patterns_) {
        if (std::regex_search(upper, pattern.regex)) {
            return InputValidationResult::invalid(
                "Input matches SQL injection pattern: " + pattern.source,
                security::ERR_SQL_INJECTION);
        }
    }

    return InputValidationResult::valid();
}

InputValidationResult InputSanitizer::validate_email(const std::string& email) const {
    try {
        if (std::regex_match(email, email_regex_)) {
            return InputValidationResult::valid();
        }
    } catch (const std::regex_error& ex) {
        utilities::log_error(std::string("InputSanitizer: email regex failure: ") + ex.what());
        return InputValidationResult::invalid("Internal regex error", security::ERR_INTERNAL_REGEX);
    }

    return InputValidationResult::invalid("Invalid email format", security::ERR_EMAIL_FORMAT);
}

InputValidationResult InputSanitizer::validate_number(
    double value,
    std::optional<double> min,
    std::optional<double> max
) const {
    if (!std::isfinite(value)) {
        return InputValidationResult::invalid("Number is not finite", security::ERR_NUMBER_NOT_FINITE);
    }

    if (min && value < *min) {
        return InputValidationResult::invalid(
            "Number " + format_number(value) + " is below minimum " + format_number(*min),
            security::ERR_NUMBER_BELOW_MIN);
    }

    if (max && value > *max) {
        return InputValidationResult::invalid(
            "Number " + format_number(value) + " exceeds maximum " + format_number(*max),
            security::ERR_NUMBER_ABOVE_MAX);
    }

    return InputValidationResult::valid();
}

// ============================================================================
// Structure Validation
// ============================================================================

InputValidationResult InputSanitizer::validate_json_structure(
    const json& value,
    size_t depth,
    json* sanitized_out
) const {
    if (depth > config_.max_object_depth) {
        return InputValidationResult::invalid(
            "JSON depth " + std::to_string(depth) +
            " exceeds maximum " + std::to_string(config_.max_object_depth),
            security::ERR_JSON_DEPTH);
    }

    bool changed = false;

    if (value.is_object()) {
        if (value.size() > config_.max_object_properties) {
            return InputValidationResult::invalid(
                "JSON object has too many properties", security::ERR_JSON_PROPERTIES);
        }

        json encoded = json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            auto key_result = sanitize_string(it.key());
            if (key_result.is_invalid()) {
                return key_result;
            }

            json child;
            auto child_result = validate_json_structure(
                it.value(), depth + 1, sanitized_out ? &child : nullptr);
            if (child_result.is_invalid()) {
                return child_result;
            }

            changed = changed || key_result.is_sanitized() || child_result.is_sanitized();
            if (sanitized_out) {
                const std::string& key = key_result.is_sanitized() ? key_result.sanitized : it.key();
                encoded[key] = std::move(child);
            }
        }

        if (sanitized_out) {
            *sanitized_out = std::move(encoded);
        }

    } else if (value.is_array()) {
        if (value.size() > config_.max_array_length) {
            return InputValidationResult::invalid(
                "Array length " + std::to_string(value.size()) +
                " exceeds maximum " + std::to_string(config_.max_array_length),
                security::ERR_ARRAY_LENGTH);
        }

        json encoded = json::array();
        for (const auto& item : value) {
            json child;
            auto child_result = validate_json_structure(
                item, depth + 1, sanitized_out ? &child : nullptr);
            if (child_result.is_invalid()) {
                return child_result;
            }

            changed = changed || child_result.is_sanitized();
            if (sanitized_out) {
                encoded.push_back(std::move(child));
            }
        }

        if (sanitized_out) {
            *sanitized_out = std::move(encoded);
        }

    } else if (value.is_string()) {
        const std::string& text = value.get_ref<const std::string&>();
        auto result = sanitize_string(text);
        if (result.is_invalid()) {
            return result;
        }

        changed = result.is_sanitized();
        if (sanitized_out) {
            *sanitized_out = changed ? json(result.sanitized) : value;
        }

    } else if (sanitized_out) {
        // Numbers, booleans and null pass through
        *sanitized_out = value;
    }

    // Structures report through sanitized_out; only string leaves carry text
    if (changed) {
        if (value.is_string()) {
            return InputValidationResult::sanitized_value(
                value.get<std::string>(), InputSanitizer::html_encode(value.get<std::string>()));
        }
        return InputValidationResult::sanitized_value("", "");
    }

    return InputValidationResult::valid();
}

InputValidationResult InputSanitizer::validate_ipc_input(
    const std::string& command,
    const json& args,
    json* sanitized_args
) const {
    auto name_result = validate_command_name(command);
    if (name_result.is_invalid()) {
        return name_result;
    }

    // Total size first; per-leaf limits do not bound the whole payload
    const size_t size = args.dump(-1, ' ', false, json::error_handler_t::replace).size();
    if (size > config_.max_argument_bytes) {
        return InputValidationResult::invalid(
            "Arguments of " + std::to_string(size) + " bytes exceed maximum " +
            std::to_string(config_.max_argument_bytes),
            security::ERR_ARGUMENTS_TOO_LARGE);
    }

    return validate_json_structure(args, 0, sanitized_args);
}

} // namespace ipcguard
