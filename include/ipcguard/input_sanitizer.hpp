/**
 * @file input_sanitizer.hpp
 * @brief Validation and normalization of untrusted IPC argument payloads
 *
 * IPCGuard - IPC Command Authorization Pipeline
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * String rules, in order of precedence:
 * 1. Length bound (1001)
 * 2. Blocked attack-signature patterns (1002), before any encoding
 * 3. Printable ASCII only (1003)
 * 4. HTML entity encoding of < > & " ' / \ (result SANITIZED if changed)
 *
 * Plus URL, file path, command name, SQL, email, number and recursive
 * JSON structure validators. Error codes are listed in security_config.hpp.
 */

#pragma once

#include "ipcguard/security_config.hpp"

#include <string>
#include <vector>
#include <regex>
#include <cstdint>
#include <optional>

#include <nlohmann/json.hpp>

namespace ipcguard {

/**
 * @brief Status of a sanitizer check
 */
enum class InputStatus {
    VALID,      ///< Input accepted unchanged
    SANITIZED,  ///< Input accepted after encoding
    INVALID     ///< Input rejected
};

/**
 * @brief Result of a sanitizer check
 */
struct InputValidationResult {
    InputStatus status = InputStatus::VALID;
    std::string original;    ///< Original text (SANITIZED only)
    std::string sanitized;   ///< Encoded text (SANITIZED only)
    std::string reason;      ///< Rejection reason (INVALID only)
    uint16_t code = 0;       ///< Error code (INVALID only)

    static InputValidationResult valid();
    static InputValidationResult sanitized_value(const std::string& original, const std::string& sanitized);
    static InputValidationResult invalid(const std::string& reason, uint16_t code);

    bool is_valid() const { return status == InputStatus::VALID; }
    bool is_sanitized() const { return status == InputStatus::SANITIZED; }
    bool is_invalid() const { return status == InputStatus::INVALID; }
};

/**
 * @brief Sanitizer configuration
 */
struct SanitizationConfig {
    size_t max_string_length = security::MAX_STRING_LENGTH;
    size_t max_array_length = security::MAX_ARRAY_LENGTH;
    size_t max_object_depth = security::MAX_OBJECT_DEPTH;
    size_t max_object_properties = security::MAX_OBJECT_PROPERTIES;
    size_t max_command_name_length = security::MAX_COMMAND_NAME_LENGTH;
    size_t max_argument_bytes = security::MAX_ARGUMENT_BYTES;
    std::vector<std::string> allowed_url_schemes = {"http", "https"};
    std::vector<std::string> allowed_base_directories = {"/tmp/", "/var/"};
    std::vector<std::string> blocked_extensions = {
        ".exe", ".bat", ".cmd", ".ps1", ".sh", ".scr", ".com", ".pif", ".vbs", ".js"
    };
    /// Case-insensitive ECMAScript regular expressions
    std::vector<std::string> blocked_patterns = default_blocked_patterns();

    static std::vector<std::string> default_blocked_patterns();
};

/**
 * @brief Argument validation stage of the pipeline
 */
class InputValidator {
public:
    virtual ~InputValidator() = default;

    /**
     * @brief Validate a command name and its full argument structure
     * @param command Command name as received
     * @param args Argument payload
     * @param sanitized_args If non-null, receives the entity-encoded copy of args
     * @return First failure, SANITIZED if any leaf or key was encoded, else VALID
     */
    virtual InputValidationResult validate_ipc_input(
        const std::string& command,
        const nlohmann::json& args,
        nlohmann::json* sanitized_args = nullptr
    ) const = 0;
};

/**
 * @brief InputSanitizer - default InputValidator
 *
 * Immutable after construction; safe to share across threads.
 */
class InputSanitizer : public InputValidator {
public:
    /**
     * @brief Construct sanitizer
     * @param config Limits and pattern lists
     * @throws std::invalid_argument if a blocked pattern does not compile
     */
    explicit InputSanitizer(SanitizationConfig config = SanitizationConfig());

    ~InputSanitizer() override = default;

    InputSanitizer(const InputSanitizer&) = delete;
    InputSanitizer& operator=(const InputSanitizer&) = delete;
    InputSanitizer(InputSanitizer&&) = delete;
    InputSanitizer& operator=(InputSanitizer&&) = delete;

    /**
     * @brief Apply the string rules (length, patterns, characters, encoding)
     * @param input Untrusted string
     * @return VALID, SANITIZED{original, sanitized} or INVALID{reason, code}
     */
    InputValidationResult sanitize_string(const std::string& input) const;

    /**
     * @brief Validate URL syntax and scheme allow-list
     * @param url URL string
     * @return INVALID 1005 if unparseable, 1004 if scheme not allowed
     */
    InputValidationResult validate_url(const std::string& url) const;

    /**
     * @brief Validate a file path
     *
     * Rejects traversal markers (.. and ~), absolute paths outside the
     * allowed base directories and blocked extensions.
     */
    InputValidationResult validate_file_path(const std::string& path) const;

    /**
     * @brief Validate a command name (ASCII alphanumeric and underscore)
     */
    InputValidationResult validate_command_name(const std::string& command) const;

    /**
     * @brief Reject SQL keywords (1014) and injection-shaped input (1015)
     */
    InputValidationResult sanitize_sql_input(const std::string& input) const;

    InputValidationResult validate_email(const std::string& email) const;

    /**
     * @brief Validate a number against optional bounds
     * @param value Number to check
     * @param min Inclusive lower bound
     * @param max Inclusive upper bound
     */
    InputValidationResult validate_number(
        double value,
        std::optional<double> min = std::nullopt,
        std::optional<double> max = std::nullopt
    ) const;

    /**
     * @brief Recursively validate a JSON value
     * @param value Value to validate
     * @param depth Nesting depth of value (0 for the root)
     * @param sanitized_out If non-null, receives the entity-encoded copy
     * @return First failure, SANITIZED if anything was encoded, else VALID
     */
    InputValidationResult validate_json_structure(
        const nlohmann::json& value,
        size_t depth = 0,
        nlohmann::json* sanitized_out = nullptr
    ) const;

    InputValidationResult validate_ipc_input(
        const std::string& command,
        const nlohmann::json& args,
        nlohmann::json* sanitized_args = nullptr
    ) const override;

    /**
     * @brief HTML entity encode < > & " ' / and backslash
     */
    static std::string html_encode(const std::string& input);

    const SanitizationConfig& get_config() const { return config_; }

private:
    /// Compiled blocked pattern with its source text
    struct CompiledPattern {
        std::string source;
        std::regex regex;
    };

    SanitizationConfig config_;
    std::vector<CompiledPattern> blocked_patterns_;
    std::vector<CompiledPattern> sql_patterns_;
    std::regex email_regex_;
    std::regex url_scheme_regex_;
};

} // namespace ipcguard
