/**
 * @file rate_limiter.hpp
 * @brief Per-(session, endpoint) rate limiting with escalating penalties
 *
 * IPCGuard - IPC Command Authorization Pipeline
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - Four strategies per endpoint: fixed window, sliding window (default),
 *   token bucket and adaptive
 * - Limits scaled down by request risk score
 * - Repeat offenders are blocked for cooldown_period * penalty_multiplier
 * - Sharded key map with a lock per key
 */

#pragma once

#include "ipcguard/security_config.hpp"

#include <string>
#include <chrono>
#include <mutex>
#include <shared_mutex>
#include <map>
#include <unordered_map>
#include <deque>
#include <array>
#include <memory>
#include <atomic>
#include <optional>

#include <nlohmann/json.hpp>

namespace ipcguard {

/**
 * @brief Rate limiting algorithm
 */
enum class RateLimitStrategy {
    FIXED_WINDOW,
    SLIDING_WINDOW,
    TOKEN_BUCKET,
    ADAPTIVE
};

std::string strategy_to_string(RateLimitStrategy strategy);
std::optional<RateLimitStrategy> string_to_strategy(const std::string& str);

/**
 * @brief Rate limit configuration for an endpoint (or the global default)
 */
struct RateLimitConfig {
    uint32_t requests_per_second = security::RATE_LIMIT_PER_SECOND;
    uint32_t requests_per_minute = security::RATE_LIMIT_PER_MINUTE;
    uint32_t burst_limit = security::RATE_LIMIT_BURST;
    RateLimitStrategy strategy = RateLimitStrategy::SLIDING_WINDOW;
    double penalty_multiplier = security::RATE_LIMIT_PENALTY_MULTIPLIER;
    std::chrono::seconds cooldown_period = security::RATE_LIMIT_COOLDOWN;
    uint32_t violation_threshold = security::RATE_LIMIT_VIOLATION_THRESHOLD;

    nlohmann::json to_json() const;

    /**
     * @brief Parse a configuration, missing keys keep the values of base
     * @return Config or std::nullopt if a key has the wrong type or value
     */
    static std::optional<RateLimitConfig> from_json(
        const nlohmann::json& j,
        const RateLimitConfig& base
    );
    static std::optional<RateLimitConfig> from_json(const nlohmann::json& j) {
        return from_json(j, RateLimitConfig());
    }
};

/**
 * @brief Outcome status of a rate limit check
 */
enum class RateLimitStatus {
    ALLOWED,   ///< Within quota
    LIMITED,   ///< Quota exhausted, retry later
    BLOCKED    ///< Penalty active
};

/**
 * @brief Result of a rate limit check
 */
struct RateLimitResult {
    RateLimitStatus status = RateLimitStatus::ALLOWED;
    uint32_t remaining = 0;                          ///< ALLOWED: remaining quota
    std::chrono::milliseconds reset_after{0};        ///< ALLOWED: until quota resets
    std::chrono::milliseconds retry_after{0};        ///< LIMITED: until next request may pass
    std::chrono::milliseconds unblock_after{0};      ///< BLOCKED: until penalty expires
    std::string reason;

    static RateLimitResult allowed(uint32_t remaining, std::chrono::milliseconds reset_after);
    static RateLimitResult limited(std::chrono::milliseconds retry_after, const std::string& reason);
    static RateLimitResult blocked(const std::string& reason, std::chrono::milliseconds unblock_after);

    bool is_allowed() const { return status == RateLimitStatus::ALLOWED; }
};

/**
 * @brief Quota snapshot for a tracked key
 */
struct RateLimitQuota {
    uint32_t remaining = 0;
    std::chrono::milliseconds reset_after{0};
    bool penalized = false;
};

/**
 * @brief Throttling stage of the pipeline
 */
class RequestThrottle {
public:
    virtual ~RequestThrottle() = default;

    /**
     * @brief Check and record one request
     * @param session_id Session identifier
     * @param endpoint Canonical endpoint (command) name
     * @param risk_score Request risk 0-100, higher risk gets tighter limits
     */
    virtual RateLimitResult check_rate_limit(
        const std::string& session_id,
        const std::string& endpoint,
        uint8_t risk_score
    ) = 0;

    virtual void set_endpoint_config(const std::string& endpoint, const RateLimitConfig& config) = 0;

    virtual bool has_endpoint_config(const std::string& endpoint) const = 0;

    /**
     * @brief Prune idle keys without an active penalty
     * @return Number of keys removed
     */
    virtual size_t cleanup_expired_states() = 0;

    virtual nlohmann::json get_statistics() const = 0;
};

/**
 * @brief RateLimiter - default RequestThrottle
 *
 * Thread-safe. Keys are spread over RATE_LIMIT_SHARDS shards; each key's
 * state has its own mutex, so concurrent calls for different keys do not
 * contend.
 */
class RateLimiter : public RequestThrottle {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Construct rate limiter
     * @param default_config Configuration for endpoints without an override
     */
    explicit RateLimiter(RateLimitConfig default_config = RateLimitConfig());

    ~RateLimiter() override = default;

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;
    RateLimiter(RateLimiter&&) = delete;
    RateLimiter& operator=(RateLimiter&&) = delete;

    RateLimitResult check_rate_limit(
        const std::string& session_id,
        const std::string& endpoint,
        uint8_t risk_score
    ) override;

    void set_endpoint_config(const std::string& endpoint, const RateLimitConfig& config) override;
    bool has_endpoint_config(const std::string& endpoint) const override;

    /**
     * @brief Configuration applied to an endpoint (override or default)
     */
    RateLimitConfig get_endpoint_config(const std::string& endpoint) const;

    /**
     * @brief Forget all state for a key (quota, violations, penalty)
     * @return true if the key was tracked
     */
    bool reset_rate_limit(const std::string& session_id, const std::string& endpoint);

    /**
     * @brief Current quota for a key without consuming it
     * @return Quota or std::nullopt if the key is not tracked
     */
    std::optional<RateLimitQuota> get_rate_limit_status(
        const std::string& session_id,
        const std::string& endpoint
    ) const;

    size_t cleanup_expired_states() override;

    /**
     * @brief Prune keys idle longer than a threshold (never penalized keys)
     * @param inactive_threshold Idle duration
     * @return Number of keys removed
     */
    size_t cleanup_inactive(std::chrono::seconds inactive_threshold);

    /**
     * @brief Number of tracked (session, endpoint) keys
     */
    size_t get_tracked_key_count() const;

    /**
     * @brief Statistics
     * @return JSON with total_requests, allowed_requests, limited_requests,
     *         blocked_requests, tracked_keys, load_factor, adaptive_limits
     */
    nlohmann::json get_statistics() const override;

    /**
     * @brief Clear all tracked state
     */
    void clear();

private:
    /// State of one (session, endpoint) key
    struct KeyState {
        std::mutex mutex;
        std::deque<Clock::time_point> requests;   ///< Sliding / adaptive history
        double tokens = 0.0;                      ///< Token bucket level
        bool bucket_initialized = false;
        Clock::time_point last_refill;
        Clock::time_point window_start;           ///< Fixed window anchor
        uint32_t window_count = 0;
        uint32_t violations = 0;
        std::optional<Clock::time_point> penalty_until;
        Clock::time_point last_seen;
        bool removed = false;                     ///< Erased from its shard
    };

    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, std::shared_ptr<KeyState>> states;
    };

    RateLimitConfig default_config_;
    std::map<std::string, RateLimitConfig> endpoint_configs_;
    mutable std::shared_mutex config_mutex_;

    std::array<Shard, security::RATE_LIMIT_SHARDS> shards_;

    std::map<std::string, uint32_t> adaptive_limits_;
    mutable std::mutex adaptive_mutex_;

    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> allowed_requests_{0};
    std::atomic<uint64_t> limited_requests_{0};
    std::atomic<uint64_t> blocked_requests_{0};

    static std::string make_key(const std::string& session_id, const std::string& endpoint);
    Shard& shard_for(const std::string& key);
    const Shard& shard_for(const std::string& key) const;
    std::shared_ptr<KeyState> get_or_create_state(const std::string& key);

    double load_factor() const;

    // Strategy evaluation, caller holds state.mutex
    RateLimitResult check_fixed_window(KeyState& state, const RateLimitConfig& limits, Clock::time_point now);
    RateLimitResult check_sliding_window(KeyState& state, const RateLimitConfig& limits, Clock::time_point now);
    RateLimitResult check_token_bucket(KeyState& state, const RateLimitConfig& limits,
                                       uint8_t risk_score, Clock::time_point now);
    RateLimitResult check_adaptive(KeyState& state, const RateLimitConfig& limits,
                                   const std::string& endpoint, Clock::time_point now);

    /**
     * @brief Scale limits by risk (0-20 x1.0, 21-50 x0.8, 51-80 x0.6, >80 x0.4)
     */
    static RateLimitConfig scale_for_risk(const RateLimitConfig& config, uint8_t risk_score);

    /**
     * @brief Token cost by risk (0-20 1.0, 21-50 1.5, 51-80 2.0, >80 3.0)
     */
    static double token_cost(uint8_t risk_score);
};

} // namespace ipcguard
