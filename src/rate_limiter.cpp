/**
 * @file rate_limiter.cpp
 * @brief Implementation of multi-strategy rate limiting
 *
 * IPCGuard - IPC Command Authorization Pipeline
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "ipcguard/rate_limiter.hpp"
#include "ipcguard/utilities.hpp"

#include <algorithm>
#include <cmath>
#include <functional>

using json = nlohmann::json;

namespace ipcguard {

namespace {
    constexpr auto ONE_SECOND = std::chrono::seconds(1);
    constexpr auto ONE_MINUTE = std::chrono::seconds(60);

    std::chrono::milliseconds to_ms(std::chrono::steady_clock::duration d) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d);
        return ms.count() < 0 ? std::chrono::milliseconds(0) : ms;
    }

    uint32_t scaled(uint32_t limit, double factor) {
        return std::max<uint32_t>(1, static_cast<uint32_t>(std::floor(limit * factor)));
    }
}

// ============================================================================
// Strategy Names
// ============================================================================

std::string strategy_to_string(RateLimitStrategy strategy) {
    switch (strategy) {
        case RateLimitStrategy::FIXED_WINDOW: return "FIXED_WINDOW";
        case RateLimitStrategy::SLIDING_WINDOW: return "SLIDING_WINDOW";
        case RateLimitStrategy::TOKEN_BUCKET: return "TOKEN_BUCKET";
        case RateLimitStrategy::ADAPTIVE: return "ADAPTIVE";
        default: return "UNKNOWN";
    }
}

std::optional<RateLimitStrategy> string_to_strategy(const std::string& str) {
    if (str == "FIXED_WINDOW") return RateLimitStrategy::FIXED_WINDOW;
    if (str == "SLIDING_WINDOW") return RateLimitStrategy::SLIDING_WINDOW;
    if (str == "TOKEN_BUCKET") return RateLimitStrategy::TOKEN_BUCKET;
    if (str == "ADAPTIVE") return RateLimitStrategy::ADAPTIVE;
    return std::nullopt;
}

// ============================================================================
// Config Serialization
// ============================================================================

json RateLimitConfig::to_json() const {
    json j;
    j["requests_per_second"] = requests_per_second;
    j["requests_per_minute"] = requests_per_minute;
    j["burst_limit"] = burst_limit;
    j["strategy"] = strategy_to_string(strategy);
    j["penalty_multiplier"] = penalty_multiplier;
    j["cooldown_period_seconds"] = cooldown_period.count();
    j["violation_threshold"] = violation_threshold;
    return j;
}

std::optional<RateLimitConfig> RateLimitConfig::from_json(const json& j, const RateLimitConfig& base) {
    try {
        if (!j.is_object()) {
            return std::nullopt;
        }

        RateLimitConfig config = base;
        config.requests_per_second = j.value("requests_per_second", base.requests_per_second);
        config.requests_per_minute = j.value("requests_per_minute", base.requests_per_minute);
        config.burst_limit = j.value("burst_limit", base.burst_limit);
        config.penalty_multiplier = j.value("penalty_multiplier", base.penalty_multiplier);
        config.cooldown_period = std::chrono::seconds(
            j.value("cooldown_period_seconds", static_cast<int64_t>(base.cooldown_period.count())));
        config.violation_threshold = j.value("violation_threshold", base.violation_threshold);

        if (j.contains("strategy")) {
            auto strategy = string_to_strategy(j["strategy"].get<std::string>());
            if (!strategy) {
                return std::nullopt;
            }
            config.strategy = *strategy;
        }

        if (config.requests_per_second == 0 || config.requests_per_minute == 0 ||
            config.burst_limit == 0 || config.violation_threshold == 0 ||
            config.penalty_multiplier < 0.0 || config.cooldown_period.count() < 0) {
            return std::nullopt;
        }

        return config;

    } catch (const json::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// Result Factories
// ============================================================================

RateLimitResult RateLimitResult::allowed(uint32_t remaining, std::chrono::milliseconds reset_after) {
    RateLimitResult result;
    result.status = RateLimitStatus::ALLOWED;
    result.remaining = remaining;
    result.reset_after = reset_after;
    return result;
}

RateLimitResult RateLimitResult::limited(std::chrono::milliseconds retry_after, const std::string& reason) {
    RateLimitResult result;
    result.status = RateLimitStatus::LIMITED;
    result.retry_after = retry_after;
    result.reason = reason;
    return result;
}

RateLimitResult RateLimitResult::blocked(const std::string& reason, std::chrono::milliseconds unblock_after) {
    RateLimitResult result;
    result.status = RateLimitStatus::BLOCKED;
    result.reason = reason;
    result.unblock_after = unblock_after;
    return result;
}

// ============================================================================
// Constructor
// ============================================================================

RateLimiter::RateLimiter(RateLimitConfig default_config)
    : default_config_(std::move(default_config))
{
}

// ============================================================================
// Rate Limiting
// ============================================================================

RateLimitResult RateLimiter::check_rate_limit(
    const std::string& session_id,
    const std::string& endpoint,
    uint8_t risk_score
) {
    RateLimitConfig config = get_endpoint_config(endpoint);
    RateLimitConfig limits = scale_for_risk(config, risk_score);
    std::string key = make_key(session_id, endpoint);

    total_requests_++;

    for (;;) {
        std::shared_ptr<KeyState> state = get_or_create_state(key);
        std::lock_guard<std::mutex> lock(state->mutex);

        // Lost a race with cleanup or reset, look the key up again
        if (state->removed) {
            continue;
        }

        auto now = Clock::now();
        state->last_seen = now;

        if (state->penalty_until) {
            if (now < *state->penalty_until) {
                blocked_requests_++;
                return RateLimitResult::blocked(
                    "Rate limit penalty active", to_ms(*state->penalty_until - now));
            }
            state->penalty_until.reset();
        }

        RateLimitResult result;
        switch (config.strategy) {
            case RateLimitStrategy::FIXED_WINDOW:
                result = check_fixed_window(*state, limits, now);
                break;
            case RateLimitStrategy::TOKEN_BUCKET:
                result = check_token_bucket(*state, limits, risk_score, now);
                break;
            case RateLimitStrategy::ADAPTIVE:
                result = check_adaptive(*state, limits, endpoint, now);
                break;
            case RateLimitStrategy::SLIDING_WINDOW:
            default:
                result = check_sliding_window(*state, limits, now);
                break;
        }

        if (result.status == RateLimitStatus::LIMITED) {
            limited_requests_++;
            state->violations++;

            if (state->violations >= config.violation_threshold) {
                auto penalty = std::chrono::duration_cast<Clock::duration>(
                    std::chrono::duration<double>(
                        config.cooldown_period.count() * config.penalty_multiplier));
                state->penalty_until = now + penalty;
                state->violations = 0;

                utilities::log_warn("RateLimiter: penalty applied to session " + session_id +
                                    " on " + endpoint + " for " +
                                    std::to_string(to_ms(penalty).count()) + "ms");
            }
        } else {
            allowed_requests_++;
        }

        return result;
    }
}

RateLimitResult RateLimiter::check_fixed_window(
    KeyState& state,
    const RateLimitConfig& limits,
    Clock::time_point now
) {
    if (state.window_count == 0 || now - state.window_start >= ONE_MINUTE) {
        state.window_start = now;
        state.window_count = 0;
    }

    auto window_end = state.window_start + ONE_MINUTE;

    if (state.window_count >= limits.requests_per_minute) {
        return RateLimitResult::limited(to_ms(window_end - now), "Per-minute limit exceeded");
    }

    state.window_count++;
    return RateLimitResult::allowed(limits.requests_per_minute - state.window_count, to_ms(window_end - now));
}

RateLimitResult RateLimiter::check_sliding_window(
    KeyState& state,
    const RateLimitConfig& limits,
    Clock::time_point now
) {
    auto& requests = state.requests;

    // Retain only the largest window
    while (!requests.empty() && now - requests.front() >= ONE_MINUTE) {
        requests.pop_front();
    }

    auto first_within = [&requests, now](Clock::duration window) {
        return std::upper_bound(requests.begin(), requests.end(), now - window);
    };

    auto second_start = first_within(ONE_SECOND);
    auto in_second = static_cast<uint32_t>(std::distance(second_start, requests.end()));
    if (in_second >= limits.requests_per_second) {
        return RateLimitResult::limited(to_ms(*second_start + ONE_SECOND - now), "Per-second limit exceeded");
    }

    auto burst_start = first_within(security::RATE_LIMIT_BURST_WINDOW);
    auto in_burst = static_cast<uint32_t>(std::distance(burst_start, requests.end()));
    if (in_burst >= limits.burst_limit) {
        return RateLimitResult::limited(
            to_ms(*burst_start + security::RATE_LIMIT_BURST_WINDOW - now), "Burst limit exceeded");
    }

    auto in_minute = static_cast<uint32_t>(requests.size());
    if (in_minute >= limits.requests_per_minute) {
        return RateLimitResult::limited(to_ms(requests.front() + ONE_MINUTE - now), "Per-minute limit exceeded");
    }

    requests.push_back(now);
    return RateLimitResult::allowed(
        limits.requests_per_minute - in_minute - 1, to_ms(requests.front() + ONE_MINUTE - now));
}

RateLimitResult RateLimiter::check_token_bucket(
    KeyState& state,
    const RateLimitConfig& limits,
    uint8_t risk_score,
    Clock::time_point now
) {
    double capacity = static_cast<double>(limits.requests_per_minute);
    double refill_rate = capacity / 60.0;

    // A new bucket starts full
    if (!state.bucket_initialized) {
        state.tokens = capacity;
        state.last_refill = now;
        state.bucket_initialized = true;
    }

    double elapsed = std::chrono::duration<double>(now - state.last_refill).count();
    if (elapsed > 0.0) {
        state.tokens = std::min(state.tokens + elapsed * refill_rate, capacity);
        state.last_refill = now;
    }

    // Risk-reduced capacity may sit below the current level
    state.tokens = std::min(state.tokens, capacity);

    double cost = token_cost(risk_score);
    if (state.tokens < cost) {
        double wait_seconds = (cost - state.tokens) / refill_rate;
        return RateLimitResult::limited(
            std::chrono::milliseconds(static_cast<int64_t>(std::ceil(wait_seconds * 1000.0))),
            "Insufficient tokens");
    }

    state.tokens -= cost;
    double refill_seconds = (capacity - state.tokens) / refill_rate;
    return RateLimitResult::allowed(
        static_cast<uint32_t>(std::floor(state.tokens)),
        std::chrono::milliseconds(static_cast<int64_t>(std::ceil(refill_seconds * 1000.0))));
}

RateLimitResult RateLimiter::check_adaptive(
    KeyState& state,
    const RateLimitConfig& limits,
    const std::string& endpoint,
    Clock::time_point now
) {
    double violation_factor = std::min(0.1 * state.violations, 0.5);
    double factor = std::max(0.0, 1.0 - load_factor() - violation_factor);

    RateLimitConfig adjusted = limits;
    adjusted.requests_per_minute = scaled(limits.requests_per_minute, factor);

    {
        std::lock_guard<std::mutex> lock(adaptive_mutex_);
        adaptive_limits_[endpoint] = adjusted.requests_per_minute;
    }

    return check_sliding_window(state, adjusted, now);
}

// ============================================================================
// Scaling
// ============================================================================

RateLimitConfig RateLimiter::scale_for_risk(const RateLimitConfig& config, uint8_t risk_score) {
    double factor = 1.0;
    if (risk_score > 80) {
        factor = 0.4;
    } else if (risk_score > 50) {
        factor = 0.6;
    } else if (risk_score > 20) {
        factor = 0.8;
    }

    RateLimitConfig result = config;
    result.requests_per_second = scaled(config.requests_per_second, factor);
    result.requests_per_minute = scaled(config.requests_per_minute, factor);
    result.burst_limit = scaled(config.burst_limit, factor);
    return result;
}

double RateLimiter::token_cost(uint8_t risk_score) {
    if (risk_score > 80) return 3.0;
    if (risk_score > 50) return 2.0;
    if (risk_score > 20) return 1.5;
    return 1.0;
}

double RateLimiter::load_factor() const {
    uint64_t total = total_requests_.load();
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(limited_requests_.load()) / static_cast<double>(total);
}

// ============================================================================
// Key State Management
// ============================================================================

std::string RateLimiter::make_key(const std::string& session_id, const std::string& endpoint) {
    return session_id + '\x1f' + endpoint;
}

RateLimiter::Shard& RateLimiter::shard_for(const std::string& key) {
    return shards_[std::hash<std::string>{}(key) % shards_.size()];
}

const RateLimiter::Shard& RateLimiter::shard_for(const std::string& key) const {
    return shards_[std::hash<std::string>{}(key) % shards_.size()];
}

std::shared_ptr<RateLimiter::KeyState> RateLimiter::get_or_create_state(const std::string& key) {
    Shard& shard = shard_for(key);

    {
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        auto it = shard.states.find(key);
        if (it != shard.states.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    auto& slot = shard.states[key];
    if (!slot) {
        slot = std::make_shared<KeyState>();
        slot->last_seen = Clock::now();
    }
    return slot;
}

void RateLimiter::set_endpoint_config(const std::string& endpoint, const RateLimitConfig& config) {
    std::unique_lock<std::shared_mutex> lock(config_mutex_);
    endpoint_configs_[endpoint] = config;
}

bool RateLimiter::has_endpoint_config(const std::string& endpoint) const {
    std::shared_lock<std::shared_mutex> lock(config_mutex_);
    return endpoint_configs_.find(endpoint) != endpoint_configs_.end();
}

RateLimitConfig RateLimiter::get_endpoint_config(const std::string& endpoint) const {
    std::shared_lock<std::shared_mutex> lock(config_mutex_);
    auto it = endpoint_configs_.find(endpoint);
    return it != endpoint_configs_.end() ? it->second : default_config_;
}

bool RateLimiter::reset_rate_limit(const std::string& session_id, const std::string& endpoint) {
    std::string key = make_key(session_id, endpoint);
    Shard& shard = shard_for(key);

    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.states.find(key);
    if (it == shard.states.end()) {
        return false;
    }

    {
        std::lock_guard<std::mutex> state_lock(it->second->mutex);
        it->second->removed = true;
    }
    shard.states.erase(it);
    return true;
}

std::optional<RateLimitQuota> RateLimiter::get_rate_limit_status(
    const std::string& session_id,
    const std::string& endpoint
) const {
    std::string key = make_key(session_id, endpoint);
    const Shard& shard = shard_for(key);

    std::shared_ptr<KeyState> state;
    {
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        auto it = shard.states.find(key);
        if (it == shard.states.end()) {
            return std::nullopt;
        }
        state = it->second;
    }

    RateLimitConfig config = get_endpoint_config(endpoint);
    auto now = Clock::now();

    std::lock_guard<std::mutex> lock(state->mutex);
    RateLimitQuota quota;
    quota.penalized = state->penalty_until && now < *state->penalty_until;

    switch (config.strategy) {
        case RateLimitStrategy::FIXED_WINDOW: {
            bool expired = state->window_count == 0 || now - state->window_start >= ONE_MINUTE;
            uint32_t used = expired ? 0 : state->window_count;
            quota.remaining = config.requests_per_minute > used ? config.requests_per_minute - used : 0;
            quota.reset_after = expired ? std::chrono::milliseconds(0)
                                        : to_ms(state->window_start + ONE_MINUTE - now);
            break;
        }
        case RateLimitStrategy::TOKEN_BUCKET: {
            double capacity = static_cast<double>(config.requests_per_minute);
            double tokens = state->bucket_initialized
                ? std::min(capacity, state->tokens +
                      std::chrono::duration<double>(now - state->last_refill).count() * capacity / 60.0)
                : capacity;
            quota.remaining = static_cast<uint32_t>(std::floor(tokens));
            quota.reset_after = std::chrono::milliseconds(
                static_cast<int64_t>(std::ceil((capacity - tokens) / (capacity / 60.0) * 1000.0)));
            break;
        }
        case RateLimitStrategy::SLIDING_WINDOW:
        case RateLimitStrategy::ADAPTIVE:
        default: {
            auto first = std::upper_bound(state->requests.begin(), state->requests.end(), now - ONE_MINUTE);
            auto used = static_cast<uint32_t>(std::distance(first, state->requests.end()));
            quota.remaining = config.requests_per_minute > used ? config.requests_per_minute - used : 0;
            quota.reset_after = first == state->requests.end() ? std::chrono::milliseconds(0)
                                                               : to_ms(*first + ONE_MINUTE - now);
            break;
        }
    }

    return quota;
}

// ============================================================================
// Management Functions
// ============================================================================

size_t RateLimiter::cleanup_expired_states() {
    return cleanup_inactive(std::chrono::duration_cast<std::chrono::seconds>(security::RATE_LIMIT_IDLE_TIMEOUT));
}

size_t RateLimiter::cleanup_inactive(std::chrono::seconds inactive_threshold) {
    auto now = Clock::now();
    size_t removed = 0;

    for (auto& shard : shards_) {
        std::unique_lock<std::shared_mutex> lock(shard.mutex);

        for (auto it = shard.states.begin(); it != shard.states.end(); ) {
            KeyState& state = *it->second;

            // Keys in use are skipped until the next sweep
            std::unique_lock<std::mutex> state_lock(state.mutex, std::try_to_lock);
            if (!state_lock.owns_lock()) {
                ++it;
                continue;
            }

            bool penalized = state.penalty_until && now < *state.penalty_until;
            if (!penalized && now - state.last_seen > inactive_threshold) {
                state.removed = true;
                state_lock.unlock();
                it = shard.states.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
    }

    if (removed > 0) {
        utilities::log_debug("RateLimiter: pruned " + std::to_string(removed) + " idle keys");
    }

    return removed;
}

size_t RateLimiter::get_tracked_key_count() const {
    size_t count = 0;
    for (const auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        count += shard.states.size();
    }
    return count;
}

json RateLimiter::get_statistics() const {
    json stats;
    stats["total_requests"] = total_requests_.load();
    stats["allowed_requests"] = allowed_requests_.load();
    stats["limited_requests"] = limited_requests_.load();
    stats["blocked_requests"] = blocked_requests_.load();
    stats["tracked_keys"] = get_tracked_key_count();
    stats["load_factor"] = load_factor();

    {
        std::shared_lock<std::shared_mutex> lock(config_mutex_);
        stats["endpoint_configs"] = endpoint_configs_.size();
        stats["default_strategy"] = strategy_to_string(default_config_.strategy);
    }

    {
        std::lock_guard<std::mutex> lock(adaptive_mutex_);
        stats["adaptive_limits"] = adaptive_limits_;
    }

    return stats;
}

void RateLimiter::clear() {
    for (auto& shard : shards_) {
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        for (auto& entry : shard.states) {
            std::lock_guard<std::mutex> state_lock(entry.second->mutex);
            entry.second->removed = true;
        }
        shard.states.clear();
    }
}

} // namespace ipcguard
