/**
 * @file test_rate_limiter.cpp
 * @brief Unit tests for RateLimiter
 *
 * Tests per-(session, endpoint) rate limiting including:
 * - Sliding window per-second, burst and per-minute bounds
 * - Fixed window, token bucket and adaptive strategies
 * - Risk-scaled limits
 * - Escalating penalties
 * - Key isolation, reset, status and cleanup
 * - Thread safety
 */

#include <gtest/gtest.h>
#include "ipcguard/rate_limiter.hpp"
#include <thread>
#include <vector>
#include <atomic>
#include <chrono>

using namespace ipcguard;
using json = nlohmann::json;

// Test fixture for rate limiter tests
class RateLimiterTest : public ::testing::Test {
protected:
    void SetUp() override {
        limiter_ = std::make_unique<RateLimiter>();
    }

    void TearDown() override {
        limiter_.reset();
    }

    static RateLimitConfig make_config(
        RateLimitStrategy strategy,
        uint32_t per_second,
        uint32_t per_minute,
        uint32_t burst
    ) {
        RateLimitConfig config;
        config.strategy = strategy;
        config.requests_per_second = per_second;
        config.requests_per_minute = per_minute;
        config.burst_limit = burst;
        return config;
    }

    // Issues count requests and returns how many were allowed
    int allowed_count(const std::string& session, const std::string& endpoint, int count, uint8_t risk = 0) {
        int allowed = 0;
        for (int i = 0; i < count; ++i) {
            if (limiter_->check_rate_limit(session, endpoint, risk).is_allowed()) {
                allowed++;
            }
        }
        return allowed;
    }

    std::unique_ptr<RateLimiter> limiter_;
};

// ============================================================================
// Sliding Window Tests
// ============================================================================

TEST_F(RateLimiterTest, FirstRequestAllowed) {
    auto result = limiter_->check_rate_limit("session1", "get_settings", 0);
    ASSERT_TRUE(result.is_allowed());
    EXPECT_EQ(result.remaining, security::RATE_LIMIT_PER_MINUTE - 1);
    EXPECT_GT(result.reset_after.count(), 0);
}

TEST_F(RateLimiterTest, BurstLimitOfThree) {
    limiter_->set_endpoint_config("save", make_config(RateLimitStrategy::SLIDING_WINDOW, 10, 100, 3));

    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(limiter_->check_rate_limit("session1", "save", 0).is_allowed()) << "request " << i;
    }

    auto fourth = limiter_->check_rate_limit("session1", "save", 0);
    EXPECT_EQ(fourth.status, RateLimitStatus::LIMITED);
    EXPECT_GT(fourth.retry_after.count(), 0);
    EXPECT_FALSE(fourth.reason.empty());
}

TEST_F(RateLimiterTest, PerSecondLimit) {
    limiter_->set_endpoint_config("ep", make_config(RateLimitStrategy::SLIDING_WINDOW, 5, 100, 50));

    EXPECT_EQ(allowed_count("session1", "ep", 8), 5);
}

TEST_F(RateLimiterTest, PerMinuteLimit) {
    limiter_->set_endpoint_config("ep", make_config(RateLimitStrategy::SLIDING_WINDOW, 100, 4, 100));

    EXPECT_EQ(allowed_count("session1", "ep", 6), 4);
}

TEST_F(RateLimiterTest, RemainingDecreases) {
    limiter_->set_endpoint_config("ep", make_config(RateLimitStrategy::SLIDING_WINDOW, 100, 10, 100));

    EXPECT_EQ(limiter_->check_rate_limit("s", "ep", 0).remaining, 9u);
    EXPECT_EQ(limiter_->check_rate_limit("s", "ep", 0).remaining, 8u);
    EXPECT_EQ(limiter_->check_rate_limit("s", "ep", 0).remaining, 7u);
}

// ============================================================================
// Penalty Tests
// ============================================================================

TEST_F(RateLimiterTest, PenaltyAfterFiveLimitedOutcomes) {
    limiter_->set_endpoint_config("save", make_config(RateLimitStrategy::SLIDING_WINDOW, 10, 100, 3));

    EXPECT_EQ(allowed_count("session1", "save", 3), 3);

    for (int i = 0; i < 5; ++i) {
        auto result = limiter_->check_rate_limit("session1", "save", 0);
        EXPECT_EQ(result.status, RateLimitStatus::LIMITED) << "violation " << i;
    }

    auto blocked = limiter_->check_rate_limit("session1", "save", 0);
    ASSERT_EQ(blocked.status, RateLimitStatus::BLOCKED);
    EXPECT_GT(blocked.unblock_after.count(), 0);

    // Default penalty is cooldown (300s) * multiplier (0.5)
    EXPECT_LE(blocked.unblock_after, std::chrono::milliseconds(150000));
    EXPECT_GT(blocked.unblock_after, std::chrono::milliseconds(140000));
}

TEST_F(RateLimiterTest, PenaltyUsesEndpointSettings) {
    RateLimitConfig config = make_config(RateLimitStrategy::SLIDING_WINDOW, 1, 100, 100);
    config.violation_threshold = 2;
    config.cooldown_period = std::chrono::seconds(10);
    config.penalty_multiplier = 2.0;
    limiter_->set_endpoint_config("ep", config);

    EXPECT_TRUE(limiter_->check_rate_limit("s", "ep", 0).is_allowed());
    EXPECT_EQ(limiter_->check_rate_limit("s", "ep", 0).status, RateLimitStatus::LIMITED);
    EXPECT_EQ(limiter_->check_rate_limit("s", "ep", 0).status, RateLimitStatus::LIMITED);

    auto blocked = limiter_->check_rate_limit("s", "ep", 0);
    ASSERT_EQ(blocked.status, RateLimitStatus::BLOCKED);
    EXPECT_GT(blocked.unblock_after, std::chrono::milliseconds(19000));
}

TEST_F(RateLimiterTest, PenaltyIsPerKey) {
    limiter_->set_endpoint_config("save", make_config(RateLimitStrategy::SLIDING_WINDOW, 10, 100, 1));

    allowed_count("attacker", "save", 7);
    EXPECT_EQ(limiter_->check_rate_limit("attacker", "save", 0).status, RateLimitStatus::BLOCKED);

    EXPECT_TRUE(limiter_->check_rate_limit("victim", "save", 0).is_allowed());
    EXPECT_TRUE(limiter_->check_rate_limit("attacker", "other", 0).is_allowed());
}

// ============================================================================
// Risk Scaling Tests
// ============================================================================

TEST_F(RateLimiterTest, HighRiskGetsTighterLimits) {
    limiter_->set_endpoint_config("ep", make_config(RateLimitStrategy::SLIDING_WINDOW, 10, 100, 100));

    EXPECT_EQ(allowed_count("low", "ep", 12, 10), 10);
    EXPECT_EQ(allowed_count("medium", "ep", 12, 40), 8);
    EXPECT_EQ(allowed_count("elevated", "ep", 12, 70), 6);
    EXPECT_EQ(allowed_count("high", "ep", 12, 95), 4);
}

TEST_F(RateLimiterTest, ScaledLimitsNeverReachZero) {
    limiter_->set_endpoint_config("ep", make_config(RateLimitStrategy::SLIDING_WINDOW, 1, 1, 1));

    EXPECT_TRUE(limiter_->check_rate_limit("s", "ep", 100).is_allowed());
}

// ============================================================================
// Fixed Window Tests
// ============================================================================

TEST_F(RateLimiterTest, FixedWindowCountsPerMinute) {
    limiter_->set_endpoint_config("ep", make_config(RateLimitStrategy::FIXED_WINDOW, 1, 5, 1));

    for (uint32_t i = 0; i < 5; ++i) {
        auto result = limiter_->check_rate_limit("s", "ep", 0);
        ASSERT_TRUE(result.is_allowed());
        EXPECT_EQ(result.remaining, 4 - i);
    }

    auto limited = limiter_->check_rate_limit("s", "ep", 0);
    EXPECT_EQ(limited.status, RateLimitStatus::LIMITED);
    EXPECT_GT(limited.retry_after.count(), 0);
    EXPECT_LE(limited.retry_after, std::chrono::milliseconds(60000));
}

// ============================================================================
// Token Bucket Tests
// ============================================================================

TEST_F(RateLimiterTest, TokenBucketStartsFull) {
    limiter_->set_endpoint_config("ep", make_config(RateLimitStrategy::TOKEN_BUCKET, 1, 6, 1));

    EXPECT_EQ(allowed_count("s", "ep", 8), 6);
}

TEST_F(RateLimiterTest, TokenBucketCostScalesWithRisk) {
    limiter_->set_endpoint_config("ep", make_config(RateLimitStrategy::TOKEN_BUCKET, 1, 60, 1));

    // Risk 95: capacity 60 * 0.4 = 24 tokens, 3 tokens per request
    EXPECT_EQ(allowed_count("s", "ep", 10, 95), 8);
}

TEST_F(RateLimiterTest, TokenBucketRetryAfterFromRefillRate) {
    limiter_->set_endpoint_config("ep", make_config(RateLimitStrategy::TOKEN_BUCKET, 1, 60, 1));

    allowed_count("s", "ep", 60);
    auto limited = limiter_->check_rate_limit("s", "ep", 0);
    ASSERT_EQ(limited.status, RateLimitStatus::LIMITED);

    // Refill is one token per second
    EXPECT_GT(limited.retry_after.count(), 0);
    EXPECT_LE(limited.retry_after, std::chrono::milliseconds(1000));
}

// ============================================================================
// Adaptive Tests
// ============================================================================

TEST_F(RateLimiterTest, AdaptiveUsesBaseLimitWithoutLoad) {
    limiter_->set_endpoint_config("ep", make_config(RateLimitStrategy::ADAPTIVE, 100, 50, 100));

    EXPECT_TRUE(limiter_->check_rate_limit("s", "ep", 0).is_allowed());

    json stats = limiter_->get_statistics();
    EXPECT_EQ(stats["adaptive_limits"]["ep"], 50);
}

TEST_F(RateLimiterTest, AdaptiveShrinksUnderLoad) {
    limiter_->set_endpoint_config("tight", make_config(RateLimitStrategy::SLIDING_WINDOW, 1, 100, 100));
    limiter_->set_endpoint_config("ep", make_config(RateLimitStrategy::ADAPTIVE, 100, 50, 100));

    // One allowed and three limited: load factor 0.75
    allowed_count("noisy", "tight", 4);

    limiter_->check_rate_limit("s", "ep", 0);
    json stats = limiter_->get_statistics();
    EXPECT_LT(stats["adaptive_limits"]["ep"].get<uint32_t>(), 50u);
    EXPECT_GE(stats["adaptive_limits"]["ep"].get<uint32_t>(), 1u);
}

// ============================================================================
// Configuration Tests
// ============================================================================

TEST_F(RateLimiterTest, EndpointConfigOverridesDefault) {
    EXPECT_FALSE(limiter_->has_endpoint_config("ep"));
    EXPECT_EQ(limiter_->get_endpoint_config("ep").requests_per_minute, security::RATE_LIMIT_PER_MINUTE);

    limiter_->set_endpoint_config("ep", make_config(RateLimitStrategy::FIXED_WINDOW, 1, 7, 1));
    EXPECT_TRUE(limiter_->has_endpoint_config("ep"));
    EXPECT_EQ(limiter_->get_endpoint_config("ep").requests_per_minute, 7u);
    EXPECT_EQ(limiter_->get_endpoint_config("ep").strategy, RateLimitStrategy::FIXED_WINDOW);
}

TEST_F(RateLimiterTest, ConfigFromJsonKeepsBaseValues) {
    auto config = RateLimitConfig::from_json(json{{"requests_per_minute", 30}, {"strategy", "TOKEN_BUCKET"}});
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->requests_per_minute, 30u);
    EXPECT_EQ(config->strategy, RateLimitStrategy::TOKEN_BUCKET);
    EXPECT_EQ(config->requests_per_second, security::RATE_LIMIT_PER_SECOND);
    EXPECT_EQ(config->cooldown_period, security::RATE_LIMIT_COOLDOWN);
}

TEST_F(RateLimiterTest, ConfigFromJsonRejectsInvalid) {
    EXPECT_FALSE(RateLimitConfig::from_json(json{{"requests_per_minute", 0}}).has_value());
    EXPECT_FALSE(RateLimitConfig::from_json(json{{"strategy", "LEAKY_BUCKET"}}).has_value());
    EXPECT_FALSE(RateLimitConfig::from_json(json{{"burst_limit", "many"}}).has_value());
    EXPECT_FALSE(RateLimitConfig::from_json(json::array()).has_value());
}

// ============================================================================
// Management Tests
// ============================================================================

TEST_F(RateLimiterTest, ResetRestoresQuota) {
    limiter_->set_endpoint_config("ep", make_config(RateLimitStrategy::SLIDING_WINDOW, 1, 100, 100));

    EXPECT_TRUE(limiter_->check_rate_limit("s", "ep", 0).is_allowed());
    EXPECT_FALSE(limiter_->check_rate_limit("s", "ep", 0).is_allowed());

    EXPECT_TRUE(limiter_->reset_rate_limit("s", "ep"));
    EXPECT_TRUE(limiter_->check_rate_limit("s", "ep", 0).is_allowed());

    EXPECT_FALSE(limiter_->reset_rate_limit("unknown", "ep"));
}

TEST_F(RateLimiterTest, StatusOfTrackedKey) {
    EXPECT_FALSE(limiter_->get_rate_limit_status("s", "ep").has_value());

    allowed_count("s", "ep", 3);

    auto status = limiter_->get_rate_limit_status("s", "ep");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->remaining, security::RATE_LIMIT_PER_MINUTE - 3);
    EXPECT_GT(status->reset_after.count(), 0);
    EXPECT_FALSE(status->penalized);
}

TEST_F(RateLimiterTest, CleanupRemovesIdleKeys) {
    allowed_count("s1", "ep", 1);
    allowed_count("s2", "ep", 1);
    EXPECT_EQ(limiter_->get_tracked_key_count(), 2u);

    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    EXPECT_EQ(limiter_->cleanup_inactive(std::chrono::seconds(0)), 2u);
    EXPECT_EQ(limiter_->get_tracked_key_count(), 0u);
}

TEST_F(RateLimiterTest, CleanupKeepsPenalizedKeys) {
    limiter_->set_endpoint_config("ep", make_config(RateLimitStrategy::SLIDING_WINDOW, 1, 100, 100));
    allowed_count("attacker", "ep", 7);
    allowed_count("idle", "ep", 1);

    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    EXPECT_EQ(limiter_->cleanup_inactive(std::chrono::seconds(0)), 1u);
    ASSERT_TRUE(limiter_->get_rate_limit_status("attacker", "ep").has_value());
    EXPECT_TRUE(limiter_->get_rate_limit_status("attacker", "ep")->penalized);
}

TEST_F(RateLimiterTest, CleanupExpiredStatesKeepsRecentKeys) {
    allowed_count("s1", "ep", 1);
    EXPECT_EQ(limiter_->cleanup_expired_states(), 0u);
    EXPECT_EQ(limiter_->get_tracked_key_count(), 1u);
}

TEST_F(RateLimiterTest, ClearRemovesEverything) {
    allowed_count("s1", "a", 1);
    allowed_count("s2", "b", 1);
    limiter_->clear();
    EXPECT_EQ(limiter_->get_tracked_key_count(), 0u);
}

TEST_F(RateLimiterTest, Statistics) {
    limiter_->set_endpoint_config("ep", make_config(RateLimitStrategy::SLIDING_WINDOW, 2, 100, 100));
    allowed_count("s", "ep", 3);

    json stats = limiter_->get_statistics();
    EXPECT_EQ(stats["total_requests"], 3);
    EXPECT_EQ(stats["allowed_requests"], 2);
    EXPECT_EQ(stats["limited_requests"], 1);
    EXPECT_EQ(stats["blocked_requests"], 0);
    EXPECT_EQ(stats["tracked_keys"], 1);
    EXPECT_EQ(stats["endpoint_configs"], 1);
    EXPECT_EQ(stats["default_strategy"], "SLIDING_WINDOW");
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

TEST_F(RateLimiterTest, ConcurrentRequestsSameKey) {
    limiter_->set_endpoint_config("ep", make_config(RateLimitStrategy::SLIDING_WINDOW, 100000, 100000, 100000));

    std::atomic<int> allowed{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, &allowed]() {
            for (int i = 0; i < 100; ++i) {
                if (limiter_->check_rate_limit("shared", "ep", 0).is_allowed()) {
                    allowed++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(allowed.load(), 800);
    EXPECT_EQ(limiter_->get_tracked_key_count(), 1u);

    auto status = limiter_->get_rate_limit_status("shared", "ep");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->remaining, 100000u - 800u);
}

TEST_F(RateLimiterTest, ConcurrentLimitIsExact) {
    limiter_->set_endpoint_config("ep", make_config(RateLimitStrategy::SLIDING_WINDOW, 1000, 50, 1000));

    std::atomic<int> allowed{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, &allowed]() {
            for (int i = 0; i < 20; ++i) {
                if (limiter_->check_rate_limit("shared", "ep", 0).is_allowed()) {
                    allowed++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(allowed.load(), 50);
}

TEST_F(RateLimiterTest, ConcurrentCleanupAndChecks) {
    std::atomic<bool> running{true};
    std::thread sweeper([this, &running]() {
        while (running) {
            limiter_->cleanup_inactive(std::chrono::seconds(0));
        }
    });

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < 200; ++i) {
                limiter_->check_rate_limit("session" + std::to_string(t), "ep" + std::to_string(i % 5), 0);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    running = false;
    sweeper.join();

    json stats = limiter_->get_statistics();
    EXPECT_EQ(stats["total_requests"], 800);
}
