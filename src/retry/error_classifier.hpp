#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <random>
#include <string>
#include "core/errors/state_errors.hpp"

namespace statekeep::retry {

enum class BackoffKind {
    Fixed,        // base
    Linear,       // base * n
    Exponential,  // base * multiplier^(n-1)
    Fibonacci     // base * fib(n): 1, 1, 2, 3, 5, ...
};

std::string to_string(BackoffKind kind);

struct RetryPolicy {
    BackoffKind backoff = BackoffKind::Exponential;
    // Total tries including the first one.
    std::uint32_t max_attempts = 1;
    std::uint32_t base_delay_ms = 0;
    std::uint32_t max_delay_ms = 0;
    double multiplier = 2.0;
    // Spread of the random jitter as a fraction of the delay, centred on it.
    double jitter_factor = 0.0;
};

RetryPolicy default_policy(core::errors::ErrorCategory category);

// Delay to wait after failed attempt `attempt` (1-based), shaped by the
// policy's backoff kind, jittered, capped at max_delay_ms.
std::chrono::milliseconds compute_delay(const RetryPolicy& policy, std::uint32_t attempt,
                                        std::mt19937& rng);

// Maps failures to retry classes. Known codes are pinned to a category so
// a component that builds an error with the wrong category cannot make a
// fatal condition retryable; unknown codes keep the category they carry.
class ErrorClassifier {
public:
    ErrorClassifier();

    core::errors::ErrorCategory classify(const core::errors::StateError& error) const;
    bool is_retryable(const core::errors::StateError& error) const;
    const RetryPolicy& retry_policy_for(core::errors::ErrorCategory category) const;

    void register_code(const std::string& code, core::errors::ErrorCategory category);
    void set_policy(core::errors::ErrorCategory category, RetryPolicy policy);

private:
    std::map<std::string, core::errors::ErrorCategory> codes_;
    std::map<core::errors::ErrorCategory, RetryPolicy> policies_;
};

}  // namespace statekeep::retry
