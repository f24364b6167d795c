#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "core/config/core_config.hpp"

namespace statekeep::retry {

enum class CircuitState {
    Closed,    // Calls pass; consecutive failures are counted
    Open,      // Calls are refused until reset_timeout_ms has passed
    HalfOpen   // A few trial calls decide between Closed and Open
};

std::string to_string(CircuitState state);

struct CircuitBreakerOptions {
    std::uint32_t failure_threshold = 5;
    std::uint32_t reset_timeout_ms = 60000;
    // Trial calls allowed while half-open; all must succeed to close.
    std::uint32_t half_open_max_attempts = 3;
};

CircuitBreakerOptions circuit_options_from(const core::config::CoreConfig& config);

using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

SteadyClock real_clock();

// Stops an operation that keeps failing from being hammered. Thread-safe.
class CircuitBreaker {
public:
    explicit CircuitBreaker(std::string name, CircuitBreakerOptions options = {},
                            SteadyClock clock = real_clock());

    // true if a call may go ahead now. Moves Open to HalfOpen once the reset
    // timeout has passed and counts half-open trials.
    bool allow_request();
    void record_success();
    void record_failure();
    void reset();

    CircuitState state() const;
    std::uint32_t failure_count() const;
    std::chrono::milliseconds remaining_timeout() const;
    std::uint64_t blocked_count() const;
    const std::string& name() const { return name_; }

private:
    void transition_to(CircuitState next);
    std::chrono::milliseconds remaining_locked() const;

    std::string name_;
    CircuitBreakerOptions options_;
    SteadyClock clock_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::Closed;
    std::uint32_t failures_ = 0;
    std::uint32_t half_open_attempts_ = 0;
    std::uint32_t half_open_successes_ = 0;
    std::chrono::steady_clock::time_point last_failure_{};
    std::uint64_t blocked_ = 0;
};

// One breaker per operation name, created on first use.
class CircuitBreakerRegistry {
public:
    explicit CircuitBreakerRegistry(CircuitBreakerOptions options = {},
                                    SteadyClock clock = real_clock())
        : options_(options), clock_(std::move(clock)) {}

    CircuitBreaker& for_operation(const std::string& operation_name);

private:
    CircuitBreakerOptions options_;
    SteadyClock clock_;
    std::mutex mutex_;
    std::map<std::string, std::unique_ptr<CircuitBreaker>> breakers_;
};

}  // namespace statekeep::retry
