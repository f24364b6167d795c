#include "retry/circuit_breaker.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"

namespace statekeep::retry {

std::string to_string(const CircuitState state) {
    switch (state) {
        case CircuitState::Closed:   return "closed";
        case CircuitState::Open:     return "open";
        case CircuitState::HalfOpen: return "half_open";
        default: return "unknown";
    }
}

CircuitBreakerOptions circuit_options_from(const core::config::CoreConfig& config) {
    CircuitBreakerOptions options;
    options.failure_threshold = config.circuit_failure_threshold;
    options.reset_timeout_ms = config.circuit_reset_timeout_ms;
    options.half_open_max_attempts = config.circuit_half_open_max_attempts;
    return options;
}

SteadyClock real_clock() {
    return []() { return std::chrono::steady_clock::now(); };
}

CircuitBreaker::CircuitBreaker(std::string name, CircuitBreakerOptions options,
                               SteadyClock clock)
    : name_(std::move(name)), options_(options), clock_(std::move(clock)) {}

bool CircuitBreaker::allow_request() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == CircuitState::Open && remaining_locked().count() == 0) {
        transition_to(CircuitState::HalfOpen);
    }
    switch (state_) {
        case CircuitState::Closed:
            return true;
        case CircuitState::HalfOpen:
            if (half_open_attempts_ < options_.half_open_max_attempts) {
                ++half_open_attempts_;
                return true;
            }
            break;
        case CircuitState::Open:
        default:
            break;
    }
    ++blocked_;
    LOG_WARN("CircuitBreaker: '" + name_ + "' blocked a call (" + to_string(state_) +
             ", failures=" + std::to_string(failures_) + ")");
    return false;
}

void CircuitBreaker::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == CircuitState::HalfOpen) {
        ++half_open_successes_;
        if (half_open_successes_ >= options_.half_open_max_attempts) {
            transition_to(CircuitState::Closed);
        }
        return;
    }
    failures_ = 0;
}

void CircuitBreaker::record_failure() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++failures_;
    last_failure_ = clock_();
    if (state_ == CircuitState::HalfOpen) {
        transition_to(CircuitState::Open);
    } else if (state_ == CircuitState::Closed && failures_ >= options_.failure_threshold) {
        transition_to(CircuitState::Open);
    }
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = CircuitState::Closed;
    failures_ = 0;
    half_open_attempts_ = 0;
    half_open_successes_ = 0;
    blocked_ = 0;
    LOG_INFO("CircuitBreaker: '" + name_ + "' reset");
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::uint32_t CircuitBreaker::failure_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

std::chrono::milliseconds CircuitBreaker::remaining_timeout() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return remaining_locked();
}

std::uint64_t CircuitBreaker::blocked_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blocked_;
}

std::chrono::milliseconds CircuitBreaker::remaining_locked() const {
    if (state_ != CircuitState::Open) {
        return std::chrono::milliseconds(0);
    }
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - last_failure_);
    const auto timeout = std::chrono::milliseconds(options_.reset_timeout_ms);
    return std::max(std::chrono::milliseconds(0), timeout - elapsed);
}

void CircuitBreaker::transition_to(const CircuitState next) {
    // Caller holds mutex_.
    if (state_ == next) {
        return;
    }
    const auto previous = state_;
    state_ = next;
    if (next == CircuitState::Closed) {
        failures_ = 0;
        half_open_attempts_ = 0;
        half_open_successes_ = 0;
    } else if (next == CircuitState::HalfOpen) {
        half_open_attempts_ = 0;
        half_open_successes_ = 0;
    }
    LOG_INFO("CircuitBreaker: '" + name_ + "' " + to_string(previous) + " -> " +
             to_string(next) + " (failures=" + std::to_string(failures_) + ")");
}

CircuitBreaker& CircuitBreakerRegistry::for_operation(const std::string& operation_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = breakers_[operation_name];
    if (!slot) {
        slot = std::make_unique<CircuitBreaker>(operation_name, options_, clock_);
    }
    return *slot;
}

}  // namespace statekeep::retry
