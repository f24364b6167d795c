#include "retry/error_classifier.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace statekeep::retry {

using core::errors::ErrorCategory;
namespace codes = core::errors::codes;

namespace {

double fibonacci(const std::uint32_t n) {
    double previous = 1.0;
    double current = 1.0;
    for (std::uint32_t i = 3; i <= n; ++i) {
        const double next = previous + current;
        previous = current;
        current = next;
    }
    return current;
}

double raw_delay(const RetryPolicy& policy, const std::uint32_t attempt) {
    const double base = static_cast<double>(policy.base_delay_ms);
    const std::uint32_t n = std::max<std::uint32_t>(attempt, 1);
    switch (policy.backoff) {
        case BackoffKind::Fixed:
            return base;
        case BackoffKind::Linear:
            return base * static_cast<double>(n);
        case BackoffKind::Fibonacci:
            return base * fibonacci(std::min<std::uint32_t>(n, 64));
        case BackoffKind::Exponential:
        default:
            return base * std::pow(policy.multiplier,
                                   static_cast<double>(std::min<std::uint32_t>(n - 1, 30)));
    }
}

}  // namespace

std::string to_string(const BackoffKind kind) {
    switch (kind) {
        case BackoffKind::Fixed:       return "fixed";
        case BackoffKind::Linear:      return "linear";
        case BackoffKind::Exponential: return "exponential";
        case BackoffKind::Fibonacci:   return "fibonacci";
        default: return "unknown";
    }
}

RetryPolicy default_policy(const ErrorCategory category) {
    RetryPolicy policy;
    switch (category) {
        case ErrorCategory::Transient:
            policy.max_attempts = 5;
            policy.base_delay_ms = 100;
            policy.max_delay_ms = 2000;
            policy.multiplier = 2.0;
            policy.jitter_factor = 0.2;
            break;
        case ErrorCategory::Recoverable:
            policy.max_attempts = 3;
            policy.base_delay_ms = 500;
            policy.max_delay_ms = 5000;
            policy.multiplier = 2.0;
            policy.jitter_factor = 0.1;
            break;
        case ErrorCategory::Fatal:
        default:
            policy.max_attempts = 1;
            break;
    }
    return policy;
}

std::chrono::milliseconds compute_delay(const RetryPolicy& policy, const std::uint32_t attempt,
                                        std::mt19937& rng) {
    double delay = std::min(raw_delay(policy, attempt),
                            static_cast<double>(policy.max_delay_ms));
    if (policy.jitter_factor > 0.0 && policy.jitter_factor <= 1.0 && delay > 0.0) {
        const double range = delay * policy.jitter_factor;
        std::uniform_real_distribution<double> jitter(-range / 2.0, range / 2.0);
        delay = std::max(0.0, delay + jitter(rng));
    }
    delay = std::min(delay, static_cast<double>(policy.max_delay_ms));
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(delay)));
}

ErrorClassifier::ErrorClassifier() {
    codes_ = {
        {codes::kLockAcquisitionFailed, ErrorCategory::Transient},
        {codes::kLockLost, ErrorCategory::Transient},
        {codes::kIoError, ErrorCategory::Transient},
        {codes::kTaskRecoverable, ErrorCategory::Recoverable},
        {codes::kProjectNotFound, ErrorCategory::Fatal},
        {codes::kSectionNotFound, ErrorCategory::Fatal},
        {codes::kProjectExists, ErrorCategory::Fatal},
        {codes::kInvalidTransition, ErrorCategory::Fatal},
        {codes::kValidationFailed, ErrorCategory::Fatal},
        {codes::kHistoryError, ErrorCategory::Fatal},
        {codes::kWatchError, ErrorCategory::Fatal},
        {codes::kCorruptRecord, ErrorCategory::Fatal},
        {codes::kLockNotHolder, ErrorCategory::Fatal},
        {codes::kInvalidSkip, ErrorCategory::Fatal},
        {codes::kRequiredStageSkip, ErrorCategory::Fatal},
        {codes::kCheckpointNotFound, ErrorCategory::Fatal},
        {codes::kCheckpointInvalid, ErrorCategory::Fatal},
        {codes::kConfigInvalid, ErrorCategory::Fatal},
        {codes::kCircuitOpen, ErrorCategory::Transient},
    };
    for (const auto category :
         {ErrorCategory::Transient, ErrorCategory::Recoverable, ErrorCategory::Fatal}) {
        policies_[category] = default_policy(category);
    }
}

ErrorCategory ErrorClassifier::classify(const core::errors::StateError& error) const {
    auto it = codes_.find(error.code);
    if (it != codes_.end()) {
        return it->second;
    }
    return error.category;
}

bool ErrorClassifier::is_retryable(const core::errors::StateError& error) const {
    const auto category = classify(error);
    return category != ErrorCategory::Fatal && retry_policy_for(category).max_attempts > 1;
}

const RetryPolicy& ErrorClassifier::retry_policy_for(const ErrorCategory category) const {
    return policies_.at(category);
}

void ErrorClassifier::register_code(const std::string& code, const ErrorCategory category) {
    codes_[code] = category;
}

void ErrorClassifier::set_policy(const ErrorCategory category, RetryPolicy policy) {
    policies_[category] = std::move(policy);
}

}  // namespace statekeep::retry
