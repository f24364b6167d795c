#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <utility>
#include <vector>
#include "core/errors/state_errors.hpp"
#include "core/logging/logger.hpp"
#include "retry/circuit_breaker.hpp"
#include "retry/error_classifier.hpp"

namespace statekeep::retry {

struct AttemptRecord {
    std::uint32_t attempt = 0;
    bool succeeded = false;
    std::string code;
    core::errors::ErrorCategory category = core::errors::ErrorCategory::Fatal;
    std::string message;
    // Recoverable failures only: did the remediation hook report success.
    bool remediated = false;
    std::chrono::milliseconds delay_before_next{0};
};

template <typename T>
struct RetryOutcome {
    core::errors::Result<T> result;
    // Every try, in order, including the last one.
    std::vector<AttemptRecord> attempts;
    // Gave up on a failure: fatal, out of attempts, or remediation failed.
    bool escalated = false;
};

// Tries to fix what a recoverable failure reported before the next attempt.
using Remediation = std::function<core::errors::Status(const core::errors::StateError&)>;
using SleepFunction = std::function<void(std::chrono::milliseconds)>;

// "#1 lock.acquisition_failed transient wait=104ms; #2 ok"
std::string describe_attempts(const std::vector<AttemptRecord>& attempts);

SleepFunction real_sleep();

// Runs an operation under the classifier's policies. Transient failures
// back off and retry up to the transient ceiling; recoverable ones retry
// only after the remediation hook succeeds; fatal ones return at once.
//
// With circuit breakers installed, each attempt first asks the breaker for
// the operation's name. An open circuit ends the run with
// retry.circuit_open. Transient and recoverable failures count against the
// breaker; a fatal answer counts as the resource responding.
class RetryExecutor {
public:
    explicit RetryExecutor(const ErrorClassifier& classifier, SleepFunction sleep = real_sleep())
        : classifier_(classifier), sleep_(std::move(sleep)) {}

    // Not owned; nullptr turns the breakers off.
    void use_circuit_breakers(CircuitBreakerRegistry* breakers) { breakers_ = breakers; }

    template <typename T>
    RetryOutcome<T> run(const std::string& operation_name,
                        const std::function<core::errors::Result<T>()>& operation,
                        const Remediation& remediation = nullptr) const {
        thread_local std::mt19937 rng(std::random_device{}());
        CircuitBreaker* breaker =
            breakers_ != nullptr ? &breakers_->for_operation(operation_name) : nullptr;
        std::vector<AttemptRecord> attempts;
        for (std::uint32_t attempt = 1;; ++attempt) {
            AttemptRecord record;
            record.attempt = attempt;
            if (breaker != nullptr && !breaker->allow_request()) {
                auto error = core::errors::make_error(
                    core::errors::ErrorCategory::Transient, core::errors::codes::kCircuitOpen,
                    "Circuit open for " + operation_name,
                    {{"operation", operation_name},
                     {"failure_count", std::to_string(breaker->failure_count())},
                     {"remaining_ms", std::to_string(breaker->remaining_timeout().count())}});
                record.code = error.code;
                record.category = error.category;
                record.message = error.message;
                attempts.push_back(record);
                LOG_WARN("RetryExecutor: " + core::errors::describe(error));
                return RetryOutcome<T>{core::errors::Result<T>(std::move(error)),
                                       std::move(attempts), true};
            }

            core::errors::Result<T> result = operation();
            if (!core::errors::is_error(result)) {
                if (breaker != nullptr) {
                    breaker->record_success();
                }
                record.succeeded = true;
                attempts.push_back(record);
                if (attempt > 1) {
                    LOG_INFO("RetryExecutor: " + operation_name + " succeeded on attempt " +
                             std::to_string(attempt));
                }
                return RetryOutcome<T>{std::move(result), std::move(attempts), false};
            }

            const auto& error = core::errors::get_error(result);
            const auto category = classifier_.classify(error);
            const auto& policy = classifier_.retry_policy_for(category);
            record.code = error.code;
            record.category = category;
            record.message = error.message;
            if (breaker != nullptr) {
                if (category == core::errors::ErrorCategory::Fatal) {
                    breaker->record_success();
                } else {
                    breaker->record_failure();
                }
            }

            bool retry = category != core::errors::ErrorCategory::Fatal &&
                         attempt < policy.max_attempts;
            if (retry && category == core::errors::ErrorCategory::Recoverable) {
                if (!remediation) {
                    retry = false;
                } else {
                    auto fixed = remediation(error);
                    record.remediated = !core::errors::is_error(fixed);
                    if (!record.remediated) {
                        LOG_WARN("RetryExecutor: remediation for " + operation_name +
                                 " failed " +
                                 core::errors::describe(core::errors::get_error(fixed)));
                        retry = false;
                    }
                }
            }

            if (!retry) {
                attempts.push_back(record);
                LOG_ERROR("RetryExecutor: " + operation_name + " gave up (" +
                          core::errors::to_string(category) + ") " +
                          core::errors::describe(error) +
                          " attempts: " + describe_attempts(attempts));
                return RetryOutcome<T>{std::move(result), std::move(attempts), true};
            }

            record.delay_before_next = compute_delay(policy, attempt, rng);
            attempts.push_back(record);
            LOG_WARN("RetryExecutor: " + operation_name + " attempt " +
                     std::to_string(attempt) + "/" + std::to_string(policy.max_attempts) +
                     " failed " + core::errors::describe(error) + ", retrying in " +
                     std::to_string(record.delay_before_next.count()) + "ms");
            sleep_(record.delay_before_next);
        }
    }

    const ErrorClassifier& classifier() const { return classifier_; }

private:
    const ErrorClassifier& classifier_;
    SleepFunction sleep_;
    CircuitBreakerRegistry* breakers_ = nullptr;
};

}  // namespace statekeep::retry
