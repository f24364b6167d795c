#pragma once
#include <map>
#include <string>
#include <utility>
#include <variant>

namespace statekeep::core::errors {

    // 1. Retry classes. Every failure lands in exactly one of these.
    enum class ErrorCategory {
        Transient,    // E.g., lock wait timed out, filesystem contention
        Recoverable,  // E.g., a worker reported a condition it can fix
        Fatal         // E.g., invalid transition, missing project, corrupt record
    };

    enum class Severity {
        Low,
        Medium,
        High,
        Critical
    };

    // The standardized error payload
    struct StateError {
        ErrorCategory category = ErrorCategory::Fatal;
        std::string message;
        std::string code = "state.unknown";
        std::string hint = "";
        Severity severity = Severity::Medium;
        // Offending project, section, resource, attempted edge...
        std::map<std::string, std::string> context;
    };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a StateError.
    template <typename T>
    using Result = std::variant<T, StateError>;

    // For operations that only succeed or fail.
    using Status = Result<std::monostate>;

    inline Status ok() { return std::monostate{}; }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<StateError>(result);
    }

    template <typename T>
    const StateError& get_error(const Result<T>& result) {
        return std::get<StateError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T take_value(Result<T>& result) {
        return std::move(std::get<T>(result));
    }

    // 3. Stable codes. Components build errors from these so callers can
    // match on them without parsing messages.
    namespace codes {
        inline constexpr const char* kProjectNotFound = "state.project_not_found";
        inline constexpr const char* kSectionNotFound = "state.section_not_found";
        inline constexpr const char* kProjectExists = "state.project_exists";
        inline constexpr const char* kInvalidTransition = "state.invalid_transition";
        inline constexpr const char* kValidationFailed = "state.validation_failed";
        inline constexpr const char* kHistoryError = "state.history_error";
        inline constexpr const char* kWatchError = "state.watch_error";
        inline constexpr const char* kCorruptRecord = "state.corrupt_record";
        inline constexpr const char* kLockAcquisitionFailed = "lock.acquisition_failed";
        inline constexpr const char* kLockNotHolder = "lock.not_holder";
        inline constexpr const char* kLockLost = "lock.lost";
        inline constexpr const char* kIoError = "fs.io_error";
        inline constexpr const char* kTaskRecoverable = "task.recoverable";
        inline constexpr const char* kInvalidSkip = "recovery.invalid_skip";
        inline constexpr const char* kRequiredStageSkip = "recovery.required_stage_skip";
        inline constexpr const char* kCheckpointNotFound = "recovery.checkpoint_not_found";
        inline constexpr const char* kCheckpointInvalid = "recovery.checkpoint_invalid";
        inline constexpr const char* kConfigInvalid = "config.invalid";
        inline constexpr const char* kCircuitOpen = "retry.circuit_open";
    }  // namespace codes

    inline StateError make_error(ErrorCategory category, std::string code,
                                 std::string message,
                                 std::map<std::string, std::string> context = {},
                                 Severity severity = Severity::Medium) {
        StateError error;
        error.category = category;
        error.code = std::move(code);
        error.message = std::move(message);
        error.context = std::move(context);
        error.severity = severity;
        return error;
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Transient:   return "transient";
            case ErrorCategory::Recoverable: return "recoverable";
            case ErrorCategory::Fatal:       return "fatal";
            default: return "unknown";
        }
    }

    inline std::string to_string(const Severity severity) {
        switch (severity) {
            case Severity::Low:      return "low";
            case Severity::Medium:   return "medium";
            case Severity::High:     return "high";
            case Severity::Critical: return "critical";
            default: return "unknown";
        }
    }

    // "[code] message (project=001, to=merged)"
    inline std::string describe(const StateError& error) {
        std::string text = "[" + error.code + "] " + error.message;
        if (!error.context.empty()) {
            text += " (";
            bool first = true;
            for (const auto& [key, value] : error.context) {
                if (!first) {
                    text += ", ";
                }
                text += key + "=" + value;
                first = false;
            }
            text += ")";
        }
        return text;
    }

} // namespace statekeep::core::errors
