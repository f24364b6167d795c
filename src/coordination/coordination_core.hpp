#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/core_config.hpp"
#include "core/errors/state_errors.hpp"
#include "lock/file_lock_manager.hpp"
#include "notify/change_notifier.hpp"
#include "retry/circuit_breaker.hpp"
#include "retry/error_classifier.hpp"
#include "retry/retry_executor.hpp"
#include "state/state_machine_engine.hpp"
#include "store/state_store.hpp"

namespace statekeep::coordination {

// One coordination core per base path: owns the lock manager, store,
// engine, notifier and retry policy, and is passed explicitly to whoever
// needs it. Independent instances share nothing but the files on disk.
//
// Every operation below retries transient failures (lock timeouts, lost
// locks, filesystem errors) per the transient policy before returning;
// fatal failures come back on the first attempt.
class CoordinationCore {
    // Only create() can name this, so only create() can construct.
    struct Token {
        explicit Token() = default;
    };

public:
    static core::errors::Result<std::unique_ptr<CoordinationCore>> create(
        core::config::CoreConfig config, retry::SleepFunction sleep = retry::real_sleep());

    CoordinationCore(Token, core::config::CoreConfig config, retry::SleepFunction sleep);

    ~CoordinationCore();

    CoordinationCore(const CoordinationCore&) = delete;
    CoordinationCore& operator=(const CoordinationCore&) = delete;

    core::errors::Result<state::ProjectSummary> initialize_project(
        const std::string& project_id, const std::string& name,
        state::PipelineState initial_state = state::PipelineState::Collecting);
    core::errors::Status delete_project(const std::string& project_id);

    core::errors::Result<store::SectionSnapshot> read_section(
        const std::string& project_id, const std::string& section,
        store::ReadOptions options = {}) const;
    core::errors::Result<store::SectionSnapshot> write_section(
        const std::string& project_id, const std::string& section, const nlohmann::json& value,
        const std::optional<std::string>& description = std::nullopt);
    core::errors::Result<store::SectionSnapshot> update_section(
        const std::string& project_id, const std::string& section, const nlohmann::json& patch,
        const store::UpdateOptions& options = {});
    core::errors::Result<std::vector<store::HistoryEntry>> get_history(
        const std::string& project_id, const std::string& section) const;
    core::errors::Result<std::uint64_t> section_version(const std::string& project_id,
                                                        const std::string& section) const;

    core::errors::Result<state::TransitionResult> transition(const std::string& project_id,
                                                             state::PipelineState target);
    core::errors::Result<state::PipelineState> current_state(
        const std::string& project_id) const;
    core::errors::Result<state::ProjectSummary> project_summary(
        const std::string& project_id) const;

    core::errors::Result<state::SkipResult> skip_to(const std::string& project_id,
                                                    state::PipelineState target,
                                                    const state::SkipOptions& options = {});
    core::errors::Result<state::TransitionResult> recover_to(
        const std::string& project_id, state::PipelineState target,
        const std::optional<std::string>& reason = std::nullopt);
    core::errors::Result<state::Checkpoint> create_checkpoint(
        const std::string& project_id,
        state::CheckpointTrigger trigger = state::CheckpointTrigger::Manual,
        const std::optional<std::string>& reason = std::nullopt);
    core::errors::Result<state::RestoreResult> restore_checkpoint(
        const std::string& project_id, const std::string& checkpoint_id);

    // In-process only. Other processes poll section_version().
    [[nodiscard]] notify::Subscription watch(
        const std::string& project_id, notify::ChangeCallback on_event,
        std::optional<std::string> section = std::nullopt);

    // Runs a collaborator's own operation (e.g. an external task) under the
    // same classification and retry discipline, with the full attempt log.
    template <typename T>
    retry::RetryOutcome<T> run_task(const std::string& name,
                                    const std::function<core::errors::Result<T>()>& task,
                                    const retry::Remediation& remediation = nullptr) const {
        return retry_.run<T>(name, task, remediation);
    }

    const core::config::CoreConfig& config() const { return config_; }
    lock::FileLockManager& locks() { return *locks_; }
    store::StateStore& store() { return *store_; }
    state::StateMachineEngine& engine() { return *engine_; }
    notify::ChangeNotifier& notifier() { return *notifier_; }
    retry::ErrorClassifier& classifier() { return classifier_; }
    // nullptr unless enable_circuit_breaker is set.
    retry::CircuitBreakerRegistry* circuit_breakers() { return breakers_.get(); }

private:
    template <typename T>
    core::errors::Result<T> retried(const std::string& name,
                                    const std::function<core::errors::Result<T>()>& op) const {
        auto outcome = retry_.run<T>(name, op);
        return std::move(outcome.result);
    }

    core::config::CoreConfig config_;
    retry::ErrorClassifier classifier_;
    std::unique_ptr<retry::CircuitBreakerRegistry> breakers_;
    retry::RetryExecutor retry_;
    // Destroyed bottom-up: engine and store first, then the lock manager,
    // which releases whatever is still held.
    std::unique_ptr<lock::FileLockManager> locks_;
    std::unique_ptr<notify::ChangeNotifier> notifier_;
    std::unique_ptr<store::StateStore> store_;
    std::unique_ptr<state::StateMachineEngine> engine_;
};

}  // namespace statekeep::coordination
