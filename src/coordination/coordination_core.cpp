#include "coordination/coordination_core.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace statekeep::coordination {

using core::errors::Result;
using core::errors::Status;
using nlohmann::json;

core::errors::Result<std::unique_ptr<CoordinationCore>> CoordinationCore::create(
    core::config::CoreConfig config, retry::SleepFunction sleep) {
    auto valid = core::config::validate(config);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }
    LOG_INFO("CoordinationCore: using " + config.base_path.string());
    return std::make_unique<CoordinationCore>(Token{}, std::move(config), std::move(sleep));
}

CoordinationCore::CoordinationCore(Token, core::config::CoreConfig config,
                                   retry::SleepFunction sleep)
    : config_(std::move(config)),
      retry_(classifier_, std::move(sleep)),
      locks_(std::make_unique<lock::FileLockManager>(config_.base_path,
                                                     lock::lock_options_from(config_))),
      notifier_(std::make_unique<notify::ChangeNotifier>()),
      store_(std::make_unique<store::StateStore>(config_, *locks_, notifier_.get())),
      engine_(std::make_unique<state::StateMachineEngine>(*store_)) {
    if (config_.enable_circuit_breaker) {
        breakers_ = std::make_unique<retry::CircuitBreakerRegistry>(
            retry::circuit_options_from(config_));
        retry_.use_circuit_breakers(breakers_.get());
    }
}

CoordinationCore::~CoordinationCore() = default;

Result<state::ProjectSummary> CoordinationCore::initialize_project(
    const std::string& project_id, const std::string& name,
    const state::PipelineState initial_state) {
    return retried<state::ProjectSummary>("initialize_project", [&]() {
        return engine_->initialize_project(project_id, name, initial_state);
    });
}

Status CoordinationCore::delete_project(const std::string& project_id) {
    return retried<std::monostate>("delete_project",
                                   [&]() { return store_->delete_project(project_id); });
}

Result<store::SectionSnapshot> CoordinationCore::read_section(const std::string& project_id,
                                                              const std::string& section,
                                                              const store::ReadOptions options) const {
    return retried<store::SectionSnapshot>("read_section", [&]() {
        return store_->read_section(project_id, section, options);
    });
}

Result<store::SectionSnapshot> CoordinationCore::write_section(
    const std::string& project_id, const std::string& section, const json& value,
    const std::optional<std::string>& description) {
    return retried<store::SectionSnapshot>("write_section", [&]() {
        return store_->write_section(project_id, section, value, description);
    });
}

Result<store::SectionSnapshot> CoordinationCore::update_section(
    const std::string& project_id, const std::string& section, const json& patch,
    const store::UpdateOptions& options) {
    return retried<store::SectionSnapshot>("update_section", [&]() {
        return store_->update_section(project_id, section, patch, options);
    });
}

Result<std::vector<store::HistoryEntry>> CoordinationCore::get_history(
    const std::string& project_id, const std::string& section) const {
    return retried<std::vector<store::HistoryEntry>>(
        "get_history", [&]() { return store_->get_history(project_id, section); });
}

Result<std::uint64_t> CoordinationCore::section_version(const std::string& project_id,
                                                        const std::string& section) const {
    return retried<std::uint64_t>(
        "section_version", [&]() { return store_->section_version(project_id, section); });
}

Result<state::TransitionResult> CoordinationCore::transition(const std::string& project_id,
                                                             const state::PipelineState target) {
    return retried<state::TransitionResult>(
        "transition", [&]() { return engine_->transition(project_id, target); });
}

Result<state::PipelineState> CoordinationCore::current_state(
    const std::string& project_id) const {
    return retried<state::PipelineState>(
        "current_state", [&]() { return engine_->current_state(project_id); });
}

Result<state::ProjectSummary> CoordinationCore::project_summary(
    const std::string& project_id) const {
    return retried<state::ProjectSummary>(
        "project_summary", [&]() { return engine_->project_summary(project_id); });
}

Result<state::SkipResult> CoordinationCore::skip_to(const std::string& project_id,
                                                    const state::PipelineState target,
                                                    const state::SkipOptions& options) {
    return retried<state::SkipResult>(
        "skip_to", [&]() { return engine_->skip_to(project_id, target, options); });
}

Result<state::TransitionResult> CoordinationCore::recover_to(
    const std::string& project_id, const state::PipelineState target,
    const std::optional<std::string>& reason) {
    return retried<state::TransitionResult>(
        "recover_to", [&]() { return engine_->recover_to(project_id, target, reason); });
}

Result<state::Checkpoint> CoordinationCore::create_checkpoint(
    const std::string& project_id, const state::CheckpointTrigger trigger,
    const std::optional<std::string>& reason) {
    return retried<state::Checkpoint>("create_checkpoint", [&]() {
        return engine_->create_checkpoint(project_id, trigger, reason);
    });
}

Result<state::RestoreResult> CoordinationCore::restore_checkpoint(
    const std::string& project_id, const std::string& checkpoint_id) {
    return retried<state::RestoreResult>("restore_checkpoint", [&]() {
        return engine_->restore_checkpoint(project_id, checkpoint_id);
    });
}

notify::Subscription CoordinationCore::watch(const std::string& project_id,
                                             notify::ChangeCallback on_event,
                                             std::optional<std::string> section) {
    return notifier_->subscribe(project_id, std::move(on_event), std::move(section));
}

}  // namespace statekeep::coordination
