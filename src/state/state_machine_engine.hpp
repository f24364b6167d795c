#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/state_errors.hpp"
#include "state/pipeline_state.hpp"
#include "store/state_store.hpp"

namespace statekeep::state {

// Reserved section holding the current pipeline state.
inline constexpr const char* kProgressSection = "progress";

struct ProjectSummary {
    std::string project_id;
    std::string name;
    PipelineState current_state = PipelineState::Collecting;
    int progress_percent = 0;
    std::uint64_t version = 0;
    std::size_t history_count = 0;
    std::int64_t last_updated_ms = 0;
};

struct TransitionResult {
    PipelineState previous_state = PipelineState::Collecting;
    PipelineState new_state = PipelineState::Collecting;
    std::int64_t timestamp_ms = 0;
    std::uint64_t version = 0;
};

enum class CheckpointTrigger { Manual, Skip, Recovery };

std::string to_string(CheckpointTrigger trigger);

struct SectionCapture {
    nlohmann::json value;
    std::uint64_t version = 0;
};

struct Checkpoint {
    std::string id;
    PipelineState state = PipelineState::Collecting;
    std::int64_t timestamp_ms = 0;
    CheckpointTrigger trigger = CheckpointTrigger::Manual;
    std::optional<std::string> reason;
    std::map<std::string, SectionCapture> sections;
};

enum class AuditType { CheckpointCreated, CheckpointRestored, SkipForward, RecoveryTransition };

std::string to_string(AuditType type);

struct AuditEntry {
    std::string id;
    AuditType type = AuditType::CheckpointCreated;
    std::int64_t timestamp_ms = 0;
    PipelineState from_state = PipelineState::Collecting;
    PipelineState to_state = PipelineState::Collecting;
    nlohmann::json details;
};

struct SkipOptions {
    bool force_skip_required = false;
    bool create_checkpoint = true;
    std::optional<std::string> reason;
};

struct SkipResult {
    TransitionResult transition;
    std::vector<PipelineState> skipped_stages;
    std::optional<std::string> checkpoint_id;
};

struct RestoreResult {
    std::string checkpoint_id;
    PipelineState previous_state = PipelineState::Collecting;
    PipelineState restored_state = PipelineState::Collecting;
    std::int64_t timestamp_ms = 0;
};

// Drives the per-project pipeline state kept in the "progress" section.
// Every state change is one locked read-modify-write of that section, so
// the graph check and the commit cannot interleave with another writer.
class StateMachineEngine {
public:
    explicit StateMachineEngine(store::StateStore& store);

    StateMachineEngine(const StateMachineEngine&) = delete;
    StateMachineEngine& operator=(const StateMachineEngine&) = delete;

    core::errors::Result<ProjectSummary> initialize_project(
        const std::string& project_id, const std::string& name,
        PipelineState initial_state = PipelineState::Collecting);

    // state.invalid_transition when the edge is not in the graph; the stored
    // state is left untouched.
    core::errors::Result<TransitionResult> transition(const std::string& project_id,
                                                      PipelineState target);

    core::errors::Result<PipelineState> current_state(const std::string& project_id) const;
    core::errors::Result<ProjectSummary> project_summary(const std::string& project_id) const;

    // Forward jump along a skip edge. Refuses to pass over a required stage
    // unless forced. Checkpoints first by default.
    core::errors::Result<SkipResult> skip_to(const std::string& project_id,
                                             PipelineState target,
                                             const SkipOptions& options = {});

    // Backward move along a recovery edge, after a checkpoint.
    core::errors::Result<TransitionResult> recover_to(
        const std::string& project_id, PipelineState target,
        const std::optional<std::string>& reason = std::nullopt);

    core::errors::Result<Checkpoint> create_checkpoint(
        const std::string& project_id, CheckpointTrigger trigger = CheckpointTrigger::Manual,
        const std::optional<std::string>& reason = std::nullopt);

    // Newest first.
    core::errors::Result<std::vector<Checkpoint>> list_checkpoints(
        const std::string& project_id) const;

    // Rewrites every captured section through the store, so versions keep
    // increasing and the restore shows up in history.
    core::errors::Result<RestoreResult> restore_checkpoint(const std::string& project_id,
                                                           const std::string& checkpoint_id);

    // Newest first.
    core::errors::Result<std::vector<AuditEntry>> recovery_audit_log(
        const std::string& project_id) const;

private:
    using EdgeCheck = std::function<core::errors::Status(PipelineState from)>;
    using Describe = std::function<std::string(PipelineState from)>;

    core::errors::Result<TransitionResult> change_state(const std::string& project_id,
                                                        PipelineState target,
                                                        const EdgeCheck& check,
                                                        const Describe& describe);
    void record_audit(const std::string& project_id, AuditType type, PipelineState from,
                      PipelineState to, nlohmann::json details);

    store::StateStore& store_;
};

}  // namespace statekeep::state
