#include "state/state_machine_engine.hpp"

#include <algorithm>
#include <iterator>
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"

namespace statekeep::state {

using core::errors::ErrorCategory;
using core::errors::StateError;
using nlohmann::json;
namespace codes = core::errors::codes;

namespace {

constexpr const char* kCheckpointsDocument = "checkpoints";
constexpr const char* kAuditDocument = "audit";

std::string join_states(const std::vector<PipelineState>& states) {
    std::string text;
    for (const auto state : states) {
        if (!text.empty()) {
            text += ", ";
        }
        text += to_string(state);
    }
    return text;
}

bool contains(const std::vector<PipelineState>& states, const PipelineState state) {
    return std::find(states.begin(), states.end(), state) != states.end();
}

StateError invalid_transition(const std::string& project_id, const PipelineState from,
                              const PipelineState to, const std::vector<PipelineState>& allowed) {
    auto error = core::errors::make_error(
        ErrorCategory::Fatal, codes::kInvalidTransition,
        "Invalid transition from " + to_string(from) + " to " + to_string(to),
        {{"project_id", project_id}, {"from", to_string(from)}, {"to", to_string(to)}});
    error.hint = allowed.empty() ? to_string(from) + " is terminal."
                                 : "Allowed: " + join_states(allowed);
    return error;
}

StateError invalid_skip(const std::string& project_id, const PipelineState from,
                        const PipelineState to) {
    auto error = core::errors::make_error(
        ErrorCategory::Fatal, codes::kInvalidSkip,
        "Cannot skip from " + to_string(from) + " to " + to_string(to),
        {{"project_id", project_id}, {"from", to_string(from)}, {"to", to_string(to)}});
    const auto& allowed = stage_rules(from).skip_to;
    error.hint = allowed.empty() ? "No skip targets from " + to_string(from) + "."
                                 : "Skip targets: " + join_states(allowed);
    return error;
}

core::errors::Result<PipelineState> state_from_progress(const json& value,
                                                        const std::string& project_id) {
    if (!value.is_object() || !value.contains("current_state") ||
        !value.at("current_state").is_string()) {
        return core::errors::make_error(ErrorCategory::Fatal, codes::kValidationFailed,
                                        "Progress section must name current_state.",
                                        {{"project_id", project_id}});
    }
    const auto name = value.at("current_state").get<std::string>();
    const auto state = state_from_string(name);
    if (!state.has_value()) {
        return core::errors::make_error(ErrorCategory::Fatal, codes::kValidationFailed,
                                        "Unknown pipeline state: " + name,
                                        {{"project_id", project_id}, {"state", name}});
    }
    return state.value();
}

std::optional<CheckpointTrigger> trigger_from_string(const std::string& name) {
    for (const auto trigger :
         {CheckpointTrigger::Manual, CheckpointTrigger::Skip, CheckpointTrigger::Recovery}) {
        if (to_string(trigger) == name) {
            return trigger;
        }
    }
    return std::nullopt;
}

std::optional<AuditType> audit_type_from_string(const std::string& name) {
    for (const auto type : {AuditType::CheckpointCreated, AuditType::CheckpointRestored,
                            AuditType::SkipForward, AuditType::RecoveryTransition}) {
        if (to_string(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

json checkpoint_to_json(const Checkpoint& checkpoint) {
    json doc;
    doc["id"] = checkpoint.id;
    doc["state"] = to_string(checkpoint.state);
    doc["timestamp_ms"] = checkpoint.timestamp_ms;
    doc["trigger"] = to_string(checkpoint.trigger);
    doc["reason"] = checkpoint.reason.has_value() ? json(checkpoint.reason.value()) : json();
    doc["sections"] = json::object();
    for (const auto& [name, capture] : checkpoint.sections) {
        doc["sections"][name] = {{"value", capture.value}, {"version", capture.version}};
    }
    return doc;
}

core::errors::Result<Checkpoint> checkpoint_from_json(const json& doc,
                                                      const std::string& project_id) {
    auto invalid = [&project_id](const std::string& what) {
        return core::errors::make_error(ErrorCategory::Fatal, codes::kCheckpointInvalid,
                                        "Invalid checkpoint: " + what,
                                        {{"project_id", project_id}});
    };
    if (!doc.is_object() || !doc.contains("id") || !doc.at("id").is_string()) {
        return invalid("missing id");
    }

    Checkpoint checkpoint;
    try {
        checkpoint.id = doc.at("id").get<std::string>();
        const auto state = state_from_string(doc.value("state", std::string()));
        if (!state.has_value()) {
            return invalid("unknown state in " + checkpoint.id);
        }
        checkpoint.state = state.value();
        checkpoint.timestamp_ms = doc.value("timestamp_ms", static_cast<std::int64_t>(0));
        checkpoint.trigger = trigger_from_string(doc.value("trigger", std::string("manual")))
                                 .value_or(CheckpointTrigger::Manual);
        if (doc.contains("reason") && doc.at("reason").is_string()) {
            checkpoint.reason = doc.at("reason").get<std::string>();
        }
        if (!doc.contains("sections") || !doc.at("sections").is_object()) {
            return invalid("missing sections in " + checkpoint.id);
        }
        for (auto it = doc.at("sections").begin(); it != doc.at("sections").end(); ++it) {
            if (!it.value().is_object() || !it.value().contains("value")) {
                return invalid("section " + it.key() + " without value");
            }
            SectionCapture capture;
            capture.value = it.value().at("value");
            capture.version = it.value().value("version", static_cast<std::uint64_t>(0));
            checkpoint.sections[it.key()] = std::move(capture);
        }
    } catch (const json::exception& e) {
        return invalid(e.what());
    }
    return checkpoint;
}

json audit_to_json(const AuditEntry& entry) {
    json doc;
    doc["id"] = entry.id;
    doc["type"] = to_string(entry.type);
    doc["timestamp_ms"] = entry.timestamp_ms;
    doc["from_state"] = to_string(entry.from_state);
    doc["to_state"] = to_string(entry.to_state);
    doc["details"] = entry.details;
    return doc;
}

core::errors::Result<AuditEntry> audit_from_json(const json& doc, const std::string& project_id) {
    auto corrupt = [&project_id](const std::string& what) {
        return core::errors::make_error(ErrorCategory::Fatal, codes::kCorruptRecord,
                                        "Corrupt recovery audit entry: " + what,
                                        {{"project_id", project_id}});
    };
    if (!doc.is_object()) {
        return corrupt("not an object");
    }
    AuditEntry entry;
    try {
        entry.id = doc.value("id", std::string());
        const auto type = audit_type_from_string(doc.value("type", std::string()));
        const auto from = state_from_string(doc.value("from_state", std::string()));
        const auto to = state_from_string(doc.value("to_state", std::string()));
        if (!type.has_value() || !from.has_value() || !to.has_value()) {
            return corrupt("unknown type or state in " + entry.id);
        }
        entry.type = type.value();
        entry.from_state = from.value();
        entry.to_state = to.value();
        entry.timestamp_ms = doc.value("timestamp_ms", static_cast<std::int64_t>(0));
        entry.details = doc.contains("details") ? doc.at("details") : json::object();
    } catch (const json::exception& e) {
        return corrupt(e.what());
    }
    return entry;
}

// Prepends `item` to a JSON array document, dropping the oldest past `limit`.
core::errors::Result<json> prepend_bounded(const std::optional<json>& current, json item,
                                           const std::size_t limit, const std::string& what) {
    json list = json::array();
    if (current.has_value()) {
        if (!current->is_array()) {
            return core::errors::make_error(ErrorCategory::Fatal, codes::kCorruptRecord,
                                            what + " document is not an array");
        }
        list = current.value();
    }
    list.insert(list.begin(), std::move(item));
    while (list.size() > limit) {
        list.erase(list.size() - 1);
    }
    return list;
}

}  // namespace

std::string to_string(const CheckpointTrigger trigger) {
    switch (trigger) {
        case CheckpointTrigger::Manual: return "manual";
        case CheckpointTrigger::Skip: return "skip";
        case CheckpointTrigger::Recovery: return "recovery";
        default: return "unknown";
    }
}

std::string to_string(const AuditType type) {
    switch (type) {
        case AuditType::CheckpointCreated: return "checkpoint_created";
        case AuditType::CheckpointRestored: return "checkpoint_restored";
        case AuditType::SkipForward: return "skip_forward";
        case AuditType::RecoveryTransition: return "recovery_transition";
        default: return "unknown";
    }
}

StateMachineEngine::StateMachineEngine(store::StateStore& store) : store_(store) {
    // Keeps direct section writes from putting an unknown state in progress.
    store_.register_validator(kProgressSection,
                              [](const std::string& project_id,
                                 const json& value) -> core::errors::Status {
                                  auto state = state_from_progress(value, project_id);
                                  if (core::errors::is_error(state)) {
                                      return core::errors::get_error(state);
                                  }
                                  return core::errors::ok();
                              });
}

core::errors::Result<ProjectSummary> StateMachineEngine::initialize_project(
    const std::string& project_id, const std::string& name, const PipelineState initial_state) {
    auto created = store_.initialize_project(project_id, name);
    if (core::errors::is_error(created)) {
        return core::errors::get_error(created);
    }

    json progress;
    progress["current_state"] = to_string(initial_state);
    progress["previous_state"] = nullptr;
    progress["transitioned_at_ms"] = core::config::now_unix_ms();
    auto written = store_.write_section(project_id, kProgressSection, progress,
                                        "initialized in " + to_string(initial_state));
    if (core::errors::is_error(written)) {
        // A project without a progress section would have no state at all.
        auto rollback = store_.delete_project(project_id);
        if (core::errors::is_error(rollback)) {
            LOG_WARN("StateMachineEngine: rollback of " + project_id + " failed " +
                     core::errors::describe(core::errors::get_error(rollback)));
        }
        return core::errors::get_error(written);
    }

    LOG_INFO("StateMachineEngine: project " + project_id + " starts in " +
             to_string(initial_state));
    return project_summary(project_id);
}

core::errors::Result<PipelineState> StateMachineEngine::current_state(
    const std::string& project_id) const {
    auto progress = store_.read_section(project_id, kProgressSection);
    if (core::errors::is_error(progress)) {
        return core::errors::get_error(progress);
    }
    return state_from_progress(core::errors::get_value(progress).value, project_id);
}

core::errors::Result<ProjectSummary> StateMachineEngine::project_summary(
    const std::string& project_id) const {
    auto project = store_.read_project(project_id);
    if (core::errors::is_error(project)) {
        return core::errors::get_error(project);
    }
    auto progress = store_.read_section(project_id, kProgressSection, {false, true});
    if (core::errors::is_error(progress)) {
        return core::errors::get_error(progress);
    }
    const auto& snapshot = core::errors::get_value(progress);
    auto state = state_from_progress(snapshot.value, project_id);
    if (core::errors::is_error(state)) {
        return core::errors::get_error(state);
    }

    ProjectSummary summary;
    summary.project_id = project_id;
    summary.name = core::errors::get_value(project).name;
    summary.current_state = core::errors::get_value(state);
    summary.progress_percent = progress_percent(summary.current_state);
    summary.version = snapshot.version;
    summary.history_count = snapshot.history.size();
    summary.last_updated_ms = snapshot.updated_at_ms;
    return summary;
}

core::errors::Result<TransitionResult> StateMachineEngine::change_state(
    const std::string& project_id, const PipelineState target, const EdgeCheck& check,
    const Describe& describe) {
    std::optional<PipelineState> previous;
    auto committed = store_.update_section_with(
        project_id, kProgressSection,
        [&](const store::SectionSnapshot& current) -> core::errors::Result<store::Mutation> {
            if (!current.exists) {
                return core::errors::make_error(
                    ErrorCategory::Fatal, codes::kSectionNotFound,
                    "Project has no progress section: " + project_id,
                    {{"project_id", project_id}, {"section", kProgressSection}});
            }
            auto from = state_from_progress(current.value, project_id);
            if (core::errors::is_error(from)) {
                return core::errors::get_error(from);
            }
            const auto from_state = core::errors::get_value(from);
            auto allowed = check(from_state);
            if (core::errors::is_error(allowed)) {
                return core::errors::get_error(allowed);
            }
            previous = from_state;

            json next = current.value;
            next["current_state"] = to_string(target);
            next["previous_state"] = to_string(from_state);
            next["transitioned_at_ms"] = core::config::now_unix_ms();
            return store::Mutation{std::move(next), describe(from_state)};
        });
    if (core::errors::is_error(committed)) {
        return core::errors::get_error(committed);
    }

    const auto& snapshot = core::errors::get_value(committed);
    TransitionResult result;
    result.previous_state = previous.value_or(target);
    result.new_state = target;
    result.timestamp_ms = snapshot.updated_at_ms;
    result.version = snapshot.version;
    LOG_INFO("StateMachineEngine: project " + project_id + " " +
             to_string(result.previous_state) + " -> " + to_string(target));
    return result;
}

core::errors::Result<TransitionResult> StateMachineEngine::transition(
    const std::string& project_id, const PipelineState target) {
    return change_state(
        project_id, target,
        [&project_id, target](const PipelineState from) -> core::errors::Status {
            if (!is_valid_transition(from, target)) {
                return invalid_transition(project_id, from, target, valid_transitions(from));
            }
            return core::errors::ok();
        },
        [target](const PipelineState from) {
            return "transitioned from " + to_string(from) + " to " + to_string(target);
        });
}

core::errors::Result<SkipResult> StateMachineEngine::skip_to(const std::string& project_id,
                                                             const PipelineState target,
                                                             const SkipOptions& options) {
    auto current = current_state(project_id);
    if (core::errors::is_error(current)) {
        return core::errors::get_error(current);
    }
    const auto from = core::errors::get_value(current);
    if (!contains(stage_rules(from).skip_to, target)) {
        return invalid_skip(project_id, from, target);
    }

    const auto skipped = stages_between(from, target);
    std::vector<PipelineState> required;
    std::copy_if(skipped.begin(), skipped.end(), std::back_inserter(required),
                 [](const PipelineState stage) { return stage_rules(stage).required; });
    if (!required.empty() && !options.force_skip_required) {
        auto error = core::errors::make_error(
            ErrorCategory::Fatal, codes::kRequiredStageSkip,
            "Skip would bypass required stages: " + join_states(required),
            {{"project_id", project_id},
             {"from", to_string(from)},
             {"to", to_string(target)},
             {"required", join_states(required)}});
        error.hint = "Set force_skip_required to bypass them.";
        return error;
    }

    SkipResult result;
    result.skipped_stages = skipped;
    if (options.create_checkpoint) {
        auto checkpoint = create_checkpoint(project_id, CheckpointTrigger::Skip, options.reason);
        if (core::errors::is_error(checkpoint)) {
            return core::errors::get_error(checkpoint);
        }
        result.checkpoint_id = core::errors::get_value(checkpoint).id;
    }

    auto moved = change_state(
        project_id, target,
        [&project_id, from, target](const PipelineState now) -> core::errors::Status {
            // Someone moved the project between our checks and the lock.
            if (now != from) {
                return invalid_skip(project_id, now, target);
            }
            return core::errors::ok();
        },
        [&skipped, target](const PipelineState now) {
            return "skipped from " + to_string(now) + " to " + to_string(target) +
                   " (skipped: " + join_states(skipped) + ")";
        });
    if (core::errors::is_error(moved)) {
        return core::errors::get_error(moved);
    }
    result.transition = core::errors::get_value(moved);

    json details;
    details["skipped_stages"] = json::array();
    for (const auto stage : skipped) {
        details["skipped_stages"].push_back(to_string(stage));
    }
    details["reason"] = options.reason.has_value() ? json(options.reason.value()) : json();
    details["force_skip_required"] = options.force_skip_required;
    details["checkpoint_id"] =
        result.checkpoint_id.has_value() ? json(result.checkpoint_id.value()) : json();
    record_audit(project_id, AuditType::SkipForward, from, target, std::move(details));
    return result;
}

core::errors::Result<TransitionResult> StateMachineEngine::recover_to(
    const std::string& project_id, const PipelineState target,
    const std::optional<std::string>& reason) {
    auto current = current_state(project_id);
    if (core::errors::is_error(current)) {
        return core::errors::get_error(current);
    }
    const auto from = core::errors::get_value(current);
    const auto& recovery = stage_rules(from).recovery;
    if (!contains(recovery, target)) {
        return invalid_transition(project_id, from, target, recovery);
    }

    auto checkpoint = create_checkpoint(project_id, CheckpointTrigger::Recovery, reason);
    if (core::errors::is_error(checkpoint)) {
        return core::errors::get_error(checkpoint);
    }

    auto moved = change_state(
        project_id, target,
        [&project_id, target](const PipelineState now) -> core::errors::Status {
            const auto& edges = stage_rules(now).recovery;
            if (!contains(edges, target)) {
                return invalid_transition(project_id, now, target, edges);
            }
            return core::errors::ok();
        },
        [&reason, target](const PipelineState now) {
            std::string text = "recovered from " + to_string(now) + " to " + to_string(target);
            if (reason.has_value()) {
                text += " (" + reason.value() + ")";
            }
            return text;
        });
    if (core::errors::is_error(moved)) {
        return moved;
    }

    json details;
    details["reason"] = reason.has_value() ? json(reason.value()) : json();
    details["checkpoint_id"] = core::errors::get_value(checkpoint).id;
    record_audit(project_id, AuditType::RecoveryTransition,
                 core::errors::get_value(moved).previous_state, target, std::move(details));
    return moved;
}

core::errors::Result<Checkpoint> StateMachineEngine::create_checkpoint(
    const std::string& project_id, const CheckpointTrigger trigger,
    const std::optional<std::string>& reason) {
    auto state = current_state(project_id);
    if (core::errors::is_error(state)) {
        return core::errors::get_error(state);
    }
    auto names = store_.list_sections(project_id);
    if (core::errors::is_error(names)) {
        return core::errors::get_error(names);
    }

    Checkpoint checkpoint;
    checkpoint.id = core::config::generate_id("ckpt", 12);
    checkpoint.state = core::errors::get_value(state);
    checkpoint.timestamp_ms = core::config::now_unix_ms();
    checkpoint.trigger = trigger;
    checkpoint.reason = reason;
    for (const auto& name : core::errors::get_value(names)) {
        auto section = store_.read_section(project_id, name, {true, false});
        if (core::errors::is_error(section)) {
            return core::errors::get_error(section);
        }
        const auto& snapshot = core::errors::get_value(section);
        if (snapshot.exists) {
            checkpoint.sections[name] = SectionCapture{snapshot.value, snapshot.version};
        }
    }

    const auto limit = store_.config().max_checkpoints;
    auto stored = store_.update_document(
        project_id, kCheckpointsDocument,
        [&checkpoint, limit](const std::optional<json>& current) {
            return prepend_bounded(current, checkpoint_to_json(checkpoint), limit,
                                   kCheckpointsDocument);
        });
    if (core::errors::is_error(stored)) {
        return core::errors::get_error(stored);
    }

    json details;
    details["checkpoint_id"] = checkpoint.id;
    details["trigger"] = to_string(trigger);
    details["reason"] = reason.has_value() ? json(reason.value()) : json();
    record_audit(project_id, AuditType::CheckpointCreated, checkpoint.state, checkpoint.state,
                 std::move(details));
    LOG_INFO("StateMachineEngine: checkpoint " + checkpoint.id + " for " + project_id + " (" +
             to_string(trigger) + ")");
    return checkpoint;
}

core::errors::Result<std::vector<Checkpoint>> StateMachineEngine::list_checkpoints(
    const std::string& project_id) const {
    auto doc = store_.read_document(project_id, kCheckpointsDocument);
    if (core::errors::is_error(doc)) {
        return core::errors::get_error(doc);
    }
    std::vector<Checkpoint> checkpoints;
    const auto& value = core::errors::get_value(doc);
    if (!value.has_value()) {
        return checkpoints;
    }
    if (!value->is_array()) {
        return core::errors::make_error(ErrorCategory::Fatal, codes::kCorruptRecord,
                                        "Checkpoint document is not an array",
                                        {{"project_id", project_id}});
    }
    for (const auto& item : value.value()) {
        auto checkpoint = checkpoint_from_json(item, project_id);
        if (core::errors::is_error(checkpoint)) {
            return core::errors::get_error(checkpoint);
        }
        checkpoints.push_back(core::errors::take_value(checkpoint));
    }
    return checkpoints;
}

core::errors::Result<RestoreResult> StateMachineEngine::restore_checkpoint(
    const std::string& project_id, const std::string& checkpoint_id) {
    auto doc = store_.read_document(project_id, kCheckpointsDocument);
    if (core::errors::is_error(doc)) {
        return core::errors::get_error(doc);
    }
    const json* found = nullptr;
    const auto& value = core::errors::get_value(doc);
    if (value.has_value() && value->is_array()) {
        for (const auto& item : value.value()) {
            if (item.is_object() && item.contains("id") && item.at("id").is_string() &&
                item.at("id").get<std::string>() == checkpoint_id) {
                found = &item;
                break;
            }
        }
    }
    if (found == nullptr) {
        return core::errors::make_error(ErrorCategory::Fatal, codes::kCheckpointNotFound,
                                        "Checkpoint not found: " + checkpoint_id,
                                        {{"project_id", project_id},
                                         {"checkpoint_id", checkpoint_id}});
    }
    auto parsed = checkpoint_from_json(*found, project_id);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    const Checkpoint checkpoint = core::errors::take_value(parsed);

    const std::string description = "restored from checkpoint " + checkpoint.id;
    for (const auto& [name, capture] : checkpoint.sections) {
        if (name == kProgressSection) {
            continue;
        }
        auto written = store_.write_section(project_id, name, capture.value, description);
        if (core::errors::is_error(written)) {
            return core::errors::get_error(written);
        }
    }

    auto moved = change_state(
        project_id, checkpoint.state,
        [](const PipelineState) -> core::errors::Status { return core::errors::ok(); },
        [&description, &checkpoint](const PipelineState now) {
            return description + ": " + to_string(now) + " -> " + to_string(checkpoint.state);
        });
    if (core::errors::is_error(moved)) {
        return core::errors::get_error(moved);
    }

    RestoreResult result;
    result.checkpoint_id = checkpoint.id;
    result.previous_state = core::errors::get_value(moved).previous_state;
    result.restored_state = checkpoint.state;
    result.timestamp_ms = core::errors::get_value(moved).timestamp_ms;

    json details;
    details["checkpoint_id"] = checkpoint.id;
    details["checkpoint_timestamp_ms"] = checkpoint.timestamp_ms;
    record_audit(project_id, AuditType::CheckpointRestored, result.previous_state,
                 checkpoint.state, std::move(details));
    return result;
}

core::errors::Result<std::vector<AuditEntry>> StateMachineEngine::recovery_audit_log(
    const std::string& project_id) const {
    auto doc = store_.read_document(project_id, kAuditDocument);
    if (core::errors::is_error(doc)) {
        return core::errors::get_error(doc);
    }
    std::vector<AuditEntry> entries;
    const auto& value = core::errors::get_value(doc);
    if (!value.has_value()) {
        return entries;
    }
    if (!value->is_array()) {
        return core::errors::make_error(ErrorCategory::Fatal, codes::kCorruptRecord,
                                        "Audit document is not an array",
                                        {{"project_id", project_id}});
    }
    for (const auto& item : value.value()) {
        auto entry = audit_from_json(item, project_id);
        if (core::errors::is_error(entry)) {
            return core::errors::get_error(entry);
        }
        entries.push_back(core::errors::take_value(entry));
    }
    return entries;
}

void StateMachineEngine::record_audit(const std::string& project_id, const AuditType type,
                                      const PipelineState from, const PipelineState to,
                                      json details) {
    AuditEntry entry;
    entry.id = core::config::generate_id("audit", 12);
    entry.type = type;
    entry.timestamp_ms = core::config::now_unix_ms();
    entry.from_state = from;
    entry.to_state = to;
    entry.details = std::move(details);

    const auto limit = store_.config().max_audit_entries;
    auto stored = store_.update_document(
        project_id, kAuditDocument, [&entry, limit](const std::optional<json>& current) {
            return prepend_bounded(current, audit_to_json(entry), limit, kAuditDocument);
        });
    // The audited change is already committed; a missing audit line is
    // reported, not rolled back.
    if (core::errors::is_error(stored)) {
        LOG_WARN("StateMachineEngine: audit " + to_string(type) + " for " + project_id +
                 " not recorded " + core::errors::describe(core::errors::get_error(stored)));
    }
}

}  // namespace statekeep::state
