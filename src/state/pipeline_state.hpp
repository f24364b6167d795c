#pragma once

#include <optional>
#include <string>
#include <vector>

namespace statekeep::state {

enum class PipelineState {
    Collecting,
    Clarifying,
    PrdDrafting,
    PrdApproved,
    SrsDrafting,
    SrsApproved,
    SdsDrafting,
    SdsApproved,
    IssuesCreating,
    IssuesCreated,
    Implementing,
    PrReview,
    Merged,
    Cancelled
};

std::string to_string(PipelineState state);
std::optional<PipelineState> state_from_string(const std::string& name);

// Every state, in declaration order.
const std::vector<PipelineState>& all_states();

// collecting .. merged. The graph is not a total order; progress and skip
// ranges are measured against this list only.
const std::vector<PipelineState>& pipeline_stages();

// Outgoing edges of the fixed graph. Empty for merged and cancelled.
const std::vector<PipelineState>& valid_transitions(PipelineState from);
bool is_valid_transition(PipelineState from, PipelineState to);
bool is_terminal(PipelineState state);

// round(index * 100 / (stages - 1)); cancelled reports 0.
int progress_percent(PipelineState state);

// Extra edges used by the recovery operations.
struct StageRules {
    std::vector<PipelineState> recovery;
    std::vector<PipelineState> skip_to;
    // A required stage cannot be skipped without force.
    bool required = true;
    std::optional<int> min_completion;
};

const StageRules& stage_rules(PipelineState state);

// Canonical stages strictly between `from` and `to`; empty when `to` does
// not come after `from`.
std::vector<PipelineState> stages_between(PipelineState from, PipelineState to);

}  // namespace statekeep::state
