#include "state/pipeline_state.hpp"

#include <algorithm>
#include <cmath>
#include <map>

namespace statekeep::state {

namespace {

using S = PipelineState;

const std::map<PipelineState, std::vector<PipelineState>>& transition_graph() {
    static const std::map<PipelineState, std::vector<PipelineState>> graph = {
        {S::Collecting, {S::Clarifying, S::PrdDrafting, S::Cancelled}},
        {S::Clarifying, {S::Collecting, S::PrdDrafting, S::Cancelled}},
        {S::PrdDrafting, {S::PrdApproved, S::Collecting, S::Cancelled}},
        {S::PrdApproved, {S::SrsDrafting, S::PrdDrafting, S::Cancelled}},
        {S::SrsDrafting, {S::SrsApproved, S::PrdApproved, S::Cancelled}},
        {S::SrsApproved, {S::SdsDrafting, S::SrsDrafting, S::Cancelled}},
        {S::SdsDrafting, {S::SdsApproved, S::SrsApproved, S::Cancelled}},
        {S::SdsApproved, {S::IssuesCreating, S::SdsDrafting, S::Cancelled}},
        {S::IssuesCreating, {S::IssuesCreated, S::SdsApproved, S::Cancelled}},
        {S::IssuesCreated, {S::Implementing, S::IssuesCreating, S::Cancelled}},
        {S::Implementing, {S::PrReview, S::IssuesCreated, S::Cancelled}},
        {S::PrReview, {S::Merged, S::Implementing, S::Cancelled}},
        {S::Merged, {}},
        {S::Cancelled, {}},
    };
    return graph;
}

const std::map<PipelineState, StageRules>& rules_table() {
    static const std::map<PipelineState, StageRules> rules = {
        {S::Collecting, {{}, {S::PrdDrafting}, true, std::nullopt}},
        {S::Clarifying, {{S::Collecting}, {}, false, std::nullopt}},
        {S::PrdDrafting, {{S::Collecting, S::Clarifying}, {}, true, std::nullopt}},
        {S::PrdApproved, {{S::PrdDrafting, S::Clarifying}, {S::SdsDrafting}, true, std::nullopt}},
        {S::SrsDrafting, {{S::PrdApproved, S::PrdDrafting}, {S::SdsDrafting}, false, 50}},
        {S::SrsApproved, {{S::SrsDrafting, S::PrdApproved}, {S::IssuesCreating}, false,
                          std::nullopt}},
        {S::SdsDrafting, {{S::SrsApproved, S::SrsDrafting}, {S::IssuesCreating}, false, 50}},
        {S::SdsApproved, {{S::SdsDrafting, S::SrsApproved}, {}, false, std::nullopt}},
        {S::IssuesCreating, {{S::SdsApproved, S::SrsApproved}, {}, true, std::nullopt}},
        {S::IssuesCreated, {{S::IssuesCreating, S::SdsApproved}, {}, true, std::nullopt}},
        {S::Implementing, {{S::IssuesCreated, S::IssuesCreating}, {}, true, 25}},
        {S::PrReview, {{S::Implementing, S::IssuesCreated}, {}, true, std::nullopt}},
        {S::Merged, {{}, {}, true, std::nullopt}},
        {S::Cancelled, {{}, {}, false, std::nullopt}},
    };
    return rules;
}

}  // namespace

std::string to_string(const PipelineState state) {
    switch (state) {
        case S::Collecting: return "collecting";
        case S::Clarifying: return "clarifying";
        case S::PrdDrafting: return "prd_drafting";
        case S::PrdApproved: return "prd_approved";
        case S::SrsDrafting: return "srs_drafting";
        case S::SrsApproved: return "srs_approved";
        case S::SdsDrafting: return "sds_drafting";
        case S::SdsApproved: return "sds_approved";
        case S::IssuesCreating: return "issues_creating";
        case S::IssuesCreated: return "issues_created";
        case S::Implementing: return "implementing";
        case S::PrReview: return "pr_review";
        case S::Merged: return "merged";
        case S::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

std::optional<PipelineState> state_from_string(const std::string& name) {
    for (const auto state : all_states()) {
        if (to_string(state) == name) {
            return state;
        }
    }
    return std::nullopt;
}

const std::vector<PipelineState>& all_states() {
    static const std::vector<PipelineState> states = {
        S::Collecting,  S::Clarifying,     S::PrdDrafting,   S::PrdApproved, S::SrsDrafting,
        S::SrsApproved, S::SdsDrafting,    S::SdsApproved,   S::IssuesCreating,
        S::IssuesCreated, S::Implementing, S::PrReview,      S::Merged,      S::Cancelled,
    };
    return states;
}

const std::vector<PipelineState>& pipeline_stages() {
    static const std::vector<PipelineState> stages(all_states().begin(),
                                                   all_states().end() - 1);
    return stages;
}

const std::vector<PipelineState>& valid_transitions(const PipelineState from) {
    return transition_graph().at(from);
}

bool is_valid_transition(const PipelineState from, const PipelineState to) {
    const auto& targets = valid_transitions(from);
    return std::find(targets.begin(), targets.end(), to) != targets.end();
}

bool is_terminal(const PipelineState state) {
    return valid_transitions(state).empty();
}

int progress_percent(const PipelineState state) {
    const auto& stages = pipeline_stages();
    const auto it = std::find(stages.begin(), stages.end(), state);
    if (it == stages.end()) {
        return 0;
    }
    const auto index = static_cast<double>(it - stages.begin());
    return static_cast<int>(std::lround(index * 100.0 / static_cast<double>(stages.size() - 1)));
}

const StageRules& stage_rules(const PipelineState state) {
    return rules_table().at(state);
}

std::vector<PipelineState> stages_between(const PipelineState from, const PipelineState to) {
    const auto& stages = pipeline_stages();
    const auto from_it = std::find(stages.begin(), stages.end(), from);
    const auto to_it = std::find(stages.begin(), stages.end(), to);
    if (from_it == stages.end() || to_it == stages.end() || from_it >= to_it) {
        return {};
    }
    return std::vector<PipelineState>(from_it + 1, to_it);
}

}  // namespace statekeep::state
