#include <optional>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "lock/file_lock_manager.hpp"
#include "state/state_machine_engine.hpp"
#include "store/state_store.hpp"
#include "test_support.hpp"

namespace {

using nlohmann::json;
using statekeep::core::config::CoreConfig;
using statekeep::core::errors::get_error;
using statekeep::core::errors::get_value;
using statekeep::core::errors::is_error;
using statekeep::lock::FileLockManager;
using statekeep::state::AuditType;
using statekeep::state::CheckpointTrigger;
using statekeep::state::PipelineState;
using statekeep::state::SkipOptions;
using statekeep::state::StateMachineEngine;
using statekeep::store::StateStore;
using statekeep::testing::TempWorkspace;

struct RecoveryHarness {
    explicit RecoveryHarness(const CoreConfig& config)
        : locks(config.base_path, statekeep::lock::lock_options_from(config)),
          store(config, locks),
          engine(store) {}

    FileLockManager locks;
    StateStore store;
    StateMachineEngine engine;
};

TEST(RecoveryTest, SkipForwardRecordsSkippedStages) {
    TempWorkspace workspace("recovery");
    RecoveryHarness h(statekeep::testing::fast_config(workspace.root()));
    ASSERT_FALSE(is_error(h.engine.initialize_project("001", "Demo")));

    SkipOptions options;
    options.reason = "requirements already clear";
    auto skipped = h.engine.skip_to("001", PipelineState::PrdDrafting, options);
    ASSERT_FALSE(is_error(skipped));
    const auto& result = get_value(skipped);
    EXPECT_EQ(result.transition.previous_state, PipelineState::Collecting);
    EXPECT_EQ(result.transition.new_state, PipelineState::PrdDrafting);
    ASSERT_EQ(result.skipped_stages.size(), 1u);
    EXPECT_EQ(result.skipped_stages[0], PipelineState::Clarifying);
    ASSERT_TRUE(result.checkpoint_id.has_value());

    auto checkpoints = h.engine.list_checkpoints("001");
    ASSERT_FALSE(is_error(checkpoints));
    ASSERT_EQ(get_value(checkpoints).size(), 1u);
    EXPECT_EQ(get_value(checkpoints)[0].id, result.checkpoint_id.value());
    EXPECT_EQ(get_value(checkpoints)[0].trigger, CheckpointTrigger::Skip);
    EXPECT_EQ(get_value(checkpoints)[0].state, PipelineState::Collecting);

    auto audit = h.engine.recovery_audit_log("001");
    ASSERT_FALSE(is_error(audit));
    ASSERT_EQ(get_value(audit).size(), 2u);
    const auto& newest = get_value(audit)[0];
    EXPECT_EQ(newest.type, AuditType::SkipForward);
    EXPECT_EQ(newest.from_state, PipelineState::Collecting);
    EXPECT_EQ(newest.to_state, PipelineState::PrdDrafting);
    EXPECT_EQ(newest.details.at("skipped_stages"), json::array({"clarifying"}));
    EXPECT_EQ(newest.details.at("reason"), "requirements already clear");
    EXPECT_EQ(get_value(audit)[1].type, AuditType::CheckpointCreated);
}

TEST(RecoveryTest, SkipOffTheSkipEdgesIsRejected) {
    TempWorkspace workspace("recovery");
    RecoveryHarness h(statekeep::testing::fast_config(workspace.root()));
    ASSERT_FALSE(is_error(h.engine.initialize_project("001", "Demo")));

    auto skipped = h.engine.skip_to("001", PipelineState::SrsDrafting);
    ASSERT_TRUE(is_error(skipped));
    EXPECT_EQ(get_error(skipped).code, "recovery.invalid_skip");
    EXPECT_EQ(get_error(skipped).context.at("from"), "collecting");

    auto state = h.engine.current_state("001");
    ASSERT_FALSE(is_error(state));
    EXPECT_EQ(get_value(state), PipelineState::Collecting);

    auto checkpoints = h.engine.list_checkpoints("001");
    ASSERT_FALSE(is_error(checkpoints));
    EXPECT_TRUE(get_value(checkpoints).empty());
}

TEST(RecoveryTest, SkipWithoutCheckpoint) {
    TempWorkspace workspace("recovery");
    RecoveryHarness h(statekeep::testing::fast_config(workspace.root()));
    ASSERT_FALSE(is_error(h.engine.initialize_project("001", "Demo", PipelineState::PrdApproved)));

    SkipOptions options;
    options.create_checkpoint = false;
    auto skipped = h.engine.skip_to("001", PipelineState::SdsDrafting, options);
    ASSERT_FALSE(is_error(skipped));
    EXPECT_FALSE(get_value(skipped).checkpoint_id.has_value());
    ASSERT_EQ(get_value(skipped).skipped_stages.size(), 2u);
    EXPECT_EQ(get_value(skipped).skipped_stages[0], PipelineState::SrsDrafting);
    EXPECT_EQ(get_value(skipped).skipped_stages[1], PipelineState::SrsApproved);

    auto checkpoints = h.engine.list_checkpoints("001");
    ASSERT_FALSE(is_error(checkpoints));
    EXPECT_TRUE(get_value(checkpoints).empty());

    auto history = h.store.get_history("001", statekeep::state::kProgressSection);
    ASSERT_FALSE(is_error(history));
    EXPECT_EQ(get_value(history).back().description.value_or(""),
              "skipped from prd_approved to sds_drafting (skipped: srs_drafting, srs_approved)");
}

TEST(RecoveryTest, RecoverAlongRecoveryEdge) {
    TempWorkspace workspace("recovery");
    RecoveryHarness h(statekeep::testing::fast_config(workspace.root()));
    ASSERT_FALSE(is_error(h.engine.initialize_project("001", "Demo")));
    ASSERT_FALSE(is_error(h.engine.transition("001", PipelineState::PrdDrafting)));

    // prd_drafting -> clarifying is not a normal edge, only a recovery one.
    ASSERT_TRUE(is_error(h.engine.transition("001", PipelineState::Clarifying)));
    auto recovered = h.engine.recover_to("001", PipelineState::Clarifying, "missing details");
    ASSERT_FALSE(is_error(recovered));
    EXPECT_EQ(get_value(recovered).previous_state, PipelineState::PrdDrafting);
    EXPECT_EQ(get_value(recovered).new_state, PipelineState::Clarifying);

    auto audit = h.engine.recovery_audit_log("001");
    ASSERT_FALSE(is_error(audit));
    ASSERT_FALSE(get_value(audit).empty());
    const auto& newest = get_value(audit)[0];
    EXPECT_EQ(newest.type, AuditType::RecoveryTransition);
    EXPECT_EQ(newest.from_state, PipelineState::PrdDrafting);
    EXPECT_EQ(newest.details.at("reason"), "missing details");

    auto checkpoints = h.engine.list_checkpoints("001");
    ASSERT_FALSE(is_error(checkpoints));
    ASSERT_EQ(get_value(checkpoints).size(), 1u);
    EXPECT_EQ(get_value(checkpoints)[0].trigger, CheckpointTrigger::Recovery);
    EXPECT_EQ(newest.details.at("checkpoint_id"), get_value(checkpoints)[0].id);
}

TEST(RecoveryTest, RecoverOffTheRecoveryEdgesIsRejected) {
    TempWorkspace workspace("recovery");
    RecoveryHarness h(statekeep::testing::fast_config(workspace.root()));
    ASSERT_FALSE(is_error(h.engine.initialize_project("001", "Demo")));

    auto recovered = h.engine.recover_to("001", PipelineState::Merged);
    ASSERT_TRUE(is_error(recovered));
    EXPECT_EQ(get_error(recovered).code, "state.invalid_transition");

    auto checkpoints = h.engine.list_checkpoints("001");
    ASSERT_FALSE(is_error(checkpoints));
    EXPECT_TRUE(get_value(checkpoints).empty());
}

TEST(RecoveryTest, RestoreBringsBackSectionsAndState) {
    TempWorkspace workspace("recovery");
    RecoveryHarness h(statekeep::testing::fast_config(workspace.root()));
    ASSERT_FALSE(is_error(h.engine.initialize_project("001", "Demo")));
    ASSERT_FALSE(is_error(h.store.write_section("001", "info", json{{"a", 1}})));

    auto checkpoint = h.engine.create_checkpoint("001", CheckpointTrigger::Manual, "before edits");
    ASSERT_FALSE(is_error(checkpoint));
    const auto checkpoint_id = get_value(checkpoint).id;
    EXPECT_EQ(get_value(checkpoint).sections.count("info"), 1u);
    EXPECT_EQ(get_value(checkpoint).sections.count("progress"), 1u);

    ASSERT_FALSE(is_error(h.store.write_section("001", "info", json{{"a", 2}})));
    ASSERT_FALSE(is_error(h.engine.transition("001", PipelineState::Clarifying)));

    auto restored = h.engine.restore_checkpoint("001", checkpoint_id);
    ASSERT_FALSE(is_error(restored));
    EXPECT_EQ(get_value(restored).previous_state, PipelineState::Clarifying);
    EXPECT_EQ(get_value(restored).restored_state, PipelineState::Collecting);

    auto info = h.store.read_section("001", "info");
    ASSERT_FALSE(is_error(info));
    EXPECT_EQ(get_value(info).value, (json{{"a", 1}}));
    // Restoring writes forward; versions never go back.
    EXPECT_EQ(get_value(info).version, 3u);

    auto history = h.store.get_history("001", "info");
    ASSERT_FALSE(is_error(history));
    EXPECT_EQ(get_value(history).back().description.value_or(""),
              "restored from checkpoint " + checkpoint_id);

    auto state = h.engine.current_state("001");
    ASSERT_FALSE(is_error(state));
    EXPECT_EQ(get_value(state), PipelineState::Collecting);

    auto audit = h.engine.recovery_audit_log("001");
    ASSERT_FALSE(is_error(audit));
    ASSERT_EQ(get_value(audit).size(), 2u);
    EXPECT_EQ(get_value(audit)[0].type, AuditType::CheckpointRestored);
    EXPECT_EQ(get_value(audit)[0].details.at("checkpoint_id"), checkpoint_id);
}

TEST(RecoveryTest, RestoreUnknownCheckpointFails) {
    TempWorkspace workspace("recovery");
    RecoveryHarness h(statekeep::testing::fast_config(workspace.root()));
    ASSERT_FALSE(is_error(h.engine.initialize_project("001", "Demo")));

    auto restored = h.engine.restore_checkpoint("001", "ckpt-missing");
    ASSERT_TRUE(is_error(restored));
    EXPECT_EQ(get_error(restored).code, "recovery.checkpoint_not_found");
    EXPECT_EQ(get_error(restored).context.at("checkpoint_id"), "ckpt-missing");
}

TEST(RecoveryTest, RestoreOfDamagedCheckpointIsRefused) {
    TempWorkspace workspace("recovery");
    RecoveryHarness h(statekeep::testing::fast_config(workspace.root()));
    ASSERT_FALSE(is_error(h.engine.initialize_project("001", "Demo")));
    ASSERT_FALSE(is_error(h.store.update_document(
        "001", "checkpoints", [](const std::optional<json>&) {
            json damaged = json::array();
            damaged.push_back({{"id", "ckpt-bad"}, {"state", "shipping"}, {"sections", json::object()}});
            return statekeep::core::errors::Result<json>(damaged);
        })));

    auto restored = h.engine.restore_checkpoint("001", "ckpt-bad");
    ASSERT_TRUE(is_error(restored));
    EXPECT_EQ(get_error(restored).code, "recovery.checkpoint_invalid");

    auto state = h.engine.current_state("001");
    ASSERT_FALSE(is_error(state));
    EXPECT_EQ(get_value(state), PipelineState::Collecting);
}

TEST(RecoveryTest, CheckpointsAreBoundedNewestFirst) {
    TempWorkspace workspace("recovery");
    auto config = statekeep::testing::fast_config(workspace.root());
    config.max_checkpoints = 2;
    RecoveryHarness h(config);
    ASSERT_FALSE(is_error(h.engine.initialize_project("001", "Demo")));

    std::string last_id;
    for (int i = 0; i < 3; ++i) {
        auto checkpoint =
            h.engine.create_checkpoint("001", CheckpointTrigger::Manual, "round " + std::to_string(i));
        ASSERT_FALSE(is_error(checkpoint));
        last_id = get_value(checkpoint).id;
    }

    auto checkpoints = h.engine.list_checkpoints("001");
    ASSERT_FALSE(is_error(checkpoints));
    ASSERT_EQ(get_value(checkpoints).size(), 2u);
    EXPECT_EQ(get_value(checkpoints)[0].id, last_id);
    EXPECT_EQ(get_value(checkpoints)[0].reason.value_or(""), "round 2");
    EXPECT_EQ(get_value(checkpoints)[1].reason.value_or(""), "round 1");
}

TEST(RecoveryTest, AuditLogIsBounded) {
    TempWorkspace workspace("recovery");
    auto config = statekeep::testing::fast_config(workspace.root());
    config.max_audit_entries = 3;
    RecoveryHarness h(config);
    ASSERT_FALSE(is_error(h.engine.initialize_project("001", "Demo")));

    for (int i = 0; i < 5; ++i) {
        ASSERT_FALSE(is_error(h.engine.create_checkpoint("001")));
    }
    auto audit = h.engine.recovery_audit_log("001");
    ASSERT_FALSE(is_error(audit));
    EXPECT_EQ(get_value(audit).size(), 3u);
}

TEST(RecoveryTest, CorruptCheckpointDocumentIsReported) {
    TempWorkspace workspace("recovery");
    RecoveryHarness h(statekeep::testing::fast_config(workspace.root()));
    ASSERT_FALSE(is_error(h.engine.initialize_project("001", "Demo")));
    ASSERT_FALSE(is_error(h.store.update_document(
        "001", "checkpoints", [](const std::optional<json>&) {
            return statekeep::core::errors::Result<json>(json{{"not", "a list"}});
        })));

    auto checkpoints = h.engine.list_checkpoints("001");
    ASSERT_TRUE(is_error(checkpoints));
    EXPECT_EQ(get_error(checkpoints).code, "state.corrupt_record");

    auto created = h.engine.create_checkpoint("001");
    ASSERT_TRUE(is_error(created));
    EXPECT_EQ(get_error(created).code, "state.corrupt_record");
}

}  // namespace
