#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "lock/file_lock_manager.hpp"
#include "notify/change_notifier.hpp"
#include "store/state_store.hpp"
#include "test_support.hpp"

namespace {

using nlohmann::json;
using statekeep::core::config::CoreConfig;
using statekeep::core::errors::ErrorCategory;
using statekeep::core::errors::get_error;
using statekeep::core::errors::get_value;
using statekeep::core::errors::is_error;
using statekeep::core::errors::make_error;
using statekeep::core::errors::ok;
using statekeep::lock::FileLockManager;
using statekeep::notify::ChangeEvent;
using statekeep::notify::ChangeNotifier;
using statekeep::notify::ChangeType;
using statekeep::store::Mutation;
using statekeep::store::ReadOptions;
using statekeep::store::SectionSnapshot;
using statekeep::store::StateStore;
using statekeep::store::UpdateOptions;
using statekeep::testing::TempWorkspace;
using namespace std::chrono_literals;

// One store over its own lock manager, like one process would have.
struct StoreHarness {
    explicit StoreHarness(const CoreConfig& config)
        : locks(config.base_path, statekeep::lock::lock_options_from(config)),
          store(config, locks, &notifier) {}

    FileLockManager locks;
    ChangeNotifier notifier;
    StateStore store;
};

TEST(StateStoreTest, InitializeCreatesProjectLayout) {
    TempWorkspace workspace("store");
    StoreHarness h(statekeep::testing::fast_config(workspace.root()));

    auto info = h.store.initialize_project("001", "Demo");
    ASSERT_FALSE(is_error(info));
    EXPECT_EQ(get_value(info).id, "001");
    EXPECT_EQ(get_value(info).name, "Demo");
    EXPECT_TRUE(h.store.project_exists("001"));
    EXPECT_TRUE(std::filesystem::exists(workspace.root() / "001" / "project.json"));

    auto read = h.store.read_project("001");
    ASSERT_FALSE(is_error(read));
    EXPECT_EQ(get_value(read).name, "Demo");
}

TEST(StateStoreTest, InitializeTwiceFails) {
    TempWorkspace workspace("store");
    StoreHarness h(statekeep::testing::fast_config(workspace.root()));
    ASSERT_FALSE(is_error(h.store.initialize_project("001", "Demo")));

    auto again = h.store.initialize_project("001", "Other");
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "state.project_exists");

    auto read = h.store.read_project("001");
    ASSERT_FALSE(is_error(read));
    EXPECT_EQ(get_value(read).name, "Demo");
}

TEST(StateStoreTest, RejectsUnsafeIdentifiers) {
    TempWorkspace workspace("store");
    StoreHarness h(statekeep::testing::fast_config(workspace.root()));

    auto bad_project = h.store.initialize_project("../escape", "x");
    ASSERT_TRUE(is_error(bad_project));
    EXPECT_EQ(get_error(bad_project).code, "state.validation_failed");

    ASSERT_FALSE(is_error(h.store.initialize_project("001", "Demo")));
    auto bad_section = h.store.write_section("001", "Info/x", json{{"a", 1}});
    ASSERT_TRUE(is_error(bad_section));
    EXPECT_EQ(get_error(bad_section).code, "state.validation_failed");
}

TEST(StateStoreTest, MergeUpdatesBumpVersionAndRecordHistory) {
    TempWorkspace workspace("store");
    StoreHarness h(statekeep::testing::fast_config(workspace.root()));
    ASSERT_FALSE(is_error(h.store.initialize_project("001", "Demo")));

    auto first = h.store.update_section("001", "info", json{{"a", 1}});
    ASSERT_FALSE(is_error(first));
    EXPECT_EQ(get_value(first).version, 1u);

    auto second = h.store.update_section("001", "info", json{{"b", 2}});
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(second).version, 2u);
    EXPECT_EQ(get_value(second).value, (json{{"a", 1}, {"b", 2}}));

    auto read = h.store.read_section("001", "info");
    ASSERT_FALSE(is_error(read));
    EXPECT_EQ(get_value(read).value, (json{{"a", 1}, {"b", 2}}));
    EXPECT_EQ(get_value(read).version, 2u);
    EXPECT_TRUE(get_value(read).history.empty());

    auto history = h.store.get_history("001", "info");
    ASSERT_FALSE(is_error(history));
    ASSERT_EQ(get_value(history).size(), 2u);
    EXPECT_EQ(get_value(history)[0].snapshot, (json{{"a", 1}}));
    EXPECT_EQ(get_value(history)[1].snapshot, (json{{"a", 1}, {"b", 2}}));
    EXPECT_EQ(get_value(history)[1].version, 2u);
}

TEST(StateStoreTest, ReplaceDropsOldKeys) {
    TempWorkspace workspace("store");
    StoreHarness h(statekeep::testing::fast_config(workspace.root()));
    ASSERT_FALSE(is_error(h.store.initialize_project("001", "Demo")));
    ASSERT_FALSE(is_error(h.store.update_section("001", "info", json{{"a", 1}})));

    UpdateOptions replace;
    replace.merge = false;
    replace.description = "reset";
    auto replaced = h.store.update_section("001", "info", json{{"b", 2}}, replace);
    ASSERT_FALSE(is_error(replaced));
    EXPECT_EQ(get_value(replaced).value, (json{{"b", 2}}));

    auto history = h.store.get_history("001", "info");
    ASSERT_FALSE(is_error(history));
    ASSERT_EQ(get_value(history).size(), 2u);
    ASSERT_TRUE(get_value(history).back().description.has_value());
    EXPECT_EQ(get_value(history).back().description.value(), "reset");
}

TEST(StateStoreTest, MergeIntoNonObjectIsRejected) {
    TempWorkspace workspace("store");
    StoreHarness h(statekeep::testing::fast_config(workspace.root()));
    ASSERT_FALSE(is_error(h.store.initialize_project("001", "Demo")));
    ASSERT_FALSE(is_error(h.store.write_section("001", "notes", json::array({1, 2}))));

    auto merged = h.store.update_section("001", "notes", json{{"a", 1}});
    ASSERT_TRUE(is_error(merged));
    EXPECT_EQ(get_error(merged).code, "state.validation_failed");

    auto version = h.store.section_version("001", "notes");
    ASSERT_FALSE(is_error(version));
    EXPECT_EQ(get_value(version), 1u);
}

TEST(StateStoreTest, MissingSectionAndProjectErrors) {
    TempWorkspace workspace("store");
    StoreHarness h(statekeep::testing::fast_config(workspace.root()));

    auto no_project = h.store.read_section("404", "info");
    ASSERT_TRUE(is_error(no_project));
    EXPECT_EQ(get_error(no_project).code, "state.project_not_found");
    EXPECT_EQ(get_error(no_project).category, ErrorCategory::Fatal);

    ASSERT_FALSE(is_error(h.store.initialize_project("001", "Demo")));
    auto no_section = h.store.read_section("001", "info");
    ASSERT_TRUE(is_error(no_section));
    EXPECT_EQ(get_error(no_section).code, "state.section_not_found");

    auto allowed = h.store.read_section("001", "info", ReadOptions{true, false});
    ASSERT_FALSE(is_error(allowed));
    EXPECT_FALSE(get_value(allowed).exists);
    EXPECT_EQ(get_value(allowed).version, 0u);

    auto history = h.store.get_history("001", "info");
    ASSERT_FALSE(is_error(history));
    EXPECT_TRUE(get_value(history).empty());

    auto write = h.store.write_section("404", "info", json{{"a", 1}});
    ASSERT_TRUE(is_error(write));
    EXPECT_EQ(get_error(write).code, "state.project_not_found");
}

TEST(StateStoreTest, HistoryIsBoundedAndSequencesKeepCounting) {
    TempWorkspace workspace("store");
    auto config = statekeep::testing::fast_config(workspace.root());
    config.max_history_entries = 3;
    StoreHarness h(config);
    ASSERT_FALSE(is_error(h.store.initialize_project("001", "Demo")));

    for (int i = 1; i <= 5; ++i) {
        ASSERT_FALSE(is_error(h.store.write_section("001", "info", json{{"n", i}})));
    }

    auto history = h.store.get_history("001", "info");
    ASSERT_FALSE(is_error(history));
    const auto& entries = get_value(history);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].sequence, 3u);
    EXPECT_EQ(entries[2].sequence, 5u);
    EXPECT_EQ(entries[2].snapshot, (json{{"n", 5}}));

    auto recent = h.store.recent_activity("001", "info", 2);
    ASSERT_FALSE(is_error(recent));
    ASSERT_EQ(get_value(recent).size(), 2u);
    EXPECT_EQ(get_value(recent)[0].version, 5u);
    EXPECT_EQ(get_value(recent)[1].version, 4u);
}

TEST(StateStoreTest, ConcurrentWritersNeverLoseAnUpdate) {
    TempWorkspace workspace("store");
    const auto config = statekeep::testing::fast_config(workspace.root());
    StoreHarness first(config);
    StoreHarness second(config);
    ASSERT_FALSE(is_error(first.store.initialize_project("001", "Demo")));

    constexpr int kWriters = 8;
    std::atomic<int> failures{0};
    std::vector<std::thread> writers;
    for (int i = 0; i < kWriters; ++i) {
        // Half the writers go through a second lock manager, like another process.
        StateStore& store = (i % 2 == 0) ? first.store : second.store;
        writers.emplace_back([&store, &failures, i]() {
            auto written = store.update_section("001", "info",
                                                json{{"writer_" + std::to_string(i), i}});
            if (is_error(written)) {
                ++failures;
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    ASSERT_EQ(failures.load(), 0);
    auto read = first.store.read_section("001", "info");
    ASSERT_FALSE(is_error(read));
    EXPECT_EQ(get_value(read).version, static_cast<std::uint64_t>(kWriters));
    EXPECT_EQ(get_value(read).value.size(), static_cast<std::size_t>(kWriters));

    auto history = first.store.get_history("001", "info");
    ASSERT_FALSE(is_error(history));
    EXPECT_EQ(get_value(history).size(), static_cast<std::size_t>(kWriters));
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "001" / "sections" / "info.json.lock"));
}

TEST(StateStoreTest, ValidatorRejectionLeavesRecordUntouched) {
    TempWorkspace workspace("store");
    StoreHarness h(statekeep::testing::fast_config(workspace.root()));
    ASSERT_FALSE(is_error(h.store.initialize_project("001", "Demo")));
    h.store.register_validator("info", [](const std::string&, const json& value) {
        if (!value.contains("title")) {
            return statekeep::core::errors::Status(make_error(
                ErrorCategory::Fatal, "custom", "title is required"));
        }
        return ok();
    });

    ASSERT_FALSE(is_error(h.store.write_section("001", "info", json{{"title", "x"}})));
    auto rejected = h.store.write_section("001", "info", json{{"other", 1}});
    ASSERT_TRUE(is_error(rejected));
    EXPECT_EQ(get_error(rejected).code, "state.validation_failed");
    EXPECT_EQ(get_error(rejected).context.at("section"), "info");

    auto read = h.store.read_section("001", "info");
    ASSERT_FALSE(is_error(read));
    EXPECT_EQ(get_value(read).version, 1u);
    EXPECT_EQ(get_value(read).value, (json{{"title", "x"}}));
}

TEST(StateStoreTest, MutatorErrorAbortsWrite) {
    TempWorkspace workspace("store");
    StoreHarness h(statekeep::testing::fast_config(workspace.root()));
    ASSERT_FALSE(is_error(h.store.initialize_project("001", "Demo")));

    auto aborted = h.store.update_section_with(
        "001", "info", [](const SectionSnapshot&) -> statekeep::core::errors::Result<Mutation> {
            return make_error(ErrorCategory::Fatal, "test.refused", "no");
        });
    ASSERT_TRUE(is_error(aborted));
    EXPECT_EQ(get_error(aborted).code, "test.refused");
    EXPECT_FALSE(std::filesystem::exists(h.store.section_path("001", "info")));
    EXPECT_EQ(h.locks.held_count(), 0u);
}

TEST(StateStoreTest, ListsProjectsAndSectionsSorted) {
    TempWorkspace workspace("store");
    StoreHarness h(statekeep::testing::fast_config(workspace.root()));
    ASSERT_FALSE(is_error(h.store.initialize_project("b-proj", "B")));
    ASSERT_FALSE(is_error(h.store.initialize_project("a-proj", "A")));
    ASSERT_FALSE(is_error(h.store.write_section("a-proj", "zeta", json{{"z", 1}})));
    ASSERT_FALSE(is_error(h.store.write_section("a-proj", "alpha", json{{"a", 1}})));

    auto projects = h.store.list_projects();
    ASSERT_FALSE(is_error(projects));
    EXPECT_EQ(get_value(projects), (std::vector<std::string>{"a-proj", "b-proj"}));

    auto sections = h.store.list_sections("a-proj");
    ASSERT_FALSE(is_error(sections));
    EXPECT_EQ(get_value(sections), (std::vector<std::string>{"alpha", "zeta"}));

    auto empty = h.store.list_sections("b-proj");
    ASSERT_FALSE(is_error(empty));
    EXPECT_TRUE(get_value(empty).empty());
}

TEST(StateStoreTest, DeleteRemovesEverything) {
    TempWorkspace workspace("store");
    StoreHarness h(statekeep::testing::fast_config(workspace.root()));
    ASSERT_FALSE(is_error(h.store.initialize_project("001", "Demo")));
    ASSERT_FALSE(is_error(h.store.write_section("001", "info", json{{"a", 1}})));

    ASSERT_FALSE(is_error(h.store.delete_project("001")));
    EXPECT_FALSE(h.store.project_exists("001"));
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "001"));

    auto read = h.store.read_section("001", "info");
    ASSERT_TRUE(is_error(read));
    EXPECT_EQ(get_error(read).code, "state.project_not_found");

    auto again = h.store.delete_project("001");
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "state.project_not_found");

    // The id is free again.
    EXPECT_FALSE(is_error(h.store.initialize_project("001", "Fresh")));
}

TEST(StateStoreTest, DirectoryWithoutMetadataIsReclaimedOnInitialize) {
    TempWorkspace workspace("store");
    StoreHarness h(statekeep::testing::fast_config(workspace.root()));
    const auto dir = workspace.root() / "002";
    std::filesystem::create_directories(dir / "sections");
    {
        std::ofstream leftover(dir / "sections" / "info.json");
        leftover << R"({"section":"info","version":7,"value":{"old":true},"history":[]})";
    }
    EXPECT_FALSE(h.store.project_exists("002"));

    auto info = h.store.initialize_project("002", "Second try");
    ASSERT_FALSE(is_error(info));
    EXPECT_TRUE(h.store.project_exists("002"));

    // Nothing from the abandoned directory carries over.
    auto read = h.store.read_section("002", "info", ReadOptions{true, false});
    ASSERT_FALSE(is_error(read));
    EXPECT_FALSE(get_value(read).exists);

    auto projects = h.store.list_projects();
    ASSERT_FALSE(is_error(projects));
    EXPECT_EQ(get_value(projects), (std::vector<std::string>{"002"}));
}

TEST(StateStoreTest, InitializeAfterDeleteWithStrayLockDirectory) {
    TempWorkspace workspace("store");
    StoreHarness h(statekeep::testing::fast_config(workspace.root()));
    ASSERT_FALSE(is_error(h.store.initialize_project("001", "Demo")));
    ASSERT_FALSE(is_error(h.store.delete_project("001")));

    // A writer that lost the race with delete recreates the sections
    // directory for its lock file.
    FileLockManager other(workspace.root(),
                          statekeep::lock::lock_options_from(h.store.config()));
    ASSERT_FALSE(is_error(other.acquire("001/sections/info.json", "late-writer", 500ms)));
    ASSERT_FALSE(is_error(other.release("001/sections/info.json", "late-writer")));
    ASSERT_TRUE(std::filesystem::exists(workspace.root() / "001"));

    auto write = h.store.write_section("001", "info", json{{"a", 1}});
    ASSERT_TRUE(is_error(write));
    EXPECT_EQ(get_error(write).code, "state.project_not_found");

    EXPECT_FALSE(is_error(h.store.initialize_project("001", "Again")));
    auto read = h.store.read_project("001");
    ASSERT_FALSE(is_error(read));
    EXPECT_EQ(get_value(read).name, "Again");
}

TEST(StateStoreTest, WritesPublishChangeEvents) {
    TempWorkspace workspace("store");
    StoreHarness h(statekeep::testing::fast_config(workspace.root()));
    ASSERT_FALSE(is_error(h.store.initialize_project("001", "Demo")));

    std::vector<ChangeEvent> events;
    auto subscription = h.notifier.subscribe(
        "001", [&events](const ChangeEvent& event) { events.push_back(event); });

    ASSERT_FALSE(is_error(h.store.update_section("001", "info", json{{"a", 1}})));
    ASSERT_FALSE(is_error(h.store.update_section("001", "info", json{{"b", 2}})));
    ASSERT_FALSE(is_error(h.store.delete_project("001")));

    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].change_type, ChangeType::Create);
    EXPECT_FALSE(events[0].previous_value.has_value());
    EXPECT_EQ(events[0].version, 1u);

    EXPECT_EQ(events[1].change_type, ChangeType::Update);
    ASSERT_TRUE(events[1].previous_value.has_value());
    EXPECT_EQ(events[1].previous_value.value(), (json{{"a", 1}}));
    EXPECT_EQ(events[1].new_value, (json{{"a", 1}, {"b", 2}}));
    EXPECT_EQ(events[1].version, 2u);

    EXPECT_EQ(events[2].change_type, ChangeType::Delete);
    EXPECT_TRUE(events[2].section.empty());

    // Deletion drops the project's subscriptions.
    EXPECT_FALSE(subscription.active());
}

TEST(StateStoreTest, RejectedWriteIsNotPublished) {
    TempWorkspace workspace("store");
    StoreHarness h(statekeep::testing::fast_config(workspace.root()));
    ASSERT_FALSE(is_error(h.store.initialize_project("001", "Demo")));
    ASSERT_FALSE(is_error(h.store.write_section("001", "notes", json("text"))));

    int calls = 0;
    auto subscription =
        h.notifier.subscribe("001", [&calls](const ChangeEvent&) { ++calls; }, "notes");
    EXPECT_TRUE(is_error(h.store.update_section("001", "notes", json{{"a", 1}})));
    EXPECT_EQ(calls, 0);
}

TEST(StateStoreTest, ThrowingObserverDoesNotFailCommittedWrite) {
    TempWorkspace workspace("store");
    StoreHarness h(statekeep::testing::fast_config(workspace.root()));
    ASSERT_FALSE(is_error(h.store.initialize_project("001", "Demo")));
    auto subscription = h.notifier.subscribe("001", [](const ChangeEvent&) { throw 42; });

    auto written = h.store.write_section("001", "info", json{{"a", 1}});
    ASSERT_FALSE(is_error(written));
    EXPECT_EQ(get_value(written).version, 1u);
}

TEST(StateStoreTest, DocumentsLiveBesideSections) {
    TempWorkspace workspace("store");
    StoreHarness h(statekeep::testing::fast_config(workspace.root()));
    ASSERT_FALSE(is_error(h.store.initialize_project("001", "Demo")));

    auto absent = h.store.read_document("001", "audit");
    ASSERT_FALSE(is_error(absent));
    EXPECT_FALSE(get_value(absent).has_value());

    auto appended = h.store.update_document(
        "001", "audit", [](const std::optional<json>& current) {
            json doc = current.value_or(json::array());
            doc.push_back("entry");
            return statekeep::core::errors::Result<json>(doc);
        });
    ASSERT_FALSE(is_error(appended));

    auto present = h.store.read_document("001", "audit");
    ASSERT_FALSE(is_error(present));
    ASSERT_TRUE(get_value(present).has_value());
    EXPECT_EQ(get_value(present).value(), json::array({"entry"}));
    EXPECT_TRUE(
        std::filesystem::exists(workspace.root() / "001" / "recovery" / "audit.json"));

    auto sections = h.store.list_sections("001");
    ASSERT_FALSE(is_error(sections));
    EXPECT_TRUE(get_value(sections).empty());
}

}  // namespace
