#include <stdexcept>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "notify/change_notifier.hpp"

namespace {

using statekeep::notify::ChangeEvent;
using statekeep::notify::ChangeNotifier;
using statekeep::notify::ChangeType;
using statekeep::notify::Subscription;

ChangeEvent make_event(const std::string& project, const std::string& section) {
    ChangeEvent event;
    event.project_id = project;
    event.section = section;
    event.change_type = ChangeType::Update;
    event.new_value = nlohmann::json{{"k", 1}};
    event.version = 2;
    return event;
}

TEST(ChangeNotifierTest, DeliversOnlyMatchingEvents) {
    ChangeNotifier notifier;
    std::vector<std::string> seen;
    auto whole_project = notifier.subscribe(
        "001", [&seen](const ChangeEvent& e) { seen.push_back("all:" + e.section); });
    auto one_section = notifier.subscribe(
        "001", [&seen](const ChangeEvent& e) { seen.push_back("info:" + e.section); }, "info");

    EXPECT_EQ(notifier.publish(make_event("001", "info")), 2u);
    EXPECT_EQ(notifier.publish(make_event("001", "progress")), 1u);
    EXPECT_EQ(notifier.publish(make_event("002", "info")), 0u);

    EXPECT_EQ(seen, (std::vector<std::string>{"all:info", "info:info", "all:progress"}));
}

TEST(ChangeNotifierTest, SubscriptionEndsWithScope) {
    ChangeNotifier notifier;
    int calls = 0;
    {
        auto subscription =
            notifier.subscribe("001", [&calls](const ChangeEvent&) { ++calls; });
        EXPECT_TRUE(subscription.active());
        EXPECT_EQ(notifier.subscriber_count("001"), 1u);
        notifier.publish(make_event("001", "info"));
    }
    notifier.publish(make_event("001", "info"));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(notifier.subscriber_count(), 0u);
}

TEST(ChangeNotifierTest, CancelAndMoveTransferOwnership) {
    ChangeNotifier notifier;
    int calls = 0;
    auto first = notifier.subscribe("001", [&calls](const ChangeEvent&) { ++calls; });
    Subscription moved = std::move(first);
    EXPECT_FALSE(first.active());
    EXPECT_TRUE(moved.active());

    notifier.publish(make_event("001", "info"));
    moved.cancel();
    notifier.publish(make_event("001", "info"));
    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(moved.active());
}

TEST(ChangeNotifierTest, ThrowingCallbackDoesNotStopOthers) {
    ChangeNotifier notifier;
    int calls = 0;
    auto bad = notifier.subscribe(
        "001", [](const ChangeEvent&) { throw std::runtime_error("observer broke"); });
    auto good = notifier.subscribe("001", [&calls](const ChangeEvent&) { ++calls; });

    EXPECT_EQ(notifier.publish(make_event("001", "info")), 1u);
    EXPECT_EQ(calls, 1);
}

TEST(ChangeNotifierTest, NonStandardThrowDoesNotStopOthers) {
    ChangeNotifier notifier;
    int calls = 0;
    auto bad = notifier.subscribe("001", [](const ChangeEvent&) { throw 42; });
    auto good = notifier.subscribe("001", [&calls](const ChangeEvent&) { ++calls; });

    EXPECT_NO_THROW(EXPECT_EQ(notifier.publish(make_event("001", "info")), 1u));
    EXPECT_EQ(calls, 1);
}

TEST(ChangeNotifierTest, CallbackMayCancelItself) {
    ChangeNotifier notifier;
    Subscription self;
    int calls = 0;
    self = notifier.subscribe("001", [&self, &calls](const ChangeEvent&) {
        ++calls;
        self.cancel();
    });

    notifier.publish(make_event("001", "info"));
    notifier.publish(make_event("001", "info"));
    EXPECT_EQ(calls, 1);
}

TEST(ChangeNotifierTest, SubscriptionMayOutliveNotifier) {
    Subscription survivor;
    {
        ChangeNotifier notifier;
        survivor = notifier.subscribe("001", [](const ChangeEvent&) {});
        EXPECT_TRUE(survivor.active());
    }
    EXPECT_FALSE(survivor.active());
    survivor.cancel();
}

TEST(ChangeNotifierTest, DropProjectRemovesItsSubscribers) {
    ChangeNotifier notifier;
    auto a = notifier.subscribe("001", [](const ChangeEvent&) {});
    auto b = notifier.subscribe("002", [](const ChangeEvent&) {});
    notifier.drop_project("001");
    EXPECT_FALSE(a.active());
    EXPECT_TRUE(b.active());
    EXPECT_EQ(notifier.subscriber_count(), 1u);
    EXPECT_EQ(statekeep::notify::to_string(ChangeType::Delete), "delete");
}

}  // namespace
