#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace statekeep::notify {

enum class ChangeType { Create, Update, Delete };

std::string to_string(ChangeType type);

struct ChangeEvent {
    std::string project_id;
    // Empty for project-level events such as deletion.
    std::string section;
    ChangeType change_type = ChangeType::Update;
    std::optional<nlohmann::json> previous_value;
    nlohmann::json new_value;
    std::uint64_t version = 0;
    std::int64_t timestamp_ms = 0;
};

using ChangeCallback = std::function<void(const ChangeEvent&)>;

class ChangeNotifier;

// Unsubscribes on destruction or cancel(). Outliving the notifier is safe.
class Subscription {
public:
    Subscription() = default;
    ~Subscription();

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void cancel();
    bool active() const;
    std::size_t id() const { return id_; }

private:
    friend class ChangeNotifier;
    struct Registry;

    Subscription(std::weak_ptr<Registry> registry, std::size_t id);

    std::weak_ptr<Registry> registry_;
    std::size_t id_ = 0;
};

// In-process observer list keyed by (project, section). Delivery is
// synchronous on the publishing thread, in subscription order. Nothing
// crosses process boundaries; other processes poll section versions.
class ChangeNotifier {
public:
    ChangeNotifier();

    ChangeNotifier(const ChangeNotifier&) = delete;
    ChangeNotifier& operator=(const ChangeNotifier&) = delete;

    // No section filter: every event for the project.
    [[nodiscard]] Subscription subscribe(const std::string& project_id, ChangeCallback callback,
                                         std::optional<std::string> section = std::nullopt);

    // Returns how many callbacks ran without throwing. A throwing callback is
    // logged as state.watch_error and does not stop the others.
    std::size_t publish(const ChangeEvent& event) const;

    // Drops every subscription for a project, e.g. after it was deleted.
    void drop_project(const std::string& project_id);

    std::size_t subscriber_count() const;
    std::size_t subscriber_count(const std::string& project_id) const;

private:
    std::shared_ptr<Subscription::Registry> registry_;
};

}  // namespace statekeep::notify
