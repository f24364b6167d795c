#include "notify/change_notifier.hpp"

#include <algorithm>
#include <exception>
#include <utility>
#include "core/errors/state_errors.hpp"
#include "core/logging/logger.hpp"

namespace statekeep::notify {

namespace codes = core::errors::codes;

struct Subscription::Registry {
    struct Entry {
        std::size_t id = 0;
        std::string project_id;
        std::optional<std::string> section;
        ChangeCallback callback;
    };

    mutable std::mutex mutex;
    std::vector<Entry> entries;
    std::size_t next_id = 1;

    void remove(const std::size_t id) {
        std::lock_guard<std::mutex> lock(mutex);
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [id](const Entry& entry) { return entry.id == id; }),
                      entries.end());
    }
};

std::string to_string(const ChangeType type) {
    switch (type) {
        case ChangeType::Create: return "create";
        case ChangeType::Update: return "update";
        case ChangeType::Delete: return "delete";
        default: return "unknown";
    }
}

Subscription::Subscription(std::weak_ptr<Registry> registry, const std::size_t id)
    : registry_(std::move(registry)), id_(id) {}

Subscription::~Subscription() {
    cancel();
}

Subscription::Subscription(Subscription&& other) noexcept
    : registry_(std::move(other.registry_)), id_(other.id_) {
    other.registry_.reset();
    other.id_ = 0;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        cancel();
        registry_ = std::move(other.registry_);
        id_ = other.id_;
        other.registry_.reset();
        other.id_ = 0;
    }
    return *this;
}

void Subscription::cancel() {
    if (auto registry = registry_.lock()) {
        registry->remove(id_);
    }
    registry_.reset();
}

bool Subscription::active() const {
    auto registry = registry_.lock();
    if (!registry) {
        return false;
    }
    std::lock_guard<std::mutex> lock(registry->mutex);
    return std::any_of(registry->entries.begin(), registry->entries.end(),
                       [this](const Registry::Entry& entry) { return entry.id == id_; });
}

ChangeNotifier::ChangeNotifier() : registry_(std::make_shared<Subscription::Registry>()) {}

Subscription ChangeNotifier::subscribe(const std::string& project_id, ChangeCallback callback,
                                       std::optional<std::string> section) {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    Subscription::Registry::Entry entry;
    entry.id = registry_->next_id++;
    entry.project_id = project_id;
    entry.section = std::move(section);
    entry.callback = std::move(callback);
    const auto id = entry.id;
    registry_->entries.push_back(std::move(entry));
    return Subscription(registry_, id);
}

std::size_t ChangeNotifier::publish(const ChangeEvent& event) const {
    // Copy the matching callbacks so a callback may subscribe or cancel.
    std::vector<std::pair<std::size_t, ChangeCallback>> targets;
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        for (const auto& entry : registry_->entries) {
            if (entry.project_id != event.project_id) {
                continue;
            }
            if (entry.section.has_value() && entry.section.value() != event.section) {
                continue;
            }
            targets.emplace_back(entry.id, entry.callback);
        }
    }

    auto report = [&event](const std::size_t id, const std::string& what) {
        auto error = core::errors::make_error(
            core::errors::ErrorCategory::Fatal, codes::kWatchError,
            "Change callback threw: " + what,
            {{"project_id", event.project_id},
             {"section", event.section},
             {"subscription", std::to_string(id)}});
        LOG_ERROR("ChangeNotifier: " + core::errors::describe(error));
    };

    std::size_t delivered = 0;
    for (const auto& [id, callback] : targets) {
        try {
            callback(event);
            ++delivered;
        } catch (const std::exception& e) {
            report(id, e.what());
        } catch (...) {
            // Writes are already committed; an observer never fails them.
            report(id, "non-standard exception");
        }
    }
    return delivered;
}

void ChangeNotifier::drop_project(const std::string& project_id) {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    auto& entries = registry_->entries;
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [&project_id](const Subscription::Registry::Entry& entry) {
                                     return entry.project_id == project_id;
                                 }),
                  entries.end());
}

std::size_t ChangeNotifier::subscriber_count() const {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    return registry_->entries.size();
}

std::size_t ChangeNotifier::subscriber_count(const std::string& project_id) const {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    return static_cast<std::size_t>(
        std::count_if(registry_->entries.begin(), registry_->entries.end(),
                      [&project_id](const Subscription::Registry::Entry& entry) {
                          return entry.project_id == project_id;
                      }));
}

}  // namespace statekeep::notify
