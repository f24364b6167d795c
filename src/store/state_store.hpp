#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/core_config.hpp"
#include "core/errors/state_errors.hpp"
#include "lock/file_lock_manager.hpp"
#include "notify/change_notifier.hpp"

namespace statekeep::store {

struct ProjectInfo {
    std::string id;
    std::string name;
    std::int64_t created_at_ms = 0;
};

struct HistoryEntry {
    // +1 per write to the section, never reset by eviction.
    std::uint64_t sequence = 0;
    std::int64_t timestamp_ms = 0;
    std::uint64_t version = 0;
    nlohmann::json snapshot;
    std::optional<std::string> description;
};

struct SectionSnapshot {
    std::string project_id;
    std::string section;
    bool exists = false;
    nlohmann::json value;
    // 0 until the first write.
    std::uint64_t version = 0;
    std::int64_t updated_at_ms = 0;
    // Oldest first. Only filled when asked for.
    std::vector<HistoryEntry> history;
};

struct ReadOptions {
    bool allow_missing = false;
    bool include_history = false;
};

struct UpdateOptions {
    bool merge = true;
    std::optional<std::string> description;
};

// Result of a read-modify-write callback run under the section lock.
struct Mutation {
    nlohmann::json value;
    std::optional<std::string> description;
};

using Mutator = std::function<core::errors::Result<Mutation>(const SectionSnapshot& current)>;
using Validator = std::function<core::errors::Status(const std::string& project_id,
                                                     const nlohmann::json& value)>;
using DocumentMutator = std::function<core::errors::Result<nlohmann::json>(
    const std::optional<nlohmann::json>& current)>;

nlohmann::json to_json(const HistoryEntry& entry);

// Per-project, per-section JSON records with a version counter and bounded
// history. Every write holds the section's file lock for its whole
// read-modify-write and commits with an atomic rename; reads take no lock
// and see either the previous or the next committed record.
class StateStore {
public:
    StateStore(core::config::CoreConfig config, lock::FileLockManager& locks,
               notify::ChangeNotifier* notifier = nullptr);

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    core::errors::Result<ProjectInfo> initialize_project(const std::string& project_id,
                                                         const std::string& name);
    core::errors::Status delete_project(const std::string& project_id);
    bool project_exists(const std::string& project_id) const;
    core::errors::Result<ProjectInfo> read_project(const std::string& project_id) const;
    core::errors::Result<std::vector<std::string>> list_projects() const;

    core::errors::Result<SectionSnapshot> read_section(const std::string& project_id,
                                                       const std::string& section,
                                                       ReadOptions options = {}) const;

    core::errors::Result<SectionSnapshot> write_section(
        const std::string& project_id, const std::string& section, nlohmann::json value,
        std::optional<std::string> description = std::nullopt);

    // merge=true shallow-merges the keys of `patch` into the current object;
    // a missing section takes `patch` as is. Both sides must be objects.
    core::errors::Result<SectionSnapshot> update_section(const std::string& project_id,
                                                         const std::string& section,
                                                         const nlohmann::json& patch,
                                                         UpdateOptions options = {});

    core::errors::Result<SectionSnapshot> update_section_with(const std::string& project_id,
                                                              const std::string& section,
                                                              const Mutator& mutator);

    // Oldest first; empty when the section was never written.
    core::errors::Result<std::vector<HistoryEntry>> get_history(
        const std::string& project_id, const std::string& section) const;

    // Newest first, at most `limit` entries.
    core::errors::Result<std::vector<HistoryEntry>> recent_activity(
        const std::string& project_id, const std::string& section, std::size_t limit) const;

    // Cheap poll for observers in other processes.
    core::errors::Result<std::uint64_t> section_version(const std::string& project_id,
                                                        const std::string& section) const;

    core::errors::Result<std::vector<std::string>> list_sections(
        const std::string& project_id) const;

    // Runs before every commit to `section`; an error aborts the write.
    void register_validator(const std::string& section, Validator validator);

    // Unversioned JSON documents under <project>/recovery/, written under
    // their own lock. No history, no change events.
    core::errors::Result<std::optional<nlohmann::json>> read_document(
        const std::string& project_id, const std::string& name) const;
    core::errors::Result<nlohmann::json> update_document(const std::string& project_id,
                                                         const std::string& name,
                                                         const DocumentMutator& mutator);

    const core::config::CoreConfig& config() const { return config_; }
    std::filesystem::path project_dir(const std::string& project_id) const;
    std::filesystem::path section_path(const std::string& project_id,
                                       const std::string& section) const;

private:
    core::errors::Status check_project(const std::string& project_id) const;
    core::errors::Result<SectionSnapshot> load_section(const std::string& project_id,
                                                       const std::string& section,
                                                       bool include_history) const;
    core::errors::Result<lock::LockRecord> lock_resource(const std::string& resource,
                                                         const std::string& holder_id);
    // Serializes initialize_project and delete_project for one ID.
    std::string project_lock_resource(const std::string& project_id) const;
    core::errors::Result<lock::LockRecord> lock_project(const std::string& project_id,
                                                        const std::string& holder_id);
    core::errors::Status discard_directory(const std::string& project_id, const std::string& tag);
    core::errors::Status run_validator(const std::string& project_id,
                                       const std::string& section,
                                       const nlohmann::json& value) const;
    std::string next_holder_id() const;

    core::config::CoreConfig config_;
    lock::FileLockManager& locks_;
    notify::ChangeNotifier* notifier_;
    std::string holder_prefix_;

    mutable std::mutex validators_mutex_;
    std::map<std::string, Validator> validators_;
};

}  // namespace statekeep::store
