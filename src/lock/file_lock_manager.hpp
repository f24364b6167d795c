#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "core/config/core_config.hpp"
#include "core/errors/state_errors.hpp"
#include "lock/lock_record.hpp"

namespace statekeep::lock {

struct LockOptions {
    std::uint32_t retry_attempts = 10;
    std::uint32_t retry_delay_ms = 100;
    std::uint32_t retry_max_delay_ms = 1000;
    bool enable_heartbeat = true;
    std::uint32_t heartbeat_interval_ms = 1000;
    std::uint32_t heartbeat_timeout_ms = 3000;
    std::uint32_t expiry_ms = 0;
    bool cooperative_release = true;
    std::uint32_t cooperative_release_timeout_ms = 1000;
};

LockOptions lock_options_from(const core::config::CoreConfig& config);

// Advisory, application-level exclusive locks backed by "<resource>.lock"
// side-car files, so independent processes sharing a filesystem exclude each
// other. Relative resource names resolve against `lock_root`.
//
// Staleness is judged from wall-clock timestamps written by the holder.
// Clock skew between hosts sharing a mount can make a live lock look stale;
// that is not corrected here.
//
// Release moves the record aside and checks it before deleting, so it never
// removes a record that replaced ours. Renewal rewrites the file in place: a
// takeover that lands between renew's read and its rename is overwritten.
// That needs our own record to have gone stale first, i.e. a heartbeat that
// was already late by heartbeat_timeout_ms.
class FileLockManager {
public:
    explicit FileLockManager(std::filesystem::path lock_root, LockOptions options = {});
    ~FileLockManager();

    FileLockManager(const FileLockManager&) = delete;
    FileLockManager& operator=(const FileLockManager&) = delete;

    // Blocks until granted or until `timeout` / retry_attempts run out
    // (lock.acquisition_failed, transient). Never overwrites a live lock.
    core::errors::Result<LockRecord> acquire(const std::string& resource,
                                             const std::string& holder_id,
                                             std::chrono::milliseconds timeout);

    // lock.not_holder when the record is absent or belongs to someone else;
    // another holder's record is never removed.
    core::errors::Status release(const std::string& resource,
                                 const std::string& holder_id);

    // Refreshes last_heartbeat. lock.lost when the record vanished or was
    // taken over.
    core::errors::Status renew(const std::string& resource, const std::string& holder_id);

    // ok only if this manager still holds the lock on disk.
    core::errors::Status verify_held(const std::string& resource,
                                     const std::string& holder_id) const;

    bool is_stale(const std::string& resource) const;

    core::errors::Result<std::optional<LockRecord>> read_lock(
        const std::string& resource) const;

    std::filesystem::path lock_path_for(const std::string& resource) const;
    std::size_t held_count() const;
    const LockOptions& options() const { return options_; }

private:
    struct HeldLock {
        std::string resource;
        std::string holder_id;
        LockRecord record;
        bool lost = false;
        std::string lost_reason;
    };

    // What is on disk at a lock path right now.
    struct Inspection {
        bool present = false;
        std::optional<LockRecord> record;  // empty + present => unreadable
        std::int64_t modified_at_ms = 0;
    };

    enum class CreateOutcome { Created, Exists };

    std::filesystem::path resolve(const std::string& resource) const;
    Inspection inspect(const std::filesystem::path& lock_path) const;
    bool inspection_is_stale(const Inspection& inspection) const;
    core::errors::Result<CreateOutcome> try_create(const std::filesystem::path& lock_path,
                                                   const LockRecord& record) const;
    // The new record when the stale lock was taken, empty when someone else
    // got there first or the holder turned out to be alive.
    core::errors::Result<std::optional<LockRecord>> try_takeover(
        const std::filesystem::path& lock_path, const std::string& resource,
        const std::string& holder_id, const Inspection& stale,
        std::chrono::steady_clock::time_point deadline);
    bool request_cooperative_release(const std::filesystem::path& lock_path,
                                     const Inspection& stale,
                                     const std::string& requester_id,
                                     std::chrono::steady_clock::time_point wait_until);
    // false, with the file left in place, when the lock no longer holds `expected`.
    core::errors::Result<bool> remove_if_unchanged(const std::filesystem::path& lock_path,
                                                   const LockRecord& expected) const;
    LockRecord make_record(const std::string& resource, const std::string& holder_id,
                           std::uint64_t generation) const;
    void register_held(const std::filesystem::path& lock_path, const std::string& resource,
                       const LockRecord& record);
    void mark_lost(const std::filesystem::path& lock_path, const std::string& reason);
    core::errors::Status renew_path(const std::filesystem::path& lock_path,
                                    const std::string& resource,
                                    const std::string& holder_id);
    bool yield_if_requested(const std::filesystem::path& lock_path,
                            const std::string& holder_id);
    void ensure_heartbeat_thread();
    void heartbeat_loop();

    std::filesystem::path lock_root_;
    LockOptions options_;

    mutable std::mutex mutex_;
    // Serializes read-modify-write of our own lock files (renew, yield,
    // release). Never taken while mutex_ is held.
    std::mutex file_mutex_;
    std::condition_variable heartbeat_cv_;
    std::map<std::filesystem::path, HeldLock> held_;
    std::thread heartbeat_thread_;
    bool stopping_ = false;
};

// Releases on destruction. A failed release is logged, not thrown.
class ScopedLock {
public:
    ScopedLock(FileLockManager& manager, std::string resource, std::string holder_id);
    ~ScopedLock();

    ScopedLock(const ScopedLock&) = delete;
    ScopedLock& operator=(const ScopedLock&) = delete;

    core::errors::Status release();
    const std::string& holder_id() const { return holder_id_; }

private:
    FileLockManager& manager_;
    std::string resource_;
    std::string holder_id_;
    bool owns_ = true;
};

}  // namespace statekeep::lock
