#include "lock/file_lock_manager.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fstream>
#include <random>
#include <sys/stat.h>
#include <system_error>
#include <tuple>
#include <unistd.h>
#include <utility>
#include <vector>
#include "core/config/ids.hpp"
#include "core/io/atomic_file.hpp"
#include "core/logging/logger.hpp"

namespace statekeep::lock {

using core::errors::ErrorCategory;
using core::errors::StateError;
using nlohmann::json;
namespace codes = core::errors::codes;

namespace {

constexpr const char* kLockExtension = ".lock";
constexpr const char* kReleaseRequestExtension = ".release";
constexpr std::chrono::milliseconds kCooperativePollInterval{25};

StateError lock_error(const ErrorCategory category, const char* code,
                      const std::string& message, const std::string& resource,
                      const std::string& holder_id) {
    return core::errors::make_error(category, code, message,
                                    {{"resource", resource}, {"holder_id", holder_id}});
}

StateError io_error(const std::string& message, const std::filesystem::path& path,
                    const int err) {
    return core::errors::make_error(ErrorCategory::Transient, codes::kIoError,
                                    message + ": " + std::strerror(err),
                                    {{"path", path.string()}});
}

std::filesystem::path with_suffix(const std::filesystem::path& path, const std::string& suffix) {
    return std::filesystem::path(path.string() + suffix);
}

std::int64_t modified_at_ms(const std::filesystem::path& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return 0;
    }
    return static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1000 +
           static_cast<std::int64_t>(st.st_mtim.tv_nsec / 1000000);
}

std::chrono::milliseconds backoff_delay(const LockOptions& options, const std::uint32_t attempt) {
    thread_local std::mt19937 gen(std::random_device{}());
    const double raw = static_cast<double>(options.retry_delay_ms) *
                       std::pow(2.0, static_cast<double>(std::min<std::uint32_t>(attempt, 20)));
    const double capped = std::min(raw, static_cast<double>(options.retry_max_delay_ms));
    // Up to 10% jitter so contending processes drift apart.
    std::uniform_real_distribution<double> jitter(0.0, capped * 0.1);
    return std::chrono::milliseconds(static_cast<std::int64_t>(capped + jitter(gen)));
}

void remove_quietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        LOG_DEBUG("FileLockManager: could not remove " + path.string() + ": " + ec.message());
    }
}

}  // namespace

LockOptions lock_options_from(const core::config::CoreConfig& config) {
    LockOptions options;
    options.retry_attempts = config.lock_retry_attempts;
    options.retry_delay_ms = config.lock_retry_delay_ms;
    options.retry_max_delay_ms = config.lock_retry_max_delay_ms;
    options.enable_heartbeat = config.enable_heartbeat;
    options.heartbeat_interval_ms = config.heartbeat_interval_ms;
    options.heartbeat_timeout_ms = config.heartbeat_timeout_ms;
    options.expiry_ms = config.lock_expiry_ms;
    options.cooperative_release = config.cooperative_release;
    options.cooperative_release_timeout_ms = config.cooperative_release_timeout_ms;
    return options;
}

FileLockManager::FileLockManager(std::filesystem::path lock_root, LockOptions options)
    : lock_root_(std::move(lock_root)), options_(options) {}

FileLockManager::~FileLockManager() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    heartbeat_cv_.notify_all();
    if (heartbeat_thread_.joinable()) {
        heartbeat_thread_.join();
    }

    std::vector<std::pair<std::string, std::string>> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [path, held] : held_) {
            if (!held.lost) {
                remaining.emplace_back(held.resource, held.holder_id);
            }
        }
    }
    for (const auto& [resource, holder_id] : remaining) {
        auto released = release(resource, holder_id);
        if (core::errors::is_error(released)) {
            LOG_WARN("FileLockManager: release on shutdown failed " +
                     core::errors::describe(core::errors::get_error(released)));
        }
    }
}

std::filesystem::path FileLockManager::resolve(const std::string& resource) const {
    std::filesystem::path path(resource);
    if (path.is_absolute()) {
        return path;
    }
    return lock_root_ / path;
}

std::filesystem::path FileLockManager::lock_path_for(const std::string& resource) const {
    return with_suffix(resolve(resource), kLockExtension);
}

std::size_t FileLockManager::held_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(
        std::count_if(held_.begin(), held_.end(),
                      [](const auto& entry) { return !entry.second.lost; }));
}

LockRecord FileLockManager::make_record(const std::string& resource,
                                        const std::string& holder_id,
                                        const std::uint64_t generation) const {
    const auto now = core::config::now_unix_ms();
    LockRecord record;
    record.resource = resource;
    record.holder_id = holder_id;
    record.acquired_at_ms = now;
    record.last_heartbeat_ms = now;
    if (options_.expiry_ms > 0) {
        record.expires_at_ms = now + options_.expiry_ms;
    }
    record.generation = generation;
    record.pid = static_cast<std::int64_t>(::getpid());
    return record;
}

FileLockManager::Inspection FileLockManager::inspect(
    const std::filesystem::path& lock_path) const {
    Inspection inspection;
    auto text = core::io::read_text_file(lock_path, true);
    if (core::errors::is_error(text)) {
        // Exists but unreadable: report present so nobody creates over it.
        inspection.present = true;
        inspection.modified_at_ms = modified_at_ms(lock_path);
        return inspection;
    }
    const auto& content = core::errors::get_value(text);
    if (!content.has_value()) {
        return inspection;
    }

    inspection.present = true;
    inspection.modified_at_ms = modified_at_ms(lock_path);
    try {
        auto record = lock_record_from_json(json::parse(content.value()));
        if (!core::errors::is_error(record)) {
            inspection.record = core::errors::get_value(record);
        }
    } catch (const json::parse_error& e) {
        LOG_DEBUG("FileLockManager: unreadable lock " + lock_path.string() + ": " + e.what());
    }
    return inspection;
}

bool FileLockManager::inspection_is_stale(const Inspection& inspection) const {
    if (!inspection.present) {
        return false;
    }
    const auto now = core::config::now_unix_ms();
    if (inspection.record.has_value()) {
        return lock::is_stale(inspection.record.value(), now, options_.heartbeat_timeout_ms);
    }
    // A corrupt record only counts as abandoned once it is old enough.
    return inspection.modified_at_ms > 0 &&
           now - inspection.modified_at_ms >
               static_cast<std::int64_t>(options_.heartbeat_timeout_ms);
}

core::errors::Result<FileLockManager::CreateOutcome> FileLockManager::try_create(
    const std::filesystem::path& lock_path, const LockRecord& record) const {
    const auto temp_path =
        with_suffix(lock_path, "." + core::config::generate_id("acq") + ".tmp");
    {
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out.is_open()) {
            return io_error("Unable to create lock staging file", temp_path, errno);
        }
        out << to_json(record).dump();
        out.flush();
        if (!out.good()) {
            const int err = errno;
            out.close();
            remove_quietly(temp_path);
            return io_error("Unable to write lock staging file", temp_path, err);
        }
    }

    // link() fails with EEXIST instead of replacing, unlike rename().
    const int rc = ::link(temp_path.c_str(), lock_path.c_str());
    const int err = errno;
    remove_quietly(temp_path);
    if (rc == 0) {
        return CreateOutcome::Created;
    }
    if (err == EEXIST) {
        return CreateOutcome::Exists;
    }
    return io_error("Unable to create lock file", lock_path, err);
}

bool FileLockManager::request_cooperative_release(
    const std::filesystem::path& lock_path, const Inspection& stale,
    const std::string& requester_id, const std::chrono::steady_clock::time_point wait_until) {
    const auto now = core::config::now_unix_ms();
    ReleaseRequest request;
    request.resource = stale.record->resource;
    request.requester_id = requester_id;
    request.original_holder_id = stale.record->holder_id;
    request.requested_at_ms = now;
    request.expires_at_ms = now + options_.cooperative_release_timeout_ms;

    const auto request_path = with_suffix(lock_path, kReleaseRequestExtension);
    auto written = core::io::write_json_atomic(request_path, to_json(request));
    if (core::errors::is_error(written)) {
        LOG_WARN("FileLockManager: could not post release request " +
                 core::errors::describe(core::errors::get_error(written)));
        return false;
    }

    LOG_INFO("FileLockManager: asked " + stale.record->holder_id + " to release " +
             lock_path.string());
    bool yielded = false;
    while (std::chrono::steady_clock::now() < wait_until) {
        const auto current = inspect(lock_path);
        if (!current.present) {
            yielded = true;
            break;
        }
        if (current.record.has_value() && !same_record(*current.record, *stale.record)) {
            break;
        }
        std::this_thread::sleep_for(kCooperativePollInterval);
    }
    remove_quietly(request_path);
    return yielded;
}

core::errors::Result<std::optional<LockRecord>> FileLockManager::try_takeover(
    const std::filesystem::path& lock_path, const std::string& resource,
    const std::string& holder_id, const Inspection& stale,
    const std::chrono::steady_clock::time_point deadline) {
    const std::uint64_t next_generation =
        stale.record.has_value() ? stale.record->generation + 1 : 1;

    auto create_fresh = [&]() -> core::errors::Result<std::optional<LockRecord>> {
        auto record = make_record(resource, holder_id, next_generation);
        auto created = try_create(lock_path, record);
        if (core::errors::is_error(created)) {
            return core::errors::get_error(created);
        }
        if (core::errors::get_value(created) == CreateOutcome::Created) {
            return std::optional<LockRecord>(record);
        }
        return std::optional<LockRecord>{};
    };

    if (options_.cooperative_release && stale.record.has_value()) {
        const auto cooperative_end =
            std::chrono::steady_clock::now() +
            std::chrono::milliseconds(options_.cooperative_release_timeout_ms);
        // The wait never outlasts the caller's acquire timeout.
        const bool cut_short = deadline < cooperative_end;
        if (request_cooperative_release(lock_path, stale, holder_id,
                                        std::min(deadline, cooperative_end))) {
            return create_fresh();
        }
        const auto again = inspect(lock_path);
        if (!again.present) {
            return create_fresh();
        }
        if (!again.record.has_value() || !same_record(*again.record, *stale.record)) {
            return std::optional<LockRecord>{};
        }
        if (cut_short) {
            return std::optional<LockRecord>{};
        }
    }

    // Move the stale record aside. Only one contender's rename can succeed.
    const auto aside =
        with_suffix(lock_path, ".stale." + core::config::generate_id("tk"));
    if (::rename(lock_path.c_str(), aside.c_str()) != 0) {
        const int err = errno;
        if (err == ENOENT) {
            return std::optional<LockRecord>{};
        }
        return io_error("Unable to move stale lock aside", lock_path, err);
    }

    const auto moved = inspect(aside);
    const bool matches = stale.record.has_value()
                             ? moved.record.has_value() &&
                                   same_record(*moved.record, *stale.record)
                             : !moved.record.has_value();
    if (!matches) {
        // The holder renewed or someone else took over in between; put it back.
        if (::link(aside.c_str(), lock_path.c_str()) != 0) {
            LOG_WARN("FileLockManager: could not restore lock " + lock_path.string() +
                     " after an aborted takeover: " + std::strerror(errno));
        }
        remove_quietly(aside);
        return std::optional<LockRecord>{};
    }
    remove_quietly(aside);

    LOG_WARN("FileLockManager: took over stale lock " + lock_path.string() + " from " +
             (stale.record.has_value() ? stale.record->holder_id : std::string("<unreadable>")));
    return create_fresh();
}

core::errors::Result<bool> FileLockManager::remove_if_unchanged(
    const std::filesystem::path& lock_path, const LockRecord& expected) const {
    // rename() moves exactly one file, so what lands at `aside` is what gets judged.
    const auto aside = with_suffix(lock_path, ".rel." + core::config::generate_id("rl"));
    if (::rename(lock_path.c_str(), aside.c_str()) != 0) {
        const int err = errno;
        if (err == ENOENT) {
            return false;
        }
        return io_error("Unable to move lock aside for removal", lock_path, err);
    }

    const auto moved = inspect(aside);
    if (moved.record.has_value() && same_record(*moved.record, expected)) {
        remove_quietly(aside);
        return true;
    }
    // A takeover landed after our read; hand its record back.
    if (::link(aside.c_str(), lock_path.c_str()) != 0) {
        LOG_WARN("FileLockManager: could not restore lock " + lock_path.string() + ": " +
                 std::strerror(errno));
    }
    remove_quietly(aside);
    return false;
}

void FileLockManager::register_held(const std::filesystem::path& lock_path,
                                    const std::string& resource, const LockRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    HeldLock held;
    held.resource = resource;
    held.holder_id = record.holder_id;
    held.record = record;
    held_[lock_path] = std::move(held);
    if (options_.enable_heartbeat) {
        ensure_heartbeat_thread();
    }
}

void FileLockManager::ensure_heartbeat_thread() {
    // Caller holds mutex_.
    if (heartbeat_thread_.joinable() || stopping_) {
        return;
    }
    heartbeat_thread_ = std::thread([this]() { heartbeat_loop(); });
}

core::errors::Result<LockRecord> FileLockManager::acquire(
    const std::string& resource, const std::string& holder_id,
    const std::chrono::milliseconds timeout) {
    if (resource.empty() || holder_id.empty()) {
        return lock_error(ErrorCategory::Fatal, codes::kValidationFailed,
                          "Lock resource and holder ID must be non-empty.", resource,
                          holder_id);
    }

    const auto lock_path = lock_path_for(resource);
    std::error_code ec;
    std::filesystem::create_directories(lock_path.parent_path(), ec);
    if (ec) {
        return io_error("Unable to create lock directory", lock_path.parent_path(),
                        ec.value());
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::uint32_t attempt = 0;
    std::string current_holder;
    while (true) {
        auto record = make_record(resource, holder_id, 0);
        auto created = try_create(lock_path, record);
        if (core::errors::is_error(created)) {
            return core::errors::get_error(created);
        }
        if (core::errors::get_value(created) == CreateOutcome::Created) {
            register_held(lock_path, resource, record);
            LOG_DEBUG("FileLockManager: " + holder_id + " acquired " + lock_path.string());
            return record;
        }

        const auto existing = inspect(lock_path);
        if (!existing.present) {
            // Released between our link() and the read; try again right away.
            if (std::chrono::steady_clock::now() < deadline) {
                continue;
            }
            break;
        }
        if (existing.record.has_value()) {
            current_holder = existing.record->holder_id;
        }

        if (inspection_is_stale(existing)) {
            auto taken = try_takeover(lock_path, resource, holder_id, existing, deadline);
            if (core::errors::is_error(taken)) {
                return core::errors::get_error(taken);
            }
            const auto& fresh = core::errors::get_value(taken);
            if (fresh.has_value()) {
                register_held(lock_path, resource, fresh.value());
                return fresh.value();
            }
        }

        ++attempt;
        const auto now = std::chrono::steady_clock::now();
        if (attempt >= options_.retry_attempts || now >= deadline) {
            break;
        }
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(backoff_delay(options_, attempt - 1), remaining));
    }

    auto error = lock_error(ErrorCategory::Transient, codes::kLockAcquisitionFailed,
                            "Failed to acquire lock for: " + resource + " within " +
                                std::to_string(timeout.count()) + "ms",
                            resource, holder_id);
    if (!current_holder.empty()) {
        error.context["current_holder"] = current_holder;
    }
    error.context["attempts"] = std::to_string(attempt);
    error.hint = "Another writer holds the lock; retry later or raise lock_timeout_ms.";
    LOG_WARN("FileLockManager: " + core::errors::describe(error));
    return error;
}

core::errors::Status FileLockManager::release(const std::string& resource,
                                              const std::string& holder_id) {
    const auto lock_path = lock_path_for(resource);
    std::string lost_reason;
    std::optional<LockRecord> held_record;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = held_.find(lock_path);
        if (it != held_.end() && it->second.holder_id == holder_id) {
            lost_reason = it->second.lost_reason;
            held_record = it->second.record;
            held_.erase(it);
        }
    }

    std::lock_guard<std::mutex> file_guard(file_mutex_);
    const auto current = inspect(lock_path);
    if (!current.present) {
        auto error = lock_error(ErrorCategory::Fatal, codes::kLockNotHolder,
                                "Lock is not held: " + resource, resource, holder_id);
        if (!lost_reason.empty()) {
            error.context["lost_reason"] = lost_reason;
        }
        return error;
    }
    if (!current.record.has_value() || current.record->holder_id != holder_id) {
        auto error = lock_error(ErrorCategory::Fatal, codes::kLockNotHolder,
                                "Cannot release lock held by another holder: " + resource,
                                resource, holder_id);
        if (current.record.has_value()) {
            error.context["current_holder"] = current.record->holder_id;
        }
        return error;
    }
    // Same holder ID, different acquisition: someone took it over from us.
    if (held_record.has_value() &&
        (current.record->acquired_at_ms != held_record->acquired_at_ms ||
         current.record->generation != held_record->generation)) {
        auto error = lock_error(ErrorCategory::Fatal, codes::kLockNotHolder,
                                "Lock was taken over before release: " + resource, resource,
                                holder_id);
        error.context["generation"] = std::to_string(current.record->generation);
        return error;
    }

    auto removed = remove_if_unchanged(lock_path, current.record.value());
    if (core::errors::is_error(removed)) {
        return core::errors::get_error(removed);
    }
    if (!core::errors::get_value(removed)) {
        auto error = lock_error(ErrorCategory::Fatal, codes::kLockNotHolder,
                                "Lock changed hands during release: " + resource, resource,
                                holder_id);
        const auto now_on_disk = inspect(lock_path);
        if (now_on_disk.record.has_value()) {
            error.context["current_holder"] = now_on_disk.record->holder_id;
        }
        return error;
    }
    LOG_DEBUG("FileLockManager: " + holder_id + " released " + lock_path.string());
    return core::errors::ok();
}

void FileLockManager::mark_lost(const std::filesystem::path& lock_path,
                                const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = held_.find(lock_path);
    if (it == held_.end() || it->second.lost) {
        return;
    }
    it->second.lost = true;
    it->second.lost_reason = reason;
    LOG_WARN("FileLockManager: lost lock " + lock_path.string() + " held by " +
             it->second.holder_id + ": " + reason);
}

core::errors::Status FileLockManager::renew_path(const std::filesystem::path& lock_path,
                                                 const std::string& resource,
                                                 const std::string& holder_id) {
    std::lock_guard<std::mutex> file_guard(file_mutex_);
    LockRecord ours;
    {
        // Released by its owner since the heartbeat snapshot.
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = held_.find(lock_path);
        if (it == held_.end() || it->second.holder_id != holder_id) {
            return lock_error(ErrorCategory::Fatal, codes::kLockNotHolder,
                              "Lock is not held: " + resource, resource, holder_id);
        }
        ours = it->second.record;
    }
    const auto current = inspect(lock_path);
    if (!current.present || !current.record.has_value() ||
        current.record->holder_id != holder_id ||
        current.record->acquired_at_ms != ours.acquired_at_ms ||
        current.record->generation != ours.generation) {
        const std::string reason =
            !current.present ? "lock file was removed" : "lock was taken over";
        mark_lost(lock_path, reason);
        return lock_error(ErrorCategory::Transient, codes::kLockLost,
                          "Lock lost for: " + resource + " (" + reason + ")", resource,
                          holder_id);
    }

    LockRecord updated = current.record.value();
    updated.last_heartbeat_ms = core::config::now_unix_ms();
    if (options_.expiry_ms > 0) {
        updated.expires_at_ms = updated.last_heartbeat_ms + options_.expiry_ms;
    }
    auto written = core::io::write_json_atomic(lock_path, to_json(updated));
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = held_.find(lock_path);
    if (it != held_.end() && it->second.holder_id == holder_id) {
        it->second.record = updated;
    }
    return core::errors::ok();
}

core::errors::Status FileLockManager::renew(const std::string& resource,
                                            const std::string& holder_id) {
    const auto lock_path = lock_path_for(resource);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = held_.find(lock_path);
        if (it == held_.end() || it->second.holder_id != holder_id) {
            return lock_error(ErrorCategory::Fatal, codes::kLockNotHolder,
                              "Cannot renew a lock this holder does not hold: " + resource,
                              resource, holder_id);
        }
        if (it->second.lost) {
            return lock_error(ErrorCategory::Transient, codes::kLockLost,
                              "Lock lost for: " + resource + " (" + it->second.lost_reason +
                                  ")",
                              resource, holder_id);
        }
    }
    return renew_path(lock_path, resource, holder_id);
}

core::errors::Status FileLockManager::verify_held(const std::string& resource,
                                                  const std::string& holder_id) const {
    const auto lock_path = lock_path_for(resource);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = held_.find(lock_path);
        if (it == held_.end() || it->second.holder_id != holder_id) {
            return lock_error(ErrorCategory::Transient, codes::kLockLost,
                              "Lock is no longer registered for: " + resource, resource,
                              holder_id);
        }
        if (it->second.lost) {
            return lock_error(ErrorCategory::Transient, codes::kLockLost,
                              "Lock lost for: " + resource + " (" + it->second.lost_reason +
                                  ")",
                              resource, holder_id);
        }
    }

    const auto current = inspect(lock_path);
    if (!current.record.has_value() || current.record->holder_id != holder_id) {
        return lock_error(ErrorCategory::Transient, codes::kLockLost,
                          "Lock record on disk no longer belongs to holder: " + resource,
                          resource, holder_id);
    }
    return core::errors::ok();
}

bool FileLockManager::is_stale(const std::string& resource) const {
    return inspection_is_stale(inspect(lock_path_for(resource)));
}

core::errors::Result<std::optional<LockRecord>> FileLockManager::read_lock(
    const std::string& resource) const {
    const auto lock_path = lock_path_for(resource);
    auto doc = core::io::read_json_file(lock_path, true);
    if (core::errors::is_error(doc)) {
        return core::errors::get_error(doc);
    }
    const auto& value = core::errors::get_value(doc);
    if (!value.has_value()) {
        return std::optional<LockRecord>{};
    }
    auto record = lock_record_from_json(value.value());
    if (core::errors::is_error(record)) {
        return core::errors::get_error(record);
    }
    return std::optional<LockRecord>(core::errors::get_value(record));
}

bool FileLockManager::yield_if_requested(const std::filesystem::path& lock_path,
                                         const std::string& holder_id) {
    const auto request_path = with_suffix(lock_path, kReleaseRequestExtension);
    auto doc = core::io::read_json_file(request_path, true);
    if (core::errors::is_error(doc) || !core::errors::get_value(doc).has_value()) {
        return false;
    }
    auto request = release_request_from_json(core::errors::get_value(doc).value());
    if (core::errors::is_error(request)) {
        return false;
    }
    const auto& parsed = core::errors::get_value(request);
    if (parsed.original_holder_id != holder_id) {
        return false;
    }

    std::lock_guard<std::mutex> file_guard(file_mutex_);
    const auto current = inspect(lock_path);
    if (current.record.has_value() && current.record->holder_id == holder_id) {
        auto removed = remove_if_unchanged(lock_path, current.record.value());
        if (core::errors::is_error(removed)) {
            LOG_WARN("FileLockManager: could not yield " +
                     core::errors::describe(core::errors::get_error(removed)));
            return false;
        }
    }
    mark_lost(lock_path, "yielded to release request from " + parsed.requester_id);
    return true;
}

void FileLockManager::heartbeat_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto interval = std::chrono::milliseconds(options_.heartbeat_interval_ms);
    while (!stopping_) {
        heartbeat_cv_.wait_for(lock, interval, [this]() { return stopping_; });
        if (stopping_) {
            break;
        }

        std::vector<std::tuple<std::filesystem::path, std::string, std::string>> due;
        for (const auto& [path, held] : held_) {
            if (!held.lost) {
                due.emplace_back(path, held.resource, held.holder_id);
            }
        }
        lock.unlock();

        for (const auto& [path, resource, holder_id] : due) {
            if (yield_if_requested(path, holder_id)) {
                continue;
            }
            auto renewed = renew_path(path, resource, holder_id);
            if (!core::errors::is_error(renewed)) {
                continue;
            }
            const auto& code = core::errors::get_error(renewed).code;
            if (code != codes::kLockLost && code != codes::kLockNotHolder) {
                LOG_WARN("FileLockManager: heartbeat failed " +
                         core::errors::describe(core::errors::get_error(renewed)));
            }
        }
        lock.lock();
    }
}

ScopedLock::ScopedLock(FileLockManager& manager, std::string resource, std::string holder_id)
    : manager_(manager), resource_(std::move(resource)), holder_id_(std::move(holder_id)) {}

ScopedLock::~ScopedLock() {
    if (!owns_) {
        return;
    }
    auto released = release();
    if (core::errors::is_error(released)) {
        LOG_WARN("ScopedLock: " + core::errors::describe(core::errors::get_error(released)));
    }
}

core::errors::Status ScopedLock::release() {
    if (!owns_) {
        return core::errors::ok();
    }
    owns_ = false;
    return manager_.release(resource_, holder_id_);
}

}  // namespace statekeep::lock
