#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/state_errors.hpp"

namespace statekeep::lock {

// Contents of a "<resource>.lock" side-car file.
struct LockRecord {
    std::string resource;
    std::string holder_id;
    std::int64_t acquired_at_ms = 0;
    std::int64_t last_heartbeat_ms = 0;
    std::optional<std::int64_t> expires_at_ms;
    // Bumped on every stale takeover so a thief can tell whether the record
    // it judged stale is still the one on disk.
    std::uint64_t generation = 0;
    std::int64_t pid = 0;
};

// Written next to a stale lock to ask its holder to yield.
struct ReleaseRequest {
    std::string resource;
    std::string requester_id;
    std::string original_holder_id;
    std::int64_t requested_at_ms = 0;
    std::int64_t expires_at_ms = 0;
};

nlohmann::json to_json(const LockRecord& record);
core::errors::Result<LockRecord> lock_record_from_json(const nlohmann::json& doc);

nlohmann::json to_json(const ReleaseRequest& request);
core::errors::Result<ReleaseRequest> release_request_from_json(const nlohmann::json& doc);

// now - last_heartbeat > heartbeat_timeout, or an expiry that has passed.
bool is_stale(const LockRecord& record, std::int64_t now_ms,
              std::uint32_t heartbeat_timeout_ms);

// Same on-disk record: nobody renewed, released or replaced it.
bool same_record(const LockRecord& a, const LockRecord& b);

}  // namespace statekeep::lock
