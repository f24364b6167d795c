#include "lock/lock_record.hpp"

namespace statekeep::lock {

using core::errors::ErrorCategory;
using nlohmann::json;
namespace codes = core::errors::codes;

namespace {

core::errors::StateError malformed(const std::string& what) {
    return core::errors::make_error(ErrorCategory::Fatal, codes::kCorruptRecord,
                                    "Malformed lock file: " + what);
}

}  // namespace

json to_json(const LockRecord& record) {
    json payload;
    payload["resource"] = record.resource;
    payload["holder_id"] = record.holder_id;
    payload["acquired_at_ms"] = record.acquired_at_ms;
    payload["last_heartbeat_ms"] = record.last_heartbeat_ms;
    if (record.expires_at_ms.has_value()) {
        payload["expires_at_ms"] = record.expires_at_ms.value();
    } else {
        payload["expires_at_ms"] = nullptr;
    }
    payload["generation"] = record.generation;
    payload["pid"] = record.pid;
    return payload;
}

core::errors::Result<LockRecord> lock_record_from_json(const json& doc) {
    if (!doc.is_object()) {
        return malformed("root is not an object");
    }
    if (!doc.contains("holder_id") || !doc.at("holder_id").is_string()) {
        return malformed("missing holder_id");
    }
    if (!doc.contains("last_heartbeat_ms") || !doc.at("last_heartbeat_ms").is_number()) {
        return malformed("missing last_heartbeat_ms");
    }

    LockRecord record;
    try {
        record.holder_id = doc.at("holder_id").get<std::string>();
        record.last_heartbeat_ms = doc.at("last_heartbeat_ms").get<std::int64_t>();
        record.resource = doc.value("resource", std::string());
        record.acquired_at_ms = doc.value("acquired_at_ms", record.last_heartbeat_ms);
        record.generation = doc.value("generation", static_cast<std::uint64_t>(0));
        record.pid = doc.value("pid", static_cast<std::int64_t>(0));
        if (doc.contains("expires_at_ms") && doc.at("expires_at_ms").is_number()) {
            record.expires_at_ms = doc.at("expires_at_ms").get<std::int64_t>();
        }
    } catch (const json::exception& e) {
        return malformed(e.what());
    }
    return record;
}

json to_json(const ReleaseRequest& request) {
    json payload;
    payload["resource"] = request.resource;
    payload["requester_id"] = request.requester_id;
    payload["original_holder_id"] = request.original_holder_id;
    payload["requested_at_ms"] = request.requested_at_ms;
    payload["expires_at_ms"] = request.expires_at_ms;
    return payload;
}

core::errors::Result<ReleaseRequest> release_request_from_json(const json& doc) {
    if (!doc.is_object() || !doc.contains("original_holder_id") ||
        !doc.at("original_holder_id").is_string()) {
        return malformed("release request without original_holder_id");
    }
    ReleaseRequest request;
    try {
        request.original_holder_id = doc.at("original_holder_id").get<std::string>();
        request.resource = doc.value("resource", std::string());
        request.requester_id = doc.value("requester_id", std::string());
        request.requested_at_ms = doc.value("requested_at_ms", static_cast<std::int64_t>(0));
        request.expires_at_ms = doc.value("expires_at_ms", static_cast<std::int64_t>(0));
    } catch (const json::exception& e) {
        return malformed(e.what());
    }
    return request;
}

bool is_stale(const LockRecord& record, const std::int64_t now_ms,
              const std::uint32_t heartbeat_timeout_ms) {
    if (record.expires_at_ms.has_value() && now_ms > record.expires_at_ms.value()) {
        return true;
    }
    return now_ms - record.last_heartbeat_ms >
           static_cast<std::int64_t>(heartbeat_timeout_ms);
}

bool same_record(const LockRecord& a, const LockRecord& b) {
    return a.holder_id == b.holder_id && a.acquired_at_ms == b.acquired_at_ms &&
           a.last_heartbeat_ms == b.last_heartbeat_ms && a.generation == b.generation;
}

}  // namespace statekeep::lock
