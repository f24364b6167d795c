#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/state_errors.hpp"

namespace statekeep::core::config {

// Plain configuration for one coordination core. Loading it from the
// command line or environment is left to the surrounding tooling.
struct CoreConfig {
    // Root of all persisted project state.
    std::filesystem::path base_path = ".statekeep";

    // Longest a writer waits for a section lock before failing transiently.
    std::uint32_t lock_timeout_ms = 5000;
    std::uint32_t lock_retry_attempts = 10;
    std::uint32_t lock_retry_delay_ms = 100;
    std::uint32_t lock_retry_max_delay_ms = 1000;

    bool enable_heartbeat = true;
    std::uint32_t heartbeat_interval_ms = 1000;
    // No heartbeat for longer than this and the lock is presumed abandoned.
    std::uint32_t heartbeat_timeout_ms = 3000;
    // 0 leaves expires_at unset on lock records.
    std::uint32_t lock_expiry_ms = 0;

    // Ask a stale holder to yield before moving its lock aside.
    bool cooperative_release = true;
    std::uint32_t cooperative_release_timeout_ms = 1000;

    // Per-operation circuit breaker consulted before every retry attempt.
    bool enable_circuit_breaker = false;
    std::uint32_t circuit_failure_threshold = 5;
    std::uint32_t circuit_reset_timeout_ms = 60000;
    std::uint32_t circuit_half_open_max_attempts = 3;

    std::size_t max_history_entries = 50;
    std::size_t max_checkpoints = 10;
    std::size_t max_audit_entries = 100;
};

core::errors::Status validate(const CoreConfig& config);

// Reads a JSON object whose keys mirror CoreConfig's fields. Missing keys
// keep their defaults.
core::errors::Result<CoreConfig> load_config_file(const std::filesystem::path& path);

core::errors::Result<CoreConfig> parse_config(const std::string& json_text);

std::string to_json_string(const CoreConfig& config);

}  // namespace statekeep::core::config
