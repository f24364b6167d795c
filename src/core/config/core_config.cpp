#include "core/config/core_config.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <nlohmann/json.hpp>

namespace statekeep::core::config {

using core::errors::ErrorCategory;
using core::errors::StateError;
using nlohmann::json;
namespace codes = core::errors::codes;

namespace {

StateError config_error(const std::string& message, const std::string& key = "") {
    auto error = core::errors::make_error(ErrorCategory::Fatal, codes::kConfigInvalid,
                                          message);
    if (!key.empty()) {
        error.context["key"] = key;
    }
    return error;
}

template <typename T>
core::errors::Status read_unsigned(const json& doc, const char* key, T& out) {
    if (!doc.contains(key)) {
        return core::errors::ok();
    }
    const auto& value = doc.at(key);
    if (!value.is_number_integer() || value.get<std::int64_t>() < 0) {
        return config_error(std::string("Expected a non-negative integer for ") + key,
                            key);
    }
    const auto raw = value.get<std::uint64_t>();
    if (raw > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
        return config_error(std::string("Value out of range for ") + key, key);
    }
    out = static_cast<T>(raw);
    return core::errors::ok();
}

core::errors::Status read_bool(const json& doc, const char* key, bool& out) {
    if (!doc.contains(key)) {
        return core::errors::ok();
    }
    const auto& value = doc.at(key);
    if (!value.is_boolean()) {
        return config_error(std::string("Expected a boolean for ") + key, key);
    }
    out = value.get<bool>();
    return core::errors::ok();
}

}  // namespace

core::errors::Status validate(const CoreConfig& config) {
    if (config.base_path.empty()) {
        return config_error("base_path cannot be empty.", "base_path");
    }
    if (config.lock_timeout_ms == 0) {
        return config_error("lock_timeout_ms must be positive.", "lock_timeout_ms");
    }
    if (config.lock_retry_attempts == 0) {
        return config_error("lock_retry_attempts must be positive.",
                            "lock_retry_attempts");
    }
    if (config.lock_retry_max_delay_ms < config.lock_retry_delay_ms) {
        return config_error("lock_retry_max_delay_ms must be >= lock_retry_delay_ms.",
                            "lock_retry_max_delay_ms");
    }
    if (config.heartbeat_interval_ms == 0) {
        return config_error("heartbeat_interval_ms must be positive.",
                            "heartbeat_interval_ms");
    }
    if (config.heartbeat_interval_ms >= config.heartbeat_timeout_ms) {
        return config_error("heartbeat_interval_ms must be below heartbeat_timeout_ms.",
                            "heartbeat_interval_ms");
    }
    // A silent stale holder must be reclaimable within one acquire.
    if (config.cooperative_release &&
        config.cooperative_release_timeout_ms >= config.lock_timeout_ms) {
        return config_error("cooperative_release_timeout_ms must be below lock_timeout_ms.",
                            "cooperative_release_timeout_ms");
    }
    if (config.enable_circuit_breaker) {
        if (config.circuit_failure_threshold == 0) {
            return config_error("circuit_failure_threshold must be at least 1.",
                                "circuit_failure_threshold");
        }
        if (config.circuit_half_open_max_attempts == 0) {
            return config_error("circuit_half_open_max_attempts must be at least 1.",
                                "circuit_half_open_max_attempts");
        }
    }
    if (config.max_history_entries == 0) {
        return config_error("max_history_entries must be at least 1.",
                            "max_history_entries");
    }
    if (config.max_checkpoints == 0) {
        return config_error("max_checkpoints must be at least 1.", "max_checkpoints");
    }
    if (config.max_audit_entries == 0) {
        return config_error("max_audit_entries must be at least 1.",
                            "max_audit_entries");
    }
    return core::errors::ok();
}

core::errors::Result<CoreConfig> parse_config(const std::string& json_text) {
    json doc;
    try {
        doc = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return config_error(std::string("Config is not valid JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        return config_error("Config root must be a JSON object.");
    }

    CoreConfig config;
    if (doc.contains("base_path")) {
        if (!doc.at("base_path").is_string()) {
            return config_error("Expected a string for base_path", "base_path");
        }
        config.base_path = doc.at("base_path").get<std::string>();
    }

    const core::errors::Status steps[] = {
        read_unsigned(doc, "lock_timeout_ms", config.lock_timeout_ms),
        read_unsigned(doc, "lock_retry_attempts", config.lock_retry_attempts),
        read_unsigned(doc, "lock_retry_delay_ms", config.lock_retry_delay_ms),
        read_unsigned(doc, "lock_retry_max_delay_ms", config.lock_retry_max_delay_ms),
        read_bool(doc, "enable_heartbeat", config.enable_heartbeat),
        read_unsigned(doc, "heartbeat_interval_ms", config.heartbeat_interval_ms),
        read_unsigned(doc, "heartbeat_timeout_ms", config.heartbeat_timeout_ms),
        read_unsigned(doc, "lock_expiry_ms", config.lock_expiry_ms),
        read_bool(doc, "cooperative_release", config.cooperative_release),
        read_unsigned(doc, "cooperative_release_timeout_ms",
                      config.cooperative_release_timeout_ms),
        read_bool(doc, "enable_circuit_breaker", config.enable_circuit_breaker),
        read_unsigned(doc, "circuit_failure_threshold", config.circuit_failure_threshold),
        read_unsigned(doc, "circuit_reset_timeout_ms", config.circuit_reset_timeout_ms),
        read_unsigned(doc, "circuit_half_open_max_attempts",
                      config.circuit_half_open_max_attempts),
        read_unsigned(doc, "max_history_entries", config.max_history_entries),
        read_unsigned(doc, "max_checkpoints", config.max_checkpoints),
        read_unsigned(doc, "max_audit_entries", config.max_audit_entries),
    };
    for (const auto& step : steps) {
        if (core::errors::is_error(step)) {
            return core::errors::get_error(step);
        }
    }

    auto valid = validate(config);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }
    return config;
}

core::errors::Result<CoreConfig> load_config_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return config_error("Unable to open config file: " + path.string(), "path");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse_config(buffer.str());
}

std::string to_json_string(const CoreConfig& config) {
    json doc;
    doc["base_path"] = config.base_path.string();
    doc["lock_timeout_ms"] = config.lock_timeout_ms;
    doc["lock_retry_attempts"] = config.lock_retry_attempts;
    doc["lock_retry_delay_ms"] = config.lock_retry_delay_ms;
    doc["lock_retry_max_delay_ms"] = config.lock_retry_max_delay_ms;
    doc["enable_heartbeat"] = config.enable_heartbeat;
    doc["heartbeat_interval_ms"] = config.heartbeat_interval_ms;
    doc["heartbeat_timeout_ms"] = config.heartbeat_timeout_ms;
    doc["lock_expiry_ms"] = config.lock_expiry_ms;
    doc["cooperative_release"] = config.cooperative_release;
    doc["cooperative_release_timeout_ms"] = config.cooperative_release_timeout_ms;
    doc["enable_circuit_breaker"] = config.enable_circuit_breaker;
    doc["circuit_failure_threshold"] = config.circuit_failure_threshold;
    doc["circuit_reset_timeout_ms"] = config.circuit_reset_timeout_ms;
    doc["circuit_half_open_max_attempts"] = config.circuit_half_open_max_attempts;
    doc["max_history_entries"] = config.max_history_entries;
    doc["max_checkpoints"] = config.max_checkpoints;
    doc["max_audit_entries"] = config.max_audit_entries;
    return doc.dump(2);
}

}  // namespace statekeep::core::config
