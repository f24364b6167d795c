#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/state_errors.hpp"

namespace statekeep::core::io {

// Writes `content` to a unique temporary sibling, fsyncs it, then renames it
// over `target`. Readers see either the old file or the new one.
core::errors::Status write_file_atomic(const std::filesystem::path& target,
                                       const std::string& content);

core::errors::Status write_json_atomic(const std::filesystem::path& target,
                                       const nlohmann::json& value);

// Missing file: nullopt when allow_missing, otherwise fs.io_error.
// Unparseable content: state.corrupt_record.
core::errors::Result<std::optional<nlohmann::json>> read_json_file(
    const std::filesystem::path& path, bool allow_missing);

core::errors::Result<std::optional<std::string>> read_text_file(
    const std::filesystem::path& path, bool allow_missing);

}  // namespace statekeep::core::io
