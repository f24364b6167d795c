#include "core/io/atomic_file.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unistd.h>
#include "core/config/ids.hpp"

namespace statekeep::core::io {

using core::errors::ErrorCategory;
using core::errors::StateError;
namespace codes = core::errors::codes;

namespace {

StateError io_error(const std::string& message, const std::filesystem::path& path,
                    const int err) {
    auto error = core::errors::make_error(
        ErrorCategory::Transient, codes::kIoError,
        message + ": " + std::strerror(err), {{"path", path.string()}});
    return error;
}

bool write_all(const int fd, const std::string& content) {
    std::size_t written = 0;
    while (written < content.size()) {
        const ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}

void sync_directory(const std::filesystem::path& dir) {
    const int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dir_fd < 0) {
        return;
    }
    // Best effort: some filesystems refuse fsync on directories.
    static_cast<void>(::fsync(dir_fd));
    static_cast<void>(::close(dir_fd));
}

}  // namespace

core::errors::Status write_file_atomic(const std::filesystem::path& target,
                                       const std::string& content) {
    std::error_code ec;
    const auto parent = target.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return io_error("Unable to create directory", parent, ec.value());
        }
    }

    const std::filesystem::path temp_path =
        target.string() + "." + core::config::generate_id("w") + ".tmp";

    const int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        return io_error("Unable to create temporary file", temp_path, errno);
    }

    if (!write_all(fd, content)) {
        const int err = errno;
        static_cast<void>(::close(fd));
        static_cast<void>(::unlink(temp_path.c_str()));
        return io_error("Unable to write temporary file", temp_path, err);
    }
    if (::fsync(fd) != 0) {
        const int err = errno;
        static_cast<void>(::close(fd));
        static_cast<void>(::unlink(temp_path.c_str()));
        return io_error("Unable to flush temporary file", temp_path, err);
    }
    if (::close(fd) != 0) {
        const int err = errno;
        static_cast<void>(::unlink(temp_path.c_str()));
        return io_error("Unable to close temporary file", temp_path, err);
    }

    if (::rename(temp_path.c_str(), target.c_str()) != 0) {
        const int err = errno;
        static_cast<void>(::unlink(temp_path.c_str()));
        return io_error("Unable to rename temporary file into place", target, err);
    }

    if (!parent.empty()) {
        sync_directory(parent);
    }
    return core::errors::ok();
}

core::errors::Status write_json_atomic(const std::filesystem::path& target,
                                       const nlohmann::json& value) {
    return write_file_atomic(target, value.dump(2) + "\n");
}

core::errors::Result<std::optional<std::string>> read_text_file(
    const std::filesystem::path& path, const bool allow_missing) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        const int err = errno;
        std::error_code ec;
        const bool exists = std::filesystem::exists(path, ec);
        if (!exists && !ec) {
            if (allow_missing) {
                return std::optional<std::string>{};
            }
            return io_error("File does not exist", path, ENOENT);
        }
        return io_error("Unable to open file", path, err);
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return io_error("Unable to read file", path, errno);
    }
    return std::optional<std::string>(buffer.str());
}

core::errors::Result<std::optional<nlohmann::json>> read_json_file(
    const std::filesystem::path& path, const bool allow_missing) {
    auto text_result = read_text_file(path, allow_missing);
    if (core::errors::is_error(text_result)) {
        return core::errors::get_error(text_result);
    }
    const auto& text = core::errors::get_value(text_result);
    if (!text.has_value()) {
        return std::optional<nlohmann::json>{};
    }

    try {
        return std::optional<nlohmann::json>(nlohmann::json::parse(text.value()));
    } catch (const nlohmann::json::parse_error& e) {
        return core::errors::make_error(
            ErrorCategory::Fatal, codes::kCorruptRecord,
            std::string("Record is not valid JSON: ") + e.what(),
            {{"path", path.string()}}, core::errors::Severity::High);
    }
}

}  // namespace statekeep::core::io
