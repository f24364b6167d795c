#pragma once
#include <chrono>
#include <cstdint>
#include <random>
#include <sstream>
#include <string>

namespace statekeep::core::config {

    // Random hex id with a readable prefix, e.g. "holder-3fa09c1e".
    inline std::string generate_id(const std::string& prefix, int hex_digits = 8) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < hex_digits; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    inline std::string generate_holder_id() {
        return generate_id("holder", 12);
    }

    inline std::int64_t now_unix_ms() {
        const auto now = std::chrono::system_clock::now();
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch())
                            .count();
        return static_cast<std::int64_t>(ms);
    }

} // namespace statekeep::core::config
