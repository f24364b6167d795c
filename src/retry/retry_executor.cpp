#include "retry/retry_executor.hpp"

#include <thread>

namespace statekeep::retry {

std::string describe_attempts(const std::vector<AttemptRecord>& attempts) {
    std::string text;
    for (const auto& record : attempts) {
        if (!text.empty()) {
            text += "; ";
        }
        text += "#" + std::to_string(record.attempt) + " ";
        if (record.succeeded) {
            text += "ok";
            continue;
        }
        text += record.code + " " + core::errors::to_string(record.category);
        if (record.remediated) {
            text += " remediated";
        }
        if (record.delay_before_next.count() > 0) {
            text += " wait=" + std::to_string(record.delay_before_next.count()) + "ms";
        }
    }
    return text;
}

SleepFunction real_sleep() {
    return [](const std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

}  // namespace statekeep::retry
