/**
 * @file error_latch.hpp
 * @brief Records the most recent failure of a background loop and logs it once per streak.
 *
 * Long-running loops (UDP receive, broadcast send, event fan-out) can fail
 * repeatedly for the same reason. The latch logs the first failure of a
 * streak, stays quiet until a success clears the streak, and always keeps
 * the latest error readable through last().
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace exo_watch {

class ErrorLatch {
public:
    ErrorLatch(std::shared_ptr<Logger> logger, std::string component)
        : logger_(std::move(logger)), component_(std::move(component)) {}

    /// Record a failure; logs at error level only if no streak is active.
    void report(const Error& error) {
        bool first = false;
        {
            std::lock_guard lock(mutex_);
            last_ = error;
            ++count_;
            first = !streak_;
            streak_ = true;
        }
        if (first && logger_) {
            logger_->error(component_, std::string(to_string(error.kind)) + ": " + error.message);
        }
    }

    /// Mark a success, ending the current failure streak.
    void clear_streak() {
        std::lock_guard lock(mutex_);
        streak_ = false;
    }

    [[nodiscard]] std::optional<Error> last() const {
        std::lock_guard lock(mutex_);
        return last_;
    }

    [[nodiscard]] uint64_t count() const {
        std::lock_guard lock(mutex_);
        return count_;
    }

private:
    std::shared_ptr<Logger> logger_;
    std::string component_;
    mutable std::mutex mutex_;
    std::optional<Error> last_;
    uint64_t count_{0};
    bool streak_{false};
};

}  // namespace exo_watch
