/**
 * @file log_tail.hpp
 * @brief Follows the cluster node's log file and turns new lines into LogEntry values.
 *
 * Only lines of the form `YYYY-MM-DD HH:MM:SS - LEVEL: message` are reported.
 * Reading starts at the end of the file as it exists when start() is called.
 * A file that shrinks is treated as rotated and is re-read from the start.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace exo_watch {

/// Parse one log line; nullopt for anything that is not a recognizable entry.
[[nodiscard]] std::optional<LogEntry> parse_log_line(std::string_view line);

using LogEntryCallback = std::function<void(const LogEntry&)>;

class LogTail {
public:
    static constexpr uint32_t DEFAULT_POLL_MS = 500;
    static constexpr size_t MAX_LINE_BYTES = 64 * 1024;
    static constexpr size_t READ_BLOCK_BYTES = 64 * 1024;

    explicit LogTail(std::filesystem::path path,
                     uint32_t poll_interval_ms = DEFAULT_POLL_MS,
                     std::shared_ptr<Logger> logger = nullptr);
    ~LogTail();

    // Non-copyable
    LogTail(const LogTail&) = delete;
    LogTail& operator=(const LogTail&) = delete;

    /// Skip whatever the file already holds and begin following it.
    void start();
    void stop();

    /// Position at the current end of file without starting the thread.
    void seek_to_end();

    /**
     * @brief Read any bytes appended since the last call.
     * @return Number of entries delivered to callbacks.
     */
    size_t poll_once();

    void on_entry(LogEntryCallback callback);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    void follow_loop(std::stop_token stop);
    /// Split `bytes` into lines, carrying an unterminated tail in partial_.
    void consume(std::string_view bytes, std::vector<LogEntry>& entries);

    std::filesystem::path path_;
    uint32_t interval_ms_;
    std::shared_ptr<Logger> logger_;

    std::mutex read_mutex_;
    uint64_t offset_{0};
    std::string partial_;
    bool discarding_{false};            ///< Inside an over-long line
    bool missing_reported_{false};

    std::mutex callbacks_mutex_;
    std::vector<LogEntryCallback> callbacks_;

    std::jthread follow_thread_;
};

}  // namespace exo_watch
