/**
 * @file log_tail.cpp
 * @brief LogTail implementation: size-polling file follower.
 */

#include "logs/log_tail.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <fstream>

namespace exo_watch {

namespace {

constexpr std::string_view COMPONENT = "logs.tail";
constexpr std::string_view SEPARATOR = " - ";
constexpr size_t TIMESTAMP_LEN = 19;  // "YYYY-MM-DD HH:MM:SS"

std::string upper(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::optional<Timestamp> parse_timestamp(std::string_view text) {
    std::tm tm{};
    std::string buf(text);
    const char* end = ::strptime(buf.c_str(), "%Y-%m-%d %H:%M:%S", &tm);
    if (end == nullptr || *end != '\0') return std::nullopt;
    tm.tm_isdst = -1;  // log files are written in local time
    std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return std::chrono::system_clock::from_time_t(t);
}

}  // anonymous namespace

std::optional<LogEntry> parse_log_line(std::string_view line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }
    if (line.size() < TIMESTAMP_LEN + SEPARATOR.size()) return std::nullopt;
    if (line.substr(TIMESTAMP_LEN, SEPARATOR.size()) != SEPARATOR) return std::nullopt;

    auto ts = parse_timestamp(line.substr(0, TIMESTAMP_LEN));
    if (!ts) return std::nullopt;

    auto rest = line.substr(TIMESTAMP_LEN + SEPARATOR.size());
    auto colon = rest.find(": ");
    if (colon == std::string_view::npos || colon == 0) return std::nullopt;

    LogEntry entry;
    entry.timestamp = *ts;
    entry.level = std::string(rest.substr(0, colon));
    entry.message = std::string(rest.substr(colon + 2));

    const auto level = upper(entry.level);
    entry.is_error = level.find("ERROR") != std::string::npos
                  || level.find("CRITICAL") != std::string::npos;
    return entry;
}

// ─────────────────────────────────────────────
// LogTail
// ─────────────────────────────────────────────

LogTail::LogTail(std::filesystem::path path, uint32_t poll_interval_ms, std::shared_ptr<Logger> logger)
    : path_(std::move(path)), interval_ms_(poll_interval_ms), logger_(std::move(logger)) {}

LogTail::~LogTail() {
    stop();
}

void LogTail::start() {
    if (follow_thread_.joinable()) return;
    seek_to_end();
    follow_thread_ = std::jthread([this](std::stop_token stop) {
        follow_loop(stop);
    });
    if (logger_) {
        logger_->info(COMPONENT, "Following " + path_.string());
    }
}

void LogTail::stop() {
    if (follow_thread_.joinable()) {
        follow_thread_.request_stop();
        follow_thread_.join();
    }
}

void LogTail::seek_to_end() {
    std::lock_guard lock(read_mutex_);
    std::error_code ec;
    auto size = std::filesystem::file_size(path_, ec);
    offset_ = ec ? 0 : size;
    partial_.clear();
    discarding_ = false;
}

void LogTail::on_entry(LogEntryCallback callback) {
    std::lock_guard lock(callbacks_mutex_);
    callbacks_.push_back(std::move(callback));
}

size_t LogTail::poll_once() {
    std::vector<LogEntry> entries;
    {
        std::lock_guard lock(read_mutex_);

        std::error_code ec;
        auto size = std::filesystem::file_size(path_, ec);
        if (ec) {
            if (!missing_reported_ && logger_) {
                logger_->warn(COMPONENT, "Log file unavailable: " + path_.string());
            }
            missing_reported_ = true;
            offset_ = 0;
            partial_.clear();
            discarding_ = false;
            return 0;
        }
        missing_reported_ = false;

        if (size < offset_) {
            if (logger_) {
                logger_->info(COMPONENT, "Log file truncated, rereading " + path_.string());
            }
            offset_ = 0;
            partial_.clear();
            discarding_ = false;
        }
        if (size == offset_) return 0;

        std::ifstream ifs(path_, std::ios::binary);
        if (!ifs.is_open()) return 0;
        ifs.seekg(static_cast<std::streamoff>(offset_));

        std::vector<char> block(READ_BLOCK_BYTES);
        while (offset_ < size) {
            auto want = std::min<uint64_t>(READ_BLOCK_BYTES, size - offset_);
            ifs.read(block.data(), static_cast<std::streamsize>(want));
            auto got = ifs.gcount();
            if (got <= 0) break;
            offset_ += static_cast<uint64_t>(got);
            consume(std::string_view(block.data(), static_cast<size_t>(got)), entries);
        }
    }

    if (entries.empty()) return 0;

    std::vector<LogEntryCallback> callbacks;
    {
        std::lock_guard lock(callbacks_mutex_);
        callbacks = callbacks_;
    }
    for (const auto& entry : entries) {
        for (const auto& cb : callbacks) {
            cb(entry);
        }
    }
    return entries.size();
}

void LogTail::consume(std::string_view bytes, std::vector<LogEntry>& entries) {
    if (discarding_) {
        auto nl = bytes.find('\n');
        if (nl == std::string_view::npos) return;
        bytes.remove_prefix(nl + 1);
        discarding_ = false;
    }

    partial_.append(bytes);
    size_t start = 0;
    for (auto nl = partial_.find('\n'); nl != std::string::npos; nl = partial_.find('\n', start)) {
        auto parsed = parse_log_line(std::string_view(partial_).substr(start, nl - start));
        if (parsed) entries.push_back(std::move(*parsed));
        start = nl + 1;
    }
    partial_.erase(0, start);

    // An unterminated run this long is not a log line; skip to the next newline.
    if (partial_.size() > MAX_LINE_BYTES) {
        if (logger_) {
            logger_->warn(COMPONENT, "Discarding over-long line in " + path_.string());
        }
        partial_.clear();
        discarding_ = true;
    }
}

void LogTail::follow_loop(std::stop_token stop) {
    std::mutex wait_mutex;
    std::condition_variable_any wait_cv;

    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(wait_mutex);
            wait_cv.wait_for(lock, stop, std::chrono::milliseconds(interval_ms_), [] { return false; });
        }
        if (stop.stop_requested()) break;
        poll_once();
    }
}

}  // namespace exo_watch
