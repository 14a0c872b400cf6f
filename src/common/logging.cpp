/**
 * Ring-buffer logging implementation
 */

#include <chrono>
#include <thread>
#include <fstream>
#include <iostream>
#include <string>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include "market_signals/common/logging.h"

namespace market_signals {
namespace common {

// Global logger instance
RingLogger g_logger("market_signals");

RingLogger::RingLogger(const std::string& name, LogLevel level)
    : name_(name),
      level_(level) {
    flush_thread_ = std::thread(&RingLogger::flushThreadFunc, this);
}

RingLogger::~RingLogger() {
    running_ = false;
    wake_cv_.notify_all();

    if (flush_thread_.joinable()) {
        flush_thread_.join();
    }

    flush();

    std::lock_guard<std::mutex> lock(file_mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

void RingLogger::log(LogLevel level, const std::string& message) {
    if (level < level_.load()) {
        return;
    }

    uint64_t now = getCurrentNanoTime();
    uint32_t thread_id = static_cast<uint32_t>(
        std::hash<std::thread::id>{}(std::this_thread::get_id()));

    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);

        // Oldest unflushed entry gets overwritten when the ring is full
        if (write_index_ - read_index_ >= BUFFER_SIZE) {
            ++read_index_;
            dropped_.fetch_add(1);
        }

        LogEntry& entry = buffer_[write_index_ % BUFFER_SIZE];
        entry.timestamp = now;
        entry.level = level;
        entry.thread_id = thread_id;
        std::strncpy(entry.message, message.c_str(), sizeof(entry.message) - 1);
        entry.message[sizeof(entry.message) - 1] = '\0';
        ++write_index_;
    }

    if (console_ && level >= LogLevel::WARNING) {
        std::cerr << "[" << logLevelToString(level) << "] " << message << std::endl;
    }

    if (level >= LogLevel::ERROR) {
        wake_cv_.notify_one();
    }
}

void RingLogger::setLevel(const std::string& level_str) {
    level_ = stringToLogLevel(level_str);
}

void RingLogger::setLevel(LogLevel level) {
    level_ = level;
}

void RingLogger::open(const std::string& path) {
    flush();

    std::lock_guard<std::mutex> lock(file_mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    if (path.empty()) {
        return;
    }

    file_.open(path, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "Failed to open log file " << path << ", logging to stderr only" << std::endl;
    }
}

void RingLogger::flush() {
    std::lock_guard<std::mutex> file_lock(file_mutex_);

    // Drain a copy of the pending range so writers are not blocked on disk I/O
    std::array<LogEntry, 64> batch;
    while (true) {
        size_t count = 0;
        {
            std::lock_guard<std::mutex> lock(buffer_mutex_);
            while (read_index_ < write_index_ && count < batch.size()) {
                batch[count++] = buffer_[read_index_ % BUFFER_SIZE];
                ++read_index_;
            }
        }

        if (count == 0) {
            break;
        }

        if (file_.is_open()) {
            for (size_t i = 0; i < count; ++i) {
                writeEntry(file_, batch[i]);
            }
        }
    }

    if (file_.is_open()) {
        file_.flush();
    }
}

LogLevel RingLogger::stringToLogLevel(const std::string& level_str) {
    std::string upper = level_str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") {
        return LogLevel::DEBUG;
    } else if (upper == "INFO") {
        return LogLevel::INFO;
    } else if (upper == "WARNING" || upper == "WARN") {
        return LogLevel::WARNING;
    } else if (upper == "ERROR") {
        return LogLevel::ERROR;
    } else if (upper == "CRITICAL") {
        return LogLevel::CRITICAL;
    } else {
        return LogLevel::INFO;  // Default to INFO
    }
}

const char* RingLogger::logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

void RingLogger::flushThreadFunc() {
    while (running_) {
        flush();

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, std::chrono::milliseconds(1000),
                          [this]() { return !running_; });
    }
}

void RingLogger::writeEntry(std::ostream& out, const LogEntry& entry) {
    auto ns = std::chrono::nanoseconds(entry.timestamp);
    auto time_point = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(ns));
    std::time_t time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ns).count() % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);

    out << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms
        << " [" << logLevelToString(entry.level) << "] "
        << "[" << name_ << ":" << entry.thread_id << "] "
        << entry.message << '\n';
}

uint64_t RingLogger::getCurrentNanoTime() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        now.time_since_epoch()).count();
}

} // namespace common
} // namespace market_signals
