/**
 * Ring-buffer logging for the signal engine
 */

#pragma once

#include <string>
#include <fstream>
#include <thread>
#include <atomic>
#include <array>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <cstdint>

namespace market_signals {
namespace common {

// Log levels
enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

// Log entry structure (pre-allocated)
struct LogEntry {
    uint64_t timestamp;       // Nanoseconds since epoch
    LogLevel level;
    uint32_t thread_id;
    char message[1024];       // Fixed-size message buffer
};

// Logger writing into a fixed ring of entries that a background thread drains to disk
class RingLogger {
public:
    explicit RingLogger(const std::string& name, LogLevel level = LogLevel::INFO);
    ~RingLogger();

    RingLogger(const RingLogger&) = delete;
    RingLogger& operator=(const RingLogger&) = delete;

    // Record a message; entries below the current level are dropped
    void log(LogLevel level, const std::string& message);

    // Set log level
    void setLevel(const std::string& level_str);
    void setLevel(LogLevel level);
    LogLevel getLevel() const { return level_.load(); }

    // Redirect output to a file (appends). Empty path disables file output.
    void open(const std::string& path);

    // Mirror WARNING and above to stderr
    void setConsoleOutput(bool enabled) { console_ = enabled; }

    // Write all pending entries
    void flush();

    // Number of entries overwritten before they could be flushed
    uint64_t droppedCount() const { return dropped_.load(); }

    static LogLevel stringToLogLevel(const std::string& level_str);
    static const char* logLevelToString(LogLevel level);

private:
    static constexpr size_t BUFFER_SIZE = 4096;
    std::array<LogEntry, BUFFER_SIZE> buffer_;
    uint64_t write_index_ = 0;
    uint64_t read_index_ = 0;
    std::mutex buffer_mutex_;

    std::string name_;
    std::atomic<LogLevel> level_;
    std::atomic<bool> console_{true};
    std::atomic<uint64_t> dropped_{0};

    std::ofstream file_;
    std::mutex file_mutex_;

    // Background thread for flushing
    std::thread flush_thread_;
    std::atomic<bool> running_{true};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    void flushThreadFunc();
    void writeEntry(std::ostream& out, const LogEntry& entry);
    static uint64_t getCurrentNanoTime();
};

// Global logger instance
extern RingLogger g_logger;

// Convenience macros
#define LOG_DEBUG(message) ::market_signals::common::g_logger.log(::market_signals::common::LogLevel::DEBUG, message)
#define LOG_INFO(message) ::market_signals::common::g_logger.log(::market_signals::common::LogLevel::INFO, message)
#define LOG_WARNING(message) ::market_signals::common::g_logger.log(::market_signals::common::LogLevel::WARNING, message)
#define LOG_ERROR(message) ::market_signals::common::g_logger.log(::market_signals::common::LogLevel::ERROR, message)
#define LOG_CRITICAL(message) ::market_signals::common::g_logger.log(::market_signals::common::LogLevel::CRITICAL, message)

} // namespace common
} // namespace market_signals
