#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace trayctx {

enum class LogLevel : std::uint8_t {
    TRACE = 0,
    DEBUG,
    INFO,
    WARN,
    ERR
};

struct LogMessage {
    LogLevel level;
    std::string timestamp;
    std::string thread;
    std::string message;
};

class Logger {
public:
    static Logger& get();

    bool should_log(LogLevel level) const;
    void log(LogLevel level, const std::string& msg);
    std::vector<LogMessage> get_recent_logs(size_t count = 100);
    void set_level(LogLevel level);
    // Stops echoing to stderr; the ring buffer keeps recording.
    void set_quiet(bool quiet);

    // Names the calling thread in subsequent log lines ("pump", "main").
    static void set_thread_name(const std::string& name);

private:
    Logger() = default;
    mutable std::mutex mu_;
    LogLevel min_level_ = LogLevel::INFO;
    bool quiet_ = false;
    std::vector<LogMessage> buffer_;
    static constexpr size_t MAX_LOGS = 256;
};

std::optional<LogLevel> parse_log_level(const std::string& name);

#define TRAYCTX_LOG_AT_LEVEL(level, msg) \
    do { if (trayctx::Logger::get().should_log(level)) trayctx::Logger::get().log(level, msg); } while(0)

#define TRAYCTX_LOG_TRACE(msg) TRAYCTX_LOG_AT_LEVEL(trayctx::LogLevel::TRACE, msg)
#define TRAYCTX_LOG_DEBUG(msg) TRAYCTX_LOG_AT_LEVEL(trayctx::LogLevel::DEBUG, msg)
#define TRAYCTX_LOG_INFO(msg)  TRAYCTX_LOG_AT_LEVEL(trayctx::LogLevel::INFO, msg)
#define TRAYCTX_LOG_WARN(msg)  TRAYCTX_LOG_AT_LEVEL(trayctx::LogLevel::WARN, msg)
#define TRAYCTX_LOG_ERROR(msg) TRAYCTX_LOG_AT_LEVEL(trayctx::LogLevel::ERR, msg)

} // namespace trayctx
