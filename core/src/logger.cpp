#include "trayctx/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#endif

namespace trayctx {

namespace {
thread_local std::string t_thread_name;
}

static std::string level_to_str(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERR:   return "ERROR";
        default: return "UNKNOWN";
    }
}

Logger& Logger::get() {
    static Logger instance;
    return instance;
}

bool Logger::should_log(LogLevel level) const {
    std::lock_guard<std::mutex> lk(mu_);
    return level >= min_level_;
}

void Logger::log(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lk(mu_);

    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &in_time_t);
#else
    localtime_r(&in_time_t, &tm_buf);
#endif

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %X");
    std::string ts = ss.str();

    std::string thread = t_thread_name.empty() ? "-" : t_thread_name;
    std::string formatted = "[" + ts + "] [" + level_to_str(level) + "] [" + thread + "] " + msg;

    if (level >= min_level_) {
        if (!quiet_) std::cerr << formatted << std::endl;
#ifdef _WIN32
        std::string win_msg = formatted + "\n";
        OutputDebugStringA(win_msg.c_str());
#endif
    }

    LogMessage lm{level, ts, thread, msg};
    buffer_.push_back(lm);
    if (buffer_.size() > MAX_LOGS) {
        buffer_.erase(buffer_.begin());
    }
}

std::vector<LogMessage> Logger::get_recent_logs(size_t count) {
    std::lock_guard<std::mutex> lk(mu_);
    if (count >= buffer_.size()) return buffer_;
    return std::vector<LogMessage>(buffer_.end() - count, buffer_.end());
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lk(mu_);
    min_level_ = level;
}

void Logger::set_quiet(bool quiet) {
    std::lock_guard<std::mutex> lk(mu_);
    quiet_ = quiet;
}

void Logger::set_thread_name(const std::string& name) {
    t_thread_name = name;
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    if (s == "trace") return LogLevel::TRACE;
    if (s == "debug") return LogLevel::DEBUG;
    if (s == "info") return LogLevel::INFO;
    if (s == "warn" || s == "warning") return LogLevel::WARN;
    if (s == "error") return LogLevel::ERR;
    return std::nullopt;
}

} // namespace trayctx
