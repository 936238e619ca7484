#pragma once

#include <atomic>
#include <cstdio>
#include <mutex>
#include <sstream>
#include <string>

namespace apisim {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel level) { level_.store(level, std::memory_order_relaxed); }
    LogLevel GetLevel() const { return level_.load(std::memory_order_relaxed); }
    // Unknown names map to INFO. Matching is case-insensitive.
    static LogLevel ParseLevel(const std::string& levelStr);
    static const char* LevelName(LogLevel level);

    // Colors are enabled by default only when the sink is a terminal.
    void SetSink(std::FILE* sink);
    void SetColor(bool on);

    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::mutex mutex_;
    std::FILE* sink_;
    bool color_;
};

// Stream wrapper to allow usage like: LOG_INFO << "Message " << 123;
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line)
        : level_(level), file_(file), line_(line) {}

    ~LogStream() {
        Logger::Instance().Log(level_, file_, line_, ss_.str());
    }

    template <typename T>
    LogStream& operator<<(const T& val) {
        ss_ << val;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    std::stringstream ss_;
};

} // namespace common
} // namespace apisim

#define LOG_DEBUG \
    if (apisim::common::LogLevel::DEBUG >= apisim::common::Logger::Instance().GetLevel()) \
    apisim::common::LogStream(apisim::common::LogLevel::DEBUG, __FILE__, __LINE__)

#define LOG_INFO \
    if (apisim::common::LogLevel::INFO >= apisim::common::Logger::Instance().GetLevel()) \
    apisim::common::LogStream(apisim::common::LogLevel::INFO, __FILE__, __LINE__)

#define LOG_WARN \
    if (apisim::common::LogLevel::WARN >= apisim::common::Logger::Instance().GetLevel()) \
    apisim::common::LogStream(apisim::common::LogLevel::WARN, __FILE__, __LINE__)

#define LOG_ERROR \
    if (apisim::common::LogLevel::ERROR >= apisim::common::Logger::Instance().GetLevel()) \
    apisim::common::LogStream(apisim::common::LogLevel::ERROR, __FILE__, __LINE__)

#define LOG_FATAL \
    if (apisim::common::LogLevel::FATAL >= apisim::common::Logger::Instance().GetLevel()) \
    apisim::common::LogStream(apisim::common::LogLevel::FATAL, __FILE__, __LINE__)
