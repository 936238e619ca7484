#include "apisim/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <unistd.h>

namespace apisim {
namespace common {

namespace {

std::string FormatNow() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tmBuf;
    ::localtime_r(&in_time_t, &tmBuf);
    std::ostringstream ss;
    ss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

const char* LevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35m";
    }
    return "\033[0m";
}

// __FILE__ carries the build path; only the file name is useful in a log line.
const char* BaseName(const char* file) {
    const char* slash = std::strrchr(file, '/');
    return slash ? slash + 1 : file;
}

} // namespace

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : sink_(stdout),
      color_(::isatty(STDOUT_FILENO) == 1) {}

void Logger::SetSink(std::FILE* sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink ? sink : stdout;
    color_ = ::isatty(::fileno(sink_)) == 1;
}

void Logger::SetColor(bool on) {
    std::lock_guard<std::mutex> lock(mutex_);
    color_ = on;
}

LogLevel Logger::ParseLevel(const std::string& levelStr) {
    std::string up = levelStr;
    std::transform(up.begin(), up.end(), up.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (up == "DEBUG") return LogLevel::DEBUG;
    if (up == "WARN" || up == "WARNING") return LogLevel::WARN;
    if (up == "ERROR") return LogLevel::ERROR;
    if (up == "FATAL") return LogLevel::FATAL;
    return LogLevel::INFO;
}

const char* Logger::LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
    }
    return "UNKNOWN";
}

void Logger::Log(LogLevel level, const char* file, int line, const std::string& msg) {
    const std::string ts = FormatNow();
    std::lock_guard<std::mutex> lock(mutex_);

    // Format: [Time] [Level] [File:Line] Message
    std::fprintf(sink_, "%s[%s] [%s] [%s:%d] %s%s\n",
                 color_ ? LevelColor(level) : "",
                 ts.c_str(),
                 LevelName(level),
                 BaseName(file),
                 line,
                 msg.c_str(),
                 color_ ? "\033[0m" : "");
    std::fflush(sink_);
}

} // namespace common
} // namespace apisim
