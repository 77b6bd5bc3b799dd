#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace Engine {

namespace {
struct LoggerState {
    std::mutex mutex;
    LogLevel minLevel{LogLevel::Info};
    LogSink sink;
};

LoggerState& state() {
    static LoggerState s;
    return s;
}

std::string timestamp() {
    using namespace std::chrono;

    const auto now = system_clock::now();
    const auto t = system_clock::to_time_t(now);
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}
}  // namespace

std::string_view logLevelLabel(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
        default:
            return "ERROR";
    }
}

std::optional<LogLevel> logLevelFromKey(const std::string& key) {
    std::string k = key;
    std::transform(k.begin(), k.end(), k.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (k == "debug") return LogLevel::Debug;
    if (k == "info") return LogLevel::Info;
    if (k == "warn" || k == "warning") return LogLevel::Warning;
    if (k == "error") return LogLevel::Error;
    return std::nullopt;
}

void Logger::log(LogLevel level, std::string_view message) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (static_cast<int>(level) < static_cast<int>(s.minLevel)) return;

    if (s.sink) {
        s.sink(level, message);
        return;
    }
    std::ostream& out = (level == LogLevel::Warning || level == LogLevel::Error) ? std::cerr : std::cout;
    out << '[' << timestamp() << "] [" << logLevelLabel(level) << "] " << message << '\n';
}

void Logger::setMinLevel(LogLevel level) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.minLevel = level;
}

LogLevel Logger::minLevel() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.minLevel;
}

void Logger::setSink(LogSink sink) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.sink = std::move(sink);
}

void Logger::resetSink() { setSink(nullptr); }

}  // namespace Engine
