// Console logger with a level threshold and a replaceable sink.
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace Engine {

enum class LogLevel { Debug, Info, Warning, Error };

using LogSink = std::function<void(LogLevel, std::string_view)>;

class Logger {
public:
    static void log(LogLevel level, std::string_view message);

    static void setMinLevel(LogLevel level);
    static LogLevel minLevel();

    // Routes messages to a custom sink instead of the console.
    static void setSink(LogSink sink);
    static void resetSink();
};

std::string_view logLevelLabel(LogLevel level);
std::optional<LogLevel> logLevelFromKey(const std::string& key);

inline void logDebug(std::string_view msg) { Logger::log(LogLevel::Debug, msg); }
inline void logInfo(std::string_view msg) { Logger::log(LogLevel::Info, msg); }
inline void logWarn(std::string_view msg) { Logger::log(LogLevel::Warning, msg); }
inline void logError(std::string_view msg) { Logger::log(LogLevel::Error, msg); }

}  // namespace Engine
