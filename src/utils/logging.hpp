#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace osintpipe::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> ParseLogLevel(const std::string& value);

struct LogMessage {
    LogLevel level;
    std::string component;
    std::string message;
    std::vector<std::pair<std::string, std::string>> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void SetLogConfig(const LogConfig& config);
bool ShouldLog(LogLevel level);

// Writes "[component] message key=value ..." to stderr; one line per call.
void Log(const LogMessage& msg);

inline void Log(LogLevel level,
                std::string component,
                std::string message,
                std::vector<std::pair<std::string, std::string>> fields = {}) {
    if (!ShouldLog(level)) {
        return;
    }
    Log(LogMessage{level, std::move(component), std::move(message), std::move(fields)});
}

}  // namespace osintpipe::utils
