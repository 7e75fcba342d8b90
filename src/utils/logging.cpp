#include "utils/logging.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>

#include "utils/common.hpp"

namespace osintpipe::utils {
namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};

std::mutex& OutputMutex() {
    static std::mutex mutex;
    return mutex;
}

bool NeedsQuoting(const std::string& value) {
    return value.empty() || value.find_first_of(" \t\n\"=") != std::string::npos;
}

}  // namespace

std::optional<LogLevel> ParseLogLevel(const std::string& value) {
    const auto lowered = ToLower(Trim(value));
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return std::nullopt;
}

void SetLogConfig(const LogConfig& config) {
    g_min_level.store(static_cast<int>(config.min_level));
}

bool ShouldLog(LogLevel level) {
    return static_cast<int>(level) >= g_min_level.load();
}

void Log(const LogMessage& msg) {
    if (!ShouldLog(msg.level)) {
        return;
    }
    std::ostringstream line;
    line << "[" << msg.component << "] ";
    if (msg.level == LogLevel::kWarn || msg.level == LogLevel::kError) {
        line << ToString(msg.level) << " ";
    }
    line << msg.message;
    for (const auto& [key, value] : msg.fields) {
        line << " " << key << "=";
        if (NeedsQuoting(value)) {
            line << '"' << value << '"';
        } else {
            line << value;
        }
    }
    std::lock_guard<std::mutex> lock(OutputMutex());
    std::cerr << line.str() << std::endl;
}

}  // namespace osintpipe::utils
