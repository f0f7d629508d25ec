#pragma once

#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace selfrepair::utils {

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

using LogField = std::pair<std::string, std::string>;

struct LogMessage {
    LogLevel level = LogLevel::kInfo;
    std::string tag;
    std::string message;
    std::vector<LogField> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback = LogLevel::kInfo);

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();

std::string FormatLogMessage(const LogMessage& message);
void Log(const LogMessage& message);
void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         std::initializer_list<LogField> fields = {});

}  // namespace selfrepair::utils
