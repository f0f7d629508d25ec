#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>

namespace selfrepair::utils {
namespace {

std::atomic<LogLevel> g_min_level{LogLevel::kInfo};
std::mutex g_write_mutex;

bool NeedsQuoting(const std::string& value) {
    if (value.empty()) {
        return true;
    }
    return std::any_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c) || c == '"' || c == '=';
    });
}

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
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
    return fallback;
}

void SetLogConfig(const LogConfig& config) {
    g_min_level.store(config.min_level);
}

LogConfig GetLogConfig() {
    LogConfig config{};
    config.min_level = g_min_level.load();
    return config;
}

std::string FormatLogMessage(const LogMessage& message) {
    std::ostringstream line;
    line << "[" << message.tag << "] " << ToString(message.level) << " " << message.message;
    for (const auto& [key, value] : message.fields) {
        line << " " << key << "=";
        if (NeedsQuoting(value)) {
            line << "\"" << value << "\"";
        } else {
            line << value;
        }
    }
    return line.str();
}

void Log(const LogMessage& message) {
    if (static_cast<int>(message.level) < static_cast<int>(g_min_level.load())) {
        return;
    }
    const auto line = FormatLogMessage(message);
    std::lock_guard<std::mutex> guard(g_write_mutex);
    std::cerr << line << std::endl;
}

void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         std::initializer_list<LogField> fields) {
    LogMessage entry{};
    entry.level = level;
    entry.tag = tag;
    entry.message = message;
    entry.fields.assign(fields.begin(), fields.end());
    Log(entry);
}

}  // namespace selfrepair::utils
