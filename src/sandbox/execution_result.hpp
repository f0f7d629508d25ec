#pragma once

#include <chrono>
#include <string>

namespace selfrepair::sandbox {

enum class ExecStatus {
    kPassed,
    kFailed,
    kTimedOut,
    kCrashed
};

inline const char* ToString(ExecStatus status) {
    switch (status) {
        case ExecStatus::kPassed: return "passed";
        case ExecStatus::kFailed: return "failed";
        case ExecStatus::kTimedOut: return "timed_out";
        case ExecStatus::kCrashed: return "crashed";
    }
    return "unknown";
}

struct ExecutionResult {
    ExecStatus status = ExecStatus::kCrashed;
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    std::chrono::milliseconds duration{0};
    bool resource_exceeded = false;
    bool output_truncated = false;
    bool network_isolated = false;

    bool Passed() const { return status == ExecStatus::kPassed; }
    bool TimedOut() const { return status == ExecStatus::kTimedOut; }
};

}  // namespace selfrepair::sandbox
