#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "classify/error_types.hpp"
#include "sandbox/execution_result.hpp"
#include "task/task_types.hpp"

namespace selfrepair::loop {

enum class OrchestratorState {
    kGenerating,
    kScreening,
    kExecuting,
    kClassifying,
    kRepairing,
    kSucceeded,
    kExhausted
};

inline const char* ToString(OrchestratorState state) {
    switch (state) {
        case OrchestratorState::kGenerating: return "generating";
        case OrchestratorState::kScreening: return "screening";
        case OrchestratorState::kExecuting: return "executing";
        case OrchestratorState::kClassifying: return "classifying";
        case OrchestratorState::kRepairing: return "repairing";
        case OrchestratorState::kSucceeded: return "succeeded";
        case OrchestratorState::kExhausted: return "exhausted";
    }
    return "unknown";
}

inline bool IsTerminal(OrchestratorState state) {
    return state == OrchestratorState::kSucceeded || state == OrchestratorState::kExhausted;
}

enum class PromptKind {
    kGenerate,
    kRepair
};

inline const char* ToString(PromptKind kind) {
    return kind == PromptKind::kGenerate ? "generate" : "repair";
}

inline constexpr const char* kReasonSolved = "solved";
inline constexpr const char* kReasonBudget = "budget";
inline constexpr const char* kReasonRepeatedFailure = "repeated_failure";
inline constexpr const char* kReasonProvisioningFailed = "provisioning_failed";

struct AttemptRecord {
    int attempt = 0;
    selfrepair::task::Submission submission;
    std::optional<selfrepair::sandbox::ExecutionResult> execution;
    std::optional<selfrepair::classify::ClassifiedError> error;
    PromptKind prompt = PromptKind::kGenerate;
    // Blocked attempts that did not consume budget.
    bool free_reroll = false;
    std::chrono::milliseconds generation_time{0};
    std::chrono::milliseconds execution_time{0};

    bool Succeeded() const { return execution && execution->Passed() && !error; }
};

struct Outcome {
    bool succeeded = false;
    // Attempt that succeeded, or the last attempt made.
    int attempt = 0;
    std::optional<selfrepair::classify::ClassifiedError> last_error;
    std::string reason;
};

struct EvaluationReport {
    std::string task_id;
    Outcome outcome;
    std::vector<AttemptRecord> attempts;
    std::chrono::milliseconds total_time{0};
};

}  // namespace selfrepair::loop
