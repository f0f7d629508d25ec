#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <utility>

#include "classify/error_classifier.hpp"
#include "config/config_schema.hpp"
#include "generator/code_generator.hpp"
#include "guard/guardrail_scanner.hpp"
#include "loop/loop_types.hpp"
#include "repair/patch_builder.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "task/task_types.hpp"

namespace selfrepair::loop {

// Thrown by Evaluate when the sandbox cannot be provisioned mid-task.
// Carries the attempts recorded before the failure.
class AbortedEvaluation : public selfrepair::sandbox::ProvisioningError {
public:
    AbortedEvaluation(const std::string& what, EvaluationReport partial)
        : ProvisioningError(what)
        , partial_(std::make_shared<const EvaluationReport>(std::move(partial))) {}

    const EvaluationReport& Partial() const { return *partial_; }

private:
    std::shared_ptr<const EvaluationReport> partial_;
};

// Drives one task through generate, screen, execute, classify and repair
// until the tests pass or the attempt budget runs out. Holds no per-task
// state between Evaluate calls. A sandbox::ProvisioningError thrown by the
// executor leaves Evaluate as an AbortedEvaluation.
class Orchestrator {
public:
    Orchestrator(selfrepair::generator::CodeGenerator& generator,
                 const selfrepair::guard::GuardrailScanner& scanner,
                 selfrepair::sandbox::Executor& executor,
                 selfrepair::config::LoopConfig config);

    EvaluationReport Evaluate(const selfrepair::task::Task& task) const;
    EvaluationReport Evaluate(const selfrepair::task::Task& task, int max_attempts) const;

private:
    struct Evaluation;

    selfrepair::generator::CodeGenerator& generator_;
    const selfrepair::guard::GuardrailScanner& scanner_;
    selfrepair::sandbox::Executor& executor_;
    selfrepair::config::LoopConfig config_;
    selfrepair::classify::ErrorClassifier classifier_;
    selfrepair::repair::PatchBuilder patch_builder_;

    OrchestratorState OnGenerating(Evaluation& eval) const;
    OrchestratorState OnScreening(Evaluation& eval) const;
    OrchestratorState OnExecuting(Evaluation& eval) const;
    OrchestratorState OnClassifying(Evaluation& eval) const;
    OrchestratorState OnRepairing(Evaluation& eval) const;

    OrchestratorState CloseFailedAttempt(Evaluation& eval, bool consumes_budget) const;

    EvaluationReport MakeReport(Evaluation& eval, std::chrono::steady_clock::time_point started) const;
};

}  // namespace selfrepair::loop
