#include "loop/orchestrator.hpp"

#include <optional>
#include <string>
#include <utility>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace selfrepair::loop {

using selfrepair::classify::ClassifiedError;
using selfrepair::classify::ErrorKind;

struct Orchestrator::Evaluation {
    const selfrepair::task::Task& task;
    int max_attempts = 0;
    // Attempts charged against max_attempts. Free re-rolls are not charged.
    int budget_used = 0;
    int free_rerolls = 0;
    OrchestratorState state = OrchestratorState::kGenerating;
    AttemptRecord current;
    std::vector<AttemptRecord> ledger;
    std::optional<selfrepair::repair::RepairRequest> repair;
    std::string previous_signature;
    bool repeated_failure = false;
    std::string exhaust_reason = kReasonBudget;
};

namespace {

void LogAttempt(const std::string& task_id, const AttemptRecord& record) {
    utils::Log(utils::LogLevel::kInfo, "loop", "attempt finished", {
        {"task", task_id},
        {"attempt", std::to_string(record.attempt)},
        {"prompt", ToString(record.prompt)},
        {"result", record.error ? selfrepair::classify::ToString(record.error->kind) : "PASSED"},
        {"free_reroll", record.free_reroll ? "true" : "false"},
        {"gen_ms", std::to_string(record.generation_time.count())},
        {"exec_ms", std::to_string(record.execution_time.count())}});
}

}  // namespace

Orchestrator::Orchestrator(selfrepair::generator::CodeGenerator& generator,
                           const selfrepair::guard::GuardrailScanner& scanner,
                           selfrepair::sandbox::Executor& executor,
                           selfrepair::config::LoopConfig config)
    : generator_(generator)
    , scanner_(scanner)
    , executor_(executor)
    , config_(std::move(config)) {}

EvaluationReport Orchestrator::Evaluate(const selfrepair::task::Task& task) const {
    return Evaluate(task, config_.max_attempts);
}

EvaluationReport Orchestrator::Evaluate(const selfrepair::task::Task& task, int max_attempts) const {
    const auto started = utils::Now();
    Evaluation eval{.task = task, .max_attempts = max_attempts};

    utils::Log(utils::LogLevel::kInfo, "loop", "evaluation started", {
        {"task", task.id},
        {"max_attempts", std::to_string(max_attempts)}});

    if (max_attempts <= 0) {
        eval.state = OrchestratorState::kExhausted;
    }

    try {
        while (!IsTerminal(eval.state)) {
            const auto from = eval.state;
            switch (eval.state) {
                case OrchestratorState::kGenerating:
                    eval.state = OnGenerating(eval);
                    break;
                case OrchestratorState::kScreening:
                    eval.state = OnScreening(eval);
                    break;
                case OrchestratorState::kExecuting:
                    eval.state = OnExecuting(eval);
                    break;
                case OrchestratorState::kClassifying:
                    eval.state = OnClassifying(eval);
                    break;
                case OrchestratorState::kRepairing:
                    eval.state = OnRepairing(eval);
                    break;
                case OrchestratorState::kSucceeded:
                case OrchestratorState::kExhausted:
                    break;
            }
            utils::Log(utils::LogLevel::kDebug, "loop", "transition", {
                {"task", task.id},
                {"from", ToString(from)},
                {"to", ToString(eval.state)}});
        }
    } catch (const selfrepair::sandbox::ProvisioningError& ex) {
        utils::Log(utils::LogLevel::kError, "loop", "sandbox provisioning failed", {
            {"task", task.id},
            {"attempt", std::to_string(eval.current.attempt)},
            {"error", ex.what()}});
        eval.exhaust_reason = kReasonProvisioningFailed;
        throw AbortedEvaluation(ex.what(), MakeReport(eval, started));
    }
    return MakeReport(eval, started);
}

EvaluationReport Orchestrator::MakeReport(Evaluation& eval, std::chrono::steady_clock::time_point started) const {
    EvaluationReport report{};
    report.task_id = eval.task.id;
    if (!eval.ledger.empty()) {
        report.outcome.attempt = eval.ledger.back().attempt;
    }
    if (eval.state == OrchestratorState::kSucceeded) {
        report.outcome.succeeded = true;
        report.outcome.reason = kReasonSolved;
    } else {
        report.outcome.reason = eval.exhaust_reason;
        if (!eval.ledger.empty()) {
            report.outcome.last_error = eval.ledger.back().error;
        }
    }
    report.attempts = std::move(eval.ledger);
    report.total_time = utils::ElapsedSince(started);

    utils::Log(utils::LogLevel::kInfo, "loop", "evaluation finished", {
        {"task", report.task_id},
        {"succeeded", report.outcome.succeeded ? "true" : "false"},
        {"attempts", std::to_string(report.attempts.size())},
        {"reason", report.outcome.reason},
        {"total_ms", std::to_string(report.total_time.count())}});
    return report;
}

OrchestratorState Orchestrator::OnGenerating(Evaluation& eval) const {
    eval.current = AttemptRecord{};
    eval.current.attempt = static_cast<int>(eval.ledger.size()) + 1;
    eval.current.submission.attempt = eval.current.attempt;
    eval.current.prompt = eval.repair ? PromptKind::kRepair : PromptKind::kGenerate;

    const auto started = utils::Now();
    const auto generated = eval.repair ? generator_.Repair(*eval.repair) : generator_.Generate(eval.task);
    eval.current.generation_time = utils::ElapsedSince(started);

    if (!generated.Ok()) {
        eval.current.error = selfrepair::classify::MakeGenerationFailure(
            generated.error.empty() ? "generator returned empty output" : generated.error);
        return CloseFailedAttempt(eval, true);
    }
    eval.current.submission.source = generated.code;
    return OrchestratorState::kScreening;
}

OrchestratorState Orchestrator::OnScreening(Evaluation& eval) const {
    const auto screen = scanner_.Screen(eval.current.submission.source);
    if (screen.Allowed()) {
        return OrchestratorState::kExecuting;
    }
    utils::Log(utils::LogLevel::kWarn, "loop", "submission blocked", {
        {"task", eval.task.id},
        {"attempt", std::to_string(eval.current.attempt)},
        {"category", screen.category},
        {"line", std::to_string(screen.line)}});
    eval.current.error = selfrepair::classify::MakeBlocked(screen.reason);
    return OrchestratorState::kRepairing;
}

OrchestratorState Orchestrator::OnExecuting(Evaluation& eval) const {
    const auto started = utils::Now();
    auto result = executor_.Run(eval.current.submission, eval.task);
    eval.current.execution_time = utils::ElapsedSince(started);
    const bool passed = result.Passed();
    eval.current.execution = std::move(result);

    if (!passed) {
        return OrchestratorState::kClassifying;
    }
    LogAttempt(eval.task.id, eval.current);
    eval.ledger.push_back(std::move(eval.current));
    return OrchestratorState::kSucceeded;
}

OrchestratorState Orchestrator::OnClassifying(Evaluation& eval) const {
    auto classified = classifier_.Classify(*eval.current.execution);
    if (!classified) {
        // Classify is empty only for passing results.
        classified = ClassifiedError{.kind = ErrorKind::kLogic, .error_type = "AssertionError"};
    }
    const auto signature = classified->Signature();
    if (config_.stop_on_repeated_error && signature == eval.previous_signature) {
        eval.repeated_failure = true;
    }
    eval.previous_signature = signature;
    eval.current.error = std::move(*classified);
    return OrchestratorState::kRepairing;
}

OrchestratorState Orchestrator::OnRepairing(Evaluation& eval) const {
    const auto& error = *eval.current.error;
    bool consumes_budget = true;
    if (error.kind == ErrorKind::kBlocked) {
        // A blocked attempt breaks any run of identical post-execution failures.
        eval.previous_signature.clear();
        if (!config_.blocked_counts_toward_budget && eval.free_rerolls < config_.max_free_rerolls) {
            ++eval.free_rerolls;
            eval.current.free_reroll = true;
            consumes_budget = false;
        }
    }

    if (eval.repeated_failure) {
        LogAttempt(eval.task.id, eval.current);
        eval.ledger.push_back(std::move(eval.current));
        eval.exhaust_reason = kReasonRepeatedFailure;
        utils::Log(utils::LogLevel::kWarn, "loop", "same failure twice in a row, stopping", {
            {"task", eval.task.id},
            {"signature", eval.previous_signature}});
        return OrchestratorState::kExhausted;
    }

    eval.repair = patch_builder_.BuildRepair(eval.task, eval.current.submission, error);
    return CloseFailedAttempt(eval, consumes_budget);
}

OrchestratorState Orchestrator::CloseFailedAttempt(Evaluation& eval, bool consumes_budget) const {
    if (eval.current.error && eval.current.error->kind == ErrorKind::kGenerationFailed) {
        eval.previous_signature.clear();
    }
    LogAttempt(eval.task.id, eval.current);
    eval.ledger.push_back(std::move(eval.current));
    if (consumes_budget) {
        ++eval.budget_used;
    }
    if (eval.budget_used >= eval.max_attempts) {
        eval.exhaust_reason = kReasonBudget;
        return OrchestratorState::kExhausted;
    }
    return OrchestratorState::kGenerating;
}

}  // namespace selfrepair::loop
