#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <vector>

#include "loop/batch_evaluator.hpp"
#include "loop/orchestrator.hpp"

using namespace selfrepair;
using classify::ErrorKind;

namespace {

const char* kGoodCode = "def add(a, b):\n    return a + b\n";
const char* kTypoCode = "def add(a, b):\n    return a + c\n";
const char* kWrongCode = "def add(a, b):\n    return a - b\n";
const char* kNetworkCode = "import socket\ndef add(a, b):\n    return a + b\n";

task::Task AddTask(const std::string& id = "add") {
    task::Task task{};
    task.id = id;
    task.signature = "def add(a, b):";
    task.description = "Return the sum of a and b.";
    task.tests = {{"test_add", "assert add(2, 3) == 5"}};
    return task;
}

sandbox::ExecutionResult Passing() {
    sandbox::ExecutionResult result{};
    result.status = sandbox::ExecStatus::kPassed;
    result.exit_code = 0;
    result.stdout_text = ".                                                                        [100%]\n1 passed in 0.01s\n";
    return result;
}

sandbox::ExecutionResult NameFailure() {
    sandbox::ExecutionResult result{};
    result.status = sandbox::ExecStatus::kFailed;
    result.exit_code = 1;
    result.stdout_text =
        ">       return a + c\n"
        "E       NameError: name 'c' is not defined\n"
        "\n"
        "solution.py:2: NameError\n"
        "FAILED test_solution.py::test_add - NameError: name 'c' is not defined\n";
    return result;
}

sandbox::ExecutionResult LogicFailure() {
    sandbox::ExecutionResult result{};
    result.status = sandbox::ExecStatus::kFailed;
    result.exit_code = 1;
    result.stdout_text =
        ">       assert add(2, 3) == 5\n"
        "E       assert -1 == 5\n"
        "E        +  where -1 = add(2, 3)\n"
        "\n"
        "test_solution.py:5: AssertionError\n"
        "FAILED test_solution.py::test_add - assert -1 == 5\n";
    return result;
}

// Replays a fixed list of generator replies; the last one repeats.
class ScriptedGenerator : public generator::CodeGenerator {
public:
    explicit ScriptedGenerator(std::vector<generator::GenerationResult> replies)
        : replies_(std::move(replies)) {}

    generator::GenerationResult Generate(const task::Task&) override {
        ++generate_calls;
        return Next();
    }

    generator::GenerationResult Repair(const repair::RepairRequest& request) override {
        ++repair_calls;
        repair_requests.push_back(request);
        return Next();
    }

    int generate_calls = 0;
    int repair_calls = 0;
    std::vector<repair::RepairRequest> repair_requests;

private:
    generator::GenerationResult Next() {
        const auto index = std::min(next_++, replies_.size() - 1);
        return replies_[index];
    }

    std::vector<generator::GenerationResult> replies_;
    std::size_t next_ = 0;
};

class SpyExecutor : public sandbox::Executor {
public:
    explicit SpyExecutor(std::vector<sandbox::ExecutionResult> results)
        : results_(std::move(results)) {}

    sandbox::ExecutionResult Run(const task::Submission& submission, const task::Task&) override {
        submissions.push_back(submission);
        const auto index = std::min(submissions.size() - 1, results_.size() - 1);
        return results_[index];
    }

    int Calls() const { return static_cast<int>(submissions.size()); }

    std::vector<task::Submission> submissions;

private:
    std::vector<sandbox::ExecutionResult> results_;
};

class BrokenSandbox : public sandbox::Executor {
public:
    sandbox::ExecutionResult Run(const task::Submission&, const task::Task&) override {
        throw sandbox::ProvisioningError("docker daemon unreachable");
    }
};

// Runs the first submission, then loses its environment.
class FailingAfterFirstRun : public sandbox::Executor {
public:
    sandbox::ExecutionResult Run(const task::Submission&, const task::Task&) override {
        if (++calls > 1) {
            throw sandbox::ProvisioningError("daemon gone");
        }
        return LogicFailure();
    }

    std::atomic<int> calls{0};
};

generator::GenerationResult Code(const char* code) {
    return generator::GenerationResult{.code = code};
}

config::LoopConfig DefaultLoop() {
    return config::LoopConfig{};
}

}  // namespace

// ─── Scenarios ─────────────────────────────────────────────────

TEST(OrchestratorTest, SucceedsOnFirstAttempt) {
    ScriptedGenerator generator({Code(kGoodCode)});
    SpyExecutor executor({Passing()});
    guard::GuardrailScanner scanner;
    loop::Orchestrator orchestrator(generator, scanner, executor, DefaultLoop());

    const auto report = orchestrator.Evaluate(AddTask());
    EXPECT_TRUE(report.outcome.succeeded);
    EXPECT_EQ(report.outcome.attempt, 1);
    EXPECT_EQ(report.outcome.reason, loop::kReasonSolved);
    EXPECT_FALSE(report.outcome.last_error.has_value());
    ASSERT_EQ(report.attempts.size(), 1u);
    EXPECT_EQ(report.attempts[0].prompt, loop::PromptKind::kGenerate);
    EXPECT_TRUE(report.attempts[0].Succeeded());
    EXPECT_EQ(generator.generate_calls, 1);
    EXPECT_EQ(generator.repair_calls, 0);
    EXPECT_EQ(executor.Calls(), 1);
}

TEST(OrchestratorTest, RepairsUndefinedName) {
    ScriptedGenerator generator({Code(kTypoCode), Code(kGoodCode)});
    SpyExecutor executor({NameFailure(), Passing()});
    guard::GuardrailScanner scanner;
    loop::Orchestrator orchestrator(generator, scanner, executor, DefaultLoop());

    const auto report = orchestrator.Evaluate(AddTask());
    EXPECT_TRUE(report.outcome.succeeded);
    EXPECT_EQ(report.outcome.attempt, 2);
    ASSERT_EQ(report.attempts.size(), 2u);
    ASSERT_TRUE(report.attempts[0].error.has_value());
    EXPECT_EQ(report.attempts[0].error->kind, ErrorKind::kName);
    EXPECT_EQ(report.attempts[0].submission.source, kTypoCode);
    EXPECT_EQ(report.attempts[1].prompt, loop::PromptKind::kRepair);
    EXPECT_FALSE(report.attempts[1].error.has_value());

    ASSERT_EQ(generator.repair_requests.size(), 1u);
    const auto& request = generator.repair_requests[0];
    EXPECT_EQ(request.submission.source, kTypoCode);
    EXPECT_EQ(request.error.kind, ErrorKind::kName);
    ASSERT_EQ(request.failing_assertions.size(), 1u);
    EXPECT_EQ(request.failing_assertions[0].name, "test_add");
}

TEST(OrchestratorTest, BlockedSubmissionNeverReachesSandbox) {
    ScriptedGenerator generator({Code(kNetworkCode), Code(kGoodCode)});
    SpyExecutor executor({Passing()});
    guard::GuardrailScanner scanner;
    loop::Orchestrator orchestrator(generator, scanner, executor, DefaultLoop());

    const auto report = orchestrator.Evaluate(AddTask());
    ASSERT_GE(report.attempts.size(), 1u);
    ASSERT_TRUE(report.attempts[0].error.has_value());
    EXPECT_EQ(report.attempts[0].error->kind, ErrorKind::kBlocked);
    EXPECT_FALSE(report.attempts[0].execution.has_value());
    ASSERT_EQ(executor.Calls(), 1);
    EXPECT_EQ(executor.submissions[0].source, kGoodCode);

    ASSERT_EQ(generator.repair_requests.size(), 1u);
    EXPECT_EQ(generator.repair_requests[0].error.kind, ErrorKind::kBlocked);
    EXPECT_NE(generator.repair_requests[0].error.excerpt.find("network_access"), std::string::npos);
}

TEST(OrchestratorTest, AlwaysBlockedMakesNoSandboxCalls) {
    ScriptedGenerator generator({Code(kNetworkCode)});
    SpyExecutor executor({Passing()});
    guard::GuardrailScanner scanner;
    loop::Orchestrator orchestrator(generator, scanner, executor, DefaultLoop());

    const auto report = orchestrator.Evaluate(AddTask(), 3);
    EXPECT_FALSE(report.outcome.succeeded);
    EXPECT_EQ(report.attempts.size(), 3u);
    EXPECT_EQ(executor.Calls(), 0);
    ASSERT_TRUE(report.outcome.last_error.has_value());
    EXPECT_EQ(report.outcome.last_error->kind, ErrorKind::kBlocked);
}

TEST(OrchestratorTest, ExhaustsBudgetOnPersistentLogicFailure) {
    ScriptedGenerator generator({Code(kWrongCode)});
    SpyExecutor executor({LogicFailure()});
    guard::GuardrailScanner scanner;
    loop::Orchestrator orchestrator(generator, scanner, executor, DefaultLoop());

    const auto report = orchestrator.Evaluate(AddTask(), 3);
    EXPECT_FALSE(report.outcome.succeeded);
    EXPECT_EQ(report.outcome.reason, loop::kReasonBudget);
    EXPECT_EQ(report.outcome.attempt, 3);
    ASSERT_EQ(report.attempts.size(), 3u);
    ASSERT_TRUE(report.outcome.last_error.has_value());
    EXPECT_EQ(report.outcome.last_error->kind, ErrorKind::kLogic);
    EXPECT_EQ(report.outcome.last_error->hint.actual, "-1");
    for (std::size_t i = 0; i < report.attempts.size(); ++i) {
        EXPECT_EQ(report.attempts[i].attempt, static_cast<int>(i) + 1);
        EXPECT_EQ(report.attempts[i].submission.attempt, static_cast<int>(i) + 1);
    }
}

// ─── Budget ────────────────────────────────────────────────────

TEST(OrchestratorTest, NeverExceedsMaxAttempts) {
    for (int max_attempts = 1; max_attempts <= 5; ++max_attempts) {
        ScriptedGenerator generator({Code(kTypoCode), Code(kNetworkCode), {.error = "upstream 503"}, Code(kWrongCode)});
        SpyExecutor executor({NameFailure(), LogicFailure()});
        guard::GuardrailScanner scanner;
        loop::Orchestrator orchestrator(generator, scanner, executor, DefaultLoop());

        const auto report = orchestrator.Evaluate(AddTask(), max_attempts);
        EXPECT_EQ(static_cast<int>(report.attempts.size()), max_attempts);
        EXPECT_FALSE(report.outcome.succeeded);
    }
}

TEST(OrchestratorTest, ZeroAttemptsEvaluatesNothing) {
    ScriptedGenerator generator({Code(kGoodCode)});
    SpyExecutor executor({Passing()});
    guard::GuardrailScanner scanner;
    loop::Orchestrator orchestrator(generator, scanner, executor, DefaultLoop());

    const auto report = orchestrator.Evaluate(AddTask(), 0);
    EXPECT_FALSE(report.outcome.succeeded);
    EXPECT_TRUE(report.attempts.empty());
    EXPECT_EQ(generator.generate_calls, 0);
}

TEST(OrchestratorTest, BlockedAttemptsCanBeFreeRerolls) {
    auto loop_config = DefaultLoop();
    loop_config.blocked_counts_toward_budget = false;
    loop_config.max_free_rerolls = 2;
    ScriptedGenerator generator({Code(kNetworkCode)});
    SpyExecutor executor({Passing()});
    guard::GuardrailScanner scanner;
    loop::Orchestrator orchestrator(generator, scanner, executor, loop_config);

    const auto report = orchestrator.Evaluate(AddTask(), 3);
    ASSERT_EQ(report.attempts.size(), 5u);
    EXPECT_TRUE(report.attempts[0].free_reroll);
    EXPECT_TRUE(report.attempts[1].free_reroll);
    EXPECT_FALSE(report.attempts[2].free_reroll);
    EXPECT_FALSE(report.attempts[4].free_reroll);
    EXPECT_EQ(executor.Calls(), 0);
}

TEST(OrchestratorTest, LedgerBoundedByBudgetPlusFreeRerolls) {
    for (int free_rerolls = 0; free_rerolls <= 2; ++free_rerolls) {
        for (int max_attempts = 1; max_attempts <= 4; ++max_attempts) {
            auto loop_config = DefaultLoop();
            loop_config.blocked_counts_toward_budget = false;
            loop_config.max_free_rerolls = free_rerolls;
            ScriptedGenerator generator({Code(kNetworkCode)});
            SpyExecutor executor({Passing()});
            guard::GuardrailScanner scanner;
            loop::Orchestrator orchestrator(generator, scanner, executor, loop_config);

            const auto report = orchestrator.Evaluate(AddTask(), max_attempts);
            EXPECT_EQ(static_cast<int>(report.attempts.size()), max_attempts + free_rerolls)
                << "max_attempts=" << max_attempts << " free_rerolls=" << free_rerolls;
            const auto rerolled = std::count_if(report.attempts.begin(), report.attempts.end(),
                                            [](const loop::AttemptRecord& r) { return r.free_reroll; });
            EXPECT_EQ(rerolled, free_rerolls);
            EXPECT_EQ(report.outcome.reason, loop::kReasonBudget);
            EXPECT_EQ(executor.Calls(), 0);
        }
    }
}

TEST(OrchestratorTest, FreeRerollThenSuccess) {
    auto loop_config = DefaultLoop();
    loop_config.blocked_counts_toward_budget = false;
    ScriptedGenerator generator({Code(kNetworkCode), Code(kGoodCode)});
    SpyExecutor executor({Passing()});
    guard::GuardrailScanner scanner;
    loop::Orchestrator orchestrator(generator, scanner, executor, loop_config);

    const auto report = orchestrator.Evaluate(AddTask(), 1);
    EXPECT_TRUE(report.outcome.succeeded);
    EXPECT_EQ(report.outcome.attempt, 2);
    EXPECT_EQ(report.attempts.size(), 2u);
}

// ─── Failure handling ──────────────────────────────────────────

TEST(OrchestratorTest, GenerationFailureConsumesAttempt) {
    ScriptedGenerator generator({{.error = "request timed out"}, Code(kGoodCode)});
    SpyExecutor executor({Passing()});
    guard::GuardrailScanner scanner;
    loop::Orchestrator orchestrator(generator, scanner, executor, DefaultLoop());

    const auto report = orchestrator.Evaluate(AddTask());
    EXPECT_TRUE(report.outcome.succeeded);
    ASSERT_EQ(report.attempts.size(), 2u);
    ASSERT_TRUE(report.attempts[0].error.has_value());
    EXPECT_EQ(report.attempts[0].error->kind, ErrorKind::kGenerationFailed);
    EXPECT_EQ(report.attempts[0].error->excerpt, "request timed out");
    EXPECT_FALSE(report.attempts[0].execution.has_value());
    // No repair request exists yet, so the task is sent again.
    EXPECT_EQ(report.attempts[1].prompt, loop::PromptKind::kGenerate);
    EXPECT_EQ(generator.generate_calls, 2);
    EXPECT_EQ(executor.Calls(), 1);
}

TEST(OrchestratorTest, EmptyGenerationIsAFailure) {
    ScriptedGenerator generator({Code("")});
    SpyExecutor executor({Passing()});
    guard::GuardrailScanner scanner;
    loop::Orchestrator orchestrator(generator, scanner, executor, DefaultLoop());

    const auto report = orchestrator.Evaluate(AddTask(), 2);
    EXPECT_FALSE(report.outcome.succeeded);
    ASSERT_EQ(report.attempts.size(), 2u);
    EXPECT_EQ(report.attempts[1].error->kind, ErrorKind::kGenerationFailed);
    EXPECT_EQ(executor.Calls(), 0);
}

TEST(OrchestratorTest, StopsOnRepeatedFailureWhenEnabled) {
    auto loop_config = DefaultLoop();
    loop_config.stop_on_repeated_error = true;
    ScriptedGenerator generator({Code(kTypoCode)});
    SpyExecutor executor({NameFailure()});
    guard::GuardrailScanner scanner;
    loop::Orchestrator orchestrator(generator, scanner, executor, loop_config);

    const auto report = orchestrator.Evaluate(AddTask(), 5);
    EXPECT_FALSE(report.outcome.succeeded);
    EXPECT_EQ(report.outcome.reason, loop::kReasonRepeatedFailure);
    EXPECT_EQ(report.attempts.size(), 2u);
}

TEST(OrchestratorTest, RepeatedFailureIgnoredByDefault) {
    ScriptedGenerator generator({Code(kTypoCode)});
    SpyExecutor executor({NameFailure()});
    guard::GuardrailScanner scanner;
    loop::Orchestrator orchestrator(generator, scanner, executor, DefaultLoop());

    const auto report = orchestrator.Evaluate(AddTask(), 4);
    EXPECT_EQ(report.outcome.reason, loop::kReasonBudget);
    EXPECT_EQ(report.attempts.size(), 4u);
}

TEST(OrchestratorTest, GenerationFailureDuringRepairResendsSameRequest) {
    ScriptedGenerator generator({Code(kTypoCode), {.error = "upstream 503"}, Code(kGoodCode)});
    SpyExecutor executor({NameFailure(), Passing()});
    guard::GuardrailScanner scanner;
    loop::Orchestrator orchestrator(generator, scanner, executor, DefaultLoop());

    const auto report = orchestrator.Evaluate(AddTask(), 3);
    EXPECT_TRUE(report.outcome.succeeded);
    ASSERT_EQ(report.attempts.size(), 3u);
    ASSERT_TRUE(report.attempts[1].error.has_value());
    EXPECT_EQ(report.attempts[1].error->kind, ErrorKind::kGenerationFailed);
    EXPECT_EQ(report.attempts[1].prompt, loop::PromptKind::kRepair);
    EXPECT_EQ(report.attempts[2].prompt, loop::PromptKind::kRepair);
    EXPECT_EQ(generator.generate_calls, 1);
    EXPECT_EQ(executor.Calls(), 2);

    ASSERT_EQ(generator.repair_requests.size(), 2u);
    const auto& first = generator.repair_requests[0];
    const auto& second = generator.repair_requests[1];
    EXPECT_EQ(second.submission.source, kTypoCode);
    EXPECT_EQ(second.submission.source, first.submission.source);
    EXPECT_EQ(second.error.kind, ErrorKind::kName);
    EXPECT_EQ(second.error.Signature(), first.error.Signature());
    EXPECT_EQ(second.instruction, first.instruction);
}

TEST(OrchestratorTest, ProvisioningErrorPropagates) {
    ScriptedGenerator generator({Code(kGoodCode)});
    BrokenSandbox executor;
    guard::GuardrailScanner scanner;
    loop::Orchestrator orchestrator(generator, scanner, executor, DefaultLoop());

    EXPECT_THROW(orchestrator.Evaluate(AddTask()), sandbox::ProvisioningError);
    EXPECT_EQ(generator.generate_calls, 1);
}

TEST(OrchestratorTest, ProvisioningErrorKeepsEarlierAttempts) {
    ScriptedGenerator generator({Code(kWrongCode), Code(kGoodCode)});
    FailingAfterFirstRun executor;
    guard::GuardrailScanner scanner;
    loop::Orchestrator orchestrator(generator, scanner, executor, DefaultLoop());

    try {
        orchestrator.Evaluate(AddTask(), 3);
        FAIL() << "Evaluate returned despite a broken sandbox";
    } catch (const loop::AbortedEvaluation& ex) {
        EXPECT_STREQ(ex.what(), "daemon gone");
        const auto& partial = ex.Partial();
        EXPECT_EQ(partial.task_id, "add");
        EXPECT_FALSE(partial.outcome.succeeded);
        EXPECT_EQ(partial.outcome.reason, loop::kReasonProvisioningFailed);
        EXPECT_EQ(partial.outcome.attempt, 1);
        ASSERT_EQ(partial.attempts.size(), 1u);
        EXPECT_EQ(partial.attempts[0].submission.source, kWrongCode);
        ASSERT_TRUE(partial.attempts[0].error.has_value());
        EXPECT_EQ(partial.attempts[0].error->kind, ErrorKind::kLogic);
        ASSERT_TRUE(partial.outcome.last_error.has_value());
        EXPECT_EQ(partial.outcome.last_error->kind, ErrorKind::kLogic);
    }
    EXPECT_EQ(executor.calls.load(), 2);
}

TEST(OrchestratorTest, AbortedEvaluationIsAProvisioningError) {
    ScriptedGenerator generator({Code(kWrongCode)});
    FailingAfterFirstRun executor;
    guard::GuardrailScanner scanner;
    loop::Orchestrator orchestrator(generator, scanner, executor, DefaultLoop());

    EXPECT_THROW(orchestrator.Evaluate(AddTask(), 3), sandbox::ProvisioningError);
}

TEST(OrchestratorTest, DeterministicGivenDeterministicCollaborators) {
    std::vector<std::string> signatures;
    for (int run = 0; run < 2; ++run) {
        ScriptedGenerator generator({Code(kTypoCode), Code(kNetworkCode), Code(kWrongCode)});
        SpyExecutor executor({NameFailure(), LogicFailure()});
        guard::GuardrailScanner scanner;
        loop::Orchestrator orchestrator(generator, scanner, executor, DefaultLoop());
        const auto report = orchestrator.Evaluate(AddTask(), 3);
        std::string joined;
        for (const auto& record : report.attempts) {
            joined += record.error ? record.error->Signature() : "PASS";
            joined += ";";
        }
        signatures.push_back(joined);
    }
    EXPECT_EQ(signatures[0], signatures[1]);
    EXPECT_EQ(signatures[0], "NAME:NameError:2;BLOCKED:GuardrailViolation:-;LOGIC:AssertionError:-;");
}

// ─── Batch ─────────────────────────────────────────────────────

namespace {

class FixedGenerator : public generator::CodeGenerator {
public:
    generator::GenerationResult Generate(const task::Task&) override { return Code(kGoodCode); }
    generator::GenerationResult Repair(const repair::RepairRequest&) override { return Code(kGoodCode); }
};

// Fails tasks whose id starts with "bad" and breaks on "broken".
class ByTaskExecutor : public sandbox::Executor {
public:
    sandbox::ExecutionResult Run(const task::Submission&, const task::Task& task) override {
        ++calls;
        if (task.id.rfind("broken", 0) == 0) {
            throw sandbox::ProvisioningError("no environment");
        }
        return task.id.rfind("bad", 0) == 0 ? LogicFailure() : Passing();
    }

    std::atomic<int> calls{0};
};

}  // namespace

TEST(BatchEvaluatorTest, KeepsInputOrderAcrossWorkers) {
    FixedGenerator generator;
    ByTaskExecutor executor;
    guard::GuardrailScanner scanner;
    loop::BatchEvaluator batch(generator, scanner, executor, DefaultLoop(), 3);

    const std::vector<task::Task> tasks = {AddTask("one"), AddTask("bad-two"), AddTask("three"), AddTask("four")};
    const auto items = batch.Run(tasks, 2);
    ASSERT_EQ(items.size(), 4u);
    EXPECT_EQ(items[0].report.task_id, "one");
    EXPECT_TRUE(items[0].report.outcome.succeeded);
    EXPECT_EQ(items[1].report.task_id, "bad-two");
    EXPECT_FALSE(items[1].report.outcome.succeeded);
    EXPECT_EQ(items[1].report.attempts.size(), 2u);
    EXPECT_EQ(items[3].report.task_id, "four");
    EXPECT_EQ(executor.calls.load(), 5);
}

TEST(BatchEvaluatorTest, ProvisioningFailureIsReportedPerTask) {
    FixedGenerator generator;
    ByTaskExecutor executor;
    guard::GuardrailScanner scanner;
    loop::BatchEvaluator batch(generator, scanner, executor, DefaultLoop(), 2);

    const auto items = batch.Run({AddTask("broken"), AddTask("fine")}, 3);
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].infrastructure_error, "no environment");
    EXPECT_TRUE(items[0].report.attempts.empty());
    EXPECT_TRUE(items[1].infrastructure_error.empty());
    EXPECT_TRUE(items[1].report.outcome.succeeded);
}

TEST(BatchEvaluatorTest, ProvisioningFailureKeepsEarlierAttempts) {
    ScriptedGenerator generator({Code(kWrongCode)});
    FailingAfterFirstRun executor;
    guard::GuardrailScanner scanner;
    loop::BatchEvaluator batch(generator, scanner, executor, DefaultLoop(), 1);

    const auto items = batch.Run({AddTask("flaky")}, 3);
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].infrastructure_error, "daemon gone");
    EXPECT_EQ(items[0].report.task_id, "flaky");
    EXPECT_EQ(items[0].report.outcome.reason, loop::kReasonProvisioningFailed);
    ASSERT_EQ(items[0].report.attempts.size(), 1u);
    ASSERT_TRUE(items[0].report.attempts[0].error.has_value());
    EXPECT_EQ(items[0].report.attempts[0].error->kind, ErrorKind::kLogic);
}
