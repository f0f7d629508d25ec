#include "sandbox/sandbox_executor.hpp"

#include <fstream>
#include <sstream>
#include <utility>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace selfrepair::sandbox {
namespace {

constexpr int kPytestTestsFailed = 1;
constexpr int kPytestInterrupted = 2;

void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw ProvisioningError("cannot write " + path.string());
    }
    output << content;
    output.close();
    if (!output) {
        throw ProvisioningError("short write to " + path.string());
    }
}

}  // namespace

EnvironmentLease::EnvironmentLease(ContainerRuntime& runtime)
    : runtime_(runtime)
    , env_(runtime.Create()) {}

EnvironmentLease::~EnvironmentLease() {
    try {
        runtime_.Destroy(env_);
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "sandbox", "environment teardown failed", {
            {"id", env_.id},
            {"error", ex.what()}});
    }
}

SandboxExecutor::SandboxExecutor(std::unique_ptr<ContainerRuntime> runtime,
                                 selfrepair::config::SandboxConfig config)
    : runtime_(std::move(runtime))
    , config_(std::move(config)) {}

ResourceLimits SandboxExecutor::Limits() const {
    ResourceLimits limits{};
    limits.timeout = std::chrono::seconds(config_.timeout_s);
    limits.kill_grace = std::chrono::milliseconds(config_.kill_grace_ms);
    limits.memory_mb = static_cast<std::size_t>(config_.memory_mb);
    limits.cpus = config_.cpus;
    limits.pids_limit = config_.pids_limit;
    limits.max_output_bytes = config_.max_output_bytes;
    return limits;
}

std::string SandboxExecutor::RenderTestModule(const selfrepair::task::Task& task) {
    std::ostringstream module;
    module << "# Generated for task " << task.id << "\n";
    module << "from solution import *\n";
    for (std::size_t i = 0; i < task.tests.size(); ++i) {
        const auto& test = task.tests[i];
        module << "\n\n";
        const auto body = utils::Trim(test.code);
        if (body.rfind("def ", 0) == 0) {
            module << body << "\n";
            continue;
        }
        module << "def " << selfrepair::task::TestFunctionName(test, i) << "():\n";
        const auto lines = utils::SplitLines(test.code);
        bool wrote = false;
        for (const auto& line : lines) {
            if (utils::Trim(line).empty()) {
                continue;
            }
            module << "    " << line << "\n";
            wrote = true;
        }
        if (!wrote) {
            module << "    pass\n";
        }
    }
    return module.str();
}

ExecStatus SandboxExecutor::MapStatus(const ExecResult& result) {
    if (result.timed_out) {
        return ExecStatus::kTimedOut;
    }
    if (result.resource_exceeded || result.term_signal != 0) {
        return ExecStatus::kCrashed;
    }
    switch (result.exit_code) {
        case 0:
            return ExecStatus::kPassed;
        case kPytestTestsFailed:
        case kPytestInterrupted:
            return ExecStatus::kFailed;
        default:
            return ExecStatus::kCrashed;
    }
}

void SandboxExecutor::Materialize(const Environment& env,
                                  const selfrepair::task::Submission& submission,
                                  const selfrepair::task::Task& task) const {
    WriteFile(env.work_dir / kSolutionFile, submission.source);
    WriteFile(env.work_dir / kTestFile, RenderTestModule(task));
}

ExecutionResult SandboxExecutor::Run(const selfrepair::task::Submission& submission,
                                     const selfrepair::task::Task& task) {
    EnvironmentLease lease(*runtime_);
    const auto& env = lease.Get();
    Materialize(env, submission, task);

    const auto raw = runtime_->Exec(env, config_.test_command, Limits());

    ExecutionResult result{};
    result.status = MapStatus(raw);
    result.exit_code = raw.exit_code;
    result.stdout_text = raw.output;
    result.stderr_text = raw.error;
    result.duration = raw.elapsed;
    result.resource_exceeded = raw.resource_exceeded;
    result.output_truncated = raw.output_truncated;
    result.network_isolated = raw.network_isolated;

    utils::Log(utils::LogLevel::kInfo, "sandbox", "run finished", {
        {"task", task.id},
        {"attempt", std::to_string(submission.attempt)},
        {"backend", runtime_->Name()},
        {"status", ToString(result.status)},
        {"exit", std::to_string(result.exit_code)},
        {"ms", std::to_string(result.duration.count())}});
    return result;
}

}  // namespace selfrepair::sandbox
