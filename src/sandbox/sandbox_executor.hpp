#pragma once

#include <memory>
#include <string>

#include "config/config_schema.hpp"
#include "sandbox/container_runtime.hpp"
#include "sandbox/execution_result.hpp"
#include "task/task_types.hpp"

namespace selfrepair::sandbox {

inline constexpr const char* kSolutionFile = "solution.py";
inline constexpr const char* kTestFile = "test_solution.py";

class Executor {
public:
    virtual ~Executor() = default;
    virtual ExecutionResult Run(const selfrepair::task::Submission& submission,
                                const selfrepair::task::Task& task) = 0;
};

// Destroys the environment on every exit path of a run.
class EnvironmentLease {
public:
    explicit EnvironmentLease(ContainerRuntime& runtime);
    ~EnvironmentLease();

    EnvironmentLease(const EnvironmentLease&) = delete;
    EnvironmentLease& operator=(const EnvironmentLease&) = delete;

    const Environment& Get() const { return env_; }

private:
    ContainerRuntime& runtime_;
    Environment env_;
};

class SandboxExecutor : public Executor {
public:
    SandboxExecutor(std::unique_ptr<ContainerRuntime> runtime,
                    selfrepair::config::SandboxConfig config);

    ExecutionResult Run(const selfrepair::task::Submission& submission,
                        const selfrepair::task::Task& task) override;

    ContainerRuntime& Runtime() { return *runtime_; }
    ResourceLimits Limits() const;

    static std::string RenderTestModule(const selfrepair::task::Task& task);
    static ExecStatus MapStatus(const ExecResult& result);

private:
    std::unique_ptr<ContainerRuntime> runtime_;
    selfrepair::config::SandboxConfig config_;

    void Materialize(const Environment& env,
                     const selfrepair::task::Submission& submission,
                     const selfrepair::task::Task& task) const;
};

}  // namespace selfrepair::sandbox
