#pragma once

#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/container_runtime.hpp"

namespace selfrepair::sandbox {

// Local fallback: a per-run directory plus rlimits, a private network
// namespace and an unprivileged uid applied to the child process.
class ProcessJailRuntime : public ContainerRuntime {
public:
    explicit ProcessJailRuntime(selfrepair::config::SandboxConfig config);

    std::string Name() const override { return "process"; }
    bool IsAvailable() override;
    Environment Create() override;
    ExecResult Exec(const Environment& env,
                    const std::vector<std::string>& command,
                    const ResourceLimits& limits) override;
    void Destroy(const Environment& env) override;

private:
    selfrepair::config::SandboxConfig config_;
    std::filesystem::path work_root_;
    bool drop_privileges_ = false;
};

}  // namespace selfrepair::sandbox
