#pragma once

#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/container_runtime.hpp"

namespace selfrepair::sandbox {

// One `docker run` per environment; the run directory is bind-mounted read-only at /work.
class DockerRuntime : public ContainerRuntime {
public:
    explicit DockerRuntime(selfrepair::config::SandboxConfig config);

    std::string Name() const override { return "docker"; }
    bool IsAvailable() override;
    Environment Create() override;
    ExecResult Exec(const Environment& env,
                    const std::vector<std::string>& command,
                    const ResourceLimits& limits) override;
    void Destroy(const Environment& env) override;

    std::vector<std::string> BuildRunCommand(const Environment& env,
                                             const std::vector<std::string>& command,
                                             const ResourceLimits& limits) const;

private:
    selfrepair::config::SandboxConfig config_;
    std::filesystem::path work_root_;

    ExecResult RunDockerCli(const Environment& env,
                            const std::vector<std::string>& argv,
                            std::chrono::milliseconds timeout,
                            const std::string& label) const;
    bool WasOomKilled(const Environment& env) const;
};

}  // namespace selfrepair::sandbox
