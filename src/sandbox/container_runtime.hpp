#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/process_runner.hpp"

namespace selfrepair::sandbox {

// The execution-environment provisioning capability itself is broken
// (no runtime, no work directory, daemon errors). Never retried by the loop.
class ProvisioningError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ResourceLimits {
    std::chrono::milliseconds timeout{15000};
    std::chrono::milliseconds kill_grace{2000};
    std::size_t memory_mb = 512;
    double cpus = 1.0;
    int pids_limit = 50;
    std::size_t max_output_bytes = 64 * 1024;
};

struct Environment {
    std::string id;
    std::filesystem::path root;
    std::filesystem::path work_dir;
};

class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;
    virtual std::string Name() const = 0;
    virtual bool IsAvailable() = 0;
    virtual Environment Create() = 0;
    virtual ExecResult Exec(const Environment& env,
                            const std::vector<std::string>& command,
                            const ResourceLimits& limits) = 0;
    // Must not throw; called from scope guards.
    virtual void Destroy(const Environment& env) = 0;
};

std::string MakeEnvironmentId();
std::filesystem::path ResolveWorkRoot(const std::string& configured);
Environment CreateRunDirectories(const std::filesystem::path& work_root, const std::string& id);
void RemoveRunDirectories(const Environment& env);

std::unique_ptr<ContainerRuntime> CreateContainerRuntime(const selfrepair::config::SandboxConfig& config);

}  // namespace selfrepair::sandbox
