#include "sandbox/process_jail_runtime.hpp"

#include <cstdlib>
#include <utility>
#include <unistd.h>

#include "utils/logging.hpp"

namespace selfrepair::sandbox {
namespace {

constexpr std::size_t kMaxFileSizeBytes = 16 * 1024 * 1024;

std::string GetEnv(const char* name, const char* fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string(fallback);
}

}  // namespace

ProcessJailRuntime::ProcessJailRuntime(selfrepair::config::SandboxConfig config)
    : config_(std::move(config))
    , work_root_(ResolveWorkRoot(config_.work_root))
    , drop_privileges_(::geteuid() == 0) {}

bool ProcessJailRuntime::IsAvailable() {
    std::error_code ec;
    std::filesystem::create_directories(work_root_, ec);
    return !ec;
}

Environment ProcessJailRuntime::Create() {
    auto env = CreateRunDirectories(work_root_, MakeEnvironmentId());
    if (drop_privileges_ &&
        ::chown(env.work_dir.c_str(),
                static_cast<uid_t>(config_.run_uid),
                static_cast<gid_t>(config_.run_gid)) != 0) {
        RemoveRunDirectories(env);
        throw ProvisioningError("cannot hand " + env.work_dir.string() + " to uid " +
                                std::to_string(config_.run_uid));
    }
    return env;
}

ExecResult ProcessJailRuntime::Exec(const Environment& env,
                                    const std::vector<std::string>& command,
                                    const ResourceLimits& limits) {
    ProcessSpec spec{};
    spec.argv = command;
    spec.working_dir = env.work_dir;
    spec.stdout_path = env.root / "stdout.log";
    spec.stderr_path = env.root / "stderr.log";
    spec.inherit_environment = false;
    spec.environment = {
        {"PATH", GetEnv("PATH", "/usr/local/bin:/usr/bin:/bin")},
        {"HOME", env.work_dir.string()},
        {"TMPDIR", env.work_dir.string()},
        {"LANG", "C.UTF-8"},
        {"PYTHONDONTWRITEBYTECODE", "1"},
        {"PYTHONHASHSEED", "0"},
        {"PYTHONUNBUFFERED", "1"}
    };
    spec.timeout = limits.timeout;
    spec.kill_grace = limits.kill_grace;
    spec.max_output_bytes = limits.max_output_bytes;
    spec.limits.memory_bytes = limits.memory_mb * 1024 * 1024;
    spec.limits.file_size_bytes = kMaxFileSizeBytes;
    spec.limits.isolate_network = true;
    spec.limits.require_network_isolation = config_.strict_isolation;
    if (drop_privileges_) {
        spec.limits.uid = config_.run_uid;
        spec.limits.gid = config_.run_gid;
    }

    utils::Log(utils::LogLevel::kDebug, "sandbox", "process jail exec", {
        {"id", env.id},
        {"command", command.empty() ? std::string() : command.front()}});
    auto result = RunProcess(spec);
    if (result.spawn_failed) {
        throw ProvisioningError("cannot start sandboxed process: " + result.error);
    }
    if (!result.timed_out && result.exit_code == kSetupFailureExitCode &&
        result.error.rfind(kSetupFailurePrefix, 0) == 0) {
        throw ProvisioningError("sandbox jail setup failed: " + result.error);
    }
    if (!result.network_isolated) {
        utils::Log(utils::LogLevel::kWarn, "sandbox", "submission ran without network isolation", {
            {"id", env.id},
            {"hint", "set sandbox.strictIsolation to refuse such runs"}});
    }
    return result;
}

void ProcessJailRuntime::Destroy(const Environment& env) {
    RemoveRunDirectories(env);
}

}  // namespace selfrepair::sandbox
