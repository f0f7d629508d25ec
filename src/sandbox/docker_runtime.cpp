#include "sandbox/docker_runtime.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace selfrepair::sandbox {
namespace {

constexpr int kDockerDaemonError = 125;

std::string FormatCpus(double cpus) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << cpus;
    return out.str();
}

}  // namespace

DockerRuntime::DockerRuntime(selfrepair::config::SandboxConfig config)
    : config_(std::move(config))
    , work_root_(ResolveWorkRoot(config_.work_root)) {}

ExecResult DockerRuntime::RunDockerCli(const Environment& env,
                                       const std::vector<std::string>& argv,
                                       std::chrono::milliseconds timeout,
                                       const std::string& label) const {
    const auto log_dir = env.root.empty() ? work_root_ : env.root;
    ProcessSpec spec{};
    spec.argv = argv;
    spec.working_dir = log_dir;
    spec.stdout_path = log_dir / (label + ".stdout.log");
    spec.stderr_path = log_dir / (label + ".stderr.log");
    spec.timeout = timeout;
    spec.kill_grace = std::chrono::milliseconds(500);
    spec.max_output_bytes = 16 * 1024;
    auto result = RunProcess(spec);
    std::error_code ec;
    std::filesystem::remove(spec.stdout_path, ec);
    std::filesystem::remove(spec.stderr_path, ec);
    return result;
}

bool DockerRuntime::IsAvailable() {
    std::error_code ec;
    std::filesystem::create_directories(work_root_, ec);
    if (ec) {
        return false;
    }
    Environment scratch{};
    const auto info = RunDockerCli(scratch, {"docker", "info"}, std::chrono::seconds(5), "docker-info");
    if (info.spawn_failed || info.timed_out || info.exit_code != 0) {
        return false;
    }
    const auto image = RunDockerCli(
        scratch, {"docker", "image", "inspect", config_.image}, std::chrono::seconds(5), "docker-image");
    return !image.spawn_failed && !image.timed_out && image.exit_code == 0;
}

Environment DockerRuntime::Create() {
    return CreateRunDirectories(work_root_, MakeEnvironmentId());
}

std::vector<std::string> DockerRuntime::BuildRunCommand(const Environment& env,
                                                        const std::vector<std::string>& command,
                                                        const ResourceLimits& limits) const {
    const auto memory = std::to_string(limits.memory_mb) + "m";
    std::vector<std::string> argv = {
        "docker", "run",
        "--name", env.id,
        "--network=none",
        "--memory=" + memory,
        "--memory-swap=" + memory,
        "--cpus=" + FormatCpus(limits.cpus),
        "--pids-limit=" + std::to_string(limits.pids_limit),
        "--read-only",
        "--tmpfs", "/tmp:rw,noexec,size=16m",
        "--cap-drop=ALL",
        "--security-opt", "no-new-privileges",
        "-e", "PYTHONDONTWRITEBYTECODE=1",
        "-e", "PYTHONHASHSEED=0",
        "-v", env.work_dir.string() + ":/work:ro",
        "-w", "/work"
    };
    if (!config_.user.empty()) {
        argv.push_back("--user");
        argv.push_back(config_.user);
    }
    argv.push_back(config_.image);
    argv.insert(argv.end(), command.begin(), command.end());
    return argv;
}

ExecResult DockerRuntime::Exec(const Environment& env,
                               const std::vector<std::string>& command,
                               const ResourceLimits& limits) {
    ProcessSpec spec{};
    spec.argv = BuildRunCommand(env, command, limits);
    spec.working_dir = env.root;
    spec.stdout_path = env.root / "stdout.log";
    spec.stderr_path = env.root / "stderr.log";
    spec.timeout = limits.timeout;
    spec.kill_grace = limits.kill_grace;
    spec.max_output_bytes = limits.max_output_bytes;

    utils::Log(utils::LogLevel::kDebug, "sandbox", "docker run", {
        {"id", env.id},
        {"image", config_.image}});
    auto result = RunProcess(spec);

    if (result.spawn_failed) {
        throw ProvisioningError("docker unavailable: " + result.error);
    }
    // BuildRunCommand always passes --network=none.
    result.network_isolated = true;
    if (result.timed_out) {
        // Killing the CLI client does not stop the container.
        RunDockerCli(env, {"docker", "kill", env.id}, std::chrono::seconds(10), "docker-kill");
        return result;
    }
    if (result.exit_code == kDockerDaemonError) {
        throw ProvisioningError("docker run failed: " + utils::Trim(result.error));
    }
    if (result.exit_code > 128) {
        result.term_signal = result.exit_code - 128;
    }
    if (WasOomKilled(env)) {
        result.resource_exceeded = true;
    }
    return result;
}

bool DockerRuntime::WasOomKilled(const Environment& env) const {
    const auto inspect = RunDockerCli(
        env,
        {"docker", "inspect", "--format", "{{.State.OOMKilled}}", env.id},
        std::chrono::seconds(10),
        "docker-inspect");
    return inspect.exit_code == 0 && utils::Trim(inspect.output) == "true";
}

void DockerRuntime::Destroy(const Environment& env) {
    const auto removed = RunDockerCli(
        env, {"docker", "rm", "-f", env.id}, std::chrono::seconds(15), "docker-rm");
    if (removed.spawn_failed || removed.timed_out) {
        utils::Log(utils::LogLevel::kWarn, "sandbox", "docker rm failed", {
            {"id", env.id},
            {"error", utils::Trim(removed.error)}});
    }
    RemoveRunDirectories(env);
}

}  // namespace selfrepair::sandbox
