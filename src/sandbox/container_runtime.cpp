#include "sandbox/container_runtime.hpp"

#include <atomic>
#include <iomanip>
#include <random>
#include <sstream>
#include <unistd.h>

#include "sandbox/docker_runtime.hpp"
#include "sandbox/process_jail_runtime.hpp"
#include "utils/logging.hpp"

namespace selfrepair::sandbox {
namespace {

std::atomic<unsigned long> g_environment_counter{0};

}  // namespace

std::string MakeEnvironmentId() {
    thread_local std::mt19937_64 generator{std::random_device{}()};
    std::ostringstream id;
    id << "selfrepair-" << ::getpid() << "-" << g_environment_counter.fetch_add(1) << "-"
       << std::hex << std::setw(8) << std::setfill('0') << (generator() & 0xffffffffULL);
    return id.str();
}

std::filesystem::path ResolveWorkRoot(const std::string& configured) {
    if (!configured.empty()) {
        return std::filesystem::path(configured);
    }
    std::error_code ec;
    auto temp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        temp = "/tmp";
    }
    return temp / "selfrepair";
}

Environment CreateRunDirectories(const std::filesystem::path& work_root, const std::string& id) {
    Environment env{};
    env.id = id;
    env.root = work_root / id;
    env.work_dir = env.root / "work";

    std::error_code ec;
    std::filesystem::create_directories(env.work_dir, ec);
    if (ec) {
        throw ProvisioningError("cannot create run directory " + env.work_dir.string() + ": " + ec.message());
    }
    using std::filesystem::perms;
    std::filesystem::permissions(env.root, perms::owner_all | perms::group_exec | perms::others_exec, ec);
    if (!ec) {
        std::filesystem::permissions(
            env.work_dir,
            perms::owner_all | perms::group_read | perms::group_exec | perms::others_read | perms::others_exec,
            ec);
    }
    if (ec) {
        RemoveRunDirectories(env);
        throw ProvisioningError("cannot set permissions on " + env.root.string() + ": " + ec.message());
    }
    return env;
}

void RemoveRunDirectories(const Environment& env) {
    if (env.root.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(env.root, ec);
    if (ec) {
        utils::Log(utils::LogLevel::kWarn, "sandbox", "failed to remove run directory", {
            {"path", env.root.string()},
            {"error", ec.message()}});
    }
}

std::unique_ptr<ContainerRuntime> CreateContainerRuntime(const selfrepair::config::SandboxConfig& config) {
    if (config.backend == "docker") {
        return std::make_unique<DockerRuntime>(config);
    }
    if (config.backend == "process") {
        return std::make_unique<ProcessJailRuntime>(config);
    }
    throw ProvisioningError("unknown sandbox backend: " + config.backend);
}

}  // namespace selfrepair::sandbox
