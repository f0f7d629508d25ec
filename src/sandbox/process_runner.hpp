#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace selfrepair::sandbox {

// Exit status used by the child when a jail setup step fails before exec.
inline constexpr int kSetupFailureExitCode = 121;
inline constexpr const char* kSetupFailurePrefix = "sandbox-setup:";
// First stderr line of a child that had to run without a private network namespace.
inline constexpr const char* kIsolationNotice = "sandbox-notice: network isolation unavailable\n";

struct ProcessLimits {
    std::size_t memory_bytes = 0;
    std::size_t file_size_bytes = 0;
    bool isolate_network = false;
    bool require_network_isolation = false;
    int uid = -1;
    int gid = -1;
};

struct ProcessSpec {
    std::vector<std::string> argv;
    std::filesystem::path working_dir;
    std::filesystem::path stdout_path;
    std::filesystem::path stderr_path;
    std::map<std::string, std::string> environment;
    bool inherit_environment = true;
    std::chrono::milliseconds timeout{15000};
    std::chrono::milliseconds kill_grace{2000};
    std::size_t max_output_bytes = 64 * 1024;
    ProcessLimits limits;
};

struct ExecResult {
    int exit_code = -1;
    int term_signal = 0;
    bool timed_out = false;
    bool spawn_failed = false;
    bool resource_exceeded = false;
    bool output_truncated = false;
    bool network_isolated = false;
    long max_rss_kb = 0;
    std::string output;
    std::string error;
    std::chrono::milliseconds elapsed{0};
};

ExecResult RunProcess(const ProcessSpec& spec);

// Removes a leading kIsolationNotice; true when one was present.
bool StripIsolationNotice(std::string& stderr_text);

}  // namespace selfrepair::sandbox
