#include "sandbox/process_runner.hpp"

#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <thread>
#include <grp.h>
#include <sched.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace selfrepair::sandbox {
namespace bp = boost::process;

namespace {

void WriteStderr(const char* text) {
    const auto written = ::write(STDERR_FILENO, text, std::strlen(text));
    (void)written;
}

// Only async-signal-safe calls: the parent may be multithreaded.
void FailSetup(const char* step) {
    const int saved = errno;
    WriteStderr(kSetupFailurePrefix);
    WriteStderr(" ");
    WriteStderr(step);
    WriteStderr(": ");
    WriteStderr(std::strerror(saved));
    WriteStderr("\n");
    ::_exit(kSetupFailureExitCode);
}

// Runs in the forked child right before execve.
void ApplyChildLimits(const ProcessLimits& limits) {
    ::setpgid(0, 0);

    bool user_namespace = false;
    if (limits.isolate_network && ::unshare(CLONE_NEWNET) != 0) {
        if (::unshare(CLONE_NEWUSER | CLONE_NEWNET) == 0) {
            user_namespace = true;
        } else if (limits.require_network_isolation) {
            FailSetup("unshare(CLONE_NEWNET)");
        } else {
            WriteStderr(kIsolationNotice);
        }
    }

    if (limits.memory_bytes > 0) {
        rlimit memory{};
        memory.rlim_cur = limits.memory_bytes;
        memory.rlim_max = limits.memory_bytes;
        if (::setrlimit(RLIMIT_AS, &memory) != 0) {
            FailSetup("setrlimit(RLIMIT_AS)");
        }
    }
    if (limits.file_size_bytes > 0) {
        rlimit file_size{};
        file_size.rlim_cur = limits.file_size_bytes;
        file_size.rlim_max = limits.file_size_bytes;
        if (::setrlimit(RLIMIT_FSIZE, &file_size) != 0) {
            FailSetup("setrlimit(RLIMIT_FSIZE)");
        }
    }
    rlimit no_core{};
    ::setrlimit(RLIMIT_CORE, &no_core);

    // An unmapped user namespace already runs as the overflow id and cannot setuid.
    if (user_namespace) {
        return;
    }
    if (limits.gid >= 0) {
        if (::setgroups(0, nullptr) != 0) {
            FailSetup("setgroups");
        }
        if (::setgid(static_cast<gid_t>(limits.gid)) != 0) {
            FailSetup("setgid");
        }
    }
    if (limits.uid >= 0 && ::setuid(static_cast<uid_t>(limits.uid)) != 0) {
        FailSetup("setuid");
    }
}

std::string ReadCapped(const std::filesystem::path& path, std::size_t limit, bool& truncated) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::string data;
    data.resize(limit);
    input.read(data.data(), static_cast<std::streamsize>(limit));
    data.resize(static_cast<std::size_t>(input.gcount()));
    if (input.peek() != std::char_traits<char>::eof()) {
        truncated = true;
    }
    return data;
}

// Waits for the child to exit without reaping it. The zombie keeps the pid,
// and with it the process group id, reserved until the group is swept.
bool ExitedWithin(pid_t pid, std::chrono::steady_clock::time_point deadline) {
    while (std::chrono::steady_clock::now() < deadline) {
        siginfo_t info{};
        const int rc = ::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT);
        if (rc == 0 && info.si_pid == pid) {
            return true;
        }
        if (rc < 0 && errno != EINTR) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return false;
}

bool Reap(pid_t pid, int& status, rusage& usage) {
    for (;;) {
        const auto waited = ::wait4(pid, &status, 0, &usage);
        if (waited == pid) {
            return true;
        }
        if (waited < 0 && errno != EINTR) {
            return false;
        }
    }
}

}  // namespace

ExecResult RunProcess(const ProcessSpec& spec) {
    ExecResult result{};
    if (spec.argv.empty()) {
        result.spawn_failed = true;
        result.error = "Error: empty command";
        return result;
    }

    boost::filesystem::path exe = spec.argv.front();
    if (spec.argv.front().find('/') == std::string::npos) {
        exe = bp::search_path(spec.argv.front());
        if (exe.empty()) {
            result.spawn_failed = true;
            result.error = "Error: executable not found: " + spec.argv.front();
            return result;
        }
    }
    const std::vector<std::string> args(spec.argv.begin() + 1, spec.argv.end());

    bp::environment env = spec.inherit_environment
        ? bp::environment(boost::this_process::environment())
        : bp::environment();
    for (const auto& [key, value] : spec.environment) {
        env[key] = value;
    }

    const ProcessLimits limits = spec.limits;
    const auto started = utils::Now();
    int status = 0;
    rusage usage{};
    bool finished = false;
    pid_t pid = -1;

    try {
        bp::child child_process(
            bp::exe = exe,
            bp::args = args,
            env,
            bp::start_dir = spec.working_dir.string(),
            bp::std_in < bp::null,
            bp::std_out > spec.stdout_path.string(),
            bp::std_err > spec.stderr_path.string(),
            bp::extend::on_exec_setup = [limits](auto&) { ApplyChildLimits(limits); });

        pid = child_process.id();
        bool exited = ExitedWithin(pid, started + spec.timeout);
        if (!exited) {
            result.timed_out = true;
            ::kill(-pid, SIGTERM);
            ::kill(pid, SIGTERM);
            exited = ExitedWithin(pid, utils::Now() + spec.kill_grace);
            if (!exited) {
                ::kill(-pid, SIGKILL);
                ::kill(pid, SIGKILL);
                exited = ExitedWithin(pid, utils::Now() + std::chrono::seconds(5));
            }
        }
        // The leader is still unreaped here, so the group id cannot have
        // been handed to another process yet.
        ::kill(-pid, SIGKILL);
        finished = exited && Reap(pid, status, usage);
        child_process.detach();
    } catch (const bp::process_error& ex) {
        result.spawn_failed = true;
        result.error = std::string("Error: exec failed: ") + ex.what();
        result.elapsed = utils::ElapsedSince(started);
        return result;
    }

    result.elapsed = utils::ElapsedSince(started);
    if (finished) {
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.term_signal = WTERMSIG(status);
            result.exit_code = 128 + result.term_signal;
        }
        result.max_rss_kb = usage.ru_maxrss;
    } else {
        utils::Log(utils::LogLevel::kError, "sandbox", "child could not be reaped after SIGKILL", {
            {"pid", std::to_string(pid)}});
        result.exit_code = 124;
    }

    if (limits.memory_bytes > 0 &&
        static_cast<std::size_t>(result.max_rss_kb) * 1024 >= limits.memory_bytes / 100 * 95) {
        result.resource_exceeded = true;
    }

    bool truncated = false;
    result.output = ReadCapped(spec.stdout_path, spec.max_output_bytes, truncated);
    result.error = ReadCapped(spec.stderr_path, spec.max_output_bytes, truncated);
    result.output_truncated = truncated;
    result.network_isolated = limits.isolate_network && !StripIsolationNotice(result.error);
    return result;
}

bool StripIsolationNotice(std::string& stderr_text) {
    const std::string notice = kIsolationNotice;
    if (stderr_text.compare(0, notice.size(), notice) != 0) {
        return false;
    }
    stderr_text.erase(0, notice.size());
    return true;
}

}  // namespace selfrepair::sandbox
