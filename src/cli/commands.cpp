#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "config/config_loader.hpp"
#include "generator/llm_code_generator.hpp"
#include "guard/guardrail_scanner.hpp"
#include "loop/batch_evaluator.hpp"
#include "loop/report_json.hpp"
#include "providers/llm_provider.hpp"
#include "sandbox/container_runtime.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "task/task_loader.hpp"
#include "utils/logging.hpp"
#include "nlohmann/json.hpp"

namespace {

constexpr int kExitAllSolved = 0;
constexpr int kExitUnsolved = 1;
constexpr int kExitUsage = 2;
constexpr int kExitProvisioning = 3;

struct SolveOptions {
    std::vector<std::string> task_files;
    std::optional<std::string> config_path;
    std::optional<int> max_attempts;
    int jobs = 1;
    std::optional<std::string> out_path;
};

void PrintUsage() {
    std::cout << "Usage:\n"
              << "  selfrepair_cli solve <task.json>... [--config F] [--max-attempts N] [--jobs N] [--out F]\n"
              << "  selfrepair_cli screen <file.py> [--config F]\n"
              << "  selfrepair_cli doctor [--config F]" << std::endl;
}

bool ParsePositiveInt(const std::string& text, int& out) {
    try {
        std::size_t used = 0;
        const int value = std::stoi(text, &used);
        if (used != text.size() || value <= 0) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// Returns false and prints the reason on malformed arguments.
bool ParseSolveOptions(int argc, char** argv, SolveOptions& options) {
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--config" || arg == "--max-attempts" || arg == "--jobs" || arg == "--out") {
            if (!has_value) {
                std::cerr << arg << " needs a value" << std::endl;
                return false;
            }
            const std::string value = argv[++i];
            if (arg == "--config") {
                options.config_path = value;
            } else if (arg == "--out") {
                options.out_path = value;
            } else {
                int parsed = 0;
                if (!ParsePositiveInt(value, parsed)) {
                    std::cerr << arg << " expects a positive integer, got '" << value << "'" << std::endl;
                    return false;
                }
                if (arg == "--jobs") {
                    options.jobs = parsed;
                } else {
                    options.max_attempts = parsed;
                }
            }
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "unknown option " << arg << std::endl;
            return false;
        } else {
            options.task_files.push_back(arg);
        }
    }
    if (options.task_files.empty()) {
        std::cerr << "solve needs at least one task file" << std::endl;
        return false;
    }
    return true;
}

std::optional<std::string> FindOption(int argc, char** argv, const std::string& name) {
    for (int i = 2; i + 1 < argc; ++i) {
        if (argv[i] == name) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

selfrepair::config::Config LoadCliConfig(const std::optional<std::string>& path) {
    auto config = path ? selfrepair::config::LoadConfig(*path) : selfrepair::config::LoadConfig();
    selfrepair::utils::SetLogConfig(selfrepair::utils::LogConfig{
        .min_level = selfrepair::utils::ParseLogLevel(config.logging.level)});
    return config;
}

int RunSolve(int argc, char** argv) {
    SolveOptions options{};
    if (!ParseSolveOptions(argc, argv, options)) {
        PrintUsage();
        return kExitUsage;
    }
    const auto config = LoadCliConfig(options.config_path);

    std::vector<selfrepair::task::Task> tasks;
    try {
        for (const auto& file : options.task_files) {
            tasks.push_back(selfrepair::task::LoadTask(file));
        }
    } catch (const selfrepair::task::TaskFormatError& ex) {
        std::cerr << "invalid task: " << ex.what() << std::endl;
        return kExitUsage;
    }

    std::unique_ptr<selfrepair::sandbox::ContainerRuntime> runtime;
    try {
        runtime = selfrepair::sandbox::CreateContainerRuntime(config.sandbox);
    } catch (const selfrepair::sandbox::ProvisioningError& ex) {
        std::cerr << "sandbox unavailable: " << ex.what() << std::endl;
        return kExitProvisioning;
    }
    if (!runtime->IsAvailable()) {
        std::cerr << "sandbox backend '" << runtime->Name() << "' is not available; run 'selfrepair_cli doctor'"
                  << std::endl;
        return kExitProvisioning;
    }

    selfrepair::sandbox::SandboxExecutor executor(std::move(runtime), config.sandbox);
    selfrepair::guard::GuardrailScanner scanner(config.guardrails);
    selfrepair::generator::LlmCodeGenerator generator(
        selfrepair::providers::CreateProvider(config),
        config.generator);

    selfrepair::loop::BatchEvaluator batch(generator, scanner, executor, config.loop, options.jobs);
    const auto items = batch.Run(tasks, options.max_attempts.value_or(config.loop.max_attempts));
    auto json = items.size() == 1
        ? selfrepair::loop::ReportToJson(items.front().report)
        : selfrepair::loop::BatchToJson(items);
    if (items.size() == 1 && !items.front().infrastructure_error.empty()) {
        json["infrastructureError"] = items.front().infrastructure_error;
    }

    if (options.out_path) {
        std::ofstream output(*options.out_path, std::ios::trunc);
        if (!output.is_open()) {
            std::cerr << "cannot write " << *options.out_path << std::endl;
            return kExitUsage;
        }
        output << json.dump(2) << std::endl;
    } else {
        std::cout << json.dump(2) << std::endl;
    }

    bool all_solved = true;
    for (const auto& item : items) {
        if (!item.infrastructure_error.empty()) {
            std::cerr << "[" << item.report.task_id << "] infrastructure failure: "
                      << item.infrastructure_error << std::endl;
            return kExitProvisioning;
        }
        all_solved = all_solved && item.report.outcome.succeeded;
    }
    return all_solved ? kExitAllSolved : kExitUnsolved;
}

int RunScreen(int argc, char** argv) {
    if (argc < 3) {
        PrintUsage();
        return kExitUsage;
    }
    std::ifstream input(argv[2]);
    if (!input.is_open()) {
        std::cerr << "cannot open " << argv[2] << std::endl;
        return kExitUsage;
    }
    std::stringstream buffer;
    buffer << input.rdbuf();

    const auto config = LoadCliConfig(FindOption(argc, argv, "--config"));
    selfrepair::guard::GuardrailScanner scanner(config.guardrails);
    const auto result = scanner.Screen(buffer.str());
    if (result.Allowed()) {
        std::cout << "ALLOW" << std::endl;
        return 0;
    }
    std::cout << "BLOCK " << result.reason << std::endl;
    return 1;
}

int RunDoctor(int argc, char** argv) {
    const auto config = LoadCliConfig(FindOption(argc, argv, "--config"));
    const auto settings = selfrepair::providers::ResolveProviderSettings(config);
    std::cout << "provider: " << settings.name << " (" << settings.api_base << ")"
              << " model=" << settings.model << std::endl;

    try {
        auto runtime = selfrepair::sandbox::CreateContainerRuntime(config.sandbox);
        const bool available = runtime->IsAvailable();
        std::cout << "sandbox: " << runtime->Name() << " " << (available ? "available" : "NOT available")
                  << std::endl;
        return available ? 0 : kExitProvisioning;
    } catch (const selfrepair::sandbox::ProvisioningError& ex) {
        std::cout << "sandbox: " << ex.what() << std::endl;
        return kExitProvisioning;
    }
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return kExitUsage;
    }
    const std::string command = argv[1];
    try {
        if (command == "solve") {
            return RunSolve(argc, argv);
        }
        if (command == "screen") {
            return RunScreen(argc, argv);
        }
        if (command == "doctor") {
            return RunDoctor(argc, argv);
        }
    } catch (const selfrepair::sandbox::ProvisioningError& ex) {
        std::cerr << "provisioning failed: " << ex.what() << std::endl;
        return kExitProvisioning;
    }
    PrintUsage();
    return kExitUsage;
}
