#pragma once

#include <string>
#include <vector>

namespace selfrepair::config {

struct LoopConfig {
    int max_attempts = 3;
    bool blocked_counts_toward_budget = true;
    int max_free_rerolls = 2;
    bool stop_on_repeated_error = false;
};

struct SandboxConfig {
    std::string backend = "docker";
    std::string image = "code-runner:latest";
    int timeout_s = 15;
    int memory_mb = 512;
    double cpus = 1.0;
    int pids_limit = 50;
    std::string user = "sandbox";
    int run_uid = 65534;
    int run_gid = 65534;
    std::string work_root;
    std::vector<std::string> test_command = {
        "python3", "-m", "pytest", "-q", "-p", "no:cacheprovider", "test_solution.py"};
    std::size_t max_output_bytes = 64 * 1024;
    int kill_grace_ms = 2000;
    bool strict_isolation = false;
};

struct GuardrailPattern {
    std::string category;
    std::string pattern;
};

struct GuardrailConfig {
    bool enabled = true;
    std::vector<GuardrailPattern> extra_patterns;
};

struct GeneratorConfig {
    std::string model = "llama-3.3-70b-versatile";
    int max_tokens = 512;
    double temperature = 0.2;
    int timeout_s = 60;
};

struct ProviderConfig {
    std::string api_key;
    std::string api_base;
};

struct ProvidersConfig {
    ProviderConfig openrouter;
    ProviderConfig openai;
    ProviderConfig anthropic;
    ProviderConfig groq;
    ProviderConfig ollama;
    ProviderConfig vllm;
    bool use_proxy_for_llm = false;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    LoopConfig loop;
    SandboxConfig sandbox;
    GuardrailConfig guardrails;
    GeneratorConfig generator;
    ProvidersConfig providers;
    LoggingConfig logging;
};

}  // namespace selfrepair::config
