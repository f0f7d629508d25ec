#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "utils/logging.hpp"

namespace selfrepair::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void ApplyProviderConfig(ProviderConfig& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    if (source.contains("apiKey") && source["apiKey"].is_string()) {
        target.api_key = source["apiKey"].get<std::string>();
    }
    if (source.contains("apiBase") && source["apiBase"].is_string()) {
        target.api_base = source["apiBase"].get<std::string>();
    }
}

void ApplyProviderEnv(ProviderConfig& target, const std::string& name) {
    const auto key_primary = "SELFREPAIR_PROVIDERS__" + name + "__API_KEY";
    const auto key_secondary = "SELFREPAIR_PROVIDERS_" + name + "_API_KEY";
    const auto api_key = GetEnvFallback(key_primary.c_str(), key_secondary.c_str());
    if (!api_key.empty()) {
        target.api_key = api_key;
    }
    const auto base_primary = "SELFREPAIR_PROVIDERS__" + name + "__API_BASE";
    const auto base_secondary = "SELFREPAIR_PROVIDERS_" + name + "_API_BASE";
    const auto api_base = GetEnvFallback(base_primary.c_str(), base_secondary.c_str());
    if (!api_base.empty()) {
        target.api_base = api_base;
    }
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    return GetHomePath() / ".selfrepair" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("loop") && data["loop"].is_object()) {
        const auto& loop = data["loop"];
        if (loop.contains("maxAttempts") && loop["maxAttempts"].is_number_integer()) {
            config.loop.max_attempts = loop["maxAttempts"].get<int>();
        }
        if (loop.contains("blockedCountsTowardBudget") && loop["blockedCountsTowardBudget"].is_boolean()) {
            config.loop.blocked_counts_toward_budget = loop["blockedCountsTowardBudget"].get<bool>();
        }
        if (loop.contains("maxFreeRerolls") && loop["maxFreeRerolls"].is_number_integer()) {
            config.loop.max_free_rerolls = loop["maxFreeRerolls"].get<int>();
        }
        if (loop.contains("stopOnRepeatedError") && loop["stopOnRepeatedError"].is_boolean()) {
            config.loop.stop_on_repeated_error = loop["stopOnRepeatedError"].get<bool>();
        }
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        if (sandbox.contains("backend") && sandbox["backend"].is_string()) {
            config.sandbox.backend = sandbox["backend"].get<std::string>();
        }
        if (sandbox.contains("image") && sandbox["image"].is_string()) {
            config.sandbox.image = sandbox["image"].get<std::string>();
        }
        if (sandbox.contains("timeoutS") && sandbox["timeoutS"].is_number_integer()) {
            config.sandbox.timeout_s = sandbox["timeoutS"].get<int>();
        }
        if (sandbox.contains("memoryMb") && sandbox["memoryMb"].is_number_integer()) {
            config.sandbox.memory_mb = sandbox["memoryMb"].get<int>();
        }
        if (sandbox.contains("cpus") && sandbox["cpus"].is_number()) {
            config.sandbox.cpus = sandbox["cpus"].get<double>();
        }
        if (sandbox.contains("pidsLimit") && sandbox["pidsLimit"].is_number_integer()) {
            config.sandbox.pids_limit = sandbox["pidsLimit"].get<int>();
        }
        if (sandbox.contains("user") && sandbox["user"].is_string()) {
            config.sandbox.user = sandbox["user"].get<std::string>();
        }
        if (sandbox.contains("runUid") && sandbox["runUid"].is_number_integer()) {
            config.sandbox.run_uid = sandbox["runUid"].get<int>();
        }
        if (sandbox.contains("runGid") && sandbox["runGid"].is_number_integer()) {
            config.sandbox.run_gid = sandbox["runGid"].get<int>();
        }
        if (sandbox.contains("workRoot") && sandbox["workRoot"].is_string()) {
            config.sandbox.work_root = sandbox["workRoot"].get<std::string>();
        }
        if (sandbox.contains("testCommand") && sandbox["testCommand"].is_array()) {
            std::vector<std::string> command;
            for (const auto& item : sandbox["testCommand"]) {
                if (item.is_string()) {
                    command.push_back(item.get<std::string>());
                }
            }
            if (!command.empty()) {
                config.sandbox.test_command = command;
            }
        }
        if (sandbox.contains("maxOutputBytes") && sandbox["maxOutputBytes"].is_number_unsigned()) {
            config.sandbox.max_output_bytes = sandbox["maxOutputBytes"].get<std::size_t>();
        }
        if (sandbox.contains("killGraceMs") && sandbox["killGraceMs"].is_number_integer()) {
            config.sandbox.kill_grace_ms = sandbox["killGraceMs"].get<int>();
        }
        if (sandbox.contains("strictIsolation") && sandbox["strictIsolation"].is_boolean()) {
            config.sandbox.strict_isolation = sandbox["strictIsolation"].get<bool>();
        }
    }

    if (data.contains("guardrails") && data["guardrails"].is_object()) {
        const auto& guardrails = data["guardrails"];
        if (guardrails.contains("enabled") && guardrails["enabled"].is_boolean()) {
            config.guardrails.enabled = guardrails["enabled"].get<bool>();
        }
        if (guardrails.contains("extraPatterns") && guardrails["extraPatterns"].is_array()) {
            config.guardrails.extra_patterns.clear();
            for (const auto& item : guardrails["extraPatterns"]) {
                if (!item.is_object()) {
                    continue;
                }
                GuardrailPattern pattern{};
                pattern.category = item.value("category", "");
                pattern.pattern = item.value("pattern", "");
                if (!pattern.category.empty() && !pattern.pattern.empty()) {
                    config.guardrails.extra_patterns.push_back(pattern);
                }
            }
        }
    }

    if (data.contains("generator") && data["generator"].is_object()) {
        const auto& generator = data["generator"];
        if (generator.contains("model") && generator["model"].is_string()) {
            config.generator.model = generator["model"].get<std::string>();
        }
        if (generator.contains("maxTokens") && generator["maxTokens"].is_number_integer()) {
            config.generator.max_tokens = generator["maxTokens"].get<int>();
        }
        if (generator.contains("temperature") && generator["temperature"].is_number()) {
            config.generator.temperature = generator["temperature"].get<double>();
        }
        if (generator.contains("timeoutS") && generator["timeoutS"].is_number_integer()) {
            config.generator.timeout_s = generator["timeoutS"].get<int>();
        }
    }

    if (data.contains("providers") && data["providers"].is_object()) {
        const auto& providers = data["providers"];
        if (providers.contains("useProxyForLLM") && providers["useProxyForLLM"].is_boolean()) {
            config.providers.use_proxy_for_llm = providers["useProxyForLLM"].get<bool>();
        }
        if (providers.contains("openrouter")) {
            ApplyProviderConfig(config.providers.openrouter, providers["openrouter"]);
        }
        if (providers.contains("openai")) {
            ApplyProviderConfig(config.providers.openai, providers["openai"]);
        }
        if (providers.contains("anthropic")) {
            ApplyProviderConfig(config.providers.anthropic, providers["anthropic"]);
        }
        if (providers.contains("groq")) {
            ApplyProviderConfig(config.providers.groq, providers["groq"]);
        }
        if (providers.contains("ollama")) {
            ApplyProviderConfig(config.providers.ollama, providers["ollama"]);
        }
        if (providers.contains("vllm")) {
            ApplyProviderConfig(config.providers.vllm, providers["vllm"]);
        }
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            config.logging.level = logging["level"].get<std::string>();
        }
    }
}

void ApplyEnvironmentOverrides(Config& config) {
    const auto max_attempts = GetEnvFallback(
        "SELFREPAIR_LOOP__MAX_ATTEMPTS",
        "SELFREPAIR_LOOP_MAX_ATTEMPTS");
    if (!max_attempts.empty()) {
        config.loop.max_attempts = ParseInt(max_attempts, config.loop.max_attempts);
    }

    const auto blocked_counts = GetEnvFallback(
        "SELFREPAIR_LOOP__BLOCKED_COUNTS_TOWARD_BUDGET",
        "SELFREPAIR_LOOP_BLOCKED_COUNTS_TOWARD_BUDGET");
    if (!blocked_counts.empty()) {
        config.loop.blocked_counts_toward_budget = ParseBool(blocked_counts);
    }

    const auto max_free_rerolls = GetEnvFallback(
        "SELFREPAIR_LOOP__MAX_FREE_REROLLS",
        "SELFREPAIR_LOOP_MAX_FREE_REROLLS");
    if (!max_free_rerolls.empty()) {
        config.loop.max_free_rerolls = ParseInt(max_free_rerolls, config.loop.max_free_rerolls);
    }

    const auto stop_on_repeated = GetEnvFallback(
        "SELFREPAIR_LOOP__STOP_ON_REPEATED_ERROR",
        "SELFREPAIR_LOOP_STOP_ON_REPEATED_ERROR");
    if (!stop_on_repeated.empty()) {
        config.loop.stop_on_repeated_error = ParseBool(stop_on_repeated);
    }

    const auto backend = GetEnvFallback(
        "SELFREPAIR_SANDBOX__BACKEND",
        "SELFREPAIR_SANDBOX_BACKEND");
    if (!backend.empty()) {
        config.sandbox.backend = backend;
    }

    const auto image = GetEnvFallback(
        "SELFREPAIR_SANDBOX__IMAGE",
        "SELFREPAIR_SANDBOX_IMAGE");
    if (!image.empty()) {
        config.sandbox.image = image;
    }

    const auto timeout = GetEnvFallback(
        "SELFREPAIR_SANDBOX__TIMEOUT_S",
        "SELFREPAIR_SANDBOX_TIMEOUT_S");
    if (!timeout.empty()) {
        config.sandbox.timeout_s = ParseInt(timeout, config.sandbox.timeout_s);
    }

    const auto memory = GetEnvFallback(
        "SELFREPAIR_SANDBOX__MEMORY_MB",
        "SELFREPAIR_SANDBOX_MEMORY_MB");
    if (!memory.empty()) {
        config.sandbox.memory_mb = ParseInt(memory, config.sandbox.memory_mb);
    }

    const auto cpus = GetEnvFallback(
        "SELFREPAIR_SANDBOX__CPUS",
        "SELFREPAIR_SANDBOX_CPUS");
    if (!cpus.empty()) {
        config.sandbox.cpus = ParseDouble(cpus, config.sandbox.cpus);
    }

    const auto work_root = GetEnvFallback(
        "SELFREPAIR_SANDBOX__WORK_ROOT",
        "SELFREPAIR_SANDBOX_WORK_ROOT");
    if (!work_root.empty()) {
        config.sandbox.work_root = work_root;
    }

    const auto test_command = GetEnvFallback(
        "SELFREPAIR_SANDBOX__TEST_COMMAND",
        "SELFREPAIR_SANDBOX_TEST_COMMAND");
    if (!test_command.empty()) {
        const auto command = SplitCsv(test_command);
        if (!command.empty()) {
            config.sandbox.test_command = command;
        }
    }

    const auto strict_isolation = GetEnvFallback(
        "SELFREPAIR_SANDBOX__STRICT_ISOLATION",
        "SELFREPAIR_SANDBOX_STRICT_ISOLATION");
    if (!strict_isolation.empty()) {
        config.sandbox.strict_isolation = ParseBool(strict_isolation);
    }

    const auto guardrails_enabled = GetEnvFallback(
        "SELFREPAIR_GUARDRAILS__ENABLED",
        "SELFREPAIR_GUARDRAILS_ENABLED");
    if (!guardrails_enabled.empty()) {
        config.guardrails.enabled = ParseBool(guardrails_enabled);
    }

    const auto model = GetEnvFallback(
        "SELFREPAIR_GENERATOR__MODEL",
        "SELFREPAIR_GENERATOR_MODEL");
    if (!model.empty()) {
        config.generator.model = model;
    }

    const auto max_tokens = GetEnvFallback(
        "SELFREPAIR_GENERATOR__MAX_TOKENS",
        "SELFREPAIR_GENERATOR_MAX_TOKENS");
    if (!max_tokens.empty()) {
        config.generator.max_tokens = ParseInt(max_tokens, config.generator.max_tokens);
    }

    const auto temperature = GetEnvFallback(
        "SELFREPAIR_GENERATOR__TEMPERATURE",
        "SELFREPAIR_GENERATOR_TEMPERATURE");
    if (!temperature.empty()) {
        config.generator.temperature = ParseDouble(temperature, config.generator.temperature);
    }

    const auto use_proxy_for_llm = GetEnvFallback(
        "SELFREPAIR_PROVIDERS__USE_PROXY_FOR_LLM",
        "SELFREPAIR_PROVIDERS_USE_PROXY_FOR_LLM");
    if (!use_proxy_for_llm.empty()) {
        config.providers.use_proxy_for_llm = ParseBool(use_proxy_for_llm);
    }

    ApplyProviderEnv(config.providers.openrouter, "OPENROUTER");
    ApplyProviderEnv(config.providers.openai, "OPENAI");
    ApplyProviderEnv(config.providers.anthropic, "ANTHROPIC");
    ApplyProviderEnv(config.providers.groq, "GROQ");
    ApplyProviderEnv(config.providers.ollama, "OLLAMA");
    ApplyProviderEnv(config.providers.vllm, "VLLM");

    const auto groq_key = GetEnv("GROQ_API_KEY");
    if (config.providers.groq.api_key.empty() && !groq_key.empty()) {
        config.providers.groq.api_key = groq_key;
    }

    const auto log_level = GetEnvFallback(
        "SELFREPAIR_LOGGING__LEVEL",
        "SELFREPAIR_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

Config LoadConfig(const std::filesystem::path& path) {
    Config config{};

    if (std::filesystem::exists(path)) {
        std::ifstream input(path);
        try {
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::Log(utils::LogLevel::kWarn, "config", "ignoring malformed config file", {
                {"path", path.string()},
                {"error", ex.what()}});
        }
    }

    ApplyEnvironmentOverrides(config);
    return config;
}

Config LoadConfig() {
    return LoadConfig(DefaultConfigPath());
}

}  // namespace selfrepair::config
