#include "providers/llm_provider.hpp"

#include "providers/litellm_provider.hpp"
#include "utils/logging.hpp"

namespace selfrepair::providers {

namespace {

std::string OrDefault(const std::string& value, const char* fallback) {
    return value.empty() ? std::string(fallback) : value;
}

}  // namespace

ProviderSettings ResolveProviderSettings(const selfrepair::config::Config& config) {
    ProviderSettings settings{};
    settings.model = config.generator.model.empty()
        ? "llama-3.3-70b-versatile"
        : config.generator.model;
    settings.timeout_s = config.generator.timeout_s;
    settings.use_proxy_for_llm = config.providers.use_proxy_for_llm;

    const auto& providers = config.providers;
    if (!providers.openrouter.api_key.empty()) {
        settings.name = "openrouter";
        settings.api_key = providers.openrouter.api_key;
        settings.api_base = OrDefault(providers.openrouter.api_base, "https://openrouter.ai/api/v1");
        return settings;
    }

    if (!providers.anthropic.api_key.empty()) {
        settings.name = "anthropic";
        settings.api_key = providers.anthropic.api_key;
        settings.api_base = OrDefault(providers.anthropic.api_base, "https://api.anthropic.com/v1");
        return settings;
    }

    if (!providers.openai.api_key.empty()) {
        settings.name = "openai";
        settings.api_key = providers.openai.api_key;
        settings.api_base = OrDefault(providers.openai.api_base, "https://api.openai.com/v1");
        return settings;
    }

    if (!providers.groq.api_key.empty()) {
        settings.name = "groq";
        settings.api_key = providers.groq.api_key;
        settings.api_base = OrDefault(providers.groq.api_base, "https://api.groq.com/openai/v1");
        return settings;
    }

    if (!providers.vllm.api_key.empty() || !providers.vllm.api_base.empty()) {
        settings.name = "vllm";
        settings.api_key = providers.vllm.api_key;
        settings.api_base = providers.vllm.api_base;
        return settings;
    }

    settings.name = "ollama";
    settings.api_key = providers.ollama.api_key;
    settings.api_base = OrDefault(providers.ollama.api_base, "http://localhost:11434/v1");
    return settings;
}

std::unique_ptr<LLMProvider> CreateProvider(const selfrepair::config::Config& config) {
    const auto settings = ResolveProviderSettings(config);
    utils::Log(utils::LogLevel::kInfo, "llm", "provider selected", {
        {"provider", settings.name},
        {"model", settings.model},
        {"api_base", settings.api_base}});
    return std::make_unique<LiteLLMProvider>(settings);
}

}  // namespace selfrepair::providers
