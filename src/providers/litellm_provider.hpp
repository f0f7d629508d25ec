#pragma once

#include <string>
#include <vector>

#include "providers/llm_provider.hpp"

namespace selfrepair::providers {

class LiteLLMProvider : public LLMProvider {
public:
    explicit LiteLLMProvider(ProviderSettings settings);

    LLMResponse Chat(
        const std::vector<Message>& messages,
        const std::string& model,
        int max_tokens,
        double temperature) override;

    std::string GetDefaultModel() const override { return settings_.model; }

    static bool UsesAnthropicMessages(const std::string& model, const std::string& api_base);

private:
    ProviderSettings settings_;
};

}  // namespace selfrepair::providers
