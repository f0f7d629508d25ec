#pragma once

#include <memory>
#include <string>

#include "config/config_schema.hpp"
#include "generator/code_generator.hpp"
#include "providers/llm_provider.hpp"

namespace selfrepair::generator {

class LlmCodeGenerator : public CodeGenerator {
public:
    LlmCodeGenerator(std::unique_ptr<selfrepair::providers::LLMProvider> provider,
                     selfrepair::config::GeneratorConfig config);

    GenerationResult Generate(const selfrepair::task::Task& task) override;
    GenerationResult Repair(const selfrepair::repair::RepairRequest& request) override;

private:
    GenerationResult Complete(const std::string& prompt, const char* prompt_kind);

    std::unique_ptr<selfrepair::providers::LLMProvider> provider_;
    selfrepair::config::GeneratorConfig config_;
};

}  // namespace selfrepair::generator
