#include "generator/llm_code_generator.hpp"

#include <vector>

#include "generator/code_extraction.hpp"
#include "repair/patch_builder.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace selfrepair::generator {

namespace {

constexpr const char* kSystemPrompt =
    "You are an expert Python programmer. You write correct, efficient code. "
    "Return only code.";

}  // namespace

LlmCodeGenerator::LlmCodeGenerator(std::unique_ptr<selfrepair::providers::LLMProvider> provider,
                                   selfrepair::config::GeneratorConfig config)
    : provider_(std::move(provider))
    , config_(std::move(config)) {}

GenerationResult LlmCodeGenerator::Generate(const selfrepair::task::Task& task) {
    return Complete(selfrepair::repair::RenderGenerationPrompt(task), "generate");
}

GenerationResult LlmCodeGenerator::Repair(const selfrepair::repair::RepairRequest& request) {
    return Complete(selfrepair::repair::RenderRepairPrompt(request), "repair");
}

GenerationResult LlmCodeGenerator::Complete(const std::string& prompt, const char* prompt_kind) {
    if (!provider_) {
        return GenerationResult{.error = "no LLM provider configured"};
    }
    const std::vector<selfrepair::providers::Message> messages = {
        {.role = "system", .content = kSystemPrompt},
        {.role = "user", .content = prompt}};

    const auto started = utils::Now();
    const auto response = provider_->Chat(messages, config_.model, config_.max_tokens, config_.temperature);
    const auto elapsed = utils::ElapsedSince(started);
    if (response.IsError()) {
        utils::Log(utils::LogLevel::kWarn, "generator", "generation failed", {
            {"prompt", prompt_kind},
            {"error", response.content}});
        return GenerationResult{.error = response.content};
    }

    auto code = ExtractCode(response.content);
    if (code.empty()) {
        utils::Log(utils::LogLevel::kWarn, "generator", "empty completion", {{"prompt", prompt_kind}});
        return GenerationResult{.error = "model returned no code"};
    }
    utils::Log(utils::LogLevel::kDebug, "generator", "completion extracted", {
        {"prompt", prompt_kind},
        {"chars", std::to_string(code.size())},
        {"elapsed_ms", std::to_string(elapsed.count())}});
    return GenerationResult{.code = std::move(code)};
}

}  // namespace selfrepair::generator
