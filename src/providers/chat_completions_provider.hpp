#pragma once

#include <string>
#include <vector>

#include "providers/llm_provider.hpp"

namespace osintpipe::providers {

// OpenAI-compatible /chat/completions client (Together, OpenRouter, OpenAI, vLLM).
class ChatCompletionsProvider : public LLMProvider {
public:
    explicit ChatCompletionsProvider(ProviderSettings settings);

    LLMResponse Chat(
        const std::vector<Message>& messages,
        const std::string& model,
        int max_tokens,
        double temperature) override;

    std::string GetDefaultModel() const override { return settings_.model; }

private:
    ProviderSettings settings_;
};

}  // namespace osintpipe::providers
