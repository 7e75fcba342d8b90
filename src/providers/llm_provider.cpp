#include "providers/llm_provider.hpp"

#include "providers/chat_completions_provider.hpp"

namespace osintpipe::providers {

ProviderSettings ResolveProviderSettings(const osintpipe::config::Config& config) {
    ProviderSettings settings{};
    settings.model = config.llm.model;
    settings.use_proxy_for_llm = config.providers.use_proxy_for_llm;
    settings.timeout_s = config.enrichment.classification_timeout_s;

    if (!config.providers.together.api_key.empty()) {
        settings.api_key = config.providers.together.api_key;
        settings.api_base = config.providers.together.api_base.empty()
            ? "https://api.together.xyz/v1"
            : config.providers.together.api_base;
        return settings;
    }

    if (!config.providers.openrouter.api_key.empty()) {
        settings.api_key = config.providers.openrouter.api_key;
        settings.api_base = config.providers.openrouter.api_base.empty()
            ? "https://openrouter.ai/api/v1"
            : config.providers.openrouter.api_base;
        return settings;
    }

    if (!config.providers.openai.api_key.empty()) {
        settings.api_key = config.providers.openai.api_key;
        settings.api_base = config.providers.openai.api_base.empty()
            ? "https://api.openai.com/v1"
            : config.providers.openai.api_base;
        return settings;
    }

    if (!config.providers.vllm.api_key.empty() || !config.providers.vllm.api_base.empty()) {
        settings.api_key = config.providers.vllm.api_key;
        settings.api_base = config.providers.vllm.api_base;
        return settings;
    }

    return settings;
}

std::unique_ptr<LLMProvider> CreateProvider(const osintpipe::config::Config& config) {
    return std::make_unique<ChatCompletionsProvider>(ResolveProviderSettings(config));
}

}  // namespace osintpipe::providers
