#pragma once

#include <memory>
#include <string>

#include "enrichment/services.hpp"
#include "providers/llm_provider.hpp"

namespace osintpipe::enrichment {

struct LlmClassifierOptions {
    std::string model;
    int max_tokens = 500;
    double temperature = 0.1;
};

class LlmClassifier : public Classifier {
public:
    LlmClassifier(std::shared_ptr<providers::LLMProvider> provider, LlmClassifierOptions options);

    Classification Classify(const std::string& text) override;

    static std::string BuildPrompt(const std::string& text);
    // Throws ServiceError when the reply holds no JSON object.
    static Classification ParseReply(const std::string& reply);

private:
    std::shared_ptr<providers::LLMProvider> provider_;
    LlmClassifierOptions options_;
};

}  // namespace osintpipe::enrichment
