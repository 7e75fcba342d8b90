#include "enrichment/llm_classifier.hpp"

#include <algorithm>
#include <cmath>

#include "core/errors.hpp"
#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace osintpipe::enrichment {
namespace {

constexpr std::size_t kMaxReasoningBytes = 500;

// Pulls the body out of a ```json ... ``` or ``` ... ``` fence if present.
std::string StripCodeFence(const std::string& reply) {
    const auto open = reply.find("```");
    if (open == std::string::npos) {
        return reply;
    }
    auto body_start = reply.find('\n', open);
    if (body_start == std::string::npos) {
        return reply;
    }
    ++body_start;
    const auto close = reply.find("```", body_start);
    if (close == std::string::npos) {
        return reply.substr(body_start);
    }
    return reply.substr(body_start, close - body_start);
}

// Cuts at a UTF-8 character boundary at or below the byte limit.
std::string TruncateUtf8(const std::string& value, std::size_t limit) {
    if (value.size() <= limit) {
        return value;
    }
    auto cut = limit;
    while (cut > 0 && (static_cast<unsigned char>(value[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return value.substr(0, cut);
}

}  // namespace

LlmClassifier::LlmClassifier(std::shared_ptr<providers::LLMProvider> provider,
                             LlmClassifierOptions options)
    : provider_(std::move(provider)), options_(std::move(options)) {}

std::string LlmClassifier::BuildPrompt(const std::string& text) {
    return "Analyze this Telegram message from Ukraine war monitoring channels.\n\n"
           "Message: " + text + "\n\n"
           "Evaluate the OSINT (Open Source Intelligence) value of this message, classify its "
           "topics and its overall sentiment.\n\n"
           "OSINT Value Guidelines:\n"
           "- 90-100: Critical military intelligence (troop movements, casualties, strategic positions)\n"
           "- 70-89: High value tactical information (equipment sightings, combat reports)\n"
           "- 50-69: Moderate intelligence value (general updates, situational reports)\n"
           "- 30-49: Low intelligence value (opinions, analysis, secondary sources)\n"
           "- 0-29: Minimal/no intelligence value (spam, off-topic, promotional)\n\n"
           "Topic Categories:\n"
           "- combat: Direct combat operations, battles, strikes\n"
           "- civilian: Civilian impact, casualties, humanitarian issues\n"
           "- diplomatic: Political statements, negotiations, international relations\n"
           "- equipment: Military equipment, vehicles, weapons\n"
           "- general: General updates, news, other content\n\n"
           "Return ONLY valid JSON (no markdown, no code blocks):\n"
           "{\n"
           "  \"osint_value\": <0-100>,\n"
           "  \"topics\": [<list of relevant topics from categories above>],\n"
           "  \"sentiment\": \"positive\" | \"negative\" | \"neutral\",\n"
           "  \"reasoning\": \"<brief 1-2 sentence explanation>\"\n"
           "}";
}

Classification LlmClassifier::ParseReply(const std::string& reply) {
    auto body = utils::Trim(StripCodeFence(reply));
    const auto first = body.find('{');
    const auto last = body.rfind('}');
    if (first == std::string::npos || last == std::string::npos || last < first) {
        throw ServiceError("classifier reply contains no JSON object");
    }
    const auto json = nlohmann::json::parse(body.substr(first, last - first + 1), nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw ServiceError("classifier reply is not valid JSON");
    }

    Classification result{};
    if (json.contains("osint_value") && json["osint_value"].is_number()) {
        const auto raw = json["osint_value"].get<double>();
        result.osint_score = static_cast<int>(std::clamp(std::lround(raw), 0L, 100L));
    } else if (json.contains("osint_value") && json["osint_value"].is_string()) {
        try {
            result.osint_score = std::clamp(std::stoi(json["osint_value"].get<std::string>()), 0, 100);
        } catch (const std::exception&) {
            throw ServiceError("classifier osint_value is not numeric");
        }
    }

    const auto& valid = ValidTopics();
    if (json.contains("topics") && json["topics"].is_array()) {
        for (const auto& item : json["topics"]) {
            if (!item.is_string()) {
                continue;
            }
            const auto topic = utils::ToLower(utils::Trim(item.get<std::string>()));
            if (std::find(valid.begin(), valid.end(), topic) == valid.end()) {
                continue;
            }
            if (std::find(result.topics.begin(), result.topics.end(), topic) == result.topics.end()) {
                result.topics.push_back(topic);
            }
        }
    }
    if (result.topics.empty()) {
        result.topics.push_back("general");
    }

    if (json.contains("sentiment") && json["sentiment"].is_string()) {
        result.sentiment = ParseSentiment(json["sentiment"].get<std::string>());
    }
    if (json.contains("reasoning") && json["reasoning"].is_string()) {
        result.reasoning = TruncateUtf8(json["reasoning"].get<std::string>(), kMaxReasoningBytes);
    }
    return result;
}

Classification LlmClassifier::Classify(const std::string& text) {
    if (!provider_) {
        throw ServiceError("classifier has no LLM provider");
    }
    const std::vector<providers::Message> messages = {
        providers::Message{.role = "user", .content = BuildPrompt(text)}};
    const auto response = provider_->Chat(messages, options_.model, options_.max_tokens, options_.temperature);
    if (response.IsError()) {
        throw ServiceError(response.content);
    }
    utils::Log(utils::LogLevel::kDebug, "classifier", "llm reply", {{"content", response.content}});
    return ParseReply(response.content);
}

}  // namespace osintpipe::enrichment
