#include "providers/chat_completions_provider.hpp"

#include <memory>
#include <string>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "utils/url.hpp"

namespace osintpipe::providers {
namespace {

std::string MaskKey(const std::string& key) {
    if (key.size() <= 8) {
        return "****";
    }
    return key.substr(0, 4) + "****" + key.substr(key.size() - 4);
}

void ApplyProxy(httplib::Client& client) {
    const char* names[] = {"HTTPS_PROXY", "HTTP_PROXY", "https_proxy", "http_proxy"};
    for (const auto* name : names) {
        const auto value = utils::GetEnv(name);
        std::string host;
        int port = 0;
        if (!value.empty() && utils::ParseProxyHostPort(value, host, port)) {
            client.set_proxy(host, port);
            return;
        }
    }
    if (!utils::GetEnv("ALL_PROXY").empty() || !utils::GetEnv("all_proxy").empty()) {
        utils::Log(utils::LogLevel::kWarn, "llm", "ALL_PROXY is set but cpp-httplib only supports HTTP proxy");
    }
}

LLMResponse ErrorResponse(const std::string& message) {
    return LLMResponse{.content = "Error calling LLM: " + message, .finish_reason = "error"};
}

}  // namespace

ChatCompletionsProvider::ChatCompletionsProvider(ProviderSettings settings)
    : settings_(std::move(settings)) {}

LLMResponse ChatCompletionsProvider::Chat(
    const std::vector<Message>& messages,
    const std::string& model,
    int max_tokens,
    double temperature) {
    try {
        const auto chosen_model = model.empty() ? settings_.model : model;

        nlohmann::json payload;
        payload["model"] = chosen_model;
        payload["max_tokens"] = max_tokens;
        payload["temperature"] = temperature;
        payload["messages"] = nlohmann::json::array();
        for (const auto& msg : messages) {
            payload["messages"].push_back({{"role", msg.role}, {"content", msg.content}});
        }

        const auto base_url = settings_.api_base.empty() ? std::string("https://api.together.xyz/v1")
                                                         : settings_.api_base;
        const auto parsed = utils::ParseUrl(base_url);
        const std::string endpoint = parsed.base_path + "/chat/completions";
        const auto scheme_host_port = parsed.SchemeHostPort();

        auto client = std::make_unique<httplib::Client>(scheme_host_port);
        client->set_connection_timeout(settings_.timeout_s);
        client->set_read_timeout(settings_.timeout_s);
        if (settings_.use_proxy_for_llm) {
            ApplyProxy(*client);
        }

        utils::Log(utils::LogLevel::kDebug, "llm", "POST " + scheme_host_port + endpoint,
                   {{"model", chosen_model}, {"api_key", MaskKey(settings_.api_key)}});

        httplib::Headers headers{{"Content-Type", "application/json"}};
        if (!settings_.api_key.empty()) {
            headers.emplace("Authorization", "Bearer " + settings_.api_key);
        }

        auto response = client->Post(endpoint.c_str(), headers, payload.dump(), "application/json");
        if (!response) {
            const auto err = response.error();
            return ErrorResponse("request failed (httplib error=" + std::to_string(static_cast<int>(err)) +
                                 ", " + httplib::to_string(err) + ")");
        }
        if (response->status >= 400) {
            utils::Log(utils::LogLevel::kWarn, "llm", "HTTP error",
                       {{"status", std::to_string(response->status)}, {"body", response->body}});
            return ErrorResponse("HTTP " + std::to_string(response->status));
        }

        auto json = nlohmann::json::parse(response->body, nullptr, false);
        if (json.is_discarded() || !json.contains("choices") || !json["choices"].is_array() ||
            json["choices"].empty()) {
            return ErrorResponse("invalid response");
        }

        LLMResponse parsed_response{};
        const auto& choice = json["choices"][0];
        if (choice.contains("message") && choice["message"].contains("content") &&
            choice["message"]["content"].is_string()) {
            parsed_response.content = choice["message"]["content"].get<std::string>();
        }
        if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
            parsed_response.finish_reason = choice["finish_reason"].get<std::string>();
        }
        if (json.contains("usage") && json["usage"].is_object()) {
            for (const auto* key : {"prompt_tokens", "completion_tokens", "total_tokens"}) {
                if (json["usage"].contains(key) && json["usage"][key].is_number_integer()) {
                    parsed_response.usage[key] = json["usage"][key].get<int>();
                }
            }
        }
        return parsed_response;
    } catch (const std::exception& ex) {
        return ErrorResponse(ex.what());
    }
}

}  // namespace osintpipe::providers
