#pragma once

#include <string>
#include <vector>

namespace osintpipe::config {

struct QueueConfig {
    std::string path = "~/.osintpipe/queue.db";
    std::string consumer_group = "enrichment";
    int max_retries = 3;
    int backoff_base_ms = 500;
    int backoff_max_ms = 60000;
    int claim_timeout_s = 300;
    int poll_interval_ms = 200;
};

struct StoreConfig {
    std::string path = "~/.osintpipe/messages.db";
};

struct MediaConfig {
    std::string root = "~/.osintpipe/media";
    std::string spool_dir = "~/.osintpipe/spool";
    int fetch_timeout_s = 30;
    long long max_bytes = 50LL * 1024 * 1024;
};

struct WorkerConfig {
    int count = 4;
    int batch_size = 8;
    int block_timeout_ms = 1000;
    std::string id_prefix = "worker";
};

struct EnrichmentConfig {
    bool enable_classification = true;
    bool enable_entities = true;
    bool enable_geolocation = true;
    bool enable_engagement = true;
    int classification_timeout_s = 30;
    int local_timeout_ms = 5000;
    double outer_timeout_multiplier = 2.0;
    bool retry_failed_steps = true;
    int max_in_flight_calls = 64;
};

struct LlmConfig {
    std::string model = "meta-llama/Meta-Llama-3.1-8B-Instruct-Turbo";
    int max_tokens = 500;
    double temperature = 0.1;
};

struct ProviderConfig {
    std::string api_key;
    std::string api_base;
};

struct ProvidersConfig {
    ProviderConfig together;
    ProviderConfig openrouter;
    ProviderConfig openai;
    ProviderConfig vllm;
    bool use_proxy_for_llm = false;
};

struct RulesConfig {
    std::string spam_rules_path;
    std::string routing_rules_path;
    double spam_threshold = 0.85;
};

struct TelegramConfig {
    bool enabled = false;
    std::string token;
    // Chat ids accepted as sources; empty accepts every chat the bot sees.
    std::vector<std::string> allow_from;
    int poll_timeout_s = 10;
    int buffer_limit = 10000;
};

struct ChannelsConfig {
    TelegramConfig telegram;
};

struct ApiConfig {
    bool enabled = true;
    std::string host = "127.0.0.1";
    int port = 18790;
};

struct LogSettings {
    std::string level = "info";
};

struct Config {
    QueueConfig queue;
    StoreConfig store;
    MediaConfig media;
    WorkerConfig workers;
    EnrichmentConfig enrichment;
    LlmConfig llm;
    ProvidersConfig providers;
    RulesConfig rules;
    ChannelsConfig channels;
    ApiConfig api;
    LogSettings log;
};

}  // namespace osintpipe::config
