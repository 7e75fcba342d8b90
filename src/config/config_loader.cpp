#include "config/config_loader.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace osintpipe::config {
namespace {

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = utils::GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return utils::GetEnv(secondary);
}

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ReadInt64(const nlohmann::json& source, const char* key, long long& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<long long>();
    }
}

void ReadDouble(const nlohmann::json& source, const char* key, double& target) {
    if (source.contains(key) && source[key].is_number()) {
        target = source[key].get<double>();
    }
}

void ReadBool(const nlohmann::json& source, const char* key, bool& target) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

void ReadStringList(const nlohmann::json& source, const char* key, std::vector<std::string>& target) {
    if (!source.contains(key) || !source[key].is_array()) {
        return;
    }
    target.clear();
    for (const auto& item : source[key]) {
        if (item.is_string()) {
            target.push_back(item.get<std::string>());
        } else if (item.is_number_integer()) {
            target.push_back(std::to_string(item.get<long long>()));
        }
    }
}

void ApplyProviderConfig(ProviderConfig& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    ReadString(source, "apiKey", target.api_key);
    ReadString(source, "apiBase", target.api_base);
}

bool ParseBool(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

long long ParseInt64(const std::string& value, long long fallback) {
    try {
        return std::stoll(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = utils::Trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void EnvString(const char* primary, const char* secondary, std::string& target) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = value;
    }
}

void EnvInt(const char* primary, const char* secondary, int& target) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = ParseInt(value, target);
    }
}

void EnvBool(const char* primary, const char* secondary, bool& target) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = ParseBool(value);
    }
}

void EnvDouble(const char* primary, const char* secondary, double& target) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = ParseDouble(value, target);
    }
}

}  // namespace

std::filesystem::path GetDefaultConfigPath() {
    return utils::GetHomePath() / ".osintpipe" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("queue") && data["queue"].is_object()) {
        const auto& queue = data["queue"];
        ReadString(queue, "path", config.queue.path);
        ReadString(queue, "consumerGroup", config.queue.consumer_group);
        ReadInt(queue, "maxRetries", config.queue.max_retries);
        ReadInt(queue, "backoffBaseMs", config.queue.backoff_base_ms);
        ReadInt(queue, "backoffMaxMs", config.queue.backoff_max_ms);
        ReadInt(queue, "claimTimeoutS", config.queue.claim_timeout_s);
        ReadInt(queue, "pollIntervalMs", config.queue.poll_interval_ms);
    }

    if (data.contains("store") && data["store"].is_object()) {
        ReadString(data["store"], "path", config.store.path);
    }

    if (data.contains("media") && data["media"].is_object()) {
        const auto& media = data["media"];
        ReadString(media, "root", config.media.root);
        ReadString(media, "spoolDir", config.media.spool_dir);
        ReadInt(media, "fetchTimeoutS", config.media.fetch_timeout_s);
        ReadInt64(media, "maxBytes", config.media.max_bytes);
    }

    if (data.contains("workers") && data["workers"].is_object()) {
        const auto& workers = data["workers"];
        ReadInt(workers, "count", config.workers.count);
        ReadInt(workers, "batchSize", config.workers.batch_size);
        ReadInt(workers, "blockTimeoutMs", config.workers.block_timeout_ms);
        ReadString(workers, "idPrefix", config.workers.id_prefix);
    }

    if (data.contains("enrichment") && data["enrichment"].is_object()) {
        const auto& enrichment = data["enrichment"];
        ReadBool(enrichment, "enableClassification", config.enrichment.enable_classification);
        ReadBool(enrichment, "enableEntities", config.enrichment.enable_entities);
        ReadBool(enrichment, "enableGeolocation", config.enrichment.enable_geolocation);
        ReadBool(enrichment, "enableEngagement", config.enrichment.enable_engagement);
        ReadInt(enrichment, "classificationTimeoutS", config.enrichment.classification_timeout_s);
        ReadInt(enrichment, "localTimeoutMs", config.enrichment.local_timeout_ms);
        ReadDouble(enrichment, "outerTimeoutMultiplier", config.enrichment.outer_timeout_multiplier);
        ReadBool(enrichment, "retryFailedSteps", config.enrichment.retry_failed_steps);
        ReadInt(enrichment, "maxInFlightCalls", config.enrichment.max_in_flight_calls);
    }

    if (data.contains("llm") && data["llm"].is_object()) {
        const auto& llm = data["llm"];
        ReadString(llm, "model", config.llm.model);
        ReadInt(llm, "maxTokens", config.llm.max_tokens);
        ReadDouble(llm, "temperature", config.llm.temperature);
    }

    if (data.contains("providers") && data["providers"].is_object()) {
        const auto& providers = data["providers"];
        ReadBool(providers, "useProxyForLLM", config.providers.use_proxy_for_llm);
        if (providers.contains("together")) {
            ApplyProviderConfig(config.providers.together, providers["together"]);
        }
        if (providers.contains("openrouter")) {
            ApplyProviderConfig(config.providers.openrouter, providers["openrouter"]);
        }
        if (providers.contains("openai")) {
            ApplyProviderConfig(config.providers.openai, providers["openai"]);
        }
        if (providers.contains("vllm")) {
            ApplyProviderConfig(config.providers.vllm, providers["vllm"]);
        }
    }

    if (data.contains("rules") && data["rules"].is_object()) {
        const auto& rules = data["rules"];
        ReadString(rules, "spamRulesPath", config.rules.spam_rules_path);
        ReadString(rules, "routingRulesPath", config.rules.routing_rules_path);
        ReadDouble(rules, "spamThreshold", config.rules.spam_threshold);
    }

    if (data.contains("channels") && data["channels"].is_object()) {
        const auto& channels = data["channels"];
        if (channels.contains("telegram") && channels["telegram"].is_object()) {
            const auto& telegram = channels["telegram"];
            ReadBool(telegram, "enabled", config.channels.telegram.enabled);
            ReadString(telegram, "token", config.channels.telegram.token);
            ReadStringList(telegram, "allowFrom", config.channels.telegram.allow_from);
            ReadInt(telegram, "pollTimeoutS", config.channels.telegram.poll_timeout_s);
            ReadInt(telegram, "bufferLimit", config.channels.telegram.buffer_limit);
        }
    }

    if (data.contains("api") && data["api"].is_object()) {
        const auto& api = data["api"];
        ReadBool(api, "enabled", config.api.enabled);
        ReadString(api, "host", config.api.host);
        ReadInt(api, "port", config.api.port);
    }

    if (data.contains("log") && data["log"].is_object()) {
        ReadString(data["log"], "level", config.log.level);
    }
}

void ApplyEnvOverrides(Config& config) {
    EnvString("OSINTPIPE_QUEUE__PATH", "OSINTPIPE_QUEUE_PATH", config.queue.path);
    EnvString("OSINTPIPE_QUEUE__CONSUMER_GROUP", "OSINTPIPE_QUEUE_CONSUMER_GROUP",
              config.queue.consumer_group);
    EnvInt("OSINTPIPE_QUEUE__MAX_RETRIES", "OSINTPIPE_QUEUE_MAX_RETRIES", config.queue.max_retries);
    EnvInt("OSINTPIPE_QUEUE__CLAIM_TIMEOUT_S", "OSINTPIPE_QUEUE_CLAIM_TIMEOUT_S",
           config.queue.claim_timeout_s);

    EnvString("OSINTPIPE_STORE__PATH", "OSINTPIPE_STORE_PATH", config.store.path);
    EnvString("OSINTPIPE_MEDIA__ROOT", "OSINTPIPE_MEDIA_ROOT", config.media.root);
    EnvString("OSINTPIPE_MEDIA__SPOOL_DIR", "OSINTPIPE_MEDIA_SPOOL_DIR", config.media.spool_dir);
    const auto max_bytes = GetEnvFallback("OSINTPIPE_MEDIA__MAX_BYTES", "OSINTPIPE_MEDIA_MAX_BYTES");
    if (!max_bytes.empty()) {
        config.media.max_bytes = ParseInt64(max_bytes, config.media.max_bytes);
    }

    EnvInt("OSINTPIPE_WORKERS__COUNT", "OSINTPIPE_WORKERS_COUNT", config.workers.count);
    EnvInt("OSINTPIPE_WORKERS__BATCH_SIZE", "OSINTPIPE_WORKERS_BATCH_SIZE", config.workers.batch_size);

    EnvBool("OSINTPIPE_ENRICHMENT__ENABLE_CLASSIFICATION", "OSINTPIPE_ENABLE_CLASSIFICATION",
            config.enrichment.enable_classification);
    EnvBool("OSINTPIPE_ENRICHMENT__ENABLE_ENTITIES", "OSINTPIPE_ENABLE_ENTITIES",
            config.enrichment.enable_entities);
    EnvBool("OSINTPIPE_ENRICHMENT__ENABLE_GEOLOCATION", "OSINTPIPE_ENABLE_GEOLOCATION",
            config.enrichment.enable_geolocation);
    EnvBool("OSINTPIPE_ENRICHMENT__ENABLE_ENGAGEMENT", "OSINTPIPE_ENABLE_ENGAGEMENT",
            config.enrichment.enable_engagement);
    EnvInt("OSINTPIPE_ENRICHMENT__CLASSIFICATION_TIMEOUT_S", "OSINTPIPE_ENRICHMENT_TIMEOUT_SECONDS",
           config.enrichment.classification_timeout_s);

    EnvString("OSINTPIPE_LLM__MODEL", "OSINTPIPE_LLM_MODEL", config.llm.model);
    EnvInt("OSINTPIPE_LLM__MAX_TOKENS", "OSINTPIPE_LLM_MAX_TOKENS", config.llm.max_tokens);
    EnvDouble("OSINTPIPE_LLM__TEMPERATURE", "OSINTPIPE_LLM_TEMPERATURE", config.llm.temperature);

    EnvString("OSINTPIPE_PROVIDERS__TOGETHER__API_KEY", "OSINTPIPE_PROVIDERS_TOGETHER_API_KEY",
              config.providers.together.api_key);
    EnvString("OSINTPIPE_PROVIDERS__TOGETHER__API_BASE", "OSINTPIPE_PROVIDERS_TOGETHER_API_BASE",
              config.providers.together.api_base);
    EnvString("OSINTPIPE_PROVIDERS__OPENROUTER__API_KEY", "OSINTPIPE_PROVIDERS_OPENROUTER_API_KEY",
              config.providers.openrouter.api_key);
    EnvString("OSINTPIPE_PROVIDERS__OPENROUTER__API_BASE", "OSINTPIPE_PROVIDERS_OPENROUTER_API_BASE",
              config.providers.openrouter.api_base);
    EnvString("OSINTPIPE_PROVIDERS__OPENAI__API_KEY", "OSINTPIPE_PROVIDERS_OPENAI_API_KEY",
              config.providers.openai.api_key);
    EnvString("OSINTPIPE_PROVIDERS__VLLM__API_KEY", "OSINTPIPE_PROVIDERS_VLLM_API_KEY",
              config.providers.vllm.api_key);
    EnvString("OSINTPIPE_PROVIDERS__VLLM__API_BASE", "OSINTPIPE_PROVIDERS_VLLM_API_BASE",
              config.providers.vllm.api_base);
    EnvBool("OSINTPIPE_PROVIDERS__USE_PROXY_FOR_LLM", "OSINTPIPE_PROVIDERS_USE_PROXY_FOR_LLM",
            config.providers.use_proxy_for_llm);

    EnvString("OSINTPIPE_RULES__SPAM_RULES_PATH", "OSINTPIPE_SPAM_RULES_PATH",
              config.rules.spam_rules_path);
    EnvString("OSINTPIPE_RULES__ROUTING_RULES_PATH", "OSINTPIPE_ROUTING_RULES_PATH",
              config.rules.routing_rules_path);
    EnvDouble("OSINTPIPE_RULES__SPAM_THRESHOLD", "OSINTPIPE_SPAM_CONFIDENCE_THRESHOLD",
              config.rules.spam_threshold);

    EnvBool("OSINTPIPE_TELEGRAM__ENABLED", "OSINTPIPE_TELEGRAM_ENABLED",
            config.channels.telegram.enabled);
    const auto telegram_token = GetEnvFallback("OSINTPIPE_TELEGRAM__TOKEN", "OSINTPIPE_TELEGRAM_TOKEN");
    if (!telegram_token.empty()) {
        config.channels.telegram.token = telegram_token;
        config.channels.telegram.enabled = true;
    }
    const auto telegram_allow_from = GetEnvFallback(
        "OSINTPIPE_TELEGRAM__ALLOW_FROM",
        "OSINTPIPE_TELEGRAM_ALLOW_FROM");
    if (!telegram_allow_from.empty()) {
        config.channels.telegram.allow_from = SplitCsv(telegram_allow_from);
    }

    EnvBool("OSINTPIPE_API__ENABLED", "OSINTPIPE_API_ENABLED", config.api.enabled);
    EnvString("OSINTPIPE_API__HOST", "OSINTPIPE_API_HOST", config.api.host);
    EnvInt("OSINTPIPE_API__PORT", "OSINTPIPE_API_PORT", config.api.port);

    EnvString("OSINTPIPE_LOG__LEVEL", "OSINTPIPE_LOG_LEVEL", config.log.level);
}

Config LoadConfig(const std::optional<std::filesystem::path>& path) {
    Config config{};

    std::filesystem::path config_path;
    if (path.has_value()) {
        config_path = *path;
    } else {
        const auto from_env = utils::GetEnv("OSINTPIPE_CONFIG");
        config_path = from_env.empty() ? GetDefaultConfigPath() : std::filesystem::path(from_env);
    }

    if (std::filesystem::exists(config_path)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::Log(utils::LogLevel::kWarn, "config", "config file unreadable; using defaults",
                       {{"path", config_path.string()}, {"error", ex.what()}});
        }
    }

    ApplyEnvOverrides(config);
    return config;
}

void ValidateConfig(const Config& config) {
    if (config.queue.path.empty()) {
        throw std::invalid_argument("queue.path must not be empty");
    }
    if (config.queue.consumer_group.empty()) {
        throw std::invalid_argument("queue.consumerGroup must not be empty");
    }
    if (config.queue.max_retries < 0) {
        throw std::invalid_argument("queue.maxRetries must be >= 0");
    }
    if (config.queue.backoff_base_ms < 0 || config.queue.backoff_max_ms < config.queue.backoff_base_ms) {
        throw std::invalid_argument("queue backoff must satisfy 0 <= backoffBaseMs <= backoffMaxMs");
    }
    if (config.queue.claim_timeout_s <= 0) {
        throw std::invalid_argument("queue.claimTimeoutS must be > 0");
    }
    if (config.store.path.empty()) {
        throw std::invalid_argument("store.path must not be empty");
    }
    if (config.media.root.empty()) {
        throw std::invalid_argument("media.root must not be empty");
    }
    if (config.media.max_bytes <= 0) {
        throw std::invalid_argument("media.maxBytes must be > 0");
    }
    if (config.workers.count <= 0) {
        throw std::invalid_argument("workers.count must be > 0");
    }
    if (config.workers.batch_size <= 0) {
        throw std::invalid_argument("workers.batchSize must be > 0");
    }
    if (config.enrichment.classification_timeout_s <= 0 || config.enrichment.local_timeout_ms <= 0) {
        throw std::invalid_argument("enrichment timeouts must be > 0");
    }
    if (config.enrichment.max_in_flight_calls <= 0) {
        throw std::invalid_argument("enrichment.maxInFlightCalls must be > 0");
    }
    if (config.enrichment.outer_timeout_multiplier < 1.0) {
        throw std::invalid_argument("enrichment.outerTimeoutMultiplier must be >= 1");
    }
    if (config.rules.spam_threshold < 0.0 || config.rules.spam_threshold > 1.0) {
        throw std::invalid_argument("rules.spamThreshold must be within [0, 1]");
    }
    if (config.api.port <= 0 || config.api.port > 65535) {
        throw std::invalid_argument("api.port must be a valid TCP port");
    }
    if (!utils::ParseLogLevel(config.log.level).has_value()) {
        throw std::invalid_argument("log.level must be one of debug, info, warn, error");
    }
}

}  // namespace osintpipe::config
