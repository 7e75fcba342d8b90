#include "cli/runtime.hpp"

#include "enrichment/engagement_scorer.hpp"
#include "enrichment/entity_extractor.hpp"
#include "enrichment/geolocator.hpp"
#include "enrichment/llm_classifier.hpp"
#include "providers/llm_provider.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace osintpipe::cli {

queue::QueueOptions MakeQueueOptions(const config::Config& config) {
    queue::QueueOptions options{};
    options.db_path = utils::ExpandHome(config.queue.path);
    options.max_retries = config.queue.max_retries;
    options.backoff_base = std::chrono::milliseconds(config.queue.backoff_base_ms);
    options.backoff_max = std::chrono::milliseconds(config.queue.backoff_max_ms);
    options.claim_timeout = std::chrono::seconds(config.queue.claim_timeout_s);
    options.poll_interval = std::chrono::milliseconds(config.queue.poll_interval_ms);
    return options;
}

enrichment::OrchestratorOptions MakeOrchestratorOptions(const config::Config& config) {
    const auto local_timeout = std::chrono::milliseconds(config.enrichment.local_timeout_ms);
    enrichment::OrchestratorOptions options{};
    options.enable_classification = config.enrichment.enable_classification;
    options.enable_entities = config.enrichment.enable_entities;
    options.enable_geolocation = config.enrichment.enable_geolocation;
    options.enable_engagement = config.enrichment.enable_engagement;
    options.classification_timeout = std::chrono::seconds(config.enrichment.classification_timeout_s);
    options.entities_timeout = local_timeout;
    options.geolocation_timeout = local_timeout;
    options.engagement_timeout = local_timeout;
    options.outer_timeout_multiplier = config.enrichment.outer_timeout_multiplier;
    options.retry_failed_steps = config.enrichment.retry_failed_steps;
    options.max_in_flight_calls = static_cast<std::size_t>(config.enrichment.max_in_flight_calls);
    return options;
}

pipeline::PoolOptions MakePoolOptions(const config::Config& config) {
    pipeline::PoolOptions options{};
    options.count = static_cast<std::size_t>(config.workers.count);
    options.id_prefix = config.workers.id_prefix;
    options.consumer_group = config.queue.consumer_group;
    options.batch_size = static_cast<std::size_t>(config.workers.batch_size);
    options.block_timeout = std::chrono::milliseconds(config.workers.block_timeout_ms);
    return options;
}

std::unique_ptr<enrichment::EnrichmentOrchestrator> BuildOrchestrator(const config::Config& config) {
    auto options = MakeOrchestratorOptions(config);

    std::shared_ptr<enrichment::Classifier> classifier;
    if (options.enable_classification) {
        const auto settings = providers::ResolveProviderSettings(config);
        if (settings.api_base.empty()) {
            utils::Log(utils::LogLevel::kWarn, "runtime", "no LLM provider configured; classification disabled");
            options.enable_classification = false;
        } else {
            std::shared_ptr<providers::LLMProvider> provider = providers::CreateProvider(config);
            classifier = std::make_shared<enrichment::LlmClassifier>(
                std::move(provider),
                enrichment::LlmClassifierOptions{
                    .model = config.llm.model,
                    .max_tokens = config.llm.max_tokens,
                    .temperature = config.llm.temperature,
                });
        }
    }

    return std::make_unique<enrichment::EnrichmentOrchestrator>(
        std::move(classifier),
        std::make_shared<enrichment::RegexEntityExtractor>(),
        std::make_shared<enrichment::GazetteerGeolocator>(),
        std::make_shared<enrichment::MetadataEngagementScorer>(),
        options);
}

bool LoadSpamRules(spam::SpamFilter& filter, const config::RulesConfig& rules) {
    std::string error;
    bool ok = false;
    if (rules.spam_rules_path.empty()) {
        auto defaults = spam::DefaultSpamRules();
        defaults.threshold = rules.spam_threshold;
        ok = filter.Reload(std::move(defaults), &error);
    } else {
        ok = filter.LoadFromFile(utils::ExpandHome(rules.spam_rules_path), &error);
    }
    if (!ok) {
        utils::Log(utils::LogLevel::kError, "runtime", "spam rules rejected; keeping current rules",
            {{"path", rules.spam_rules_path}, {"error", error}});
        return false;
    }
    utils::Log(utils::LogLevel::kInfo, "runtime", "spam rules loaded",
        {{"version", std::to_string(filter.Version())}});
    return true;
}

bool LoadRoutingRules(routing::MessageRouter& router, const config::RulesConfig& rules) {
    std::string error;
    bool ok = false;
    if (rules.routing_rules_path.empty()) {
        ok = router.Reload(routing::DefaultRoutingRules(), &error);
    } else {
        ok = router.LoadFromFile(utils::ExpandHome(rules.routing_rules_path), &error);
    }
    if (!ok) {
        utils::Log(utils::LogLevel::kError, "runtime", "routing rules rejected; keeping current rules",
            {{"path", rules.routing_rules_path}, {"error", error}});
        return false;
    }
    utils::Log(utils::LogLevel::kInfo, "runtime", "routing rules loaded",
        {{"version", std::to_string(router.Version())}});
    return true;
}

}  // namespace osintpipe::cli
