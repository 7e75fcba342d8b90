#pragma once

#include <memory>
#include <string>

#include "config/config_schema.hpp"
#include "enrichment/orchestrator.hpp"
#include "pipeline/worker_pool.hpp"
#include "queue/message_queue.hpp"
#include "routing/message_router.hpp"
#include "spam/spam_filter.hpp"

namespace osintpipe::cli {

queue::QueueOptions MakeQueueOptions(const config::Config& config);
enrichment::OrchestratorOptions MakeOrchestratorOptions(const config::Config& config);
pipeline::PoolOptions MakePoolOptions(const config::Config& config);

// Wires the configured sub-services. Classification is switched off when
// no LLM provider is configured.
std::unique_ptr<enrichment::EnrichmentOrchestrator> BuildOrchestrator(const config::Config& config);

// Built-in rules when no file is configured. On a bad file the filter or
// router keeps its current rules and false is returned.
bool LoadSpamRules(spam::SpamFilter& filter, const config::RulesConfig& rules);
bool LoadRoutingRules(routing::MessageRouter& router, const config::RulesConfig& rules);

}  // namespace osintpipe::cli
