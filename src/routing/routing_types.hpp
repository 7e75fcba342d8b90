#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace osintpipe::routing {

struct TriggerRule {
    int priority = 0;
    std::string target_partition;
    std::vector<std::string> triggers;
};

struct RoutingRules {
    std::vector<TriggerRule> trigger_rules;
    // Ordered; the first topic present in the message wins.
    std::vector<std::pair<std::string, std::string>> topic_partitions;
    std::string default_partition = "messages_general";
};

struct RoutingDecision {
    std::string target_partition;
    std::optional<std::string> matched_trigger;
    std::optional<int> matched_priority;
    std::uint64_t rules_version = 0;
    std::chrono::system_clock::time_point decided_at;

    // decided_at is bookkeeping and takes no part in equality.
    bool operator==(const RoutingDecision& other) const {
        return target_partition == other.target_partition &&
            matched_trigger == other.matched_trigger &&
            matched_priority == other.matched_priority &&
            rules_version == other.rules_version;
    }
    bool operator!=(const RoutingDecision& other) const { return !(*this == other); }
};

}  // namespace osintpipe::routing
