#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "config/snapshot.hpp"
#include "routing/routing_types.hpp"

namespace osintpipe::routing {

// Rules with triggers lowered and sorted by priority, ready to evaluate.
class CompiledRoutingRules {
public:
    // Throws std::invalid_argument on an empty partition name.
    explicit CompiledRoutingRules(RoutingRules rules);

    RoutingDecision Evaluate(const std::string& normalized_text,
                             const std::vector<std::string>& topics) const;

    const RoutingRules& Rules() const { return rules_; }

private:
    struct Trigger {
        std::string configured;
        std::string needle;
    };
    struct Rule {
        int priority = 0;
        std::string target_partition;
        std::vector<Trigger> triggers;
    };

    RoutingRules rules_;
    std::vector<Rule> ordered_;
};

class MessageRouter {
public:
    MessageRouter();
    explicit MessageRouter(RoutingRules rules);

    RoutingDecision Route(const std::string& text, const std::vector<std::string>& topics) const;

    bool Reload(RoutingRules rules, std::string* error = nullptr);
    bool LoadFromFile(const std::filesystem::path& path, std::string* error = nullptr);

    std::uint64_t Version() const;

private:
    config::VersionedSnapshot<CompiledRoutingRules> snapshot_;
};

// Case-folded (ASCII and Cyrillic) with whitespace runs collapsed to one space.
std::string NormalizeText(const std::string& text);

RoutingRules DefaultRoutingRules();
RoutingRules ParseRoutingRules(const std::string& json_text);

}  // namespace osintpipe::routing
