#include "routing/message_router.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace osintpipe::routing {

std::string NormalizeText(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (const unsigned char c : text) {
        if (std::isspace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(static_cast<char>(c));
    }
    return utils::FoldCase(out);
}

CompiledRoutingRules::CompiledRoutingRules(RoutingRules rules)
    : rules_(std::move(rules)) {
    if (rules_.default_partition.empty()) {
        throw std::invalid_argument("routing default partition must not be empty");
    }
    for (const auto& rule : rules_.trigger_rules) {
        if (rule.target_partition.empty()) {
            throw std::invalid_argument("trigger rule with priority " + std::to_string(rule.priority) +
                                        " has no target partition");
        }
        Rule compiled{};
        compiled.priority = rule.priority;
        compiled.target_partition = rule.target_partition;
        for (const auto& trigger : rule.triggers) {
            auto needle = NormalizeText(trigger);
            if (!needle.empty()) {
                compiled.triggers.push_back(Trigger{trigger, std::move(needle)});
            }
        }
        ordered_.push_back(std::move(compiled));
    }
    std::stable_sort(ordered_.begin(), ordered_.end(), [](const Rule& left, const Rule& right) {
        return left.priority < right.priority;
    });
    for (const auto& [topic, partition] : rules_.topic_partitions) {
        if (topic.empty() || partition.empty()) {
            throw std::invalid_argument("topic mapping entries need both topic and partition");
        }
    }
}

RoutingDecision CompiledRoutingRules::Evaluate(const std::string& normalized_text,
                                               const std::vector<std::string>& topics) const {
    RoutingDecision decision{};
    for (const auto& rule : ordered_) {
        for (const auto& trigger : rule.triggers) {
            if (normalized_text.find(trigger.needle) != std::string::npos) {
                decision.target_partition = rule.target_partition;
                decision.matched_trigger = trigger.configured;
                decision.matched_priority = rule.priority;
                return decision;
            }
        }
    }

    std::vector<std::string> lowered_topics;
    lowered_topics.reserve(topics.size());
    for (const auto& topic : topics) {
        lowered_topics.push_back(utils::ToLower(utils::Trim(topic)));
    }
    for (const auto& [topic, partition] : rules_.topic_partitions) {
        const auto wanted = utils::ToLower(topic);
        if (std::find(lowered_topics.begin(), lowered_topics.end(), wanted) != lowered_topics.end()) {
            decision.target_partition = partition;
            return decision;
        }
    }

    decision.target_partition = rules_.default_partition;
    return decision;
}

MessageRouter::MessageRouter()
    : MessageRouter(DefaultRoutingRules()) {}

MessageRouter::MessageRouter(RoutingRules rules)
    : snapshot_(CompiledRoutingRules(std::move(rules))) {}

RoutingDecision MessageRouter::Route(const std::string& text, const std::vector<std::string>& topics) const {
    const auto current = snapshot_.Current();
    auto decision = current->value.Evaluate(NormalizeText(text), topics);
    decision.rules_version = current->version;
    decision.decided_at = utils::Now();
    return decision;
}

bool MessageRouter::Reload(RoutingRules rules, std::string* error) {
    try {
        CompiledRoutingRules compiled(std::move(rules));
        const auto count = compiled.Rules().trigger_rules.size();
        const auto version = snapshot_.Swap(std::move(compiled));
        utils::Log(utils::LogLevel::kInfo, "router", "rules reloaded",
                   {{"version", std::to_string(version)}, {"trigger_rules", std::to_string(count)}});
        return true;
    } catch (const std::invalid_argument& ex) {
        utils::Log(utils::LogLevel::kError, "router", "rule reload rejected; keeping current rules",
                   {{"error", ex.what()}});
        if (error) {
            *error = ex.what();
        }
        return false;
    }
}

bool MessageRouter::LoadFromFile(const std::filesystem::path& path, std::string* error) {
    std::ifstream input(path);
    if (!input) {
        const auto message = "cannot read routing rules file " + path.string();
        utils::Log(utils::LogLevel::kError, "router", message);
        if (error) {
            *error = message;
        }
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    RoutingRules rules;
    try {
        rules = ParseRoutingRules(buffer.str());
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "router", "rule file rejected; keeping current rules",
                   {{"path", path.string()}, {"error", ex.what()}});
        if (error) {
            *error = ex.what();
        }
        return false;
    }
    return Reload(std::move(rules), error);
}

std::uint64_t MessageRouter::Version() const {
    return snapshot_.Current()->version;
}

RoutingRules DefaultRoutingRules() {
    RoutingRules rules{};
    rules.trigger_rules = {
        TriggerRule{
            .priority = 1,
            .target_partition = "messages_strikes",
            .triggers = {"strike", "missile", "shelling", "explosion", "drone attack",
                         "удар", "обстріл", "ракет"},
        },
        TriggerRule{
            .priority = 2,
            .target_partition = "messages_casualties",
            .triggers = {"killed", "wounded", "casualties", "injured", "death toll",
                         "загинул", "поранен", "жертв"},
        },
        TriggerRule{
            .priority = 3,
            .target_partition = "messages_movements",
            .triggers = {"troops", "advance", "retreat", "redeploy", "convoy", "offensive",
                         "наступ", "колона"},
        },
        TriggerRule{
            .priority = 4,
            .target_partition = "messages_equipment",
            .triggers = {"HIMARS", "ATACMS", "Storm Shadow", "Leopard", "Abrams", "Bradley",
                         "F-16", "Patriot", "howitzer", "tank"},
        },
        TriggerRule{
            .priority = 5,
            .target_partition = "messages_diplomatic",
            .triggers = {"negotiations", "sanctions", "summit", "ceasefire", "peace talks",
                         "переговор", "санкц"},
        },
    };
    rules.topic_partitions = {
        {"combat", "messages_combat"},
        {"civilian", "messages_civilian"},
        {"diplomatic", "messages_diplomatic"},
        {"equipment", "messages_equipment"},
        {"general", "messages_general"},
    };
    rules.default_partition = "messages_general";
    return rules;
}

RoutingRules ParseRoutingRules(const std::string& json_text) {
    const auto json = nlohmann::json::parse(json_text);
    if (!json.is_object()) {
        throw std::invalid_argument("routing rules must be a JSON object");
    }
    RoutingRules rules{};
    rules.topic_partitions.clear();
    if (json.contains("triggerRules") && json["triggerRules"].is_array()) {
        for (const auto& item : json["triggerRules"]) {
            TriggerRule rule{};
            rule.priority = item.value("priority", 0);
            rule.target_partition = item.value("targetPartition", "");
            if (item.contains("triggers") && item["triggers"].is_array()) {
                for (const auto& trigger : item["triggers"]) {
                    rule.triggers.push_back(trigger.get<std::string>());
                }
            }
            rules.trigger_rules.push_back(std::move(rule));
        }
    }
    if (json.contains("topicPartitions") && json["topicPartitions"].is_array()) {
        for (const auto& item : json["topicPartitions"]) {
            rules.topic_partitions.emplace_back(item.value("topic", ""), item.value("partition", ""));
        }
    }
    rules.default_partition = json.value("defaultPartition", rules.default_partition);
    return rules;
}

}  // namespace osintpipe::routing
