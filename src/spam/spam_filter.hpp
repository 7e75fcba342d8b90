#pragma once

#include <filesystem>
#include <regex>
#include <string>
#include <vector>

#include "config/snapshot.hpp"
#include "queue/queue_types.hpp"
#include "spam/spam_types.hpp"

namespace osintpipe::spam {

inline constexpr const char* kForwardBlocklistRule = "forward_blocklist";

// A rule set with its patterns lowered or compiled, ready for matching.
class CompiledRuleSet {
public:
    // Throws std::invalid_argument on a bad weight or regex.
    explicit CompiledRuleSet(SpamRuleSet rules);

    const SpamRuleSet& Rules() const { return rules_; }
    bool Matches(std::size_t rule_index, const std::string& text, const std::string& lowered) const;

private:
    struct Matcher {
        std::vector<std::string> needles;
        std::vector<std::string> words;
        std::vector<std::regex> expressions;
    };

    SpamRuleSet rules_;
    std::vector<Matcher> matchers_;
};

class SpamFilter {
public:
    SpamFilter();
    explicit SpamFilter(SpamRuleSet rules);

    SpamVerdict Check(const std::string& text, const queue::Metadata& metadata = {}) const;

    // On failure the current rules stay active and the error is returned.
    bool Reload(SpamRuleSet rules, std::string* error = nullptr);
    bool LoadFromFile(const std::filesystem::path& path, std::string* error = nullptr);

    std::uint64_t Version() const;

private:
    config::VersionedSnapshot<CompiledRuleSet> snapshot_;
};

SpamRuleSet DefaultSpamRules();
SpamRuleSet ParseSpamRules(const std::string& json_text);

}  // namespace osintpipe::spam
