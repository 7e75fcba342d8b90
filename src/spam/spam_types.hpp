#pragma once

#include <string>
#include <vector>

namespace osintpipe::spam {

struct SpamVerdict {
    bool is_spam = false;
    double confidence = 1.0;
    std::vector<std::string> matched_rules;
};

enum class RuleKind {
    kSubstring,
    // Whole-word match; letters on either side of the pattern break it.
    kWord,
    kRegex
};

struct SpamRule {
    std::string id;
    RuleKind kind = RuleKind::kSubstring;
    std::vector<std::string> patterns;
    double weight = 1.0;
};

struct SpamRuleSet {
    std::vector<SpamRule> rules;
    double threshold = 0.85;
    // Forwards from these origins are spam regardless of text.
    std::vector<std::string> blocked_forward_sources;
};

}  // namespace osintpipe::spam
