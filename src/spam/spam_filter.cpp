#include "spam/spam_filter.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace osintpipe::spam {
namespace {

RuleKind ParseKind(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    if (lowered == "substring") {
        return RuleKind::kSubstring;
    }
    if (lowered == "word") {
        return RuleKind::kWord;
    }
    if (lowered == "regex") {
        return RuleKind::kRegex;
    }
    throw std::invalid_argument("unknown spam rule kind: " + value);
}

// Decodes one- and two-byte sequences only; anything longer (CJK, emoji,
// typographic punctuation) decodes to 0 and counts as a separator.
char32_t DecodeAt(const std::string& text, std::size_t pos) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    if (lead < 0x80) {
        return lead;
    }
    if (lead >= 0xC0 && lead <= 0xDF && pos + 1 < text.size()) {
        return static_cast<char32_t>(((lead & 0x1F) << 6) | (static_cast<unsigned char>(text[pos + 1]) & 0x3F));
    }
    return 0;
}

char32_t DecodeBefore(const std::string& text, std::size_t pos) {
    const auto last = static_cast<unsigned char>(text[pos - 1]);
    if (last < 0x80) {
        return last;
    }
    if (pos >= 2 && (last & 0xC0) == 0x80) {
        const auto lead = static_cast<unsigned char>(text[pos - 2]);
        if (lead >= 0xC0 && lead <= 0xDF) {
            return DecodeAt(text, pos - 2);
        }
    }
    return 0;
}

// ASCII alphanumerics and underscore, Latin-1 and Latin Extended letters, Cyrillic.
bool IsWordCodePoint(char32_t cp) {
    if (cp < 0x80) {
        return std::isalnum(static_cast<unsigned char>(cp)) || cp == U'_';
    }
    return cp >= 0xC0 && cp <= 0x4FF && cp != 0xD7 && cp != 0xF7;
}

bool ContainsWord(const std::string& text, const std::string& word) {
    std::size_t pos = text.find(word);
    while (pos != std::string::npos) {
        const auto end = pos + word.size();
        const bool open_before = pos == 0 || !IsWordCodePoint(DecodeBefore(text, pos));
        const bool open_after = end >= text.size() || !IsWordCodePoint(DecodeAt(text, end));
        if (open_before && open_after) {
            return true;
        }
        pos = text.find(word, pos + 1);
    }
    return false;
}

}  // namespace

CompiledRuleSet::CompiledRuleSet(SpamRuleSet rules)
    : rules_(std::move(rules)) {
    if (rules_.threshold < 0.0 || rules_.threshold > 1.0) {
        throw std::invalid_argument("spam threshold must be within [0, 1]");
    }
    matchers_.reserve(rules_.rules.size());
    for (const auto& rule : rules_.rules) {
        if (rule.id.empty()) {
            throw std::invalid_argument("spam rule without id");
        }
        if (rule.weight < 0.0 || rule.weight > 1.0) {
            throw std::invalid_argument("spam rule " + rule.id + " has weight outside [0, 1]");
        }
        Matcher matcher{};
        for (const auto& pattern : rule.patterns) {
            if (pattern.empty()) {
                continue;
            }
            if (rule.kind == RuleKind::kSubstring) {
                matcher.needles.push_back(utils::FoldCase(pattern));
                continue;
            }
            if (rule.kind == RuleKind::kWord) {
                matcher.words.push_back(utils::FoldCase(pattern));
                continue;
            }
            try {
                matcher.expressions.emplace_back(
                    pattern, std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
            } catch (const std::regex_error& ex) {
                throw std::invalid_argument("spam rule " + rule.id + " has invalid regex: " + ex.what());
            }
        }
        matchers_.push_back(std::move(matcher));
    }
}

bool CompiledRuleSet::Matches(std::size_t rule_index,
                              const std::string& text,
                              const std::string& lowered) const {
    const auto& matcher = matchers_.at(rule_index);
    for (const auto& needle : matcher.needles) {
        if (lowered.find(needle) != std::string::npos) {
            return true;
        }
    }
    for (const auto& word : matcher.words) {
        if (ContainsWord(lowered, word)) {
            return true;
        }
    }
    for (const auto& expression : matcher.expressions) {
        if (std::regex_search(text, expression)) {
            return true;
        }
    }
    return false;
}

SpamFilter::SpamFilter()
    : SpamFilter(DefaultSpamRules()) {}

SpamFilter::SpamFilter(SpamRuleSet rules)
    : snapshot_(CompiledRuleSet(std::move(rules))) {}

SpamVerdict SpamFilter::Check(const std::string& text, const queue::Metadata& metadata) const {
    const auto current = snapshot_.Current();
    const auto& compiled = current->value;
    const auto& rules = compiled.Rules();

    SpamVerdict verdict{};
    const auto forward = metadata.find("forward_from");
    if (forward != metadata.end() && !forward->second.empty()) {
        const auto& blocked = rules.blocked_forward_sources;
        if (std::find(blocked.begin(), blocked.end(), forward->second) != blocked.end()) {
            verdict.is_spam = true;
            verdict.confidence = 1.0;
            verdict.matched_rules.push_back(kForwardBlocklistRule);
            return verdict;
        }
    }

    const auto lowered = utils::FoldCase(text);
    double max_partial = 0.0;
    for (std::size_t i = 0; i < rules.rules.size(); ++i) {
        const auto& rule = rules.rules[i];
        if (!compiled.Matches(i, text, lowered)) {
            continue;
        }
        verdict.matched_rules.push_back(rule.id);
        if (rule.weight >= rules.threshold) {
            verdict.is_spam = true;
            verdict.confidence = rule.weight;
            return verdict;
        }
        max_partial = std::max(max_partial, rule.weight);
    }
    verdict.confidence = 1.0 - max_partial;
    return verdict;
}

bool SpamFilter::Reload(SpamRuleSet rules, std::string* error) {
    try {
        CompiledRuleSet compiled(std::move(rules));
        const auto count = compiled.Rules().rules.size();
        const auto version = snapshot_.Swap(std::move(compiled));
        utils::Log(utils::LogLevel::kInfo, "spam", "rules reloaded",
                   {{"version", std::to_string(version)}, {"rules", std::to_string(count)}});
        return true;
    } catch (const std::invalid_argument& ex) {
        utils::Log(utils::LogLevel::kError, "spam", "rule reload rejected; keeping current rules",
                   {{"error", ex.what()}});
        if (error) {
            *error = ex.what();
        }
        return false;
    }
}

bool SpamFilter::LoadFromFile(const std::filesystem::path& path, std::string* error) {
    std::ifstream input(path);
    if (!input) {
        const auto message = "cannot read spam rules file " + path.string();
        utils::Log(utils::LogLevel::kError, "spam", message);
        if (error) {
            *error = message;
        }
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    SpamRuleSet rules;
    try {
        rules = ParseSpamRules(buffer.str());
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "spam", "rule file rejected; keeping current rules",
                   {{"path", path.string()}, {"error", ex.what()}});
        if (error) {
            *error = ex.what();
        }
        return false;
    }
    return Reload(std::move(rules), error);
}

std::uint64_t SpamFilter::Version() const {
    return snapshot_.Current()->version;
}

SpamRuleSet DefaultSpamRules() {
    SpamRuleSet rules{};
    rules.threshold = 0.85;
    rules.rules.push_back(SpamRule{
        .id = "card_numbers",
        .kind = RuleKind::kRegex,
        .patterns = {R"(\b\d{4}[\s-]?\d{4}[\s-]?\d{4}[\s-]?\d{4}\b)"},
        .weight = 1.0,
    });
    rules.rules.push_back(SpamRule{
        .id = "donation_keywords",
        .kind = RuleKind::kWord,
        .patterns = {"donate", "support us", "донат", "донатить", "підтримайте", "поддержите"},
        .weight = 1.0,
    });
    rules.rules.push_back(SpamRule{
        .id = "excessive_emojis",
        .kind = RuleKind::kRegex,
        .patterns = {"(💰|💳|🔥){3,}"},
        .weight = 1.0,
    });
    return rules;
}

SpamRuleSet ParseSpamRules(const std::string& json_text) {
    const auto json = nlohmann::json::parse(json_text);
    if (!json.is_object()) {
        throw std::invalid_argument("spam rules must be a JSON object");
    }
    SpamRuleSet rules{};
    rules.threshold = json.value("threshold", rules.threshold);
    if (json.contains("blockedForwardSources") && json["blockedForwardSources"].is_array()) {
        for (const auto& item : json["blockedForwardSources"]) {
            rules.blocked_forward_sources.push_back(item.get<std::string>());
        }
    }
    if (!json.contains("rules") || !json["rules"].is_array()) {
        throw std::invalid_argument("spam rules file has no rules array");
    }
    for (const auto& item : json["rules"]) {
        SpamRule rule{};
        rule.id = item.value("id", "");
        rule.kind = ParseKind(item.value("kind", "substring"));
        rule.weight = item.value("weight", 1.0);
        if (item.contains("patterns") && item["patterns"].is_array()) {
            for (const auto& pattern : item["patterns"]) {
                rule.patterns.push_back(pattern.get<std::string>());
            }
        }
        rules.rules.push_back(std::move(rule));
    }
    return rules;
}

}  // namespace osintpipe::spam
