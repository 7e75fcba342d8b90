#pragma once

#include <regex>
#include <string>
#include <vector>

#include "enrichment/services.hpp"

namespace osintpipe::enrichment {

// Pattern-based extraction of military units, organisations, people,
// locations and front directions. Cyrillic patterns match case-sensitively.
class RegexEntityExtractor : public EntityExtractor {
public:
    RegexEntityExtractor();

    Entities Extract(const std::string& text) override;

private:
    struct Pattern {
        std::regex expression;
        int group = 0;
    };

    static std::vector<Pattern> Compile(const std::vector<std::string>& patterns, bool icase);
    static std::vector<std::string> Collect(const std::vector<Pattern>& patterns, const std::string& text);

    std::vector<Pattern> military_units_;
    std::vector<Pattern> organizations_;
    std::vector<Pattern> people_;
    std::vector<Pattern> locations_;
    std::vector<Pattern> directions_;
};

}  // namespace osintpipe::enrichment
