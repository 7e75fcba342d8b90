#include "enrichment/entity_extractor.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

#include "utils/common.hpp"

namespace osintpipe::enrichment {
namespace {

// std::regex works on bytes, so \b never fires next to Cyrillic letters.
// Cyrillic patterns get this lookahead appended instead.
constexpr const char* kCyrillicWordEnd = R"re((?=$|[\s.,;:!?()"'\-]))re";

const std::vector<std::string> kMilitaryUnitPatterns = {
    R"(\b\d{1,3}(?:st|nd|rd|th)?\s+(?:Brigade|Battalion|Regiment|Division)\b)",
    R"(\b\d{1,3}(?:st|nd|rd|th)?\s+(?:Separate\s+)?(?:Mechanized|Airborne|Air\s+Assault|Assault|Infantry|Tank|Artillery|Marine|Jaeger)\s+(?:Brigade|Battalion|Regiment|Division)\b)",
    R"(\bAzov\s+(?:Battalion|Regiment|Brigade)\b)",
    R"(\bKraken\s+(?:Battalion|Regiment|Unit)\b)",
};

const std::vector<std::string> kMilitaryUnitPatternsCyrillic = {
    R"(\b\d{1,3}\s*(?:ОМБр|ОШБр|ОДШБр|ОМПБр|ОТБр|ОАБр))",
};

const std::vector<std::string> kOrganizationPatterns = {
    R"(\bWagner\s+Group\b)",
    R"(\b(?:Armed\s+Forces\s+of\s+Ukraine|Armed\s+Forces\s+of\s+Russia|Russian\s+Forces)\b)",
    R"(\bRed\s+Cross\b)",
};

const std::vector<std::string> kOrganizationAcronyms = {
    R"(\b(?:AFU|UAF|RF|NATO|UN|EU|OSCE|IAEA|ICRC|SBU|GUR|FSB)\b)",
};

const std::vector<std::string> kOrganizationPatternsCyrillic = {
    R"((?:ЗСУ|ВС\s+РФ|СБУ|ГУР|НАТО|ФСБ))",
};

// Title followed by a capitalised name; the name is the captured entity.
const std::vector<std::string> kPeoplePatterns = {
    R"(\b(?:President|Prime\s+Minister|Defen[cs]e\s+Minister|Foreign\s+Minister|Minister|General|Colonel|Commander|Spokesman|Spokeswoman)\s+([A-Z][a-z]+(?:\s+[A-Z][a-z]+)?))",
};

const std::vector<std::string> kKnownPeoplePatterns = {
    R"(\b(?:Zelenskyy?|Putin|Syrskyi|Zaluzhnyi|Budanov|Shoigu|Gerasimov|Prigozhin|Umerov|Belousov)\b)",
};

const std::vector<std::string> kLocationPatterns = {
    R"(\bBakhmut\w*\b)",
    R"(\b(?:Kyiv|Kiev)\w*\b)",
    R"(\bKharkiv\w*\b)",
    R"(\bMariupol\w*\b)",
    R"(\bDonetsk\w*\b)",
    R"(\bLuhansk\w*\b)",
    R"(\bDnipro\w*\b)",
    R"(\b(?:Odesa|Odessa)\w*\b)",
    R"(\bZaporizhzhia\w*\b)",
    R"(\bKherson\w*\b)",
    R"(\bMykolaiv\w*\b)",
    R"(\bLviv\w*\b)",
    R"(\bSeverodonetsk\w*\b)",
    R"(\bLysychansk\w*\b)",
    R"(\bAvdiivka\w*\b)",
    R"(\bVuhledar\w*\b)",
    R"(\bChasiv\s+Yar\w*\b)",
    R"(\bSoledar\w*\b)",
};

const std::vector<std::string> kLocationPatternsCyrillic = {
    R"(Бахмут(?:і|у|а)?)",
    R"(Ки(?:ї|є)в(?:і|у|а)?)",
    R"(Харк(?:і|о)в(?:і|у|а)?)",
    R"(Маріупол(?:ь|і|ю|я)?)",
    R"(Донецьк(?:у|а)?)",
    R"(Луганськ(?:у|а)?)",
    R"(Дніпр(?:о|у|а)?)",
    R"(Одес(?:і|у|а)?)",
    R"(Запоріжж(?:я|і)?)",
    R"(Херсон(?:і|у|а)?)",
    R"(Микола(?:ї|є)в(?:і|у|а)?)",
    R"(Льв(?:і|о)в(?:і|у|а)?)",
    R"(Сєвєродонецьк(?:у|а)?)",
    R"(Лисичанськ(?:у|а)?)",
    R"(Авдіївк(?:і|а|у)?)",
    R"(Вугледар(?:і|у|а)?)",
    R"(Часів\s+Яр(?:і|у|а)?)",
    R"(Соледар(?:і|у|а)?)",
};

const std::vector<std::string> kDirectionPatterns = {
    R"(\b(?:Eastern|Southern|Northern)\s+Front\b)",
    R"(\b(?:Zaporizhzhia|Kharkiv|Kherson|Pokrovsk|Kupiansk|Lyman|Bakhmut|Avdiivka)\s+(?:direction|axis)\b)",
    R"(\bDonbas\b)",
    R"(\bCrimea\b)",
};

const std::vector<std::string> kDirectionPatternsCyrillic = {
    R"((?:Східний|Південний|Північний)\s+фронт)",
    R"(Донбас(?:і|у)?)",
    R"(Крим(?:у)?)",
};

std::vector<std::string> WithWordEnd(const std::vector<std::string>& patterns) {
    std::vector<std::string> out;
    out.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        out.push_back(pattern + kCyrillicWordEnd);
    }
    return out;
}

template <typename T>
void Append(std::vector<T>& target, std::vector<T> source) {
    target.insert(target.end(),
                  std::make_move_iterator(source.begin()),
                  std::make_move_iterator(source.end()));
}

}  // namespace

RegexEntityExtractor::RegexEntityExtractor() {
    military_units_ = Compile(kMilitaryUnitPatterns, true);
    Append(military_units_, Compile(WithWordEnd(kMilitaryUnitPatternsCyrillic), false));

    organizations_ = Compile(kOrganizationPatterns, true);
    Append(organizations_, Compile(kOrganizationAcronyms, false));
    Append(organizations_, Compile(WithWordEnd(kOrganizationPatternsCyrillic), false));

    people_ = Compile(kPeoplePatterns, false);
    for (auto& pattern : people_) {
        pattern.group = 1;
    }
    Append(people_, Compile(kKnownPeoplePatterns, false));

    locations_ = Compile(kLocationPatterns, true);
    Append(locations_, Compile(WithWordEnd(kLocationPatternsCyrillic), false));

    directions_ = Compile(kDirectionPatterns, true);
    Append(directions_, Compile(WithWordEnd(kDirectionPatternsCyrillic), false));
}

std::vector<RegexEntityExtractor::Pattern> RegexEntityExtractor::Compile(
    const std::vector<std::string>& patterns,
    bool icase) {
    auto flags = std::regex::ECMAScript | std::regex::optimize;
    if (icase) {
        flags |= std::regex::icase;
    }
    std::vector<Pattern> compiled;
    compiled.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        compiled.push_back(Pattern{std::regex(pattern, flags), 0});
    }
    return compiled;
}

std::vector<std::string> RegexEntityExtractor::Collect(const std::vector<Pattern>& patterns,
                                                       const std::string& text) {
    std::vector<std::pair<std::size_t, std::string>> found;
    std::unordered_set<std::string> seen;
    for (const auto& pattern : patterns) {
        for (std::sregex_iterator it(text.begin(), text.end(), pattern.expression), end; it != end; ++it) {
            const auto& match = *it;
            if (!match[pattern.group].matched) {
                continue;
            }
            auto value = utils::Trim(match[pattern.group].str());
            if (value.empty() || !seen.insert(utils::FoldCase(value)).second) {
                continue;
            }
            found.emplace_back(static_cast<std::size_t>(match.position(pattern.group)), std::move(value));
        }
    }
    std::stable_sort(found.begin(), found.end(), [](const auto& left, const auto& right) {
        return left.first < right.first;
    });
    std::vector<std::string> values;
    values.reserve(found.size());
    for (auto& item : found) {
        values.push_back(std::move(item.second));
    }
    return values;
}

Entities RegexEntityExtractor::Extract(const std::string& text) {
    Entities entities{};
    if (text.empty()) {
        return entities;
    }
    entities.military_units = Collect(military_units_, text);
    entities.organizations = Collect(organizations_, text);
    entities.people = Collect(people_, text);
    entities.locations = Collect(locations_, text);
    entities.directions = Collect(directions_, text);
    return entities;
}

}  // namespace osintpipe::enrichment
