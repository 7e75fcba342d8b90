#include "enrichment/geolocator.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include "utils/common.hpp"

namespace osintpipe::enrichment {
namespace {

bool IsWordByte(unsigned char c) {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

// Extends a match over the rest of the word so inflected forms keep their ending.
std::size_t WordEnd(const std::string& text, std::size_t pos) {
    while (pos < text.size() && IsWordByte(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    return pos;
}

bool StartsWord(const std::string& text, std::size_t pos) {
    return pos == 0 || !IsWordByte(static_cast<unsigned char>(text[pos - 1]));
}

}  // namespace

const std::vector<GazetteerEntry>& DefaultGazetteer() {
    static const std::vector<GazetteerEntry> gazetteer = {
        {"Bakhmut", 48.5953, 38.0003, {"Bakhmut", "Бахмут"}},
        {"Kyiv", 50.4501, 30.5234, {"Kyiv", "Kiev", "Київ", "Києв", "Киев"}},
        {"Kharkiv", 49.9935, 36.2304, {"Kharkiv", "Kharkov", "Харків", "Харков"}},
        {"Mariupol", 47.0971, 37.5434, {"Mariupol", "Маріупол", "Мариупол"}},
        {"Donetsk", 48.0159, 37.8029, {"Donetsk", "Донецьк", "Донецк"}},
        {"Luhansk", 48.5740, 39.3078, {"Luhansk", "Lugansk", "Луганськ", "Луганск"}},
        {"Dnipro", 48.4647, 35.0462, {"Dnipro", "Дніпр", "Днепр"}},
        {"Odesa", 46.4825, 30.7233, {"Odesa", "Odessa", "Одес"}},
        {"Zaporizhzhia", 47.8388, 35.1396, {"Zaporizhzhia", "Zaporozhye", "Запоріжж", "Запорож"}},
        {"Kherson", 46.6354, 32.6169, {"Kherson", "Херсон"}},
        {"Mykolaiv", 46.9750, 31.9946, {"Mykolaiv", "Nikolaev", "Миколаїв", "Миколаєв", "Николаев"}},
        {"Lviv", 49.8397, 24.0297, {"Lviv", "Lvov", "Львів", "Львов"}},
        {"Severodonetsk", 48.9483, 38.4917, {"Severodonetsk", "Sievierodonetsk", "Сєвєродонецьк", "Северодонецк"}},
        {"Lysychansk", 48.9167, 38.4333, {"Lysychansk", "Лисичанськ", "Лисичанск"}},
        {"Avdiivka", 48.1394, 37.7497, {"Avdiivka", "Avdeevka", "Авдіївк", "Авдеевк"}},
        {"Vuhledar", 47.7797, 37.2486, {"Vuhledar", "Ugledar", "Вугледар", "Угледар"}},
        {"Chasiv Yar", 48.5869, 37.8358, {"Chasiv Yar", "Часів Яр", "Часов Яр"}},
        {"Soledar", 48.6833, 38.0833, {"Soledar", "Соледар"}},
    };
    return gazetteer;
}

GazetteerGeolocator::GazetteerGeolocator()
    : GazetteerGeolocator(DefaultGazetteer()) {}

GazetteerGeolocator::GazetteerGeolocator(std::vector<GazetteerEntry> gazetteer)
    : gazetteer_(std::move(gazetteer)),
      coordinates_(R"((-?\d{1,2}\.\d{2,})\s*[,;]\s*(-?\d{1,3}\.\d{2,}))",
                   std::regex::ECMAScript | std::regex::optimize) {}

std::vector<Geolocation> GazetteerGeolocator::Locate(const std::string& text) {
    std::vector<Geolocation> candidates;

    for (std::sregex_iterator it(text.begin(), text.end(), coordinates_), end; it != end; ++it) {
        const auto& match = *it;
        const auto lat = std::strtod(match[1].str().c_str(), nullptr);
        const auto lon = std::strtod(match[2].str().c_str(), nullptr);
        if (lat < -90.0 || lat > 90.0 || lon < -180.0 || lon > 180.0) {
            continue;
        }
        const auto begin = static_cast<std::size_t>(match.position(0));
        candidates.push_back(Geolocation{
            .lat = lat,
            .lon = lon,
            .source_span = TextSpan{begin, begin + static_cast<std::size_t>(match.length(0))},
            .name = match.str(0),
        });
    }

    // Folding keeps byte offsets, so positions in haystack are positions in text.
    const auto haystack = utils::FoldCase(text);
    for (const auto& entry : gazetteer_) {
        for (const auto& variant : entry.variants) {
            const auto needle = utils::FoldCase(variant);
            std::size_t pos = haystack.find(needle);
            while (pos != std::string::npos) {
                if (StartsWord(text, pos)) {
                    candidates.push_back(Geolocation{
                        .lat = entry.lat,
                        .lon = entry.lon,
                        .source_span = TextSpan{pos, WordEnd(text, pos + needle.size())},
                        .name = entry.name,
                    });
                }
                pos = haystack.find(needle, pos + needle.size());
            }
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(), [](const auto& left, const auto& right) {
        if (left.source_span.begin != right.source_span.begin) {
            return left.source_span.begin < right.source_span.begin;
        }
        return left.source_span.end > right.source_span.end;
    });

    std::vector<Geolocation> result;
    std::size_t covered_until = 0;
    for (auto& candidate : candidates) {
        if (!result.empty() && candidate.source_span.begin < covered_until) {
            continue;
        }
        covered_until = candidate.source_span.end;
        result.push_back(std::move(candidate));
    }
    return result;
}

}  // namespace osintpipe::enrichment
