#pragma once

#include <regex>
#include <string>
#include <vector>

#include "enrichment/services.hpp"

namespace osintpipe::enrichment {

struct GazetteerEntry {
    std::string name;
    double lat = 0.0;
    double lon = 0.0;
    // Spellings matched as word prefixes; ASCII ones case-insensitively.
    std::vector<std::string> variants;
};

const std::vector<GazetteerEntry>& DefaultGazetteer();

// Finds explicit "lat, lon" pairs and gazetteer place names, ordered by
// their byte offset in the text. Overlapping mentions keep the earliest,
// longest match.
class GazetteerGeolocator : public Geolocator {
public:
    GazetteerGeolocator();
    explicit GazetteerGeolocator(std::vector<GazetteerEntry> gazetteer);

    std::vector<Geolocation> Locate(const std::string& text) override;

private:
    std::vector<GazetteerEntry> gazetteer_;
    std::regex coordinates_;
};

}  // namespace osintpipe::enrichment
