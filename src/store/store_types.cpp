#include "store/store_types.hpp"

namespace osintpipe::store {

const char* ToString(EnrichmentState state) {
    switch (state) {
        case EnrichmentState::kSpam: return "spam";
        case EnrichmentState::kPartial: return "partial";
        case EnrichmentState::kFull: return "full";
    }
    return "unknown";
}

std::optional<EnrichmentState> ParseEnrichmentState(const std::string& value) {
    if (value == "spam") {
        return EnrichmentState::kSpam;
    }
    if (value == "partial") {
        return EnrichmentState::kPartial;
    }
    if (value == "full") {
        return EnrichmentState::kFull;
    }
    return std::nullopt;
}

}  // namespace osintpipe::store
