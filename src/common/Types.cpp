#include "common/Types.h"

#include <algorithm>
#include <cctype>

namespace stockcast {

std::string toString(AssetClass asset_class) {
    switch (asset_class) {
        case AssetClass::EQUITY: return "equity";
        case AssetClass::CRYPTO: return "crypto";
    }
    return "unknown";
}

std::string toString(FeatureGeneration generation) {
    switch (generation) {
        case FeatureGeneration::ORIGINAL: return "original";
        case FeatureGeneration::EXTENDED: return "extended";
    }
    return "unknown";
}

std::string toString(Direction direction) {
    return direction == Direction::UP ? "UP" : "DOWN";
}

std::optional<FeatureGeneration> parseFeatureGeneration(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "original") return FeatureGeneration::ORIGINAL;
    if (lower == "extended") return FeatureGeneration::EXTENDED;
    return std::nullopt;
}

} // namespace stockcast
