#include "model/ModelCandidate.h"

#include <algorithm>
#include <cctype>

namespace stockcast {
namespace model {

namespace {
const std::string kSymbolPlaceholder = "{symbol}";

std::string expandPattern(const std::string& pattern, const std::string& token) {
    std::string out = pattern;
    size_t pos = 0;
    while ((pos = out.find(kSymbolPlaceholder, pos)) != std::string::npos) {
        out.replace(pos, kSymbolPlaceholder.size(), token);
        pos += token.size();
    }
    return out;
}
} // namespace

CandidateTable CandidateTable::defaults() {
    CandidateTable table;
    table.setCandidates(AssetClass::CRYPTO, {
        {"crypto_specific", "{symbol}_model.json", FeatureGeneration::ORIGINAL, std::nullopt},
        {"spy_original", "spy_model.json", FeatureGeneration::ORIGINAL, std::nullopt},
    });
    table.setCandidates(AssetClass::EQUITY, {
        {"spy_enhanced", "enhanced_spy_model.json", FeatureGeneration::EXTENDED, std::nullopt},
        {"spy_original", "spy_model.json", FeatureGeneration::ORIGINAL, std::nullopt},
    });
    return table;
}

void CandidateTable::setCandidates(AssetClass asset_class, std::vector<CandidateSpec> specs) {
    specs_[asset_class] = std::move(specs);
}

const std::vector<CandidateSpec>& CandidateTable::specsFor(AssetClass asset_class) const {
    static const std::vector<CandidateSpec> kEmpty;
    auto it = specs_.find(asset_class);
    return it != specs_.end() ? it->second : kEmpty;
}

std::vector<ModelCandidate> CandidateTable::expand(
    const std::string& symbol,
    AssetClass asset_class,
    const std::filesystem::path& model_dir
) const {
    const std::string token = symbolToken(symbol);
    std::vector<ModelCandidate> out;
    int priority = 0;
    for (const auto& spec : specsFor(asset_class)) {
        ModelCandidate candidate;
        candidate.name = spec.name;
        candidate.file_name = expandPattern(spec.file_pattern, token);
        candidate.location = (model_dir / candidate.file_name).lexically_normal();
        candidate.generation = spec.generation;
        candidate.asset_class = asset_class;
        candidate.priority = priority++;
        out.push_back(std::move(candidate));
    }
    return out;
}

std::string CandidateTable::symbolToken(const std::string& symbol) {
    std::string token = symbol;
    std::transform(token.begin(), token.end(), token.begin(), [](unsigned char c) {
        if (c == '-' || c == '/') return '_';
        return static_cast<char>(std::tolower(c));
    });
    return token;
}

} // namespace model
} // namespace stockcast
