#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"

namespace stockcast {
namespace model {

// 설정/기본 테이블의 한 줄. file_pattern 안의 "{symbol}"은 심볼 토큰으로 치환된다.
struct CandidateSpec {
    std::string name;
    std::string file_pattern;
    FeatureGeneration generation = FeatureGeneration::ORIGINAL;
    std::optional<std::size_t> input_dimension;
};

// A concrete, symbol-resolved candidate in priority order.
struct ModelCandidate {
    std::string name;
    std::string file_name;
    std::filesystem::path location;
    FeatureGeneration generation = FeatureGeneration::ORIGINAL;
    AssetClass asset_class = AssetClass::EQUITY;
    int priority = 0;
};

class CandidateTable {
public:
    // crypto: {symbol}_model -> spy_model / equity: enhanced_spy_model -> spy_model
    static CandidateTable defaults();

    void setCandidates(AssetClass asset_class, std::vector<CandidateSpec> specs);
    const std::vector<CandidateSpec>& specsFor(AssetClass asset_class) const;

    std::vector<ModelCandidate> expand(const std::string& symbol,
                                       AssetClass asset_class,
                                       const std::filesystem::path& model_dir) const;

    // "BTC-USD" -> "btc_usd"
    static std::string symbolToken(const std::string& symbol);

private:
    std::map<AssetClass, std::vector<CandidateSpec>> specs_;
};

} // namespace model
} // namespace stockcast
