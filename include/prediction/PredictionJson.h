#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/ModelRegistry.h"
#include "prediction/PredictionTypes.h"

namespace stockcast {
namespace prediction {

// Wire documents. decimals >= 0 rounds the probabilities only (up + down stays 100);
// current_price is always emitted at full precision.
class PredictionJson {
public:
    static nlohmann::json success(const PredictionResult& result, int decimals = -1);
    static nlohmann::json error(const std::string& symbol, const PredictionFailure& failure);
    static nlohmann::json outcome(const PredictionOutcome& outcome, int decimals = -1);
    static nlohmann::json batch(const std::vector<PredictionOutcome>& outcomes, int decimals = -1);

    static nlohmann::json modelInfo(const std::string& symbol,
                                    AssetClass asset_class,
                                    const model::ResolvedModel& resolved);

    // epoch ms -> "2024-01-02T00:00:00Z"
    static std::string formatTimestamp(long long epoch_ms);

    static double round(double value, int decimals);
};

} // namespace prediction
} // namespace stockcast
