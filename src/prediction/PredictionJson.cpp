#include "prediction/PredictionJson.h"
#include "model/TreeEnsembleModel.h"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace stockcast {
namespace prediction {

double PredictionJson::round(double value, int decimals) {
    if (decimals < 0) return value;
    const double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

std::string PredictionJson::formatTimestamp(long long epoch_ms) {
    std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
    if (epoch_ms < 0 && epoch_ms % 1000 != 0) --seconds;

    std::tm tm_utc{};
    gmtime_r(&seconds, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

nlohmann::json PredictionJson::success(const PredictionResult& result, int decimals) {
    nlohmann::json j;
    j["success"] = true;
    j["symbol"] = result.symbol;
    j["prediction"] = toString(result.direction);
    // 가격은 반올림하지 않는다. 확률은 up만 반올림하고 down = 100 - up 으로 합을 유지한다
    double up = result.probability_up;
    double down = result.probability_down;
    double confidence = result.confidence;
    if (decimals >= 0) {
        up = round(up, decimals);
        down = 100.0 - up;
        confidence = result.direction == Direction::UP ? up : down;
    }
    j["confidence"] = confidence;
    j["current_price"] = result.current_price;
    j["probabilities"] = {
        {"up", up},
        {"down", down}
    };
    j["timestamp"] = formatTimestamp(result.timestamp);
    j["model"] = {
        {"name", result.model_name},
        {"generation", toString(result.generation)},
        {"n_features", result.n_features}
    };
    return j;
}

nlohmann::json PredictionJson::error(const std::string& symbol, const PredictionFailure& failure) {
    return {
        {"success", false},
        {"symbol", symbol},
        {"error", toString(failure.kind)},
        {"details", failure.message},
        {"stage", toString(failure.failed_at)}
    };
}

nlohmann::json PredictionJson::outcome(const PredictionOutcome& outcome, int decimals) {
    if (outcome.result) {
        return success(*outcome.result, decimals);
    }
    if (outcome.failure) {
        return error(outcome.symbol, *outcome.failure);
    }
    // 결과도 실패도 없는 outcome은 만들어지지 않는다
    return error(outcome.symbol, PredictionFailure{ErrorKind::DATA_UNAVAILABLE,
                                                   "prediction did not complete", outcome.stage});
}

nlohmann::json PredictionJson::batch(const std::vector<PredictionOutcome>& outcomes, int decimals) {
    nlohmann::json predictions = nlohmann::json::array();
    for (const auto& o : outcomes) {
        predictions.push_back(outcome(o, decimals));
    }
    return {{"success", true}, {"predictions", predictions}};
}

nlohmann::json PredictionJson::modelInfo(const std::string& symbol,
                                         AssetClass asset_class,
                                         const model::ResolvedModel& resolved) {
    const auto& artifact = *resolved.artifact;

    nlohmann::json j;
    j["symbol"] = symbol;
    j["asset_class"] = toString(asset_class);
    j["model"] = {
        {"name", resolved.candidate.name},
        {"file", resolved.candidate.file_name},
        {"generation", toString(resolved.candidate.generation)},
        {"description", artifact.describe()}
    };
    j["classes"] = artifact.classLabels();
    j["n_features"] = artifact.inputDimension();

    if (const auto* ensemble = dynamic_cast<const model::TreeEnsembleModel*>(&artifact)) {
        j["n_trees"] = ensemble->treeCount();
    }
    if (!artifact.featureNames().empty()) {
        j["feature_names"] = artifact.featureNames();
    }
    return j;
}

} // namespace prediction
} // namespace stockcast
