#pragma once

#include <optional>
#include <string>

#include "common/Errors.h"
#include "common/Types.h"

namespace stockcast {
namespace prediction {

struct PredictionResult {
    std::string symbol;
    Direction direction = Direction::DOWN;
    double confidence = 0.0;     // [50, 100] for two classes
    double probability_up = 0.0;   // percent
    double probability_down = 0.0; // percent
    double current_price = 0.0;
    long long timestamp = 0;     // timestamp of the bar the prediction is made from

    std::string model_name;
    FeatureGeneration generation = FeatureGeneration::ORIGINAL;
    size_t n_features = 0;
};

// Fetching -> FeatureComputing -> ModelResolving -> Inferring -> Done | Failed
enum class PredictionStage {
    FETCHING,
    FEATURE_COMPUTING,
    MODEL_RESOLVING,
    INFERRING,
    DONE,
    FAILED
};

std::string toString(PredictionStage stage);

struct PredictionFailure {
    ErrorKind kind;
    std::string message;
    PredictionStage failed_at;   // 실패 직전 단계
};

// 서비스 경계의 결과 값. result와 failure 중 하나만 채워진다.
struct PredictionOutcome {
    std::string symbol;
    PredictionStage stage = PredictionStage::FETCHING;
    std::optional<PredictionResult> result;
    std::optional<PredictionFailure> failure;

    bool ok() const { return result.has_value(); }
};

} // namespace prediction
} // namespace stockcast
