#include "prediction/PredictionService.h"
#include "prediction/PredictionJson.h"
#include "common/Logger.h"

#include <stdexcept>

namespace stockcast {
namespace prediction {

PredictionService::PredictionService(std::shared_ptr<data::IBarSource> bar_source,
                                     std::shared_ptr<Predictor> predictor,
                                     int lookback_bars)
    : bar_source_(std::move(bar_source))
    , predictor_(std::move(predictor))
    , lookback_bars_(lookback_bars)
{
    if (!bar_source_ || !predictor_) {
        throw std::invalid_argument("PredictionService requires a bar source and a predictor");
    }
    if (lookback_bars_ <= 0) {
        throw std::invalid_argument("lookback_bars must be positive");
    }
}

PredictionOutcome PredictionService::predictSymbol(const std::string& symbol) {
    PredictionOutcome outcome;
    outcome.symbol = symbol;

    auto enter = [&outcome](PredictionStage stage) {
        LOG_DEBUG("{}: {} -> {}", outcome.symbol, toString(outcome.stage), toString(stage));
        outcome.stage = stage;
    };

    auto fail = [&outcome](ErrorKind kind, const std::string& message) {
        outcome.failure = PredictionFailure{kind, message, outcome.stage};
        LOG_WARN("{}: {} failed with {}: {}", outcome.symbol, toString(outcome.stage), toString(kind), message);
        outcome.stage = PredictionStage::FAILED;
    };

    try {
        outcome.stage = PredictionStage::FETCHING;
        const auto bars = bar_source_->fetchBars(symbol, lookback_bars_);

        auto result = predictor_->predict(symbol, bars, enter);
        enter(PredictionStage::DONE);

        LOG_INFO("{}: {} {:.2f}% (model {})",
                 symbol, toString(result.direction), result.confidence, result.model_name);
        Logger::getInstance().logPrediction(symbol, toString(result.direction), result.confidence,
                                            result.current_price, result.model_name);
        outcome.result = std::move(result);
    } catch (const PredictionError& e) {
        fail(e.kind(), e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("{}: unexpected error during {}: {}", symbol, toString(outcome.stage), e.what());
        fail(kindForUntypedFailure(outcome.stage), e.what());
    }

    return outcome;
}

std::vector<PredictionOutcome> PredictionService::predictBatch(const std::vector<std::string>& symbols) {
    std::vector<PredictionOutcome> outcomes;
    outcomes.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        outcomes.push_back(predictSymbol(symbol));
    }
    return outcomes;
}

nlohmann::json PredictionService::modelInfo(const std::string& symbol) {
    const auto& registry = predictor_->registry();
    try {
        const auto resolved = registry->resolve(
            symbol, {FeatureGeneration::ORIGINAL, FeatureGeneration::EXTENDED});
        return PredictionJson::modelInfo(symbol, registry->classify(symbol), resolved);
    } catch (const PredictionError& e) {
        PredictionFailure failure{e.kind(), e.what(), PredictionStage::MODEL_RESOLVING};
        return PredictionJson::error(symbol, failure);
    }
}

ErrorKind PredictionService::kindForUntypedFailure(PredictionStage stage) {
    switch (stage) {
        case PredictionStage::MODEL_RESOLVING: return ErrorKind::MODEL_NOT_FOUND;
        case PredictionStage::INFERRING: return ErrorKind::CORRUPT_ARTIFACT;
        default: return ErrorKind::DATA_UNAVAILABLE;
    }
}

} // namespace prediction
} // namespace stockcast
