#include "prediction/Predictor.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace stockcast {
namespace prediction {

namespace {
constexpr int LABEL_DOWN = 0;
constexpr int LABEL_UP = 1;
constexpr double PROBABILITY_TOLERANCE = 1e-6;
} // namespace

Predictor::Predictor(std::shared_ptr<model::ModelRegistry> registry)
    : registry_(std::move(registry))
{
    if (!registry_) {
        throw std::invalid_argument("Predictor requires a model registry");
    }
}

PredictionResult Predictor::predict(const std::string& symbol,
                                    const std::vector<Bar>& bars,
                                    const StageObserver& observer) const {
    auto notify = [&observer](PredictionStage stage) {
        if (observer) observer(stage);
    };

    notify(PredictionStage::FEATURE_COMPUTING);
    if (bars.empty()) {
        throw DataUnavailableError("no bars for " + symbol);
    }

    const auto original = analytics::FeatureEngine::computeLatest(bars, FeatureGeneration::ORIGINAL);

    // extended 후보는 같은 봉에서 39개 값이 모두 정의될 때만 쓸 수 있다
    std::set<FeatureGeneration> eligible = {FeatureGeneration::ORIGINAL};
    const auto extended_table = analytics::FeatureEngine::computeTable(bars, FeatureGeneration::EXTENDED);
    const auto extended = analytics::FeatureEngine::rowAt(extended_table, original.bar_index);
    if (extended) {
        eligible.insert(FeatureGeneration::EXTENDED);
    } else {
        LOG_DEBUG("{}: extended features undefined at bar {}", symbol, original.bar_index);
    }

    notify(PredictionStage::MODEL_RESOLVING);
    const auto resolved = registry_->resolve(symbol, eligible);
    const auto& row = resolved.candidate.generation == FeatureGeneration::EXTENDED ? *extended : original;

    notify(PredictionStage::INFERRING);
    const Inference inference = infer(row, *resolved.artifact);

    PredictionResult result;
    result.symbol = symbol;
    result.direction = inference.direction;
    result.confidence = inference.confidence;
    result.probability_up = inference.probability_up;
    result.probability_down = inference.probability_down;
    result.current_price = bars.back().close;
    result.timestamp = bars.back().timestamp;
    result.model_name = resolved.candidate.name;
    result.generation = resolved.candidate.generation;
    result.n_features = row.size();
    return result;
}

Inference Predictor::infer(const analytics::FeatureRow& row, const model::IModelArtifact& artifact) {
    if (row.size() != artifact.inputDimension()) {
        throw FeatureMismatchError("model expects " + std::to_string(artifact.inputDimension()) +
                                   " features, got " + std::to_string(row.size()) +
                                   " (" + toString(row.generation) + ")");
    }

    const auto& recorded = artifact.featureNames();
    if (!recorded.empty() && recorded != row.names) {
        for (size_t i = 0; i < recorded.size(); ++i) {
            if (recorded[i] != row.names[i]) {
                throw FeatureMismatchError("feature " + std::to_string(i) + " is '" + row.names[i] +
                                           "' but the model was trained with '" + recorded[i] + "'");
            }
        }
    }

    const auto& labels = artifact.classLabels();
    const auto down_it = std::find(labels.begin(), labels.end(), LABEL_DOWN);
    const auto up_it = std::find(labels.begin(), labels.end(), LABEL_UP);
    if (labels.size() != 2 || down_it == labels.end() || up_it == labels.end()) {
        throw CorruptArtifactError("model class labels must be exactly {0, 1}");
    }

    std::vector<double> proba;
    try {
        proba = artifact.predictProba(row.values);
    } catch (const std::exception& e) {
        throw CorruptArtifactError(std::string("inference failed: ") + e.what());
    }
    if (proba.size() != labels.size()) {
        throw CorruptArtifactError("model returned " + std::to_string(proba.size()) + " probabilities");
    }

    double total = 0.0;
    for (double p : proba) {
        if (!std::isfinite(p) || p < 0.0) {
            throw CorruptArtifactError("model returned an invalid probability");
        }
        total += p;
    }
    if (total <= 0.0) {
        throw CorruptArtifactError("model returned all-zero probabilities");
    }
    if (std::abs(total - 1.0) > PROBABILITY_TOLERANCE) {
        LOG_WARN("probabilities sum to {}, renormalizing", total);
    }

    const double down = proba[static_cast<size_t>(down_it - labels.begin())] / total;
    const double up = proba[static_cast<size_t>(up_it - labels.begin())] / total;

    Inference inference;
    // 동률이면 DOWN
    inference.direction = up > down ? Direction::UP : Direction::DOWN;
    inference.confidence = std::max(up, down) * 100.0;
    inference.probability_up = up * 100.0;
    inference.probability_down = down * 100.0;
    return inference;
}

} // namespace prediction
} // namespace stockcast
