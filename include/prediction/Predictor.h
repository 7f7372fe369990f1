#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "analytics/FeatureEngine.h"
#include "model/IModelArtifact.h"
#include "model/ModelRegistry.h"
#include "prediction/PredictionTypes.h"

namespace stockcast {
namespace prediction {

struct Inference {
    Direction direction = Direction::DOWN;
    double confidence = 0.0;
    double probability_up = 0.0;
    double probability_down = 0.0;
};

class Predictor {
public:
    using StageObserver = std::function<void(PredictionStage)>;

    explicit Predictor(std::shared_ptr<model::ModelRegistry> registry);

    // bars -> features -> model -> direction. Throws PredictionError subclasses.
    // observer (optional) is told each stage before it starts.
    PredictionResult predict(const std::string& symbol,
                             const std::vector<Bar>& bars,
                             const StageObserver& observer = nullptr) const;

    // FeatureMismatchError: length or recorded feature order differs.
    // CorruptArtifactError: labels are not {0,1} or probabilities are unusable.
    static Inference infer(const analytics::FeatureRow& row, const model::IModelArtifact& artifact);

    const std::shared_ptr<model::ModelRegistry>& registry() const { return registry_; }

private:
    std::shared_ptr<model::ModelRegistry> registry_;
};

} // namespace prediction
} // namespace stockcast
