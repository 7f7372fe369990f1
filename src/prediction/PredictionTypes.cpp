#include "prediction/PredictionTypes.h"

namespace stockcast {
namespace prediction {

std::string toString(PredictionStage stage) {
    switch (stage) {
        case PredictionStage::FETCHING: return "fetching";
        case PredictionStage::FEATURE_COMPUTING: return "feature_computing";
        case PredictionStage::MODEL_RESOLVING: return "model_resolving";
        case PredictionStage::INFERRING: return "inferring";
        case PredictionStage::DONE: return "done";
        case PredictionStage::FAILED: return "failed";
    }
    return "unknown";
}

} // namespace prediction
} // namespace stockcast
