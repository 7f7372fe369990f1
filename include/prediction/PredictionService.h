#pragma once

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "data/IBarSource.h"
#include "prediction/PredictionTypes.h"
#include "prediction/Predictor.h"

namespace stockcast {
namespace prediction {

// 서비스 경계: 예외 대신 PredictionOutcome 값을 돌려준다.
class PredictionService {
public:
    PredictionService(std::shared_ptr<data::IBarSource> bar_source,
                      std::shared_ptr<Predictor> predictor,
                      int lookback_bars);

    PredictionOutcome predictSymbol(const std::string& symbol);
    std::vector<PredictionOutcome> predictBatch(const std::vector<std::string>& symbols);

    // Model info document, or an error document if no candidate loads.
    nlohmann::json modelInfo(const std::string& symbol);

    int lookbackBars() const { return lookback_bars_; }

private:
    static ErrorKind kindForUntypedFailure(PredictionStage stage);

    std::shared_ptr<data::IBarSource> bar_source_;
    std::shared_ptr<Predictor> predictor_;
    int lookback_bars_;
};

} // namespace prediction
} // namespace stockcast
