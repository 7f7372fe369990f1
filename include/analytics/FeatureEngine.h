#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"

namespace stockcast {
namespace analytics {

// One row per bar; cells stay std::nullopt during warm-up.
struct FeatureTable {
    FeatureGeneration generation = FeatureGeneration::ORIGINAL;
    std::vector<std::string> names;
    std::vector<std::vector<std::optional<double>>> rows;
    std::vector<long long> timestamps;

    bool isComplete(size_t row) const;
};

// 추론 입력 한 줄. names 순서가 곧 모델 입력 순서.
struct FeatureRow {
    FeatureGeneration generation = FeatureGeneration::ORIGINAL;
    std::vector<std::string> names;
    std::vector<double> values;
    size_t bar_index = 0;
    long long timestamp = 0;

    size_t size() const { return values.size(); }
};

class FeatureEngine {
public:
    // Canonical, training-order feature names. The extended list starts with
    // the full original list; extras are only ever appended.
    static const std::vector<std::string>& featureNames(FeatureGeneration generation);
    static size_t featureCount(FeatureGeneration generation);

    // Rejects malformed series with DataUnavailableError.
    static void validateBars(const std::vector<Bar>& bars);

    static FeatureTable computeTable(const std::vector<Bar>& bars,
                                     FeatureGeneration generation = FeatureGeneration::ORIGINAL);

    // Row at bar index if every cell there is defined.
    static std::optional<FeatureRow> rowAt(const FeatureTable& table, size_t index);

    // 마지막으로 모든 값이 정의된 행
    static std::optional<FeatureRow> findLatestRow(const FeatureTable& table);

    // Throws InsufficientHistoryError when no row is fully defined.
    static FeatureRow latestRow(const FeatureTable& table);

    static FeatureRow computeLatest(const std::vector<Bar>& bars,
                                    FeatureGeneration generation = FeatureGeneration::ORIGINAL);
};

} // namespace analytics
} // namespace stockcast
