#pragma once

#include <optional>

#include <nlohmann/json.hpp>

#include "model/IModelArtifact.h"

namespace stockcast {
namespace model {

// sklearn 트리 배열 레이아웃을 그대로 따른 결정 트리.
// children_left[n] == -1 이면 리프, x[feature[n]] <= threshold[n] 이면 왼쪽.
struct DecisionTree {
    std::vector<int> children_left;
    std::vector<int> children_right;
    std::vector<int> feature;
    std::vector<double> threshold;
    std::vector<std::vector<double>> leaf_proba;  // normalized per node

    const std::vector<double>& evaluate(const std::vector<double>& x) const;
};

// Optional RobustScaler stage: (x - center) / scale
struct FeatureScaler {
    std::vector<double> center;
    std::vector<double> scale;

    std::vector<double> transform(const std::vector<double>& x) const;
};

// Averaged-probability tree ensemble exported by the offline trainer.
class TreeEnsembleModel : public IModelArtifact {
public:
    static constexpr const char* FORMAT_NAME = "stockcast-tree-ensemble";
    static constexpr int FORMAT_VERSION = 1;

    // Validates the whole document; throws std::runtime_error on any inconsistency.
    static std::shared_ptr<const TreeEnsembleModel> fromJson(const nlohmann::json& doc);

    std::vector<double> predictProba(const std::vector<double>& features) const override;
    std::size_t inputDimension() const override { return n_features_; }
    const std::vector<int>& classLabels() const override { return classes_; }
    const std::vector<std::string>& featureNames() const override { return feature_names_; }
    std::string describe() const override;

    std::size_t treeCount() const { return trees_.size(); }
    bool hasScaler() const { return scaler_.has_value(); }

private:
    TreeEnsembleModel() = default;

    std::size_t n_features_ = 0;
    std::vector<int> classes_;
    std::vector<std::string> feature_names_;
    std::optional<FeatureScaler> scaler_;
    std::vector<DecisionTree> trees_;
};

class TreeEnsembleLoader : public IArtifactLoader {
public:
    std::shared_ptr<const IModelArtifact> load(const std::filesystem::path& location) override;
};

} // namespace model
} // namespace stockcast
