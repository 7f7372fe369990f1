#include "model/TreeEnsembleModel.h"

#include <cmath>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace stockcast {
namespace model {

namespace {
std::vector<double> normalizeLeaf(const std::vector<double>& raw, size_t tree_index, size_t node) {
    double total = 0.0;
    for (double v : raw) {
        if (!std::isfinite(v) || v < 0.0) {
            throw std::runtime_error("tree " + std::to_string(tree_index) + " node " +
                                     std::to_string(node) + " has an invalid leaf value");
        }
        total += v;
    }
    std::vector<double> out(raw.size(), 0.0);
    if (total <= 0.0) {
        // 빈 리프는 균등 분포
        for (auto& v : out) v = 1.0 / static_cast<double>(raw.size());
        return out;
    }
    for (size_t k = 0; k < raw.size(); ++k) out[k] = raw[k] / total;
    return out;
}

DecisionTree parseTree(const nlohmann::json& jt, size_t tree_index, size_t n_features, size_t n_classes) {
    DecisionTree tree;
    tree.children_left = jt.at("children_left").get<std::vector<int>>();
    tree.children_right = jt.at("children_right").get<std::vector<int>>();
    tree.feature = jt.at("feature").get<std::vector<int>>();
    tree.threshold = jt.at("threshold").get<std::vector<double>>();
    const auto values = jt.at("value").get<std::vector<std::vector<double>>>();

    const size_t n_nodes = tree.children_left.size();
    const std::string where = "tree " + std::to_string(tree_index);
    if (n_nodes == 0) {
        throw std::runtime_error(where + " has no nodes");
    }
    if (tree.children_right.size() != n_nodes || tree.feature.size() != n_nodes ||
        tree.threshold.size() != n_nodes || values.size() != n_nodes) {
        throw std::runtime_error(where + " has inconsistent array lengths");
    }

    tree.leaf_proba.resize(n_nodes);
    for (size_t n = 0; n < n_nodes; ++n) {
        const int left = tree.children_left[n];
        const int right = tree.children_right[n];

        if (left == -1) {
            if (right != -1) {
                throw std::runtime_error(where + " node " + std::to_string(n) + " has only one child");
            }
            if (values[n].size() != n_classes) {
                throw std::runtime_error(where + " node " + std::to_string(n) + " value width != class count");
            }
            tree.leaf_proba[n] = normalizeLeaf(values[n], tree_index, n);
            continue;
        }

        // 자식은 항상 부모보다 뒤에 있어야 순회가 끝난다
        if (left <= static_cast<int>(n) || right <= static_cast<int>(n) ||
            left >= static_cast<int>(n_nodes) || right >= static_cast<int>(n_nodes)) {
            throw std::runtime_error(where + " node " + std::to_string(n) + " has out-of-order children");
        }
        if (tree.feature[n] < 0 || tree.feature[n] >= static_cast<int>(n_features)) {
            throw std::runtime_error(where + " node " + std::to_string(n) + " splits on unknown feature");
        }
        if (!std::isfinite(tree.threshold[n])) {
            throw std::runtime_error(where + " node " + std::to_string(n) + " has a non-finite threshold");
        }
    }
    return tree;
}
} // namespace

const std::vector<double>& DecisionTree::evaluate(const std::vector<double>& x) const {
    size_t node = 0;
    while (children_left[node] != -1) {
        node = (x[feature[node]] <= threshold[node])
            ? static_cast<size_t>(children_left[node])
            : static_cast<size_t>(children_right[node]);
    }
    return leaf_proba[node];
}

std::vector<double> FeatureScaler::transform(const std::vector<double>& x) const {
    std::vector<double> out(x.size());
    for (size_t i = 0; i < x.size(); ++i) {
        out[i] = (x[i] - center[i]) / scale[i];
    }
    return out;
}

std::shared_ptr<const TreeEnsembleModel> TreeEnsembleModel::fromJson(const nlohmann::json& doc) {
    try {
        if (!doc.is_object()) {
            throw std::runtime_error("artifact root is not an object");
        }
        const std::string format = doc.value("format", "");
        if (format != FORMAT_NAME) {
            throw std::runtime_error("unexpected artifact format '" + format + "'");
        }
        const int version = doc.value("version", 0);
        if (version != FORMAT_VERSION) {
            throw std::runtime_error("unsupported artifact version " + std::to_string(version));
        }

        TreeEnsembleModel model;
        model.n_features_ = doc.at("n_features").get<std::size_t>();
        if (model.n_features_ == 0) {
            throw std::runtime_error("n_features must be positive");
        }

        model.classes_ = doc.at("classes").get<std::vector<int>>();
        if (model.classes_.size() < 2) {
            throw std::runtime_error("artifact must declare at least two classes");
        }

        if (doc.contains("feature_names")) {
            model.feature_names_ = doc["feature_names"].get<std::vector<std::string>>();
            if (model.feature_names_.size() != model.n_features_) {
                throw std::runtime_error("feature_names length != n_features");
            }
        }

        if (doc.contains("scaler")) {
            FeatureScaler scaler;
            scaler.center = doc["scaler"].at("center").get<std::vector<double>>();
            scaler.scale = doc["scaler"].at("scale").get<std::vector<double>>();
            if (scaler.center.size() != model.n_features_ || scaler.scale.size() != model.n_features_) {
                throw std::runtime_error("scaler width != n_features");
            }
            for (double s : scaler.scale) {
                if (!std::isfinite(s) || s == 0.0) {
                    throw std::runtime_error("scaler has a zero or non-finite scale");
                }
            }
            model.scaler_ = std::move(scaler);
        }

        const auto& trees = doc.at("trees");
        if (!trees.is_array() || trees.empty()) {
            throw std::runtime_error("artifact has no trees");
        }
        for (size_t t = 0; t < trees.size(); ++t) {
            model.trees_.push_back(parseTree(trees[t], t, model.n_features_, model.classes_.size()));
        }

        return std::make_shared<const TreeEnsembleModel>(std::move(model));
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("malformed artifact: ") + e.what());
    }
}

std::vector<double> TreeEnsembleModel::predictProba(const std::vector<double>& features) const {
    if (features.size() != n_features_) {
        throw std::invalid_argument("expected " + std::to_string(n_features_) + " features, got " +
                                    std::to_string(features.size()));
    }

    const std::vector<double> x = scaler_ ? scaler_->transform(features) : features;

    std::vector<double> proba(classes_.size(), 0.0);
    for (const auto& tree : trees_) {
        const auto& leaf = tree.evaluate(x);
        for (size_t k = 0; k < proba.size(); ++k) proba[k] += leaf[k];
    }
    for (auto& p : proba) p /= static_cast<double>(trees_.size());
    return proba;
}

std::string TreeEnsembleModel::describe() const {
    std::ostringstream oss;
    oss << "tree-ensemble(trees=" << trees_.size()
        << ", features=" << n_features_
        << ", classes=" << classes_.size()
        << (scaler_ ? ", scaled" : "") << ")";
    return oss.str();
}

std::shared_ptr<const IModelArtifact> TreeEnsembleLoader::load(const std::filesystem::path& location) {
    std::ifstream in(location, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open artifact " + location.string());
    }

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("artifact " + location.string() + " is not valid JSON: " + e.what());
    }
    return TreeEnsembleModel::fromJson(doc);
}

} // namespace model
} // namespace stockcast
