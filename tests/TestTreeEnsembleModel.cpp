#include "model/TreeEnsembleModel.h"
#include "TestSupport.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace stockcast;
using model::TreeEnsembleModel;

namespace {
bool rejects(const nlohmann::json& doc) {
    try {
        TreeEnsembleModel::fromJson(doc);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}
} // namespace

int main() {
    // 단일 리프: 입력과 무관한 확률
    {
        auto model = TreeEnsembleModel::fromJson(testing::constantArtifact(3, 0.7));
        auto p = model->predictProba({1.0, 2.0, 3.0});
        assert(p.size() == 2);
        assert(near(p[0], 0.3));
        assert(near(p[1], 0.7));
        assert(model->inputDimension() == 3);
        assert(model->treeCount() == 1);
        assert(!model->hasScaler());
        assert(model->featureNames().empty());
        assert(model.use_count() == 1);
    }

    // Split goes left on x <= threshold; tree probabilities are averaged
    {
        auto doc = testing::constantArtifact(2, 0.5);
        doc["trees"] = {testing::stumpTree(0.0), testing::stumpTree(10.0)};
        auto model = TreeEnsembleModel::fromJson(doc);

        auto low = model->predictProba({-1.0, 0.0});   // both left: 0.2 up
        assert(near(low[1], 0.2));
        auto mid = model->predictProba({0.0, 0.0});    // x == threshold -> left
        assert(near(mid[1], 0.2));
        auto between = model->predictProba({5.0, 0.0}); // right (0.75 up) + left (0.2 up)
        assert(near(between[1], (0.75 + 0.2) / 2.0));
        auto high = model->predictProba({11.0, 0.0});
        assert(near(high[1], 0.75));
        assert(near(high[0] + high[1], 1.0));
    }

    // Scaler is applied before the split
    {
        auto doc = testing::constantArtifact(1, 0.5);
        doc["trees"] = nlohmann::json::array({testing::stumpTree(0.0)});
        doc["scaler"] = {{"center", {100.0}}, {"scale", {2.0}}};
        auto model = TreeEnsembleModel::fromJson(doc);
        assert(model->hasScaler());
        assert(near(model->predictProba({99.0})[1], 0.2));   // (99-100)/2 <= 0
        assert(near(model->predictProba({101.0})[1], 0.75)); // (101-100)/2 > 0
    }

    // Wrong input width
    {
        auto model = TreeEnsembleModel::fromJson(testing::constantArtifact(3, 0.5));
        bool thrown = false;
        try {
            model->predictProba({1.0, 2.0});
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);
    }

    // 잘못된 문서는 모두 거부
    {
        auto base = testing::constantArtifact(2, 0.5);

        auto wrong_format = base;
        wrong_format["format"] = "pickle";
        assert(rejects(wrong_format));

        auto wrong_version = base;
        wrong_version["version"] = 2;
        assert(rejects(wrong_version));

        auto no_trees = base;
        no_trees["trees"] = nlohmann::json::array();
        assert(rejects(no_trees));

        auto one_class = base;
        one_class["classes"] = {1};
        assert(rejects(one_class));

        auto bad_feature = base;
        bad_feature["trees"] = nlohmann::json::array({testing::stumpTree(0.0)});
        bad_feature["trees"][0]["feature"][0] = 5;
        assert(rejects(bad_feature));

        auto cycle = base;
        cycle["trees"] = nlohmann::json::array({testing::stumpTree(0.0)});
        cycle["trees"][0]["children_left"][0] = 0;
        assert(rejects(cycle));

        auto ragged = base;
        ragged["trees"] = nlohmann::json::array({testing::stumpTree(0.0)});
        ragged["trees"][0]["threshold"] = {0.0};
        assert(rejects(ragged));

        auto names = base;
        names["feature_names"] = {"RSI"};
        assert(rejects(names));

        auto zero_scale = base;
        zero_scale["scaler"] = {{"center", {0.0, 0.0}}, {"scale", {1.0, 0.0}}};
        assert(rejects(zero_scale));

        assert(rejects(nlohmann::json::array()));
        assert(rejects(nlohmann::json{{"format", "stockcast-tree-ensemble"}, {"version", 1}}));
    }

    // Loader: file -> model, garbage -> runtime_error
    {
        testing::TempDir dir("tree_loader");
        model::TreeEnsembleLoader loader;

        testing::writeArtifact(dir / "ok.json", testing::constantArtifact(30, 0.6, testing::originalNames()));
        auto artifact = loader.load(dir / "ok.json");
        assert(artifact->inputDimension() == 30);
        assert(artifact->featureNames() == testing::originalNames());
        assert(artifact->describe().find("trees=1") != std::string::npos);

        testing::writeText(dir / "garbage.json", "\x80\x04\x95 not json");
        bool thrown = false;
        try {
            loader.load(dir / "garbage.json");
        } catch (const std::runtime_error&) {
            thrown = true;
        }
        assert(thrown);

        thrown = false;
        try {
            loader.load(dir / "missing.json");
        } catch (const std::runtime_error&) {
            thrown = true;
        }
        assert(thrown);
    }

    std::cout << "[TEST] TreeEnsembleModel PASSED\n";
    return 0;
}
