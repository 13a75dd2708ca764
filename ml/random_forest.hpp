#pragma once
#include <cstddef>
#include <vector>
#include <nlohmann/json_fwd.hpp>

#include "ml/decision_tree.hpp"

namespace ml {

struct ForestParams {
    int trees = 100;
    int maxDepth = 10;
    unsigned seed = 42;
};

// ------------------------------------------------------------
// RandomForest: bagged CART classifiers.
// Tree t is grown on a bootstrap draw from std::mt19937(seed + t), so
// the result does not depend on how many threads build it.
// ------------------------------------------------------------
class RandomForest {
public:
    void fit(const FeatureMatrix& X,
             const std::vector<int>& y,
             int numClasses,
             const ForestParams& params);

    // Mean of the trees' leaf distributions.
    std::vector<double> predict_proba(const FeatureRow& x) const;

    std::size_t tree_count() const { return trees_.size(); }
    int num_classes() const { return numClasses_; }
    const ForestParams& params() const { return params_; }

    nlohmann::json to_json() const;

    // Throws std::runtime_error on structurally invalid input.
    static RandomForest from_json(const nlohmann::json& j, int numClasses, std::size_t featureCount);

private:
    std::vector<DecisionTree> trees_;
    int numClasses_ = 0;
    ForestParams params_;
};

} // namespace ml
