#pragma once
#include <cstddef>
#include <random>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ml {

using FeatureRow    = std::vector<float>;
using FeatureMatrix = std::vector<FeatureRow>;

// One node of a flattened tree. feat == -1 marks a leaf.
struct TreeNode {
    int   feat  = -1;
    float thr   = 0.f;          // go left when x[feat] <= thr
    int   left  = -1;
    int   right = -1;
    std::vector<float> dist;    // leaf: class probabilities
};

void to_json(nlohmann::json& j, const TreeNode& n);
void from_json(const nlohmann::json& j, TreeNode& n);

struct TreeParams {
    int maxDepth = 10;
    std::size_t maxFeatures = 1;      // candidate features per split
    std::size_t minSamplesSplit = 2;
};

// ------------------------------------------------------------
// DecisionTree: CART classifier with Gini impurity.
// At each node a random order of features is walked until maxFeatures
// non-constant ones have been tried; if none of them improves the
// impurity, the walk continues through the remaining features.
// ------------------------------------------------------------
class DecisionTree {
public:
    // rows: sample indices into X/y (repeats allowed, e.g. a bootstrap draw)
    void fit(const FeatureMatrix& X,
             const std::vector<int>& y,
             const std::vector<std::size_t>& rows,
             int numClasses,
             const TreeParams& params,
             std::mt19937& rng);

    const std::vector<float>& predict_proba(const FeatureRow& x) const;

    std::size_t node_count() const { return nodes_.size(); }
    int depth() const;

    nlohmann::json to_json() const;

    // Throws std::runtime_error if node links, feature indices or leaf
    // distributions do not fit the given shape.
    static DecisionTree from_json(const nlohmann::json& j, int numClasses, std::size_t featureCount);

private:
    int build(const FeatureMatrix& X,
              const std::vector<int>& y,
              std::vector<std::size_t>& rows,
              int depth,
              std::mt19937& rng);

    std::vector<TreeNode> nodes_;
    int numClasses_ = 0;
    TreeParams params_;
};

} // namespace ml
