#include "ml/random_forest.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <future>
#include <random>
#include <stdexcept>
#include <thread>

namespace ml {

// ------------------------------------------------------------
// Training
// ------------------------------------------------------------
void RandomForest::fit(const FeatureMatrix& X,
                       const std::vector<int>& y,
                       int numClasses,
                       const ForestParams& params) {
    if (X.empty() || X.size() != y.size()) {
        throw std::invalid_argument("RandomForest::fit: empty or mismatched training data");
    }
    if (params.trees <= 0) throw std::invalid_argument("RandomForest::fit: trees must be positive");

    params_ = params;
    numClasses_ = numClasses;

    const std::size_t n = X.size();
    TreeParams treeParams;
    treeParams.maxDepth = params.maxDepth;
    treeParams.maxFeatures = std::max<std::size_t>(1, static_cast<std::size_t>(std::sqrt(static_cast<double>(X.front().size()))));

    auto growTree = [&](int t) {
        std::mt19937 rng(params.seed + static_cast<unsigned>(t));
        std::uniform_int_distribution<std::size_t> pick(0, n - 1);
        std::vector<std::size_t> rows(n);
        for (auto& r : rows) r = pick(rng);

        DecisionTree tree;
        tree.fit(X, y, rows, numClasses, treeParams, rng);
        return tree;
    };

    // Build in batches of hardware threads.
    const int total = params.trees;
    const int batch = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    std::vector<DecisionTree> grown;
    grown.reserve(static_cast<std::size_t>(total));

    for (int start = 0; start < total; start += batch) {
        std::vector<std::future<DecisionTree>> jobs;
        for (int t = start; t < std::min(total, start + batch); ++t) {
            jobs.push_back(std::async(std::launch::async, growTree, t));
        }
        for (auto& job : jobs) grown.push_back(job.get());
    }

    trees_ = std::move(grown);
    LOG_DEBUG("Forest", "Grew " + std::to_string(trees_.size()) + " trees over " +
                        std::to_string(n) + " samples, " + std::to_string(X.front().size()) + " features");
}

// ------------------------------------------------------------
// Inference
// ------------------------------------------------------------
std::vector<double> RandomForest::predict_proba(const FeatureRow& x) const {
    std::vector<double> proba(static_cast<std::size_t>(numClasses_), 0.0);
    if (trees_.empty()) return proba;

    for (const auto& tree : trees_) {
        const auto& dist = tree.predict_proba(x);
        for (std::size_t c = 0; c < proba.size(); ++c) proba[c] += dist[c];
    }
    for (auto& p : proba) p /= static_cast<double>(trees_.size());
    return proba;
}

// ------------------------------------------------------------
// Serialization
// ------------------------------------------------------------
nlohmann::json RandomForest::to_json() const {
    nlohmann::json trees = nlohmann::json::array();
    for (const auto& tree : trees_) trees.push_back(tree.to_json());

    return {
        { "trees", trees },
        { "meta", { {"trees", params_.trees}, {"max_depth", params_.maxDepth}, {"seed", params_.seed} } }
    };
}

RandomForest RandomForest::from_json(const nlohmann::json& j, int numClasses, std::size_t featureCount) {
    if (!j.is_object()) throw std::runtime_error("forest: expected object");

    const auto& trees = j.at("trees");
    if (!trees.is_array() || trees.empty()) throw std::runtime_error("forest: no trees");

    RandomForest forest;
    forest.numClasses_ = numClasses;
    if (j.contains("meta")) {
        const auto& meta = j.at("meta");
        forest.params_.trees = meta.value("trees", static_cast<int>(trees.size()));
        forest.params_.maxDepth = meta.value("max_depth", forest.params_.maxDepth);
        forest.params_.seed = meta.value("seed", forest.params_.seed);
    }
    for (const auto& jt : trees) {
        forest.trees_.push_back(DecisionTree::from_json(jt, numClasses, featureCount));
    }
    return forest;
}

} // namespace ml
