#include "ml/decision_tree.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace ml {

// ------------------------------------------------------------
// JSON <-> TreeNode
// ------------------------------------------------------------
void to_json(nlohmann::json& j, const TreeNode& n) {
    j = { {"feat", n.feat}, {"thr", n.thr}, {"left", n.left}, {"right", n.right} };
    if (n.feat == -1) j["dist"] = n.dist;
}

void from_json(const nlohmann::json& j, TreeNode& n) {
    j.at("feat").get_to(n.feat);
    j.at("thr").get_to(n.thr);
    j.at("left").get_to(n.left);
    j.at("right").get_to(n.right);
    if (n.feat == -1) j.at("dist").get_to(n.dist);
}

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------
static double gini(const std::vector<double>& counts, double total) {
    if (total <= 0.0) return 0.0;
    double sum = 0.0;
    for (double c : counts) {
        double p = c / total;
        sum += p * p;
    }
    return 1.0 - sum;
}

// ------------------------------------------------------------
// Training
// ------------------------------------------------------------
void DecisionTree::fit(const FeatureMatrix& X,
                       const std::vector<int>& y,
                       const std::vector<std::size_t>& rows,
                       int numClasses,
                       const TreeParams& params,
                       std::mt19937& rng) {
    if (rows.empty()) throw std::invalid_argument("DecisionTree::fit: no samples");

    nodes_.clear();
    numClasses_ = numClasses;
    params_ = params;

    std::vector<std::size_t> work = rows;
    build(X, y, work, 0, rng);
}

int DecisionTree::build(const FeatureMatrix& X,
                        const std::vector<int>& y,
                        std::vector<std::size_t>& rows,
                        int depth,
                        std::mt19937& rng) {
    std::vector<double> counts(static_cast<std::size_t>(numClasses_), 0.0);
    for (auto r : rows) counts[static_cast<std::size_t>(y[r])] += 1.0;
    const double total = static_cast<double>(rows.size());
    const double parentImpurity = gini(counts, total);

    auto makeLeaf = [&]() {
        TreeNode leaf;
        leaf.dist.resize(counts.size());
        for (std::size_t c = 0; c < counts.size(); ++c) {
            leaf.dist[c] = static_cast<float>(counts[c] / total);
        }
        nodes_.push_back(std::move(leaf));
        return static_cast<int>(nodes_.size()) - 1;
    };

    if (depth >= params_.maxDepth || rows.size() < params_.minSamplesSplit || parentImpurity <= 0.0) {
        return makeLeaf();
    }

    const std::size_t featureCount = X[rows.front()].size();
    std::vector<std::size_t> order(featureCount);
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), rng);

    int bestFeat = -1;
    float bestThr = 0.f;
    double bestImpurity = parentImpurity;
    std::size_t tried = 0;

    std::vector<std::pair<float, int>> column(rows.size());
    std::vector<double> leftCounts(counts.size());

    for (std::size_t f : order) {
        if (tried >= params_.maxFeatures && bestFeat != -1) break;

        for (std::size_t k = 0; k < rows.size(); ++k) {
            column[k] = { X[rows[k]][f], y[rows[k]] };
        }
        std::sort(column.begin(), column.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });
        if (column.front().first == column.back().first) continue;   // constant here
        ++tried;

        std::fill(leftCounts.begin(), leftCounts.end(), 0.0);
        for (std::size_t k = 0; k + 1 < column.size(); ++k) {
            leftCounts[static_cast<std::size_t>(column[k].second)] += 1.0;
            if (column[k].first == column[k + 1].first) continue;

            const double nLeft = static_cast<double>(k + 1);
            const double nRight = total - nLeft;
            std::vector<double> rightCounts(counts.size());
            for (std::size_t c = 0; c < counts.size(); ++c) rightCounts[c] = counts[c] - leftCounts[c];

            const double impurity = (nLeft / total) * gini(leftCounts, nLeft)
                                  + (nRight / total) * gini(rightCounts, nRight);
            if (impurity < bestImpurity - 1e-12) {
                bestImpurity = impurity;
                bestFeat = static_cast<int>(f);
                bestThr = column[k].first + (column[k + 1].first - column[k].first) / 2.0f;
                // Guard against the midpoint rounding onto the right-hand value.
                if (bestThr >= column[k + 1].first) bestThr = column[k].first;
            }
        }
    }

    if (bestFeat == -1) return makeLeaf();

    std::vector<std::size_t> leftRows, rightRows;
    for (auto r : rows) {
        (X[r][static_cast<std::size_t>(bestFeat)] <= bestThr ? leftRows : rightRows).push_back(r);
    }
    if (leftRows.empty() || rightRows.empty()) return makeLeaf();

    TreeNode node;
    node.feat = bestFeat;
    node.thr = bestThr;
    const int self = static_cast<int>(nodes_.size());
    nodes_.push_back(node);   // placeholder, children patched below

    rows.clear();
    rows.shrink_to_fit();
    const int left = build(X, y, leftRows, depth + 1, rng);
    const int right = build(X, y, rightRows, depth + 1, rng);
    nodes_[static_cast<std::size_t>(self)].left = left;
    nodes_[static_cast<std::size_t>(self)].right = right;
    return self;
}

// ------------------------------------------------------------
// Inference
// ------------------------------------------------------------
const std::vector<float>& DecisionTree::predict_proba(const FeatureRow& x) const {
    std::size_t id = 0;
    while (nodes_[id].feat != -1) {
        const auto& n = nodes_[id];
        id = static_cast<std::size_t>(x[static_cast<std::size_t>(n.feat)] <= n.thr ? n.left : n.right);
    }
    return nodes_[id].dist;
}

int DecisionTree::depth() const {
    if (nodes_.empty()) return 0;
    int deepest = 0;
    std::vector<std::pair<std::size_t, int>> stack{ {0, 0} };
    while (!stack.empty()) {
        auto [id, d] = stack.back();
        stack.pop_back();
        deepest = std::max(deepest, d);
        const auto& n = nodes_[id];
        if (n.feat != -1) {
            stack.push_back({ static_cast<std::size_t>(n.left), d + 1 });
            stack.push_back({ static_cast<std::size_t>(n.right), d + 1 });
        }
    }
    return deepest;
}

// ------------------------------------------------------------
// Serialization
// ------------------------------------------------------------
nlohmann::json DecisionTree::to_json() const {
    return nodes_;
}

DecisionTree DecisionTree::from_json(const nlohmann::json& j, int numClasses, std::size_t featureCount) {
    if (!j.is_array() || j.empty()) throw std::runtime_error("tree: expected non-empty node array");

    DecisionTree tree;
    tree.numClasses_ = numClasses;
    tree.nodes_ = j.get<std::vector<TreeNode>>();

    const int count = static_cast<int>(tree.nodes_.size());
    for (int i = 0; i < count; ++i) {
        const auto& n = tree.nodes_[static_cast<std::size_t>(i)];
        if (n.feat == -1) {
            if (n.dist.size() != static_cast<std::size_t>(numClasses)) {
                throw std::runtime_error("tree: leaf distribution size mismatch");
            }
            continue;
        }
        if (n.feat < 0 || static_cast<std::size_t>(n.feat) >= featureCount) {
            throw std::runtime_error("tree: feature index out of range");
        }
        // Children always follow their parent in the flattened layout.
        if (n.left <= i || n.left >= count || n.right <= i || n.right >= count) {
            throw std::runtime_error("tree: bad child link");
        }
    }
    return tree;
}

} // namespace ml
