#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ml/category_model.hpp"
#include "ml/training_data.hpp"

namespace ml {

struct CategorizerOptions {
    std::string modelPath;            // empty: never persisted
    int trees = 100;
    int maxDepth = 10;
    std::size_t maxFeatures = 1000;
    double testSize = 0.2;            // stratified hold-out share
    unsigned seed = 42;
};

struct CategorizationResult {
    ledger::TransactionCategory category = ledger::TransactionCategory::OtherExpense;
    std::optional<std::string> subcategory;
    double confidence = 0.0;
};

struct ClassMetrics {
    ledger::TransactionCategory category = ledger::TransactionCategory::OtherExpense;
    double precision = 0.0;
    double recall = 0.0;
    double f1 = 0.0;
    std::size_t support = 0;
};

struct TrainingReport {
    std::size_t trainSize = 0;
    std::size_t testSize = 0;
    std::size_t featureCount = 0;
    double accuracy = 0.0;
    std::vector<ClassMetrics> perClass;
    bool saved = false;
};

// ------------------------------------------------------------
// TransactionCategorizer
// predict() copies the published model pointer under a short lock and
// scores outside it; train() builds a fresh model and swaps it in.
// ------------------------------------------------------------
class TransactionCategorizer {
public:
    explicit TransactionCategorizer(CategorizerOptions options = {},
                                    SubcategoryRuleTable rules = defaultSubcategoryRules());

    // Empty samples: the bootstrap dataset.
    TrainingReport train(std::vector<TrainingSample> samples = {});

    // Loads a persisted artifact. Any failure is reported and answered
    // with a retrain from the bootstrap dataset; returns false then.
    bool load_model(const std::string& path);
    bool load_model() { return load_model(options_.modelPath); }

    CategorizationResult predict(const std::string& description,
                                 ledger::Money amount,
                                 const std::optional<std::string>& merchantName = std::nullopt) const;

    std::optional<std::string> resolve_subcategory(ledger::TransactionCategory category,
                                                   const std::string& description,
                                                   const std::optional<std::string>& merchantName) const;

    bool is_trained() const;
    std::shared_ptr<const CategoryModel> snapshot() const;

    const CategorizerOptions& options() const { return options_; }
    const SubcategoryRuleTable& rules() const { return rules_; }

    // lowercase, merchant appended, non-letters blanked, whitespace collapsed
    static std::string preprocess(const std::string& description,
                                  const std::optional<std::string>& merchantName);

private:
    void publish(std::shared_ptr<const CategoryModel> model);

    CategorizerOptions options_;
    SubcategoryRuleTable rules_;
    mutable std::mutex modelMutex_;
    std::shared_ptr<const CategoryModel> model_;   // guarded by modelMutex_
};

} // namespace ml
