#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

#include "ledger/transaction_category.hpp"
#include "ml/random_forest.hpp"
#include "ml/tfidf_vectorizer.hpp"

namespace ml {

// ------------------------------------------------------------
// CategoryModel: everything inference needs, persisted as one JSON
// artifact. Published read-only once built.
// ------------------------------------------------------------
struct CategoryModel {
    static constexpr int kSchemaVersion = 1;

    std::vector<ledger::TransactionCategory> classes;   // forest class index -> category
    TfidfVectorizer vectorizer;
    RandomForest forest;
    bool isTrained = false;

    // TF-IDF row of preprocessed text with the raw amount appended.
    FeatureRow features(const std::string& preprocessedText, double amount) const;

    nlohmann::json to_json() const;

    // Throws std::runtime_error on version mismatch or invalid structure.
    static CategoryModel from_json(const nlohmann::json& j);

    bool save(const std::string& path, std::string* err = nullptr) const;
    static std::optional<CategoryModel> load(const std::string& path, std::string* err = nullptr);
};

} // namespace ml
