#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ml {

// ------------------------------------------------------------
// TfidfVectorizer
// Tokens are runs of two or more word characters, English stop words
// dropped, unigrams plus adjacent bigrams. Vocabulary keeps the
// maxFeatures most frequent terms (corpus counts, ties alphabetical)
// and is indexed alphabetically.
//
//   idf(t) = ln((1 + n) / (1 + df(t))) + 1
//
// Rows are L2-normalised.
// ------------------------------------------------------------
class TfidfVectorizer {
public:
    explicit TfidfVectorizer(std::size_t maxFeatures = 1000) : maxFeatures_(maxFeatures) {}

    void fit(const std::vector<std::string>& documents);

    // Dense row of feature_count() values. Unknown terms are ignored.
    std::vector<float> transform(const std::string& document) const;

    // Unigrams followed by bigrams, in document order.
    static std::vector<std::string> analyze(const std::string& document);
    static bool isStopWord(const std::string& word);

    std::size_t feature_count() const { return vocabulary_.size(); }
    std::size_t max_features() const { return maxFeatures_; }
    const std::map<std::string, int>& vocabulary() const { return vocabulary_; }
    const std::vector<double>& idf() const { return idf_; }

    nlohmann::json to_json() const;

    // Throws std::runtime_error on structurally invalid input.
    static TfidfVectorizer from_json(const nlohmann::json& j);

private:
    std::size_t maxFeatures_;
    std::map<std::string, int> vocabulary_;   // term -> column
    std::vector<double> idf_;                 // by column
};

} // namespace ml
