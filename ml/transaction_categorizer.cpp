#include "ml/transaction_categorizer.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <random>
#include <sstream>

namespace ml {

using ledger::TransactionCategory;

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

// ------------------------------------------------------------
// Construction / snapshot
// ------------------------------------------------------------
TransactionCategorizer::TransactionCategorizer(CategorizerOptions options, SubcategoryRuleTable rules)
    : options_(std::move(options)), rules_(std::move(rules)) {
    for (auto& [category, subs] : rules_) {
        for (auto& sub : subs) {
            for (auto& kw : sub.keywords) kw = toLower(kw);
        }
    }
}

std::shared_ptr<const CategoryModel> TransactionCategorizer::snapshot() const {
    std::lock_guard<std::mutex> lock(modelMutex_);
    return model_;
}

void TransactionCategorizer::publish(std::shared_ptr<const CategoryModel> model) {
    std::lock_guard<std::mutex> lock(modelMutex_);
    model_.swap(model);
}

bool TransactionCategorizer::is_trained() const {
    auto model = snapshot();
    return model && model->isTrained;
}

// ------------------------------------------------------------
// Preprocessing
// ------------------------------------------------------------
std::string TransactionCategorizer::preprocess(const std::string& description,
                                               const std::optional<std::string>& merchantName) {
    std::string text = toLower(description);
    if (merchantName && !merchantName->empty()) {
        text += " " + toLower(*merchantName);
    }

    for (auto& ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        const bool letter = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        if (!letter && !std::isspace(c)) ch = ' ';
    }

    std::istringstream iss(text);
    std::string word, out;
    while (iss >> word) {
        if (!out.empty()) out += ' ';
        out += word;
    }
    return out;
}

// ------------------------------------------------------------
// Training
// ------------------------------------------------------------
TrainingReport TransactionCategorizer::train(std::vector<TrainingSample> samples) {
    if (samples.empty()) {
        LOG_DEBUG("Categorizer", "No training data supplied, using bootstrap dataset");
        samples = bootstrapTrainingData();
    }

    auto model = std::make_shared<CategoryModel>();

    // Classes in category order; y holds the class index.
    for (auto c : ledger::allCategories()) {
        bool present = std::any_of(samples.begin(), samples.end(),
                                   [c](const TrainingSample& s) { return s.category == c; });
        if (present) model->classes.push_back(c);
    }
    std::vector<int> y;
    y.reserve(samples.size());
    for (const auto& s : samples) {
        auto it = std::find(model->classes.begin(), model->classes.end(), s.category);
        y.push_back(static_cast<int>(it - model->classes.begin()));
    }

    std::vector<std::string> texts;
    texts.reserve(samples.size());
    for (const auto& s : samples) texts.push_back(preprocess(s.description, s.merchantName));

    model->vectorizer = TfidfVectorizer(options_.maxFeatures);
    model->vectorizer.fit(texts);

    FeatureMatrix X;
    X.reserve(samples.size());
    for (std::size_t i = 0; i < samples.size(); ++i) {
        X.push_back(model->features(texts[i], samples[i].amount.toDouble()));
    }

    // Stratified hold-out
    std::mt19937 rng(options_.seed);
    std::vector<std::size_t> trainIdx, testIdx;
    for (std::size_t c = 0; c < model->classes.size(); ++c) {
        std::vector<std::size_t> members;
        for (std::size_t i = 0; i < y.size(); ++i) {
            if (y[i] == static_cast<int>(c)) members.push_back(i);
        }
        std::shuffle(members.begin(), members.end(), rng);

        std::size_t nTest = static_cast<std::size_t>(std::lround(static_cast<double>(members.size()) * options_.testSize));
        if (members.size() >= 2) nTest = std::clamp<std::size_t>(nTest, 1, members.size() - 1);
        else nTest = 0;

        testIdx.insert(testIdx.end(), members.begin(), members.begin() + static_cast<std::ptrdiff_t>(nTest));
        trainIdx.insert(trainIdx.end(), members.begin() + static_cast<std::ptrdiff_t>(nTest), members.end());
    }
    std::sort(trainIdx.begin(), trainIdx.end());
    std::sort(testIdx.begin(), testIdx.end());

    FeatureMatrix trainX;
    std::vector<int> trainY;
    for (auto i : trainIdx) {
        trainX.push_back(X[i]);
        trainY.push_back(y[i]);
    }

    ForestParams params;
    params.trees = options_.trees;
    params.maxDepth = options_.maxDepth;
    params.seed = options_.seed;
    model->forest.fit(trainX, trainY, static_cast<int>(model->classes.size()), params);
    model->isTrained = true;

    // Evaluation
    TrainingReport report;
    report.trainSize = trainIdx.size();
    report.testSize = testIdx.size();
    report.featureCount = model->vectorizer.feature_count() + 1;

    const std::size_t k = model->classes.size();
    std::vector<std::size_t> tp(k, 0), fp(k, 0), fn(k, 0), support(k, 0);
    std::size_t correct = 0;
    for (auto i : testIdx) {
        auto proba = model->forest.predict_proba(X[i]);
        auto predicted = static_cast<std::size_t>(std::max_element(proba.begin(), proba.end()) - proba.begin());
        auto actual = static_cast<std::size_t>(y[i]);
        support[actual]++;
        if (predicted == actual) {
            tp[actual]++;
            correct++;
        } else {
            fp[predicted]++;
            fn[actual]++;
        }
    }
    report.accuracy = testIdx.empty() ? 0.0 : static_cast<double>(correct) / static_cast<double>(testIdx.size());

    std::ostringstream table;
    table << std::fixed << std::setprecision(2);
    for (std::size_t c = 0; c < k; ++c) {
        ClassMetrics m;
        m.category = model->classes[c];
        m.support = support[c];
        m.precision = (tp[c] + fp[c]) ? static_cast<double>(tp[c]) / static_cast<double>(tp[c] + fp[c]) : 0.0;
        m.recall = (tp[c] + fn[c]) ? static_cast<double>(tp[c]) / static_cast<double>(tp[c] + fn[c]) : 0.0;
        m.f1 = (m.precision + m.recall) > 0.0 ? 2.0 * m.precision * m.recall / (m.precision + m.recall) : 0.0;
        report.perClass.push_back(m);

        table << "\n  " << std::left << std::setw(18) << ledger::toString(m.category)
              << " p=" << m.precision << " r=" << m.recall << " f1=" << m.f1 << " n=" << m.support;
    }
    LOG_DEBUG("Categorizer", "Model performance (" + std::to_string(report.testSize) + " held out), accuracy=" +
                             std::to_string(report.accuracy) + table.str());

    if (!options_.modelPath.empty()) {
        std::string err;
        report.saved = model->save(options_.modelPath, &err);
        if (!report.saved) ErrorManager::log("ERR_MODEL_SAVE", err);
    }

    publish(std::move(model));
    LOG_PHASE("Categorizer trained", true);
    return report;
}

// ------------------------------------------------------------
// Artifact loading
// ------------------------------------------------------------
bool TransactionCategorizer::load_model(const std::string& path) {
    std::string err;
    std::optional<CategoryModel> loaded;
    if (!path.empty()) loaded = CategoryModel::load(path, &err);
    if (loaded && loaded->isTrained) {
        publish(std::make_shared<const CategoryModel>(std::move(*loaded)));
        LOG_DEBUG("Categorizer", "Loaded model from " + path);
        return true;
    }

    if (path.empty()) err = "no model path configured";
    else if (loaded) err = "artifact is marked untrained";
    ErrorManager::log("ERR_MODEL_LOAD", err);

    train();
    return false;
}

// ------------------------------------------------------------
// Inference
// ------------------------------------------------------------
CategorizationResult TransactionCategorizer::predict(const std::string& description,
                                                     ledger::Money amount,
                                                     const std::optional<std::string>& merchantName) const {
    CategorizationResult result;
    auto model = snapshot();
    if (!model || !model->isTrained) {
        result.category = TransactionCategory::OtherExpense;
        result.confidence = 0.1;
        return result;
    }

    auto row = model->features(preprocess(description, merchantName), amount.toDouble());
    auto proba = model->forest.predict_proba(row);

    // max_element returns the first maximum, so ties go to the earlier class.
    auto best = std::max_element(proba.begin(), proba.end());
    result.category = model->classes[static_cast<std::size_t>(best - proba.begin())];
    result.confidence = *best;
    result.subcategory = resolve_subcategory(result.category, description, merchantName);
    return result;
}

std::optional<std::string> TransactionCategorizer::resolve_subcategory(TransactionCategory category,
                                                                       const std::string& description,
                                                                       const std::optional<std::string>& merchantName) const {
    const std::string text = toLower(description + " " + merchantName.value_or(""));

    for (const auto& [cat, subs] : rules_) {
        if (cat != category) continue;
        for (const auto& sub : subs) {
            for (const auto& kw : sub.keywords) {
                if (!kw.empty() && text.find(kw) != std::string::npos) return sub.subcategory;
            }
        }
    }
    return std::nullopt;
}

} // namespace ml
