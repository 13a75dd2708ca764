#include <gtest/gtest.h>

#include "ml/tfidf_vectorizer.hpp"
#include "ml/transaction_categorizer.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <thread>

using ledger::Money;
using ledger::TransactionCategory;
using namespace ml;

namespace fs = std::filesystem;

namespace {

CategorizerOptions fastOptions(const std::string& modelPath = "") {
    CategorizerOptions options;
    options.modelPath = modelPath;
    options.trees = 50;
    return options;
}

fs::path tempModelPath(const std::string& name) {
    return fs::temp_directory_path() / "finchat_tests" / name;
}

class TrainedCategorizer : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        categorizer = std::make_unique<TransactionCategorizer>(fastOptions());
        report = categorizer->train();
    }

    static void TearDownTestSuite() {
        categorizer.reset();
    }

    static std::unique_ptr<TransactionCategorizer> categorizer;
    static TrainingReport report;
};

std::unique_ptr<TransactionCategorizer> TrainedCategorizer::categorizer;
TrainingReport TrainedCategorizer::report;

bool listedUnder(const SubcategoryRuleTable& rules, TransactionCategory category, const std::string& name) {
    for (const auto& [owner, subs] : rules) {
        if (owner != category) continue;
        for (const auto& sub : subs) {
            if (sub.subcategory == name) return true;
        }
    }
    return false;
}

} // namespace

// ------------------------------------------------------------
// Preprocessing / vectorizer
// ------------------------------------------------------------
TEST(CategorizerPreprocessTest, LowercasesAppendsMerchantAndBlanksNonLetters) {
    EXPECT_EQ(TransactionCategorizer::preprocess("MCDONALD'S #123", std::string("McDonald's")),
              "mcdonald s mcdonald s");
    EXPECT_EQ(TransactionCategorizer::preprocess("  Uber   RIDE 42 ", std::nullopt), "uber ride");
    EXPECT_EQ(TransactionCategorizer::preprocess("Coffee", std::string("")), "coffee");
}

TEST(TfidfVectorizerTest, AnalyzerDropsStopWordsAndAddsBigrams) {
    auto terms = TfidfVectorizer::analyze("the electric bill payment");
    EXPECT_EQ(terms, (std::vector<std::string>{ "electric", "payment", "electric payment" }));
    EXPECT_TRUE(TfidfVectorizer::isStopWord("the"));
    EXPECT_FALSE(TfidfVectorizer::isStopWord("coffee"));
}

TEST(TfidfVectorizerTest, RowsAreUnitLengthAndVocabularyIsCapped) {
    TfidfVectorizer vectorizer(3);
    vectorizer.fit({ "coffee shop", "coffee beans", "coffee shop downtown" });
    EXPECT_EQ(vectorizer.feature_count(), 3u);
    EXPECT_TRUE(vectorizer.vocabulary().count("coffee"));

    auto row = vectorizer.transform("coffee shop");
    double norm = 0.0;
    for (float v : row) norm += static_cast<double>(v) * v;
    EXPECT_NEAR(norm, 1.0, 1e-5);

    auto unknown = vectorizer.transform("zebra");
    for (float v : unknown) EXPECT_EQ(v, 0.0f);
}

// ------------------------------------------------------------
// Untrained behaviour
// ------------------------------------------------------------
TEST(CategorizerTest, UntrainedReturnsLowConfidenceDefault) {
    TransactionCategorizer categorizer(fastOptions());
    EXPECT_FALSE(categorizer.is_trained());

    auto result = categorizer.predict("STARBUCKS COFFEE", Money::fromCents(525));
    EXPECT_EQ(result.category, TransactionCategory::OtherExpense);
    EXPECT_FALSE(result.subcategory.has_value());
    EXPECT_DOUBLE_EQ(result.confidence, 0.1);
}

TEST(CategorizerTest, SubcategoryRulesFirstMatchWins) {
    TransactionCategorizer categorizer(fastOptions());

    EXPECT_EQ(categorizer.resolve_subcategory(TransactionCategory::Transportation, "UBER RIDE", std::string("Uber")),
              std::optional<std::string>("public_transit"));
    EXPECT_EQ(categorizer.resolve_subcategory(TransactionCategory::FoodDining, "TARGET STORE", std::nullopt),
              std::optional<std::string>("grocery"));
    EXPECT_EQ(categorizer.resolve_subcategory(TransactionCategory::Shopping, "Best Buy order", std::nullopt),
              std::optional<std::string>("electronics"));
    EXPECT_FALSE(categorizer.resolve_subcategory(TransactionCategory::Shopping, "misc", std::nullopt).has_value());
    EXPECT_FALSE(categorizer.resolve_subcategory(TransactionCategory::Healthcare, "coffee", std::nullopt).has_value());
}

TEST(CategorizerTest, SubcategoryIsAlwaysListedUnderItsCategory) {
    TransactionCategorizer categorizer(fastOptions());
    const auto& rules = categorizer.rules();

    // Every keyword of every category, tried against every category.
    std::vector<std::string> descriptions;
    for (const auto& [owner, subs] : rules) {
        for (const auto& sub : subs) {
            for (const auto& kw : sub.keywords) descriptions.push_back("POS " + kw + " 0042");
        }
    }
    ASSERT_FALSE(descriptions.empty());

    for (auto category : ledger::allCategories()) {
        for (const auto& description : descriptions) {
            auto sub = categorizer.resolve_subcategory(category, description, std::string("Merchant"));
            if (!sub) continue;
            EXPECT_TRUE(listedUnder(rules, category, *sub))
                << ledger::toString(category) << " -> " << *sub << " for '" << description << "'";
        }
    }
}

TEST(CategorizerTest, RuleKeywordsAreLowercased) {
    SubcategoryRuleTable rules = {
        { TransactionCategory::Travel, { { "flights", { "AIRLINE" } } } }
    };
    TransactionCategorizer categorizer(fastOptions(), rules);
    EXPECT_EQ(categorizer.resolve_subcategory(TransactionCategory::Travel, "Delta Airline", std::nullopt),
              std::optional<std::string>("flights"));
}

// ------------------------------------------------------------
// Trained on the bootstrap dataset
// ------------------------------------------------------------
TEST_F(TrainedCategorizer, ReportCoversStratifiedSplit) {
    EXPECT_EQ(report.trainSize, 160u);
    EXPECT_EQ(report.testSize, 40u);
    EXPECT_GT(report.featureCount, 1u);
    EXPECT_GE(report.accuracy, 0.8);
    EXPECT_FALSE(report.saved);
    EXPECT_EQ(report.perClass.size(), 8u);

    auto model = categorizer->snapshot();
    ASSERT_TRUE(model);
    EXPECT_EQ(model->classes.front(), TransactionCategory::Salary);
    EXPECT_EQ(model->forest.tree_count(), 50u);
}

TEST_F(TrainedCategorizer, PredictsKnownMerchants) {
    auto coffee = categorizer->predict("STARBUCKS COFFEE", Money::fromCents(525), std::string("Starbucks"));
    EXPECT_EQ(coffee.category, TransactionCategory::FoodDining);
    EXPECT_EQ(coffee.subcategory, std::optional<std::string>("coffee"));
    EXPECT_GT(coffee.confidence, 0.3);
    EXPECT_LE(coffee.confidence, 1.0);

    auto salary = categorizer->predict("SALARY DEPOSIT", Money::fromCents(350000), std::string("Employer"));
    EXPECT_EQ(salary.category, TransactionCategory::Salary);
    EXPECT_FALSE(salary.subcategory.has_value());

    auto netflix = categorizer->predict("NETFLIX SUBSCRIPTION", Money::fromCents(1599), std::string("Netflix"));
    EXPECT_EQ(netflix.category, TransactionCategory::Entertainment);
}

TEST_F(TrainedCategorizer, TrainingIsDeterministicForASeed) {
    TransactionCategorizer again(fastOptions());
    again.train();

    auto a = categorizer->predict("UBER RIDE", Money::fromCents(1250), std::string("Uber"));
    auto b = again.predict("UBER RIDE", Money::fromCents(1250), std::string("Uber"));
    EXPECT_EQ(a.category, b.category);
    EXPECT_DOUBLE_EQ(a.confidence, b.confidence);
}

TEST(CategorizerTest, PredictionsStayValidWhileRetraining) {
    TransactionCategorizer live(fastOptions());
    live.train();

    const auto& classes = ledger::allCategories();
    std::atomic<bool> done{ false };
    std::atomic<int> invalid{ 0 };
    std::atomic<int> predictions{ 0 };

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&] {
            do {
                auto r = live.predict("UBER RIDE", Money::fromCents(1250), std::string("Uber"));
                const bool known = std::find(classes.begin(), classes.end(), r.category) != classes.end();
                if (!known || r.confidence < 0.0 || r.confidence > 1.0) invalid++;
                if (r.subcategory && !listedUnder(live.rules(), r.category, *r.subcategory)) invalid++;
                predictions++;
            } while (!done.load());
        });
    }

    live.train();
    live.train();
    done = true;
    for (auto& reader : readers) reader.join();

    EXPECT_EQ(invalid.load(), 0);
    EXPECT_GT(predictions.load(), 0);
    EXPECT_TRUE(live.is_trained());
}

TEST(CategorizerTest, CustomSamplesDefineTheClasses) {
    std::vector<TrainingSample> samples;
    for (int i = 0; i < 10; ++i) {
        samples.push_back({ "TUITION PAYMENT", std::string("State University"), Money::fromCents(120000),
                            TransactionCategory::Education });
        samples.push_back({ "CAR INSURANCE", std::string("Geico"), Money::fromCents(9800),
                            TransactionCategory::Insurance });
    }

    TransactionCategorizer categorizer(fastOptions());
    auto report = categorizer.train(samples);
    EXPECT_EQ(report.trainSize + report.testSize, 20u);
    EXPECT_EQ(report.testSize, 4u);

    auto model = categorizer.snapshot();
    ASSERT_TRUE(model);
    EXPECT_EQ(model->classes, (std::vector<TransactionCategory>{ TransactionCategory::Education,
                                                                 TransactionCategory::Insurance }));
    EXPECT_EQ(categorizer.predict("car insurance", Money::fromCents(9800), std::string("Geico")).category,
              TransactionCategory::Insurance);
}

// ------------------------------------------------------------
// Artifact persistence
// ------------------------------------------------------------
TEST(CategorizerArtifactTest, SavedModelReloadsWithSamePredictions) {
    const auto path = tempModelPath("roundtrip_model.json");
    fs::remove(path);

    TransactionCategorizer trainer(fastOptions(path.string()));
    auto report = trainer.train();
    ASSERT_TRUE(report.saved);
    ASSERT_TRUE(fs::exists(path));

    TransactionCategorizer loader(fastOptions(path.string()));
    ASSERT_TRUE(loader.load_model());
    EXPECT_TRUE(loader.is_trained());

    auto a = trainer.predict("WHOLE FOODS MARKET", Money::fromCents(6789), std::string("Whole Foods"));
    auto b = loader.predict("WHOLE FOODS MARKET", Money::fromCents(6789), std::string("Whole Foods"));
    EXPECT_EQ(a.category, b.category);
    EXPECT_NEAR(a.confidence, b.confidence, 1e-9);
    EXPECT_EQ(a.subcategory, b.subcategory);

    fs::remove(path);
}

TEST(CategorizerArtifactTest, CorruptArtifactFallsBackToRetraining) {
    const auto path = tempModelPath("corrupt_model.json");
    fs::create_directories(path.parent_path());
    {
        std::ofstream out(path);
        out << "{ this is not a model";
    }

    TransactionCategorizer categorizer(fastOptions(path.string()));
    EXPECT_FALSE(categorizer.load_model());
    EXPECT_TRUE(categorizer.is_trained());

    // The retrain overwrote the broken file with a loadable artifact.
    std::string err;
    EXPECT_TRUE(CategoryModel::load(path.string(), &err).has_value()) << err;

    fs::remove(path);
}

TEST(CategorizerArtifactTest, MissingArtifactFallsBackToRetraining) {
    TransactionCategorizer categorizer(fastOptions());
    EXPECT_FALSE(categorizer.load_model("/nonexistent/finchat/model.json"));
    EXPECT_TRUE(categorizer.is_trained());
}

TEST(CategorizerArtifactTest, RejectsOtherSchemaVersions) {
    TransactionCategorizer categorizer(fastOptions());
    categorizer.train();

    auto j = categorizer.snapshot()->to_json();
    EXPECT_NO_THROW(CategoryModel::from_json(j));

    j["schema_version"] = CategoryModel::kSchemaVersion + 1;
    EXPECT_THROW(CategoryModel::from_json(j), std::runtime_error);

    auto unknownClass = categorizer.snapshot()->to_json();
    unknownClass["classes"][0] = "lottery";
    EXPECT_THROW(CategoryModel::from_json(unknownClass), std::runtime_error);
}
