#include <gtest/gtest.h>

#include "bootstrap_config.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace {

fs::path tempConfigPath(const std::string& name) {
    auto dir = fs::temp_directory_path() / "finchat_tests";
    fs::create_directories(dir);
    return dir / name;
}

nlohmann::json readJson(const fs::path& path) {
    std::ifstream in(path);
    return nlohmann::json::parse(in);
}

} // namespace

// ------------------------------------------------------------
// PipelineConfig
// ------------------------------------------------------------
TEST(PipelineConfigTest, DefaultsRoundTripThroughJson) {
    auto config = PipelineConfig::fromJson(bootstrap_config::defaultPipeline());

    EXPECT_EQ(config.userId, 1);
    EXPECT_EQ(config.ledgerFile, "ledger.json");
    EXPECT_TRUE(config.nerRulesFile.empty());
    EXPECT_DOUBLE_EQ(config.policy.amountTolerance, 0.10);
    EXPECT_DOUBLE_EQ(config.policy.savingsSplit.longTerm, 0.3);
    EXPECT_EQ(config.policy.topCategories, 5u);
    EXPECT_EQ(config.policy.searchLimit, 10u);
    EXPECT_EQ(config.policy.trendMonths, 6);
    EXPECT_EQ(config.policy.analysisWindowDays, 30);
    EXPECT_EQ(config.categorizer.trees, 100);
    EXPECT_EQ(config.categorizer.maxDepth, 10);
    EXPECT_EQ(config.categorizer.maxFeatures, 1000u);
    EXPECT_EQ(config.categorizer.seed, 42u);
}

TEST(PipelineConfigTest, OutOfRangeValuesFallBackToDefaults) {
    auto cfg = bootstrap_config::defaultPipeline();
    cfg["categorizer"]["trees"] = -5;
    cfg["categorizer"]["test_size"] = 1.5;
    cfg["policy"]["top_categories"] = -3;
    cfg["policy"]["search_limit"] = 25;
    cfg["policy"]["amount_tolerance"] = "wide";
    cfg["policy"]["savings_split"]["emergency"] = 0.9;

    auto config = PipelineConfig::fromJson(cfg);
    EXPECT_EQ(config.categorizer.trees, 100);
    EXPECT_DOUBLE_EQ(config.categorizer.testSize, 0.2);
    EXPECT_EQ(config.policy.topCategories, 5u);
    EXPECT_EQ(config.policy.searchLimit, 25u);
    EXPECT_DOUBLE_EQ(config.policy.amountTolerance, 0.10);
    EXPECT_DOUBLE_EQ(config.policy.savingsSplit.emergency, 0.5);
}

TEST(PipelineConfigTest, MissingSectionsUseDefaults) {
    auto config = PipelineConfig::fromJson(nlohmann::json::object());
    EXPECT_EQ(config.modelFile, "categorizer_model.json");
    EXPECT_EQ(config.policy.analysisWindowDays, 30);
}

TEST(PipelineConfigTest, ResolvePathsAnchorsRelativeFiles) {
    PipelineConfig config;
    config.ledgerFile = "data/ledger.json";
    config.intentsFile = (fs::temp_directory_path() / "intents.json").string();

    const fs::path base = fs::temp_directory_path() / "finchat_res";
    config.resolvePaths(base);

    EXPECT_EQ(fs::path(config.ledgerFile), base / "data/ledger.json");
    EXPECT_EQ(fs::path(config.intentsFile), fs::temp_directory_path() / "intents.json");
    EXPECT_EQ(fs::path(config.modelFile), base / "categorizer_model.json");
    EXPECT_EQ(config.categorizer.modelPath, config.modelFile);
    EXPECT_TRUE(config.nerRulesFile.empty());
}

// ------------------------------------------------------------
// loadConfig
// ------------------------------------------------------------
TEST(LoadConfigTest, MissingFileIsCreatedFromDefaults) {
    const auto path = tempConfigPath("created_config.json");
    fs::remove(path);

    nlohmann::json out;
    EXPECT_TRUE(bootstrap_config::loadConfig(path, bootstrap_config::defaultPipeline(), out, "Test config"));
    EXPECT_EQ(out, bootstrap_config::defaultPipeline());
    ASSERT_TRUE(fs::exists(path));
    EXPECT_EQ(readJson(path), bootstrap_config::defaultPipeline());

    fs::remove(path);
}

TEST(LoadConfigTest, CorruptFileIsResetToDefaults) {
    const auto path = tempConfigPath("corrupt_config.json");
    {
        std::ofstream out(path);
        out << "{ \"policy\": ";
    }

    nlohmann::json out;
    EXPECT_FALSE(bootstrap_config::loadConfig(path, bootstrap_config::defaultPipeline(), out,
                                              "Test config", "ERR_CONFIG_INVALID"));
    EXPECT_EQ(out, bootstrap_config::defaultPipeline());
    EXPECT_EQ(readJson(path), bootstrap_config::defaultPipeline());

    fs::remove(path);
}

TEST(LoadConfigTest, NonObjectTopLevelIsRejected) {
    const auto path = tempConfigPath("array_config.json");
    {
        std::ofstream out(path);
        out << "[1, 2, 3]";
    }

    nlohmann::json out;
    EXPECT_FALSE(bootstrap_config::loadConfig(path, bootstrap_config::defaultPipeline(), out, "Test config"));
    EXPECT_TRUE(out.is_object());

    fs::remove(path);
}

TEST(LoadConfigTest, PartialFileIsPatchedKeepingUserValues) {
    const auto path = tempConfigPath("partial_config.json");
    {
        std::ofstream out(path);
        out << R"({ "user_id": 7, "policy": { "search_limit": 3, "trend_months": "six" } })";
    }

    nlohmann::json out;
    EXPECT_TRUE(bootstrap_config::loadConfig(path, bootstrap_config::defaultPipeline(), out, "Test config"));
    EXPECT_EQ(out["user_id"], 7);
    EXPECT_EQ(out["policy"]["search_limit"], 3);
    EXPECT_EQ(out["policy"]["trend_months"], 6);
    EXPECT_EQ(out["categorizer"]["trees"], 100);
    EXPECT_EQ(out["policy"]["savings_split"]["long_term"], 0.3);

    // The patched file is written back.
    auto saved = readJson(path);
    EXPECT_EQ(saved, out);

    auto config = PipelineConfig::fromJson(out);
    EXPECT_EQ(config.userId, 7);
    EXPECT_EQ(config.policy.searchLimit, 3u);

    fs::remove(path);
}

TEST(ErrorTableTest, DefaultsCarryUserAndDebugText) {
    auto errors = bootstrap_config::defaultErrors();
    for (const char* code : { "ERR_CORE_UNKNOWN_COMMAND", "ERR_CAT_AMOUNT", "ERR_TX_NOT_FOUND", "ERR_MODEL_LOAD" }) {
        ASSERT_TRUE(errors.contains(code)) << code;
        EXPECT_TRUE(errors[code]["user"].is_string());
        EXPECT_TRUE(errors[code]["debug"].is_string());
    }
}
