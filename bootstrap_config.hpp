#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <filesystem>

#include "ledger/ledger_aggregator.hpp"
#include "ml/transaction_categorizer.hpp"

// ------------------------------------------------------------
// Typed view of finchat_config.json
// Relative paths are resolved against the resource directory.
// ------------------------------------------------------------
struct PipelineConfig {
    ledger::UserId userId = 1;

    std::string logLevel = "debug";
    bool logToConsole = true;

    std::string ledgerFile = "ledger.json";
    std::string modelFile = "categorizer_model.json";
    std::string intentsFile = "intents.json";
    std::string nerRulesFile;                    // empty: built-in rules

    ledger::AggregatorPolicy policy;
    ml::CategorizerOptions categorizer;          // modelPath filled by resolvePaths()

    // Out-of-range values are logged and replaced by their defaults.
    static PipelineConfig fromJson(const nlohmann::json& cfg);

    // Makes relative file names absolute under resourceDir.
    void resolvePaths(const std::filesystem::path& resourceDir);
};

// Centralized config + error-table bootstrap for FinChat
namespace bootstrap_config {

    // Loads finchat_config.json and errors.json (creating/patching them)
    // and feeds ErrorManager. Returns the typed pipeline config.
    PipelineConfig initAll();

    // Generic loader → ensures defaults, patches missing keys, saves back
    bool loadConfig(const std::filesystem::path& path,
                    const nlohmann::json& defaults,
                    nlohmann::json& outConfig,
                    const std::string& name,
                    const std::string& errorCode = "");

    // Canonical defaults
    nlohmann::json defaultPipeline();
    nlohmann::json defaultErrors();
}
