#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <cmath>
#include <fstream>
#include <type_traits>

namespace fs = std::filesystem;

// ----------------- helpers -----------------
// Integers parse as unsigned, so any two numbers count as the same kind.
static bool sameKind(const nlohmann::json& a, const nlohmann::json& b) {
    if (a.is_number() && b.is_number()) return true;
    return a.type() == b.type();
}

static bool mergeDefaults(nlohmann::json& cfg,
                          const nlohmann::json& defs,
                          const std::string& prefix = "",
                          int* patchedCount = nullptr) {
    bool patched = false;
    for (auto& [key, defVal] : defs.items()) {
        const std::string path = prefix.empty() ? key : prefix + "." + key;
        if (!cfg.contains(key) || cfg[key].is_null()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        } else if (defVal.is_object() && cfg[key].is_object()) {
            if (mergeDefaults(cfg[key], defVal, path, patchedCount))
                patched = true;
        } else if (!sameKind(cfg[key], defVal)) {
            LOG_DEBUG("Config", "Key " + path + " has wrong type, reset to default");
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        }
    }
    return patched;
}

static bool writeJson(const fs::path& path, const nlohmann::json& j) {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
    }
    std::ofstream out(path);
    if (!out) {
        LOG_ERROR("Config", "Could not write " + path.string());
        return false;
    }
    out << j.dump(2);
    return true;
}

// ----------------- PipelineConfig -----------------
template <typename T, typename Pred>
static T checked(const nlohmann::json& obj, const char* key, T fallback, Pred ok, const std::string& section) {
    if (!obj.contains(key)) return fallback;
    if constexpr (std::is_unsigned_v<T>) {
        // negative integers would wrap around
        if (obj.at(key).is_number_integer() && !obj.at(key).is_number_unsigned()) {
            LOG_ERROR("Config", section + "." + key + " out of range, using default");
            return fallback;
        }
    }
    try {
        T value = obj.at(key).get<T>();
        if (ok(value)) return value;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Config", section + "." + key + ": " + e.what());
        return fallback;
    }
    LOG_ERROR("Config", section + "." + key + " out of range, using default");
    return fallback;
}

PipelineConfig PipelineConfig::fromJson(const nlohmann::json& cfg) {
    PipelineConfig out;
    const auto empty = nlohmann::json::object();
    auto section = [&](const char* name) -> const nlohmann::json& {
        return (cfg.contains(name) && cfg[name].is_object()) ? cfg[name] : empty;
    };
    auto positive = [](auto v) { return v > 0; };
    auto any = [](const auto&) { return true; };
    auto ratio = [](double v) { return v >= 0.0 && v < 1.0; };

    out.userId = checked<ledger::UserId>(cfg, "user_id", out.userId, positive, "root");

    const auto& logging = section("logging");
    out.logLevel = checked<std::string>(logging, "level", out.logLevel, any, "logging");
    out.logToConsole = checked<bool>(logging, "console", out.logToConsole, any, "logging");

    const auto& paths = section("paths");
    out.ledgerFile = checked<std::string>(paths, "ledger", out.ledgerFile, any, "paths");
    out.modelFile = checked<std::string>(paths, "model", out.modelFile, any, "paths");
    out.intentsFile = checked<std::string>(paths, "intents", out.intentsFile, any, "paths");
    out.nerRulesFile = checked<std::string>(paths, "ner_rules", out.nerRulesFile, any, "paths");

    const auto& policy = section("policy");
    auto& p = out.policy;
    p.amountTolerance = checked<double>(policy, "amount_tolerance", p.amountTolerance, ratio, "policy");
    p.topCategories = checked<std::size_t>(policy, "top_categories", p.topCategories, positive, "policy");
    p.searchLimit = checked<std::size_t>(policy, "search_limit", p.searchLimit, positive, "policy");
    p.trendMonths = checked<int>(policy, "trend_months", p.trendMonths, positive, "policy");
    p.analysisWindowDays = checked<int>(policy, "analysis_window_days", p.analysisWindowDays, positive, "policy");

    if (policy.contains("savings_split") && policy["savings_split"].is_object()) {
        const auto& split = policy["savings_split"];
        auto share = [](double v) { return v >= 0.0 && v <= 1.0; };
        ledger::SavingsSplit s;
        s.emergency = checked<double>(split, "emergency", s.emergency, share, "policy.savings_split");
        s.longTerm = checked<double>(split, "long_term", s.longTerm, share, "policy.savings_split");
        s.discretionary = checked<double>(split, "discretionary", s.discretionary, share, "policy.savings_split");
        if (std::fabs(s.emergency + s.longTerm + s.discretionary - 1.0) > 1e-6) {
            LOG_ERROR("Config", "policy.savings_split does not sum to 1, using default");
        } else {
            p.savingsSplit = s;
        }
    }

    const auto& cat = section("categorizer");
    auto& c = out.categorizer;
    c.trees = checked<int>(cat, "trees", c.trees, positive, "categorizer");
    c.maxDepth = checked<int>(cat, "max_depth", c.maxDepth, positive, "categorizer");
    c.maxFeatures = checked<std::size_t>(cat, "max_features", c.maxFeatures, positive, "categorizer");
    c.testSize = checked<double>(cat, "test_size", c.testSize, ratio, "categorizer");
    c.seed = checked<unsigned>(cat, "seed", c.seed, any, "categorizer");

    return out;
}

void PipelineConfig::resolvePaths(const fs::path& resourceDir) {
    auto resolve = [&](std::string& file) {
        if (file.empty()) return;
        fs::path p(file);
        if (p.is_relative()) file = (resourceDir / p).string();
    };
    resolve(ledgerFile);
    resolve(modelFile);
    resolve(intentsFile);
    resolve(nerRulesFile);
    categorizer.modelPath = modelFile;
}

// ----------------- defaults -----------------
namespace bootstrap_config {

nlohmann::json defaultPipeline() {
    return {
        {"user_id", 1},

        {"logging", {
            {"level", "debug"},
            {"console", true}
        }},

        {"paths", {
            {"ledger", "ledger.json"},
            {"model", "categorizer_model.json"},
            {"intents", "intents.json"},
            {"ner_rules", ""}
        }},

        {"policy", {
            {"amount_tolerance", 0.10},
            {"savings_split", {
                {"emergency", 0.5},
                {"long_term", 0.3},
                {"discretionary", 0.2}
            }},
            {"top_categories", 5},
            {"search_limit", 10},
            {"trend_months", 6},
            {"analysis_window_days", 30}
        }},

        {"categorizer", {
            {"trees", 100},
            {"max_depth", 10},
            {"max_features", 1000},
            {"test_size", 0.2},
            {"seed", 42}
        }}
    };
}

nlohmann::json defaultErrors() {
    return {
        {"ERR_NONE", {
            {"user", ""},
            {"debug", "No error."}
        }},
        {"ERR_CORE_UNKNOWN_COMMAND", {
            {"user", "[Core] Unknown command"},
            {"debug", "dispatchCommand found no handler."}
        }},
        {"ERR_CMD_EXCEPTION", {
            {"user", "[Core] The command failed unexpectedly."},
            {"debug", "Exception escaped a command handler."}
        }},
        {"ERR_CONFIG_INVALID", {
            {"user", "[Config] Config file invalid → reset to defaults."},
            {"debug", "finchat_config.json failed parsing or validation."}
        }},
        {"ERR_INTENTS_LOAD", {
            {"user", "[NLP] Could not load intents, keeping current table."},
            {"debug", "intents.json missing, unparsable, or without usable intents."}
        }},
        {"ERR_NER_RULES_LOAD", {
            {"user", "[NLP] Could not load tagger rules, using built-ins."},
            {"debug", "NER rules file missing or unparsable."}
        }},
        {"ERR_MODEL_LOAD", {
            {"user", "[Model] Stored model unusable, retrained from bootstrap data."},
            {"debug", "Categorizer artifact missing, corrupt, or wrong schema version."}
        }},
        {"ERR_MODEL_SAVE", {
            {"user", "[Model] Could not save the trained model."},
            {"debug", "Writing the categorizer artifact failed."}
        }},
        {"ERR_TRAIN_DATA", {
            {"user", "[Model] Could not read training data."},
            {"debug", "Training ledger file missing or unparsable."}
        }},
        {"ERR_CAT_USAGE", {
            {"user", "[Model] Usage: categorize <description> | <amount> [| <merchant>]"},
            {"debug", "categorize called with malformed arguments."}
        }},
        {"ERR_CAT_DESCRIPTION", {
            {"user", "[Model] Description must be 1 to 500 characters."},
            {"debug", "Categorization description length out of range."}
        }},
        {"ERR_CAT_AMOUNT", {
            {"user", "[Model] Amount must be a positive number with at most two decimals."},
            {"debug", "Categorization amount missing, unparsable, or not positive."}
        }},
        {"ERR_LEDGER_LOAD", {
            {"user", "[Ledger] Could not load ledger, starting empty."},
            {"debug", "Ledger file unparsable."}
        }},
        {"ERR_LEDGER_SAVE", {
            {"user", "[Ledger] Could not save ledger."},
            {"debug", "Writing the ledger file failed."}
        }},
        {"ERR_TX_USAGE", {
            {"user", "[Ledger] Usage: add <account_id> | <income|expense|transfer> | <amount> | <description> [| <merchant>] [| <YYYY-MM-DD>]  or  update <id> | field=value ..."},
            {"debug", "add/update called with malformed arguments."}
        }},
        {"ERR_TX_UNKNOWN_ACCOUNT", {
            {"user", "[Ledger] No such account."},
            {"debug", "Transaction references an account that does not exist."}
        }},
        {"ERR_TX_NOT_FOUND", {
            {"user", "[Ledger] No such transaction."},
            {"debug", "Transaction id not found."}
        }},
        {"ERR_TX_FILTER", {
            {"user", "[Ledger] Usage: list [account=ID] [type=T] [category=C] [min=X] [max=X] [from=DATE] [to=DATE] [merchant=TEXT] [page=N] [size=1-100]"},
            {"debug", "Invalid list filter token."}
        }},
        {"ERR_CHAT_PIPELINE", {
            {"user", "[Chat] Could not analyse that message."},
            {"debug", "Intent matcher or entity extractor failed."}
        }},
        {"ERR_CHAT_BUILDER", {
            {"user", "[Chat] Could not build a reply."},
            {"debug", "Response builder threw; fallback reply used."}
        }}
    };
}

// ----------------- loader -----------------
bool loadConfig(const fs::path& path,
                const nlohmann::json& defaults,
                nlohmann::json& outConfig,
                const std::string& name,
                const std::string& errorCode) {
    if (!fs::exists(path)) {
        outConfig = defaults;
        writeJson(path, outConfig);

        LOG_PHASE(name + " created", true);
        return true;
    }

    try {
        std::ifstream f(path);
        f >> outConfig;
        if (!outConfig.is_object()) {
            throw std::runtime_error("top level is not an object");
        }

        int patchedCount = 0;
        if (mergeDefaults(outConfig, defaults, "", &patchedCount)) {
            writeJson(path, outConfig);
            LOG_PHASE(name + " patched", true);
            LOG_DEBUG("Config", name + " patched (" + std::to_string(patchedCount) + " keys)");
        } else {
            LOG_PHASE(name + " load", true);
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Config", name + " invalid → reset to defaults (" + e.what() + ")");
        LOG_PHASE(name + " load", false);

        if (!errorCode.empty())
            ErrorManager::log(errorCode, path.string());

        outConfig = defaults;
        writeJson(path, outConfig);
        return false;
    }
}

// ----------------- entry -----------------
PipelineConfig initAll() {
    const fs::path resourceDir = getResourcePath();

    // errors.json first, so later failures resolve their codes
    nlohmann::json errorsCfg;
    loadConfig(resourceDir / "errors.json", defaultErrors(), errorsCfg, "Errors config", "");
    ErrorManager::loadFromJson(errorsCfg);
    LOG_DEBUG("Config", "Error table: " + std::to_string(ErrorManager::codeCount()) + " codes");

    // finchat_config.json
    nlohmann::json pipelineCfg;
    loadConfig(fs::current_path() / CONFIG_FILE, defaultPipeline(), pipelineCfg,
               "Pipeline config", "ERR_CONFIG_INVALID");

    PipelineConfig config = PipelineConfig::fromJson(pipelineCfg);
    config.resolvePaths(resourceDir);
    return config;
}

} // namespace bootstrap_config
