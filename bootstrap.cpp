#include "bootstrap.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <filesystem>

namespace fs = std::filesystem;

std::unique_ptr<AppContext> buildAppContext(const PipelineConfig& config, bool loadModel) {
    auto app = std::make_unique<AppContext>();
    app->config = config;

    // ============================================================
    // Intent table
    // ============================================================
    if (!config.intentsFile.empty() && fs::exists(config.intentsFile)) {
        std::string err;
        if (!app->matcher.load_intents(config.intentsFile, &err)) {
            ErrorManager::log("ERR_INTENTS_LOAD", err);
            LOG_PHASE("Intents load", false);
        } else {
            LOG_PHASE("Intents load", true);
        }
    } else {
        LOG_DEBUG("NLP", "No intents file, using built-in table (" +
                         std::to_string(app->matcher.intent_count()) + " intents)");
    }

    // ============================================================
    // NER tagger + extractor
    // ============================================================
    app->tagger = std::make_shared<RuleNerTagger>();
    if (!config.nerRulesFile.empty()) {
        std::string err;
        if (!app->tagger->load_rules(config.nerRulesFile, &err)) {
            ErrorManager::log("ERR_NER_RULES_LOAD", err);
            LOG_PHASE("NER rules load", false);
        } else {
            LOG_PHASE("NER rules load", true);
        }
    }
    app->extractor = std::make_unique<EntityExtractor>(app->tagger);

    // ============================================================
    // Ledger
    // ============================================================
    if (!config.ledgerFile.empty() && fs::exists(config.ledgerFile)) {
        std::string err;
        if (!app->ledger.load_file(config.ledgerFile, &err)) {
            ErrorManager::log("ERR_LEDGER_LOAD", err);
            LOG_PHASE("Ledger load", false);
        } else {
            LOG_PHASE("Ledger load", true);
        }
    } else {
        LOG_DEBUG("Ledger", "No ledger file, starting empty");
    }
    app->aggregator = std::make_unique<ledger::LedgerAggregator>(app->ledger, config.policy);

    // ============================================================
    // Categorizer
    // ============================================================
    app->categorizer = std::make_unique<ml::TransactionCategorizer>(config.categorizer);
    if (loadModel) {
        beginPhaseGroup();
        bool loaded = app->categorizer->load_model();
        endPhaseGroup();
        LOG_PHASE("Categorizer model load", loaded);
    }

    // ============================================================
    // Orchestrator
    // ============================================================
    app->orchestrator = std::make_unique<ConversationOrchestrator>(
        app->matcher, *app->extractor, *app->aggregator, config.userId);

    return app;
}

std::unique_ptr<AppContext> runBootstrapChecks() {
    LOG_PHASE("Bootstrap begin", true);

    // ============================================================
    // Centralized config bootstrap
    // ============================================================
    beginPhaseGroup();
    PipelineConfig config = bootstrap_config::initAll();
    endPhaseGroup();
    LOG_PHASE("Configs initialized", true);

    setLogLevel(logLevelFromString(config.logLevel));
    setLogConsoleEcho(config.logToConsole);

    auto app = buildAppContext(config);

    LOG_PHASE("Bootstrap complete", true);
    return app;
}
