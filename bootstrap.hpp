#pragma once
#include <memory>

#include "bootstrap_config.hpp"
#include "chat/conversation_orchestrator.hpp"
#include "ledger/ledger_aggregator.hpp"
#include "ledger/ledger_store.hpp"
#include "ml/transaction_categorizer.hpp"
#include "nlp/entity_extractor.hpp"
#include "nlp/intent_matcher.hpp"
#include "nlp/ner_tagger.hpp"

// ------------------------------------------------------------
// AppContext: the wired pipeline for one process.
// Members reference each other; the context is never moved.
// ------------------------------------------------------------
struct AppContext {
    PipelineConfig config;

    IntentMatcher matcher;
    std::shared_ptr<RuleNerTagger> tagger;
    std::unique_ptr<EntityExtractor> extractor;

    ledger::InMemoryLedger ledger;
    std::unique_ptr<ledger::LedgerAggregator> aggregator;

    std::unique_ptr<ml::TransactionCategorizer> categorizer;
    std::unique_ptr<ConversationOrchestrator> orchestrator;
};

// Wires every component from an already-loaded config. Missing or
// broken data files are logged and replaced by built-in defaults.
// loadModel=false leaves the categorizer untrained.
std::unique_ptr<AppContext> buildAppContext(const PipelineConfig& config, bool loadModel = true);

// Config + error table bootstrap, then buildAppContext().
std::unique_ptr<AppContext> runBootstrapChecks();
