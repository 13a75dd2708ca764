#pragma once
#include <string>
#include <unordered_map>

#include "chat/chat_types.hpp"
#include "ledger/ledger_aggregator.hpp"
#include "nlp/entity_extractor.hpp"
#include "nlp/intent_matcher.hpp"

// Everything a builder may consult for one message.
struct BuilderContext {
    const IntentMatcher& matcher;
    const ledger::LedgerAggregator& aggregator;
    ledger::UserId user;
    const std::string& intent;
    const std::string& message;
    const StructuredEntities& entities;
};

// ------------------------------------------------------------
// ResponseBuilders
// One builder per supported intent. Builders may throw; the
// orchestrator turns that into the fallback reply.
// ------------------------------------------------------------
namespace ResponseBuilders {
    using BuilderFunc = BuilderReply(*)(const BuilderContext& ctx);

    // Fixed dispatch table. Intents without an entry get fallback().
    const std::unordered_map<std::string, BuilderFunc>& table();

    BuilderReply fallback();

    BuilderReply fromTemplates(const BuilderContext& ctx);   // greeting / help / goodbye
    BuilderReply balanceInquiry(const BuilderContext& ctx);
    BuilderReply spendingAnalysis(const BuilderContext& ctx);
    BuilderReply budgetHelp(const BuilderContext& ctx);
    BuilderReply savingsAdvice(const BuilderContext& ctx);
    BuilderReply transactionSearch(const BuilderContext& ctx);
    BuilderReply financialGoals(const BuilderContext& ctx);
    BuilderReply billReminders(const BuilderContext& ctx);
    BuilderReply exportData(const BuilderContext& ctx);
}
