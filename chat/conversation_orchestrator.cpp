#include "chat/conversation_orchestrator.hpp"
#include "chat/response_builders.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <cstdint>
#include <cstdio>
#include <future>
#include <mutex>
#include <random>
#include <utility>

ConversationOrchestrator::ConversationOrchestrator(const IntentMatcher& matcher,
                                                   const EntityExtractor& extractor,
                                                   const ledger::LedgerAggregator& aggregator,
                                                   ledger::UserId user)
    : matcher_(matcher), extractor_(extractor), aggregator_(aggregator), user_(user) {}

// ------------------------------------------------------------
// Conversation ids
// ------------------------------------------------------------
std::string ConversationOrchestrator::newConversationId() {
    static std::mutex genMutex;
    static std::mt19937_64 gen{ std::random_device{}() };

    std::uint64_t hi, lo;
    {
        std::lock_guard<std::mutex> lock(genMutex);
        hi = gen();
        lo = gen();
    }
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;   // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;   // variant 10

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

// ------------------------------------------------------------
// Message processing
// ------------------------------------------------------------
MessageAnalysis ConversationOrchestrator::analyze(const std::string& message) const {
    auto classified = std::async(std::launch::async,
                                 [this, &message] { return matcher_.classify(message); });
    auto extracted = std::async(std::launch::async, [this, &message] {
        auto spans = extractor_.tag(message);
        auto structured = extractor_.extract(message, spans);
        return std::make_pair(std::move(spans), std::move(structured));
    });

    MessageAnalysis analysis;
    analysis.classification = classified.get();
    auto [spans, structured] = extracted.get();
    analysis.classification.entities = std::move(spans);
    analysis.entities = std::move(structured);
    return analysis;
}

ChatResponse ConversationOrchestrator::process(const std::string& message,
                                               const std::optional<std::string>& conversationId) const {
    ChatResponse response;
    response.conversationId = (conversationId && !conversationId->empty())
        ? *conversationId
        : newConversationId();

    // 1) classify + extract, independently
    StructuredEntities entities;
    try {
        auto analysis = analyze(message);
        response.intent = analysis.classification.intent;
        response.confidence = analysis.classification.confidence;
        response.entities = std::move(analysis.classification.entities);
        entities = std::move(analysis.entities);
    } catch (const std::exception& e) {
        ErrorManager::log("ERR_CHAT_PIPELINE", e.what());
        response.intent = IntentMatcher::kUnknownIntent;
        response.confidence = 0.0;
        response.entities.clear();
    }

    LOG_TRACE("Chat", "intent=" + response.intent + " confidence=" + std::to_string(response.confidence) +
                      " amounts=" + std::to_string(entities.amounts.size()) +
                      " dates=" + std::to_string(entities.dates.size()) +
                      " categories=" + std::to_string(entities.categories.size()));

    // 2) dispatch
    const auto& builders = ResponseBuilders::table();
    auto it = builders.find(response.intent);

    BuilderReply reply;
    if (it == builders.end()) {
        reply = ResponseBuilders::fallback();
    } else {
        BuilderContext ctx{ matcher_, aggregator_, user_, response.intent, message, entities };
        try {
            reply = it->second(ctx);
        } catch (const std::exception& e) {
            ErrorManager::log("ERR_CHAT_BUILDER", response.intent + ": " + e.what());
            reply = ResponseBuilders::fallback();
        }
    }

    // 3) assemble
    response.response = std::move(reply.text);
    response.chart = std::move(reply.chart);
    response.actions = std::move(reply.actions);
    return response;
}

std::vector<std::string> ConversationOrchestrator::suggestions() const {
    return {
        "What's my spending this month?",
        "Show me my account balances",
        "Help me create a budget",
        "What are my upcoming bills?",
        "How can I save more money?"
    };
}
