#pragma once
#include <optional>
#include <string>
#include <vector>

#include "chat/chat_types.hpp"
#include "ledger/ledger_aggregator.hpp"
#include "nlp/entity_extractor.hpp"
#include "nlp/intent_matcher.hpp"

// Understanding step of one message: intent with the tagger spans
// attached, plus the structured entities the builders consume.
struct MessageAnalysis {
    ClassificationResult classification;
    StructuredEntities entities;
};

// ------------------------------------------------------------
// ConversationOrchestrator
// Per-message coordinator for one user. Holds no state between
// messages besides echoing the caller's conversation id.
// The referenced collaborators must outlive the orchestrator.
// ------------------------------------------------------------
class ConversationOrchestrator {
public:
    ConversationOrchestrator(const IntentMatcher& matcher,
                             const EntityExtractor& extractor,
                             const ledger::LedgerAggregator& aggregator,
                             ledger::UserId user);

    // Never throws. Failures inside a builder yield the fallback text.
    ChatResponse process(const std::string& message,
                         const std::optional<std::string>& conversationId = std::nullopt) const;

    // Classification and extraction only, run concurrently. The message is
    // tagged once; the same spans fill both results.
    MessageAnalysis analyze(const std::string& message) const;

    // Prompt suggestions for the chat front end.
    std::vector<std::string> suggestions() const;

    ledger::UserId user() const { return user_; }

    // Random RFC 4122 version 4 id, e.g. "3f0c2a9e-5b1d-4c6e-9a7f-1e2d3c4b5a69".
    static std::string newConversationId();

private:
    const IntentMatcher& matcher_;
    const EntityExtractor& extractor_;
    const ledger::LedgerAggregator& aggregator_;
    ledger::UserId user_;
};
