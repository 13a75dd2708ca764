#pragma once
#include <string>
#include <vector>

#include "nlp/intent.hpp"

// ------------------------------------------------------------
// IntentMatcher
// Scores a message against an ordered intent table with word-set
// (Jaccard) overlap plus a verbatim-substring boost.
//
// Tie-break contract: intents are scanned in table order and a later
// intent must score strictly higher to win, so the first intent in the
// table reaching the maximum is chosen.
//
// Punctuation is not stripped: "balance?" and "balance" are different
// words. Changing that changes which intents win.
// ------------------------------------------------------------
class IntentMatcher {
public:
    static constexpr double kUnknownThreshold = 0.3;
    static constexpr double kSubstringBoost   = 0.8;
    static constexpr const char* kUnknownIntent = "unknown";

    // Starts with the built-in table.
    IntentMatcher();
    explicit IntentMatcher(std::vector<IntentDefinition> table);

    // --- Classification (never throws, no I/O) ---
    ClassificationResult classify(const std::string& message) const;

    // Score of one intent against an already-lowercased message.
    static double score(const std::string& loweredMessage, const IntentDefinition& intent);

    // --- Table loading ---
    // JSON: [ { "intent": "...", "patterns": [...], "responses": [...] }, ... ]
    // On failure the current table is kept.
    bool load_intents(const std::string& path, std::string* err = nullptr);
    bool load_intents_from_string(const std::string& intentsText, std::string* err = nullptr);

    // Templates of an intent (empty if unknown).
    const std::vector<std::string>& response_templates(const std::string& intent) const;

    const std::vector<IntentDefinition>& intents() const { return intents_; }
    size_t intent_count() const { return intents_.size(); }

    static std::vector<IntentDefinition> defaultIntents();

private:
    std::vector<IntentDefinition> intents_;
};
