#include "nlp/intent_matcher.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------
static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::set<std::string> wordsOf(const std::string& text) {
    std::set<std::string> words;
    std::istringstream iss(text);
    std::string w;
    while (iss >> w) words.insert(w);
    return words;
}

static IntentDefinition normalized(IntentDefinition def) {
    std::vector<std::string> patterns;
    for (auto& p : def.patterns) {
        if (p.empty()) continue;   // an empty pattern would "occur" in every message
        patterns.push_back(toLower(p));
    }
    def.patterns = std::move(patterns);
    return def;
}

// ------------------------------------------------------------
// Construction
// ------------------------------------------------------------
IntentMatcher::IntentMatcher() : IntentMatcher(defaultIntents()) {}

IntentMatcher::IntentMatcher(std::vector<IntentDefinition> table) {
    intents_.reserve(table.size());
    for (auto& def : table) intents_.push_back(normalized(std::move(def)));
}

// ------------------------------------------------------------
// Scoring
// ------------------------------------------------------------
double IntentMatcher::score(const std::string& loweredMessage, const IntentDefinition& intent) {
    const auto messageWords = wordsOf(loweredMessage);
    double best = 0.0;

    for (const auto& pattern : intent.patterns) {
        const auto patternWords = wordsOf(pattern);

        std::size_t common = 0;
        for (const auto& w : patternWords) {
            if (messageWords.count(w)) common++;
        }
        std::size_t unionSize = messageWords.size() + patternWords.size() - common;
        if (unionSize > 0) {
            best = std::max(best, static_cast<double>(common) / static_cast<double>(unionSize));
        }

        if (loweredMessage.find(pattern) != std::string::npos) {
            best = std::max(best, kSubstringBoost);
        }
    }
    return best;
}

ClassificationResult IntentMatcher::classify(const std::string& message) const {
    ClassificationResult result;
    const std::string lowered = toLower(message);

    std::string bestIntent = kUnknownIntent;
    double bestScore = 0.0;
    for (const auto& intent : intents_) {
        double s = score(lowered, intent);
        if (s > bestScore) {
            bestScore = s;
            bestIntent = intent.name;
        }
    }

    if (bestScore < kUnknownThreshold) {
        bestIntent = kUnknownIntent;
        bestScore = 0.0;
    }

    result.intent = bestIntent;
    result.confidence = bestScore;
    return result;
}

const std::vector<std::string>& IntentMatcher::response_templates(const std::string& intent) const {
    static const std::vector<std::string> none;
    for (const auto& def : intents_) {
        if (def.name == intent) return def.responses;
    }
    return none;
}

// ------------------------------------------------------------
// Loading
// ------------------------------------------------------------
bool IntentMatcher::load_intents(const std::string& path, std::string* err) {
    std::ifstream f(path);
    if (!f) {
        if (err) *err = "Could not open file: " + path;
        return false;
    }
    std::stringstream buffer;
    buffer << f.rdbuf();

    if (!load_intents_from_string(buffer.str(), err)) return false;
    LOG_DEBUG("NLP", "Loaded " + std::to_string(intents_.size()) + " intents from " + path);
    return true;
}

bool IntentMatcher::load_intents_from_string(const std::string& intentsText, std::string* err) {
    try {
        nlohmann::json j = nlohmann::json::parse(intentsText);
        if (!j.is_array()) {
            if (err) *err = "Invalid intents JSON (expected array)";
            return false;
        }

        std::vector<IntentDefinition> table;
        for (const auto& entry : j) {
            IntentDefinition def;
            def.name      = entry.value("intent", "");
            def.patterns  = entry.value("patterns", std::vector<std::string>{});
            def.responses = entry.value("responses", std::vector<std::string>{});

            if (def.name.empty() || def.patterns.empty()) {
                LOG_ERROR("NLP", "Skipping intent without name or patterns: " + entry.dump());
                continue;
            }
            table.push_back(normalized(std::move(def)));
        }

        if (table.empty()) {
            if (err) *err = "Intents JSON contained no usable intents";
            return false;
        }

        intents_ = std::move(table);
        return true;
    } catch (const std::exception& e) {
        if (err) *err = e.what();
        return false;
    }
}

// ------------------------------------------------------------
// Built-in table (order matters for tie-breaks)
// ------------------------------------------------------------
std::vector<IntentDefinition> IntentMatcher::defaultIntents() {
    return {
        { "greeting",
          { "hello", "hi", "hey", "good morning", "good afternoon",
            "good evening", "greetings", "what's up", "howdy" },
          { "Hello! I'm your personal finance assistant. How can I help you today?",
            "Hi there! I'm here to help you manage your finances. What would you like to know?",
            "Greetings! I can help you with budgets, transactions, and financial insights." } },

        { "balance_inquiry",
          { "what's my balance", "show balance", "account balance", "how much money",
            "current balance", "balance check", "money left", "account total" },
          { "Let me check your account balances for you.",
            "I'll retrieve your current account balances." } },

        { "spending_analysis",
          { "spending analysis", "where did i spend", "spending breakdown", "expense report",
            "spending summary", "money spent on", "spending patterns", "expense analysis" },
          { "I'll analyze your spending patterns for you.",
            "Let me break down your expenses by category." } },

        { "budget_help",
          { "budget help", "create budget", "budget advice", "budgeting tips",
            "how to budget", "budget planning", "budget management", "budget recommendation" },
          { "I'd be happy to help you with budgeting!",
            "Let me provide some budget recommendations based on your spending." } },

        { "savings_advice",
          { "saving money", "savings advice", "how to save", "savings tips",
            "save more money", "savings plan", "savings goal", "emergency fund" },
          { "I can help you create a savings plan!",
            "Let me analyze your spending to find savings opportunities." } },

        { "transaction_search",
          { "find transaction", "search transactions", "look for payment", "transaction history",
            "find purchase", "search spending", "transaction details", "payment history" },
          { "I'll search your transaction history for you.",
            "Let me find the transactions you're looking for." } },

        { "financial_goals",
          { "financial goals", "set goal", "savings goal", "financial planning",
            "goal tracking", "achieve goal", "financial targets", "money goals" },
          { "I can help you set and track your financial goals!",
            "Let's work on your financial goal planning." } },

        { "investment_advice",
          { "investment advice", "should i invest", "investment tips", "portfolio",
            "stocks", "bonds", "investing money", "investment strategy" },
          { "I can provide general investment guidance based on your financial situation.",
            "Let me help you understand your investment options." } },

        { "bill_reminders",
          { "bill reminders", "upcoming bills", "bill due dates", "payment reminders",
            "bill schedule", "payment due", "bill notifications", "recurring payments" },
          { "I'll check your upcoming bill due dates.",
            "Let me show you your bill payment schedule." } },

        { "export_data",
          { "export data", "download report", "export transactions", "generate report",
            "export to excel", "pdf report", "download statements", "export csv" },
          { "I can help you export your financial data.",
            "What type of report would you like to generate?" } },

        { "help",
          { "help", "what can you do", "commands", "features", "assistance",
            "how to use", "capabilities", "options", "support" },
          { "I can help you with:\n• Account balances\n• Spending analysis\n• Budget planning\n"
            "• Savings advice\n• Transaction search\n• Financial goals\n• Bill reminders\n"
            "• Export reports",
            "I'm your financial assistant! I can analyze spending, help with budgets, track goals, and much more." } },

        { "goodbye",
          { "goodbye", "bye", "see you later", "talk to you later", "farewell",
            "good night", "take care", "until next time", "see ya", "adios" },
          { "Goodbye! Feel free to ask me anything about your finances anytime.",
            "Take care! I'm here whenever you need financial assistance.",
            "See you later! Remember to check your budget regularly." } },
    };
}
