#include <unordered_map>
#include <random>
#include <mutex>
#include "response_manager.hpp"
#include "logger.hpp"

// Simple random picker
std::string ResponseManager::pick(const std::vector<std::string>& options) {
    if (options.empty()) return "";
    static std::mutex genMutex;
    static std::random_device rd;
    static std::mt19937 gen(rd());

    std::lock_guard<std::mutex> lock(genMutex);
    std::uniform_int_distribution<> dist(0, static_cast<int>(options.size()) - 1);
    return options[static_cast<size_t>(dist(gen))];
}

// Response database
static const std::unordered_map<std::string, std::vector<std::string>> responses = {
    // --- General ---
    { "fallback", {
        "I'm not sure how to help with that. Try asking about your balance, spending, or budget!"
    }},

    // --- Ledger-driven replies with no data ---
    { "no_accounts", {
        "You don't have any active accounts."
    }},
    { "no_expenses", {
        "No expenses found for the specified period."
    }},
    { "no_transactions", {
        "No transactions found matching your criteria."
    }},
    { "budget_no_data", {
        "I need some transaction data to provide budget advice. Start by adding some expenses!"
    }},

    // --- Informational intents ---
    { "financial_goals", {
        "Financial Goals Help:\n\n"
        "I can help you set and track goals like:\n"
        "• Emergency fund (3-6 months expenses)\n"
        "• Vacation savings\n"
        "• Home down payment\n"
        "• Debt payoff\n"
        "• Retirement savings\n\n"
        "Would you like to create a new goal or check progress on existing ones?"
    }},
    { "bill_reminders", {
        "Upcoming Bills:\n\n"
        "• Electric Bill - Due in 5 days - $89.45\n"
        "• Credit Card - Due in 8 days - $234.67\n"
        "• Internet Service - Due in 12 days - $79.99\n"
        "• Phone Bill - Due in 15 days - $65.00\n\n"
        "Would you like me to set up automatic reminders?"
    }},
    { "export_data", {
        "Export Options:\n\n"
        "I can generate reports in these formats:\n"
        "• PDF - Detailed financial summary with charts\n"
        "• Excel - Transaction data for analysis\n"
        "• CSV - Raw transaction data\n\n"
        "What type of report would you like?"
    }},

    // --- Console ---
    { "reload_intents", {
        "Intent table reloaded.",
        "Intents refreshed.",
        "Intent patterns reloaded successfully."
    }},
    { "startup", {
        "FinChat is ready. Ask me about your money.",
        "All systems online. How can I help with your finances?",
        "Ready when you are."
    }},
};

std::string ResponseManager::get(const std::string& key) {
    auto it = responses.find(key);
    if (it != responses.end() && !it->second.empty()) {
        return pick(it->second);
    }

    LOG_TRACE("Response", "Unknown response key: " + key);
    return responses.at("fallback").front();
}
