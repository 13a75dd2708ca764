#include "chat/response_builders.hpp"
#include "response_manager.hpp"

#include <cstdio>
#include <sstream>

using ledger::Money;

namespace {

constexpr int kEmergencyFundMonths = 3;
constexpr double kSuggestedSavingsRate = 0.2;
constexpr std::size_t kMaxViewActions = 3;

std::string percentText(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f%%", value);
    return buf;
}

// "MM/DD"
std::string shortDate(const ledger::Date& d) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d/%02d", d.month, d.day);
    return buf;
}

} // namespace

// ------------------------------------------------------------
// Dispatch table
// ------------------------------------------------------------
const std::unordered_map<std::string, ResponseBuilders::BuilderFunc>& ResponseBuilders::table() {
    static const std::unordered_map<std::string, BuilderFunc> builders = {
        { "greeting",           fromTemplates },
        { "balance_inquiry",    balanceInquiry },
        { "spending_analysis",  spendingAnalysis },
        { "budget_help",        budgetHelp },
        { "savings_advice",     savingsAdvice },
        { "transaction_search", transactionSearch },
        { "financial_goals",    financialGoals },
        { "bill_reminders",     billReminders },
        { "export_data",        exportData },
        { "help",               fromTemplates },
        { "goodbye",            fromTemplates },
    };
    return builders;
}

BuilderReply ResponseBuilders::fallback() {
    return { ResponseManager::get("fallback"), std::nullopt, {} };
}

// ------------------------------------------------------------
// Template intents
// ------------------------------------------------------------
BuilderReply ResponseBuilders::fromTemplates(const BuilderContext& ctx) {
    const auto& templates = ctx.matcher.response_templates(ctx.intent);
    if (templates.empty()) return fallback();
    return { ResponseManager::pick(templates), std::nullopt, {} };
}

// ------------------------------------------------------------
// Ledger-backed intents
// ------------------------------------------------------------
BuilderReply ResponseBuilders::balanceInquiry(const BuilderContext& ctx) {
    auto report = ctx.aggregator.account_balances(ctx.user);
    if (report.accounts.empty()) {
        return { ResponseManager::get("no_accounts"), std::nullopt, {} };
    }

    std::ostringstream text;
    text << "Here are your current account balances:\n";

    ChartPayload chart;
    chart.type = "pie";
    chart.title = "Account Balances";

    for (const auto& a : report.accounts) {
        text << "• " << a.name << ": " << a.balance.format() << "\n";
        chart.labels.push_back(a.name);
        chart.values.push_back(a.balance.toDouble());
    }
    text << "\nTotal Balance: " << report.total.format();

    return { text.str(), chart, {} };
}

BuilderReply ResponseBuilders::spendingAnalysis(const BuilderContext& ctx) {
    const auto& policy = ctx.aggregator.policy();
    auto breakdown = ctx.aggregator.category_breakdown(ctx.user, ctx.aggregator.analysis_window());
    if (breakdown.all.empty()) {
        return { ResponseManager::get("no_expenses"), std::nullopt, {} };
    }

    std::ostringstream text;
    text << "Spending Analysis (Last " << policy.analysisWindowDays << " Days):\n";
    text << "Total Spent: " << breakdown.total.format() << "\n\n";
    text << "Top Categories:\n";
    for (const auto& c : breakdown.top) {
        text << "• " << ledger::displayName(c.category) << ": " << c.amount.format()
             << " (" << percentText(c.percent) << ")\n";
    }

    ChartPayload chart;
    chart.type = "doughnut";
    chart.title = "Spending by Category";
    for (const auto& c : breakdown.all) {
        chart.labels.push_back(ledger::displayName(c.category));
        chart.values.push_back(c.amount.toDouble());
    }

    return { text.str(), chart, {} };
}

BuilderReply ResponseBuilders::budgetHelp(const BuilderContext& ctx) {
    Money spent = ctx.aggregator.expense_total(ctx.user, ctx.aggregator.analysis_window());
    if (spent.isZero()) {
        return { ResponseManager::get("budget_no_data"), std::nullopt, {} };
    }

    std::ostringstream text;
    text << "Budget Advice:\n\n";
    text << "Your monthly spending: " << spent.format() << "\n\n";
    text << "Recommendations:\n";
    text << "• Emergency fund goal: " << spent.scaled(kEmergencyFundMonths).format()
         << " (" << kEmergencyFundMonths << " months expenses)\n";
    text << "• Suggested monthly savings: " << spent.scaled(kSuggestedSavingsRate).format()
         << " (" << static_cast<int>(kSuggestedSavingsRate * 100 + 0.5) << "% of expenses)\n";
    text << "• Consider the 50/30/20 rule: 50% needs, 30% wants, 20% savings\n";
    text << "• Review your largest expense categories for potential savings";

    return { text.str(), std::nullopt, {} };
}

BuilderReply ResponseBuilders::savingsAdvice(const BuilderContext& ctx) {
    auto window = ctx.aggregator.analysis_window();
    Money income = ctx.aggregator.income_total(ctx.user, window);
    Money expenses = ctx.aggregator.expense_total(ctx.user, window);
    Money net = income - expenses;

    std::ostringstream text;
    text << "Savings Analysis:\n\n";
    text << "Monthly Income: " << income.format() << "\n";
    text << "Monthly Expenses: " << expenses.format() << "\n";
    text << "Net Income: " << net.format() << "\n\n";

    if (auto allocation = ctx.aggregator.savings_allocation(net)) {
        text << "Great! You have " << net.format() << " left over each month.\n\n";
        text << "Savings Suggestions:\n";
        text << "• Emergency fund: Save " << allocation->emergency.format() << "/month\n";
        text << "• Long-term goals: Save " << allocation->longTerm.format() << "/month\n";
        text << "• Fun money: Keep " << allocation->discretionary.format() << "/month flexible";
    } else {
        text << "You're spending more than you earn. Consider:\n";
        text << "• Review your largest expenses\n";
        text << "• Look for subscription services to cancel\n";
        text << "• Find ways to increase your income";
    }

    return { text.str(), std::nullopt, {} };
}

BuilderReply ResponseBuilders::transactionSearch(const BuilderContext& ctx) {
    auto found = ctx.aggregator.search_by_amounts(ctx.user, ctx.entities.amounts);
    if (found.empty()) {
        return { ResponseManager::get("no_transactions"), std::nullopt, {} };
    }

    BuilderReply reply;
    std::ostringstream text;
    text << "Found " << found.size() << " recent transactions:\n\n";
    for (const auto& t : found) {
        text << "• " << shortDate(t.date) << " - " << t.description << ": " << t.amount.format() << "\n";
    }
    reply.text = text.str();

    for (std::size_t i = 0; i < found.size() && i < kMaxViewActions; ++i) {
        ChatAction action;
        action.type = "view_transaction";
        action.fields = { { "id", found[i].id }, { "label", "View $" + found[i].amount.toString() } };
        reply.actions.push_back(std::move(action));
    }
    return reply;
}

// ------------------------------------------------------------
// Informational intents
// ------------------------------------------------------------
BuilderReply ResponseBuilders::financialGoals(const BuilderContext&) {
    return { ResponseManager::get("financial_goals"), std::nullopt, {} };
}

BuilderReply ResponseBuilders::billReminders(const BuilderContext&) {
    return { ResponseManager::get("bill_reminders"), std::nullopt, {} };
}

BuilderReply ResponseBuilders::exportData(const BuilderContext&) {
    BuilderReply reply{ ResponseManager::get("export_data"), std::nullopt, {} };
    reply.actions.push_back({ "export", { { "format", "pdf" }, { "label", "Download PDF Report" } } });
    reply.actions.push_back({ "export", { { "format", "excel" }, { "label", "Download Excel Report" } } });
    return reply;
}
