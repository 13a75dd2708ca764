#include "commands_ledger.hpp"
#include "commands_helpers.hpp"
#include "bootstrap.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <cstdio>
#include <sstream>

namespace {

// Upper bounds for the reporting windows; anything larger is a typo.
constexpr long long kMaxBreakdownDays = 3660;
constexpr long long kMaxTrendMonths   = 120;
constexpr long long kMaxPageSize      = 100;

std::optional<long long> parseId(const std::string& text) {
    try {
        size_t used = 0;
        long long v = std::stoll(trim(text), &used);
        if (used != trim(text).size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string percentText(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f%%", value);
    return buf;
}

// "key=value key=value" -> filter. Returns the offending token on failure.
std::optional<std::string> parseFilter(const std::string& arg, ledger::TransactionFilter& filter) {
    std::istringstream iss(arg);
    std::string token;
    while (iss >> token) {
        auto eq = token.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == token.size()) return token;
        const std::string key = toLowerCopy(token.substr(0, eq));
        const std::string value = token.substr(eq + 1);

        if (key == "account") {
            auto id = parseId(value);
            if (!id) return token;
            filter.accountId = *id;
        } else if (key == "type") {
            auto type = ledger::transactionTypeFromString(toLowerCopy(value));
            if (!type) return token;
            filter.type = *type;
        } else if (key == "category") {
            auto category = ledger::categoryFromString(toLowerCopy(value));
            if (!category) return token;
            filter.category = *category;
        } else if (key == "min" || key == "max") {
            auto amount = ledger::Money::parse(value);
            if (!amount || *amount < ledger::Money()) return token;
            (key == "min" ? filter.minAmount : filter.maxAmount) = *amount;
        } else if (key == "from" || key == "to") {
            auto date = ledger::parseDate(value);
            if (!date) return token;
            (key == "from" ? filter.startDate : filter.endDate) = *date;
        } else if (key == "merchant") {
            filter.merchant = value;
        } else if (key == "page" || key == "size") {
            auto n = parseId(value);
            if (!n || *n <= 0) return token;
            if (key == "size" && *n > kMaxPageSize) return token;
            if (key == "page" && *n > 1000000) return token;
            (key == "page" ? filter.page : filter.pageSize) = static_cast<std::size_t>(*n);
        } else {
            return token;
        }
    }
    return std::nullopt;
}

std::string describe(const ledger::Transaction& t, const std::string& accountName) {
    std::ostringstream line;
    line << "#" << t.id << " " << ledger::toString(t.date) << " " << accountName << " "
         << ledger::toString(t.type) << " " << t.amount.format() << " " << ledger::toString(t.category);
    if (t.subcategory) line << "/" << *t.subcategory;
    line << " " << t.description;
    if (t.merchantName) line << " @ " << *t.merchantName;
    return line.str();
}

void persistLedger(AppContext& app) {
    if (app.config.ledgerFile.empty()) return;
    std::string err;
    if (!app.ledger.save_file(app.config.ledgerFile, &err)) {
        ErrorManager::log("ERR_LEDGER_SAVE", err);
    }
}

} // namespace

// ------------------------------------------------------------
// [Ledger] Read side
// ------------------------------------------------------------
CommandResult cmdBalances([[maybe_unused]] const std::string& arg) {
    auto& app = appContext();
    auto report = app.aggregator->account_balances(app.config.userId);
    if (report.accounts.empty()) {
        return { "[Ledger] No active accounts.", true, "ERR_NONE" };
    }

    std::ostringstream msg;
    msg << "[Ledger] Balances:\n";
    for (const auto& a : report.accounts) {
        msg << "- " << a.name << " (" << ledger::toString(a.kind) << "): " << a.balance.format() << "\n";
    }
    msg << "Total (excluding credit cards): " << report.total.format();
    return { msg.str(), true, "ERR_NONE" };
}

CommandResult cmdBreakdown(const std::string& arg) {
    auto& app = appContext();
    int days = app.aggregator->policy().analysisWindowDays;
    if (!trim(arg).empty()) {
        auto parsed = parseId(arg);
        if (!parsed || *parsed <= 0 || *parsed > kMaxBreakdownDays) {
            return { "[Ledger] Usage: breakdown [days] (1-" + std::to_string(kMaxBreakdownDays) + ")",
                     false, "ERR_NONE" };
        }
        days = static_cast<int>(*parsed);
    }

    auto breakdown = app.aggregator->category_breakdown(app.config.userId, app.aggregator->trailing_days(days));
    if (breakdown.all.empty()) {
        return { "[Ledger] No expenses in the last " + std::to_string(days) + " days.", true, "ERR_NONE" };
    }

    std::ostringstream msg;
    msg << "[Ledger] Expenses, last " << days << " days: " << breakdown.total.format() << "\n";
    for (const auto& c : breakdown.all) {
        msg << "- " << ledger::displayName(c.category) << ": " << c.amount.format()
            << " (" << percentText(c.percent) << ")\n";
    }
    return { trim(msg.str()), true, "ERR_NONE" };
}

CommandResult cmdTrend(const std::string& arg) {
    auto& app = appContext();
    int months = app.aggregator->policy().trendMonths;
    if (!trim(arg).empty()) {
        auto parsed = parseId(arg);
        if (!parsed || *parsed <= 0 || *parsed > kMaxTrendMonths) {
            return { "[Ledger] Usage: trend [months] (1-" + std::to_string(kMaxTrendMonths) + ")",
                     false, "ERR_NONE" };
        }
        months = static_cast<int>(*parsed);
    }

    std::ostringstream msg;
    msg << "[Ledger] Monthly trend:\n";
    for (const auto& m : app.aggregator->monthly_trend(app.config.userId, months)) {
        msg << m.month << "  income " << m.income.format()
            << "  expenses " << m.expenses.format()
            << "  net " << m.net.format() << "\n";
    }
    return { trim(msg.str()), true, "ERR_NONE" };
}

CommandResult cmdSummary([[maybe_unused]] const std::string& arg) {
    auto& app = appContext();
    auto s = app.aggregator->summary(app.config.userId);

    std::ostringstream msg;
    msg << "[Ledger] Summary:\n"
        << "Income:       " << s.totalIncome.format() << "\n"
        << "Expenses:     " << s.totalExpenses.format() << "\n"
        << "Net:          " << s.netIncome.format() << "\n"
        << "Transactions: " << s.transactionCount << "\n";
    if (!s.topCategories.empty()) {
        msg << "Top categories:\n";
        for (const auto& c : s.topCategories) {
            msg << "- " << ledger::displayName(c.category) << ": " << c.amount.format()
                << " (" << percentText(c.percent) << ")\n";
        }
    }
    return { trim(msg.str()), true, "ERR_NONE" };
}

CommandResult cmdListTransactions(const std::string& arg) {
    auto& app = appContext();
    ledger::TransactionFilter filter;
    if (auto bad = parseFilter(arg, filter)) {
        return ErrorManager::report("ERR_TX_FILTER", *bad);
    }
    if (filter.minAmount && filter.maxAmount && *filter.maxAmount < *filter.minAmount) {
        return ErrorManager::report("ERR_TX_FILTER", "min is above max");
    }

    auto page = app.aggregator->list_transactions(app.config.userId, filter);
    if (page.items.empty()) {
        if (page.totalMatches == 0) return { "[Ledger] No matching transactions.", true, "ERR_NONE" };
        return { "[Ledger] Page " + std::to_string(page.page) + " is past the last of " +
                 std::to_string(page.totalMatches) + " matches.", true, "ERR_NONE" };
    }

    const std::size_t first = (page.page - 1) * page.pageSize + 1;
    std::ostringstream msg;
    msg << "[Ledger] Transactions " << first << "-" << first + page.items.size() - 1
        << " of " << page.totalMatches << ":\n";
    for (const auto& t : page.items) {
        auto account = app.ledger.account(t.accountId);
        msg << "- " << describe(t, account ? account->name : "?") << "\n";
    }
    return { trim(msg.str()), true, "ERR_NONE" };
}

// ------------------------------------------------------------
// [Ledger] Write side
// ------------------------------------------------------------
CommandResult cmdAddTransaction(const std::string& arg) {
    auto& app = appContext();
    auto fields = splitFields(arg);
    if (fields.size() < 4 || fields.size() > 6) {
        return ErrorManager::report("ERR_TX_USAGE", arg);
    }

    auto accountId = parseId(fields[0]);
    auto type = ledger::transactionTypeFromString(toLowerCopy(fields[1]));
    auto amount = ledger::Money::parse(fields[2]);
    if (!accountId || !type || !amount || !amount->isPositive() || fields[3].empty()) {
        return ErrorManager::report("ERR_TX_USAGE", arg);
    }
    if (!app.ledger.account(*accountId)) {
        return ErrorManager::report("ERR_TX_UNKNOWN_ACCOUNT", fields[0]);
    }

    ledger::Transaction tx;
    tx.accountId = *accountId;
    tx.type = *type;
    tx.amount = *amount;
    tx.description = fields[3];
    if (fields.size() >= 5 && !fields[4].empty()) tx.merchantName = fields[4];

    tx.date = app.aggregator->now();
    if (fields.size() == 6) {
        auto date = ledger::parseDate(fields[5]);
        if (!date) return ErrorManager::report("ERR_TX_USAGE", "bad date " + fields[5]);
        tx.date = *date;
    }

    if (tx.type == ledger::TransactionType::Transfer) {
        tx.category = ledger::TransactionCategory::TransferOut;
    } else {
        auto predicted = app.categorizer->predict(tx.description, tx.amount, tx.merchantName);
        tx.category = predicted.category;
        tx.subcategory = predicted.subcategory;
        tx.confidenceScore = predicted.confidence;
    }

    auto stored = app.ledger.create_transaction(tx);
    if (!stored) {
        return ErrorManager::report("ERR_TX_UNKNOWN_ACCOUNT", fields[0]);
    }
    persistLedger(app);

    auto account = app.ledger.account(stored->accountId);
    std::ostringstream msg;
    msg << "[Ledger] Added #" << stored->id << " " << ledger::toString(stored->category);
    if (stored->subcategory) msg << "/" << *stored->subcategory;
    if (account) msg << ", " << account->name << " balance " << account->currentBalance.format();
    return { msg.str(), true, "ERR_NONE" };
}

CommandResult cmdUpdateTransaction(const std::string& arg) {
    auto& app = appContext();
    auto fields = splitFields(arg);
    if (fields.size() < 2) {
        return ErrorManager::report("ERR_TX_USAGE", arg);
    }

    auto id = parseId(fields[0]);
    std::optional<ledger::Transaction> current;
    if (id) current = app.ledger.transaction(*id);
    if (!current) {
        return ErrorManager::report("ERR_TX_NOT_FOUND", fields[0]);
    }
    // Only the caller's own transactions.
    auto owner = app.ledger.account(current->accountId);
    if (!owner || owner->userId != app.config.userId) {
        return ErrorManager::report("ERR_TX_NOT_FOUND", fields[0]);
    }

    ledger::Transaction tx = *current;
    bool categorySet = false;
    bool subcategorySet = false;
    for (size_t i = 1; i < fields.size(); i++) {
        auto eq = fields[i].find('=');
        if (eq == std::string::npos) return ErrorManager::report("ERR_TX_USAGE", fields[i]);
        const std::string key = toLowerCopy(trim(fields[i].substr(0, eq)));
        const std::string value = trim(fields[i].substr(eq + 1));

        if (key == "amount") {
            auto amount = ledger::Money::parse(value);
            if (!amount || !amount->isPositive()) return ErrorManager::report("ERR_TX_USAGE", fields[i]);
            tx.amount = *amount;
        } else if (key == "category") {
            auto category = ledger::categoryFromString(toLowerCopy(value));
            if (!category) return ErrorManager::report("ERR_TX_USAGE", fields[i]);
            tx.category = *category;
            categorySet = true;
        } else if (key == "subcategory") {
            if (value.size() > 100) return ErrorManager::report("ERR_TX_USAGE", "subcategory too long");
            tx.subcategory = value.empty() ? std::nullopt : std::optional<std::string>(value);
            subcategorySet = true;
        } else if (key == "description") {
            if (value.empty() || value.size() > 500) return ErrorManager::report("ERR_TX_USAGE", fields[i]);
            tx.description = value;
        } else if (key == "merchant") {
            if (value.size() > 255) return ErrorManager::report("ERR_TX_USAGE", "merchant too long");
            tx.merchantName = value.empty() ? std::nullopt : std::optional<std::string>(value);
        } else if (key == "date") {
            auto date = ledger::parseDate(value);
            if (!date) return ErrorManager::report("ERR_TX_USAGE", fields[i]);
            tx.date = *date;
        } else {
            return ErrorManager::report("ERR_TX_USAGE", "unknown field " + key);
        }
    }

    // A hand-set category replaces the model's label and its sub-category.
    if (categorySet && tx.category != current->category) {
        tx.confidenceScore.reset();
        if (!subcategorySet) tx.subcategory.reset();
    }

    if (!app.ledger.update_transaction(tx)) {
        return ErrorManager::report("ERR_TX_NOT_FOUND", fields[0]);
    }
    persistLedger(app);

    auto account = app.ledger.account(tx.accountId);
    std::ostringstream msg;
    msg << "[Ledger] Updated #" << tx.id << " " << ledger::toString(tx.category);
    if (tx.subcategory) msg << "/" << *tx.subcategory;
    if (account) msg << ", " << account->name << " balance " << account->currentBalance.format();
    return { msg.str(), true, "ERR_NONE" };
}

CommandResult cmdDeleteTransaction(const std::string& arg) {
    auto& app = appContext();
    auto id = parseId(arg);
    if (!id || !app.ledger.delete_transaction(*id)) {
        return ErrorManager::report("ERR_TX_NOT_FOUND", arg);
    }
    persistLedger(app);
    return { "[Ledger] Deleted #" + std::to_string(*id), true, "ERR_NONE" };
}

CommandResult cmdRecalculate(const std::string& arg) {
    auto& app = appContext();
    auto id = parseId(arg);
    if (!id) return ErrorManager::report("ERR_TX_UNKNOWN_ACCOUNT", arg);

    auto balance = app.ledger.recalculate_balance(*id);
    if (!balance) return ErrorManager::report("ERR_TX_UNKNOWN_ACCOUNT", arg);

    persistLedger(app);
    return { "[Ledger] Account " + std::to_string(*id) + " balance " + balance->format(), true, "ERR_NONE" };
}
