#include "ledger/ledger_aggregator.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <map>
#include <utility>

namespace ledger {

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

static void sortNewestFirst(std::vector<Transaction>& txs) {
    std::stable_sort(txs.begin(), txs.end(), [](const Transaction& a, const Transaction& b) {
        if (a.date != b.date) return b.date < a.date;
        return a.id > b.id;
    });
}

LedgerAggregator::LedgerAggregator(const LedgerStore& store, AggregatorPolicy policy, Clock clock)
    : store_(store), policy_(policy), clock_(clock ? std::move(clock) : Clock(today)) {}

DateRange LedgerAggregator::trailing_days(int days) const {
    Date end = clock_();
    return { addDays(end, -days), end };
}

// ------------------------------------------------------------
// Balances
// ------------------------------------------------------------
BalanceReport LedgerAggregator::account_balances(UserId user) const {
    BalanceReport report;
    for (const auto& a : store_.accounts(user)) {
        if (!a.isActive) continue;
        report.accounts.push_back({ a.name, a.currentBalance, a.kind });

        // Credit card balances are liabilities, not available funds.
        if (a.kind != AccountKind::CreditCard) {
            report.total += a.currentBalance;
        }
    }
    return report;
}

// ------------------------------------------------------------
// Category totals
// ------------------------------------------------------------
std::vector<CategoryTotal> LedgerAggregator::rankCategories(const std::vector<Transaction>& txs,
                                                            Money& total) const {
    std::map<TransactionCategory, Money> totals;
    total = Money();
    for (const auto& t : txs) {
        if (t.type != TransactionType::Expense) continue;
        totals[t.category] += t.amount;
        total += t.amount;
    }

    std::vector<CategoryTotal> ranked;
    for (const auto& [category, amount] : totals) {
        CategoryTotal entry;
        entry.category = category;
        entry.amount = amount;
        entry.percent = total.isZero() ? 0.0 : amount.toDouble() / total.toDouble() * 100.0;
        ranked.push_back(entry);
    }

    std::stable_sort(ranked.begin(), ranked.end(), [](const CategoryTotal& a, const CategoryTotal& b) {
        if (a.amount != b.amount) return a.amount > b.amount;
        return toString(a.category) < toString(b.category);
    });
    return ranked;
}

CategoryBreakdown LedgerAggregator::category_breakdown(UserId user, const DateRange& window) const {
    CategoryBreakdown breakdown;
    breakdown.all = rankCategories(store_.transactions(user, window), breakdown.total);

    std::size_t n = std::min(policy_.topCategories, breakdown.all.size());
    breakdown.top.assign(breakdown.all.begin(), breakdown.all.begin() + static_cast<std::ptrdiff_t>(n));
    return breakdown;
}

// ------------------------------------------------------------
// Flows
// ------------------------------------------------------------
std::vector<MonthlyFlow> LedgerAggregator::monthly_trend(UserId user, int months) const {
    std::vector<MonthlyFlow> trend;
    if (months <= 0) return trend;

    Date end = clock_();
    Date start = monthsBefore(end, months - 1);

    std::map<std::string, MonthlyFlow> byMonth;
    for (int i = 0; i < months; i++) {
        Date m = monthsBefore(end, months - 1 - i);
        MonthlyFlow flow;
        flow.month = monthKey(m);
        byMonth[flow.month] = flow;
    }

    for (const auto& t : store_.transactions(user, DateRange{ start, end })) {
        auto it = byMonth.find(monthKey(t.date));
        if (it == byMonth.end()) continue;
        if (t.type == TransactionType::Income)  it->second.income += t.amount;
        if (t.type == TransactionType::Expense) it->second.expenses += t.amount;
    }

    // "YYYY-MM" keys sort chronologically.
    for (auto& [key, flow] : byMonth) {
        flow.net = flow.income - flow.expenses;
        trend.push_back(flow);
    }
    return trend;
}

Money LedgerAggregator::income_total(UserId user, const DateRange& window) const {
    Money total;
    for (const auto& t : store_.transactions(user, window)) {
        if (t.type == TransactionType::Income) total += t.amount;
    }
    return total;
}

Money LedgerAggregator::expense_total(UserId user, const DateRange& window) const {
    Money total;
    for (const auto& t : store_.transactions(user, window)) {
        if (t.type == TransactionType::Expense) total += t.amount;
    }
    return total;
}

Money LedgerAggregator::net_flow(UserId user, const DateRange& window) const {
    return income_total(user, window) - expense_total(user, window);
}

std::optional<SavingsAllocation> LedgerAggregator::savings_allocation(Money net) const {
    if (!net.isPositive()) return std::nullopt;

    SavingsAllocation split;
    split.emergency     = net.scaled(policy_.savingsSplit.emergency);
    split.longTerm      = net.scaled(policy_.savingsSplit.longTerm);
    split.discretionary = net.scaled(policy_.savingsSplit.discretionary);
    return split;
}

// ------------------------------------------------------------
// Search
// ------------------------------------------------------------
std::vector<Transaction> LedgerAggregator::search_by_amounts(UserId user,
                                                             const std::vector<Money>& amounts) const {
    std::vector<Transaction> matches;
    for (const auto& t : store_.transactions(user)) {
        if (amounts.empty()) {
            matches.push_back(t);
            continue;
        }
        for (const auto& a : amounts) {
            Money lower = a.scaled(1.0 - policy_.amountTolerance);
            Money upper = a.scaled(1.0 + policy_.amountTolerance);
            if (t.amount >= lower && t.amount <= upper) {
                matches.push_back(t);
                break;
            }
        }
    }

    sortNewestFirst(matches);
    if (matches.size() > policy_.searchLimit) matches.resize(policy_.searchLimit);

    LOG_TRACE("Ledger", "search_by_amounts: " + std::to_string(amounts.size()) + " amount(s), " +
                        std::to_string(matches.size()) + " match(es)");
    return matches;
}

TransactionPage LedgerAggregator::list_transactions(UserId user, const TransactionFilter& filter) const {
    const std::string merchant = toLower(filter.merchant);

    std::vector<Transaction> matches;
    for (auto& t : store_.transactions(user)) {
        if (filter.accountId && t.accountId != *filter.accountId) continue;
        if (filter.type && t.type != *filter.type) continue;
        if (filter.category && t.category != *filter.category) continue;
        if (filter.minAmount && t.amount < *filter.minAmount) continue;
        if (filter.maxAmount && t.amount > *filter.maxAmount) continue;
        if (filter.startDate && t.date < *filter.startDate) continue;
        if (filter.endDate && *filter.endDate < t.date) continue;
        if (!merchant.empty()) {
            if (!t.merchantName || toLower(*t.merchantName).find(merchant) == std::string::npos) continue;
        }
        matches.push_back(std::move(t));
    }
    sortNewestFirst(matches);

    TransactionPage page;
    page.totalMatches = matches.size();
    page.page = std::max<std::size_t>(filter.page, 1);
    page.pageSize = filter.pageSize;

    const std::size_t offset = (page.page - 1) * page.pageSize;
    if (page.pageSize > 0 && offset < matches.size()) {
        const std::size_t end = std::min(matches.size(), offset + page.pageSize);
        page.items.assign(std::make_move_iterator(matches.begin() + static_cast<std::ptrdiff_t>(offset)),
                          std::make_move_iterator(matches.begin() + static_cast<std::ptrdiff_t>(end)));
    }

    LOG_TRACE("Ledger", "list_transactions: " + std::to_string(page.totalMatches) + " match(es), page " +
                        std::to_string(page.page) + " has " + std::to_string(page.items.size()));
    return page;
}

// ------------------------------------------------------------
// Summary
// ------------------------------------------------------------
TransactionSummary LedgerAggregator::summary(UserId user, const std::optional<DateRange>& window) const {
    TransactionSummary s;
    auto txs = store_.transactions(user, window);
    s.transactionCount = txs.size();

    for (const auto& t : txs) {
        if (t.type == TransactionType::Income)  s.totalIncome += t.amount;
        if (t.type == TransactionType::Expense) s.totalExpenses += t.amount;
    }
    s.netIncome = s.totalIncome - s.totalExpenses;

    Money expenseTotal;
    auto ranked = rankCategories(txs, expenseTotal);
    std::size_t n = std::min(policy_.topCategories, ranked.size());
    s.topCategories.assign(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(n));

    s.monthlyTrend = monthly_trend(user);
    return s;
}

} // namespace ledger
