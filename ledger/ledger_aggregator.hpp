#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "ledger/ledger_store.hpp"

namespace ledger {

// ------------------------------------------------------------
// Product policy constants (loaded from finchat_config.json)
// ------------------------------------------------------------
struct SavingsSplit {
    double emergency     = 0.5;
    double longTerm      = 0.3;
    double discretionary = 0.2;
};

struct AggregatorPolicy {
    double amountTolerance    = 0.10;  // +/- band for amount search
    SavingsSplit savingsSplit;
    std::size_t topCategories = 5;
    std::size_t searchLimit   = 10;
    int trendMonths           = 6;
    int analysisWindowDays    = 30;
};

// ------------------------------------------------------------
// Query results
// ------------------------------------------------------------
struct AccountBalance {
    std::string name;
    Money balance;
    AccountKind kind = AccountKind::Checking;
};

struct BalanceReport {
    std::vector<AccountBalance> accounts;   // active accounts only
    Money total;                            // credit cards excluded
};

struct CategoryTotal {
    TransactionCategory category = TransactionCategory::OtherExpense;
    Money amount;
    double percent = 0.0;                   // amount / total * 100
};

struct CategoryBreakdown {
    std::vector<CategoryTotal> all;         // sorted by amount, descending
    std::vector<CategoryTotal> top;         // first policy.topCategories of `all`
    Money total;
};

struct MonthlyFlow {
    std::string month;                      // "YYYY-MM"
    Money income;
    Money expenses;
    Money net;
};

struct SavingsAllocation {
    Money emergency;
    Money longTerm;
    Money discretionary;
};

// Every set field narrows the result; unset fields match anything.
struct TransactionFilter {
    std::optional<AccountId> accountId;
    std::optional<TransactionType> type;
    std::optional<TransactionCategory> category;
    std::optional<Money> minAmount;               // inclusive
    std::optional<Money> maxAmount;               // inclusive
    std::optional<Date> startDate;                // inclusive
    std::optional<Date> endDate;                  // inclusive
    std::string merchant;                         // case-insensitive substring, empty: any
    std::size_t page = 1;                         // 1-based
    std::size_t pageSize = 20;
};

struct TransactionPage {
    std::vector<Transaction> items;               // newest first
    std::size_t totalMatches = 0;
    std::size_t page = 1;
    std::size_t pageSize = 20;
};

struct TransactionSummary {
    Money totalIncome;
    Money totalExpenses;
    Money netIncome;
    std::size_t transactionCount = 0;
    std::vector<CategoryTotal> topCategories;
    std::vector<MonthlyFlow> monthlyTrend;
};

// ------------------------------------------------------------
// LedgerAggregator
// Read-only queries. Every result is a function of the store's state
// and the injected clock at call time; nothing is cached.
// ------------------------------------------------------------
class LedgerAggregator {
public:
    using Clock = std::function<Date()>;

    explicit LedgerAggregator(const LedgerStore& store,
                              AggregatorPolicy policy = {},
                              Clock clock = today);

    BalanceReport account_balances(UserId user) const;

    CategoryBreakdown category_breakdown(UserId user, const DateRange& window) const;

    // One entry per calendar month, the current month last.
    std::vector<MonthlyFlow> monthly_trend(UserId user, int months) const;
    std::vector<MonthlyFlow> monthly_trend(UserId user) const { return monthly_trend(user, policy_.trendMonths); }

    Money income_total(UserId user, const DateRange& window) const;
    Money expense_total(UserId user, const DateRange& window) const;
    Money net_flow(UserId user, const DateRange& window) const;

    // nullopt unless net > 0
    std::optional<SavingsAllocation> savings_allocation(Money net) const;

    // Transactions within +/- amountTolerance of any requested amount,
    // newest first, at most searchLimit. No amounts: newest transactions.
    std::vector<Transaction> search_by_amounts(UserId user, const std::vector<Money>& amounts) const;

    // Filtered listing, newest first (equal dates: higher id first), one page of it.
    TransactionPage list_transactions(UserId user, const TransactionFilter& filter) const;

    TransactionSummary summary(UserId user, const std::optional<DateRange>& window = std::nullopt) const;

    // [today - days, today]
    DateRange trailing_days(int days) const;
    DateRange analysis_window() const { return trailing_days(policy_.analysisWindowDays); }

    const AggregatorPolicy& policy() const { return policy_; }
    Date now() const { return clock_(); }

private:
    std::vector<CategoryTotal> rankCategories(const std::vector<Transaction>& txs, Money& total) const;

    const LedgerStore& store_;
    AggregatorPolicy policy_;
    Clock clock_;
};

} // namespace ledger
