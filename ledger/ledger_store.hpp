#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

#include "ledger/ledger_types.hpp"

namespace ledger {

// ------------------------------------------------------------
// Read side of the ledger, as seen by the analytics core.
// Implementations must return empty vectors rather than throw when a
// user has no data.
// ------------------------------------------------------------
class LedgerStore {
public:
    virtual ~LedgerStore() = default;

    virtual std::vector<Account> accounts(UserId user) const = 0;

    // Transactions of all the user's accounts, optionally limited to a date range.
    virtual std::vector<Transaction> transactions(UserId user,
                                                  const std::optional<DateRange>& range = std::nullopt) const = 0;
};

// ------------------------------------------------------------
// InMemoryLedger
// Process-local ledger backed by a JSON file. Owns the write path:
// every create/update/delete keeps
//     currentBalance == sum(income) - sum(expense)
// for the affected account(s).
//
// 🔹 Thread-safety: all public methods lock an internal mutex.
// ------------------------------------------------------------
class InMemoryLedger : public LedgerStore {
public:
    std::vector<Account> accounts(UserId user) const override;
    std::vector<Transaction> transactions(UserId user,
                                          const std::optional<DateRange>& range = std::nullopt) const override;

    // Adds (or replaces) an account. Its balance is recomputed from the
    // transactions already recorded against it.
    void add_account(Account account);
    std::optional<Account> account(AccountId id) const;

    // Returns the stored transaction (with its assigned id), or nullopt if
    // the account does not exist.
    std::optional<Transaction> create_transaction(Transaction tx);
    std::optional<Transaction> transaction(TransactionId id) const;
    bool update_transaction(const Transaction& tx);
    bool delete_transaction(TransactionId id);

    // Rebuilds an account balance from its transactions and stores it.
    std::optional<Money> recalculate_balance(AccountId id);

    std::size_t transaction_count() const;

    // Every recorded transaction regardless of owner (training input).
    std::vector<Transaction> all_transactions() const;

    // JSON persistence: { "accounts": [...], "transactions": [...] }
    bool load_file(const std::string& path, std::string* err = nullptr);
    bool load_from_string(const std::string& text, std::string* err = nullptr);
    bool save_file(const std::string& path, std::string* err = nullptr) const;

    nlohmann::json to_json() const;

private:
    bool loadJsonLocked(const nlohmann::json& j, std::string* err);
    Money computeBalanceLocked(AccountId id) const;
    Account* findAccountLocked(AccountId id);
    const Account* findAccountLocked(AccountId id) const;

    mutable std::mutex mutex_;
    std::vector<Account> accounts_;
    std::vector<Transaction> transactions_;
    TransactionId nextId_ = 1;
};

} // namespace ledger
