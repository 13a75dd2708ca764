#include "ledger/ledger_store.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace ledger {

// ------------------------------------------------------------
// JSON helpers
// ------------------------------------------------------------
static Money moneyFromJson(const nlohmann::json& v, const char* field) {
    if (v.is_string()) {
        auto parsed = Money::parse(v.get<std::string>());
        if (!parsed) throw std::runtime_error(std::string("invalid amount in '") + field + "'");
        return *parsed;
    }
    if (v.is_number()) return Money::fromDouble(v.get<double>());
    throw std::runtime_error(std::string("'") + field + "' must be a string or number");
}

static std::optional<std::string> optionalString(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<std::string>();
}

static Account accountFromJson(const nlohmann::json& j) {
    Account a;
    a.id       = j.at("id").get<AccountId>();
    a.userId   = j.value("user_id", UserId{1});
    a.name     = j.at("name").get<std::string>();
    a.isActive = j.value("is_active", true);

    auto kind = accountKindFromString(j.value("account_type", "checking"));
    if (!kind) throw std::runtime_error("unknown account_type for account " + std::to_string(a.id));
    a.kind = *kind;
    return a;
}

static Transaction transactionFromJson(const nlohmann::json& j) {
    Transaction t;
    t.id        = j.at("id").get<TransactionId>();
    t.accountId = j.at("account_id").get<AccountId>();
    t.amount    = moneyFromJson(j.at("amount"), "amount");

    auto type = transactionTypeFromString(j.at("transaction_type").get<std::string>());
    if (!type) throw std::runtime_error("unknown transaction_type for transaction " + std::to_string(t.id));
    t.type = *type;

    auto category = categoryFromString(j.value("category", "other_expense"));
    if (!category) throw std::runtime_error("unknown category for transaction " + std::to_string(t.id));
    t.category = *category;

    auto date = parseDate(j.at("transaction_date").get<std::string>());
    if (!date) throw std::runtime_error("invalid transaction_date for transaction " + std::to_string(t.id));
    t.date = *date;

    t.description  = j.at("description").get<std::string>();
    t.subcategory  = optionalString(j, "subcategory");
    t.merchantName = optionalString(j, "merchant_name");
    if (j.contains("confidence_score") && j["confidence_score"].is_number()) {
        t.confidenceScore = j["confidence_score"].get<double>();
    }
    return t;
}

static nlohmann::json accountToJson(const Account& a) {
    return {
        {"id", a.id},
        {"user_id", a.userId},
        {"name", a.name},
        {"account_type", toString(a.kind)},
        {"current_balance", a.currentBalance.toString()},
        {"is_active", a.isActive}
    };
}

static nlohmann::json transactionToJson(const Transaction& t) {
    nlohmann::json j = {
        {"id", t.id},
        {"account_id", t.accountId},
        {"amount", t.amount.toString()},
        {"transaction_type", toString(t.type)},
        {"category", toString(t.category)},
        {"transaction_date", toString(t.date)},
        {"description", t.description}
    };
    j["subcategory"]   = t.subcategory ? nlohmann::json(*t.subcategory) : nlohmann::json(nullptr);
    j["merchant_name"] = t.merchantName ? nlohmann::json(*t.merchantName) : nlohmann::json(nullptr);
    if (t.confidenceScore) j["confidence_score"] = *t.confidenceScore;
    return j;
}

static Money balanceDelta(const Transaction& t) {
    switch (t.type) {
        case TransactionType::Income:   return t.amount;
        case TransactionType::Expense:  return -t.amount;
        case TransactionType::Transfer: return Money();
    }
    return Money();
}

// ------------------------------------------------------------
// Read side
// ------------------------------------------------------------
std::vector<Account> InMemoryLedger::accounts(UserId user) const {
    std::scoped_lock lock(mutex_);
    std::vector<Account> out;
    for (const auto& a : accounts_) {
        if (a.userId == user) out.push_back(a);
    }
    return out;
}

std::vector<Transaction> InMemoryLedger::transactions(UserId user,
                                                      const std::optional<DateRange>& range) const {
    std::scoped_lock lock(mutex_);
    std::vector<Transaction> out;
    for (const auto& t : transactions_) {
        const Account* owner = findAccountLocked(t.accountId);
        if (!owner || owner->userId != user) continue;
        if (range && !range->contains(t.date)) continue;
        out.push_back(t);
    }
    return out;
}

std::vector<Transaction> InMemoryLedger::all_transactions() const {
    std::scoped_lock lock(mutex_);
    return transactions_;
}

std::optional<Account> InMemoryLedger::account(AccountId id) const {
    std::scoped_lock lock(mutex_);
    const Account* a = findAccountLocked(id);
    if (!a) return std::nullopt;
    return *a;
}

std::optional<Transaction> InMemoryLedger::transaction(TransactionId id) const {
    std::scoped_lock lock(mutex_);
    auto it = std::find_if(transactions_.begin(), transactions_.end(),
                           [&](const Transaction& t) { return t.id == id; });
    if (it == transactions_.end()) return std::nullopt;
    return *it;
}

std::size_t InMemoryLedger::transaction_count() const {
    std::scoped_lock lock(mutex_);
    return transactions_.size();
}

// ------------------------------------------------------------
// Write side
// ------------------------------------------------------------
void InMemoryLedger::add_account(Account account) {
    std::scoped_lock lock(mutex_);
    account.currentBalance = computeBalanceLocked(account.id);
    if (Account* existing = findAccountLocked(account.id)) {
        *existing = account;
    } else {
        accounts_.push_back(account);
    }
}

std::optional<Transaction> InMemoryLedger::create_transaction(Transaction tx) {
    std::scoped_lock lock(mutex_);
    Account* owner = findAccountLocked(tx.accountId);
    if (!owner) {
        LOG_ERROR("Ledger", "create_transaction: unknown account " + std::to_string(tx.accountId));
        return std::nullopt;
    }

    if (tx.id == 0) tx.id = nextId_;
    nextId_ = std::max(nextId_, tx.id + 1);
    transactions_.push_back(tx);

    owner->currentBalance += balanceDelta(tx);
    LOG_TRACE("Ledger", "Created transaction " + std::to_string(tx.id) +
                        " on account " + std::to_string(tx.accountId));
    return tx;
}

bool InMemoryLedger::update_transaction(const Transaction& tx) {
    std::scoped_lock lock(mutex_);
    auto it = std::find_if(transactions_.begin(), transactions_.end(),
                           [&](const Transaction& t) { return t.id == tx.id; });
    if (it == transactions_.end() || !findAccountLocked(tx.accountId)) return false;

    AccountId oldAccount = it->accountId;
    *it = tx;

    // The transaction may have moved between accounts; rebuild both.
    if (Account* a = findAccountLocked(oldAccount)) a->currentBalance = computeBalanceLocked(oldAccount);
    if (Account* a = findAccountLocked(tx.accountId)) a->currentBalance = computeBalanceLocked(tx.accountId);
    return true;
}

bool InMemoryLedger::delete_transaction(TransactionId id) {
    std::scoped_lock lock(mutex_);
    auto it = std::find_if(transactions_.begin(), transactions_.end(),
                           [&](const Transaction& t) { return t.id == id; });
    if (it == transactions_.end()) return false;

    AccountId accountId = it->accountId;
    transactions_.erase(it);
    if (Account* a = findAccountLocked(accountId)) a->currentBalance = computeBalanceLocked(accountId);
    return true;
}

std::optional<Money> InMemoryLedger::recalculate_balance(AccountId id) {
    std::scoped_lock lock(mutex_);
    Account* a = findAccountLocked(id);
    if (!a) return std::nullopt;
    a->currentBalance = computeBalanceLocked(id);
    return a->currentBalance;
}

Money InMemoryLedger::computeBalanceLocked(AccountId id) const {
    Money balance;
    for (const auto& t : transactions_) {
        if (t.accountId == id) balance += balanceDelta(t);
    }
    return balance;
}

Account* InMemoryLedger::findAccountLocked(AccountId id) {
    for (auto& a : accounts_) {
        if (a.id == id) return &a;
    }
    return nullptr;
}

const Account* InMemoryLedger::findAccountLocked(AccountId id) const {
    for (const auto& a : accounts_) {
        if (a.id == id) return &a;
    }
    return nullptr;
}

// ------------------------------------------------------------
// Persistence
// ------------------------------------------------------------
bool InMemoryLedger::loadJsonLocked(const nlohmann::json& j, std::string* err) {
    try {
        std::vector<Account> accounts;
        std::vector<Transaction> transactions;

        if (j.contains("accounts")) {
            for (const auto& a : j.at("accounts")) accounts.push_back(accountFromJson(a));
        }
        if (j.contains("transactions")) {
            for (const auto& t : j.at("transactions")) transactions.push_back(transactionFromJson(t));
        }

        accounts_ = std::move(accounts);
        transactions_ = std::move(transactions);
        nextId_ = 1;
        for (const auto& t : transactions_) nextId_ = std::max(nextId_, t.id + 1);

        // Stored balances are never trusted; the invariant is rebuilt on load.
        for (auto& a : accounts_) a.currentBalance = computeBalanceLocked(a.id);
        return true;
    } catch (const std::exception& e) {
        if (err) *err = e.what();
        return false;
    }
}

bool InMemoryLedger::load_file(const std::string& path, std::string* err) {
    std::ifstream in(path);
    if (!in) {
        if (err) *err = "Could not open file: " + path;
        return false;
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        if (err) *err = e.what();
        return false;
    }

    std::scoped_lock lock(mutex_);
    if (!loadJsonLocked(j, err)) return false;
    LOG_DEBUG("Ledger", "Loaded " + std::to_string(accounts_.size()) + " accounts and " +
                        std::to_string(transactions_.size()) + " transactions from " + path);
    return true;
}

bool InMemoryLedger::load_from_string(const std::string& text, std::string* err) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const std::exception& e) {
        if (err) *err = e.what();
        return false;
    }

    std::scoped_lock lock(mutex_);
    return loadJsonLocked(j, err);
}

nlohmann::json InMemoryLedger::to_json() const {
    std::scoped_lock lock(mutex_);
    nlohmann::json j = {
        {"accounts", nlohmann::json::array()},
        {"transactions", nlohmann::json::array()}
    };
    for (const auto& a : accounts_) j["accounts"].push_back(accountToJson(a));
    for (const auto& t : transactions_) j["transactions"].push_back(transactionToJson(t));
    return j;
}

bool InMemoryLedger::save_file(const std::string& path, std::string* err) const {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        if (err) *err = "Could not write file: " + path;
        return false;
    }
    out << to_json().dump(2);
    return true;
}

} // namespace ledger
