#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "ledger/money.hpp"
#include "ledger/transaction_category.hpp"

namespace ledger {

using UserId        = std::int64_t;
using AccountId     = std::int64_t;
using TransactionId = std::int64_t;

// ------------------------------------------------------------
// Calendar date (proleptic Gregorian, no time zone)
// ------------------------------------------------------------
struct Date {
    int year  = 1970;
    int month = 1;
    int day   = 1;
};

bool operator==(const Date& a, const Date& b);
bool operator!=(const Date& a, const Date& b);
bool operator<(const Date& a, const Date& b);
bool operator<=(const Date& a, const Date& b);

bool isValidDate(const Date& d);

// Days since 1970-01-01 and back.
std::int64_t toDays(const Date& d);
Date fromDays(std::int64_t days);

Date addDays(const Date& d, int days);

// First day of the month `months` calendar months before d's month.
Date monthsBefore(const Date& d, int months);

// "YYYY-MM-DD"; anything after the date part ("T10:30:00Z") is ignored.
std::optional<Date> parseDate(const std::string& text);
std::string toString(const Date& d);

// "YYYY-MM"
std::string monthKey(const Date& d);

// Local calendar date from the system clock.
Date today();

// Inclusive on both ends.
struct DateRange {
    Date start;
    Date end;

    bool contains(const Date& d) const { return start <= d && d <= end; }
};

// ------------------------------------------------------------
// Ledger records
// ------------------------------------------------------------
enum class AccountKind { Checking, Savings, CreditCard, Investment, Loan };
enum class TransactionType { Income, Expense, Transfer };

std::string toString(AccountKind kind);
std::optional<AccountKind> accountKindFromString(const std::string& name);

std::string toString(TransactionType type);
std::optional<TransactionType> transactionTypeFromString(const std::string& name);

struct Account {
    AccountId id = 0;
    UserId userId = 0;
    std::string name;
    Money currentBalance;
    bool isActive = true;
    AccountKind kind = AccountKind::Checking;
};

struct Transaction {
    TransactionId id = 0;
    AccountId accountId = 0;
    Money amount;
    TransactionType type = TransactionType::Expense;
    TransactionCategory category = TransactionCategory::OtherExpense;
    std::optional<std::string> subcategory;
    Date date;
    std::string description;
    std::optional<std::string> merchantName;
    std::optional<double> confidenceScore;   // set when the category came from the model
};

} // namespace ledger
