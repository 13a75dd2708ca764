#include "ledger/ledger_types.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <tuple>

namespace ledger {

// ------------------------------------------------------------
// Date
// ------------------------------------------------------------
bool operator==(const Date& a, const Date& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

bool operator!=(const Date& a, const Date& b) { return !(a == b); }

bool operator<(const Date& a, const Date& b) {
    return std::tie(a.year, a.month, a.day) < std::tie(b.year, b.month, b.day);
}

bool operator<=(const Date& a, const Date& b) { return !(b < a); }

static bool isLeap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

static int daysInMonth(int y, int m) {
    static const int md[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return md[m - 1] + ((m == 2 && isLeap(y)) ? 1 : 0);
}

bool isValidDate(const Date& d) {
    if (d.year < 1900 || d.year > 9999 || d.month < 1 || d.month > 12 || d.day < 1) return false;
    return d.day <= daysInMonth(d.year, d.month);
}

// Civil-from-days / days-from-civil (era based, valid for the whole range we accept)
std::int64_t toDays(const Date& d) {
    std::int64_t y = d.year - (d.month <= 2 ? 1 : 0);
    std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    std::int64_t yoe = y - era * 400;
    std::int64_t mp  = (d.month + 9) % 12;
    std::int64_t doy = (153 * mp + 2) / 5 + d.day - 1;
    std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Date fromDays(std::int64_t days) {
    days += 719468;
    std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    std::int64_t doe = days - era * 146097;
    std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    std::int64_t y   = yoe + era * 400;
    std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    std::int64_t mp  = (5 * doy + 2) / 153;
    std::int64_t d   = doy - (153 * mp + 2) / 5 + 1;
    std::int64_t m   = mp < 10 ? mp + 3 : mp - 9;

    Date out;
    out.year  = static_cast<int>(y + (m <= 2 ? 1 : 0));
    out.month = static_cast<int>(m);
    out.day   = static_cast<int>(d);
    return out;
}

Date addDays(const Date& d, int days) {
    return fromDays(toDays(d) + days);
}

Date monthsBefore(const Date& d, int months) {
    int index = d.year * 12 + (d.month - 1) - months;
    Date out;
    out.year  = index / 12;
    out.month = index % 12 + 1;
    out.day   = 1;
    return out;
}

std::optional<Date> parseDate(const std::string& text) {
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') return std::nullopt;
    if (text.size() > 10 && text[10] != 'T' && text[10] != ' ') return std::nullopt;

    Date d;
    for (int i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (text[i] < '0' || text[i] > '9') return std::nullopt;
    }
    d.year  = std::stoi(text.substr(0, 4));
    d.month = std::stoi(text.substr(5, 2));
    d.day   = std::stoi(text.substr(8, 2));
    if (!isValidDate(d)) return std::nullopt;
    return d;
}

std::string toString(const Date& d) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", d.year, d.month, d.day);
    return buf;
}

std::string monthKey(const Date& d) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d", d.year, d.month);
    return buf;
}

Date today() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    Date d;
    d.year  = tm.tm_year + 1900;
    d.month = tm.tm_mon + 1;
    d.day   = tm.tm_mday;
    return d;
}

// ------------------------------------------------------------
// Enum names
// ------------------------------------------------------------
std::string toString(AccountKind kind) {
    switch (kind) {
        case AccountKind::Checking:   return "checking";
        case AccountKind::Savings:    return "savings";
        case AccountKind::CreditCard: return "credit_card";
        case AccountKind::Investment: return "investment";
        case AccountKind::Loan:       return "loan";
    }
    return "checking";
}

std::optional<AccountKind> accountKindFromString(const std::string& name) {
    if (name == "checking")    return AccountKind::Checking;
    if (name == "savings")     return AccountKind::Savings;
    if (name == "credit_card") return AccountKind::CreditCard;
    if (name == "investment")  return AccountKind::Investment;
    if (name == "loan")        return AccountKind::Loan;
    return std::nullopt;
}

std::string toString(TransactionType type) {
    switch (type) {
        case TransactionType::Income:   return "income";
        case TransactionType::Expense:  return "expense";
        case TransactionType::Transfer: return "transfer";
    }
    return "expense";
}

std::optional<TransactionType> transactionTypeFromString(const std::string& name) {
    if (name == "income")   return TransactionType::Income;
    if (name == "expense")  return TransactionType::Expense;
    if (name == "transfer") return TransactionType::Transfer;
    return std::nullopt;
}

} // namespace ledger
