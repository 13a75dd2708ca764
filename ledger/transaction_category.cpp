#include "ledger/transaction_category.hpp"

#include <cctype>
#include <utility>

namespace ledger {

static const std::vector<std::pair<TransactionCategory, const char*>>& categoryNames() {
    static const std::vector<std::pair<TransactionCategory, const char*>> names = {
        { TransactionCategory::Salary,           "salary" },
        { TransactionCategory::Freelance,        "freelance" },
        { TransactionCategory::InvestmentIncome, "investment_income" },
        { TransactionCategory::OtherIncome,      "other_income" },
        { TransactionCategory::FoodDining,       "food_dining" },
        { TransactionCategory::Shopping,         "shopping" },
        { TransactionCategory::Transportation,   "transportation" },
        { TransactionCategory::Entertainment,    "entertainment" },
        { TransactionCategory::BillsUtilities,   "bills_utilities" },
        { TransactionCategory::Healthcare,       "healthcare" },
        { TransactionCategory::Education,        "education" },
        { TransactionCategory::Travel,           "travel" },
        { TransactionCategory::Insurance,        "insurance" },
        { TransactionCategory::Taxes,            "taxes" },
        { TransactionCategory::OtherExpense,     "other_expense" },
        { TransactionCategory::TransferIn,       "transfer_in" },
        { TransactionCategory::TransferOut,      "transfer_out" },
    };
    return names;
}

std::string toString(TransactionCategory category) {
    for (const auto& [value, name] : categoryNames()) {
        if (value == category) return name;
    }
    return "other_expense";
}

std::optional<TransactionCategory> categoryFromString(const std::string& name) {
    for (const auto& [value, wire] : categoryNames()) {
        if (name == wire) return value;
    }
    return std::nullopt;
}

std::string displayName(TransactionCategory category) {
    std::string out = toString(category);
    bool startOfWord = true;
    for (auto& c : out) {
        if (c == '_') {
            c = ' ';
            startOfWord = true;
        } else if (startOfWord) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            startOfWord = false;
        }
    }
    return out;
}

const std::vector<TransactionCategory>& allCategories() {
    static const std::vector<TransactionCategory> all = [] {
        std::vector<TransactionCategory> v;
        for (const auto& entry : categoryNames()) v.push_back(entry.first);
        return v;
    }();
    return all;
}

} // namespace ledger
