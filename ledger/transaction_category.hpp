#pragma once
#include <optional>
#include <string>
#include <vector>

namespace ledger {

enum class TransactionCategory {
    // Income
    Salary,
    Freelance,
    InvestmentIncome,
    OtherIncome,

    // Expense
    FoodDining,
    Shopping,
    Transportation,
    Entertainment,
    BillsUtilities,
    Healthcare,
    Education,
    Travel,
    Insurance,
    Taxes,
    OtherExpense,

    // Transfer
    TransferIn,
    TransferOut
};

// Wire names ("food_dining", "other_expense", ...)
std::string toString(TransactionCategory category);
std::optional<TransactionCategory> categoryFromString(const std::string& name);

// "food_dining" -> "Food Dining"
std::string displayName(TransactionCategory category);

const std::vector<TransactionCategory>& allCategories();

} // namespace ledger
