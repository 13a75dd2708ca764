#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ledger/money.hpp"
#include "ledger/transaction_category.hpp"

namespace ml {

struct TrainingSample {
    std::string description;
    std::optional<std::string> merchantName;
    ledger::Money amount;
    ledger::TransactionCategory category = ledger::TransactionCategory::OtherExpense;
};

struct SubcategoryRule {
    std::string subcategory;
    std::vector<std::string> keywords;   // lowercase
};

// Ordered: the first matching sub-category of a category wins.
using SubcategoryRuleTable =
    std::vector<std::pair<ledger::TransactionCategory, std::vector<SubcategoryRule>>>;

// 20 labelled merchant descriptions, each repeated 10 times.
std::vector<TrainingSample> bootstrapTrainingData();

const SubcategoryRuleTable& defaultSubcategoryRules();

} // namespace ml
