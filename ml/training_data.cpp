#include "ml/training_data.hpp"

namespace ml {

using ledger::Money;
using ledger::TransactionCategory;

std::vector<TrainingSample> bootstrapTrainingData() {
    static const std::vector<TrainingSample> base = {
        // Food & dining
        { "MCDONALD'S #123",       "McDonald's",       Money::fromCents(850),    TransactionCategory::FoodDining },
        { "STARBUCKS COFFEE",      "Starbucks",        Money::fromCents(525),    TransactionCategory::FoodDining },
        { "WHOLE FOODS MARKET",    "Whole Foods",      Money::fromCents(6789),   TransactionCategory::FoodDining },
        { "RESTAURANT PAYMENT",    "Local Bistro",     Money::fromCents(4500),   TransactionCategory::FoodDining },

        // Shopping
        { "AMAZON PURCHASE",       "Amazon",           Money::fromCents(2999),   TransactionCategory::Shopping },
        { "TARGET STORE",          "Target",           Money::fromCents(5678),   TransactionCategory::Shopping },
        { "APPLE STORE ONLINE",    "Apple",            Money::fromCents(19900),  TransactionCategory::Shopping },

        // Transportation
        { "SHELL GAS STATION",     "Shell",            Money::fromCents(3500),   TransactionCategory::Transportation },
        { "UBER RIDE",             "Uber",             Money::fromCents(1250),   TransactionCategory::Transportation },
        { "METRO TRANSIT",         "Metro",            Money::fromCents(275),    TransactionCategory::Transportation },

        // Bills & utilities
        { "ELECTRIC BILL PAYMENT", "Electric Company", Money::fromCents(8945),   TransactionCategory::BillsUtilities },
        { "INTERNET SERVICE",      "Comcast",          Money::fromCents(7999),   TransactionCategory::BillsUtilities },
        { "PHONE BILL",            "Verizon",          Money::fromCents(6500),   TransactionCategory::BillsUtilities },

        // Entertainment
        { "NETFLIX SUBSCRIPTION",  "Netflix",          Money::fromCents(1599),   TransactionCategory::Entertainment },
        { "MOVIE THEATER",         "AMC",              Money::fromCents(2400),   TransactionCategory::Entertainment },
        { "SPOTIFY PREMIUM",       "Spotify",          Money::fromCents(999),    TransactionCategory::Entertainment },

        // Healthcare
        { "PHARMACY PRESCRIPTION", "CVS",              Money::fromCents(2550),   TransactionCategory::Healthcare },
        { "DOCTOR VISIT COPAY",    "Medical Center",   Money::fromCents(3000),   TransactionCategory::Healthcare },

        // Income
        { "SALARY DEPOSIT",        "Employer",         Money::fromCents(350000), TransactionCategory::Salary },
        { "FREELANCE PAYMENT",     "Client",           Money::fromCents(50000),  TransactionCategory::Freelance },
    };

    std::vector<TrainingSample> data;
    data.reserve(base.size() * 10);
    for (int i = 0; i < 10; ++i) {
        data.insert(data.end(), base.begin(), base.end());
    }
    return data;
}

const SubcategoryRuleTable& defaultSubcategoryRules() {
    static const SubcategoryRuleTable table = {
        { TransactionCategory::FoodDining, {
            { "restaurant", { "restaurant", "cafe", "bistro", "grill" } },
            { "fast_food",  { "mcdonalds", "burger", "pizza", "subway" } },
            { "grocery",    { "grocery", "supermarket", "walmart", "target" } },
            { "coffee",     { "starbucks", "coffee", "dunkin" } },
        } },
        { TransactionCategory::Shopping, {
            { "clothing",    { "clothing", "apparel", "fashion", "shoes" } },
            { "electronics", { "electronics", "apple", "best buy", "amazon" } },
            { "household",   { "home", "furniture", "kitchen", "bath" } },
        } },
        { TransactionCategory::Transportation, {
            { "gas",            { "gas", "fuel", "exxon", "shell", "bp" } },
            { "public_transit", { "metro", "bus", "train", "uber", "lyft" } },
            { "parking",        { "parking", "toll" } },
        } },
    };
    return table;
}

} // namespace ml
