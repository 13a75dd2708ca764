#include <gtest/gtest.h>

#include "ledger/ledger_types.hpp"
#include "ledger/money.hpp"
#include "ledger/transaction_category.hpp"

using ledger::Money;

TEST(MoneyTest, ParsesCommonForms) {
    EXPECT_EQ(Money::parse("1234")->cents(), 123400);
    EXPECT_EQ(Money::parse("1,234.5")->cents(), 123450);
    EXPECT_EQ(Money::parse("$1,234.56")->cents(), 123456);
    EXPECT_EQ(Money::parse("-12.30")->cents(), -1230);
    EXPECT_EQ(Money::parse(" 45.99 ")->cents(), 4599);
}

TEST(MoneyTest, RejectsMalformedText) {
    EXPECT_FALSE(Money::parse("").has_value());
    EXPECT_FALSE(Money::parse("abc").has_value());
    EXPECT_FALSE(Money::parse("12.345").has_value());
    EXPECT_FALSE(Money::parse("12 dollars").has_value());
}

TEST(MoneyTest, RejectsAmountsBeyondCentRange) {
    EXPECT_FALSE(Money::parse("99999999999999999").has_value());
    EXPECT_FALSE(Money::parse("123456789012345678901234567890").has_value());
    EXPECT_FALSE(Money::parse("-$9,999,999,999,999,999,999.99").has_value());

    // Largest whole amount that still fits in cents.
    auto max = Money::parse("92233720368547757.99");
    ASSERT_TRUE(max.has_value());
    EXPECT_EQ(max->cents(), 9223372036854775799LL);
    EXPECT_FALSE(Money::parse("92233720368547758").has_value());
}

TEST(MoneyTest, FormatsWithGroupingAndSign) {
    EXPECT_EQ(Money::fromCents(123456789).format(), "$1,234,567.89");
    EXPECT_EQ(Money::fromCents(5).format(), "$0.05");
    EXPECT_EQ(Money::fromCents(-500).format(), "$-5.00");
    EXPECT_EQ(Money::fromCents(4599).toString(), "45.99");
}

TEST(MoneyTest, ArithmeticStaysExact) {
    Money total;
    for (int i = 0; i < 10; ++i) total += Money::fromCents(10);   // 0.10 ten times
    EXPECT_EQ(total, Money::fromCents(100));

    EXPECT_EQ(Money::fromCents(100000).scaled(0.3), Money::fromCents(30000));
    EXPECT_EQ(Money::fromCents(1).scaled(0.5), Money::fromCents(1));   // half away from zero
    EXPECT_EQ(Money::fromDouble(19.999), Money::fromCents(2000));
}

TEST(DateTest, ParsesAndFormatsIsoDates) {
    auto d = ledger::parseDate("2024-03-15T10:30:00Z");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(ledger::toString(*d), "2024-03-15");
    EXPECT_EQ(ledger::monthKey(*d), "2024-03");

    EXPECT_FALSE(ledger::parseDate("2024-02-30").has_value());
    EXPECT_FALSE(ledger::parseDate("15/03/2024").has_value());
}

TEST(DateTest, CalendarArithmetic) {
    ledger::Date d{ 2024, 3, 1 };
    EXPECT_EQ(ledger::addDays(d, -1), (ledger::Date{ 2024, 2, 29 }));
    EXPECT_EQ(ledger::monthsBefore(d, 3), (ledger::Date{ 2023, 12, 1 }));
    EXPECT_EQ(ledger::fromDays(ledger::toDays(d)), d);
}

TEST(CategoryTest, WireNamesRoundTrip) {
    for (auto c : ledger::allCategories()) {
        auto back = ledger::categoryFromString(ledger::toString(c));
        ASSERT_TRUE(back.has_value());
        EXPECT_EQ(*back, c);
    }
    EXPECT_EQ(ledger::allCategories().size(), 17u);
    EXPECT_EQ(ledger::toString(ledger::TransactionCategory::FoodDining), "food_dining");
    EXPECT_EQ(ledger::displayName(ledger::TransactionCategory::BillsUtilities), "Bills Utilities");
    EXPECT_FALSE(ledger::categoryFromString("groceries").has_value());
}
