#include <gtest/gtest.h>

#include "nlp/intent_matcher.hpp"

#include <string>

#ifndef FINCHAT_TEST_RESOURCES
#define FINCHAT_TEST_RESOURCES "resources"
#endif

TEST(IntentMatcherTest, BuiltInTableHasTwelveIntents) {
    IntentMatcher matcher;
    EXPECT_EQ(matcher.intent_count(), 12u);
    EXPECT_EQ(matcher.intents().front().name, "greeting");
    EXPECT_EQ(matcher.intents().back().name, "goodbye");
}

TEST(IntentMatcherTest, SubstringPatternGivesBoostedScore) {
    IntentMatcher matcher;
    auto result = matcher.classify("What's my balance?");
    EXPECT_EQ(result.intent, "balance_inquiry");
    EXPECT_DOUBLE_EQ(result.confidence, IntentMatcher::kSubstringBoost);
}

TEST(IntentMatcherTest, MatchingIsCaseInsensitive) {
    IntentMatcher matcher;
    EXPECT_EQ(matcher.classify("SHOW BALANCE please").intent, "balance_inquiry");
    EXPECT_EQ(matcher.classify("Export Data now").intent, "export_data");
}

TEST(IntentMatcherTest, NoOverlapIsUnknown) {
    IntentMatcher matcher;
    auto result = matcher.classify("asdfgh qwerty");
    EXPECT_EQ(result.intent, "unknown");
    EXPECT_DOUBLE_EQ(result.confidence, 0.0);

    EXPECT_EQ(matcher.classify("").intent, "unknown");
}

TEST(IntentMatcherTest, TiesGoToTheEarlierIntent) {
    // "savings goal" is a pattern of both savings_advice and financial_goals.
    IntentMatcher matcher;
    EXPECT_EQ(matcher.classify("savings goal").intent, "savings_advice");

    // budget_help comes before help.
    EXPECT_EQ(matcher.classify("budget help").intent, "budget_help");
}

TEST(IntentMatcherTest, EveryBuiltInPatternSelectsItsIntent) {
    IntentMatcher matcher;
    size_t checked = 0;
    for (const auto& def : IntentMatcher::defaultIntents()) {
        for (const auto& pattern : def.patterns) {
            auto result = matcher.classify(pattern);
            EXPECT_DOUBLE_EQ(result.confidence, 1.0) << pattern;
            checked++;

            // Listed under two intents; the earlier one keeps it.
            if (def.name == "financial_goals" && pattern == "savings goal") {
                EXPECT_EQ(result.intent, "savings_advice");
                continue;
            }
            EXPECT_EQ(result.intent, def.name) << pattern;
        }
    }
    EXPECT_GT(checked, 90u);
}

TEST(IntentMatcherTest, JaccardOverlapWithoutSubstring) {
    IntentMatcher matcher({ { "rent", { "pay rent now" }, { "ok" } } });

    auto partial = matcher.classify("pay rent later");
    EXPECT_EQ(partial.intent, "rent");
    EXPECT_DOUBLE_EQ(partial.confidence, 0.5);

    // 1 shared word of 6 is below the threshold.
    auto weak = matcher.classify("pay something else entirely");
    EXPECT_EQ(weak.intent, "unknown");
    EXPECT_DOUBLE_EQ(weak.confidence, 0.0);

    // Same words in another order.
    EXPECT_DOUBLE_EQ(matcher.classify("now rent pay").confidence, 1.0);
}

TEST(IntentMatcherTest, PunctuationStaysPartOfTheWord) {
    IntentMatcher matcher(std::vector<IntentDefinition>{ { "check", { "check balance" }, {} } });
    EXPECT_DOUBLE_EQ(matcher.classify("balance check").confidence, 1.0);
    EXPECT_NEAR(matcher.classify("balance? check").confidence, 1.0 / 3.0, 1e-9);
}

TEST(IntentMatcherTest, ScoreIsBestOverPatterns) {
    IntentDefinition def{ "x", { "alpha beta", "gamma" }, {} };
    EXPECT_DOUBLE_EQ(IntentMatcher::score("gamma ray", def), IntentMatcher::kSubstringBoost);
    EXPECT_NEAR(IntentMatcher::score("alpha delta", def), 1.0 / 3.0, 1e-9);
    EXPECT_DOUBLE_EQ(IntentMatcher::score("nothing here", def), 0.0);
}

TEST(IntentMatcherTest, LoadsTableFromJsonAndLowercasesPatterns) {
    IntentMatcher matcher;
    std::string err;
    ASSERT_TRUE(matcher.load_intents_from_string(R"([
        { "intent": "rent_due", "patterns": ["When Is Rent Due"], "responses": ["Rent is due on the 1st."] },
        { "intent": "broken" }
    ])", &err)) << err;

    EXPECT_EQ(matcher.intent_count(), 1u);
    EXPECT_EQ(matcher.classify("when is rent due?").intent, "rent_due");
    ASSERT_EQ(matcher.response_templates("rent_due").size(), 1u);
    EXPECT_TRUE(matcher.response_templates("missing").empty());
}

TEST(IntentMatcherTest, FailedLoadKeepsCurrentTable) {
    IntentMatcher matcher;
    std::string err;
    EXPECT_FALSE(matcher.load_intents_from_string("{ not json", &err));
    EXPECT_FALSE(err.empty());
    EXPECT_FALSE(matcher.load_intents_from_string(R"({ "intent": "x" })", &err));
    EXPECT_FALSE(matcher.load_intents_from_string("[]", &err));
    EXPECT_FALSE(matcher.load_intents("/nonexistent/intents.json", &err));
    EXPECT_EQ(matcher.intent_count(), 12u);
}

TEST(IntentMatcherTest, ShippedIntentsFileMatchesBuiltIns) {
    IntentMatcher fromFile;
    std::string err;
    ASSERT_TRUE(fromFile.load_intents(std::string(FINCHAT_TEST_RESOURCES) + "/intents.json", &err)) << err;

    IntentMatcher builtIn;
    ASSERT_EQ(fromFile.intent_count(), builtIn.intent_count());
    for (size_t i = 0; i < builtIn.intent_count(); ++i) {
        EXPECT_EQ(fromFile.intents()[i].name, builtIn.intents()[i].name);
        EXPECT_EQ(fromFile.intents()[i].patterns, builtIn.intents()[i].patterns);
    }
}
