#include <gtest/gtest.h>

#include "nlp/entity_extractor.hpp"
#include "nlp/ner_tagger.hpp"

#include <memory>
#include <stdexcept>

using ledger::Money;

namespace {

class ThrowingTagger : public NerTagger {
public:
    std::vector<ExtractedEntity> tag(const std::string&) const override {
        throw std::runtime_error("model unavailable");
    }
};

class ThrowingStage : public ExtractionStage {
public:
    std::string name() const override { return "broken"; }
    void apply(const ExtractionInput&, StructuredEntities& out) const override {
        out.categories.push_back("never");
        throw std::runtime_error("stage failure");
    }
};

std::vector<std::string> labelsOf(const std::vector<ExtractedEntity>& spans) {
    std::vector<std::string> out;
    for (const auto& s : spans) out.push_back(toString(s.label));
    return out;
}

} // namespace

// ------------------------------------------------------------
// RuleNerTagger
// ------------------------------------------------------------
TEST(RuleNerTaggerTest, TagsMoneyDatesAndTimesWithOffsets) {
    RuleNerTagger tagger;
    auto spans = tagger.tag("I paid $30 yesterday at 5pm");

    ASSERT_EQ(spans.size(), 3u);
    EXPECT_EQ(labelsOf(spans), (std::vector<std::string>{ "MONEY", "DATE", "TIME" }));

    EXPECT_EQ(spans[0].text, "$30");
    EXPECT_EQ(spans[0].start, 7u);
    EXPECT_EQ(spans[0].end, 10u);
    EXPECT_EQ(spans[1].text, "yesterday");
    EXPECT_EQ(spans[2].text, "5pm");
    EXPECT_EQ(spans[2].end, 27u);
}

TEST(RuleNerTaggerTest, LongestSpanWinsAtSameStart) {
    RuleNerTagger tagger;
    auto spans = tagger.tag("Due March 5, 2024 and 2024-04-01");
    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[0].text, "March 5, 2024");
    EXPECT_EQ(spans[1].text, "2024-04-01");
    EXPECT_EQ(spans[1].label, EntityLabel::Date);
}

TEST(RuleNerTaggerTest, RelativeDates) {
    RuleNerTagger tagger;
    auto spans = tagger.tag("spending over the last 3 months versus next week");
    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[0].text, "last 3 months");
    EXPECT_EQ(spans[1].text, "next week");
}

TEST(RuleNerTaggerTest, CustomRulesReplaceBuiltInsAndSkipBadRegex) {
    RuleNerTagger tagger;
    std::string err;
    ASSERT_TRUE(tagger.load_rules_from_string(R"([
        { "label": "DATE", "pattern": "(" },
        { "label": "MONEY", "pattern": "\\b\\d+ euros?\\b" }
    ])", &err)) << err;
    EXPECT_EQ(tagger.rule_count(), 1u);

    auto spans = tagger.tag("lunch was 12 euros yesterday");
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].text, "12 euros");
    EXPECT_EQ(spans[0].label, EntityLabel::Money);

    EXPECT_FALSE(tagger.load_rules_from_string(R"({ "label": "DATE" })", &err));
    EXPECT_EQ(tagger.rule_count(), 1u);
}

// ------------------------------------------------------------
// EntityExtractor
// ------------------------------------------------------------
TEST(EntityExtractorTest, AmountsInSourceOrder) {
    EntityExtractor extractor(std::make_shared<RuleNerTagger>());
    auto e = extractor.extract("Find transactions of $45.99 or $12 last week");

    ASSERT_EQ(e.amounts.size(), 2u);
    EXPECT_EQ(e.amounts[0], Money::fromCents(4599));
    EXPECT_EQ(e.amounts[1], Money::fromCents(1200));
    EXPECT_EQ(e.dates, (std::vector<std::string>{ "last week" }));
}

TEST(EntityExtractorTest, OverlongDigitRunIsSkipped) {
    EntityExtractor extractor(nullptr);
    auto e = extractor.extract("find transaction for account 123456789012345678901234567890");
    EXPECT_TRUE(e.amounts.empty());

    auto mixed = extractor.extract("paid $99999999999999999 then $12.50");
    ASSERT_EQ(mixed.amounts.size(), 1u);
    EXPECT_EQ(mixed.amounts[0], Money::fromCents(1250));
}

TEST(EntityExtractorTest, AmountsWithThousandsSeparator) {
    EntityExtractor extractor;
    auto e = extractor.extract("rent is 1,250.00 a month");
    ASSERT_EQ(e.amounts.size(), 1u);
    EXPECT_EQ(e.amounts[0], Money::fromCents(125000));
}

TEST(EntityExtractorTest, CategoriesFollowVocabularyOrderWithoutDuplicates) {
    EntityExtractor extractor;
    auto e = extractor.extract("I spent too much on GAS and food, mostly food");
    EXPECT_EQ(e.categories, (std::vector<std::string>{ "food", "gas" }));

    auto none = extractor.extract("nothing relevant");
    EXPECT_TRUE(none.categories.empty());
    EXPECT_TRUE(none.amounts.empty());
}

TEST(EntityExtractorTest, NoTaggerMeansNoDates) {
    EntityExtractor extractor;
    auto e = extractor.extract("what did I spend yesterday on $20 of gas");
    EXPECT_TRUE(e.dates.empty());
    EXPECT_EQ(e.amounts.size(), 1u);
    EXPECT_TRUE(extractor.tag("yesterday").empty());
}

TEST(EntityExtractorTest, PrecomputedSpansFeedDates) {
    EntityExtractor extractor;
    std::vector<ExtractedEntity> spans = {
        { "$20", EntityLabel::Money, 0, 3 },
        { "tomorrow", EntityLabel::Date, 4, 12 },
        { "9am", EntityLabel::Time, 13, 16 },
    };
    auto e = extractor.extract("$20 tomorrow 9am", spans);
    EXPECT_EQ(e.dates, (std::vector<std::string>{ "tomorrow", "9am" }));
    ASSERT_EQ(e.amounts.size(), 1u);
    EXPECT_EQ(e.amounts[0], Money::fromCents(2000));
}

TEST(EntityExtractorTest, ThrowingTaggerOnlyLosesDates) {
    EntityExtractor extractor(std::make_shared<ThrowingTagger>());
    auto e = extractor.extract("dinner $45 yesterday at a restaurant");

    EXPECT_TRUE(e.dates.empty());
    ASSERT_EQ(e.amounts.size(), 1u);
    EXPECT_EQ(e.categories, (std::vector<std::string>{ "restaurant" }));
    EXPECT_TRUE(extractor.tag("yesterday").empty());
}

TEST(EntityExtractorTest, ThrowingStageIsIsolated) {
    EntityExtractor extractor(std::make_shared<RuleNerTagger>());
    extractor.add_stage(std::make_unique<ThrowingStage>());
    EXPECT_EQ(extractor.stage_count(), 4u);

    auto e = extractor.extract("$10 for shopping today");
    EXPECT_EQ(e.amounts.size(), 1u);
    EXPECT_EQ(e.dates, (std::vector<std::string>{ "today" }));
    EXPECT_EQ(e.categories, (std::vector<std::string>{ "shopping" }));
}

TEST(EntityExtractorTest, CustomKeywordStage) {
    EntityExtractor extractor;
    extractor.add_stage(std::make_unique<CategoryKeywordStage>(std::vector<std::string>{ "Coffee", "food", "" }));
    auto e = extractor.extract("coffee and food");
    // "food" from the default vocabulary first, then the custom stage adds "coffee".
    EXPECT_EQ(e.categories, (std::vector<std::string>{ "food", "coffee" }));
}
