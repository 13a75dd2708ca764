#include "nlp/entity_extractor.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

// ------------------------------------------------------------
// Stages
// ------------------------------------------------------------
void AmountStage::apply(const ExtractionInput& input, StructuredEntities& out) const {
    const std::string& message = input.message;
    static const std::regex amountRe(R"(\$?(\d+(?:,\d{3})*(?:\.\d{2})?))");

    for (auto it = std::sregex_iterator(message.begin(), message.end(), amountRe);
         it != std::sregex_iterator(); ++it) {
        auto amount = ledger::Money::parse((*it)[1].str());
        if (amount) {
            out.amounts.push_back(*amount);
        } else {
            LOG_TRACE("Extract", "Unparsable amount: " + (*it)[1].str());
        }
    }
}

void DateStage::apply(const ExtractionInput& input, StructuredEntities& out) const {
    for (const auto& span : input.spans) {
        if (span.label == EntityLabel::Date || span.label == EntityLabel::Time) {
            out.dates.push_back(span.text);
        }
    }
}

CategoryKeywordStage::CategoryKeywordStage(std::vector<std::string> vocabulary) {
    for (auto& word : vocabulary) {
        std::string lowered = toLower(std::move(word));
        if (lowered.empty()) continue;
        if (std::find(vocabulary_.begin(), vocabulary_.end(), lowered) == vocabulary_.end()) {
            vocabulary_.push_back(std::move(lowered));
        }
    }
}

void CategoryKeywordStage::apply(const ExtractionInput& input, StructuredEntities& out) const {
    const std::string lowered = toLower(input.message);
    for (const auto& word : vocabulary_) {
        if (lowered.find(word) == std::string::npos) continue;
        if (std::find(out.categories.begin(), out.categories.end(), word) == out.categories.end()) {
            out.categories.push_back(word);
        }
    }
}

// ------------------------------------------------------------
// EntityExtractor
// ------------------------------------------------------------
EntityExtractor::EntityExtractor(std::shared_ptr<const NerTagger> tagger)
    : tagger_(std::move(tagger)) {
    if (!tagger_) {
        LOG_DEBUG("Extract", "No NER tagger configured; date extraction disabled");
    }
    stages_.push_back(std::make_unique<AmountStage>());
    stages_.push_back(std::make_unique<DateStage>());
    stages_.push_back(std::make_unique<CategoryKeywordStage>(defaultCategoryVocabulary()));
}

void EntityExtractor::add_stage(std::unique_ptr<ExtractionStage> stage) {
    if (stage) stages_.push_back(std::move(stage));
}

StructuredEntities EntityExtractor::extract(const std::string& message) const {
    return extract(message, tag(message));
}

StructuredEntities EntityExtractor::extract(const std::string& message,
                                            const std::vector<ExtractedEntity>& spans) const {
    const ExtractionInput input{ message, spans };
    StructuredEntities result;
    for (const auto& stage : stages_) {
        StructuredEntities partial;
        try {
            stage->apply(input, partial);
        } catch (const std::exception& e) {
            LOG_ERROR("Extract", "Stage '" + stage->name() + "' failed: " + e.what());
            continue;
        }
        result.amounts.insert(result.amounts.end(), partial.amounts.begin(), partial.amounts.end());
        result.dates.insert(result.dates.end(), partial.dates.begin(), partial.dates.end());
        for (auto& c : partial.categories) {
            if (std::find(result.categories.begin(), result.categories.end(), c) == result.categories.end()) {
                result.categories.push_back(std::move(c));
            }
        }
    }
    return result;
}

std::vector<ExtractedEntity> EntityExtractor::tag(const std::string& message) const {
    if (!tagger_) return {};
    try {
        return tagger_->tag(message);
    } catch (const std::exception& e) {
        LOG_ERROR("Extract", std::string("NER tagger failed: ") + e.what());
        return {};
    }
}

const std::vector<std::string>& EntityExtractor::defaultCategoryVocabulary() {
    static const std::vector<std::string> vocabulary = {
        "food", "dining", "restaurant", "grocery", "shopping", "gas",
        "transportation", "entertainment", "bills", "utilities", "healthcare",
        "insurance", "rent", "mortgage", "salary", "income", "investment", "savings"
    };
    return vocabulary;
}
