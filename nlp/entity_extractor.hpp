#pragma once
#include <memory>
#include <string>
#include <vector>

#include "ledger/money.hpp"
#include "nlp/intent.hpp"
#include "nlp/ner_tagger.hpp"

// Entities pulled from one message.
struct StructuredEntities {
    std::vector<ledger::Money> amounts;     // source order
    std::vector<std::string> dates;         // DATE / TIME span texts
    std::vector<std::string> categories;    // vocabulary order, unique
};

// What a stage sees: the raw message and the tagger spans computed once for it.
struct ExtractionInput {
    const std::string& message;
    const std::vector<ExtractedEntity>& spans;
};

// ------------------------------------------------------------
// ExtractionStage: one independent step of the pipeline.
// A stage that throws loses only its own contribution.
// ------------------------------------------------------------
class ExtractionStage {
public:
    virtual ~ExtractionStage() = default;
    virtual std::string name() const = 0;
    virtual void apply(const ExtractionInput& input, StructuredEntities& out) const = 0;
};

// $12, 1,250.00, 45.99
class AmountStage : public ExtractionStage {
public:
    std::string name() const override { return "amounts"; }
    void apply(const ExtractionInput& input, StructuredEntities& out) const override;
};

// DATE/TIME texts picked out of the tagger spans.
class DateStage : public ExtractionStage {
public:
    std::string name() const override { return "dates"; }
    void apply(const ExtractionInput& input, StructuredEntities& out) const override;
};

// Case-insensitive substring match against a fixed vocabulary.
class CategoryKeywordStage : public ExtractionStage {
public:
    explicit CategoryKeywordStage(std::vector<std::string> vocabulary);
    std::string name() const override { return "categories"; }
    void apply(const ExtractionInput& input, StructuredEntities& out) const override;

private:
    std::vector<std::string> vocabulary_;
};

// ------------------------------------------------------------
// EntityExtractor
// Runs the stages in order. Never throws: stage and tagger failures
// are logged and leave the corresponding fields empty.
// ------------------------------------------------------------
class EntityExtractor {
public:
    explicit EntityExtractor(std::shared_ptr<const NerTagger> tagger = nullptr);

    // Tags the message, then runs the stages over it.
    StructuredEntities extract(const std::string& message) const;

    // Runs the stages against spans the caller already has from tag().
    StructuredEntities extract(const std::string& message,
                               const std::vector<ExtractedEntity>& spans) const;

    // All tagger spans (any label), for the chat response. No tagger: empty.
    std::vector<ExtractedEntity> tag(const std::string& message) const;

    void add_stage(std::unique_ptr<ExtractionStage> stage);
    size_t stage_count() const { return stages_.size(); }

    static const std::vector<std::string>& defaultCategoryVocabulary();

private:
    std::shared_ptr<const NerTagger> tagger_;
    std::vector<std::unique_ptr<ExtractionStage>> stages_;
};
