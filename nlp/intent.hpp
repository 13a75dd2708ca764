#pragma once
#include <cstddef>
#include <string>
#include <vector>

// 🔹 Label of a tagged span. Money and Other are the non-date labels a
//    tagger may produce; only Date/Time feed StructuredEntities::dates.
enum class EntityLabel {
    Date,
    Time,
    Money,
    Other
};

std::string toString(EntityLabel label);   // "DATE", "TIME", "MONEY", "OTHER"
EntityLabel entityLabelFromString(const std::string& name);

// A tagged span of the original message (byte offsets, end exclusive).
struct ExtractedEntity {
    std::string text;
    EntityLabel label = EntityLabel::Other;
    std::size_t start = 0;
    std::size_t end = 0;
};

// One row of the intent table.
struct IntentDefinition {
    std::string name;                     // e.g. "balance_inquiry"
    std::vector<std::string> patterns;    // lowercased on load
    std::vector<std::string> responses;   // reply templates
};

// Result of classifying one message.
struct ClassificationResult {
    std::string intent = "unknown";
    double confidence = 0.0;                   // in [0, 1]
    std::vector<ExtractedEntity> entities;     // tagger spans, source order; attached by the orchestrator
};
