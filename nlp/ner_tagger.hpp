#pragma once
#include <regex>
#include <string>
#include <vector>

#include "nlp/intent.hpp"

// ------------------------------------------------------------
// NerTagger: pluggable named-entity tagger.
// Implementations may throw; callers treat a throwing tagger the same
// as a missing one.
// ------------------------------------------------------------
class NerTagger {
public:
    virtual ~NerTagger() = default;

    // Non-overlapping spans in source order.
    virtual std::vector<ExtractedEntity> tag(const std::string& text) const = 0;
};

// ------------------------------------------------------------
// RuleNerTagger
// Regex rules (month names, weekdays, relative days, clock times,
// currency amounts). Overlapping matches resolve to the earliest,
// then longest, span.
// ------------------------------------------------------------
class RuleNerTagger : public NerTagger {
public:
    struct Rule {
        EntityLabel label = EntityLabel::Other;
        std::string pattern_str;      // raw regex string
        std::regex pattern;           // compiled regex
        bool case_insensitive = true;
    };

    // Starts with the built-in rules.
    RuleNerTagger();

    std::vector<ExtractedEntity> tag(const std::string& text) const override;

    // JSON: [ { "label": "DATE", "pattern": "...", "case_insensitive": true }, ... ]
    bool load_rules(const std::string& path, std::string* err = nullptr);
    bool load_rules_from_string(const std::string& rulesText, std::string* err = nullptr);

    size_t rule_count() const { return rules.size(); }

private:
    static bool compile(Rule& rule, std::string* err);

    std::vector<Rule> rules;
};
