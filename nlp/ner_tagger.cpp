#include "nlp/ner_tagger.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

// ------------------------------------------------------------
// Built-in rules
// ------------------------------------------------------------
namespace {

const char* kMonth =
    "(?:jan(?:uary)?|feb(?:ruary)?|mar(?:ch)?|apr(?:il)?|may|june?|july?|aug(?:ust)?"
    "|sep(?:t(?:ember)?)?|oct(?:ober)?|nov(?:ember)?|dec(?:ember)?)";

const char* kWeekday =
    "(?:monday|tuesday|wednesday|thursday|friday|saturday|sunday)";

std::vector<std::pair<EntityLabel, std::string>> builtinRules() {
    const std::string month = kMonth;
    const std::string weekday = kWeekday;
    return {
        { EntityLabel::Date,  R"(\b\d{4}-\d{2}-\d{2}\b)" },
        { EntityLabel::Date,  R"(\b\d{1,2}/\d{1,2}(?:/\d{2,4})?\b)" },
        { EntityLabel::Date,  R"(\b)" + month + R"((?:\s+\d{1,2}(?:st|nd|rd|th)?)?(?:,?\s+\d{4})?\b)" },
        { EntityLabel::Date,  R"(\b(?:last|this|next|past|previous)\s+(?:\d+\s+)?(?:days?|weeks?|weekends?|months?|quarters?|years?|)" + weekday + R"()\b)" },
        { EntityLabel::Date,  R"(\b\d+\s+(?:days?|weeks?|months?|years?)(?:\s+ago)?\b)" },
        { EntityLabel::Date,  R"(\b(?:today|yesterday|tomorrow)\b)" },
        { EntityLabel::Date,  R"(\b)" + weekday + R"(\b)" },
        { EntityLabel::Time,  R"(\b\d{1,2}(?::\d{2})?\s?(?:am|pm)\b)" },
        { EntityLabel::Time,  R"(\b\d{1,2}:\d{2}\b)" },
        { EntityLabel::Time,  R"(\b(?:tonight|noon|midnight|this morning|this afternoon|this evening)\b)" },
        { EntityLabel::Money, R"(\$\s?\d+(?:,\d{3})*(?:\.\d{2})?)" },
        { EntityLabel::Money, R"(\b\d+(?:,\d{3})*(?:\.\d{2})?\s+(?:dollars|bucks|usd)\b)" },
    };
}

} // namespace

// ------------------------------------------------------------
// Construction
// ------------------------------------------------------------
RuleNerTagger::RuleNerTagger() {
    for (auto& [label, pattern] : builtinRules()) {
        Rule rule;
        rule.label = label;
        rule.pattern_str = pattern;
        std::string err;
        if (compile(rule, &err)) {
            rules.push_back(std::move(rule));
        } else {
            LOG_ERROR("NER", "Invalid built-in rule " + pattern + ": " + err);
        }
    }
}

bool RuleNerTagger::compile(Rule& rule, std::string* err) {
    try {
        std::regex::flag_type flags = std::regex::ECMAScript;
        if (rule.case_insensitive) {
            flags |= std::regex::icase;
        }
        rule.pattern = std::regex(rule.pattern_str, flags);
        return true;
    } catch (const std::regex_error& e) {
        if (err) *err = e.what();
        return false;
    }
}

// ------------------------------------------------------------
// Tagging
// ------------------------------------------------------------
std::vector<ExtractedEntity> RuleNerTagger::tag(const std::string& text) const {
    std::vector<ExtractedEntity> candidates;
    for (const auto& rule : rules) {
        for (auto it = std::sregex_iterator(text.begin(), text.end(), rule.pattern);
             it != std::sregex_iterator(); ++it) {
            const auto& m = *it;
            if (m.length(0) == 0) continue;
            ExtractedEntity e;
            e.text  = m.str(0);
            e.label = rule.label;
            e.start = static_cast<std::size_t>(m.position(0));
            e.end   = e.start + static_cast<std::size_t>(m.length(0));
            candidates.push_back(std::move(e));
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const ExtractedEntity& a, const ExtractedEntity& b) {
                         if (a.start != b.start) return a.start < b.start;
                         return (a.end - a.start) > (b.end - b.start);
                     });

    std::vector<ExtractedEntity> spans;
    std::size_t lastEnd = 0;
    for (auto& c : candidates) {
        if (!spans.empty() && c.start < lastEnd) continue;
        lastEnd = c.end;
        spans.push_back(std::move(c));
    }
    return spans;
}

// ------------------------------------------------------------
// Loading
// ------------------------------------------------------------
bool RuleNerTagger::load_rules(const std::string& path, std::string* err) {
    std::ifstream f(path);
    if (!f) {
        if (err) *err = "Could not open file: " + path;
        return false;
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return load_rules_from_string(buffer.str(), err);
}

bool RuleNerTagger::load_rules_from_string(const std::string& rulesText, std::string* err) {
    try {
        nlohmann::json j = nlohmann::json::parse(rulesText);
        if (!j.is_array()) {
            if (err) *err = "Invalid NER rules JSON (expected array)";
            return false;
        }

        std::vector<Rule> loaded;
        for (const auto& r : j) {
            Rule rule;
            rule.label = entityLabelFromString(r.value("label", "OTHER"));
            rule.pattern_str = r.value("pattern", "");
            rule.case_insensitive = r.value("case_insensitive", true);

            std::string regexErr;
            if (rule.pattern_str.empty() || !compile(rule, &regexErr)) {
                LOG_ERROR("NER", "Invalid regex for label " + toString(rule.label) + ": " + regexErr);
                continue;
            }
            loaded.push_back(std::move(rule));
        }

        rules = std::move(loaded);
        LOG_DEBUG("NER", "Loaded " + std::to_string(rules.size()) + " tagger rules");
        return true;
    } catch (const std::exception& e) {
        if (err) *err = e.what();
        return false;
    }
}
