#include "ml/tfidf_vectorizer.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>
#include <set>
#include <stdexcept>
#include <unordered_map>

namespace ml {

namespace {

const std::set<std::string>& stopWords() {
    static const std::set<std::string> words = {
        "a", "about", "above", "across", "after", "afterwards", "again", "against",
        "all", "almost", "alone", "along", "already", "also", "although", "always",
        "am", "among", "amongst", "amoungst", "amount", "an", "and", "another", "any",
        "anyhow", "anyone", "anything", "anyway", "anywhere", "are", "around", "as",
        "at", "back", "be", "became", "because", "become", "becomes", "becoming",
        "been", "before", "beforehand", "behind", "being", "below", "beside",
        "besides", "between", "beyond", "bill", "both", "bottom", "but", "by", "call",
        "can", "cannot", "cant", "co", "con", "could", "couldnt", "cry", "de",
        "describe", "detail", "do", "done", "down", "due", "during", "each", "eg",
        "eight", "either", "eleven", "else", "elsewhere", "empty", "enough", "etc",
        "even", "ever", "every", "everyone", "everything", "everywhere", "except",
        "few", "fifteen", "fifty", "fill", "find", "fire", "first", "five", "for",
        "former", "formerly", "forty", "found", "four", "from", "front", "full",
        "further", "get", "give", "go", "had", "has", "hasnt", "have", "he", "hence",
        "her", "here", "hereafter", "hereby", "herein", "hereupon", "hers", "herself",
        "him", "himself", "his", "how", "however", "hundred", "i", "ie", "if", "in",
        "inc", "indeed", "interest", "into", "is", "it", "its", "itself", "keep",
        "last", "latter", "latterly", "least", "less", "ltd", "made", "many", "may",
        "me", "meanwhile", "might", "mill", "mine", "more", "moreover", "most",
        "mostly", "move", "much", "must", "my", "myself", "name", "namely", "neither",
        "never", "nevertheless", "next", "nine", "no", "nobody", "none", "noone",
        "nor", "not", "nothing", "now", "nowhere", "of", "off", "often", "on", "once",
        "one", "only", "onto", "or", "other", "others", "otherwise", "our", "ours",
        "ourselves", "out", "over", "own", "part", "per", "perhaps", "please", "put",
        "rather", "re", "same", "see", "seem", "seemed", "seeming", "seems",
        "serious", "several", "she", "should", "show", "side", "since", "sincere",
        "six", "sixty", "so", "some", "somehow", "someone", "something", "sometime",
        "sometimes", "somewhere", "still", "such", "system", "take", "ten", "than",
        "that", "the", "their", "them", "themselves", "then", "thence", "there",
        "thereafter", "thereby", "therefore", "therein", "thereupon", "these", "they",
        "thick", "thin", "third", "this", "those", "though", "three", "through",
        "throughout", "thru", "thus", "to", "together", "too", "top", "toward",
        "towards", "twelve", "twenty", "two", "un", "under", "until", "up", "upon",
        "us", "very", "via", "was", "we", "well", "were", "what", "whatever", "when",
        "whence", "whenever", "where", "whereafter", "whereas", "whereby", "wherein",
        "whereupon", "wherever", "whether", "which", "while", "whither", "who",
        "whoever", "whole", "whom", "whose", "why", "will", "with", "within",
        "without", "would", "yet", "you", "your", "yours", "yourself", "yourselves"
    };
    return words;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

// ------------------------------------------------------------
// Analysis
// ------------------------------------------------------------
bool TfidfVectorizer::isStopWord(const std::string& word) {
    return stopWords().count(word) > 0;
}

std::vector<std::string> TfidfVectorizer::analyze(const std::string& document) {
    static const std::regex tokenRe(R"(\b\w\w+\b)");

    const std::string lowered = toLower(document);
    std::vector<std::string> tokens;
    for (auto it = std::sregex_iterator(lowered.begin(), lowered.end(), tokenRe);
         it != std::sregex_iterator(); ++it) {
        std::string token = it->str();
        if (!isStopWord(token)) tokens.push_back(std::move(token));
    }

    std::vector<std::string> terms = tokens;
    for (std::size_t i = 1; i < tokens.size(); ++i) {
        terms.push_back(tokens[i - 1] + " " + tokens[i]);
    }
    return terms;
}

// ------------------------------------------------------------
// Fitting
// ------------------------------------------------------------
void TfidfVectorizer::fit(const std::vector<std::string>& documents) {
    std::map<std::string, std::size_t> corpusCount;
    std::map<std::string, std::size_t> docFreq;

    for (const auto& doc : documents) {
        std::set<std::string> seen;
        for (auto& term : analyze(doc)) {
            corpusCount[term]++;
            if (seen.insert(term).second) docFreq[term]++;
        }
    }

    std::vector<std::pair<std::string, std::size_t>> ranked(corpusCount.begin(), corpusCount.end());
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (ranked.size() > maxFeatures_) ranked.resize(maxFeatures_);

    // Columns in alphabetical order.
    std::vector<std::string> terms;
    terms.reserve(ranked.size());
    for (auto& [term, count] : ranked) terms.push_back(term);
    std::sort(terms.begin(), terms.end());

    vocabulary_.clear();
    idf_.assign(terms.size(), 0.0);
    const double n = static_cast<double>(documents.size());
    for (std::size_t col = 0; col < terms.size(); ++col) {
        vocabulary_[terms[col]] = static_cast<int>(col);
        const double df = static_cast<double>(docFreq[terms[col]]);
        idf_[col] = std::log((1.0 + n) / (1.0 + df)) + 1.0;
    }
}

std::vector<float> TfidfVectorizer::transform(const std::string& document) const {
    std::vector<double> row(vocabulary_.size(), 0.0);
    for (const auto& term : analyze(document)) {
        auto it = vocabulary_.find(term);
        if (it != vocabulary_.end()) row[static_cast<std::size_t>(it->second)] += 1.0;
    }

    double norm = 0.0;
    for (std::size_t i = 0; i < row.size(); ++i) {
        row[i] *= idf_[i];
        norm += row[i] * row[i];
    }
    norm = std::sqrt(norm);

    std::vector<float> out(row.size(), 0.0f);
    if (norm > 0.0) {
        for (std::size_t i = 0; i < row.size(); ++i) out[i] = static_cast<float>(row[i] / norm);
    }
    return out;
}

// ------------------------------------------------------------
// Serialization
// ------------------------------------------------------------
nlohmann::json TfidfVectorizer::to_json() const {
    return {
        { "max_features", maxFeatures_ },
        { "vocabulary", vocabulary_ },
        { "idf", idf_ }
    };
}

TfidfVectorizer TfidfVectorizer::from_json(const nlohmann::json& j) {
    if (!j.is_object()) throw std::runtime_error("vectorizer: expected object");

    TfidfVectorizer v(j.at("max_features").get<std::size_t>());
    v.vocabulary_ = j.at("vocabulary").get<std::map<std::string, int>>();
    v.idf_ = j.at("idf").get<std::vector<double>>();

    if (v.idf_.size() != v.vocabulary_.size()) {
        throw std::runtime_error("vectorizer: idf and vocabulary sizes differ");
    }
    std::vector<bool> used(v.idf_.size(), false);
    for (const auto& [term, col] : v.vocabulary_) {
        if (col < 0 || static_cast<std::size_t>(col) >= used.size() || used[static_cast<std::size_t>(col)]) {
            throw std::runtime_error("vectorizer: bad column for term '" + term + "'");
        }
        used[static_cast<std::size_t>(col)] = true;
    }
    return v;
}

} // namespace ml
