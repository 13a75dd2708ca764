#include "ml/category_model.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace ml {

FeatureRow CategoryModel::features(const std::string& preprocessedText, double amount) const {
    FeatureRow row = vectorizer.transform(preprocessedText);
    row.push_back(static_cast<float>(amount));
    return row;
}

nlohmann::json CategoryModel::to_json() const {
    nlohmann::json names = nlohmann::json::array();
    for (auto c : classes) names.push_back(ledger::toString(c));

    return {
        { "schema_version", kSchemaVersion },
        { "is_trained", isTrained },
        { "classes", names },
        { "vectorizer", vectorizer.to_json() },
        { "forest", forest.to_json() }
    };
}

CategoryModel CategoryModel::from_json(const nlohmann::json& j) {
    if (!j.is_object()) throw std::runtime_error("model: expected object");

    const int version = j.at("schema_version").get<int>();
    if (version != kSchemaVersion) {
        throw std::runtime_error("model: schema_version " + std::to_string(version) +
                                 " (expected " + std::to_string(kSchemaVersion) + ")");
    }

    CategoryModel model;
    model.isTrained = j.at("is_trained").get<bool>();

    for (const auto& name : j.at("classes").get<std::vector<std::string>>()) {
        auto category = ledger::categoryFromString(name);
        if (!category) throw std::runtime_error("model: unknown class '" + name + "'");
        model.classes.push_back(*category);
    }
    if (model.classes.empty()) throw std::runtime_error("model: no classes");

    model.vectorizer = TfidfVectorizer::from_json(j.at("vectorizer"));
    model.forest = RandomForest::from_json(j.at("forest"),
                                           static_cast<int>(model.classes.size()),
                                           model.vectorizer.feature_count() + 1);
    return model;
}

bool CategoryModel::save(const std::string& path, std::string* err) const {
    try {
        fs::path p(path);
        if (p.has_parent_path()) fs::create_directories(p.parent_path());

        std::ofstream out(path);
        if (!out) {
            if (err) *err = "Could not write " + path;
            return false;
        }
        out << to_json().dump();
        return static_cast<bool>(out);
    } catch (const std::exception& e) {
        if (err) *err = e.what();
        return false;
    }
}

std::optional<CategoryModel> CategoryModel::load(const std::string& path, std::string* err) {
    std::ifstream in(path);
    if (!in) {
        if (err) *err = "Model file not found: " + path;
        return std::nullopt;
    }
    try {
        nlohmann::json j;
        in >> j;
        return from_json(j);
    } catch (const std::exception& e) {
        if (err) *err = e.what();
        return std::nullopt;
    }
}

} // namespace ml
