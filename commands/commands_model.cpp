#include "commands_model.hpp"
#include "commands_helpers.hpp"
#include "bootstrap.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <cstdio>
#include <sstream>

namespace {

constexpr std::size_t kMaxDescriptionLength = 500;

std::vector<ml::TrainingSample> samplesFrom(const std::vector<ledger::Transaction>& txs) {
    std::vector<ml::TrainingSample> samples;
    for (const auto& t : txs) {
        if (t.type == ledger::TransactionType::Transfer) continue;
        if (t.description.empty() || !t.amount.isPositive()) continue;
        samples.push_back({ t.description, t.merchantName, t.amount, t.category });
    }
    return samples;
}

} // namespace

// ------------------------------------------------------------
// Input validation
// ------------------------------------------------------------
std::optional<CategorizeRequest> parseCategorizeArgs(const std::string& arg, CommandResult* error) {
    auto fail = [&](const std::string& code, const std::string& detail) -> std::optional<CategorizeRequest> {
        if (error) *error = ErrorManager::report(code, detail);
        return std::nullopt;
    };

    auto fields = splitFields(arg);
    if (fields.size() < 2 || fields.size() > 3) {
        return fail("ERR_CAT_USAGE", "got " + std::to_string(fields.size()) + " fields");
    }

    CategorizeRequest req;
    req.description = fields[0];
    if (req.description.empty() || req.description.size() > kMaxDescriptionLength) {
        return fail("ERR_CAT_DESCRIPTION", std::to_string(req.description.size()) + " chars");
    }

    auto amount = ledger::Money::parse(fields[1]);
    if (!amount || !amount->isPositive()) {
        return fail("ERR_CAT_AMOUNT", fields[1]);
    }
    req.amount = *amount;

    if (fields.size() == 3 && !fields[2].empty()) req.merchantName = fields[2];
    return req;
}

// ------------------------------------------------------------
// [Model] Train
// ------------------------------------------------------------
CommandResult cmdTrain(const std::string& arg) {
    auto& app = appContext();
    const std::string source = trim(arg);

    std::vector<ml::TrainingSample> samples;
    if (source == "ledger") {
        samples = samplesFrom(app.ledger.all_transactions());
    } else if (!source.empty()) {
        ledger::InMemoryLedger external;
        std::string err;
        if (!external.load_file(source, &err)) {
            return ErrorManager::report("ERR_TRAIN_DATA", err);
        }
        samples = samplesFrom(external.all_transactions());
    }

    const bool bootstrap = samples.empty();
    auto report = app.categorizer->train(std::move(samples));

    std::ostringstream msg;
    msg << "[Model] Trained on " << report.trainSize << " samples"
        << (bootstrap ? " (bootstrap data)" : "") << ", " << report.featureCount << " features.\n";
    char acc[32];
    std::snprintf(acc, sizeof(acc), "%.3f", report.accuracy);
    msg << "Hold-out: " << report.testSize << " samples, accuracy " << acc;
    if (!app.config.categorizer.modelPath.empty()) {
        msg << "\nSaved: " << (report.saved ? app.config.categorizer.modelPath : std::string("no"));
    }
    return { msg.str(), true, "ERR_NONE" };
}

// ------------------------------------------------------------
// [Model] Categorize
// ------------------------------------------------------------
CommandResult cmdCategorize(const std::string& arg) {
    CommandResult error;
    auto req = parseCategorizeArgs(arg, &error);
    if (!req) return error;

    auto result = appContext().categorizer->predict(req->description, req->amount, req->merchantName);

    nlohmann::json out = {
        { "category", ledger::toString(result.category) },
        { "subcategory", result.subcategory ? nlohmann::json(*result.subcategory) : nlohmann::json(nullptr) },
        { "confidence_score", result.confidence }
    };
    return { out.dump(2), true, "ERR_NONE" };
}

// ------------------------------------------------------------
// [Model] Info
// ------------------------------------------------------------
CommandResult cmdModelInfo([[maybe_unused]] const std::string& arg) {
    auto model = appContext().categorizer->snapshot();
    if (!model || !model->isTrained) {
        return { "[Model] No trained model loaded.", true, "ERR_NONE" };
    }

    std::ostringstream msg;
    msg << "[Model] schema v" << ml::CategoryModel::kSchemaVersion
        << ", " << model->classes.size() << " classes, "
        << model->vectorizer.feature_count() << " terms, "
        << model->forest.tree_count() << " trees\nClasses:";
    for (auto c : model->classes) msg << " " << ledger::toString(c);
    return { msg.str(), true, "ERR_NONE" };
}
