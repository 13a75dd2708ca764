#include "chat/chat_types.hpp"

nlohmann::json toJson(const ExtractedEntity& entity) {
    return {
        { "text", entity.text },
        { "label", toString(entity.label) },
        { "start", entity.start },
        { "end", entity.end }
    };
}

nlohmann::json toJson(const ChartPayload& chart) {
    return {
        { "type", chart.type },
        { "title", chart.title },
        { "data", { { "labels", chart.labels }, { "values", chart.values } } }
    };
}

nlohmann::json toJson(const ChatAction& action) {
    nlohmann::json j = action.fields.is_object() ? action.fields : nlohmann::json::object();
    j["type"] = action.type;
    return j;
}

nlohmann::json toJson(const ChatResponse& response) {
    nlohmann::json entities = nlohmann::json::array();
    for (const auto& e : response.entities) entities.push_back(toJson(e));

    nlohmann::json j = {
        { "response", response.response },
        { "intent", response.intent },
        { "confidence", response.confidence },
        { "entities", entities },
        { "conversation_id", response.conversationId }
    };

    if (response.chart) j["chart_data"] = toJson(*response.chart);
    if (!response.actions.empty()) {
        nlohmann::json actions = nlohmann::json::array();
        for (const auto& a : response.actions) actions.push_back(toJson(a));
        j["actions"] = actions;
    }
    return j;
}
