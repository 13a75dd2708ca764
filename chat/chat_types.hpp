#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "nlp/intent.hpp"

// Chart shown beside a reply ("pie", "doughnut", "line", ...).
struct ChartPayload {
    std::string type;
    std::string title;
    std::vector<std::string> labels;
    std::vector<double> values;
};

// Client action, e.g. { "type": "export", "format": "pdf" }.
struct ChatAction {
    std::string type;
    nlohmann::json fields = nlohmann::json::object();
};

// What a response builder produces.
struct BuilderReply {
    std::string text;
    std::optional<ChartPayload> chart;
    std::vector<ChatAction> actions;
};

// Full reply for one message.
struct ChatResponse {
    std::string response;
    std::string intent = "unknown";
    double confidence = 0.0;
    std::vector<ExtractedEntity> entities;
    std::string conversationId;
    std::optional<ChartPayload> chart;
    std::vector<ChatAction> actions;
};

// { response, intent, confidence, entities, conversation_id, chart_data?, actions? }
nlohmann::json toJson(const ChatResponse& response);
nlohmann::json toJson(const ChartPayload& chart);
nlohmann::json toJson(const ChatAction& action);
nlohmann::json toJson(const ExtractedEntity& entity);
