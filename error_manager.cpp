#include "error_manager.hpp"
#include "logger.hpp"

#include <mutex>

// ------------------------------------------------------------
// Storage
// ------------------------------------------------------------
static nlohmann::json g_errorRoot = nlohmann::json::object();
static std::mutex g_errorMutex;

// ------------------------------------------------------------
// ErrorManager implementation
// ------------------------------------------------------------
void ErrorManager::loadFromJson(const nlohmann::json& errors) {
    std::lock_guard<std::mutex> lock(g_errorMutex);
    if (errors.contains("errors") && errors["errors"].is_object()) {
        g_errorRoot = errors["errors"];
    } else if (errors.is_object()) {
        g_errorRoot = errors;
    } else {
        g_errorRoot = nlohmann::json::object();
    }
}

std::string ErrorManager::getUserMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_errorMutex);
    if (g_errorRoot.contains(code) && g_errorRoot[code].contains("user")
        && g_errorRoot[code]["user"].is_string()) {
        return g_errorRoot[code]["user"].get<std::string>();
    }
    return "[Error] Unknown error code: " + code;
}

std::string ErrorManager::getDebugMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_errorMutex);
    if (g_errorRoot.contains(code) && g_errorRoot[code].contains("debug")
        && g_errorRoot[code]["debug"].is_string()) {
        return g_errorRoot[code]["debug"].get<std::string>();
    }
    return "[Debug] No debug message for code: " + code;
}

void ErrorManager::log(const std::string& code, const std::string& detail) {
    std::string line = code + " -> " + getDebugMessage(code);
    if (!detail.empty()) line += " (" + detail + ")";
    LOG_ERROR("ErrorManager", line);
}

CommandResult ErrorManager::report(const std::string& code, const std::string& detail) {
    log(code, detail);

    CommandResult result;
    result.success   = false;
    result.message   = getUserMessage(code);
    result.errorCode = code;
    return result;
}

std::size_t ErrorManager::codeCount() {
    std::lock_guard<std::mutex> lock(g_errorMutex);
    return g_errorRoot.size();
}
