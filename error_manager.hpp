#pragma once

#include <string>
#include <nlohmann/json.hpp>

// Undefine Windows ERROR macro if it leaks in
#ifdef ERROR
#undef ERROR
#endif

#include "commands/commands_core.hpp"

// ------------------------------------------------------------
// ErrorManager
// Error codes map to { "user": ..., "debug": ... } messages
// (resources/errors.json, defaults in bootstrap_config).
// ------------------------------------------------------------
namespace ErrorManager {
    // Load error codes from the parsed errors.json
    void loadFromJson(const nlohmann::json& errors);

    // Get messages
    std::string getUserMessage(const std::string& code);
    std::string getDebugMessage(const std::string& code);

    // Log the debug message for a code (plus optional detail) without
    // producing a user-facing result. Used by the pipeline's fallbacks.
    void log(const std::string& code, const std::string& detail = "");

    // Report an error to the console layer (returns a failed CommandResult)
    CommandResult report(const std::string& code, const std::string& detail = "");

    // Number of loaded codes (for sanity checks)
    std::size_t codeCount();
}
