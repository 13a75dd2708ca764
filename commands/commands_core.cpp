#include "commands_core.hpp"
#include "commands_interface.hpp"
#include "commands_ledger.hpp"
#include "commands_model.hpp"
#include "commands_helpers.hpp"

#include "error_manager.hpp"
#include "logger.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

// ------------------------------------------------------------
// Globals
// ------------------------------------------------------------
std::unordered_map<std::string, CommandFunc> commandMap;

static AppContext* g_app = nullptr;

void bindAppContext(AppContext* app) {
    g_app = app;
}

AppContext& appContext() {
    if (!g_app) throw std::runtime_error("AppContext not bound");
    return *g_app;
}

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------
static int levenshteinDistance(const std::string& s1, const std::string& s2) {
    const size_t m = s1.size(), n = s2.size();
    std::vector<int> prev(n + 1), curr(n + 1);

    for (size_t j = 0; j <= n; j++) prev[j] = static_cast<int>(j);

    for (size_t i = 1; i <= m; i++) {
        curr[0] = static_cast<int>(i);
        for (size_t j = 1; j <= n; j++) {
            int cost = (s1[i - 1] == s2[j - 1]) ? 0 : 1;
            curr[j] = std::min({ prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost });
        }
        prev.swap(curr);
    }
    return prev[n];
}

// Typo correction for bare command words ("balnces" → "balances").
// Short words are left alone so chat like "hi" never turns into a command.
static std::string fuzzyMatch(const std::string& input) {
    if (input.size() < 4) return input;

    std::string best = input;
    int bestDist = 2; // only allow corrections within distance 1

    for (const auto& [key, _] : commandMap) {
        int dist = levenshteinDistance(input, key);
        if (dist < bestDist) {
            bestDist = dist;
            best = key;
        }
    }
    return best;
}

// ------------------------------------------------------------
// Command Registration
// ------------------------------------------------------------
static void initCommands() {
    if (!commandMap.empty()) return; // already initialized

    commandMap = {
        // --- Chat ---
        {"chat",           cmdChat},
        {"suggestions",    cmdSuggestions},

        // --- Ledger ---
        {"balances",       cmdBalances},
        {"breakdown",      cmdBreakdown},
        {"trend",          cmdTrend},
        {"summary",        cmdSummary},
        {"list",           cmdListTransactions},
        {"add",            cmdAddTransaction},
        {"update",         cmdUpdateTransaction},
        {"delete",         cmdDeleteTransaction},
        {"recalc",         cmdRecalculate},

        // --- Model ---
        {"categorize",     cmdCategorize},
        {"train",          cmdTrain},
        {"model_info",     cmdModelInfo},

        // --- Interface ---
        {"help",           cmdShowHelp},
        {"reload_intents", cmdReloadIntents}
    };
}

// ------------------------------------------------------------
// Core Dispatch
// ------------------------------------------------------------
std::pair<std::string, std::string> parseInput(const std::string& input) {
    std::string line = trim(input);
    auto pos = line.find(' ');
    if (pos == std::string::npos) {
        return {line, ""};
    }
    return {line.substr(0, pos), trim(line.substr(pos + 1))};
}

CommandResult dispatchCommand(const std::string& cmd, const std::string& arg) {
    initCommands();

    auto it = commandMap.find(cmd);
    if (it != commandMap.end()) {
        LOG_TRACE("dispatchCommand", "Found handler for cmd=\"" + cmd + "\" arg=\"" + arg + "\"");
        try {
            return it->second(arg);
        } catch (const std::exception& e) {
            return ErrorManager::report("ERR_CMD_EXCEPTION", cmd + ": " + e.what());
        }
    }

    LOG_DEBUG("dispatchCommand", "Unknown command: \"" + cmd + "\"");
    return ErrorManager::report("ERR_CORE_UNKNOWN_COMMAND", cmd);
}

// ------------------------------------------------------------
// handleCommand: command words first, everything else is chat
// ------------------------------------------------------------
CommandResult handleCommand(const std::string& line) {
    initCommands();

    auto [cmdRaw, arg] = parseInput(line);
    if (cmdRaw.empty()) {
        return { "", true, "ERR_NONE" };
    }

    std::string cmd = toLowerCopy(cmdRaw);

    // Case 1: direct command
    if (commandMap.count(cmd)) {
        return dispatchCommand(cmd, arg);
    }

    // Case 2: a misspelled bare command word
    if (arg.empty()) {
        std::string corrected = fuzzyMatch(cmd);
        if (corrected != cmd) {
            LOG_DEBUG("handleCommand", "Fuzzy matched \"" + cmd + "\" → \"" + corrected + "\"");
            return dispatchCommand(corrected, arg);
        }
    }

    // Case 3: free text goes to the conversation pipeline
    LOG_TRACE("handleCommand", "No command match, routing to chat");
    return dispatchCommand("chat", trim(line));
}
