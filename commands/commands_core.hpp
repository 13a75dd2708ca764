#pragma once
#include <string>
#include <unordered_map>
#include <utility>

struct AppContext;

// ------------------------------------------------------------
// CommandResult: unified return type for all commands
// ------------------------------------------------------------
struct CommandResult {
    std::string message;                 // user-facing text
    bool success = true;                 // true if command succeeded
    std::string errorCode = "ERR_NONE";  // code for ErrorManager/Logger
};

// ------------------------------------------------------------
// Function pointer type for commands
// ------------------------------------------------------------
using CommandFunc = CommandResult(*)(const std::string& arg);

// ------------------------------------------------------------
// Globals (defined in commands_core.cpp)
// ------------------------------------------------------------
extern std::unordered_map<std::string, CommandFunc> commandMap;

// The pipeline commands operate on. Must be bound before dispatch.
void bindAppContext(AppContext* app);
AppContext& appContext();

// ------------------------------------------------------------
// Public API
// ------------------------------------------------------------
std::pair<std::string, std::string> parseInput(const std::string& input);
CommandResult dispatchCommand(const std::string& cmd, const std::string& arg);

// Known command → its handler; anything else → chat pipeline.
CommandResult handleCommand(const std::string& line);
