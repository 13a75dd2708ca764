#pragma once
#include "commands_core.hpp"

// Utility / chat commands
CommandResult cmdShowHelp(const std::string& arg);
CommandResult cmdReloadIntents(const std::string& arg);
CommandResult cmdSuggestions(const std::string& arg);

// Runs one message through the conversation pipeline; returns the JSON reply.
CommandResult cmdChat(const std::string& arg);
