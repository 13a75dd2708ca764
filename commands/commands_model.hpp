#pragma once
#include <optional>
#include <string>

#include "commands/commands_core.hpp"
#include "ledger/money.hpp"

// Validated input of the categorize command.
struct CategorizeRequest {
    std::string description;
    ledger::Money amount;
    std::optional<std::string> merchantName;
};

// "desc | amount [| merchant]" → request, or the failed result to return.
// Description must be 1..500 characters, amount > 0.
std::optional<CategorizeRequest> parseCategorizeArgs(const std::string& arg, CommandResult* error);

// Model commands
CommandResult cmdTrain(const std::string& arg);        // train [ledger|<ledger.json>]
CommandResult cmdCategorize(const std::string& arg);   // categorize desc | amount [| merchant]
CommandResult cmdModelInfo(const std::string& arg);
