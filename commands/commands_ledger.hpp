#pragma once
#include <string>
#include "commands/commands_core.hpp"

// Ledger / analytics commands
CommandResult cmdBalances(const std::string& arg);
CommandResult cmdBreakdown(const std::string& arg);   // breakdown [days]
CommandResult cmdTrend(const std::string& arg);       // trend [months]
CommandResult cmdSummary(const std::string& arg);

// list [account=ID] [type=T] [category=C] [min=X] [max=X] [from=DATE] [to=DATE]
//      [merchant=TEXT] [page=N] [size=N]
CommandResult cmdListTransactions(const std::string& arg);

// add <account_id> | <income|expense|transfer> | <amount> | <description> [| <merchant>] [| <YYYY-MM-DD>]
CommandResult cmdAddTransaction(const std::string& arg);
// update <id> | field=value [| field=value ...]
// fields: amount, category, subcategory, description, merchant, date
CommandResult cmdUpdateTransaction(const std::string& arg);
CommandResult cmdDeleteTransaction(const std::string& arg);   // delete <id>
CommandResult cmdRecalculate(const std::string& arg);         // recalc <account_id>
