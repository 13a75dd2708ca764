#include "commands_interface.hpp"
#include "commands_helpers.hpp"
#include "bootstrap.hpp"
#include "response_manager.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <filesystem>
#include <sstream>
#include <string>

namespace {

// One conversation per console session.
std::string& sessionConversationId() {
    static std::string id = ConversationOrchestrator::newConversationId();
    return id;
}

} // namespace

// ------------------------------------------------------------
// [Utility] Show help text
// ------------------------------------------------------------
CommandResult cmdShowHelp([[maybe_unused]] const std::string& arg) {
    std::string helpText =
        "[Help] Available commands:\n"
        "- chat <message>            (or just type a question)\n"
        "- suggestions\n"
        "- balances\n"
        "- breakdown [days]\n"
        "- trend [months]\n"
        "- summary\n"
        "- list [account=ID] [type=T] [category=C] [min=X] [max=X] [from=DATE] [to=DATE] [merchant=TEXT] [page=N] [size=N]\n"
        "- add <account> | <income|expense|transfer> | <amount> | <description> [| <merchant>] [| <YYYY-MM-DD>]\n"
        "- update <transaction_id> | field=value [| field=value ...]   (amount, category, subcategory, description, merchant, date)\n"
        "- delete <transaction_id>\n"
        "- recalc <account_id>\n"
        "- categorize <description> | <amount> [| <merchant>]\n"
        "- train [ledger|<ledger.json>]\n"
        "- model_info\n"
        "- reload_intents\n"
        "- help\n"
        "- quit";

    return { helpText, true, "ERR_NONE" };
}

// ------------------------------------------------------------
// [Utility] Reload intent table
// ------------------------------------------------------------
CommandResult cmdReloadIntents([[maybe_unused]] const std::string& arg) {
    auto& app = appContext();

    std::string path = app.config.intentsFile;
    if (path.empty() || !std::filesystem::exists(path)) {
        path = resourceFile("intents.json");
    }

    std::string err;
    if (!app.matcher.load_intents(path, &err)) {
        return ErrorManager::report("ERR_INTENTS_LOAD", err);
    }

    LOG_DEBUG("NLP", "Reloaded " + std::to_string(app.matcher.intent_count()) + " intents from " + path);
    return {
        "[NLP] " + ResponseManager::get("reload_intents") +
            " (" + std::to_string(app.matcher.intent_count()) + " intents)",
        true,
        "ERR_NONE"
    };
}

// ------------------------------------------------------------
// [Chat] Prompt suggestions
// ------------------------------------------------------------
CommandResult cmdSuggestions([[maybe_unused]] const std::string& arg) {
    std::ostringstream msg;
    msg << "[Chat] Try asking:";
    for (const auto& s : appContext().orchestrator->suggestions()) {
        msg << "\n- " << s;
    }
    return { msg.str(), true, "ERR_NONE" };
}

// ------------------------------------------------------------
// [Chat] Conversation pipeline
// ------------------------------------------------------------
CommandResult cmdChat(const std::string& arg) {
    const std::string message = trim(arg);
    if (message.empty()) {
        return { ResponseManager::get("fallback"), true, "ERR_NONE" };
    }

    auto response = appContext().orchestrator->process(message, sessionConversationId());
    LOG_TRACE("Chat", "intent=" + response.intent + " confidence=" + std::to_string(response.confidence));
    return { toJson(response).dump(2), true, "ERR_NONE" };
}
