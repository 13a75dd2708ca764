#include "pch.hpp"
#include "commands/commands_core.hpp"
#include "response_manager.hpp"
#include "bootstrap.hpp"
#include "logger.hpp"

// ============================================================
// Main entry point
// ============================================================
int main() {
    // Initialize logger (writes to finchat.log + console if enabled)
    initLogger("finchat.log");
    LOG_PHASE("Startup begin", true);

    // Bootstrap configuration, data files and the chat pipeline
    auto app = runBootstrapChecks();
    bindAppContext(app.get());
    LOG_PHASE("Bootstrap checks complete", true);

    // 🔹 Startup greeting
    std::cout << ResponseManager::get("startup") << "\n"
              << "Type 'help' for commands, or just ask a question.\n";

    LOG_PHASE("Startup complete, entering main loop", true);

    // ============================================================
    // Console REPL loop
    // ============================================================
    std::string line;
    while (true) {
        std::cout << "> "; // REPL prompt
        if (!std::getline(std::cin, line)) {
            break; // EOF / Ctrl+D
        }

        if (line.empty()) {
            continue;
        }

        if (line == "quit" || line == "exit") {
            LOG_PHASE("Shutdown requested", true);
            break;
        }

        LOG_TRACE("Console", "Dispatching command: " + line);
        CommandResult result = handleCommand(line);
        if (!result.success) {
            LOG_DEBUG("Console", "Command failed with " + result.errorCode);
        }
        if (!result.message.empty()) {
            std::cout << result.message << std::endl;
        }
    }

    // ============================================================
    // Shutdown cleanup
    // ============================================================
    bindAppContext(nullptr);
    app.reset();
    LOG_PHASE("Shutdown complete", true);

    // 🔹 Close logger
    shutdownLogger();
    return 0;
}
