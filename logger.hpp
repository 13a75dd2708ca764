#pragma once
#include <string>
#include <chrono>

// =====================================================
// Log levels (lowest first). Lines below the active
// level are dropped; phases and errors always print.
// =====================================================
enum class LogLevel {
    Trace,
    Debug,
    Error
};

// Parse "trace" / "debug" / "error" (anything else -> Debug)
LogLevel logLevelFromString(const std::string& name);
void setLogLevel(LogLevel level);

// =====================================================
// Phase Info (most recent lifecycle phase)
// =====================================================
struct PhaseInfo {
    std::chrono::system_clock::time_point timestamp; // when entered
    std::string fileName;    // file containing this phase
    std::string phaseName;   // descriptive phase string
    bool success = false;
};

PhaseInfo lastPhase();

// =====================================================
// Lifecycle
// =====================================================
void initLogger(const std::string& filename);
void shutdownLogger();

// Console echo (stderr) is on by default; the test runner turns it off.
void setLogConsoleEcho(bool enabled);

// =====================================================
// Core Logging Functions
// =====================================================
void logPhaseInternal(const std::string& file,
                      const std::string& phase,
                      bool success);

void logDebug(const std::string& tag, const std::string& msg);
void logTrace(const std::string& tag, const std::string& msg);
void logError(const std::string& tag, const std::string& msg);

// =====================================================
// Phase Group Controls (buffered block logging)
// =====================================================
void beginPhaseGroup();
void endPhaseGroup();

// =====================================================
// Macros for convenience
// =====================================================
#define LOG_PHASE(phase, success) logPhaseInternal(__FILE__, phase, success)
#define LOG_DEBUG(tag, msg) logDebug(tag, msg)
#define LOG_TRACE(tag, msg) logTrace(tag, msg)
#define LOG_ERROR(tag, msg) logError(tag, msg)
