#include "resources.hpp"
#include "logger.hpp"

#include <filesystem>

namespace fs = std::filesystem;

// -------------------------------------------------------------
// Locate resource root (prefer repo/resources over build/resources)
// -------------------------------------------------------------
std::string getResourcePath() {
#if defined(FINCHAT_PORTABLE_ONLY)
    fs::path exePath;
    std::error_code ec;
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    exePath = ec ? fs::current_path() : self.parent_path();

    fs::path portablePath = exePath / "resources";
    if (fs::exists(portablePath)) {
        LOG_DEBUG("Resources", "Using portable resource path: " + portablePath.string());
        return portablePath.string();
    }
    return exePath.string();
#else
    fs::path buildPath   = fs::current_path() / "resources";
    fs::path projectPath = fs::current_path().parent_path() / "resources";

    // 🔹 Prefer project resources first
    if (fs::exists(projectPath)) {
        LOG_DEBUG("Resources", "Using resource path: " + projectPath.string());
        return projectPath.string();
    }
    if (fs::exists(buildPath)) {
        LOG_DEBUG("Resources", "Using fallback resource path: " + buildPath.string());
        return buildPath.string();
    }

    // Last resort: current working directory
    LOG_DEBUG("Resources", "Falling back to cwd: " + fs::current_path().string());
    return fs::current_path().string();
#endif
}

std::string resourceFile(const std::string& filename) {
    return (fs::path(getResourcePath()) / filename).string();
}
