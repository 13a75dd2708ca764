#pragma once
#include <string>

// ------------------------------------------------------------
// Constants
// ------------------------------------------------------------
inline constexpr const char* CONFIG_FILE = "finchat_config.json";

// ------------------------------------------------------------
// Resource loading
// ------------------------------------------------------------
std::string getResourcePath();

// getResourcePath() + "/" + filename
std::string resourceFile(const std::string& filename);

