// pch.hpp
#pragma once

// ---------------------------------------------------------
// External libraries
// ---------------------------------------------------------
#include <nlohmann/json.hpp>

// ---------------------------------------------------------
// Standard Library
// ---------------------------------------------------------
#include <iostream>
#include <vector>
#include <string>
#include <sstream>
#include <unordered_map>
#include <map>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <regex>
#include <optional>
#include <memory>
#include <functional>
#include <fstream>
#include <mutex>
#include <atomic>
#include <random>
#include <future>
#include <cmath>
