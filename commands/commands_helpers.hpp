#pragma once
#include <string>
#include <vector>

// Trim whitespace from both ends
std::string trim(const std::string& s);

std::string toLowerCopy(std::string s);

// "a | b |c" -> {"a", "b", "c"} (fields trimmed, empties kept)
std::vector<std::string> splitFields(const std::string& s, char sep = '|');
