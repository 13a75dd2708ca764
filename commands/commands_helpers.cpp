#include "commands_helpers.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> splitFields(const std::string& s, char sep) {
    std::vector<std::string> fields;
    std::stringstream ss(s);
    std::string field;
    while (std::getline(ss, field, sep)) {
        fields.push_back(trim(field));
    }
    if (!s.empty() && s.back() == sep) fields.push_back("");
    return fields;
}
