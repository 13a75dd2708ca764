#pragma once
#include <string>
#include <vector>

namespace ResponseManager {
    // Fixed reply text by key ("fallback", "no_accounts", ...). A key with
    // several variants returns one of them at random; an unknown key
    // returns the fallback text.
    std::string get(const std::string& key);

    // Random element of options ("" if empty)
    std::string pick(const std::vector<std::string>& options);
}
