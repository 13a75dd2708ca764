#include "ledger/money.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace ledger {

namespace {
constexpr std::int64_t kMaxCents = std::numeric_limits<std::int64_t>::max();
}

Money Money::fromDouble(double value) {
    return Money(static_cast<std::int64_t>(std::llround(value * 100.0)));
}

std::optional<Money> Money::parse(const std::string& text) {
    std::size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) i++;

    bool negative = false;
    if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
        negative = (text[i] == '-');
        i++;
    }
    if (i < text.size() && text[i] == '$') i++;

    std::int64_t whole = 0;
    int digits = 0;
    for (; i < text.size(); i++) {
        char c = text[i];
        if (c == ',') continue;
        if (!std::isdigit(static_cast<unsigned char>(c))) break;
        if (whole > (kMaxCents - 9) / 10) return std::nullopt;
        whole = whole * 10 + (c - '0');
        digits++;
    }

    std::int64_t fraction = 0;
    int fracDigits = 0;
    if (i < text.size() && text[i] == '.') {
        i++;
        for (; i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])); i++) {
            if (++fracDigits > 2) return std::nullopt;
            fraction = fraction * 10 + (text[i] - '0');
        }
        if (fracDigits == 1) fraction *= 10;
    }

    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) i++;
    if (i != text.size() || (digits == 0 && fracDigits == 0)) {
        return std::nullopt;
    }

    // Whole units must still fit once scaled to cents.
    if (whole > (kMaxCents - 99) / 100) return std::nullopt;
    std::int64_t cents = whole * 100 + fraction;
    return Money(negative ? -cents : cents);
}

std::string Money::toString() const {
    std::int64_t absCents = std::llabs(cents_);
    std::string frac = std::to_string(absCents % 100);
    if (frac.size() < 2) frac.insert(0, "0");
    return std::string(cents_ < 0 ? "-" : "") + std::to_string(absCents / 100) + "." + frac;
}

std::string Money::format() const {
    std::int64_t absCents = std::llabs(cents_);
    std::string whole = std::to_string(absCents / 100);

    std::string grouped;
    int count = 0;
    for (auto it = whole.rbegin(); it != whole.rend(); ++it) {
        if (count > 0 && count % 3 == 0) grouped.insert(grouped.begin(), ',');
        grouped.insert(grouped.begin(), *it);
        count++;
    }

    std::string frac = std::to_string(absCents % 100);
    if (frac.size() < 2) frac.insert(0, "0");
    return std::string("$") + (cents_ < 0 ? "-" : "") + grouped + "." + frac;
}

Money Money::scaled(double ratio) const {
    return Money(static_cast<std::int64_t>(std::llround(static_cast<double>(cents_) * ratio)));
}

} // namespace ledger
