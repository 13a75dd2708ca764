#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace ledger {

// ------------------------------------------------------------
// Money: exact decimal amount held as signed cents.
// Ledger arithmetic never goes through floating point; toDouble()
// exists only for percentages, charts and model features.
// ------------------------------------------------------------
class Money {
public:
    constexpr Money() = default;

    static constexpr Money fromCents(std::int64_t cents) { return Money(cents); }

    // Rounds half away from zero to the nearest cent.
    static Money fromDouble(double value);

    // Accepts "1234", "1,234.5", "$1,234.56", "-12.30". Returns nullopt on
    // anything else (more than two fractional digits included).
    static std::optional<Money> parse(const std::string& text);

    constexpr std::int64_t cents() const { return cents_; }
    double toDouble() const { return static_cast<double>(cents_) / 100.0; }

    // "1234.56" / "-5.00"
    std::string toString() const;

    // "$1,234.56" / "$-5.00"
    std::string format() const;

    // Multiply by a ratio, rounded to the cent.
    Money scaled(double ratio) const;

    bool isZero() const { return cents_ == 0; }
    bool isPositive() const { return cents_ > 0; }

    Money& operator+=(Money other) { cents_ += other.cents_; return *this; }
    Money& operator-=(Money other) { cents_ -= other.cents_; return *this; }

    friend Money operator+(Money a, Money b) { return Money(a.cents_ + b.cents_); }
    friend Money operator-(Money a, Money b) { return Money(a.cents_ - b.cents_); }
    friend Money operator-(Money a) { return Money(-a.cents_); }

    friend bool operator==(Money a, Money b) { return a.cents_ == b.cents_; }
    friend bool operator!=(Money a, Money b) { return a.cents_ != b.cents_; }
    friend bool operator<(Money a, Money b)  { return a.cents_ < b.cents_; }
    friend bool operator>(Money a, Money b)  { return a.cents_ > b.cents_; }
    friend bool operator<=(Money a, Money b) { return a.cents_ <= b.cents_; }
    friend bool operator>=(Money a, Money b) { return a.cents_ >= b.cents_; }

private:
    explicit constexpr Money(std::int64_t cents) : cents_(cents) {}

    std::int64_t cents_ = 0;
};

} // namespace ledger
