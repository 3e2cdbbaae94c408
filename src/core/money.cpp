/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: money.cpp
 * ============================================================================
 */

#include "money.hpp"
#include "errors.hpp"
#include <cctype>
#include <cmath>
#include <limits>

namespace tally {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

} // namespace

money_cents parse_amount(const std::string& text) {
    const std::string s = trim(text);
    if (s.empty()) {
        throw InvalidAmountError("Amount is required.");
    }
    if (s[0] == '-') {
        throw InvalidAmountError("Amount must not be negative: " + s);
    }

    money_cents units = 0;
    money_cents fraction = 0;
    int fraction_digits = 0;
    bool seen_point = false;
    bool seen_digit = false;

    for (char c : s) {
        if (c == '.') {
            if (seen_point) throw InvalidAmountError("Amount is not a number: " + s);
            seen_point = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw InvalidAmountError("Amount is not a number: " + s);
        }
        seen_digit = true;
        if (seen_point) {
            if (++fraction_digits > 2) {
                throw InvalidAmountError("Amount has more than two decimals: " + s);
            }
            fraction = fraction * 10 + (c - '0');
        } else {
            units = units * 10 + (c - '0');
            if (units > MAX_AMOUNT_CENTS / 100) {
                throw InvalidAmountError("Amount is too large: " + s);
            }
        }
    }

    if (!seen_digit) {
        throw InvalidAmountError("Amount is not a number: " + s);
    }
    if (fraction_digits == 1) fraction *= 10;

    money_cents total = units * 100 + fraction;
    if (total > MAX_AMOUNT_CENTS) {
        throw InvalidAmountError("Amount is too large: " + s);
    }
    return total;
}

std::string format_amount(money_cents cents) {
    bool negative = cents < 0;
    // Avoid overflow on negation by working on the unsigned magnitude.
    uint64_t magnitude = negative ? static_cast<uint64_t>(-(cents + 1)) + 1 : static_cast<uint64_t>(cents);
    uint64_t whole = magnitude / 100;
    uint64_t part = magnitude % 100;
    return std::string(negative ? "-" : "") + std::to_string(whole) + "." + (part < 10 ? "0" : "") + std::to_string(part);
}

double to_decimal(money_cents cents) {
    return static_cast<double>(cents) / 100.0;
}

money_cents from_decimal(double value) {
    return static_cast<money_cents>(std::llround(value * 100.0));
}

money_cents parse_amount_number(double value) {
    if (!std::isfinite(value)) {
        throw InvalidAmountError("Amount must be a finite number.");
    }
    if (value < 0.0) {
        throw InvalidAmountError("Amount must not be negative.");
    }
    const double scaled = value * 100.0;
    if (scaled > static_cast<double>(MAX_AMOUNT_CENTS)) {
        throw InvalidAmountError("Amount is too large.");
    }
    // Binary doubles rarely hit a cent exactly; allow representation error only.
    const double tolerance = 1e-6 + std::fabs(scaled) * 4 * std::numeric_limits<double>::epsilon();
    if (std::fabs(scaled - std::nearbyint(scaled)) > tolerance) {
        throw InvalidAmountError("Amount has more than two decimal places.");
    }
    return static_cast<money_cents>(std::llround(scaled));
}

} // namespace tally
