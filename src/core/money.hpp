/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: money.hpp
 * ============================================================================
 */

#ifndef TALLY_MONEY_HPP
#define TALLY_MONEY_HPP

#include <cstdint>
#include <string>

namespace tally {

    // money_cents: $1.00 = 100.
    // We use int64_t to prevent floating-point rounding errors in totals.
    typedef int64_t money_cents;

    // Largest amount accepted from a caller: 1,000,000,000,000.00
    const money_cents MAX_AMOUNT_CENTS = 100000000000000LL;

    /**
     * parse_amount
     * Accepts "12", "12.5", "12.50" (optional surrounding whitespace).
     * Throws InvalidAmountError for empty, non-numeric, negative, more than
     * two decimals, or above MAX_AMOUNT_CENTS.
     */
    money_cents parse_amount(const std::string& text);

    /**
     * format_amount
     * Two-decimal display string without currency symbol, e.g. "-50.00".
     */
    std::string format_amount(money_cents cents);

    // JSON boundary: files store amounts as plain numbers.
    double to_decimal(money_cents cents);
    money_cents from_decimal(double value);

    /**
     * parse_amount_number
     * Caller-supplied JSON number. Same rules as parse_amount: a value
     * with sub-cent precision (12.345) is rejected, not rounded.
     */
    money_cents parse_amount_number(double value);

} // namespace tally

#endif // TALLY_MONEY_HPP
