/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: dates.hpp
 * ============================================================================
 */

#ifndef TALLY_DATES_HPP
#define TALLY_DATES_HPP

#include <cstdint>
#include <string>

namespace tally {

    struct YearMonth {
        int year = 0;
        int month = 0; // 1..12
    };

    // Milliseconds since the Unix epoch.
    int64_t now_epoch_ms();

    // Local date as YYYY-MM-DD.
    std::string today_iso();

    // Local wall-clock time as YYYY-MM-DDTHH:MM:SS.
    std::string now_iso_timestamp();

    // Local wall-clock time as HH:MM:SS, used by the system log.
    std::string now_clock_time();

    YearMonth current_year_month();

    /**
     * is_valid_date
     * True for a strictly formatted YYYY-MM-DD that names a real calendar day.
     */
    bool is_valid_date(const std::string& date);

    // "2025-01-" for (2025, 1); records in that month start with it.
    std::string month_prefix(int year, int month);

    // Steps back/forward whole months, e.g. (2025, 1) - 1 = (2024, 12).
    YearMonth add_months(YearMonth ym, int delta);

} // namespace tally

#endif // TALLY_DATES_HPP
