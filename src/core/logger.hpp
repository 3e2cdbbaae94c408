/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: logger.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The Tally system log. Every entry is echoed to the console and kept in a
 * bounded in-memory buffer so the dashboard can show recent activity via
 * /api/system/logs.
 * ============================================================================
 */

#ifndef TALLY_LOGGER_HPP
#define TALLY_LOGGER_HPP

#include <string>
#include <vector>

namespace tally {

    // Entries kept in memory before the oldest is dropped.
    const size_t LOG_CAPACITY = 200;

    /**
     * log_event
     * Records "[HH:MM:SS] [LEVEL] message". ERROR, FATAL and CRITICAL go to
     * stderr, everything else to stdout.
     */
    void log_event(const std::string& level, const std::string& message);

    // Oldest first.
    std::vector<std::string> recent_logs();

    void clear_logs();

} // namespace tally

#endif // TALLY_LOGGER_HPP
