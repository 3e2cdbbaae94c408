/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: csv_export.hpp
 * ============================================================================
 */

#ifndef TALLY_CSV_EXPORT_HPP
#define TALLY_CSV_EXPORT_HPP

#include "transaction.hpp"
#include <string>
#include <vector>

namespace tally {

    // Header: id,date,type,amount,category,note,created_at. Rows oldest first.
    std::string render_csv(const std::vector<Transaction>& records);

    /**
     * export_csv
     * Writes render_csv() to `path`. Throws IOFailure if the destination
     * cannot be written.
     * @return Number of rows written (header excluded).
     */
    size_t export_csv(const std::vector<Transaction>& records, const std::string& path);

} // namespace tally

#endif // TALLY_CSV_EXPORT_HPP
