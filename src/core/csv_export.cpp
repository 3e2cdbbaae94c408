/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: csv_export.cpp
 * ============================================================================
 */

#include "csv_export.hpp"
#include "atomic_file.hpp"
#include "logger.hpp"
#include <algorithm>
#include <sstream>

namespace tally {

namespace {

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) return value;
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

} // namespace

std::string render_csv(const std::vector<Transaction>& records) {
    std::vector<Transaction> ordered(records);
    std::stable_sort(ordered.begin(), ordered.end(), [](const Transaction& a, const Transaction& b) {
        if (a.date != b.date) return a.date < b.date;
        return a.created_at < b.created_at;
    });

    std::stringstream out;
    out << "id,date,type,amount,category,note,created_at\r\n";
    for (const auto& t : ordered) {
        out << t.id << ','
            << csv_field(t.date) << ','
            << kind_to_string(t.kind) << ','
            << format_amount(t.amount) << ','
            << csv_field(t.category) << ','
            << csv_field(t.note) << ','
            << csv_field(t.created_at) << "\r\n";
    }
    return out.str();
}

size_t export_csv(const std::vector<Transaction>& records, const std::string& path) {
    write_file_atomic(path, render_csv(records));
    log_event("INFO", "Exported " + std::to_string(records.size()) + " transaction(s) to " + path);
    return records.size();
}

} // namespace tally
