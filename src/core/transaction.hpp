/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: transaction.hpp
 * ============================================================================
 */

#ifndef TALLY_TRANSACTION_HPP
#define TALLY_TRANSACTION_HPP

#include "money.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tally {

    using json = nlohmann::json;

    enum class Kind { Income, Expense };

    const char* const UNCATEGORIZED = "Uncategorized";

    /**
     * @brief A single income or expense entry.
     * Persisted as one object in transactions.json ("type" holds the kind).
     */
    struct Transaction {
        int64_t id = 0;
        std::string date;        // YYYY-MM-DD
        Kind kind = Kind::Expense;
        money_cents amount = 0;
        std::string category;
        std::string note;
        std::string created_at;  // YYYY-MM-DDTHH:MM:SS
    };

    bool operator==(const Transaction& a, const Transaction& b);
    bool operator!=(const Transaction& a, const Transaction& b);

    // Read-only view handed to the Aggregation Engine.
    typedef std::shared_ptr<const std::vector<Transaction>> Snapshot;

    std::string kind_to_string(Kind kind);

    /**
     * parse_kind
     * Trims and lower-cases user input. Empty means expense; anything other
     * than "income" or "expense" throws InvalidKindError.
     */
    Kind parse_kind(const std::string& text);

    // File mapping. from_json throws CorruptDataError on a malformed record.
    void to_json(json& j, const Transaction& t);
    void from_json(const json& j, Transaction& t);

} // namespace tally

#endif // TALLY_TRANSACTION_HPP
