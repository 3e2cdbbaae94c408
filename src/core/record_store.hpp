/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: record_store.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Owns the transaction list and its file (transactions.json). Every
 * mutation writes the complete new list to disk before it becomes visible
 * in memory, so a failed write leaves both the file and the in-memory list
 * as they were.
 * ============================================================================
 */

#ifndef TALLY_RECORD_STORE_HPP
#define TALLY_RECORD_STORE_HPP

#include "transaction.hpp"
#include <cstdint>
#include <set>
#include <string>

namespace tally {

    class RecordStore {
    public:
        explicit RecordStore(std::string path);

        /**
         * @brief Replaces the in-memory list with the file's content.
         * An absent file yields an empty list. Throws CorruptDataError when
         * the file exists but is not an array of valid transactions.
         */
        void load();

        /**
         * @brief Validates and appends a new transaction.
         * @param kind "income" / "expense" (empty means expense)
         * @param date YYYY-MM-DD, empty means today
         * @param amount decimal string, at most two decimals
         * @return The stored record with its id and created_at filled in.
         */
        Transaction add(const std::string& kind,
                        const std::string& date,
                        const std::string& amount,
                        const std::string& category,
                        const std::string& note);

        /**
         * @brief Removes every record whose id is in `ids`.
         * Unknown ids are ignored. The file is rewritten only when something
         * was removed.
         * @return Number of records removed.
         */
        size_t remove(const std::set<int64_t>& ids);

        /**
         * @brief Removes the most recently created record.
         * Records added through this store win over loaded ones (newest id
         * first); loaded records are ordered by created_at, then id.
         * Throws EmptyStoreError when there is nothing to undo.
         */
        Transaction undo_last();

        // Deletes every record. Confirmation is the caller's job.
        void reset_all();

        Snapshot snapshot() const { return records_; }
        size_t size() const { return records_->size(); }
        const std::string& path() const { return path_; }

    private:
        void persist(const std::vector<Transaction>& records) const;
        void commit(std::vector<Transaction> records);
        int64_t next_id() const;

        std::string path_;
        Snapshot records_;
        std::set<int64_t> added_ids_;   // ids added since the last load
    };

} // namespace tally

#endif // TALLY_RECORD_STORE_HPP
