/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: record_store.cpp
 * ============================================================================
 */

#include "record_store.hpp"
#include "atomic_file.hpp"
#include "dates.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace tally {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Creation order: created_at, then id for records stamped in the same second.
bool created_before(const Transaction& a, const Transaction& b) {
    if (a.created_at != b.created_at) return a.created_at < b.created_at;
    return a.id < b.id;
}

} // namespace

RecordStore::RecordStore(std::string path)
    : path_(std::move(path)),
      records_(std::make_shared<const std::vector<Transaction>>()) {}

// ----------------------------------------------------------------------------
// load
// A missing file is a fresh install, not an error. Anything unreadable is
// reported so the caller can decide between aborting and starting empty.
// ----------------------------------------------------------------------------
void RecordStore::load() {
    remove_stale_temp_files(path_);
    std::optional<std::string> content = read_file(path_);
    if (!content) {
        log_event("INFO", "No transaction file at " + path_ + ". Starting with an empty ledger.");
        records_ = std::make_shared<const std::vector<Transaction>>();
        added_ids_.clear();
        return;
    }

    json doc;
    try {
        doc = json::parse(*content);
    } catch (const json::parse_error& e) {
        throw CorruptDataError("Transaction file " + path_ + " is not valid JSON: " + e.what());
    }
    if (!doc.is_array()) {
        throw CorruptDataError("Transaction file " + path_ + " does not hold a list.");
    }

    std::vector<Transaction> loaded;
    loaded.reserve(doc.size());
    std::set<int64_t> seen;
    for (const auto& entry : doc) {
        Transaction t = entry.get<Transaction>();
        if (!seen.insert(t.id).second) {
            throw CorruptDataError("Transaction file " + path_ + " repeats id " + std::to_string(t.id) + ".");
        }
        loaded.push_back(std::move(t));
    }

    records_ = std::make_shared<const std::vector<Transaction>>(std::move(loaded));
    added_ids_.clear();
    log_event("INFO", "Loaded " + std::to_string(records_->size()) + " transactions from " + path_);
}

Transaction RecordStore::add(const std::string& kind,
                             const std::string& date,
                             const std::string& amount,
                             const std::string& category,
                             const std::string& note) {
    Transaction t;
    t.kind = parse_kind(kind);
    t.amount = parse_amount(amount);

    t.date = trim(date);
    if (t.date.empty()) {
        t.date = today_iso();
    } else if (!is_valid_date(t.date)) {
        throw InvalidDateError("Invalid date '" + t.date + "'. Use YYYY-MM-DD.");
    }

    t.category = trim(category);
    if (t.category.empty()) t.category = UNCATEGORIZED;
    t.note = trim(note);
    t.id = next_id();
    t.created_at = now_iso_timestamp();

    std::vector<Transaction> updated(*records_);
    updated.push_back(t);
    commit(std::move(updated));
    added_ids_.insert(t.id);

    log_event("INFO", "Transaction " + std::to_string(t.id) + " saved: " + kind_to_string(t.kind) + " "
              + format_amount(t.amount) + " (" + t.category + ")");
    return t;
}

size_t RecordStore::remove(const std::set<int64_t>& ids) {
    std::vector<Transaction> updated;
    updated.reserve(records_->size());
    for (const auto& t : *records_) {
        if (ids.count(t.id) == 0) updated.push_back(t);
    }

    size_t removed = records_->size() - updated.size();
    if (removed == 0) return 0;

    commit(std::move(updated));
    log_event("INFO", "Deleted " + std::to_string(removed) + " transaction(s).");
    return removed;
}

Transaction RecordStore::undo_last() {
    if (records_->empty()) {
        throw EmptyStoreError("Nothing to undo.");
    }

    // Records added since load carry strictly increasing ids, which stay
    // ordered even if the wall clock steps back. Loaded history falls back
    // to its created_at stamp.
    auto newest = records_->end();
    for (auto it = records_->begin(); it != records_->end(); ++it) {
        if (added_ids_.count(it->id) && (newest == records_->end() || it->id > newest->id)) newest = it;
    }
    if (newest == records_->end()) {
        newest = std::max_element(records_->begin(), records_->end(), created_before);
    }
    Transaction undone = *newest;

    std::vector<Transaction> updated;
    updated.reserve(records_->size() - 1);
    for (const auto& t : *records_) {
        if (t.id != undone.id) updated.push_back(t);
    }
    commit(std::move(updated));
    added_ids_.erase(undone.id);

    log_event("INFO", "Undid transaction " + std::to_string(undone.id) + ".");
    return undone;
}

void RecordStore::reset_all() {
    size_t count = records_->size();
    commit(std::vector<Transaction>());
    added_ids_.clear();
    log_event("CRITICAL", "All transactions cleared (" + std::to_string(count) + " removed).");
}

// ----------------------------------------------------------------------------
// Persistence
// ----------------------------------------------------------------------------
void RecordStore::persist(const std::vector<Transaction>& records) const {
    json doc = json::array();
    for (const auto& t : records) {
        doc.push_back(t);
    }
    write_file_atomic(path_, doc.dump(2));
}

void RecordStore::commit(std::vector<Transaction> records) {
    persist(records);
    records_ = std::make_shared<const std::vector<Transaction>>(std::move(records));
}

int64_t RecordStore::next_id() const {
    int64_t id = now_epoch_ms();
    for (const auto& t : *records_) {
        if (t.id >= id) id = t.id + 1;
    }
    return id;
}

} // namespace tally
