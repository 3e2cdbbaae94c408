/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: settings_store.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Owns settings.json: the optional PIN credential and the per-category
 * monthly budgets. Same write discipline as the RecordStore: the new state
 * reaches disk before it replaces the in-memory copy.
 * ============================================================================
 */

#ifndef TALLY_SETTINGS_STORE_HPP
#define TALLY_SETTINGS_STORE_HPP

#include "crypto.hpp"
#include "money.hpp"
#include <map>
#include <optional>
#include <string>

namespace tally {

    typedef std::map<std::string, money_cents> BudgetMap;

    struct Settings {
        std::optional<PinCredential> pin;
        BudgetMap budgets;
    };

    class SettingsStore {
    public:
        /**
         * @param path settings.json location
         * @param pin_iterations PBKDF2 cost used for newly set PINs
         */
        explicit SettingsStore(std::string path, int pin_iterations = TallyCrypto::DEFAULT_PIN_ITERATIONS);

        // Absent file gives default settings; malformed file throws CorruptDataError.
        void load();

        /**
         * @brief Creates or overwrites the budget for `category`.
         * Throws InvalidInputError for a blank category and
         * InvalidAmountError for a negative or non-numeric amount.
         */
        void set_budget(const std::string& category, const std::string& amount);

        // @return true if a budget was removed.
        bool remove_budget(const std::string& category);

        const BudgetMap& list_budgets() const { return settings_.budgets; }

        // Throws InvalidPinError when `pin` is empty.
        void set_pin(const std::string& pin);
        void remove_pin();
        bool has_pin() const { return settings_.pin.has_value(); }
        const std::optional<PinCredential>& pin_credential() const { return settings_.pin; }

        int pin_iterations() const { return pin_iterations_; }
        const std::string& path() const { return path_; }

    private:
        void commit(Settings updated);

        std::string path_;
        int pin_iterations_;
        Settings settings_;
    };

} // namespace tally

#endif // TALLY_SETTINGS_STORE_HPP
