/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: credential_gate.hpp
 * ============================================================================
 */

#ifndef TALLY_CREDENTIAL_GATE_HPP
#define TALLY_CREDENTIAL_GATE_HPP

#include "crypto.hpp"
#include <functional>
#include <optional>
#include <string>

namespace tally {

    bool verify(const std::string& attempt, const PinCredential& stored);

    /**
     * @brief Startup PIN check with a bounded number of attempts.
     * The gate raises AuthExhausted once the attempts run out; ending the
     * session is left to the caller.
     */
    class PinGate {
    public:
        static constexpr int DEFAULT_MAX_ATTEMPTS = 3;

        explicit PinGate(std::optional<PinCredential> stored, int max_attempts = DEFAULT_MAX_ATTEMPTS);

        // False when no PIN is stored; submit() is then never needed.
        bool required() const { return stored_.has_value(); }
        bool unlocked() const { return unlocked_; }
        int remaining_attempts() const { return max_attempts_ - failed_; }

        /**
         * submit
         * @return true on a correct PIN, false on a wrong one while attempts
         * remain. Throws AuthExhausted on the failure that uses up the last
         * attempt and on any call after that.
         */
        bool submit(const std::string& attempt);

        /**
         * unlock
         * Drives the prompt until the gate opens. The prompt returns
         * std::nullopt when the user cancels, in which case unlock returns
         * false. Returns true immediately when no PIN is stored.
         */
        bool unlock(const std::function<std::optional<std::string>(int remaining)>& prompt);

    private:
        std::optional<PinCredential> stored_;
        int max_attempts_;
        int failed_ = 0;
        bool unlocked_ = false;
    };

} // namespace tally

#endif // TALLY_CREDENTIAL_GATE_HPP
