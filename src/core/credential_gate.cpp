/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: credential_gate.cpp
 * ============================================================================
 */

#include "credential_gate.hpp"
#include "errors.hpp"
#include "logger.hpp"

namespace tally {

bool verify(const std::string& attempt, const PinCredential& stored) {
    return TallyCrypto::verify_pin(attempt, stored);
}

PinGate::PinGate(std::optional<PinCredential> stored, int max_attempts)
    : stored_(std::move(stored)), max_attempts_(max_attempts > 0 ? max_attempts : DEFAULT_MAX_ATTEMPTS) {
    unlocked_ = !stored_.has_value();
}

bool PinGate::submit(const std::string& attempt) {
    if (!stored_) return true;
    if (failed_ >= max_attempts_) {
        throw AuthExhausted("Too many wrong PIN attempts.");
    }

    if (verify(attempt, *stored_)) {
        unlocked_ = true;
        failed_ = 0;
        return true;
    }

    ++failed_;
    log_event("WARN", "Wrong PIN entered (" + std::to_string(remaining_attempts()) + " attempt(s) left).");
    if (failed_ >= max_attempts_) {
        throw AuthExhausted("Too many wrong PIN attempts.");
    }
    return false;
}

bool PinGate::unlock(const std::function<std::optional<std::string>(int remaining)>& prompt) {
    if (unlocked_) return true;

    while (true) {
        std::optional<std::string> attempt = prompt(remaining_attempts());
        if (!attempt) {
            log_event("INFO", "PIN entry cancelled.");
            return false;
        }
        if (submit(*attempt)) return true;
    }
}

} // namespace tally
