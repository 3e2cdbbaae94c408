/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: errors.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Typed failures raised by the Tally core. The presentation layer catches
 * these by type and shows the message to the user; nothing in the core
 * swallows them or replaces them with a default value.
 * ============================================================================
 */

#ifndef TALLY_ERRORS_HPP
#define TALLY_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace tally {

    /**
     * @brief Root of every error the core raises.
     * kind() is the stable type name reported to the UI.
     */
    class TallyError : public std::runtime_error {
    public:
        explicit TallyError(const std::string& message) : std::runtime_error(message) {}
        virtual const char* kind() const noexcept { return "TallyError"; }
    };

    // A data file exists but does not parse into the expected shape.
    class CorruptDataError : public TallyError {
    public:
        explicit CorruptDataError(const std::string& message) : TallyError(message) {}
        const char* kind() const noexcept override { return "CorruptDataError"; }
    };

    // Caller supplied a field the core cannot accept.
    class InvalidInputError : public TallyError {
    public:
        explicit InvalidInputError(const std::string& message) : TallyError(message) {}
        const char* kind() const noexcept override { return "InvalidInputError"; }
    };

    class InvalidAmountError : public InvalidInputError {
    public:
        explicit InvalidAmountError(const std::string& message) : InvalidInputError(message) {}
        const char* kind() const noexcept override { return "InvalidAmountError"; }
    };

    class InvalidKindError : public InvalidInputError {
    public:
        explicit InvalidKindError(const std::string& message) : InvalidInputError(message) {}
        const char* kind() const noexcept override { return "InvalidKindError"; }
    };

    class InvalidDateError : public InvalidInputError {
    public:
        explicit InvalidDateError(const std::string& message) : InvalidInputError(message) {}
        const char* kind() const noexcept override { return "InvalidDateError"; }
    };

    class InvalidPinError : public TallyError {
    public:
        explicit InvalidPinError(const std::string& message) : TallyError(message) {}
        const char* kind() const noexcept override { return "InvalidPinError"; }
    };

    // undo_last() on a store with no records.
    class EmptyStoreError : public TallyError {
    public:
        explicit EmptyStoreError(const std::string& message) : TallyError(message) {}
        const char* kind() const noexcept override { return "EmptyStoreError"; }
    };

    // PIN attempts exhausted. The caller decides how to end the session.
    class AuthExhausted : public TallyError {
    public:
        explicit AuthExhausted(const std::string& message) : TallyError(message) {}
        const char* kind() const noexcept override { return "AuthExhausted"; }
    };

    // Disk write, flush or rename failed.
    class IOFailure : public TallyError {
    public:
        explicit IOFailure(const std::string& message) : TallyError(message) {}
        const char* kind() const noexcept override { return "IOFailure"; }
    };

} // namespace tally

#endif // TALLY_ERRORS_HPP
