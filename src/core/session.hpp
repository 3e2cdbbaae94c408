/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: session.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Request admission for the local dashboard. The console PIN unlock mints
 * one random session token per run; every HTTP request must present it,
 * either as the "tally_session" cookie (set when the dashboard is opened
 * through the printed link) or in the X-Tally-Session header.
 * ============================================================================
 */

#ifndef TALLY_SESSION_HPP
#define TALLY_SESSION_HPP

#include <string>

namespace tally {

    const char* const SESSION_COOKIE = "tally_session";
    const char* const SESSION_HEADER = "X-Tally-Session";

    class SessionGuard {
    public:
        static constexpr int TOKEN_BYTES = 32;

        explicit SessionGuard(std::string token);

        // Fresh guard with a CSPRNG token.
        static SessionGuard generate();

        const std::string& token() const { return token_; }

        bool matches(const std::string& candidate) const;

        /**
         * accepts
         * @param cookie_header raw Cookie header ("a=1; tally_session=...")
         * @param token_header value of X-Tally-Session, may be empty
         */
        bool accepts(const std::string& cookie_header, const std::string& token_header) const;

        // Set-Cookie value. SameSite=Strict keeps other sites from riding it.
        std::string cookie() const;

    private:
        std::string token_;
    };

    // Value of `name` in a Cookie header, or "" when absent.
    std::string cookie_value(const std::string& header, const std::string& name);

    // True for "application/json" with or without parameters (charset=...).
    bool is_json_content_type(const std::string& header);

    /**
     * export_file_path
     * Resolves a CSV export name to <data_dir>/exports/<name>. An empty name
     * becomes "tally-export-<today>.csv". Throws InvalidInputError for names
     * that are not a plain "*.csv" file name.
     */
    std::string export_file_path(const std::string& data_dir, const std::string& name);

} // namespace tally

#endif // TALLY_SESSION_HPP
