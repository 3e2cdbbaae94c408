/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: HttpApi.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Local presentation surface. Serves the dashboard page and a JSON API on
 * the loopback interface; every handler calls into the stores and the
 * aggregation functions and renders whatever they return or throw.
 * ============================================================================
 */

#ifndef TALLY_HTTP_API_HPP
#define TALLY_HTTP_API_HPP

#include "config.hpp"
#include "record_store.hpp"
#include "session.hpp"
#include "settings_store.hpp"

namespace httplib {
class Server;
}

namespace tally {

    struct AppContext {
        const Config& config;
        RecordStore& records;
        SettingsStore& settings;
        const SessionGuard& session;
    };

    /**
     * register_routes
     * Every request must carry the session token (cookie or header) and
     * every POST must be application/json; otherwise 401 / 415. The one
     * exception is GET /?session=<token>, which plants the cookie.
     */
    void register_routes(httplib::Server& svr, AppContext& app);

    // Blocks until the server stops. Returns false if binding failed.
    bool run_http_server(AppContext& app);

} // namespace tally

#endif // TALLY_HTTP_API_HPP
