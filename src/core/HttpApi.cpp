/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: HttpApi.cpp
 * ============================================================================
 */

#include "HttpApi.hpp"
#include "ViewEngine.hpp"
#include "aggregation.hpp"
#include "credential_gate.hpp"
#include "csv_export.hpp"
#include "dates.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "session.hpp"
#include "views.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <set>

using json = nlohmann::json;

namespace tally {

namespace {

const char* RESET_CONFIRMATION = "DELETE ALL";
const size_t DASHBOARD_HISTORY_ROWS = 50;

void send_json(httplib::Response& res, const json& body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void send_error(httplib::Response& res, const TallyError& e) {
    int status = status_for(e);
    log_event(status >= 500 ? "ERROR" : "WARN", std::string(e.kind()) + ": " + e.what());
    send_json(res, error_view(e), status);
}

void send_bad_request(httplib::Response& res, const std::string& message) {
    send_json(res, {{"error", message}, {"kind", "BadRequest"}}, 400);
}

json parse_body(const httplib::Request& req) {
    if (req.body.empty()) return json::object();
    json body = json::parse(req.body);
    if (!body.is_object()) {
        throw InvalidInputError("Request body must be a JSON object.");
    }
    return body;
}

// Accepts "12.50" or 12.5 for amount fields.
std::string amount_field(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) return "";
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number()) {
        return format_amount(parse_amount_number(it->get<double>()));
    }
    throw InvalidAmountError(std::string("Field '") + key + "' must be a number.");
}

std::string string_field(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) return "";
    if (!it->is_string()) {
        throw InvalidInputError(std::string("Field '") + key + "' must be text.");
    }
    return it->get<std::string>();
}

// ?year=2025&month=1, defaulting to the current month.
YearMonth month_params(const httplib::Request& req) {
    YearMonth ym = current_year_month();
    try {
        if (req.has_param("year")) ym.year = std::stoi(req.get_param_value("year"));
        if (req.has_param("month")) ym.month = std::stoi(req.get_param_value("month"));
    } catch (const std::exception&) {
        throw InvalidInputError("Year and month must be whole numbers.");
    }
    if (ym.month < 1 || ym.month > 12) {
        throw InvalidInputError("Month must be between 1 and 12.");
    }
    return ym;
}

bool current_pin_ok(const SettingsStore& settings, const json& body) {
    if (!settings.has_pin()) return true;
    return verify(string_field(body, "current"), *settings.pin_credential());
}

void send_wrong_pin(httplib::Response& res) {
    log_event("WARN", "Settings change blocked: wrong current PIN.");
    send_json(res, {{"error", "Wrong PIN."}, {"kind", "WrongPin"}}, 403);
}

bool is_authenticated(const httplib::Request& req, const SessionGuard& session) {
    return session.accepts(req.get_header_value("Cookie"), req.get_header_value(SESSION_HEADER));
}

// GET /?session=<token>: the link printed at startup.
bool is_opening_link(const httplib::Request& req, const SessionGuard& session) {
    return req.method == "GET" && req.path == "/" && req.has_param("session")
        && session.matches(req.get_param_value("session"));
}

// Runs a handler body and turns every failure into a JSON notification.
template <typename Fn>
void guarded(httplib::Response& res, Fn&& fn) {
    try {
        fn();
    } catch (const TallyError& e) {
        send_error(res, e);
    } catch (const json::exception& e) {
        log_event("WARN", std::string("Malformed request: ") + e.what());
        send_bad_request(res, "Invalid request format.");
    }
}

} // namespace

void register_routes(httplib::Server& svr, AppContext& app) {
    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        log_event("DEBUG", "API Request: " + req.method + " " + req.path + " -> Status " + std::to_string(res.status));
    });

    // === [SEARCH: REQUEST ADMISSION] ===
    svr.set_pre_routing_handler([&](const httplib::Request& req, httplib::Response& res) {
        if (is_opening_link(req, app.session)) return httplib::Server::HandlerResponse::Unhandled;
        if (!is_authenticated(req, app.session)) {
            log_event("WARN", "Rejected unauthenticated " + req.method + " " + req.path);
            res.status = 401;
            res.set_content("401 Unauthorized - open the link printed at startup", "text/plain");
            return httplib::Server::HandlerResponse::Handled;
        }
        if (req.method == "POST" && !is_json_content_type(req.get_header_value("Content-Type"))) {
            log_event("WARN", "Rejected non-JSON POST to " + req.path);
            send_json(res, {{"error", "Content-Type must be application/json."}, {"kind", "UnsupportedMediaType"}}, 415);
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });

    // === [SEARCH: UI RENDERER] ===
    svr.Get("/", [&](const httplib::Request& req, httplib::Response& res) {
        if (is_opening_link(req, app.session)) {
            // Trade the one-off link for the cookie and drop the token from the address bar.
            res.set_header("Set-Cookie", app.session.cookie());
            res.set_redirect("/", 303);
            return;
        }
        try {
            Snapshot snap = app.records.snapshot();
            YearMonth ym = current_year_month();

            DashboardData data;
            data.totals = totals(*snap);
            data.rating = rating(data.totals.net, app.config.rating_scale);
            data.month = monthly_report(*snap, ym.year, ym.month, app.config.top_categories);
            data.has_budgets = !app.settings.list_budgets().empty();
            data.warnings = budget_warnings(*snap, app.settings.list_budgets(), ym.year, ym.month,
                                            app.config.near_threshold_percent);
            data.series = monthly_series(*snap, ym.year, ym.month, 12);
            data.recent = history_order(*snap);
            if (data.recent.size() > DASHBOARD_HISTORY_ROWS) data.recent.resize(DASHBOARD_HISTORY_ROWS);

            std::string template_path = (std::filesystem::path(app.config.template_dir) / "dashboard.html").string();
            res.status = 200;
            res.set_content(ViewEngine::render_template(template_path, dashboard_context(data)), "text/html");
        } catch (const TallyError& e) {
            log_event("ERROR", std::string("Dashboard render failed: ") + e.what());
            res.status = 500;
            res.set_content("System Error: Failed to render interface.", "text/plain");
        }
    });

    // === [SEARCH: TRANSACTIONS] ===
    svr.Get("/api/transactions", [&](const httplib::Request&, httplib::Response& res) {
        send_json(res, transactions_view(history_order(*app.records.snapshot())));
    });

    svr.Post("/api/transactions/add", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] {
            json body = parse_body(req);
            Transaction t = app.records.add(string_field(body, "type"),
                                            string_field(body, "date"),
                                            amount_field(body, "amount"),
                                            string_field(body, "category"),
                                            string_field(body, "note"));
            send_json(res, {{"status", "SUCCESS"}, {"transaction", transaction_view(t)}});
        });
    });

    svr.Post("/api/transactions/delete", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] {
            json body = parse_body(req);
            if (!body.contains("ids") || !body["ids"].is_array()) {
                throw InvalidInputError("Field 'ids' must be a list of transaction ids.");
            }
            std::set<int64_t> ids;
            for (const auto& id : body["ids"]) {
                ids.insert(id.get<int64_t>());
            }
            size_t removed = app.records.remove(ids);
            send_json(res, {{"status", "SUCCESS"}, {"removed", removed}});
        });
    });

    svr.Post("/api/transactions/undo", [&](const httplib::Request&, httplib::Response& res) {
        guarded(res, [&] {
            Transaction undone = app.records.undo_last();
            send_json(res, {{"status", "SUCCESS"}, {"transaction", transaction_view(undone)}});
        });
    });

    svr.Post("/api/transactions/reset", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] {
            json body = parse_body(req);
            if (string_field(body, "confirmation") != RESET_CONFIRMATION) {
                throw InvalidInputError(std::string("Type \"") + RESET_CONFIRMATION + "\" to confirm deleting all transactions.");
            }
            app.records.reset_all();
            send_json(res, {{"status", "SUCCESS"}});
        });
    });

    // === [SEARCH: REPORTS] ===
    svr.Get("/api/summary", [&](const httplib::Request&, httplib::Response& res) {
        guarded(res, [&] {
            Snapshot snap = app.records.snapshot();
            Totals t = totals(*snap);
            send_json(res, {
                {"totals", totals_view(t)},
                {"rating", rating_view(rating(t.net, app.config.rating_scale))},
                {"expense_by_category", ranked_view(rank_categories(category_breakdown(*snap, Kind::Expense)))},
                {"income_by_category", ranked_view(rank_categories(category_breakdown(*snap, Kind::Income)))}
            });
        });
    });

    svr.Get("/api/reports/monthly", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] {
            YearMonth ym = month_params(req);
            MonthlyReport report = monthly_report(*app.records.snapshot(), ym.year, ym.month, app.config.top_categories);
            send_json(res, monthly_report_view(report));
        });
    });

    svr.Get("/api/reports/series", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] {
            YearMonth ym = month_params(req);
            send_json(res, series_view(monthly_series(*app.records.snapshot(), ym.year, ym.month, 12)));
        });
    });

    // === [SEARCH: BUDGETS] ===
    svr.Get("/api/budgets", [&](const httplib::Request&, httplib::Response& res) {
        send_json(res, budgets_view(app.settings.list_budgets()));
    });

    svr.Get("/api/budgets/warnings", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] {
            YearMonth ym = month_params(req);
            send_json(res, warnings_view(budget_warnings(*app.records.snapshot(), app.settings.list_budgets(),
                                                         ym.year, ym.month, app.config.near_threshold_percent)));
        });
    });

    svr.Post("/api/budgets/set", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] {
            json body = parse_body(req);
            app.settings.set_budget(string_field(body, "category"), amount_field(body, "amount"));
            send_json(res, {{"status", "SUCCESS"}, {"budgets", budgets_view(app.settings.list_budgets())}});
        });
    });

    svr.Post("/api/budgets/remove", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] {
            json body = parse_body(req);
            bool removed = app.settings.remove_budget(string_field(body, "category"));
            send_json(res, {{"status", "SUCCESS"}, {"removed", removed}});
        });
    });

    // === [SEARCH: SETTINGS & PIN ROUTES] ===
    svr.Post("/api/settings/pin", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] {
            json body = parse_body(req);
            if (!current_pin_ok(app.settings, body)) {
                send_wrong_pin(res);
                return;
            }
            std::string new_pin = string_field(body, "new");
            if (body.contains("confirm") && string_field(body, "confirm") != new_pin) {
                throw InvalidPinError("PINs do not match.");
            }
            app.settings.set_pin(new_pin);
            send_json(res, {{"status", "SUCCESS"}});
        });
    });

    svr.Post("/api/settings/pin/remove", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] {
            json body = parse_body(req);
            if (!app.settings.has_pin()) {
                send_json(res, {{"status", "SUCCESS"}, {"message", "No PIN is set."}});
                return;
            }
            if (!current_pin_ok(app.settings, body)) {
                send_wrong_pin(res);
                return;
            }
            app.settings.remove_pin();
            send_json(res, {{"status", "SUCCESS"}});
        });
    });

    // === [SEARCH: EXPORT] ===
    svr.Post("/api/export/csv", [&](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [&] {
            json body = parse_body(req);
            std::string path = export_file_path(app.config.data_dir, string_field(body, "name"));
            Snapshot snap = app.records.snapshot();
            if (snap->empty()) {
                throw EmptyStoreError("No transactions to export.");
            }
            size_t rows = export_csv(*snap, path);
            send_json(res, {{"status", "SUCCESS"}, {"rows", rows}, {"path", path}});
        });
    });

    // === [SEARCH: SYSTEM ROUTES] ===
    svr.Get("/api/system/logs", [&](const httplib::Request&, httplib::Response& res) {
        json response;
        response["logs"] = recent_logs();
        send_json(res, response);
    });
}

bool run_http_server(AppContext& app) {
    httplib::Server svr;

    // One worker: the stores are single-threaded and every call is serialized.
    svr.new_task_queue = [] { return new httplib::ThreadPool(1); };

    register_routes(svr, app);

    log_event("INFO", "Tally server running on " + app.config.bind_address + ":" + std::to_string(app.config.port));
    if (!svr.listen(app.config.bind_address, app.config.port)) {
        log_event("FATAL", "Cannot listen on " + app.config.bind_address + ":" + std::to_string(app.config.port));
        return false;
    }
    return true;
}

} // namespace tally
