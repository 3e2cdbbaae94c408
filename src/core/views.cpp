/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: views.cpp
 * ============================================================================
 */

#include "views.hpp"
#include "ViewEngine.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace tally {

json transaction_view(const Transaction& t) {
    return {
        {"id", t.id},
        {"date", t.date},
        {"type", kind_to_string(t.kind)},
        {"amount", format_amount(t.amount)},
        {"category", t.category},
        {"note", t.note},
        {"created_at", t.created_at}
    };
}

json transactions_view(const std::vector<Transaction>& records) {
    json out = json::array();
    for (const auto& t : records) {
        out.push_back(transaction_view(t));
    }
    return out;
}

json totals_view(const Totals& t) {
    return {
        {"income", format_amount(t.income)},
        {"expense", format_amount(t.expense)},
        {"net", format_amount(t.net)}
    };
}

json rating_view(const RatingTier& tier) {
    return {{"label", tier.label}, {"message", tier.message}};
}

json ranked_view(const RankedCategories& ranked) {
    json out = json::array();
    for (const auto& pair : ranked) {
        out.push_back({{"category", pair.first}, {"amount", format_amount(pair.second)}});
    }
    return out;
}

json monthly_report_view(const MonthlyReport& report) {
    return {
        {"year", report.year},
        {"month", report.month},
        {"totals", totals_view(report.totals)},
        {"transaction_count", report.transaction_count},
        {"top_expenses", ranked_view(report.top_expenses)}
    };
}

json budgets_view(const BudgetMap& budgets) {
    json out = json::object();
    for (const auto& pair : budgets) {
        out[pair.first] = format_amount(pair.second);
    }
    return out;
}

json warnings_view(const std::vector<BudgetWarning>& warnings) {
    json out = json::array();
    for (const auto& w : warnings) {
        out.push_back({
            {"category", w.category},
            {"status", status_to_string(w.status)},
            {"spent", format_amount(w.spent)},
            {"budget", format_amount(w.budget)},
            {"percent", std::round(w.percent * 10.0) / 10.0}
        });
    }
    return out;
}

json series_view(const std::vector<MonthPoint>& points) {
    json out = json::array();
    for (const auto& p : points) {
        json row = totals_view(p.totals);
        row["year"] = p.year;
        row["month"] = p.month;
        out.push_back(row);
    }
    return out;
}

json error_view(const TallyError& e) {
    return {{"error", e.what()}, {"kind", e.kind()}};
}

int status_for(const TallyError& e) {
    if (dynamic_cast<const InvalidInputError*>(&e) || dynamic_cast<const InvalidPinError*>(&e)) return 400;
    if (dynamic_cast<const AuthExhausted*>(&e)) return 403;
    if (dynamic_cast<const EmptyStoreError*>(&e)) return 409;
    return 500;
}

std::map<std::string, std::string> dashboard_context(const DashboardData& data) {
    std::map<std::string, std::string> ctx;
    auto esc = ViewEngine::html_escape;

    ctx["INCOME_TOTAL"] = format_amount(data.totals.income);
    ctx["EXPENSE_TOTAL"] = format_amount(data.totals.expense);
    ctx["NET_TOTAL"] = format_amount(data.totals.net);
    ctx["RATING_LABEL"] = esc(data.rating.label);
    ctx["RATING_MESSAGE"] = esc(data.rating.message);

    std::stringstream label;
    label << std::setw(4) << std::setfill('0') << data.month.year << "-"
          << std::setw(2) << std::setfill('0') << data.month.month;
    ctx["MONTH_LABEL"] = label.str();
    ctx["MONTH_INCOME"] = format_amount(data.month.totals.income);
    ctx["MONTH_EXPENSE"] = format_amount(data.month.totals.expense);
    ctx["MONTH_NET"] = format_amount(data.month.totals.net);

    std::string top;
    for (const auto& pair : data.month.top_expenses) {
        top += "<tr><td>" + esc(pair.first) + "</td><td class='num'>" + format_amount(pair.second) + "</td></tr>";
    }
    ctx["TOP_CATEGORY_ROWS"] = top.empty() ? "<tr><td colspan='2'>No transactions for that month.</td></tr>" : top;

    std::string warnings;
    if (!data.has_budgets) {
        warnings = "<li>No budgets set.</li>";
    } else if (data.warnings.empty()) {
        warnings = "<li>All budgets look OK.</li>";
    } else {
        for (const auto& w : data.warnings) {
            std::stringstream pct;
            pct << std::fixed << std::setprecision(0) << w.percent;
            warnings += "<li class='" + std::string(w.status == BudgetStatus::Over ? "over" : "near") + "'>"
                      + status_to_string(w.status) + ": " + esc(w.category) + " "
                      + format_amount(w.spent) + " / " + format_amount(w.budget) + " (" + pct.str() + "%)</li>";
        }
    }
    ctx["BUDGET_WARNINGS"] = warnings;

    std::string series;
    for (const auto& p : data.series) {
        std::stringstream month;
        month << std::setw(4) << std::setfill('0') << p.year << "-" << std::setw(2) << std::setfill('0') << p.month;
        series += "<tr><td>" + month.str() + "</td><td class='num'>" + format_amount(p.totals.income)
                + "</td><td class='num'>" + format_amount(p.totals.expense)
                + "</td><td class='num'>" + format_amount(p.totals.net) + "</td></tr>";
    }
    ctx["SERIES_ROWS"] = series;

    std::string history;
    for (const auto& t : data.recent) {
        history += "<tr><td>" + esc(t.date) + "</td><td>" + kind_to_string(t.kind)
                 + "</td><td class='num'>" + format_amount(t.amount) + "</td><td>" + esc(t.category)
                 + "</td><td>" + esc(t.note) + "</td><td>" + std::to_string(t.id) + "</td></tr>";
    }
    ctx["HISTORY_ROWS"] = history.empty() ? "<tr><td colspan='6'>No transactions yet.</td></tr>" : history;

    return ctx;
}

} // namespace tally
