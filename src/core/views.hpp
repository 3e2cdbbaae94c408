/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: views.hpp
 * ============================================================================
 * * DESCRIPTION:
 * JSON shapes returned by the HTTP surface. Amounts go out as two-decimal
 * strings ("1000.00") so no client ever sees a binary float.
 * ============================================================================
 */

#ifndef TALLY_VIEWS_HPP
#define TALLY_VIEWS_HPP

#include "aggregation.hpp"
#include "errors.hpp"
#include "transaction.hpp"
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace tally {

    using json = nlohmann::json;

    json transaction_view(const Transaction& t);
    json transactions_view(const std::vector<Transaction>& records);
    json totals_view(const Totals& t);
    json rating_view(const RatingTier& tier);
    json ranked_view(const RankedCategories& ranked);
    json monthly_report_view(const MonthlyReport& report);
    json budgets_view(const BudgetMap& budgets);
    json warnings_view(const std::vector<BudgetWarning>& warnings);
    json series_view(const std::vector<MonthPoint>& points);

    /**
     * @brief {"error": <reason>, "kind": <type name>} for a core failure.
     */
    json error_view(const TallyError& e);

    // HTTP status for a core failure (400, 409, 500...).
    int status_for(const TallyError& e);

    struct DashboardData {
        Totals totals;
        RatingTier rating;
        MonthlyReport month;
        std::vector<BudgetWarning> warnings;
        bool has_budgets = false;
        std::vector<MonthPoint> series;
        std::vector<Transaction> recent;   // newest first
    };

    /**
     * dashboard_context
     * Tag values for templates/dashboard.html. User text is HTML-escaped.
     */
    std::map<std::string, std::string> dashboard_context(const DashboardData& data);

} // namespace tally

#endif // TALLY_VIEWS_HPP
