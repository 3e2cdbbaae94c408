/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: aggregation.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Report arithmetic over a RecordStore snapshot. Everything here is a pure
 * function of its arguments: no I/O, no caching, no hidden clock. Callers
 * pass the month they care about explicitly.
 * ============================================================================
 */

#ifndef TALLY_AGGREGATION_HPP
#define TALLY_AGGREGATION_HPP

#include "settings_store.hpp"
#include "transaction.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace tally {

    struct Totals {
        money_cents income = 0;
        money_cents expense = 0;
        money_cents net = 0;
    };

    /**
     * @brief One row of the rating table.
     * A tier applies when net >= min. The table values are illustrative
     * and not financial advice.
     */
    struct RatingTier {
        money_cents min = 0;
        std::string label;
        std::string message;
    };

    typedef std::vector<RatingTier> RatingScale;

    // Excellent >= 1000.00, Good >= 100.00, Tight >= 0.00, Deficit below.
    RatingScale default_rating_scale();

    typedef std::map<std::string, money_cents> CategoryTotals;
    typedef std::vector<std::pair<std::string, money_cents>> RankedCategories;

    struct MonthlyReport {
        int year = 0;
        int month = 0;
        Totals totals;
        size_t transaction_count = 0;
        RankedCategories top_expenses;
    };

    enum class BudgetStatus { Ok, Near, Over };

    struct BudgetWarning {
        std::string category;
        BudgetStatus status = BudgetStatus::Ok;
        money_cents spent = 0;
        money_cents budget = 0;
        double percent = 0.0;
    };

    struct MonthPoint {
        int year = 0;
        int month = 0;
        Totals totals;
    };

    Totals totals(const std::vector<Transaction>& records);

    /**
     * rating
     * Picks the first tier (in descending `min` order) whose floor `net`
     * reaches; below every floor the lowest tier is used.
     * Throws InvalidInputError for an empty scale.
     */
    RatingTier rating(money_cents net, const RatingScale& scale);

    CategoryTotals category_breakdown(const std::vector<Transaction>& records, Kind kind);

    // Descending amount, ties by category name ascending. limit 0 = all.
    RankedCategories rank_categories(const CategoryTotals& breakdown, size_t limit = 0);

    // Records whose date falls in the given calendar month.
    std::vector<Transaction> filter_month(const std::vector<Transaction>& records, int year, int month);

    MonthlyReport monthly_report(const std::vector<Transaction>& records, int year, int month, size_t top_n = 10);

    /**
     * budget_warnings
     * Near: spent >= near_percent% of the budget and spent <= budget.
     * Over: spent > budget. Zero budgets are skipped. Result is ordered by
     * category name and never contains Ok entries.
     */
    std::vector<BudgetWarning> budget_warnings(const std::vector<Transaction>& records,
                                               const BudgetMap& budgets,
                                               int year, int month,
                                               int near_percent = 80);

    // `count` months ending at (year, month), oldest first.
    std::vector<MonthPoint> monthly_series(const std::vector<Transaction>& records, int year, int month, int count = 12);

    // Newest first by (date, created_at).
    std::vector<Transaction> history_order(const std::vector<Transaction>& records);

    std::string status_to_string(BudgetStatus status);

} // namespace tally

#endif // TALLY_AGGREGATION_HPP
