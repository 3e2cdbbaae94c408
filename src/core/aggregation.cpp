/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: aggregation.cpp
 * ============================================================================
 */

#include "aggregation.hpp"
#include "dates.hpp"
#include "errors.hpp"
#include <algorithm>
#include <limits>

namespace tally {

RatingScale default_rating_scale() {
    return {
        {100000, "Excellent", "Savings are comfortably ahead of spending."},
        {10000, "Good", "Income covers spending with room to spare."},
        {0, "Tight", "Income barely covers spending."},
        {std::numeric_limits<money_cents>::min(), "Deficit", "Spending exceeds income."}
    };
}

Totals totals(const std::vector<Transaction>& records) {
    Totals t;
    for (const auto& r : records) {
        if (r.kind == Kind::Income) {
            t.income += r.amount;
        } else {
            t.expense += r.amount;
        }
    }
    t.net = t.income - t.expense;
    return t;
}

RatingTier rating(money_cents net, const RatingScale& scale) {
    if (scale.empty()) {
        throw InvalidInputError("Rating scale has no tiers.");
    }

    RatingScale ordered(scale);
    std::stable_sort(ordered.begin(), ordered.end(), [](const RatingTier& a, const RatingTier& b) {
        return a.min > b.min;
    });

    for (const auto& tier : ordered) {
        if (net >= tier.min) return tier;
    }
    return ordered.back();
}

CategoryTotals category_breakdown(const std::vector<Transaction>& records, Kind kind) {
    CategoryTotals out;
    for (const auto& r : records) {
        if (r.kind != kind) continue;
        out[r.category] += r.amount;
    }
    return out;
}

RankedCategories rank_categories(const CategoryTotals& breakdown, size_t limit) {
    RankedCategories ranked(breakdown.begin(), breakdown.end());
    std::sort(ranked.begin(), ranked.end(), [](const std::pair<std::string, money_cents>& a,
                                               const std::pair<std::string, money_cents>& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    });
    if (limit > 0 && ranked.size() > limit) {
        ranked.resize(limit);
    }
    return ranked;
}

std::vector<Transaction> filter_month(const std::vector<Transaction>& records, int year, int month) {
    const std::string prefix = month_prefix(year, month);
    std::vector<Transaction> out;
    for (const auto& r : records) {
        if (r.date.compare(0, prefix.size(), prefix) == 0) out.push_back(r);
    }
    return out;
}

MonthlyReport monthly_report(const std::vector<Transaction>& records, int year, int month, size_t top_n) {
    if (month < 1 || month > 12) {
        throw InvalidInputError("Month must be between 1 and 12.");
    }

    std::vector<Transaction> subset = filter_month(records, year, month);

    MonthlyReport report;
    report.year = year;
    report.month = month;
    report.totals = totals(subset);
    report.transaction_count = subset.size();
    report.top_expenses = rank_categories(category_breakdown(subset, Kind::Expense), top_n);
    return report;
}

std::vector<BudgetWarning> budget_warnings(const std::vector<Transaction>& records,
                                           const BudgetMap& budgets,
                                           int year, int month,
                                           int near_percent) {
    std::vector<BudgetWarning> warnings;
    if (budgets.empty()) return warnings;

    CategoryTotals spent = category_breakdown(filter_month(records, year, month), Kind::Expense);

    // BudgetMap is ordered, so the output is ordered by category name.
    for (const auto& pair : budgets) {
        const money_cents limit = pair.second;
        if (limit <= 0) continue;

        auto it = spent.find(pair.first);
        const money_cents used = it == spent.end() ? 0 : it->second;

        BudgetWarning w;
        w.category = pair.first;
        w.spent = used;
        w.budget = limit;
        w.percent = static_cast<double>(used) * 100.0 / static_cast<double>(limit);

        if (used > limit) {
            w.status = BudgetStatus::Over;
        } else if (used * 100 >= limit * near_percent) {
            w.status = BudgetStatus::Near;
        } else {
            continue;
        }
        warnings.push_back(w);
    }
    return warnings;
}

std::vector<MonthPoint> monthly_series(const std::vector<Transaction>& records, int year, int month, int count) {
    std::vector<MonthPoint> points;
    for (int i = count - 1; i >= 0; --i) {
        YearMonth ym = add_months(YearMonth{year, month}, -i);
        MonthPoint p;
        p.year = ym.year;
        p.month = ym.month;
        p.totals = totals(filter_month(records, ym.year, ym.month));
        points.push_back(p);
    }
    return points;
}

std::vector<Transaction> history_order(const std::vector<Transaction>& records) {
    std::vector<Transaction> ordered(records);
    std::sort(ordered.begin(), ordered.end(), [](const Transaction& a, const Transaction& b) {
        if (a.date != b.date) return a.date > b.date;
        if (a.created_at != b.created_at) return a.created_at > b.created_at;
        return a.id > b.id;
    });
    return ordered;
}

std::string status_to_string(BudgetStatus status) {
    switch (status) {
        case BudgetStatus::Near: return "NEAR";
        case BudgetStatus::Over: return "OVER";
        default: return "OK";
    }
}

} // namespace tally
