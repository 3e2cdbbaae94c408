#include <gtest/gtest.h>
#include "ViewEngine.hpp"
#include "test_helpers.hpp"
#include "views.hpp"

using namespace tally;
using namespace tally::test_support;

TEST(ViewsTest, AmountsLeaveAsTwoDecimalStrings) {
    Transaction t = make_tx(42, "2025-01-05", Kind::Income, 100000, "Salary", "2025-01-05T08:00:00");
    json view = transaction_view(t);
    EXPECT_EQ(view["id"], 42);
    EXPECT_EQ(view["type"], "income");
    EXPECT_EQ(view["amount"], "1000.00");

    Totals totals{100000, 105000, -5000};
    json tv = totals_view(totals);
    EXPECT_EQ(tv["net"], "-50.00");
}

TEST(ViewsTest, WarningPercentIsRoundedToOneDecimal) {
    BudgetWarning w;
    w.category = "Food";
    w.status = BudgetStatus::Near;
    w.spent = 8333;
    w.budget = 10000;
    w.percent = 83.33;
    json view = warnings_view({w});
    ASSERT_EQ(view.size(), 1u);
    EXPECT_EQ(view[0]["status"], "NEAR");
    EXPECT_DOUBLE_EQ(view[0]["percent"].get<double>(), 83.3);
}

TEST(ViewsTest, ErrorsMapToHttpStatus) {
    EXPECT_EQ(status_for(InvalidAmountError("bad")), 400);
    EXPECT_EQ(status_for(InvalidKindError("bad")), 400);
    EXPECT_EQ(status_for(InvalidPinError("bad")), 400);
    EXPECT_EQ(status_for(AuthExhausted("locked")), 403);
    EXPECT_EQ(status_for(EmptyStoreError("empty")), 409);
    EXPECT_EQ(status_for(IOFailure("disk")), 500);
    EXPECT_EQ(status_for(CorruptDataError("bad file")), 500);

    json err = error_view(InvalidDateError("Date must be YYYY-MM-DD."));
    EXPECT_EQ(err["kind"], "InvalidDateError");
    EXPECT_EQ(err["error"], "Date must be YYYY-MM-DD.");
}

TEST(ViewsTest, EmptyDashboardShowsPlaceholders) {
    DashboardData data;
    data.rating = rating(0, default_rating_scale());
    data.month.year = 2025;
    data.month.month = 3;

    auto ctx = dashboard_context(data);
    EXPECT_EQ(ctx["MONTH_LABEL"], "2025-03");
    EXPECT_EQ(ctx["RATING_LABEL"], "Tight");
    EXPECT_EQ(ctx["BUDGET_WARNINGS"], "<li>No budgets set.</li>");
    EXPECT_NE(ctx["HISTORY_ROWS"].find("No transactions yet."), std::string::npos);
    EXPECT_NE(ctx["TOP_CATEGORY_ROWS"].find("No transactions for that month."), std::string::npos);

    data.has_budgets = true;
    EXPECT_EQ(dashboard_context(data)["BUDGET_WARNINGS"], "<li>All budgets look OK.</li>");
}

TEST(ViewsTest, DashboardListsWarningsAndEscapesUserText) {
    DashboardData data;
    data.has_budgets = true;
    BudgetWarning w;
    w.category = "Food";
    w.status = BudgetStatus::Over;
    w.spent = 20500;
    w.budget = 10000;
    w.percent = 205.0;
    data.warnings.push_back(w);

    Transaction t = make_tx(7, "2025-03-01", Kind::Expense, 1250, "<b>Snacks</b>");
    t.note = "Tom & Jerry's";
    data.recent.push_back(t);

    auto ctx = dashboard_context(data);
    EXPECT_EQ(ctx["BUDGET_WARNINGS"], "<li class='over'>OVER: Food 205.00 / 100.00 (205%)</li>");
    EXPECT_NE(ctx["HISTORY_ROWS"].find("&lt;b&gt;Snacks&lt;/b&gt;"), std::string::npos);
    EXPECT_NE(ctx["HISTORY_ROWS"].find("Tom &amp; Jerry&#39;s"), std::string::npos);
    EXPECT_EQ(ctx["HISTORY_ROWS"].find("<b>"), std::string::npos);
}

TEST(ViewsTest, TemplateTagsAreReplacedEverywhere) {
    std::string html = ViewEngine::render_string("<p>{{NET_TOTAL}}</p><p>{{NET_TOTAL}}</p>{{UNKNOWN}}",
                                                 {{"NET_TOTAL", "700.00"}});
    EXPECT_EQ(html, "<p>700.00</p><p>700.00</p>{{UNKNOWN}}");
}

TEST(ViewsTest, UserTextThatLooksLikeATagStaysLiteral) {
    DashboardData data;
    data.totals = Totals{123456, 0, 123456};
    Transaction t = make_tx(3, "2025-03-01", Kind::Expense, 100, "{{SERIES_ROWS}}");
    t.note = "{{NET_TOTAL}}";
    data.recent.push_back(t);

    std::string html = ViewEngine::render_string("<b>{{NET_TOTAL}}</b><table>{{HISTORY_ROWS}}</table>",
                                                 dashboard_context(data));
    EXPECT_NE(html.find("<b>1234.56</b>"), std::string::npos);
    EXPECT_NE(html.find("<td>{{NET_TOTAL}}</td>"), std::string::npos);
    EXPECT_NE(html.find("<td>{{SERIES_ROWS}}</td>"), std::string::npos);
    EXPECT_EQ(html.find("<td>1234.56</td>"), std::string::npos);
}

TEST(ViewsTest, MissingTemplateIsAnIOFailure) {
    TempDir dir;
    EXPECT_THROW(ViewEngine::render_template(dir.file("missing.html"), {}), IOFailure);
}
