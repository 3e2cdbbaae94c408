#include <gtest/gtest.h>
#include "dates.hpp"

using namespace tally;

TEST(DatesTest, ValidatesCalendarDates) {
    EXPECT_TRUE(is_valid_date("2025-01-05"));
    EXPECT_TRUE(is_valid_date("2024-02-29"));
    EXPECT_TRUE(is_valid_date("2000-02-29"));
    EXPECT_FALSE(is_valid_date("1900-02-29"));
    EXPECT_FALSE(is_valid_date("2025-02-29"));
    EXPECT_FALSE(is_valid_date("2025-13-01"));
    EXPECT_FALSE(is_valid_date("2025-04-31"));
    EXPECT_FALSE(is_valid_date("2025-1-5"));
    EXPECT_FALSE(is_valid_date("05/01/2025"));
    EXPECT_FALSE(is_valid_date(""));
}

TEST(DatesTest, TodayIsAValidDate) {
    EXPECT_TRUE(is_valid_date(today_iso()));
    std::string stamp = now_iso_timestamp();
    ASSERT_EQ(stamp.size(), 19u);
    EXPECT_EQ(stamp[10], 'T');
    EXPECT_TRUE(is_valid_date(stamp.substr(0, 10)));
}

TEST(DatesTest, MonthPrefixIsZeroPadded) {
    EXPECT_EQ(month_prefix(2025, 1), "2025-01-");
    EXPECT_EQ(month_prefix(2025, 12), "2025-12-");
}

TEST(DatesTest, AddMonthsCrossesYearBoundaries) {
    YearMonth back = add_months(YearMonth{2025, 1}, -1);
    EXPECT_EQ(back.year, 2024);
    EXPECT_EQ(back.month, 12);

    YearMonth far_back = add_months(YearMonth{2025, 3}, -11);
    EXPECT_EQ(far_back.year, 2024);
    EXPECT_EQ(far_back.month, 4);

    YearMonth forward = add_months(YearMonth{2024, 11}, 3);
    EXPECT_EQ(forward.year, 2025);
    EXPECT_EQ(forward.month, 2);
}
