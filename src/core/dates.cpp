/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: dates.cpp
 * ============================================================================
 */

#include "dates.hpp"
#include <chrono>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace tally {

namespace {

std::tm local_now() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm result{};
    localtime_r(&now, &result);
    return result;
}

std::string format_now(const char* pattern) {
    std::tm t = local_now();
    std::stringstream ss;
    ss << std::put_time(&t, pattern);
    return ss.str();
}

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap(year)) return 29;
    return days[month - 1];
}

} // namespace

int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string today_iso() {
    return format_now("%Y-%m-%d");
}

std::string now_iso_timestamp() {
    return format_now("%Y-%m-%dT%H:%M:%S");
}

std::string now_clock_time() {
    return format_now("%H:%M:%S");
}

YearMonth current_year_month() {
    std::tm t = local_now();
    return YearMonth{t.tm_year + 1900, t.tm_mon + 1};
}

bool is_valid_date(const std::string& date) {
    if (date.size() != 10 || date[4] != '-' || date[7] != '-') return false;
    for (size_t i = 0; i < date.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(date[i]))) return false;
    }
    int year = std::stoi(date.substr(0, 4));
    int month = std::stoi(date.substr(5, 2));
    int day = std::stoi(date.substr(8, 2));
    if (year < 1 || month < 1 || month > 12 || day < 1) return false;
    return day <= days_in_month(year, month);
}

std::string month_prefix(int year, int month) {
    std::stringstream ss;
    ss << std::setw(4) << std::setfill('0') << year << "-"
       << std::setw(2) << std::setfill('0') << month << "-";
    return ss.str();
}

YearMonth add_months(YearMonth ym, int delta) {
    int index = ym.year * 12 + (ym.month - 1) + delta;
    // Floor division keeps negative deltas correct.
    int year = index >= 0 ? index / 12 : -((-index + 11) / 12);
    int month = index - year * 12 + 1;
    return YearMonth{year, month};
}

} // namespace tally
