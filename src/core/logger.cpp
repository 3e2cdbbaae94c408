/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: logger.cpp
 * ============================================================================
 */

#include "logger.hpp"
#include "dates.hpp"
#include <deque>
#include <iostream>
#include <mutex>

namespace tally {

namespace {

std::deque<std::string> system_logs;
std::mutex log_mutex;

} // namespace

void log_event(const std::string& level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);

    if (system_logs.size() >= LOG_CAPACITY) {
        system_logs.pop_front();
    }

    std::string log_entry = "[" + now_clock_time() + "] [" + level + "] " + message;
    system_logs.push_back(log_entry);

    if (level == "ERROR" || level == "FATAL" || level == "CRITICAL") {
        std::cerr << log_entry << std::endl;
    } else {
        std::cout << log_entry << std::endl;
    }
}

std::vector<std::string> recent_logs() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return std::vector<std::string>(system_logs.begin(), system_logs.end());
}

void clear_logs() {
    std::lock_guard<std::mutex> lock(log_mutex);
    system_logs.clear();
}

} // namespace tally
