/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: session.cpp
 * ============================================================================
 */

#include "session.hpp"
#include "crypto.hpp"
#include "dates.hpp"
#include "errors.hpp"
#include <cctype>
#include <filesystem>

namespace tally {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

} // namespace

SessionGuard::SessionGuard(std::string token) : token_(std::move(token)) {}

SessionGuard SessionGuard::generate() {
    return SessionGuard(TallyCrypto::random_hex(TOKEN_BYTES));
}

bool SessionGuard::matches(const std::string& candidate) const {
    if (token_.empty() || candidate.empty()) return false;
    return TallyCrypto::constant_time_equals(candidate, token_);
}

bool SessionGuard::accepts(const std::string& cookie_header, const std::string& token_header) const {
    if (matches(token_header)) return true;
    return matches(cookie_value(cookie_header, SESSION_COOKIE));
}

std::string SessionGuard::cookie() const {
    return std::string(SESSION_COOKIE) + "=" + token_ + "; Path=/; HttpOnly; SameSite=Strict";
}

std::string cookie_value(const std::string& header, const std::string& name) {
    size_t pos = 0;
    while (pos <= header.size()) {
        size_t end = header.find(';', pos);
        if (end == std::string::npos) end = header.size();
        std::string pair = header.substr(pos, end - pos);
        size_t eq = pair.find('=');
        if (eq != std::string::npos && trim(pair.substr(0, eq)) == name) {
            return trim(pair.substr(eq + 1));
        }
        pos = end + 1;
    }
    return "";
}

bool is_json_content_type(const std::string& header) {
    std::string media = header.substr(0, header.find(';'));
    return lower(trim(media)) == "application/json";
}

std::string export_file_path(const std::string& data_dir, const std::string& name) {
    std::string file = trim(name);
    if (file.empty()) {
        file = "tally-export-" + today_iso() + ".csv";
    }

    const std::string suffix = ".csv";
    bool plain = file.size() > suffix.size() && file[0] != '.'
              && file.compare(file.size() - suffix.size(), suffix.size(), suffix) == 0;
    for (char c : file) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '_' && c != '-') plain = false;
    }
    if (!plain) {
        throw InvalidInputError("Export name must be a plain file name ending in .csv (letters, digits, '.', '_', '-').");
    }

    return (std::filesystem::path(data_dir) / "exports" / file).string();
}

} // namespace tally
