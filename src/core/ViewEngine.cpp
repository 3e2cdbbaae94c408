/*
 * Tally: Personal Finance Tracker
 * Copyright (c) 2026 Cel-Tech-Serv Pty Ltd
 * * ViewEngine.cpp - Implementation of the dashboard template assembler
 */

#include "ViewEngine.hpp"
#include "atomic_file.hpp"
#include "errors.hpp"
#include "logger.hpp"

namespace tally {

std::string ViewEngine::html_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c;
        }
    }
    return out;
}

// Single left-to-right pass: inserted values are never scanned for tags, so
// user text that looks like {{NET_TOTAL}} stays literal.
std::string ViewEngine::render_string(const std::string& html, const std::map<std::string, std::string>& context) {
    std::string out;
    out.reserve(html.size());
    size_t pos = 0;
    while (pos < html.size()) {
        size_t open = html.find("{{", pos);
        if (open == std::string::npos) break;
        size_t close = html.find("}}", open + 2);
        if (close == std::string::npos) break;

        out.append(html, pos, open - pos);
        auto tag = context.find(html.substr(open + 2, close - open - 2));
        if (tag != context.end()) {
            out += tag->second;
        } else {
            out.append(html, open, close + 2 - open);
        }
        pos = close + 2;
    }
    out.append(html, pos, std::string::npos);
    return out;
}

std::string ViewEngine::render_template(const std::string& template_path, const std::map<std::string, std::string>& context) {
    std::optional<std::string> html = read_file(template_path);
    if (!html) {
        log_event("ERROR", "Failed to open template at " + template_path);
        throw IOFailure("Dashboard template missing: " + template_path);
    }
    return render_string(*html, context);
}

} // namespace tally
