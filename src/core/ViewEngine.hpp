/*
 * Tally: Personal Finance Tracker
 * Copyright (c) 2026 Cel-Tech-Serv Pty Ltd
 * * ViewEngine.hpp - Dashboard template assembler
 * Fills {{TAG}} placeholders in the HTML templates served at "/".
 */

#ifndef TALLY_VIEW_ENGINE_HPP
#define TALLY_VIEW_ENGINE_HPP

#include <string>
#include <map>

namespace tally {

class ViewEngine {
public:
    // Loads the template and replaces tags with provided data.
    // Values are inserted verbatim; escape user text with html_escape first.
    // Throws IOFailure when the template file is missing.
    static std::string render_template(const std::string& template_path, const std::map<std::string, std::string>& context);

    // Same substitution on an in-memory template.
    static std::string render_string(const std::string& html, const std::map<std::string, std::string>& context);

    static std::string html_escape(const std::string& text);
};

} // namespace tally

#endif // TALLY_VIEW_ENGINE_HPP
