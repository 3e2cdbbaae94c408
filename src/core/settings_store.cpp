/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: settings_store.cpp
 * ============================================================================
 */

#include "settings_store.hpp"
#include "atomic_file.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <cctype>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace tally {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

json to_document(const Settings& s) {
    json doc;
    doc["pin_hash"] = s.pin ? json(s.pin->encode()) : json(nullptr);
    doc["budgets"] = json::object();
    for (const auto& pair : s.budgets) {
        doc["budgets"][pair.first] = to_decimal(pair.second);
    }
    return doc;
}

} // namespace

SettingsStore::SettingsStore(std::string path, int pin_iterations)
    : path_(std::move(path)), pin_iterations_(pin_iterations) {}

void SettingsStore::load() {
    remove_stale_temp_files(path_);
    std::optional<std::string> content = read_file(path_);
    if (!content) {
        log_event("INFO", "No settings file at " + path_ + ". Using defaults.");
        settings_ = Settings();
        return;
    }

    json doc;
    try {
        doc = json::parse(*content);
    } catch (const json::parse_error& e) {
        throw CorruptDataError("Settings file " + path_ + " is not valid JSON: " + e.what());
    }
    if (!doc.is_object()) {
        throw CorruptDataError("Settings file " + path_ + " does not hold an object.");
    }

    Settings loaded;

    auto pin = doc.find("pin_hash");
    if (pin != doc.end() && !pin->is_null()) {
        if (!pin->is_string()) {
            throw CorruptDataError("Settings file " + path_ + " has a non-string pin_hash.");
        }
        // An empty string was never a valid hash; treat it as "no PIN".
        if (!pin->get<std::string>().empty()) {
            loaded.pin = PinCredential::parse(pin->get<std::string>());
        }
    }

    auto budgets = doc.find("budgets");
    if (budgets != doc.end() && !budgets->is_null()) {
        if (!budgets->is_object()) {
            throw CorruptDataError("Settings file " + path_ + " has budgets that are not an object.");
        }
        for (auto it = budgets->begin(); it != budgets->end(); ++it) {
            if (!it.value().is_number() || it.value().get<double>() < 0.0) {
                throw CorruptDataError("Budget for '" + it.key() + "' is not a non-negative number.");
            }
            loaded.budgets[it.key()] = from_decimal(it.value().get<double>());
        }
    }

    settings_ = std::move(loaded);
    log_event("INFO", "Settings loaded: " + std::to_string(settings_.budgets.size()) + " budget(s), PIN "
              + (settings_.pin ? "enabled" : "disabled") + ".");
}

void SettingsStore::set_budget(const std::string& category, const std::string& amount) {
    std::string name = trim(category);
    if (name.empty()) {
        throw InvalidInputError("Category is required.");
    }
    money_cents limit = parse_amount(amount);

    Settings updated = settings_;
    updated.budgets[name] = limit;
    commit(std::move(updated));
    log_event("INFO", "Budget for '" + name + "' set to " + format_amount(limit));
}

bool SettingsStore::remove_budget(const std::string& category) {
    std::string name = trim(category);
    if (settings_.budgets.count(name) == 0) return false;

    Settings updated = settings_;
    updated.budgets.erase(name);
    commit(std::move(updated));
    log_event("INFO", "Budget for '" + name + "' removed.");
    return true;
}

void SettingsStore::set_pin(const std::string& pin) {
    if (pin.empty()) {
        throw InvalidPinError("PIN must not be empty.");
    }

    Settings updated = settings_;
    updated.pin = TallyCrypto::hash_pin(pin, pin_iterations_);
    commit(std::move(updated));
    log_event("INFO", "PIN updated.");
}

void SettingsStore::remove_pin() {
    if (!settings_.pin) return;

    Settings updated = settings_;
    updated.pin.reset();
    commit(std::move(updated));
    log_event("INFO", "PIN removed.");
}

void SettingsStore::commit(Settings updated) {
    write_file_atomic(path_, to_document(updated).dump(2));
    settings_ = std::move(updated);
}

} // namespace tally
