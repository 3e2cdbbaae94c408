/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: config.cpp
 * ============================================================================
 */

#include "config.hpp"
#include "atomic_file.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace tally {

namespace {

std::string env_or(const EnvLookup& env, const char* key, const std::string& fallback) {
    const char* value = env(key);
    return (value && *value) ? std::string(value) : fallback;
}

int positive_int(const json& j, const char* key) {
    if (!j.is_number_integer() || j.get<long long>() <= 0 || j.get<long long>() > 1000000000LL) {
        throw CorruptDataError(std::string("Config key '") + key + "' must be a positive integer.");
    }
    return j.get<int>();
}

} // namespace

std::string Config::transactions_path() const {
    return (std::filesystem::path(data_dir) / "transactions.json").string();
}

std::string Config::settings_path() const {
    return (std::filesystem::path(data_dir) / "settings.json").string();
}

void apply_config_json(Config& config, const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw CorruptDataError(std::string("Configuration file is corrupt: ") + e.what());
    }
    if (!doc.is_object()) {
        throw CorruptDataError("Configuration file must hold a JSON object.");
    }

    if (doc.contains("top_categories")) {
        config.top_categories = static_cast<size_t>(positive_int(doc["top_categories"], "top_categories"));
    }
    if (doc.contains("near_threshold_percent")) {
        int pct = positive_int(doc["near_threshold_percent"], "near_threshold_percent");
        if (pct > 100) {
            throw CorruptDataError("Config key 'near_threshold_percent' must be at most 100.");
        }
        config.near_threshold_percent = pct;
    }
    if (doc.contains("pin_kdf_iterations")) {
        config.pin_kdf_iterations = positive_int(doc["pin_kdf_iterations"], "pin_kdf_iterations");
    }
    if (doc.contains("max_pin_attempts")) {
        config.max_pin_attempts = positive_int(doc["max_pin_attempts"], "max_pin_attempts");
    }
    if (doc.contains("on_corrupt")) {
        const json& policy = doc["on_corrupt"];
        if (policy == "abort") {
            config.on_corrupt = CorruptPolicy::Abort;
        } else if (policy == "start-empty") {
            config.on_corrupt = CorruptPolicy::StartEmpty;
        } else {
            throw CorruptDataError("Config key 'on_corrupt' must be \"abort\" or \"start-empty\".");
        }
    }
    if (doc.contains("rating_tiers")) {
        const json& tiers = doc["rating_tiers"];
        if (!tiers.is_array() || tiers.empty()) {
            throw CorruptDataError("Config key 'rating_tiers' must be a non-empty list.");
        }
        RatingScale scale;
        for (const auto& tier : tiers) {
            if (!tier.is_object() || !tier.contains("label") || !tier["label"].is_string()) {
                throw CorruptDataError("Every rating tier needs a label.");
            }
            RatingTier t;
            t.label = tier["label"].get<std::string>();
            t.message = tier.value("message", std::string());
            // A tier without "min" is the catch-all floor.
            if (tier.contains("min")) {
                if (!tier["min"].is_number()) {
                    throw CorruptDataError("Rating tier '" + t.label + "' has a non-numeric min.");
                }
                t.min = from_decimal(tier["min"].get<double>());
            } else {
                t.min = std::numeric_limits<money_cents>::min();
            }
            scale.push_back(t);
        }
        config.rating_scale = scale;
    }
}

Config load_config(const EnvLookup& env) {
    Config config;
    config.data_dir = env_or(env, "TALLY_DATA_DIR", config.data_dir);
    config.bind_address = env_or(env, "TALLY_BIND", config.bind_address);
    config.template_dir = env_or(env, "TALLY_TEMPLATE_DIR", config.template_dir);
    config.config_file = env_or(env, "TALLY_CONFIG",
                                (std::filesystem::path(config.data_dir) / "tally_config.json").string());

    std::string port = env_or(env, "TALLY_PORT", "");
    if (!port.empty()) {
        try {
            int parsed = std::stoi(port);
            if (parsed <= 0 || parsed > 65535) throw std::out_of_range("port");
            config.port = parsed;
        } catch (const std::exception&) {
            log_event("WARN", "TALLY_PORT '" + port + "' is not a valid port. Using " + std::to_string(config.port) + ".");
        }
    }

    std::optional<std::string> text = read_file(config.config_file);
    if (!text) {
        log_event("WARN", "Config file " + config.config_file + " missing. Using system defaults.");
        return config;
    }
    apply_config_json(config, *text);
    log_event("INFO", "Configuration loaded from " + config.config_file);
    return config;
}

Config load_config() {
    return load_config([](const char* key) -> const char* { return std::getenv(key); });
}

} // namespace tally
