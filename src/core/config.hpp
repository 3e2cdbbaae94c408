/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: config.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Runtime configuration. Locations and the listen address come from the
 * environment (TALLY_DATA_DIR, TALLY_CONFIG, TALLY_PORT, TALLY_BIND,
 * TALLY_TEMPLATE_DIR); report tuning comes from an optional JSON file.
 * ============================================================================
 */

#ifndef TALLY_CONFIG_HPP
#define TALLY_CONFIG_HPP

#include "aggregation.hpp"
#include <functional>
#include <string>

namespace tally {

    enum class CorruptPolicy { Abort, StartEmpty };

    struct Config {
        std::string data_dir = "data";
        std::string config_file;        // empty: <data_dir>/tally_config.json
        std::string bind_address = "127.0.0.1";
        int port = 8080;
        std::string template_dir = "templates";

        size_t top_categories = 10;
        int near_threshold_percent = 80;
        int pin_kdf_iterations = 200000;
        int max_pin_attempts = 3;
        CorruptPolicy on_corrupt = CorruptPolicy::Abort;
        RatingScale rating_scale = default_rating_scale();

        std::string transactions_path() const;
        std::string settings_path() const;
    };

    // Looks up an environment variable; nullptr when unset.
    typedef std::function<const char*(const char*)> EnvLookup;

    /**
     * load_config
     * Reads the environment, then applies the JSON config file on top.
     * A missing config file keeps the defaults; a malformed one throws
     * CorruptDataError.
     */
    Config load_config(const EnvLookup& env);
    Config load_config();

    // Applies the keys present in `text` to `config`. Throws CorruptDataError.
    void apply_config_json(Config& config, const std::string& text);

} // namespace tally

#endif // TALLY_CONFIG_HPP
