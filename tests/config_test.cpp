#include <gtest/gtest.h>
#include <map>
#include "config.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace tally;
using namespace tally::test_support;

namespace {

EnvLookup fake_env(const std::map<std::string, std::string>& values) {
    return [values](const char* key) -> const char* {
        auto it = values.find(key);
        return it == values.end() ? nullptr : it->second.c_str();
    };
}

}

TEST(ConfigTest, DefaultsWithoutEnvironmentOrFile) {
    TempDir dir;
    Config config = load_config(fake_env({{"TALLY_DATA_DIR", dir.path()}}));

    EXPECT_EQ(config.data_dir, dir.path());
    EXPECT_EQ(config.bind_address, "127.0.0.1");
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.top_categories, 10u);
    EXPECT_EQ(config.near_threshold_percent, 80);
    EXPECT_EQ(config.max_pin_attempts, 3);
    EXPECT_EQ(config.on_corrupt, CorruptPolicy::Abort);
    EXPECT_EQ(config.rating_scale.size(), 4u);
    EXPECT_EQ(config.transactions_path(), dir.file("transactions.json"));
    EXPECT_EQ(config.settings_path(), dir.file("settings.json"));
    EXPECT_EQ(config.config_file, dir.file("tally_config.json"));
}

TEST(ConfigTest, EnvironmentOverridesLocations) {
    TempDir dir;
    Config config = load_config(fake_env({
        {"TALLY_DATA_DIR", dir.path()},
        {"TALLY_BIND", "0.0.0.0"},
        {"TALLY_PORT", "9090"},
        {"TALLY_TEMPLATE_DIR", "/srv/tally/templates"},
    }));
    EXPECT_EQ(config.bind_address, "0.0.0.0");
    EXPECT_EQ(config.port, 9090);
    EXPECT_EQ(config.template_dir, "/srv/tally/templates");
}

TEST(ConfigTest, InvalidPortKeepsDefault) {
    TempDir dir;
    EXPECT_EQ(load_config(fake_env({{"TALLY_DATA_DIR", dir.path()}, {"TALLY_PORT", "http"}})).port, 8080);
    EXPECT_EQ(load_config(fake_env({{"TALLY_DATA_DIR", dir.path()}, {"TALLY_PORT", "70000"}})).port, 8080);
}

TEST(ConfigTest, FileTunesReports) {
    TempDir dir;
    std::string file = dir.file("custom.json");
    write_text(file, R"({
        "top_categories": 5,
        "near_threshold_percent": 90,
        "pin_kdf_iterations": 50000,
        "max_pin_attempts": 5,
        "on_corrupt": "start-empty",
        "rating_tiers": [
            {"min": 500, "label": "Ahead", "message": "Keep going."},
            {"label": "Behind"}
        ]
    })");

    Config config = load_config(fake_env({{"TALLY_DATA_DIR", dir.path()}, {"TALLY_CONFIG", file}}));
    EXPECT_EQ(config.top_categories, 5u);
    EXPECT_EQ(config.near_threshold_percent, 90);
    EXPECT_EQ(config.pin_kdf_iterations, 50000);
    EXPECT_EQ(config.max_pin_attempts, 5);
    EXPECT_EQ(config.on_corrupt, CorruptPolicy::StartEmpty);

    ASSERT_EQ(config.rating_scale.size(), 2u);
    EXPECT_EQ(rating(50000, config.rating_scale).label, "Ahead");
    EXPECT_EQ(rating(49999, config.rating_scale).label, "Behind");
    EXPECT_EQ(rating(-100000, config.rating_scale).label, "Behind");
}

TEST(ConfigTest, MalformedFileIsCorrupt) {
    Config config;
    EXPECT_THROW(apply_config_json(config, "{\"top_categories\": "), CorruptDataError);
    EXPECT_THROW(apply_config_json(config, "[1, 2]"), CorruptDataError);
    EXPECT_THROW(apply_config_json(config, R"({"top_categories": 0})"), CorruptDataError);
    EXPECT_THROW(apply_config_json(config, R"({"near_threshold_percent": 150})"), CorruptDataError);
    EXPECT_THROW(apply_config_json(config, R"({"on_corrupt": "ignore"})"), CorruptDataError);
    EXPECT_THROW(apply_config_json(config, R"({"rating_tiers": []})"), CorruptDataError);
    EXPECT_THROW(apply_config_json(config, R"({"rating_tiers": [{"min": 1}]})"), CorruptDataError);

    // Nothing above was half-applied.
    EXPECT_EQ(config.top_categories, 10u);
    EXPECT_EQ(config.on_corrupt, CorruptPolicy::Abort);
}
