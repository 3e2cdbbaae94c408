#include <gtest/gtest.h>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "credential_gate.hpp"
#include "errors.hpp"
#include "settings_store.hpp"
#include "test_helpers.hpp"

using namespace tally;
using namespace tally::test_support;

namespace {
// Keep PBKDF2 cheap in tests.
const int TEST_ITERATIONS = 1000;
const std::string SHA256_OF_1234 = "03ac674216f3e15c761ee1a5e255f067953623c8b388b4459e13f978d7c846f4";
}

class SettingsStoreTest : public ::testing::Test {
protected:
    TempDir dir;
    std::string path = dir.file("settings.json");
};

TEST_F(SettingsStoreTest, MissingFileMeansNoPinAndNoBudgets) {
    SettingsStore store(path, TEST_ITERATIONS);
    store.load();
    EXPECT_FALSE(store.has_pin());
    EXPECT_TRUE(store.list_budgets().empty());
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(SettingsStoreTest, BudgetsSurviveReload) {
    {
        SettingsStore store(path, TEST_ITERATIONS);
        store.load();
        store.set_budget("Food", "100");
        store.set_budget(" Rent ", "750.50");
        store.set_budget("Food", "120");
    }

    SettingsStore reloaded(path, TEST_ITERATIONS);
    reloaded.load();
    BudgetMap expected{{"Food", 12000}, {"Rent", 75050}};
    EXPECT_EQ(reloaded.list_budgets(), expected);
}

TEST_F(SettingsStoreTest, RemoveBudgetReportsWhetherItExisted) {
    SettingsStore store(path, TEST_ITERATIONS);
    store.load();
    store.set_budget("Food", "100");

    EXPECT_TRUE(store.remove_budget("Food"));
    EXPECT_FALSE(store.remove_budget("Food"));
    EXPECT_TRUE(store.list_budgets().empty());

    SettingsStore reloaded(path, TEST_ITERATIONS);
    reloaded.load();
    EXPECT_TRUE(reloaded.list_budgets().empty());
}

TEST_F(SettingsStoreTest, RejectsBadBudgetInput) {
    SettingsStore store(path, TEST_ITERATIONS);
    store.load();
    EXPECT_THROW(store.set_budget("Food", "-5"), InvalidAmountError);
    EXPECT_THROW(store.set_budget("Food", "lots"), InvalidAmountError);
    EXPECT_THROW(store.set_budget("  ", "5"), InvalidInputError);
    EXPECT_TRUE(store.list_budgets().empty());
}

TEST_F(SettingsStoreTest, PinIsStoredSaltedAndVerifies) {
    SettingsStore store(path, TEST_ITERATIONS);
    store.load();
    store.set_pin("1234");

    nlohmann::json doc = nlohmann::json::parse(read_text(path));
    std::string stored = doc["pin_hash"].get<std::string>();
    EXPECT_EQ(stored.rfind("pbkdf2_sha256$1000$", 0), 0u);
    EXPECT_EQ(stored.find("1234$"), std::string::npos);

    SettingsStore reloaded(path, TEST_ITERATIONS);
    reloaded.load();
    ASSERT_TRUE(reloaded.has_pin());
    EXPECT_TRUE(verify("1234", *reloaded.pin_credential()));
    EXPECT_FALSE(verify("4321", *reloaded.pin_credential()));
}

TEST_F(SettingsStoreTest, SamePinHashesDifferentlyEachTime) {
    SettingsStore store(path, TEST_ITERATIONS);
    store.load();
    store.set_pin("1234");
    std::string first = store.pin_credential()->encode();
    store.set_pin("1234");
    EXPECT_NE(store.pin_credential()->encode(), first);
}

TEST_F(SettingsStoreTest, EmptyPinIsRejected) {
    SettingsStore store(path, TEST_ITERATIONS);
    store.load();
    EXPECT_THROW(store.set_pin(""), InvalidPinError);
    EXPECT_FALSE(store.has_pin());
}

TEST_F(SettingsStoreTest, RemovePinWritesNull) {
    SettingsStore store(path, TEST_ITERATIONS);
    store.load();
    store.set_pin("1234");
    store.set_budget("Food", "10");
    store.remove_pin();

    EXPECT_FALSE(store.has_pin());
    nlohmann::json doc = nlohmann::json::parse(read_text(path));
    EXPECT_TRUE(doc["pin_hash"].is_null());
    EXPECT_DOUBLE_EQ(doc["budgets"]["Food"].get<double>(), 10.0);
}

TEST_F(SettingsStoreTest, AcceptsLegacyUnsaltedHash) {
    write_text(path, "{\"pin_hash\": \"" + SHA256_OF_1234 + "\", \"budgets\": {\"Food\": 100}}");
    SettingsStore store(path, TEST_ITERATIONS);
    store.load();

    ASSERT_TRUE(store.has_pin());
    EXPECT_TRUE(verify("1234", *store.pin_credential()));
    EXPECT_FALSE(verify("0000", *store.pin_credential()));
    EXPECT_TRUE(TallyCrypto::needs_rehash(*store.pin_credential(), TEST_ITERATIONS));
    EXPECT_EQ(store.pin_credential()->encode(), SHA256_OF_1234);
}

TEST_F(SettingsStoreTest, NullAndEmptyPinHashMeanNoPin) {
    write_text(path, R"({"pin_hash": null, "budgets": {}})");
    SettingsStore a(path, TEST_ITERATIONS);
    a.load();
    EXPECT_FALSE(a.has_pin());

    write_text(path, R"({"pin_hash": "", "budgets": {}})");
    SettingsStore b(path, TEST_ITERATIONS);
    b.load();
    EXPECT_FALSE(b.has_pin());
}

TEST_F(SettingsStoreTest, CorruptSettingsAreReported) {
    SettingsStore store(path, TEST_ITERATIONS);

    write_text(path, "{\"pin_hash\": ");
    EXPECT_THROW(store.load(), CorruptDataError);

    write_text(path, R"({"pin_hash": 1234})");
    EXPECT_THROW(store.load(), CorruptDataError);

    write_text(path, R"({"pin_hash": "not-a-hash"})");
    EXPECT_THROW(store.load(), CorruptDataError);

    write_text(path, R"({"budgets": {"Food": -1}})");
    EXPECT_THROW(store.load(), CorruptDataError);

    write_text(path, R"({"budgets": ["Food"]})");
    EXPECT_THROW(store.load(), CorruptDataError);
}
