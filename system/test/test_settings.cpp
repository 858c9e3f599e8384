#include "database/settings_store.hpp"
#include "core/errors.hpp"
#include "utils.hpp"
#include "fake_detector.hpp"
#include <gtest/gtest.h>
#include <fstream>

using namespace facevault;
using namespace facevault::testing_util;

TEST(SettingsStore, DefaultsWhenMissing) {
    TempDir tmp;
    SettingsStore store(tmp.path(), 0.6);

    EXPECT_FALSE(store.exists());
    Settings s = store.load();
    EXPECT_TRUE(s.webhook_url.empty());
    EXPECT_FALSE(s.webhook_enabled);
    EXPECT_DOUBLE_EQ(s.tolerance, 0.6);
}

TEST(SettingsStore, SaveReplacesRecord) {
    TempDir tmp;
    SettingsStore store(tmp.path());

    Settings s;
    s.webhook_url = "https://hooks.example.com/abc";
    s.webhook_enabled = true;
    s.tolerance = 0.5;
    store.save(s);
    EXPECT_TRUE(store.exists());

    Settings loaded = store.load();
    EXPECT_EQ(loaded.webhook_url, s.webhook_url);
    EXPECT_TRUE(loaded.webhook_enabled);
    EXPECT_DOUBLE_EQ(loaded.tolerance, 0.5);

    Settings cleared;
    store.save(cleared);
    loaded = store.load();
    EXPECT_TRUE(loaded.webhook_url.empty());
    EXPECT_FALSE(loaded.webhook_enabled);
    EXPECT_DOUBLE_EQ(loaded.tolerance, Config::DEFAULT_TOLERANCE);
}

TEST(SettingsStore, MissingToleranceKeepsDefault) {
    TempDir tmp;
    std::ofstream(tmp.path() / "settings.json") << R"({"webhook_url": "http://x", "webhook_enabled": true})";

    SettingsStore store(tmp.path(), 0.7);
    Settings s = store.load();
    EXPECT_EQ(s.webhook_url, "http://x");
    EXPECT_DOUBLE_EQ(s.tolerance, 0.7);
}

TEST(SettingsStore, ToleranceStoredExactly) {
    TempDir tmp;
    SettingsStore store(tmp.path());

    Settings s;
    s.tolerance = 0.6;
    store.save(s);

    auto json = read_json_file(tmp.path() / "settings.json");
    ASSERT_TRUE(json.has_value());
    EXPECT_EQ((*json)["tolerance"].asDouble(), 0.6);
    EXPECT_EQ(store.load().tolerance, 0.6);
}

TEST(SettingsStore, CorruptFileThrows) {
    TempDir tmp;
    std::ofstream(tmp.path() / "settings.json") << "{ broken";
    SettingsStore store(tmp.path());
    EXPECT_THROW(store.load(), StorageError);

    std::ofstream(tmp.path() / "settings.json") << "[1, 2]";
    EXPECT_THROW(store.load(), StorageError);
}

TEST(ShouldNotify, RequiresEnabledUrlAndNames) {
    Settings s;
    s.webhook_url = "https://hooks.example.com/abc";
    s.webhook_enabled = true;

    EXPECT_TRUE(should_notify(s, {"alice"}));
    EXPECT_FALSE(should_notify(s, {}));

    s.webhook_enabled = false;
    EXPECT_FALSE(should_notify(s, {"alice"}));

    s.webhook_enabled = true;
    s.webhook_url = "   ";
    EXPECT_FALSE(should_notify(s, {"alice"}));
}
