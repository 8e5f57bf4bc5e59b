#include <catch2/catch.hpp>
#include "test_support.hpp"

TEST_CASE("settings are seeded with documented defaults", "[settings]") {
    TestCore t;
    auto& s = t.core->settings;
    CHECK(s.get(SETTING_TIMEOUT) == "30");
    CHECK(s.get(SETTING_MAX_RESPONSE_LENGTH) == "10000");
    CHECK(s.get(SETTING_VERIFY_SSL) == "true");
    CHECK(s.get("export_format") == "markdown");
    CHECK(s.all().size() == SettingsStore::defaults().size());
}

TEST_CASE("set upserts and keeps unknown keys", "[settings]") {
    TestCore t;
    auto& s = t.core->settings;
    s.set("my_custom_key", "abc");
    s.set(SETTING_TIMEOUT, "45");
    s.set(SETTING_TIMEOUT, "60");
    CHECK(s.get("my_custom_key") == "abc");
    CHECK(s.get(SETTING_TIMEOUT) == "60");
    auto all = s.all();
    CHECK(all.count("my_custom_key") == 1);
    CHECK_FALSE(s.find("never_set").has_value());
    CHECK(s.get("never_set").empty());
}

TEST_CASE("typed accessors reject unparsable values", "[settings]") {
    TestCore t;
    auto& s = t.core->settings;

    s.set(SETTING_TIMEOUT, " 15 ");
    CHECK(s.get_positive_int(SETTING_TIMEOUT) == 15);

    s.set(SETTING_TIMEOUT, "15s");
    CHECK_THROWS_AS(s.get_int(SETTING_TIMEOUT), ChatlistError);

    s.set(SETTING_TIMEOUT, "0");
    try {
        s.get_positive_int(SETTING_TIMEOUT);
        FAIL("expected InvalidSetting");
    } catch (const ChatlistError& e) {
        CHECK(e.kind() == ErrorKind::InvalidSetting);
    }

    s.set(SETTING_VERIFY_SSL, "Off");
    CHECK(s.get_bool(SETTING_VERIFY_SSL) == false);
    s.set(SETTING_VERIFY_SSL, "maybe");
    CHECK_THROWS_AS(s.get_bool(SETTING_VERIFY_SSL), ChatlistError);
}

TEST_CASE("dispatch policy falls back to defaults on invalid settings", "[settings][dispatch]") {
    TestCore t;
    LogCapture logs;
    t.core->settings.set(SETTING_TIMEOUT, "soon");
    t.core->settings.set(SETTING_MAX_RESPONSE_LENGTH, "-3");
    t.core->settings.set(SETTING_VERIFY_SSL, "perhaps");

    auto policy = t.core->engine.resolve_policy();
    CHECK(policy.timeout == std::chrono::seconds(30));
    CHECK(policy.max_response_length == 10000);
    CHECK(policy.verify_tls == true);
    CHECK(logs.contains(LogLevel::Warn, "default_timeout"));
    CHECK(logs.contains(LogLevel::Warn, "max_response_length"));
}

TEST_CASE("dispatch policy reads configured values", "[settings][dispatch]") {
    TestCore t;
    t.core->settings.set(SETTING_TIMEOUT, "5");
    t.core->settings.set(SETTING_MAX_RESPONSE_LENGTH, "200");
    t.core->settings.set(SETTING_VERIFY_SSL, "false");
    auto policy = t.core->engine.resolve_policy();
    CHECK(policy.timeout == std::chrono::seconds(5));
    CHECK(policy.max_response_length == 200);
    CHECK(policy.verify_tls == false);
}
