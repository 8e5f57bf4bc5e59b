#pragma once
#include <string>
#include <map>
#include <optional>

class Database;

constexpr const char* SETTING_TIMEOUT = "default_timeout";
constexpr const char* SETTING_MAX_RESPONSE_LENGTH = "max_response_length";
constexpr const char* SETTING_VERIFY_SSL = "verify_ssl";

class SettingsStore {
public:
    explicit SettingsStore(Database& db);

    // Stored value, else the documented default, else empty.
    std::string get(const std::string& key);
    std::optional<std::string> find(const std::string& key);
    void set(const std::string& key, const std::string& value);
    std::map<std::string, std::string> all();

    // Typed readers throw ChatlistError(InvalidSetting) when the value does not parse.
    long long get_int(const std::string& key);
    long long get_positive_int(const std::string& key);
    bool get_bool(const std::string& key);

    static const std::map<std::string, std::string>& defaults();
    static std::string default_for(const std::string& key);

private:
    Database& db_;
};
