#include "../include/settings_store.hpp"
#include "../include/database.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"

SettingsStore::SettingsStore(Database& db) : db_(db) {}

const std::map<std::string, std::string>& SettingsStore::defaults() {
    static const std::map<std::string, std::string> d = {
        {SETTING_TIMEOUT, "30"},
        {SETTING_MAX_RESPONSE_LENGTH, "10000"},
        {SETTING_VERIFY_SSL, "true"},
        {"auto_save", "false"},
        {"theme", "light"},
        {"font_size", "10"},
        {"export_format", "markdown"},
        {"prompt_improver_enabled", "true"},
        {"prompt_improver_model", ""}
    };
    return d;
}

std::string SettingsStore::default_for(const std::string& key) {
    auto it = defaults().find(key);
    return it == defaults().end() ? std::string() : it->second;
}

std::optional<std::string> SettingsStore::find(const std::string& key) {
    auto lk = db_.lock();
    Statement st(db_.handle(), "SELECT value FROM settings WHERE key = ?;");
    st.bind(1, key);
    if (!st.step()) return std::nullopt;
    return st.column_text(0);
}

std::string SettingsStore::get(const std::string& key) {
    if (auto v = find(key)) return *v;
    return default_for(key);
}

void SettingsStore::set(const std::string& key, const std::string& value) {
    if (trim(key).empty()) {
        throw ChatlistError(ErrorKind::InvalidArgument, "setting key must not be empty");
    }
    auto lk = db_.lock();
    Statement st(db_.handle(),
                 "INSERT INTO settings (key, value) VALUES (?, ?) "
                 "ON CONFLICT(key) DO UPDATE SET value = excluded.value;");
    st.bind(1, key);
    st.bind(2, value);
    st.step();
}

std::map<std::string, std::string> SettingsStore::all() {
    auto lk = db_.lock();
    std::map<std::string, std::string> out;
    Statement st(db_.handle(), "SELECT key, value FROM settings ORDER BY key;");
    while (st.step()) {
        out[st.column_text(0)] = st.column_text(1);
    }
    return out;
}

long long SettingsStore::get_int(const std::string& key) {
    std::string raw = trim(get(key));
    try {
        size_t used = 0;
        long long v = std::stoll(raw, &used);
        if (used == raw.size()) return v;
    } catch (const std::exception&) {
        // reported below
    }
    throw ChatlistError(ErrorKind::InvalidSetting,
                        "setting '" + key + "' is not an integer: '" + raw + "'");
}

long long SettingsStore::get_positive_int(const std::string& key) {
    long long v = get_int(key);
    if (v <= 0) {
        throw ChatlistError(ErrorKind::InvalidSetting,
                            "setting '" + key + "' must be positive, got " + std::to_string(v));
    }
    return v;
}

bool SettingsStore::get_bool(const std::string& key) {
    std::string raw = get(key);
    bool v = false;
    if (!parse_bool(raw, v)) {
        throw ChatlistError(ErrorKind::InvalidSetting,
                            "setting '" + key + "' is not a boolean: '" + raw + "'");
    }
    return v;
}
