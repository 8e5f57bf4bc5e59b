#include "../include/secrets.hpp"
#include "../include/util.hpp"
#include "../include/log.hpp"
#include <sstream>
#include <cstdlib>

static std::optional<std::string> non_blank(const std::string& v) {
    if (trim(v).empty()) return std::nullopt;
    return v;
}

std::optional<std::string> EnvSecretResolver::resolve(const std::string& key) const {
    const char* v = std::getenv(key.c_str());
    if (!v) return std::nullopt;
    return non_blank(v);
}

std::map<std::string, std::string> parse_dotenv(const std::string& text) {
    std::map<std::string, std::string> out;
    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        auto t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        if (t.rfind("export ", 0) == 0) t = trim(t.substr(7));
        auto eq = t.find('=');
        if (eq == std::string::npos) continue;
        auto key = trim(t.substr(0, eq));
        auto val = trim(t.substr(eq + 1));
        if (key.empty()) continue;
        if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'') && val.back() == val.front()) {
            val = val.substr(1, val.size() - 2);
        } else {
            auto hash = val.find(" #");
            if (hash != std::string::npos) val = trim(val.substr(0, hash));
        }
        out[key] = val;
    }
    return out;
}

DotEnvSecretResolver::DotEnvSecretResolver(const std::filesystem::path& env_file) {
    std::error_code ec;
    if (!std::filesystem::exists(env_file, ec)) {
        log_debug("no env file at " + env_file.string() + ", using process environment only");
        return;
    }
    values_ = parse_dotenv(read_text_file(env_file));
    log_debug("loaded " + std::to_string(values_.size()) + " entries from " + env_file.string());
}

std::optional<std::string> DotEnvSecretResolver::resolve(const std::string& key) const {
    // variables already present in the environment take precedence over the file
    if (auto v = env_.resolve(key)) return v;
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return non_blank(it->second);
}

std::optional<std::string> MapSecretResolver::resolve(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return non_blank(it->second);
}
