#include "../include/util.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

std::string read_text_file(const std::filesystem::path& p) {
    std::ifstream f(p);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::string trim(const std::string& s) {
    auto is_space = [](unsigned char c){ return std::isspace(c) != 0; };
    auto b = std::find_if_not(s.begin(), s.end(), is_space);
    auto e = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    return b < e ? std::string(b, e) : std::string();
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

bool parse_bool(const std::string& s, bool& out) {
    auto v = to_lower(trim(s));
    if (v == "true" || v == "1" || v == "yes" || v == "on") { out = true; return true; }
    if (v == "false" || v == "0" || v == "no" || v == "off") { out = false; return true; }
    return false;
}

std::vector<std::string> split_tags(const std::string& joined) {
    std::vector<std::string> out;
    std::stringstream ss(joined);
    std::string part;
    while (std::getline(ss, part, ',')) {
        auto t = trim(part);
        if (!t.empty()) out.push_back(std::move(t));
    }
    return out;
}

std::string join_tags(const std::vector<std::string>& tags) {
    std::string out;
    for (auto& t : tags) {
        // a comma inside a tag would split it on the way back out
        std::string clean = t;
        std::replace(clean.begin(), clean.end(), ',', ' ');
        clean = trim(clean);
        if (clean.empty()) continue;
        if (!out.empty()) out += ",";
        out += clean;
    }
    return out;
}

static bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

std::size_t utf8_length(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if (!is_continuation(c)) ++n;
    }
    return n;
}

std::string utf8_truncate(const std::string& s, std::size_t max_chars) {
    std::size_t chars = 0;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (is_continuation((unsigned char)s[i])) continue;
        if (chars == max_chars) return s.substr(0, i);
        ++chars;
    }
    return s;
}

std::string utc_timestamp() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}
