#pragma once
#include <string>
#include <vector>
#include <filesystem>

std::string getenv_or(const char* key, const std::string& def);
std::string read_text_file(const std::filesystem::path& p);

std::string trim(const std::string& s);
std::string to_lower(std::string s);
bool parse_bool(const std::string& s, bool& out);

// Tags are stored comma-joined; splitting trims and drops empty entries.
std::vector<std::string> split_tags(const std::string& joined);
std::string join_tags(const std::vector<std::string>& tags);

// Length and truncation count UTF-8 code points, never bytes.
std::size_t utf8_length(const std::string& s);
std::string utf8_truncate(const std::string& s, std::size_t max_chars);

// "YYYY-MM-DD HH:MM:SS" in UTC.
std::string utc_timestamp();
