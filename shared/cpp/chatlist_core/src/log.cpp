#include "../include/log.hpp"
#include "../include/util.hpp"
#include <iostream>
#include <fstream>
#include <mutex>
#include <atomic>

namespace {
std::mutex g_log_mtx;
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
LogSink g_sink;
std::ofstream g_file;

const char* level_tag(LogLevel level) {
    switch (level) {
    case LogLevel::Error: return "[ERROR]";
    case LogLevel::Warn: return "[WARN]";
    case LogLevel::Info: return "[chatlist]";
    case LogLevel::Debug: return "[debug]";
    }
    return "[chatlist]";
}
}

void log_set_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

bool parse_log_level(const std::string& s, LogLevel& out) {
    auto v = to_lower(trim(s));
    if (v == "error") out = LogLevel::Error;
    else if (v == "warn" || v == "warning") out = LogLevel::Warn;
    else if (v == "info") out = LogLevel::Info;
    else if (v == "debug") out = LogLevel::Debug;
    else return false;
    return true;
}

void log_set_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_log_mtx);
    g_sink = std::move(sink);
}

void log_set_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_log_mtx);
    if (g_file.is_open()) g_file.close();
    if (path.empty()) return;
    g_file.open(path, std::ios::app);
    if (!g_file) {
        std::cerr << "[WARN] cannot open log file " << path << "\n";
    }
}

void log_write(LogLevel level, const std::string& msg) {
    if (static_cast<int>(level) > g_level.load()) return;
    std::lock_guard<std::mutex> lock(g_log_mtx);
    if (g_sink) {
        g_sink(level, msg);
    } else {
        std::cerr << level_tag(level) << " " << msg << "\n";
    }
    if (g_file.is_open()) {
        g_file << utc_timestamp() << " " << level_tag(level) << " " << msg << "\n";
        g_file.flush();
    }
}
