#include "../include/config.hpp"
#include "../include/util.hpp"
#include "../include/log.hpp"
#include <cstdlib>

AppConfig load_config_from_env() {
    AppConfig cfg;
    cfg.db_path = getenv_or("CHATLIST_DB_PATH", cfg.db_path);
    cfg.env_file = getenv_or("CHATLIST_ENV_FILE", cfg.env_file);
    cfg.log_file = getenv_or("CHATLIST_LOG_FILE", cfg.log_file);
    cfg.log_level = getenv_or("CHATLIST_LOG_LEVEL", cfg.log_level);
    if (const char* p = std::getenv("CHATLIST_PORT")) {
        try {
            cfg.port = std::stoi(p);
        } catch (const std::exception&) {
            log_warn(std::string("ignoring invalid CHATLIST_PORT '") + p + "'");
        }
    }
    return cfg;
}

void apply_logging(const AppConfig& cfg) {
    LogLevel level = LogLevel::Info;
    if (!parse_log_level(cfg.log_level, level)) {
        log_warn("unknown log level '" + cfg.log_level + "', using info");
    }
    log_set_level(level);
    log_set_file(cfg.log_file);
}
