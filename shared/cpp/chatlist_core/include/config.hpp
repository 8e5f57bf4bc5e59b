#pragma once
#include <string>

struct AppConfig {
    std::string db_path{"./chatlist.db"};
    std::string env_file{"./.env"};
    int port{7100};
    std::string log_file;       // empty: stderr only
    std::string log_level{"info"};
};

// CHATLIST_DB_PATH, CHATLIST_ENV_FILE, CHATLIST_PORT, CHATLIST_LOG_FILE, CHATLIST_LOG_LEVEL
AppConfig load_config_from_env();
void apply_logging(const AppConfig& cfg);
