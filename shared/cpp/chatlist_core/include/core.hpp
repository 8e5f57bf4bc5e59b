#pragma once
#include <memory>
#include <string>
#include "config.hpp"
#include "database.hpp"
#include "secrets.hpp"
#include "http.hpp"
#include "settings_store.hpp"
#include "model_registry.hpp"
#include "prompt_store.hpp"
#include "result_store.hpp"
#include "dispatch_engine.hpp"

// Owns one database connection and every component built on it.
class ChatlistCore {
public:
    // .env secrets and libcurl transport.
    explicit ChatlistCore(const AppConfig& cfg);
    ChatlistCore(const std::string& db_path, std::unique_ptr<SecretResolver> secrets,
                 std::unique_ptr<HttpTransport> transport);

    Database db;
    std::unique_ptr<SecretResolver> secrets;
    std::unique_ptr<HttpTransport> transport;
    SettingsStore settings;
    ModelRegistry models;
    PromptStore prompts;
    ResultStore results;
    DispatchEngine engine;
};
