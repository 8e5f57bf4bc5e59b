#include "../include/core.hpp"

ChatlistCore::ChatlistCore(const AppConfig& cfg)
    : ChatlistCore(cfg.db_path,
                   std::make_unique<DotEnvSecretResolver>(cfg.env_file),
                   std::make_unique<CurlTransport>()) {}

ChatlistCore::ChatlistCore(const std::string& db_path, std::unique_ptr<SecretResolver> secrets_in,
                           std::unique_ptr<HttpTransport> transport_in)
    : db(db_path),
      secrets(std::move(secrets_in)),
      transport(std::move(transport_in)),
      settings(db),
      models(db, *secrets),
      prompts(db),
      results(db),
      engine(prompts, models, results, settings, *transport) {}
