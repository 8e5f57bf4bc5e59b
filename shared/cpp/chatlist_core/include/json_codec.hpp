#pragma once
#include <nlohmann/json.hpp>
#include "prompt_store.hpp"
#include "model_registry.hpp"
#include "result_store.hpp"
#include "outcome.hpp"

nlohmann::json to_json(const Prompt& p);
nlohmann::json to_json(const Provider& p);
nlohmann::json to_json(const ResultRecord& r);
nlohmann::json to_json(const DispatchOutcome& o);

// Missing fields keep Provider defaults; name, api_url and api_id are validated by the registry.
Provider provider_from_json(const nlohmann::json& j, Provider base = {});
