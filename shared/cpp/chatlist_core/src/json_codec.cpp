#include "../include/json_codec.hpp"

using json = nlohmann::json;

json to_json(const Prompt& p) {
    return json{
        {"id", p.id},
        {"date", p.created_at},
        {"prompt", p.text},
        {"tags", p.tags}
    };
}

json to_json(const Provider& p) {
    return json{
        {"id", p.id},
        {"name", p.name},
        {"api_url", p.api_url},
        {"api_id", p.api_id},
        {"model_name", p.model_name},
        {"is_active", p.is_active}
    };
}

json to_json(const ResultRecord& r) {
    json j = {
        {"id", r.id},
        {"prompt_id", r.prompt_id},
        {"model_id", r.model_id},
        {"model_name", r.model_name},
        {"prompt_text", r.prompt_text},
        {"response", r.response},
        {"date", r.created_at},
        {"selected", r.selected},
        {"status", result_status_name(r.status)}
    };
    if (!r.error_kind.empty()) j["error_kind"] = r.error_kind;
    return j;
}

json to_json(const DispatchOutcome& o) {
    json j = {
        {"provider_id", o.provider_id},
        {"provider_name", o.provider_name},
        {"status", o.status == OutcomeStatus::Success ? "success" : "failure"},
        {"elapsed_ms", o.elapsed.count()}
    };
    if (o.status == OutcomeStatus::Success) j["response"] = o.response_text;
    if (o.error_kind) {
        j["error_kind"] = error_kind_name(*o.error_kind);
        j["error"] = o.error_detail;
    }
    if (o.result_id) j["result_id"] = *o.result_id;
    if (!o.persist_error.empty()) j["persist_error"] = o.persist_error;
    return j;
}

Provider provider_from_json(const json& j, Provider base) {
    base.name = j.value("name", base.name);
    base.api_url = j.value("api_url", base.api_url);
    base.api_id = j.value("api_id", base.api_id);
    base.model_name = j.value("model_name", base.model_name);
    base.is_active = j.value("is_active", base.is_active);
    return base;
}
