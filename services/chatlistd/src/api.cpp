#include "../include/api.hpp"
#include "../../../shared/cpp/chatlist_core/include/core.hpp"
#include "../../../shared/cpp/chatlist_core/include/json_codec.hpp"
#include "../../../shared/cpp/chatlist_core/include/export.hpp"
#include "../../../shared/cpp/chatlist_core/include/util.hpp"
#include "../../../shared/cpp/chatlist_core/include/log.hpp"
#include <nlohmann/json.hpp>
#include <sstream>
#include <vector>

using json = nlohmann::json;

namespace {
ApiResponse json_response(int status, const json& body) {
    return ApiResponse{status, body.dump(), "application/json"};
}

ApiResponse error_response(int status, const std::string& msg, const char* kind = nullptr) {
    json err = {{"error", msg}};
    if (kind) err["kind"] = kind;
    return json_response(status, err);
}

int status_for(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound: return 404;
    case ErrorKind::ProviderInUse: return 409;
    case ErrorKind::InvalidArgument:
    case ErrorKind::InvalidSetting: return 400;
    default: return 500;
    }
}

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty()) parts.push_back(part);
    }
    return parts;
}

int64_t parse_id(const std::string& s) {
    try {
        size_t used = 0;
        long long v = std::stoll(s, &used);
        if (used == s.size() && v > 0) return (int64_t)v;
    } catch (const std::exception&) {
        // reported below
    }
    throw ChatlistError(ErrorKind::InvalidArgument, "invalid id: " + s);
}

json parse_body(const std::string& body) {
    if (trim(body).empty()) return json::object();
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw ChatlistError(ErrorKind::InvalidArgument, "request body must be a JSON object");
    }
    return j;
}

std::string query_or(const ApiRequest& req, const std::string& key, const std::string& def) {
    auto it = req.query.find(key);
    return it == req.query.end() ? def : it->second;
}

ApiResponse route_prompts(ChatlistCore& core, const ApiRequest& req, const std::vector<std::string>& parts) {
    const std::string& m = req.method;
    if (parts.size() == 1 && m == "GET") {
        json arr = json::array();
        for (auto& p : core.prompts.list(query_or(req, "sort", "date"), query_or(req, "order", "DESC"))) {
            arr.push_back(to_json(p));
        }
        return json_response(200, arr);
    }
    if (parts.size() == 1 && m == "POST") {
        auto j = parse_body(req.body);
        std::vector<std::string> tags;
        if (j.contains("tags") && j["tags"].is_array()) tags = j["tags"].get<std::vector<std::string>>();
        else if (j.contains("tags") && j["tags"].is_string()) tags = split_tags(j["tags"].get<std::string>());
        int64_t id = core.prompts.create(j.value("prompt", std::string()), tags);
        return json_response(201, to_json(*core.prompts.find(id)));
    }
    if (parts.size() == 2 && parts[1] == "search" && m == "GET") {
        json arr = json::array();
        for (auto& p : core.prompts.search(query_or(req, "q", ""))) arr.push_back(to_json(p));
        return json_response(200, arr);
    }
    if (parts.size() >= 2) {
        int64_t id = parse_id(parts[1]);
        if (parts.size() == 2 && m == "GET") {
            auto p = core.prompts.find(id);
            if (!p) return error_response(404, "prompt not found", "NotFound");
            return json_response(200, to_json(*p));
        }
        if (parts.size() == 2 && m == "DELETE") {
            core.prompts.remove(id);
            return json_response(200, json{{"ok", true}});
        }
        if (parts.size() == 3 && parts[2] == "results" && m == "GET") {
            json arr = json::array();
            for (auto& r : core.results.find_results(id)) arr.push_back(to_json(r));
            return json_response(200, arr);
        }
        if (parts.size() == 3 && parts[2] == "dispatch" && m == "POST") {
            json arr = json::array();
            for (auto& o : core.engine.dispatch(id)) arr.push_back(to_json(o));
            return json_response(200, json{{"prompt_id", id}, {"outcomes", arr}});
        }
    }
    return error_response(404, "not found");
}

ApiResponse route_models(ChatlistCore& core, const ApiRequest& req, const std::vector<std::string>& parts) {
    const std::string& m = req.method;
    if (parts.size() == 1 && m == "GET") {
        json arr = json::array();
        bool active_only = query_or(req, "active", "") == "1" || query_or(req, "active", "") == "true";
        for (auto& p : active_only ? core.models.list_active() : core.models.list_all()) arr.push_back(to_json(p));
        return json_response(200, arr);
    }
    if (parts.size() == 1 && m == "POST") {
        Provider p = provider_from_json(parse_body(req.body));
        int64_t id = core.models.create(p);
        return json_response(201, to_json(*core.models.find(id)));
    }
    if (parts.size() >= 2) {
        int64_t id = parse_id(parts[1]);
        if (parts.size() == 2 && m == "GET") {
            auto p = core.models.find(id);
            if (!p) return error_response(404, "provider not found", "NotFound");
            return json_response(200, to_json(*p));
        }
        if (parts.size() == 2 && m == "PUT") {
            auto current = core.models.find(id);
            if (!current) return error_response(404, "provider not found", "NotFound");
            Provider p = provider_from_json(parse_body(req.body), *current);
            core.models.update(p);
            return json_response(200, to_json(*core.models.find(id)));
        }
        if (parts.size() == 2 && m == "DELETE") {
            core.models.remove(id);
            return json_response(200, json{{"ok", true}});
        }
        if (parts.size() == 3 && parts[2] == "toggle" && m == "POST") {
            bool active = core.models.toggle_active(id);
            return json_response(200, json{{"id", id}, {"is_active", active}});
        }
    }
    return error_response(404, "not found");
}

ApiResponse route_results(ChatlistCore& core, const ApiRequest& req, const std::vector<std::string>& parts) {
    const std::string& m = req.method;
    if (parts.size() == 2 && parts[1] == "selected" && m == "GET") {
        json arr = json::array();
        for (auto& r : core.results.find_selected()) arr.push_back(to_json(r));
        return json_response(200, arr);
    }
    if (parts.size() == 2 && parts[1] == "search" && m == "GET") {
        json arr = json::array();
        for (auto& r : core.results.search(query_or(req, "q", ""))) arr.push_back(to_json(r));
        return json_response(200, arr);
    }
    if (parts.size() == 3 && m == "POST") {
        int64_t id = parse_id(parts[1]);
        if (parts[2] == "select") {
            auto j = parse_body(req.body);
            core.results.set_selected(id, j.value("selected", true));
            return json_response(200, json{{"id", id}, {"selected", j.value("selected", true)}});
        }
        if (parts[2] == "toggle") {
            bool selected = core.results.toggle_selected(id);
            return json_response(200, json{{"id", id}, {"selected", selected}});
        }
    }
    return error_response(404, "not found");
}

ApiResponse route_settings(ChatlistCore& core, const ApiRequest& req, const std::vector<std::string>& parts) {
    const std::string& m = req.method;
    if (parts.size() == 1 && m == "GET") {
        return json_response(200, json(core.settings.all()));
    }
    if (parts.size() == 2 && m == "GET") {
        return json_response(200, json{{"key", parts[1]}, {"value", core.settings.get(parts[1])}});
    }
    if (parts.size() == 2 && m == "PUT") {
        auto j = parse_body(req.body);
        if (!j.contains("value")) return error_response(400, "value required", "InvalidArgument");
        std::string value = j["value"].is_string() ? j["value"].get<std::string>() : j["value"].dump();
        core.settings.set(parts[1], value);
        return json_response(200, json{{"key", parts[1]}, {"value", value}});
    }
    return error_response(404, "not found");
}

ApiResponse route_export(ChatlistCore& core, const ApiRequest& req) {
    ExportFormat fmt = ExportFormat::Markdown;
    std::string requested = query_or(req, "format", core.settings.get("export_format"));
    if (!parse_export_format(requested, fmt)) {
        return error_response(400, "unknown export format: " + requested, "InvalidArgument");
    }
    auto results = core.results.find_selected();
    if (fmt == ExportFormat::Json) {
        return ApiResponse{200, export_json(results), "application/json"};
    }
    return ApiResponse{200, export_markdown(results, utc_timestamp()), "text/markdown; charset=utf-8"};
}
}

ApiResponse handle_api_request(ChatlistCore& core, const ApiRequest& req) {
    auto parts = split_path(req.path);
    try {
        if (parts.empty()) return error_response(404, "not found");
        if (parts[0] == "prompts") return route_prompts(core, req, parts);
        if (parts[0] == "models") return route_models(core, req, parts);
        if (parts[0] == "results") return route_results(core, req, parts);
        if (parts[0] == "settings") return route_settings(core, req, parts);
        if (parts[0] == "export" && parts.size() == 1 && req.method == "GET") return route_export(core, req);
        return error_response(404, "not found");
    } catch (const ChatlistError& e) {
        if (status_for(e.kind()) >= 500) log_error(req.method + " " + req.path + ": " + e.what());
        return error_response(status_for(e.kind()), e.what(), error_kind_name(e.kind()));
    } catch (const json::exception& e) {
        return error_response(400, e.what(), "InvalidArgument");
    } catch (const std::exception& e) {
        log_error(req.method + " " + req.path + ": " + e.what());
        return error_response(500, e.what());
    }
}
