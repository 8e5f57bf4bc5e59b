#include "../include/provider_protocol.hpp"
#include "../include/model_registry.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::string build_chat_request(const Provider& p, const std::string& prompt) {
    std::string model = trim(p.model_name).empty() ? p.name : p.model_name;
    json body = {
        {"model", model},
        {"messages", json::array({
            json{{"role", "user"}, {"content", prompt}}
        })},
        {"temperature", 0.7}
    };
    return body.dump();
}

std::vector<std::string> chat_headers(const Provider& p) {
    std::vector<std::string> out;
    if (to_lower(p.api_url).find("openrouter") != std::string::npos) {
        out.push_back("X-Title: ChatList");
    }
    return out;
}

std::string extract_response_text(const std::string& body) {
    json data = json::parse(body, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        throw ChatlistError(ErrorKind::NetworkError, "unexpected response: body is not a JSON object");
    }
    if (data.contains("choices") && data["choices"].is_array() && !data["choices"].empty()) {
        const auto& first = data["choices"][0];
        if (first.contains("message") && first["message"].contains("content") &&
            first["message"]["content"].is_string()) {
            return first["message"]["content"].get<std::string>();
        }
        if (first.contains("text") && first["text"].is_string()) {
            return first["text"].get<std::string>();
        }
    }
    if (data.contains("content") && data["content"].is_string()) {
        return data["content"].get<std::string>();
    }
    if (data.contains("message") && data["message"].is_object() &&
        data["message"].contains("content") && data["message"]["content"].is_string()) {
        return data["message"]["content"].get<std::string>();
    }
    if (data.contains("error")) {
        const auto& err = data["error"];
        std::string msg = err.is_object() ? err.value("message", err.dump()) : err.dump();
        throw ChatlistError(ErrorKind::NetworkError, "provider returned error: " + msg);
    }
    throw ChatlistError(ErrorKind::NetworkError, "unexpected response: no message content");
}

std::string describe_http_failure(long status, const std::string& body) {
    std::string excerpt = utf8_truncate(body, 200);
    if (excerpt.size() < body.size()) excerpt += "...";
    return "HTTP status " + std::to_string(status) + ": " + excerpt;
}
