#pragma once
#include <string>
#include <map>

class ChatlistCore;

struct ApiRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> query;
    std::string body;
};

struct ApiResponse {
    int status{200};
    std::string body;
    std::string content_type{"application/json"};
};

// Routes one request against the core. Never throws; errors become JSON bodies.
ApiResponse handle_api_request(ChatlistCore& core, const ApiRequest& req);
