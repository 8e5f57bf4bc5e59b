#pragma once
#include <string>
#include <vector>
#include <atomic>

class CancelToken {
public:
    void cancel() { flag_.store(true); }
    bool cancelled() const { return flag_.load(); }

private:
    std::atomic<bool> flag_{false};
};

struct HttpRequest {
    std::string url;
    std::string body;                  // JSON payload, sent as POST
    std::string bearer_token;          // empty means no Authorization header
    std::vector<std::string> headers;  // extra "Name: value" lines
    bool verify_tls{true};
    long timeout_ms{30000};
    const CancelToken* cancel{nullptr};
};

struct HttpResponse {
    long status{0};
    std::string body;
};

// Sends one request. Transport failures throw ChatlistError with kind Timeout,
// Cancelled or NetworkError; any HTTP status is returned as a response.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse send(const HttpRequest& req) = 0;
};

class CurlTransport : public HttpTransport {
public:
    CurlTransport();
    HttpResponse send(const HttpRequest& req) override;
};
