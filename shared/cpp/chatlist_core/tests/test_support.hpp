#pragma once
#include "../include/core.hpp"
#include "../include/http.hpp"
#include "../include/secrets.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

struct ScriptedReply {
    long status{200};
    std::string body;
    std::chrono::milliseconds delay{0};
    std::optional<ErrorKind> fail;
    std::string fail_message;
};

// Answers by URL. Delays respect the request timeout and cancel token the
// way the libcurl transport does.
class FakeTransport : public HttpTransport {
public:
    void script(const std::string& url, ScriptedReply reply) {
        std::lock_guard<std::mutex> lock(mtx_);
        replies_[url] = std::move(reply);
    }

    HttpResponse send(const HttpRequest& req) override {
        ScriptedReply reply;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            requests_.push_back(req);
            auto it = replies_.find(req.url);
            if (it == replies_.end()) return HttpResponse{404, "{\"error\":\"no script\"}"};
            reply = it->second;
        }
        auto start = std::chrono::steady_clock::now();
        auto budget = start + std::chrono::milliseconds(req.timeout_ms);
        auto until = start + reply.delay;
        while (std::chrono::steady_clock::now() < until) {
            if (req.cancel && req.cancel->cancelled()) throw ChatlistError(ErrorKind::Cancelled, "request cancelled");
            if (std::chrono::steady_clock::now() >= budget) {
                throw ChatlistError(ErrorKind::Timeout, "request timed out after " + std::to_string(req.timeout_ms) + " ms");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        if (reply.fail) throw ChatlistError(*reply.fail, reply.fail_message);
        return HttpResponse{reply.status, reply.body};
    }

    std::vector<HttpRequest> requests() {
        std::lock_guard<std::mutex> lock(mtx_);
        return requests_;
    }

private:
    std::mutex mtx_;
    std::map<std::string, ScriptedReply> replies_;
    std::vector<HttpRequest> requests_;
};

inline std::string chat_body(const std::string& text) {
    nlohmann::json j = {
        {"choices", nlohmann::json::array({
            {{"message", {{"role", "assistant"}, {"content", text}}}}
        })}
    };
    return j.dump();
}

struct TestCore {
    MapSecretResolver* secrets{nullptr};
    FakeTransport* transport{nullptr};
    std::unique_ptr<ChatlistCore> core;

    TestCore() {
        auto s = std::make_unique<MapSecretResolver>();
        auto t = std::make_unique<FakeTransport>();
        secrets = s.get();
        transport = t.get();
        core = std::make_unique<ChatlistCore>(":memory:", std::move(s), std::move(t));
    }

    int64_t add_provider(const std::string& name, bool active = true, bool with_secret = true) {
        Provider p;
        p.name = name;
        p.api_url = "https://" + name + ".example/v1/chat/completions";
        p.api_id = "KEY_" + name;
        p.is_active = active;
        if (with_secret) secrets->set(p.api_id, "secret-" + name);
        return core->models.create(p);
    }

    std::string url_of(const std::string& name) const {
        return "https://" + name + ".example/v1/chat/completions";
    }

    void reply(const std::string& name, const std::string& text, std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
        ScriptedReply r;
        r.body = chat_body(text);
        r.delay = delay;
        transport->script(url_of(name), r);
    }
};

// Captures log output for the lifetime of the object.
class LogCapture {
public:
    LogCapture() {
        log_set_sink([this](LogLevel level, const std::string& msg) {
            std::lock_guard<std::mutex> lock(mtx_);
            lines_.push_back({level, msg});
        });
    }
    ~LogCapture() { log_set_sink({}); }

    bool contains(LogLevel level, const std::string& needle) {
        std::lock_guard<std::mutex> lock(mtx_);
        for (auto& l : lines_) {
            if (l.first == level && l.second.find(needle) != std::string::npos) return true;
        }
        return false;
    }

private:
    std::mutex mtx_;
    std::vector<std::pair<LogLevel, std::string>> lines_;
};
