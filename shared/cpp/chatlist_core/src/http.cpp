#include "../include/http.hpp"
#include "../include/errors.hpp"
#include <curl/curl.h>
#include <mutex>

namespace {
size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

int progress_cb(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* cancel = static_cast<const CancelToken*>(clientp);
    return (cancel && cancel->cancelled()) ? 1 : 0;
}

struct CurlHandle {
    CURL* h{nullptr};
    CurlHandle() {
        h = curl_easy_init();
        if (!h) throw ChatlistError(ErrorKind::NetworkError, "curl_easy_init failed");
    }
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
};

struct HeaderList {
    curl_slist* list{nullptr};
    void append(const std::string& line) {
        curl_slist* next = curl_slist_append(list, line.c_str());
        if (!next) throw ChatlistError(ErrorKind::NetworkError, "curl_slist_append failed");
        list = next;
    }
    ~HeaderList() { if (list) curl_slist_free_all(list); }
};

std::once_flag g_curl_init;
}

CurlTransport::CurlTransport() {
    // curl_global_init is not thread-safe; run it before any worker thread exists
    std::call_once(g_curl_init, []{ curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse CurlTransport::send(const HttpRequest& req) {
    CurlHandle c;
    HeaderList headers;
    headers.append("Content-Type: application/json");
    if (!req.bearer_token.empty()) headers.append("Authorization: Bearer " + req.bearer_token);
    for (auto& h : req.headers) headers.append(h);

    std::string buf;
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(c.h, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, headers.list);
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, req.body.c_str());
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)req.body.size());
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(c.h, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, req.timeout_ms);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c.h, CURLOPT_SSL_VERIFYPEER, req.verify_tls ? 1L : 0L);
    curl_easy_setopt(c.h, CURLOPT_SSL_VERIFYHOST, req.verify_tls ? 2L : 0L);
    curl_easy_setopt(c.h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(c.h, CURLOPT_XFERINFOFUNCTION, progress_cb);
    curl_easy_setopt(c.h, CURLOPT_XFERINFODATA, static_cast<void*>(const_cast<CancelToken*>(req.cancel)));

    CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) {
        std::string detail = errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(code));
        if (code == CURLE_OPERATION_TIMEDOUT) {
            throw ChatlistError(ErrorKind::Timeout, "request timed out after " +
                                std::to_string(req.timeout_ms) + " ms: " + detail);
        }
        if (code == CURLE_ABORTED_BY_CALLBACK) {
            throw ChatlistError(ErrorKind::Cancelled, "request cancelled");
        }
        throw ChatlistError(ErrorKind::NetworkError, std::string("curl_easy_perform failed: ") + detail);
    }

    HttpResponse resp;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body = std::move(buf);
    return resp;
}
