#include <iostream>
#include <string>
#include <map>
#include <cstring>
#include <csignal>
#include <unistd.h>
#include <microhttpd.h>
#include "../include/api.hpp"
#include "../../../shared/cpp/chatlist_core/include/core.hpp"
#include "../../../shared/cpp/chatlist_core/include/log.hpp"

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

static ChatlistCore* g_core = nullptr;

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

static MhdResult send_response(struct MHD_Connection* conn, const ApiResponse& r) {
    struct MHD_Response* resp = MHD_create_response_from_buffer(r.body.size(), (void*)r.body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, r.content_type.c_str());
    MhdResult ret = MHD_queue_response(conn, (unsigned int)r.status, resp);
    MHD_destroy_response(resp);
    return ret;
}

static std::map<std::string,std::string> parse_query(struct MHD_Connection* conn) {
    std::map<std::string,std::string> out;
    MHD_get_connection_values(conn, MHD_GET_ARGUMENT_KIND,
        [](void* cls, enum MHD_ValueKind, const char* key, const char* val) -> MhdResult {
            auto* m = static_cast<std::map<std::string,std::string>*>(cls);
            (*m)[key ? key : ""] = val ? val : "";
            return MHD_YES;
        }, &out);
    return out;
}

static MhdResult handler(void* /*cls*/, struct MHD_Connection* connection, const char* url, const char* method,
                         const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }

    if (*upload_data_size) {
        ci->body.append(upload_data, *upload_data_size);
        *upload_data_size = 0;
        return MHD_YES;
    }

    ApiRequest req;
    req.method = ci->method;
    req.path = ci->url;
    req.query = parse_query(connection);
    req.body = ci->body;
    ApiResponse resp = handle_api_request(*g_core, req);
    log_debug(req.method + " " + req.path + " -> " + std::to_string(resp.status));
    return send_response(connection, resp);
}

static void request_completed(void* /*cls*/, struct MHD_Connection* /*conn*/, void** con_cls,
                              enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

static void usage() {
    std::cerr << "chatlistd usage:\n"
              << "  chatlistd [--db <dbfile>] [--env-file <path>] [--port N] [--log-file <path>] [--log-level L]\n";
}

static volatile std::sig_atomic_t g_stop = 0;

int main(int argc, char** argv) {
    AppConfig cfg = load_config_from_env();
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--db" && i + 1 < argc) cfg.db_path = argv[++i];
        else if (a == "--env-file" && i + 1 < argc) cfg.env_file = argv[++i];
        else if (a == "--port" && i + 1 < argc) {
            try { cfg.port = std::stoi(argv[++i]); } catch (const std::exception&) { usage(); return 2; }
        }
        else if (a == "--log-file" && i + 1 < argc) cfg.log_file = argv[++i];
        else if (a == "--log-level" && i + 1 < argc) cfg.log_level = argv[++i];
        else if (a == "--help" || a == "-h") { usage(); return 0; }
        else { usage(); return 2; }
    }
    apply_logging(cfg);

    try {
        ChatlistCore core(cfg);
        g_core = &core;
        log_info("Starting HTTP server on port " + std::to_string(cfg.port) + " (db " + cfg.db_path + ")");
        struct MHD_Daemon* d = MHD_start_daemon(MHD_USE_THREAD_PER_CONNECTION | MHD_USE_INTERNAL_POLLING_THREAD,
                                                (uint16_t)cfg.port, nullptr, nullptr, &handler, nullptr,
                                                MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                                                MHD_OPTION_END);
        if (!d) {
            log_error("Failed to start HTTP server");
            return 1;
        }
        std::signal(SIGINT, [](int){ g_stop = 1; });
        std::signal(SIGTERM, [](int){ g_stop = 1; });
        while (!g_stop) pause();
        log_info("shutting down");
        MHD_stop_daemon(d);
        g_core = nullptr;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
