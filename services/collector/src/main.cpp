#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <microhttpd.h>
#include <nlohmann/json.hpp>
#include "../include/ingest_service.hpp"

#if MHD_VERSION >= 0x00097002
using MHD_RESULT = enum MHD_Result;
#else
using MHD_RESULT = int;
#endif

using json = nlohmann::json;

static std::atomic<bool> g_stop{false};

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
    std::string form_payload;
    bool form{false};
    bool too_large{false};
    bool bad_form{false};
    struct MHD_PostProcessor* pp{nullptr};
};

struct ServerContext {
    IngestService* service{nullptr};
    std::size_t max_body_bytes{0};
};

static MHD_RESULT send_response(struct MHD_Connection* conn, int status, const std::string& body, const char* ctype = "application/json") {
    struct MHD_Response* resp = MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, ctype);
    MHD_add_response_header(resp, "Access-Control-Allow-Origin", "*");
    MHD_add_response_header(resp, "Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    MHD_add_response_header(resp, "Access-Control-Allow-Headers", "Content-Type, Authorization");
    MHD_RESULT ret = MHD_queue_response(conn, status, resp);
    MHD_destroy_response(resp);
    return ret;
}

static MHD_RESULT send_reply(struct MHD_Connection* conn, const HttpReply& r) {
    return send_response(conn, r.status, r.body.dump());
}

// Tier-3 submissions arrive form-encoded with the message in the "payload" field.
static MHD_RESULT form_iterator(void* cls, enum MHD_ValueKind, const char* key, const char*, const char*,
                                const char*, const char* data, uint64_t, size_t size) {
    auto* ci = static_cast<ConnInfo*>(cls);
    if (key && 0 == strcmp(key, "payload") && size > 0) ci->form_payload.append(data, size);
    return MHD_YES;
}

static std::string header_value(struct MHD_Connection* conn, const char* name) {
    const char* v = MHD_lookup_connection_value(conn, MHD_HEADER_KIND, name);
    return v ? std::string(v) : std::string();
}

static MHD_RESULT handler(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                          const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    auto* ctx = static_cast<ServerContext*>(cls);
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url};
        if (0 == strcmp(method, MHD_HTTP_METHOD_POST)) {
            std::string ctype = header_value(connection, MHD_HTTP_HEADER_CONTENT_TYPE);
            if (ctype.rfind(MHD_HTTP_POST_ENCODING_FORM_URLENCODED, 0) == 0) {
                ci->form = true;
                ci->pp = MHD_create_post_processor(connection, 64 * 1024, &form_iterator, ci);
            }
        }
        *con_cls = ci;
        return MHD_YES;
    }

    if (0 == strcmp(method, MHD_HTTP_METHOD_POST)) {
        if (*upload_data_size) {
            if (ci->body.size() + ci->form_payload.size() + *upload_data_size > ctx->max_body_bytes) {
                ci->too_large = true;
            } else if (ci->pp) {
                if (MHD_post_process(ci->pp, upload_data, *upload_data_size) != MHD_YES) ci->bad_form = true;
            } else {
                ci->body.append(upload_data, *upload_data_size);
            }
            *upload_data_size = 0;
            return MHD_YES;
        }
    }

    std::string path(url);
    IngestService& svc = *ctx->service;
    try {
        if (ci->method == "OPTIONS") {
            return send_response(connection, MHD_HTTP_NO_CONTENT, "", "text/plain");
        }
        if (ci->method == "POST" && path == "/ingest") {
            if (ci->too_large) {
                return send_reply(connection, error_reply(MHD_HTTP_PAYLOAD_TOO_LARGE, "Payload Too Large",
                                                          "Request body exceeds collector limit"));
            }
            if (ci->bad_form) {
                return send_reply(connection, error_reply(MHD_HTTP_BAD_REQUEST, "Bad Request", "Malformed form body"));
            }
            const std::string& body = ci->form ? ci->form_payload : ci->body;
            return send_reply(connection, svc.ingest(body, header_value(connection, MHD_HTTP_HEADER_AUTHORIZATION)));
        }
        if (ci->method == "GET" && path.rfind("/jobs/", 0) == 0) {
            std::string id = path.substr(std::string("/jobs/").size());
            if (id.empty()) {
                return send_reply(connection, error_reply(MHD_HTTP_BAD_REQUEST, "Bad Request", "jobId required"));
            }
            return send_reply(connection, svc.job_status(id));
        }
        if (ci->method == "GET" && path == "/health") return send_reply(connection, svc.health());
        if (ci->method == "GET" && path == "/stats") return send_reply(connection, svc.stats());
        if (ci->method == "GET" && path == "/") return send_reply(connection, svc.info());
        return send_reply(connection, error_reply(MHD_HTTP_NOT_FOUND, "Not Found", "No route for " + ci->method + " " + path));
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << ci->method << " " << path << ": " << e.what() << std::endl;
        return send_reply(connection, error_reply(MHD_HTTP_INTERNAL_SERVER_ERROR, "Internal Server Error", "Unexpected server error"));
    }
}

static void request_completed(void*, struct MHD_Connection*, void** con_cls, enum MHD_RequestTerminationCode) {
    auto* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) return;
    if (ci->pp) MHD_destroy_post_processor(ci->pp);
    delete ci;
    *con_cls = nullptr;
}

static void usage() {
    std::cerr << "swerve-collector usage:\n"
              << "  swerve-collector [--port N] [--db <file>|--no-db] [--public-url <url>]\n"
              << "                   [--retention-s N] [--incomplete-ttl-s N] [--sweep-s N]\n";
}

int main(int argc, char** argv) {
    CollectorConfig cfg = collector_config_from_env();
    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--port" && i + 1 < argc) cfg.port = std::stoi(argv[++i]);
            else if (a == "--db" && i + 1 < argc) cfg.db_path = argv[++i];
            else if (a == "--no-db") cfg.db_path.clear();
            else if (a == "--public-url" && i + 1 < argc) cfg.public_url = argv[++i];
            else if (a == "--retention-s" && i + 1 < argc) cfg.limits.retention = std::chrono::seconds(std::stol(argv[++i]));
            else if (a == "--incomplete-ttl-s" && i + 1 < argc) cfg.limits.incomplete_ttl = std::chrono::seconds(std::stol(argv[++i]));
            else if (a == "--sweep-s" && i + 1 < argc) cfg.sweep_interval = std::chrono::seconds(std::stol(argv[++i]));
            else { usage(); return a == "--help" ? 0 : 2; }
        }
    } catch (const std::exception& e) {
        std::cerr << "[collector] bad argument: " << e.what() << std::endl;
        usage();
        return 2;
    }
    if (cfg.public_url.empty()) cfg.public_url = "http://localhost:" + std::to_string(cfg.port);

    std::unique_ptr<SqliteSnapshotSink> sink;
    if (!cfg.db_path.empty()) {
        try {
            auto parent = std::filesystem::path(cfg.db_path).parent_path();
            if (!parent.empty()) std::filesystem::create_directories(parent);
            sink = std::make_unique<SqliteSnapshotSink>(cfg.db_path);
        } catch (const std::exception& e) {
            std::cerr << "[collector] " << e.what() << std::endl;
            return 1;
        }
    }

    JobStore store(cfg.limits);
    IngestService service(store, sink.get(), cfg.public_url);
    ServerContext ctx{&service, cfg.max_body_bytes};

    std::cout << "[collector] Starting HTTP server on port " << cfg.port << "...\n";
    struct MHD_Daemon* d = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD, (uint16_t)cfg.port,
                                            nullptr, nullptr, &handler, &ctx,
                                            MHD_OPTION_THREAD_POOL_SIZE, (unsigned int)4,
                                            MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                                            MHD_OPTION_END);
    if (!d) {
        std::cerr << "[collector] Failed to start HTTP server" << std::endl;
        return 1;
    }
    std::cout << "[collector] POST /ingest, GET /jobs/:jobId, GET /health, GET /stats\n"
              << "[collector] Database: " << (sink ? cfg.db_path : std::string("(none)")) << std::endl;

    std::signal(SIGTERM, [](int) { g_stop = true; });
    std::signal(SIGINT, [](int) { g_stop = true; });
    auto next_sweep = Clock::now() + cfg.sweep_interval;
    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (Clock::now() >= next_sweep) {
            std::size_t n = store.sweep();
            if (n) std::cout << "[collector] swept " << n << " job(s), " << store.size() << " active" << std::endl;
            next_sweep = Clock::now() + cfg.sweep_interval;
        }
    }
    std::cout << "\n[collector] Shutting down..." << std::endl;
    MHD_stop_daemon(d);
    return 0;
}
