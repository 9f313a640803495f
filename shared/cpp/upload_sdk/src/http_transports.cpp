#include "../include/http_transports.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <stdexcept>

namespace {
static size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

static size_t discard_cb(void*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

struct CurlHandle {
    CURL* h{nullptr};
    CurlHandle() { h = curl_easy_init(); if (!h) throw std::runtime_error("curl_easy_init failed"); }
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
};

struct HeaderList {
    curl_slist* list{nullptr};
    void add(const std::string& h) { list = curl_slist_append(list, h.c_str()); }
    ~HeaderList() { if (list) curl_slist_free_all(list); }
};

TransportFailure from_curl(CURLcode code) {
    TransportFailure f;
    f.curl_code = static_cast<int>(code);
    f.detail = curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            f.kind = FailureKind::Timeout;
            break;
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            f.kind = FailureKind::ConnectFailed;
            break;
        case CURLE_UNSUPPORTED_PROTOCOL:
            f.kind = FailureKind::Disallowed;
            break;
        default:
            f.kind = FailureKind::Curl;
            break;
    }
    return f;
}
}

CurlTransport::CurlTransport(HttpTransportConfig cfg) : cfg_(std::move(cfg)) {}

std::optional<TransportFailure> CurlTransport::admit(const std::string&) const {
    return std::nullopt;
}

TransportOutcome CurlTransport::send(const std::string& json_body) {
    TransportOutcome out;
    if (std::find(cfg_.disabled.begin(), cfg_.disabled.end(), tier()) != cfg_.disabled.end()) {
        out.failure = {FailureKind::Disallowed, 0, 0, std::string(tier_name(tier())) + " disabled by policy"};
        return out;
    }
    if (auto refused = admit(json_body)) {
        out.failure = *refused;
        return out;
    }
    try {
        return perform(build(json_body));
    } catch (const std::exception& e) {
        out.failure = {FailureKind::Curl, 0, 0, e.what()};
        return out;
    }
}

TransportOutcome CurlTransport::perform(const Request& req) {
    CurlHandle c;
    HeaderList headers;
    headers.add("Content-Type: " + req.content_type);
    if (!cfg_.auth_token.empty()) headers.add("Authorization: Bearer " + cfg_.auth_token);

    std::string buf;
    curl_easy_setopt(c.h, CURLOPT_URL, cfg_.endpoint.c_str());
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, headers.list);
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, req.body.c_str());
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)req.body.size());
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, cfg_.timeout_ms);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
    if (req.read_response) {
        curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
    } else {
        curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, discard_cb);
    }

    TransportOutcome out;
    CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) {
        out.failure = from_curl(code);
        return out;
    }
    long status = 0;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &status);
    out.http_status = status;
    out.has_response = req.read_response;
    out.body = std::move(buf);
    if (status < 200 || status >= 300) {
        out.failure = {FailureKind::HttpStatus, status, 0, "HTTP " + std::to_string(status)};
        return out;
    }
    out.ok = true;
    return out;
}

CurlTransport::Request DirectTransport::build(const std::string& json_body) const {
    return {json_body, "application/json", true};
}

CurlTransport::Request BeaconTransport::build(const std::string& json_body) const {
    return {json_body, "application/json", false};
}

std::optional<TransportFailure> BeaconTransport::admit(const std::string& json_body) const {
    if (json_body.size() <= cfg_.beacon_limit) return std::nullopt;
    return TransportFailure{FailureKind::PayloadTooLarge, 0, 0,
                            "message of " + std::to_string(json_body.size()) + " bytes exceeds beacon limit of " +
                                std::to_string(cfg_.beacon_limit)};
}

CurlTransport::Request FormTransport::build(const std::string& json_body) const {
    CurlHandle c;
    char* escaped = curl_easy_escape(c.h, json_body.data(), (int)json_body.size());
    if (!escaped) throw std::runtime_error("curl_easy_escape failed");
    std::string body = std::string("payload=") + escaped;
    curl_free(escaped);
    return {body, "application/x-www-form-urlencoded", false};
}

std::vector<std::unique_ptr<Transport>> make_http_transports(const HttpTransportConfig& cfg) {
    std::vector<std::unique_ptr<Transport>> out;
    out.push_back(std::make_unique<DirectTransport>(cfg));
    out.push_back(std::make_unique<BeaconTransport>(cfg));
    out.push_back(std::make_unique<FormTransport>(cfg));
    return out;
}
