#pragma once
#include "transport.hpp"
#include <memory>
#include <string>
#include <vector>

struct HttpTransportConfig {
    std::string endpoint{"http://localhost:3000/ingest"};
    std::string auth_token;           // sent as "Authorization: Bearer <token>" when set
    long timeout_ms{30000};
    std::size_t beacon_limit{65536};  // encoded message ceiling for the beacon tier
    std::vector<Tier> disabled;       // tiers refused by the local environment
};

// Shared libcurl plumbing for the three tiers.
class CurlTransport : public Transport {
public:
    explicit CurlTransport(HttpTransportConfig cfg);
    TransportOutcome send(const std::string& json_body) override;

protected:
    struct Request {
        std::string body;
        std::string content_type;
        bool read_response{false};
    };
    virtual Request build(const std::string& json_body) const = 0;
    // Pre-flight check, e.g. the beacon size ceiling.
    virtual std::optional<TransportFailure> admit(const std::string& json_body) const;

    HttpTransportConfig cfg_;

private:
    TransportOutcome perform(const Request& req);
};

class DirectTransport : public CurlTransport {
public:
    using CurlTransport::CurlTransport;
    Tier tier() const override { return Tier::Direct; }

protected:
    Request build(const std::string& json_body) const override;
};

class BeaconTransport : public CurlTransport {
public:
    using CurlTransport::CurlTransport;
    Tier tier() const override { return Tier::Beacon; }

protected:
    Request build(const std::string& json_body) const override;
    std::optional<TransportFailure> admit(const std::string& json_body) const override;
};

class FormTransport : public CurlTransport {
public:
    using CurlTransport::CurlTransport;
    Tier tier() const override { return Tier::Form; }

protected:
    Request build(const std::string& json_body) const override;
};

// direct, beacon, form, in preference order.
std::vector<std::unique_ptr<Transport>> make_http_transports(const HttpTransportConfig& cfg);
