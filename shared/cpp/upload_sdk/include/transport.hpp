#pragma once
#include <optional>
#include <string>

// Ordered by preference; the numeric value is the tier number.
enum class Tier {
    Direct = 1, // request/response, richest error information
    Beacon = 2, // fire-and-forget with a hard size ceiling
    Form = 3    // indirect form submission, no response body
};

const char* tier_name(Tier t);
std::optional<Tier> tier_from_name(const std::string& name);

enum class FailureKind {
    Disallowed,      // mechanism switched off in this environment
    PayloadTooLarge, // over the tier's size ceiling
    HttpStatus,
    Timeout,
    ConnectFailed,
    Curl             // any other transfer error
};

struct TransportFailure {
    FailureKind kind{FailureKind::Curl};
    long http_status{0};
    int curl_code{0};
    std::string detail;
};

struct TransportOutcome {
    bool ok{false};
    bool has_response{false}; // body below is a real server response
    long http_status{0};
    std::string body;
    TransportFailure failure; // meaningful only when !ok
};

// One send mechanism. Implementations must not throw for transport-level
// failures; they report them through TransportOutcome.
class Transport {
public:
    virtual ~Transport() = default;
    virtual Tier tier() const = 0;
    virtual TransportOutcome send(const std::string& json_body) = 0;
};
