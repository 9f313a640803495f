#pragma once
#include "transport.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class FailureClass { PolicyBlocked, Transient };

const char* failure_class_name(FailureClass c);

FailureClass classify(const TransportFailure& f);

// What the selector does after a tier failed.
enum class Step { Escalate, StopTransient, StopAllBlocked };

Step next_step(Tier current, FailureClass c);

struct TransportAttempt {
    Tier tier{Tier::Direct};
    std::optional<TransportFailure> error;
    std::optional<FailureClass> classified_as;
};

enum class SendStatus { Delivered, TransientFailure, AllTransportsBlocked };

const char* send_status_name(SendStatus s);

struct SendResult {
    SendStatus status{SendStatus::TransientFailure};
    Tier tier{Tier::Direct};  // tier that delivered, or the last one tried
    bool confirmed{false};    // a server response body is available
    long http_status{0};
    std::string response_body;
    std::vector<TransportAttempt> attempts;

    bool ok() const { return status == SendStatus::Delivered; }
};

// Multi-line, human readable account of every attempt.
std::string describe_attempts(const std::vector<TransportAttempt>& attempts);

class TransportSelector {
public:
    explicit TransportSelector(std::vector<std::unique_ptr<Transport>> tiers);

    SendResult send(const std::string& json_body);


private:
    std::vector<std::unique_ptr<Transport>> tiers_;
};
