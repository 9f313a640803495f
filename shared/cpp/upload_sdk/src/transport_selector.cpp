#include "../include/transport_selector.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>
#include <stdexcept>

const char* tier_name(Tier t) {
    switch (t) {
        case Tier::Direct: return "direct";
        case Tier::Beacon: return "beacon";
        case Tier::Form: return "form";
    }
    return "?";
}

std::optional<Tier> tier_from_name(const std::string& name) {
    if (name == "direct" || name == "1") return Tier::Direct;
    if (name == "beacon" || name == "2") return Tier::Beacon;
    if (name == "form" || name == "3") return Tier::Form;
    return std::nullopt;
}

const char* failure_class_name(FailureClass c) {
    return c == FailureClass::PolicyBlocked ? "PolicyBlocked" : "Transient";
}

const char* send_status_name(SendStatus s) {
    switch (s) {
        case SendStatus::Delivered: return "Delivered";
        case SendStatus::TransientFailure: return "TransientNetworkError";
        case SendStatus::AllTransportsBlocked: return "AllTransportsBlocked";
    }
    return "?";
}

FailureClass classify(const TransportFailure& f) {
    switch (f.kind) {
        case FailureKind::Disallowed:
        case FailureKind::PayloadTooLarge:
            return FailureClass::PolicyBlocked;
        case FailureKind::HttpStatus:
            // Statuses a proxy or content policy uses to refuse the mechanism itself.
            if (f.http_status == 403 || f.http_status == 405 || f.http_status == 415 || f.http_status == 451) {
                return FailureClass::PolicyBlocked;
            }
            return FailureClass::Transient;
        case FailureKind::Curl:
        case FailureKind::Timeout:
        case FailureKind::ConnectFailed:
            return FailureClass::Transient;
    }
    return FailureClass::Transient;
}

Step next_step(Tier current, FailureClass c) {
    if (c == FailureClass::Transient) return Step::StopTransient;
    return current == Tier::Form ? Step::StopAllBlocked : Step::Escalate;
}

std::string describe_attempts(const std::vector<TransportAttempt>& attempts) {
    std::ostringstream os;
    int n = 1;
    for (const auto& a : attempts) {
        os << "  " << n++ << ". tier " << static_cast<int>(a.tier) << " (" << tier_name(a.tier) << "): ";
        if (!a.error) {
            os << "ok\n";
            continue;
        }
        os << (a.classified_as ? failure_class_name(*a.classified_as) : "?");
        if (a.error->http_status) os << " status=" << a.error->http_status;
        if (!a.error->detail.empty()) os << " " << a.error->detail;
        os << "\n";
    }
    return os.str();
}

TransportSelector::TransportSelector(std::vector<std::unique_ptr<Transport>> tiers) : tiers_(std::move(tiers)) {
    if (tiers_.empty()) throw std::invalid_argument("TransportSelector needs at least one tier");
    std::stable_sort(tiers_.begin(), tiers_.end(), [](const std::unique_ptr<Transport>& a, const std::unique_ptr<Transport>& b) {
        return static_cast<int>(a->tier()) < static_cast<int>(b->tier());
    });
}

SendResult TransportSelector::send(const std::string& json_body) {
    SendResult res;
    for (std::size_t i = 0; i < tiers_.size(); ++i) {
        Transport& t = *tiers_[i];
        res.tier = t.tier();
        TransportOutcome out = t.send(json_body);
        if (out.ok) {
            res.attempts.push_back({t.tier(), std::nullopt, std::nullopt});
            res.status = SendStatus::Delivered;
            res.confirmed = out.has_response;
            res.http_status = out.http_status;
            res.response_body = std::move(out.body);
            return res;
        }

        FailureClass cls = classify(out.failure);
        res.attempts.push_back({t.tier(), out.failure, cls});
        res.http_status = out.failure.http_status;
        res.response_body = std::move(out.body);

        Step step = next_step(t.tier(), cls);
        if (step == Step::StopTransient) {
            res.status = SendStatus::TransientFailure;
            return res;
        }
        if (step == Step::StopAllBlocked || i + 1 == tiers_.size()) {
            res.status = SendStatus::AllTransportsBlocked;
            return res;
        }
        std::cerr << "[swerve] tier " << tier_name(t.tier()) << " blocked ("
                  << out.failure.detail << "), trying " << tier_name(tiers_[i + 1]->tier()) << std::endl;
    }
    res.status = SendStatus::AllTransportsBlocked;
    return res;
}
