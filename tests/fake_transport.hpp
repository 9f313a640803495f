// tests/fake_transport.hpp
#pragma once
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "transport.hpp"

// Plays back queued outcomes; when the queue is empty it keeps returning
// `fallback`. Every body it is handed is recorded.
class ScriptedTransport : public Transport
{
  public:
    explicit ScriptedTransport(Tier t, TransportOutcome fallback = ok()) : tier_(t), fallback_(fallback) {}

    Tier tier() const override { return tier_; }

    TransportOutcome send(const std::string &json_body) override
    {
        sent.push_back(json_body);
        if (script.empty())
            return fallback_;
        TransportOutcome o = script.front();
        script.pop_front();
        return o;
    }

    static TransportOutcome ok()
    {
        TransportOutcome o;
        o.ok = true;
        return o;
    }
    static TransportOutcome fail(FailureKind kind, long status = 0)
    {
        TransportOutcome o;
        o.failure.kind        = kind;
        o.failure.http_status = status;
        o.failure.detail      = "scripted";
        return o;
    }

    std::deque<TransportOutcome> script;
    std::vector<std::string>     sent;

  private:
    Tier             tier_;
    TransportOutcome fallback_;
};

// Hands each body to a callback, like a wire that reaches a server in-process.
class LoopbackTransport : public Transport
{
  public:
    using Handler = std::function<TransportOutcome(const std::string &)>;
    LoopbackTransport(Tier t, Handler h) : tier_(t), handler_(std::move(h)) {}

    Tier             tier() const override { return tier_; }
    TransportOutcome send(const std::string &json_body) override { return handler_(json_body); }

  private:
    Tier    tier_;
    Handler handler_;
};

// Three scripted tiers; raw pointers stay valid while the selector owns them.
struct ScriptedTiers
{
    ScriptedTransport *direct = nullptr;
    ScriptedTransport *beacon = nullptr;
    ScriptedTransport *form   = nullptr;

    std::vector<std::unique_ptr<Transport>> make()
    {
        auto d = std::make_unique<ScriptedTransport>(Tier::Direct);
        auto b = std::make_unique<ScriptedTransport>(Tier::Beacon);
        auto f = std::make_unique<ScriptedTransport>(Tier::Form);
        direct = d.get();
        beacon = b.get();
        form   = f.get();
        std::vector<std::unique_ptr<Transport>> v;
        v.push_back(std::move(d));
        v.push_back(std::move(b));
        v.push_back(std::move(f));
        return v;
    }
};
