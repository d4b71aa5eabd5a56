// ===================== include/probe_sender.hpp =====================
#pragma once
#include "trace_types.hpp"

#include <cstddef>
#include <future>

namespace zt {

class Connection;
class DiagLogger;
class ProbeRegistry;

struct PendingProbe {
    Probe probe;
    std::future<HopResult> reply;
};

// Emits one TTL-limited probe on an existing connection: a WebSocket Ping
// whose size encodes the token, sent with the TTL lowered for that one write.
class ProbeSender {
public:
    explicit ProbeSender(ProbeRegistry& registry, DiagLogger* diag = nullptr);

    // Throws TokenCollisionError (retry with the next attempt) or
    // ConnectionClosedError (the connection is gone; nothing is registered).
    PendingProbe send(Connection& conn, int ttl, int attempt, clk::duration lifetime);

    // Ping payload bytes for (ttl, attempt): distinct for every TTL of a session.
    static std::size_t payload_size(int ttl, int attempt);

private:
    ProbeRegistry& registry_;
    DiagLogger* diag_;
};

} // namespace zt
