// ===================== File: src/probe_sender.cpp =====================
#include "probe_sender.hpp"
#include "connection.hpp"
#include "diag_logger.hpp"
#include "probe_registry.hpp"
#include "trace_config.hpp"
#include "trace_errors.hpp"

#include <openssl/rand.h>
#include <stdexcept>
#include <vector>

namespace zt {

namespace {

constexpr std::size_t kMaxPingPayload = 125; // control frame limit

std::vector<uint8_t> random_payload(std::size_t n) {
    std::vector<uint8_t> out(n);
    if (n && RAND_bytes(out.data(), static_cast<int>(n)) != 1)
        throw std::runtime_error("RAND_bytes failed");
    return out;
}

// Lowers the connection's TTL for one write and puts the old value back.
class TtlGuard {
public:
    TtlGuard(Connection& conn, int ttl, DiagLogger* diag)
        : conn_(conn), saved_(conn.ttl()), diag_(diag) {
        if (saved_ < 0 || !conn_.set_ttl(ttl))
            throw ConnectionClosedError("cannot set TTL " + std::to_string(ttl) + " on connection");
    }
    ~TtlGuard() {
        if (!conn_.set_ttl(saved_) && diag_)
            diag_->error("TTL_RESTORE_FAILED ttl=" + std::to_string(saved_));
    }
    TtlGuard(const TtlGuard&) = delete;
    TtlGuard& operator=(const TtlGuard&) = delete;

private:
    Connection& conn_;
    int saved_;
    DiagLogger* diag_;
};

} // namespace

ProbeSender::ProbeSender(ProbeRegistry& registry, DiagLogger* diag)
    : registry_(registry), diag_(diag) {}

std::size_t ProbeSender::payload_size(int ttl, int attempt) {
    return static_cast<std::size_t>(ttl + kMaxTtl * attempt) % (kMaxPingPayload + 1);
}

PendingProbe ProbeSender::send(Connection& conn, int ttl, int attempt, clk::duration lifetime) {
    if (!conn.is_open())
        throw ConnectionClosedError("connection closed before probe ttl=" + std::to_string(ttl));

    std::vector<uint8_t> payload = random_payload(payload_size(ttl, attempt));

    Probe probe{};
    probe.ttl = ttl;
    probe.token.target_addr = conn.peer_address();
    probe.token.local_port = conn.local_port();
    probe.token.peer_port = conn.peer_port();
    probe.token.ip_length = static_cast<uint16_t>(conn.header_overhead() + payload.size());

    // registered before the write so a fast reply cannot race the insert
    probe.sent_at = clk::now();
    PendingProbe pending{probe, registry_.insert(probe, probe.sent_at + lifetime)};

    bool sent = false;
    try {
        TtlGuard guard(conn, ttl, diag_);
        sent = conn.send_ping(payload);
    } catch (...) {
        registry_.cancel(probe.token);
        throw;
    }
    if (!sent) {
        registry_.cancel(probe.token);
        if (diag_)
            diag_->log("PROBE_SEND_ERR ttl=" + std::to_string(ttl) + " " + to_string(probe.token));
        throw ConnectionClosedError("connection closed while sending probe ttl=" + std::to_string(ttl));
    }

    if (diag_)
        diag_->log("PROBE_SENT ttl=" + std::to_string(ttl) + " attempt=" + std::to_string(attempt) +
                   " payload=" + std::to_string(payload.size()) + " " + to_string(probe.token));
    return pending;
}

} // namespace zt
