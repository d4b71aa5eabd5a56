#pragma once
#include "probe_sender.hpp"
#include "trace_config.hpp"
#include "trace_types.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace zt {

class Connection;
class DiagLogger;
class ProbeRegistry;

enum class SessionState {
    Idle,
    Probing,
    AwaitingResponse,
    HopRecorded,
    HopTimedOut,
    Completed,
    Aborted,
};

const char* to_string(SessionState s);

// Abort reason of a session stopped by cancel().
constexpr const char* kCancelledReason = "cancelled";

// TTL sweep over one connection. Hops are appended strictly in TTL order,
// one per TTL, and the session ends exactly once (Completed or Aborted).
class TraceSession {
public:
    TraceSession(std::string session_id, Connection& conn, ProbeSender& sender,
                 ProbeRegistry& registry, const TraceConfig& cfg, DiagLogger* diag = nullptr);

    TraceSession(const TraceSession&) = delete;
    TraceSession& operator=(const TraceSession&) = delete;

    // Drives the session to Completed or Aborted. Throws CaptureError if the
    // engine's capture failed underneath it (the session is Aborted first).
    void run();

    // External cancellation; wakes a pending wait immediately.
    void cancel();

    SessionState state() const { return state_.load(); }
    bool terminated() const;
    int current_ttl() const { return ttl_; }

    const std::string& session_id() const { return session_id_; }
    const std::string& target_ip() const { return target_ip_; }
    const std::vector<HopResult>& hops() const { return hops_; }
    bool reached_target() const { return reached_target_; }
    const std::string& abort_reason() const { return abort_reason_; }
    std::chrono::system_clock::time_point started_at() const { return started_at_; }

private:
    std::optional<PendingProbe> send_probe(int ttl);
    std::optional<HopResult> await_hop(PendingProbe& pending); // nullopt: connection closed
    HopResult timeout_hop(int ttl) const;
    void transition(SessionState next);
    void abort(const std::string& why);
    void set_pending(const std::optional<ProbeToken>& token);

    std::string session_id_;
    Connection& conn_;
    ProbeSender& sender_;
    ProbeRegistry& registry_;
    TraceConfig cfg_;
    DiagLogger* diag_;

    std::string target_ip_;
    std::vector<HopResult> hops_;
    std::atomic<SessionState> state_{SessionState::Idle};
    int ttl_ = 0;
    bool reached_target_ = false;
    std::string abort_reason_;
    std::chrono::system_clock::time_point started_at_{};

    std::atomic<bool> cancelled_{false};
    std::mutex pending_mu_;
    std::optional<ProbeToken> pending_token_;
};

} // namespace zt
