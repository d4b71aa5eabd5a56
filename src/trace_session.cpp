#include "trace_session.hpp"
#include "connection.hpp"
#include "diag_logger.hpp"
#include "probe_registry.hpp"
#include "trace_errors.hpp"
#include "utils_net.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>

namespace zt {

namespace {
// how often a pending wait checks that the connection is still up
constexpr auto kLivenessInterval = std::chrono::milliseconds(50);
}

const char* to_string(SessionState s) {
    switch (s) {
    case SessionState::Idle:             return "Idle";
    case SessionState::Probing:          return "Probing";
    case SessionState::AwaitingResponse: return "AwaitingResponse";
    case SessionState::HopRecorded:      return "HopRecorded";
    case SessionState::HopTimedOut:      return "HopTimedOut";
    case SessionState::Completed:        return "Completed";
    case SessionState::Aborted:          return "Aborted";
    }
    return "Unknown";
}

TraceSession::TraceSession(std::string session_id, Connection& conn, ProbeSender& sender,
                           ProbeRegistry& registry, const TraceConfig& cfg, DiagLogger* diag)
    : session_id_(std::move(session_id)), conn_(conn), sender_(sender), registry_(registry),
      cfg_(cfg), diag_(diag), target_ip_(net::ip_to_string(conn.peer_address())) {}

bool TraceSession::terminated() const {
    auto s = state_.load();
    return s == SessionState::Completed || s == SessionState::Aborted;
}

void TraceSession::transition(SessionState next) {
    if (terminated())
        throw std::logic_error(std::string("trace session already ") + to_string(state_.load()));
    state_ = next;
}

void TraceSession::abort(const std::string& why) {
    abort_reason_ = why;
    transition(SessionState::Aborted);
    set_pending(std::nullopt);
    if (diag_)
        diag_->log("SESSION_ABORTED uuid=" + session_id_ + " ttl=" + std::to_string(ttl_) +
                   " hops=" + std::to_string(hops_.size()) + " reason=" + why);
}

void TraceSession::set_pending(const std::optional<ProbeToken>& token) {
    std::lock_guard<std::mutex> lk(pending_mu_);
    pending_token_ = token;
}

void TraceSession::cancel() {
    cancelled_ = true;
    std::lock_guard<std::mutex> lk(pending_mu_);
    if (pending_token_)
        registry_.cancel(*pending_token_);
}

HopResult TraceSession::timeout_hop(int ttl) const {
    HopResult hop{};
    hop.ttl = ttl;
    hop.status = HopStatus::Timeout;
    return hop;
}

std::optional<PendingProbe> TraceSession::send_probe(int ttl) {
    for (int attempt = 0; attempt < kMaxTokenAttempts; ++attempt) {
        try {
            return sender_.send(conn_, ttl, attempt, cfg_.hop_timeout + cfg_.reap_grace);
        } catch (const TokenCollisionError& e) {
            if (diag_)
                diag_->log("TOKEN_COLLISION uuid=" + session_id_ + " ttl=" + std::to_string(ttl) +
                           " attempt=" + std::to_string(attempt) + " " + to_string(e.token()));
        }
    }
    return std::nullopt;
}

std::optional<HopResult> TraceSession::await_hop(PendingProbe& pending) {
    const int ttl = pending.probe.ttl;
    const auto deadline = pending.probe.sent_at + cfg_.hop_timeout;

    auto status = std::future_status::timeout;
    for (auto now = clk::now(); now < deadline; now = clk::now()) {
        status = pending.reply.wait_for(std::min<clk::duration>(deadline - now, kLivenessInterval));
        if (status == std::future_status::ready)
            break;
        if (!conn_.is_open()) {
            registry_.cancel(pending.probe.token);
            return std::nullopt;
        }
    }

    if (status != std::future_status::ready && registry_.cancel(pending.probe.token)) {
        if (diag_)
            diag_->log("HOP_TIMEOUT uuid=" + session_id_ + " ttl=" + std::to_string(ttl));
        return timeout_hop(ttl);
    }

    // Either resolved in time, resolved between the wait and the cancel,
    // or dropped by cancel()/the reaper (broken promise).
    try {
        return pending.reply.get();
    } catch (const std::future_error&) {
        return timeout_hop(ttl);
    }
}

void TraceSession::run() {
    if (state_.load() != SessionState::Idle)
        throw std::logic_error("trace session can only run once");
    started_at_ = std::chrono::system_clock::now();
    if (diag_)
        diag_->log("SESSION_START uuid=" + session_id_ + " target=" + target_ip_ +
                   " min_ttl=" + std::to_string(cfg_.min_ttl) + " max_hops=" + std::to_string(cfg_.max_hops));

    for (int ttl = cfg_.min_ttl;; ++ttl) {
        ttl_ = ttl;
        if (cancelled_) {
            abort(kCancelledReason);
            return;
        }

        transition(SessionState::Probing);
        std::optional<PendingProbe> pending;
        try {
            pending = send_probe(ttl);
        } catch (const ConnectionClosedError& e) {
            abort(e.what());
            return;
        } catch (const CaptureError& e) {
            abort(std::string("capture failed: ") + e.what());
            throw;
        }

        std::optional<HopResult> hop;
        if (!pending) {
            hop = timeout_hop(ttl);
        } else {
            set_pending(pending->probe.token);
            if (cancelled_)
                registry_.cancel(pending->probe.token);
            transition(SessionState::AwaitingResponse);
            try {
                hop = await_hop(*pending);
            } catch (const CaptureError& e) {
                abort(std::string("capture failed: ") + e.what());
                throw;
            }
            set_pending(std::nullopt);
        }
        if (!hop) {
            abort("connection closed while awaiting ttl=" + std::to_string(ttl));
            return;
        }

        if (cancelled_) {
            abort(kCancelledReason);
            return;
        }

        hops_.push_back(*hop);
        transition(hop->status == HopStatus::Timeout ? SessionState::HopTimedOut
                                                     : SessionState::HopRecorded);

        if (hop->responder && *hop->responder == target_ip_) {
            reached_target_ = true;
            transition(SessionState::Completed);
            break;
        }
        if (!conn_.is_open()) {
            abort("connection closed after ttl=" + std::to_string(ttl));
            return;
        }
        if (ttl + 1 > cfg_.max_hops) {
            transition(SessionState::Completed);
            break;
        }
    }

    if (diag_)
        diag_->log("SESSION_COMPLETED uuid=" + session_id_ + " hops=" + std::to_string(hops_.size()) +
                   " reached=" + std::to_string(reached_target_ ? 1 : 0));
}

} // namespace zt
