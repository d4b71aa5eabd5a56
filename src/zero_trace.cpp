// ===================== File: src/zero_trace.cpp =====================
#include "zero_trace.hpp"
#include "connection.hpp"
#include "diag_logger.hpp"
#include "raw_capture_socket.hpp"
#include "trace_errors.hpp"
#include "trace_session.hpp"
#include "uuid.hpp"

#include <stdexcept>

namespace zt {

namespace {

TraceConfig checked(const TraceConfig& cfg) {
    try {
        cfg.validate();
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError(e.what());
    }
    return cfg;
}

CaptureSource& require(const std::unique_ptr<CaptureSource>& capture) {
    if (!capture)
        throw ConfigurationError("no capture source");
    return *capture;
}

// Keeps a session visible to cancel() for exactly as long as it runs.
class ActiveSession {
public:
    ActiveSession(std::mutex& mu, std::unordered_map<std::string, TraceSession*>& map,
                  TraceSession& s)
        : mu_(mu), map_(map), id_(s.session_id()) {
        std::lock_guard<std::mutex> lk(mu_);
        if (!map_.emplace(id_, &s).second)
            throw std::invalid_argument("session " + id_ + " is already tracing");
    }
    ~ActiveSession() {
        std::lock_guard<std::mutex> lk(mu_);
        map_.erase(id_);
    }
    ActiveSession(const ActiveSession&) = delete;
    ActiveSession& operator=(const ActiveSession&) = delete;

private:
    std::mutex& mu_;
    std::unordered_map<std::string, TraceSession*>& map_;
    std::string id_;
};

} // namespace

ZeroTrace::ZeroTrace(const TraceConfig& cfg, JsonLineLogger* records, DiagLogger* diag)
    : ZeroTrace(std::make_unique<RawCaptureSocket>(checked(cfg).interface_name), cfg, records, diag) {}

ZeroTrace::ZeroTrace(std::unique_ptr<CaptureSource> capture, const TraceConfig& cfg,
                     JsonLineLogger* records, DiagLogger* diag)
    : cfg_(checked(cfg)),
      diag_(diag),
      capture_(std::move(capture)),
      sender_(registry_, diag),
      aggregator_(records, diag),
      listener_(require(capture_), registry_, diag) {
    start();
}

ZeroTrace::~ZeroTrace() {
    {
        std::lock_guard<std::mutex> lk(reaper_mu_);
        stopping_ = true;
    }
    reaper_cv_.notify_all();
    if (reaper_.joinable())
        reaper_.join();
    listener_.stop();
}

void ZeroTrace::start() {
    listener_.start();
    reaper_ = std::thread(&ZeroTrace::reaper_loop, this);
    if (diag_)
        diag_->log("ENGINE_START iface=" + cfg_.interface_name +
                   " max_hops=" + std::to_string(cfg_.max_hops) +
                   " hop_timeout_ms=" + std::to_string(cfg_.hop_timeout.count()));
}

void ZeroTrace::reaper_loop() {
    std::unique_lock<std::mutex> lk(reaper_mu_);
    while (!stopping_) {
        reaper_cv_.wait_for(lk, cfg_.reap_interval, [this] { return stopping_; });
        if (stopping_)
            break;
        std::size_t evicted = registry_.reap(clk::now());
        if (evicted && diag_)
            diag_->log("REAPED probes=" + std::to_string(evicted));
    }
}

std::size_t ZeroTrace::active_sessions() const {
    std::lock_guard<std::mutex> lk(sessions_mu_);
    return sessions_.size();
}

bool ZeroTrace::cancel(const std::string& session_id) {
    std::lock_guard<std::mutex> lk(sessions_mu_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end())
        return false;
    it->second->cancel();
    return true;
}

TraceResult ZeroTrace::run_trace(const std::string& interface_name, Connection& conn,
                                 const std::string& session_id) {
    if (interface_name != cfg_.interface_name)
        throw ConfigurationError("engine is bound to '" + cfg_.interface_name +
                                 "', not '" + interface_name + "'");
    if (!listener_.healthy())
        throw ConfigurationError("capture socket is down: " + listener_.failure());
    if (!is_valid_uuid(session_id))
        throw std::invalid_argument("session id is not a UUID: '" + session_id + "'");

    TraceSession session(session_id, conn, sender_, registry_, cfg_, diag_);
    {
        ActiveSession active(sessions_mu_, sessions_, session);
        session.run();
    }

    TraceResult result = aggregator_.finalize(session);
    if (session.state() == SessionState::Aborted) {
        std::string reason = result.error;
        throw ConnectionClosedError(reason, std::move(result));
    }
    return result;
}

} // namespace zt
