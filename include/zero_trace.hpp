// ===================== include/zero_trace.hpp =====================
#pragma once
#include "capture_source.hpp"
#include "probe_registry.hpp"
#include "probe_sender.hpp"
#include "response_listener.hpp"
#include "result_aggregator.hpp"
#include "trace_config.hpp"
#include "trace_types.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace zt {

class Connection;
class DiagLogger;
class JsonLineLogger;
class TraceSession;

// The 0trace engine. Built once at startup; every trace shares its capture
// source, probe registry, listener and reaper.
class ZeroTrace {
public:
    // Opens a RawCaptureSocket on cfg.interface_name. Throws ConfigurationError.
    explicit ZeroTrace(const TraceConfig& cfg, JsonLineLogger* records = nullptr,
                       DiagLogger* diag = nullptr);
    ZeroTrace(std::unique_ptr<CaptureSource> capture, const TraceConfig& cfg,
              JsonLineLogger* records = nullptr, DiagLogger* diag = nullptr);
    ~ZeroTrace();

    ZeroTrace(const ZeroTrace&) = delete;
    ZeroTrace& operator=(const ZeroTrace&) = delete;

    // Traces the path to the connection's peer. Blocks until the session
    // completes. Throws ConnectionClosedError (with the partial result) if
    // the connection goes away, ConfigurationError if the engine cannot
    // trace, std::invalid_argument for a bad session id.
    TraceResult run_trace(const std::string& interface_name, Connection& conn,
                          const std::string& session_id);

    // Aborts the running session with this id. Returns false if none.
    bool cancel(const std::string& session_id);

    const TraceConfig& config() const { return cfg_; }
    ProbeRegistry& registry() { return registry_; }
    const ResponseListener& listener() const { return listener_; }
    std::size_t active_sessions() const;

private:
    void start();
    void reaper_loop();

    TraceConfig cfg_;
    DiagLogger* diag_;
    std::unique_ptr<CaptureSource> capture_;
    ProbeRegistry registry_;
    ProbeSender sender_;
    ResultAggregator aggregator_;
    ResponseListener listener_;

    std::thread reaper_;
    std::mutex reaper_mu_;
    std::condition_variable reaper_cv_;
    bool stopping_ = false;

    mutable std::mutex sessions_mu_;
    std::unordered_map<std::string, TraceSession*> sessions_;
};

} // namespace zt
