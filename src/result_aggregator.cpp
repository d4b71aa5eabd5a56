#include "result_aggregator.hpp"
#include "diag_logger.hpp"
#include "json_log.hpp"
#include "trace_session.hpp"

#include <stdexcept>

namespace zt {

ResultAggregator::ResultAggregator(JsonLineLogger* records, DiagLogger* diag)
    : records_(records), diag_(diag) {}

TraceResult ResultAggregator::finalize(const TraceSession& session) const {
    if (!session.terminated())
        throw std::logic_error("cannot finalize a running trace session (state " +
                               std::string(to_string(session.state())) + ")");

    TraceResult r;
    r.session_id = session.session_id();
    r.target_ip = session.target_ip();
    r.hops = session.hops();
    r.completed = session.state() == SessionState::Completed;
    r.reached_target = session.reached_target();
    r.error = session.abort_reason();
    r.started_at = session.started_at();
    r.ended_at = std::chrono::system_clock::now();

    if (records_)
        records_->write(to_json(r));
    if (diag_)
        diag_->log("TRACE_RESULT uuid=" + r.session_id + " target=" + r.target_ip +
                   " hops=" + std::to_string(r.hops.size()) +
                   " completed=" + std::to_string(r.completed ? 1 : 0) +
                   " reached=" + std::to_string(r.reached_target ? 1 : 0));
    return r;
}

Json::Value to_json(const TraceResult& r) {
    Json::Value hops(Json::arrayValue);
    for (const auto& h : r.hops) {
        Json::Value hop(Json::objectValue);
        hop["TTL"] = h.ttl;
        hop["Status"] = to_string(h.status);
        hop["IP"] = h.responder ? Json::Value(*h.responder) : Json::Value(Json::nullValue);
        hop["RTTms"] = h.rtt_ms ? Json::Value(*h.rtt_ms) : Json::Value(Json::nullValue);
        hops.append(hop);
    }

    Json::Value j(Json::objectValue);
    j["Type"] = "0trace";
    j["UUID"] = r.session_id;
    j["IPaddr"] = r.target_ip;
    j["Timestamp"] = utc_timestamp(r.ended_at);
    j["StartedAt"] = utc_timestamp(r.started_at);
    j["Completed"] = r.completed;
    j["ReachedTarget"] = r.reached_target;
    j["Hops"] = hops;
    if (!r.error.empty())
        j["Error"] = r.error;
    return j;
}

} // namespace zt
