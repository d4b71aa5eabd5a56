#pragma once
#include "trace_types.hpp"

#include <json/json.h>

namespace zt {

class DiagLogger;
class JsonLineLogger;
class TraceSession;

// Freezes a terminated session into a TraceResult and records it.
class ResultAggregator {
public:
    explicit ResultAggregator(JsonLineLogger* records = nullptr, DiagLogger* diag = nullptr);

    // Throws std::logic_error if the session has not terminated.
    TraceResult finalize(const TraceSession& session) const;

private:
    JsonLineLogger* records_;
    DiagLogger* diag_;
};

// JSON record written per finalized session.
Json::Value to_json(const TraceResult& r);

} // namespace zt
