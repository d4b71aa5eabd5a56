#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace zt {

constexpr int kMaxTtl = 64;
constexpr int kMaxTokenAttempts = 4;

struct TraceConfig {
    std::string interface_name;
    int min_ttl = 1;
    int max_hops = 30;
    std::chrono::milliseconds hop_timeout{1000};
    std::chrono::milliseconds reap_interval{250};
    std::chrono::milliseconds reap_grace{2000}; // kept past hop_timeout before eviction

    // Throws std::invalid_argument.
    void validate() const;
};

struct ServerConfig {
    int port = 8080;
    std::string logfile = "logFile.jsonl";
    std::string errlog = "errlog.txt";
    bool report = false; // send the trace result back over the WebSocket
    TraceConfig trace;
};

// Flags in any position: --iface= --port= --max-hops= --min-ttl=
// --timeout-ms= --logfile= --errlog= --report. Throws std::invalid_argument.
ServerConfig parse_server_args(const std::vector<std::string>& args);

} // namespace zt
