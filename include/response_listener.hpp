#pragma once
#include "capture_source.hpp"
#include "probe_registry.hpp"
#include "trace_types.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace zt {

class DiagLogger;

// Sole reader of the capture source. Matches ICMP errors against the probe
// registry and drops everything else.
class ResponseListener {
public:
    ResponseListener(CaptureSource& source, ProbeRegistry& registry, DiagLogger* diag = nullptr);
    ~ResponseListener();

    ResponseListener(const ResponseListener&) = delete;
    ResponseListener& operator=(const ResponseListener&) = delete;

    void start();
    void stop();

    // Handles one captured packet. Returns true if it resolved a probe.
    bool handle_packet(const uint8_t* data, std::size_t len, clk::time_point received_at);

    bool healthy() const { return !failed_.load(); }
    std::string failure() const;

    uint64_t matched() const { return matched_.load(); }
    uint64_t unmatched() const { return unmatched_.load(); }
    uint64_t malformed() const { return malformed_.load(); }

private:
    void run();

    CaptureSource& source_;
    ProbeRegistry& registry_;
    DiagLogger* diag_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> failed_{false};
    std::atomic<uint64_t> matched_{0};
    std::atomic<uint64_t> unmatched_{0};
    std::atomic<uint64_t> malformed_{0};

    mutable std::mutex failure_mu_;
    std::string failure_;
};

} // namespace zt
