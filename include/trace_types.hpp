// ===================== File: include/trace_types.hpp =====================
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace zt {

using clk = std::chrono::steady_clock;

enum class HopStatus { Answered, Timeout, Unreachable };

const char* to_string(HopStatus s);

// Identifies one outstanding probe. Every field is recoverable from the
// first 28 bytes of the probe datagram that routers quote back in ICMP errors.
struct ProbeToken {
    uint32_t target_addr{}; // network byte order
    uint16_t local_port{};  // host byte order
    uint16_t peer_port{};   // host byte order
    uint16_t ip_length{};   // total length of the probe datagram

    bool operator==(const ProbeToken& o) const {
        return target_addr == o.target_addr && local_port == o.local_port &&
               peer_port == o.peer_port && ip_length == o.ip_length;
    }
    bool operator!=(const ProbeToken& o) const { return !(*this == o); }
};

struct ProbeTokenHash {
    std::size_t operator()(const ProbeToken& t) const noexcept;
};

std::string to_string(const ProbeToken& t);

struct Probe {
    int ttl{};
    ProbeToken token{};
    clk::time_point sent_at{};
};

struct HopResult {
    int ttl{};
    std::optional<std::string> responder; // empty on timeout
    std::optional<double> rtt_ms;         // empty on timeout
    HopStatus status = HopStatus::Timeout;
};

struct TraceResult {
    std::string session_id;
    std::string target_ip;
    std::vector<HopResult> hops;
    bool completed = false;      // Completed (destination or hop ceiling), not Aborted
    bool reached_target = false; // last hop's responder is target_ip
    std::string error;           // abort reason, empty otherwise
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point ended_at{};
};

} // namespace zt
