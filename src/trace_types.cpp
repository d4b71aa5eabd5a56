#include "trace_types.hpp"
#include "trace_errors.hpp"
#include "utils_net.hpp"

namespace zt {

const char* to_string(HopStatus s) {
    switch (s) {
    case HopStatus::Answered:    return "answered";
    case HopStatus::Timeout:     return "timeout";
    case HopStatus::Unreachable: return "unreachable";
    }
    return "unknown";
}

std::size_t ProbeTokenHash::operator()(const ProbeToken& t) const noexcept {
    uint64_t k = (static_cast<uint64_t>(t.target_addr) << 32) ^
                 (static_cast<uint64_t>(t.local_port) << 16) ^ t.peer_port;
    k ^= static_cast<uint64_t>(t.ip_length) * 0x9E3779B97F4A7C15ULL;
    return std::hash<uint64_t>{}(k);
}

std::string to_string(const ProbeToken& t) {
    return net::ip_to_string(t.target_addr) + ":" + std::to_string(t.peer_port) +
           " lport=" + std::to_string(t.local_port) +
           " len=" + std::to_string(t.ip_length);
}

const TraceResult& ConnectionClosedError::partial() const {
    static const TraceResult empty{};
    return partial_ ? *partial_ : empty;
}

} // namespace zt
