// ===================== File: include/icmp_packet.hpp =====================
#pragma once
#include "trace_types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace zt
{
    // An ICMP error (Time Exceeded / Destination Unreachable) together with
    // the fields recovered from the datagram it quotes.
    struct IcmpQuote
    {
        uint32_t responder;      // router or host that sent the ICMP, network order
        uint8_t type;
        uint8_t code;
        uint32_t quoted_src;     // original datagram source, network order
        uint32_t quoted_dst;     // original datagram destination, network order
        uint16_t quoted_length;  // original datagram total length
        uint8_t quoted_ttl;      // TTL left in the original datagram (best-effort)
        uint16_t quoted_sport;   // source port of the original TCP segment
        uint16_t quoted_dport;   // destination port of the original TCP segment
        uint32_t quoted_seq;     // sequence number of the original TCP segment

        ProbeToken token() const;
        HopStatus status() const;
    };

    // Parses a full IPv4 packet as delivered by a raw ICMP socket. Returns
    // nullopt for anything that is not a well-formed ICMP error quoting TCP.
    std::optional<IcmpQuote> parse_icmp_error(const uint8_t *data, std::size_t len);
} // namespace zt
