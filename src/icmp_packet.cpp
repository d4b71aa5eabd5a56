//// ===================== File: src/icmp_packet.cpp =====================
#include "icmp_packet.hpp"
#include "utils_net.hpp"

#include <arpa/inet.h>
#include <cstring>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>

namespace zt
{
    namespace
    {
        constexpr std::size_t kIcmpHeaderLen = 8;
        constexpr std::size_t kQuotedTransportLen = 8; // RFC 792 minimum
    } // namespace

    ProbeToken IcmpQuote::token() const
    {
        ProbeToken t{};
        t.target_addr = quoted_dst;
        t.local_port = quoted_sport;
        t.peer_port = quoted_dport;
        t.ip_length = quoted_length;
        return t;
    }

    HopStatus IcmpQuote::status() const
    {
        return type == ICMP_DEST_UNREACH ? HopStatus::Unreachable : HopStatus::Answered;
    }

    std::optional<IcmpQuote> parse_icmp_error(const uint8_t *data, std::size_t len)
    {
        if (data == nullptr || len < sizeof(iphdr))
            return std::nullopt;

        iphdr outer{};
        std::memcpy(&outer, data, sizeof(outer));
        if (outer.version != 4 || outer.ihl < 5 || outer.protocol != IPPROTO_ICMP)
            return std::nullopt;

        size_t off = outer.ihl * 4;
        size_t total = ntohs(outer.tot_len);
        if (total > len || total < off + kIcmpHeaderLen)
            return std::nullopt;
        len = total; // ignore link-layer padding

        icmphdr icmp{};
        std::memcpy(&icmp, data + off, sizeof(icmp));
        if (icmp.type != ICMP_TIME_EXCEEDED && icmp.type != ICMP_DEST_UNREACH)
            return std::nullopt;
        if (net::csum16(data + off, len - off) != 0)
            return std::nullopt;

        size_t inner_off = off + kIcmpHeaderLen;
        if (inner_off + sizeof(iphdr) > len)
            return std::nullopt;
        iphdr inner{};
        std::memcpy(&inner, data + inner_off, sizeof(inner));
        if (inner.version != 4 || inner.ihl < 5 || inner.protocol != IPPROTO_TCP)
            return std::nullopt;

        size_t tcp_off = inner_off + inner.ihl * 4;
        if (tcp_off + kQuotedTransportLen > len)
            return std::nullopt;

        uint16_t sport = 0, dport = 0;
        uint32_t seq = 0;
        std::memcpy(&sport, data + tcp_off + 0, sizeof(sport));
        std::memcpy(&dport, data + tcp_off + 2, sizeof(dport));
        std::memcpy(&seq, data + tcp_off + 4, sizeof(seq));

        IcmpQuote q{};
        q.responder = outer.saddr;
        q.type = icmp.type;
        q.code = icmp.code;
        q.quoted_src = inner.saddr;
        q.quoted_dst = inner.daddr;
        q.quoted_length = ntohs(inner.tot_len);
        q.quoted_ttl = inner.ttl;
        q.quoted_sport = ntohs(sport);
        q.quoted_dport = ntohs(dport);
        q.quoted_seq = ntohl(seq);
        return q;
    }
} // namespace zt
