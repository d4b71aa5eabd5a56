#include "utils_net.hpp"
#include <arpa/inet.h>

namespace zt::net {

uint16_t csum16(const void* data, std::size_t len) {
    const uint8_t* p = static_cast<const uint8_t*>(data);
    uint32_t sum = 0;
    // byte-wise so odd offsets inside a capture buffer are safe
    while (len > 1) {
        sum += static_cast<uint16_t>((p[0] << 8) | p[1]);
        p += 2;
        len -= 2;
    }
    if (len) sum += static_cast<uint16_t>(p[0] << 8);
    while (sum >> 16) sum = (sum & 0xFFFF) + (sum >> 16);
    return htons(static_cast<uint16_t>(~sum));
}

uint16_t ip_checksum(const iphdr* ip) {
    return csum16(ip, ip->ihl * 4);
}

std::string ip_to_string(uint32_t be_ip) {
    in_addr a{};
    a.s_addr = be_ip;
    char buf[INET_ADDRSTRLEN];
    return inet_ntop(AF_INET, &a, buf, sizeof(buf)) ? std::string(buf) : std::string();
}

std::optional<uint32_t> parse_ipv4(const std::string& text) {
    in_addr a{};
    if (inet_pton(AF_INET, text.c_str(), &a) != 1)
        return std::nullopt;
    return a.s_addr;
}

} // namespace zt::net
