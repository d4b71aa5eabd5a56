#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <netinet/ip.h> // iphdr

namespace zt::net {

// Internet checksum over an arbitrary buffer. Summing a buffer that already
// carries a correct checksum yields 0.
uint16_t csum16(const void* data, std::size_t len);

// IPv4 header checksum (covers only the IP header)
uint16_t ip_checksum(const iphdr* ip);

// Dotted quad for a network-order address; empty on failure.
std::string ip_to_string(uint32_t be_ip);

// Network-order address for a dotted quad.
std::optional<uint32_t> parse_ipv4(const std::string& text);

} // namespace zt::net
