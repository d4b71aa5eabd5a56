#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace zt
{
    // A live, established stream the engine can probe. Owned by the caller;
    // a trace session has exclusive use of it while it runs.
    class Connection
    {
    public:
        virtual ~Connection() = default;

        virtual uint32_t peer_address() const = 0; // network byte order
        virtual uint16_t peer_port() const = 0;
        virtual uint16_t local_port() const = 0;

        virtual int ttl() const = 0;
        virtual bool set_ttl(int ttl) = 0;

        // Bytes in front of a ping payload on the wire: IP and TCP headers
        // plus the ping frame header.
        virtual std::size_t header_overhead() const = 0;

        // Sends one Ping control frame carrying `payload` (at most 125 bytes).
        virtual bool send_ping(const std::vector<uint8_t> &payload) = 0;
        virtual bool is_open() const = 0;
    };
} // namespace zt
