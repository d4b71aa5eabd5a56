#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace zt
{
    // Where the response listener reads captured IPv4 packets from.
    class CaptureSource
    {
    public:
        virtual ~CaptureSource() = default;

        // Waits up to `timeout` for one packet and copies it into buf.
        // Returns its length, or 0 if nothing arrived. Throws CaptureError
        // when the source is no longer usable.
        virtual std::size_t receive(uint8_t *buf, std::size_t cap,
                                    std::chrono::milliseconds timeout) = 0;
    };
} // namespace zt
