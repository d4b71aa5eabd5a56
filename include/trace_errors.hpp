#pragma once
#include "trace_types.hpp"

#include <memory>
#include <stdexcept>
#include <string>

namespace zt
{
    // Interface not found, no CAP_NET_RAW, bad engine settings. Fatal at startup.
    class ConfigurationError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // The capture socket broke while the engine was running.
    class CaptureError : public ConfigurationError
    {
    public:
        using ConfigurationError::ConfigurationError;
    };

    // The traced connection closed or errored. Carries the hops collected so far.
    class ConnectionClosedError : public std::runtime_error
    {
    public:
        explicit ConnectionClosedError(const std::string &what)
            : std::runtime_error(what) {}
        ConnectionClosedError(const std::string &what, TraceResult partial)
            : std::runtime_error(what),
              partial_(std::make_shared<const TraceResult>(std::move(partial))) {}

        bool has_partial() const { return partial_ != nullptr; }
        const TraceResult &partial() const;

    private:
        std::shared_ptr<const TraceResult> partial_;
    };

    class TokenCollisionError : public std::runtime_error
    {
    public:
        explicit TokenCollisionError(const ProbeToken &token)
            : std::runtime_error("probe token already pending: " + to_string(token)),
              token_(token) {}

        const ProbeToken &token() const { return token_; }

    private:
        ProbeToken token_;
    };

    // Echo channel message with an unrecognized shape.
    class MessageFormatError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };
} // namespace zt
