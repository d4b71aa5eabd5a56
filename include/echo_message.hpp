#pragma once
#include <string>
#include <variant>

#include <json/json.h>

namespace zt
{
    // Periodic latency sample from the browser; echoed, never logged.
    struct LatencyMessage
    {
        Json::Value body;
    };

    // Summary the browser sends once all samples are in; echoed and logged.
    struct FinalMessage
    {
        std::string uuid;
        Json::Value body;
    };

    using EchoMessage = std::variant<LatencyMessage, FinalMessage>;

    // Throws MessageFormatError for anything outside the two shapes above.
    EchoMessage parse_echo_message(const std::string &text);
} // namespace zt
