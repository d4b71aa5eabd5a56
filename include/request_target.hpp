// ===================== include/request_target.hpp =====================
#pragma once
#include <map>
#include <optional>
#include <string>

namespace zt
{
    // Origin-form request target, e.g. "/trace?uuid=..."
    class RequestTarget
    {
    public:
        std::string path;                         // e.g., "/trace"
        std::multimap<std::string, std::string> query; // decoded key/value pairs

        explicit RequestTarget(const std::string &target);

        // Value of a parameter that appears exactly once.
        std::optional<std::string> single(const std::string &key) const;
    };

    std::string percent_decode(const std::string &s);
} // namespace zt
