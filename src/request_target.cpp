// ===================== src/request_target.cpp =====================
#include "request_target.hpp"

#include <cctype>

namespace zt
{
    namespace
    {
        int hex_value(char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            return -1;
        }
    } // namespace

    std::string percent_decode(const std::string &s)
    {
        std::string out;
        out.reserve(s.size());
        for (size_t i = 0; i < s.size(); ++i)
        {
            if (s[i] == '+')
            {
                out.push_back(' ');
            }
            else if (s[i] == '%' && i + 2 < s.size() &&
                     hex_value(s[i + 1]) >= 0 && hex_value(s[i + 2]) >= 0)
            {
                out.push_back(static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2])));
                i += 2;
            }
            else
            {
                out.push_back(s[i]);
            }
        }
        return out;
    }

    RequestTarget::RequestTarget(const std::string &target)
    {
        path = "/"; // default

        size_t q = target.find('?');
        std::string raw_path = target.substr(0, q);
        if (!raw_path.empty())
            path = percent_decode(raw_path);
        if (q == std::string::npos)
            return;

        std::string qs = target.substr(q + 1);
        size_t frag = qs.find('#');
        if (frag != std::string::npos)
            qs.erase(frag);

        size_t start = 0;
        while (start <= qs.size())
        {
            size_t amp = qs.find('&', start);
            std::string pair = qs.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
            if (!pair.empty())
            {
                size_t eq = pair.find('=');
                if (eq == std::string::npos)
                    query.emplace(percent_decode(pair), std::string());
                else
                    query.emplace(percent_decode(pair.substr(0, eq)), percent_decode(pair.substr(eq + 1)));
            }
            if (amp == std::string::npos)
                break;
            start = amp + 1;
        }
    }

    std::optional<std::string> RequestTarget::single(const std::string &key) const
    {
        if (query.count(key) != 1)
            return std::nullopt;
        return query.find(key)->second;
    }
} // namespace zt
