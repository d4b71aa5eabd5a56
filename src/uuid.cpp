#include "uuid.hpp"
#include <regex>

namespace zt
{
    bool is_valid_uuid(const std::string &s)
    {
        static const std::regex re(
            "^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$");
        return std::regex_match(s, re);
    }
} // namespace zt
