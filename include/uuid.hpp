#pragma once
#include <string>

namespace zt
{
    // Canonical 8-4-4-4-12 hexadecimal form.
    bool is_valid_uuid(const std::string &s);
} // namespace zt
