#pragma once

#include <string_view>

namespace pushgw
{
    inline constexpr int version_major       = 0;
    inline constexpr int version_minor       = 1;
    inline constexpr int version_patch       = 0;
    inline constexpr const char* version_tag = "";

    inline constexpr std::string_view version()
    {
        return "0.1.0";
    }

    /// Sent as the User-Agent header of every push.
    inline constexpr std::string_view user_agent()
    {
        return "pushgw/0.1.0";
    }
} // namespace pushgw
