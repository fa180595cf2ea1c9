#pragma once

#include <string_view>

namespace sluice
{
    inline constexpr int version_major       = 0;
    inline constexpr int version_minor       = 3;
    inline constexpr int version_patch       = 0;
    inline constexpr const char* version_tag = "";

    inline constexpr std::string_view version()
    {
        if constexpr (version_tag[0] == '\0')
        {
            return "0.3.0";
        }
        else
        {
            return "0.3.0-";
        }
    }

    inline constexpr std::string_view version_full()
    {
        return "Sluice v0.3.0 - per-stream backpressure and chunk pipeline";
    }
} // namespace sluice
