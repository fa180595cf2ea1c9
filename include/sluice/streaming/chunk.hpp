#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sluice
{

using chunk = std::vector<std::uint8_t>;

inline chunk make_chunk(std::string_view text)
{
    return chunk(text.begin(), text.end());
}

inline std::string_view as_text(const chunk& c)
{
    return {reinterpret_cast<const char*>(c.data()), c.size()};
}

inline std::string to_string(const chunk& c)
{
    return std::string(as_text(c));
}

} // namespace sluice
