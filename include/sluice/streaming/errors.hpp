#pragma once

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <string>
#include <type_traits>

namespace sluice
{

// ============================================================================
// Stream Error Codes
// ============================================================================

enum class stream_errc
{
    capacity_exceeded = 1,
    duplicate_stream_id,
    upstream_read_failed,
    read_in_progress
};

const boost::system::error_category& stream_category() noexcept;

inline boost::system::error_code make_error_code(stream_errc e) noexcept
{
    return {static_cast<int>(e), stream_category()};
}

// ============================================================================
// Exceptions
// ============================================================================

class stream_error : public boost::system::system_error
{
public:
    stream_error(stream_errc code, const std::string& what)
        : boost::system::system_error(make_error_code(code), what) {}
};

// Raised by start_stream when the live-session limit is reached. No session
// state exists for the rejected id.
class capacity_exceeded : public stream_error
{
    std::size_t limit_;

public:
    explicit capacity_exceeded(std::size_t limit);

    std::size_t limit() const noexcept { return limit_; }
};

} // namespace sluice

namespace boost::system
{

template<>
struct is_error_code_enum<sluice::stream_errc> : std::true_type {};

} // namespace boost::system
