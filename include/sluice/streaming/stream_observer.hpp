#pragma once

#include <boost/system/error_code.hpp>

#include <cstddef>
#include <string>

namespace sluice
{

// ============================================================================
// Stream Observer Interface
// ============================================================================

enum class close_reason
{
    completed,
    upstream_error,
    cancelled
};

inline const char* to_string(close_reason reason)
{
    switch (reason)
    {
        case close_reason::completed:
            return "completed";
        case close_reason::upstream_error:
            return "upstream_error";
        case close_reason::cancelled:
            return "cancelled";
    }
    return "unknown";
}

// Purely observational hooks. Called on the session's executor (chunk and
// backpressure events) or the caller's thread (start/reject); implementations
// must be thread-safe and must not throw.
class stream_observer
{
public:
    virtual ~stream_observer() = default;
    virtual void on_stream_started(const std::string& id) = 0;
    virtual void on_stream_rejected(const std::string& id) = 0;
    virtual void on_chunk_emitted(const std::string& id, std::size_t bytes) = 0;
    virtual void on_backpressure(const std::string& id, bool active) = 0;
    virtual void on_stream_closed(const std::string& id, close_reason reason, const boost::system::error_code& ec) = 0;
};

} // namespace sluice
