#pragma once

#include <sluice/streaming/stream_session.hpp>

#include <stdexcept>
#include <string>

namespace sluice
{

// ============================================================================
// Stream Reader
// ============================================================================

// Consumer handle returned by stream_manager::start_stream. Reads complete
// with a chunk, then boost::asio::error::eof after the last one, the upstream
// error if the source failed, or operation_aborted after cancel(). Destroying
// a reader whose stream is still open cancels the stream.
class stream_reader
{
    stream_session_ptr session_;

public:
    using read_handler = stream_session::read_handler;

    stream_reader() = default;
    explicit stream_reader(stream_session_ptr session) : session_(std::move(session)) {}

    ~stream_reader()
    {
        release();
    }

    stream_reader(const stream_reader&) = delete;
    stream_reader& operator=(const stream_reader&) = delete;

    stream_reader(stream_reader&& other) noexcept = default;

    stream_reader& operator=(stream_reader&& other) noexcept
    {
        if (this != &other)
        {
            release();
            session_ = std::move(other.session_);
        }
        return *this;
    }

    /// @throws std::logic_error on a default-constructed or moved-from reader
    void async_read(read_handler handler)
    {
        require_session();
        session_->async_read(std::move(handler));
    }

    void cancel()
    {
        if (session_)
            session_->cancel();
    }

    bool valid() const { return session_ != nullptr; }
    const std::string& id() const
    {
        require_session();
        return session_->id();
    }
    bool is_closed() const { return session_ && session_->is_closed(); }

    // Direct access for diagnostics.
    const stream_session_ptr& session() const { return session_; }

private:
    void require_session() const
    {
        if (!session_)
            throw std::logic_error("stream_reader has no stream");
    }

    void release() noexcept
    {
        if (session_ && !session_->is_closed())
        {
            try {
                session_->cancel();
            }
            catch (const std::exception& e) {
                log_error(stream_session::log_component,
                          fmt::format("Failed to cancel abandoned stream {}: {}", session_->id(), e.what()));
            }
            catch (...) {
                log_error(stream_session::log_component,
                          fmt::format("Failed to cancel abandoned stream {}", session_->id()));
            }
        }
        session_.reset();
    }
};

} // namespace sluice
