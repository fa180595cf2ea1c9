#pragma once

#include <sluice/streaming/chunk.hpp>

#include <utility>
#include <boost/asio.hpp>

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>

namespace sluice
{

// ============================================================================
// Upstream Chunk Source Interface
// ============================================================================

// Pull-style byte producer (e.g. an SSE response body). One read is
// outstanding at a time. Completion with boost::asio::error::eof means the
// stream ended; any other error is an upstream failure.
class chunk_source
{
public:
    using read_handler = std::function<void(boost::system::error_code, chunk)>;

    virtual ~chunk_source() = default;
    virtual void async_read_chunk(read_handler handler) = 0;
    virtual void cancel() = 0;
};

using chunk_source_ptr = std::shared_ptr<chunk_source>;

// ============================================================================
// In-Memory Source
// ============================================================================

class memory_chunk_source : public chunk_source,
                            public std::enable_shared_from_this<memory_chunk_source>
{
    boost::asio::any_io_executor executor_;
    boost::asio::steady_timer latency_timer_;
    std::deque<chunk> chunks_;
    std::chrono::milliseconds latency_{0};
    std::optional<boost::system::error_code> failure_;
    bool cancelled_{false};
    std::size_t reads_{0};

public:
    explicit memory_chunk_source(boost::asio::any_io_executor executor, std::deque<chunk> chunks = {})
        : executor_(std::move(executor))
        , latency_timer_(executor_)
        , chunks_(std::move(chunks)) {}

    void push(chunk c) { chunks_.push_back(std::move(c)); }

    // Once the queued chunks run out, fail with `ec` instead of eof.
    void fail_after_chunks(boost::system::error_code ec) { failure_ = ec; }

    void set_latency(std::chrono::milliseconds latency) { latency_ = latency; }

    bool cancelled() const { return cancelled_; }
    std::size_t reads() const { return reads_; }
    std::size_t remaining() const { return chunks_.size(); }

    void async_read_chunk(read_handler handler) override
    {
        ++reads_;
        if (latency_.count() > 0)
        {
            latency_timer_.expires_after(latency_);
            latency_timer_.async_wait([self = shared_from_this(), handler = std::move(handler)](boost::system::error_code ec) mutable {
                if (ec)
                    return handler(boost::asio::error::operation_aborted, {});
                self->complete(std::move(handler));
            });
            return;
        }

        boost::asio::post(executor_, [self = shared_from_this(), handler = std::move(handler)]() mutable {
            self->complete(std::move(handler));
        });
    }

    void cancel() override
    {
        cancelled_ = true;
        boost::system::error_code ec;
        latency_timer_.cancel(ec);
    }

private:
    void complete(read_handler handler)
    {
        if (cancelled_)
            return handler(boost::asio::error::operation_aborted, {});

        if (chunks_.empty())
            return handler(failure_.value_or(boost::asio::error::eof), {});

        auto next = std::move(chunks_.front());
        chunks_.pop_front();
        handler({}, std::move(next));
    }
};

} // namespace sluice
