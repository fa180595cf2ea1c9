#pragma once

#include <sluice/logger.h>
#include <sluice/streaming/backpressure_controller.hpp>
#include <sluice/streaming/chunk.hpp>
#include <sluice/streaming/chunk_source.hpp>
#include <sluice/streaming/chunk_transform.hpp>
#include <sluice/streaming/errors.hpp>
#include <sluice/streaming/session_state.hpp>
#include <sluice/streaming/stream_config.hpp>
#include <sluice/streaming/stream_metrics.hpp>
#include <sluice/streaming/stream_observer.hpp>
#include <sluice/streaming/threading_policy.hpp>

#include <boost/asio.hpp>
#include <fmt/core.h>

#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sluice
{

// ============================================================================
// Stream Session (with threading policy)
// ============================================================================

// One upstream source feeding one consumer. The session reads ahead into a
// pending buffer bounded by the configured byte budget, consulting the
// backpressure controller before every upstream read. All state below is
// touched only on executor_.
template<typename ThreadingPolicy = SLUICE_THREADING_MODE>
class basic_stream_session : public std::enable_shared_from_this<basic_stream_session<ThreadingPolicy>>
{
public:
    using executor_type = typename ThreadingPolicy::executor_type;
    using read_handler = std::function<void(boost::system::error_code, chunk)>;
    using close_callback = std::function<void(const std::string&, close_reason, boost::system::error_code)>;

    static constexpr const char* log_component{"STREAMING_MANAGER"};

private:
    // Identity and configuration
    std::string id_;
    stream_config config_;

    // Threading
    executor_type executor_;

    // Upstream
    chunk_source_ptr source_;
    boost::asio::steady_timer delay_timer_;
    bool upstream_finished_{false};

    // State
    std::unique_ptr<stream_state> state_;
    std::atomic<bool> closed_{false};

    // Read-ahead buffer and the consumer side
    std::deque<chunk> pending_;
    std::size_t buffered_bytes_{0};
    bool read_ahead_parked_{false};
    read_handler consumer_handler_;
    std::optional<boost::system::error_code> terminal_error_;

    // Pipeline
    backpressure_controller backpressure_;
    chunk_transformer transformer_;
    std::shared_ptr<session_metrics> metrics_;

    // Handlers
    std::vector<std::shared_ptr<stream_observer>> observers_;
    close_callback close_handler_;

public:
    basic_stream_session(boost::asio::io_context& io_context,
                         std::string id,
                         chunk_source_ptr source,
                         stream_config config,
                         std::vector<chunk_stage_ptr> stages = {})
      : id_(std::move(id))
      , config_(std::move(config))
      , executor_(ThreadingPolicy::make_executor(io_context.get_executor()))
      , source_(std::move(source))
      , delay_timer_(executor_)
      , state_(std::make_unique<created_state>())
      , backpressure_(config_)
      , transformer_(config_, std::move(stages))
      , metrics_(std::make_shared<session_metrics>(id_))
    {
        if (!source_)
            throw std::invalid_argument("chunk source cannot be null");
    }

    ~basic_stream_session() = default;

    basic_stream_session(const basic_stream_session&) = delete;
    basic_stream_session& operator=(const basic_stream_session&) = delete;
    basic_stream_session(basic_stream_session&&) = delete;
    basic_stream_session& operator=(basic_stream_session&&) = delete;

    // Configuration, before start()
    void set_close_handler(close_callback handler)
    {
        close_handler_ = std::move(handler);
    }

    void add_observer(std::shared_ptr<stream_observer> observer)
    {
        if (observer)
            observers_.push_back(std::move(observer));
    }

    // Lifecycle
    void start()
    {
        ThreadingPolicy::dispatch(executor_, [self = this->shared_from_this()]() {
            self->do_start();
        });
    }

    void cancel()
    {
        ThreadingPolicy::dispatch(executor_, [self = this->shared_from_this()]() {
            self->do_cancel();
        });
    }

    // Consumer side. The handler is always invoked through the executor,
    // never from inside async_read itself.
    void async_read(read_handler handler)
    {
        ThreadingPolicy::dispatch(executor_, [self = this->shared_from_this(), handler = std::move(handler)]() mutable {
            self->do_read(std::move(handler));
        });
    }

    // Queries. Everything except id(), metrics() and is_closed() must be
    // called from the session executor or after the io_context has stopped.
    const std::string& id() const { return id_; }
    std::shared_ptr<session_metrics> metrics() const { return metrics_; }
    bool is_closed() const { return closed_.load(); }

    const char* state_name() const { return state_->name(); }
    std::size_t buffered_bytes() const { return buffered_bytes_; }
    std::size_t pending_chunks() const { return pending_.size(); }
    const backpressure_controller& backpressure() const { return backpressure_; }

private:
    void do_start();
    void do_pull();
    void do_read_upstream();
    void on_upstream_chunk(boost::system::error_code ec, chunk data);
    void emit(chunk data);
    void do_read(read_handler handler);
    void do_cancel();
    void finalize();
    void fail(boost::system::error_code ec);
    void close(close_reason reason, boost::system::error_code ec);

    void deliver(read_handler handler, boost::system::error_code ec, chunk data)
    {
        boost::asio::post(executor_, [handler = std::move(handler), ec, data = std::move(data)]() mutable {
            handler(ec, std::move(data));
        });
    }

    template<typename F>
    void notify(F&& f)
    {
        for (auto& observer : observers_)
        {
            try {
                f(*observer);
            }
            catch (const std::exception& e) {
                log_error(log_component, fmt::format("Observer exception for stream {}: {}", id_, e.what()));
            }
            catch (...) {
                log_error(log_component, fmt::format("Unknown observer exception for stream {}", id_));
            }
        }
    }

    void transition_to(std::unique_ptr<stream_state> new_state)
    {
        state_ = std::move(new_state);
    }

    template<typename State>
    bool in_state() const
    {
        return dynamic_cast<const State*>(state_.get()) != nullptr;
    }
};

// Type aliases
using stream_session = basic_stream_session<SLUICE_THREADING_MODE>;
using stream_session_ptr = std::shared_ptr<stream_session>;

} // namespace sluice

// Include implementation
#include <sluice/streaming/stream_session.inl>
