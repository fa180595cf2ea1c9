#pragma once

// Implementation file for basic_stream_session template methods

namespace sluice
{

template<typename ThreadingPolicy>
void basic_stream_session<ThreadingPolicy>::do_start()
{
    if (!in_state<created_state>())
        return;

    log_debug(log_component, fmt::format("Stream {} started", id_));
    do_pull();
}

template<typename ThreadingPolicy>
void basic_stream_session<ThreadingPolicy>::do_pull()
{
    if (!state_->can_read_upstream() || upstream_finished_)
        return;

    auto decision = backpressure_.evaluate(buffered_bytes_);

    if (decision.change == backpressure_controller::transition::activated)
    {
        metrics_->record_backpressure_event();
        if (Logger::instance().enabled(LogLevel::Debug))
            log_debug(log_component, fmt::format("Backpressure activated for stream {} ({:.1f}% buffer utilization)",
                                                 id_, backpressure_.utilization() * 100.0));
        notify([this](stream_observer& o) { o.on_backpressure(id_, true); });
    }
    else if (decision.change == backpressure_controller::transition::deactivated)
    {
        if (Logger::instance().enabled(LogLevel::Debug))
            log_debug(log_component, fmt::format("Backpressure deactivated for stream {}", id_));
        notify([this](stream_observer& o) { o.on_backpressure(id_, false); });
    }

    // Budget exhausted: stop reading ahead until the consumer takes a chunk.
    if (buffered_bytes_ >= config_.buffer_byte_budget)
    {
        read_ahead_parked_ = true;
        transition_to(std::make_unique<backpressure_wait_state>());
        return;
    }

    if (decision.delay.count() > 0)
    {
        transition_to(std::make_unique<backpressure_wait_state>());
        delay_timer_.expires_after(decision.delay);
        delay_timer_.async_wait([self = this->shared_from_this()](boost::system::error_code ec) {
            if (ec || self->state_->is_terminal())
                return;
            self->do_read_upstream();
        });
        return;
    }

    do_read_upstream();
}

template<typename ThreadingPolicy>
void basic_stream_session<ThreadingPolicy>::do_read_upstream()
{
    transition_to(std::make_unique<pulling_state>());

    try {
        source_->async_read_chunk([self = this->shared_from_this()](boost::system::error_code ec, chunk data) {
            ThreadingPolicy::dispatch(self->executor_, [self, ec, data = std::move(data)]() mutable {
                self->on_upstream_chunk(ec, std::move(data));
            });
        });
    }
    catch (const std::exception& e) {
        log_error(log_component, fmt::format("Stream {} upstream read could not start: {}", id_, e.what()));
        fail(make_error_code(stream_errc::upstream_read_failed));
    }
    catch (...) {
        log_error(log_component, fmt::format("Stream {} upstream read could not start: unknown exception", id_));
        fail(make_error_code(stream_errc::upstream_read_failed));
    }
}

template<typename ThreadingPolicy>
void basic_stream_session<ThreadingPolicy>::on_upstream_chunk(boost::system::error_code ec, chunk data)
{
    // Cancelled while the read was outstanding.
    if (state_->is_terminal())
        return;

    if (ec == boost::asio::error::eof)
        return finalize();

    if (ec)
        return fail(ec);

    transition_to(std::make_unique<emitting_state>());

    if (auto processed = transformer_.apply(id_, data, *metrics_))
        emit(std::move(*processed));

    boost::asio::post(executor_, [self = this->shared_from_this()]() {
        self->do_pull();
    });
}

template<typename ThreadingPolicy>
void basic_stream_session<ThreadingPolicy>::emit(chunk data)
{
    auto size = data.size();

    if (consumer_handler_)
    {
        auto handler = std::exchange(consumer_handler_, nullptr);
        deliver(std::move(handler), {}, std::move(data));
    }
    else
    {
        buffered_bytes_ += size;
        pending_.push_back(std::move(data));
    }

    auto count = metrics_->record_chunk(size);
    notify([this, size](stream_observer& o) { o.on_chunk_emitted(id_, size); });

    if (config_.progress_log_interval > 0 && count % config_.progress_log_interval == 0
        && Logger::instance().enabled(LogLevel::Debug))
    {
        log_debug(log_component, fmt::format("Stream {}: {} chunks, {:.1f} chunks/sec, {:.1f}KB processed",
                                             id_, count, metrics_->processing_rate(),
                                             static_cast<double>(metrics_->bytes_processed()) / 1024.0));
    }
}

template<typename ThreadingPolicy>
void basic_stream_session<ThreadingPolicy>::do_read(read_handler handler)
{
    if (consumer_handler_)
        return deliver(std::move(handler), make_error_code(stream_errc::read_in_progress), {});

    if (!pending_.empty())
    {
        auto next = std::move(pending_.front());
        pending_.pop_front();
        buffered_bytes_ -= next.size();
        deliver(std::move(handler), {}, std::move(next));

        if (read_ahead_parked_ && !state_->is_terminal())
        {
            read_ahead_parked_ = false;
            do_pull();
        }
        return;
    }

    if (terminal_error_)
        return deliver(std::move(handler), *terminal_error_, {});

    consumer_handler_ = std::move(handler);
}

template<typename ThreadingPolicy>
void basic_stream_session<ThreadingPolicy>::do_cancel()
{
    // Whatever was still buffered for the consumer is discarded.
    pending_.clear();
    buffered_bytes_ = 0;

    if (state_->is_terminal())
        return;

    log_debug(log_component, fmt::format("Stream {} cancelled", id_));

    if (!upstream_finished_)
        source_->cancel();

    terminal_error_ = boost::system::error_code(boost::asio::error::operation_aborted);
    if (consumer_handler_)
        deliver(std::exchange(consumer_handler_, nullptr), *terminal_error_, {});

    close(close_reason::cancelled, *terminal_error_);
}

template<typename ThreadingPolicy>
void basic_stream_session<ThreadingPolicy>::finalize()
{
    transition_to(std::make_unique<finalizing_state>());
    upstream_finished_ = true;

    auto duration = static_cast<double>(metrics_->elapsed().count()) / 1000.0;
    log_info(log_component, fmt::format("Stream {} completed: {} chunks in {:.2f}s ({:.1f} chunks/sec, {:.1f}KB)",
                                        id_, metrics_->chunks_processed(), duration,
                                        metrics_->processing_rate(),
                                        static_cast<double>(metrics_->bytes_processed()) / 1024.0));

    // Buffered chunks are still handed out before eof.
    terminal_error_ = boost::system::error_code(boost::asio::error::eof);
    if (consumer_handler_)
        deliver(std::exchange(consumer_handler_, nullptr), *terminal_error_, {});

    close(close_reason::completed, {});
}

template<typename ThreadingPolicy>
void basic_stream_session<ThreadingPolicy>::fail(boost::system::error_code ec)
{
    upstream_finished_ = true;
    log_error(log_component, fmt::format("Stream {} error: {}", id_, ec.message()));

    // No partial output after an upstream failure.
    pending_.clear();
    buffered_bytes_ = 0;

    terminal_error_ = ec;
    if (consumer_handler_)
        deliver(std::exchange(consumer_handler_, nullptr), ec, {});

    close(close_reason::upstream_error, ec);
}

// Single cleanup path for completion, failure and cancellation.
template<typename ThreadingPolicy>
void basic_stream_session<ThreadingPolicy>::close(close_reason reason, boost::system::error_code ec)
{
    transition_to(std::make_unique<closed_state>());
    closed_.store(true);

    boost::system::error_code ignored;
    delay_timer_.cancel(ignored);
    read_ahead_parked_ = false;
    backpressure_.reset();

    notify([this, reason, ec](stream_observer& o) { o.on_stream_closed(id_, reason, ec); });
    log_debug(log_component, fmt::format("Cleaned up stream {}", id_));

    auto close_copy = std::move(close_handler_);
    close_handler_ = {};
    observers_.clear();

    if (close_copy)
    {
        try {
            close_copy(id_, reason, ec);
        }
        catch (const std::exception& e) {
            log_error(log_component, fmt::format("Exception in close_handler for stream {}: {}", id_, e.what()));
        }
        catch (...) {
            log_error(log_component, fmt::format("Unknown exception in close_handler for stream {}", id_));
        }
    }
}

} // namespace sluice
