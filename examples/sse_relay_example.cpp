// Relays several simulated SSE upstreams through one stream_manager.
// Configuration comes from SLUICE_* environment variables.

#include <sluice/sluice.h>

#ifdef SLUICE_WITH_MONITORING
#include <prometheus/registry.h>
#include <prometheus/text_serializer.h>
#endif

#include <boost/asio.hpp>
#include <fmt/core.h>

#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace std::chrono_literals;

// Prints lifecycle events as they happen
class console_observer : public sluice::stream_observer
{
public:
    void on_stream_started(const std::string& id) override
    {
        std::cout << "[" << id << "] started" << std::endl;
    }

    void on_stream_rejected(const std::string& id) override
    {
        std::cout << "[" << id << "] rejected at capacity" << std::endl;
    }

    void on_chunk_emitted(const std::string&, std::size_t) override {}

    void on_backpressure(const std::string& id, bool active) override
    {
        std::cout << "[" << id << "] backpressure " << (active ? "on" : "off") << std::endl;
    }

    void on_stream_closed(const std::string& id, sluice::close_reason reason, const boost::system::error_code& ec) override
    {
        std::cout << "[" << id << "] closed: " << sluice::to_string(reason);
        if (ec)
            std::cout << " (" << ec.message() << ")";
        std::cout << std::endl;
    }
};

// Consumer that takes `pause` between reads and forwards to nowhere
class slow_consumer : public std::enable_shared_from_this<slow_consumer>
{
    sluice::stream_reader reader_;
    boost::asio::steady_timer timer_;
    std::chrono::milliseconds pause_;
    std::size_t received_{0};

public:
    slow_consumer(boost::asio::io_context& io_context, sluice::stream_reader reader, std::chrono::milliseconds pause)
        : reader_(std::move(reader)), timer_(io_context), pause_(pause) {}

    void start() { read_next(); }

private:
    void read_next()
    {
        reader_.async_read([self = shared_from_this()](boost::system::error_code ec, sluice::chunk data) {
            if (ec)
            {
                if (ec != boost::asio::error::eof)
                    std::cout << "[" << self->reader_.id() << "] consumer stopped: " << ec.message() << std::endl;
                else
                    std::cout << "[" << self->reader_.id() << "] consumer received " << self->received_ << " events" << std::endl;
                return;
            }

            ++self->received_;
            if (self->pause_.count() == 0)
                return self->read_next();

            self->timer_.expires_after(self->pause_);
            self->timer_.async_wait([self](boost::system::error_code wait_ec) {
                if (!wait_ec)
                    self->read_next();
            });
        });
    }
};

std::shared_ptr<sluice::memory_chunk_source> make_sse_source(boost::asio::io_context& io_context,
                                                             std::size_t events,
                                                             std::size_t payload_size)
{
    auto source = std::make_shared<sluice::memory_chunk_source>(io_context.get_executor());
    for (std::size_t i = 0; i < events; ++i)
    {
        source->push(sluice::make_chunk(
            fmt::format("data: {{\"seq\":{},\"text\":\"{}\"}}\n\n", i, std::string(payload_size, 'x'))));
    }
    return source;
}

void print_metrics(const sluice::stream_manager& manager, const std::vector<std::string>& ids)
{
    for (auto& id : ids)
    {
        auto metrics = manager.get_metrics(id);
        if (!metrics)
        {
            std::cout << id << ": no metrics" << std::endl;
            continue;
        }
        std::cout << fmt::format("{}: {} chunks, {} bytes, avg {:.1f}B, {:.1f} chunks/sec, {} backpressure events",
                                 id, metrics->chunks_processed, metrics->bytes_processed,
                                 metrics->average_chunk_size, metrics->processing_rate,
                                 metrics->backpressure_events)
                  << std::endl;
    }

    auto stats = manager.get_aggregate_stats();
    std::cout << fmt::format("aggregate: {} streams ({} recent), {} bytes, {:.1f} chunks/sec avg, {} backpressure events",
                             stats.total_streams, stats.active_streams, stats.total_bytes_processed,
                             stats.average_processing_rate, stats.backpressure_events)
              << std::endl;
}

int main()
{
    try
    {
        auto config = sluice::load_stream_config_from_env(
            sluice::stream_config_builder()
                .with_max_concurrent_streams(3)
                .with_buffer_budget(16 * 1024)
                .with_grace_period(5s)
                .build());

        std::cout << "sluice " << sluice::version() << ": "
                  << config.max_concurrent_streams << " streams, "
                  << config.buffer_byte_budget << " byte budget" << std::endl;

        boost::asio::io_context io_context;
        sluice::stream_manager manager(io_context, config);
        manager.add_observer(std::make_shared<console_observer>());

#ifdef SLUICE_WITH_MONITORING
        prometheus::Registry registry;
        manager.add_observer(std::make_shared<sluice::monitoring::stream_metrics_exporter>(
            registry, std::map<std::string, std::string>{{"service", "relay_example"}}));
#endif

        std::vector<std::string> ids{"fast", "slow", "broken"};

        auto fast = std::make_shared<slow_consumer>(
            io_context, manager.start_stream("fast", make_sse_source(io_context, 200, 64)), 0ms);

        // 1KB events against a slow reader fill the read-ahead budget.
        auto slow = std::make_shared<slow_consumer>(
            io_context, manager.start_stream("slow", make_sse_source(io_context, 60, 1024)), 5ms);

        auto broken_source = make_sse_source(io_context, 10, 32);
        broken_source->fail_after_chunks(boost::asio::error::connection_reset);
        auto broken = std::make_shared<slow_consumer>(
            io_context, manager.start_stream("broken", broken_source), 0ms);

        try
        {
            auto extra = manager.start_stream("extra", make_sse_source(io_context, 1, 8));
        }
        catch (const sluice::capacity_exceeded& e)
        {
            std::cout << "extra: " << e.what() << std::endl;
        }

        fast->start();
        slow->start();
        broken->start();

        io_context.run_for(2s);

        print_metrics(manager, ids);

#ifdef SLUICE_WITH_MONITORING
        prometheus::TextSerializer serializer;
        std::cout << serializer.Serialize(registry.Collect());
#endif
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
