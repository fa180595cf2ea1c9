#include <sluice/streaming/stream_manager.hpp>
#include <sluice/logger.h>

#include <fmt/core.h>

namespace sluice
{

namespace
{

constexpr std::string_view component{"STREAMING_MANAGER"};

const stream_config& validated(const stream_config& config)
{
    config.validate();
    return config;
}

} // namespace

stream_manager::stream_manager(boost::asio::io_context& io_context, stream_config config)
    : io_context_(io_context)
    , config_(validated(config))
    , registry_(std::make_shared<stream_registry>())
{
    std::weak_ptr<stream_registry> weak_registry = registry_;
    evictions_ = std::make_shared<io::eviction_scheduler<std::string>>(
        io_context_,
        [weak_registry](const std::string& id) {
            if (auto registry = weak_registry.lock())
            {
                if (registry->evict_metrics(id))
                    log_debug(component, fmt::format("Evicted metrics for stream {}", id));
            }
        });

    log_info(component, fmt::format("Initialized with {} max streams", config_.max_concurrent_streams));
    log_debug(component, fmt::format("Worker pool size {} is advisory; chunk transforms run inline",
                                     config_.worker_pool_size));
}

stream_manager::~stream_manager()
{
    shutdown();
    evictions_->stop();
    registry_->clear();
}

stream_reader stream_manager::start_stream(const std::string& id, chunk_source_ptr source)
{
    if (!source)
        throw std::invalid_argument("chunk source cannot be null");

    std::vector<std::shared_ptr<stream_observer>> observers;
    std::vector<chunk_stage_ptr> stages;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        observers = observers_;
        stages = stages_;
    }

    std::weak_ptr<stream_registry> weak_registry = registry_;
    std::weak_ptr<io::eviction_scheduler<std::string>> weak_evictions = evictions_;
    auto grace = config_.metrics_grace_period;

    stream_session_ptr session;
    try {
        session = registry_->admit(id, config_.max_concurrent_streams, [&]() {
            return std::make_shared<stream_session>(io_context_, id, std::move(source), config_, std::move(stages));
        });
    }
    catch (const capacity_exceeded& e) {
        log_warning(component, fmt::format("Rejected stream {}: {}", id, e.what()));
        notify_rejected(id);
        throw;
    }

    // A reused id may still have an eviction pending from its previous run.
    evictions_->cancel(id);

    auto* raw = session.get();
    session->set_close_handler([weak_registry, weak_evictions, grace, raw](const std::string& sid, close_reason, boost::system::error_code) {
        auto registry = weak_registry.lock();
        if (!registry || !registry->release(sid, raw))
            return;
        if (auto evictions = weak_evictions.lock())
            evictions->schedule(sid, grace);
    });

    for (auto& observer : observers)
        session->add_observer(observer);

    for (auto& observer : observers)
    {
        try {
            observer->on_stream_started(id);
        }
        catch (const std::exception& e) {
            log_error(component, fmt::format("Observer exception for stream {}: {}", id, e.what()));
        }
    }

    log_debug(component, fmt::format("Started stream {}", id));
    session->start();
    return stream_reader(std::move(session));
}

std::optional<stream_metrics> stream_manager::get_metrics(const std::string& id) const
{
    return registry_->metrics(id);
}

aggregate_stats stream_manager::get_aggregate_stats() const
{
    auto all = registry_->all_metrics();
    auto now = std::chrono::steady_clock::now();

    aggregate_stats stats;
    stats.total_streams = all.size();

    double rate_sum = 0.0;
    for (const auto& m : all)
    {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - m.start_time);
        if (elapsed < std::chrono::milliseconds(1000) || m.chunks_processed == 0)
            ++stats.active_streams;

        rate_sum += m.processing_rate;
        stats.total_bytes_processed += m.bytes_processed;
        stats.backpressure_events += m.backpressure_events;
    }

    if (!all.empty())
        stats.average_processing_rate = rate_sum / static_cast<double>(all.size());

    return stats;
}

std::size_t stream_manager::active_count() const
{
    return registry_->live_count();
}

void stream_manager::add_observer(std::shared_ptr<stream_observer> observer)
{
    if (!observer)
        throw std::invalid_argument("observer cannot be null");

    std::lock_guard<std::mutex> lock(mutex_);
    observers_.push_back(std::move(observer));
}

void stream_manager::add_transform_stage(chunk_stage_ptr stage)
{
    if (!stage)
        throw std::invalid_argument("transform stage cannot be null");

    std::lock_guard<std::mutex> lock(mutex_);
    log_debug(component, fmt::format("Registered transform stage {}", stage->name()));
    stages_.push_back(std::move(stage));
}

void stream_manager::shutdown()
{
    auto sessions = registry_->live_sessions();
    if (!sessions.empty())
        log_info(component, fmt::format("Shutting down {} open streams", sessions.size()));

    for (auto& session : sessions)
        session->cancel();
}

void stream_manager::notify_rejected(const std::string& id)
{
    std::vector<std::shared_ptr<stream_observer>> observers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        observers = observers_;
    }

    for (auto& observer : observers)
    {
        try {
            observer->on_stream_rejected(id);
        }
        catch (const std::exception& e) {
            log_error(component, fmt::format("Observer exception for stream {}: {}", id, e.what()));
        }
    }
}

} // namespace sluice
