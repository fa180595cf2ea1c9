#pragma once

#include <sluice/io/eviction_scheduler.hpp>
#include <sluice/streaming/chunk_source.hpp>
#include <sluice/streaming/chunk_transform.hpp>
#include <sluice/streaming/stream_config.hpp>
#include <sluice/streaming/stream_metrics.hpp>
#include <sluice/streaming/stream_observer.hpp>
#include <sluice/streaming/stream_reader.hpp>
#include <sluice/streaming/stream_registry.hpp>

#include <utility>
#include <boost/asio.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sluice
{

// ============================================================================
// Stream Manager
// ============================================================================

class stream_manager
{
    boost::asio::io_context& io_context_;
    const stream_config config_;

    std::shared_ptr<stream_registry> registry_;
    std::shared_ptr<io::eviction_scheduler<std::string>> evictions_;

    // Applied to sessions started after registration
    std::vector<std::shared_ptr<stream_observer>> observers_;
    std::vector<chunk_stage_ptr> stages_;
    mutable std::mutex mutex_;

public:
    /// @throws std::invalid_argument if `config` is invalid
    explicit stream_manager(boost::asio::io_context& io_context, stream_config config = {});
    ~stream_manager();

    stream_manager(const stream_manager&) = delete;
    stream_manager& operator=(const stream_manager&) = delete;

    /// Register a stream and start reading ahead from `source`.
    /// @throws capacity_exceeded when max_concurrent_streams sessions are open
    /// @throws stream_error{duplicate_stream_id} when `id` is already open
    [[nodiscard]] stream_reader start_stream(const std::string& id, chunk_source_ptr source);

    /// Metrics for an open stream, or one that closed less than the grace
    /// period ago.
    [[nodiscard]] std::optional<stream_metrics> get_metrics(const std::string& id) const;

    /// See aggregate_stats for the meaning of active_streams.
    [[nodiscard]] aggregate_stats get_aggregate_stats() const;

    /// Exact number of open sessions; this is what capacity is checked against.
    [[nodiscard]] std::size_t active_count() const;

    const stream_config& config() const { return config_; }

    void add_observer(std::shared_ptr<stream_observer> observer);
    void add_transform_stage(chunk_stage_ptr stage);

    /// Cancel every open stream. Their metrics follow the normal grace window.
    void shutdown();

private:
    void notify_rejected(const std::string& id);
};

} // namespace sluice
