#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace sluice
{

// ============================================================================
// Metrics Snapshot
// ============================================================================

struct stream_metrics
{
    std::string stream_id;
    std::chrono::steady_clock::time_point start_time;
    std::uint64_t chunks_processed{0};
    std::uint64_t bytes_processed{0};
    double average_chunk_size{0.0};
    double processing_rate{0.0};  // chunks per second
    std::uint64_t backpressure_events{0};
    std::optional<double> compression_ratio;  // set once size reduction applied
};

// Totals over every metrics entry still held by the manager, including
// streams inside their post-completion grace window.
//
// `active_streams` is a liveness approximation, not an exact count: an entry
// counts as active if it started less than one second ago or has not emitted
// its first chunk yet. A long-running stream that is still emitting is
// therefore not counted, and a stream that finished within its first second
// still is. Use stream_manager::active_count() for the exact number of open
// sessions.
struct aggregate_stats
{
    std::size_t active_streams{0};
    std::size_t total_streams{0};
    double average_processing_rate{0.0};
    std::uint64_t total_bytes_processed{0};
    std::uint64_t backpressure_events{0};
};

// ============================================================================
// Live Session Metrics
// ============================================================================

// Written only by the owning session's task; read concurrently through
// snapshot().
class session_metrics
{
    std::string stream_id_;
    std::chrono::steady_clock::time_point start_time_{std::chrono::steady_clock::now()};

    std::atomic<std::uint64_t> chunks_processed_{0};
    std::atomic<std::uint64_t> bytes_processed_{0};
    std::atomic<double> average_chunk_size_{0.0};
    std::atomic<double> processing_rate_{0.0};
    std::atomic<std::uint64_t> backpressure_events_{0};
    std::atomic<double> compression_ratio_{0.0};
    std::atomic<bool> has_compression_ratio_{false};

public:
    explicit session_metrics(std::string stream_id)
        : stream_id_(std::move(stream_id)) {}

    session_metrics(const session_metrics&) = delete;
    session_metrics& operator=(const session_metrics&) = delete;

    const std::string& stream_id() const { return stream_id_; }
    std::chrono::steady_clock::time_point start_time() const { return start_time_; }

    // Count one emitted chunk and refresh the derived values. Returns the new
    // chunk count.
    std::uint64_t record_chunk(std::size_t size,
                               std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    void record_backpressure_event()
    {
        backpressure_events_.fetch_add(1, std::memory_order_relaxed);
    }

    // First sample sets the ratio; later samples average with the previous one.
    void record_compression(std::size_t original_size, std::size_t reduced_size);

    std::uint64_t chunks_processed() const { return chunks_processed_.load(std::memory_order_relaxed); }
    std::uint64_t bytes_processed() const { return bytes_processed_.load(std::memory_order_relaxed); }
    double processing_rate() const { return processing_rate_.load(std::memory_order_relaxed); }
    std::uint64_t backpressure_events() const { return backpressure_events_.load(std::memory_order_relaxed); }

    std::chrono::milliseconds elapsed(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()) const
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time_);
    }

    stream_metrics snapshot() const;
};

} // namespace sluice
