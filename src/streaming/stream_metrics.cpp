#include <sluice/streaming/stream_metrics.hpp>

#include <algorithm>

namespace sluice
{

std::uint64_t session_metrics::record_chunk(std::size_t size, std::chrono::steady_clock::time_point now)
{
    auto chunks = chunks_processed_.fetch_add(1, std::memory_order_relaxed) + 1;
    auto bytes = bytes_processed_.fetch_add(size, std::memory_order_relaxed) + size;

    average_chunk_size_.store(static_cast<double>(bytes) / static_cast<double>(chunks),
                              std::memory_order_relaxed);

    // Floor elapsed time at 1ms so the first chunk never divides by zero.
    auto elapsed_ms = std::max<std::int64_t>(1, elapsed(now).count());
    processing_rate_.store(static_cast<double>(chunks) / (static_cast<double>(elapsed_ms) / 1000.0),
                           std::memory_order_relaxed);

    return chunks;
}

void session_metrics::record_compression(std::size_t original_size, std::size_t reduced_size)
{
    if (original_size == 0)
        return;

    double sample = static_cast<double>(reduced_size) / static_cast<double>(original_size);
    if (!has_compression_ratio_.load(std::memory_order_relaxed))
    {
        compression_ratio_.store(sample, std::memory_order_relaxed);
        has_compression_ratio_.store(true, std::memory_order_release);
        return;
    }

    double previous = compression_ratio_.load(std::memory_order_relaxed);
    compression_ratio_.store((previous + sample) / 2.0, std::memory_order_relaxed);
}

stream_metrics session_metrics::snapshot() const
{
    stream_metrics m;
    m.stream_id = stream_id_;
    m.start_time = start_time_;
    m.chunks_processed = chunks_processed_.load(std::memory_order_relaxed);
    m.bytes_processed = bytes_processed_.load(std::memory_order_relaxed);
    m.average_chunk_size = m.chunks_processed > 0 ? average_chunk_size_.load(std::memory_order_relaxed) : 0.0;
    m.processing_rate = processing_rate_.load(std::memory_order_relaxed);
    m.backpressure_events = backpressure_events_.load(std::memory_order_relaxed);
    if (has_compression_ratio_.load(std::memory_order_acquire))
        m.compression_ratio = compression_ratio_.load(std::memory_order_relaxed);
    return m;
}

} // namespace sluice
