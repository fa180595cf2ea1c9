#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace sluice
{

// ============================================================================
// Stream Manager Configuration
// ============================================================================

struct stream_config
{
    // Capacity
    std::size_t max_concurrent_streams{150};

    // Read-ahead buffer
    std::size_t buffer_byte_budget{64 * 1024};

    // Backpressure settings
    double backpressure_threshold{0.8};
    double hysteresis_factor{0.7};  // deactivate below threshold * factor
    bool adaptive_buffering{true};
    std::chrono::milliseconds adaptive_delay_cap{100};
    double adaptive_delay_scale{200.0};

    // Transforms, both off by default: they touch payload bytes
    bool size_reduction_enabled{false};
    bool content_optimization_enabled{false};
    std::size_t size_reduction_min_bytes{2048};

    // Advisory only. Transforms always run inline on the session executor.
    std::size_t worker_pool_size{4};

    // Observability
    std::chrono::milliseconds metrics_grace_period{1000};
    std::uint64_t progress_log_interval{25};

    bool is_valid() const
    {
        return validation_error() == nullptr;
    }

    // Returns the first violated rule, or nullptr.
    const char* validation_error() const;

    // Throws std::invalid_argument on the first violated rule.
    void validate() const;

    double deactivation_threshold() const
    {
        return backpressure_threshold * hysteresis_factor;
    }
};

// ============================================================================
// Configuration Builder
// ============================================================================

class stream_config_builder
{
    stream_config config_;

public:
    stream_config_builder() = default;
    explicit stream_config_builder(stream_config base) : config_(base) {}

    stream_config_builder& with_max_concurrent_streams(std::size_t n)
    {
        config_.max_concurrent_streams = n;
        return *this;
    }

    stream_config_builder& with_buffer_budget(std::size_t bytes)
    {
        config_.buffer_byte_budget = bytes;
        return *this;
    }

    stream_config_builder& with_backpressure_threshold(double threshold)
    {
        config_.backpressure_threshold = threshold;
        return *this;
    }

    stream_config_builder& with_hysteresis_factor(double factor)
    {
        config_.hysteresis_factor = factor;
        return *this;
    }

    stream_config_builder& with_adaptive_buffering(bool enabled)
    {
        config_.adaptive_buffering = enabled;
        return *this;
    }

    stream_config_builder& with_adaptive_delay(std::chrono::milliseconds cap, double scale)
    {
        config_.adaptive_delay_cap = cap;
        config_.adaptive_delay_scale = scale;
        return *this;
    }

    stream_config_builder& with_size_reduction(bool enabled, std::size_t min_bytes = 2048)
    {
        config_.size_reduction_enabled = enabled;
        config_.size_reduction_min_bytes = min_bytes;
        return *this;
    }

    stream_config_builder& with_content_optimization(bool enabled)
    {
        config_.content_optimization_enabled = enabled;
        return *this;
    }

    stream_config_builder& with_worker_pool_size(std::size_t n)
    {
        config_.worker_pool_size = n;
        return *this;
    }

    stream_config_builder& with_grace_period(std::chrono::milliseconds period)
    {
        config_.metrics_grace_period = period;
        return *this;
    }

    stream_config_builder& with_progress_log_interval(std::uint64_t chunks)
    {
        config_.progress_log_interval = chunks;
        return *this;
    }

    stream_config build() const
    {
        config_.validate();
        return config_;
    }
};

/// Overlay SLUICE_* environment variables on top of `base`.
/// Unset variables leave the corresponding field untouched.
/// @throws std::invalid_argument on malformed values or an invalid result
stream_config load_stream_config_from_env(stream_config base = {});

} // namespace sluice
