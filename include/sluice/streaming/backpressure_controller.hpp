#pragma once

#include <sluice/streaming/stream_config.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>

namespace sluice
{

// ============================================================================
// Backpressure Controller
// ============================================================================

// Hysteresis controller over read-ahead buffer occupancy. Activates when
// utilization exceeds the high threshold and deactivates only once it drops
// below threshold * hysteresis factor.
class backpressure_controller
{
public:
    enum class transition { none, activated, deactivated };

    struct decision
    {
        transition change{transition::none};
        std::chrono::milliseconds delay{0};
    };

private:
    std::size_t byte_budget_;
    double high_threshold_;
    double low_threshold_;
    bool adaptive_;
    std::chrono::milliseconds delay_cap_;
    double delay_scale_;

    bool active_{false};
    double utilization_{0.0};
    std::chrono::milliseconds adaptive_delay_{0};

public:
    explicit backpressure_controller(const stream_config& config)
        : byte_budget_(config.buffer_byte_budget)
        , high_threshold_(config.backpressure_threshold)
        , low_threshold_(config.deactivation_threshold())
        , adaptive_(config.adaptive_buffering)
        , delay_cap_(config.adaptive_delay_cap)
        , delay_scale_(config.adaptive_delay_scale) {}

    // Called once before every upstream read.
    decision evaluate(std::size_t buffered_bytes)
    {
        decision d;
        utilization_ = byte_budget_ > 0
            ? static_cast<double>(buffered_bytes) / static_cast<double>(byte_budget_)
            : 0.0;

        if (utilization_ > high_threshold_)
        {
            if (!active_)
            {
                active_ = true;
                d.change = transition::activated;
            }

            if (adaptive_)
            {
                adaptive_delay_ = delay_for(utilization_);
                d.delay = adaptive_delay_;
            }
        }
        else if (active_ && utilization_ < low_threshold_)
        {
            active_ = false;
            adaptive_delay_ = std::chrono::milliseconds{0};
            d.change = transition::deactivated;
        }

        return d;
    }

    std::chrono::milliseconds delay_for(double utilization) const
    {
        double overage = std::max(0.0, utilization - high_threshold_);
        double ms = std::min(static_cast<double>(delay_cap_.count()), overage * delay_scale_);
        return std::chrono::milliseconds(std::llround(ms));
    }

    bool is_active() const { return active_; }
    double utilization() const { return utilization_; }
    std::chrono::milliseconds adaptive_delay() const { return adaptive_delay_; }

    double high_threshold() const { return high_threshold_; }
    double low_threshold() const { return low_threshold_; }
    std::size_t byte_budget() const { return byte_budget_; }

    void reset()
    {
        active_ = false;
        utilization_ = 0.0;
        adaptive_delay_ = std::chrono::milliseconds{0};
    }
};

} // namespace sluice
