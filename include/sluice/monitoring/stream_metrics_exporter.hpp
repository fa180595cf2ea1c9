#pragma once

#include <sluice/streaming/stream_observer.hpp>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>

#include <map>
#include <string>

namespace sluice::monitoring
{

// ============================================================================
// Prometheus Exporter
// ============================================================================

/// Process-wide stream counters in a caller-owned registry. Per-stream
/// metrics stay in the manager; nothing here is labelled by stream id.
class stream_metrics_exporter : public stream_observer
{
public:
    /// @param registry Registry the families are registered in; must outlive the exporter
    /// @param labels Constant labels applied to every family (e.g. {"service", "relay"})
    explicit stream_metrics_exporter(prometheus::Registry& registry,
                                     const std::map<std::string, std::string>& labels = {});

    void on_stream_started(const std::string& id) override;
    void on_stream_rejected(const std::string& id) override;
    void on_chunk_emitted(const std::string& id, std::size_t bytes) override;
    void on_backpressure(const std::string& id, bool active) override;
    void on_stream_closed(const std::string& id, close_reason reason, const boost::system::error_code& ec) override;

private:
    prometheus::Counter& started_;
    prometheus::Counter& rejected_;
    prometheus::Counter& chunks_;
    prometheus::Counter& bytes_;
    prometheus::Counter& backpressure_events_;
    prometheus::Family<prometheus::Counter>& closed_family_;
    prometheus::Counter& closed_completed_;
    prometheus::Counter& closed_upstream_error_;
    prometheus::Counter& closed_cancelled_;
    prometheus::Gauge& active_;
};

} // namespace sluice::monitoring
