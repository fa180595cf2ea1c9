#include <sluice/monitoring/stream_metrics_exporter.hpp>

namespace sluice::monitoring
{

namespace
{

prometheus::Counter& make_counter(prometheus::Registry& registry,
                                  const std::string& name,
                                  const std::string& help,
                                  const std::map<std::string, std::string>& labels)
{
    return prometheus::BuildCounter().Name(name).Help(help).Labels(labels).Register(registry).Add({});
}

} // namespace

stream_metrics_exporter::stream_metrics_exporter(prometheus::Registry& registry,
                                                 const std::map<std::string, std::string>& labels)
    : started_(make_counter(registry, "sluice_streams_started_total", "Streams admitted by the manager", labels))
    , rejected_(make_counter(registry, "sluice_streams_rejected_total", "Streams rejected at capacity", labels))
    , chunks_(make_counter(registry, "sluice_chunks_total", "Chunks emitted to consumers", labels))
    , bytes_(make_counter(registry, "sluice_bytes_total", "Bytes emitted to consumers", labels))
    , backpressure_events_(make_counter(registry, "sluice_backpressure_events_total",
                                        "Backpressure activations across all streams", labels))
    , closed_family_(prometheus::BuildCounter()
                         .Name("sluice_streams_closed_total")
                         .Help("Streams closed, by reason")
                         .Labels(labels)
                         .Register(registry))
    , closed_completed_(closed_family_.Add({{"reason", to_string(close_reason::completed)}}))
    , closed_upstream_error_(closed_family_.Add({{"reason", to_string(close_reason::upstream_error)}}))
    , closed_cancelled_(closed_family_.Add({{"reason", to_string(close_reason::cancelled)}}))
    , active_(prometheus::BuildGauge()
                  .Name("sluice_active_streams")
                  .Help("Open stream sessions")
                  .Labels(labels)
                  .Register(registry)
                  .Add({}))
{
}

void stream_metrics_exporter::on_stream_started(const std::string&)
{
    started_.Increment();
    active_.Increment();
}

void stream_metrics_exporter::on_stream_rejected(const std::string&)
{
    rejected_.Increment();
}

void stream_metrics_exporter::on_chunk_emitted(const std::string&, std::size_t bytes)
{
    chunks_.Increment();
    bytes_.Increment(static_cast<double>(bytes));
}

void stream_metrics_exporter::on_backpressure(const std::string&, bool active)
{
    if (active)
        backpressure_events_.Increment();
}

void stream_metrics_exporter::on_stream_closed(const std::string&, close_reason reason, const boost::system::error_code&)
{
    active_.Decrement();
    switch (reason)
    {
        case close_reason::completed:
            closed_completed_.Increment();
            break;
        case close_reason::upstream_error:
            closed_upstream_error_.Increment();
            break;
        case close_reason::cancelled:
            closed_cancelled_.Increment();
            break;
    }
}

} // namespace sluice::monitoring
