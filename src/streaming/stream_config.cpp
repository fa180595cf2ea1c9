#include <sluice/streaming/stream_config.hpp>

#include <fmt/core.h>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sluice
{

const char* stream_config::validation_error() const
{
    if (max_concurrent_streams < 1)
        return "max_concurrent_streams must be at least 1";
    if (buffer_byte_budget < 1024)
        return "buffer_byte_budget must be at least 1024 bytes";
    if (!(backpressure_threshold > 0.0 && backpressure_threshold <= 1.0))
        return "backpressure_threshold must be in (0, 1]";
    if (!(hysteresis_factor > 0.0 && hysteresis_factor < 1.0))
        return "hysteresis_factor must be in (0, 1)";
    if (!(adaptive_delay_scale > 0.0))
        return "adaptive_delay_scale must be positive";
    if (adaptive_delay_cap.count() < 0)
        return "adaptive_delay_cap must not be negative";
    if (metrics_grace_period.count() < 0)
        return "metrics_grace_period must not be negative";
    return nullptr;
}

void stream_config::validate() const
{
    if (auto err = validation_error())
        throw std::invalid_argument(fmt::format("Invalid stream configuration: {}", err));
}

namespace
{

const char* lookup(const char* name)
{
    const char* value = std::getenv(name);
    if (value && *value)
        return value;
    return nullptr;
}

std::size_t parse_size(const char* name, const char* value)
{
    // std::stoull would skip leading whitespace and accept a sign.
    std::string_view text(value);
    if (text.empty() || text.front() < '0' || text.front() > '9')
        throw std::invalid_argument(fmt::format("{}: expected a non-negative integer, got '{}'", name, value));

    std::size_t pos = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(std::string(text), &pos);
    }
    catch (const std::exception&) {
        throw std::invalid_argument(fmt::format("{}: expected a non-negative integer, got '{}'", name, value));
    }
    if (pos != text.size())
        throw std::invalid_argument(fmt::format("{}: trailing characters in '{}'", name, value));
    return static_cast<std::size_t>(parsed);
}

double parse_double(const char* name, const char* value)
{
    std::size_t pos = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &pos);
    }
    catch (const std::exception&) {
        throw std::invalid_argument(fmt::format("{}: expected a number, got '{}'", name, value));
    }
    if (pos != std::string_view(value).size())
        throw std::invalid_argument(fmt::format("{}: trailing characters in '{}'", name, value));
    return parsed;
}

bool parse_bool(const char* name, const char* value)
{
    std::string_view text(value);
    if (text == "1" || text == "true" || text == "yes" || text == "on")
        return true;
    if (text == "0" || text == "false" || text == "no" || text == "off")
        return false;
    throw std::invalid_argument(fmt::format("{}: expected a boolean, got '{}'", name, value));
}

} // namespace

stream_config load_stream_config_from_env(stream_config base)
{
    if (auto v = lookup("SLUICE_MAX_STREAMS"))
        base.max_concurrent_streams = parse_size("SLUICE_MAX_STREAMS", v);
    if (auto v = lookup("SLUICE_BUFFER_BYTES"))
        base.buffer_byte_budget = parse_size("SLUICE_BUFFER_BYTES", v);
    if (auto v = lookup("SLUICE_BACKPRESSURE_THRESHOLD"))
        base.backpressure_threshold = parse_double("SLUICE_BACKPRESSURE_THRESHOLD", v);
    if (auto v = lookup("SLUICE_ADAPTIVE_BUFFERING"))
        base.adaptive_buffering = parse_bool("SLUICE_ADAPTIVE_BUFFERING", v);
    if (auto v = lookup("SLUICE_SIZE_REDUCTION"))
        base.size_reduction_enabled = parse_bool("SLUICE_SIZE_REDUCTION", v);
    if (auto v = lookup("SLUICE_CONTENT_OPTIMIZATION"))
        base.content_optimization_enabled = parse_bool("SLUICE_CONTENT_OPTIMIZATION", v);
    if (auto v = lookup("SLUICE_WORKER_POOL_SIZE"))
        base.worker_pool_size = parse_size("SLUICE_WORKER_POOL_SIZE", v);
    if (auto v = lookup("SLUICE_GRACE_PERIOD_MS"))
        base.metrics_grace_period = std::chrono::milliseconds(parse_size("SLUICE_GRACE_PERIOD_MS", v));

    base.validate();
    return base;
}

} // namespace sluice
