#include <sluice/streaming/chunk_transform.hpp>
#include <sluice/logger.h>

#include <fmt/core.h>

#include <algorithm>
#include <exception>

namespace sluice
{

namespace
{

constexpr std::string_view component{"STREAMING_MANAGER"};

bool is_space(std::uint8_t c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

} // namespace

chunk_transformer::chunk_transformer(const stream_config& config, std::vector<chunk_stage_ptr> stages)
    : size_reduction_(config.size_reduction_enabled)
    , content_optimization_(config.content_optimization_enabled)
    , size_reduction_min_bytes_(config.size_reduction_min_bytes)
    , stages_(std::move(stages))
{
}

std::optional<chunk> chunk_transformer::apply(std::string_view stream_id,
                                              const chunk& input,
                                              session_metrics& metrics) const
{
    if (input.empty())
        return std::nullopt;

    try {
        return run_passes(input, metrics);
    }
    catch (const std::exception& e) {
        log_error(component, fmt::format("Chunk processing error for stream {}: {}", stream_id, e.what()));
        return input;
    }
    catch (...) {
        log_error(component, fmt::format("Chunk processing error for stream {}: unknown exception", stream_id));
        return input;
    }
}

chunk chunk_transformer::run_passes(const chunk& input, session_metrics& metrics) const
{
    chunk current = input;

    if (size_reduction_ && current.size() > size_reduction_min_bytes_)
    {
        chunk reduced = reduce_size(current);
        if (!reduced.empty() && reduced.size() < current.size())
        {
            metrics.record_compression(current.size(), reduced.size());
            current = std::move(reduced);
        }
    }

    if (content_optimization_)
        current = optimize_content(current);

    for (auto& stage : stages_)
        stage->apply(current);

    return current;
}

bool chunk_transformer::is_event_stream(const chunk& data)
{
    auto text = as_text(data);
    return text.substr(0, event_stream_prefix.size()) == event_stream_prefix;
}

chunk chunk_transformer::reduce_size(const chunk& data)
{
    if (is_event_stream(data))
        return data;

    auto first = std::find_if_not(data.begin(), data.end(), is_space);
    auto last = std::find_if_not(data.rbegin(), std::make_reverse_iterator(first), is_space).base();
    return chunk(first, last);
}

chunk chunk_transformer::optimize_content(const chunk& data)
{
    if (!is_event_stream(data))
        return data;

    // Split on '\n' and rejoin. Every line survives the filter; stricter rules
    // go here once a payload shape is known to tolerate them.
    std::vector<std::string_view> lines;
    auto text = as_text(data);
    std::size_t start = 0;
    while (true)
    {
        auto pos = text.find('\n', start);
        if (pos == std::string_view::npos)
        {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }

    chunk out;
    out.reserve(data.size());
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        if (i > 0)
            out.push_back('\n');
        out.insert(out.end(), lines[i].begin(), lines[i].end());
    }
    return out;
}

} // namespace sluice
