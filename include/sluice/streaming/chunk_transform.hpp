#pragma once

#include <sluice/streaming/chunk.hpp>
#include <sluice/streaming/stream_config.hpp>
#include <sluice/streaming/stream_metrics.hpp>

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace sluice
{

// ============================================================================
// Transform Stage Interface
// ============================================================================

// Extra per-chunk transform run after the built-in passes. One instance is
// shared by every session started after registration, so apply() must be safe
// to call concurrently. Throwing makes the pipeline emit the original chunk.
class chunk_stage
{
public:
    virtual ~chunk_stage() = default;
    virtual const char* name() const = 0;
    virtual void apply(chunk& data) = 0;
};

using chunk_stage_ptr = std::shared_ptr<chunk_stage>;

// ============================================================================
// Chunk Transformer
// ============================================================================

class chunk_transformer
{
    bool size_reduction_;
    bool content_optimization_;
    std::size_t size_reduction_min_bytes_;
    std::vector<chunk_stage_ptr> stages_;

public:
    static constexpr std::string_view event_stream_prefix{"data: "};

    explicit chunk_transformer(const stream_config& config,
                               std::vector<chunk_stage_ptr> stages = {});

    /// Run the pipeline on one upstream chunk.
    /// @return std::nullopt for an empty chunk, otherwise the chunk to emit.
    ///         If any pass throws, the original chunk is returned unchanged.
    std::optional<chunk> apply(std::string_view stream_id, const chunk& input, session_metrics& metrics) const;

    static bool is_event_stream(const chunk& data);

    // Leading/trailing whitespace trim. Event-stream payloads are returned
    // byte-identical.
    static chunk reduce_size(const chunk& data);

    // Event-stream payloads keep every line, blank lines included, since blank
    // lines terminate events. Everything else is returned as-is.
    static chunk optimize_content(const chunk& data);

    std::size_t stage_count() const { return stages_.size(); }

private:
    chunk run_passes(const chunk& input, session_metrics& metrics) const;
};

} // namespace sluice
