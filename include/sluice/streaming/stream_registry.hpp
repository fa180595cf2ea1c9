#pragma once

#include <sluice/streaming/errors.hpp>
#include <sluice/streaming/stream_metrics.hpp>
#include <sluice/streaming/stream_session.hpp>

#include <fmt/core.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sluice
{

// ============================================================================
// Stream Registry
// ============================================================================

// Owned table of live sessions plus the metrics entries that outlive them for
// the grace window. Only insert/remove/count go through the lock; each
// session mutates its own metrics from its own task.
class stream_registry
{
    std::unordered_map<std::string, stream_session_ptr> live_;
    std::unordered_map<std::string, std::shared_ptr<session_metrics>> metrics_;
    mutable std::mutex mutex_;

public:
    // Checks capacity and id uniqueness, then creates the session with
    // `make` and registers it, all under one lock. Nothing is constructed
    // when the check fails.
    template<typename Factory>
    stream_session_ptr admit(const std::string& id, std::size_t max_live, Factory&& make)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (live_.size() >= max_live)
            throw capacity_exceeded(max_live);

        if (live_.find(id) != live_.end())
            throw stream_error(stream_errc::duplicate_stream_id,
                               fmt::format("Stream {} is already active", id));

        stream_session_ptr session = make();
        live_[id] = session;
        metrics_[id] = session->metrics();  // replaces a grace-window entry
        return session;
    }

    // Drops the live entry if it still belongs to `session`.
    bool release(const std::string& id, const stream_session* session)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = live_.find(id);
        if (it == live_.end() || it->second.get() != session)
            return false;
        live_.erase(it);
        return true;
    }

    // Removes the retained metrics unless the id went live again.
    bool evict_metrics(const std::string& id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (live_.find(id) != live_.end())
            return false;
        return metrics_.erase(id) > 0;
    }

    std::optional<stream_metrics> metrics(const std::string& id) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = metrics_.find(id);
        if (it == metrics_.end())
            return std::nullopt;
        return it->second->snapshot();
    }

    std::vector<stream_metrics> all_metrics() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<stream_metrics> out;
        out.reserve(metrics_.size());
        for (auto& [id, m] : metrics_)
            out.push_back(m->snapshot());
        return out;
    }

    std::size_t live_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return live_.size();
    }

    std::size_t retained_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return metrics_.size();
    }

    bool is_live(const std::string& id) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return live_.find(id) != live_.end();
    }

    std::vector<stream_session_ptr> live_sessions() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<stream_session_ptr> out;
        out.reserve(live_.size());
        for (auto& [id, session] : live_)
            out.push_back(session);
        return out;
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        live_.clear();
        metrics_.clear();
    }
};

} // namespace sluice
