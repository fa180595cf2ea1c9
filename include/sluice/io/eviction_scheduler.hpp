#pragma once

#include <utility>
#include <boost/asio.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace sluice::io
{

// One-shot deferred removals driven by a single steady_timer over an ordered
// expiry queue. Each key has at most one pending eviction. Safe to call from
// any thread; the eviction handler runs on the io_context without the
// internal lock held.
template<typename Tkey>
class eviction_scheduler : public std::enable_shared_from_this<eviction_scheduler<Tkey>>
{
  public:
    using eviction_handler = std::function<void(const Tkey&)>;
    using clock_type = std::chrono::steady_clock;
    using time_point = clock_type::time_point;
    using duration = clock_type::duration;

  private:
    using queue_type = std::multimap<time_point, Tkey>;

    boost::asio::steady_timer timer_;
    std::unordered_map<Tkey, typename queue_type::iterator> entries_;
    queue_type expiry_queue_;
    const eviction_handler handler_;
    bool waiting_{false};
    bool stopped_{false};
    mutable std::mutex mutex_;

  public:
    eviction_scheduler(boost::asio::io_context& io_context, eviction_handler handler)
      : timer_(io_context)
      , handler_(std::move(handler))
    {
        if (!handler_)
            throw std::invalid_argument("eviction handler cannot be null");
    }

    eviction_scheduler(const eviction_scheduler&) = delete;
    eviction_scheduler& operator=(const eviction_scheduler&) = delete;

    // Schedule (or reschedule) the eviction of `key` after `delay`.
    // Returns false if an earlier eviction for the key was replaced.
    bool schedule(const Tkey& key, duration delay)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_)
            return false;

        bool fresh = true;
        auto it = entries_.find(key);
        if (it != entries_.end())
        {
            expiry_queue_.erase(it->second);
            entries_.erase(it);
            fresh = false;
        }

        auto queue_iter = expiry_queue_.emplace(clock_type::now() + delay, key);
        entries_.emplace(key, queue_iter);

        if (!waiting_ || queue_iter == expiry_queue_.begin())
            arm_locked();

        return fresh;
    }

    bool cancel(const Tkey& key)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end())
            return false;

        expiry_queue_.erase(it->second);
        entries_.erase(it);
        return true;
    }

    bool contains(const Tkey& key) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.find(key) != entries_.end();
    }

    std::optional<duration> remaining(const Tkey& key) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end())
            return {};

        auto left = it->second->first - clock_type::now();
        return left > duration::zero() ? left : duration::zero();
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    // Drops every pending eviction without invoking the handler.
    void stop()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        entries_.clear();
        expiry_queue_.clear();
        waiting_ = false;

        boost::system::error_code ec;
        timer_.cancel(ec);
    }

  private:
    void arm_locked()
    {
        if (expiry_queue_.empty())
        {
            waiting_ = false;
            return;
        }

        waiting_ = true;
        timer_.expires_at(expiry_queue_.begin()->first);
        timer_.async_wait([self = this->shared_from_this()](const boost::system::error_code& ec) {
            // Rescheduled or stopped
            if (ec == boost::asio::error::operation_aborted)
                return;
            self->process_expired();
        });
    }

    void process_expired()
    {
        std::vector<Tkey> expired;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_)
                return;

            auto now = clock_type::now();
            auto it = expiry_queue_.begin();
            while (it != expiry_queue_.end() && it->first <= now)
            {
                expired.push_back(it->second);
                entries_.erase(it->second);
                it = expiry_queue_.erase(it);
            }

            arm_locked();
        }

        for (const auto& key : expired)
            handler_(key);
    }
};

} // namespace sluice::io
