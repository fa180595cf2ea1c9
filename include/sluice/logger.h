#pragma once

#include <fmt/core.h>

#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace sluice
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

inline std::string_view to_string(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
    }
    return "UNKNOWN";
}

class Logger
{
  public:
    using sink_type = std::function<void(LogLevel, std::string_view component, std::string_view message)>;

    static Logger& instance()
    {
        static Logger inst;
        return inst;
    }

    // A custom sink runs without the logger lock held, so it may log itself.
    void log(LogLevel level, std::string_view component, std::string_view message)
    {
        sink_type sink;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_)
                return;

            if (!sink_)
            {
                std::cout << fmt::format("[{}] [{}] {}", to_string(level), component, message) << std::endl;
                return;
            }
            sink = sink_;
        }

        sink(level, component, message);
    }

    void set_level(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel level() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    // Replaces stdout output. Pass an empty function to restore it.
    void set_sink(sink_type sink)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

    bool enabled(LogLevel level) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return level >= min_level_;
    }

  private:
    Logger() = default;

    mutable std::mutex mutex_;
    LogLevel min_level_{LogLevel::Info};
    sink_type sink_;
};

inline void log_debug(std::string_view component, std::string_view message)
{
    Logger::instance().log(LogLevel::Debug, component, message);
}

inline void log_info(std::string_view component, std::string_view message)
{
    Logger::instance().log(LogLevel::Info, component, message);
}

inline void log_warning(std::string_view component, std::string_view message)
{
    Logger::instance().log(LogLevel::Warning, component, message);
}

inline void log_error(std::string_view component, std::string_view message)
{
    Logger::instance().log(LogLevel::Error, component, message);
}

}  // namespace sluice
