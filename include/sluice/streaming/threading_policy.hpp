#pragma once

#include <utility>
#include <boost/asio.hpp>

// Compile-time threading mode selection
// Define SLUICE_MULTI_THREADED when the io_context is run from several threads;
// each session then gets its own strand. Otherwise sessions use the plain
// io_context executor.
#ifdef SLUICE_MULTI_THREADED
    #define SLUICE_THREADING_MODE multi_threaded
#else
    #define SLUICE_THREADING_MODE single_threaded
#endif

namespace sluice
{

// ============================================================================
// Threading Policy
// ============================================================================

struct single_threaded
{
    using executor_type = boost::asio::any_io_executor;

    template<typename Executor>
    static executor_type make_executor(Executor&& ex)
    {
        return std::forward<Executor>(ex);
    }

    // Runs inline on the io_context thread, queued from anywhere else.
    template<typename F>
    static void dispatch(executor_type& ex, F&& f)
    {
        boost::asio::dispatch(ex, std::forward<F>(f));
    }
};

struct multi_threaded
{
    using executor_type = boost::asio::strand<boost::asio::any_io_executor>;

    template<typename Executor>
    static executor_type make_executor(Executor&& ex)
    {
        return boost::asio::make_strand(boost::asio::any_io_executor(std::forward<Executor>(ex)));
    }

    template<typename F>
    static void dispatch(executor_type& ex, F&& f)
    {
        boost::asio::dispatch(ex, std::forward<F>(f));
    }
};

} // namespace sluice
