#pragma once

#include <sluice/streaming/chunk.hpp>
#include <sluice/streaming/chunk_source.hpp>
#include <sluice/streaming/stream_reader.hpp>

#include <boost/asio.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace sluice::test
{

struct collected
{
    std::vector<chunk> chunks;
    boost::system::error_code final_ec;
    bool done{false};

    std::vector<std::string> texts() const
    {
        std::vector<std::string> out;
        for (auto& c : chunks)
            out.push_back(to_string(c));
        return out;
    }
};

// Reads until the stream terminates. `reader` must outlive the io_context run.
inline void drain(stream_reader& reader, std::shared_ptr<collected> out)
{
    reader.async_read([&reader, out](boost::system::error_code ec, chunk data) {
        if (ec)
        {
            out->final_ec = ec;
            out->done = true;
            return;
        }
        out->chunks.push_back(std::move(data));
        drain(reader, out);
    });
}

template<typename Pred>
bool run_until(boost::asio::io_context& io, Pred done,
               std::chrono::milliseconds limit = std::chrono::seconds(5))
{
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (!done())
    {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        if (io.stopped())
            io.restart();
        io.run_one_for(std::chrono::milliseconds(5));
    }
    return true;
}

inline void run_for(boost::asio::io_context& io, std::chrono::milliseconds period)
{
    if (io.stopped())
        io.restart();
    io.run_for(period);
}

inline std::shared_ptr<memory_chunk_source> make_source(boost::asio::io_context& io,
                                                        const std::vector<std::string>& texts)
{
    auto source = std::make_shared<memory_chunk_source>(io.get_executor());
    for (auto& t : texts)
        source->push(make_chunk(t));
    return source;
}

} // namespace sluice::test
