#include <sluice/streaming/errors.hpp>

#include <fmt/core.h>

namespace sluice
{

namespace
{

class stream_category_impl : public boost::system::error_category
{
public:
    const char* name() const noexcept override { return "sluice.stream"; }

    std::string message(int ev) const override
    {
        switch (static_cast<stream_errc>(ev))
        {
            case stream_errc::capacity_exceeded:
                return "maximum concurrent streams exceeded";
            case stream_errc::duplicate_stream_id:
                return "stream id already active";
            case stream_errc::upstream_read_failed:
                return "upstream read failed";
            case stream_errc::read_in_progress:
                return "a read is already pending on this stream";
        }
        return "unknown stream error";
    }
};

} // namespace

const boost::system::error_category& stream_category() noexcept
{
    static const stream_category_impl instance;
    return instance;
}

capacity_exceeded::capacity_exceeded(std::size_t limit)
    : stream_error(stream_errc::capacity_exceeded,
                   fmt::format("Maximum concurrent streams ({}) exceeded", limit))
    , limit_(limit)
{
}

} // namespace sluice
