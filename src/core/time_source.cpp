#include <chrono>
#include <ndcapture/time_source.hpp>

namespace ndcapture
{

double SteadyTimeSource::now_ms() const
{
    using Clock = std::chrono::steady_clock;
    return std::chrono::duration<double, std::milli>(Clock::now().time_since_epoch()).count();
}

int64_t SteadyTimeSource::epoch_ms() const
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

SteadyTimeSource& SteadyTimeSource::instance()
{
    static SteadyTimeSource source;
    return source;
}

}   // namespace ndcapture
