#pragma once

#include <cstdint>

namespace ndcapture
{

// Clock used for batch budgets, ETA and artifact names.
class TimeSource
{
   public:
    virtual ~TimeSource() = default;

    // Monotonic milliseconds from an arbitrary origin.
    virtual double now_ms() const = 0;

    // Milliseconds since the Unix epoch.
    virtual int64_t epoch_ms() const = 0;
};

class SteadyTimeSource final : public TimeSource
{
   public:
    double  now_ms() const override;
    int64_t epoch_ms() const override;

    static SteadyTimeSource& instance();
};

}   // namespace ndcapture
