#ifndef COLLAT_CORE_TIMEKEEPER_H_INCLUDED
#define COLLAT_CORE_TIMEKEEPER_H_INCLUDED

#include <collat/basics/chrono.h>

#include <atomic>
#include <chrono>

namespace collat {

/** Manages various times used by the server. */
class TimeKeeper
{
public:
    virtual ~TimeKeeper() = default;

    /** Returns the current ledger time. */
    virtual NetClock::time_point
    now() const = 0;
};

/** Ledger time taken from the system clock. */
class SystemTimeKeeper : public TimeKeeper
{
public:
    NetClock::time_point
    now() const override
    {
        using namespace std::chrono;
        auto const since =
            duration_cast<seconds>(system_clock::now().time_since_epoch()) -
            epoch_offset;
        if (since.count() <= 0)
            return NetClock::time_point{};
        return NetClock::time_point{NetClock::duration{
            static_cast<NetClock::rep>(since.count())}};
    }
};

/** Ledger time that only moves when told to. */
class ManualTimeKeeper : public TimeKeeper
{
private:
    std::atomic<NetClock::rep> now_;

public:
    explicit ManualTimeKeeper(NetClock::time_point start = {})
        : now_(start.time_since_epoch().count())
    {
    }

    NetClock::time_point
    now() const override
    {
        return NetClock::time_point{NetClock::duration{now_.load()}};
    }

    void
    set(NetClock::time_point now)
    {
        now_ = now.time_since_epoch().count();
    }

    void
    advance(NetClock::duration elapsed)
    {
        now_ += elapsed.count();
    }
};

}  // namespace collat

#endif
