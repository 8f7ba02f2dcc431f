/*=============================================================================

Source of wall-clock time (UNIX seconds) for all poll window checks. The
system clock is used by the shell, the manual clock lets tests move time
forward deterministically.

Author   : Benedikt Hiemenz, Max Kolhagen, Markus Schmidt
=============================================================================*/
#ifndef GRIDVOTING_CLOCK_H
#define GRIDVOTING_CLOCK_H

#include <stdint.h>

// ----------------------------------------------------------------
class Clock
{
public:
    virtual ~Clock() {}

    // Current UNIX timestamp (sec)
    virtual int64_t Now() const = 0;
};

// ----------------------------------------------------------------
class SystemClock : public Clock
{
public:
    int64_t Now() const;
};

// ----------------------------------------------------------------
class ManualClock : public Clock
{
public:
    ManualClock(int64_t now = 0):
        now(now) {}

    int64_t Now() const
    {
        return this->now;
    }

    // Jump to the given timestamp
    void Set(int64_t timestamp)
    {
        this->now = timestamp;
    }

    // Move forward by the given number of seconds
    void Advance(int64_t seconds)
    {
        this->now += seconds;
    }

private:
    int64_t now;
};

#endif // GRIDVOTING_CLOCK_H
