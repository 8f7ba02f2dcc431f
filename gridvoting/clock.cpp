#include "clock.h"

#include "helper.h"

// ================================================================

int64_t
SystemClock::Now() const
{
    return Helper::GetUNIXTimestamp() / 1000;
}
